#pragma once

#include <format>
#include <magic_enum.hpp>
#include <utility>

#include "common.hpp"
#include "location.hpp"

namespace caret {
    // ordered from least to most severe
    enum class Severity : uint8_t {
        Help,
        Note,
        Warning,
        Error,
        Bug,
    };

    enum class LabelStyle : uint8_t {
        Primary,
        Secondary,
    };

    [[nodiscard]] inline auto severity_name(Severity severity) -> std::string {
        return to_lower_str(magic_enum::enum_name(severity));
    }

    class Label {
    public:
        Label(LabelStyle style, FileId file_id, ByteRange range)
            : m_style(style)
            , m_file_id(file_id)
            , m_range(range) {}

        static auto primary(FileId file_id, ByteRange range) -> Label {
            return { LabelStyle::Primary, file_id, range };
        }
        static auto secondary(FileId file_id, ByteRange range) -> Label {
            return { LabelStyle::Secondary, file_id, range };
        }

        auto with_message(std::string message) && -> Label {
            m_message = std::move(message);
            return std::move(*this);
        }

        [[nodiscard]] auto style() const -> LabelStyle {
            return m_style;
        }
        [[nodiscard]] auto file_id() const -> FileId {
            return m_file_id;
        }
        [[nodiscard]] auto range() const -> const ByteRange& {
            return m_range;
        }
        [[nodiscard]] auto message() const -> std::string_view {
            return m_message;
        }

        [[nodiscard]] auto to_json() const -> Json;
        static auto from_json(const Json& json) -> Result<Label, std::string>;

    private:
        LabelStyle m_style;
        FileId m_file_id;
        ByteRange m_range;
        std::string m_message;
    };

    class Diagnostic {
    public:
        explicit Diagnostic(Severity severity) : m_severity(severity) {}
        ~Diagnostic() = default;
        Diagnostic(Diagnostic&&) = default;
        Diagnostic(const Diagnostic&) = delete;
        auto operator=(Diagnostic&&) -> Diagnostic& = default;
        auto operator=(const Diagnostic&) -> Diagnostic& = delete;

        static auto bug() -> Diagnostic {
            return Diagnostic(Severity::Bug);
        }
        static auto error() -> Diagnostic {
            return Diagnostic(Severity::Error);
        }
        static auto warning() -> Diagnostic {
            return Diagnostic(Severity::Warning);
        }
        static auto note() -> Diagnostic {
            return Diagnostic(Severity::Note);
        }
        static auto help() -> Diagnostic {
            return Diagnostic(Severity::Help);
        }

        auto with_code(std::string code) && -> Diagnostic {
            m_code = std::move(code);
            return std::move(*this);
        }
        auto with_message(std::string message) && -> Diagnostic {
            m_message = std::move(message);
            return std::move(*this);
        }
        auto with_labels(Vec<Label> labels) && -> Diagnostic {
            m_labels.insert(
                m_labels.end(),
                std::make_move_iterator(labels.begin()),
                std::make_move_iterator(labels.end())
            );
            return std::move(*this);
        }
        auto with_notes(Vec<std::string> notes) && -> Diagnostic {
            m_notes.insert(
                m_notes.end(),
                std::make_move_iterator(notes.begin()),
                std::make_move_iterator(notes.end())
            );
            return std::move(*this);
        }

        [[nodiscard]] auto severity() const -> Severity {
            return m_severity;
        }
        [[nodiscard]] auto code() const -> Option<std::string_view> {
            if (!m_code) {
                return std::nullopt;
            }
            return *m_code;
        }
        [[nodiscard]] auto message() const -> std::string_view {
            return m_message;
        }
        [[nodiscard]] auto labels() const -> const Vec<Label>& {
            return m_labels;
        }
        [[nodiscard]] auto notes() const -> const Vec<std::string>& {
            return m_notes;
        }

        [[nodiscard]] auto to_json() const -> Json;
        static auto from_json(const Json& json) -> Result<Diagnostic, std::string>;

    private:
        Severity m_severity;
        Option<std::string> m_code;
        std::string m_message;
        Vec<Label> m_labels;
        Vec<std::string> m_notes;
    };
}  // namespace caret

template<>
struct std::formatter<caret::Severity> {
    constexpr static auto parse(std::format_parse_context& ctx)
        -> std::format_parse_context::iterator {
        return ctx.begin();
    }

    static auto format(caret::Severity severity, std::format_context& ctx)
        -> std::format_context::iterator {
        return std::format_to(ctx.out(), "{}", caret::severity_name(severity));
    }
};

#pragma once

#include <format>
#include <string>
#include <utility>

#include "common.hpp"

namespace caret {
    class RenderError {
    public:
        enum class Kind : uint8_t {
            /* resolution failures */
            FileMissing,
            IndexTooLarge,
            LineTooLarge,
            InvalidRange,

            /* sink failures */
            Io,
        };

        RenderError(Kind kind, std::string message)
            : m_kind(kind)
            , m_message(std::move(message)) {}

        [[nodiscard]] auto kind() const -> Kind {
            return m_kind;
        }
        [[nodiscard]] auto message() const -> std::string_view {
            return m_message;
        }
        [[nodiscard]] auto is_resolution_failure() const -> bool {
            return m_kind != Kind::Io;
        }

    private:
        Kind m_kind;
        std::string m_message;
    };

    template<typename T>
    using RenderResult = Result<T, RenderError>;
}  // namespace caret

namespace caret::errors {
    inline auto file_missing(FileId file_id) -> std::unexpected<RenderError> {
        return std::unexpected(RenderError(
            RenderError::Kind::FileMissing,
            std::format("file {} is missing from the source table", file_id)
        ));
    }
    inline auto index_too_large(size_t given, size_t max) -> std::unexpected<RenderError> {
        return std::unexpected(RenderError(
            RenderError::Kind::IndexTooLarge,
            std::format("byte index {} is past the end of the source (length {})", given, max)
        ));
    }
    inline auto line_too_large(size_t given, size_t max) -> std::unexpected<RenderError> {
        return std::unexpected(RenderError(
            RenderError::Kind::LineTooLarge,
            std::format("line index {} is past the last line (index {})", given, max)
        ));
    }
    inline auto invalid_range(size_t start, size_t end) -> std::unexpected<RenderError> {
        return std::unexpected(RenderError(
            RenderError::Kind::InvalidRange,
            std::format("label range {}..{} starts after it ends", start, end)
        ));
    }
    inline auto io(std::string_view what) -> std::unexpected<RenderError> {
        return std::unexpected(
            RenderError(RenderError::Kind::Io, std::format("failed to {}", what))
        );
    }
}  // namespace caret::errors

template<>
struct std::formatter<caret::RenderError> {
    constexpr static auto parse(std::format_parse_context& ctx)
        -> std::format_parse_context::iterator {
        return ctx.begin();
    }

    static auto format(const caret::RenderError& error, std::format_context& ctx)
        -> std::format_context::iterator {
        return std::format_to(ctx.out(), "{}", error.message());
    }
};

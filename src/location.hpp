#pragma once

#include <compare>
#include <format>
#include <utility>

#include "common.hpp"

namespace caret {
    // half-open byte range `[start, end)` into a file's source
    struct ByteRange {
    public:
        size_t start;
        size_t end;

        [[nodiscard]] constexpr auto length() const -> size_t {
            return end - start;
        }
        [[nodiscard]] constexpr auto contains(size_t byte_index) const -> bool {
            return start <= byte_index && byte_index < end;
        }

        auto operator<=>(const ByteRange&) const = default;

        [[nodiscard]] auto to_json() const -> Json {
            return { { "start", start }, { "end", end } };
        }
    };

    // display-ready position, line and column are 1-based
    class Locus {
    public:
        Locus() = default;
        Locus(std::string origin, size_t line_number, size_t column_number)
            : m_origin(std::move(origin))
            , m_line_number(line_number)
            , m_column_number(column_number) {}

        [[nodiscard]] auto origin() const -> std::string_view {
            return m_origin;
        }
        [[nodiscard]] auto line_number() const -> size_t {
            return m_line_number;
        }
        [[nodiscard]] auto column_number() const -> size_t {
            return m_column_number;
        }

        auto operator==(const Locus&) const -> bool = default;

        [[nodiscard]] auto to_json() const -> Json {
            return { { "origin", m_origin },
                     { "line", m_line_number },
                     { "column", m_column_number } };
        }

    private:
        std::string m_origin;
        size_t m_line_number {};
        size_t m_column_number {};
    };
}  // namespace caret

template<>
struct std::formatter<caret::ByteRange> {
    constexpr static auto parse(std::format_parse_context& ctx)
        -> std::format_parse_context::iterator {
        return ctx.begin();
    }

    static auto format(const caret::ByteRange& range, std::format_context& ctx)
        -> std::format_context::iterator {
        return std::format_to(ctx.out(), "{}..{}", range.start, range.end);
    }
};

template<>
struct std::formatter<caret::Locus> {
    constexpr static auto parse(std::format_parse_context& ctx)
        -> std::format_parse_context::iterator {
        return ctx.begin();
    }

    static auto format(const caret::Locus& locus, std::format_context& ctx)
        -> std::format_context::iterator {
        return std::format_to(
            ctx.out(),
            "{}:{}:{}",
            locus.origin(),
            locus.line_number(),
            locus.column_number()
        );
    }
};

#pragma once

#include <variant>

#include "diagnostics.hpp"
#include "location.hpp"

namespace caret {
    // severity a mark is colored with, none for secondary labels
    using MarkSeverity = Option<Severity>;

    namespace mark {
        // underline of `[start, end)`, byte offsets relative to the line start
        struct Single {
            size_t start;
            size_t end;
            std::string_view message;
        };

        // the marked region starts after leading whitespace only
        struct MultiTopLeft {};

        // underline under the unmarked prefix, up to byte offset `end` of the line
        struct MultiTop {
            size_t end;
        };

        struct MultiLeft {};

        // underline from the left connector up to byte offset `end` of the line
        struct MultiBottom {
            size_t end;
            std::string_view message;
        };
    }  // namespace mark

    using Mark = std::variant<
        mark::Single,
        mark::MultiTopLeft,
        mark::MultiTop,
        mark::MultiLeft,
        mark::MultiBottom>;

    struct LineMark {
        MarkSeverity severity;
        Mark mark;
    };

    namespace entry {
        struct Header {
            Option<Locus> locus;
            Severity severity;
            Option<std::string_view> code;
            std::string_view message;
        };

        struct Empty {};

        struct SourceStart {
            size_t outer_padding;
            Locus locus;
        };

        struct SourceBreak {
            size_t outer_padding;
        };

        struct SourceEmpty {
            size_t outer_padding;
        };

        struct SourceLine {
            size_t outer_padding;
            size_t line_number;
            std::string_view source;
            Vec<Option<LineMark>> marks;
        };

        struct SourceNote {
            size_t outer_padding;
            std::string_view message;
        };
    }  // namespace entry

    // one printable unit of a rendered diagnostic
    //
    // string views borrow from the diagnostic and the source table, so entries must not
    // outlive either.
    using Entry = std::variant<
        entry::Header,
        entry::Empty,
        entry::SourceStart,
        entry::SourceBreak,
        entry::SourceEmpty,
        entry::SourceLine,
        entry::SourceNote>;

    [[nodiscard]] auto to_json(const Mark& mark) -> Json;
    [[nodiscard]] auto to_json(const Entry& entry) -> Json;
    [[nodiscard]] auto to_json(const Vec<Entry>& entries) -> Json;
}  // namespace caret

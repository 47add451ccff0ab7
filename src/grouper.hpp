#pragma once

#include "diagnostics.hpp"
#include "entry.hpp"
#include "files.hpp"

namespace caret {
    // one label, resolved against the source table
    struct FileMark {
    public:
        MarkSeverity severity;
        ByteRange range;
        std::string_view message;
        size_t start_line_index;
        size_t end_line_index;

        [[nodiscard]] auto is_multiline() const -> bool {
            return start_line_index != end_line_index;
        }
    };

    struct MarkedFile {
    public:
        FileId file_id;
        std::string_view origin;
        Vec<FileMark> marks;  // sorted by (range.start, range.end)
    };

    struct LabelGroups {
    public:
        Vec<MarkedFile> files;  // in order of each file's first label
        size_t outer_padding { 0 };
    };

    // partitions a diagnostic's labels per file and sizes the line number gutter
    //
    // fails on the first label the source table cannot resolve.
    [[nodiscard]] auto group_labels(const Diagnostic& diagnostic, const Files& files)
        -> RenderResult<LabelGroups>;
}  // namespace caret

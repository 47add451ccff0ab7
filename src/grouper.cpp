#include "grouper.hpp"

#include <algorithm>
#include <tuple>

namespace caret {
    auto group_labels(const Diagnostic& diagnostic, const Files& files)
        -> RenderResult<LabelGroups> {
        LabelGroups groups;

        for (const auto& label : diagnostic.labels()) {
            const auto& range = label.range();
            if (range.start > range.end) {
                return errors::invalid_range(range.start, range.end);
            }

            auto start_line_index = files.line_index(label.file_id(), range.start);
            if (!start_line_index) {
                return std::unexpected(std::move(start_line_index).error());
            }
            auto end_line = files.line_at(label.file_id(), range.end);
            if (!end_line) {
                return std::unexpected(std::move(end_line).error());
            }
            groups.outer_padding = std::max(groups.outer_padding, count_digits(end_line->number));

            auto file_mark = FileMark {
                .severity = label.style() == LabelStyle::Primary
                                ? MarkSeverity(diagnostic.severity())
                                : std::nullopt,
                .range = range,
                .message = label.message(),
                .start_line_index = *start_line_index,
                .end_line_index = end_line->index(),
            };

            auto it = std::ranges::find(groups.files, label.file_id(), &MarkedFile::file_id);
            if (it != groups.files.end()) {
                it->marks.push_back(file_mark);
                continue;
            }

            auto origin = files.origin(label.file_id());
            if (!origin) {
                return std::unexpected(std::move(origin).error());
            }
            groups.files.push_back(MarkedFile {
                .file_id = label.file_id(),
                .origin = *origin,
                .marks = { file_mark },
            });
        }

        for (auto& marked_file : groups.files) {
            std::ranges::stable_sort(marked_file.marks, {}, [](const FileMark& mark) {
                return std::tuple(mark.range.start, mark.range.end);
            });
        }
        return groups;
    }
}  // namespace caret

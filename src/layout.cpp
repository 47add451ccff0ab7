#include "layout.hpp"

#include "grouper.hpp"
#include "renderer.hpp"

namespace caret {
    namespace {
        auto push_source_line(
            Vec<Entry>& entries,
            size_t outer_padding,
            const Line& line,
            MarkSeverity severity,
            Mark mark
        ) -> void {
            entries.emplace_back(entry::SourceLine {
                .outer_padding = outer_padding,
                .line_number = line.number,
                .source = line.source,
                .marks = { LineMark { .severity = severity, .mark = std::move(mark) } },
            });
        }

        // the source lines of one label, single underline or top/left/bottom connector
        auto layout_mark(
            Vec<Entry>& entries,
            const Files& files,
            FileId file_id,
            const FileMark& file_mark,
            size_t outer_padding
        ) -> RenderResult<void> {
            auto start_line = files.line(file_id, file_mark.start_line_index);
            if (!start_line) {
                return std::unexpected(std::move(start_line).error());
            }
            const auto mark_start = file_mark.range.start - start_line->range.start;

            // 2 │ (+ test "")
            //   │         ^^ expected `Int` but found `String`
            if (!file_mark.is_multiline()) {
                push_source_line(
                    entries,
                    outer_padding,
                    *start_line,
                    file_mark.severity,
                    mark::Single {
                        .start = mark_start,
                        .end = file_mark.range.end - start_line->range.start,
                        .message = file_mark.message,
                    }
                );
                return {};
            }

            // 4 │ ╭     case (mod num 5) (mod num 3) of
            // or
            // 4 │   fizz₁ num = case (mod num 5) (mod num 3) of
            //   │ ╭─────────────^
            const auto prefix = start_line->source.substr(0, mark_start);
            if (is_blank(prefix)) {
                push_source_line(
                    entries,
                    outer_padding,
                    *start_line,
                    file_mark.severity,
                    mark::MultiTopLeft {}
                );
            } else {
                push_source_line(
                    entries,
                    outer_padding,
                    *start_line,
                    file_mark.severity,
                    mark::MultiTop { .end = mark_start }
                );
            }

            // 5 │ │     0 0 => "FizzBuzz"
            for (auto index = file_mark.start_line_index + 1; index < file_mark.end_line_index;
                 ++index) {
                auto line = files.line(file_id, index);
                if (!line) {
                    return std::unexpected(std::move(line).error());
                }
                push_source_line(
                    entries,
                    outer_padding,
                    *line,
                    file_mark.severity,
                    mark::MultiLeft {}
                );
            }

            // 8 │ │     _ _ => num
            //   │ ╰──────────────^ `case` clauses have incompatible types
            auto end_line = files.line(file_id, file_mark.end_line_index);
            if (!end_line) {
                return std::unexpected(std::move(end_line).error());
            }
            push_source_line(
                entries,
                outer_padding,
                *end_line,
                file_mark.severity,
                mark::MultiBottom {
                    .end = file_mark.range.end - end_line->range.start,
                    .message = file_mark.message,
                }
            );
            return {};
        }

        auto emit_entries(const Vec<Entry>& entries, WriteColor& writer, const Config& config)
            -> RenderResult<void> {
            Renderer renderer(writer, config);
            for (const auto& entry : entries) {
                if (auto result = renderer.render(entry); !result) {
                    return result;
                }
            }
            return {};
        }
    }  // namespace

    auto RichDiagnostic::entries(const Files& files) const -> RenderResult<Vec<Entry>> {
        const auto& diagnostic = m_diagnostic.get();

        auto groups = group_labels(diagnostic, files);
        if (!groups) {
            return std::unexpected(std::move(groups).error());
        }
        const auto outer_padding = groups->outer_padding;

        Vec<Entry> entries;

        // error[E0001]: unexpected type in `+` application
        entries.emplace_back(entry::Header {
            .locus = std::nullopt,
            .severity = diagnostic.severity(),
            .code = diagnostic.code(),
            .message = diagnostic.message(),
        });
        if (!groups->files.empty()) {
            entries.emplace_back(entry::Empty {});
        }

        for (const auto& marked_file : groups->files) {
            const auto& first_mark = marked_file.marks.front();
            auto first_line = files.line(marked_file.file_id, first_mark.start_line_index);
            if (!first_line) {
                return std::unexpected(std::move(first_line).error());
            }

            //   ┌── test:2:9 ───
            entries.emplace_back(entry::SourceStart {
                .outer_padding = outer_padding,
                .locus = Locus(
                    std::string(marked_file.origin),
                    first_line->number,
                    first_line->column_number(first_mark.range.start)
                ),
            });

            for (size_t i = 0; i < marked_file.marks.size(); ++i) {
                if (i == 0) {
                    entries.emplace_back(entry::SourceEmpty { .outer_padding = outer_padding });
                } else {
                    entries.emplace_back(entry::SourceBreak { .outer_padding = outer_padding });
                }

                auto result = layout_mark(
                    entries,
                    files,
                    marked_file.file_id,
                    marked_file.marks.at(i),
                    outer_padding
                );
                if (!result) {
                    return std::unexpected(std::move(result).error());
                }
            }
            entries.emplace_back(entry::SourceEmpty { .outer_padding = outer_padding });
        }

        // = expected type `Int`
        //      found type `String`
        for (const auto& note : diagnostic.notes()) {
            entries.emplace_back(entry::SourceNote {
                .outer_padding = outer_padding,
                .message = note,
            });
        }
        entries.emplace_back(entry::Empty {});
        return entries;
    }

    auto RichDiagnostic::emit(const Files& files, WriteColor& writer, const Config& config) const
        -> RenderResult<void> {
        return entries(files).and_then([&](const Vec<Entry>& entries) {
            return emit_entries(entries, writer, config);
        });
    }

    auto ShortDiagnostic::entries(const Files& files) const -> RenderResult<Vec<Entry>> {
        const auto& diagnostic = m_diagnostic.get();
        Vec<Entry> entries;

        // test:2:9: error[E0001]: unexpected type in `+` application
        for (const auto& label : diagnostic.labels()) {
            if (label.style() != LabelStyle::Primary) {
                continue;
            }
            const auto& range = label.range();
            if (range.start > range.end) {
                return errors::invalid_range(range.start, range.end);
            }

            auto origin = files.origin(label.file_id());
            if (!origin) {
                return std::unexpected(std::move(origin).error());
            }
            auto line = files.line_at(label.file_id(), range.start);
            if (!line) {
                return std::unexpected(std::move(line).error());
            }

            entries.emplace_back(entry::Header {
                .locus = Locus(std::string(*origin), line->number, line->column_number(range.start)),
                .severity = diagnostic.severity(),
                .code = diagnostic.code(),
                .message = diagnostic.message(),
            });
        }

        // error[E0002]: Bad config found
        if (entries.empty()) {
            entries.emplace_back(entry::Header {
                .locus = std::nullopt,
                .severity = diagnostic.severity(),
                .code = diagnostic.code(),
                .message = diagnostic.message(),
            });
        }
        return entries;
    }

    auto ShortDiagnostic::emit(const Files& files, WriteColor& writer, const Config& config) const
        -> RenderResult<void> {
        return entries(files).and_then([&](const Vec<Entry>& entries) {
            return emit_entries(entries, writer, config);
        });
    }
}  // namespace caret

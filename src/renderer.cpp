#include "renderer.hpp"

#include <format>

#include "files.hpp"

namespace caret {
    namespace {
        auto trim_line_ending(std::string_view source) -> std::string_view {
            if (source.ends_with('\n')) {
                source.remove_suffix(1);
            }
            if (source.ends_with('\r')) {
                source.remove_suffix(1);
            }
            return source;
        }

        auto char_count(std::string_view text) -> size_t {
            return column_index(text, 0, text.length());
        }

        auto is_single(const Option<LineMark>& line_mark) -> bool {
            return line_mark && std::holds_alternative<mark::Single>(line_mark->mark);
        }

        auto has_underline(const Mark& mark) -> bool {
            return std::holds_alternative<mark::Single>(mark)
                   || std::holds_alternative<mark::MultiTop>(mark)
                   || std::holds_alternative<mark::MultiBottom>(mark);
        }

        // whether the left connector carries on to the next row
        auto continues_down(const Mark& mark) -> bool {
            return std::holds_alternative<mark::MultiTopLeft>(mark)
                   || std::holds_alternative<mark::MultiTop>(mark)
                   || std::holds_alternative<mark::MultiLeft>(mark);
        }
    }  // namespace

    auto Renderer::render(const Entry& entry) -> RenderResult<void> {
        return std::visit([this](const auto& value) { return render_entry(value); }, entry);
    }

    // test:2:9: error[E0001]: unexpected type in `+` application
    auto Renderer::render_entry(const entry::Header& header) -> RenderResult<void> {
        if (header.locus) {
            if (auto result = write(std::format("{}: ", *header.locus)); !result) {
                return result;
            }
        }

        auto severity = severity_name(header.severity);
        if (header.code) {
            severity += std::format("[{}]", *header.code);
        }
        return write_styled(styles().header(header.severity), severity)
            .and_then([&] {
                return write_styled(styles().header_message, std::format(": {}", header.message));
            })
            .and_then([&] { return write("\n"); });
    }

    auto Renderer::render_entry(const entry::Empty& /*empty*/) -> RenderResult<void> {
        return write("\n");
    }

    //   ┌── test:2:9 ───
    auto Renderer::render_entry(const entry::SourceStart& start) -> RenderResult<void> {
        return outer_gutter(start.outer_padding)
            .and_then([&] { return border_top_left(); })
            .and_then([&] { return border_top(2); })
            .and_then([&] { return write(std::format(" {} ", start.locus)); })
            .and_then([&] { return border_top(3); })
            .and_then([&] { return write("\n"); });
    }

    //   ·
    auto Renderer::render_entry(const entry::SourceBreak& source_break) -> RenderResult<void> {
        return outer_gutter(source_break.outer_padding)
            .and_then([&] { return border_left_break(); })
            .and_then([&] { return write("\n"); });
    }

    //   │
    auto Renderer::render_entry(const entry::SourceEmpty& empty) -> RenderResult<void> {
        return outer_gutter(empty.outer_padding)
            .and_then([&] { return border_left(); })
            .and_then([&] { return write("\n"); });
    }

    // 4 │ ╭     case (mod num 5) (mod num 3) of
    // 5 │ │     0 0 => "FizzBuzz"
    auto Renderer::render_entry(const entry::SourceLine& line) -> RenderResult<void> {
        const auto source = trim_line_ending(line.source);

        Vec<const Option<LineMark>*> left_marks;
        for (const auto& line_mark : line.marks) {
            if (!is_single(line_mark)) {
                left_marks.push_back(&line_mark);
            }
        }

        auto result = outer_gutter_number(line.line_number, line.outer_padding)
                          .and_then([&] { return border_left(); });
        if (result && (!left_marks.empty() || !source.empty())) {
            result = write(" ");
        }
        for (const auto* left_mark : left_marks) {
            if (!result) {
                return result;
            }
            if (!left_mark->has_value()) {
                result = write(" ");
                continue;
            }

            const auto& style = styles().label((*left_mark)->severity);
            const auto& shape = (*left_mark)->mark;
            if (std::holds_alternative<mark::MultiTopLeft>(shape)) {
                result = write_styled(style, chars().multi_top_left);
            } else if (std::holds_alternative<mark::MultiTop>(shape)) {
                result = write(" ");
            } else {
                result = write_styled(style, chars().multi_left);
            }
        }
        if (result && !left_marks.empty() && !source.empty()) {
            result = write(" ");
        }
        if (result) {
            result = write(source).and_then([&] { return write("\n"); });
        }

        for (const auto& line_mark : line.marks) {
            if (!result) {
                return result;
            }
            if (line_mark && has_underline(line_mark->mark)) {
                result = render_underline(line, left_marks, *line_mark);
            }
        }
        return result;
    }

    //   = expected type `Int`
    //        found type `String`
    auto Renderer::render_entry(const entry::SourceNote& note) -> RenderResult<void> {
        const auto bullet_width = char_count(chars().note_bullet);

        auto message = note.message;
        for (bool first = true; first || !message.empty(); first = false) {
            const auto newline = message.find('\n');
            const auto text = message.substr(0, newline);
            message = newline == std::string_view::npos ? std::string_view {}
                                                        : message.substr(newline + 1);

            auto result = outer_gutter(note.outer_padding).and_then([&] {
                if (first) {
                    return write_styled(styles().note_bullet, chars().note_bullet);
                }
                return write_repeated(" ", bullet_width);
            });
            if (result) {
                result = write(std::format(" {}\n", text));
            }
            if (!result) {
                return result;
            }
        }
        return {};
    }

    //   │         ^^ expected `Int` but found `String`
    // or
    //   │ ╭─────────────^
    // or
    //   │ ╰──────────────^ `case` clauses have incompatible types
    auto Renderer::render_underline(
        const entry::SourceLine& line,
        const Vec<const Option<LineMark>*>& left_marks,
        const LineMark& line_mark
    ) -> RenderResult<void> {
        const auto& style = styles().label(line_mark.severity);
        const auto is_primary = line_mark.severity.has_value();

        auto result = outer_gutter(line.outer_padding)
                          .and_then([&] { return border_left(); })
                          .and_then([&] { return write(" "); });
        if (!result) {
            return result;
        }

        if (const auto* single = std::get_if<mark::Single>(&line_mark.mark)) {
            const auto start_column = column_index(line.source, 0, single->start);
            const auto end_column = column_index(line.source, 0, single->end);
            const auto& caret =
                is_primary ? chars().single_primary_caret : chars().single_secondary_caret;

            result = render_left_marks(left_marks, nullptr);
            if (result && !left_marks.empty()) {
                result = write(" ");
            }
            if (result) {
                result = write_repeated(" ", start_column).and_then([&] {
                    return write_repeated_styled(
                        style,
                        caret,
                        std::max<size_t>(end_column - start_column, 1)
                    );
                });
            }
            if (result && !single->message.empty()) {
                result = write_styled(style, std::format(" {}", single->message));
            }
        } else if (const auto* top = std::get_if<mark::MultiTop>(&line_mark.mark)) {
            const auto start_column = column_index(line.source, 0, top->end);
            const auto& caret =
                is_primary ? chars().multi_primary_caret_start : chars().multi_secondary_caret_start;

            result = render_left_marks(left_marks, &line_mark)
                         .and_then([&] {
                             return write_repeated_styled(style, chars().multi_top, start_column + 1);
                         })
                         .and_then([&] { return write_styled(style, caret); });
        } else if (const auto* bottom = std::get_if<mark::MultiBottom>(&line_mark.mark)) {
            const auto end_column = column_index(line.source, 0, bottom->end);
            const auto& caret =
                is_primary ? chars().multi_primary_caret_end : chars().multi_secondary_caret_end;

            result = render_left_marks(left_marks, &line_mark)
                         .and_then([&] {
                             return write_repeated_styled(
                                 style,
                                 chars().multi_bottom,
                                 std::max<size_t>(end_column, 1)
                             );
                         })
                         .and_then([&] { return write_styled(style, caret); });
            if (result && !bottom->message.empty()) {
                result = write_styled(style, std::format(" {}", bottom->message));
            }
        }

        if (!result) {
            return result;
        }
        return write("\n");
    }

    auto Renderer::render_left_marks(
        const Vec<const Option<LineMark>*>& left_marks,
        const LineMark* drawing
    ) -> RenderResult<void> {
        // once the drawing mark's corner is written, the rest of the row is its rule
        const Style* rule_style = nullptr;
        std::string_view rule;

        for (const auto* left_mark : left_marks) {
            RenderResult<void> result;
            if (rule_style != nullptr) {
                result = write_styled(*rule_style, rule);
            } else if (left_mark->has_value() && &left_mark->value() == drawing) {
                const auto& style = styles().label(drawing->severity);
                const auto is_top = std::holds_alternative<mark::MultiTop>(drawing->mark);
                rule = is_top ? chars().multi_top : chars().multi_bottom;
                rule_style = &style;
                result = write_styled(
                    style,
                    is_top ? chars().multi_top_left : chars().multi_bottom_left
                );
            } else if (left_mark->has_value() && continues_down((*left_mark)->mark)) {
                result = write_styled(styles().label((*left_mark)->severity), chars().multi_left);
            } else {
                result = write(" ");
            }

            if (!result) {
                return result;
            }
        }
        return {};
    }

    auto Renderer::write(std::string_view text) -> RenderResult<void> {
        return m_writer.get().write(text);
    }

    auto Renderer::write_repeated(std::string_view text, size_t count) -> RenderResult<void> {
        if (count == 0) {
            return {};
        }
        std::string repeated;
        repeated.reserve(text.length() * count);
        for (size_t i = 0; i < count; ++i) {
            repeated += text;
        }
        return write(repeated);
    }

    auto Renderer::write_styled(const Style& style, std::string_view text) -> RenderResult<void> {
        auto& writer = m_writer.get();
        if (!writer.supports_color()) {
            return writer.write(text);
        }
        return writer.set_style(style)
            .and_then([&] { return writer.write(text); })
            .and_then([&] { return writer.reset(); });
    }

    auto Renderer::write_repeated_styled(const Style& style, std::string_view text, size_t count)
        -> RenderResult<void> {
        auto& writer = m_writer.get();
        if (!writer.supports_color()) {
            return write_repeated(text, count);
        }
        return writer.set_style(style)
            .and_then([&] { return write_repeated(text, count); })
            .and_then([&] { return writer.reset(); });
    }

    auto Renderer::outer_gutter(size_t outer_padding) -> RenderResult<void> {
        return write(std::format("{:{}} ", "", outer_padding));
    }

    auto Renderer::outer_gutter_number(size_t line_number, size_t outer_padding)
        -> RenderResult<void> {
        return write_styled(styles().line_number, std::format("{:>{}}", line_number, outer_padding))
            .and_then([&] { return write(" "); });
    }

    auto Renderer::border_top_left() -> RenderResult<void> {
        return write_styled(styles().source_border, chars().source_border_top_left);
    }

    auto Renderer::border_top(size_t width) -> RenderResult<void> {
        return write_repeated_styled(styles().source_border, chars().source_border_top, width);
    }

    auto Renderer::border_left() -> RenderResult<void> {
        return write_styled(styles().source_border, chars().source_border_left);
    }

    auto Renderer::border_left_break() -> RenderResult<void> {
        return write_styled(styles().source_border, chars().source_border_left_break);
    }
}  // namespace caret

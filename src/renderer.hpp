#pragma once

#include "config.hpp"
#include "entry.hpp"
#include "writer.hpp"

namespace caret {
    // writes entries as text, one entry at a time
    //
    // ```text
    // error[E0001]: unexpected type in `+` application
    //
    //   ┌── test:2:9 ───
    //   │
    // 2 │ (+ test "")
    //   │         ^^ expected `Int` but found `String`
    //   │
    //   = expected type `Int`
    //        found type `String`
    // ```
    class Renderer {
    public:
        Renderer(WriteColor& writer, const Config& config)
            : m_writer(writer)
            , m_config(config) {}

        auto render(const Entry& entry) -> RenderResult<void>;

    private:
        auto render_entry(const entry::Header& header) -> RenderResult<void>;
        auto render_entry(const entry::Empty& empty) -> RenderResult<void>;
        auto render_entry(const entry::SourceStart& start) -> RenderResult<void>;
        auto render_entry(const entry::SourceBreak& source_break) -> RenderResult<void>;
        auto render_entry(const entry::SourceEmpty& empty) -> RenderResult<void>;
        auto render_entry(const entry::SourceLine& line) -> RenderResult<void>;
        auto render_entry(const entry::SourceNote& note) -> RenderResult<void>;

        auto render_underline(
            const entry::SourceLine& line,
            const Vec<const Option<LineMark>*>& left_marks,
            const LineMark& line_mark
        ) -> RenderResult<void>;
        auto render_left_marks(
            const Vec<const Option<LineMark>*>& left_marks,
            const LineMark* drawing
        ) -> RenderResult<void>;

        auto write(std::string_view text) -> RenderResult<void>;
        auto write_repeated(std::string_view text, size_t count) -> RenderResult<void>;
        auto write_styled(const Style& style, std::string_view text) -> RenderResult<void>;
        auto write_repeated_styled(const Style& style, std::string_view text, size_t count)
            -> RenderResult<void>;

        // `pad` spaces and a separator, aligned with the line number gutter
        auto outer_gutter(size_t outer_padding) -> RenderResult<void>;
        auto outer_gutter_number(size_t line_number, size_t outer_padding) -> RenderResult<void>;

        auto border_top_left() -> RenderResult<void>;
        auto border_top(size_t width) -> RenderResult<void>;
        auto border_left() -> RenderResult<void>;
        auto border_left_break() -> RenderResult<void>;

        [[nodiscard]] auto styles() const -> const Styles& {
            return m_config.get().styles;
        }
        [[nodiscard]] auto chars() const -> const Chars& {
            return m_config.get().chars;
        }

        Ref<WriteColor> m_writer;
        Ref<const Config> m_config;
    };
}  // namespace caret

#pragma once

#include <string>

#include "diagnostics.hpp"
#include "style.hpp"

namespace caret {
    enum class DisplayStyle : uint8_t {
        // header, bordered snippets and notes
        Rich,
        // one located header per primary label
        Short,
    };

    struct Styles {
    public:
        Style header_bug { Style::fg(Color::Red).with_bold().with_intense() };
        Style header_error { Style::fg(Color::Red).with_bold().with_intense() };
        Style header_warning { Style::fg(Color::Yellow).with_bold().with_intense() };
        Style header_note { Style::fg(Color::Green).with_bold().with_intense() };
        Style header_help { Style::fg(Color::Cyan).with_bold().with_intense() };
        Style header_message { .bold = true };

        Style primary_label_bug { Style::fg(Color::Red) };
        Style primary_label_error { Style::fg(Color::Red) };
        Style primary_label_warning { Style::fg(Color::Yellow) };
        Style primary_label_note { Style::fg(Color::Green) };
        Style primary_label_help { Style::fg(Color::Cyan) };
        Style secondary_label { Style::fg(Color::Blue) };

        Style line_number { Style::fg(Color::Blue) };
        Style source_border { Style::fg(Color::Blue) };
        Style note_bullet { Style::fg(Color::Blue) };

        [[nodiscard]] auto header(Severity severity) const -> const Style&;
        // secondary labels carry no severity
        [[nodiscard]] auto label(Option<Severity> severity) const -> const Style&;
    };

    struct Chars {
    public:
        std::string source_border_top_left { "┌" };
        std::string source_border_top { "─" };
        std::string source_border_left { "│" };
        std::string source_border_left_break { "·" };

        std::string note_bullet { "=" };

        std::string single_primary_caret { "^" };
        std::string single_secondary_caret { "-" };

        std::string multi_primary_caret_start { "^" };
        std::string multi_primary_caret_end { "^" };
        std::string multi_secondary_caret_start { "'" };
        std::string multi_secondary_caret_end { "'" };
        std::string multi_top_left { "╭" };
        std::string multi_top { "─" };
        std::string multi_bottom_left { "╰" };
        std::string multi_bottom { "─" };
        std::string multi_left { "│" };

        static auto ascii() -> Chars;
    };

    struct Config {
    public:
        DisplayStyle display_style { DisplayStyle::Rich };
        Styles styles;
        Chars chars;

        [[nodiscard]] auto to_json() const -> Json;
        // defaults, overridden by whatever `json` names
        static auto from_json(const Json& json) -> Result<Config, std::string>;
    };
}  // namespace caret

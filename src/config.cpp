#include "config.hpp"

#include <array>
#include <format>
#include <utility>

namespace caret {
    namespace {
        constexpr auto STYLE_FIELDS = std::to_array<std::pair<std::string_view, Style Styles::*>>({
            { "header_bug", &Styles::header_bug },
            { "header_error", &Styles::header_error },
            { "header_warning", &Styles::header_warning },
            { "header_note", &Styles::header_note },
            { "header_help", &Styles::header_help },
            { "header_message", &Styles::header_message },
            { "primary_label_bug", &Styles::primary_label_bug },
            { "primary_label_error", &Styles::primary_label_error },
            { "primary_label_warning", &Styles::primary_label_warning },
            { "primary_label_note", &Styles::primary_label_note },
            { "primary_label_help", &Styles::primary_label_help },
            { "secondary_label", &Styles::secondary_label },
            { "line_number", &Styles::line_number },
            { "source_border", &Styles::source_border },
            { "note_bullet", &Styles::note_bullet },
        });

        constexpr auto CHAR_FIELDS =
            std::to_array<std::pair<std::string_view, std::string Chars::*>>({
                { "source_border_top_left", &Chars::source_border_top_left },
                { "source_border_top", &Chars::source_border_top },
                { "source_border_left", &Chars::source_border_left },
                { "source_border_left_break", &Chars::source_border_left_break },
                { "note_bullet", &Chars::note_bullet },
                { "single_primary_caret", &Chars::single_primary_caret },
                { "single_secondary_caret", &Chars::single_secondary_caret },
                { "multi_primary_caret_start", &Chars::multi_primary_caret_start },
                { "multi_primary_caret_end", &Chars::multi_primary_caret_end },
                { "multi_secondary_caret_start", &Chars::multi_secondary_caret_start },
                { "multi_secondary_caret_end", &Chars::multi_secondary_caret_end },
                { "multi_top_left", &Chars::multi_top_left },
                { "multi_top", &Chars::multi_top },
                { "multi_bottom_left", &Chars::multi_bottom_left },
                { "multi_bottom", &Chars::multi_bottom },
                { "multi_left", &Chars::multi_left },
            });

        template<typename Fields>
        auto unknown_key(const Json& json, const Fields& fields) -> Option<std::string> {
            for (const auto& item : json.items()) {
                const auto& key = item.key();
                auto known = std::ranges::any_of(fields, [&key](const auto& field) {
                    return field.first == key;
                });
                if (!known) {
                    return key;
                }
            }
            return std::nullopt;
        }
    }  // namespace

    auto Styles::header(Severity severity) const -> const Style& {
        switch (severity) {
            case Severity::Bug:
                return header_bug;
            case Severity::Error:
                return header_error;
            case Severity::Warning:
                return header_warning;
            case Severity::Note:
                return header_note;
            case Severity::Help:
                return header_help;
        }
        return header_error;
    }

    auto Styles::label(Option<Severity> severity) const -> const Style& {
        if (!severity) {
            return secondary_label;
        }
        switch (*severity) {
            case Severity::Bug:
                return primary_label_bug;
            case Severity::Error:
                return primary_label_error;
            case Severity::Warning:
                return primary_label_warning;
            case Severity::Note:
                return primary_label_note;
            case Severity::Help:
                return primary_label_help;
        }
        return primary_label_error;
    }

    auto Chars::ascii() -> Chars {
        auto chars = Chars {};
        chars.source_border_top_left = "-";
        chars.source_border_top = "-";
        chars.source_border_left = "|";
        chars.source_border_left_break = ".";
        chars.multi_top_left = "/";
        chars.multi_top = "-";
        chars.multi_bottom_left = "\\";
        chars.multi_bottom = "-";
        chars.multi_left = "|";
        return chars;
    }

    auto Config::to_json() const -> Json {
        auto style_json = Json::object();
        for (const auto& [name, field] : STYLE_FIELDS) {
            style_json[std::string(name)] = (styles.*field).to_json();
        }
        auto chars_json = Json::object();
        for (const auto& [name, field] : CHAR_FIELDS) {
            chars_json[std::string(name)] = chars.*field;
        }

        return { { "display_style", to_lower_str(magic_enum::enum_name(display_style)) },
                 { "styles", std::move(style_json) },
                 { "chars", std::move(chars_json) } };
    }

    auto Config::from_json(const Json& json) -> Result<Config, std::string> {
        auto config = Config {};
        if (!json.is_object()) {
            return std::unexpected(std::format("expected a config object, found {}", json.dump()));
        }

        try {
            if (json.contains("display_style")) {
                const auto name = json.at("display_style").get<std::string>();
                auto display_style =
                    magic_enum::enum_cast<DisplayStyle>(name, magic_enum::case_insensitive);
                if (!display_style) {
                    return std::unexpected(std::format("unknown display style '{}'", name));
                }
                config.display_style = *display_style;
            }

            if (json.contains("styles")) {
                const auto& styles_json = json.at("styles");
                if (auto key = unknown_key(styles_json, STYLE_FIELDS)) {
                    return std::unexpected(std::format("unknown style '{}'", *key));
                }
                for (const auto& [name, field] : STYLE_FIELDS) {
                    const auto key = std::string(name);
                    if (!styles_json.contains(key)) {
                        continue;
                    }
                    auto style = Style::from_json(styles_json.at(key), config.styles.*field);
                    if (!style) {
                        return std::unexpected(
                            std::format("style '{}': {}", name, std::move(style).error())
                        );
                    }
                    config.styles.*field = *style;
                }
            }

            if (json.contains("chars")) {
                const auto& chars_json = json.at("chars");
                if (auto key = unknown_key(chars_json, CHAR_FIELDS)) {
                    return std::unexpected(std::format("unknown border glyph '{}'", *key));
                }
                for (const auto& [name, field] : CHAR_FIELDS) {
                    const auto key = std::string(name);
                    if (chars_json.contains(key)) {
                        config.chars.*field = chars_json.at(key).get<std::string>();
                    }
                }
            }
        } catch (const Json::exception& error) {
            return std::unexpected(std::format("malformed config: {}", error.what()));
        }
        return config;
    }
}  // namespace caret

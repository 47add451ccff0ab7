#include "style.hpp"

#include <format>

namespace caret {
    auto Style::to_ansi() const -> std::string {
        std::string codes;
        auto append = [&codes](std::string_view code) {
            if (!codes.empty()) {
                codes += ';';
            }
            codes += code;
        };

        append("0");
        if (bold) {
            append(term::BOLD);
        }
        if (underline) {
            append(term::UNDERLINE);
        }
        if (foreground) {
            const auto base = intense ? 90 : 30;
            append(std::to_string(base + static_cast<int>(*foreground)));
        }
        return std::format("{}{}m", term::CSI, codes);
    }

    auto Style::to_json() const -> Json {
        auto json = Json::object();
        if (foreground) {
            json["fg"] = to_lower_str(magic_enum::enum_name(*foreground));
        }
        json["bold"] = bold;
        json["intense"] = intense;
        json["underline"] = underline;
        return json;
    }

    auto Style::from_json(const Json& json, Style base) -> Result<Style, std::string> {
        if (!json.is_object()) {
            return std::unexpected(std::format("expected a style object, found {}", json.dump()));
        }

        try {
            if (json.contains("fg")) {
                const auto& fg = json.at("fg");
                if (fg.is_null()) {
                    base.foreground = std::nullopt;
                } else {
                    const auto name = fg.get<std::string>();
                    auto color = magic_enum::enum_cast<Color>(name, magic_enum::case_insensitive);
                    if (!color) {
                        return std::unexpected(std::format("unknown color '{}'", name));
                    }
                    base.foreground = *color;
                }
            }
            base.bold = json.value("bold", base.bold);
            base.intense = json.value("intense", base.intense);
            base.underline = json.value("underline", base.underline);
        } catch (const Json::exception& error) {
            return std::unexpected(std::format("malformed style: {}", error.what()));
        }
        return base;
    }
}  // namespace caret

#pragma once

#include <magic_enum.hpp>

#include "common.hpp"

namespace caret {
    namespace term {
        static constexpr std::string_view RESET = "\033[0m";
        static constexpr std::string_view CSI = "\033[";
        static constexpr std::string_view BOLD = "1";
        static constexpr std::string_view UNDERLINE = "4";
    }  // namespace term

    enum class Color : uint8_t {
        Black,
        Red,
        Green,
        Yellow,
        Blue,
        Magenta,
        Cyan,
        White,
    };

    struct Style {
    public:
        Option<Color> foreground;
        bool bold { false };
        bool intense { false };
        bool underline { false };

        static auto fg(Color color) -> Style {
            return Style { .foreground = color };
        }
        auto with_bold() && -> Style {
            bold = true;
            return *this;
        }
        auto with_intense() && -> Style {
            intense = true;
            return *this;
        }

        auto operator==(const Style&) const -> bool = default;

        // SGR escape selecting this style, starting from a reset
        [[nodiscard]] auto to_ansi() const -> std::string;

        [[nodiscard]] auto to_json() const -> Json;
        // overrides the fields present in `json` on top of `base`
        static auto from_json(const Json& json, Style base) -> Result<Style, std::string>;
    };
}  // namespace caret

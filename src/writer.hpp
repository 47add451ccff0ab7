#pragma once

#include <ostream>

#include "errors.hpp"
#include "style.hpp"

namespace caret {
    enum class ColorChoice : uint8_t {
        Always,
        Never,
        // color only when the stream is a terminal and NO_COLOR is unset
        Auto,
    };

    // styled text sink the renderer writes into
    class WriteColor {
    public:
        WriteColor() = default;
        virtual ~WriteColor() = default;
        WriteColor(WriteColor&&) = default;
        WriteColor(const WriteColor&) = delete;
        auto operator=(WriteColor&&) -> WriteColor& = default;
        auto operator=(const WriteColor&) -> WriteColor& = delete;

        virtual auto write(std::string_view text) -> RenderResult<void> = 0;
        virtual auto set_style(const Style& style) -> RenderResult<void> = 0;
        virtual auto reset() -> RenderResult<void> = 0;

        // when false, callers skip `set_style` and `reset` altogether
        [[nodiscard]] virtual auto supports_color() const -> bool = 0;
    };

    class StreamWriter : public WriteColor {
    public:
        StreamWriter(std::ostream& stream, ColorChoice choice);

        auto write(std::string_view text) -> RenderResult<void> override;
        auto set_style(const Style& style) -> RenderResult<void> override;
        auto reset() -> RenderResult<void> override;

        [[nodiscard]] auto supports_color() const -> bool override {
            return m_color;
        }

    private:
        auto check_stream(std::string_view what) -> RenderResult<void>;

        Ref<std::ostream> m_stream;
        bool m_color;
    };

    // resolves `Auto` against the terminal behind `stream`
    //
    // only `std::cout`, `std::cerr` and `std::clog` can reach a terminal; any other stream
    // is treated as redirected.
    [[nodiscard]] auto stream_supports_color(const std::ostream& stream, ColorChoice choice)
        -> bool;
}  // namespace caret

#include "writer.hpp"

#include <cstdlib>
#include <iostream>
#include <unistd.h>

namespace caret {
    namespace {
        auto terminal_fd(const std::ostream& stream) -> Option<int> {
            if (&stream == &std::cout) {
                return STDOUT_FILENO;
            }
            if (&stream == &std::cerr || &stream == &std::clog) {
                return STDERR_FILENO;
            }
            return std::nullopt;
        }
    }  // namespace

    auto stream_supports_color(const std::ostream& stream, ColorChoice choice) -> bool {
        switch (choice) {
            case ColorChoice::Always:
                return true;
            case ColorChoice::Never:
                return false;
            case ColorChoice::Auto:
                break;
        }
        if (std::getenv("NO_COLOR") != nullptr) {
            return false;
        }
        const auto* term = std::getenv("TERM");
        if (term != nullptr && std::string_view(term) == "dumb") {
            return false;
        }
        const auto fd = terminal_fd(stream);
        return fd && isatty(*fd) != 0;
    }

    StreamWriter::StreamWriter(std::ostream& stream, ColorChoice choice)
        : m_stream(stream)
        , m_color(stream_supports_color(stream, choice)) {}

    auto StreamWriter::check_stream(std::string_view what) -> RenderResult<void> {
        if (!m_stream.get()) {
            return errors::io(what);
        }
        return {};
    }

    auto StreamWriter::write(std::string_view text) -> RenderResult<void> {
        m_stream.get() << text;
        return check_stream("write to output stream");
    }

    auto StreamWriter::set_style(const Style& style) -> RenderResult<void> {
        if (!m_color) {
            return {};
        }
        m_stream.get() << style.to_ansi();
        return check_stream("set output style");
    }

    auto StreamWriter::reset() -> RenderResult<void> {
        if (!m_color) {
            return {};
        }
        m_stream.get() << term::RESET;
        return check_stream("reset output style");
    }
}  // namespace caret

#pragma once

#include <string>
#include <string_view>

#include "errors.hpp"
#include "location.hpp"

namespace caret {
    // offsets of every line start: 0, then the byte after each '\n'
    auto line_starts(std::string_view source) -> Vec<size_t>;

    // number of characters in `line_source` before `byte_index`
    //
    // `byte_index` is absolute; `line_start` is the absolute offset of `line_source`.
    // offsets before the line give 0, offsets at or past its end give its full character
    // count, and offsets inside a multi-byte character count as that character's start.
    auto column_index(std::string_view line_source, size_t line_start, size_t byte_index)
        -> size_t;

    // whether `text` holds nothing but whitespace, ASCII or Unicode (U+00A0, U+3000, ...)
    //
    // malformed UTF-8 is never blank.
    auto is_blank(std::string_view text) -> bool;

    inline auto column_number(std::string_view line_source, size_t line_start, size_t byte_index)
        -> size_t {
        return column_index(line_source, line_start, byte_index) + 1;
    }

    struct Line {
    public:
        size_t number;
        ByteRange range;
        std::string_view source;  // includes the line terminator, if any

        [[nodiscard]] auto index() const -> size_t {
            return number - 1;
        }
        [[nodiscard]] auto column_index(size_t byte_index) const -> size_t {
            return caret::column_index(source, range.start, byte_index);
        }
        [[nodiscard]] auto column_number(size_t byte_index) const -> size_t {
            return caret::column_number(source, range.start, byte_index);
        }
    };

    // read-only source table consulted while rendering
    //
    // answers must stay stable for the duration of a render call; views returned here are
    // only used until the call returns.
    class Files {
    public:
        Files() = default;
        virtual ~Files() = default;
        Files(Files&&) = default;
        Files(const Files&) = default;
        auto operator=(Files&&) -> Files& = default;
        auto operator=(const Files&) -> Files& = default;

        [[nodiscard]] virtual auto origin(FileId file_id) const
            -> RenderResult<std::string_view> = 0;
        [[nodiscard]] virtual auto source(FileId file_id) const
            -> RenderResult<std::string_view> = 0;
        [[nodiscard]] virtual auto line_index(FileId file_id, size_t byte_index) const
            -> RenderResult<size_t> = 0;
        [[nodiscard]] virtual auto line(FileId file_id, size_t line_index) const
            -> RenderResult<Line> = 0;

        // the line containing `byte_index`
        [[nodiscard]] auto line_at(FileId file_id, size_t byte_index) const -> RenderResult<Line> {
            return line_index(file_id, byte_index).and_then([&](size_t index) {
                return line(file_id, index);
            });
        }
    };

    class SimpleFile {
    public:
        SimpleFile(std::string origin, std::string source)
            : m_origin(std::move(origin))
            , m_source(std::move(source))
            , m_line_starts(line_starts(m_source)) {}

        [[nodiscard]] auto origin() const -> std::string_view {
            return m_origin;
        }
        [[nodiscard]] auto source() const -> std::string_view {
            return m_source;
        }
        [[nodiscard]] auto line_count() const -> size_t {
            return m_line_starts.size();
        }

        [[nodiscard]] auto line_index(size_t byte_index) const -> RenderResult<size_t>;
        [[nodiscard]] auto line(size_t line_index) const -> RenderResult<Line>;

    private:
        [[nodiscard]] auto line_start(size_t line_index) const -> RenderResult<size_t>;

        std::string m_origin;
        std::string m_source;
        Vec<size_t> m_line_starts;
    };

    class SimpleFiles : public Files {
    public:
        auto add(std::string origin, std::string source) -> FileId;

        [[nodiscard]] auto get(FileId file_id) const -> RenderResult<Ref<const SimpleFile>>;
        [[nodiscard]] auto size() const -> size_t {
            return m_files.size();
        }

        [[nodiscard]] auto origin(FileId file_id) const -> RenderResult<std::string_view> override;
        [[nodiscard]] auto source(FileId file_id) const -> RenderResult<std::string_view> override;
        [[nodiscard]] auto line_index(FileId file_id, size_t byte_index) const
            -> RenderResult<size_t> override;
        [[nodiscard]] auto line(FileId file_id, size_t line_index) const
            -> RenderResult<Line> override;

    private:
        // files are boxed so views into their sources survive later `add` calls
        Vec<Box<SimpleFile>> m_files;
    };
}  // namespace caret

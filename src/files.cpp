#include "files.hpp"

#include <algorithm>

namespace caret {
    namespace {
        auto is_char_boundary(std::string_view source, size_t index) -> bool {
            if (index == 0 || index >= source.length()) {
                return true;
            }
            // UTF-8 continuation bytes look like 0b10xxxxxx
            return (static_cast<unsigned char>(source.at(index)) & 0xC0U) != 0x80U;
        }

        // code point at `index`, advancing past it; none on malformed UTF-8
        auto decode_char(std::string_view text, size_t& index) -> Option<char32_t> {
            const auto lead = static_cast<unsigned char>(text.at(index));
            if (lead < 0x80U) {
                ++index;
                return lead;
            }

            size_t length = 0;
            char32_t code_point = 0;
            if ((lead & 0xE0U) == 0xC0U) {
                length = 2;
                code_point = lead & 0x1FU;
            } else if ((lead & 0xF0U) == 0xE0U) {
                length = 3;
                code_point = lead & 0x0FU;
            } else if ((lead & 0xF8U) == 0xF0U) {
                length = 4;
                code_point = lead & 0x07U;
            } else {
                return std::nullopt;
            }
            if (index + length > text.length()) {
                return std::nullopt;
            }

            for (size_t i = 1; i < length; ++i) {
                const auto byte = static_cast<unsigned char>(text.at(index + i));
                if ((byte & 0xC0U) != 0x80U) {
                    return std::nullopt;
                }
                code_point = (code_point << 6U) | (byte & 0x3FU);
            }
            index += length;
            return code_point;
        }

        // the Unicode White_Space property
        auto is_whitespace(char32_t ch) -> bool {
            switch (ch) {
                case 0x09:
                case 0x0A:
                case 0x0B:
                case 0x0C:
                case 0x0D:
                case 0x20:
                case 0x85:
                case 0xA0:
                case 0x1680:
                case 0x2028:
                case 0x2029:
                case 0x202F:
                case 0x205F:
                case 0x3000:
                    return true;
                default:
                    return ch >= 0x2000 && ch <= 0x200A;
            }
        }
    }  // namespace

    auto is_blank(std::string_view text) -> bool {
        size_t index = 0;
        while (index < text.length()) {
            auto ch = decode_char(text, index);
            if (!ch || !is_whitespace(*ch)) {
                return false;
            }
        }
        return true;
    }

    auto line_starts(std::string_view source) -> Vec<size_t> {
        Vec<size_t> starts;
        starts.push_back(0);

        for (size_t i = 0; i < source.length(); ++i) {
            if (source.at(i) == '\n') {
                starts.push_back(i + 1);
            }
        }
        return starts;
    }

    auto column_index(std::string_view line_source, size_t line_start, size_t byte_index)
        -> size_t {
        if (byte_index < line_start) {
            return 0;
        }
        const auto relative_index = byte_index - line_start;

        size_t column = 0;
        for (size_t i = 0; i < line_source.length() && i < relative_index; ++i) {
            if (is_char_boundary(line_source, i)) {
                ++column;
            }
        }

        if (relative_index >= line_source.length() || is_char_boundary(line_source, relative_index)) {
            return column;
        }
        return column - 1;
    }

    auto SimpleFile::line_start(size_t line_index) const -> RenderResult<size_t> {
        if (line_index < m_line_starts.size()) {
            return m_line_starts.at(line_index);
        }
        if (line_index == m_line_starts.size()) {
            return m_source.length();
        }
        return errors::line_too_large(line_index, m_line_starts.size() - 1);
    }

    auto SimpleFile::line_index(size_t byte_index) const -> RenderResult<size_t> {
        if (byte_index > m_source.length()) {
            return errors::index_too_large(byte_index, m_source.length());
        }
        auto it = std::ranges::upper_bound(m_line_starts, byte_index);
        return static_cast<size_t>(it - m_line_starts.begin() - 1);
    }

    auto SimpleFile::line(size_t line_index) const -> RenderResult<Line> {
        if (line_index >= m_line_starts.size()) {
            return errors::line_too_large(line_index, m_line_starts.size() - 1);
        }
        auto start = line_start(line_index);
        auto end = line_start(line_index + 1);
        if (!start) {
            return std::unexpected(std::move(start).error());
        }
        if (!end) {
            return std::unexpected(std::move(end).error());
        }

        const auto range = ByteRange { .start = *start, .end = *end };
        return Line {
            .number = line_index + 1,
            .range = range,
            .source = std::string_view(m_source).substr(range.start, range.length()),
        };
    }

    auto SimpleFiles::add(std::string origin, std::string source) -> FileId {
        auto file_id = static_cast<FileId>(m_files.size());
        m_files.push_back(std::make_unique<SimpleFile>(std::move(origin), std::move(source)));
        return file_id;
    }

    auto SimpleFiles::get(FileId file_id) const -> RenderResult<Ref<const SimpleFile>> {
        if (file_id >= m_files.size()) {
            return errors::file_missing(file_id);
        }
        return std::cref(*m_files.at(file_id));
    }

    auto SimpleFiles::origin(FileId file_id) const -> RenderResult<std::string_view> {
        return get(file_id).transform([](const SimpleFile& file) { return file.origin(); });
    }

    auto SimpleFiles::source(FileId file_id) const -> RenderResult<std::string_view> {
        return get(file_id).transform([](const SimpleFile& file) { return file.source(); });
    }

    auto SimpleFiles::line_index(FileId file_id, size_t byte_index) const -> RenderResult<size_t> {
        return get(file_id).and_then([&](const SimpleFile& file) {
            return file.line_index(byte_index);
        });
    }

    auto SimpleFiles::line(FileId file_id, size_t line_index) const -> RenderResult<Line> {
        return get(file_id).and_then([&](const SimpleFile& file) { return file.line(line_index); });
    }
}  // namespace caret

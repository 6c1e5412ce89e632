// ==============================================================================
// line_extractor.cpp - Извлечение строки по смещению совпадения
// ==============================================================================

#include "streamgrep/line_extractor.hpp"

#include "streamgrep/byte_search.hpp"

#include <algorithm>

namespace streamgrep::search {

LineInfo extract_line(std::string_view chunk, std::size_t match_offset,
                      std::uint32_t lines_before_chunk) {
    match_offset = std::min(match_offset, chunk.size());

    const std::int64_t prev_newline =
        find_byte_backward(chunk, '\n', static_cast<std::int64_t>(match_offset) - 1);
    const std::size_t line_start =
        prev_newline < 0 ? 0 : static_cast<std::size_t>(prev_newline) + 1;
    const std::size_t line_end = find_byte_forward(chunk, '\n', match_offset);

    LineInfo info;
    info.line_number = lines_before_chunk +
                       static_cast<std::uint32_t>(count_byte(chunk, '\n', 0, match_offset)) + 1;
    info.line_content.assign(chunk.substr(line_start, line_end - line_start));
    info.column_offset = static_cast<std::uint32_t>(match_offset - line_start);
    return info;
}

bool is_binary_chunk(std::string_view chunk, std::size_t sample_size) {
    return chunk.substr(0, sample_size).find('\0') != std::string_view::npos;
}

std::string_view trim_line_end(std::string_view line) {
    std::size_t end = line.size();
    while (end > 0) {
        char c = line[end - 1];
        if (c != ' ' && c != '\t' && c != '\r' && c != '\n' && c != '\v' && c != '\f') {
            break;
        }
        --end;
    }
    return line.substr(0, end);
}

std::string truncate_preview(std::string_view content, std::size_t max_columns) {
    if (content.size() <= max_columns) {
        return std::string(content);
    }

    // Не разрезаем continuation-байты (10xxxxxx)
    std::size_t cut = max_columns;
    while (cut > 0 && (static_cast<unsigned char>(content[cut]) & 0xC0) == 0x80) {
        --cut;
    }

    std::string result(content.substr(0, cut));
    result += TRUNCATION_MARKER;
    return result;
}

}  // namespace streamgrep::search

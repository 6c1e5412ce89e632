// ==============================================================================
// streamgrep/line_extractor.hpp - Извлечение строки по смещению совпадения
// ==============================================================================
//
// Назначение:
// - Номер строки, содержимое строки и колонка совпадения по смещению в чанке
// - Эвристика двоичного содержимого (NUL-байт в начале файла)
// - Подготовка содержимого строки к выводу (обрезка, превью)
//
// ==============================================================================

#ifndef STREAMGREP_LINE_EXTRACTOR_HPP
#define STREAMGREP_LINE_EXTRACTOR_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace streamgrep::search {

/// Размер выборки для эвристики двоичного файла
constexpr std::size_t BINARY_SAMPLE_SIZE = 8192;

/// Маркер обрезанного превью
constexpr const char* TRUNCATION_MARKER = "...";

/// Информация о строке совпадения
struct LineInfo {
    std::uint32_t line_number = 0;    ///< Номер строки (с 1)
    std::string line_content;         ///< Содержимое строки без '\n'
    std::uint32_t column_offset = 0;  ///< Смещение совпадения в строке (байты, с 0)
};

/// Извлечь строку, содержащую match_offset
///
/// Начало строки: последний '\n' перед совпадением (или начало чанка).
/// Конец строки: первый '\n' начиная с совпадения (или конец чанка).
/// Строка, выходящая за пределы чанка, обрезается его границами.
///
/// @param chunk Байты чанка
/// @param match_offset Смещение совпадения в чанке
/// @param lines_before_chunk Число переводов строки до начала чанка
LineInfo extract_line(std::string_view chunk, std::size_t match_offset,
                      std::uint32_t lines_before_chunk = 0);

/// true если в первых sample_size байтах есть NUL
bool is_binary_chunk(std::string_view chunk, std::size_t sample_size = BINARY_SAMPLE_SIZE);

/// Убрать завершающие пробельные символы (' ', '\t', '\r', '\n', '\v', '\f')
std::string_view trim_line_end(std::string_view line);

/// Обрезать превью до max_columns байт и добавить "..."
/// Многобайтовая последовательность UTF-8 на границе не разрезается
std::string truncate_preview(std::string_view content, std::size_t max_columns);

}  // namespace streamgrep::search

#endif  // STREAMGREP_LINE_EXTRACTOR_HPP

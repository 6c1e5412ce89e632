// ==============================================================================
// streamgrep/byte_search.hpp - Поиск литеральных шаблонов в байтовых буферах
// ==============================================================================
//
// Чистые функции без состояния. Поиск шаблона: фильтр по первому байту,
// затем полная проверка остатка (O(N*P) в худшем случае; чанки ограничены,
// шаблоны короткие).
//
// Регистронезависимый вариант сравнивает ASCII-байты в нижнем регистре,
// байты вне ASCII сравниваются точно.
//
// ==============================================================================

#ifndef STREAMGREP_BYTE_SEARCH_HPP
#define STREAMGREP_BYTE_SEARCH_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace streamgrep::search {

/// Все смещения вхождений pattern в haystack[start..]
/// Пустой шаблон или шаблон длиннее остатка: пустой результат
std::vector<std::size_t> find_all(std::string_view haystack, std::string_view pattern,
                                  std::size_t start = 0);

/// Есть ли хотя бы одно вхождение (ранний выход)
bool exists(std::string_view haystack, std::string_view pattern, std::size_t start = 0);

/// find_all без учёта регистра ASCII
std::vector<std::size_t> find_all_icase(std::string_view haystack, std::string_view pattern,
                                        std::size_t start = 0);

/// exists без учёта регистра ASCII
bool exists_icase(std::string_view haystack, std::string_view pattern, std::size_t start = 0);

/// Количество байтов value в haystack[start, end)
/// end ограничивается размером буфера
std::size_t count_byte(std::string_view haystack, char value, std::size_t start,
                       std::size_t end);

/// Индекс последнего value в haystack[0, from], -1 если не найден
/// from за концом буфера ограничивается последним индексом
std::int64_t find_byte_backward(std::string_view haystack, char value, std::int64_t from);

/// Индекс первого value в haystack[from, size), size() если не найден
std::size_t find_byte_forward(std::string_view haystack, char value, std::size_t from);

/// Байт слова: ASCII буква, цифра или '_'
bool is_word_byte(unsigned char c);

/// ASCII lower-case; байты вне 'A'..'Z' не меняются
char ascii_lower(char c);

/// Перевести ASCII-буквы строки в нижний регистр
std::string ascii_lower(std::string_view s);

/// Содержит ли строка заглавные ASCII-буквы
bool has_ascii_upper(std::string_view s);

}  // namespace streamgrep::search

#endif  // STREAMGREP_BYTE_SEARCH_HPP

// ==============================================================================
// streamgrep/glob.hpp - Glob-фильтры путей
// ==============================================================================
//
// Синтаксис:
//   *      любая последовательность байтов, кроме '/'
//   **     любая последовательность, включая '/'
//   ?      один байт, кроме '/'
//   [abc]  класс байтов, [a-z] диапазон, [!x] / [^x] отрицание
//
// Glob без '/' сравнивается с именем записи, glob с '/' — с относительным путём.
//
// ==============================================================================

#ifndef STREAMGREP_GLOB_HPP
#define STREAMGREP_GLOB_HPP

#include <string>
#include <string_view>
#include <vector>

namespace streamgrep::io {

/// Сопоставить текст с glob-шаблоном целиком
bool glob_match(std::string_view pattern, std::string_view text);

/// Разобранный набор фильтров путей
class PathFilter {
public:
    PathFilter() = default;

    /// @param filters Фильтры; префикс '!' означает исключение
    explicit PathFilter(const std::vector<std::string>& filters);

    /// Исключена ли директория (поддерево не обходится)
    bool excludes_dir(std::string_view relative_path, std::string_view name) const;

    /// Проходит ли файл фильтры
    bool accepts_file(std::string_view relative_path, std::string_view name) const;

    bool empty() const { return includes_.empty() && excludes_.empty(); }

private:
    static bool matches_any(const std::vector<std::string>& globs, std::string_view relative_path,
                            std::string_view name);

    std::vector<std::string> includes_;
    std::vector<std::string> excludes_;
};

}  // namespace streamgrep::io

#endif  // STREAMGREP_GLOB_HPP

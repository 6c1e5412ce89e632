// ==============================================================================
// streamgrep/config.hpp - Файл конфигурации (YAML)
// ==============================================================================
//
// Порядок применения: встроенные значения < файл конфигурации < флаги CLI.
//
// Поиск файла: --config <file>, иначе переменная окружения STREAMGREP_CONFIG.
//
// Пример:
//   chunk_size: 256K
//   threads: 4
//   hidden: false
//   globs: ["!node_modules", "!*.min.js"]
//   max_columns: 200
//   context: 1
//   smart_case: true
//   color: true
//
// ==============================================================================

#ifndef STREAMGREP_CONFIG_HPP
#define STREAMGREP_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace streamgrep::config {

/// Переменная окружения с путём к файлу конфигурации
constexpr const char* CONFIG_ENV = "STREAMGREP_CONFIG";

/// Значения из файла конфигурации (nullopt = не задано)
struct Config {
    std::optional<std::uint32_t> chunk_size;
    std::optional<std::size_t> threads;
    std::optional<bool> hidden;
    std::vector<std::string> globs;
    std::optional<std::uint32_t> max_columns;
    std::optional<std::uint32_t> context;
    std::optional<bool> smart_case;
    std::optional<bool> color;
};

/// Ошибка загрузки
struct Error {
    std::string message;
    std::string path;

    /// "<path>: <message>"
    std::string format() const;
};

/// Результат загрузки
struct LoadResult {
    bool ok = false;
    Config config;
    std::vector<std::string> warnings;  ///< Неизвестные ключи
    Error error;
};

/// Загрузить файл конфигурации
LoadResult load(const std::filesystem::path& path);

/// Разобрать YAML-текст конфигурации
/// @param source Имя источника для сообщений
LoadResult parse(std::string_view yaml, const std::string& source = "<config>");

/// Найти файл конфигурации: явный путь, иначе STREAMGREP_CONFIG
std::optional<std::filesystem::path> locate(const std::optional<std::filesystem::path>& explicit_path);

/// Разобрать размер: "4096", "512K", "1M" (регистр суффикса не важен)
std::optional<std::uint64_t> parse_size(std::string_view text);

}  // namespace streamgrep::config

#endif  // STREAMGREP_CONFIG_HPP

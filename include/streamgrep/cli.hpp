// ==============================================================================
// streamgrep/cli.hpp - CLI парсинг и команды
// ==============================================================================
//
// Назначение:
// - Парсинг argv
// - Генерация --help / --version
// - Сборка SearchOptions: встроенные значения < файл конфигурации < флаги
// - Исключения по умолчанию: служебные директории и .gitignore корня поиска
// - Диагностические ошибки CLI (exit code 2)
//
// ==============================================================================

#ifndef STREAMGREP_CLI_HPP
#define STREAMGREP_CLI_HPP

#include "streamgrep/config.hpp"
#include "streamgrep/options.hpp"
#include "streamgrep/vfs.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace streamgrep::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    int verbose = 0;             // --verbose (repeatable)
    bool quiet = false;          // -q, --quiet
    bool no_progress = false;    // --no-progress
    std::optional<bool> color;   // --color / --no-color (nullopt = auto)
    std::optional<std::filesystem::path> config;  // --config
};

// ----------------------------------------------------------------------------
// Команды
// ----------------------------------------------------------------------------

/// Поиск (основная команда)
///
/// Поля, которые может задать файл конфигурации, хранятся как optional:
/// nullopt означает "флаг не указан".
struct SearchCommand {
    std::string pattern;
    std::vector<std::string> paths;

    // Сопоставление
    bool ignore_case = false;          // -i, --ignore-case
    bool smart_case = false;           // -S, --smart-case
    bool word = false;                 // -w, --word-regexp
    bool invert = false;               // -v, --invert-match
    bool count = false;                // -c, --count
    bool files_with_matches = false;   // -l, --files-with-matches
    bool files_without_match = false;  // --files-without-match
    bool only_matching = false;        // -o, --only-matching

    // Контекст
    std::optional<std::uint32_t> after;    // -A
    std::optional<std::uint32_t> before;   // -B
    std::optional<std::uint32_t> context;  // -C

    // Ограничения
    std::optional<std::uint32_t> max_columns;  // -M, --max-columns
    std::optional<std::uint32_t> max_count;    // -m, --max-count

    // Файлы
    bool hidden = false;             // --hidden
    std::vector<std::string> globs;  // -g, --glob; --exclude добавляет '!GLOB'
    bool no_exclude = false;         // --no-exclude (подразумевает --hidden)

    // Движок
    std::optional<std::uint32_t> chunk_size;  // --chunk-size
    std::optional<std::size_t> threads;       // -j, --threads

    // Вывод
    bool json = false;    // --json
    bool jsonl = false;   // --jsonl
    bool stream = false;  // --stream
    bool column = false;  // --column
};

/// help - показать справку
struct HelpCommand {};

/// version - показать версию
struct VersionCommand {};

// ----------------------------------------------------------------------------
// Command - вариант команды
// ----------------------------------------------------------------------------

using Command = std::variant<SearchCommand, HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Диагностика CLI
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 2;
    std::string stderr_message;
};

// ----------------------------------------------------------------------------
// Результат парсинга
// ----------------------------------------------------------------------------

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

/// Парсить аргументы командной строки
ParseResult parse(int argc, char** argv);

/// Собрать SearchOptions: config задаёт значения по умолчанию, флаги их перекрывают
///
/// @param exclusions Фильтры из collect_exclusions; добавляются между glob'ами
///                   конфигурации и glob'ами командной строки
search::SearchOptionsBuilder::BuildResult build_options(
    const SearchCommand& cmd, const config::Config& cfg,
    const std::vector<std::string>& exclusions = {});

/// Имена, исключаемые из обхода по умолчанию
const std::vector<std::string>& default_excludes();

/// Разобрать содержимое .gitignore
///
/// Пустые строки и комментарии '#' пропускаются, пробелы по краям обрезаются.
/// Строки '!' (повторное включение) возвращаются как есть.
std::vector<std::string> parse_gitignore(std::string_view content);

/// Фильтры исключения для поиска: default_excludes() и .gitignore каждого корня
///
/// Пустой результат при --no-exclude. Нечитаемый или отсутствующий .gitignore
/// пропускается.
std::vector<std::string> collect_exclusions(const SearchCommand& cmd, const io::FileSystem& fs);

/// Генерировать текст --help
std::string render_help();

/// Генерировать текст --version
std::string render_version();

/// Сообщение об ошибке использования: error + usage + подсказка
std::string render_usage_error(const std::string& error_msg);

// ----------------------------------------------------------------------------
// Константы
// ----------------------------------------------------------------------------

/// Версия программы
constexpr const char* VERSION = "0.3.0";

/// Длина превью в текстовом выводе, если -M не задан (JSON не обрезается)
constexpr std::uint32_t DEFAULT_MAX_COLUMNS = 200;

/// Описание программы
constexpr const char* ABOUT = "Search files for a literal byte pattern, chunk by chunk";

}  // namespace streamgrep::cli

#endif  // STREAMGREP_CLI_HPP

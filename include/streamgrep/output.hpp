// ==============================================================================
// streamgrep/output.hpp - Пользовательский вывод
// ==============================================================================
//
// Назначение:
// - Единственная точка записи в stdout/stderr (ядро поиска ничего не печатает)
// - Сообщения с префиксами [+] [!] [x] [*] [~]
// - Форматирование совпадений, прогресса и итогов
// - JSON / JSON Lines (RapidJSON)
// - Цветной вывод (ANSI escape codes, только на TTY)
// - Прогресс-индикатор в stderr
//
// ==============================================================================

#ifndef STREAMGREP_OUTPUT_HPP
#define STREAMGREP_OUTPUT_HPP

#include "streamgrep/coordinator.hpp"
#include "streamgrep/file_scan.hpp"

#include <rapidjson/document.h>

#include <cstddef>
#include <cstdio>
#include <optional>
#include <string>
#include <string_view>

namespace streamgrep::output {

// ----------------------------------------------------------------------------
// Потоки вывода
// ----------------------------------------------------------------------------

enum class Stream { Stdout, Stderr };

// ----------------------------------------------------------------------------
// Формат вывода
// ----------------------------------------------------------------------------

enum class Format {
    Std,   // path:line: content
    Json,  // JSON массив
    Jsonl  // JSON Lines (один объект на строку)
};

// ----------------------------------------------------------------------------
// ANSI цвета для терминала
// ----------------------------------------------------------------------------

enum class Color {
    Default,
    Green,   // Успех, информация
    Yellow,  // Предупреждения, номера строк
    Red,     // Ошибки
    Cyan,    // Пути, отладка
    Magenta  // Трассировка
};

// ----------------------------------------------------------------------------
// Конфигурация вывода
// ----------------------------------------------------------------------------

struct OutputConfig {
    bool quiet = false;           // -q: подавить informational stderr
    int verbose = 0;              // --verbose: уровень подробности (0..2+)
    bool progress = true;         // --no-progress: скрыть индикатор
    Format format = Format::Std;  // Формат вывода

    /// Цвет: nullopt = автоопределение по TTY
    std::optional<bool> color;
};

// ----------------------------------------------------------------------------
// Writer - единый слой вывода
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    // Базовый вывод
    // -------------------------------------------------------------------------

    /// Записать байты в поток
    void write(Stream s, std::string_view bytes);

    /// Записать строку с переводом строки
    void write_line(Stream s, std::string_view bytes);

    // Сообщения с префиксами
    // -------------------------------------------------------------------------

    /// "[+] <message>" в stderr (если не quiet)
    void info(std::string_view message);

    /// "[!] <message>" в stderr (если не quiet)
    void warn(std::string_view message);

    /// "[x] <message>" в stderr (всегда)
    void error(std::string_view message);

    /// "[*] <message>" в stderr (только при verbose > 0)
    void debug(std::string_view message);

    /// "[~] <message>" в stderr (только при verbose > 1)
    void trace(std::string_view message);

    // Результаты поиска
    // -------------------------------------------------------------------------

    /// Вывести совпадение (с контекстом, если он есть) в выбранном формате
    void match(const search::SearchMatch& m, bool with_column);

    /// Вывести строку "path:count" (режим -c)
    void count(const std::string& path, std::uint32_t count);

    /// Вывести путь файла (режимы -l / -L)
    void file_path(const std::string& path);

    /// Завершить вывод результатов (Format::Json: записать накопленный массив)
    void end_results();

    // JSON
    // -------------------------------------------------------------------------

    /// Записать JSON значение
    void write_json(const rapidjson::Value& value);

    /// Записать JSON значение + newline (JSONL)
    void write_json_line(const rapidjson::Value& value);

    /// Записать pretty JSON (с отступами)
    void write_json_pretty(const rapidjson::Value& value);

    // Прогресс-индикатор
    // -------------------------------------------------------------------------

    /// Начать прогресс-индикатор (только stderr TTY, не quiet/verbose)
    void progress_begin();

    /// Перерисовать строку прогресса
    void progress_tick(const search::SearchProgress& progress);

    /// Стереть строку прогресса
    void progress_end();

    bool progress_active() const { return progress_active_; }

    // Управление
    // -------------------------------------------------------------------------

    void flush();

    const OutputConfig& config() const { return config_; }

    /// Использовать ли цвет для потока
    bool use_color(Stream s) const;

private:
    void write_prefixed(std::string_view prefix, Color color, std::string_view message);

    /// Записать с цветом
    void write_colored(Stream s, std::string_view message, Color color);

    FILE* get_file(Stream s) const;

    /// Стереть прогресс перед обычным выводом
    void clear_progress_line();

    /// Аллокатор для очередного JSON-объекта
    rapidjson::Document::AllocatorType& json_allocator();

    /// Отдать результат в JSON/JSONL
    void emit_json(rapidjson::Value& value);

    OutputConfig config_;

    // Накопленный массив для Format::Json
    rapidjson::Document json_;
    // Временные объекты для Format::Jsonl
    rapidjson::Document scratch_;

    bool progress_active_ = false;
    bool progress_drawn_ = false;
};

// ----------------------------------------------------------------------------
// Форматирование
// ----------------------------------------------------------------------------

/// "path:line: content" (с колонкой: "path:line:column: content")
/// При color пути и номер строки окрашиваются (cyan / yellow)
std::string format_match(const search::SearchMatch& m, bool color, bool with_column = false);

/// Строка контекста: "path-line- content"
std::string format_context_line(const std::string& path, const search::ContextLine& line,
                                bool color);

/// "Searching... <scanned>/<total> files, <matches> matches"
std::string format_progress(const search::SearchProgress& progress);

/// "Found <N> match(es) (searched <M> file(s))"
std::string format_summary(const search::SearchProgress& progress);

/// Форматирует информационное сообщение: "[+] <message>\n"
std::string format_info(std::string_view message);

/// Форматирует сообщение об ошибке: "[x] <message>\n"
std::string format_error(std::string_view message);

/// Форматирует предупреждение: "[!] <message>\n"
std::string format_warning(std::string_view message);

/// Форматирует отладочное сообщение: "[*] <message>\n"
std::string format_debug(std::string_view message);

/// Совпадение как JSON-объект
rapidjson::Value match_to_json(const search::SearchMatch& m,
                               rapidjson::Document::AllocatorType& alloc);

/// Результат файла как JSON-объект (path, match_count, bytes_scanned, error)
rapidjson::Value file_result_to_json(const search::FileScanResult& r,
                                     rapidjson::Document::AllocatorType& alloc);

/// Сериализовать JSON значение в строку
std::string json_to_string(const rapidjson::Value& value);

/// Получить ANSI escape code для цвета
std::string ansi_color_code(Color color);

/// Получить ANSI reset code
std::string ansi_reset_code();

/// Проверить, поддерживает ли поток цвета (TTY check)
bool supports_color(Stream s);

}  // namespace streamgrep::output

#endif  // STREAMGREP_OUTPUT_HPP

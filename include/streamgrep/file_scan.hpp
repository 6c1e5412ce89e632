// ==============================================================================
// streamgrep/file_scan.hpp - Сканирование одного файла
// ==============================================================================
//
// Назначение:
// - SearchMatch / FileScanResult — результаты поиска по файлу
// - FileScanTask — неизменяемый запрос на сканирование файла
// - scan_file — потоковое сканирование файла чанками (никогда не бросает)
//
// Состояния задачи: Idle -> Scanning -> {Completed | BinarySkipped | Failed}
//
// Совпадения внутри файла упорядочены по возрастанию смещения.
//
// ==============================================================================

#ifndef STREAMGREP_FILE_SCAN_HPP
#define STREAMGREP_FILE_SCAN_HPP

#include "streamgrep/options.hpp"
#include "streamgrep/vfs.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace streamgrep::search {

/// Значение FileScanResult::error для двоичных файлов
constexpr const char* BINARY_ERROR = "binary";

/// Предел длины содержимого строки, переносимого между чанками
/// Более длинные строки обрезаются в содержимом; колонки остаются точными
constexpr std::size_t MAX_LINE_BYTES = 64 * 1024;

// ============================================================================
// Результаты
// ============================================================================

/// Строка контекста
struct ContextLine {
    std::uint32_t line_number = 0;
    std::string content;
};

/// Контекст вокруг совпадения
struct MatchContext {
    std::vector<ContextLine> before;
    std::vector<ContextLine> after;
};

/// Одно совпадение
struct SearchMatch {
    std::string path;               ///< Относительный путь файла
    std::uint32_t line_number = 0;  ///< Номер строки (с 1; 0 для записей режимов -l/-L)
    std::string line_content;       ///< Содержимое строки (или совпавшие байты при -o)
    std::uint32_t match_start = 0;  ///< Колонка совпадения (байты, с 0)
    std::uint64_t byte_offset = 0;  ///< Абсолютное смещение совпадения в файле

    std::optional<MatchContext> context;  ///< Только при запрошенном контексте
};

enum class ScanState {
    Completed,      ///< Файл просканирован целиком (или ранний выход по режиму)
    BinarySkipped,  ///< Двоичный файл пропущен
    Failed          ///< Ошибка чтения; собранные совпадения сохранены
};

/// Результат сканирования одного файла
struct FileScanResult {
    std::string path;
    std::vector<SearchMatch> matches;
    std::uint32_t match_count = 0;    ///< Число совпадений (в режиме -c — счётчик)
    std::uint64_t bytes_scanned = 0;  ///< Прочитано байт файла
    std::optional<std::string> error;  ///< BINARY_ERROR или сообщение об ошибке
    ScanState state = ScanState::Completed;

    bool is_binary() const { return state == ScanState::BinarySkipped; }
    bool failed() const { return state == ScanState::Failed; }
};

// ============================================================================
// FileScanTask
// ============================================================================

/// Запрос на сканирование файла
struct FileScanTask {
    std::string path;
    std::shared_ptr<const io::FileHandle> file;
    std::string pattern;           ///< Шаблон (в нижнем регистре при case_insensitive)
    bool case_insensitive = false;  ///< Итоговый режим регистра (с учётом smart case)
    std::size_t chunk_size = 0;     ///< Эффективный размер чанка
    std::shared_ptr<const SearchOptions> options;
};

/// Построить задачу из параметров поиска
FileScanTask make_scan_task(std::shared_ptr<const io::FileHandle> file,
                            std::shared_ptr<const SearchOptions> options);

/// Перекрытие соседних окон, нужное для шаблона
/// pattern_len - 1; в режиме -w на 2 байта больше (байт до и после совпадения)
std::size_t required_overlap(std::size_t pattern_len, bool word_boundary);

/// Просканировать файл
///
/// Никогда не бросает: ошибки чтения попадают в FileScanResult::error,
/// уже найденные совпадения сохраняются.
FileScanResult scan_file(const FileScanTask& task);

/// Результат для файла, который не удалось открыть
FileScanResult failed_result(const std::string& path, const std::string& message);

}  // namespace streamgrep::search

#endif  // STREAMGREP_FILE_SCAN_HPP

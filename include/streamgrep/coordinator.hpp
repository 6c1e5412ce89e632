// ==============================================================================
// streamgrep/coordinator.hpp - Координатор многофайлового поиска
// ==============================================================================
//
// Назначение:
// - Перечисление файлов-кандидатов через FileSystem
// - Распределение FileScanTask по пулу рабочих потоков
// - Пакетный (search) и потоковый (search_stream, stream_files) API
// - Прогресс, отмена, общий лимит совпадений
//
// Порядок: внутри файла совпадения идут по возрастанию смещения; порядок
// файлов не гарантируется (для детерминизма: sort_matches_by_path).
//
// Одновременно в работе не больше size() пула задач: следующая задача
// отправляется, когда вызывающая сторона забирает результат. Прогресс
// вызывается в потоке вызывающей стороны.
//
// ==============================================================================

#ifndef STREAMGREP_COORDINATOR_HPP
#define STREAMGREP_COORDINATOR_HPP

#include "streamgrep/file_scan.hpp"
#include "streamgrep/options.hpp"
#include "streamgrep/vfs.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace streamgrep::search {

class WorkerPool;

// ============================================================================
// Отмена и прогресс
// ============================================================================

/// Флаг отмены, разделяемый между вызывающей стороной и координатором
using CancellationToken = std::shared_ptr<std::atomic<bool>>;

/// Создать новый (не взведённый) флаг отмены
CancellationToken make_cancellation_token();

/// Снимок прогресса (монотонно растёт)
struct SearchProgress {
    std::uint32_t files_scanned = 0;
    std::uint32_t files_total = 0;
    std::uint32_t matches_found = 0;
    std::string current_file;  ///< Только что завершённый файл ("" в финальном событии)
};

using ProgressCallback = std::function<void(const SearchProgress&)>;

// ============================================================================
// SearchResult
// ============================================================================

/// Результат пакетного поиска
struct SearchResult {
    std::vector<SearchMatch> matches;
    std::vector<FileScanResult> files;  ///< По одному на файл, matches перенесены выше
    SearchProgress progress;
    bool cancelled = false;
    bool truncated = false;  ///< Сработал max_results
    std::vector<std::string> warnings;  ///< Ошибки перечисления файлов
};

// ============================================================================
// Потоковые результаты
// ============================================================================

namespace detail {
class SearchRun;
}

/// Результаты по файлам по мере завершения задач
///
/// Последовательность конечна и не перезапускается. Поток не должен
/// пережить координатор, который его создал.
class ResultStream {
public:
    explicit ResultStream(std::unique_ptr<detail::SearchRun> run);
    ~ResultStream();
    ResultStream(ResultStream&&) noexcept;
    ResultStream& operator=(ResultStream&&) noexcept;

    /// Получить результат следующего файла
    /// @return false если файлы закончились или поиск отменён
    bool next(FileScanResult& out);

    const SearchProgress& progress() const;
    bool cancelled() const;
    bool truncated() const;
    const std::vector<std::string>& warnings() const;

private:
    std::unique_ptr<detail::SearchRun> run_;
};

/// Совпадения по мере завершения файлов
class MatchStream {
public:
    explicit MatchStream(ResultStream files);

    /// Получить следующее совпадение
    bool next(SearchMatch& out);

    const SearchProgress& progress() const { return files_.progress(); }
    bool cancelled() const { return files_.cancelled(); }

private:
    ResultStream files_;
    FileScanResult current_;
    std::size_t index_ = 0;
};

// ============================================================================
// SearchCoordinator
// ============================================================================

class SearchCoordinator {
public:
    explicit SearchCoordinator(std::shared_ptr<const io::FileSystem> fs);
    ~SearchCoordinator();

    SearchCoordinator(const SearchCoordinator&) = delete;
    SearchCoordinator& operator=(const SearchCoordinator&) = delete;

    /// Подписка на прогресс (заменяет предыдущую)
    void on_progress(ProgressCallback callback);

    /// Пакетный поиск
    /// @throws InvalidOptionsError до чтения любого файла
    SearchResult search(const SearchOptions& options, CancellationToken cancel = nullptr);

    /// Потоковый поиск по совпадениям
    /// @throws InvalidOptionsError
    MatchStream search_stream(const SearchOptions& options, CancellationToken cancel = nullptr);

    /// Потоковый поиск по результатам файлов (для -c, -l, -L)
    /// @throws InvalidOptionsError
    ResultStream stream_files(const SearchOptions& options, CancellationToken cancel = nullptr);

private:
    std::shared_ptr<WorkerPool> pool_for(const SearchOptions& options);

    std::shared_ptr<const io::FileSystem> fs_;
    std::shared_ptr<WorkerPool> pool_;
    ProgressCallback progress_;
};

/// Упорядочить совпадения по пути (стабильно: порядок внутри файла сохраняется)
void sort_matches_by_path(std::vector<SearchMatch>& matches);

}  // namespace streamgrep::search

#endif  // STREAMGREP_COORDINATOR_HPP

// ==============================================================================
// coordinator.cpp - Координатор многофайлового поиска
// ==============================================================================

#include "streamgrep/coordinator.hpp"

#include "streamgrep/worker_pool.hpp"

#include <algorithm>
#include <iterator>
#include <set>

namespace streamgrep::search {

CancellationToken make_cancellation_token() {
    return std::make_shared<std::atomic<bool>>(false);
}

// ============================================================================
// SearchRun - состояние одного поиска
// ============================================================================

namespace detail {

class SearchRun {
public:
    SearchRun(std::shared_ptr<const io::FileSystem> fs,
              std::shared_ptr<const SearchOptions> options, std::shared_ptr<WorkerPool> pool,
              CancellationToken cancel, ProgressCallback progress)
        : fs_(std::move(fs)),
          options_(std::move(options)),
          pool_(std::move(pool)),
          cancel_(std::move(cancel)),
          on_progress_(std::move(progress)),
          results_(std::make_shared<Channel<FileScanResult>>()) {
        enumerate();
    }

    ~SearchRun() {
        // Задачи в полёте держат свои копии channel/fs/options; дожидаемся их,
        // чтобы после разрушения потока не оставалось незавершённой работы
        drain();
    }

    bool next(FileScanResult& out) {
        if (finished_) {
            return false;
        }
        dispatch();

        while (in_flight_ > 0) {
            if (is_cancelled()) {
                cancelled_ = true;
                break;
            }

            std::optional<FileScanResult> result = results_->pop();
            --in_flight_;
            if (!result || is_cancelled()) {
                break;
            }

            ++progress_.files_scanned;
            progress_.current_file = result->path;

            if (limit_reached_) {
                // Лимит уже исчерпан: результат в полёте не выдаётся
                truncated_ = truncated_ || result->match_count > 0;
                continue;
            }

            apply_limit(*result);
            progress_.matches_found += result->match_count;

            dispatch();
            if (on_progress_) {
                on_progress_(progress_);
            }
            out = std::move(*result);
            return true;
        }

        if (is_cancelled()) {
            cancelled_ = true;
        }
        drain();
        finish();
        return false;
    }

    const SearchProgress& progress() const { return progress_; }
    bool cancelled() const { return cancelled_; }
    bool truncated() const { return truncated_; }
    const std::vector<std::string>& warnings() const { return warnings_; }

private:
    bool is_cancelled() const { return cancel_ && cancel_->load(); }

    /// Перечислить файлы всех корней (без повторов, в порядке корней)
    void enumerate() {
        io::ListOptions list_opt;
        list_opt.include_hidden = options_->include_hidden;
        list_opt.path_filters = options_->path_filters;

        std::vector<std::string> roots = options_->paths;
        if (roots.empty()) {
            roots.emplace_back();
        }

        std::set<std::string> seen;
        for (const auto& root : roots) {
            io::Listing listing = fs_->list_candidate_files(root, list_opt);
            for (auto& file : listing.files) {
                if (seen.insert(file).second) {
                    files_.push_back(std::move(file));
                }
            }
            for (auto& error : listing.errors) {
                warnings_.push_back(std::move(error));
            }
        }
        progress_.files_total = static_cast<std::uint32_t>(files_.size());
    }

    /// Дозаполнить пул задачами
    void dispatch() {
        while (in_flight_ < pool_->size() && next_file_ < files_.size() && !limit_reached_ &&
               !is_cancelled()) {
            submit(files_[next_file_++]);
            ++in_flight_;
        }
    }

    void submit(const std::string& path) {
        auto fs = fs_;
        auto options = options_;
        auto results = results_;
        pool_->submit([fs, options, results, path]() {
            try {
                std::shared_ptr<const io::FileHandle> file = fs->open_file(path);
                results->push(scan_file(make_scan_task(std::move(file), options)));
            } catch (const std::exception& e) {
                results->push(failed_result(path, e.what()));
            }
        });
    }

    /// Общий лимит max_results
    void apply_limit(FileScanResult& result) {
        if (!options_->max_results) {
            return;
        }
        const std::uint32_t limit = *options_->max_results;
        const std::uint32_t remaining =
            limit > progress_.matches_found ? limit - progress_.matches_found : 0;

        if (result.match_count > remaining) {
            truncated_ = true;
            result.match_count = remaining;
            if (result.matches.size() > remaining) {
                result.matches.resize(remaining);
            }
        }
        if (progress_.matches_found + result.match_count >= limit) {
            limit_reached_ = true;
            if (next_file_ < files_.size()) {
                truncated_ = true;
            }
        }
    }

    /// Дождаться задач в полёте, отбрасывая результаты
    void drain() {
        while (in_flight_ > 0) {
            results_->pop();
            --in_flight_;
        }
    }

    void finish() {
        finished_ = true;
        progress_.current_file.clear();
        if (on_progress_) {
            on_progress_(progress_);
        }
    }

    std::shared_ptr<const io::FileSystem> fs_;
    std::shared_ptr<const SearchOptions> options_;
    std::shared_ptr<WorkerPool> pool_;
    CancellationToken cancel_;
    ProgressCallback on_progress_;
    std::shared_ptr<Channel<FileScanResult>> results_;

    std::vector<std::string> files_;
    std::vector<std::string> warnings_;
    std::size_t next_file_ = 0;
    std::size_t in_flight_ = 0;

    SearchProgress progress_;
    bool limit_reached_ = false;
    bool truncated_ = false;
    bool cancelled_ = false;
    bool finished_ = false;
};

}  // namespace detail

// ============================================================================
// ResultStream / MatchStream
// ============================================================================

ResultStream::ResultStream(std::unique_ptr<detail::SearchRun> run) : run_(std::move(run)) {}

ResultStream::~ResultStream() = default;
ResultStream::ResultStream(ResultStream&&) noexcept = default;
ResultStream& ResultStream::operator=(ResultStream&&) noexcept = default;

bool ResultStream::next(FileScanResult& out) {
    return run_ && run_->next(out);
}

const SearchProgress& ResultStream::progress() const {
    return run_->progress();
}

bool ResultStream::cancelled() const {
    return run_->cancelled();
}

bool ResultStream::truncated() const {
    return run_->truncated();
}

const std::vector<std::string>& ResultStream::warnings() const {
    return run_->warnings();
}

MatchStream::MatchStream(ResultStream files) : files_(std::move(files)) {}

bool MatchStream::next(SearchMatch& out) {
    while (index_ >= current_.matches.size()) {
        if (!files_.next(current_)) {
            return false;
        }
        index_ = 0;
    }
    out = std::move(current_.matches[index_++]);
    return true;
}

// ============================================================================
// SearchCoordinator
// ============================================================================

SearchCoordinator::SearchCoordinator(std::shared_ptr<const io::FileSystem> fs)
    : fs_(std::move(fs)) {}

SearchCoordinator::~SearchCoordinator() = default;

void SearchCoordinator::on_progress(ProgressCallback callback) {
    progress_ = std::move(callback);
}

std::shared_ptr<WorkerPool> SearchCoordinator::pool_for(const SearchOptions& options) {
    const std::size_t size = options.worker_count ? *options.worker_count : default_worker_count();
    if (!pool_ || pool_->size() != size) {
        pool_ = std::make_shared<WorkerPool>(size);
    }
    return pool_;
}

ResultStream SearchCoordinator::stream_files(const SearchOptions& options,
                                             CancellationToken cancel) {
    require_valid(options);
    auto run = std::make_unique<detail::SearchRun>(
        fs_, std::make_shared<const SearchOptions>(options), pool_for(options), std::move(cancel),
        progress_);
    return ResultStream(std::move(run));
}

MatchStream SearchCoordinator::search_stream(const SearchOptions& options,
                                             CancellationToken cancel) {
    return MatchStream(stream_files(options, std::move(cancel)));
}

SearchResult SearchCoordinator::search(const SearchOptions& options, CancellationToken cancel) {
    ResultStream stream = stream_files(options, std::move(cancel));

    SearchResult result;
    FileScanResult file;
    while (stream.next(file)) {
        std::move(file.matches.begin(), file.matches.end(), std::back_inserter(result.matches));
        file.matches.clear();
        result.files.push_back(std::move(file));
        file = FileScanResult();
    }

    result.progress = stream.progress();
    result.cancelled = stream.cancelled();
    result.truncated = stream.truncated();
    result.warnings = stream.warnings();
    return result;
}

void sort_matches_by_path(std::vector<SearchMatch>& matches) {
    std::stable_sort(matches.begin(), matches.end(),
                     [](const SearchMatch& a, const SearchMatch& b) { return a.path < b.path; });
}

}  // namespace streamgrep::search

// ==============================================================================
// options.cpp - Параметры поиска: валидация и builder
// ==============================================================================

#include "streamgrep/options.hpp"

#include "streamgrep/byte_search.hpp"
#include "streamgrep/platform.hpp"

#include <algorithm>

namespace streamgrep::search {

namespace {

constexpr std::size_t MAX_DEFAULT_WORKERS = 6;

}  // anonymous namespace

bool SearchOptions::needs_line_walk() const {
    if (invert_match) {
        return true;
    }
    // Контекст не влияет на режимы подсчёта и списка файлов
    return (context_before > 0 || context_after > 0) && !count_only && !lists_files();
}

// ----------------------------------------------------------------------------
// Валидация
// ----------------------------------------------------------------------------

std::optional<std::string> validate_options(const SearchOptions& options) {
    if (options.pattern.empty()) {
        return std::string("pattern must not be empty");
    }
    if (options.pattern.find('\n') != std::string::npos) {
        return std::string("pattern must not contain a line terminator");
    }
    if (options.chunk_size == 0) {
        return std::string("chunk size must be greater than zero");
    }
    if (options.max_results && *options.max_results == 0) {
        return std::string("max results must be greater than zero");
    }
    if (options.worker_count && *options.worker_count == 0) {
        return std::string("worker count must be greater than zero");
    }
    if (options.files_with_matches && options.files_without_match) {
        return std::string("files-with-matches and files-without-match are mutually exclusive");
    }
    if (options.count_only && options.lists_files()) {
        return std::string("count cannot be combined with file listing modes");
    }
    return std::nullopt;
}

void require_valid(const SearchOptions& options) {
    if (auto error = validate_options(options)) {
        throw InvalidOptionsError(*error);
    }
}

bool resolve_case(const SearchOptions& options) {
    if (options.case_insensitive) {
        return true;
    }
    if (options.smart_case) {
        return !has_ascii_upper(options.pattern);
    }
    return false;
}

std::size_t effective_chunk_size(std::size_t pattern_len, std::size_t configured) {
    return io::calculate_chunk_size(pattern_len, configured);
}

std::size_t default_worker_count() {
    std::size_t cores = platform::hardware_threads();
    std::size_t workers = cores > 1 ? cores - 1 : 1;
    return std::min(workers, MAX_DEFAULT_WORKERS);
}

// ----------------------------------------------------------------------------
// SearchOptionsBuilder
// ----------------------------------------------------------------------------

SearchOptionsBuilder SearchOptionsBuilder::create() {
    return SearchOptionsBuilder();
}

SearchOptionsBuilder& SearchOptionsBuilder::pattern(std::string pattern) {
    options_.pattern = std::move(pattern);
    return *this;
}

SearchOptionsBuilder& SearchOptionsBuilder::case_insensitive(bool value) {
    options_.case_insensitive = value;
    return *this;
}

SearchOptionsBuilder& SearchOptionsBuilder::smart_case(bool value) {
    options_.smart_case = value;
    return *this;
}

SearchOptionsBuilder& SearchOptionsBuilder::word_boundary(bool value) {
    options_.word_boundary = value;
    return *this;
}

SearchOptionsBuilder& SearchOptionsBuilder::invert_match(bool value) {
    options_.invert_match = value;
    return *this;
}

SearchOptionsBuilder& SearchOptionsBuilder::count_only(bool value) {
    options_.count_only = value;
    return *this;
}

SearchOptionsBuilder& SearchOptionsBuilder::files_with_matches(bool value) {
    options_.files_with_matches = value;
    return *this;
}

SearchOptionsBuilder& SearchOptionsBuilder::files_without_match(bool value) {
    options_.files_without_match = value;
    return *this;
}

SearchOptionsBuilder& SearchOptionsBuilder::only_matching(bool value) {
    options_.only_matching = value;
    return *this;
}

SearchOptionsBuilder& SearchOptionsBuilder::context_before(std::uint32_t lines) {
    options_.context_before = lines;
    return *this;
}

SearchOptionsBuilder& SearchOptionsBuilder::context_after(std::uint32_t lines) {
    options_.context_after = lines;
    return *this;
}

SearchOptionsBuilder& SearchOptionsBuilder::context(std::uint32_t lines) {
    options_.context_before = lines;
    options_.context_after = lines;
    return *this;
}

SearchOptionsBuilder& SearchOptionsBuilder::max_columns(std::uint32_t columns) {
    options_.max_columns = columns;
    return *this;
}

SearchOptionsBuilder& SearchOptionsBuilder::max_results(std::uint32_t limit) {
    options_.max_results = limit;
    return *this;
}

SearchOptionsBuilder& SearchOptionsBuilder::chunk_size(std::uint32_t bytes) {
    options_.chunk_size = bytes;
    return *this;
}

SearchOptionsBuilder& SearchOptionsBuilder::include_hidden(bool value) {
    options_.include_hidden = value;
    return *this;
}

SearchOptionsBuilder& SearchOptionsBuilder::path_filters(std::vector<std::string> filters) {
    options_.path_filters = std::move(filters);
    return *this;
}

SearchOptionsBuilder& SearchOptionsBuilder::add_path_filter(std::string filter) {
    options_.path_filters.push_back(std::move(filter));
    return *this;
}

SearchOptionsBuilder& SearchOptionsBuilder::paths(std::vector<std::string> roots) {
    options_.paths = std::move(roots);
    return *this;
}

SearchOptionsBuilder& SearchOptionsBuilder::worker_count(std::size_t workers) {
    options_.worker_count = workers;
    return *this;
}

SearchOptionsBuilder::BuildResult SearchOptionsBuilder::build() const {
    BuildResult result;
    if (auto error = validate_options(options_)) {
        result.error = *error;
        return result;
    }
    result.ok = true;
    result.options = options_;
    return result;
}

}  // namespace streamgrep::search

// ==============================================================================
// streamgrep/options.hpp - Параметры поиска
// ==============================================================================
//
// Назначение:
// - SearchOptions — неизменяемое значение с параметрами запроса
// - SearchOptionsBuilder — builder pattern с валидацией
// - InvalidOptionsError — ошибка параметров (до чтения любого файла)
//
// ==============================================================================

#ifndef STREAMGREP_OPTIONS_HPP
#define STREAMGREP_OPTIONS_HPP

#include "streamgrep/chunk_reader.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace streamgrep::search {

// ============================================================================
// SearchOptions
// ============================================================================

/// Параметры поискового запроса
struct SearchOptions {
    std::string pattern;  ///< Литеральный шаблон (байты)

    bool case_insensitive = false;  ///< -i
    bool smart_case = false;        ///< -S: без учёта регистра, если в шаблоне нет заглавных
    bool word_boundary = false;     ///< -w
    bool invert_match = false;      ///< -v
    bool count_only = false;        ///< -c
    bool files_with_matches = false;     ///< -l
    bool files_without_match = false;    ///< --files-without-match
    bool only_matching = false;     ///< -o

    std::uint32_t context_before = 0;  ///< -B
    std::uint32_t context_after = 0;   ///< -A

    std::optional<std::uint32_t> max_columns;  ///< -M: длина превью строки
    std::optional<std::uint32_t> max_results;  ///< -m: общий лимит совпадений

    std::uint32_t chunk_size = static_cast<std::uint32_t>(io::DEFAULT_CHUNK_SIZE);

    bool include_hidden = false;            ///< --hidden
    std::vector<std::string> path_filters;  ///< -g: glob, "!glob" исключает
    std::vector<std::string> paths;         ///< Корни поиска (пусто = весь корень)

    /// Размер пула (nullopt = default_worker_count())
    std::optional<std::size_t> worker_count;

    /// Нужен ли построчный обход (инверсия или контекст)
    bool needs_line_walk() const;

    /// Режим "только список файлов"
    bool lists_files() const { return files_with_matches || files_without_match; }
};

// ============================================================================
// InvalidOptionsError
// ============================================================================

/// Некорректные параметры поиска
/// Бросается на входе search / search_stream / stream_files
class InvalidOptionsError : public std::invalid_argument {
public:
    explicit InvalidOptionsError(const std::string& message)
        : std::invalid_argument(message) {}
};

// ============================================================================
// Валидация и нормализация
// ============================================================================

/// Проверить параметры
/// @return Сообщение об ошибке или nullopt, если параметры корректны
std::optional<std::string> validate_options(const SearchOptions& options);

/// Проверить параметры
/// @throws InvalidOptionsError
void require_valid(const SearchOptions& options);

/// Итоговый режим регистра с учётом smart case
bool resolve_case(const SearchOptions& options);

/// Эффективный размер чанка: max(configured, pattern_len * 4)
std::size_t effective_chunk_size(std::size_t pattern_len, std::size_t configured);

/// Размер пула по умолчанию: min(hardware_threads - 1, 6), не меньше 1
std::size_t default_worker_count();

// ============================================================================
// SearchOptionsBuilder
// ============================================================================

/// Builder для SearchOptions
///
/// Использование:
/// @code
///   auto result = SearchOptionsBuilder::create()
///       .pattern("hello")
///       .case_insensitive(true)
///       .context(2)
///       .build();
///   if (result.ok) {
///       coordinator.search(result.options);
///   }
/// @endcode
class SearchOptionsBuilder {
public:
    static SearchOptionsBuilder create();

    SearchOptionsBuilder& pattern(std::string pattern);
    SearchOptionsBuilder& case_insensitive(bool value);
    SearchOptionsBuilder& smart_case(bool value);
    SearchOptionsBuilder& word_boundary(bool value);
    SearchOptionsBuilder& invert_match(bool value);
    SearchOptionsBuilder& count_only(bool value);
    SearchOptionsBuilder& files_with_matches(bool value);
    SearchOptionsBuilder& files_without_match(bool value);
    SearchOptionsBuilder& only_matching(bool value);
    SearchOptionsBuilder& context_before(std::uint32_t lines);
    SearchOptionsBuilder& context_after(std::uint32_t lines);

    /// Контекст с обеих сторон (-C)
    SearchOptionsBuilder& context(std::uint32_t lines);

    SearchOptionsBuilder& max_columns(std::uint32_t columns);
    SearchOptionsBuilder& max_results(std::uint32_t limit);
    SearchOptionsBuilder& chunk_size(std::uint32_t bytes);
    SearchOptionsBuilder& include_hidden(bool value);
    SearchOptionsBuilder& path_filters(std::vector<std::string> filters);
    SearchOptionsBuilder& add_path_filter(std::string filter);
    SearchOptionsBuilder& paths(std::vector<std::string> roots);
    SearchOptionsBuilder& worker_count(std::size_t workers);

    struct BuildResult {
        bool ok = false;
        SearchOptions options;
        std::string error;
    };

    /// Собрать параметры (с валидацией)
    BuildResult build() const;

private:
    SearchOptionsBuilder() = default;

    SearchOptions options_;
};

}  // namespace streamgrep::search

#endif  // STREAMGREP_OPTIONS_HPP

// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// Точка входа:
// 1. Парсинг argv (cli)
// 2. Загрузка файла конфигурации (config)
// 3. Создание Writer (output)
// 4. Поиск через SearchCoordinator
// 5. Возврат exit code: 0 - есть совпадения, 1 - нет, 2 - ошибка
//
// ==============================================================================

#include "streamgrep/cli.hpp"
#include "streamgrep/config.hpp"
#include "streamgrep/coordinator.hpp"
#include "streamgrep/output.hpp"
#include "streamgrep/platform.hpp"
#include "streamgrep/vfs.hpp"

#include <algorithm>
#include <atomic>
#include <csignal>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace {

constexpr int EXIT_MATCH = 0;
constexpr int EXIT_NO_MATCH = 1;
constexpr int EXIT_ERROR = 2;

// ----------------------------------------------------------------------------
// Ctrl-C -> токен отмены
// ----------------------------------------------------------------------------

std::atomic<bool>* g_cancel_flag = nullptr;

void handle_sigint(int) {
    if (g_cancel_flag != nullptr) {
        g_cancel_flag->store(true);
    }
}

/// Установить обработчик SIGINT на время поиска
class SigintGuard {
public:
    explicit SigintGuard(const streamgrep::search::CancellationToken& token) {
        g_cancel_flag = token.get();
        previous_ = std::signal(SIGINT, handle_sigint);
    }

    ~SigintGuard() {
        std::signal(SIGINT, previous_ == SIG_ERR ? SIG_DFL : previous_);
        g_cancel_flag = nullptr;
    }

    SigintGuard(const SigintGuard&) = delete;
    SigintGuard& operator=(const SigintGuard&) = delete;

private:
    void (*previous_)(int) = SIG_DFL;
};

// ----------------------------------------------------------------------------
// Вывод результата одного файла
// ----------------------------------------------------------------------------

void report_file_problem(const streamgrep::search::FileScanResult& file,
                         streamgrep::output::Writer& writer) {
    if (file.is_binary()) {
        writer.debug("skipping binary file: " + file.path);
    } else if (file.failed()) {
        writer.warn(*file.error);
    }
}

void print_file_result(const streamgrep::search::FileScanResult& file,
                       const streamgrep::search::SearchOptions& options,
                       const streamgrep::cli::SearchCommand& cmd,
                       streamgrep::output::Writer& writer) {
    if (options.count_only) {
        if (file.match_count > 0) {
            writer.count(file.path, file.match_count);
        }
        return;
    }
    if (options.lists_files()) {
        for (const auto& m : file.matches) {
            writer.file_path(m.path);
        }
        return;
    }
    for (const auto& m : file.matches) {
        writer.match(m, cmd.column);
    }
}

// ----------------------------------------------------------------------------
// search
// ----------------------------------------------------------------------------

int run_search(const streamgrep::cli::SearchCommand& cmd,
               const streamgrep::config::Config& cfg, streamgrep::output::Writer& writer) {
    using namespace streamgrep;

    auto fs = std::make_shared<io::LocalFileSystem>(std::filesystem::path("."));

    const std::vector<std::string> exclusions = cli::collect_exclusions(cmd, *fs);
    if (cmd.no_exclude) {
        writer.debug("default exclusions disabled");
    } else {
        writer.trace(std::to_string(exclusions.size()) + " exclusion filter(s), " +
                     std::to_string(cli::default_excludes().size()) + " built in");
    }

    auto built = cli::build_options(cmd, cfg, exclusions);
    if (!built.ok) {
        writer.error(built.error);
        return EXIT_ERROR;
    }
    const search::SearchOptions& options = built.options;

    writer.debug("pattern: '" + options.pattern + "', chunk size: " +
                 std::to_string(search::effective_chunk_size(options.pattern.size(),
                                                             options.chunk_size)) +
                 " bytes, workers: " +
                 std::to_string(options.worker_count ? *options.worker_count
                                                     : search::default_worker_count()));
    if (search::resolve_case(options) && !options.case_insensitive) {
        writer.trace("smart case: pattern has no uppercase letters, ignoring case");
    }

    search::SearchCoordinator coordinator(fs);

    writer.progress_begin();
    coordinator.on_progress(
        [&writer](const search::SearchProgress& progress) { writer.progress_tick(progress); });

    search::CancellationToken cancel = search::make_cancellation_token();
    SigintGuard sigint(cancel);

    search::SearchProgress progress;
    bool cancelled = false;
    bool truncated = false;
    std::vector<std::string> warnings;

    if (cmd.stream) {
        // Результаты печатаются по мере завершения файлов
        search::ResultStream stream = coordinator.stream_files(options, cancel);
        search::FileScanResult file;
        while (stream.next(file)) {
            report_file_problem(file, writer);
            print_file_result(file, options, cmd, writer);
        }
        progress = stream.progress();
        cancelled = stream.cancelled();
        truncated = stream.truncated();
        warnings = stream.warnings();
    } else {
        search::SearchResult result = coordinator.search(options, cancel);

        std::stable_sort(result.files.begin(), result.files.end(),
                         [](const search::FileScanResult& a, const search::FileScanResult& b) {
                             return a.path < b.path;
                         });
        for (const auto& file : result.files) {
            report_file_problem(file, writer);
        }

        if (options.count_only) {
            for (const auto& file : result.files) {
                print_file_result(file, options, cmd, writer);
            }
        } else {
            search::sort_matches_by_path(result.matches);
            for (const auto& m : result.matches) {
                if (options.lists_files()) {
                    writer.file_path(m.path);
                } else {
                    writer.match(m, cmd.column);
                }
            }
        }

        progress = result.progress;
        cancelled = result.cancelled;
        truncated = result.truncated;
        warnings = std::move(result.warnings);
    }

    writer.progress_end();
    writer.end_results();

    for (const auto& warning : warnings) {
        writer.warn(warning);
    }
    if (cancelled) {
        writer.warn("search cancelled, results are partial");
    }
    if (truncated) {
        writer.info("stopped after " + std::to_string(*options.max_results) + " match(es)");
    }
    writer.info(output::format_summary(progress));

    return progress.matches_found > 0 ? EXIT_MATCH : EXIT_NO_MATCH;
}

// ----------------------------------------------------------------------------
// Главная функция выполнения (run)
// ----------------------------------------------------------------------------

int run(int argc, char** argv) {
    using namespace streamgrep;

    // 1. Парсинг argv
    cli::ParseResult parse_result = cli::parse(argc, argv);

    // 2. Файл конфигурации (до Writer: он может задать цвет)
    config::LoadResult loaded;
    loaded.ok = true;
    std::optional<std::filesystem::path> config_path;
    if (parse_result.ok) {
        config_path = config::locate(parse_result.global.config);
        if (config_path) {
            loaded = config::load(*config_path);
        }
    }

    // 3. Создание Writer
    output::OutputConfig out_cfg;
    out_cfg.quiet = parse_result.global.quiet;
    out_cfg.verbose = parse_result.global.verbose;
    out_cfg.progress = !parse_result.global.no_progress;
    out_cfg.color = parse_result.global.color;
    if (!out_cfg.color && loaded.ok) {
        out_cfg.color = loaded.config.color;
    }
    if (const auto* search_cmd = std::get_if<cli::SearchCommand>(&parse_result.command)) {
        if (search_cmd->json) {
            out_cfg.format = output::Format::Json;
        } else if (search_cmd->jsonl) {
            out_cfg.format = output::Format::Jsonl;
        }
    }
    output::Writer writer(out_cfg);

    // Ошибки парсинга выводятся без префикса [x], напрямую в stderr
    if (!parse_result.ok) {
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }

    if (!loaded.ok) {
        writer.error(loaded.error.format());
        return EXIT_ERROR;
    }
    for (const auto& warning : loaded.warnings) {
        writer.warn(platform::path_to_utf8(*config_path) + ": " + warning);
    }
    if (config_path) {
        writer.debug("loaded configuration from " + platform::path_to_utf8(*config_path));
    }

    // 4. Dispatch команды
    return std::visit(
        [&](auto&& cmd) -> int {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, cli::HelpCommand>) {
                writer.write(output::Stream::Stdout, cli::render_help());
                return EXIT_MATCH;
            } else if constexpr (std::is_same_v<T, cli::VersionCommand>) {
                writer.write(output::Stream::Stdout, cli::render_version());
                return EXIT_MATCH;
            } else {
                return run_search(cmd, loaded.config, writer);
            }
        },
        parse_result.command);
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// main
// ----------------------------------------------------------------------------

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        // Формат ошибки "[x] <err>"
        std::cerr << "[x] " << e.what() << "\n";
        return EXIT_ERROR;
    }
}

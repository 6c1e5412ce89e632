// ==============================================================================
// cli.cpp - CLI парсинг
// ==============================================================================
//
// Формат ошибок: "error: <текст>" + usage + подсказка, exit code 2.
// Значения длинных опций: "--name value" или "--name=value".
// "--" завершает опции (шаблон может начинаться с '-').
//
// ==============================================================================

#include "streamgrep/cli.hpp"

#include "streamgrep/platform.hpp"

#include <cctype>
#include <cstring>
#include <limits>
#include <stdexcept>

namespace streamgrep::cli {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

namespace {

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

bool starts_with(const char* str, const char* prefix) {
    return std::strncmp(str, prefix, std::strlen(prefix)) == 0;
}

/// Ошибка использования (превращается в CliDiagnostic)
class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

std::uint32_t parse_number(const std::string& text, const char* option) {
    if (text.empty()) {
        throw UsageError(std::string("error: invalid value '' for '") + option +
                         "': cannot parse integer from empty string");
    }
    std::uint64_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            throw UsageError("error: invalid value '" + text + "' for '" + option +
                             "': invalid digit found in string");
        }
        value = value * 10 + static_cast<std::uint64_t>(c - '0');
        if (value > std::numeric_limits<std::uint32_t>::max()) {
            throw UsageError("error: invalid value '" + text + "' for '" + option +
                             "': number too large");
        }
    }
    return static_cast<std::uint32_t>(value);
}

std::uint32_t parse_chunk_size(const std::string& text) {
    auto size = config::parse_size(text);
    if (!size || *size == 0 || *size > std::numeric_limits<std::uint32_t>::max()) {
        throw UsageError("error: invalid value '" + text +
                         "' for '--chunk-size <SIZE>': expected a positive size (e.g. 65536, "
                         "512K, 1M)");
    }
    return static_cast<std::uint32_t>(*size);
}

/// Курсор по argv
class ArgCursor {
public:
    ArgCursor(int argc, char** argv) : argc_(argc), argv_(argv) {}

    bool done() const { return index_ >= argc_; }

    /// Следующий аргумент; разделяет "--name=value"
    const std::string& advance() {
        current_ = argv_[index_++];
        inline_value_.reset();
        if (current_.size() > 2 && current_.compare(0, 2, "--") == 0) {
            auto eq = current_.find('=');
            if (eq != std::string::npos) {
                inline_value_ = current_.substr(eq + 1);
                current_.resize(eq);
            }
        }
        return current_;
    }

    bool has_inline_value() const { return inline_value_.has_value(); }

    /// Значение текущей опции
    std::string value(const char* display) {
        if (inline_value_) {
            return *inline_value_;
        }
        if (index_ >= argc_) {
            throw UsageError(std::string("error: a value is required for '") + display +
                             "' but none was supplied");
        }
        return argv_[index_++];
    }

private:
    int argc_;
    char** argv_;
    int index_ = 1;
    std::string current_;
    std::optional<std::string> inline_value_;
};

}  // anonymous namespace

// ----------------------------------------------------------------------------
// render_version
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string("streamgrep ") + VERSION + " (" + platform::os_name() + ")\n";
}

// ----------------------------------------------------------------------------
// render_help
// ----------------------------------------------------------------------------

std::string render_help() {
    return std::string(ABOUT) +
           "\n"
           "\n"
           "Usage: streamgrep [OPTIONS] <PATTERN> [PATH]...\n"
           "\n"
           "Arguments:\n"
           "  <PATTERN>  Literal byte pattern to search for\n"
           "  [PATH]...  Files or directories to search (default: current directory)\n"
           "\n"
           "Matching:\n"
           "  -i, --ignore-case            Case insensitive search (ASCII)\n"
           "  -S, --smart-case             Ignore case unless the pattern has an uppercase "
           "letter\n"
           "  -w, --word-regexp            Only report matches surrounded by word boundaries\n"
           "  -v, --invert-match           Report lines that do not match\n"
           "  -c, --count                  Print the number of matches per file\n"
           "  -l, --files-with-matches     Print only paths of files with matches\n"
           "      --files-without-match    Print only paths of files without matches\n"
           "  -o, --only-matching          Print only the matched bytes\n"
           "\n"
           "Context:\n"
           "  -A, --after-context <NUM>    Show NUM lines after each match\n"
           "  -B, --before-context <NUM>   Show NUM lines before each match\n"
           "  -C, --context <NUM>          Show NUM lines before and after each match\n"
           "\n"
           "Limits:\n"
           "  -M, --max-columns <NUM>      Truncate previews longer than NUM bytes (default "
           "200, 0 = no limit)\n"
           "  -m, --max-count <NUM>        Stop after NUM matches in total\n"
           "\n"
           "Files:\n"
           "      --hidden                 Search hidden files and directories\n"
           "  -g, --glob <GLOB>            Include files matching GLOB; '!GLOB' excludes\n"
           "      --exclude <GLOB>         Exclude files and directories matching GLOB\n"
           "      --no-exclude             Search everywhere: no default exclusions, no "
           ".gitignore, hidden files included\n"
           "\n"
           "Engine:\n"
           "      --chunk-size <SIZE>      Read files in chunks of SIZE bytes (K/M suffix)\n"
           "  -j, --threads <NUM>          Number of worker threads\n"
           "\n"
           "Output:\n"
           "      --json                   Output as a JSON array\n"
           "      --jsonl                  Output as JSON lines\n"
           "      --stream                 Print results as files complete (unsorted)\n"
           "      --column                 Show column numbers\n"
           "      --color / --no-color     Force or disable colored output\n"
           "      --no-progress            Hide the progress indicator\n"
           "  -q, --quiet                  Suppress informational messages\n"
           "      --verbose                Print verbose output (repeatable)\n"
           "\n"
           "Other:\n"
           "      --config <FILE>          Load settings from a YAML file (env: "
           "STREAMGREP_CONFIG)\n"
           "  -h, --help                   Print help\n"
           "  -V, --version                Print version\n";
}

// ----------------------------------------------------------------------------
// render_usage_error
// ----------------------------------------------------------------------------

std::string render_usage_error(const std::string& error_msg) {
    return error_msg + "\n\n"
                       "Usage: streamgrep [OPTIONS] <PATTERN> [PATH]...\n\n"
                       "For more information, try '--help'.\n";
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    result.command = HelpCommand{};

    if (argc < 2) {
        // Без аргументов: справка в stderr, exit code 2
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message = render_help();
        return result;
    }

    SearchCommand cmd;
    bool have_pattern = false;
    bool options_done = false;

    auto positional = [&](const std::string& arg) {
        if (!have_pattern) {
            cmd.pattern = arg;
            have_pattern = true;
        } else {
            cmd.paths.push_back(arg);
        }
    };

    try {
        ArgCursor args(argc, argv);
        while (!args.done()) {
            const std::string arg = args.advance();
            const char* a = arg.c_str();

            if (options_done || a[0] != '-' || str_eq(a, "-")) {
                positional(arg);
                continue;
            }

            if (str_eq(a, "--")) {
                options_done = true;
            } else if (str_eq(a, "-h") || str_eq(a, "--help")) {
                result.ok = true;
                result.command = HelpCommand{};
                return result;
            } else if (str_eq(a, "-V") || str_eq(a, "--version")) {
                result.ok = true;
                result.command = VersionCommand{};
                return result;
            }
            // Сопоставление
            else if (str_eq(a, "-i") || str_eq(a, "--ignore-case")) {
                cmd.ignore_case = true;
            } else if (str_eq(a, "-S") || str_eq(a, "--smart-case")) {
                cmd.smart_case = true;
            } else if (str_eq(a, "-w") || str_eq(a, "--word-regexp")) {
                cmd.word = true;
            } else if (str_eq(a, "-v") || str_eq(a, "--invert-match")) {
                cmd.invert = true;
            } else if (str_eq(a, "-c") || str_eq(a, "--count")) {
                cmd.count = true;
            } else if (str_eq(a, "-l") || str_eq(a, "--files-with-matches")) {
                cmd.files_with_matches = true;
            } else if (str_eq(a, "--files-without-match")) {
                cmd.files_without_match = true;
            } else if (str_eq(a, "-o") || str_eq(a, "--only-matching")) {
                cmd.only_matching = true;
            }
            // Контекст
            else if (str_eq(a, "-A") || str_eq(a, "--after-context")) {
                cmd.after = parse_number(args.value("-A <NUM>"), "-A <NUM>");
            } else if (str_eq(a, "-B") || str_eq(a, "--before-context")) {
                cmd.before = parse_number(args.value("-B <NUM>"), "-B <NUM>");
            } else if (str_eq(a, "-C") || str_eq(a, "--context")) {
                cmd.context = parse_number(args.value("-C <NUM>"), "-C <NUM>");
            }
            // Ограничения
            else if (str_eq(a, "-M") || str_eq(a, "--max-columns")) {
                cmd.max_columns = parse_number(args.value("-M <NUM>"), "-M <NUM>");
            } else if (str_eq(a, "-m") || str_eq(a, "--max-count")) {
                cmd.max_count = parse_number(args.value("-m <NUM>"), "-m <NUM>");
            }
            // Файлы
            else if (str_eq(a, "--hidden")) {
                cmd.hidden = true;
            } else if (str_eq(a, "-g") || str_eq(a, "--glob")) {
                cmd.globs.push_back(args.value("-g <GLOB>"));
            } else if (str_eq(a, "--exclude")) {
                cmd.globs.push_back("!" + args.value("--exclude <GLOB>"));
            } else if (str_eq(a, "--no-exclude")) {
                cmd.no_exclude = true;
            }
            // Движок
            else if (str_eq(a, "--chunk-size")) {
                cmd.chunk_size = parse_chunk_size(args.value("--chunk-size <SIZE>"));
            } else if (str_eq(a, "-j") || str_eq(a, "--threads")) {
                cmd.threads = parse_number(args.value("-j <NUM>"), "-j <NUM>");
            }
            // Вывод
            else if (str_eq(a, "--json")) {
                cmd.json = true;
            } else if (str_eq(a, "--jsonl")) {
                cmd.jsonl = true;
            } else if (str_eq(a, "--stream")) {
                cmd.stream = true;
            } else if (str_eq(a, "--column")) {
                cmd.column = true;
            } else if (str_eq(a, "--color")) {
                result.global.color = true;
            } else if (str_eq(a, "--no-color")) {
                result.global.color = false;
            } else if (str_eq(a, "--no-progress")) {
                result.global.no_progress = true;
            } else if (str_eq(a, "-q") || str_eq(a, "--quiet")) {
                result.global.quiet = true;
            } else if (str_eq(a, "--verbose")) {
                result.global.verbose++;
            } else if (str_eq(a, "--config")) {
                result.global.config = platform::path_from_utf8(args.value("--config <FILE>"));
            } else {
                if (starts_with(a, "--") && args.has_inline_value()) {
                    throw UsageError("error: unexpected argument '" + arg + "=...' found");
                }
                throw UsageError("error: unexpected argument '" + arg + "' found");
            }
        }

        if (!have_pattern) {
            throw UsageError(
                "error: the following required arguments were not provided:\n"
                "  <PATTERN>");
        }
        if (cmd.json && cmd.jsonl) {
            throw UsageError("error: the argument '--json' cannot be used with '--jsonl'");
        }
        if (cmd.files_with_matches && cmd.files_without_match) {
            throw UsageError(
                "error: the argument '--files-with-matches' cannot be used with "
                "'--files-without-match'");
        }
        if (cmd.count && (cmd.files_with_matches || cmd.files_without_match)) {
            throw UsageError(
                "error: the argument '--count' cannot be used with the file listing modes");
        }
        if (cmd.threads && *cmd.threads == 0) {
            throw UsageError("error: invalid value '0' for '-j <NUM>': must be at least 1");
        }
        if (cmd.max_count && *cmd.max_count == 0) {
            throw UsageError("error: invalid value '0' for '-m <NUM>': must be at least 1");
        }
    } catch (const UsageError& e) {
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message = render_usage_error(e.what());
        return result;
    }

    result.ok = true;
    result.command = std::move(cmd);
    return result;
}

// ----------------------------------------------------------------------------
// build_options
// ----------------------------------------------------------------------------

search::SearchOptionsBuilder::BuildResult build_options(
    const SearchCommand& cmd, const config::Config& cfg,
    const std::vector<std::string>& exclusions) {
    auto builder = search::SearchOptionsBuilder::create();

    builder.pattern(cmd.pattern)
        .case_insensitive(cmd.ignore_case)
        .smart_case(cmd.smart_case || cfg.smart_case.value_or(false))
        .word_boundary(cmd.word)
        .invert_match(cmd.invert)
        .count_only(cmd.count)
        .files_with_matches(cmd.files_with_matches)
        .files_without_match(cmd.files_without_match)
        .only_matching(cmd.only_matching)
        .include_hidden(cmd.hidden || cmd.no_exclude || cfg.hidden.value_or(false));

    // Контекст: config < -C < -A/-B
    std::uint32_t before = cfg.context.value_or(0);
    std::uint32_t after = before;
    if (cmd.context) {
        before = after = *cmd.context;
    }
    if (cmd.before) {
        before = *cmd.before;
    }
    if (cmd.after) {
        after = *cmd.after;
    }
    builder.context_before(before).context_after(after);

    // Превью: -M < config < 200 для текстового вывода; 0 снимает ограничение
    std::optional<std::uint32_t> columns = cmd.max_columns ? cmd.max_columns : cfg.max_columns;
    if (!columns && !cmd.json && !cmd.jsonl) {
        columns = DEFAULT_MAX_COLUMNS;
    }
    if (columns && *columns > 0) {
        builder.max_columns(*columns);
    }
    if (cmd.max_count) {
        builder.max_results(*cmd.max_count);
    }

    if (cmd.chunk_size) {
        builder.chunk_size(*cmd.chunk_size);
    } else if (cfg.chunk_size) {
        builder.chunk_size(*cfg.chunk_size);
    }
    if (cmd.threads) {
        builder.worker_count(*cmd.threads);
    } else if (cfg.threads) {
        builder.worker_count(*cfg.threads);
    }

    // Glob'ы конфигурации идут первыми, затем исключения, затем флаги
    for (const auto& glob : cfg.globs) {
        builder.add_path_filter(glob);
    }
    for (const auto& glob : exclusions) {
        builder.add_path_filter(glob);
    }
    for (const auto& glob : cmd.globs) {
        builder.add_path_filter(glob);
    }

    builder.paths(cmd.paths);
    return builder.build();
}

// ----------------------------------------------------------------------------
// Исключения по умолчанию
// ----------------------------------------------------------------------------

namespace {

/// Корень поиска в виде, в котором его возвращает FileSystem ("./src/" -> "src")
std::string normalize_root(const std::string& root) {
    std::string result =
        platform::generic_utf8(platform::path_from_utf8(root).lexically_normal());
    while (result.size() > 1 && result.back() == '/') {
        result.pop_back();
    }
    if (result == ".") {
        result.clear();
    }
    return result;
}

/// Строка .gitignore -> фильтр исключения относительно корня поиска
std::optional<std::string> gitignore_filter(std::string pattern, const std::string& root) {
    // Повторное включение не выражается фильтром исключения
    if (pattern[0] == '!') {
        return std::nullopt;
    }
    while (pattern.size() > 1 && pattern.back() == '/') {
        pattern.pop_back();
    }
    if (pattern.size() > 1 && pattern.front() == '/') {
        pattern.erase(0, 1);
    }
    // Шаблон с '/' сравнивается с путём, поэтому привязывается к корню
    if (pattern.find('/') != std::string::npos && !root.empty()) {
        pattern = root + "/" + pattern;
    }
    return "!" + pattern;
}

}  // anonymous namespace

const std::vector<std::string>& default_excludes() {
    static const std::vector<std::string> names = {
        "node_modules", ".git", ".hg", ".svn", ".vite", "dist", "build", ".cache",
    };
    return names;
}

std::vector<std::string> parse_gitignore(std::string_view content) {
    std::vector<std::string> patterns;

    std::size_t pos = 0;
    while (pos <= content.size()) {
        std::size_t eol = content.find('\n', pos);
        if (eol == std::string_view::npos) {
            eol = content.size();
        }
        std::string_view line = content.substr(pos, eol - pos);
        pos = eol + 1;

        while (!line.empty() && std::isspace(static_cast<unsigned char>(line.front()))) {
            line.remove_prefix(1);
        }
        while (!line.empty() && std::isspace(static_cast<unsigned char>(line.back()))) {
            line.remove_suffix(1);
        }
        if (line.empty() || line[0] == '#') {
            continue;
        }
        patterns.emplace_back(line);
    }
    return patterns;
}

std::vector<std::string> collect_exclusions(const SearchCommand& cmd, const io::FileSystem& fs) {
    std::vector<std::string> filters;
    if (cmd.no_exclude) {
        return filters;
    }

    for (const auto& name : default_excludes()) {
        filters.push_back("!" + name);
    }

    std::vector<std::string> roots = cmd.paths;
    if (roots.empty()) {
        roots.emplace_back();
    }
    for (const auto& raw : roots) {
        const std::string root = normalize_root(raw);
        std::string content;
        try {
            content = fs.open_file(io::join_path(root, ".gitignore"))->read_all();
        } catch (const io::IoError&) {
            // Нет .gitignore (или корень - файл)
            continue;
        }
        for (auto& pattern : parse_gitignore(content)) {
            if (auto filter = gitignore_filter(std::move(pattern), root)) {
                filters.push_back(std::move(*filter));
            }
        }
    }
    return filters;
}

}  // namespace streamgrep::cli

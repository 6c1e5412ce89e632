// ==============================================================================
// output.cpp - Пользовательский вывод
// ==============================================================================
//
// Байты первичны: вывод через fwrite, без std::endl.
// JSON сериализуется RapidJSON.
//
// ==============================================================================

#include "streamgrep/output.hpp"

#include "streamgrep/platform.hpp"

#include <cstdio>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace streamgrep::output {

// ----------------------------------------------------------------------------
// ANSI Escape Codes
// ----------------------------------------------------------------------------

namespace {

// ANSI SGR (Select Graphic Rendition) коды
constexpr const char* ANSI_RESET = "\x1b[0m";
constexpr const char* ANSI_GREEN = "\x1b[32m";
constexpr const char* ANSI_YELLOW = "\x1b[33m";
constexpr const char* ANSI_RED = "\x1b[31m";
constexpr const char* ANSI_CYAN = "\x1b[36m";
constexpr const char* ANSI_MAGENTA = "\x1b[35m";

// Возврат каретки + очистка до конца строки
constexpr const char* CLEAR_LINE = "\r\x1b[K";

std::string colored(std::string_view text, const char* code, bool color) {
    std::string result;
    if (color) {
        result += code;
        result.append(text);
        result += ANSI_RESET;
    } else {
        result.append(text);
    }
    return result;
}

rapidjson::Value json_string(const std::string& s, rapidjson::Document::AllocatorType& alloc) {
    rapidjson::Value v;
    v.SetString(s.data(), static_cast<rapidjson::SizeType>(s.size()), alloc);
    return v;
}

rapidjson::Value context_to_json(const std::vector<search::ContextLine>& lines,
                                 rapidjson::Document::AllocatorType& alloc) {
    rapidjson::Value arr(rapidjson::kArrayType);
    for (const auto& line : lines) {
        rapidjson::Value obj(rapidjson::kObjectType);
        obj.AddMember("line_number", line.line_number, alloc);
        obj.AddMember("content", json_string(line.content, alloc), alloc);
        arr.PushBack(obj, alloc);
    }
    return arr;
}

}  // namespace

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

Writer::Writer(const OutputConfig& cfg) : config_(cfg) {
    json_.SetArray();
}

Writer::~Writer() {
    progress_end();
    flush();
}

void Writer::write(Stream s, std::string_view bytes) {
    FILE* f = get_file(s);
    if (f != nullptr && !bytes.empty()) {
        std::fwrite(bytes.data(), 1, bytes.size(), f);
    }
}

void Writer::write_line(Stream s, std::string_view bytes) {
    write(s, bytes);
    write(s, "\n");
}

FILE* Writer::get_file(Stream s) const {
    return (s == Stream::Stdout) ? stdout : stderr;
}

bool Writer::use_color(Stream s) const {
    if (config_.color.has_value()) {
        return *config_.color;
    }
    return supports_color(s);
}

void Writer::write_prefixed(std::string_view prefix, Color color, std::string_view message) {
    clear_progress_line();
    write_colored(Stream::Stderr, prefix, color);
    write(Stream::Stderr, " ");
    write_line(Stream::Stderr, message);
}

void Writer::info(std::string_view message) {
    // Подавляем информационные сообщения при --quiet
    if (config_.quiet) {
        return;
    }
    write_prefixed("[+]", Color::Green, message);
}

void Writer::warn(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    write_prefixed("[!]", Color::Yellow, message);
}

void Writer::error(std::string_view message) {
    // Ошибки печатаются всегда, даже при --quiet
    write_prefixed("[x]", Color::Red, message);
}

void Writer::debug(std::string_view message) {
    if (config_.verbose <= 0) {
        return;
    }
    write_prefixed("[*]", Color::Cyan, message);
}

void Writer::trace(std::string_view message) {
    if (config_.verbose <= 1) {
        return;
    }
    write_prefixed("[~]", Color::Magenta, message);
}

void Writer::write_colored(Stream s, std::string_view message, Color color) {
    if (use_color(s) && color != Color::Default) {
        write(s, ansi_color_code(color));
        write(s, message);
        write(s, ANSI_RESET);
    } else {
        write(s, message);
    }
}

// ----------------------------------------------------------------------------
// Результаты поиска
// ----------------------------------------------------------------------------

rapidjson::Document::AllocatorType& Writer::json_allocator() {
    return config_.format == Format::Jsonl ? scratch_.GetAllocator() : json_.GetAllocator();
}

void Writer::emit_json(rapidjson::Value& value) {
    if (config_.format == Format::Jsonl) {
        write_json_line(value);
        scratch_.GetAllocator().Clear();
    } else {
        json_.PushBack(value, json_.GetAllocator());
    }
}

void Writer::match(const search::SearchMatch& m, bool with_column) {
    clear_progress_line();

    if (config_.format != Format::Std) {
        rapidjson::Value value = match_to_json(m, json_allocator());
        emit_json(value);
        return;
    }

    const bool color = use_color(Stream::Stdout);
    if (m.context) {
        for (const auto& line : m.context->before) {
            write_line(Stream::Stdout, format_context_line(m.path, line, color));
        }
    }
    write_line(Stream::Stdout, format_match(m, color, with_column));
    if (m.context) {
        for (const auto& line : m.context->after) {
            write_line(Stream::Stdout, format_context_line(m.path, line, color));
        }
    }
}

void Writer::count(const std::string& path, std::uint32_t count) {
    clear_progress_line();

    if (config_.format != Format::Std) {
        auto& alloc = json_allocator();
        rapidjson::Value obj(rapidjson::kObjectType);
        obj.AddMember("path", json_string(path, alloc), alloc);
        obj.AddMember("count", count, alloc);
        emit_json(obj);
        return;
    }

    const bool color = use_color(Stream::Stdout);
    write_line(Stream::Stdout, colored(path, ANSI_CYAN, color) + ":" + std::to_string(count));
}

void Writer::file_path(const std::string& path) {
    clear_progress_line();

    if (config_.format != Format::Std) {
        auto& alloc = json_allocator();
        rapidjson::Value obj(rapidjson::kObjectType);
        obj.AddMember("path", json_string(path, alloc), alloc);
        emit_json(obj);
        return;
    }

    write_line(Stream::Stdout, colored(path, ANSI_CYAN, use_color(Stream::Stdout)));
}

void Writer::end_results() {
    if (config_.format == Format::Json) {
        write_json_pretty(json_);
        json_.SetArray();
    }
    flush();
}

// ----------------------------------------------------------------------------
// JSON
// ----------------------------------------------------------------------------

void Writer::write_json(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    value.Accept(writer);

    write(Stream::Stdout, std::string_view(buffer.GetString(), buffer.GetSize()));
}

void Writer::write_json_line(const rapidjson::Value& value) {
    write_json(value);
    write(Stream::Stdout, "\n");
}

void Writer::write_json_pretty(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    value.Accept(writer);

    write(Stream::Stdout, std::string_view(buffer.GetString(), buffer.GetSize()));
    write(Stream::Stdout, "\n");
    flush();
}

// ----------------------------------------------------------------------------
// Прогресс
// ----------------------------------------------------------------------------

void Writer::progress_begin() {
    // Прогресс скрыт при verbose, quiet и вне TTY
    if (!config_.progress || config_.verbose > 0 || config_.quiet ||
        !platform::is_tty_stderr()) {
        return;
    }
    progress_active_ = true;
    progress_drawn_ = false;
}

void Writer::progress_tick(const search::SearchProgress& progress) {
    if (!progress_active_) {
        return;
    }
    write(Stream::Stderr, "\r");
    write(Stream::Stderr, format_progress(progress));
    write(Stream::Stderr, "\x1b[K");
    std::fflush(stderr);
    progress_drawn_ = true;
}

void Writer::progress_end() {
    clear_progress_line();
    progress_active_ = false;
}

void Writer::clear_progress_line() {
    if (progress_drawn_) {
        write(Stream::Stderr, CLEAR_LINE);
        progress_drawn_ = false;
    }
}

void Writer::flush() {
    std::fflush(stdout);
    std::fflush(stderr);
}

// ----------------------------------------------------------------------------
// Форматирование
// ----------------------------------------------------------------------------

std::string format_match(const search::SearchMatch& m, bool color, bool with_column) {
    std::string result = colored(m.path, ANSI_CYAN, color);
    result += ':';
    result += colored(std::to_string(m.line_number), ANSI_YELLOW, color);
    if (with_column) {
        result += ':';
        result += std::to_string(m.match_start + 1);
    }
    result += ": ";
    result += m.line_content;
    return result;
}

std::string format_context_line(const std::string& path, const search::ContextLine& line,
                                bool color) {
    std::string result = colored(path, ANSI_CYAN, color);
    result += '-';
    result += colored(std::to_string(line.line_number), ANSI_YELLOW, color);
    result += "- ";
    result += line.content;
    return result;
}

std::string format_progress(const search::SearchProgress& progress) {
    return "Searching... " + std::to_string(progress.files_scanned) + "/" +
           std::to_string(progress.files_total) + " files, " +
           std::to_string(progress.matches_found) + " matches";
}

std::string format_summary(const search::SearchProgress& progress) {
    const char* match_word = progress.matches_found == 1 ? "match" : "matches";
    const char* file_word = progress.files_scanned == 1 ? "file" : "files";
    return "Found " + std::to_string(progress.matches_found) + " " + match_word +
           " (searched " + std::to_string(progress.files_scanned) + " " + file_word + ")";
}

std::string format_info(std::string_view message) {
    std::string result = "[+] ";
    result.append(message);
    result.append("\n");
    return result;
}

std::string format_error(std::string_view message) {
    std::string result = "[x] ";
    result.append(message);
    result.append("\n");
    return result;
}

std::string format_warning(std::string_view message) {
    std::string result = "[!] ";
    result.append(message);
    result.append("\n");
    return result;
}

std::string format_debug(std::string_view message) {
    std::string result = "[*] ";
    result.append(message);
    result.append("\n");
    return result;
}

rapidjson::Value match_to_json(const search::SearchMatch& m,
                               rapidjson::Document::AllocatorType& alloc) {
    rapidjson::Value obj(rapidjson::kObjectType);
    obj.AddMember("path", json_string(m.path, alloc), alloc);
    obj.AddMember("line_number", m.line_number, alloc);
    obj.AddMember("match_start", m.match_start, alloc);
    obj.AddMember("byte_offset", static_cast<std::uint64_t>(m.byte_offset), alloc);
    obj.AddMember("line_content", json_string(m.line_content, alloc), alloc);

    if (m.context) {
        rapidjson::Value ctx(rapidjson::kObjectType);
        ctx.AddMember("before", context_to_json(m.context->before, alloc), alloc);
        ctx.AddMember("after", context_to_json(m.context->after, alloc), alloc);
        obj.AddMember("context", ctx, alloc);
    }
    return obj;
}

rapidjson::Value file_result_to_json(const search::FileScanResult& r,
                                     rapidjson::Document::AllocatorType& alloc) {
    rapidjson::Value obj(rapidjson::kObjectType);
    obj.AddMember("path", json_string(r.path, alloc), alloc);
    obj.AddMember("match_count", r.match_count, alloc);
    obj.AddMember("bytes_scanned", static_cast<std::uint64_t>(r.bytes_scanned), alloc);
    if (r.error) {
        obj.AddMember("error", json_string(*r.error, alloc), alloc);
    } else {
        obj.AddMember("error", rapidjson::Value(rapidjson::kNullType), alloc);
    }
    return obj;
}

std::string json_to_string(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    value.Accept(writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

std::string ansi_color_code(Color color) {
    switch (color) {
    case Color::Green:
        return ANSI_GREEN;
    case Color::Yellow:
        return ANSI_YELLOW;
    case Color::Red:
        return ANSI_RED;
    case Color::Cyan:
        return ANSI_CYAN;
    case Color::Magenta:
        return ANSI_MAGENTA;
    case Color::Default:
    default:
        return "";
    }
}

std::string ansi_reset_code() {
    return ANSI_RESET;
}

bool supports_color(Stream s) {
    if (s == Stream::Stdout) {
        return platform::is_tty_stdout();
    }
    return platform::is_tty_stderr();
}

}  // namespace streamgrep::output

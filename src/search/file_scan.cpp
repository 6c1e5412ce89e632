// ==============================================================================
// file_scan.cpp - Сканирование одного файла
// ==============================================================================
//
// Файл читается чанками через ChunkReader. Из чанков собираются "окна":
// каждое окно, кроме первого, начинается за required_overlap байт до конца
// предыдущего (недостающее перекрытие берётся из хвоста предыдущего окна).
//
// Принадлежность совпадения окну (P = длина шаблона, t = 1 в режиме -w):
// - в непервом окне пропускаются o + P + t <= overlap (уже учтены ранее)
// - в непоследнем окне откладываются o + P + t > size (следующий байт неизвестен)
// Так каждое совпадение обрабатывается ровно один раз.
//
// Стратегии:
// - по смещениям (обычный режим, -c, -l, -L): строка извлекается вокруг совпадения
// - построчная (-v или контекст): обход каждой строки файла
//
// Строка, пересекающая границу окна, переносится в open_line_
// (до MAX_LINE_BYTES байт; реальная длина учитывается через open_start_).
//
// ==============================================================================

#include "streamgrep/file_scan.hpp"

#include "streamgrep/byte_search.hpp"
#include "streamgrep/chunk_reader.hpp"
#include "streamgrep/line_extractor.hpp"

#include <algorithm>
#include <deque>
#include <string_view>

namespace streamgrep::search {

namespace {

enum class Mode { Lines, Count, FilesWith, FilesWithout };

Mode mode_of(const SearchOptions& opt) {
    if (opt.count_only) {
        return Mode::Count;
    }
    if (opt.files_with_matches) {
        return Mode::FilesWith;
    }
    if (opt.files_without_match) {
        return Mode::FilesWithout;
    }
    return Mode::Lines;
}

/// Дописать байты с ограничением MAX_LINE_BYTES
void append_capped(std::string& out, std::string_view bytes) {
    if (out.size() >= MAX_LINE_BYTES) {
        return;
    }
    out.append(bytes.substr(0, MAX_LINE_BYTES - out.size()));
}

// ----------------------------------------------------------------------------
// FileScanner - состояние сканирования одного файла
// ----------------------------------------------------------------------------

class FileScanner {
public:
    FileScanner(const FileScanTask& task, FileScanResult& result)
        : opt_(*task.options),
          result_(result),
          pattern_(task.pattern),
          icase_(task.case_insensitive),
          word_(opt_.word_boundary ? 1 : 0),
          required_(required_overlap(task.pattern.size(), opt_.word_boundary)),
          mode_(mode_of(opt_)),
          walk_(opt_.invert_match || opt_.needs_line_walk()),
          with_context_(mode_ == Mode::Lines &&
                        (opt_.context_before > 0 || opt_.context_after > 0)) {}

    std::size_t required() const { return required_; }

    /// Обработать окно
    /// @param w Байты окна
    /// @param ws Абсолютное смещение начала окна
    /// @param overlap Сколько байт окна уже было в предыдущем окне
    /// @return false если дальше читать не нужно
    bool process_window(std::string_view w, std::uint64_t ws, std::size_t overlap, bool first,
                        bool last) {
        if (first && is_binary_chunk(w)) {
            result_.state = ScanState::BinarySkipped;
            result_.error = BINARY_ERROR;
            result_.bytes_scanned = w.size();
            result_.matches.clear();
            binary_ = true;
            return false;
        }
        result_.bytes_scanned += first ? w.size() : w.size() - std::min(overlap, w.size());

        // Байты окна, которые следующее окно уже не покрывает
        std::size_t consumed = w.size();
        if (!last) {
            consumed = w.size() > required_ ? w.size() - required_ : 0;
        }

        bool more = walk_ ? walk_window(w, ws, overlap, first, last, consumed)
                          : offsets_window(w, ws, overlap, first, last, consumed);
        return more && !last;
    }

    /// Завершить сканирование (в т.ч. после ошибки)
    void finish(bool failed) {
        if (binary_) {
            return;
        }
        if (failed) {
            // Незавершённые строки отдаются с известной частью содержимого
            for (const auto& p : pending_) {
                std::string_view raw = p.line_start == open_start_ ? std::string_view(open_line_)
                                                                   : std::string_view();
                emit(p.offset, p.line_number, p.column, raw, p.text);
            }
            pending_.clear();
        }

        switch (mode_) {
        case Mode::Lines:
            result_.match_count = static_cast<std::uint32_t>(result_.matches.size());
            break;
        case Mode::Count:
            result_.match_count = static_cast<std::uint32_t>(count_);
            break;
        case Mode::FilesWith:
            if (found_) {
                add_file_record();
            }
            break;
        case Mode::FilesWithout:
            if (!found_ && !failed) {
                add_file_record();
            }
            break;
        }
    }

private:
    struct Pending {
        std::uint64_t offset;
        std::uint64_t line_start;
        std::uint64_t line_number;
        std::uint64_t column;
        std::string text;
    };

    struct Hit {
        std::uint64_t offset;
        std::string text;
    };

    struct AfterSlot {
        std::size_t index;
        std::uint32_t remaining;
    };

    // ------------------------------------------------------------------------
    // Общие операции
    // ------------------------------------------------------------------------

    /// Совпадения, принадлежащие окну, с фильтром границ слова
    std::vector<std::size_t> owned_offsets(std::string_view w, std::size_t overlap, bool first,
                                           bool last) const {
        std::vector<std::size_t> raw = icase_ ? find_all_icase(w, pattern_) : find_all(w, pattern_);
        const std::size_t p = pattern_.size();

        std::vector<std::size_t> out;
        out.reserve(raw.size());
        for (std::size_t o : raw) {
            if (!first && o + p + word_ <= overlap) {
                continue;
            }
            if (!last && o + p + word_ > w.size()) {
                continue;
            }
            if (word_ != 0) {
                if (o > 0 && is_word_byte(static_cast<unsigned char>(w[o - 1]))) {
                    continue;
                }
                if (o + p < w.size() && is_word_byte(static_cast<unsigned char>(w[o + p]))) {
                    continue;
                }
            }
            out.push_back(o);
        }
        return out;
    }

    /// Содержимое строки [line_start, ws + end) с учётом переноса
    std::string line_text(std::string_view w, std::uint64_t ws, std::uint64_t line_start,
                          std::size_t end) const {
        std::string text;
        if (line_start >= ws) {
            auto from = static_cast<std::size_t>(line_start - ws);
            append_capped(text, w.substr(from, end - from));
        } else {
            text = open_line_;
            append_capped(text, w.substr(0, end));
        }
        return text;
    }

    /// Перенести незавершённую строку через границу окна
    void carry_line(std::string_view w, std::uint64_t ws, std::size_t consumed) {
        if (consumed == 0) {
            return;
        }
        std::int64_t nl = find_byte_backward(w, '\n', static_cast<std::int64_t>(consumed) - 1);
        if (nl >= 0) {
            auto start = static_cast<std::size_t>(nl) + 1;
            open_start_ = ws + start;
            open_line_.clear();
            append_capped(open_line_, w.substr(start, consumed - start));
        } else {
            append_capped(open_line_, w.substr(0, consumed));
        }
    }

    /// Строка для вывода: без завершающих пробелов, с ограничением превью
    std::string display(std::string_view raw) const {
        std::string_view trimmed = trim_line_end(raw);
        if (opt_.max_columns) {
            return truncate_preview(trimmed, *opt_.max_columns);
        }
        return std::string(trimmed);
    }

    bool limit_reached(std::uint64_t collected) const {
        return opt_.max_results && collected >= *opt_.max_results;
    }

    void emit(std::uint64_t offset, std::uint64_t line_number, std::uint64_t column,
              std::string_view raw_line, const std::string& text) {
        SearchMatch m;
        m.path = result_.path;
        m.line_number = static_cast<std::uint32_t>(line_number);
        m.match_start = static_cast<std::uint32_t>(column);
        m.byte_offset = offset;
        // При -v совпавших байтов нет: выводится вся строка
        if (opt_.only_matching && !opt_.invert_match) {
            m.line_content = text;
        } else {
            m.line_content = display(raw_line);
        }
        result_.matches.push_back(std::move(m));
    }

    void add_file_record() {
        SearchMatch m;
        m.path = result_.path;
        result_.matches.push_back(std::move(m));
        result_.match_count = 1;
    }

    // ------------------------------------------------------------------------
    // Стратегия по смещениям
    // ------------------------------------------------------------------------

    bool offsets_window(std::string_view w, std::uint64_t ws, std::size_t overlap, bool first,
                        bool last, std::size_t consumed) {
        resolve_pending(w, ws, last);

        if (!stop_search_) {
            if (mode_ == Mode::FilesWith || mode_ == Mode::FilesWithout) {
                found_ = word_ == 0 ? exists_owned(w, overlap, first)
                                    : !owned_offsets(w, overlap, first, last).empty();
                if (found_) {
                    return false;
                }
            } else {
                scan_offsets(w, ws, overlap, first, last);
            }
        }

        if (stop_search_ && pending_.empty()) {
            return false;
        }

        carry_line(w, ws, consumed);
        lines_before_ += count_byte(w, '\n', 0, consumed);
        return true;
    }

    /// Ранний выход для -l/-L без -w: первое вхождение за перекрытием
    bool exists_owned(std::string_view w, std::size_t overlap, bool first) const {
        std::size_t start = 0;
        if (!first && overlap + 1 > pattern_.size()) {
            start = overlap + 1 - pattern_.size();
        }
        return icase_ ? exists_icase(w, pattern_, start) : exists(w, pattern_, start);
    }

    void scan_offsets(std::string_view w, std::uint64_t ws, std::size_t overlap, bool first,
                      bool last) {
        std::size_t counted_pos = 0;
        std::uint64_t newlines = 0;

        for (std::size_t o : owned_offsets(w, overlap, first, last)) {
            if (mode_ == Mode::Count) {
                ++count_;
                if (limit_reached(count_)) {
                    stop_search_ = true;
                    return;
                }
                continue;
            }

            newlines += count_byte(w, '\n', counted_pos, o);
            counted_pos = o;

            const std::int64_t prev = find_byte_backward(w, '\n', static_cast<std::int64_t>(o) - 1);
            const std::uint64_t line_start =
                prev >= 0 ? ws + static_cast<std::uint64_t>(prev) + 1 : open_start_;
            const std::uint64_t line_number = lines_before_ + newlines + 1;
            const std::uint64_t offset = ws + o;
            const std::uint64_t column = offset - line_start;
            std::string text = opt_.only_matching ? std::string(w.substr(o, pattern_.size()))
                                                  : std::string();

            const std::size_t nl = find_byte_forward(w, '\n', o);
            if (nl < w.size() || last) {
                std::string raw = line_text(w, ws, line_start, nl);
                emit(offset, line_number, column, raw, text);
            } else {
                pending_.push_back({offset, line_start, line_number, column, std::move(text)});
            }

            if (limit_reached(result_.matches.size() + pending_.size())) {
                stop_search_ = true;
                return;
            }
        }
    }

    /// Отдать совпадения, чья строка закрылась в этом окне
    void resolve_pending(std::string_view w, std::uint64_t ws, bool last) {
        if (pending_.empty()) {
            return;
        }
        const std::uint64_t last_offset = pending_.back().offset;
        const std::size_t from =
            last_offset > ws ? static_cast<std::size_t>(last_offset - ws) : 0;
        const std::size_t nl = find_byte_forward(w, '\n', from);
        if (nl == w.size() && !last) {
            return;
        }
        for (const auto& p : pending_) {
            std::string raw = line_text(w, ws, p.line_start, nl);
            emit(p.offset, p.line_number, p.column, raw, p.text);
        }
        pending_.clear();
    }

    // ------------------------------------------------------------------------
    // Построчная стратегия
    // ------------------------------------------------------------------------

    bool walk_window(std::string_view w, std::uint64_t ws, std::size_t overlap, bool first,
                     bool last, std::size_t consumed) {
        if (!stop_search_) {
            for (std::size_t o : owned_offsets(w, overlap, first, last)) {
                std::string text = opt_.only_matching ? std::string(w.substr(o, pattern_.size()))
                                                      : std::string();
                hits_.push_back({ws + o, std::move(text)});
            }
        }

        std::size_t pos = 0;
        while (pos <= consumed) {
            const std::size_t nl = find_byte_forward(w, '\n', pos);
            if (nl >= consumed) {
                break;
            }
            complete_line(w, ws, nl);
            line_start_ = ws + nl + 1;
            pos = nl + 1;
            if (walk_done()) {
                return false;
            }
        }

        if (last) {
            // Последняя строка без завершающего '\n'
            if (line_start_ < ws + w.size()) {
                complete_line(w, ws, w.size());
            }
            return false;
        }

        // Перенос незавершённой строки
        if (line_start_ >= ws) {
            auto start = static_cast<std::size_t>(line_start_ - ws);
            open_line_.clear();
            append_capped(open_line_, w.substr(start, consumed - start));
        } else {
            append_capped(open_line_, w.substr(0, consumed));
        }
        open_start_ = line_start_;
        return !walk_done();
    }

    bool walk_done() const {
        if (mode_ == Mode::FilesWith || mode_ == Mode::FilesWithout) {
            return found_;
        }
        return stop_search_ && after_.empty();
    }

    /// Обработать строку [line_start_, ws + end)
    void complete_line(std::string_view w, std::uint64_t ws, std::size_t end) {
        const std::uint64_t line_number = next_line_++;
        const std::uint64_t line_end = ws + end;

        std::vector<Hit> taken;
        while (!hits_.empty() && hits_.front().offset < line_end) {
            if (hits_.front().offset >= line_start_) {
                taken.push_back(std::move(hits_.front()));
            }
            hits_.pop_front();
        }

        const bool is_hit = opt_.invert_match ? taken.empty() : !taken.empty();

        if (mode_ != Mode::Lines) {
            if (is_hit && !stop_search_) {
                if (mode_ == Mode::Count) {
                    count_ += opt_.invert_match ? 1 : taken.size();
                    if (limit_reached(count_)) {
                        count_ = *opt_.max_results;
                        stop_search_ = true;
                    }
                } else {
                    found_ = true;
                }
            }
            return;
        }

        std::string raw;
        bool have_raw = false;
        auto raw_line = [&]() -> const std::string& {
            if (!have_raw) {
                raw = line_text(w, ws, line_start_, end);
                have_raw = true;
            }
            return raw;
        };

        std::string shown;
        if (with_context_) {
            shown = display(raw_line());
            feed_after(static_cast<std::uint32_t>(line_number), shown);
        }

        if (is_hit && !stop_search_) {
            if (opt_.invert_match) {
                add_line_match(line_start_, line_number, 0, raw_line(), std::string());
            } else {
                for (const auto& hit : taken) {
                    add_line_match(hit.offset, line_number, hit.offset - line_start_, raw_line(),
                                   hit.text);
                    if (stop_search_) {
                        break;
                    }
                }
            }
        }

        if (opt_.context_before > 0) {
            before_.push_back({static_cast<std::uint32_t>(line_number), std::move(shown)});
            if (before_.size() > opt_.context_before) {
                before_.pop_front();
            }
        }
    }

    void add_line_match(std::uint64_t offset, std::uint64_t line_number, std::uint64_t column,
                        const std::string& raw, const std::string& text) {
        emit(offset, line_number, column, raw, text);
        if (with_context_) {
            MatchContext ctx;
            ctx.before.assign(before_.begin(), before_.end());
            result_.matches.back().context = std::move(ctx);
            if (opt_.context_after > 0) {
                after_.push_back({result_.matches.size() - 1, opt_.context_after});
            }
        }
        if (limit_reached(result_.matches.size())) {
            stop_search_ = true;
        }
    }

    /// Добавить строку в after-контекст ожидающих совпадений
    void feed_after(std::uint32_t line_number, const std::string& content) {
        for (auto& slot : after_) {
            result_.matches[slot.index].context->after.push_back({line_number, content});
            --slot.remaining;
        }
        after_.erase(std::remove_if(after_.begin(), after_.end(),
                                    [](const AfterSlot& s) { return s.remaining == 0; }),
                     after_.end());
    }

    // ------------------------------------------------------------------------

    const SearchOptions& opt_;
    FileScanResult& result_;
    const std::string& pattern_;
    const bool icase_;
    const std::size_t word_;
    const std::size_t required_;
    const Mode mode_;
    const bool walk_;
    const bool with_context_;

    bool binary_ = false;
    bool stop_search_ = false;
    bool found_ = false;
    std::uint64_t count_ = 0;

    // Перенос строки через границу окна
    std::string open_line_;
    std::uint64_t open_start_ = 0;

    // Стратегия по смещениям
    std::uint64_t lines_before_ = 0;
    std::vector<Pending> pending_;

    // Построчная стратегия
    std::uint64_t next_line_ = 1;
    std::uint64_t line_start_ = 0;
    std::deque<Hit> hits_;
    std::deque<ContextLine> before_;
    std::vector<AfterSlot> after_;
};

/// Прочитать файл потоком: чанки -> окна -> FileScanner
void scan_stream(const FileScanTask& task, FileScanner& scanner) {
    auto stream = task.file->open_stream();
    const std::size_t required = scanner.required();
    io::ChunkReader reader(*stream, task.chunk_size, required);

    io::ChunkData chunk;
    std::string window;
    std::string tail;
    std::uint64_t prev_end = 0;
    bool first = true;
    bool finished = false;

    while (reader.next(chunk)) {
        std::uint64_t ws = chunk.absolute_offset;
        std::size_t overlap = 0;

        if (first) {
            window = std::move(chunk.bytes);
        } else {
            // Дошиваем перекрытие из хвоста предыдущего окна
            const auto seen = static_cast<std::size_t>(prev_end - chunk.absolute_offset);
            const std::size_t missing =
                required > seen ? std::min(required - seen, tail.size()) : 0;
            window.assign(tail, tail.size() - missing, missing);
            window.append(chunk.bytes);
            ws = chunk.absolute_offset - missing;
            overlap = static_cast<std::size_t>(prev_end - ws);
        }
        prev_end = ws + window.size();

        if (!scanner.process_window(window, ws, overlap, first, chunk.is_last)) {
            finished = true;
            break;
        }

        const std::size_t keep = std::min(required, window.size());
        tail.assign(window, window.size() - keep, keep);
        first = false;
    }

    if (!finished && !first) {
        // Источник закончился без чанка с is_last: дочищаем хвост
        scanner.process_window(tail, prev_end - tail.size(), tail.size(), false, true);
    }
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// Публичный API
// ----------------------------------------------------------------------------

std::size_t required_overlap(std::size_t pattern_len, bool word_boundary) {
    if (pattern_len == 0) {
        return 0;
    }
    return pattern_len - 1 + (word_boundary ? 2 : 0);
}

FileScanTask make_scan_task(std::shared_ptr<const io::FileHandle> file,
                            std::shared_ptr<const SearchOptions> options) {
    FileScanTask task;
    task.path = file->path();
    task.file = std::move(file);
    task.case_insensitive = resolve_case(*options);
    task.pattern = task.case_insensitive ? ascii_lower(options->pattern) : options->pattern;
    task.chunk_size = effective_chunk_size(task.pattern.size(), options->chunk_size);
    task.options = std::move(options);
    return task;
}

FileScanResult failed_result(const std::string& path, const std::string& message) {
    FileScanResult result;
    result.path = path;
    result.state = ScanState::Failed;
    result.error = message;
    return result;
}

FileScanResult scan_file(const FileScanTask& task) {
    FileScanResult result;
    result.path = task.path;

    FileScanner scanner(task, result);
    bool failed = false;

    try {
        const std::optional<std::uint64_t> size = task.file->size();
        if (size && *size == 0) {
            // Пустой файл не читается
        } else if (size && *size <= task.chunk_size) {
            const std::string content = task.file->read_all();
            if (!content.empty()) {
                scanner.process_window(content, 0, 0, true, true);
            }
        } else {
            scan_stream(task, scanner);
        }
    } catch (const std::exception& e) {
        failed = true;
        result.state = ScanState::Failed;
        result.error = e.what();
    }

    scanner.finish(failed);
    return result;
}

}  // namespace streamgrep::search

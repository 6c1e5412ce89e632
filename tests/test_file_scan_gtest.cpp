// ==============================================================================
// test_file_scan_gtest.cpp - Тесты сканирования одного файла (GoogleTest)
// ==============================================================================
//
// Проверяется:
// - совпадения на границах чанков (ровно один раз)
// - одинаковый результат при любом разбиении на чанки
// - режимы: -i, -S, -w, -v, -c, -l, -L, -o, контекст, -M, -m
// - двоичные файлы, пустые файлы, CRLF, длинные строки
// - ошибка чтения посреди файла
//
// Тесты: TST-SCAN-001..TST-SCAN-025
//
// ==============================================================================

#include "streamgrep/file_scan.hpp"
#include "streamgrep/line_extractor.hpp"

#include <functional>
#include <gtest/gtest.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace streamgrep::search::test {

// ============================================================================
// Helpers
// ============================================================================

SearchOptions make_options(const std::string& pattern, std::uint32_t chunk_size = 1 << 20) {
    SearchOptions options;
    options.pattern = pattern;
    options.chunk_size = chunk_size;
    return options;
}

FileScanResult scan_content(const std::string& content, SearchOptions options,
                            std::size_t block_size = 16) {
    io::MemoryFileSystem fs(block_size);
    fs.write("f.txt", content);
    auto shared = std::make_shared<const SearchOptions>(std::move(options));
    return scan_file(make_scan_task(fs.open_file("f.txt"), shared));
}

std::vector<std::uint64_t> offsets_of(const FileScanResult& result) {
    std::vector<std::uint64_t> out;
    for (const auto& m : result.matches) {
        out.push_back(m.byte_offset);
    }
    return out;
}

void expect_same_lines(const std::vector<ContextLine>& expected,
                       const std::vector<ContextLine>& actual) {
    ASSERT_EQ(actual.size(), expected.size());
    for (std::size_t i = 0; i < expected.size(); ++i) {
        EXPECT_EQ(actual[i].line_number, expected[i].line_number);
        EXPECT_EQ(actual[i].content, expected[i].content);
    }
}

void expect_same_result(const FileScanResult& expected, const FileScanResult& actual) {
    EXPECT_EQ(actual.state, expected.state);
    EXPECT_EQ(actual.match_count, expected.match_count);
    ASSERT_EQ(actual.matches.size(), expected.matches.size());
    for (std::size_t i = 0; i < expected.matches.size(); ++i) {
        const SearchMatch& e = expected.matches[i];
        const SearchMatch& a = actual.matches[i];
        SCOPED_TRACE("match #" + std::to_string(i));
        EXPECT_EQ(a.line_number, e.line_number);
        EXPECT_EQ(a.match_start, e.match_start);
        EXPECT_EQ(a.byte_offset, e.byte_offset);
        EXPECT_EQ(a.line_content, e.line_content);
        ASSERT_EQ(a.context.has_value(), e.context.has_value());
        if (e.context) {
            expect_same_lines(e.context->before, a.context->before);
            expect_same_lines(e.context->after, a.context->after);
        }
    }
}

/// Детерминированный текст: строки разной длины, слова с "needle" в разных позициях
std::string make_corpus() {
    const char* words[] = {"alpha",  "needle",   "needles",  "xneedle", "NEEDLE",
                           "_needle", "beta",    "needle.",  "(needle)", "gamma"};
    std::string text;
    std::uint32_t seed = 12345;
    auto rnd = [&seed](std::uint32_t n) {
        seed = seed * 1103515245u + 12345u;
        return (seed >> 16) % n;
    };

    for (int line = 0; line < 120; ++line) {
        // Каждая 17-я строка длиннее любого тестового чанка
        const std::uint32_t count = rnd(line % 17 == 0 ? 60 : 8);
        for (std::uint32_t i = 0; i < count; ++i) {
            if (i > 0) {
                text += ' ';
            }
            text += words[rnd(10)];
        }
        if (line % 23 == 5) {
            text += '\r';
        }
        text += '\n';
    }
    text += "trailing needle without newline";
    return text;
}

// ============================================================================
// TST-SCAN-001: Базовое совпадение
// ============================================================================

TEST(FileScan, TST_SCAN_001_FindsMatchWithLineAndColumn) {
    // Act
    FileScanResult result = scan_content("hello world\nline 2", make_options("hello"));

    // Assert
    EXPECT_EQ(result.state, ScanState::Completed);
    EXPECT_FALSE(result.error.has_value());
    ASSERT_EQ(result.matches.size(), 1u);
    EXPECT_EQ(result.match_count, 1u);
    EXPECT_EQ(result.matches[0].path, "f.txt");
    EXPECT_EQ(result.matches[0].line_number, 1u);
    EXPECT_EQ(result.matches[0].match_start, 0u);
    EXPECT_EQ(result.matches[0].byte_offset, 0u);
    EXPECT_EQ(result.matches[0].line_content, "hello world");
    EXPECT_FALSE(result.matches[0].context.has_value());
    EXPECT_EQ(result.bytes_scanned, 18u);
}

TEST(FileScan, TST_SCAN_002_MultipleMatchesPerLineAreSeparateRecords) {
    FileScanResult result = scan_content("ab ab\nx ab", make_options("ab"));

    ASSERT_EQ(result.matches.size(), 3u);
    EXPECT_EQ(offsets_of(result), (std::vector<std::uint64_t>{0, 3, 8}));
    EXPECT_EQ(result.matches[1].line_number, 1u);
    EXPECT_EQ(result.matches[1].match_start, 3u);
    EXPECT_EQ(result.matches[2].line_number, 2u);
    EXPECT_EQ(result.matches[2].match_start, 2u);
    EXPECT_EQ(result.matches[2].line_content, "x ab");
}

// ============================================================================
// TST-SCAN-003: Совпадение на границе чанков
// ============================================================================

TEST(FileScan, TST_SCAN_003_BoundaryMatchFoundExactlyOnce) {
    // chunk = 4 * 7 = 28; шаблон проходит через каждую позицию около границ
    for (std::size_t pos = 14; pos < 70; ++pos) {
        SCOPED_TRACE("pos=" + std::to_string(pos));
        std::string content(100, 'x');
        content.replace(pos, 7, "PATTERN");

        FileScanResult result = scan_content(content, make_options("PATTERN", 28), 5);

        ASSERT_EQ(result.matches.size(), 1u);
        EXPECT_EQ(result.matches[0].byte_offset, pos);
        EXPECT_EQ(result.matches[0].match_start, pos);
        EXPECT_EQ(result.matches[0].line_content, content);
        EXPECT_EQ(result.bytes_scanned, content.size());
    }
}

TEST(FileScan, TST_SCAN_004_ChunkingDoesNotChangeResults) {
    const std::string corpus = make_corpus();

    struct Variant {
        const char* name;
        std::function<void(SearchOptions&)> apply;
    };
    const std::vector<Variant> variants = {
        {"plain", [](SearchOptions&) {}},
        {"icase", [](SearchOptions& o) { o.case_insensitive = true; }},
        {"word", [](SearchOptions& o) { o.word_boundary = true; }},
        {"word+icase",
         [](SearchOptions& o) {
             o.word_boundary = true;
             o.case_insensitive = true;
         }},
        {"invert", [](SearchOptions& o) { o.invert_match = true; }},
        {"count", [](SearchOptions& o) { o.count_only = true; }},
        {"count+word",
         [](SearchOptions& o) {
             o.count_only = true;
             o.word_boundary = true;
         }},
        {"count+invert",
         [](SearchOptions& o) {
             o.count_only = true;
             o.invert_match = true;
         }},
        {"context", [](SearchOptions& o) { o.context_before = o.context_after = 2; }},
        {"context+word",
         [](SearchOptions& o) {
             o.context_after = 1;
             o.word_boundary = true;
         }},
        {"invert+context",
         [](SearchOptions& o) {
             o.invert_match = true;
             o.context_before = 1;
         }},
        {"only-matching",
         [](SearchOptions& o) {
             o.only_matching = true;
             o.case_insensitive = true;
         }},
        {"max-columns", [](SearchOptions& o) { o.max_columns = 20; }},
        {"max-results", [](SearchOptions& o) { o.max_results = 7; }},
        {"files-with", [](SearchOptions& o) { o.files_with_matches = true; }},
        {"files-without", [](SearchOptions& o) { o.files_without_match = true; }},
    };

    for (const auto& variant : variants) {
        SearchOptions whole = make_options("needle");
        variant.apply(whole);
        const FileScanResult expected = scan_content(corpus, whole);
        ASSERT_EQ(expected.state, ScanState::Completed);

        for (std::uint32_t chunk : {24u, 25u, 33u, 64u, 250u}) {
            for (std::size_t block : {3u, 16u, 1000u}) {
                SCOPED_TRACE(std::string(variant.name) + " chunk=" + std::to_string(chunk) +
                             " block=" + std::to_string(block));
                SearchOptions chunked = whole;
                chunked.chunk_size = chunk;

                expect_same_result(expected, scan_content(corpus, chunked, block));
            }
        }
    }
}

// ============================================================================
// TST-SCAN-005: Длинные строки
// ============================================================================

TEST(FileScan, TST_SCAN_005_LineLongerThanChunkIsExact) {
    const std::string long_line = std::string(300, 'a') + "needle" + std::string(300, 'b');
    const std::string content = long_line + "\nsecond needle\n";

    FileScanResult result = scan_content(content, make_options("needle", 24), 7);

    ASSERT_EQ(result.matches.size(), 2u);
    EXPECT_EQ(result.matches[0].line_number, 1u);
    EXPECT_EQ(result.matches[0].match_start, 300u);
    EXPECT_EQ(result.matches[0].line_content, long_line);
    EXPECT_EQ(result.matches[1].line_number, 2u);
    EXPECT_EQ(result.matches[1].match_start, 7u);
    EXPECT_EQ(result.matches[1].byte_offset, long_line.size() + 1 + 7);
    EXPECT_EQ(result.matches[1].line_content, "second needle");
}

TEST(FileScan, TST_SCAN_006_OversizedLineContentIsCapped) {
    const std::string content = std::string(MAX_LINE_BYTES + 100, 'a') + "needle";

    FileScanResult result = scan_content(content, make_options("needle", 4096), 1000);

    ASSERT_EQ(result.matches.size(), 1u);
    EXPECT_EQ(result.matches[0].match_start, MAX_LINE_BYTES + 100);
    EXPECT_EQ(result.matches[0].line_content.size(), MAX_LINE_BYTES);
}

// ============================================================================
// TST-SCAN-007: Двоичные и пустые файлы
// ============================================================================

TEST(FileScan, TST_SCAN_007_BinaryFileSkipped) {
    const std::string content = std::string("\0binary hello", 13) + std::string(5000, 'x');

    FileScanResult result = scan_content(content, make_options("hello", 64));

    EXPECT_TRUE(result.is_binary());
    EXPECT_EQ(result.state, ScanState::BinarySkipped);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(*result.error, BINARY_ERROR);
    EXPECT_TRUE(result.matches.empty());
    EXPECT_EQ(result.match_count, 0u);
}

TEST(FileScan, TST_SCAN_008_NulAfterSampleIsText) {
    std::string content(BINARY_SAMPLE_SIZE + 10, 'a');
    content += '\0';
    content += "\nhello";

    FileScanResult result = scan_content(content, make_options("hello"));

    EXPECT_EQ(result.state, ScanState::Completed);
    ASSERT_EQ(result.matches.size(), 1u);
    EXPECT_EQ(result.matches[0].line_number, 2u);
}

TEST(FileScan, TST_SCAN_009_EmptyFile) {
    FileScanResult result = scan_content("", make_options("hello"));

    EXPECT_EQ(result.state, ScanState::Completed);
    EXPECT_TRUE(result.matches.empty());
    EXPECT_EQ(result.bytes_scanned, 0u);

    SearchOptions without = make_options("hello");
    without.files_without_match = true;
    FileScanResult listed = scan_content("", without);
    ASSERT_EQ(listed.matches.size(), 1u);
    EXPECT_EQ(listed.matches[0].line_number, 0u);
}

// ============================================================================
// TST-SCAN-010: Содержимое строки
// ============================================================================

TEST(FileScan, TST_SCAN_010_CrlfAndTrailingWhitespaceTrimmed) {
    FileScanResult result = scan_content("hello\r\nworld hello  \r\n", make_options("hello"));

    ASSERT_EQ(result.matches.size(), 2u);
    EXPECT_EQ(result.matches[0].line_content, "hello");
    EXPECT_EQ(result.matches[1].line_content, "world hello");
    EXPECT_EQ(result.matches[1].line_number, 2u);
    EXPECT_EQ(result.matches[1].match_start, 6u);
}

TEST(FileScan, TST_SCAN_011_MaxColumnsTruncatesPreview) {
    SearchOptions options = make_options("hello");
    options.max_columns = 10;

    FileScanResult result = scan_content("0123456789abcdef hello", options);

    ASSERT_EQ(result.matches.size(), 1u);
    EXPECT_EQ(result.matches[0].line_content, "0123456789...");
    EXPECT_EQ(result.matches[0].match_start, 17u);
}

// ============================================================================
// TST-SCAN-012: Регистр
// ============================================================================

TEST(FileScan, TST_SCAN_012_CaseInsensitive) {
    SearchOptions options = make_options("HeLLo");
    options.case_insensitive = true;

    FileScanResult result = scan_content("Hello\nHELLO\nhello\nhelo", options);

    EXPECT_EQ(result.matches.size(), 3u);
}

TEST(FileScan, TST_SCAN_013_SmartCase) {
    const std::string content = "Hello\nhello";

    SearchOptions lower = make_options("hello");
    lower.smart_case = true;
    EXPECT_EQ(scan_content(content, lower).matches.size(), 2u);

    SearchOptions upper = make_options("Hello");
    upper.smart_case = true;
    EXPECT_EQ(scan_content(content, upper).matches.size(), 1u);
}

// ============================================================================
// TST-SCAN-014: Границы слова
// ============================================================================

TEST(FileScan, TST_SCAN_014_WordBoundary) {
    SearchOptions options = make_options("foo");
    options.word_boundary = true;

    FileScanResult result = scan_content("foo foobar barfoo foo_x (foo) foo", options);

    EXPECT_EQ(offsets_of(result), (std::vector<std::uint64_t>{0, 25, 30}));
}

TEST(FileScan, TST_SCAN_015_WordBoundaryAcrossChunks) {
    // Соседний байт слова лежит в следующем чанке
    for (std::size_t pos = 8; pos < 40; ++pos) {
        SCOPED_TRACE("pos=" + std::to_string(pos));
        std::string content(60, ' ');
        content.replace(pos, 3, "foo");
        std::string glued = content;
        glued[pos + 3] = 'x';

        SearchOptions options = make_options("foo", 12);
        options.word_boundary = true;

        EXPECT_EQ(scan_content(content, options, 5).matches.size(), 1u);
        EXPECT_TRUE(scan_content(glued, options, 5).matches.empty());
    }
}

// ============================================================================
// TST-SCAN-016: Инверсия
// ============================================================================

TEST(FileScan, TST_SCAN_016_InvertReportsNonMatchingLines) {
    SearchOptions options = make_options("hello");
    options.invert_match = true;

    FileScanResult result = scan_content("a\nhello\nb\n", options);

    ASSERT_EQ(result.matches.size(), 2u);
    EXPECT_EQ(result.matches[0].line_number, 1u);
    EXPECT_EQ(result.matches[0].line_content, "a");
    EXPECT_EQ(result.matches[0].match_start, 0u);
    EXPECT_EQ(result.matches[0].byte_offset, 0u);
    EXPECT_EQ(result.matches[1].line_number, 3u);
    EXPECT_EQ(result.matches[1].line_content, "b");
    EXPECT_EQ(result.matches[1].byte_offset, 8u);
}

TEST(FileScan, TST_SCAN_017_OnlyMatching) {
    SearchOptions options = make_options("hello");
    options.only_matching = true;
    options.case_insensitive = true;

    FileScanResult result = scan_content("Say HELLO twice: hello", options);

    ASSERT_EQ(result.matches.size(), 2u);
    EXPECT_EQ(result.matches[0].line_content, "HELLO");
    EXPECT_EQ(result.matches[1].line_content, "hello");

    // С инверсией совпавших байтов нет: выводится строка
    options.invert_match = true;
    FileScanResult inverted = scan_content("a\nhello", options);
    ASSERT_EQ(inverted.matches.size(), 1u);
    EXPECT_EQ(inverted.matches[0].line_content, "a");
}

// ============================================================================
// TST-SCAN-018: Подсчёт и списки файлов
// ============================================================================

TEST(FileScan, TST_SCAN_018_CountOnly) {
    SearchOptions options = make_options("hello");
    options.count_only = true;

    FileScanResult result = scan_content("hello hello\nhello", options);

    EXPECT_EQ(result.match_count, 3u);
    EXPECT_TRUE(result.matches.empty());

    options.invert_match = true;
    EXPECT_EQ(scan_content("a\nhello\nb\n", options).match_count, 2u);
}

TEST(FileScan, TST_SCAN_019_FilesWithMatches) {
    SearchOptions options = make_options("hello");
    options.files_with_matches = true;

    FileScanResult hit = scan_content("x\nsay hello\nhello", options);
    ASSERT_EQ(hit.matches.size(), 1u);
    EXPECT_EQ(hit.match_count, 1u);
    EXPECT_EQ(hit.matches[0].path, "f.txt");
    EXPECT_EQ(hit.matches[0].line_number, 0u);
    EXPECT_EQ(hit.matches[0].line_content, "");

    FileScanResult miss = scan_content("nothing here", options);
    EXPECT_TRUE(miss.matches.empty());
    EXPECT_EQ(miss.match_count, 0u);
}

TEST(FileScan, TST_SCAN_020_FilesWithoutMatch) {
    SearchOptions options = make_options("hello");
    options.files_without_match = true;

    FileScanResult listed = scan_content("nothing here", options);
    ASSERT_EQ(listed.matches.size(), 1u);
    EXPECT_EQ(listed.match_count, 1u);
    EXPECT_EQ(listed.matches[0].line_number, 0u);
    EXPECT_EQ(listed.matches[0].line_content, "");

    FileScanResult skipped = scan_content("hello", options);
    EXPECT_TRUE(skipped.matches.empty());
    EXPECT_EQ(skipped.match_count, 0u);
}

// ============================================================================
// TST-SCAN-021: Контекст
// ============================================================================

TEST(FileScan, TST_SCAN_021_ContextLines) {
    SearchOptions options = make_options("hello");
    options.context_before = 1;
    options.context_after = 1;

    FileScanResult result =
        scan_content("line 1\nline 2\nline 3 hello\nline 4\nline 5", options);

    ASSERT_EQ(result.matches.size(), 1u);
    const SearchMatch& m = result.matches[0];
    EXPECT_EQ(m.line_number, 3u);
    EXPECT_EQ(m.match_start, 7u);
    ASSERT_TRUE(m.context.has_value());
    ASSERT_EQ(m.context->before.size(), 1u);
    EXPECT_EQ(m.context->before[0].line_number, 2u);
    EXPECT_EQ(m.context->before[0].content, "line 2");
    ASSERT_EQ(m.context->after.size(), 1u);
    EXPECT_EQ(m.context->after[0].line_number, 4u);
    EXPECT_EQ(m.context->after[0].content, "line 4");
}

TEST(FileScan, TST_SCAN_022_AdjacentMatchesHaveOwnContext) {
    SearchOptions options = make_options("hello");
    options.context_before = 1;
    options.context_after = 1;

    FileScanResult result = scan_content("a hello\nb hello\nc", options);

    ASSERT_EQ(result.matches.size(), 2u);
    ASSERT_TRUE(result.matches[0].context.has_value());
    EXPECT_TRUE(result.matches[0].context->before.empty());
    ASSERT_EQ(result.matches[0].context->after.size(), 1u);
    EXPECT_EQ(result.matches[0].context->after[0].content, "b hello");

    ASSERT_TRUE(result.matches[1].context.has_value());
    ASSERT_EQ(result.matches[1].context->before.size(), 1u);
    EXPECT_EQ(result.matches[1].context->before[0].content, "a hello");
    ASSERT_EQ(result.matches[1].context->after.size(), 1u);
    EXPECT_EQ(result.matches[1].context->after[0].line_number, 3u);
    EXPECT_EQ(result.matches[1].context->after[0].content, "c");
}

// ============================================================================
// TST-SCAN-023: Лимит совпадений
// ============================================================================

TEST(FileScan, TST_SCAN_023_MaxResultsStopsCollecting) {
    SearchOptions options = make_options("hello");
    options.max_results = 2;

    FileScanResult result = scan_content("hello\nhello\nhello\nhello", options);

    EXPECT_EQ(result.matches.size(), 2u);
    EXPECT_EQ(result.match_count, 2u);
    EXPECT_EQ(result.matches[1].line_number, 2u);
}

// ============================================================================
// TST-SCAN-024: Ошибка чтения посреди файла
// ============================================================================

/// Поток: несколько блоков, затем ошибка ввода-вывода
class FlakyStream : public io::ByteStream {
public:
    explicit FlakyStream(std::vector<std::string> blocks) : blocks_(std::move(blocks)) {}

    bool next(std::string& out) override {
        if (index_ < blocks_.size()) {
            out = blocks_[index_++];
            return true;
        }
        throw io::IoError("flaky.txt", "Input/output error");
    }

private:
    std::vector<std::string> blocks_;
    std::size_t index_ = 0;
};

/// Файл неизвестного размера, чтение которого обрывается ошибкой
class FlakyHandle : public io::FileHandle {
public:
    explicit FlakyHandle(std::vector<std::string> blocks) : blocks_(std::move(blocks)) {}

    const std::string& path() const override { return path_; }
    std::optional<std::uint64_t> size() const override { return std::nullopt; }
    std::unique_ptr<io::ByteStream> open_stream() const override {
        return std::make_unique<FlakyStream>(blocks_);
    }

private:
    std::string path_ = "flaky.txt";
    std::vector<std::string> blocks_;
};

TEST(FileScan, TST_SCAN_024_ReadErrorKeepsPartialMatches) {
    // Arrange: чанк 20 байт; первая строка с совпадением читается до ошибки
    auto handle = std::make_shared<const FlakyHandle>(
        std::vector<std::string>{"hello one\nplain line\n", "another hello\n"});
    auto options = std::make_shared<const SearchOptions>(make_options("hello", 20));

    // Act
    FileScanResult result = scan_file(make_scan_task(handle, options));

    // Assert
    EXPECT_TRUE(result.failed());
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(*result.error, "flaky.txt: Input/output error");
    ASSERT_EQ(result.matches.size(), 1u);
    EXPECT_EQ(result.matches[0].line_content, "hello one");
    EXPECT_EQ(result.match_count, 1u);
}

TEST(FileScan, TST_SCAN_025_TaskParameters) {
    EXPECT_EQ(required_overlap(7, false), 6u);
    EXPECT_EQ(required_overlap(7, true), 8u);
    EXPECT_EQ(required_overlap(0, false), 0u);

    io::MemoryFileSystem fs;
    fs.write("a.txt", "x");
    SearchOptions options = make_options("HeLLo", 8);
    options.case_insensitive = true;
    FileScanTask task = make_scan_task(fs.open_file("a.txt"),
                                       std::make_shared<const SearchOptions>(options));

    EXPECT_EQ(task.path, "a.txt");
    EXPECT_EQ(task.pattern, "hello");
    EXPECT_TRUE(task.case_insensitive);
    EXPECT_EQ(task.chunk_size, 20u);

    FileScanResult failed = failed_result("gone.txt", "gone.txt: No such file or directory");
    EXPECT_TRUE(failed.failed());
    EXPECT_EQ(failed.path, "gone.txt");
}

}  // namespace streamgrep::search::test

// ==============================================================================
// test_config_gtest.cpp - Тесты файла конфигурации (GoogleTest)
// ==============================================================================
//
// Тесты: TST-CONFIG-001..TST-CONFIG-011
//
// ==============================================================================

#include "streamgrep/config.hpp"
#include "streamgrep/platform.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace streamgrep::config::test {

// ==============================================================================
// TST-CONFIG-001: Разбор YAML
// ==============================================================================

TEST(ConfigTest, TST_CONFIG_001_ParsesAllKeys) {
    // Arrange
    const char* yaml =
        "chunk_size: 256K\n"
        "threads: 4\n"
        "hidden: true\n"
        "globs: [\"!node_modules\", \"*.ts\"]\n"
        "max_columns: 200\n"
        "context: 2\n"
        "smart_case: yes\n"
        "color: false\n";

    // Act
    LoadResult result = parse(yaml);

    // Assert
    ASSERT_TRUE(result.ok) << result.error.format();
    const Config& cfg = result.config;
    EXPECT_EQ(cfg.chunk_size, 256u * 1024u);
    EXPECT_EQ(cfg.threads, 4u);
    EXPECT_EQ(cfg.hidden, true);
    EXPECT_EQ(cfg.globs, (std::vector<std::string>{"!node_modules", "*.ts"}));
    EXPECT_EQ(cfg.max_columns, 200u);
    EXPECT_EQ(cfg.context, 2u);
    EXPECT_EQ(cfg.smart_case, true);
    EXPECT_EQ(cfg.color, false);
    EXPECT_TRUE(result.warnings.empty());
}

TEST(ConfigTest, TST_CONFIG_002_EmptyDocumentIsValid) {
    LoadResult result = parse("");

    ASSERT_TRUE(result.ok);
    EXPECT_FALSE(result.config.chunk_size.has_value());
    EXPECT_FALSE(result.config.color.has_value());
    EXPECT_TRUE(result.config.globs.empty());
}

TEST(ConfigTest, TST_CONFIG_003_SingleGlobScalar) {
    LoadResult result = parse("globs: \"!vendor\"\n");

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.config.globs, (std::vector<std::string>{"!vendor"}));
}

TEST(ConfigTest, TST_CONFIG_004_UnknownKeysAreWarnings) {
    LoadResult result = parse("threads: 2\nmystery: 1\n");

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.config.threads, 2u);
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_EQ(result.warnings[0], "unknown configuration key 'mystery'");
}

// ==============================================================================
// TST-CONFIG-005: Ошибки значений
// ==============================================================================

TEST(ConfigTest, TST_CONFIG_005_InvalidValuesRejected) {
    LoadResult bad_chunk = parse("chunk_size: lots\n", "cfg.yaml");
    ASSERT_FALSE(bad_chunk.ok);
    EXPECT_EQ(bad_chunk.error.message, "chunk_size: invalid size 'lots'");
    EXPECT_EQ(bad_chunk.error.format(), "cfg.yaml: chunk_size: invalid size 'lots'");

    EXPECT_FALSE(parse("chunk_size: 0\n").ok);

    LoadResult zero_threads = parse("threads: 0\n");
    ASSERT_FALSE(zero_threads.ok);
    EXPECT_EQ(zero_threads.error.message, "threads: must be greater than zero");

    LoadResult bad_bool = parse("hidden: [1, 2]\n");
    ASSERT_FALSE(bad_bool.ok);
    EXPECT_EQ(bad_bool.error.message, "hidden: expected a boolean");

    EXPECT_FALSE(parse("max_columns: -5\n").ok);
    EXPECT_FALSE(parse("globs: {a: 1}\n").ok);
}

TEST(ConfigTest, TST_CONFIG_006_RootMustBeMapping) {
    LoadResult result = parse("- a\n- b\n");

    ASSERT_FALSE(result.ok);
    EXPECT_EQ(result.error.message, "top-level value must be a mapping");
    EXPECT_EQ(result.error.path, "<config>");
}

TEST(ConfigTest, TST_CONFIG_007_MalformedYaml) {
    LoadResult result = parse("threads: [1, 2\n");

    EXPECT_FALSE(result.ok);
    EXPECT_FALSE(result.error.message.empty());
}

// ==============================================================================
// TST-CONFIG-008: Размеры
// ==============================================================================

TEST(ConfigTest, TST_CONFIG_008_ParseSize) {
    EXPECT_EQ(parse_size("4096"), 4096u);
    EXPECT_EQ(parse_size("512K"), 512u * 1024u);
    EXPECT_EQ(parse_size("512k"), 512u * 1024u);
    EXPECT_EQ(parse_size("1M"), 1024u * 1024u);

    EXPECT_FALSE(parse_size("").has_value());
    EXPECT_FALSE(parse_size("K").has_value());
    EXPECT_FALSE(parse_size("12G").has_value());
    EXPECT_FALSE(parse_size("-1").has_value());
    EXPECT_FALSE(parse_size("99999999999").has_value());
}

// ==============================================================================
// TST-CONFIG-009: Файлы
// ==============================================================================

TEST(ConfigTest, TST_CONFIG_009_LoadFromFile) {
    // Arrange
    std::filesystem::path path = platform::make_temp_file("streamgrep_config");
    {
        std::ofstream out(path, std::ios::binary);
        out << "context: 3\nunknown_key: x\n";
    }

    // Act
    LoadResult result = load(path);

    // Assert
    ASSERT_TRUE(result.ok) << result.error.format();
    EXPECT_EQ(result.config.context, 3u);
    EXPECT_EQ(result.warnings.size(), 1u);

    // Cleanup
    std::filesystem::remove(path);
}

TEST(ConfigTest, TST_CONFIG_010_LoadMissingFile) {
    std::filesystem::path missing =
        std::filesystem::temp_directory_path() / "streamgrep_no_such_config.yaml";

    LoadResult result = load(missing);

    ASSERT_FALSE(result.ok);
    EXPECT_EQ(result.error.message, "failed to open configuration file");
    EXPECT_EQ(result.error.path, platform::path_to_utf8(missing));
}

TEST(ConfigTest, TST_CONFIG_011_LocateUsesExplicitPathThenEnvironment) {
    const std::filesystem::path explicit_path = "explicit.yaml";
    auto located = locate(explicit_path);
    ASSERT_TRUE(located.has_value());
    EXPECT_EQ(located->string(), "explicit.yaml");

#ifdef _WIN32
    _putenv_s(CONFIG_ENV, "from_env.yaml");
#else
    setenv(CONFIG_ENV, "from_env.yaml", 1);
#endif
    auto from_env = locate(std::nullopt);
    ASSERT_TRUE(from_env.has_value());
    EXPECT_EQ(from_env->string(), "from_env.yaml");
    EXPECT_EQ(locate(explicit_path)->string(), "explicit.yaml");

#ifdef _WIN32
    _putenv_s(CONFIG_ENV, "");
#else
    unsetenv(CONFIG_ENV);
#endif
    EXPECT_FALSE(locate(std::nullopt).has_value());
}

}  // namespace streamgrep::config::test

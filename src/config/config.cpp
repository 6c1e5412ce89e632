// ==============================================================================
// config.cpp - Файл конфигурации (YAML)
// ==============================================================================

#include "streamgrep/config.hpp"

#include "streamgrep/platform.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace streamgrep::config {

namespace {

/// Значение ключа вне допустимого диапазона / неверного типа
class ValueError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

std::uint32_t as_u32(const YAML::Node& node, const std::string& key) {
    auto value = node.as<long long>();
    if (value < 0 || value > static_cast<long long>(std::numeric_limits<std::uint32_t>::max())) {
        throw ValueError(key + ": value out of range");
    }
    return static_cast<std::uint32_t>(value);
}

bool as_bool(const YAML::Node& node, const std::string& key) {
    if (!node.IsScalar()) {
        throw ValueError(key + ": expected a boolean");
    }
    return node.as<bool>();
}

void parse_root(const YAML::Node& root, LoadResult& result) {
    if (root.IsNull()) {
        return;
    }
    if (!root.IsMap()) {
        throw ValueError("top-level value must be a mapping");
    }

    Config& cfg = result.config;
    for (const auto& entry : root) {
        const std::string key = entry.first.as<std::string>();
        const YAML::Node& value = entry.second;

        if (key == "chunk_size") {
            auto size = parse_size(value.as<std::string>());
            if (!size || *size == 0 || *size > std::numeric_limits<std::uint32_t>::max()) {
                throw ValueError("chunk_size: invalid size '" + value.as<std::string>() + "'");
            }
            cfg.chunk_size = static_cast<std::uint32_t>(*size);
        } else if (key == "threads") {
            std::uint32_t threads = as_u32(value, key);
            if (threads == 0) {
                throw ValueError("threads: must be greater than zero");
            }
            cfg.threads = threads;
        } else if (key == "hidden") {
            cfg.hidden = as_bool(value, key);
        } else if (key == "globs") {
            if (value.IsScalar()) {
                cfg.globs.push_back(value.as<std::string>());
            } else if (value.IsSequence()) {
                for (const auto& g : value) {
                    cfg.globs.push_back(g.as<std::string>());
                }
            } else {
                throw ValueError("globs: expected a list of strings");
            }
        } else if (key == "max_columns") {
            cfg.max_columns = as_u32(value, key);
        } else if (key == "context") {
            cfg.context = as_u32(value, key);
        } else if (key == "smart_case") {
            cfg.smart_case = as_bool(value, key);
        } else if (key == "color") {
            cfg.color = as_bool(value, key);
        } else {
            result.warnings.push_back("unknown configuration key '" + key + "'");
        }
    }
}

}  // anonymous namespace

std::string Error::format() const {
    if (path.empty()) {
        return message;
    }
    return path + ": " + message;
}

LoadResult parse(std::string_view yaml, const std::string& source) {
    LoadResult result;
    try {
        YAML::Node root = YAML::Load(std::string(yaml));
        parse_root(root, result);
        result.ok = true;
    } catch (const YAML::Exception& e) {
        result.error = Error{e.what(), source};
    } catch (const ValueError& e) {
        result.error = Error{e.what(), source};
    }
    return result;
}

LoadResult load(const std::filesystem::path& path) {
    const std::string source = platform::path_to_utf8(path);
    LoadResult result;
    try {
        YAML::Node root = YAML::LoadFile(source);
        parse_root(root, result);
        result.ok = true;
    } catch (const YAML::BadFile&) {
        result.error = Error{"failed to open configuration file", source};
    } catch (const YAML::Exception& e) {
        result.error = Error{e.what(), source};
    } catch (const ValueError& e) {
        result.error = Error{e.what(), source};
    }
    return result;
}

std::optional<std::filesystem::path> locate(
    const std::optional<std::filesystem::path>& explicit_path) {
    if (explicit_path) {
        return explicit_path;
    }
    const char* env = std::getenv(CONFIG_ENV);
    if (env != nullptr && *env != '\0') {
        return platform::path_from_utf8(env);
    }
    return std::nullopt;
}

std::optional<std::uint64_t> parse_size(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }

    std::uint64_t multiplier = 1;
    char suffix = text.back();
    if (suffix == 'k' || suffix == 'K') {
        multiplier = 1024;
        text.remove_suffix(1);
    } else if (suffix == 'm' || suffix == 'M') {
        multiplier = 1024 * 1024;
        text.remove_suffix(1);
    }
    if (text.empty()) {
        return std::nullopt;
    }

    std::uint64_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        value = value * 10 + static_cast<std::uint64_t>(c - '0');
        if (value > std::numeric_limits<std::uint32_t>::max()) {
            return std::nullopt;
        }
    }
    return value * multiplier;
}

}  // namespace streamgrep::config

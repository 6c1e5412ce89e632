// ==============================================================================
// glob.cpp - Glob-фильтры путей
// ==============================================================================

#include "streamgrep/glob.hpp"

namespace streamgrep::io {

namespace {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Разобрать класс байтов, начинающийся с pattern[pos] == '['
/// @return false если класс не закрыт (тогда '[' — обычный символ)
bool parse_class(std::string_view pattern, std::size_t pos, unsigned char c, std::size_t& end,
                 bool& matched) {
    std::size_t i = pos + 1;
    bool negate = false;
    if (i < pattern.size() && (pattern[i] == '!' || pattern[i] == '^')) {
        negate = true;
        ++i;
    }

    bool hit = false;
    bool first = true;
    while (i < pattern.size() && (pattern[i] != ']' || first)) {
        auto lo = static_cast<unsigned char>(pattern[i]);
        if (i + 2 < pattern.size() && pattern[i + 1] == '-' && pattern[i + 2] != ']') {
            auto hi = static_cast<unsigned char>(pattern[i + 2]);
            if (c >= lo && c <= hi) {
                hit = true;
            }
            i += 3;
        } else {
            if (c == lo) {
                hit = true;
            }
            ++i;
        }
        first = false;
    }

    if (i >= pattern.size()) {
        return false;
    }

    end = i + 1;
    matched = negate ? !hit : hit;
    return true;
}

bool match_from(std::string_view p, std::size_t pi, std::string_view t, std::size_t ti) {
    while (pi < p.size()) {
        char pc = p[pi];

        if (pc == '*') {
            bool double_star = pi + 1 < p.size() && p[pi + 1] == '*';
            std::size_t next = pi + (double_star ? 2 : 1);

            // "**/" может совпасть с нулём директорий
            if (double_star && next < p.size() && p[next] == '/') {
                if (match_from(p, next + 1, t, ti)) {
                    return true;
                }
            }

            for (std::size_t k = ti; k <= t.size(); ++k) {
                if (match_from(p, next, t, k)) {
                    return true;
                }
                // Одиночная '*' не пересекает границу директории
                if (k < t.size() && !double_star && t[k] == '/') {
                    break;
                }
            }
            return false;
        }

        if (ti >= t.size()) {
            return false;
        }

        if (pc == '?') {
            if (t[ti] == '/') {
                return false;
            }
            ++pi;
            ++ti;
            continue;
        }

        if (pc == '[') {
            std::size_t end = 0;
            bool matched = false;
            if (parse_class(p, pi, static_cast<unsigned char>(t[ti]), end, matched)) {
                if (!matched) {
                    return false;
                }
                pi = end;
                ++ti;
                continue;
            }
        }

        if (pc != t[ti]) {
            return false;
        }
        ++pi;
        ++ti;
    }

    return ti == t.size();
}

/// Нормализовать glob: убрать ведущий '/' (якорь корня) и завершающий '/'
std::string normalize_glob(std::string glob) {
    while (glob.size() > 1 && glob.back() == '/') {
        glob.pop_back();
    }
    if (glob.size() > 1 && glob.front() == '/') {
        glob.erase(0, 1);
    }
    return glob;
}

}  // anonymous namespace

bool glob_match(std::string_view pattern, std::string_view text) {
    return match_from(pattern, 0, text, 0);
}

// ----------------------------------------------------------------------------
// PathFilter
// ----------------------------------------------------------------------------

PathFilter::PathFilter(const std::vector<std::string>& filters) {
    for (const auto& f : filters) {
        if (f.empty()) {
            continue;
        }
        if (f[0] == '!') {
            if (f.size() > 1) {
                excludes_.push_back(normalize_glob(f.substr(1)));
            }
        } else {
            includes_.push_back(normalize_glob(f));
        }
    }
}

bool PathFilter::matches_any(const std::vector<std::string>& globs,
                             std::string_view relative_path, std::string_view name) {
    for (const auto& g : globs) {
        bool has_slash = g.find('/') != std::string::npos;
        if (glob_match(g, has_slash ? relative_path : name)) {
            return true;
        }
    }
    return false;
}

bool PathFilter::excludes_dir(std::string_view relative_path, std::string_view name) const {
    return matches_any(excludes_, relative_path, name);
}

bool PathFilter::accepts_file(std::string_view relative_path, std::string_view name) const {
    if (matches_any(excludes_, relative_path, name)) {
        return false;
    }
    if (includes_.empty()) {
        return true;
    }
    return matches_any(includes_, relative_path, name);
}

}  // namespace streamgrep::io

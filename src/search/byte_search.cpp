// ==============================================================================
// byte_search.cpp - Поиск литеральных шаблонов в байтовых буферах
// ==============================================================================

#include "streamgrep/byte_search.hpp"

#include <algorithm>
#include <cstring>

namespace streamgrep::search {

namespace {

struct ExactEq {
    bool operator()(char a, char b) const { return a == b; }
};

struct IcaseEq {
    bool operator()(char a, char b) const { return ascii_lower(a) == ascii_lower(b); }
};

/// Общий алгоритм: фильтр по первому байту + проверка остатка
/// Callback возвращает false, чтобы прекратить поиск
template <typename Eq, typename OnHit>
void scan(std::string_view hay, std::string_view pat, std::size_t start, Eq eq, OnHit on_hit) {
    const std::size_t n = hay.size();
    const std::size_t p = pat.size();
    if (p == 0 || start >= n || p > n - start) {
        return;
    }

    const char first = pat[0];
    const std::size_t last_start = n - p;

    for (std::size_t i = start; i <= last_start; ++i) {
        if (!eq(hay[i], first)) {
            continue;
        }
        std::size_t j = 1;
        while (j < p && eq(hay[i + j], pat[j])) {
            ++j;
        }
        if (j == p && !on_hit(i)) {
            return;
        }
    }
}

/// Точный однобайтовый поиск через memchr
template <typename OnHit>
void scan_single(std::string_view hay, char value, std::size_t start, OnHit on_hit) {
    const char* base = hay.data();
    const char* end = base + hay.size();
    const char* p = base + start;
    while (p < end) {
        const void* hit = std::memchr(p, value, static_cast<std::size_t>(end - p));
        if (hit == nullptr) {
            return;
        }
        const char* at = static_cast<const char*>(hit);
        if (!on_hit(static_cast<std::size_t>(at - base))) {
            return;
        }
        p = at + 1;
    }
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// Поиск шаблона
// ----------------------------------------------------------------------------

std::vector<std::size_t> find_all(std::string_view haystack, std::string_view pattern,
                                  std::size_t start) {
    std::vector<std::size_t> result;
    auto collect = [&result](std::size_t at) {
        result.push_back(at);
        return true;
    };

    if (pattern.size() == 1) {
        if (start < haystack.size()) {
            scan_single(haystack, pattern[0], start, collect);
        }
    } else {
        scan(haystack, pattern, start, ExactEq{}, collect);
    }
    return result;
}

bool exists(std::string_view haystack, std::string_view pattern, std::size_t start) {
    bool found = false;
    auto stop = [&found](std::size_t) {
        found = true;
        return false;
    };

    if (pattern.size() == 1) {
        if (start < haystack.size()) {
            scan_single(haystack, pattern[0], start, stop);
        }
    } else {
        scan(haystack, pattern, start, ExactEq{}, stop);
    }
    return found;
}

std::vector<std::size_t> find_all_icase(std::string_view haystack, std::string_view pattern,
                                        std::size_t start) {
    std::vector<std::size_t> result;
    scan(haystack, pattern, start, IcaseEq{}, [&result](std::size_t at) {
        result.push_back(at);
        return true;
    });
    return result;
}

bool exists_icase(std::string_view haystack, std::string_view pattern, std::size_t start) {
    bool found = false;
    scan(haystack, pattern, start, IcaseEq{}, [&found](std::size_t) {
        found = true;
        return false;
    });
    return found;
}

// ----------------------------------------------------------------------------
// Сканирование отдельных байтов
// ----------------------------------------------------------------------------

std::size_t count_byte(std::string_view haystack, char value, std::size_t start,
                       std::size_t end) {
    end = std::min(end, haystack.size());
    if (start >= end) {
        return 0;
    }
    return static_cast<std::size_t>(
        std::count(haystack.begin() + static_cast<std::ptrdiff_t>(start),
                   haystack.begin() + static_cast<std::ptrdiff_t>(end), value));
}

std::int64_t find_byte_backward(std::string_view haystack, char value, std::int64_t from) {
    if (haystack.empty() || from < 0) {
        return -1;
    }
    auto i = std::min<std::int64_t>(from, static_cast<std::int64_t>(haystack.size()) - 1);
    for (; i >= 0; --i) {
        if (haystack[static_cast<std::size_t>(i)] == value) {
            return i;
        }
    }
    return -1;
}

std::size_t find_byte_forward(std::string_view haystack, char value, std::size_t from) {
    if (from >= haystack.size()) {
        return haystack.size();
    }
    const void* hit = std::memchr(haystack.data() + from, value, haystack.size() - from);
    if (hit == nullptr) {
        return haystack.size();
    }
    return static_cast<std::size_t>(static_cast<const char*>(hit) - haystack.data());
}

// ----------------------------------------------------------------------------
// ASCII-классы
// ----------------------------------------------------------------------------

bool is_word_byte(unsigned char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '_';
}

char ascii_lower(char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

std::string ascii_lower(std::string_view s) {
    std::string result(s);
    for (char& c : result) {
        c = ascii_lower(c);
    }
    return result;
}

bool has_ascii_upper(std::string_view s) {
    return std::any_of(s.begin(), s.end(), [](char c) { return c >= 'A' && c <= 'Z'; });
}

}  // namespace streamgrep::search

// ==============================================================================
// discovery.cpp - LocalFileSystem: обход директорий и чтение файлов с диска
// ==============================================================================
//
// - Рекурсивный обход (depth-first) с фильтрами hidden / glob / max_depth
// - Детерминированный порядок результатов (сортировка)
// - Ошибки обхода не прерывают перечисление, а собираются в Listing::errors
// - Символические ссылки не разыменовываются
//
// ==============================================================================

#include "streamgrep/glob.hpp"
#include "streamgrep/platform.hpp"
#include "streamgrep/vfs.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <system_error>

namespace streamgrep::io {

namespace {

// ----------------------------------------------------------------------------
// Потоковое чтение файла с диска
// ----------------------------------------------------------------------------

class LocalByteStream : public ByteStream {
public:
    LocalByteStream(const std::filesystem::path& full_path, std::string path)
        : path_(std::move(path)), in_(full_path, std::ios::binary) {
        if (!in_.is_open()) {
            throw IoError(path_, std::strerror(errno));
        }
    }

    bool next(std::string& out) override {
        if (done_) {
            return false;
        }
        out.resize(LocalFileSystem::READ_BLOCK_SIZE);
        in_.read(&out[0], static_cast<std::streamsize>(out.size()));
        std::streamsize got = in_.gcount();

        if (in_.bad()) {
            throw IoError(path_, "read failed");
        }
        if (got <= 0) {
            done_ = true;
            out.clear();
            return false;
        }
        out.resize(static_cast<std::size_t>(got));
        if (in_.eof()) {
            done_ = true;
        }
        return true;
    }

private:
    std::string path_;
    std::ifstream in_;
    bool done_ = false;
};

class LocalFileHandle : public FileHandle {
public:
    LocalFileHandle(std::filesystem::path full_path, std::string path,
                    std::optional<std::uint64_t> size)
        : full_path_(std::move(full_path)), path_(std::move(path)), size_(size) {}

    const std::string& path() const override { return path_; }

    std::optional<std::uint64_t> size() const override { return size_; }

    std::unique_ptr<ByteStream> open_stream() const override {
        return std::make_unique<LocalByteStream>(full_path_, path_);
    }

private:
    std::filesystem::path full_path_;
    std::string path_;
    std::optional<std::uint64_t> size_;
};

// ----------------------------------------------------------------------------
// Рекурсивный обход
// ----------------------------------------------------------------------------

struct WalkContext {
    const ListOptions& opt;
    PathFilter filter;
    Listing& listing;
};

void collect_files_recursive(const std::filesystem::path& dir, const std::string& relative,
                             std::size_t depth, WalkContext& ctx) {
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        ctx.listing.errors.push_back("failed to read directory '" + platform::path_to_utf8(dir) +
                                     "' - " + ec.message());
        return;
    }

    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec) {
            ctx.listing.errors.push_back("failed to read directory '" +
                                         platform::path_to_utf8(dir) + "' - " + ec.message());
            return;
        }

        const auto& entry = *it;
        std::string name = platform::generic_utf8(entry.path().filename());
        std::string child = join_path(relative, name);

        if (!ctx.opt.include_hidden && is_hidden_name(name)) {
            continue;
        }
        if (ctx.opt.max_depth && depth + 1 > *ctx.opt.max_depth) {
            continue;
        }

        std::error_code st_ec;
        std::filesystem::file_status status = entry.symlink_status(st_ec);
        if (st_ec) {
            ctx.listing.errors.push_back("failed to get metadata for '" + child + "' - " +
                                         st_ec.message());
            continue;
        }

        if (std::filesystem::is_directory(status)) {
            if (ctx.filter.excludes_dir(child, name)) {
                continue;
            }
            collect_files_recursive(entry.path(), child, depth + 1, ctx);
        } else if (std::filesystem::is_regular_file(status)) {
            if (ctx.filter.accepts_file(child, name)) {
                ctx.listing.files.push_back(child);
            }
        }
        // Symlinks, special files etc. игнорируются
    }
}

/// Нормализовать относительный путь пользователя ("./src/" -> "src")
std::string normalize_root(const std::string& root) {
    std::string result = platform::generic_utf8(
        platform::path_from_utf8(root).lexically_normal());
    while (!result.empty() && result.back() == '/') {
        result.pop_back();
    }
    if (result == ".") {
        result.clear();
    }
    return result;
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// LocalFileSystem
// ----------------------------------------------------------------------------

LocalFileSystem::LocalFileSystem(std::filesystem::path root) : root_(std::move(root)) {}

std::filesystem::path LocalFileSystem::resolve(const std::string& relative) const {
    if (relative.empty()) {
        return root_;
    }
    return root_ / platform::path_from_utf8(relative);
}

Listing LocalFileSystem::list_candidate_files(const std::string& root,
                                              const ListOptions& opt) const {
    Listing listing;
    const std::string base = normalize_root(root);
    const std::filesystem::path start = resolve(base);

    std::error_code ec;
    std::filesystem::file_status status = std::filesystem::status(start, ec);
    if (ec || !std::filesystem::exists(status)) {
        listing.errors.push_back((base.empty() ? platform::path_to_utf8(start) : base) +
                                 ": No such file or directory");
        return listing;
    }

    if (std::filesystem::is_regular_file(status)) {
        // Явно указанный файл не фильтруется
        listing.files.push_back(base);
        return listing;
    }

    if (!std::filesystem::is_directory(status)) {
        listing.errors.push_back(base + ": not a regular file or directory");
        return listing;
    }

    WalkContext ctx{opt, PathFilter(opt.path_filters), listing};
    collect_files_recursive(start, base, 0, ctx);

    // Сортировка для детерминизма (порядок directory_iterator зависит от ОС)
    std::sort(listing.files.begin(), listing.files.end());
    return listing;
}

std::unique_ptr<FileHandle> LocalFileSystem::open_file(const std::string& path) const {
    const std::filesystem::path full = resolve(path);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(full, ec)) {
        throw IoError(path, ec ? ec.message() : "No such file or directory");
    }

    std::optional<std::uint64_t> size;
    std::uintmax_t sz = std::filesystem::file_size(full, ec);
    if (!ec) {
        size = static_cast<std::uint64_t>(sz);
    }
    return std::make_unique<LocalFileHandle>(full, path, size);
}

}  // namespace streamgrep::io

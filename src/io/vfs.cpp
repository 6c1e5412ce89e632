// ==============================================================================
// vfs.cpp - Общая часть VFS и MemoryFileSystem
// ==============================================================================

#include "streamgrep/vfs.hpp"

#include "streamgrep/glob.hpp"

#include <algorithm>

namespace streamgrep::io {

// ----------------------------------------------------------------------------
// IoError
// ----------------------------------------------------------------------------

IoError::IoError(const std::string& path, const std::string& message)
    : std::runtime_error(path.empty() ? message : path + ": " + message), path_(path) {}

// ----------------------------------------------------------------------------
// FileHandle
// ----------------------------------------------------------------------------

std::string FileHandle::read_all() const {
    auto stream = open_stream();
    std::string result;
    if (auto sz = size()) {
        result.reserve(static_cast<std::size_t>(*sz));
    }
    std::string block;
    while (stream->next(block)) {
        result.append(block);
    }
    return result;
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

bool is_hidden_name(const std::string& name) {
    return !name.empty() && name[0] == '.' && name != "." && name != "..";
}

std::string join_path(const std::string& dir, const std::string& name) {
    if (dir.empty()) {
        return name;
    }
    if (name.empty()) {
        return dir;
    }
    return dir + "/" + name;
}

// ----------------------------------------------------------------------------
// MemoryFileSystem
// ----------------------------------------------------------------------------

namespace {

/// Убрать ведущие "./" и '/' и завершающие '/'
std::string normalize_relative(std::string path) {
    while (path.rfind("./", 0) == 0) {
        path.erase(0, 2);
    }
    while (!path.empty() && path.front() == '/') {
        path.erase(0, 1);
    }
    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }
    if (path == ".") {
        path.clear();
    }
    return path;
}

/// Поток поверх снимка содержимого
class MemoryByteStream : public ByteStream {
public:
    MemoryByteStream(std::shared_ptr<const std::string> content, std::size_t block_size)
        : content_(std::move(content)), block_size_(block_size) {}

    bool next(std::string& out) override {
        if (pos_ >= content_->size()) {
            return false;
        }
        std::size_t n = std::min(block_size_, content_->size() - pos_);
        out.assign(*content_, pos_, n);
        pos_ += n;
        return true;
    }

private:
    std::shared_ptr<const std::string> content_;
    std::size_t block_size_;
    std::size_t pos_ = 0;
};

class MemoryFileHandle : public FileHandle {
public:
    MemoryFileHandle(std::string path, std::shared_ptr<const std::string> content,
                     std::size_t block_size)
        : path_(std::move(path)), content_(std::move(content)), block_size_(block_size) {}

    const std::string& path() const override { return path_; }

    std::optional<std::uint64_t> size() const override { return content_->size(); }

    std::unique_ptr<ByteStream> open_stream() const override {
        return std::make_unique<MemoryByteStream>(content_, block_size_);
    }

    std::string read_all() const override { return *content_; }

private:
    std::string path_;
    std::shared_ptr<const std::string> content_;
    std::size_t block_size_;
};

}  // anonymous namespace

MemoryFileSystem::MemoryFileSystem(std::size_t block_size)
    : block_size_(block_size == 0 ? DEFAULT_BLOCK_SIZE : block_size) {}

void MemoryFileSystem::write(const std::string& path, std::string content) {
    std::lock_guard<std::mutex> lock(mutex_);
    files_[normalize_relative(path)] = std::make_shared<const std::string>(std::move(content));
}

bool MemoryFileSystem::remove(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    return files_.erase(normalize_relative(path)) > 0;
}

bool MemoryFileSystem::exists(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return files_.count(normalize_relative(path)) > 0;
}

Listing MemoryFileSystem::list_candidate_files(const std::string& root,
                                               const ListOptions& opt) const {
    Listing listing;
    const std::string base = normalize_relative(root);
    const PathFilter filter(opt.path_filters);

    std::lock_guard<std::mutex> lock(mutex_);

    // Корень указывает на файл: возвращаем его без фильтрации
    if (!base.empty() && files_.count(base) > 0) {
        listing.files.push_back(base);
        return listing;
    }

    const std::string prefix = base.empty() ? std::string() : base + "/";
    bool root_exists = base.empty();

    for (const auto& entry : files_) {
        const std::string& path = entry.first;
        if (!prefix.empty() && path.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }
        root_exists = true;

        // Проверяем каждый компонент ниже корня: директории, затем файл
        bool accepted = true;
        std::size_t depth = 0;
        std::size_t start = prefix.size();
        while (accepted) {
            std::size_t slash = path.find('/', start);
            std::string name = path.substr(start, slash == std::string::npos
                                                      ? std::string::npos
                                                      : slash - start);
            ++depth;

            if (!opt.include_hidden && is_hidden_name(name)) {
                accepted = false;
                break;
            }
            if (opt.max_depth && depth > *opt.max_depth) {
                accepted = false;
                break;
            }

            if (slash == std::string::npos) {
                accepted = filter.accepts_file(path, name);
                break;
            }
            if (filter.excludes_dir(path.substr(0, slash), name)) {
                accepted = false;
                break;
            }
            start = slash + 1;
        }

        if (accepted) {
            listing.files.push_back(path);
        }
    }

    if (!root_exists) {
        listing.errors.push_back(base + ": No such file or directory");
    }

    // std::map уже упорядочен по пути
    return listing;
}

std::unique_ptr<FileHandle> MemoryFileSystem::open_file(const std::string& path) const {
    const std::string key = normalize_relative(path);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = files_.find(key);
    if (it == files_.end()) {
        throw IoError(key, "No such file or directory");
    }
    return std::make_unique<MemoryFileHandle>(key, it->second, block_size_);
}

}  // namespace streamgrep::io

// ==============================================================================
// streamgrep/vfs.hpp - Виртуальная файловая система (источник файлов для поиска)
// ==============================================================================
//
// Назначение:
// - ByteStream — последовательное чтение байтов (forward-only)
// - FileHandle — дескриптор файла: поток, полный буфер, размер
// - FileSystem — перечисление файлов-кандидатов и открытие файлов
// - LocalFileSystem — реализация поверх std::filesystem
// - MemoryFileSystem — реализация в памяти (встраивание, тесты)
//
// Пути относительные (от корня файловой системы), разделитель '/'.
// Пустой путь "" означает корень.
//
// ==============================================================================

#ifndef STREAMGREP_VFS_HPP
#define STREAMGREP_VFS_HPP

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace streamgrep::io {

// ----------------------------------------------------------------------------
// IoError - ошибка ввода-вывода
// ----------------------------------------------------------------------------

/// Ошибка чтения/открытия файла
/// Бросается слоем vfs, перехватывается задачей сканирования файла
class IoError : public std::runtime_error {
public:
    IoError(const std::string& path, const std::string& message);

    /// Путь файла, на котором произошла ошибка
    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// ----------------------------------------------------------------------------
// ByteStream - последовательный источник байтов
// ----------------------------------------------------------------------------

/// Последовательное (forward-only) чтение файла блоками
///
/// Использование:
/// @code
///   auto stream = handle->open_stream();
///   std::string block;
///   while (stream->next(block)) {
///       // обработка block
///   }
/// @endcode
class ByteStream {
public:
    virtual ~ByteStream() = default;

    /// Прочитать следующий блок
    /// @param out[out] Блок байтов (заменяет содержимое, не пустой при true)
    /// @return false если поток исчерпан
    /// @throws IoError при ошибке чтения
    virtual bool next(std::string& out) = 0;

protected:
    ByteStream() = default;
};

// ----------------------------------------------------------------------------
// FileHandle - дескриптор файла
// ----------------------------------------------------------------------------

class FileHandle {
public:
    virtual ~FileHandle() = default;

    /// Относительный путь файла
    virtual const std::string& path() const = 0;

    /// Размер файла в байтах (если известен)
    virtual std::optional<std::uint64_t> size() const = 0;

    /// Открыть новый поток чтения с начала файла
    /// @throws IoError если файл не удалось открыть
    virtual std::unique_ptr<ByteStream> open_stream() const = 0;

    /// Прочитать файл целиком (для маленьких файлов)
    /// @throws IoError при ошибке чтения
    virtual std::string read_all() const;

protected:
    FileHandle() = default;
};

// ----------------------------------------------------------------------------
// Перечисление файлов
// ----------------------------------------------------------------------------

/// Параметры перечисления файлов-кандидатов
struct ListOptions {
    /// Включать скрытые файлы и директории (имя начинается с '.')
    /// false: скрытая директория пропускается вместе с поддеревом
    bool include_hidden = false;

    /// Glob-фильтры путей
    /// "!glob" — исключить файл / отсечь поддерево директории
    /// "glob"  — файл должен совпасть хотя бы с одним таким фильтром
    std::vector<std::string> path_filters;

    /// Максимальная глубина обхода (nullopt = без ограничения)
    std::optional<std::size_t> max_depth;
};

/// Результат перечисления
struct Listing {
    /// Отсортированный список относительных путей файлов
    std::vector<std::string> files;

    /// Ошибки обхода (недоступные директории, отсутствующий корень)
    std::vector<std::string> errors;
};

/// Проверить, скрыто ли имя (начинается с '.', кроме "." и "..")
bool is_hidden_name(const std::string& name);

/// Склеить относительные пути: join_path("src", "a.ts") == "src/a.ts"
std::string join_path(const std::string& dir, const std::string& name);

// ----------------------------------------------------------------------------
// FileSystem - коллаборатор поискового движка
// ----------------------------------------------------------------------------

class FileSystem {
public:
    virtual ~FileSystem() = default;

    /// Перечислить файлы под root с учётом фильтров
    /// Ошибки обхода не бросаются, а попадают в Listing::errors
    virtual Listing list_candidate_files(const std::string& root,
                                         const ListOptions& opt) const = 0;

    /// Открыть файл по относительному пути
    /// @throws IoError если файл не существует или недоступен
    virtual std::unique_ptr<FileHandle> open_file(const std::string& path) const = 0;

protected:
    FileSystem() = default;
};

// ----------------------------------------------------------------------------
// LocalFileSystem - реальная файловая система
// ----------------------------------------------------------------------------

/// Файловая система поверх директории на диске
class LocalFileSystem : public FileSystem {
public:
    /// @param root Корневая директория; относительные пути считаются от неё
    explicit LocalFileSystem(std::filesystem::path root);

    Listing list_candidate_files(const std::string& root, const ListOptions& opt) const override;

    std::unique_ptr<FileHandle> open_file(const std::string& path) const override;

    const std::filesystem::path& root() const { return root_; }

    /// Размер блока чтения потока
    static constexpr std::size_t READ_BLOCK_SIZE = 64 * 1024;

private:
    std::filesystem::path resolve(const std::string& relative) const;

    std::filesystem::path root_;
};

// ----------------------------------------------------------------------------
// MemoryFileSystem - файловая система в памяти
// ----------------------------------------------------------------------------

/// Файловая система в памяти
///
/// Потокобезопасна: write/remove можно вызывать параллельно с поиском.
/// Открытый поток держит снимок содержимого на момент open_stream().
class MemoryFileSystem : public FileSystem {
public:
    /// @param block_size Размер блока, которым потоки отдают данные
    explicit MemoryFileSystem(std::size_t block_size = DEFAULT_BLOCK_SIZE);

    /// Записать (создать или заменить) файл
    void write(const std::string& path, std::string content);

    /// Удалить файл; false если файла не было
    bool remove(const std::string& path);

    /// Проверить наличие файла
    bool exists(const std::string& path) const;

    Listing list_candidate_files(const std::string& root, const ListOptions& opt) const override;

    std::unique_ptr<FileHandle> open_file(const std::string& path) const override;

    static constexpr std::size_t DEFAULT_BLOCK_SIZE = 16 * 1024;

private:
    std::size_t block_size_;
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<const std::string>> files_;
};

}  // namespace streamgrep::io

#endif  // STREAMGREP_VFS_HPP

// ==============================================================================
// streamgrep/chunk_reader.hpp - Потоковое чтение файла перекрывающимися чанками
// ==============================================================================
//
// Назначение:
// - Разбить последовательный поток байтов на чанки ограниченного размера
// - Каждый чанк несёт абсолютное смещение в файле и признак последнего
// - Соседние чанки (кроме первой пары) перекрываются на overlap байт
//
// Шаг окна:
// - после первого чанка: chunk_size
// - после каждого следующего: chunk_size - overlap
// - overlap принудительно ограничивается min(overlap, chunk_size - 1),
//   иначе шаг был бы нулевым или отрицательным (бесконечный цикл)
//
// ==============================================================================

#ifndef STREAMGREP_CHUNK_READER_HPP
#define STREAMGREP_CHUNK_READER_HPP

#include "streamgrep/vfs.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace streamgrep::io {

/// Размер чанка по умолчанию: 512 KiB
constexpr std::size_t DEFAULT_CHUNK_SIZE = 512 * 1024;

// ----------------------------------------------------------------------------
// ChunkData
// ----------------------------------------------------------------------------

/// Чанк файла с позицией
struct ChunkData {
    std::string bytes;                ///< Содержимое чанка
    std::uint64_t absolute_offset = 0;  ///< Смещение первого байта в файле
    bool is_last = false;             ///< После этого чанка данных нет
};

// ----------------------------------------------------------------------------
// ChunkReader
// ----------------------------------------------------------------------------

/// Ленивая последовательность перекрывающихся чанков
///
/// Последовательность конечна и не перезапускается: для повторного
/// чтения нужен новый ByteStream.
///
/// Использование:
/// @code
///   auto stream = handle->open_stream();
///   ChunkReader reader(*stream, 512 * 1024, pattern.size() - 1);
///   ChunkData chunk;
///   while (reader.next(chunk)) {
///       // обработка chunk.bytes
///   }
/// @endcode
class ChunkReader {
public:
    /// @param source Источник байтов (должен пережить reader)
    /// @param chunk_size Размер чанка (0 трактуется как 1)
    /// @param overlap Запрошенное перекрытие (ограничивается chunk_size - 1)
    ChunkReader(ByteStream& source, std::size_t chunk_size, std::size_t overlap);

    /// Получить следующий чанк
    /// @param out[out] Чанк (содержимое заменяется)
    /// @return false если данных больше нет
    /// @throws IoError при ошибке чтения источника
    bool next(ChunkData& out);

    std::size_t chunk_size() const { return chunk_size_; }

    /// Фактическое перекрытие после ограничения
    std::size_t overlap() const { return overlap_; }

private:
    /// Дочитать источник, пока в буфере меньше want байт
    void fill(std::size_t want);

    /// Количество непрочитанных байт в буфере
    std::size_t available() const { return buffer_.size() - start_; }

    ByteStream& source_;
    std::size_t chunk_size_;
    std::size_t overlap_;

    std::string buffer_;
    std::size_t start_ = 0;        // Начало непрочитанной части буфера
    std::uint64_t offset_ = 0;     // Абсолютное смещение buffer_[start_]
    std::string block_;            // Последний блок из источника
    bool first_ = true;
    bool eof_ = false;
    bool done_ = false;
};

/// Прочитать поток целиком
/// @throws IoError при ошибке чтения
std::string read_full_stream(ByteStream& source);

/// Размер чанка для шаблона длины pattern_length: не меньше 4 * pattern_length
std::size_t calculate_chunk_size(std::size_t pattern_length,
                                 std::size_t preferred = DEFAULT_CHUNK_SIZE);

}  // namespace streamgrep::io

#endif  // STREAMGREP_CHUNK_READER_HPP

// ==============================================================================
// chunk_reader.cpp - Потоковое чтение файла перекрывающимися чанками
// ==============================================================================

#include "streamgrep/chunk_reader.hpp"

#include <algorithm>

namespace streamgrep::io {

ChunkReader::ChunkReader(ByteStream& source, std::size_t chunk_size, std::size_t overlap)
    : source_(source),
      chunk_size_(chunk_size == 0 ? 1 : chunk_size),
      overlap_(std::min(overlap, chunk_size_ - 1)) {}

void ChunkReader::fill(std::size_t want) {
    while (!eof_ && available() < want) {
        if (!source_.next(block_)) {
            eof_ = true;
            break;
        }
        // Сжимаем буфер, когда прочитанная часть стала больше непрочитанной
        if (start_ > 0 && start_ >= available()) {
            buffer_.erase(0, start_);
            start_ = 0;
        }
        buffer_.append(block_);
    }
}

bool ChunkReader::next(ChunkData& out) {
    if (done_) {
        return false;
    }

    // +1 байт: чтобы знать, остаётся ли что-то после полного чанка
    fill(chunk_size_ + 1);

    if (available() >= chunk_size_) {
        const std::size_t advance = first_ ? chunk_size_ : chunk_size_ - overlap_;

        out.bytes.assign(buffer_, start_, chunk_size_);
        out.absolute_offset = offset_;
        out.is_last = eof_ && available() == advance;

        start_ += advance;
        offset_ += advance;
        first_ = false;
        if (out.is_last) {
            done_ = true;
        }
        return true;
    }

    // Источник исчерпан: остаток уходит последним чанком
    done_ = true;
    if (available() == 0) {
        return false;
    }

    out.bytes.assign(buffer_, start_, std::string::npos);
    out.absolute_offset = offset_;
    out.is_last = true;
    start_ = buffer_.size();
    return true;
}

std::string read_full_stream(ByteStream& source) {
    std::string result;
    std::string block;
    while (source.next(block)) {
        result.append(block);
    }
    return result;
}

std::size_t calculate_chunk_size(std::size_t pattern_length, std::size_t preferred) {
    return std::max(pattern_length * 4, preferred);
}

}  // namespace streamgrep::io

#include "ChunkedByteBuffer.hpp"
#include "ByteUtils.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <stdexcept>

ChunkedByteBuffer::ChunkedByteBuffer(Chunk chunk) {
    push_chunk(std::move(chunk));
}

ChunkedByteBuffer::ChunkedByteBuffer(std::vector<Chunk> chunks) {
    for (auto &chunk : chunks) {
        push_chunk(std::move(chunk));
    }
}

void ChunkedByteBuffer::push_chunk(Chunk &&chunk) {
    size_ += chunk.size();
    chunks_.push_back(std::move(chunk));
}

void ChunkedByteBuffer::append_bytes(const uint8_t *data, size_t len) {
    if (len == 0) {
        return;
    }
    push_chunk(Chunk(data, data + len));
}

// === POSITION ===

BufferPosition ChunkedByteBuffer::begin_position() const {
    BufferPosition pos{0, head_};
    normalize(pos);
    return pos;
}

void ChunkedByteBuffer::normalize(BufferPosition &pos) const {
    // Пустые и дочитанные чанки пропускаем
    while (pos.chunk_index < chunks_.size() && pos.offset >= chunks_[pos.chunk_index].size()) {
        pos.offset -= chunks_[pos.chunk_index].size();
        ++pos.chunk_index;
    }
    if (pos.chunk_index >= chunks_.size()) {
        pos.offset = 0;
    }
}

void ChunkedByteBuffer::advance(BufferPosition &pos, size_t num_bytes, uint8_t *out) const {
    size_t copied = 0;
    while (num_bytes > 0) {
        if (pos.chunk_index >= chunks_.size()) {
            throw std::out_of_range("ChunkedByteBuffer advance past end of buffer");
        }

        const Chunk &chunk = chunks_[pos.chunk_index];
        const size_t take = std::min(num_bytes, chunk.size() - pos.offset);

        if (out != nullptr) {
            boost::asio::buffer_copy(boost::asio::buffer(out + copied, take),
                                     boost::asio::buffer(chunk.data() + pos.offset, take));
            copied += take;
        }

        pos.offset += take;
        num_bytes -= take;
        normalize(pos);
    }
}

// === READ ===

Chunk ChunkedByteBuffer::slice(std::optional<int64_t> start, std::optional<int64_t> end) const {
    const auto len = static_cast<int64_t>(size_);

    int64_t from = start.value_or(0);
    int64_t to = end.value_or(len);
    if (to > len) {
        to = len;
    }

    // Отрицательные индексы считаются с конца
    if (from < 0) {
        from = std::max<int64_t>(from + len, 0);
    }
    if (to < 0) {
        to = std::max<int64_t>(to + len, 0);
    }

    if (from >= to) {
        return {};
    }

    BufferPosition pos = begin_position();
    advance(pos, static_cast<size_t>(from), nullptr);

    Chunk result(static_cast<size_t>(to - from));
    advance(pos, result.size(), result.data());
    return result;
}

int64_t ChunkedByteBuffer::index_of(const Chunk &needle, int64_t from) const {
    return index_of(needle.data(), needle.size(), from);
}

int64_t ChunkedByteBuffer::index_of(const uint8_t *needle, size_t len, int64_t from) const {
    if (from < 0) {
        from = 0;
    }

    if (len == 0) {
        return std::min<int64_t>(from, static_cast<int64_t>(size_));
    }

    const auto start = static_cast<uint64_t>(from);
    if (start >= size_ || len > size_ - start) {
        return -1;
    }

    BufferPosition pos = begin_position();
    advance(pos, static_cast<size_t>(start), nullptr);

    // Ищем первый байт, затем сверяем остаток побайтно (наивно, O(n*m))
    size_t chunk_index = pos.chunk_index;
    size_t offset = pos.offset;

    while (chunk_index < chunks_.size()) {
        const Chunk &chunk = chunks_[chunk_index];
        auto it = std::find(chunk.begin() + static_cast<std::ptrdiff_t>(offset), chunk.end(), needle[0]);
        if (it == chunk.end()) {
            ++chunk_index;
            offset = 0;
            continue;
        }

        const auto found = static_cast<size_t>(it - chunk.begin());
        if (!matches_at(chunk_index, found, needle, len)) {
            offset = found + 1;
            continue;
        }

        size_t index = found;
        for (size_t i = 0; i < chunk_index; ++i) {
            index += chunks_[i].size();
        }
        return static_cast<int64_t>(index - head_);
    }

    return -1;
}

bool ChunkedByteBuffer::matches_at(size_t chunk_index, size_t offset, const uint8_t *needle, size_t len) const {
    for (size_t i = 1; i < len; ++i) {
        ++offset;
        while (offset >= chunks_[chunk_index].size()) {
            offset -= chunks_[chunk_index].size();
            ++chunk_index;
            if (chunk_index >= chunks_.size()) {
                return false;
            }
        }
        if (chunks_[chunk_index][offset] != needle[i]) {
            return false;
        }
    }
    return true;
}

std::vector<boost::asio::const_buffer> ChunkedByteBuffer::buffers() const {
    std::vector<boost::asio::const_buffer> views;
    views.reserve(chunks_.size());

    for (size_t i = 0; i < chunks_.size(); ++i) {
        const Chunk &chunk = chunks_[i];
        const size_t from = (i == 0) ? head_ : 0;
        if (from >= chunk.size()) {
            continue;
        }
        views.emplace_back(chunk.data() + from, chunk.size() - from);
    }
    return views;
}

// === CONSUME ===

size_t ChunkedByteBuffer::check_consume_length(int64_t x, const char *op) const {
    if (x < 0) {
        Logger::get()->error("[ChunkedByteBuffer] {}: negative length {}", op, x);
        throw std::invalid_argument(fmt::format("ByteBuffer#{}(): length cannot be less than 0.", op));
    }
    if (static_cast<uint64_t>(x) > size_) {
        Logger::get()->error("[ChunkedByteBuffer] {}: length {} exceeds buffer length {}", op, x, size_);
        throw std::invalid_argument(
                fmt::format("ByteBuffer#{}(): length cannot be greater than current length of buffer.", op));
    }
    return static_cast<size_t>(x);
}

void ChunkedByteBuffer::commit(const BufferPosition &pos, size_t consumed) {
    for (size_t i = 0; i < pos.chunk_index; ++i) {
        chunks_.pop_front();
    }
    head_ = pos.offset;
    size_ -= consumed;
}

Chunk ChunkedByteBuffer::pull(int64_t x) {
    const size_t count = check_consume_length(x, "pull");

    Chunk result(count);
    if (count == 0) {
        return result;
    }

    BufferPosition pos = begin_position();
    advance(pos, count, result.data());

    const size_t released = pos.chunk_index;
    commit(pos, count);

    auto log = Logger::get();
    if (log->should_log(spdlog::level::debug)) {
        log->debug("[ChunkedByteBuffer::pull] {} bytes, {} chunks released, {} left: {}",
                   count, released, size_, ByteUtils::to_hex(result));
    }
    return result;
}

void ChunkedByteBuffer::skip(int64_t x) {
    const size_t count = check_consume_length(x, "skip");
    if (count == 0) {
        return;
    }

    BufferPosition pos = begin_position();
    advance(pos, count, nullptr);
    commit(pos, count);

    Logger::get()->debug("[ChunkedByteBuffer::skip] {} bytes, {} left", count, size_);
}

std::vector<Chunk> ChunkedByteBuffer::pull_chunks(int64_t x) {
    const size_t count = check_consume_length(x, "pull_chunks");

    std::vector<Chunk> result;
    if (count == 0) {
        return result;
    }

    BufferPosition pos = begin_position();
    advance(pos, count, nullptr);

    // Целиком прочитанные чанки отдаём без копирования
    for (size_t i = 0; i < pos.chunk_index; ++i) {
        Chunk &chunk = chunks_[i];
        const size_t from = (i == 0) ? head_ : 0;
        if (from >= chunk.size()) {
            continue;
        }
        if (from == 0) {
            result.push_back(std::move(chunk));
        } else {
            result.emplace_back(chunk.begin() + static_cast<std::ptrdiff_t>(from), chunk.end());
        }
    }

    // Хвост последнего чанка остаётся в буфере, копируем только прочитанную часть
    if (pos.offset > 0) {
        const Chunk &last = chunks_[pos.chunk_index];
        const size_t from = (pos.chunk_index == 0) ? head_ : 0;
        result.emplace_back(last.begin() + static_cast<std::ptrdiff_t>(from),
                            last.begin() + static_cast<std::ptrdiff_t>(pos.offset));
    }

    commit(pos, count);

    Logger::get()->debug("[ChunkedByteBuffer::pull_chunks] {} bytes as {} chunks, {} left",
                         count, result.size(), size_);
    return result;
}

void ChunkedByteBuffer::clear() {
    chunks_.clear();
    head_ = 0;
    size_ = 0;
}

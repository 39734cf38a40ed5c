#pragma once

#include <boost/asio/buffer.hpp>

#include <cstdint>
#include <deque>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

using Chunk = std::vector<uint8_t>;

// Позиция внутри буфера: номер чанка + смещение в нём.
// Нормализована: offset < размера чанка, либо chunk_index == количеству чанков (конец).
struct BufferPosition {
    size_t chunk_index = 0;
    size_t offset = 0;
};

/**
 * Буфер байт поверх последовательности чанков, пришедших из потока.
 *
 * Чанки не копируются и не склеиваются при append(). Копия делается только
 * когда её явно просят: slice() / pull().
 * head_ — смещение первого непрочитанного байта в первом чанке.
 *
 * Однопоточный, без блокировок.
 */
class ChunkedByteBuffer {
public:
    ChunkedByteBuffer() = default;
    explicit ChunkedByteBuffer(Chunk chunk);
    explicit ChunkedByteBuffer(std::vector<Chunk> chunks);

    ChunkedByteBuffer(const ChunkedByteBuffer &) = default;
    ChunkedByteBuffer &operator=(const ChunkedByteBuffer &) = default;

    ChunkedByteBuffer(ChunkedByteBuffer &&other) noexcept
            : chunks_(std::move(other.chunks_)),
              head_(std::exchange(other.head_, 0)),
              size_(std::exchange(other.size_, 0)) {
        other.chunks_.clear();
    }

    ChunkedByteBuffer &operator=(ChunkedByteBuffer &&other) noexcept {
        if (this != &other) {
            chunks_ = std::move(other.chunks_);
            head_ = std::exchange(other.head_, 0);
            size_ = std::exchange(other.size_, 0);
            other.chunks_.clear();
        }
        return *this;
    }

    // === APPEND ===
    // Порядок аргументов сохраняется. Rvalue-чанки забираются без копирования.
    // Только сами чанки: иначе append(16) ушёл бы в vector(size_type)
    template<typename... Chunks>
        requires (std::is_same_v<std::remove_cvref_t<Chunks>, Chunk> && ...)
    void append(Chunks &&... chunks) {
        (push_chunk(Chunk(std::forward<Chunks>(chunks))), ...);
    }

    // Для продюсера, который переиспользует свой буфер чтения: копирует диапазон в новый чанк
    void append_bytes(const uint8_t *data, size_t len);

    // === READ (non-consuming) ===
    Chunk slice(std::optional<int64_t> start = std::nullopt,
                std::optional<int64_t> end = std::nullopt) const;

    int64_t index_of(const Chunk &needle, int64_t from = 0) const;
    int64_t index_of(const uint8_t *needle, size_t len, int64_t from = 0) const;

    // Представления непрочитанных байт для Boost.Asio (scatter/gather).
    // Валидны до следующего изменяющего вызова.
    std::vector<boost::asio::const_buffer> buffers() const;

    // === CONSUME ===
    Chunk pull(int64_t x);
    void skip(int64_t x);
    std::vector<Chunk> pull_chunks(int64_t x);
    void clear();

    size_t length() const { return size_; }
    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }
    size_t chunk_count() const { return chunks_.size(); }

private:
    void push_chunk(Chunk &&chunk);

    BufferPosition begin_position() const;
    void normalize(BufferPosition &pos) const;

    // Проходит num_bytes логических байт от pos, копируя их в out (если не nullptr).
    void advance(BufferPosition &pos, size_t num_bytes, uint8_t *out) const;

    bool matches_at(size_t chunk_index, size_t offset, const uint8_t *needle, size_t len) const;

    size_t check_consume_length(int64_t x, const char *op) const;
    void commit(const BufferPosition &pos, size_t consumed);

    std::deque<Chunk> chunks_;
    size_t head_ = 0;
    size_t size_ = 0;
};

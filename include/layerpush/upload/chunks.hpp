#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>

namespace layerpush {

// One window of an object: part numbers are 1-based like S3 multipart parts
struct Chunk {
    int part_number = 0;
    int64_t offset = 0;
    int64_t size = 0;

    bool operator==(const Chunk& other) const {
        return part_number == other.part_number && offset == other.offset && size == other.size;
    }
};

/// Splits [0, total_size) into consecutive windows of chunk_size bytes.
///
/// A plan is a value: it is computed from its two inputs on every iteration
/// and may be iterated any number of times. When chunk_size <= 0 or
/// chunk_size >= total_size the plan has exactly one chunk covering the whole
/// object (zero-length when total_size == 0), meaning "single PUT".
class ChunkPlan {
public:
    ChunkPlan(int64_t total_size, int64_t chunk_size);

    class iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = Chunk;
        using difference_type = std::ptrdiff_t;
        using pointer = const Chunk*;
        using reference = const Chunk&;

        iterator() = default;
        iterator(const ChunkPlan* plan, int part_number);

        reference operator*() const { return chunk_; }
        pointer operator->() const { return &chunk_; }

        iterator& operator++();
        iterator operator++(int) {
            iterator prev = *this;
            ++*this;
            return prev;
        }

        bool operator==(const iterator& other) const { return chunk_.part_number == other.chunk_.part_number; }
        bool operator!=(const iterator& other) const { return !(*this == other); }

    private:
        void load();

        const ChunkPlan* plan_ = nullptr;
        Chunk chunk_;
    };

    iterator begin() const { return iterator(this, 1); }
    iterator end() const { return iterator(this, count_ + 1); }

    /// Number of chunks, always >= 1.
    int count() const { return count_; }

    /// True when the plan is a single whole-object chunk.
    bool single() const { return count_ == 1; }

    int64_t total_size() const { return total_size_; }
    int64_t chunk_size() const { return chunk_size_; }

    /// The chunk with the given 1-based part number. part_number must be in [1, count()].
    Chunk at(int part_number) const;

private:
    int64_t total_size_;
    int64_t chunk_size_;  // effective: equals total_size_ for single-chunk plans
    int count_;
};

inline ChunkPlan chunks(int64_t total_size, int64_t chunk_size) {
    return ChunkPlan(total_size, chunk_size);
}

} // namespace layerpush

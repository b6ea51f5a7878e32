#include "layerpush/upload/chunks.hpp"

#include <limits>
#include <stdexcept>
#include <string>

namespace layerpush {

ChunkPlan::ChunkPlan(int64_t total_size, int64_t chunk_size)
    : total_size_(total_size < 0 ? 0 : total_size) {
    if (chunk_size <= 0 || chunk_size >= total_size_) {
        chunk_size_ = total_size_;
        count_ = 1;
        return;
    }

    chunk_size_ = chunk_size;
    int64_t n = total_size_ / chunk_size_ + (total_size_ % chunk_size_ != 0 ? 1 : 0);
    if (n > std::numeric_limits<int>::max() - 1) {
        throw std::length_error("chunk plan has too many parts: " + std::to_string(n));
    }
    count_ = static_cast<int>(n);
}

Chunk ChunkPlan::at(int part_number) const {
    Chunk c;
    c.part_number = part_number;
    c.offset = static_cast<int64_t>(part_number - 1) * chunk_size_;
    c.size = (part_number == count_) ? total_size_ - c.offset : chunk_size_;
    return c;
}

ChunkPlan::iterator::iterator(const ChunkPlan* plan, int part_number) : plan_(plan) {
    chunk_.part_number = part_number;
    load();
}

ChunkPlan::iterator& ChunkPlan::iterator::operator++() {
    ++chunk_.part_number;
    load();
    return *this;
}

void ChunkPlan::iterator::load() {
    if (!plan_ || chunk_.part_number < 1 || chunk_.part_number > plan_->count_) {
        chunk_.offset = 0;
        chunk_.size = 0;
        return;
    }
    chunk_ = plan_->at(chunk_.part_number);
}

} // namespace layerpush

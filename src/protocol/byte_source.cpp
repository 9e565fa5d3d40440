#include "byte_source.hpp"

#include <algorithm>
#include <cstring>

namespace han::protocol {

MemoryByteSource::MemoryByteSource(const uint8_t *data, std::size_t size, std::size_t maxChunk)
    : data_(data), size_(size), maxChunk_(maxChunk) {}

ReadResult MemoryByteSource::read(uint8_t *buffer, std::size_t capacity) {
    ReadResult result;
    if (failArmed_ && position_ >= failAt_) {
        result.status = ReadStatus::IoError;
        return result;
    }
    if (position_ >= size_) {
        result.status = ReadStatus::EndOfStream;
        return result;
    }
    if (capacity == 0) {
        return result;
    }

    std::size_t count = std::min(capacity, size_ - position_);
    if (maxChunk_ > 0) {
        count = std::min(count, maxChunk_);
    }
    if (failArmed_) {
        count = std::min(count, failAt_ - position_);
    }
    std::memcpy(buffer, data_ + position_, count);
    position_ += count;
    result.count = count;
    return result;
}

// Reads at or beyond offset report IoError, as a dropped link would.
void MemoryByteSource::failAt(std::size_t offset) {
    failAt_ = offset;
    failArmed_ = true;
}

std::size_t MemoryByteSource::position() const {
    return position_;
}

bool MemoryByteSource::atEnd() const {
    return position_ >= size_;
}

}  // namespace han::protocol

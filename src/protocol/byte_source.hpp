#pragma once

#include <cstddef>
#include <cstdint>

namespace han::protocol {

enum class ReadStatus {
    Ok,
    EndOfStream,
    IoError,
};

struct ReadResult {
    ReadStatus status = ReadStatus::Ok;
    std::size_t count = 0;
};

// Pull side of a transport. read() returns at least one byte with Ok, may
// block until bytes arrive, and reports EndOfStream or IoError otherwise.
// Deadlines are the source's business: a timeout is an IoError.
class ByteSource {
public:
    virtual ~ByteSource() = default;

    virtual ReadResult read(uint8_t *buffer, std::size_t capacity) = 0;
};

// Serves a caller-owned buffer in chunks of at most maxChunk bytes.
class MemoryByteSource : public ByteSource {
public:
    MemoryByteSource(const uint8_t *data, std::size_t size, std::size_t maxChunk = 0);

    ReadResult read(uint8_t *buffer, std::size_t capacity) override;

    void failAt(std::size_t offset);
    std::size_t position() const;
    bool atEnd() const;

private:
    const uint8_t *data_ = nullptr;
    std::size_t size_ = 0;
    std::size_t maxChunk_ = 0;
    std::size_t position_ = 0;
    std::size_t failAt_ = 0;
    bool failArmed_ = false;
};

}  // namespace han::protocol

#pragma once

#include <cstddef>

// Fixed capacities of the decode pipeline. They size static buffers and are
// part of the library contract; none of them can be changed at runtime.
namespace han {

// De-stuffed bytes between two flags. The HDLC length field tops out at 2047.
constexpr std::size_t kMaxFrameBytes = 2048;

// format(2) + dest(1) + src(1) + control(1) + HCS(2) + FCS(2)
constexpr std::size_t kMinFrameBytes = 9;

// Composite levels, counting the notification body as level 1.
constexpr std::size_t kMaxNestingDepth = 8;

constexpr std::size_t kMaxEntries = 32;
constexpr std::size_t kMaxValueNodes = 128;
constexpr std::size_t kMaxValueBytes = 512;

// Bytes pulled from a ByteSource per read.
constexpr std::size_t kReadChunkBytes = 64;

}  // namespace han

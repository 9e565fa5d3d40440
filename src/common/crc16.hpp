#pragma once

#include <cstddef>
#include <cstdint>

namespace han::common {

// CRC-16/X.25 as used by the HDLC header (HCS) and frame (FCS) check sequences.
uint16_t crc16_x25(const uint8_t *data, std::size_t size);

}  // namespace han::common

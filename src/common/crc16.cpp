#include "crc16.hpp"

namespace han::common {

namespace {

constexpr uint16_t kPoly = 0x8408;  // 0x1021 bit-reversed
constexpr uint16_t kInit = 0xFFFF;
constexpr uint16_t kXorOut = 0xFFFF;

}  // namespace

uint16_t crc16_x25(const uint8_t *data, std::size_t size) {
    uint16_t crc = kInit;
    for (std::size_t idx = 0; idx < size; ++idx) {
        crc ^= data[idx];
        for (int i = 0; i < 8; ++i) {
            const bool carry = (crc & 0x0001) != 0;
            crc >>= 1;
            if (carry) {
                crc ^= kPoly;
            }
        }
    }
    return static_cast<uint16_t>(crc ^ kXorOut);
}

}  // namespace han::common

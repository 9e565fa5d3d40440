#pragma once

#include "common/decode_error.hpp"

#include <QtCore/QByteArray>

#include <cstddef>
#include <cstdint>
#include <optional>

namespace han::protocol {

constexpr uint8_t kFrameType3 = 0x0A;
constexpr uint8_t kSegmentationBit = 0x08;
constexpr uint16_t kFrameLengthMask = 0x07FF;
constexpr std::size_t kMaxAddressBytes = 4;

struct HdlcAddress {
    uint32_t value = 0;
    uint8_t size = 0;  // encoded bytes, 1..4
};

struct FrameHeader {
    uint8_t type = 0;
    bool segmented = false;
    uint16_t length = 0;
    HdlcAddress destination;
    HdlcAddress source;
    uint8_t control = 0;
    uint16_t hcs = 0;
    uint16_t fcs = 0;
};

struct ValidatedFrame {
    FrameHeader header;
    const uint8_t *payload = nullptr;  // points into the validated buffer
    std::size_t payloadSize = 0;
};

// Checks the header layout and both check sequences of one de-stuffed frame
// (the bytes between the flags).
std::optional<ValidatedFrame> validate_frame(const uint8_t *data, std::size_t size, DecodeError *error = nullptr);

// De-stuffed frame content: header, HCS, information, FCS. No flags.
QByteArray build_frame_content(const HdlcAddress &destination, const HdlcAddress &source, uint8_t control,
                               const QByteArray &information);
// Wraps content in flags and escapes flag and escape bytes inside it.
QByteArray stuff_frame(const QByteArray &content);
QByteArray encode_frame(const HdlcAddress &destination, const HdlcAddress &source, uint8_t control,
                        const QByteArray &information);

}  // namespace han::protocol

#include "hdlc_frame.hpp"

#include "common/crc16.hpp"
#include "common/limits.hpp"
#include "frame_synchronizer.hpp"

namespace han::protocol {

namespace {

constexpr std::size_t kFormatBytes = 2;
constexpr std::size_t kCheckBytes = 2;

void set_error(DecodeError code, DecodeError *outCode) {
    if (outCode) {
        *outCode = code;
    }
}

// Check sequences travel least significant byte first.
uint16_t read_check(const uint8_t *data) {
    return static_cast<uint16_t>(data[0] | (data[1] << 8));
}

void append_check(QByteArray &out, uint16_t check) {
    out.append(char(check & 0xFF));
    out.append(char((check >> 8) & 0xFF));
}

// Address bytes carry 7 bits each; the low bit marks the last byte.
std::optional<HdlcAddress> read_address(const uint8_t *data, std::size_t available) {
    HdlcAddress address;
    for (std::size_t i = 0; i < kMaxAddressBytes && i < available; ++i) {
        address.value = (address.value << 7) | (data[i] >> 1);
        if (data[i] & 0x01) {
            address.size = static_cast<uint8_t>(i + 1);
            return address;
        }
    }
    return std::nullopt;
}

void append_address(QByteArray &out, const HdlcAddress &address) {
    const int size = address.size == 0 ? 1 : address.size;
    for (int i = size - 1; i >= 0; --i) {
        uint8_t byte = static_cast<uint8_t>(((address.value >> (i * 7)) & 0x7F) << 1);
        if (i == 0) {
            byte |= 0x01;
        }
        out.append(char(byte));
    }
}

}  // namespace

std::optional<ValidatedFrame> validate_frame(const uint8_t *data, std::size_t size, DecodeError *error) {
    set_error(DecodeError::None, error);

    if (size < kMinFrameBytes) {
        set_error(DecodeError::LengthMismatch, error);
        return std::nullopt;
    }

    ValidatedFrame frame;
    FrameHeader &header = frame.header;
    header.type = static_cast<uint8_t>(data[0] >> 4);
    header.segmented = (data[0] & kSegmentationBit) != 0;
    header.length = static_cast<uint16_t>(((data[0] << 8) | data[1]) & kFrameLengthMask);
    if (header.type != kFrameType3) {
        set_error(DecodeError::InvalidFormat, error);
        return std::nullopt;
    }
    if (header.length != size) {
        set_error(DecodeError::LengthMismatch, error);
        return std::nullopt;
    }

    // Everything up to the FCS is available to the header fields.
    const std::size_t limit = size - kCheckBytes;
    std::size_t offset = kFormatBytes;
    const auto destination = read_address(data + offset, limit - offset);
    if (!destination) {
        set_error(DecodeError::InvalidFormat, error);
        return std::nullopt;
    }
    header.destination = *destination;
    offset += destination->size;

    const auto source = read_address(data + offset, limit - offset);
    if (!source) {
        set_error(DecodeError::InvalidFormat, error);
        return std::nullopt;
    }
    header.source = *source;
    offset += source->size;

    if (offset + 1 + kCheckBytes > limit) {
        set_error(DecodeError::LengthMismatch, error);
        return std::nullopt;
    }
    header.control = data[offset++];

    header.hcs = read_check(data + offset);
    const uint16_t hcsCalculated = common::crc16_x25(data, offset);
    if (hcsCalculated != header.hcs) {
        set_error(DecodeError::HeaderChecksum, error);
        return std::nullopt;
    }
    offset += kCheckBytes;

    header.fcs = read_check(data + limit);
    const uint16_t fcsCalculated = common::crc16_x25(data, limit);
    if (fcsCalculated != header.fcs) {
        set_error(DecodeError::FrameChecksum, error);
        return std::nullopt;
    }

    if (header.segmented) {
        set_error(DecodeError::Unsupported, error);
        return std::nullopt;
    }

    frame.payload = data + offset;
    frame.payloadSize = limit - offset;
    return frame;
}

QByteArray build_frame_content(const HdlcAddress &destination, const HdlcAddress &source, uint8_t control,
                               const QByteArray &information) {
    QByteArray content;
    content.append(char(0));
    content.append(char(0));
    append_address(content, destination);
    append_address(content, source);
    content.append(char(control));

    const int frameSize = content.size() + int(kCheckBytes) + information.size() + int(kCheckBytes);
    content[0] = char((kFrameType3 << 4) | ((frameSize >> 8) & 0x07));
    content[1] = char(frameSize & 0xFF);

    const auto *ptr = reinterpret_cast<const uint8_t *>(content.constData());
    append_check(content, common::crc16_x25(ptr, static_cast<std::size_t>(content.size())));
    content.append(information);
    ptr = reinterpret_cast<const uint8_t *>(content.constData());
    append_check(content, common::crc16_x25(ptr, static_cast<std::size_t>(content.size())));
    return content;
}

QByteArray stuff_frame(const QByteArray &content) {
    QByteArray frame;
    frame.reserve(content.size() + 2);
    frame.append(char(kFlag));
    for (const char ch : content) {
        const auto byte = static_cast<uint8_t>(ch);
        if (byte == kFlag || byte == kEscape) {
            frame.append(char(kEscape));
            frame.append(char(byte ^ kEscapeXor));
        } else {
            frame.append(ch);
        }
    }
    frame.append(char(kFlag));
    return frame;
}

QByteArray encode_frame(const HdlcAddress &destination, const HdlcAddress &source, uint8_t control,
                        const QByteArray &information) {
    return stuff_frame(build_frame_content(destination, source, control, information));
}

}  // namespace han::protocol

#include "apdu_decoder.hpp"

#include "han/telegram.hpp"

#include <cstring>

namespace han::cosem {

namespace {

constexpr uint8_t kLengthOneByte = 0x81;
constexpr uint8_t kLengthTwoBytes = 0x82;
constexpr std::size_t kScalerUnitElements = 2;

void set_error(DecodeError code, DecodeError *outCode) {
    if (outCode) {
        *outCode = code;
    }
}

// Bytes following the tag for fixed-size types, 0 for everything else.
std::size_t fixed_width(uint8_t tag) {
    switch (static_cast<DataType>(tag)) {
        case DataType::Boolean:
        case DataType::Integer:
        case DataType::Unsigned:
        case DataType::Enum:
            return 1;
        case DataType::Long:
        case DataType::LongUnsigned:
            return 2;
        case DataType::DoubleLong:
        case DataType::DoubleLongUnsigned:
        case DataType::Float32:
            return 4;
        case DataType::Long64:
        case DataType::Long64Unsigned:
        case DataType::Float64:
            return 8;
        case DataType::DateTime:
            return kDateTimeBytes;
        default:
            return 0;
    }
}

bool is_string(uint8_t tag) {
    const auto type = static_cast<DataType>(tag);
    return type == DataType::OctetString || type == DataType::VisibleString || type == DataType::Utf8String;
}

bool is_composite(uint8_t tag) {
    const auto type = static_cast<DataType>(tag);
    return type == DataType::Array || type == DataType::Structure;
}

uint64_t read_be(const uint8_t *bytes, std::size_t width) {
    uint64_t value = 0;
    for (std::size_t i = 0; i < width; ++i) {
        value = (value << 8) | bytes[i];
    }
    return value;
}

int64_t sign_extend(uint64_t value, std::size_t width) {
    const unsigned bits = static_cast<unsigned>(width * 8);
    if (bits >= 64) {
        return static_cast<int64_t>(value);
    }
    const uint64_t signBit = uint64_t{1} << (bits - 1);
    return static_cast<int64_t>((value ^ signBit) - signBit);
}

Value primitive_value(uint8_t tag, const uint8_t *bytes, std::size_t width) {
    const uint64_t raw = read_be(bytes, width);
    const auto w = static_cast<uint8_t>(width);
    switch (static_cast<DataType>(tag)) {
        case DataType::Boolean:
            return raw != 0;
        case DataType::Enum:
            return Enumerated{static_cast<uint8_t>(raw)};
        case DataType::Integer:
        case DataType::Long:
        case DataType::DoubleLong:
        case DataType::Long64:
            return SignedInt{sign_extend(raw, width), w};
        case DataType::Float32: {
            const auto bits = static_cast<uint32_t>(raw);
            float f = 0.0f;
            std::memcpy(&f, &bits, sizeof(f));
            return Float{static_cast<double>(f), w};
        }
        case DataType::Float64: {
            double d = 0.0;
            std::memcpy(&d, &raw, sizeof(d));
            return Float{d, w};
        }
        default:
            return UnsignedInt{raw, w};
    }
}

}  // namespace

ApduDecoder::ApduDecoder(const uint8_t *data, std::size_t size) : data_(data), size_(size) {}

bool ApduDecoder::decodeNotification(TelegramBuilder &builder, DecodeError *error) {
    set_error(DecodeError::None, error);
    pos_ = 0;

    if (size_ >= 3 && data_[0] == kLlcDestination && (data_[1] == kLlcCommand || data_[1] == kLlcResponse) &&
        data_[2] == 0x00) {
        pos_ = 3;
    }

    uint8_t tag = 0;
    if (!readByte(tag)) {
        set_error(DecodeError::Truncated, error);
        return false;
    }
    if (tag != kDataNotification) {
        set_error(DecodeError::UnexpectedApdu, error);
        return false;
    }

    const uint8_t *invoke = nullptr;
    if (!readBytes(kInvokeIdBytes, invoke)) {
        set_error(DecodeError::Truncated, error);
        return false;
    }
    builder.setInvokeId(static_cast<uint32_t>(read_be(invoke, kInvokeIdBytes)));

    if (!readByte(tag)) {
        set_error(DecodeError::Truncated, error);
        return false;
    }
    switch (static_cast<DataType>(tag)) {
        case DataType::Null:
            builder.setTimestamp(std::nullopt);
            break;
        case DataType::OctetString:
        case DataType::DateTime: {
            std::size_t length = kDateTimeBytes;
            if (tag == static_cast<uint8_t>(DataType::OctetString)) {
                const DecodeError lengthError = readLength(length);
                if (lengthError != DecodeError::None) {
                    set_error(lengthError, error);
                    return false;
                }
                if (length != kDateTimeBytes) {
                    set_error(DecodeError::InvalidDateTime, error);
                    return false;
                }
            }
            const uint8_t *bytes = nullptr;
            if (!readBytes(length, bytes)) {
                set_error(DecodeError::Truncated, error);
                return false;
            }
            DecodeError dateError = DecodeError::None;
            const auto timestamp = decode_date_time(bytes, length, &dateError);
            if (!timestamp) {
                set_error(dateError, error);
                return false;
            }
            builder.setTimestamp(timestamp);
            break;
        }
        default:
            set_error(DecodeError::UnexpectedTag, error);
            return false;
    }

    if (!readByte(tag)) {
        set_error(DecodeError::Truncated, error);
        return false;
    }
    if (!is_composite(tag)) {
        set_error(DecodeError::UnexpectedTag, error);
        return false;
    }
    std::size_t count = 0;
    const DecodeError countError = readLength(count);
    if (countError != DecodeError::None) {
        set_error(countError, error);
        return false;
    }
    builder.setDeclaredEntryCount(count);

    for (std::size_t i = 0; i < count; ++i) {
        if (builder.full()) {
            if (skipValue() != DecodeError::None) {
                break;
            }
            builder.dropEntry();
            continue;
        }
        EntrySlot slot;
        const bool canContinue = decodeEntry(builder.store(), slot, 1);
        builder.addEntry(slot);
        if (!canContinue) {
            break;
        }
    }
    return true;
}

std::optional<Value> ApduDecoder::decodeValue(ValueStore &store, DecodeError *error) {
    Value value;
    const ValueStore::Mark mark = store.mark();
    const DecodeError result = decodeInto(store, value, 0);
    set_error(result, error);
    if (result != DecodeError::None) {
        store.rewind(mark);
        return std::nullopt;
    }
    return value;
}

DecodeError ApduDecoder::skipValue() {
    std::size_t pending = 1;
    while (pending > 0) {
        --pending;
        uint8_t tag = 0;
        if (!readByte(tag)) {
            return DecodeError::Truncated;
        }
        if (static_cast<DataType>(tag) == DataType::Null) {
            continue;
        }
        if (is_composite(tag)) {
            std::size_t count = 0;
            const DecodeError lengthError = readLength(count);
            if (lengthError != DecodeError::None) {
                return lengthError;
            }
            if (count > remaining()) {
                return DecodeError::Truncated;
            }
            pending += count;
            continue;
        }

        std::size_t width = fixed_width(tag);
        if (width == 0) {
            if (!is_string(tag)) {
                return DecodeError::UnexpectedTag;
            }
            const DecodeError lengthError = readLength(width);
            if (lengthError != DecodeError::None) {
                return lengthError;
            }
        }
        const uint8_t *ignored = nullptr;
        if (!readBytes(width, ignored)) {
            return DecodeError::Truncated;
        }
    }
    return DecodeError::None;
}

std::size_t ApduDecoder::position() const {
    return pos_;
}

std::size_t ApduDecoder::remaining() const {
    return size_ - pos_;
}

bool ApduDecoder::readByte(uint8_t &out) {
    if (pos_ >= size_) {
        return false;
    }
    out = data_[pos_++];
    return true;
}

bool ApduDecoder::readBytes(std::size_t count, const uint8_t *&out) {
    if (count > remaining()) {
        return false;
    }
    out = data_ + pos_;
    pos_ += count;
    return true;
}

// A-XDR length: one byte below 0x80, otherwise 0x81/0x82 followed by one or
// two length bytes.
DecodeError ApduDecoder::readLength(std::size_t &out) {
    uint8_t first = 0;
    if (!readByte(first)) {
        return DecodeError::Truncated;
    }
    if (first < 0x80) {
        out = first;
        return DecodeError::None;
    }
    std::size_t width = 0;
    if (first == kLengthOneByte) {
        width = 1;
    } else if (first == kLengthTwoBytes) {
        width = 2;
    } else {
        return DecodeError::UnexpectedTag;
    }
    const uint8_t *bytes = nullptr;
    if (!readBytes(width, bytes)) {
        return DecodeError::Truncated;
    }
    out = static_cast<std::size_t>(read_be(bytes, width));
    return DecodeError::None;
}

DecodeError ApduDecoder::decodeInto(ValueStore &store, Value &out, std::size_t depth) {
    uint8_t tag = 0;
    if (!readByte(tag)) {
        return DecodeError::Truncated;
    }

    if (static_cast<DataType>(tag) == DataType::Null) {
        out = Null{};
        return DecodeError::None;
    }

    if (is_composite(tag)) {
        if (depth >= kMaxNestingDepth) {
            return DecodeError::StructureTooDeep;
        }
        std::size_t count = 0;
        const DecodeError lengthError = readLength(count);
        if (lengthError != DecodeError::None) {
            return lengthError;
        }
        // Every element takes at least its tag byte.
        if (count > remaining()) {
            return DecodeError::Truncated;
        }
        const auto children = store.allocateNodes(count);
        if (!children) {
            return DecodeError::CapacityExceeded;
        }
        for (std::size_t i = 0; i < count; ++i) {
            const DecodeError childError = decodeInto(store, store.node(children->first + i), depth + 1);
            if (childError != DecodeError::None) {
                return childError;
            }
        }
        if (static_cast<DataType>(tag) == DataType::Array) {
            out = Array{*children};
        } else {
            out = Structure{*children};
        }
        return DecodeError::None;
    }

    if (is_string(tag)) {
        std::size_t length = 0;
        const DecodeError lengthError = readLength(length);
        if (lengthError != DecodeError::None) {
            return lengthError;
        }
        const uint8_t *bytes = nullptr;
        if (!readBytes(length, bytes)) {
            return DecodeError::Truncated;
        }
        const auto range = store.storeBytes(bytes, length);
        if (!range) {
            return DecodeError::CapacityExceeded;
        }
        if (static_cast<DataType>(tag) == DataType::OctetString) {
            out = OctetString{*range};
        } else {
            out = VisibleString{*range};
        }
        return DecodeError::None;
    }

    const std::size_t width = fixed_width(tag);
    if (width == 0) {
        return DecodeError::UnexpectedTag;
    }
    const uint8_t *bytes = nullptr;
    if (!readBytes(width, bytes)) {
        return DecodeError::Truncated;
    }
    if (static_cast<DataType>(tag) == DataType::DateTime) {
        DecodeError dateError = DecodeError::None;
        const auto timestamp = decode_date_time(bytes, width, &dateError);
        if (!timestamp) {
            return dateError;
        }
        out = DateTime{*timestamp};
        return DecodeError::None;
    }
    out = primitive_value(tag, bytes, width);
    return DecodeError::None;
}

// Scaler-unit pair: structure { integer scaler, enum unit }.
DecodeError ApduDecoder::decodeScalerUnit(EntrySlot &slot) {
    uint8_t tag = 0;
    if (!readByte(tag)) {
        return DecodeError::Truncated;
    }
    if (static_cast<DataType>(tag) != DataType::Structure) {
        return DecodeError::MalformedEntry;
    }
    std::size_t count = 0;
    const DecodeError lengthError = readLength(count);
    if (lengthError != DecodeError::None) {
        return lengthError;
    }
    if (count != kScalerUnitElements) {
        return DecodeError::MalformedEntry;
    }

    const uint8_t *bytes = nullptr;
    if (!readByte(tag)) {
        return DecodeError::Truncated;
    }
    if (static_cast<DataType>(tag) != DataType::Integer) {
        return DecodeError::MalformedEntry;
    }
    if (!readBytes(1, bytes)) {
        return DecodeError::Truncated;
    }
    ScalerUnit scalerUnit;
    scalerUnit.scaler = static_cast<int8_t>(bytes[0]);

    if (!readByte(tag)) {
        return DecodeError::Truncated;
    }
    if (static_cast<DataType>(tag) != DataType::Enum) {
        return DecodeError::MalformedEntry;
    }
    if (!readBytes(1, bytes)) {
        return DecodeError::Truncated;
    }
    scalerUnit.unit = bytes[0];
    slot.entry.scalerUnit = scalerUnit;
    return DecodeError::None;
}

bool ApduDecoder::decodeEntry(ValueStore &store, EntrySlot &slot, std::size_t depth) {
    const std::size_t start = pos_;
    const ValueStore::Mark mark = store.mark();

    const auto decode = [&]() -> DecodeError {
        uint8_t tag = 0;
        if (!readByte(tag)) {
            return DecodeError::Truncated;
        }
        if (static_cast<DataType>(tag) != DataType::Structure) {
            return DecodeError::MalformedEntry;
        }
        if (depth >= kMaxNestingDepth) {
            return DecodeError::StructureTooDeep;
        }
        std::size_t count = 0;
        const DecodeError lengthError = readLength(count);
        if (lengthError != DecodeError::None) {
            return lengthError;
        }
        if (count != 2 && count != 3) {
            return DecodeError::MalformedEntry;
        }

        if (!readByte(tag)) {
            return DecodeError::Truncated;
        }
        if (static_cast<DataType>(tag) != DataType::OctetString) {
            return DecodeError::MalformedEntry;
        }
        std::size_t length = 0;
        const DecodeError codeLengthError = readLength(length);
        if (codeLengthError != DecodeError::None) {
            return codeLengthError;
        }
        if (length != kObisCodeBytes) {
            return DecodeError::MalformedEntry;
        }
        const uint8_t *code = nullptr;
        if (!readBytes(kObisCodeBytes, code)) {
            return DecodeError::Truncated;
        }
        std::memcpy(slot.entry.code.bytes.data(), code, kObisCodeBytes);

        const DecodeError valueError = decodeInto(store, slot.entry.value, depth + 1);
        if (valueError != DecodeError::None) {
            return valueError;
        }
        if (count == 3) {
            return decodeScalerUnit(slot);
        }
        return DecodeError::None;
    };

    const DecodeError result = decode();
    if (result == DecodeError::None) {
        return true;
    }

    // Keep the code when it was read; it tells the caller which entry failed.
    const ObisCode code = slot.entry.code;
    slot = EntrySlot();
    slot.entry.code = code;
    slot.error = result;
    store.rewind(mark);
    pos_ = start;
    return skipValue() == DecodeError::None;
}

}  // namespace han::cosem

#pragma once

#include "common/decode_error.hpp"
#include "value.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>

namespace han {
class TelegramBuilder;
struct EntrySlot;
}  // namespace han

namespace han::cosem {

constexpr uint8_t kDataNotification = 0x0F;
constexpr uint8_t kLlcDestination = 0xE6;
constexpr uint8_t kLlcCommand = 0xE7;
constexpr uint8_t kLlcResponse = 0xE6;
constexpr std::size_t kInvokeIdBytes = 4;

// Recursive-descent reader over the A-XDR tag stream of one information
// field. Works on a borrowed buffer; decoded values land in a ValueStore.
class ApduDecoder {
public:
    ApduDecoder(const uint8_t *data, std::size_t size);

    // Reads a data-notification into the builder. Returns false only when a
    // mandatory field (notification tag, invoke id, date-time, body) fails;
    // problems inside individual entries are recorded on their slots.
    bool decodeNotification(TelegramBuilder &builder, DecodeError *error = nullptr);

    // Reads one value at the cursor.
    std::optional<Value> decodeValue(ValueStore &store, DecodeError *error = nullptr);
    // Steps over one value at the cursor without recursion.
    DecodeError skipValue();

    std::size_t position() const;
    std::size_t remaining() const;

private:
    bool readByte(uint8_t &out);
    bool readBytes(std::size_t count, const uint8_t *&out);
    DecodeError readLength(std::size_t &out);
    DecodeError decodeInto(ValueStore &store, Value &out, std::size_t depth);
    DecodeError decodeScalerUnit(EntrySlot &slot);
    // Returns false when the element could not even be stepped over.
    bool decodeEntry(ValueStore &store, EntrySlot &slot, std::size_t depth);

    const uint8_t *data_ = nullptr;
    std::size_t size_ = 0;
    std::size_t pos_ = 0;
};

}  // namespace han::cosem

#pragma once

#include "common/decode_error.hpp"
#include "common/limits.hpp"
#include "cosem/date_time.hpp"
#include "cosem/obis.hpp"
#include "cosem/value.hpp"
#include "protocol/hdlc_frame.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace han {

struct ScalerUnit {
    int8_t scaler = 0;  // power of ten
    uint8_t unit = 0;   // DLMS unit enumeration
};

struct ObisEntry {
    cosem::ObisCode code;
    cosem::Value value;
    std::optional<ScalerUnit> scalerUnit;
};

// One entry position of the notification: the entry, or why it failed.
struct EntrySlot {
    ObisEntry entry;
    DecodeError error = DecodeError::None;

    bool ok() const { return error == DecodeError::None; }
};

// Raw number times 10^scaler, for display. Empty for non-numeric values.
std::optional<double> scaled_value(const ObisEntry &entry);

class TelegramBuilder;

// Built only by TelegramBuilder from a frame whose checksums verified.
class Telegram {
public:
    const protocol::FrameHeader &header() const;
    uint32_t invokeId() const;
    const std::optional<cosem::Timestamp> &timestamp() const;

    std::size_t entryCount() const;
    // Past entryCount() this is an empty slot carrying Truncated.
    const EntrySlot &entry(std::size_t index) const;
    const EntrySlot *begin() const;
    const EntrySlot *end() const;
    // First successfully decoded entry carrying this code.
    const ObisEntry *find(const cosem::ObisCode &code) const;

    // Element count announced by the notification body. Larger than
    // entryCount() when entries were dropped or an element could not be
    // stepped over.
    std::size_t declaredEntryCount() const;
    std::size_t droppedEntryCount() const;
    std::size_t failedEntryCount() const;
    bool isClean() const;

    const cosem::ValueStore &store() const;
    std::string_view text(const cosem::VisibleString &value) const;
    std::string_view bytes(const cosem::OctetString &value) const;
    // Null past the composite's child count.
    const cosem::Value &child(const cosem::Structure &value, std::size_t index) const;
    const cosem::Value &child(const cosem::Array &value, std::size_t index) const;

private:
    friend class TelegramBuilder;

    Telegram() = default;

    protocol::FrameHeader header_;
    uint32_t invokeId_ = 0;
    std::optional<cosem::Timestamp> timestamp_;
    std::array<EntrySlot, kMaxEntries> entries_{};
    std::size_t entryCount_ = 0;
    std::size_t declaredEntryCount_ = 0;
    std::size_t droppedEntryCount_ = 0;
    cosem::ValueStore store_;
};

// Collects the pieces of one telegram while a frame is decoded.
class TelegramBuilder {
public:
    void setHeader(const protocol::FrameHeader &header);
    void setInvokeId(uint32_t invokeId);
    void setTimestamp(const std::optional<cosem::Timestamp> &timestamp);
    void setDeclaredEntryCount(std::size_t count);

    bool full() const;
    // Returns false and counts the entry as dropped when no slot is left.
    bool addEntry(const EntrySlot &slot);
    void dropEntry();

    cosem::ValueStore &store();
    const Telegram &peek() const;

    Telegram build() const;
    void clear();

private:
    Telegram telegram_;
};

}  // namespace han

#include "telegram.hpp"

#include <cmath>

namespace han {

std::optional<double> scaled_value(const ObisEntry &entry) {
    const auto raw = cosem::numeric_value(entry.value);
    if (!raw) {
        return std::nullopt;
    }
    if (!entry.scalerUnit || entry.scalerUnit->scaler == 0) {
        return raw;
    }
    const int scaler = entry.scalerUnit->scaler;
    // Dividing keeps 2301 * 10^-1 at 230.1.
    if (scaler < 0) {
        return *raw / std::pow(10.0, -scaler);
    }
    return *raw * std::pow(10.0, scaler);
}

const protocol::FrameHeader &Telegram::header() const {
    return header_;
}

uint32_t Telegram::invokeId() const {
    return invokeId_;
}

const std::optional<cosem::Timestamp> &Telegram::timestamp() const {
    return timestamp_;
}

std::size_t Telegram::entryCount() const {
    return entryCount_;
}

const EntrySlot &Telegram::entry(std::size_t index) const {
    if (index >= entryCount_) {
        static const EntrySlot missing = [] {
            EntrySlot slot;
            slot.error = DecodeError::Truncated;
            return slot;
        }();
        return missing;
    }
    return entries_[index];
}

const EntrySlot *Telegram::begin() const {
    return entries_.data();
}

const EntrySlot *Telegram::end() const {
    return entries_.data() + entryCount_;
}

const ObisEntry *Telegram::find(const cosem::ObisCode &code) const {
    for (const EntrySlot &slot : *this) {
        if (slot.ok() && slot.entry.code == code) {
            return &slot.entry;
        }
    }
    return nullptr;
}

std::size_t Telegram::declaredEntryCount() const {
    return declaredEntryCount_;
}

std::size_t Telegram::droppedEntryCount() const {
    return droppedEntryCount_;
}

std::size_t Telegram::failedEntryCount() const {
    std::size_t failed = 0;
    for (const EntrySlot &slot : *this) {
        if (!slot.ok()) {
            ++failed;
        }
    }
    return failed;
}

bool Telegram::isClean() const {
    return failedEntryCount() == 0 && droppedEntryCount_ == 0 && entryCount_ == declaredEntryCount_;
}

const cosem::ValueStore &Telegram::store() const {
    return store_;
}

std::string_view Telegram::text(const cosem::VisibleString &value) const {
    return store_.text(value.bytes);
}

std::string_view Telegram::bytes(const cosem::OctetString &value) const {
    return store_.text(value.bytes);
}

const cosem::Value &Telegram::child(const cosem::Structure &value, std::size_t index) const {
    return store_.child(value.children, index);
}

const cosem::Value &Telegram::child(const cosem::Array &value, std::size_t index) const {
    return store_.child(value.children, index);
}

void TelegramBuilder::setHeader(const protocol::FrameHeader &header) {
    telegram_.header_ = header;
}

void TelegramBuilder::setInvokeId(uint32_t invokeId) {
    telegram_.invokeId_ = invokeId;
}

void TelegramBuilder::setTimestamp(const std::optional<cosem::Timestamp> &timestamp) {
    telegram_.timestamp_ = timestamp;
}

void TelegramBuilder::setDeclaredEntryCount(std::size_t count) {
    telegram_.declaredEntryCount_ = count;
}

bool TelegramBuilder::full() const {
    return telegram_.entryCount_ == telegram_.entries_.size();
}

bool TelegramBuilder::addEntry(const EntrySlot &slot) {
    if (full()) {
        dropEntry();
        return false;
    }
    telegram_.entries_[telegram_.entryCount_++] = slot;
    return true;
}

void TelegramBuilder::dropEntry() {
    ++telegram_.droppedEntryCount_;
}

cosem::ValueStore &TelegramBuilder::store() {
    return telegram_.store_;
}

const Telegram &TelegramBuilder::peek() const {
    return telegram_;
}

Telegram TelegramBuilder::build() const {
    return telegram_;
}

void TelegramBuilder::clear() {
    telegram_ = Telegram();
}

}  // namespace han

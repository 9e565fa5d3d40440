#pragma once

#include "common/decode_error.hpp"

#include <QtCore/QDateTime>

#include <cstddef>
#include <cstdint>
#include <optional>

namespace han::cosem {

constexpr std::size_t kDateTimeBytes = 12;

constexpr uint8_t kClockInvalidValue = 0x01;
constexpr uint8_t kClockDoubtfulValue = 0x02;
constexpr uint8_t kClockDifferentBase = 0x04;
constexpr uint8_t kClockInvalidStatus = 0x08;
constexpr uint8_t kClockDaylightSaving = 0x80;

constexpr uint8_t kMonthDaylightSavingEnd = 0xFD;
constexpr uint8_t kMonthDaylightSavingBegin = 0xFE;
constexpr uint8_t kDaySecondLastOfMonth = 0xFD;
constexpr uint8_t kDayLastOfMonth = 0xFE;

// COSEM date-time. Fields the meter left unspecified are empty.
struct Timestamp {
    std::optional<uint16_t> year;
    std::optional<uint8_t> month;
    std::optional<uint8_t> day;
    std::optional<uint8_t> dayOfWeek;  // 1 = Monday
    std::optional<uint8_t> hour;
    std::optional<uint8_t> minute;
    std::optional<uint8_t> second;
    std::optional<uint8_t> hundredths;
    std::optional<int16_t> deviation;  // minutes
    std::optional<uint8_t> status;

    bool invalidValue() const;
    bool doubtfulValue() const;
    bool differentClockBase() const;
    bool invalidClockStatus() const;
    bool daylightSavingActive() const;

    // Calendar value when year through second are plain values. The offset
    // from UTC is the deviation when present, otherwise local time.
    std::optional<QDateTime> toDateTime() const;
    QString toString() const;
};

bool operator==(const Timestamp &lhs, const Timestamp &rhs);
bool operator!=(const Timestamp &lhs, const Timestamp &rhs);

std::optional<Timestamp> decode_date_time(const uint8_t *data, std::size_t size, DecodeError *error = nullptr);

}  // namespace han::cosem

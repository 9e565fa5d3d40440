#include "date_time.hpp"

namespace han::cosem {

namespace {

constexpr uint16_t kYearUnspecified = 0xFFFF;
constexpr uint8_t kFieldUnspecified = 0xFF;
constexpr uint16_t kDeviationUnspecified = 0x8000;
constexpr int kMaxDeviationMinutes = 720;

bool has_flag(const std::optional<uint8_t> &status, uint8_t flag) {
    return status.has_value() && (*status & flag) != 0;
}

std::optional<uint8_t> field(uint8_t value) {
    if (value == kFieldUnspecified) {
        return std::nullopt;
    }
    return value;
}

bool in_range(const std::optional<uint8_t> &value, uint8_t low, uint8_t high) {
    return !value || (*value >= low && *value <= high);
}

QString two_digits(const std::optional<uint8_t> &value) {
    return value ? QStringLiteral("%1").arg(int(*value), 2, 10, QLatin1Char('0')) : QStringLiteral("??");
}

}  // namespace

bool Timestamp::invalidValue() const {
    return has_flag(status, kClockInvalidValue);
}

bool Timestamp::doubtfulValue() const {
    return has_flag(status, kClockDoubtfulValue);
}

bool Timestamp::differentClockBase() const {
    return has_flag(status, kClockDifferentBase);
}

bool Timestamp::invalidClockStatus() const {
    return has_flag(status, kClockInvalidStatus);
}

bool Timestamp::daylightSavingActive() const {
    return has_flag(status, kClockDaylightSaving);
}

std::optional<QDateTime> Timestamp::toDateTime() const {
    if (!year || !month || !day || !hour || !minute || !second) {
        return std::nullopt;
    }
    if (*month > 12 || *day > 31) {
        return std::nullopt;
    }
    const QDate date(*year, *month, *day);
    const QTime time(*hour, *minute, *second, hundredths ? *hundredths * 10 : 0);
    if (!date.isValid() || !time.isValid()) {
        return std::nullopt;
    }
    // UTC = local + deviation, so the offset ahead of UTC is its negation.
    if (deviation) {
        return QDateTime(date, time, Qt::OffsetFromUTC, -*deviation * 60);
    }
    return QDateTime(date, time);
}

QString Timestamp::toString() const {
    const QString yearText = year ? QStringLiteral("%1").arg(int(*year), 4, 10, QLatin1Char('0')) : QStringLiteral("????");
    QString text = QStringLiteral("%1-%2-%3 %4:%5:%6")
                       .arg(yearText, two_digits(month), two_digits(day), two_digits(hour), two_digits(minute),
                            two_digits(second));
    if (hundredths) {
        text.append(QStringLiteral(".%1").arg(int(*hundredths), 2, 10, QLatin1Char('0')));
    }
    if (deviation) {
        const int offset = -int(*deviation);
        const int minutes = offset < 0 ? -offset : offset;
        text.append(QStringLiteral(" %1%2:%3")
                        .arg(offset < 0 ? QLatin1Char('-') : QLatin1Char('+'))
                        .arg(minutes / 60, 2, 10, QLatin1Char('0'))
                        .arg(minutes % 60, 2, 10, QLatin1Char('0')));
    }
    if (daylightSavingActive()) {
        text.append(QStringLiteral(" DST"));
    }
    return text;
}

bool operator==(const Timestamp &lhs, const Timestamp &rhs) {
    return lhs.year == rhs.year && lhs.month == rhs.month && lhs.day == rhs.day && lhs.dayOfWeek == rhs.dayOfWeek &&
           lhs.hour == rhs.hour && lhs.minute == rhs.minute && lhs.second == rhs.second &&
           lhs.hundredths == rhs.hundredths && lhs.deviation == rhs.deviation && lhs.status == rhs.status;
}

bool operator!=(const Timestamp &lhs, const Timestamp &rhs) {
    return !(lhs == rhs);
}

std::optional<Timestamp> decode_date_time(const uint8_t *data, std::size_t size, DecodeError *error) {
    if (error) {
        *error = DecodeError::None;
    }
    if (size < kDateTimeBytes) {
        if (error) {
            *error = DecodeError::Truncated;
        }
        return std::nullopt;
    }

    Timestamp ts;
    const uint16_t year = static_cast<uint16_t>((data[0] << 8) | data[1]);
    if (year != kYearUnspecified) {
        ts.year = year;
    }
    ts.month = field(data[2]);
    ts.day = field(data[3]);
    ts.dayOfWeek = field(data[4]);
    ts.hour = field(data[5]);
    ts.minute = field(data[6]);
    ts.second = field(data[7]);
    ts.hundredths = field(data[8]);
    const uint16_t deviation = static_cast<uint16_t>((data[9] << 8) | data[10]);
    if (deviation != kDeviationUnspecified) {
        ts.deviation = static_cast<int16_t>(deviation);
    }
    ts.status = field(data[11]);

    const bool monthValid = !ts.month || (*ts.month >= 1 && *ts.month <= 12) ||
                            *ts.month == kMonthDaylightSavingEnd || *ts.month == kMonthDaylightSavingBegin;
    const bool dayValid = !ts.day || (*ts.day >= 1 && *ts.day <= 31) || *ts.day == kDaySecondLastOfMonth ||
                          *ts.day == kDayLastOfMonth;
    const bool deviationValid = !ts.deviation || (*ts.deviation >= -kMaxDeviationMinutes &&
                                                  *ts.deviation <= kMaxDeviationMinutes);
    if (!monthValid || !dayValid || !deviationValid || !in_range(ts.dayOfWeek, 1, 7) || !in_range(ts.hour, 0, 23) ||
        !in_range(ts.minute, 0, 59) || !in_range(ts.second, 0, 59) || !in_range(ts.hundredths, 0, 99)) {
        if (error) {
            *error = DecodeError::InvalidDateTime;
        }
        return std::nullopt;
    }
    return ts;
}

}  // namespace han::cosem

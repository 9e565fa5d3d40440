#include "cosem/date_time.hpp"
#include "test_frames.hpp"

#include <gtest/gtest.h>

using han::DecodeError;
using han::cosem::decode_date_time;

namespace {

std::optional<han::cosem::Timestamp> decode(const QByteArray &bytes, DecodeError *error = nullptr) {
    return decode_date_time(reinterpret_cast<const uint8_t *>(bytes.constData()),
                            static_cast<std::size_t>(bytes.size()), error);
}

}  // namespace

TEST(DateTimeTest, DecodesAllFields) {
    const auto ts = decode(testing_frames::date_time(2023, 1, 15, 7, 10, 30, 5, 42, -60, 0x80));
    ASSERT_TRUE(ts.has_value());
    EXPECT_EQ(ts->year, 2023);
    EXPECT_EQ(ts->month, 1);
    EXPECT_EQ(ts->day, 15);
    EXPECT_EQ(ts->dayOfWeek, 7);
    EXPECT_EQ(ts->hour, 10);
    EXPECT_EQ(ts->minute, 30);
    EXPECT_EQ(ts->second, 5);
    EXPECT_EQ(ts->hundredths, 42);
    EXPECT_EQ(ts->deviation, -60);
    EXPECT_EQ(ts->status, 0x80);
    EXPECT_TRUE(ts->daylightSavingActive());
    EXPECT_FALSE(ts->invalidValue());
}

TEST(DateTimeTest, SentinelsBecomeUnknownNotZero) {
    const QByteArray bytes =
        testing_frames::bytes({0xFF, 0xFF, 0x03, 0x01, 0xFF, 0x08, 0x00, 0x00, 0xFF, 0x80, 0x00, 0xFF});
    const auto ts = decode(bytes);
    ASSERT_TRUE(ts.has_value());
    EXPECT_FALSE(ts->year.has_value());
    EXPECT_EQ(ts->month, 3);
    EXPECT_FALSE(ts->dayOfWeek.has_value());
    EXPECT_EQ(ts->minute, 0);
    EXPECT_FALSE(ts->hundredths.has_value());
    EXPECT_FALSE(ts->deviation.has_value());
    EXPECT_FALSE(ts->status.has_value());
    EXPECT_FALSE(ts->daylightSavingActive());
    EXPECT_FALSE(ts->toDateTime().has_value());
}

TEST(DateTimeTest, StatusFlags) {
    const auto ts = decode(testing_frames::date_time(2023, 6, 1, 4, 0, 0, 0, 0, 0, 0x0F));
    ASSERT_TRUE(ts.has_value());
    EXPECT_TRUE(ts->invalidValue());
    EXPECT_TRUE(ts->doubtfulValue());
    EXPECT_TRUE(ts->differentClockBase());
    EXPECT_TRUE(ts->invalidClockStatus());
    EXPECT_FALSE(ts->daylightSavingActive());
}

TEST(DateTimeTest, AcceptsDaylightSavingMarkers) {
    const auto ts = decode(testing_frames::date_time(2023, 0xFE, 0xFE, 7, 2, 0, 0));
    ASSERT_TRUE(ts.has_value());
    EXPECT_EQ(ts->month, han::cosem::kMonthDaylightSavingBegin);
    EXPECT_EQ(ts->day, han::cosem::kDayLastOfMonth);
}

TEST(DateTimeTest, RejectsOutOfRangeFields) {
    DecodeError error = DecodeError::None;
    EXPECT_FALSE(decode(testing_frames::date_time(2023, 13, 1, 1, 0, 0, 0), &error));
    EXPECT_EQ(error, DecodeError::InvalidDateTime);
    EXPECT_FALSE(decode(testing_frames::date_time(2023, 1, 1, 1, 24, 0, 0), &error));
    EXPECT_EQ(error, DecodeError::InvalidDateTime);
    EXPECT_FALSE(decode(testing_frames::date_time(2023, 1, 1, 1, 0, 60, 0), &error));
    EXPECT_EQ(error, DecodeError::InvalidDateTime);
    EXPECT_FALSE(decode(testing_frames::date_time(2023, 1, 1, 1, 0, 0, 0, 100), &error));
    EXPECT_EQ(error, DecodeError::InvalidDateTime);
    EXPECT_FALSE(decode(testing_frames::date_time(2023, 1, 1, 1, 0, 0, 0, 0, 900), &error));
    EXPECT_EQ(error, DecodeError::InvalidDateTime);
}

TEST(DateTimeTest, ShortInputIsTruncated) {
    DecodeError error = DecodeError::None;
    EXPECT_FALSE(decode(testing_frames::bytes({0x07, 0xE7, 0x01}), &error));
    EXPECT_EQ(error, DecodeError::Truncated);
}

TEST(DateTimeTest, ConvertsToQDateTime) {
    const auto utc = decode(testing_frames::date_time(2023, 1, 15, 7, 10, 30, 0));
    ASSERT_TRUE(utc.has_value());
    const auto dt = utc->toDateTime();
    ASSERT_TRUE(dt.has_value());
    EXPECT_EQ(*dt, QDateTime(QDate(2023, 1, 15), QTime(10, 30, 0), Qt::UTC));

    // Central European winter time: the meter sends a deviation of -60.
    const auto cet = decode(testing_frames::bytes({0x07, 0xE7, 0x01, 0x0F, 0x07, 0x0B, 0x1E, 0x00, 0x00, 0xFF, 0xC4, 0x00}));
    ASSERT_TRUE(cet.has_value());
    EXPECT_EQ(cet->deviation, -60);
    ASSERT_TRUE(cet->toDateTime().has_value());
    EXPECT_EQ(cet->toDateTime()->toUTC(), *dt);
    EXPECT_EQ(cet->toDateTime()->offsetFromUtc(), 3600);

    const auto west = decode(testing_frames::date_time(2023, 1, 15, 7, 6, 30, 0, 0, 240));
    ASSERT_TRUE(west.has_value());
    EXPECT_EQ(west->toDateTime()->toUTC(), *dt);
}

TEST(DateTimeTest, FormatsOffsetAheadOfUtc) {
    const auto cet = decode(testing_frames::date_time(2023, 7, 1, 6, 12, 0, 0, 0, -120, 0x80));
    ASSERT_TRUE(cet.has_value());
    EXPECT_EQ(cet->toString().toStdString(), "2023-07-01 12:00:00.00 +02:00 DST");

    const auto west = decode(testing_frames::date_time(2023, 7, 1, 6, 12, 0, 0, 0, 330));
    ASSERT_TRUE(west.has_value());
    EXPECT_EQ(west->toString().toStdString(), "2023-07-01 12:00:00.00 -05:30");
}

TEST(DateTimeTest, FormatsUnknownFields) {
    const auto ts = decode(
        testing_frames::bytes({0x07, 0xE7, 0x01, 0x0F, 0x07, 0x0A, 0x1E, 0x00, 0xFF, 0x80, 0x00, 0x00}));
    ASSERT_TRUE(ts.has_value());
    EXPECT_EQ(ts->toString().toStdString(), "2023-01-15 10:30:00");
}

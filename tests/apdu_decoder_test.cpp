#include "cosem/apdu_decoder.hpp"
#include "han/telegram.hpp"
#include "test_frames.hpp"

#include <gtest/gtest.h>

using han::DecodeError;
using han::TelegramBuilder;
using han::cosem::ApduDecoder;
using han::cosem::ObisCode;
using han::cosem::ValueStore;
namespace cosem = han::cosem;
namespace tf = testing_frames;

namespace {

struct Decoded {
    bool ok = false;
    DecodeError error = DecodeError::None;
    std::optional<han::Telegram> telegram;
};

Decoded decode_notification(const QByteArray &information) {
    TelegramBuilder builder;
    ApduDecoder decoder(reinterpret_cast<const uint8_t *>(information.constData()),
                        static_cast<std::size_t>(information.size()));
    Decoded result;
    result.ok = decoder.decodeNotification(builder, &result.error);
    result.telegram = builder.build();
    return result;
}

std::optional<cosem::Value> decode_value(const QByteArray &bytes, ValueStore &store, DecodeError *error) {
    ApduDecoder decoder(reinterpret_cast<const uint8_t *>(bytes.constData()), static_cast<std::size_t>(bytes.size()));
    return decoder.decodeValue(store, error);
}

QByteArray nested_structures(int levels, const QByteArray &leaf) {
    QByteArray out;
    for (int i = 0; i < levels; ++i) {
        out.append(tf::bytes({0x02, 0x01}));
    }
    out.append(leaf);
    return out;
}

}  // namespace

TEST(ApduDecoderTest, DecodesIntegerWidthsAndSigns) {
    ValueStore store;
    DecodeError error = DecodeError::None;

    const auto int8 = decode_value(tf::bytes({0x0F, 0xFF}), store, &error);
    ASSERT_TRUE(int8.has_value());
    EXPECT_EQ(std::get<cosem::SignedInt>(*int8).value, -1);
    EXPECT_EQ(std::get<cosem::SignedInt>(*int8).width, 1);

    const auto int16 = decode_value(tf::int16_value(-1234), store, &error);
    ASSERT_TRUE(int16.has_value());
    EXPECT_EQ(std::get<cosem::SignedInt>(*int16).value, -1234);

    const auto int32 = decode_value(tf::bytes({0x05, 0xFF, 0xFF, 0xFF, 0xFE}), store, &error);
    ASSERT_TRUE(int32.has_value());
    EXPECT_EQ(std::get<cosem::SignedInt>(*int32).value, -2);

    const auto uint32 = decode_value(tf::uint32_value(0xFFFFFFFFu), store, &error);
    ASSERT_TRUE(uint32.has_value());
    EXPECT_EQ(std::get<cosem::UnsignedInt>(*uint32).value, 0xFFFFFFFFu);
    EXPECT_EQ(std::get<cosem::UnsignedInt>(*uint32).width, 4);

    const auto uint64 = decode_value(tf::bytes({0x15, 0, 0, 0, 1, 0, 0, 0, 2}), store, &error);
    ASSERT_TRUE(uint64.has_value());
    EXPECT_EQ(std::get<cosem::UnsignedInt>(*uint64).value, 0x100000002ull);

    const auto enumerated = decode_value(tf::bytes({0x16, 0x1B}), store, &error);
    ASSERT_TRUE(enumerated.has_value());
    EXPECT_EQ(std::get<cosem::Enumerated>(*enumerated).value, 27);

    const auto boolean = decode_value(tf::bytes({0x03, 0x01}), store, &error);
    ASSERT_TRUE(boolean.has_value());
    EXPECT_TRUE(std::get<bool>(*boolean));
}

TEST(ApduDecoderTest, DecodesFloats) {
    ValueStore store;
    DecodeError error = DecodeError::None;
    // 230.5f
    const auto f32 = decode_value(tf::bytes({0x17, 0x43, 0x66, 0x80, 0x00}), store, &error);
    ASSERT_TRUE(f32.has_value());
    EXPECT_DOUBLE_EQ(std::get<cosem::Float>(*f32).value, 230.5);
}

TEST(ApduDecoderTest, StoresStringsInStore) {
    ValueStore store;
    DecodeError error = DecodeError::None;
    const auto text = decode_value(tf::visible_string("AIDON_V0001"), store, &error);
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(store.text(std::get<cosem::VisibleString>(*text).bytes), "AIDON_V0001");
    EXPECT_EQ(store.byteCount(), 11u);
}

TEST(ApduDecoderTest, DecodesNestedCompositesContiguously) {
    ValueStore store;
    DecodeError error = DecodeError::None;
    const QByteArray bytes = tf::bytes({0x01, 0x02, 0x02, 0x02, 0x11, 0x01, 0x11, 0x02, 0x12, 0x00, 0x03});
    const auto value = decode_value(bytes, store, &error);
    ASSERT_TRUE(value.has_value()) << han::to_string(error);
    const auto &array = std::get<cosem::Array>(*value);
    ASSERT_EQ(array.children.count, 2);
    const auto &first = std::get<cosem::Structure>(store.child(array.children, 0));
    ASSERT_EQ(first.children.count, 2);
    EXPECT_EQ(std::get<cosem::UnsignedInt>(store.child(first.children, 1)).value, 2u);
    EXPECT_EQ(std::get<cosem::UnsignedInt>(store.child(array.children, 1)).value, 3u);
}

TEST(ApduDecoderTest, AcceptsLongFormLengths) {
    ValueStore store;
    DecodeError error = DecodeError::None;
    QByteArray bytes = tf::bytes({0x09, 0x81, 0x80});
    bytes.append(QByteArray(0x80, 'x'));
    const auto value = decode_value(bytes, store, &error);
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(std::get<cosem::OctetString>(*value).bytes.size, 0x80);
}

TEST(ApduDecoderTest, NestingAtLimitIsAccepted) {
    ValueStore store;
    DecodeError error = DecodeError::None;
    EXPECT_TRUE(decode_value(nested_structures(int(han::kMaxNestingDepth), tf::bytes({0x11, 0x05})), store, &error));
    EXPECT_EQ(error, DecodeError::None);
}

TEST(ApduDecoderTest, NestingPastLimitIsStructureTooDeep) {
    ValueStore store;
    DecodeError error = DecodeError::None;
    const auto value =
        decode_value(nested_structures(int(han::kMaxNestingDepth) + 1, tf::bytes({0x11, 0x05})), store, &error);
    EXPECT_FALSE(value.has_value());
    EXPECT_EQ(error, DecodeError::StructureTooDeep);
    EXPECT_EQ(store.nodeCount(), 0u);
}

TEST(ApduDecoderTest, UnknownTagAndTruncation) {
    ValueStore store;
    DecodeError error = DecodeError::None;
    EXPECT_FALSE(decode_value(tf::bytes({0x04, 0x08, 0xFF}), store, &error));
    EXPECT_EQ(error, DecodeError::UnexpectedTag);
    EXPECT_FALSE(decode_value(tf::bytes({0x06, 0x00, 0x01}), store, &error));
    EXPECT_EQ(error, DecodeError::Truncated);
    EXPECT_FALSE(decode_value(tf::bytes({0x09, 0x0A, 0x01}), store, &error));
    EXPECT_EQ(error, DecodeError::Truncated);
    EXPECT_FALSE(decode_value(tf::bytes({0x02, 0x7F, 0x11}), store, &error));
    EXPECT_EQ(error, DecodeError::Truncated);
}

TEST(ApduDecoderTest, StoreExhaustionIsCapacityExceeded) {
    ValueStore store;
    DecodeError error = DecodeError::None;
    QByteArray bytes = tf::bytes({0x09, 0x82, 0x02, 0x01});
    bytes.append(QByteArray(0x201, 'y'));
    EXPECT_FALSE(decode_value(bytes, store, &error));
    EXPECT_EQ(error, DecodeError::CapacityExceeded);
}

TEST(ApduDecoderTest, SkipValueStepsOverDeepTreesIteratively) {
    const QByteArray bytes = nested_structures(200, tf::bytes({0x11, 0x05})) + tf::bytes({0x11, 0x06});
    ApduDecoder decoder(reinterpret_cast<const uint8_t *>(bytes.constData()), static_cast<std::size_t>(bytes.size()));
    EXPECT_EQ(decoder.skipValue(), DecodeError::None);
    EXPECT_EQ(decoder.remaining(), 2u);
}

TEST(ApduDecoderTest, DecodesSampleNotification) {
    const Decoded result = decode_notification(tf::sample_information(0x40000001));
    ASSERT_TRUE(result.ok) << han::to_string(result.error);
    const han::Telegram &telegram = *result.telegram;
    EXPECT_EQ(telegram.invokeId(), 0x40000001u);
    ASSERT_TRUE(telegram.timestamp().has_value());
    EXPECT_EQ(telegram.timestamp()->year, 2023);
    ASSERT_EQ(telegram.entryCount(), 1u);
    const han::EntrySlot &slot = telegram.entry(0);
    ASSERT_TRUE(slot.ok());
    EXPECT_EQ(slot.entry.code, ObisCode::from(1, 0, 1, 7, 0));
    EXPECT_EQ(std::get<cosem::UnsignedInt>(slot.entry.value).value, 450u);
    ASSERT_TRUE(slot.entry.scalerUnit.has_value());
    EXPECT_EQ(slot.entry.scalerUnit->scaler, -1);
    EXPECT_EQ(slot.entry.scalerUnit->unit, 27);
    EXPECT_TRUE(telegram.isClean());
}

TEST(ApduDecoderTest, LlcHeaderIsOptional) {
    const QByteArray power = tf::entry(ObisCode::from(1, 0, 1, 7, 0), tf::uint32_value(7));
    const Decoded result = decode_notification(
        tf::notification(1, tf::date_time_field(tf::date_time(2024, 2, 29, 4, 0, 0, 0)), tf::body(1, power), false));
    ASSERT_TRUE(result.ok);
    ASSERT_EQ(result.telegram->entryCount(), 1u);
    EXPECT_FALSE(result.telegram->entry(0).entry.scalerUnit.has_value());
}

TEST(ApduDecoderTest, NullDateTimeLeavesTimestampEmpty) {
    const QByteArray power = tf::entry(ObisCode::from(1, 0, 1, 7, 0), tf::uint32_value(7));
    const Decoded result = decode_notification(tf::notification(1, tf::bytes({0x00}), tf::body(1, power)));
    ASSERT_TRUE(result.ok);
    EXPECT_FALSE(result.telegram->timestamp().has_value());
}

TEST(ApduDecoderTest, ArrayBodyIsAccepted) {
    const QByteArray power = tf::entry(ObisCode::from(1, 0, 2, 7, 0), tf::uint32_value(9));
    const Decoded result = decode_notification(
        tf::notification(1, tf::date_time_field(tf::date_time(2024, 1, 1, 1, 0, 0, 0)), tf::body(1, power, 0x01)));
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.telegram->entryCount(), 1u);
}

TEST(ApduDecoderTest, MandatoryFieldFailuresFailTheNotification) {
    const QByteArray dt = tf::date_time_field(tf::date_time(2023, 1, 15, 7, 10, 30, 0));
    const QByteArray body = tf::body(1, tf::entry(ObisCode::from(1, 0, 1, 7, 0), tf::uint32_value(1)));

    QByteArray wrongApdu = tf::notification(1, dt, body);
    wrongApdu[3] = char(0x0E);
    Decoded result = decode_notification(wrongApdu);
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error, DecodeError::UnexpectedApdu);

    result = decode_notification(tf::bytes({0xE6, 0xE7, 0x00, 0x0F, 0x00, 0x00}));
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error, DecodeError::Truncated);

    result = decode_notification(tf::notification(1, tf::bytes({0x09, 0x05, 1, 2, 3, 4, 5}), body));
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error, DecodeError::InvalidDateTime);

    result = decode_notification(tf::notification(1, tf::date_time_field(tf::date_time(2023, 14, 1, 1, 0, 0, 0)), body));
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error, DecodeError::InvalidDateTime);

    result = decode_notification(tf::notification(1, tf::bytes({0x11, 0x00}), body));
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error, DecodeError::UnexpectedTag);

    result = decode_notification(tf::notification(1, dt, tf::uint32_value(1)));
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error, DecodeError::UnexpectedTag);
}

TEST(ApduDecoderTest, MalformedCodeFailsOnlyThatEntry) {
    QByteArray elements;
    elements.append(tf::entry(ObisCode::from(1, 0, 1, 7, 0), tf::uint32_value(100), tf::scaler_unit(0, 27)));
    elements.append(tf::bytes({0x02, 0x02, 0x09, 0x05, 1, 0, 2, 7, 0, 0x06, 0, 0, 0, 5}));
    elements.append(tf::entry(ObisCode::from(1, 0, 32, 7, 0), tf::uint16_value(2305), tf::scaler_unit(-1, 35)));
    const Decoded result = decode_notification(
        tf::notification(1, tf::date_time_field(tf::date_time(2023, 1, 15, 7, 10, 30, 0)), tf::body(3, elements)));

    ASSERT_TRUE(result.ok);
    const han::Telegram &telegram = *result.telegram;
    ASSERT_EQ(telegram.entryCount(), 3u);
    EXPECT_TRUE(telegram.entry(0).ok());
    EXPECT_EQ(telegram.entry(1).error, DecodeError::MalformedEntry);
    ASSERT_TRUE(telegram.entry(2).ok());
    EXPECT_EQ(std::get<cosem::UnsignedInt>(telegram.entry(2).entry.value).value, 2305u);
    EXPECT_EQ(telegram.failedEntryCount(), 1u);
    EXPECT_FALSE(telegram.isClean());
}

TEST(ApduDecoderTest, OtherEntryShapesAreMalformed) {
    QByteArray elements;
    // Bare value instead of a structure.
    elements.append(tf::uint16_value(1));
    // Structure with four elements.
    elements.append(tf::bytes({0x02, 0x04, 0x11, 1, 0x11, 2, 0x11, 3, 0x11, 4}));
    // Code is a visible string.
    elements.append(tf::bytes({0x02, 0x02, 0x0A, 0x06, 1, 0, 1, 7, 0, 255, 0x11, 1}));
    // Scaler-unit with the wrong types.
    elements.append(tf::entry(ObisCode::from(1, 0, 1, 7, 0), tf::uint32_value(1), tf::bytes({0x02, 0x02, 0x11, 0, 0x16, 27})));
    elements.append(tf::entry(ObisCode::from(1, 0, 2, 7, 0), tf::uint32_value(2)));
    const Decoded result = decode_notification(
        tf::notification(1, tf::date_time_field(tf::date_time(2023, 1, 15, 7, 10, 30, 0)), tf::body(5, elements)));

    ASSERT_TRUE(result.ok);
    ASSERT_EQ(result.telegram->entryCount(), 5u);
    for (std::size_t i = 0; i < 4; ++i) {
        EXPECT_EQ(result.telegram->entry(i).error, DecodeError::MalformedEntry) << "entry " << i;
    }
    // The code was read before the scaler-unit went wrong.
    EXPECT_EQ(result.telegram->entry(3).entry.code, ObisCode::from(1, 0, 1, 7, 0));
    EXPECT_TRUE(result.telegram->entry(4).ok());
}

TEST(ApduDecoderTest, TooDeepEntryIsSkippedAndSiblingsContinue) {
    QByteArray elements;
    elements.append(tf::entry(ObisCode::from(1, 0, 99, 1, 0), nested_structures(12, tf::bytes({0x11, 0x01}))));
    elements.append(tf::entry(ObisCode::from(1, 0, 1, 7, 0), tf::uint32_value(42)));
    const Decoded result = decode_notification(
        tf::notification(1, tf::date_time_field(tf::date_time(2023, 1, 15, 7, 10, 30, 0)), tf::body(2, elements)));

    ASSERT_TRUE(result.ok);
    ASSERT_EQ(result.telegram->entryCount(), 2u);
    EXPECT_EQ(result.telegram->entry(0).error, DecodeError::StructureTooDeep);
    EXPECT_EQ(result.telegram->entry(0).entry.code, ObisCode::from(1, 0, 99, 1, 0));
    ASSERT_TRUE(result.telegram->entry(1).ok());
    EXPECT_EQ(std::get<cosem::UnsignedInt>(result.telegram->entry(1).entry.value).value, 42u);
    EXPECT_EQ(result.telegram->store().nodeCount(), 0u);
}

TEST(ApduDecoderTest, UnskippableEntryEndsTheList) {
    QByteArray elements;
    elements.append(tf::entry(ObisCode::from(1, 0, 1, 7, 0), tf::uint32_value(1)));
    elements.append(tf::entry(ObisCode::from(1, 0, 2, 7, 0), tf::bytes({0x04, 0x08, 0x00})));
    elements.append(tf::entry(ObisCode::from(1, 0, 3, 7, 0), tf::uint32_value(3)));
    const Decoded result = decode_notification(
        tf::notification(1, tf::date_time_field(tf::date_time(2023, 1, 15, 7, 10, 30, 0)), tf::body(3, elements)));

    ASSERT_TRUE(result.ok);
    ASSERT_EQ(result.telegram->entryCount(), 2u);
    EXPECT_EQ(result.telegram->declaredEntryCount(), 3u);
    EXPECT_EQ(result.telegram->entry(1).error, DecodeError::UnexpectedTag);
    EXPECT_FALSE(result.telegram->isClean());
}

TEST(ApduDecoderTest, EntriesBeyondCapacityAreDropped) {
    const std::size_t total = han::kMaxEntries + 5;
    QByteArray elements;
    for (std::size_t i = 0; i < total; ++i) {
        elements.append(tf::entry(ObisCode::from(1, 0, 1, 7, static_cast<uint8_t>(i)), tf::uint16_value(uint16_t(i))));
    }
    const Decoded result = decode_notification(tf::notification(
        1, tf::date_time_field(tf::date_time(2023, 1, 15, 7, 10, 30, 0)), tf::body(int(total), elements)));

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.telegram->entryCount(), han::kMaxEntries);
    EXPECT_EQ(result.telegram->droppedEntryCount(), 5u);
    EXPECT_EQ(result.telegram->declaredEntryCount(), total);
    EXPECT_FALSE(result.telegram->isClean());
    EXPECT_EQ(result.telegram->entry(han::kMaxEntries - 1).entry.code.e(), han::kMaxEntries - 1);
}

#include <gtest/gtest.h>
#include "Fakes.h"
#include "wearable/HeartRateParser.h"

TEST(HeartRateParserTest, SixteenBitBpmWithOneRrField) {
    const uint8_t data[] = { 0x11, 0x48, 0x00, 0x34, 0x03 };
    HeartSample sample;

    ASSERT_TRUE(HeartRateParser::parse(data, sizeof(data), sample));
    EXPECT_EQ(72, sample.bpm);
    ASSERT_EQ(1, sample.rrCount);
    EXPECT_FLOAT_EQ(820.0f * 1000.0f / 1024.0f, sample.rrIntervalsMs[0]);
}

TEST(HeartRateParserTest, EightBitBpmWithoutRr) {
    const uint8_t data[] = { 0x00, 0x5A };
    HeartSample sample;

    ASSERT_TRUE(HeartRateParser::parse(data, sizeof(data), sample));
    EXPECT_EQ(90, sample.bpm);
    EXPECT_EQ(0, sample.rrCount);
}

TEST(HeartRateParserTest, EnergyExpendedIsSkipped) {
    const uint8_t data[] = { 0x18, 0x40, 0xAA, 0xBB, 0x00, 0x04 };
    HeartSample sample;

    ASSERT_TRUE(HeartRateParser::parse(data, sizeof(data), sample));
    EXPECT_EQ(64, sample.bpm);
    ASSERT_EQ(1, sample.rrCount);
    EXPECT_FLOAT_EQ(1000.0f, sample.rrIntervalsMs[0]);
}

TEST(HeartRateParserTest, SeveralRrFieldsAndTrailingOddByte) {
    Bytes data = heartRatePacket(60, { 1024, 1000, 980 });
    data.push_back(0x7F);
    HeartSample sample;

    ASSERT_TRUE(HeartRateParser::parse(data.data(), data.size(), sample));
    ASSERT_EQ(3, sample.rrCount);
    EXPECT_FLOAT_EQ(1000.0f, sample.rrIntervalsMs[0]);
    EXPECT_FLOAT_EQ(HeartRateParser::rrTicksToMs(980), sample.rrIntervalsMs[2]);
}

TEST(HeartRateParserTest, TruncatedNotificationsAreRejected) {
    HeartSample sample;
    const uint8_t tooShort[] = { 0x00 };
    const uint8_t missingBpmByte[] = { 0x01, 0x48 };
    const uint8_t missingEnergy[] = { 0x08, 0x48, 0x01 };

    EXPECT_FALSE(HeartRateParser::parse(tooShort, sizeof(tooShort), sample));
    EXPECT_FALSE(HeartRateParser::parse(missingBpmByte, sizeof(missingBpmByte), sample));
    EXPECT_FALSE(HeartRateParser::parse(missingEnergy, sizeof(missingEnergy), sample));
    EXPECT_FALSE(HeartRateParser::parse(nullptr, 4, sample));
}

#include <gtest/gtest.h>

#include "application/TtlCodec.hpp"

using namespace tiercache::application;
using namespace std::chrono;

class TtlCodecTest : public ::testing::Test {
protected:
    static TtlCodec::TimePoint at(std::int64_t millis) {
        return TtlCodec::TimePoint(duration_cast<TtlCodec::Clock::duration>(milliseconds(millis)));
    }
};

TEST_F(TtlCodecTest, Encode_ProducesFourBigEndianBytes) {
    auto bytes = TtlCodec::encode(at(0x01020304));

    ASSERT_EQ(bytes.size(), TtlCodec::kTimestampSize);
    EXPECT_EQ(static_cast<unsigned char>(bytes[0]), 0x01);
    EXPECT_EQ(static_cast<unsigned char>(bytes[1]), 0x02);
    EXPECT_EQ(static_cast<unsigned char>(bytes[2]), 0x03);
    EXPECT_EQ(static_cast<unsigned char>(bytes[3]), 0x04);
}

TEST_F(TtlCodecTest, Decode_RestoresInstantWithMillisecondResolution) {
    auto written = at(1700000000123);
    auto now = at(1700000005000);

    auto decoded = TtlCodec::decode(TtlCodec::encode(written), now);

    EXPECT_EQ(duration_cast<milliseconds>(decoded.time_since_epoch()).count(), 1700000000123);
}

TEST_F(TtlCodecTest, Decode_RealClockRoundTrip) {
    auto now = TtlCodec::Clock::now();
    auto decoded = TtlCodec::decode(TtlCodec::encode(now), now);

    EXPECT_LE(now - decoded, milliseconds(1));
    EXPECT_GE(now - decoded, TtlCodec::Clock::duration::zero());
}

TEST_F(TtlCodecTest, Decode_HandlesWraparoundOfLow32Bits) {
    // Запись перед границей 2^32 мс, чтение после неё
    const std::int64_t boundary = 5LL * (1LL << 32);
    auto written = at(boundary - 10);
    auto now = at(boundary + 25);

    auto decoded = TtlCodec::decode(TtlCodec::encode(written), now);

    EXPECT_EQ(duration_cast<milliseconds>(now - decoded).count(), 35);
}

TEST_F(TtlCodecTest, Decode_WrongLength_Throws) {
    EXPECT_THROW(TtlCodec::decode(std::string("abc"), TtlCodec::Clock::now()), std::invalid_argument);
    EXPECT_THROW(TtlCodec::decode(std::string("abcde"), TtlCodec::Clock::now()), std::invalid_argument);
}

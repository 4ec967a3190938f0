#include <gtest/gtest.h>

#include <vector>

#include "signal_synth.hpp"
#include "wxrx/rx/mebus_frame.hpp"

using namespace wxrx;
using namespace wxrx::rx;
using wxrx::test::mebus_bits;
using wxrx::utils::BitBuffer;

TEST(MebusFrame, DecodesFields) {
  std::vector<BitBuffer> frames = {BitBuffer(mebus_bits(1234, 1, 1, -53, 45))};
  auto out = decode_mebus_packet(frames);
  ASSERT_TRUE(out.record.has_value());
  const auto& r = *out.record;
  EXPECT_EQ(r.id, 1234);
  EXPECT_EQ(r.setkey, 1);
  EXPECT_EQ(r.channel, 1);
  EXPECT_DOUBLE_EQ(r.temperature, -5.3);
  EXPECT_EQ(r.humidity, 45);
}

TEST(MebusFrame, TemperatureTwosComplementBoundaries) {
  struct Case { int raw; double expect; };
  for (auto c : {Case{0, 0.0}, Case{2047, 204.7}, Case{-2048, -204.8}, Case{-1, -0.1}, Case{215, 21.5}}) {
    std::vector<BitBuffer> frames = {BitBuffer(mebus_bits(7, 0, 3, c.raw, 99))};
    auto out = decode_mebus_packet(frames);
    ASSERT_TRUE(out.record.has_value());
    EXPECT_DOUBLE_EQ(out.record->temperature, c.expect) << c.raw;
    EXPECT_EQ(out.record->channel, 3);
  }
}

TEST(MebusFrame, IdenticalRepeatsDecode) {
  BitBuffer f(mebus_bits(42, 0, 2, 180, 60));
  std::vector<BitBuffer> frames = {f, f, f, f};
  auto out = decode_mebus_packet(frames);
  ASSERT_TRUE(out.record.has_value());
  EXPECT_EQ(out.record->id, 42);
  EXPECT_DOUBLE_EQ(out.record->temperature, 18.0);
}

TEST(MebusFrame, AnySingleBitDifferenceIsRejected) {
  auto bits = mebus_bits(1234, 1, 1, -53, 45);
  for (size_t i = 0; i < bits.size(); ++i) {
    auto other = bits;
    other[i] ^= 1;
    std::vector<BitBuffer> frames = {BitBuffer(bits), BitBuffer(other)};
    auto out = decode_mebus_packet(frames);
    EXPECT_FALSE(out.record.has_value()) << i;
    EXPECT_EQ(out.error, DecodeError::RepeatMismatch) << i;
  }
}

TEST(MebusFrame, LengthDifferenceIsRejected) {
  auto bits = mebus_bits(1234, 1, 1, -53, 45);
  auto longer = bits;
  longer.push_back(0);
  std::vector<BitBuffer> frames = {BitBuffer(bits), BitBuffer(bits), BitBuffer(longer)};
  EXPECT_EQ(decode_mebus_packet(frames).error, DecodeError::RepeatMismatch);
}

TEST(MebusFrame, EmptyOrShortPacket) {
  std::vector<BitBuffer> none;
  EXPECT_EQ(decode_mebus_packet(none).error, DecodeError::FrameIncomplete);
  auto bits = mebus_bits(1, 0, 0, 0, 0);
  bits.resize(30);
  std::vector<BitBuffer> frames = {BitBuffer(bits)};
  EXPECT_EQ(decode_mebus_packet(frames).error, DecodeError::FrameIncomplete);
}

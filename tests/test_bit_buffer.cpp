#include <gtest/gtest.h>

#include "wxrx/utils/bit_buffer.hpp"
#include "wxrx/utils/nibble_check.hpp"

using namespace wxrx::utils;

TEST(BitBuffer, PopLsbFirst) {
  BitBuffer b({1, 0, 1, 1, 0, 1});
  auto v = b.pop_lsb(4);
  ASSERT_TRUE(v.has_value());
  EXPECT_EQ(*v, 0xDu);
  EXPECT_EQ(b.cursor(), 4u);
  EXPECT_EQ(b.remaining(), 2u);
  EXPECT_EQ(*b.pop_lsb(2), 2u);
  EXPECT_EQ(b.remaining(), 0u);
}

TEST(BitBuffer, PopMsbFirst) {
  BitBuffer b({1, 0, 1, 1, 0, 1});
  EXPECT_EQ(*b.pop_msb(4), 0xBu);
  EXPECT_EQ(*b.pop_msb(2), 1u);
}

TEST(BitBuffer, ExhaustedLeavesCursor) {
  BitBuffer b({1, 1, 1});
  EXPECT_EQ(*b.pop_lsb(1), 1u);
  EXPECT_FALSE(b.pop_lsb(3).has_value());
  EXPECT_EQ(b.cursor(), 1u);
  EXPECT_FALSE(b.pop_msb(33).has_value());
  EXPECT_EQ(*b.pop_msb(2), 3u);
}

TEST(BitBuffer, RewindAndClear) {
  BitBuffer b;
  for (int i = 0; i < 8; ++i) b.push(static_cast<uint8_t>(i & 1));
  EXPECT_EQ(*b.pop_lsb(8), 0xAAu);
  b.rewind();
  EXPECT_EQ(b.cursor(), 0u);
  EXPECT_EQ(*b.pop_msb(8), 0x55u);
  b.clear();
  EXPECT_TRUE(b.empty());
  EXPECT_EQ(b.cursor(), 0u);
}

TEST(BitBuffer, PushMasksToOneBit) {
  BitBuffer b;
  b.push(2);
  b.push(3);
  EXPECT_EQ(b.bits()[0], 0);
  EXPECT_EQ(b.bits()[1], 1);
}

TEST(BitBuffer, EqualityIgnoresCursor) {
  BitBuffer a({1, 0, 1});
  BitBuffer b({1, 0, 1});
  b.pop_lsb(2);
  EXPECT_TRUE(a == b);
  b.push(0);
  EXPECT_FALSE(a == b);
}

TEST(BitBuffer, FormatBitsInGroupsOfFour) {
  std::vector<uint8_t> bits = {0, 1, 0, 1, 1, 1, 0, 0, 0, 1};
  EXPECT_EQ(format_bits(bits), " 0101 1100 01");
  EXPECT_EQ(format_bits({}), "");
}

TEST(NibbleCheck, XorAndSum) {
  NibbleCheck c;
  for (uint8_t n : {1, 6, 2, 0, 2, 7, 1, 6, 7}) c.add(n);
  EXPECT_TRUE(c.xor_ok());
  EXPECT_EQ(c.sum, 32u);
  EXPECT_EQ(c.expected_sum(), 5);
  EXPECT_TRUE(c.sum_ok(5));
  EXPECT_FALSE(c.sum_ok(4));
  c.add(3);
  EXPECT_FALSE(c.xor_ok());
}

#include <gtest/gtest.h>

#include "luma/Lib/LumaLib/Bits.hpp"
#include "luma/Lib/LumaLib/Crc16.hpp"
#include "luma/Lib/LumaLib/Parity.hpp"

using namespace LumaLib;

TEST(Bits, ToBinaryIsMsbFirstAndFixedWidth) {
  BitStream bits;
  ASSERT_TRUE(toBinary(5, 4, bits));
  EXPECT_EQ("0101", toBitString(bits));

  ASSERT_TRUE(toBinary(1, 8, bits));
  EXPECT_EQ("010100000001", toBitString(bits));
}

TEST(Bits, ToBinaryRejectsValuesThatDoNotFit) {
  BitStream bits;
  EXPECT_FALSE(toBinary(16, 4, bits));
  EXPECT_FALSE(toBinary(1, 0, bits));
  EXPECT_FALSE(toBinary(1, 33, bits));
  EXPECT_TRUE(bits.empty());
}

TEST(Bits, FromBinaryReadsWindows) {
  BitStream bits;
  ASSERT_TRUE(fromBitString("0011111111000", bits));
  EXPECT_EQ(0xFFu, fromBinary(bits, 2, 8));
  EXPECT_EQ(0x3u, fromBinary(bits.data(), 4));
}

TEST(Bits, FromBitStringRejectsOtherCharacters) {
  BitStream bits;
  EXPECT_FALSE(fromBitString("01x1", bits));
}

TEST(Bits, PackBytesInvertsAppendBytes) {
  const Bytes data = toBytes("Az");
  BitStream bits;
  appendBytes(data, bits);
  ASSERT_EQ(16u, bits.size());
  EXPECT_EQ("0100000101111010", toBitString(bits));
  EXPECT_EQ(data, packBytes(bits, 0, 2));
}

TEST(Crc16, MatchesCcittFalseCheckValue) {
  EXPECT_EQ(0x29B1, crc16(toBytes("123456789")));
  EXPECT_EQ(CRC16_INIT, crc16(Bytes()));
}

TEST(Parity, EvenParityOverNineBitUnits) {
  // 'A' = 01000001 has two ones -> parity bit 0
  const BitStream unit = encodeLegacyUnits("A");
  ASSERT_EQ(9u, unit.size());
  EXPECT_EQ("010000010", toBitString(unit));
  EXPECT_TRUE(validateParity(unit.data(), unit.size()));

  // 'h' = 01101000 has three ones -> parity bit 1
  EXPECT_EQ("011010001", toBitString(encodeLegacyUnits("h")));
}

TEST(Parity, SingleBitFlipFailsValidation) {
  BitStream unit = encodeLegacyUnits("A");
  unit[3] ^= 1;
  EXPECT_FALSE(validateParity(unit.data(), unit.size()));
}

TEST(Parity, OnlyNineBitUnitsValidate) {
  const BitStream bits(8, 0);
  EXPECT_FALSE(validateParity(bits.data(), bits.size()));
}

TEST(Parity, LegacyMessageIsFramedByMarkers) {
  const BitStream bits = encodeLegacyMessage("hi");
  ASSERT_EQ(8u + 18u + 8u, bits.size());
  EXPECT_EQ(0xFFu, fromBinary(bits, 0, 8));
  EXPECT_EQ(0x00u, fromBinary(bits, bits.size() - 8, 8));
}

#include <gtest/gtest.h>

#include "luma/Lib/LumaLib/Base64.hpp"
#include "luma/Lib/LumaLib/Fec.hpp"
#include "luma/Lib/LumaLib/Lzss.hpp"

using namespace LumaLib;

TEST(Base64, KnownVectors) {
  EXPECT_EQ("", base64Encode(Bytes()));
  EXPECT_EQ("aA==", base64Encode(toBytes("h")));
  EXPECT_EQ("aGk=", base64Encode(toBytes("hi")));
  EXPECT_EQ("aGVsbG8=", base64Encode(toBytes("hello")));

  Bytes out;
  ASSERT_TRUE(base64Decode("aGVsbG8=", out));
  EXPECT_EQ("hello", toString(out));
}

TEST(Base64, MalformedInputIsRejected) {
  Bytes out = toBytes("keep");
  EXPECT_FALSE(base64Decode("abc", out));
  EXPECT_FALSE(base64Decode("a=bc", out));
  EXPECT_FALSE(base64Decode("ab==abcd", out));
  EXPECT_FALSE(base64Decode("ab!d", out));
  EXPECT_EQ("keep", toString(out));
}

TEST(RepetitionFec, CleanBlockDecodes) {
  RepetitionFec fec;
  const FecBlock block = fec.encode(toBytes("abc"));
  EXPECT_EQ("rep3", block.scheme);
  EXPECT_EQ(3u, block.length);
  EXPECT_EQ(9u, block.data.size());

  const FecResult r = fec.decode(block);
  EXPECT_TRUE(r.success);
  EXPECT_EQ("abc", toString(r.data));
  EXPECT_EQ(0u, r.errorsCorrected);
}

TEST(RepetitionFec, SingleCorruptCopyIsCorrected) {
  RepetitionFec fec;
  FecBlock block = fec.encode(toBytes("abc"));
  block.data[4] = 'X';
  const FecResult r = fec.decode(block);
  EXPECT_TRUE(r.success);
  EXPECT_EQ("abc", toString(r.data));
  EXPECT_EQ(1u, r.errorsCorrected);
}

TEST(RepetitionFec, DisagreeingCopiesFailWithBestEffortData) {
  RepetitionFec fec;
  FecBlock block = fec.encode(toBytes("hey"));
  block.data[0] = 'a';
  block.data[3] = 'b';
  block.data[6] = 'c';
  const FecResult r = fec.decode(block);
  EXPECT_FALSE(r.success);
  // bitwise majority of 0x61, 0x62, 0x63
  EXPECT_EQ("cey", toString(r.data));
}

TEST(RepetitionFec, ForeignSchemePassesThrough) {
  RepetitionFec fec;
  FecBlock block;
  block.scheme = "rs255";
  block.length = 2;
  block.data = toBytes("zz");
  const FecResult r = fec.decode(block);
  EXPECT_FALSE(r.success);
  EXPECT_EQ("zz", toString(r.data));
}

TEST(RepetitionFec, ShortBlockFails) {
  RepetitionFec fec;
  FecBlock block = fec.encode(toBytes("abc"));
  block.data.pop_back();
  EXPECT_FALSE(fec.decode(block).success);
}

TEST(Lzss, RepetitiveTextShrinksAndRestores) {
  const std::string text =
      "{\"temp\":21.5,\"humidity\":40}{\"temp\":21.5,\"humidity\":40}{\"temp\":21.5,\"humidity\":40}";
  Bytes packed;
  ASSERT_TRUE(lzssCompress(toBytes(text), packed));
  EXPECT_LT(packed.size(), text.size());

  Bytes restored;
  ASSERT_TRUE(lzssDecompress(packed, restored));
  EXPECT_EQ(text, toString(restored));
}

TEST(Lzss, EmptyInput) {
  Bytes packed;
  ASSERT_TRUE(lzssCompress(Bytes(), packed));
  EXPECT_TRUE(packed.empty());
  Bytes restored;
  ASSERT_TRUE(lzssDecompress(packed, restored));
  EXPECT_TRUE(restored.empty());
}

TEST(Lzss, BackReferenceBeforeStartIsRejected) {
  const Bytes bogus = {0x01, 0x05, 0x00, 0x03};
  Bytes out;
  EXPECT_FALSE(lzssDecompress(bogus, out));
}

TEST(Lzss, TruncatedMatchTokenIsRejected) {
  const Bytes bogus = {0x02, 'a', 0x01};
  Bytes out;
  EXPECT_FALSE(lzssDecompress(bogus, out));
}

TEST(Lzss, OverlappingRunExpands) {
  // 'a' then one match copying it eighteen times from one byte back
  const Bytes packed = {0x02, 'a', 0x01, 0x00, 18};
  Bytes out;
  ASSERT_TRUE(lzssDecompress(packed, out));
  EXPECT_EQ(std::string(19, 'a'), toString(out));
}

TEST(Lzss, OutputCapStopsExpansion) {
  Bytes packed = {0xFE, 'a'};
  for (int i = 0; i < 7; ++i) {
    packed.push_back(0x01);
    packed.push_back(0x00);
    packed.push_back(18);
  }
  Bytes out;
  ASSERT_TRUE(lzssDecompress(packed, out));
  EXPECT_EQ(127u, out.size());

  EXPECT_FALSE(lzssDecompress(packed, out, 100));
  EXPECT_FALSE(lzssDecompress(packed, out, 0));
}

TEST(Lzss, MatchLengthOutsideFormatIsRejected) {
  const Bytes tooShort = {0x02, 'a', 0x01, 0x00, 2};
  const Bytes tooLong = {0x02, 'a', 0x01, 0x00, 19};
  Bytes out;
  EXPECT_FALSE(lzssDecompress(tooShort, out));
  EXPECT_FALSE(lzssDecompress(tooLong, out));
}

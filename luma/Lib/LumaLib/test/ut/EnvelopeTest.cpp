#include <gtest/gtest.h>

#include "luma/Lib/LumaLib/Base64.hpp"
#include "luma/Lib/LumaLib/Envelope.hpp"

using namespace LumaLib;

TEST(Envelope, PlainPayloadIsRaw) {
  const Envelope env = parseEnvelope(toBytes("hello"));
  EXPECT_EQ(Envelope::Kind::RAW, env.kind);
  EXPECT_EQ(0, env.flags);
  EXPECT_EQ("hello", toString(env.data));
}

TEST(Envelope, UnrelatedJsonIsRaw) {
  const std::string doc = "{\"temp\":21.5}";
  const Envelope env = parseEnvelope(toBytes(doc));
  EXPECT_EQ(Envelope::Kind::RAW, env.kind);
  EXPECT_EQ(doc, toString(env.data));
}

TEST(Envelope, DataEnvelopeCarriesFlagsAndBinary) {
  const Bytes binary = {0x00, 0xFF, 0x10, 0x80};
  const Bytes wire = serializeDataEnvelope(PacketFlags::COMPRESSED, binary, nullptr);
  const Envelope env = parseEnvelope(wire);
  ASSERT_EQ(Envelope::Kind::DATA, env.kind);
  EXPECT_EQ(PacketFlags::COMPRESSED, env.flags);
  EXPECT_FALSE(env.hasFec);
  EXPECT_EQ(binary, env.data);
}

TEST(Envelope, ChunkEnvelopeWithFecBlock) {
  Chunk chunk;
  chunk.sequence = 1;
  chunk.total = 3;
  chunk.data = toBytes("part");
  const FecBlock block = RepetitionFec().encode(chunk.data);

  const Bytes wire = serializeChunkEnvelope(42, chunk, PacketFlags::FEC_ENABLED, &block);
  const Envelope env = parseEnvelope(wire);
  ASSERT_EQ(Envelope::Kind::CHUNK, env.kind);
  EXPECT_EQ(42u, env.id);
  EXPECT_EQ(1u, env.sequence);
  EXPECT_EQ(3u, env.total);
  EXPECT_EQ(PacketFlags::FEC_ENABLED, env.flags);
  ASSERT_TRUE(env.hasFec);
  EXPECT_EQ("rep3", env.fec.scheme);
  EXPECT_EQ(4u, env.fec.length);
  EXPECT_EQ(block.data, env.fec.data);
}

TEST(Envelope, ChunkWithSequenceOutOfRangeIsRaw) {
  const std::string doc =
      "{\"kind\":\"chunk\",\"id\":1,\"sequence\":3,\"total\":2,\"data\":\"aGk=\"}";
  EXPECT_EQ(Envelope::Kind::RAW, parseEnvelope(toBytes(doc)).kind);
}

TEST(Envelope, BadBase64IsRaw) {
  const std::string doc = "{\"kind\":\"data\",\"flags\":0,\"data\":\"***\"}";
  EXPECT_EQ(Envelope::Kind::RAW, parseEnvelope(toBytes(doc)).kind);
}

TEST(Envelope, LegacyChunkShape) {
  const std::string doc = "{\"sequence\":0,\"total\":2,\"data\":\"ab\"}";
  const Envelope env = parseEnvelope(toBytes(doc));
  ASSERT_EQ(Envelope::Kind::CHUNK, env.kind);
  EXPECT_EQ(0u, env.id);
  EXPECT_EQ(0u, env.sequence);
  EXPECT_EQ(2u, env.total);
  EXPECT_EQ("ab", toString(env.data));
}

TEST(Envelope, LegacyFecShapeImpliesFecFlag) {
  const std::string doc =
      "{\"data\":\"hi\",\"fec\":{\"scheme\":\"rep3\",\"length\":2,\"data\":\"" +
      base64Encode(toBytes("hihihi")) + "\"}}";
  const Envelope env = parseEnvelope(toBytes(doc));
  ASSERT_EQ(Envelope::Kind::DATA, env.kind);
  EXPECT_EQ(PacketFlags::FEC_ENABLED, env.flags);
  ASSERT_TRUE(env.hasFec);
  EXPECT_EQ("hi", toString(env.data));
  EXPECT_EQ("hihihi", toString(env.fec.data));
}

TEST(BackendMode, DetectedFromModeField) {
  EXPECT_EQ(BackendMode::AUTH, detectBackendMode(toBytes("{\"mode\":\"auth\",\"user\":\"x\"}")));
  EXPECT_EQ(BackendMode::CONFIG, detectBackendMode(toBytes("{\"mode\":\"config\"}")));
  EXPECT_EQ(BackendMode::COMMAND, detectBackendMode(toBytes("{\"mode\":\"command\"}")));
}

TEST(BackendMode, TwoBitPrefixIsAccepted) {
  EXPECT_EQ(BackendMode::CONFIG, detectBackendMode(toBytes("10{\"mode\":\"config\"}")));
}

TEST(BackendMode, AnythingElseIsNone) {
  EXPECT_EQ(BackendMode::NONE, detectBackendMode(toBytes("hello")));
  EXPECT_EQ(BackendMode::NONE, detectBackendMode(toBytes("{\"mode\":\"other\"}")));
  EXPECT_EQ(BackendMode::NONE, detectBackendMode(toBytes("{\"mode\":3}")));
  EXPECT_EQ(BackendMode::NONE, detectBackendMode(Bytes()));
  EXPECT_STREQ("none", backendModeName(BackendMode::NONE));
}

TEST(JsonDocument, RecognisesWellFormedJson) {
  EXPECT_TRUE(isJsonDocument(toBytes("{\"a\":[1,2]}")));
  EXPECT_TRUE(isJsonDocument(toBytes("[1,2]")));
  EXPECT_FALSE(isJsonDocument(toBytes("{\"a\":")));
  EXPECT_FALSE(isJsonDocument(Bytes()));
}

#include <gtest/gtest.h>

#include "luma/Lib/LumaLib/Encoder.hpp"
#include "luma/Lib/LumaLib/Envelope.hpp"
#include "luma/Lib/LumaLib/Lzss.hpp"
#include "luma/Lib/LumaLib/Packet.hpp"

using namespace LumaLib;

namespace {

Packet decodeOne(const BitStream& bits) {
  const ParseResult r = decodePacket(bits);
  EXPECT_EQ(ParseStatus::OK, r.status);
  EXPECT_EQ(bits.size(), r.endIndex);
  return r.packet;
}

Bytes sequence(std::size_t n) {
  Bytes out(n);
  for (std::size_t i = 0; i < n; ++i) {
    out[i] = static_cast<std::uint8_t>(i % 251);
  }
  return out;
}

} // namespace

TEST(Encoder, SmallPayloadIsSentRaw) {
  Encoder encoder;
  std::vector<BitStream> packets;
  ASSERT_EQ(EncodeStatus::OK,
            encoder.encodeData(toTag(DataType::TEXT), toBytes("hi"), EncodeOptions(), packets));
  ASSERT_EQ(1u, packets.size());
  EXPECT_EQ(72u, packets[0].size());

  const Packet p = decodeOne(packets[0]);
  EXPECT_EQ(toTag(DataType::TEXT), p.type);
  EXPECT_EQ("hi", toString(p.payload));
}

TEST(Encoder, EnvelopeShapedPayloadIsWrapped) {
  Encoder encoder;
  const Bytes payload = toBytes("{\"sequence\":4,\"total\":10,\"data\":\"22.5C\"}");
  std::vector<BitStream> packets;
  ASSERT_EQ(EncodeStatus::OK,
            encoder.encodeData(toTag(DataType::SENSOR_DATA), payload, EncodeOptions(), packets));
  ASSERT_EQ(1u, packets.size());

  const Envelope env = parseEnvelope(decodeOne(packets[0]).payload);
  EXPECT_EQ(Envelope::Kind::DATA, env.kind);
  EXPECT_EQ(PacketFlags::NONE, env.flags);
  EXPECT_EQ(payload, env.data);
}

TEST(Encoder, LargestFramesFitReceiverLimit) {
  Encoder encoder;
  EncodeOptions options;
  options.fec = true;
  options.transmissionId = 0xFFFFFFFFu;
  std::vector<BitStream> packets;
  ASSERT_EQ(EncodeStatus::OK,
            encoder.encodeData(toTag(DataType::FILE), sequence(3 * Cfg::MAX_CHUNK_SIZE), options, packets));
  ASSERT_EQ(3u, packets.size());
  for (const BitStream& bits : packets) {
    EXPECT_LE(decodeOne(bits).payload.size(), Cfg::DEFAULT_MAX_PACKET_PAYLOAD);
  }
}

TEST(Encoder, LargePayloadIsChunked) {
  Encoder encoder;
  const Bytes payload = sequence(600);
  std::vector<BitStream> packets;
  ASSERT_EQ(EncodeStatus::OK,
            encoder.encodeData(toTag(DataType::FILE), payload, EncodeOptions(), packets));
  ASSERT_EQ(3u, packets.size());

  std::vector<Chunk> chunks;
  std::uint32_t id = 0;
  for (const BitStream& bits : packets) {
    const Packet p = decodeOne(bits);
    EXPECT_EQ(toTag(DataType::FILE), p.type);
    const Envelope env = parseEnvelope(p.payload);
    ASSERT_EQ(Envelope::Kind::CHUNK, env.kind);
    EXPECT_EQ(3u, env.total);
    id = env.id;
    Chunk c;
    c.sequence = env.sequence;
    c.total = env.total;
    c.data = env.data;
    chunks.push_back(c);
  }
  EXPECT_NE(0u, id);
  EXPECT_EQ(256u, chunks[0].data.size());
  EXPECT_EQ(88u, chunks[2].data.size());

  const ReassemblyResult r = reassembleChunks(chunks);
  ASSERT_EQ(ReassemblyStatus::COMPLETE, r.status);
  EXPECT_EQ(payload, r.data);
}

TEST(Encoder, TransmissionIdsAdvance) {
  Encoder encoder;
  EncodeOptions options;
  options.maxChunkSize = 4;
  std::vector<BitStream> packets;

  ASSERT_EQ(EncodeStatus::OK, encoder.encodeData(1, toBytes("0123456789"), options, packets));
  const std::uint32_t first = parseEnvelope(decodeOne(packets[0]).payload).id;
  ASSERT_EQ(EncodeStatus::OK, encoder.encodeData(1, toBytes("0123456789"), options, packets));
  const std::uint32_t second = parseEnvelope(decodeOne(packets[0]).payload).id;
  EXPECT_NE(first, second);

  options.transmissionId = 77;
  ASSERT_EQ(EncodeStatus::OK, encoder.encodeData(1, toBytes("0123456789"), options, packets));
  EXPECT_EQ(3u, packets.size());
  EXPECT_EQ(77u, parseEnvelope(decodeOne(packets[2]).payload).id);
}

TEST(Encoder, CompressedPayloadUsesDataEnvelope) {
  Encoder encoder;
  EncodeOptions options;
  options.compress = true;
  const std::string text = "abcabcabcabcabcabcabcabcabcabc";
  std::vector<BitStream> packets;
  ASSERT_EQ(EncodeStatus::OK, encoder.encodeData(1, toBytes(text), options, packets));
  ASSERT_EQ(1u, packets.size());

  const Envelope env = parseEnvelope(decodeOne(packets[0]).payload);
  ASSERT_EQ(Envelope::Kind::DATA, env.kind);
  EXPECT_EQ(PacketFlags::COMPRESSED, env.flags);
  Bytes plain;
  ASSERT_TRUE(lzssDecompress(env.data, plain));
  EXPECT_EQ(text, toString(plain));
}

TEST(Encoder, FecPayloadCarriesBlock) {
  Encoder encoder;
  EncodeOptions options;
  options.fec = true;
  std::vector<BitStream> packets;
  ASSERT_EQ(EncodeStatus::OK, encoder.encodeData(1, toBytes("ping"), options, packets));
  ASSERT_EQ(1u, packets.size());

  const Envelope env = parseEnvelope(decodeOne(packets[0]).payload);
  ASSERT_EQ(Envelope::Kind::DATA, env.kind);
  EXPECT_EQ(PacketFlags::FEC_ENABLED, env.flags);
  ASSERT_TRUE(env.hasFec);
  const FecResult r = RepetitionFec().decode(env.fec);
  EXPECT_TRUE(r.success);
  EXPECT_EQ("ping", toString(r.data));
}

TEST(Encoder, ZeroChunkSizeIsRefused) {
  Encoder encoder;
  EncodeOptions options;
  options.maxChunkSize = 0;
  std::vector<BitStream> packets(1);
  EXPECT_EQ(EncodeStatus::INVALID_CHUNK_SIZE, encoder.encodeData(1, toBytes("x"), options, packets));
  EXPECT_TRUE(packets.empty());
}

TEST(Encoder, OversizedUnchunkedPayloadIsRefused) {
  Encoder encoder;
  EncodeOptions options;
  options.maxChunkSize = Cfg::MAX_FRAME_PAYLOAD + 10;
  std::vector<BitStream> packets;
  EXPECT_EQ(EncodeStatus::PAYLOAD_TOO_LARGE,
            encoder.encodeData(1, Bytes(Cfg::MAX_FRAME_PAYLOAD + 1, 0x41), options, packets));
  EXPECT_TRUE(packets.empty());
}

TEST(Encoder, DurationAtOneHundredMsPerBit) {
  EXPECT_EQ(7200u, transmissionDurationMs(72));
  EXPECT_EQ(720u, transmissionDurationMs(72, 10));

  std::vector<BitStream> packets(2, BitStream(72, 0));
  EXPECT_EQ(144u, concatenate(packets).size());
}

#include "luma/Lib/LumaLib/Encoder.hpp"

#include <memory>
#include <utility>

#include "luma/Lib/LumaLib/Chunker.hpp"
#include "luma/Lib/LumaLib/Envelope.hpp"
#include "luma/Lib/LumaLib/Lzss.hpp"
#include "luma/Lib/LumaLib/Packet.hpp"

namespace LumaLib {

const char* encodeStatusName(EncodeStatus status) {
  switch (status) {
    case EncodeStatus::OK:
      return "OK";
    case EncodeStatus::INVALID_CHUNK_SIZE:
      return "InvalidChunkSize";
    case EncodeStatus::PAYLOAD_TOO_LARGE:
      return "PayloadTooLarge";
    case EncodeStatus::COMPRESSION_FAILED:
      return "CompressionFailed";
  }
  return "Unknown";
}

Encoder::Encoder(std::unique_ptr<FecCodec> fec)
  : m_fec(std::move(fec))
  , m_nextId(1)
{
  if (!m_fec) {
    m_fec = std::make_unique<RepetitionFec>();
  }
}

std::uint32_t Encoder::nextTransmissionId() {
  const std::uint32_t id = m_nextId++;
  if (m_nextId == 0) {
    m_nextId = 1;
  }
  return id;
}

EncodeStatus Encoder::encodeData(
    std::uint8_t type,
    const Bytes& payload,
    const EncodeOptions& options,
    std::vector<BitStream>& packets
) {
  packets.clear();
  if (options.maxChunkSize == 0) {
    return EncodeStatus::INVALID_CHUNK_SIZE;
  }

  std::uint8_t flags = PacketFlags::NONE;
  Bytes data;
  if (options.compress) {
    if (!lzssCompress(payload, data)) {
      return EncodeStatus::COMPRESSION_FAILED;
    }
    flags |= PacketFlags::COMPRESSED;
  } else {
    data = payload;
  }
  if (options.fec) {
    flags |= PacketFlags::FEC_ENABLED;
  }

  std::vector<Bytes> frames;
  if (data.size() > options.maxChunkSize) {
    std::vector<Chunk> chunks;
    if (!chunkPayload(data, options.maxChunkSize, chunks)) {
      return EncodeStatus::INVALID_CHUNK_SIZE;
    }
    const std::uint32_t id =
        (options.transmissionId != 0) ? options.transmissionId : this->nextTransmissionId();

    for (const Chunk& c : chunks) {
      if (options.fec) {
        const FecBlock block = m_fec->encode(c.data);
        frames.push_back(serializeChunkEnvelope(id, c, flags, &block));
      } else {
        frames.push_back(serializeChunkEnvelope(id, c, flags, nullptr));
      }
    }
  } else if (flags != PacketFlags::NONE) {
    if (options.fec) {
      const FecBlock block = m_fec->encode(data);
      frames.push_back(serializeDataEnvelope(flags, data, &block));
    } else {
      frames.push_back(serializeDataEnvelope(flags, data, nullptr));
    }
  } else if (parseEnvelope(data).kind != Envelope::Kind::RAW) {
    // Sent bare, the receiver would read the payload as an envelope
    frames.push_back(serializeDataEnvelope(flags, data, nullptr));
  } else {
    frames.push_back(std::move(data));
  }

  std::vector<BitStream> out;
  out.reserve(frames.size());
  for (const Bytes& frame : frames) {
    BitStream bits;
    if (!encodePacket(type, frame, bits)) {
      return EncodeStatus::PAYLOAD_TOO_LARGE;
    }
    out.push_back(std::move(bits));
  }

  packets.swap(out);
  return EncodeStatus::OK;
}

BitStream concatenate(const std::vector<BitStream>& packets) {
  BitStream out;
  for (const BitStream& p : packets) {
    out.insert(out.end(), p.begin(), p.end());
  }
  return out;
}

std::uint64_t transmissionDurationMs(std::size_t bitCount, std::uint32_t bitPeriodMs) {
  return static_cast<std::uint64_t>(bitCount) * bitPeriodMs;
}

} // namespace LumaLib

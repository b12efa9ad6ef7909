#include "luma/Lib/LumaLib/Packet.hpp"

#include "luma/Lib/LumaLib/Bits.hpp"
#include "luma/Lib/LumaLib/Crc16.hpp"

#include <utility>

namespace LumaLib {

namespace {

constexpr std::size_t HEADER_BITS = Cfg::TYPE_BITS + Cfg::LENGTH_BITS;
constexpr std::size_t TRAILER_BITS = Cfg::CHECKSUM_BITS + Cfg::MARKER_BITS;

bool markerAt(const BitStream& bits, std::size_t index, std::uint8_t marker) {
  return fromBinary(bits, index, Cfg::MARKER_BITS) == marker;
}

} // namespace

const char* parseStatusName(ParseStatus status) {
  switch (status) {
    case ParseStatus::OK:
      return "OK";
    case ParseStatus::START_FRAME_NOT_FOUND:
      return "StartFrameNotFound";
    case ParseStatus::INCOMPLETE_FRAME:
      return "IncompleteFrame";
    case ParseStatus::INVALID_LENGTH:
      return "InvalidLength";
    case ParseStatus::INVALID_END_FRAME:
      return "InvalidEndFrame";
    case ParseStatus::CHECKSUM_MISMATCH:
      return "ChecksumMismatch";
  }
  return "Unknown";
}

std::size_t packetBitLength(std::size_t payloadLen) {
  return Cfg::MIN_PACKET_BITS + payloadLen * 8;
}

bool encodePacket(std::uint8_t type, const Bytes& payload, BitStream& out) {
  if (payload.size() > Cfg::MAX_FRAME_PAYLOAD) {
    return false;
  }

  out.reserve(out.size() + packetBitLength(payload.size()));
  toBinary(Cfg::START_MARKER, Cfg::MARKER_BITS, out);
  toBinary(type, Cfg::TYPE_BITS, out);
  toBinary(static_cast<std::uint32_t>(payload.size()), Cfg::LENGTH_BITS, out);
  appendBytes(payload, out);
  toBinary(crc16(payload), Cfg::CHECKSUM_BITS, out);
  toBinary(Cfg::END_MARKER, Cfg::MARKER_BITS, out);
  return true;
}

ParseResult decodePacket(const BitStream& bits, std::size_t startOffset, std::size_t maxPayload) {
  ParseResult r{};
  const std::size_t n = bits.size();

  // 1) Synchronize on the start marker
  std::size_t pos = startOffset;
  bool found = false;
  while (pos + Cfg::MARKER_BITS <= n) {
    if (markerAt(bits, pos, Cfg::START_MARKER)) {
      found = true;
      break;
    }
    ++pos;
  }
  if (!found) {
    r.status = ParseStatus::START_FRAME_NOT_FOUND;
    r.scannedTo = pos;
    return r;
  }
  r.startIndex = pos;
  pos += Cfg::MARKER_BITS;

  // 2) Header
  if (pos + HEADER_BITS > n) {
    r.status = ParseStatus::INCOMPLETE_FRAME;
    return r;
  }
  const std::uint8_t type = static_cast<std::uint8_t>(fromBinary(bits, pos, Cfg::TYPE_BITS));
  pos += Cfg::TYPE_BITS;
  const std::size_t length = fromBinary(bits, pos, Cfg::LENGTH_BITS);
  pos += Cfg::LENGTH_BITS;

  if (length > maxPayload) {
    r.status = ParseStatus::INVALID_LENGTH;
    return r;
  }

  // 3) Payload + trailer must be fully buffered before we read them
  if (pos + length * 8 + TRAILER_BITS > n) {
    r.status = ParseStatus::INCOMPLETE_FRAME;
    return r;
  }
  Bytes payload = packBytes(bits, pos, length);
  pos += length * 8;

  const std::uint16_t received = static_cast<std::uint16_t>(fromBinary(bits, pos, Cfg::CHECKSUM_BITS));
  pos += Cfg::CHECKSUM_BITS;

  // 4) End marker, then integrity
  if (!markerAt(bits, pos, Cfg::END_MARKER)) {
    r.status = ParseStatus::INVALID_END_FRAME;
    return r;
  }
  pos += Cfg::MARKER_BITS;

  if (crc16(payload) != received) {
    r.status = ParseStatus::CHECKSUM_MISMATCH;
    return r;
  }

  r.status = ParseStatus::OK;
  r.packet.type = type;
  r.packet.payload = std::move(payload);
  r.packet.checksum = received;
  r.endIndex = pos;
  return r;
}

} // namespace LumaLib

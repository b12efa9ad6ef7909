#ifndef LUMA_LIB_LUMA_CFG_HPP
#define LUMA_LIB_LUMA_CFG_HPP

#include <cstddef>
#include <cstdint>

namespace LumaLib {
namespace Cfg {

  // ---------- Frame layout ----------
  // START | TYPE | LENGTH | PAYLOAD | CHECKSUM | END
  //   8      8      16      8*len       16       8

  constexpr std::uint8_t START_MARKER = 0xFF;  // 11111111
  constexpr std::uint8_t END_MARKER   = 0x00;  // 00000000

  constexpr unsigned MARKER_BITS   = 8;
  constexpr unsigned TYPE_BITS     = 8;
  constexpr unsigned LENGTH_BITS   = 16;
  constexpr unsigned CHECKSUM_BITS = 16;

  //! Bits in a frame with an empty payload
  constexpr std::size_t MIN_PACKET_BITS =
      MARKER_BITS + TYPE_BITS + LENGTH_BITS + CHECKSUM_BITS + MARKER_BITS;

  //! Largest payload the 16-bit length field can announce
  constexpr std::size_t MAX_FRAME_PAYLOAD = 0xFFFF;

  // ---------- Timing / segmentation ----------

  constexpr std::uint32_t BIT_PERIOD_MS = 100;
  constexpr std::size_t MAX_CHUNK_SIZE = 256;

  // ---------- Legacy mode ----------

  //! 8 data bits followed by one even-parity bit
  constexpr unsigned LEGACY_UNIT_BITS = 9;

  // ---------- Receiver defaults ----------

  //! Repetition FEC sends every byte three times
  constexpr std::size_t FEC_EXPANSION = 3;

  //! JSON keys and numbers of a chunk envelope around its base64 body
  constexpr std::size_t MAX_ENVELOPE_OVERHEAD = 256;

  //! Largest payload the sender emits: a full chunk, FEC-expanded, base64, enveloped
  constexpr std::size_t MAX_SENDER_PAYLOAD =
      ((MAX_CHUNK_SIZE * FEC_EXPANSION + 2) / 3) * 4 + MAX_ENVELOPE_OVERHEAD;

  //! Largest payload the receiver accepts before treating the header as noise
  constexpr std::size_t DEFAULT_MAX_PACKET_PAYLOAD = MAX_SENDER_PAYLOAD;

  //! Upper bound on a decompressed message
  constexpr std::size_t DEFAULT_MAX_MESSAGE_BYTES = 64 * 1024;

  //! Packet-mode buffer cap: room for two of the largest accepted frames
  constexpr std::size_t DEFAULT_MAX_BUFFER_BITS =
      2 * (MIN_PACKET_BITS + DEFAULT_MAX_PACKET_PAYLOAD * 8);

  constexpr std::uint64_t DEFAULT_REASSEMBLY_TIMEOUT_MS = 60000;
  constexpr std::size_t DEFAULT_MAX_PENDING_GROUPS = 16;

  // ---------- Calibration ----------

  constexpr std::uint8_t DEFAULT_THRESHOLD = 128;
  constexpr std::uint8_t DEFAULT_CALIBRATION_MARGIN = 50;
  constexpr std::size_t DEFAULT_MAX_CALIBRATION_SAMPLES = 1024;

} // namespace Cfg

// Payload envelope flag bits
namespace PacketFlags {
  constexpr std::uint8_t NONE        = 0x00;
  constexpr std::uint8_t COMPRESSED  = 0x01;  // payload is LZSS-compressed
  constexpr std::uint8_t FEC_ENABLED = 0x02;  // payload carries an FEC block
}

} // namespace LumaLib

#endif

#ifndef LUMA_LIB_PACKET_HPP
#define LUMA_LIB_PACKET_HPP

#include <cstddef>
#include <cstdint>

#include "luma/Lib/LumaLib/LumaLib.hpp"

namespace LumaLib {

  //! A validated frame. Only ever returned fully populated.
  struct Packet {
    std::uint8_t type = 0;
    Bytes payload;
    std::uint16_t checksum = 0;
  };

  /**
   * Outcome of decodePacket.
   *
   *  OK                     all checks passed
   *  START_FRAME_NOT_FOUND  no start marker in the searched window (keep buffering)
   *  INCOMPLETE_FRAME       start found but the frame is not fully received yet
   *                         (keep buffering)
   *  INVALID_LENGTH         header announces more payload than accepted
   *  INVALID_END_FRAME      bits after the checksum are not the end marker
   *  CHECKSUM_MISMATCH      CRC of the payload disagrees with the checksum field
   */
  enum class ParseStatus : std::int32_t {
    OK                    =  0,
    START_FRAME_NOT_FOUND = -1,
    INCOMPLETE_FRAME      = -2,
    INVALID_LENGTH        = -3,
    INVALID_END_FRAME     = -4,
    CHECKSUM_MISMATCH     = -5,
  };

  struct ParseResult {
    ParseStatus status = ParseStatus::START_FRAME_NOT_FOUND;
    Packet packet;               // meaningful only when status == OK
    std::size_t startIndex = 0;  // first bit of the start marker, when one was found
    std::size_t endIndex = 0;    // one past the end marker, when status == OK
    std::size_t scannedTo = 0;   // next window to examine after START_FRAME_NOT_FOUND
  };

  const char* parseStatusName(ParseStatus status);

  //! START_FRAME_NOT_FOUND and INCOMPLETE_FRAME just mean "keep buffering"
  inline bool isWaitStatus(ParseStatus status) {
    return status == ParseStatus::START_FRAME_NOT_FOUND ||
           status == ParseStatus::INCOMPLETE_FRAME;
  }

  //! Total on-air bits for a payload of payloadLen bytes
  std::size_t packetBitLength(std::size_t payloadLen);

  /**
   * Append START | TYPE | LENGTH | PAYLOAD | CRC16 | END to out.
   *
   * Returns false (out untouched) only when payload is larger than the
   * 16-bit length field allows.
   */
  bool encodePacket(std::uint8_t type, const Bytes& payload, BitStream& out);

  /**
   * Scan bits for the first start marker at or after startOffset and
   * parse the frame that follows it.
   *
   * Leading noise before the marker is skipped. Truncated input is
   * reported as INCOMPLETE_FRAME, never read past. A header whose length
   * exceeds maxPayload is rejected with INVALID_LENGTH.
   */
  ParseResult decodePacket(const BitStream& bits,
                           std::size_t startOffset = 0,
                           std::size_t maxPayload = Cfg::MAX_FRAME_PAYLOAD);

} // namespace LumaLib

#endif

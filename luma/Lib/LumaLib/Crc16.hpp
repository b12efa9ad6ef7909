#ifndef LUMA_LIB_CRC16_HPP
#define LUMA_LIB_CRC16_HPP

#include <cstddef>
#include <cstdint>

#include "luma/Lib/LumaLib/LumaLib.hpp"

namespace LumaLib {

  constexpr std::uint16_t CRC16_INIT = 0xFFFF;
  constexpr std::uint16_t CRC16_POLY = 0x1021;

  /**
   * CRC-16-CCITT (init 0xFFFF, poly 0x1021, MSB first, no final XOR).
   *
   * Every frame's checksum field is this value computed over the
   * payload bytes only.
   */
  std::uint16_t crc16(const std::uint8_t* data, std::size_t len);

  inline std::uint16_t crc16(const Bytes& data) {
    return crc16(data.data(), data.size());
  }

} // namespace LumaLib

#endif

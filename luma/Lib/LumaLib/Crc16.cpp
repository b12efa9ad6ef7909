#include "luma/Lib/LumaLib/Crc16.hpp"

namespace LumaLib {

std::uint16_t crc16(const std::uint8_t* data, std::size_t len) {
  std::uint16_t crc = CRC16_INIT;
  for (std::size_t i = 0; i < len; ++i) {
    crc ^= static_cast<std::uint16_t>(data[i]) << 8;
    for (int b = 0; b < 8; ++b) {
      crc = (crc & 0x8000u) ? static_cast<std::uint16_t>((crc << 1) ^ CRC16_POLY)
                            : static_cast<std::uint16_t>(crc << 1);
    }
  }
  return crc;
}

} // namespace LumaLib

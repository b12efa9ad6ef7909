#ifndef LUMA_LIB_PARITY_HPP
#define LUMA_LIB_PARITY_HPP

#include <cstddef>
#include <cstdint>
#include <string>

#include "luma/Lib/LumaLib/LumaLib.hpp"

namespace LumaLib {

  //! Even-parity bit for count bits: 1 when the number of ones is odd
  std::uint8_t parityBit(const std::uint8_t* bits, std::size_t count);

  /**
   * True when a legacy unit (8 data bits + 1 parity bit) holds an even
   * number of ones. Units of any other length are invalid.
   */
  bool validateParity(const std::uint8_t* bits, std::size_t count);

  //! 9-bit units for every byte of text, without framing
  BitStream encodeLegacyUnits(const std::string& text);

  /**
   * Full legacy frame: START marker, one 9-bit unit per character,
   * END marker.
   */
  BitStream encodeLegacyMessage(const std::string& text);

} // namespace LumaLib

#endif

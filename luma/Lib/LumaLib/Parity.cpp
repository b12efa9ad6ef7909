#include "luma/Lib/LumaLib/Parity.hpp"

#include "luma/Lib/LumaLib/Bits.hpp"

namespace LumaLib {

std::uint8_t parityBit(const std::uint8_t* bits, std::size_t count) {
  std::size_t ones = 0;
  for (std::size_t i = 0; i < count; ++i) {
    if (bits[i] != 0) {
      ++ones;
    }
  }
  return static_cast<std::uint8_t>(ones % 2);
}

bool validateParity(const std::uint8_t* bits, std::size_t count) {
  if (count != Cfg::LEGACY_UNIT_BITS) {
    return false;
  }
  return parityBit(bits, count) == 0;
}

BitStream encodeLegacyUnits(const std::string& text) {
  BitStream out;
  out.reserve(text.size() * Cfg::LEGACY_UNIT_BITS);
  for (char c : text) {
    const std::size_t unitStart = out.size();
    toBinary(static_cast<std::uint8_t>(c), 8, out);
    out.push_back(parityBit(out.data() + unitStart, 8));
  }
  return out;
}

BitStream encodeLegacyMessage(const std::string& text) {
  BitStream out;
  toBinary(Cfg::START_MARKER, Cfg::MARKER_BITS, out);
  const BitStream units = encodeLegacyUnits(text);
  out.insert(out.end(), units.begin(), units.end());
  toBinary(Cfg::END_MARKER, Cfg::MARKER_BITS, out);
  return out;
}

} // namespace LumaLib

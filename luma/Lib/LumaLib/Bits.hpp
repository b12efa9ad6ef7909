#ifndef LUMA_LIB_BITS_HPP
#define LUMA_LIB_BITS_HPP

#include <cstddef>
#include <cstdint>
#include <string>

#include "luma/Lib/LumaLib/LumaLib.hpp"

namespace LumaLib {

  /**
   * Append the fixed-width, MSB-first binary form of value to out.
   *
   * Returns false (and leaves out untouched) when width is 0 or larger
   * than 32, or when value does not fit in width bits.
   */
  bool toBinary(std::uint32_t value, unsigned width, BitStream& out);

  /**
   * Inverse of toBinary: interpret count bits (MSB first) starting at bits.
   * Count must be between 1 and 32; every element is treated as 0 or non-zero.
   */
  std::uint32_t fromBinary(const std::uint8_t* bits, std::size_t count);

  //! Convenience overload reading width bits of stream at offset
  std::uint32_t fromBinary(const BitStream& stream, std::size_t offset, unsigned width);

  //! Expand bytes into 8 bits each, big-endian bit order within a byte
  void appendBytes(const Bytes& bytes, BitStream& out);

  //! Pack groups of 8 bits starting at offset back into bytes
  Bytes packBytes(const BitStream& stream, std::size_t offset, std::size_t byteCount);

  //! "0101..." text form, for logging and tests
  std::string toBitString(const BitStream& stream);

  /**
   * Parse a "0101..." string. Returns false on any character other
   * than '0' or '1'.
   */
  bool fromBitString(const std::string& text, BitStream& out);

} // namespace LumaLib

#endif

#include "luma/Lib/LumaLib/Bits.hpp"

namespace LumaLib {

bool toBinary(std::uint32_t value, unsigned width, BitStream& out) {
  if (width == 0 || width > 32) {
    return false;
  }
  if (width < 32 && (value >> width) != 0) {
    return false; // does not fit
  }

  for (unsigned i = width; i > 0; --i) {
    out.push_back(static_cast<std::uint8_t>((value >> (i - 1)) & 0x1u));
  }
  return true;
}

std::uint32_t fromBinary(const std::uint8_t* bits, std::size_t count) {
  std::uint32_t value = 0;
  for (std::size_t i = 0; i < count && i < 32; ++i) {
    value = (value << 1) | (bits[i] != 0 ? 1u : 0u);
  }
  return value;
}

std::uint32_t fromBinary(const BitStream& stream, std::size_t offset, unsigned width) {
  return fromBinary(stream.data() + offset, width);
}

void appendBytes(const Bytes& bytes, BitStream& out) {
  out.reserve(out.size() + bytes.size() * 8);
  for (std::uint8_t b : bytes) {
    for (int bit = 7; bit >= 0; --bit) {
      out.push_back(static_cast<std::uint8_t>((b >> bit) & 0x1u));
    }
  }
}

Bytes packBytes(const BitStream& stream, std::size_t offset, std::size_t byteCount) {
  Bytes out;
  out.reserve(byteCount);
  for (std::size_t i = 0; i < byteCount; ++i) {
    out.push_back(static_cast<std::uint8_t>(fromBinary(stream.data() + offset + i * 8, 8)));
  }
  return out;
}

std::string toBitString(const BitStream& stream) {
  std::string text;
  text.reserve(stream.size());
  for (std::uint8_t bit : stream) {
    text.push_back(bit != 0 ? '1' : '0');
  }
  return text;
}

bool fromBitString(const std::string& text, BitStream& out) {
  BitStream parsed;
  parsed.reserve(text.size());
  for (char c : text) {
    if (c == '0') {
      parsed.push_back(0);
    } else if (c == '1') {
      parsed.push_back(1);
    } else {
      return false;
    }
  }
  out.insert(out.end(), parsed.begin(), parsed.end());
  return true;
}

} // namespace LumaLib

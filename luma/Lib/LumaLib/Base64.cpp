#include "luma/Lib/LumaLib/Base64.hpp"

#include <cstdint>

namespace LumaLib {

namespace {

const char ALPHABET[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int sextet(char c) {
  if (c >= 'A' && c <= 'Z') return c - 'A';
  if (c >= 'a' && c <= 'z') return c - 'a' + 26;
  if (c >= '0' && c <= '9') return c - '0' + 52;
  if (c == '+') return 62;
  if (c == '/') return 63;
  return -1;
}

} // namespace

std::string base64Encode(const Bytes& data) {
  std::string out;
  out.reserve(((data.size() + 2) / 3) * 4);

  std::size_t i = 0;
  for (; i + 3 <= data.size(); i += 3) {
    const std::uint32_t v = (static_cast<std::uint32_t>(data[i]) << 16) |
                            (static_cast<std::uint32_t>(data[i + 1]) << 8) |
                            static_cast<std::uint32_t>(data[i + 2]);
    out.push_back(ALPHABET[(v >> 18) & 0x3Fu]);
    out.push_back(ALPHABET[(v >> 12) & 0x3Fu]);
    out.push_back(ALPHABET[(v >> 6) & 0x3Fu]);
    out.push_back(ALPHABET[v & 0x3Fu]);
  }

  const std::size_t rest = data.size() - i;
  if (rest == 1) {
    const std::uint32_t v = static_cast<std::uint32_t>(data[i]) << 16;
    out.push_back(ALPHABET[(v >> 18) & 0x3Fu]);
    out.push_back(ALPHABET[(v >> 12) & 0x3Fu]);
    out += "==";
  } else if (rest == 2) {
    const std::uint32_t v = (static_cast<std::uint32_t>(data[i]) << 16) |
                            (static_cast<std::uint32_t>(data[i + 1]) << 8);
    out.push_back(ALPHABET[(v >> 18) & 0x3Fu]);
    out.push_back(ALPHABET[(v >> 12) & 0x3Fu]);
    out.push_back(ALPHABET[(v >> 6) & 0x3Fu]);
    out.push_back('=');
  }
  return out;
}

bool base64Decode(const std::string& text, Bytes& out) {
  if (text.size() % 4 != 0) {
    return false;
  }

  Bytes decoded;
  decoded.reserve((text.size() / 4) * 3);
  for (std::size_t i = 0; i < text.size(); i += 4) {
    const bool last = (i + 4 == text.size());
    int pad = 0;
    std::uint32_t v = 0;
    for (std::size_t k = 0; k < 4; ++k) {
      const char c = text[i + k];
      int s = 0;
      if (c == '=') {
        // only the last one or two characters of the final group may be padding
        if (!last || k < 2) {
          return false;
        }
        ++pad;
      } else {
        if (pad > 0) {
          return false;
        }
        s = sextet(c);
        if (s < 0) {
          return false;
        }
      }
      v = (v << 6) | static_cast<std::uint32_t>(s);
    }

    decoded.push_back(static_cast<std::uint8_t>((v >> 16) & 0xFFu));
    if (pad < 2) {
      decoded.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFFu));
    }
    if (pad < 1) {
      decoded.push_back(static_cast<std::uint8_t>(v & 0xFFu));
    }
  }

  out.swap(decoded);
  return true;
}

} // namespace LumaLib

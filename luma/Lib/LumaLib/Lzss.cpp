#include "luma/Lib/LumaLib/Lzss.hpp"

#include <algorithm>
#include <cstdint>

namespace LumaLib {

namespace {

constexpr std::size_t WINDOW_SIZE = 4096;
constexpr std::size_t MIN_MATCH = 3;
constexpr std::size_t MAX_MATCH = 18;
constexpr unsigned GROUP_TOKENS = 8;
constexpr std::size_t MATCH_TOKEN_BYTES = 3;

struct Match {
  std::size_t offset = 0;
  std::size_t length = 0;
};

// Longest run at pos repeating earlier input; nearest source wins ties
Match longestMatch(const Bytes& in, std::size_t pos) {
  Match best;
  const std::size_t limit = std::min(MAX_MATCH, in.size() - pos);
  if (limit < MIN_MATCH) {
    return best;
  }

  const std::size_t oldest = (pos > WINDOW_SIZE) ? pos - WINDOW_SIZE : 0;
  for (std::size_t src = pos; src-- > oldest;) {
    std::size_t len = 0;
    while (len < limit && in[src + len] == in[pos + len]) {
      ++len;
    }
    if (len > best.length) {
      best.offset = pos - src;
      best.length = len;
      if (len == limit) {
        break;
      }
    }
  }

  if (best.length < MIN_MATCH) {
    return Match();
  }
  return best;
}

// Appends tokens to out, opening a new flag byte every eight tokens
class TokenWriter {
  public:
    explicit TokenWriter(Bytes& out) : m_out(out), m_flagIndex(0), m_tokens(GROUP_TOKENS) {}

    void literal(std::uint8_t value) {
      this->nextSlot();
      m_out.push_back(value);
    }

    void match(const Match& m) {
      const unsigned slot = this->nextSlot();
      m_out[m_flagIndex] = static_cast<std::uint8_t>(m_out[m_flagIndex] | (1u << slot));
      m_out.push_back(static_cast<std::uint8_t>(m.offset & 0xFFu));
      m_out.push_back(static_cast<std::uint8_t>((m.offset >> 8) & 0xFFu));
      m_out.push_back(static_cast<std::uint8_t>(m.length));
    }

  private:
    unsigned nextSlot() {
      if (m_tokens == GROUP_TOKENS) {
        m_flagIndex = m_out.size();
        m_out.push_back(0);
        m_tokens = 0;
      }
      return m_tokens++;
    }

    Bytes& m_out;
    std::size_t m_flagIndex;
    unsigned m_tokens;
};

} // namespace

bool lzssCompress(const Bytes& in, Bytes& out) {
  out.clear();
  TokenWriter writer(out);

  std::size_t pos = 0;
  while (pos < in.size()) {
    const Match m = longestMatch(in, pos);
    if (m.length == 0) {
      writer.literal(in[pos]);
      ++pos;
    } else {
      writer.match(m);
      pos += m.length;
    }
  }
  return true;
}

bool lzssDecompress(const Bytes& in, Bytes& out, std::size_t maxOutput) {
  out.clear();
  std::size_t pos = 0;

  while (pos < in.size()) {
    const std::uint8_t flags = in[pos++];
    for (unsigned slot = 0; slot < GROUP_TOKENS && pos < in.size(); ++slot) {
      if (((flags >> slot) & 0x1u) == 0) {
        if (out.size() >= maxOutput) {
          return false;
        }
        out.push_back(in[pos++]);
        continue;
      }

      if (in.size() - pos < MATCH_TOKEN_BYTES) {
        return false;
      }
      const std::size_t offset = static_cast<std::size_t>(in[pos]) |
                                 (static_cast<std::size_t>(in[pos + 1]) << 8);
      const std::size_t length = in[pos + 2];
      pos += MATCH_TOKEN_BYTES;

      if (offset == 0 || offset > WINDOW_SIZE || offset > out.size() ||
          length < MIN_MATCH || length > MAX_MATCH) {
        return false;
      }
      if (length > maxOutput - out.size()) {
        return false;
      }

      // Source may overlap the bytes being written
      const std::size_t src = out.size() - offset;
      for (std::size_t k = 0; k < length; ++k) {
        out.push_back(out[src + k]);
      }
    }
  }
  return true;
}

} // namespace LumaLib

#ifndef LUMA_LIB_LZSS_HPP
#define LUMA_LIB_LZSS_HPP

#include <cstddef>

#include "luma/Lib/LumaLib/LumaLib.hpp"

namespace LumaLib {

  /**
   * LZSS payload compressor used for the COMPRESSED envelope flag.
   *
   * Stream format:
   *  - groups of up to 8 tokens, each group preceded by one flag byte
   *  - flag bit i (LSB first) = 1: match token  [offLo][offHi][len]
   *                           = 0: literal token [byte]
   *  - offset counts back from the current output end, 1..4096
   *  - length 3..18
   *
   * Returns false only on internal error; out is cleared first.
   */
  bool lzssCompress(const Bytes& in, Bytes& out);

  /**
   * Inverse of lzssCompress.
   *
   * Returns false on a truncated token, an offset or length outside the
   * format's range, an offset reaching before the start of the output,
   * or output that would grow past maxOutput. out is cleared first.
   */
  bool lzssDecompress(const Bytes& in, Bytes& out,
                      std::size_t maxOutput = Cfg::DEFAULT_MAX_MESSAGE_BYTES);

} // namespace LumaLib

#endif

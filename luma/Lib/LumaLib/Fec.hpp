#ifndef LUMA_LIB_FEC_HPP
#define LUMA_LIB_FEC_HPP

#include <cstdint>
#include <string>

#include "luma/Lib/LumaLib/LumaLib.hpp"

namespace LumaLib {

  //! Encoded form of a protected payload as carried in an envelope
  struct FecBlock {
    std::string scheme;        // codec identifier, e.g. "rep3"
    std::uint32_t length = 0;  // unencoded payload length in bytes
    Bytes data;                // encoded bytes
  };

  /**
   * Result of FecCodec::decode.
   *
   * data always holds the best available bytes: corrected when success
   * is true, a best-effort reconstruction (or the raw encoded bytes when
   * the scheme is unknown) otherwise.
   */
  struct FecResult {
    bool success = false;
    Bytes data;
    std::uint32_t errorsCorrected = 0;
  };

  //! Pluggable forward-error-correction algorithm
  class FecCodec {
    public:
      virtual ~FecCodec() = default;

      virtual const char* scheme() const = 0;
      virtual FecBlock encode(const Bytes& data) const = 0;
      virtual FecResult decode(const FecBlock& block) const = 0;
  };

  /**
   * Triple repetition code: every byte is sent three times.
   *
   * Two agreeing copies win and count as one corrected error when the
   * third differs. Three disagreeing copies cannot be corrected; the
   * bitwise majority is used and the decode reports failure.
   */
  class RepetitionFec : public FecCodec {
    public:
      const char* scheme() const override;
      FecBlock encode(const Bytes& data) const override;
      FecResult decode(const FecBlock& block) const override;
  };

} // namespace LumaLib

#endif

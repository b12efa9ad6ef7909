#ifndef LUMA_LIB_ENCODER_HPP
#define LUMA_LIB_ENCODER_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "luma/Lib/LumaLib/Fec.hpp"
#include "luma/Lib/LumaLib/LumaLib.hpp"

namespace LumaLib {

  struct EncodeOptions {
    bool compress = false;
    bool fec = false;
    std::size_t maxChunkSize = Cfg::MAX_CHUNK_SIZE;
    std::uint32_t transmissionId = 0;  // 0: let the encoder assign one
  };

  /**
   *  OK                   packets produced
   *  INVALID_CHUNK_SIZE   maxChunkSize is 0
   *  PAYLOAD_TOO_LARGE    an envelope would not fit the 16-bit length field
   *  COMPRESSION_FAILED   the LZSS encoder rejected the payload
   */
  enum class EncodeStatus : std::int32_t {
    OK                 =  0,
    INVALID_CHUNK_SIZE = -1,
    PAYLOAD_TOO_LARGE  = -2,
    COMPRESSION_FAILED = -3,
  };

  const char* encodeStatusName(EncodeStatus status);

  /**
   * Sender side of the link.
   *
   * Payloads within maxChunkSize and without flags go out as a single
   * raw frame, unless the bytes themselves would parse as an envelope;
   * those are wrapped in a tagged data envelope. Compression (LZSS) is applied first, then the payload is
   * split into chunk envelopes when it exceeds maxChunkSize, and each
   * data unit is FEC-protected when requested.
   */
  class Encoder {
    public:
      //! Uses RepetitionFec when fec is null
      explicit Encoder(std::unique_ptr<FecCodec> fec = nullptr);

      EncodeStatus encodeData(
          std::uint8_t type,
          const Bytes& payload,
          const EncodeOptions& options,
          std::vector<BitStream>& packets
      );

      //! Ids are never 0 so an explicit id is distinguishable from legacy chunks
      std::uint32_t nextTransmissionId();

    private:
      std::unique_ptr<FecCodec> m_fec;
      std::uint32_t m_nextId;
  };

  //! All packets back to back, as handed to the flash-timing driver
  BitStream concatenate(const std::vector<BitStream>& packets);

  //! Airtime of bitCount bits at the given bit period
  std::uint64_t transmissionDurationMs(std::size_t bitCount,
                                       std::uint32_t bitPeriodMs = Cfg::BIT_PERIOD_MS);

} // namespace LumaLib

#endif

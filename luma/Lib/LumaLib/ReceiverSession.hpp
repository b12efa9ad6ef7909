#ifndef LUMA_LIB_RECEIVER_SESSION_HPP
#define LUMA_LIB_RECEIVER_SESSION_HPP

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "luma/Lib/LumaLib/Calibration.hpp"
#include "luma/Lib/LumaLib/Chunker.hpp"
#include "luma/Lib/LumaLib/Envelope.hpp"
#include "luma/Lib/LumaLib/Fec.hpp"
#include "luma/Lib/LumaLib/LumaLib.hpp"
#include "luma/Lib/LumaLib/Packet.hpp"

namespace LumaLib {

  //! Order matches the alternatives of ReceiverSession's state variant
  enum class ReceiverState : std::uint8_t {
    IDLE              = 0,
    CALIBRATING       = 1,
    WAITING_FOR_START = 2,
    RECEIVING         = 3,
    END_DETECTED      = 4,
    PARITY_CHECK      = 5,
    SUCCESS           = 6,
    ERROR             = 7,
  };

  const char* receiverStateName(ReceiverState state);

  enum class ReceiveMode : std::uint8_t {
    LEGACY = 0,  // START + 9-bit parity units + END
    PACKET = 1,  // CRC-checked frames, envelopes, chunking
  };

  //! Most significant thing that happened while processing one sample
  enum class ReceiveEvent {
    NONE,
    IGNORED,               // session idle or calibrating
    START_DETECTED,        // legacy start marker seen
    MESSAGE_DECODED,       // legacy message passed parity
    MESSAGE_REJECTED,      // legacy parity failure or overlong message
    PACKET_DECODED,        // packet (or last chunk) delivered as a record
    CHUNK_BUFFERED,        // chunk stored, group still incomplete
    PACKET_REJECTED,       // framing or checksum failure
    DECOMPRESSION_FAILED,  // COMPRESSED payload did not decode
  };

  const char* receiveEventName(ReceiveEvent event);

  enum class FecStatus {
    NOT_APPLIED,
    DECODED,
    FAILED_PASSTHROUGH,  // correction unsuccessful, best-effort bytes used
  };

  struct SampleReport {
    ReceiveEvent event = ReceiveEvent::NONE;
    ReceiverState state = ReceiverState::IDLE;
    std::uint8_t bit = 0;
    ParseStatus parseStatus = ParseStatus::START_FRAME_NOT_FOUND;  // packet mode only
    FecStatus fecStatus = FecStatus::NOT_APPLIED;
    std::uint32_t errorsCorrected = 0;
    bool truncated = false;
    std::size_t expiredGroups = 0;
    std::size_t evictedGroups = 0;  // pushed out to make room for a new group
  };

  //! Shape handed to the storage collaborator
  struct DecodedRecord {
    std::uint8_t type = 0;
    std::string typeName;
    Bytes data;
    std::uint64_t timestampMs = 0;
    std::uint64_t durationMs = 0;
    std::size_t size = 0;
    bool isJson = false;
    BackendMode backendMode = BackendMode::NONE;
  };

  struct ReceiverConfig {
    ReceiveMode mode = ReceiveMode::LEGACY;
    std::uint8_t initialThreshold = Cfg::DEFAULT_THRESHOLD;

    //! Packet-mode bit buffer cap; exceeded => keep the most recent half
    std::size_t maxBufferBits = Cfg::DEFAULT_MAX_BUFFER_BITS;
    std::size_t maxPacketPayload = Cfg::DEFAULT_MAX_PACKET_PAYLOAD;
    std::size_t maxMessageBytes = Cfg::DEFAULT_MAX_MESSAGE_BYTES;  // after decompression

    std::uint64_t reassemblyTimeoutMs = Cfg::DEFAULT_REASSEMBLY_TIMEOUT_MS;
    std::size_t maxPendingGroups = Cfg::DEFAULT_MAX_PENDING_GROUPS;

    CalibrationMethod calibrationMethod = CalibrationMethod::AMBIENT_MARGIN;
    std::uint8_t calibrationMargin = Cfg::DEFAULT_CALIBRATION_MARGIN;
    std::size_t maxCalibrationSamples = Cfg::DEFAULT_MAX_CALIBRATION_SAMPLES;
  };

  struct ReceiverStats {
    ReceiveMode mode = ReceiveMode::LEGACY;
    ReceiverState state = ReceiverState::IDLE;
    std::uint8_t threshold = 0;
    std::size_t pendingGroups = 0;
    std::size_t bufferedBits = 0;

    std::uint32_t messagesDecoded = 0;
    std::uint32_t packetsDecoded = 0;
    std::uint32_t packetsRejected = 0;
    std::uint32_t checksumErrors = 0;
    std::uint32_t framingErrors = 0;
    std::uint32_t parityErrors = 0;
    std::uint32_t fecErrorsCorrected = 0;
    std::uint32_t fecFailures = 0;
    std::uint32_t decompressionFailures = 0;
    std::uint32_t truncations = 0;
    std::uint32_t expiredGroups = 0;
    std::uint32_t evictedGroups = 0;
  };

  /**
   * One reception attempt over the optical channel.
   *
   * Driven synchronously once per bit period with a brightness sample
   * and the caller's clock. Never blocks; every error is local to the
   * current message and the session keeps scanning. Decoded records
   * queue up until takeRecords() drains them.
   */
  class ReceiverSession {
    public:
      explicit ReceiverSession(const ReceiverConfig& config = ReceiverConfig());

      //! Replace the FEC algorithm (RepetitionFec by default); null is ignored
      void setFecCodec(std::unique_ptr<FecCodec> codec);

      //! Switch decoding mode; drops any partial message
      void setMode(ReceiveMode mode);
      ReceiveMode mode() const { return m_config.mode; }

      // ---------- Calibration ----------

      void startCalibration();
      bool addCalibrationSample(std::uint8_t brightness);
      CalibrationStatus finishCalibration();

      //! Skip calibration and use threshold directly
      void setThreshold(std::uint8_t threshold);

      //! IDLE -> WAITING_FOR_START with the current threshold
      void startReceiving();

      // ---------- Reception ----------

      //! bit = brightness > threshold, then processBit
      SampleReport processSample(std::uint8_t brightness, std::uint64_t nowMs);
      SampleReport processBit(std::uint8_t bit, std::uint64_t nowMs);

      //! Clear every buffer and return to IDLE. Safe from any state.
      void reset();

      ReceiverState state() const;
      std::uint8_t threshold() const { return m_threshold; }
      std::size_t bufferedBits() const;

      //! Effective cap after clamping; bounds both the packet buffer and a legacy message
      std::size_t maxBufferBits() const { return m_config.maxBufferBits; }

      //! Message of the last legacy SUCCESS, empty in any other state
      std::string lastMessage() const;

      std::vector<DecodedRecord> takeRecords();
      std::size_t pendingRecords() const { return m_outbox.size(); }

      ReceiverStats stats() const;

    private:
      // ---------- Per-state data ----------

      struct IdleState {};
      struct CalibratingState {
        CalibrationEngine engine;
      };
      struct WaitingState {
        std::uint8_t window = 0;  // legacy sliding window
        unsigned filled = 0;
      };
      struct ReceivingState {
        BitStream bits;           // legacy data bits since the start marker
        std::uint64_t startMs = 0;
      };
      struct EndDetectedState {
        BitStream unitBits;       // whole 9-bit units, end marker excluded
        std::uint64_t startMs = 0;
      };
      struct ParityCheckState {
        BitStream unitBits;
        std::uint64_t startMs = 0;
      };
      struct SuccessState {
        std::string message;      // legacy only
      };
      struct ErrorState {};

      using State = std::variant<
          IdleState,
          CalibratingState,
          WaitingState,
          ReceivingState,
          EndDetectedState,
          ParityCheckState,
          SuccessState,
          ErrorState>;

      void processLegacyBit(std::uint8_t bit, std::uint64_t nowMs, SampleReport& report);
      void runParityCheck(std::uint64_t nowMs, SampleReport& report);

      void processPacketBit(std::uint8_t bit, std::uint64_t nowMs, SampleReport& report);
      bool findFrameEndingNow(std::size_t after, ParseResult& found) const;
      void acceptFrame(const ParseResult& frame, std::uint64_t startMs, std::uint64_t nowMs, SampleReport& report);
      void dispatchPacket(const Packet& packet, std::uint64_t startMs, std::uint64_t nowMs, SampleReport& report);
      void enforceBufferCap(SampleReport& report);

      void emitRecord(std::uint8_t type, Bytes data, std::uint64_t startMs, std::uint64_t nowMs);
      void clearBuffers();

      ReceiverConfig m_config;
      State m_state;
      std::uint8_t m_threshold;
      std::unique_ptr<FecCodec> m_fec;

      // Packet mode scan state; persists across messages until reset
      BitStream m_packetBits;
      std::size_t m_scanOffset;
      std::size_t m_candidateStart;
      std::uint64_t m_candidateStartMs;

      ReassemblyTable m_reassembly;
      std::deque<DecodedRecord> m_outbox;
      ReceiverStats m_stats;
  };

} // namespace LumaLib

#endif

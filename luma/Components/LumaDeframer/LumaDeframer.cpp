// ======================================================================
// \title  LumaDeframer.cpp
// \brief  Deframer component: brightness samples in, decoded records out
// ======================================================================
#include "luma/Components/LumaDeframer/LumaDeframer.hpp"
#include "Fw/Logger/Logger.hpp"

#include <algorithm>
#include <cinttypes>
#include <cstring>
#include <limits>
#include <vector>

namespace Luma {

  namespace {

    U32 clampU32(U64 value) {
        return static_cast<U32>(std::min<U64>(value, std::numeric_limits<U32>::max()));
    }

  } // namespace

  LumaDeframer::LumaDeframer(const char* const compName) :
      LumaDeframerComponentBase(compName),
      m_parityErrors(0) {
  }

  LumaDeframer::~LumaDeframer() {}

  // ================================================================
  // Port Handlers
  // ================================================================

  void LumaDeframer::sampleIn_handler(
      FwIndexType portNum,
      U8 brightness
  ) {
      if (m_session.state() == LumaLib::ReceiverState::CALIBRATING) {
          if (!m_session.addCalibrationSample(brightness)) {
              this->log_WARNING_LO_CalibrationSampleDropped();
          }
          return;
      }

      const LumaLib::SampleReport report = m_session.processSample(brightness, this->nowMs());
      this->reportSample(report);
      this->drainRecords();
      this->writeTelemetry();
  }

  // ================================================================
  // Command Handlers
  // ================================================================

  void LumaDeframer::SET_MODE_cmdHandler(
      FwOpcodeType opCode,
      U32 cmdSeq,
      Luma::ReceiveMode mode
  ) {
      m_session.setMode(static_cast<LumaLib::ReceiveMode>(mode.e));
      this->log_ACTIVITY_HI_ModeSet(mode);
      this->writeTelemetry();
      this->cmdResponse_out(opCode, cmdSeq, Fw::CmdResponse::OK);
  }

  void LumaDeframer::START_CALIBRATION_cmdHandler(
      FwOpcodeType opCode,
      U32 cmdSeq
  ) {
      m_session.startCalibration();
      this->writeTelemetry();
      this->cmdResponse_out(opCode, cmdSeq, Fw::CmdResponse::OK);
  }

  void LumaDeframer::FINISH_CALIBRATION_cmdHandler(
      FwOpcodeType opCode,
      U32 cmdSeq
  ) {
      const LumaLib::CalibrationStatus status = m_session.finishCalibration();
      if (status != LumaLib::CalibrationStatus::OK) {
          this->log_WARNING_LO_CalibrationFailed(static_cast<I32>(status));
          this->cmdResponse_out(opCode, cmdSeq, Fw::CmdResponse::EXECUTION_ERROR);
          return;
      }

      this->log_ACTIVITY_HI_CalibrationComplete(m_session.threshold());
      this->writeTelemetry();
      this->cmdResponse_out(opCode, cmdSeq, Fw::CmdResponse::OK);
  }

  void LumaDeframer::SET_THRESHOLD_cmdHandler(
      FwOpcodeType opCode,
      U32 cmdSeq,
      U8 threshold
  ) {
      m_session.setThreshold(threshold);
      this->tlmWrite_Threshold(threshold);
      this->cmdResponse_out(opCode, cmdSeq, Fw::CmdResponse::OK);
  }

  void LumaDeframer::START_RECEIVING_cmdHandler(
      FwOpcodeType opCode,
      U32 cmdSeq
  ) {
      m_session.startReceiving();
      this->writeTelemetry();
      this->cmdResponse_out(opCode, cmdSeq, Fw::CmdResponse::OK);
  }

  void LumaDeframer::RESET_cmdHandler(
      FwOpcodeType opCode,
      U32 cmdSeq
  ) {
      m_session.reset();
      this->writeTelemetry();
      this->cmdResponse_out(opCode, cmdSeq, Fw::CmdResponse::OK);
  }

  // ================================================================
  // Helper Functions
  // ================================================================

  U64 LumaDeframer::nowMs() {
      const Fw::Time now = this->getTime();
      return static_cast<U64>(now.getSeconds()) * 1000U + now.getUSeconds() / 1000U;
  }

  void LumaDeframer::reportSample(const LumaLib::SampleReport& report) {
      switch (report.event) {
          case LumaLib::ReceiveEvent::START_DETECTED:
              this->log_ACTIVITY_LO_StartDetected();
              break;
          case LumaLib::ReceiveEvent::MESSAGE_REJECTED: {
              const U32 parityErrors = m_session.stats().parityErrors;
              if (parityErrors != m_parityErrors) {
                  this->log_WARNING_LO_ParityCheckFailed();
              } else {
                  this->log_WARNING_LO_LegacyOverrun(clampU32(m_session.maxBufferBits()));
              }
              m_parityErrors = parityErrors;
              break;
          }
          case LumaLib::ReceiveEvent::PACKET_REJECTED:
              this->log_WARNING_LO_PacketRejected(static_cast<I32>(report.parseStatus));
              break;
          case LumaLib::ReceiveEvent::CHUNK_BUFFERED:
              this->log_ACTIVITY_LO_ChunkBuffered(clampU32(m_session.stats().pendingGroups));
              break;
          case LumaLib::ReceiveEvent::DECOMPRESSION_FAILED:
              this->log_WARNING_LO_DecompressionFailed();
              break;
          default:
              // Decoded messages are reported per record in drainRecords
              break;
      }

      if (report.fecStatus == LumaLib::FecStatus::DECODED && report.errorsCorrected > 0) {
          this->log_ACTIVITY_LO_FecCorrected(report.errorsCorrected);
      } else if (report.fecStatus == LumaLib::FecStatus::FAILED_PASSTHROUGH) {
          this->log_WARNING_LO_FecFailed();
      }
      if (report.truncated) {
          this->log_WARNING_LO_BufferTruncated(clampU32(m_session.bufferedBits()));
      }
      if (report.expiredGroups > 0) {
          this->log_WARNING_LO_GroupsExpired(clampU32(report.expiredGroups));
      }
      if (report.evictedGroups > 0) {
          this->log_WARNING_LO_GroupsEvicted(clampU32(report.evictedGroups));
      }
  }

  void LumaDeframer::drainRecords() {
      const std::vector<LumaLib::DecodedRecord> records = m_session.takeRecords();
      for (const LumaLib::DecodedRecord& record : records) {
          const U32 size = clampU32(record.size);
          const U32 durationMs = clampU32(record.durationMs);

          this->log_ACTIVITY_HI_MessageDecoded(record.type, size, durationMs);
          if (record.backendMode != LumaLib::BackendMode::NONE) {
              Fw::LogStringArg mode(LumaLib::backendModeName(record.backendMode));
              this->log_ACTIVITY_HI_BackendEnvelope(mode);
          }

          Fw::Buffer buffer = this->allocate_out(0, size > 0 ? size : 1);
          if (!buffer.isValid() || buffer.getSize() < size) {
              Fw::Logger::log("LumaDeframer: allocation of %" PRIu32 " bytes failed\n", size);
              this->log_WARNING_HI_RecordDropped(size);
              if (buffer.isValid()) {
                  this->deallocate_out(0, buffer);
              }
              continue;
          }

          if (size > 0) {
              std::memcpy(buffer.getData(), record.data.data(), size);
          }
          buffer.setSize(size);
          this->recordOut_out(0, record.type, buffer, record.timestampMs, durationMs);
      }
  }

  void LumaDeframer::writeTelemetry() {
      const LumaLib::ReceiverStats stats = m_session.stats();
      this->tlmWrite_State(Luma::ReceiverState(static_cast<Luma::ReceiverState::T>(stats.state)));
      this->tlmWrite_Threshold(stats.threshold);
      this->tlmWrite_PacketsDecoded(stats.packetsDecoded);
      this->tlmWrite_PacketsRejected(stats.packetsRejected);
      this->tlmWrite_PendingGroups(clampU32(stats.pendingGroups));
      this->tlmWrite_BufferedBits(clampU32(stats.bufferedBits));
  }

} // namespace Luma

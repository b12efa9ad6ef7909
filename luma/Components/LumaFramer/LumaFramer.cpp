// ======================================================================
// \title  LumaFramer.cpp
// \brief  Framer component: payload buffers and commands in, optical bit streams out
// ======================================================================
#include "luma/Components/LumaFramer/LumaFramer.hpp"
#include "Fw/Logger/Logger.hpp"
#include "luma/Lib/LumaLib/Packet.hpp"
#include "luma/Lib/LumaLib/Parity.hpp"

#include <cinttypes>
#include <cstring>

namespace Luma {

  LumaFramer::LumaFramer(const char* const compName) :
      LumaFramerComponentBase(compName),
      m_packetsFramed(0),
      m_bitsFramed(0) {
  }

  LumaFramer::~LumaFramer() {}

  // ================================================================
  // Port Handlers
  // ================================================================

  void LumaFramer::payloadIn_handler(
      FwIndexType portNum,
      U8 dataType,
      U8 flags,
      Fw::Buffer& data
  ) {
      const LumaLib::Bytes payload(data.getData(), data.getData() + data.getSize());
      // Failures are reported through FrameFailed / BufferUnavailable
      (void) this->frameAndSend(dataType, payload, flags);

      // Payload has been copied out; hand the buffer back
      this->deallocate_out(0, data);
  }

  // ================================================================
  // Command Handlers
  // ================================================================

  void LumaFramer::TRANSMIT_TEXT_cmdHandler(
      FwOpcodeType opCode,
      U32 cmdSeq,
      U8 dataType,
      const Fw::CmdStringArg& text
  ) {
      const char* chars = text.toChar();
      const LumaLib::Bytes payload(chars, chars + std::strlen(chars));

      const bool ok = this->frameAndSend(dataType, payload, LumaLib::PacketFlags::NONE);
      this->cmdResponse_out(opCode, cmdSeq, ok ? Fw::CmdResponse::OK : Fw::CmdResponse::EXECUTION_ERROR);
  }

  void LumaFramer::TRANSMIT_LEGACY_cmdHandler(
      FwOpcodeType opCode,
      U32 cmdSeq,
      const Fw::CmdStringArg& text
  ) {
      const LumaLib::BitStream bits = LumaLib::encodeLegacyMessage(text.toChar());
      if (!this->sendBits(bits)) {
          this->cmdResponse_out(opCode, cmdSeq, Fw::CmdResponse::EXECUTION_ERROR);
          return;
      }

      this->log_ACTIVITY_HI_FrameBuilt(LumaLib::toTag(LumaLib::DataType::TEXT), 1, static_cast<U32>(bits.size()));
      this->tlmWrite_PacketsFramed(m_packetsFramed);
      this->tlmWrite_BitsFramed(m_bitsFramed);
      this->cmdResponse_out(opCode, cmdSeq, Fw::CmdResponse::OK);
  }

  void LumaFramer::SET_CHUNK_SIZE_cmdHandler(
      FwOpcodeType opCode,
      U32 cmdSeq,
      U16 size
  ) {
      if (size == 0 || size > LumaLib::Cfg::MAX_CHUNK_SIZE) {
          this->log_WARNING_LO_InvalidChunkSize(size);
          this->cmdResponse_out(opCode, cmdSeq, Fw::CmdResponse::VALIDATION_ERROR);
          return;
      }

      m_options.maxChunkSize = size;
      this->cmdResponse_out(opCode, cmdSeq, Fw::CmdResponse::OK);
  }

  void LumaFramer::SET_FLAGS_cmdHandler(
      FwOpcodeType opCode,
      U32 cmdSeq,
      bool compress,
      bool fec
  ) {
      m_options.compress = compress;
      m_options.fec = fec;
      this->cmdResponse_out(opCode, cmdSeq, Fw::CmdResponse::OK);
  }

  // ================================================================
  // Helper Functions
  // ================================================================

  bool LumaFramer::frameAndSend(U8 dataType, const LumaLib::Bytes& payload, U8 flags) {
      // Port flags add to the commanded defaults
      LumaLib::EncodeOptions options = m_options;
      options.compress = options.compress || (flags & LumaLib::PacketFlags::COMPRESSED) != 0;
      options.fec = options.fec || (flags & LumaLib::PacketFlags::FEC_ENABLED) != 0;

      std::vector<LumaLib::BitStream> packets;
      const LumaLib::EncodeStatus status = m_encoder.encodeData(dataType, payload, options, packets);
      if (status != LumaLib::EncodeStatus::OK) {
          this->log_WARNING_HI_FrameFailed(dataType, static_cast<I32>(status));
          return false;
      }

      U32 bits = 0;
      for (const LumaLib::BitStream& packet : packets) {
          if (!this->sendBits(packet)) {
              return false;
          }
          bits += static_cast<U32>(packet.size());
      }

      this->log_ACTIVITY_HI_FrameBuilt(dataType, static_cast<U32>(packets.size()), bits);
      this->tlmWrite_PacketsFramed(m_packetsFramed);
      this->tlmWrite_BitsFramed(m_bitsFramed);
      return true;
  }

  bool LumaFramer::sendBits(const LumaLib::BitStream& bits) {
      const U32 size = static_cast<U32>(bits.size());
      Fw::Buffer buffer = this->allocate_out(0, size);
      if (!buffer.isValid() || buffer.getSize() < size) {
          Fw::Logger::log("LumaFramer: allocation of %" PRIu32 " bytes failed\n", size);
          this->log_WARNING_HI_BufferUnavailable(size);
          if (buffer.isValid()) {
              this->deallocate_out(0, buffer);
          }
          return false;
      }

      std::memcpy(buffer.getData(), bits.data(), bits.size());
      buffer.setSize(size);
      this->bitsOut_out(0, buffer);

      m_packetsFramed++;
      m_bitsFramed += size;
      return true;
  }

} // namespace Luma

// ======================================================================
// \title  LumaFramer.hpp
// \brief  Framer component: payload buffers and commands in, optical bit streams out
// ======================================================================
#ifndef LUMA_LUMAFRAMER_HPP
#define LUMA_LUMAFRAMER_HPP

#include <vector>

#include "luma/Components/LumaFramer/LumaFramerComponentAc.hpp"  // Auto-generated from LumaFramer.fpp
#include "Fw/Buffer/Buffer.hpp"
#include "Fw/Types/BasicTypes.hpp"
#include "luma/Lib/LumaLib/Encoder.hpp"

namespace Luma {

  class LumaFramer : public LumaFramerComponentBase {
    public:

      // Constructor / Destructor
      LumaFramer(const char* const compName);
      ~LumaFramer();

    PRIVATE:
      // ========== Port Handlers ==========

      //! Frame a payload buffer and return it to its owner
      void payloadIn_handler(
          FwIndexType portNum,
          U8 dataType,
          U8 flags,
          Fw::Buffer& data
      ) override;

      // ========== Command Handlers ==========

      void TRANSMIT_TEXT_cmdHandler(
          FwOpcodeType opCode,
          U32 cmdSeq,
          U8 dataType,
          const Fw::CmdStringArg& text
      ) override;

      void TRANSMIT_LEGACY_cmdHandler(
          FwOpcodeType opCode,
          U32 cmdSeq,
          const Fw::CmdStringArg& text
      ) override;

      void SET_CHUNK_SIZE_cmdHandler(
          FwOpcodeType opCode,
          U32 cmdSeq,
          U16 size
      ) override;

      void SET_FLAGS_cmdHandler(
          FwOpcodeType opCode,
          U32 cmdSeq,
          bool compress,
          bool fec
      ) override;

      // ========== Helper Functions ==========

      //! Encode a payload and send every packet; false on any failure
      bool frameAndSend(U8 dataType, const LumaLib::Bytes& payload, U8 flags);

      //! Copy one bit stream into an allocated buffer and send it on bitsOut
      bool sendBits(const LumaLib::BitStream& bits);

      // ========== Internal State ==========

      LumaLib::Encoder m_encoder;
      LumaLib::EncodeOptions m_options;

      U32 m_packetsFramed;
      U32 m_bitsFramed;
  };

} // namespace Luma

#endif

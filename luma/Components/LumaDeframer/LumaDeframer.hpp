// ======================================================================
// \title  LumaDeframer.hpp
// \brief  Deframer component: brightness samples in, decoded records out
// ======================================================================
#ifndef LUMA_LUMADEFRAMER_HPP
#define LUMA_LUMADEFRAMER_HPP

#include "luma/Components/LumaDeframer/LumaDeframerComponentAc.hpp"  // Auto-generated from LumaDeframer.fpp
#include "Fw/Buffer/Buffer.hpp"
#include "Fw/Types/BasicTypes.hpp"
#include "luma/Lib/LumaLib/ReceiverSession.hpp"

namespace Luma {

  class LumaDeframer : public LumaDeframerComponentBase {
    public:

      // Constructor / Destructor
      LumaDeframer(const char* const compName);
      ~LumaDeframer();

    PRIVATE:
      // ========== Port Handlers ==========

      //! One brightness reading per bit period
      void sampleIn_handler(
          FwIndexType portNum,
          U8 brightness
      ) override;

      // ========== Command Handlers ==========

      void SET_MODE_cmdHandler(
          FwOpcodeType opCode,
          U32 cmdSeq,
          Luma::ReceiveMode mode
      ) override;

      void START_CALIBRATION_cmdHandler(
          FwOpcodeType opCode,
          U32 cmdSeq
      ) override;

      void FINISH_CALIBRATION_cmdHandler(
          FwOpcodeType opCode,
          U32 cmdSeq
      ) override;

      void SET_THRESHOLD_cmdHandler(
          FwOpcodeType opCode,
          U32 cmdSeq,
          U8 threshold
      ) override;

      void START_RECEIVING_cmdHandler(
          FwOpcodeType opCode,
          U32 cmdSeq
      ) override;

      void RESET_cmdHandler(
          FwOpcodeType opCode,
          U32 cmdSeq
      ) override;

      // ========== Helper Functions ==========

      //! Current time in milliseconds, from the time port
      U64 nowMs();

      //! Turn the library's per-sample report into events
      void reportSample(const LumaLib::SampleReport& report);

      //! Copy queued records into buffers and emit them on recordOut
      void drainRecords();

      void writeTelemetry();

      // ========== Internal State ==========

      LumaLib::ReceiverSession m_session;
      U32 m_parityErrors;  // last seen, to tell parity rejects from overruns
  };

} // namespace Luma

#endif

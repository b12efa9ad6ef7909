#ifndef LUMA_LIB_CALIBRATION_HPP
#define LUMA_LIB_CALIBRATION_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

#include "luma/Lib/LumaLib/LumaCfg.hpp"

namespace LumaLib {

  enum class CalibrationMethod {
    AMBIENT_MARGIN,  // round(mean) + margin, clamped to 255
    MEAN,            // round(mean)
    MIDPOINT,        // (min + max) / 2
  };

  /**
   *  OK                    threshold computed
   *  NOT_CALIBRATING       finish() without a preceding start()
   *  INSUFFICIENT_SAMPLES  finish() with no samples collected
   */
  enum class CalibrationStatus : std::int32_t {
    OK                   =  0,
    NOT_CALIBRATING      = -1,
    INSUFFICIENT_SAMPLES = -2,
  };

  const char* calibrationStatusName(CalibrationStatus status);

  //! Turns a batch of ambient brightness readings into a bit decision threshold
  class CalibrationEngine {
    public:
      CalibrationEngine(
          CalibrationMethod method = CalibrationMethod::AMBIENT_MARGIN,
          std::uint8_t margin = Cfg::DEFAULT_CALIBRATION_MARGIN,
          std::size_t maxSamples = Cfg::DEFAULT_MAX_CALIBRATION_SAMPLES
      );

      //! Clear collected samples and begin collecting
      void start();

      //! False when not collecting or when the sample limit is reached
      bool addSample(std::uint8_t brightness);

      /**
       * Compute the threshold from the collected samples. On OK collection
       * stops; on INSUFFICIENT_SAMPLES the engine keeps collecting and
       * threshold is left unchanged.
       */
      CalibrationStatus finish(std::uint8_t& threshold);

      bool isActive() const { return m_active; }
      std::size_t sampleCount() const { return m_samples.size(); }

      static std::uint8_t computeThreshold(
          const std::vector<std::uint8_t>& samples,
          CalibrationMethod method,
          std::uint8_t margin
      );

    private:
      CalibrationMethod m_method;
      std::uint8_t m_margin;
      std::size_t m_maxSamples;
      bool m_active;
      std::vector<std::uint8_t> m_samples;
  };

} // namespace LumaLib

#endif

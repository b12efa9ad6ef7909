#include "luma/Lib/LumaLib/Calibration.hpp"

#include <algorithm>

namespace LumaLib {

const char* calibrationStatusName(CalibrationStatus status) {
  switch (status) {
    case CalibrationStatus::OK:
      return "OK";
    case CalibrationStatus::NOT_CALIBRATING:
      return "NotCalibrating";
    case CalibrationStatus::INSUFFICIENT_SAMPLES:
      return "InsufficientSamples";
  }
  return "Unknown";
}

CalibrationEngine::CalibrationEngine(CalibrationMethod method, std::uint8_t margin, std::size_t maxSamples)
  : m_method(method)
  , m_margin(margin)
  , m_maxSamples(maxSamples)
  , m_active(false)
{
}

void CalibrationEngine::start() {
  m_samples.clear();
  m_active = true;
}

bool CalibrationEngine::addSample(std::uint8_t brightness) {
  if (!m_active || m_samples.size() >= m_maxSamples) {
    return false;
  }
  m_samples.push_back(brightness);
  return true;
}

CalibrationStatus CalibrationEngine::finish(std::uint8_t& threshold) {
  if (!m_active) {
    return CalibrationStatus::NOT_CALIBRATING;
  }
  if (m_samples.empty()) {
    return CalibrationStatus::INSUFFICIENT_SAMPLES;
  }

  threshold = computeThreshold(m_samples, m_method, m_margin);
  m_active = false;
  m_samples.clear();
  return CalibrationStatus::OK;
}

std::uint8_t CalibrationEngine::computeThreshold(
    const std::vector<std::uint8_t>& samples,
    CalibrationMethod method,
    std::uint8_t margin
) {
  if (samples.empty()) {
    return Cfg::DEFAULT_THRESHOLD;
  }

  if (method == CalibrationMethod::MIDPOINT) {
    const auto range = std::minmax_element(samples.begin(), samples.end());
    return static_cast<std::uint8_t>((static_cast<unsigned>(*range.first) +
                                      static_cast<unsigned>(*range.second)) / 2u);
  }

  std::uint64_t sum = 0;
  for (std::uint8_t s : samples) {
    sum += s;
  }
  // round half up
  const std::uint64_t mean = (2 * sum + samples.size()) / (2 * samples.size());

  std::uint64_t threshold = mean;
  if (method == CalibrationMethod::AMBIENT_MARGIN) {
    threshold += margin;
  }
  return static_cast<std::uint8_t>(std::min<std::uint64_t>(threshold, 255u));
}

} // namespace LumaLib

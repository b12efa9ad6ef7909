#include <gtest/gtest.h>

#include "luma/Lib/LumaLib/Calibration.hpp"

using namespace LumaLib;

TEST(Calibration, AmbientMarginIsMeanPlusMargin) {
  const std::vector<std::uint8_t> samples = {10, 20, 30};
  EXPECT_EQ(70, CalibrationEngine::computeThreshold(samples, CalibrationMethod::AMBIENT_MARGIN, 50));
  EXPECT_EQ(20, CalibrationEngine::computeThreshold(samples, CalibrationMethod::MEAN, 50));
  EXPECT_EQ(20, CalibrationEngine::computeThreshold(samples, CalibrationMethod::MIDPOINT, 50));
}

TEST(Calibration, MeanRoundsHalfUp) {
  const std::vector<std::uint8_t> samples = {10, 11};
  EXPECT_EQ(11, CalibrationEngine::computeThreshold(samples, CalibrationMethod::MEAN, 0));
}

TEST(Calibration, ThresholdSaturates) {
  const std::vector<std::uint8_t> samples = {250, 250};
  EXPECT_EQ(255, CalibrationEngine::computeThreshold(samples, CalibrationMethod::AMBIENT_MARGIN, 50));
}

TEST(Calibration, NoSamplesGivesDefault) {
  EXPECT_EQ(Cfg::DEFAULT_THRESHOLD,
            CalibrationEngine::computeThreshold({}, CalibrationMethod::AMBIENT_MARGIN, 50));
}

TEST(CalibrationEngine, FinishOutsideCalibration) {
  CalibrationEngine engine;
  std::uint8_t threshold = 7;
  EXPECT_FALSE(engine.addSample(10));
  EXPECT_EQ(CalibrationStatus::NOT_CALIBRATING, engine.finish(threshold));
  EXPECT_EQ(7, threshold);
}

TEST(CalibrationEngine, FinishWithoutSamplesKeepsCalibrating) {
  CalibrationEngine engine;
  engine.start();
  std::uint8_t threshold = 7;
  EXPECT_EQ(CalibrationStatus::INSUFFICIENT_SAMPLES, engine.finish(threshold));
  EXPECT_TRUE(engine.isActive());
  EXPECT_EQ(7, threshold);

  ASSERT_TRUE(engine.addSample(100));
  EXPECT_EQ(CalibrationStatus::OK, engine.finish(threshold));
  EXPECT_EQ(150, threshold);
  EXPECT_FALSE(engine.isActive());
  EXPECT_EQ(0u, engine.sampleCount());
}

TEST(CalibrationEngine, SampleLimit) {
  CalibrationEngine engine(CalibrationMethod::MEAN, 0, 2);
  engine.start();
  EXPECT_TRUE(engine.addSample(1));
  EXPECT_TRUE(engine.addSample(3));
  EXPECT_FALSE(engine.addSample(200));

  std::uint8_t threshold = 0;
  ASSERT_EQ(CalibrationStatus::OK, engine.finish(threshold));
  EXPECT_EQ(2, threshold);
}

TEST(CalibrationEngine, RestartDiscardsSamples) {
  CalibrationEngine engine(CalibrationMethod::MEAN, 0);
  engine.start();
  engine.addSample(200);
  engine.start();
  engine.addSample(40);
  std::uint8_t threshold = 0;
  ASSERT_EQ(CalibrationStatus::OK, engine.finish(threshold));
  EXPECT_EQ(40, threshold);
}

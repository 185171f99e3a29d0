#include <algorithm>
#include <cmath>
#include <cstdint>
#include <memory>
#include <ranges>
#include <sstream>

#include "compasslevel/core/math.hpp"
#include "compasslevel/simulator/sensor_simulator.hpp"
#include "compasslevel/simulator/sensors.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "spdlog/sinks/ostream_sink.h"
#include "spdlog/spdlog.h"
#include "testing/device_vectors.hpp"
#include "testing/matchers.hpp"

namespace cl = compasslevel;
using cl::SensorKind;
using ::testing::HasSubstr;

namespace {
std::size_t CountKind(const std::vector<cl::Sample>& samples,
                      SensorKind kind) {
  return static_cast<std::size_t>(
      std::ranges::count(samples, kind, &cl::Sample::kind));
}
}  // namespace

TEST(SensorSimulator, StaticDeviceReadsGravityAndField) {
  auto config = std::make_shared<cl::SensorSimulator::Config>();
  config->initial_heading_deg = 0.0;
  config->gravity = 9.81;
  config->field_strength_ut = 50.0;
  config->dip_deg = 60.0;
  cl::SensorSimulator sim(config);

  const auto samples = sim.step(0.0);
  ASSERT_THAT(samples, HasValue());
  ASSERT_EQ(samples->size(), 3U);

  const auto expected = cl::testing::VectorsAt(0.0);
  EXPECT_EQ((*samples)[0].kind, SensorKind::kAccelerometer);
  EXPECT_THAT((*samples)[0].values, AllClose(expected.gravity));
  EXPECT_EQ((*samples)[1].kind, SensorKind::kMagnetometer);
  EXPECT_THAT((*samples)[1].values, AllClose(expected.magnetic));
  EXPECT_EQ((*samples)[2].kind, SensorKind::kGyroscope);
  EXPECT_THAT((*samples)[2].values, AllClose(Eigen::Vector3d(0.0, 0.0, 0.0)));
  for (const auto& sample : *samples) {
    EXPECT_EQ(sample.timestamp_ns, 0);
  }
}

TEST(SensorSimulator, InitialAttitudeMatchesConfig) {
  auto config = std::make_shared<cl::SensorSimulator::Config>();
  config->initial_heading_deg = 250.0;
  config->initial_roll_deg = 20.0;
  config->initial_pitch_deg = -10.0;
  cl::SensorSimulator sim(config);

  EXPECT_NEAR(sim.trueHeading(), 250.0, 1e-9);

  const auto samples = sim.step(0.0);
  ASSERT_THAT(samples, HasValue());
  const auto expected = cl::testing::VectorsAt(250.0, 20.0, -10.0, 50.0, 60.0);
  EXPECT_THAT((*samples)[0].values,
              AllClose(Eigen::Vector3d(expected.gravity *
                                       (config->gravity / 9.81))));
  EXPECT_THAT((*samples)[1].values, AllClose(expected.magnetic));
}

TEST(SensorSimulator, SamplesFollowConfiguredPeriods) {
  auto config = std::make_shared<cl::SensorSimulator::Config>();
  config->accel_period_s = 0.02;
  config->mag_period_s = 0.05;
  config->gyro_period_s = 0.005;
  cl::SensorSimulator sim(config);

  const auto samples = sim.step(1.0);
  ASSERT_THAT(samples, HasValue());
  // Both ends of [0, 1] s are included
  EXPECT_EQ(CountKind(*samples, SensorKind::kAccelerometer), 51U);
  EXPECT_EQ(CountKind(*samples, SensorKind::kMagnetometer), 21U);
  EXPECT_EQ(CountKind(*samples, SensorKind::kGyroscope), 201U);
  EXPECT_TRUE(std::ranges::is_sorted(*samples, {}, &cl::Sample::timestamp_ns));
  EXPECT_EQ(sim.now_ns(), 1'000'000'000);

  // The next step continues where this one ended
  const auto more = sim.step(0.01);
  ASSERT_THAT(more, HasValue());
  EXPECT_EQ(CountKind(*more, SensorKind::kGyroscope), 2U);
  EXPECT_GT(more->front().timestamp_ns, samples->back().timestamp_ns);
}

TEST(SensorSimulator, YawRateTurnsHeadingClockwise) {
  auto config = std::make_shared<cl::SensorSimulator::Config>();
  config->initial_heading_deg = 30.0;
  // Negative rate about the device z axis (up when level) turns clockwise
  config->body_rate_dps = Eigen::Vector3d(0.0, 0.0, -10.0);
  cl::SensorSimulator sim(config);

  ASSERT_THAT(sim.step(2.0), HasValue());
  EXPECT_NEAR(sim.trueHeading(), 50.0, 1e-6);

  ASSERT_THAT(sim.step(33.0), HasValue());
  EXPECT_NEAR(sim.trueHeading(), cl::WrapTo360(30.0 + 350.0), 1e-6);
}

TEST(SensorSimulator, GyroReportsBodyRate) {
  auto config = std::make_shared<cl::SensorSimulator::Config>();
  config->body_rate_dps = Eigen::Vector3d(5.0, -3.0, 1.0);
  cl::SensorSimulator sim(config);

  const auto samples = sim.step(0.1);
  ASSERT_THAT(samples, HasValue());
  for (const auto& sample : *samples) {
    if (sample.kind == SensorKind::kGyroscope) {
      EXPECT_THAT(sample.values,
                  AllClose(Eigen::Vector3d(cl::deg2rad(5.0), cl::deg2rad(-3.0),
                                           cl::deg2rad(1.0))));
    }
  }

  sim.setBodyRate(Eigen::Vector3d(0.0, 0.0, 1.0));
  const auto after = sim.step(0.1);
  ASSERT_THAT(after, HasValue());
  EXPECT_THAT(after->back().values, AllClose(Eigen::Vector3d(0.0, 0.0, 1.0)));
}

TEST(SensorSimulator, RejectsInvalidStep) {
  cl::SensorSimulator sim;
  EXPECT_THAT(sim.step(-0.1),
              HoldsError(cl::CompassLevelErrc::kOutOfBounds));
  EXPECT_THAT(sim.step(std::nan("")),
              HoldsError(cl::CompassLevelErrc::kNumericallyNonFinite));
  EXPECT_EQ(sim.now_ns(), 0);
}

TEST(SensorSimulator, SeededNoiseIsReproducible) {
  auto config = std::make_shared<cl::SensorSimulator::Config>();
  config->enable_noise = true;
  config->random_seed = 1234;

  cl::SensorSimulator first(config);
  cl::SensorSimulator second(config);
  const auto a = first.step(0.5);
  const auto b = second.step(0.5);
  ASSERT_THAT(a, HasValue());
  ASSERT_THAT(b, HasValue());
  ASSERT_EQ(a->size(), b->size());
  for (std::size_t i = 0; i < a->size(); ++i) {
    EXPECT_EQ((*a)[i].values, (*b)[i].values) << "sample " << i;
  }

  // Noise is actually applied
  cl::SensorSimulator clean;
  const auto c = clean.step(0.0);
  ASSERT_THAT(c, HasValue());
  EXPECT_NE((*a)[0].values, (*c)[0].values);
}

TEST(SensorSimulator, LargestSeedIsReproducible) {
  auto config = std::make_shared<cl::SensorSimulator::Config>();
  config->enable_noise = true;
  config->random_seed = 0xFFFFFFFF;

  cl::SensorSimulator first(config);
  cl::SensorSimulator second(config);
  const auto a = first.step(0.2);
  const auto b = second.step(0.2);
  ASSERT_THAT(a, HasValue());
  ASSERT_THAT(b, HasValue());
  ASSERT_EQ(a->size(), b->size());
  for (std::size_t i = 0; i < a->size(); ++i) {
    EXPECT_EQ((*a)[i].values, (*b)[i].values) << "sample " << i;
  }
}

TEST(SensorSimulator, InjectedLoggerReportsMissingNoiseConfig) {
  std::ostringstream log;
  auto logger = std::make_shared<spdlog::logger>(
      "Simulator.Test", std::make_shared<spdlog::sinks::ostream_sink_st>(log));

  auto config = std::make_shared<cl::SensorSimulator::Config>();
  config->enable_noise = true;
  config->random_seed = 5;
  config->mag_noise = nullptr;
  cl::SensorSimulator sim(config, logger);

  EXPECT_THAT(log.str(), HasSubstr("Invalid Magnetometer noise config"));
  EXPECT_EQ(sim.logger(), logger);

  // The magnetometer stays noise free
  const auto samples = sim.step(0.0);
  ASSERT_THAT(samples, HasValue());
  EXPECT_THAT((*samples)[1].values,
              AllClose(cl::testing::VectorsAt(0.0).magnetic));
}

TEST(DeriveSeed, IsDeterministicPerStream) {
  for (const std::uint32_t base : {0U, 1U, 0xFFFFFFFEU, 0xFFFFFFFFU}) {
    EXPECT_EQ(cl::DeriveSeed(base, 0), cl::DeriveSeed(base, 0)) << base;
    EXPECT_NE(cl::DeriveSeed(base, 0), cl::DeriveSeed(base, 1)) << base;
    EXPECT_NE(cl::DeriveSeed(base, 1), cl::DeriveSeed(base, 2)) << base;
  }
  // Adjacent bases do not share streams
  EXPECT_NE(cl::DeriveSeed(0xFFFFFFFF, 1), cl::DeriveSeed(0, 0));
}

TEST(NoiseProcess, ZeroIsAnOrdinarySeed) {
  cl::NoiseProcess a(0);
  cl::NoiseProcess b(0);
  ASSERT_THAT(a.configure(0.01, 0.0, 1.0), IsEmptyErrorCode());
  ASSERT_THAT(b.configure(0.01, 0.0, 1.0), IsEmptyErrorCode());
  for (int i = 0; i < 10; ++i) {
    EXPECT_DOUBLE_EQ(a.corrupt(0.0, 0.01), b.corrupt(0.0, 0.01));
  }
}

TEST(NoiseProcess, RejectsNegativeParameters) {
  cl::NoiseProcess noise(7);
  EXPECT_EQ(noise.configure(-1.0, 0.0, 1.0),
            make_error_code(cl::CompassLevelErrc::kPhysicallyInvalid));
  EXPECT_EQ(noise.configure(0.0, -1.0, 1.0),
            make_error_code(cl::CompassLevelErrc::kPhysicallyInvalid));
  EXPECT_EQ(noise.configure(0.0, 0.0, 0.0),
            make_error_code(cl::CompassLevelErrc::kPhysicallyInvalid));
  EXPECT_THAT(noise.configure(0.0, 0.0, 1.0), IsEmptyErrorCode());

  // Noise-free process passes values through
  EXPECT_DOUBLE_EQ(noise.corrupt(3.0, 0.01), 3.0);
}

TEST(NoiseProcess, WhiteNoiseHasConfiguredSpread) {
  cl::NoiseProcess noise(99);
  constexpr double kDensity = 0.01;
  constexpr double kDt = 0.01;
  ASSERT_THAT(noise.configure(kDensity, 0.0, 1.0), IsEmptyErrorCode());

  constexpr int kN = 20000;
  double sum = 0.0;
  double sum_sq = 0.0;
  for (int i = 0; i < kN; ++i) {
    const double v = noise.corrupt(0.0, kDt);
    sum += v;
    sum_sq += v * v;
  }
  const double mean = sum / kN;
  const double stddev = std::sqrt(sum_sq / kN - mean * mean);
  EXPECT_NEAR(mean, 0.0, 0.01);
  EXPECT_NEAR(stddev, kDensity / std::sqrt(kDt), 0.01);
}

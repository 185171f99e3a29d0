#include <cstdint>
#include <limits>
#include <memory>

#include "compasslevel/core/math.hpp"
#include "compasslevel/estimators/tilt_integrator.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "testing/matchers.hpp"

namespace cl = compasslevel;
using cl::CompassLevelErrc;

namespace {
constexpr std::int64_t kSecond = 1'000'000'000;

std::shared_ptr<cl::TiltIntegrator::Config> PolicyConfig(
    std::string_view policy) {
  auto config = std::make_shared<cl::TiltIntegrator::Config>();
  config->timestamp_policy = std::string(policy);
  return config;
}
}  // namespace

class TiltIntegratorTest : public ::testing::Test {
 protected:
  cl::TiltIntegrator integrator_;
};

TEST_F(TiltIntegratorTest, FirstSampleOnlyRecordsTimestamp) {
  const cl::TiltState initial{.roll_deg = 3.0, .pitch_deg = -4.0};
  const auto state = integrator_.integrate(initial, 10.0, -10.0, 42);
  ASSERT_THAT(state, HasValue());
  EXPECT_DOUBLE_EQ(state->roll_deg, 3.0);
  EXPECT_DOUBLE_EQ(state->pitch_deg, -4.0);
  EXPECT_EQ(state->last_timestamp_ns, 42);
}

TEST_F(TiltIntegratorTest, OneSecondAtTenthRadianPerSecond) {
  auto state = integrator_.integrate({}, 0.1, 0.0, 0);
  ASSERT_THAT(state, HasValue());
  state = integrator_.integrate(*state, 0.1, 0.0, kSecond);
  ASSERT_THAT(state, HasValue());
  EXPECT_NEAR(state->roll_deg, 5.7296, 1e-3);
  EXPECT_NEAR(state->pitch_deg, 0.0, 1e-12);
  EXPECT_EQ(state->last_timestamp_ns, kSecond);
}

TEST_F(TiltIntegratorTest, OneDegreePerSecondOverTwoHalfSeconds) {
  const double rate = cl::deg2rad(1.0);
  cl::TiltState state;
  for (const std::int64_t t : {std::int64_t{0}, kSecond / 2, kSecond}) {
    auto next = integrator_.integrate(state, rate, 0.0, t);
    ASSERT_THAT(next, HasValue());
    state = *next;
  }
  EXPECT_NEAR(state.roll_deg, 1.0, 1e-9);
  EXPECT_NEAR(state.pitch_deg, 0.0, 1e-12);
}

TEST_F(TiltIntegratorTest, PitchFollowsGyroY) {
  auto state = integrator_.integrate({}, 0.0, -0.5, 0);
  ASSERT_THAT(state, HasValue());
  state = integrator_.integrate(*state, 0.0, -0.5, 2 * kSecond);
  ASSERT_THAT(state, HasValue());
  EXPECT_NEAR(state->roll_deg, 0.0, 1e-12);
  EXPECT_NEAR(state->pitch_deg, cl::rad2deg(-1.0), 1e-9);
}

TEST_F(TiltIntegratorTest, SplittingAnIntervalGivesTheSameAngles) {
  const cl::TiltState start{.last_timestamp_ns = 0};
  constexpr double kWx = 0.3;
  constexpr double kWy = -0.2;

  const auto whole = integrator_.integrate(start, kWx, kWy, 3 * kSecond);
  ASSERT_THAT(whole, HasValue());

  auto split = integrator_.integrate(start, kWx, kWy, kSecond);
  ASSERT_THAT(split, HasValue());
  split = integrator_.integrate(*split, kWx, kWy, 3 * kSecond);
  ASSERT_THAT(split, HasValue());

  EXPECT_NEAR(split->roll_deg, whole->roll_deg, 1e-9);
  EXPECT_NEAR(split->pitch_deg, whole->pitch_deg, 1e-9);
}

TEST_F(TiltIntegratorTest, AnglesAreNotWrapped) {
  cl::TiltState state{.last_timestamp_ns = 0};
  // 2 rad/s for 10 s is well over one turn
  for (int i = 1; i <= 10; ++i) {
    auto next = integrator_.integrate(state, 2.0, 0.0, i * kSecond);
    ASSERT_THAT(next, HasValue());
    state = *next;
  }
  EXPECT_NEAR(state.roll_deg, cl::rad2deg(20.0), 1e-6);
  EXPECT_GT(state.roll_deg, 360.0);
}

TEST_F(TiltIntegratorTest, EqualTimestampIsNoOp) {
  const cl::TiltState start{.roll_deg = 1.0, .last_timestamp_ns = kSecond};
  const auto state = integrator_.integrate(start, 5.0, 5.0, kSecond);
  ASSERT_THAT(state, HasValue());
  EXPECT_DOUBLE_EQ(state->roll_deg, 1.0);
  EXPECT_DOUBLE_EQ(state->pitch_deg, 0.0);
  EXPECT_EQ(state->last_timestamp_ns, kSecond);
}

TEST_F(TiltIntegratorTest, RejectsOutOfOrderTimestampByDefault) {
  EXPECT_EQ(integrator_.policy(), cl::TimestampPolicy::kReject);
  const cl::TiltState start{.roll_deg = 1.0, .last_timestamp_ns = kSecond};
  EXPECT_THAT(integrator_.integrate(start, 1.0, 1.0, kSecond / 2),
              HoldsError(CompassLevelErrc::kTimestampOutOfOrder));
}

TEST_F(TiltIntegratorTest, ClampPolicyRecordsTimestampWithoutRotation) {
  const cl::TiltIntegrator clamp(PolicyConfig("clamp"));
  ASSERT_EQ(clamp.policy(), cl::TimestampPolicy::kClamp);

  const cl::TiltState start{.roll_deg = 1.0, .last_timestamp_ns = kSecond};
  const auto state = clamp.integrate(start, 1.0, 1.0, kSecond / 2);
  ASSERT_THAT(state, HasValue());
  EXPECT_DOUBLE_EQ(state->roll_deg, 1.0);
  EXPECT_DOUBLE_EQ(state->pitch_deg, 0.0);
  EXPECT_EQ(state->last_timestamp_ns, kSecond / 2);
}

TEST_F(TiltIntegratorTest, PassthroughPolicySubtractsRotation) {
  const cl::TiltIntegrator passthrough(PolicyConfig("passthrough"));
  ASSERT_EQ(passthrough.policy(), cl::TimestampPolicy::kPassthrough);

  const cl::TiltState start{.last_timestamp_ns = kSecond};
  const auto state = passthrough.integrate(start, 0.1, 0.0, 0);
  ASSERT_THAT(state, HasValue());
  EXPECT_NEAR(state->roll_deg, -cl::rad2deg(0.1), 1e-9);
  EXPECT_EQ(state->last_timestamp_ns, 0);
}

TEST_F(TiltIntegratorTest, TimestampsAtOppositeEndsOfTheRange) {
  constexpr std::int64_t kEarly = -5'000'000'000'000'000'000;
  constexpr std::int64_t kLate = 5'000'000'000'000'000'000;
  constexpr double kRate = 1e-10;  // rad/s over 1e10 s

  auto state = integrator_.integrate({}, kRate, 0.0, kEarly);
  ASSERT_THAT(state, HasValue());
  state = integrator_.integrate(*state, kRate, 0.0, kLate);
  ASSERT_THAT(state, HasValue());
  EXPECT_NEAR(state->roll_deg, cl::rad2deg(1.0), 1e-6);
  EXPECT_EQ(state->last_timestamp_ns, kLate);

  const cl::TiltState late{.last_timestamp_ns = kLate};
  EXPECT_THAT(integrator_.integrate(late, kRate, 0.0, kEarly),
              HoldsError(CompassLevelErrc::kTimestampOutOfOrder));

  const cl::TiltIntegrator passthrough(PolicyConfig("passthrough"));
  const auto backwards = passthrough.integrate(late, kRate, 0.0, kEarly);
  ASSERT_THAT(backwards, HasValue());
  EXPECT_NEAR(backwards->roll_deg, -cl::rad2deg(1.0), 1e-6);
}

TEST_F(TiltIntegratorTest, NonFiniteRateIsRejected) {
  const cl::TiltState start{.roll_deg = 2.0, .last_timestamp_ns = 0};
  EXPECT_THAT(integrator_.integrate(
                  start, std::numeric_limits<double>::quiet_NaN(), 0.0, 10),
              HoldsError(CompassLevelErrc::kNumericallyNonFinite));
  EXPECT_THAT(integrator_.integrate(
                  start, 0.0, std::numeric_limits<double>::infinity(), 10),
              HoldsError(CompassLevelErrc::kNumericallyNonFinite));
}

TEST(TiltIntegratorConfig, InvalidPolicyKeepsDefault) {
  const cl::TiltIntegrator integrator(PolicyConfig("sometimes"));
  EXPECT_EQ(integrator.policy(), cl::TimestampPolicy::kReject);
  EXPECT_EQ(integrator.config()->timestamp_policy, "reject");
}

TEST(TiltIntegratorConfig, SetConfigReportsErrors) {
  cl::TiltIntegrator integrator;
  EXPECT_EQ(integrator.setConfig(PolicyConfig("bogus")),
            make_error_code(CompassLevelErrc::kInvalidChoice));
  EXPECT_EQ(integrator.setConfig(nullptr),
            make_error_code(CompassLevelErrc::kConfigValueUninitialized));
  EXPECT_THAT(integrator.setConfig(PolicyConfig("clamp")), IsEmptyErrorCode());
  EXPECT_EQ(integrator.policy(), cl::TimestampPolicy::kClamp);
}

TEST(TiltIntegratorConfig, ParseTimestampPolicy) {
  EXPECT_EQ(cl::ParseTimestampPolicy("reject"), cl::TimestampPolicy::kReject);
  EXPECT_EQ(cl::ParseTimestampPolicy("clamp"), cl::TimestampPolicy::kClamp);
  EXPECT_EQ(cl::ParseTimestampPolicy("passthrough"),
            cl::TimestampPolicy::kPassthrough);
  EXPECT_THAT(cl::ParseTimestampPolicy("Reject"),
              HoldsError(CompassLevelErrc::kInvalidChoice));

  // Every advertised choice parses
  for (const auto name : cl::kTimestampPolicyNames) {
    EXPECT_THAT(cl::ParseTimestampPolicy(name), HasValue()) << name;
  }
}

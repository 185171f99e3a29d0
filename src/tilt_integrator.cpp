#include "compasslevel/estimators/tilt_integrator.hpp"

#include <cmath>
#include <utility>

#include "compasslevel/core/math.hpp"

namespace compasslevel {

std::expected<TimestampPolicy, std::error_code> ParseTimestampPolicy(
    std::string_view name) {
  if (name == "reject") {
    return TimestampPolicy::kReject;
  }
  if (name == "clamp") {
    return TimestampPolicy::kClamp;
  }
  if (name == "passthrough") {
    return TimestampPolicy::kPassthrough;
  }
  return std::unexpected(make_error_code(CompassLevelErrc::kInvalidChoice));
}

TiltIntegrator::TiltIntegrator(std::shared_ptr<Config> config,
                               std::shared_ptr<spdlog::logger> logger)
    : Module("Estimator", kName, std::move(logger)),
      config_(std::make_shared<Config>()) {
  if (auto ec = setConfig(std::move(config))) {
    this->logger()->error(
        "Invalid tilt integrator config ({}); keeping timestamp policy '{}'",
        ec.message(), config_->timestamp_policy);
  }
}

std::error_code TiltIntegrator::setConfig(std::shared_ptr<Config> config) {
  if (!config) {
    return make_error_code(CompassLevelErrc::kConfigValueUninitialized);
  }
  const auto policy = ParseTimestampPolicy(config->timestamp_policy);
  if (!policy) {
    return policy.error();
  }

  config_ = std::move(config);
  policy_ = *policy;
  return {};
}

std::expected<TiltState, std::error_code> TiltIntegrator::integrate(
    const TiltState& state, double wx, double wy,
    std::int64_t timestamp_ns) const {
  if (!std::isfinite(wx) || !std::isfinite(wy)) {
    return std::unexpected(
        make_error_code(CompassLevelErrc::kNumericallyNonFinite));
  }

  TiltState next = state;
  next.last_timestamp_ns = timestamp_ns;

  // Nothing to integrate against yet
  if (!state.last_timestamp_ns) {
    return next;
  }

  const std::int64_t last_ns = *state.last_timestamp_ns;
  // Differences are taken in floating point: timestamps far apart would
  // overflow an int64 subtraction
  double dt = (static_cast<double>(timestamp_ns) -
               static_cast<double>(last_ns)) /
              kNanosPerSecond;
  if (timestamp_ns < last_ns) {
    switch (policy_) {
      case TimestampPolicy::kReject:
        logger()->warn("Rejecting gyro sample at {} ns, {:.6f} s older than {}",
                       timestamp_ns, -dt, last_ns);
        return std::unexpected(
            make_error_code(CompassLevelErrc::kTimestampOutOfOrder));
      case TimestampPolicy::kClamp:
        logger()->debug("Clamping negative gyro dt {:.6f} s to zero", dt);
        dt = 0.0;
        break;
      case TimestampPolicy::kPassthrough:
        logger()->debug("Integrating negative gyro dt {:.6f} s", dt);
        break;
    }
  }

  // Explicit Euler step; the gyro reports rad/s, the angles are in degrees
  next.roll_deg = state.roll_deg + rad2deg(wx) * dt;
  next.pitch_deg = state.pitch_deg + rad2deg(wy) * dt;
  return next;
}

}  // namespace compasslevel

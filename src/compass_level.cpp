#include "compasslevel/estimators/compass_level.hpp"

#include <utility>

#include "compasslevel/core/math.hpp"

namespace compasslevel {

CompassLevel::CompassLevel(std::shared_ptr<Config> config,
                           std::shared_ptr<spdlog::logger> logger)
    : Module("Estimator", kName, std::move(logger)),
      config_(config ? std::move(config) : std::make_shared<Config>()),
      heading_estimator_(config_->heading),
      tilt_integrator_(config_->tilt) {}

std::expected<SampleUpdate, std::error_code> CompassLevel::onSample(
    const Sample& sample) {
  if (simulated_) {
    logger()->trace("Simulated attitude active, ignoring {}", sample);
    return SampleUpdate{};
  }

  if (!sample.values.allFinite()) {
    logger()->warn("Dropping non-finite {}", sample);
    return std::unexpected(
        make_error_code(CompassLevelErrc::kNumericallyNonFinite));
  }

  SampleUpdate update;
  switch (sample.kind) {
    case SensorKind::kAccelerometer:
      heading_state_.gravity = sample.values;
      updateHeading();
      update.heading = heading_state_;
      break;
    case SensorKind::kMagnetometer:
      heading_state_.magnetic = sample.values;
      updateHeading();
      update.heading = heading_state_;
      break;
    case SensorKind::kGyroscope: {
      auto tilt = tilt_integrator_.integrate(tilt_state_, sample.values.x(),
                                             sample.values.y(),
                                             sample.timestamp_ns);
      if (!tilt) {
        return std::unexpected(tilt.error());
      }
      tilt_state_ = *tilt;
      update.tilt = tilt_state_;
      break;
    }
    default:
      logger()->error("Unknown sensor type {}", sample.kind);
      return std::unexpected(
          make_error_code(CompassLevelErrc::kUnknownSensorType));
  }

  last_timestamp_ns_ = sample.timestamp_ns;
  return update;
}

void CompassLevel::updateHeading() {
  if (!heading_state_.complete()) {
    return;
  }

  const auto heading =
      heading_estimator_.estimate(*heading_state_.gravity,
                                  *heading_state_.magnetic);
  if (heading) {
    last_heading_deg_ = *heading;
    heading_stale_ = false;
    return;
  }

  if (last_heading_deg_ && !heading_stale_) {
    logger()->debug("Heading unavailable ({}), keeping {:.1f} deg",
                    heading.error().message(), *last_heading_deg_);
  }
  heading_stale_ = true;
}

void CompassLevel::markSensorUnavailable(SensorKind kind) {
  const auto idx = static_cast<std::size_t>(kind);
  if (idx >= unavailable_.size()) {
    logger()->error("Unknown sensor type {}", kind);
    return;
  }
  logger()->warn("{} unavailable", kind);
  unavailable_[idx] = true;
}

std::error_code CompassLevel::setSimulatedAttitude(double heading_deg,
                                                   double roll_deg,
                                                   double pitch_deg) {
  if (!kSimulatedHeadingBounds.contains(heading_deg) ||
      !kSimulatedTiltBounds.contains(roll_deg) ||
      !kSimulatedTiltBounds.contains(pitch_deg)) {
    return make_error_code(CompassLevelErrc::kOutOfBounds);
  }

  if (!simulated_) {
    logger()->info("Switching to simulated attitude");
  }
  simulated_ = SimulatedAttitude{.heading_deg = heading_deg,
                                 .roll_deg = roll_deg,
                                 .pitch_deg = pitch_deg};
  return {};
}

void CompassLevel::clearSimulation() {
  if (simulated_) {
    logger()->info("Switching back to live sensors");
  }
  simulated_.reset();
}

AttitudeReadout CompassLevel::readout() const {
  if (simulated_) {
    return {
        .heading_deg = WrapTo360(simulated_->heading_deg),
        .roll_deg = simulated_->roll_deg,
        .pitch_deg = simulated_->pitch_deg,
        .heading_status = ReadoutStatus::kValid,
        .tilt_status = ReadoutStatus::kValid,
        .simulated = true,
        .timestamp_ns = last_timestamp_ns_,
    };
  }

  AttitudeReadout readout{
      .heading_deg = last_heading_deg_.value_or(0.0),
      .roll_deg = tilt_state_.roll_deg,
      .pitch_deg = tilt_state_.pitch_deg,
      .timestamp_ns = last_timestamp_ns_,
  };

  if (!available(SensorKind::kAccelerometer) ||
      !available(SensorKind::kMagnetometer)) {
    readout.heading_status = ReadoutStatus::kSensorUnavailable;
  } else if (!last_heading_deg_) {
    readout.heading_status = ReadoutStatus::kWaiting;
  } else {
    readout.heading_status =
        heading_stale_ ? ReadoutStatus::kStale : ReadoutStatus::kValid;
  }

  if (!available(SensorKind::kGyroscope)) {
    readout.tilt_status = ReadoutStatus::kSensorUnavailable;
  } else {
    readout.tilt_status = tilt_state_.last_timestamp_ns
                              ? ReadoutStatus::kValid
                              : ReadoutStatus::kWaiting;
  }
  return readout;
}

void CompassLevel::reset() {
  heading_state_ = {};
  tilt_state_ = {};
  last_heading_deg_.reset();
  heading_stale_ = false;
  last_timestamp_ns_.reset();
  unavailable_.fill(false);
  simulated_.reset();
}

}  // namespace compasslevel

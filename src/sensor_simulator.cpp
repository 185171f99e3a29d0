#include "compasslevel/simulator/sensor_simulator.hpp"

#include <algorithm>
#include <cmath>
#include <optional>
#include <utility>

namespace compasslevel {

namespace {
std::int64_t ToNanos(double seconds) {
  return std::max<std::int64_t>(std::llround(seconds * kNanosPerSecond), 1);
}

// One noise stream per sensor; a zero config seed leaves them all random
std::optional<std::uint32_t> ChannelSeed(std::int64_t seed,
                                         std::uint32_t channel) {
  if (seed == 0) {
    return std::nullopt;
  }
  return DeriveSeed(static_cast<std::uint32_t>(seed), channel);
}

Eigen::Quaterniond InitialAttitude(const SensorSimulatorConfig& config) {
  const Eigen::Quaterniond roll(Eigen::AngleAxisd(
      deg2rad(config.initial_roll_deg), Eigen::Vector3d::UnitX()));
  const Eigen::Quaterniond pitch(Eigen::AngleAxisd(
      deg2rad(config.initial_pitch_deg), Eigen::Vector3d::UnitY()));
  return HeadingToQuaternion(config.initial_heading_deg) * roll * pitch;
}

// Horizontal component points to magnetic north, vertical one down for a
// positive dip
Eigen::Vector3d FieldInWorld(const SensorSimulatorConfig& config) {
  const double dip = deg2rad(config.dip_deg);
  return config.field_strength_ut *
         Eigen::Vector3d(0.0, std::cos(dip), -std::sin(dip));
}
}  // namespace

SensorSimulator::SensorSimulator(std::shared_ptr<Config> config,
                                 std::shared_ptr<spdlog::logger> logger)
    : Module("Simulator", "Sensors", std::move(logger)),
      config_(config ? std::move(config) : std::make_shared<Config>()),
      attitude_(InitialAttitude(*config_)),
      body_rate_(config_->body_rate_dps * deg2rad(1.0)),
      gravity_world_(0.0, 0.0, config_->gravity),
      field_world_(FieldInWorld(*config_)),
      channels_{
          Channel{
              .kind = SensorKind::kAccelerometer,
              .period_ns = ToNanos(config_->accel_period_s),
              .next_due_ns = 0,
              .noise =
                  Vector3NoiseProcess(ChannelSeed(config_->random_seed, 0)),
          },
          Channel{
              .kind = SensorKind::kMagnetometer,
              .period_ns = ToNanos(config_->mag_period_s),
              .next_due_ns = 0,
              .noise =
                  Vector3NoiseProcess(ChannelSeed(config_->random_seed, 1)),
          },
          Channel{
              .kind = SensorKind::kGyroscope,
              .period_ns = ToNanos(config_->gyro_period_s),
              .next_due_ns = 0,
              .noise =
                  Vector3NoiseProcess(ChannelSeed(config_->random_seed, 2)),
          },
      } {
  if (!config_->enable_noise) {
    return;
  }

  const std::array noise_configs = {config_->accel_noise, config_->mag_noise,
                                    config_->gyro_noise};
  for (std::size_t i = 0; i < kNumSensors; ++i) {
    std::error_code ec =
        noise_configs[i]
            ? channels_[i].noise.configure(*noise_configs[i])
            : make_error_code(CompassLevelErrc::kConfigValueUninitialized);
    if (ec) {
      this->logger()->error("Invalid {} noise config: {}", channels_[i].kind,
                            ec.message());
    }
  }
}

std::expected<std::vector<Sample>, std::error_code> SensorSimulator::step(
    double dt) {
  if (!std::isfinite(dt)) {
    return std::unexpected(
        make_error_code(CompassLevelErrc::kNumericallyNonFinite));
  }
  if (dt < 0.0) {
    return std::unexpected(make_error_code(CompassLevelErrc::kOutOfBounds));
  }

  const std::int64_t end_ns = now_ns_ + std::llround(dt * kNanosPerSecond);

  std::vector<Sample> samples;
  while (true) {
    // Ties go to the first channel, so accelerometer before magnetometer
    // before gyroscope
    auto due = std::ranges::min_element(channels_, {}, &Channel::next_due_ns);
    if (due->next_due_ns > end_ns) {
      break;
    }
    propagateTo(due->next_due_ns);
    samples.push_back(measure(*due));
    due->next_due_ns += due->period_ns;
  }
  propagateTo(end_ns);

  logger()->trace("Stepped to {} ns, {} samples", now_ns_, samples.size());
  return samples;
}

void SensorSimulator::setBodyRate(const Eigen::Vector3d& body_rate) {
  body_rate_ = body_rate;
}

double SensorSimulator::trueHeading() const {
  return WrapTo360(
      rad2deg(RotationToAzimuthPitchRoll(attitude_.toRotationMatrix()).x()));
}

void SensorSimulator::propagateTo(std::int64_t timestamp_ns) {
  const double dt =
      static_cast<double>(timestamp_ns - now_ns_) / kNanosPerSecond;
  if (dt > 0.0) {
    // Constant body rate, so the exponential map is exact over any interval
    attitude_ =
        (attitude_ * AngleAxisToQuaternion(Eigen::Vector3d(body_rate_ * dt)))
            .normalized();
  }
  now_ns_ = timestamp_ns;
}

Sample SensorSimulator::measure(Channel& channel) {
  Eigen::Vector3d values = Eigen::Vector3d::Zero();
  switch (channel.kind) {
    case SensorKind::kAccelerometer:
      values = attitude_.conjugate() * gravity_world_;
      break;
    case SensorKind::kMagnetometer:
      values = attitude_.conjugate() * field_world_;
      break;
    case SensorKind::kGyroscope:
      values = body_rate_;
      break;
  }

  if (config_->enable_noise) {
    values = channel.noise.corrupt(
        values, static_cast<double>(channel.period_ns) / kNanosPerSecond);
  }
  return Sample{
      .kind = channel.kind, .timestamp_ns = now_ns_, .values = values};
}

}  // namespace compasslevel

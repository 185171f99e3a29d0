#include "compasslevel/simulator/sensors.hpp"

#include <cmath>

#include "compasslevel/core/common.hpp"

namespace compasslevel {

namespace {
std::optional<std::uint32_t> AxisSeed(std::optional<std::uint32_t> seed,
                                      std::uint32_t axis) {
  if (!seed) {
    return std::nullopt;
  }
  return DeriveSeed(*seed, axis);
}
}  // namespace

std::uint32_t DeriveSeed(std::uint32_t base, std::uint32_t stream) {
  std::seed_seq seq{base, stream};
  std::uint32_t seed = 0;
  seq.generate(&seed, &seed + 1);
  return seed;
}

NoiseProcess::NoiseProcess(std::optional<std::uint32_t> seed)
    : rng_(seed ? *seed : std::random_device{}()) {}

std::error_code NoiseProcess::configure(double noise_density,
                                        double random_walk,
                                        double correlation_time) {
  if (noise_density < 0.0) {
    return make_error_code(CompassLevelErrc::kPhysicallyInvalid);
  }

  if (random_walk < 0.0) {
    return make_error_code(CompassLevelErrc::kPhysicallyInvalid);
  }

  if (correlation_time <= 0.0) {
    return make_error_code(CompassLevelErrc::kPhysicallyInvalid);
  }

  noise_density_ = noise_density;
  random_walk_ = random_walk;
  correlation_time_ = correlation_time;
  return {};
}

void NoiseProcess::initializeBias(double turn_on_sigma) {
  std::normal_distribution dist(0.0, 1.0);
  bias_ = turn_on_sigma * dist(rng_);
}

double NoiseProcess::corrupt(double true_value, double dt) {
  if (dt <= 0.0) {
    return true_value + bias_;
  }

  // 1. Propagate bias (discrete Gauss-Markov)
  const double bias_decay = std::exp(-dt / correlation_time_);
  const double bias_walk_std =
      std::sqrt(-std::pow(random_walk_, 2) * correlation_time_ / 2.0 *
                (std::exp(-2.0 * dt / correlation_time_) - 1.0));

  std::normal_distribution dist(0.0, 1.0);
  bias_ = bias_decay * bias_ + bias_walk_std * dist(rng_);

  // 2. Add white noise
  const double white_noise_std = noise_density_ / std::sqrt(dt);
  return true_value + bias_ + white_noise_std * dist(rng_);
}

Vector3NoiseProcess::Vector3NoiseProcess(std::optional<std::uint32_t> seed)
    : x_(AxisSeed(seed, 0)), y_(AxisSeed(seed, 1)), z_(AxisSeed(seed, 2)) {}

std::error_code Vector3NoiseProcess::configure(
    const SensorNoiseConfig& config) {
  for (NoiseProcess* axis : {&x_, &y_, &z_}) {
    if (auto ec = axis->configure(config.noise_density, config.random_walk,
                                  config.bias_correlation_time)) {
      return ec;
    }
    axis->initializeBias(config.turn_on_bias_sigma);
  }
  return {};
}

Eigen::Vector3d Vector3NoiseProcess::corrupt(const Eigen::Vector3d& true_value,
                                             double dt) {
  return Eigen::Vector3d(x_.corrupt(true_value.x(), dt),
                         y_.corrupt(true_value.y(), dt),
                         z_.corrupt(true_value.z(), dt));
}

Eigen::Vector3d Vector3NoiseProcess::bias() const {
  return Eigen::Vector3d(x_.bias(), y_.bias(), z_.bias());
}

}  // namespace compasslevel

#ifndef COMPASSLEVEL_SIMULATOR_SENSORS_HPP_
#define COMPASSLEVEL_SIMULATOR_SENSORS_HPP_

#include <cstdint>
#include <optional>
#include <random>
#include <system_error>

#include "Eigen/Dense"
#include "compasslevel/base/config_base.hpp"

namespace compasslevel {

/// Noise model of one three-axis sensor
struct SensorNoiseConfig final
    : public ReflectiveConfigBase<SensorNoiseConfig> {
  std::string_view name() const override { return "SensorNoiseConfig"; }

  double noise_density = 0.0;
  double random_walk = 0.0;
  double bias_correlation_time = 300.0;
  double turn_on_bias_sigma = 0.0;

  static constexpr auto kDescriptors = std::make_tuple(
      Describe("noise_density", &SensorNoiseConfig::noise_density,
               F64Properties{.desc = "White noise density (unit/√Hz)",
                             .bounds = Bounds<double>::NonNegative()}),
      Describe("random_walk", &SensorNoiseConfig::random_walk,
               F64Properties{.desc = "Bias random walk (unit/s/√Hz)",
                             .bounds = Bounds<double>::NonNegative()}),
      Describe("bias_correlation_time",
               &SensorNoiseConfig::bias_correlation_time,
               F64Properties{.desc = "Bias correlation time (seconds)",
                             .bounds = Bounds<double>::Positive()}),
      Describe("turn_on_bias_sigma", &SensorNoiseConfig::turn_on_bias_sigma,
               F64Properties{.desc = "Turn-on bias sigma (unit)",
                             .bounds = Bounds<double>::NonNegative()}));
};

/// Seed of stream number `stream` derived from `base` through std::seed_seq.
/// Every base, zero included, is a valid seed.
std::uint32_t DeriveSeed(std::uint32_t base, std::uint32_t stream);

// State holder for a single noise process (e.g., gyro X axis)
class NoiseProcess {
 public:
  // Without a seed the generator is seeded from std::random_device
  explicit NoiseProcess(std::optional<std::uint32_t> seed = std::nullopt);

  std::error_code configure(double noise_density, double random_walk,
                            double correlation_time);

  void initializeBias(double turn_on_sigma);

  // Updates bias and returns the corrupt value (true_val + bias + white_noise)
  double corrupt(double true_value, double dt);

  double bias() const { return bias_; }

 private:
  std::mt19937 rng_;
  double noise_density_ = 0.0;
  double random_walk_ = 0.0;
  double correlation_time_ = 1.0;
  double bias_ = 0.0;
};

/// Independent noise processes for the three axes of a sensor
class Vector3NoiseProcess {
 public:
  // Each axis draws from its own stream derived from seed
  explicit Vector3NoiseProcess(
      std::optional<std::uint32_t> seed = std::nullopt);

  std::error_code configure(const SensorNoiseConfig& config);

  Eigen::Vector3d corrupt(const Eigen::Vector3d& true_value, double dt);

  Eigen::Vector3d bias() const;

 private:
  NoiseProcess x_;
  NoiseProcess y_;
  NoiseProcess z_;
};

}  // namespace compasslevel

#endif  // COMPASSLEVEL_SIMULATOR_SENSORS_HPP_

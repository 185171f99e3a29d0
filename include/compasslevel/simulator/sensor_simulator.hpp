#ifndef COMPASSLEVEL_SIMULATOR_SENSOR_SIMULATOR_HPP_
#define COMPASSLEVEL_SIMULATOR_SENSOR_SIMULATOR_HPP_

#include <array>
#include <cstdint>
#include <expected>
#include <memory>
#include <system_error>
#include <vector>

#include "Eigen/Dense"
#include "compasslevel/base/config_base.hpp"
#include "compasslevel/base/module.hpp"
#include "compasslevel/core/definitions.hpp"
#include "compasslevel/core/math.hpp"
#include "compasslevel/simulator/sensors.hpp"

namespace compasslevel {

struct SensorSimulatorConfig final
    : public ReflectiveConfigBase<SensorSimulatorConfig> {
  std::string_view name() const override { return "SensorSimulatorConfig"; }

  // Initial attitude. Roll is about the device x axis, pitch about y, matching
  // the gyroscope axes the tilt integrator reads.
  double initial_heading_deg = 0.0;
  double initial_roll_deg = 0.0;
  double initial_pitch_deg = 0.0;

  // Constant angular velocity in device axes
  Eigen::Vector3d body_rate_dps = Eigen::Vector3d::Zero();

  double accel_period_s = 0.02;
  double mag_period_s = 0.02;
  double gyro_period_s = 0.005;

  // Environment
  double gravity = 9.80665;
  double field_strength_ut = 50.0;
  double dip_deg = 60.0;

  bool enable_noise = false;
  std::int64_t random_seed = 0;  // 0 = nondeterministic
  std::shared_ptr<SensorNoiseConfig> accel_noise = [] {
    auto cfg = std::make_shared<SensorNoiseConfig>();
    cfg->noise_density = 4.0e-3;
    cfg->random_walk = 6.0e-3;
    cfg->turn_on_bias_sigma = 0.05;
    return cfg;
  }();
  std::shared_ptr<SensorNoiseConfig> mag_noise = [] {
    auto cfg = std::make_shared<SensorNoiseConfig>();
    cfg->noise_density = 0.05;
    cfg->random_walk = 0.0;
    cfg->turn_on_bias_sigma = 0.5;
    return cfg;
  }();
  std::shared_ptr<SensorNoiseConfig> gyro_noise = [] {
    auto cfg = std::make_shared<SensorNoiseConfig>();
    cfg->noise_density = deg2rad(2.0 * 35.0 / 3600.0);
    cfg->random_walk = deg2rad(2.0 * 4.0 / 3600.0);
    cfg->bias_correlation_time = 1.0e+3;
    cfg->turn_on_bias_sigma = deg2rad(0.5);
    return cfg;
  }();

  static constexpr auto kDescriptors = std::make_tuple(
      Describe("initial_heading_deg",
               &SensorSimulatorConfig::initial_heading_deg,
               F64Properties{.desc = "Initial compass heading (degrees)",
                             .bounds = Bounds<double>::HalfOpenInterval(
                                 0.0, 360.0)}),
      Describe("initial_roll_deg", &SensorSimulatorConfig::initial_roll_deg,
               F64Properties{
                   .desc = "Initial rotation about the device x axis (degrees)",
                   .bounds = Bounds<double>::ClosedInterval(-90.0, 90.0)}),
      Describe("initial_pitch_deg", &SensorSimulatorConfig::initial_pitch_deg,
               F64Properties{
                   .desc = "Initial rotation about the device y axis (degrees)",
                   .bounds = Bounds<double>::ClosedInterval(-90.0, 90.0)}),
      Describe(
          "body_rate_dps", &SensorSimulatorConfig::body_rate_dps,
          F64Properties{.desc = "Angular velocity in device axes (deg/s)"}),
      Describe("accel_period_s", &SensorSimulatorConfig::accel_period_s,
               F64Properties{.desc = "Accelerometer sample period (seconds)",
                             .bounds = Bounds<double>::Positive()}),
      Describe("mag_period_s", &SensorSimulatorConfig::mag_period_s,
               F64Properties{.desc = "Magnetometer sample period (seconds)",
                             .bounds = Bounds<double>::Positive()}),
      Describe("gyro_period_s", &SensorSimulatorConfig::gyro_period_s,
               F64Properties{.desc = "Gyroscope sample period (seconds)",
                             .bounds = Bounds<double>::Positive()}),
      Describe("gravity", &SensorSimulatorConfig::gravity,
               F64Properties{.desc = "Gravity magnitude (m/s²)",
                             .bounds = Bounds<double>::Positive()}),
      Describe("field_strength_ut", &SensorSimulatorConfig::field_strength_ut,
               F64Properties{.desc = "Geomagnetic field strength (µT)",
                             .bounds = Bounds<double>::Positive()}),
      Describe("dip_deg", &SensorSimulatorConfig::dip_deg,
               F64Properties{
                   .desc = "Magnetic inclination below the horizon (degrees)",
                   .bounds = Bounds<double>::OpenInterval(-90.0, 90.0)}),
      Describe("enable_noise", &SensorSimulatorConfig::enable_noise,
               Properties{.desc = "Corrupt samples with sensor noise"}),
      Describe("random_seed", &SensorSimulatorConfig::random_seed,
               I64Properties{.desc = "Noise seed, 0 for a random one",
                             .bounds = Bounds<std::int64_t>::ClosedInterval(
                                 0, 0xFFFFFFFF)}),
      Describe("accel_noise", &SensorSimulatorConfig::accel_noise,
               Properties{.desc = "Accelerometer noise (m/s²)"}),
      Describe("mag_noise", &SensorSimulatorConfig::mag_noise,
               Properties{.desc = "Magnetometer noise (µT)"}),
      Describe("gyro_noise", &SensorSimulatorConfig::gyro_noise,
               Properties{.desc = "Gyroscope noise (rad/s)"}));
};

/// Synthetic accelerometer, magnetometer and gyroscope of a device rotating
/// at a constant body rate in a uniform gravity and geomagnetic field.
///
/// World frame is East-North-Up. The attitude maps device vectors into the
/// world frame; at heading h the device +y axis points h degrees clockwise
/// from magnetic north.
class SensorSimulator : public Module {
 public:
  using Config = SensorSimulatorConfig;

  explicit SensorSimulator(
      std::shared_ptr<Config> config = std::make_shared<Config>(),
      std::shared_ptr<spdlog::logger> logger = nullptr);

  /// Advances time by dt seconds and returns every sample that fell due, in
  /// timestamp order. The first call also emits samples at time zero.
  std::expected<std::vector<Sample>, std::error_code> step(double dt);

  /// Angular velocity in device axes (rad/s)
  void setBodyRate(const Eigen::Vector3d& body_rate);

  [[nodiscard]] const Eigen::Quaterniond& attitude() const {
    return attitude_;
  }

  /// Ground-truth azimuth of the device +y axis, [0, 360)
  [[nodiscard]] double trueHeading() const;

  [[nodiscard]] std::int64_t now_ns() const { return now_ns_; }

 private:
  static constexpr std::size_t kNumSensors = 3;

  struct Channel {
    SensorKind kind;
    std::int64_t period_ns;
    std::int64_t next_due_ns;
    Vector3NoiseProcess noise;
  };

  void propagateTo(std::int64_t timestamp_ns);

  Sample measure(Channel& channel);

  std::shared_ptr<Config> config_;

  Eigen::Quaterniond attitude_;
  Eigen::Vector3d body_rate_;
  Eigen::Vector3d gravity_world_;
  Eigen::Vector3d field_world_;
  std::int64_t now_ns_ = 0;

  std::array<Channel, kNumSensors> channels_;
};

}  // namespace compasslevel

#endif  // COMPASSLEVEL_SIMULATOR_SENSOR_SIMULATOR_HPP_

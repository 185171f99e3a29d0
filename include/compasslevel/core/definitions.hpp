#ifndef COMPASSLEVEL_CORE_DEFINITIONS_HPP_
#define COMPASSLEVEL_CORE_DEFINITIONS_HPP_

#include <cstdint>
#include <optional>
#include <utility>

#include "Eigen/Dense"
#include "compasslevel/core/common.hpp"
#include "fmt/format.h"

namespace compasslevel {

inline constexpr double kNanosPerSecond = 1e9;

enum class SensorKind : std::uint8_t {
  kAccelerometer,
  kMagnetometer,
  kGyroscope,
};

/// A single reading pushed by the platform sensor subsystem.
///
/// Units depend on the kind: m/s^2 for the accelerometer, uT for the
/// magnetometer and rad/s for the gyroscope, all in device-local axes.
struct Sample {
  SensorKind kind = SensorKind::kAccelerometer;
  std::int64_t timestamp_ns = 0;  // Monotonic clock
  Eigen::Vector3d values = Eigen::Vector3d::Zero();

  static Sample Accelerometer(std::int64_t timestamp_ns,
                              const Eigen::Vector3d& values) {
    return {SensorKind::kAccelerometer, timestamp_ns, values};
  }

  static Sample Magnetometer(std::int64_t timestamp_ns,
                             const Eigen::Vector3d& values) {
    return {SensorKind::kMagnetometer, timestamp_ns, values};
  }

  static Sample Gyroscope(std::int64_t timestamp_ns,
                          const Eigen::Vector3d& values) {
    return {SensorKind::kGyroscope, timestamp_ns, values};
  }

  [[nodiscard]] double timestamp_secs() const {
    return static_cast<double>(timestamp_ns) / kNanosPerSecond;
  }
};

// Last known inputs of the compass. Values are retained once set.
struct HeadingState {
  std::optional<Eigen::Vector3d> gravity;
  std::optional<Eigen::Vector3d> magnetic;

  [[nodiscard]] bool complete() const {
    return gravity.has_value() && magnetic.has_value();
  }
};

// Cumulative gyro tilt. Angles are never wrapped.
struct TiltState {
  double roll_deg = 0.0;
  double pitch_deg = 0.0;
  std::optional<std::int64_t> last_timestamp_ns;
};

struct MagneticAttitude {
  double azimuth_deg = 0.0;  // [0, 360), clockwise from magnetic north
  double pitch_deg = 0.0;
  double roll_deg = 0.0;
  double inclination_deg = 0.0;  // Positive when the field dips below horizon
};

enum class ReadoutStatus : std::uint8_t {
  kWaiting,
  kValid,
  kStale,
  kSensorUnavailable,
};

/// Snapshot handed to the renderer every frame
struct AttitudeReadout {
  double heading_deg = 0.0;
  double roll_deg = 0.0;
  double pitch_deg = 0.0;
  ReadoutStatus heading_status = ReadoutStatus::kWaiting;
  ReadoutStatus tilt_status = ReadoutStatus::kWaiting;
  bool simulated = false;
  std::optional<std::int64_t> timestamp_ns;
};

}  // namespace compasslevel

namespace fmt {

struct NoSpecifierFormatter {
  constexpr auto parse(format_parse_context& ctx) const { return ctx.begin(); }
};

template <>
struct formatter<compasslevel::SensorKind> : NoSpecifierFormatter {
  template <typename FormatContext>
  auto format(const compasslevel::SensorKind& kind, FormatContext& ctx) const {
    switch (kind) {
      case compasslevel::SensorKind::kAccelerometer:
        return ::fmt::format_to(ctx.out(), "Accelerometer");
      case compasslevel::SensorKind::kMagnetometer:
        return ::fmt::format_to(ctx.out(), "Magnetometer");
      case compasslevel::SensorKind::kGyroscope:
        return ::fmt::format_to(ctx.out(), "Gyroscope");
      default:
        return ::fmt::format_to(ctx.out(), "Unknown({})",
                                std::to_underlying(kind));
    }
  }
};

template <>
struct formatter<compasslevel::ReadoutStatus> : NoSpecifierFormatter {
  template <typename FormatContext>
  auto format(const compasslevel::ReadoutStatus& status,
              FormatContext& ctx) const {
    switch (status) {
      case compasslevel::ReadoutStatus::kWaiting:
        return ::fmt::format_to(ctx.out(), "Waiting");
      case compasslevel::ReadoutStatus::kValid:
        return ::fmt::format_to(ctx.out(), "Valid");
      case compasslevel::ReadoutStatus::kStale:
        return ::fmt::format_to(ctx.out(), "Stale");
      case compasslevel::ReadoutStatus::kSensorUnavailable:
        return ::fmt::format_to(ctx.out(), "SensorUnavailable");
      default:
        std::unreachable();
    }
  }
};

template <>
struct formatter<compasslevel::Sample> : NoSpecifierFormatter {
  template <typename FormatContext>
  auto format(const compasslevel::Sample& sample, FormatContext& ctx) const {
    return ::fmt::format_to(ctx.out(), "Sample({} @ {} ns: [{}, {}, {}])",
                            sample.kind, sample.timestamp_ns, sample.values.x(),
                            sample.values.y(), sample.values.z());
  }
};

template <>
struct formatter<compasslevel::AttitudeReadout> : NoSpecifierFormatter {
  template <typename FormatContext>
  auto format(const compasslevel::AttitudeReadout& readout,
              FormatContext& ctx) const {
    return ::fmt::format_to(
        ctx.out(),
        "AttitudeReadout(Heading: {:.1f} deg [{}], Roll: {:.1f} deg, "
        "Pitch: {:.1f} deg [{}]{})",
        readout.heading_deg, readout.heading_status, readout.roll_deg,
        readout.pitch_deg, readout.tilt_status,
        readout.simulated ? ", Simulated" : "");
  }
};

}  // namespace fmt

static_assert(fmt::is_formattable<compasslevel::Sample>::value);
static_assert(fmt::is_formattable<compasslevel::AttitudeReadout>::value);

#endif  // COMPASSLEVEL_CORE_DEFINITIONS_HPP_

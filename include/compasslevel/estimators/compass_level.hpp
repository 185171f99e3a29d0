#ifndef COMPASSLEVEL_ESTIMATORS_COMPASS_LEVEL_HPP_
#define COMPASSLEVEL_ESTIMATORS_COMPASS_LEVEL_HPP_

#include <array>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <system_error>

#include "compasslevel/base/config_base.hpp"
#include "compasslevel/base/module.hpp"
#include "compasslevel/core/definitions.hpp"
#include "compasslevel/estimators/heading_estimator.hpp"
#include "compasslevel/estimators/tilt_integrator.hpp"

namespace compasslevel {

/// States changed by a single sample. Both are empty when the sample was
/// ignored because a simulated attitude is active.
struct SampleUpdate {
  std::optional<HeadingState> heading;
  std::optional<TiltState> tilt;
};

/// Routes sensor samples to the heading estimator and the tilt integrator and
/// keeps the readout a renderer polls every frame. Not thread-safe; see
/// AsyncCompassLevel.
class CompassLevel : public Module {
 public:
  static constexpr char kName[] = "CompassLevel";

  // Slider ranges of the simulated attitude
  static constexpr auto kSimulatedHeadingBounds =
      Bounds<double>::ClosedInterval(0.0, 360.0);
  static constexpr auto kSimulatedTiltBounds =
      Bounds<double>::ClosedInterval(-45.0, 45.0);

  struct Config final : ReflectiveConfigBase<Config> {
    std::shared_ptr<HeadingEstimator::Config> heading =
        std::make_shared<HeadingEstimator::Config>();
    std::shared_ptr<TiltIntegrator::Config> tilt =
        std::make_shared<TiltIntegrator::Config>();

    std::string_view name() const override { return "CompassLevelConfig"; }

    static constexpr auto kDescriptors = std::make_tuple(
        Describe("heading", &Config::heading,
                 Properties{.desc = "Compass heading estimation"}),
        Describe("tilt", &Config::tilt,
                 Properties{.desc = "Gyroscope tilt integration"}));
  };

  explicit CompassLevel(
      std::shared_ptr<Config> config = std::make_shared<Config>(),
      std::shared_ptr<spdlog::logger> logger = nullptr);

  /** Consumes one sensor sample.
   *
   * Accelerometer and magnetometer samples replace the stored gravity and
   * field vectors and recompute the heading once both are known. A heading
   * that cannot be computed is not an error: the last valid heading is kept
   * and reported as stale. Gyroscope samples are integrated into roll and
   * pitch.
   *
   * @return The states the sample changed, or kNumericallyNonFinite,
   *         kUnknownSensorType or an integration error. Errors leave every
   *         state untouched.
   */
  std::expected<SampleUpdate, std::error_code> onSample(const Sample& sample);

  /// Reports a sensor the platform could not provide
  void markSensorUnavailable(SensorKind kind);

  /** Replaces the live readout with a fixed attitude.
   *
   * While active, live samples are ignored. Heading must lie in [0, 360],
   * roll and pitch in [-45, 45].
   */
  std::error_code setSimulatedAttitude(double heading_deg, double roll_deg,
                                       double pitch_deg);

  void clearSimulation();

  [[nodiscard]] bool simulating() const { return simulated_.has_value(); }

  [[nodiscard]] AttitudeReadout readout() const;

  [[nodiscard]] const HeadingState& headingState() const {
    return heading_state_;
  }

  [[nodiscard]] const TiltState& tiltState() const { return tilt_state_; }

  /// Forgets all samples, sensor availability and the simulated attitude
  void reset();

  [[nodiscard]] std::shared_ptr<const Config> config() const {
    return config_;
  }

 private:
  struct SimulatedAttitude {
    double heading_deg;
    double roll_deg;
    double pitch_deg;
  };

  void updateHeading();

  [[nodiscard]] bool available(SensorKind kind) const {
    return !unavailable_[static_cast<std::size_t>(kind)];
  }

  std::shared_ptr<Config> config_;
  HeadingEstimator heading_estimator_;
  TiltIntegrator tilt_integrator_;

  HeadingState heading_state_;
  TiltState tilt_state_;
  std::optional<double> last_heading_deg_;
  bool heading_stale_ = false;
  std::optional<std::int64_t> last_timestamp_ns_;

  std::array<bool, 3> unavailable_{};
  std::optional<SimulatedAttitude> simulated_;
};

}  // namespace compasslevel

#endif  // COMPASSLEVEL_ESTIMATORS_COMPASS_LEVEL_HPP_

#ifndef COMPASSLEVEL_ESTIMATORS_TILT_INTEGRATOR_HPP_
#define COMPASSLEVEL_ESTIMATORS_TILT_INTEGRATOR_HPP_

#include <array>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>

#include "compasslevel/base/config_base.hpp"
#include "compasslevel/base/module.hpp"
#include "compasslevel/core/definitions.hpp"

namespace compasslevel {

// What to do with a gyro sample older than the previous one
enum class TimestampPolicy {
  kReject,       // Return kTimestampOutOfOrder, keep the state
  kClamp,        // Integrate with dt = 0
  kPassthrough,  // Integrate the negative dt
};

inline constexpr std::array<std::string_view, 3> kTimestampPolicyNames = {
    "reject", "clamp", "passthrough"};

std::expected<TimestampPolicy, std::error_code> ParseTimestampPolicy(
    std::string_view name);

class TiltIntegrator : public Module {
 public:
  static constexpr char kName[] = "Tilt";

  struct Config final : ReflectiveConfigBase<Config> {
    std::string timestamp_policy = "reject";

    std::string_view name() const override { return "TiltIntegratorConfig"; }

    static constexpr auto kDescriptors = std::make_tuple(Describe(
        "timestamp_policy", &Config::timestamp_policy,
        StrProperties{.desc = "Handling of out-of-order gyroscope timestamps",
                      .non_empty = true,
                      .choices = kTimestampPolicyNames}));
  };

  // An invalid config is logged and the default policy is kept
  explicit TiltIntegrator(
      std::shared_ptr<Config> config = std::make_shared<Config>(),
      std::shared_ptr<spdlog::logger> logger = nullptr);

  std::error_code setConfig(std::shared_ptr<Config> config);

  /** Integrates one gyroscope sample into the tilt angles.
   *
   * The first sample only records its timestamp. Every later sample adds
   * omega * dt, converted to degrees, to roll (x) and pitch (y). Angles are
   * never wrapped.
   *
   * @param state Tilt before the sample.
   * @param wx Angular velocity about the device x axis (rad/s).
   * @param wy Angular velocity about the device y axis (rad/s).
   * @param timestamp_ns Sample timestamp.
   * @return The new tilt, or an error with the state left as it was.
   */
  [[nodiscard]] std::expected<TiltState, std::error_code> integrate(
      const TiltState& state, double wx, double wy,
      std::int64_t timestamp_ns) const;

  [[nodiscard]] TimestampPolicy policy() const { return policy_; }

  [[nodiscard]] std::shared_ptr<const Config> config() const {
    return config_;
  }

 private:
  std::shared_ptr<Config> config_;
  TimestampPolicy policy_ = TimestampPolicy::kReject;
};

}  // namespace compasslevel

#endif  // COMPASSLEVEL_ESTIMATORS_TILT_INTEGRATOR_HPP_

#ifndef COMPASSLEVEL_ESTIMATORS_HEADING_ESTIMATOR_HPP_
#define COMPASSLEVEL_ESTIMATORS_HEADING_ESTIMATOR_HPP_

#include <expected>
#include <memory>
#include <system_error>

#include "Eigen/Dense"
#include "compasslevel/base/config_base.hpp"
#include "compasslevel/base/module.hpp"
#include "compasslevel/core/definitions.hpp"

namespace compasslevel {

/** Builds the device-to-world rotation from a gravity and a geomagnetic sample.
 *
 * Rows of the result are the East, North and Up axes expressed in device
 * coordinates:
 *   east  = normalize(magnetic x gravity)
 *   north = up x east
 *   up    = normalize(gravity)
 *
 * @param gravity Accelerometer reading at rest (points away from the ground).
 * @param magnetic Magnetometer reading.
 * @param min_vector_norm Inputs shorter than this are rejected.
 * @param parallel_tolerance Rejects inputs whose unit vectors have a cross
 *        product shorter than this.
 * @return The rotation, or kDegenerateInput / kNumericallyNonFinite.
 */
std::expected<Eigen::Matrix3d, std::error_code> RotationFromGravityAndMagnetic(
    const Eigen::Vector3d& gravity, const Eigen::Vector3d& magnetic,
    double min_vector_norm, double parallel_tolerance);

class HeadingEstimator : public Module {
 public:
  static constexpr char kName[] = "Heading";

  struct Config final : ReflectiveConfigBase<Config> {
    double min_vector_norm = 1e-6;
    double parallel_tolerance = 1e-6;

    std::string_view name() const override { return "HeadingEstimatorConfig"; }

    static constexpr auto kDescriptors = std::make_tuple(
        Describe("min_vector_norm", &Config::min_vector_norm,
                 F64Properties{
                     .desc = "Gravity or magnetic samples shorter than this "
                             "cannot produce a heading",
                     .bounds = Bounds<double>::Positive()}),
        Describe("parallel_tolerance", &Config::parallel_tolerance,
                 F64Properties{
                     .desc = "Minimum sine of the angle between gravity and "
                             "the magnetic field",
                     .bounds = Bounds<double>::OpenInterval(0.0, 1.0)}));
  };

  explicit HeadingEstimator(
      std::shared_ptr<Config> config = std::make_shared<Config>(),
      std::shared_ptr<spdlog::logger> logger = nullptr);

  /// Compass heading in degrees, [0, 360). An error means "unavailable".
  [[nodiscard]] std::expected<double, std::error_code> estimate(
      const Eigen::Vector3d& gravity, const Eigen::Vector3d& magnetic) const;

  /// Heading together with pitch, roll and magnetic inclination
  [[nodiscard]] std::expected<MagneticAttitude, std::error_code>
  estimateAttitude(const Eigen::Vector3d& gravity,
                   const Eigen::Vector3d& magnetic) const;

  [[nodiscard]] std::shared_ptr<const Config> config() const {
    return config_;
  }

 private:
  std::expected<Eigen::Matrix3d, std::error_code> rotation(
      const Eigen::Vector3d& gravity, const Eigen::Vector3d& magnetic) const;

  std::shared_ptr<Config> config_;
};

}  // namespace compasslevel

#endif  // COMPASSLEVEL_ESTIMATORS_HEADING_ESTIMATOR_HPP_

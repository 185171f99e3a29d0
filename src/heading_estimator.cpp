#include "compasslevel/estimators/heading_estimator.hpp"

#include <cmath>
#include <utility>

#include "compasslevel/core/math.hpp"

namespace compasslevel {

std::expected<Eigen::Matrix3d, std::error_code> RotationFromGravityAndMagnetic(
    const Eigen::Vector3d& gravity, const Eigen::Vector3d& magnetic,
    double min_vector_norm, double parallel_tolerance) {
  if (!gravity.allFinite() || !magnetic.allFinite()) {
    return std::unexpected(
        make_error_code(CompassLevelErrc::kNumericallyNonFinite));
  }

  const double gravity_norm = gravity.norm();
  const double magnetic_norm = magnetic.norm();
  if (gravity_norm < min_vector_norm || magnetic_norm < min_vector_norm) {
    return std::unexpected(make_error_code(CompassLevelErrc::kDegenerateInput));
  }

  // Normalize first so that the parallel check does not depend on units
  const Eigen::Vector3d up = gravity / gravity_norm;
  const Eigen::Vector3d field = magnetic / magnetic_norm;

  Eigen::Vector3d east = field.cross(up);
  const double east_norm = east.norm();
  if (east_norm < parallel_tolerance) {
    return std::unexpected(make_error_code(CompassLevelErrc::kDegenerateInput));
  }
  east /= east_norm;

  // up and east are orthonormal, so north is already unit length
  const Eigen::Vector3d north = up.cross(east);

  Eigen::Matrix3d R;
  R.row(0) = east.transpose();
  R.row(1) = north.transpose();
  R.row(2) = up.transpose();
  return R;
}

HeadingEstimator::HeadingEstimator(std::shared_ptr<Config> config,
                                   std::shared_ptr<spdlog::logger> logger)
    : Module("Estimator", kName, std::move(logger)),
      config_(config ? std::move(config) : std::make_shared<Config>()) {}

std::expected<Eigen::Matrix3d, std::error_code> HeadingEstimator::rotation(
    const Eigen::Vector3d& gravity, const Eigen::Vector3d& magnetic) const {
  auto R = RotationFromGravityAndMagnetic(gravity, magnetic,
                                          config_->min_vector_norm,
                                          config_->parallel_tolerance);
  if (!R) {
    logger()->debug("No heading for |g|={:.3g}, |m|={:.3g}: {}",
                    gravity.norm(), magnetic.norm(), R.error().message());
  }
  return R;
}

std::expected<double, std::error_code> HeadingEstimator::estimate(
    const Eigen::Vector3d& gravity, const Eigen::Vector3d& magnetic) const {
  const auto R = rotation(gravity, magnetic);
  if (!R) {
    return std::unexpected(R.error());
  }
  return WrapTo360(rad2deg(RotationToAzimuthPitchRoll(*R).x()));
}

std::expected<MagneticAttitude, std::error_code>
HeadingEstimator::estimateAttitude(const Eigen::Vector3d& gravity,
                                   const Eigen::Vector3d& magnetic) const {
  const auto R = rotation(gravity, magnetic);
  if (!R) {
    return std::unexpected(R.error());
  }

  const Eigen::Vector3d angles = RotationToAzimuthPitchRoll(*R);

  // Dip of the field below the horizontal plane, measured in the
  // north-up plane of the world frame
  const Eigen::Vector3d field_enu = *R * magnetic.normalized();
  const double inclination = std::atan2(-field_enu.z(), field_enu.y());

  return MagneticAttitude{
      .azimuth_deg = WrapTo360(rad2deg(angles.x())),
      .pitch_deg = rad2deg(angles.y()),
      .roll_deg = rad2deg(angles.z()),
      .inclination_deg = rad2deg(inclination),
  };
}

}  // namespace compasslevel

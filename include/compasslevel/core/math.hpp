#ifndef COMPASSLEVEL_CORE_MATH_HPP_
#define COMPASSLEVEL_CORE_MATH_HPP_

#include <algorithm>
#include <cmath>
#include <concepts>
#include <limits>
#include <numbers>

#include "Eigen/Dense"
#include "compasslevel/core/common.hpp"

namespace compasslevel {

template <std::floating_point T>
constexpr T deg2rad(T degrees) {
  return degrees * (std::numbers::pi_v<T> / static_cast<T>(180));
}

template <std::floating_point T>
constexpr T rad2deg(T radians) {
  return radians * (static_cast<T>(180) / std::numbers::pi_v<T>);
}

template <std::floating_point T>
struct Tolerances {
  static constexpr T kDefaultAbsTol = static_cast<T>(1e-5);
  static constexpr T kDefaultRelTol = static_cast<T>(1e-8);

  T abs = kDefaultAbsTol;
  T rel = kDefaultRelTol;
};

template <std::floating_point T>
bool IsClose(T a, T b, const Tolerances<T>& tols = {}) {
  using std::abs;
  using std::max;
  using std::min;
  if (a == b) {
    return true;
  }

  const T diff = abs(a - b);
  const T norm = min((abs(a) + abs(b)), std::numeric_limits<T>::max());
  return diff < max(tols.abs, tols.rel * norm);
}

/// Maps an angle in degrees onto [0, 360)
template <std::floating_point T>
T WrapTo360(T degrees) {
  constexpr T kFullTurn = static_cast<T>(360);
  T wrapped = std::fmod(degrees, kFullTurn);
  if (wrapped < T(0)) {
    wrapped += kFullTurn;
  }
  // fmod of a tiny negative value can round back up to exactly 360. Adding
  // zero turns -0 into +0.
  return wrapped >= kFullTurn ? T(0) : wrapped + T(0);
}

template <Vector3Like Derived>
Eigen::Quaternion<typename Derived::Scalar> AngleAxisToQuaternion(
    const Eigen::MatrixBase<Derived>& angle_axis) {
  using Scalar = typename Derived::Scalar;
  using std::cos;
  using std::sin;
  using std::sqrt;

  const Scalar theta_sq = angle_axis.squaredNorm();

  Scalar imag_factor;
  Scalar real_factor;

  if (IsClose(theta_sq, Scalar(0))) {
    const Scalar theta_po4 = theta_sq * theta_sq;
    imag_factor = Scalar(0.5) - Scalar(1.0 / 48.0) * theta_sq +
                  Scalar(1.0 / 3840.0) * theta_po4;
    real_factor = Scalar(1) - Scalar(1.0 / 8.0) * theta_sq +
                  Scalar(1.0 / 384.0) * theta_po4;
  } else {
    const Scalar theta = sqrt(theta_sq);
    const Scalar half_theta = Scalar(0.5) * theta;
    imag_factor = sin(half_theta) / theta;
    real_factor = cos(half_theta);
  }

  Eigen::Quaternion<Scalar> quaternion;
  quaternion.w() = real_factor;
  quaternion.vec() = imag_factor * angle_axis;
  return quaternion;
}

/// Decomposes a device-to-ENU rotation matrix into (azimuth, pitch, roll)
/// in radians. Azimuth is the angle of the device +y axis clockwise from
/// north, in (-pi, pi].
template <Matrix3Like Derived>
Eigen::Vector3<typename Derived::Scalar> RotationToAzimuthPitchRoll(
    const Eigen::MatrixBase<Derived>& R) {
  using Scalar = typename Derived::Scalar;
  using std::asin;
  using std::atan2;
  using std::clamp;

  Eigen::Vector3<Scalar> angles;
  angles.x() = atan2(R(0, 1), R(1, 1));
  angles.y() = asin(clamp(-R(2, 1), Scalar(-1), Scalar(1)));
  angles.z() = atan2(-R(2, 0), R(2, 2));
  return angles;
}

/// Rotation about the world vertical that turns the device +y axis from
/// magnetic north to the given compass heading (clockwise, degrees)
template <std::floating_point T>
Eigen::Quaternion<T> HeadingToQuaternion(T heading_deg) {
  return Eigen::Quaternion<T>(
      Eigen::AngleAxis<T>(-deg2rad(heading_deg), Eigen::Vector3<T>::UnitZ()));
}

}  // namespace compasslevel

#endif  // COMPASSLEVEL_CORE_MATH_HPP_

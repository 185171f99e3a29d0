#ifndef COMPASSLEVEL_TESTING_DEVICE_VECTORS_HPP_
#define COMPASSLEVEL_TESTING_DEVICE_VECTORS_HPP_

#include <cmath>

#include "Eigen/Dense"
#include "compasslevel/core/math.hpp"

namespace compasslevel::testing {

struct DeviceVectors {
  Eigen::Vector3d gravity;
  Eigen::Vector3d magnetic;
};

// Device-to-ENU attitude: heading about the vertical, then roll about the
// device x axis, then pitch about the device y axis
inline Eigen::Quaterniond DeviceAttitude(double heading_deg, double roll_deg,
                                         double pitch_deg) {
  return HeadingToQuaternion(heading_deg) *
         Eigen::Quaterniond(
             Eigen::AngleAxisd(deg2rad(roll_deg), Eigen::Vector3d::UnitX())) *
         Eigen::Quaterniond(
             Eigen::AngleAxisd(deg2rad(pitch_deg), Eigen::Vector3d::UnitY()));
}

// What a resting device reads in a field of the given strength and dip
inline DeviceVectors VectorsAt(double heading_deg, double roll_deg = 0.0,
                               double pitch_deg = 0.0,
                               double field_strength = 50.0,
                               double dip_deg = 60.0) {
  const double dip = deg2rad(dip_deg);
  const Eigen::Vector3d gravity_world(0.0, 0.0, 9.81);
  const Eigen::Vector3d field_world =
      field_strength * Eigen::Vector3d(0.0, std::cos(dip), -std::sin(dip));
  const Eigen::Quaterniond q = DeviceAttitude(heading_deg, roll_deg, pitch_deg);
  return {.gravity = q.conjugate() * gravity_world,
          .magnetic = q.conjugate() * field_world};
}

}  // namespace compasslevel::testing

#endif  // COMPASSLEVEL_TESTING_DEVICE_VECTORS_HPP_

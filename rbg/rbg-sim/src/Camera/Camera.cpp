// Ticket: 0007_orbit_camera

#include "rbg-sim/src/Camera/Camera.hpp"

#include <algorithm>
#include <cmath>

namespace rbg_sim
{

void Camera::lookAt(const Coordinate& target)
{
  Eigen::Vector3d const direction = target - position;
  if (direction.norm() < 1e-9)
  {
    return;
  }

  // Forward is -Z: yaw = atan2(-dx, -dz), pitch = asin(dy)
  Eigen::Vector3d const d = direction.normalized();
  double const yaw = std::atan2(-d.x(), -d.z());
  double const pitch = std::asin(std::clamp(d.y(), -1.0, 1.0));
  orientation = composeYawPitch(yaw, pitch);
}

YawPitch decomposeYawPitch(const Eigen::Quaterniond& orientation)
{
  // R = Ry(yaw) * Rx(pitch) * Rz(roll); the third column does not depend on
  // roll: (sin(yaw)cos(pitch), -sin(pitch), cos(yaw)cos(pitch))
  Eigen::Matrix3d const r = orientation.normalized().toRotationMatrix();

  YawPitch result;
  result.pitch = std::asin(std::clamp(-r(1, 2), -1.0, 1.0));
  result.yaw = std::atan2(r(0, 2), r(2, 2));
  return result;
}

Eigen::Quaterniond composeYawPitch(double yaw, double pitch)
{
  return Eigen::Quaterniond{
    Eigen::AngleAxisd{yaw, Eigen::Vector3d::UnitY()} *
    Eigen::AngleAxisd{pitch, Eigen::Vector3d::UnitX()}};
}

}  // namespace rbg_sim

// Ticket: 0007_orbit_camera

#ifndef RBG_SIM_CAMERA_CAMERA_HPP
#define RBG_SIM_CAMERA_CAMERA_HPP

#include <variant>

#include <Eigen/Geometry>

#include "rbg-sim/src/DataTypes/Coordinate.hpp"
#include "rbg-sim/src/Scene/SceneGraph.hpp"

namespace rbg_sim
{

/**
 * @brief Keyboard and mouse fly camera, no target
 */
struct FreeFlyMode
{
  bool operator==(const FreeFlyMode&) const = default;
};

/**
 * @brief Mouse-look camera orbiting a followed node
 */
struct OrbitMode
{
  NodeId followTarget{0};
  double distance{4.0};
  double sensitivity{0.000002};  // Mouse pixels -> radians, per window pixel

  bool operator==(const OrbitMode&) const = default;
};

/**
 * @brief Exactly one control mode per camera
 */
using CameraMode = std::variant<FreeFlyMode, OrbitMode>;

/**
 * @brief A viewpoint in the world
 *
 * An unrotated camera looks down -Z with +Y up.
 */
struct Camera
{
  Coordinate position;
  Eigen::Quaterniond orientation{Eigen::Quaterniond::Identity()};
  CameraMode mode{FreeFlyMode{}};

  [[nodiscard]] Coordinate forward() const
  {
    return Coordinate{orientation * Eigen::Vector3d{0.0, 0.0, -1.0}};
  }

  [[nodiscard]] Coordinate back() const
  {
    return Coordinate{orientation * Eigen::Vector3d{0.0, 0.0, 1.0}};
  }

  [[nodiscard]] Coordinate left() const
  {
    return Coordinate{orientation * Eigen::Vector3d{-1.0, 0.0, 0.0}};
  }

  [[nodiscard]] Coordinate right() const
  {
    return Coordinate{orientation * Eigen::Vector3d{1.0, 0.0, 0.0}};
  }

  [[nodiscard]] Coordinate up() const
  {
    return Coordinate{orientation * Eigen::Vector3d{0.0, 1.0, 0.0}};
  }

  [[nodiscard]] bool isOrbit() const
  {
    return std::holds_alternative<OrbitMode>(mode);
  }

  /**
   * @brief Turn to look at a point, keeping +Y up
   */
  void lookAt(const Coordinate& target);
};

struct YawPitch
{
  double yaw{0.0};    // About world Y [rad]
  double pitch{0.0};  // About local X [rad]
};

/**
 * @brief Yaw and pitch of a Y-X-Z Euler decomposition; roll is discarded
 */
[[nodiscard]] YawPitch decomposeYawPitch(const Eigen::Quaterniond& orientation);

/**
 * @brief Rotation by yaw about Y, then pitch about X, with zero roll
 */
[[nodiscard]] Eigen::Quaterniond composeYawPitch(double yaw, double pitch);

}  // namespace rbg_sim

#endif  // RBG_SIM_CAMERA_CAMERA_HPP

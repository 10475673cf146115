// Ticket: 0009_ball_controller

#ifndef RBG_SIM_GAMEPLAY_BALL_CONTROLLER_HPP
#define RBG_SIM_GAMEPLAY_BALL_CONTROLLER_HPP

#include <optional>
#include <utility>

#include <Eigen/Geometry>

#include "rbg-sim/src/Agent/InputCommands.hpp"
#include "rbg-sim/src/Config/GameConfig.hpp"
#include "rbg-sim/src/Gameplay/WorldRegistry.hpp"
#include "rbg-sim/src/Physics/PhysicsEngine.hpp"

namespace rbg_sim
{

/**
 * @brief Force and torque written to the ball for one tick
 */
struct BallDrive
{
  Coordinate force;
  Coordinate torque;
};

/**
 * @brief Maps camera-relative movement keys to a load on the ball
 *
 * The load is replaced every tick. Without an orbit camera both force and
 * torque are zero.
 */
class BallController
{
public:
  BallController(SteeringMode mode, double forceGain, double torqueGain);

  /**
   * @param orbitOrientation Orientation of the active orbit camera, if any
   */
  void update(const InputCommands& input,
              std::optional<Eigen::Quaterniond> orbitOrientation,
              const WorldRegistry& registry,
              PhysicsEngine& physics) const;

  [[nodiscard]] BallDrive computeDrive(
    const InputCommands& input,
    const std::optional<Eigen::Quaterniond>& orbitOrientation) const;

  /**
   * @brief Priority W > S > A > D; the chosen camera axis flattened onto XZ,
   *        normalized and scaled by gain
   */
  [[nodiscard]] static Coordinate computeForce(
    const InputCommands& input,
    const Eigen::Quaterniond& cameraOrientation,
    double gain);

  /**
   * @brief Sum of W -> left, S -> right, A -> back, D -> forward camera axes,
   *        scaled by gain
   */
  [[nodiscard]] static Coordinate computeTorque(
    const InputCommands& input,
    const Eigen::Quaterniond& cameraOrientation,
    double gain);

private:
  SteeringMode mode_;
  double forceGain_;
  double torqueGain_;
};

}  // namespace rbg_sim

#endif  // RBG_SIM_GAMEPLAY_BALL_CONTROLLER_HPP

// Ticket: 0002_world_registry

#ifndef RBG_SIM_GAMEPLAY_BALL_HPP
#define RBG_SIM_GAMEPLAY_BALL_HPP

#include <optional>

#include <Eigen/Geometry>

#include "rbg-sim/src/DataTypes/Coordinate.hpp"
#include "rbg-sim/src/Scene/SceneGraph.hpp"
#include "rbg-sim/src/Services/AudioSink.hpp"

namespace rbg_sim
{

/**
 * @brief The player-controlled sphere
 *
 * Live position and velocity belong to the physics body of `node`; this
 * record holds only game state.
 */
struct Ball
{
  NodeId node{0};
  double radius{0.5};
  bool isInBounds{true};

  // Fixed at spawn
  Coordinate restartPosition;
  Eigen::Quaterniond restartOrientation{Eigen::Quaterniond::Identity()};

  // Started on the first contact, then muted / unmuted
  std::optional<LoopHandle> rollingLoop;
  bool rollingMuted{true};
};

}  // namespace rbg_sim

#endif  // RBG_SIM_GAMEPLAY_BALL_HPP

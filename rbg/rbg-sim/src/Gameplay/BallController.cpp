// Ticket: 0009_ball_controller

#include "rbg-sim/src/Gameplay/BallController.hpp"

namespace rbg_sim
{

namespace
{

const Eigen::Vector3d kForward{0.0, 0.0, -1.0};
const Eigen::Vector3d kBack{0.0, 0.0, 1.0};
const Eigen::Vector3d kLeft{-1.0, 0.0, 0.0};
const Eigen::Vector3d kRight{1.0, 0.0, 0.0};

}  // namespace

BallController::BallController(SteeringMode mode,
                               double forceGain,
                               double torqueGain)
  : mode_{mode}, forceGain_{forceGain}, torqueGain_{torqueGain}
{
}

void BallController::update(const InputCommands& input,
                            std::optional<Eigen::Quaterniond> orbitOrientation,
                            const WorldRegistry& registry,
                            PhysicsEngine& physics) const
{
  auto ball = registry.getBall();
  if (!ball || !physics.hasBody(ball->get().node))
  {
    return;
  }

  BallDrive const drive = computeDrive(input, orbitOrientation);
  physics.setExternalForce(ball->get().node, drive.force, drive.torque);
}

BallDrive BallController::computeDrive(
  const InputCommands& input,
  const std::optional<Eigen::Quaterniond>& orbitOrientation) const
{
  BallDrive drive;
  if (!orbitOrientation)
  {
    return drive;
  }

  switch (mode_)
  {
    case SteeringMode::Force:
      drive.force = computeForce(input, *orbitOrientation, forceGain_);
      break;
    case SteeringMode::Torque:
      drive.torque = computeTorque(input, *orbitOrientation, torqueGain_);
      break;
  }
  return drive;
}

Coordinate BallController::computeForce(
  const InputCommands& input,
  const Eigen::Quaterniond& cameraOrientation,
  double gain)
{
  const Eigen::Vector3d* axis = nullptr;
  if (input.moveForward)
  {
    axis = &kForward;
  }
  else if (input.moveBackward)
  {
    axis = &kBack;
  }
  else if (input.moveLeft)
  {
    axis = &kLeft;
  }
  else if (input.moveRight)
  {
    axis = &kRight;
  }

  if (axis == nullptr)
  {
    return Coordinate{0.0, 0.0, 0.0};
  }

  Eigen::Vector3d direction = cameraOrientation * *axis;
  direction.y() = 0.0;

  // Looking straight up or down leaves nothing to push along
  if (direction.norm() < 1e-9)
  {
    return Coordinate{0.0, 0.0, 0.0};
  }

  return Coordinate{direction.normalized() * gain};
}

Coordinate BallController::computeTorque(
  const InputCommands& input,
  const Eigen::Quaterniond& cameraOrientation,
  double gain)
{
  Eigen::Vector3d torque = Eigen::Vector3d::Zero();
  if (input.moveForward)
  {
    torque += cameraOrientation * kLeft;
  }
  if (input.moveBackward)
  {
    torque += cameraOrientation * kRight;
  }
  if (input.moveLeft)
  {
    torque += cameraOrientation * kBack;
  }
  if (input.moveRight)
  {
    torque += cameraOrientation * kForward;
  }
  return Coordinate{torque * gain};
}

}  // namespace rbg_sim

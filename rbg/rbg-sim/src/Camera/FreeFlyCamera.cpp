// Ticket: 0015_free_fly_camera

#include "rbg-sim/src/Camera/FreeFlyCamera.hpp"

#include <algorithm>
#include <numbers>

namespace rbg_sim
{

FreeFlyCamera::FreeFlyCamera(double speed,
                             double sensitivity,
                             double pitchLimit)
  : speed_{speed}, sensitivity_{sensitivity}, pitchLimit_{pitchLimit}
{
}

void FreeFlyCamera::update(Camera& camera,
                           const InputCommands& input,
                           std::chrono::duration<double> dt) const
{
  if (input.cursorCaptured && !input.mouseMotion.empty())
  {
    auto [yaw, pitch] = decomposeYawPitch(camera.orientation);

    double const windowScale =
      static_cast<double>(std::min(input.windowHeight, input.windowWidth));
    double const scale =
      sensitivity_ * windowScale * std::numbers::pi / 180.0;

    for (const auto& delta : input.mouseMotion)
    {
      yaw -= scale * delta.x();
      pitch -= scale * delta.y();
    }

    pitch = std::clamp(pitch, -pitchLimit_, pitchLimit_);
    camera.orientation = composeYawPitch(yaw, pitch);
  }

  Eigen::Vector3d velocity = Eigen::Vector3d::Zero();
  if (input.moveForward)
  {
    velocity += camera.forward();
  }
  if (input.moveBackward)
  {
    velocity += camera.back();
  }
  if (input.moveLeft)
  {
    velocity += camera.left();
  }
  if (input.moveRight)
  {
    velocity += camera.right();
  }
  if (input.moveUp)
  {
    velocity += Eigen::Vector3d::UnitY();
  }
  if (input.moveDown)
  {
    velocity -= Eigen::Vector3d::UnitY();
  }

  if (velocity.norm() > 1e-9)
  {
    camera.position +=
      velocity.normalized() * (speed_ * dt.count());
  }
}

}  // namespace rbg_sim

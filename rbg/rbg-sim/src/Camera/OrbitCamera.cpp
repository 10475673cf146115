// Ticket: 0007_orbit_camera

#include "rbg-sim/src/Camera/OrbitCamera.hpp"

#include <algorithm>

namespace rbg_sim
{

OrbitCamera::OrbitCamera(std::shared_ptr<spdlog::logger> logger,
                         double pitchLimit)
  : logger_{std::move(logger)}, pitchLimit_{pitchLimit}
{
}

void OrbitCamera::update(Camera& camera,
                         const OrbitMode& mode,
                         const InputCommands& input,
                         std::optional<Coordinate> target) const
{
  auto [yaw, pitch] = decomposeYawPitch(camera.orientation);

  if (input.cursorCaptured)
  {
    double const windowScale =
      static_cast<double>(std::min(input.windowHeight, input.windowWidth));
    double const scale = mode.sensitivity * windowScale;

    for (const auto& delta : input.mouseMotion)
    {
      yaw -= scale * delta.x();
      pitch -= scale * delta.y();
    }
  }

  pitch = std::clamp(pitch, -pitchLimit_, pitchLimit_);
  camera.orientation = composeYawPitch(yaw, pitch);

  if (!target)
  {
    logger_->error("Orbit camera target {} has no pose", mode.followTarget);
    return;
  }

  camera.position = Coordinate{*target + camera.back() * mode.distance};
}

}  // namespace rbg_sim

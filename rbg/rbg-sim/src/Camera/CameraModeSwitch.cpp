// Ticket: 0008_camera_mode_switch

#include "rbg-sim/src/Camera/CameraModeSwitch.hpp"

namespace rbg_sim
{

CameraModeSwitch::CameraModeSwitch(double orbitDistance,
                                   double orbitSensitivity,
                                   std::shared_ptr<spdlog::logger> logger)
  : orbitDistance_{orbitDistance},
    orbitSensitivity_{orbitSensitivity},
    logger_{std::move(logger)}
{
}

void CameraModeSwitch::update(const InputCommands& input,
                              std::span<Camera> cameras,
                              const WorldRegistry& registry) const
{
  if (input.activateOrbitCamera)
  {
    auto ball = registry.getBall();
    if (!ball)
    {
      logger_->warn("No ball to follow, staying in fly camera mode");
    }
    else
    {
      for (auto& camera : cameras)
      {
        if (std::holds_alternative<FreeFlyMode>(camera.mode))
        {
          camera.mode =
            OrbitMode{ball->get().node, orbitDistance_, orbitSensitivity_};
          logger_->info("Camera mode: orbit");
        }
      }
    }
  }

  if (input.activateFlyCamera)
  {
    for (auto& camera : cameras)
    {
      if (std::holds_alternative<OrbitMode>(camera.mode))
      {
        camera.mode = FreeFlyMode{};
        logger_->info("Camera mode: free fly");
      }
    }
  }
}

}  // namespace rbg_sim

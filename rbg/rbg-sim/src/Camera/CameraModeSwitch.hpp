// Ticket: 0008_camera_mode_switch

#ifndef RBG_SIM_CAMERA_CAMERA_MODE_SWITCH_HPP
#define RBG_SIM_CAMERA_CAMERA_MODE_SWITCH_HPP

#include <memory>
#include <span>

#include <spdlog/spdlog.h>

#include "rbg-sim/src/Agent/InputCommands.hpp"
#include "rbg-sim/src/Camera/Camera.hpp"
#include "rbg-sim/src/Gameplay/WorldRegistry.hpp"

namespace rbg_sim
{

/**
 * @brief Swaps camera control modes on key presses
 *
 * - activateOrbitCamera: every free-fly camera gets an OrbitMode following
 *   the Ball, with the configured distance and sensitivity. Without a Ball
 *   a warning is logged and the cameras stay free-fly.
 * - activateFlyCamera: every orbit camera becomes free-fly.
 *
 * Cameras already in the requested mode keep their state.
 */
class CameraModeSwitch
{
public:
  CameraModeSwitch(double orbitDistance,
                   double orbitSensitivity,
                   std::shared_ptr<spdlog::logger> logger);

  void update(const InputCommands& input,
              std::span<Camera> cameras,
              const WorldRegistry& registry) const;

private:
  double orbitDistance_;
  double orbitSensitivity_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace rbg_sim

#endif  // RBG_SIM_CAMERA_CAMERA_MODE_SWITCH_HPP

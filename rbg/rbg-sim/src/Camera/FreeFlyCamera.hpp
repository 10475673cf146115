// Ticket: 0015_free_fly_camera

#ifndef RBG_SIM_CAMERA_FREE_FLY_CAMERA_HPP
#define RBG_SIM_CAMERA_FREE_FLY_CAMERA_HPP

#include <chrono>

#include "rbg-sim/src/Agent/InputCommands.hpp"
#include "rbg-sim/src/Camera/Camera.hpp"

namespace rbg_sim
{

/**
 * @brief Moves a camera from held keys and captured mouse motion
 *
 * Camera movement mapping:
 * - W/S: along the camera's forward/back axis
 * - A/D: along the camera's left/right axis
 * - E/Q: along world up/down
 * - Mouse (captured only): yaw and pitch, pitch clamped like the orbit mode
 *
 * Thread safety: Not thread-safe
 */
class FreeFlyCamera
{
public:
  /**
   * @param speed Movement speed [units/s]
   * @param sensitivity Mouse degrees per pixel, per window pixel
   * @param pitchLimit Pitch clamp [rad]
   */
  FreeFlyCamera(double speed, double sensitivity, double pitchLimit);

  void update(Camera& camera,
              const InputCommands& input,
              std::chrono::duration<double> dt) const;

  [[nodiscard]] double getSpeed() const
  {
    return speed_;
  }

private:
  double speed_;
  double sensitivity_;
  double pitchLimit_;
};

}  // namespace rbg_sim

#endif  // RBG_SIM_CAMERA_FREE_FLY_CAMERA_HPP

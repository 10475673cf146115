// Ticket: 0007_orbit_camera

#ifndef RBG_SIM_CAMERA_ORBIT_CAMERA_HPP
#define RBG_SIM_CAMERA_ORBIT_CAMERA_HPP

#include <memory>
#include <optional>

#include <spdlog/spdlog.h>

#include "rbg-sim/src/Agent/InputCommands.hpp"
#include "rbg-sim/src/Camera/Camera.hpp"

namespace rbg_sim
{

/**
 * @brief Mouse-look camera that orbits a follow target
 *
 * Per tick:
 * 1. Decompose the orientation into yaw and pitch (Y-X-Z, roll dropped)
 * 2. If the cursor is captured, apply every mouse delta of the tick with
 *    scale = sensitivity * min(window height, window width):
 *    yaw -= scale * dx, pitch -= scale * dy. Uncaptured deltas are discarded
 * 3. Clamp pitch to [-pitchLimit, pitchLimit]; yaw is left unbounded
 * 4. Recompose with zero roll
 * 5. position = target + back * distance, or log an error and keep the
 *    previous position if the target cannot be resolved
 */
class OrbitCamera
{
public:
  static constexpr double kDefaultPitchLimit = 1.54;  // [rad]

  explicit OrbitCamera(std::shared_ptr<spdlog::logger> logger,
                       double pitchLimit = kDefaultPitchLimit);

  void update(Camera& camera,
              const OrbitMode& mode,
              const InputCommands& input,
              std::optional<Coordinate> target) const;

  [[nodiscard]] double getPitchLimit() const
  {
    return pitchLimit_;
  }

private:
  std::shared_ptr<spdlog::logger> logger_;
  double pitchLimit_;
};

}  // namespace rbg_sim

#endif  // RBG_SIM_CAMERA_ORBIT_CAMERA_HPP

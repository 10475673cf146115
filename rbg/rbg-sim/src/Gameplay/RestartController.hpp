// Ticket: 0010_restart_controller

#ifndef RBG_SIM_GAMEPLAY_RESTART_CONTROLLER_HPP
#define RBG_SIM_GAMEPLAY_RESTART_CONTROLLER_HPP

#include <memory>

#include <spdlog/spdlog.h>

#include "rbg-sim/src/Agent/InputCommands.hpp"
#include "rbg-sim/src/Gameplay/CollisionClassifier.hpp"
#include "rbg-sim/src/Gameplay/TransientUi.hpp"
#include "rbg-sim/src/Gameplay/WorldRegistry.hpp"
#include "rbg-sim/src/Physics/PhysicsEngine.hpp"
#include "rbg-sim/src/Scene/SceneGraph.hpp"
#include "rbg-sim/src/Services/AudioSink.hpp"

namespace rbg_sim
{

/**
 * @brief The single path back from a fall or a win
 *
 * On restart the ball returns to its restart pose with zero velocity and no
 * applied load, is marked in bounds, the restart sound plays and the fall and
 * win banners are removed. Restarting twice in a row is harmless.
 */
class RestartController
{
public:
  RestartController(AudioSink& audio,
                    TransientUi& ui,
                    CollisionClassifier& classifier,
                    std::shared_ptr<spdlog::logger> logger);

  /**
   * @return true if a restart happened this tick
   */
  bool update(const InputCommands& input,
              SceneGraph& scene,
              PhysicsEngine& physics,
              WorldRegistry& registry);

  /**
   * @return false if there is no ball to restart
   */
  bool restart(SceneGraph& scene,
               PhysicsEngine& physics,
               WorldRegistry& registry);

private:
  AudioSink& audio_;
  TransientUi& ui_;
  CollisionClassifier& classifier_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace rbg_sim

#endif  // RBG_SIM_GAMEPLAY_RESTART_CONTROLLER_HPP

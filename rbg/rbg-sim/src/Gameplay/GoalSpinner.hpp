// Ticket: 0014_goal_spinner

#ifndef RBG_SIM_GAMEPLAY_GOAL_SPINNER_HPP
#define RBG_SIM_GAMEPLAY_GOAL_SPINNER_HPP

#include <chrono>

#include "rbg-sim/src/Gameplay/WorldRegistry.hpp"
#include "rbg-sim/src/Scene/SceneGraph.hpp"

namespace rbg_sim
{

/**
 * @brief Rotates every Goal node about the world vertical axis
 */
class GoalSpinner
{
public:
  /**
   * @param rate Angular rate [rad/s]
   */
  explicit GoalSpinner(double rate);

  void update(SceneGraph& scene,
              const WorldRegistry& registry,
              std::chrono::duration<double> dt) const;

private:
  double rate_;
};

}  // namespace rbg_sim

#endif  // RBG_SIM_GAMEPLAY_GOAL_SPINNER_HPP

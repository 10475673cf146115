// Ticket: 0014_goal_spinner

#include "rbg-sim/src/Gameplay/GoalSpinner.hpp"

namespace rbg_sim
{

GoalSpinner::GoalSpinner(double rate) : rate_{rate}
{
}

void GoalSpinner::update(SceneGraph& scene,
                         const WorldRegistry& registry,
                         std::chrono::duration<double> dt) const
{
  double const angle = rate_ * dt.count();
  if (angle == 0.0)
  {
    return;
  }

  for (NodeId const goal : registry.getGoals())
  {
    if (!scene.contains(goal))
    {
      continue;
    }

    auto& node = scene.getNode(goal);

    // World +Y expressed in the parent's frame
    Eigen::Vector3d axis = Eigen::Vector3d::UnitY();
    if (node.parent)
    {
      axis = scene.getWorldRotation(*node.parent).conjugate() * axis;
    }

    node.local.rotation =
      (Eigen::Quaterniond{Eigen::AngleAxisd{angle, axis.normalized()}} *
       node.local.rotation)
        .normalized();
  }
}

}  // namespace rbg_sim

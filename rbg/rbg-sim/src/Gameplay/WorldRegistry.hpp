// Ticket: 0002_world_registry

#ifndef RBG_SIM_GAMEPLAY_WORLD_REGISTRY_HPP
#define RBG_SIM_GAMEPLAY_WORLD_REGISTRY_HPP

#include <functional>
#include <optional>
#include <set>
#include <vector>

#include "rbg-sim/src/Gameplay/Ball.hpp"
#include "rbg-sim/src/Scene/SceneGraph.hpp"

namespace rbg_sim
{

/**
 * @brief Lookup of the world's singletons and tags
 *
 * Holds the Ball, the set of Goal nodes and the fall-threshold node. Every
 * lookup returns an optional so a missing singleton is a value, never a
 * crash.
 *
 * Thread safety: Not thread-safe
 */
class WorldRegistry
{
public:
  /**
   * @brief Register the one Ball
   * @throws std::logic_error if a Ball is already registered
   */
  void registerBall(Ball ball);

  [[nodiscard]] std::optional<std::reference_wrapper<Ball>> getBall();
  [[nodiscard]] std::optional<std::reference_wrapper<const Ball>> getBall()
    const;

  void tagGoal(NodeId node);
  [[nodiscard]] bool isGoal(NodeId node) const;
  [[nodiscard]] const std::set<NodeId>& getGoals() const
  {
    return goals_;
  }
  void clearGoals();

  /**
   * @brief Record the node whose world Y is the fall threshold
   */
  void setThresholdNode(std::optional<NodeId> node);
  [[nodiscard]] std::optional<NodeId> getThresholdNode() const
  {
    return thresholdNode_;
  }

  /**
   * @brief Drop every reference to nodes that were removed from the scene
   */
  void forgetNodes(const std::vector<NodeId>& removed);

private:
  std::optional<Ball> ball_;
  std::set<NodeId> goals_;
  std::optional<NodeId> thresholdNode_;
};

}  // namespace rbg_sim

#endif  // RBG_SIM_GAMEPLAY_WORLD_REGISTRY_HPP

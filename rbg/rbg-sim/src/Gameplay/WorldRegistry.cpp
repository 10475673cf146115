// Ticket: 0002_world_registry

#include "rbg-sim/src/Gameplay/WorldRegistry.hpp"

#include <algorithm>
#include <stdexcept>

namespace rbg_sim
{

void WorldRegistry::registerBall(Ball ball)
{
  if (ball_)
  {
    throw std::logic_error("A Ball is already registered");
  }
  ball_ = std::move(ball);
}

std::optional<std::reference_wrapper<Ball>> WorldRegistry::getBall()
{
  if (!ball_)
  {
    return std::nullopt;
  }
  return std::ref(*ball_);
}

std::optional<std::reference_wrapper<const Ball>> WorldRegistry::getBall()
  const
{
  if (!ball_)
  {
    return std::nullopt;
  }
  return std::cref(*ball_);
}

void WorldRegistry::tagGoal(NodeId node)
{
  goals_.insert(node);
}

bool WorldRegistry::isGoal(NodeId node) const
{
  return goals_.contains(node);
}

void WorldRegistry::clearGoals()
{
  goals_.clear();
}

void WorldRegistry::setThresholdNode(std::optional<NodeId> node)
{
  thresholdNode_ = node;
}

void WorldRegistry::forgetNodes(const std::vector<NodeId>& removed)
{
  for (NodeId const node : removed)
  {
    goals_.erase(node);
  }

  if (thresholdNode_ &&
      std::ranges::find(removed, *thresholdNode_) != removed.end())
  {
    thresholdNode_.reset();
  }
}

}  // namespace rbg_sim

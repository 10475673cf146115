// Ticket: 0005_bounds_monitor

#ifndef RBG_SIM_GAMEPLAY_BOUNDS_MONITOR_HPP
#define RBG_SIM_GAMEPLAY_BOUNDS_MONITOR_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include <spdlog/spdlog.h>

#include "rbg-sim/src/Gameplay/SceneLoadWatcher.hpp"
#include "rbg-sim/src/Gameplay/TransientUi.hpp"
#include "rbg-sim/src/Gameplay/WorldRegistry.hpp"
#include "rbg-sim/src/Scene/LevelSource.hpp"
#include "rbg-sim/src/Scene/SceneGraph.hpp"
#include "rbg-sim/src/Services/AudioSink.hpp"

namespace rbg_sim
{

/**
 * @brief Detects the ball dropping below the level's `bottom` node
 *
 * Lifecycle:
 * - Inactive until the first load event
 * - AwaitingColliders after any load event, until the watcher reports
 *   Attached
 * - Active once the threshold node resolved, Disabled if it did not (the
 *   error is logged once per load cycle)
 */
class BoundsMonitor
{
public:
  enum class State : uint8_t
  {
    Inactive,
    AwaitingColliders,
    Active,
    Disabled
  };

  BoundsMonitor(AudioSink& audio,
                TransientUi& ui,
                std::shared_ptr<spdlog::logger> logger);

  /**
   * @brief Track the load stream; any event starts a new cycle
   */
  void observe(const std::vector<LoadEvent>& events);

  /**
   * @brief Resolve the threshold node once colliders are attached
   */
  void resolve(const SceneLoadWatcher& watcher, const WorldRegistry& registry);

  /**
   * @brief Compare the ball's height with the threshold
   *
   * The first tick below the threshold while the ball is in bounds clears
   * the flag, shows the fall banner and plays the fall sound.
   *
   * @return true if the ball fell on this tick
   */
  bool check(const SceneGraph& scene, WorldRegistry& registry);

  [[nodiscard]] State getState() const
  {
    return state_;
  }

  [[nodiscard]] std::optional<NodeId> getThresholdNode() const
  {
    return thresholdNode_;
  }

private:
  AudioSink& audio_;
  TransientUi& ui_;
  std::shared_ptr<spdlog::logger> logger_;

  State state_{State::Inactive};
  std::optional<NodeId> thresholdNode_;
};

}  // namespace rbg_sim

#endif  // RBG_SIM_GAMEPLAY_BOUNDS_MONITOR_HPP

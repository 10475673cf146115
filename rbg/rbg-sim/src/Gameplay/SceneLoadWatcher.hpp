// Ticket: 0003_scene_load_watcher

#ifndef RBG_SIM_GAMEPLAY_SCENE_LOAD_WATCHER_HPP
#define RBG_SIM_GAMEPLAY_SCENE_LOAD_WATCHER_HPP

#include <cstdint>
#include <memory>
#include <vector>

#include <boost/describe/enum.hpp>
#include <spdlog/spdlog.h>

#include "rbg-sim/src/Scene/LevelSource.hpp"

namespace rbg_sim
{

enum class SceneLoadState : uint8_t
{
  Pending,
  ScheduledNextTick,
  ReadyToAttach,
  Attached
};

BOOST_DESCRIBE_ENUM(SceneLoadState,
                    Pending,
                    ScheduledNextTick,
                    ReadyToAttach,
                    Attached)

/**
 * @brief Detects the "level fully loaded" transition
 *
 * State machine, driven once per tick by advance() then observe():
 *
 *   Pending --loaded--> ScheduledNextTick --advance--> ReadyToAttach
 *   ReadyToAttach --markAttached--> Attached
 *   any --reloading--> Pending
 *
 * A loaded event seen while ScheduledNextTick or ReadyToAttach restarts the
 * one-tick deferral, so attachment always happens on the tick after the
 * latest loaded event.
 *
 * Thread safety: Not thread-safe
 */
class SceneLoadWatcher
{
public:
  explicit SceneLoadWatcher(std::shared_ptr<spdlog::logger> logger);

  /**
   * @brief Start a tick: a deferral scheduled last tick becomes ready
   */
  void advance();

  /**
   * @brief Consume this tick's load events in order
   */
  void observe(const std::vector<LoadEvent>& events);

  /**
   * @brief Record that the attachment pass ran
   * @throws std::logic_error if the watcher was not ReadyToAttach
   */
  void markAttached();

  [[nodiscard]] SceneLoadState getState() const
  {
    return state_;
  }

  [[nodiscard]] bool isReadyToAttach() const
  {
    return state_ == SceneLoadState::ReadyToAttach;
  }

  [[nodiscard]] bool isAttached() const
  {
    return state_ == SceneLoadState::Attached;
  }

  /**
   * @brief Number of completed attachment passes since construction
   */
  [[nodiscard]] uint64_t getAttachCount() const
  {
    return attachCount_;
  }

private:
  void transition(SceneLoadState next);

  std::shared_ptr<spdlog::logger> logger_;
  SceneLoadState state_{SceneLoadState::Pending};
  uint64_t attachCount_{0};
};

}  // namespace rbg_sim

#endif  // RBG_SIM_GAMEPLAY_SCENE_LOAD_WATCHER_HPP

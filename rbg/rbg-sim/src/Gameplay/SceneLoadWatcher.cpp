// Ticket: 0003_scene_load_watcher

#include "rbg-sim/src/Gameplay/SceneLoadWatcher.hpp"

#include <stdexcept>
#include <string>

#include <boost/describe/enum_to_string.hpp>

namespace rbg_sim
{

SceneLoadWatcher::SceneLoadWatcher(std::shared_ptr<spdlog::logger> logger)
  : logger_{std::move(logger)}
{
}

void SceneLoadWatcher::advance()
{
  if (state_ == SceneLoadState::ScheduledNextTick)
  {
    transition(SceneLoadState::ReadyToAttach);
  }
}

void SceneLoadWatcher::observe(const std::vector<LoadEvent>& events)
{
  for (const auto& event : events)
  {
    switch (event.kind)
    {
      case LoadEvent::Kind::Reloading:
        transition(SceneLoadState::Pending);
        break;
      case LoadEvent::Kind::LoadedWithDependencies:
        transition(SceneLoadState::ScheduledNextTick);
        break;
    }
  }
}

void SceneLoadWatcher::markAttached()
{
  if (state_ != SceneLoadState::ReadyToAttach)
  {
    throw std::logic_error(
      std::string{"Attachment recorded while scene load state is "} +
      boost::describe::enum_to_string(state_, "?"));
  }
  ++attachCount_;
  transition(SceneLoadState::Attached);
}

void SceneLoadWatcher::transition(SceneLoadState next)
{
  if (next != state_)
  {
    logger_->debug("Scene load state {} -> {}",
                   boost::describe::enum_to_string(state_, "?"),
                   boost::describe::enum_to_string(next, "?"));
  }
  state_ = next;
}

}  // namespace rbg_sim

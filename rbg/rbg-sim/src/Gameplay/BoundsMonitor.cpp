// Ticket: 0005_bounds_monitor

#include "rbg-sim/src/Gameplay/BoundsMonitor.hpp"

namespace rbg_sim
{

BoundsMonitor::BoundsMonitor(AudioSink& audio,
                             TransientUi& ui,
                             std::shared_ptr<spdlog::logger> logger)
  : audio_{audio}, ui_{ui}, logger_{std::move(logger)}
{
}

void BoundsMonitor::observe(const std::vector<LoadEvent>& events)
{
  if (!events.empty())
  {
    state_ = State::AwaitingColliders;
    thresholdNode_.reset();
  }
}

void BoundsMonitor::resolve(const SceneLoadWatcher& watcher,
                            const WorldRegistry& registry)
{
  if (state_ != State::AwaitingColliders || !watcher.isAttached())
  {
    return;
  }

  thresholdNode_ = registry.getThresholdNode();
  if (!thresholdNode_)
  {
    logger_->error(
      "Level has no 'bottom' node; fall detection disabled until the next "
      "load");
    state_ = State::Disabled;
    return;
  }

  state_ = State::Active;
}

bool BoundsMonitor::check(const SceneGraph& scene, WorldRegistry& registry)
{
  if (state_ != State::Active || !thresholdNode_ ||
      !scene.contains(*thresholdNode_))
  {
    return false;
  }

  auto ballRef = registry.getBall();
  if (!ballRef || !scene.contains(ballRef->get().node))
  {
    return false;
  }
  Ball& ball = ballRef->get();

  double const threshold = scene.getWorldPosition(*thresholdNode_).y();
  double const height = scene.getWorldPosition(ball.node).y();

  if (height >= threshold || !ball.isInBounds)
  {
    return false;
  }

  ball.isInBounds = false;
  ui_.showFall();
  audio_.playOneShot(SoundCue::Fall);
  logger_->info("Ball fell below y = {:.2f}", threshold);
  return true;
}

}  // namespace rbg_sim

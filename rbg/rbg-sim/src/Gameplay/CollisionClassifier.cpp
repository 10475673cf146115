// Ticket: 0006_collision_classifier

#include "rbg-sim/src/Gameplay/CollisionClassifier.hpp"

#include <algorithm>

namespace rbg_sim
{

ContactClass classifyContact(const ContactEvent& event,
                             std::optional<NodeId> ballNode,
                             const std::function<bool(NodeId)>& isGoal)
{
  bool const goalInvolved = isGoal(event.first) || isGoal(event.second);

  if (event.type == ContactEvent::Type::Began && goalInvolved)
  {
    return ContactClass::GoalEntered;
  }

  if (!ballNode || !event.involves(*ballNode) || goalInvolved)
  {
    return ContactClass::Irrelevant;
  }

  return event.type == ContactEvent::Type::Began
           ? ContactClass::BallContactBegin
           : ContactClass::BallContactEnd;
}

CollisionClassifier::CollisionClassifier(AudioSink& audio,
                                         TransientUi& ui,
                                         double rollingVolumeGain,
                                         std::shared_ptr<spdlog::logger> logger)
  : audio_{audio},
    ui_{ui},
    rollingVolumeGain_{rollingVolumeGain},
    logger_{std::move(logger)}
{
}

void CollisionClassifier::update(const std::vector<ContactEvent>& events,
                                 WorldRegistry& registry,
                                 const PhysicsEngine& physics)
{
  auto ballRef = registry.getBall();
  std::optional<NodeId> const ballNode =
    ballRef ? std::optional<NodeId>{ballRef->get().node} : std::nullopt;

  auto const isGoal = [&registry](NodeId node)
  { return registry.isGoal(node); };

  for (const auto& event : events)
  {
    switch (classifyContact(event, ballNode, isGoal))
    {
      case ContactClass::GoalEntered:
        if (!won_)
        {
          won_ = true;
          audio_.playOneShot(SoundCue::Win);
          ui_.showWin();
          logger_->info("Goal reached");
        }
        break;

      case ContactClass::BallContactBegin:
        ++activeContacts_;
        setRollingMuted(ballRef->get(), false);
        break;

      case ContactClass::BallContactEnd:
        activeContacts_ = activeContacts_ > 0 ? activeContacts_ - 1 : 0;
        if (activeContacts_ == 0)
        {
          setRollingMuted(ballRef->get(), true);
        }
        break;

      case ContactClass::Irrelevant:
        break;
    }
  }

  if (!ballRef)
  {
    return;
  }

  Ball& ball = ballRef->get();
  if (!ball.rollingLoop || ball.rollingMuted)
  {
    return;
  }

  if (auto state = physics.getBodyState(ball.node))
  {
    double const volume =
      std::clamp(state->velocity.norm() * rollingVolumeGain_, 0.0, 1.0);
    audio_.setVolume(*ball.rollingLoop, volume);
  }
}

void CollisionClassifier::resetContacts(WorldRegistry& registry)
{
  activeContacts_ = 0;
  if (auto ball = registry.getBall())
  {
    setRollingMuted(ball->get(), true);
  }
}

void CollisionClassifier::setRollingMuted(Ball& ball, bool muted)
{
  if (!ball.rollingLoop)
  {
    if (muted)
    {
      return;
    }
    // Loops start audible
    ball.rollingLoop = audio_.playLooping(SoundCue::Rolling, ball.node);
    ball.rollingMuted = false;
    return;
  }

  if (ball.rollingMuted != muted)
  {
    audio_.setMuted(*ball.rollingLoop, muted);
    ball.rollingMuted = muted;
  }
}

}  // namespace rbg_sim

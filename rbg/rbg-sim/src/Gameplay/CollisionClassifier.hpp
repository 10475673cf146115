// Ticket: 0006_collision_classifier

#ifndef RBG_SIM_GAMEPLAY_COLLISION_CLASSIFIER_HPP
#define RBG_SIM_GAMEPLAY_COLLISION_CLASSIFIER_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include <spdlog/spdlog.h>

#include "rbg-sim/src/Gameplay/TransientUi.hpp"
#include "rbg-sim/src/Gameplay/WorldRegistry.hpp"
#include "rbg-sim/src/Physics/PhysicsEngine.hpp"
#include "rbg-sim/src/Services/AudioSink.hpp"

namespace rbg_sim
{

enum class ContactClass : uint8_t
{
  GoalEntered,
  BallContactBegin,
  BallContactEnd,
  Irrelevant
};

/**
 * @brief Classify one contact event
 *
 * A Began event with a Goal on either side is GoalEntered. Otherwise events
 * involving the ball are BallContactBegin / BallContactEnd, except an Ended
 * event against a Goal, which is Irrelevant (sensor overlap is not rolling
 * contact).
 */
[[nodiscard]] ContactClass classifyContact(
  const ContactEvent& event,
  std::optional<NodeId> ballNode,
  const std::function<bool(NodeId)>& isGoal);

/**
 * @brief Reacts to contact events: goal detection and rolling audio
 *
 * Winning is latched: the first goal contact after start or restart plays
 * the win sound and shows the banner; later contacts are ignored until
 * resetWin().
 *
 * The rolling loop starts on the ball's first solid contact and is muted
 * when the ball has no remaining solid contact. While unmuted its volume is
 * `clamp(speed * gain, 0, 1)`.
 */
class CollisionClassifier
{
public:
  CollisionClassifier(AudioSink& audio,
                      TransientUi& ui,
                      double rollingVolumeGain,
                      std::shared_ptr<spdlog::logger> logger);

  void update(const std::vector<ContactEvent>& events,
              WorldRegistry& registry,
              const PhysicsEngine& physics);

  [[nodiscard]] bool hasWon() const
  {
    return won_;
  }

  void resetWin()
  {
    won_ = false;
  }

  /**
   * @brief Forget contacts whose bodies were removed and mute the loop
   */
  void resetContacts(WorldRegistry& registry);

  [[nodiscard]] size_t getActiveContactCount() const
  {
    return activeContacts_;
  }

private:
  void setRollingMuted(Ball& ball, bool muted);

  AudioSink& audio_;
  TransientUi& ui_;
  double rollingVolumeGain_;
  std::shared_ptr<spdlog::logger> logger_;

  bool won_{false};
  size_t activeContacts_{0};
};

}  // namespace rbg_sim

#endif  // RBG_SIM_GAMEPLAY_COLLISION_CLASSIFIER_HPP

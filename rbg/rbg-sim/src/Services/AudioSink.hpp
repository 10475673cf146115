#ifndef RBG_SIM_SERVICES_AUDIO_SINK_HPP
#define RBG_SIM_SERVICES_AUDIO_SINK_HPP

#include <cstdint>
#include <optional>

#include <boost/describe/enum.hpp>

#include "rbg-sim/src/Scene/SceneGraph.hpp"

namespace rbg_sim
{

enum class SoundCue : uint8_t
{
  Win,
  Fall,
  Restart,
  Rolling
};

BOOST_DESCRIBE_ENUM(SoundCue, Win, Fall, Restart, Rolling)

using LoopHandle = uint32_t;

/**
 * @brief Audio output used by the gameplay systems
 *
 * Implementations that cannot produce sound still return valid handles so
 * callers never special-case a silent backend.
 */
class AudioSink
{
public:
  virtual ~AudioSink() = default;

  virtual void playOneShot(SoundCue cue) = 0;

  /**
   * @brief Start a looping sound attached to a scene node
   * @param emitter Node the sound follows, if any
   * @return Handle used for mute and volume changes; the loop starts audible
   */
  virtual LoopHandle playLooping(SoundCue cue,
                                 std::optional<NodeId> emitter) = 0;

  virtual void setMuted(LoopHandle handle, bool muted) = 0;

  /**
   * @param volume Linear gain in [0, 1]
   */
  virtual void setVolume(LoopHandle handle, double volume) = 0;
};

}  // namespace rbg_sim

#endif  // RBG_SIM_SERVICES_AUDIO_SINK_HPP

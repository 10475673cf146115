// Ticket: 0004_audio

#ifndef RBG_GUI_SDL_AUDIO_SINK_HPP
#define RBG_GUI_SDL_AUDIO_SINK_HPP

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <vector>

#include <SDL3/SDL.h>
#include <spdlog/spdlog.h>

#include "rbg-gui/src/SDLUtils.hpp"
#include "rbg-sim/src/Services/AudioSink.hpp"

namespace rbg_gui
{

/**
 * @brief Decoded WAV samples of one sound cue
 */
struct WavClip
{
  SDL_AudioSpec spec{};
  std::vector<Uint8> samples;
};

/**
 * @brief AudioSink playing WAV files through SDL audio streams
 *
 * Cue files are looked up in the sound directory as `win.wav`, `fall.wav`,
 * `restart.wav` and `rolling.wav`. A missing file or an unavailable audio
 * device is logged once as a warning; the affected cue plays silently but
 * every call still succeeds and every handle stays valid.
 *
 * Looping streams are topped up from update(), which must be called once per
 * frame.
 *
 * Thread safety: Not thread-safe
 */
class SDLAudioSink final : public rbg_sim::AudioSink
{
public:
  /**
   * @param soundDirectory Directory holding the cue WAV files
   * @param deviceAvailable False when the SDL audio subsystem failed to start
   */
  SDLAudioSink(const std::filesystem::path& soundDirectory,
               bool deviceAvailable,
               std::shared_ptr<spdlog::logger> logger);

  SDLAudioSink(const SDLAudioSink&) = delete;
  SDLAudioSink& operator=(const SDLAudioSink&) = delete;
  ~SDLAudioSink() override = default;

  void playOneShot(rbg_sim::SoundCue cue) override;

  rbg_sim::LoopHandle playLooping(
    rbg_sim::SoundCue cue,
    std::optional<rbg_sim::NodeId> emitter) override;

  void setMuted(rbg_sim::LoopHandle handle, bool muted) override;

  void setVolume(rbg_sim::LoopHandle handle, double volume) override;

  /**
   * @brief Re-queue loop samples that are about to run out
   */
  void update();

  [[nodiscard]] bool hasClip(rbg_sim::SoundCue cue) const
  {
    return clips_.contains(cue);
  }

  /**
   * @brief File name of a cue inside the sound directory
   */
  [[nodiscard]] static std::filesystem::path cueFileName(
    rbg_sim::SoundCue cue);

private:
  struct Loop
  {
    rbg_sim::SoundCue cue;
    std::optional<rbg_sim::NodeId> emitter;
    UniqueAudioStream stream;
    bool muted{false};
    double volume{1.0};
  };

  void loadClip(const std::filesystem::path& directory, rbg_sim::SoundCue cue);
  [[nodiscard]] UniqueAudioStream openStream(const WavClip& clip) const;
  static void applyGain(Loop& loop);

  bool deviceAvailable_;
  std::shared_ptr<spdlog::logger> logger_;

  std::map<rbg_sim::SoundCue, WavClip> clips_;
  std::map<rbg_sim::SoundCue, UniqueAudioStream> oneShotStreams_;
  std::map<rbg_sim::LoopHandle, Loop> loops_;
  rbg_sim::LoopHandle nextHandle_{1};
};

}  // namespace rbg_gui

#endif  // RBG_GUI_SDL_AUDIO_SINK_HPP

// Ticket: 0004_audio

#include "rbg-gui/src/SDLAudioSink.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include <boost/describe/enum_to_string.hpp>

namespace rbg_gui
{

SDLAudioSink::SDLAudioSink(const std::filesystem::path& soundDirectory,
                           bool deviceAvailable,
                           std::shared_ptr<spdlog::logger> logger)
  : deviceAvailable_{deviceAvailable}, logger_{std::move(logger)}
{
  if (!deviceAvailable_)
  {
    logger_->warn("No audio device, sounds are disabled");
    return;
  }

  for (auto cue : {rbg_sim::SoundCue::Win,
                   rbg_sim::SoundCue::Fall,
                   rbg_sim::SoundCue::Restart,
                   rbg_sim::SoundCue::Rolling})
  {
    loadClip(soundDirectory, cue);
  }
}

std::filesystem::path SDLAudioSink::cueFileName(rbg_sim::SoundCue cue)
{
  switch (cue)
  {
    case rbg_sim::SoundCue::Win:
      return "win.wav";
    case rbg_sim::SoundCue::Fall:
      return "fall.wav";
    case rbg_sim::SoundCue::Restart:
      return "restart.wav";
    case rbg_sim::SoundCue::Rolling:
      return "rolling.wav";
  }
  return {};
}

void SDLAudioSink::loadClip(const std::filesystem::path& directory,
                            rbg_sim::SoundCue cue)
{
  auto const path = directory / cueFileName(cue);

  WavClip clip;
  Uint8* buffer = nullptr;
  Uint32 length = 0;
  if (!SDL_LoadWAV(path.string().c_str(), &clip.spec, &buffer, &length))
  {
    logger_->warn("Could not load sound '{}': {}", path.string(), SDL_GetError());
    return;
  }

  clip.samples.assign(buffer, buffer + length);
  SDL_free(buffer);

  logger_->debug("Loaded sound {} ({} bytes)",
                 boost::describe::enum_to_string(cue, "?"),
                 clip.samples.size());
  clips_.emplace(cue, std::move(clip));
}

UniqueAudioStream SDLAudioSink::openStream(const WavClip& clip) const
{
  UniqueAudioStream stream{SDL_OpenAudioDeviceStream(
    SDL_AUDIO_DEVICE_DEFAULT_PLAYBACK, &clip.spec, nullptr, nullptr)};

  if (!stream)
  {
    logger_->warn("Could not open audio stream: {}", SDL_GetError());
    return stream;
  }

  // Device streams start paused
  if (!SDL_ResumeAudioStreamDevice(stream.get()))
  {
    logger_->warn("Could not resume audio device: {}", SDL_GetError());
  }
  return stream;
}

void SDLAudioSink::playOneShot(rbg_sim::SoundCue cue)
{
  auto clip = clips_.find(cue);
  if (clip == clips_.end())
  {
    return;
  }

  auto& stream = oneShotStreams_[cue];
  if (!stream)
  {
    stream = openStream(clip->second);
    if (!stream)
    {
      oneShotStreams_.erase(cue);
      return;
    }
  }

  // Restart the cue rather than stacking it
  SDL_ClearAudioStream(stream.get());
  if (!SDL_PutAudioStreamData(stream.get(),
                              clip->second.samples.data(),
                              static_cast<int>(clip->second.samples.size())))
  {
    logger_->warn("Could not queue sound: {}", SDL_GetError());
  }
}

rbg_sim::LoopHandle SDLAudioSink::playLooping(
  rbg_sim::SoundCue cue,
  std::optional<rbg_sim::NodeId> emitter)
{
  rbg_sim::LoopHandle const handle = nextHandle_++;

  Loop loop{cue, emitter, nullptr};
  if (auto clip = clips_.find(cue); clip != clips_.end())
  {
    loop.stream = openStream(clip->second);
  }

  loops_.emplace(handle, std::move(loop));
  update();
  return handle;
}

void SDLAudioSink::setMuted(rbg_sim::LoopHandle handle, bool muted)
{
  auto it = loops_.find(handle);
  if (it == loops_.end())
  {
    return;
  }
  it->second.muted = muted;
  applyGain(it->second);
}

void SDLAudioSink::setVolume(rbg_sim::LoopHandle handle, double volume)
{
  auto it = loops_.find(handle);
  if (it == loops_.end())
  {
    return;
  }
  it->second.volume = std::clamp(volume, 0.0, 1.0);
  applyGain(it->second);
}

void SDLAudioSink::applyGain(Loop& loop)
{
  if (!loop.stream)
  {
    return;
  }
  float const gain = loop.muted ? 0.0f : static_cast<float>(loop.volume);
  SDL_SetAudioStreamGain(loop.stream.get(), gain);
}

void SDLAudioSink::update()
{
  for (auto& [handle, loop] : loops_)
  {
    if (!loop.stream)
    {
      continue;
    }

    const auto& clip = clips_.at(loop.cue);
    int const clipBytes = static_cast<int>(clip.samples.size());

    // Keep at least one full clip queued so the loop never gaps
    if (SDL_GetAudioStreamQueued(loop.stream.get()) < clipBytes)
    {
      if (!SDL_PutAudioStreamData(
            loop.stream.get(), clip.samples.data(), clipBytes))
      {
        logger_->warn("Could not queue loop {}: {}", handle, SDL_GetError());
      }
    }
  }
}

}  // namespace rbg_gui

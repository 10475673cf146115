#ifndef RBG_SIM_TEST_HELPERS_FAKE_SERVICES_HPP
#define RBG_SIM_TEST_HELPERS_FAKE_SERVICES_HPP

#include <algorithm>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "rbg-sim/src/Services/AudioSink.hpp"
#include "rbg-sim/src/Services/TextOverlay.hpp"

namespace rbg_sim::test
{

/**
 * @brief AudioSink that records every request
 */
class FakeAudioSink final : public AudioSink
{
public:
  struct Loop
  {
    SoundCue cue;
    std::optional<NodeId> emitter;
    bool muted{false};
    double volume{1.0};
  };

  void playOneShot(SoundCue cue) override
  {
    oneShots.push_back(cue);
  }

  LoopHandle playLooping(SoundCue cue, std::optional<NodeId> emitter) override
  {
    LoopHandle const handle = nextHandle_++;
    loops.emplace(handle, Loop{cue, emitter});
    return handle;
  }

  void setMuted(LoopHandle handle, bool muted) override
  {
    loops.at(handle).muted = muted;
    ++muteCalls;
  }

  void setVolume(LoopHandle handle, double volume) override
  {
    loops.at(handle).volume = volume;
  }

  [[nodiscard]] size_t count(SoundCue cue) const
  {
    return static_cast<size_t>(std::ranges::count(oneShots, cue));
  }

  std::vector<SoundCue> oneShots;
  std::map<LoopHandle, Loop> loops;
  size_t muteCalls{0};

private:
  LoopHandle nextHandle_{1};
};

/**
 * @brief TextOverlay keeping banners in memory
 */
class FakeTextOverlay final : public TextOverlay
{
public:
  struct Banner
  {
    std::string text;
    Color color;
    BannerAnchor anchor;
  };

  BannerId spawnBanner(const std::string& text,
                       Color color,
                       BannerAnchor anchor) override
  {
    BannerId const id = nextId_++;
    banners.emplace(id, Banner{text, color, anchor});
    ++spawnCount;
    return id;
  }

  void despawnBanner(BannerId id) override
  {
    banners.erase(id);
  }

  void setBannerText(BannerId id, const std::string& text) override
  {
    auto it = banners.find(id);
    if (it == banners.end())
    {
      throw std::out_of_range("Unknown banner");
    }
    it->second.text = text;
  }

  [[nodiscard]] bool hasText(const std::string& text) const
  {
    return std::ranges::any_of(banners,
                               [&text](const auto& entry)
                               { return entry.second.text == text; });
  }

  std::map<BannerId, Banner> banners;
  size_t spawnCount{0};

private:
  BannerId nextId_{1};
};

}  // namespace rbg_sim::test

#endif  // RBG_SIM_TEST_HELPERS_FAKE_SERVICES_HPP

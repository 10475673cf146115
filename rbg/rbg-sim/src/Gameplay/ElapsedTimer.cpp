// Ticket: 0013_elapsed_timer

#include "rbg-sim/src/Gameplay/ElapsedTimer.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <format>

namespace rbg_sim
{

ElapsedTimer::ElapsedTimer(TextOverlay& overlay) : overlay_{overlay}
{
}

void ElapsedTimer::update(std::chrono::duration<double> dt)
{
  elapsed_ += dt;

  std::string const text = format(elapsed_);
  if (!banner_)
  {
    banner_ = overlay_.spawnBanner(text, colors::kWhite, BannerAnchor::TopLeft);
  }
  else
  {
    overlay_.setBannerText(*banner_, text);
  }
}

std::string ElapsedTimer::format(std::chrono::duration<double> elapsed)
{
  auto const totalMillis = static_cast<int64_t>(
    std::floor(std::max(elapsed.count(), 0.0) * 1000.0));

  int64_t const hours = totalMillis / 3'600'000;
  int64_t const minutes = (totalMillis / 60'000) % 60;
  int64_t const seconds = (totalMillis / 1000) % 60;
  int64_t const millis = totalMillis % 1000;

  return std::format(
    "Time: {:02}:{:02}:{:02}.{:03}", hours, minutes, seconds, millis);
}

}  // namespace rbg_sim

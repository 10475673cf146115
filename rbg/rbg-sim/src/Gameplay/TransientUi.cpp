// Ticket: 0012_transient_ui

#include "rbg-sim/src/Gameplay/TransientUi.hpp"

namespace rbg_sim
{

TransientUi::TransientUi(TextOverlay& overlay) : overlay_{overlay}
{
}

void TransientUi::showFall()
{
  show(fallBanner_, kFallText, colors::kRed);
}

void TransientUi::showWin()
{
  show(winBanner_, kWinText, colors::kGold);
}

void TransientUi::clearFall()
{
  clear(fallBanner_);
}

void TransientUi::clearWin()
{
  clear(winBanner_);
}

void TransientUi::show(std::optional<BannerId>& slot,
                       const char* text,
                       Color color)
{
  if (!slot)
  {
    slot = overlay_.spawnBanner(text, color, BannerAnchor::Center);
  }
}

void TransientUi::clear(std::optional<BannerId>& slot)
{
  if (slot)
  {
    overlay_.despawnBanner(*slot);
    slot.reset();
  }
}

}  // namespace rbg_sim

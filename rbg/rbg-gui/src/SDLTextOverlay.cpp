#include "rbg-gui/src/SDLTextOverlay.hpp"

#include <stdexcept>
#include <string>

namespace rbg_gui
{

rbg_sim::BannerId SDLTextOverlay::spawnBanner(const std::string& text,
                                              rbg_sim::Color color,
                                              rbg_sim::BannerAnchor anchor)
{
  rbg_sim::BannerId const id = nextId_++;
  banners_.emplace(id, Banner{text, color, anchor});
  return id;
}

void SDLTextOverlay::despawnBanner(rbg_sim::BannerId id)
{
  banners_.erase(id);
}

void SDLTextOverlay::setBannerText(rbg_sim::BannerId id,
                                   const std::string& text)
{
  auto it = banners_.find(id);
  if (it == banners_.end())
  {
    throw std::out_of_range("Banner " + std::to_string(id) +
                            " does not exist");
  }
  it->second.text = text;
}

std::optional<std::reference_wrapper<const Banner>> SDLTextOverlay::findBanner(
  rbg_sim::BannerId id) const
{
  auto it = banners_.find(id);
  if (it == banners_.end())
  {
    return std::nullopt;
  }
  return std::cref(it->second);
}

void SDLTextOverlay::render(SDL_Renderer* renderer, int width, int height) const
{
  float previousX = 1.0f;
  float previousY = 1.0f;
  SDL_GetRenderScale(renderer, &previousX, &previousY);

  auto const glyph = static_cast<float>(SDL_DEBUG_TEXT_FONT_CHARACTER_SIZE);

  for (const auto& [id, banner] : banners_)
  {
    SDL_SetRenderDrawColor(renderer,
                           banner.color.r,
                           banner.color.g,
                           banner.color.b,
                           banner.color.a);

    // Positions are given in scaled units
    if (banner.anchor == rbg_sim::BannerAnchor::Center)
    {
      SDL_SetRenderScale(renderer, kCenterScale, kCenterScale);
      float const textWidth = glyph * static_cast<float>(banner.text.size());
      float const x = (static_cast<float>(width) / kCenterScale - textWidth) / 2.0f;
      float const y = (static_cast<float>(height) / kCenterScale - glyph) / 2.0f;
      SDL_RenderDebugText(renderer, x, y, banner.text.c_str());
    }
    else
    {
      SDL_SetRenderScale(renderer, kCornerScale, kCornerScale);
      SDL_RenderDebugText(renderer,
                          kMargin / kCornerScale,
                          kMargin / kCornerScale,
                          banner.text.c_str());
    }
  }

  SDL_SetRenderScale(renderer, previousX, previousY);
}

}  // namespace rbg_gui

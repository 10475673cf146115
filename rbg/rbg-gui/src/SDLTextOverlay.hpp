#ifndef RBG_GUI_SDL_TEXT_OVERLAY_HPP
#define RBG_GUI_SDL_TEXT_OVERLAY_HPP

#include <functional>
#include <map>
#include <optional>
#include <string>

#include <SDL3/SDL.h>

#include "rbg-sim/src/Services/TextOverlay.hpp"

namespace rbg_gui
{

struct Banner
{
  std::string text;
  rbg_sim::Color color;
  rbg_sim::BannerAnchor anchor;
};

/**
 * @brief TextOverlay drawn with the SDL renderer's built-in debug font
 *
 * Center banners are drawn at kCenterScale times the 8x8 debug glyph size,
 * top-left banners at kCornerScale.
 */
class SDLTextOverlay final : public rbg_sim::TextOverlay
{
public:
  static constexpr float kCenterScale = 4.0f;
  static constexpr float kCornerScale = 2.0f;
  static constexpr float kMargin = 10.0f;  // [px]

  rbg_sim::BannerId spawnBanner(const std::string& text,
                                rbg_sim::Color color,
                                rbg_sim::BannerAnchor anchor) override;

  void despawnBanner(rbg_sim::BannerId id) override;

  /**
   * @throws std::out_of_range if the banner does not exist
   */
  void setBannerText(rbg_sim::BannerId id, const std::string& text) override;

  [[nodiscard]] const std::map<rbg_sim::BannerId, Banner>& getBanners() const
  {
    return banners_;
  }

  [[nodiscard]] std::optional<std::reference_wrapper<const Banner>> findBanner(
    rbg_sim::BannerId id) const;

  /**
   * @brief Draw every banner
   * @param renderer Target renderer; its scale is restored afterwards
   * @param width Output width in pixels
   * @param height Output height in pixels
   */
  void render(SDL_Renderer* renderer, int width, int height) const;

private:
  std::map<rbg_sim::BannerId, Banner> banners_;
  rbg_sim::BannerId nextId_{1};
};

}  // namespace rbg_gui

#endif  // RBG_GUI_SDL_TEXT_OVERLAY_HPP

#ifndef RBG_SIM_SERVICES_TEXT_OVERLAY_HPP
#define RBG_SIM_SERVICES_TEXT_OVERLAY_HPP

#include <cstdint>
#include <string>

namespace rbg_sim
{

using BannerId = uint32_t;

struct Color
{
  uint8_t r{255};
  uint8_t g{255};
  uint8_t b{255};
  uint8_t a{255};

  bool operator==(const Color&) const = default;
};

namespace colors
{
inline constexpr Color kWhite{255, 255, 255, 255};
inline constexpr Color kRed{230, 40, 40, 255};
inline constexpr Color kGold{250, 210, 60, 255};
}  // namespace colors

enum class BannerAnchor : uint8_t
{
  TopLeft,
  Center
};

/**
 * @brief Screen-space text banners
 */
class TextOverlay
{
public:
  virtual ~TextOverlay() = default;

  virtual BannerId spawnBanner(const std::string& text,
                               Color color,
                               BannerAnchor anchor) = 0;

  /**
   * @brief Remove a banner; unknown ids are ignored
   */
  virtual void despawnBanner(BannerId id) = 0;

  virtual void setBannerText(BannerId id, const std::string& text) = 0;
};

}  // namespace rbg_sim

#endif  // RBG_SIM_SERVICES_TEXT_OVERLAY_HPP

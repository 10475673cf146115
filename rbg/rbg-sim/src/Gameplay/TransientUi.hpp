// Ticket: 0012_transient_ui

#ifndef RBG_SIM_GAMEPLAY_TRANSIENT_UI_HPP
#define RBG_SIM_GAMEPLAY_TRANSIENT_UI_HPP

#include <optional>
#include <string>

#include "rbg-sim/src/Services/TextOverlay.hpp"

namespace rbg_sim
{

/**
 * @brief Win and fall banners, at most one of each
 */
class TransientUi
{
public:
  static constexpr const char* kFallText = "You fell! Press R to restart";
  static constexpr const char* kWinText = "You Win!";

  explicit TransientUi(TextOverlay& overlay);

  /**
   * @brief Spawn the fall banner unless one is already shown
   */
  void showFall();
  void showWin();

  void clearFall();
  void clearWin();

  [[nodiscard]] bool hasFallBanner() const
  {
    return fallBanner_.has_value();
  }

  [[nodiscard]] bool hasWinBanner() const
  {
    return winBanner_.has_value();
  }

private:
  void show(std::optional<BannerId>& slot, const char* text, Color color);
  void clear(std::optional<BannerId>& slot);

  TextOverlay& overlay_;
  std::optional<BannerId> fallBanner_;
  std::optional<BannerId> winBanner_;
};

}  // namespace rbg_sim

#endif  // RBG_SIM_GAMEPLAY_TRANSIENT_UI_HPP

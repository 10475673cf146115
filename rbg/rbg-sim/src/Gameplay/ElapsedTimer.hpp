// Ticket: 0013_elapsed_timer

#ifndef RBG_SIM_GAMEPLAY_ELAPSED_TIMER_HPP
#define RBG_SIM_GAMEPLAY_ELAPSED_TIMER_HPP

#include <chrono>
#include <optional>
#include <string>

#include "rbg-sim/src/Services/TextOverlay.hpp"

namespace rbg_sim
{

/**
 * @brief HUD line with the elapsed game time
 */
class ElapsedTimer
{
public:
  explicit ElapsedTimer(TextOverlay& overlay);

  /**
   * @brief Advance the clock and refresh the banner, spawning it on first use
   */
  void update(std::chrono::duration<double> dt);

  [[nodiscard]] std::chrono::duration<double> getElapsed() const
  {
    return elapsed_;
  }

  /**
   * @brief "Time: HH:MM:SS.mmm"
   */
  [[nodiscard]] static std::string format(std::chrono::duration<double> elapsed);

private:
  TextOverlay& overlay_;
  std::optional<BannerId> banner_;
  std::chrono::duration<double> elapsed_{0.0};
};

}  // namespace rbg_sim

#endif  // RBG_SIM_GAMEPLAY_ELAPSED_TIMER_HPP

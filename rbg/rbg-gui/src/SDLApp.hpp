#ifndef RBG_GUI_SDL_APP_HPP
#define RBG_GUI_SDL_APP_HPP

#include <cstdint>
#include <memory>

#include <SDL3/SDL.h>
#include <spdlog/spdlog.h>

#include "rbg-gui/src/InputHandler.hpp"
#include "rbg-gui/src/SDLUtils.hpp"
#include "rbg-sim/src/Config/GameConfig.hpp"

namespace rbg_gui
{

/**
 * @brief Window, event pump and frame loop around rbg_sim::Engine
 *
 * Key bindings handled here rather than by the game:
 * - F1: toggle mouse capture (relative mouse mode)
 */
class SDLApplication
{
public:
  enum class Status : uint8_t
  {
    Starting,
    Running,
    Exiting
  };

  /**
   * @brief Initialize SDL and open the window
   * @throws SDLException if video, the window or the renderer fail
   */
  SDLApplication(rbg_sim::GameConfig config,
                 std::shared_ptr<spdlog::logger> logger);

  SDLApplication(const SDLApplication&) = delete;
  SDLApplication& operator=(const SDLApplication&) = delete;
  SDLApplication(SDLApplication&&) = delete;
  SDLApplication& operator=(SDLApplication&&) = delete;

  ~SDLApplication();

  /**
   * @brief Run the game until the window closes or the game asks to quit
   * @return Process exit code
   */
  int runApp();

  [[nodiscard]] Status getStatus() const;

private:
  void handleEvents();
  void toggleMouseCapture();

  rbg_sim::GameConfig config_;
  std::shared_ptr<spdlog::logger> logger_;
  Status status_;
  bool audioAvailable_{false};

  UniqueWindow window_;
  UniqueRenderer renderer_;
  InputHandler inputHandler_;
};

}  // namespace rbg_gui

#endif  // RBG_GUI_SDL_APP_HPP

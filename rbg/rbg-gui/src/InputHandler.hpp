#ifndef RBG_GUI_INPUT_HANDLER_HPP
#define RBG_GUI_INPUT_HANDLER_HPP

#include <functional>
#include <vector>

#include <SDL3/SDL.h>

#include "rbg-gui/src/InputState.hpp"
#include "rbg-sim/src/Agent/InputCommands.hpp"

namespace rbg_gui
{

/**
 * @brief Binds a key to a GUI-side action fired once per key press
 *
 * Thread safety: Not thread-safe (assumes single-threaded execution)
 */
class InputBinding
{
public:
  InputBinding(SDL_Keycode key, std::function<void()> action);

  [[nodiscard]] SDL_Keycode getKey() const
  {
    return key_;
  }

  /**
   * @brief Execute the bound action
   *
   * Note: No exceptions are caught; action execution failure propagates.
   */
  void execute();

private:
  SDL_Keycode key_;
  std::function<void()> action_;
};

/**
 * @brief Turns SDL events into per-tick InputCommands
 *
 * Owns the InputState (single source of truth). Game keys map to
 * InputCommands fields:
 *
 * | Key    | Field                      |
 * |--------|----------------------------|
 * | W/S    | moveForward / moveBackward |
 * | A/D    | moveLeft / moveRight       |
 * | E/Q    | moveUp / moveDown          |
 * | R      | restart                    |
 * | 1      | activateOrbitCamera        |
 * | 2      | activateFlyCamera          |
 * | Escape | quit                       |
 *
 * GUI-only actions (cursor grab) are added as bindings.
 *
 * Thread safety: Not thread-safe
 */
class InputHandler
{
public:
  InputHandler() = default;

  InputHandler(const InputHandler&) = delete;
  InputHandler& operator=(const InputHandler&) = delete;
  InputHandler(InputHandler&&) noexcept = default;
  InputHandler& operator=(InputHandler&&) noexcept = default;
  ~InputHandler() = default;

  void addBinding(InputBinding binding);

  /**
   * @brief Remove the first binding matching the key
   */
  void removeBinding(SDL_Keycode key);

  /**
   * @brief Update the input state from keyboard and mouse motion events
   *
   * Bindings fire here, on the key-down event itself. Key repeats are
   * ignored.
   */
  void handleSDLEvent(const SDL_Event& event);

  /**
   * @brief Snapshot this frame's input for the game
   * @param cursorCaptured Whether relative mouse mode is on
   * @param windowWidth Window width in pixels
   * @param windowHeight Window height in pixels
   */
  [[nodiscard]] rbg_sim::InputCommands buildCommands(bool cursorCaptured,
                                                     int windowWidth,
                                                     int windowHeight) const;

  /**
   * @brief Clear pressed-this-frame flags and mouse motion
   */
  void update();

  [[nodiscard]] const InputState& getInputState() const
  {
    return inputState_;
  }

private:
  InputState inputState_;
  std::vector<InputBinding> bindings_;
};

}  // namespace rbg_gui

#endif  // RBG_GUI_INPUT_HANDLER_HPP

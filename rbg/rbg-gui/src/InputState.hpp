#ifndef RBG_GUI_INPUT_STATE_HPP
#define RBG_GUI_INPUT_STATE_HPP

#include <unordered_map>
#include <vector>

#include <Eigen/Core>
#include <SDL3/SDL.h>

namespace rbg_gui
{

/**
 * @brief State information for a single key
 */
struct KeyState
{
  bool pressed{false};      // Currently pressed
  bool justPressed{false};  // Pressed since the last update()
};

/**
 * @brief Tracks the current state of keyboard and mouse inputs
 *
 * A key pressed and released between two update() calls still reports
 * justPressed until the next update(), so quick taps are never lost.
 * Mouse motion events accumulate in arrival order until update().
 *
 * Thread safety: Not thread-safe (single-threaded GUI operation assumed)
 */
class InputState
{
public:
  InputState() = default;

  /**
   * @brief Update the state of a key from SDL event
   * @param key The SDL keycode
   * @param pressed True if key is pressed, false if released
   */
  void updateKey(SDL_Keycode key, bool pressed);

  /**
   * @brief Record one relative mouse motion event, in pixels
   */
  void addMouseMotion(float dx, float dy);

  [[nodiscard]] bool isKeyPressed(SDL_Keycode key) const;

  [[nodiscard]] bool isKeyJustPressed(SDL_Keycode key) const;

  [[nodiscard]] const std::vector<Eigen::Vector2d>& getMouseMotion() const
  {
    return mouseMotion_;
  }

  /**
   * @brief Clear per-frame data
   *
   * Clears justPressed flags and drains mouse motion. Call once per frame
   * after the frame's input has been consumed.
   */
  void update();

  void reset();

private:
  std::unordered_map<SDL_Keycode, KeyState> keyStates_;
  std::vector<Eigen::Vector2d> mouseMotion_;
};

}  // namespace rbg_gui

#endif  // RBG_GUI_INPUT_STATE_HPP

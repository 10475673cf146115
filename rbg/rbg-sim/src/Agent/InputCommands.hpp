#ifndef RBG_SIM_AGENT_INPUT_COMMANDS_HPP
#define RBG_SIM_AGENT_INPUT_COMMANDS_HPP

#include <vector>

#include <Eigen/Core>

namespace rbg_sim
{

/**
 * @brief Plain data structure representing one tick of input
 *
 * This struct is the bridge between rbg-gui (input source) and rbg-sim
 * (consumer). Held flags stay true while the key is down; action flags are
 * true only on the tick the key was pressed.
 *
 * Thread safety: Value type (safe to copy)
 */
struct InputCommands
{
  // Held movement
  bool moveForward{false};   // W
  bool moveBackward{false};  // S
  bool moveLeft{false};      // A
  bool moveRight{false};     // D
  bool moveUp{false};        // E
  bool moveDown{false};      // Q

  // Pressed this tick
  bool restart{false};
  bool activateOrbitCamera{false};
  bool activateFlyCamera{false};
  bool quit{false};

  // Raw mouse motion events of this tick, in pixels
  std::vector<Eigen::Vector2d> mouseMotion;
  bool cursorCaptured{false};

  int windowWidth{1280};
  int windowHeight{720};

  /**
   * @brief Reset all commands, keeping the window size
   */
  void reset()
  {
    moveForward = moveBackward = moveLeft = moveRight = false;
    moveUp = moveDown = false;
    restart = activateOrbitCamera = activateFlyCamera = quit = false;
    mouseMotion.clear();
    cursorCaptured = false;
  }
};

}  // namespace rbg_sim

#endif  // RBG_SIM_AGENT_INPUT_COMMANDS_HPP

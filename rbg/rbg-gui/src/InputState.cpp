#include "rbg-gui/src/InputState.hpp"

namespace rbg_gui
{

void InputState::updateKey(SDL_Keycode key, bool pressed)
{
  auto& keyState = keyStates_[key];

  if (pressed && !keyState.pressed)
  {
    keyState.pressed = true;
    keyState.justPressed = true;
  }
  else if (!pressed && keyState.pressed)
  {
    // justPressed survives until update()
    keyState.pressed = false;
  }
}

void InputState::addMouseMotion(float dx, float dy)
{
  mouseMotion_.emplace_back(dx, dy);
}

bool InputState::isKeyPressed(SDL_Keycode key) const
{
  auto it = keyStates_.find(key);
  return it != keyStates_.end() && it->second.pressed;
}

bool InputState::isKeyJustPressed(SDL_Keycode key) const
{
  auto it = keyStates_.find(key);
  return it != keyStates_.end() && it->second.justPressed;
}

void InputState::update()
{
  for (auto& [key, state] : keyStates_)
  {
    state.justPressed = false;
  }
  mouseMotion_.clear();
}

void InputState::reset()
{
  keyStates_.clear();
  mouseMotion_.clear();
}

}  // namespace rbg_gui

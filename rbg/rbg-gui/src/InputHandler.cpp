#include "rbg-gui/src/InputHandler.hpp"

#include <algorithm>
#include <utility>

namespace rbg_gui
{

//------------------------------------------------------------------------------
// InputBinding Implementation
//------------------------------------------------------------------------------

InputBinding::InputBinding(SDL_Keycode key, std::function<void()> action)
  : key_{key}, action_{std::move(action)}
{
}

void InputBinding::execute()
{
  if (action_)
  {
    action_();
  }
}

//------------------------------------------------------------------------------
// InputHandler Implementation
//------------------------------------------------------------------------------

void InputHandler::addBinding(InputBinding binding)
{
  bindings_.push_back(std::move(binding));
}

void InputHandler::removeBinding(SDL_Keycode key)
{
  auto it = std::ranges::find_if(bindings_,
                                 [key](const InputBinding& binding)
                                 { return binding.getKey() == key; });

  if (it != bindings_.end())
  {
    bindings_.erase(it);
  }
}

void InputHandler::handleSDLEvent(const SDL_Event& event)
{
  switch (event.type)
  {
    case SDL_EVENT_KEY_DOWN:
    {
      if (event.key.repeat)
      {
        break;
      }

      SDL_Keycode const key = event.key.key;
      inputState_.updateKey(key, true);

      for (auto& binding : bindings_)
      {
        if (binding.getKey() == key)
        {
          binding.execute();
        }
      }
      break;
    }

    case SDL_EVENT_KEY_UP:
      inputState_.updateKey(event.key.key, false);
      break;

    case SDL_EVENT_MOUSE_MOTION:
      inputState_.addMouseMotion(event.motion.xrel, event.motion.yrel);
      break;

    default:
      break;
  }
}

rbg_sim::InputCommands InputHandler::buildCommands(bool cursorCaptured,
                                                   int windowWidth,
                                                   int windowHeight) const
{
  rbg_sim::InputCommands commands;

  commands.moveForward = inputState_.isKeyPressed(SDLK_W);
  commands.moveBackward = inputState_.isKeyPressed(SDLK_S);
  commands.moveLeft = inputState_.isKeyPressed(SDLK_A);
  commands.moveRight = inputState_.isKeyPressed(SDLK_D);
  commands.moveUp = inputState_.isKeyPressed(SDLK_E);
  commands.moveDown = inputState_.isKeyPressed(SDLK_Q);

  commands.restart = inputState_.isKeyJustPressed(SDLK_R);
  commands.activateOrbitCamera = inputState_.isKeyJustPressed(SDLK_1);
  commands.activateFlyCamera = inputState_.isKeyJustPressed(SDLK_2);
  commands.quit = inputState_.isKeyJustPressed(SDLK_ESCAPE);

  commands.mouseMotion = inputState_.getMouseMotion();
  commands.cursorCaptured = cursorCaptured;
  commands.windowWidth = windowWidth;
  commands.windowHeight = windowHeight;

  return commands;
}

void InputHandler::update()
{
  inputState_.update();
}

}  // namespace rbg_gui

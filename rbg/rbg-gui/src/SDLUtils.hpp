#ifndef RBG_GUI_SDL_UTILS_HPP
#define RBG_GUI_SDL_UTILS_HPP

#include <memory>
#include <stdexcept>
#include <string>

#include <SDL3/SDL.h>

namespace rbg_gui
{

class SDLException final : public std::runtime_error
{
public:
  explicit SDLException(const std::string& message)
    : std::runtime_error(message + ": " + SDL_GetError())
  {
  }
};

struct SDLWindowDeleter
{
  void operator()(SDL_Window* w) const
  {
    SDL_DestroyWindow(w);
  }
};

struct SDLRendererDeleter
{
  void operator()(SDL_Renderer* r) const
  {
    SDL_DestroyRenderer(r);
  }
};

struct SDLAudioStreamDeleter
{
  void operator()(SDL_AudioStream* s) const
  {
    SDL_DestroyAudioStream(s);
  }
};

using UniqueWindow = std::unique_ptr<SDL_Window, SDLWindowDeleter>;
using UniqueRenderer = std::unique_ptr<SDL_Renderer, SDLRendererDeleter>;
using UniqueAudioStream =
  std::unique_ptr<SDL_AudioStream, SDLAudioStreamDeleter>;

}  // namespace rbg_gui

#endif  // RBG_GUI_SDL_UTILS_HPP

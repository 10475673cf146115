#include "rbg-gui/src/SDLApp.hpp"

#include <chrono>
#include <cstdlib>
#include <utility>

#include "rbg-assets/src/LevelLoader.hpp"
#include "rbg-gui/src/SDLAudioSink.hpp"
#include "rbg-gui/src/SDLTextOverlay.hpp"
#include "rbg-gui/src/WireframeRenderer.hpp"
#include "rbg-sim/src/Engine.hpp"
#include "rbg-utils/src/Logging.hpp"
#include "rbg-utils/src/PathUtils.hpp"

namespace rbg_gui
{

SDLApplication::SDLApplication(rbg_sim::GameConfig config,
                               std::shared_ptr<spdlog::logger> logger)
  : config_{std::move(config)},
    logger_{std::move(logger)},
    status_{Status::Starting}
{
  if (!SDL_Init(SDL_INIT_VIDEO))
  {
    throw SDLException("Failed to initialize SDL video");
  }

  audioAvailable_ = SDL_InitSubSystem(SDL_INIT_AUDIO);
  if (!audioAvailable_)
  {
    logger_->warn("SDL audio unavailable: {}", SDL_GetError());
  }

  window_.reset(SDL_CreateWindow("Rolling Ball",
                                 config_.windowWidth,
                                 config_.windowHeight,
                                 SDL_WINDOW_RESIZABLE));
  if (!window_)
  {
    throw SDLException("Failed to create SDL window");
  }

  renderer_.reset(SDL_CreateRenderer(window_.get(), nullptr));
  if (!renderer_)
  {
    throw SDLException("Failed to create SDL renderer");
  }

  inputHandler_.addBinding(
    InputBinding{SDLK_F1, [this]() { toggleMouseCapture(); }});
}

SDLApplication::~SDLApplication()
{
  renderer_.reset();
  window_.reset();
  SDL_Quit();
}

int SDLApplication::runApp()
{
  auto levelSource = std::make_unique<rbg_assets::LevelLoader>(
    rbg_utils::resolveResourcePath(config_.levelPath),
    config_.hotReload,
    rbg_utils::getLogger("assets"));

  SDLAudioSink audio{rbg_utils::resolveResourcePath(config_.soundDirectory),
                     audioAvailable_,
                     rbg_utils::getLogger("audio")};
  SDLTextOverlay overlay;
  rbg_sim::Engine engine{config_,
                         std::move(levelSource),
                         audio,
                         overlay,
                         rbg_utils::getLogger("gameplay")};
  WireframeRenderer wireframe;

  SDL_ShowWindow(window_.get());
  status_ = Status::Running;
  logger_->info("Running; press F1 to capture the mouse");

  Uint64 lastTicks = SDL_GetTicksNS();

  while (status_ == Status::Running)
  {
    handleEvents();
    if (status_ != Status::Running)
    {
      break;
    }

    Uint64 const now = SDL_GetTicksNS();
    std::chrono::nanoseconds const elapsed{now - lastTicks};
    lastTicks = now;

    int width = config_.windowWidth;
    int height = config_.windowHeight;
    SDL_GetWindowSize(window_.get(), &width, &height);

    auto const commands = inputHandler_.buildCommands(
      SDL_GetWindowRelativeMouseMode(window_.get()), width, height);

    engine.update(commands, elapsed);
    audio.update();

    if (engine.isQuitRequested())
    {
      status_ = Status::Exiting;
    }

    wireframe.render(renderer_.get(), engine, width, height);
    overlay.render(renderer_.get(), width, height);
    SDL_RenderPresent(renderer_.get());

    inputHandler_.update();
  }

  logger_->info("Exiting");
  return EXIT_SUCCESS;
}

SDLApplication::Status SDLApplication::getStatus() const
{
  return status_;
}

void SDLApplication::handleEvents()
{
  SDL_Event event;
  while (SDL_PollEvent(&event))
  {
    if (event.type == SDL_EVENT_QUIT)
    {
      status_ = Status::Exiting;
      continue;
    }
    inputHandler_.handleSDLEvent(event);
  }
}

void SDLApplication::toggleMouseCapture()
{
  bool const captured = !SDL_GetWindowRelativeMouseMode(window_.get());
  if (!SDL_SetWindowRelativeMouseMode(window_.get(), captured))
  {
    logger_->warn("Could not change mouse capture: {}", SDL_GetError());
    return;
  }
  logger_->debug("Mouse capture {}", captured ? "on" : "off");
}

}  // namespace rbg_gui

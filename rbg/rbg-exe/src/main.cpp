#include <cstdlib>
#include <exception>
#include <stdexcept>

#include "rbg-gui/src/SDLApp.hpp"
#include "rbg-sim/src/Config/GameConfig.hpp"
#include "rbg-sim/src/Gameplay/ColliderAttacher.hpp"
#include "rbg-utils/src/Logging.hpp"

int main(int argc, char* argv[])
{
  auto logger = rbg_utils::getLogger("rbg");

  try
  {
    rbg_sim::GameConfig config;
    if (argc > 1)
    {
      config = rbg_sim::loadConfig(argv[1]);
      logger->info("Loaded configuration from {}", argv[1]);
    }
    rbg_utils::setGlobalLogLevel(config.logLevel);

    for (const auto& line : rbg_sim::describeConfig(config))
    {
      logger->debug("  {}", line);
    }

    rbg_gui::SDLApplication application{config, logger};
    return application.runApp();
  }
  catch (const rbg_sim::LevelAuthoringError& e)
  {
    logger->critical("Level authoring error: {}", e.what());
  }
  catch (const std::invalid_argument& e)
  {
    logger->critical("Invalid configuration: {}", e.what());
  }
  catch (const std::exception& e)
  {
    logger->critical("{}", e.what());
  }

  return EXIT_FAILURE;
}

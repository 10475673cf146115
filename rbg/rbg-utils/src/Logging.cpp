#include "rbg-utils/src/Logging.hpp"

#include <array>
#include <stdexcept>
#include <string_view>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace rbg_utils
{

std::shared_ptr<spdlog::logger> getLogger(const std::string& name)
{
  if (auto existing = spdlog::get(name))
  {
    return existing;
  }

  try
  {
    return spdlog::stdout_color_mt(name);
  }
  catch (const spdlog::spdlog_ex&)
  {
    // Lost a registration race against another caller with the same name
    auto registered = spdlog::get(name);
    if (!registered)
    {
      throw;
    }
    return registered;
  }
}

std::shared_ptr<spdlog::logger> makeNullLogger(const std::string& name)
{
  auto sink = std::make_shared<spdlog::sinks::null_sink_mt>();
  return std::make_shared<spdlog::logger>(name, sink);
}

void setGlobalLogLevel(const std::string& level)
{
  static constexpr std::array<std::string_view, 7> kLevelNames{
    "trace", "debug", "info", "warning", "error", "critical", "off"};

  bool known = false;
  for (auto candidate : kLevelNames)
  {
    known = known || candidate == level;
  }
  if (!known)
  {
    throw std::invalid_argument("Unknown log level: " + level);
  }

  spdlog::set_level(spdlog::level::from_str(level));
}

}  // namespace rbg_utils

// Ticket: 0016_json_game_config

#include "rbg-sim/src/Config/GameConfig.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <stdexcept>
#include <string_view>
#include <type_traits>

#include <boost/describe/enum_from_string.hpp>
#include <boost/describe/enum_to_string.hpp>
#include <boost/describe/members.hpp>
#include <boost/mp11/algorithm.hpp>

namespace rbg_sim
{

namespace
{

using nlohmann::json;

template <typename T>
void readValue(const json& value, std::string_view key, T& out)
{
  if constexpr (std::is_same_v<T, std::string>)
  {
    if (!value.is_string())
    {
      throw std::invalid_argument(std::format("'{}' expects a string", key));
    }
    out = value.get<std::string>();
  }
  else if constexpr (std::is_same_v<T, bool>)
  {
    if (!value.is_boolean())
    {
      throw std::invalid_argument(std::format("'{}' expects a boolean", key));
    }
    out = value.get<bool>();
  }
  else if constexpr (std::is_same_v<T, Coordinate>)
  {
    bool const valid =
      value.is_array() && value.size() == 3 &&
      std::ranges::all_of(value, [](const json& c) { return c.is_number(); });
    if (!valid)
    {
      throw std::invalid_argument(
        std::format("'{}' expects an array of three numbers", key));
    }
    out = Coordinate{
      value[0].get<double>(), value[1].get<double>(), value[2].get<double>()};
  }
  else if constexpr (std::is_enum_v<T>)
  {
    if (!value.is_string() ||
        !boost::describe::enum_from_string(
          value.get<std::string>().c_str(), out))
    {
      throw std::invalid_argument(
        std::format("'{}' is not a valid choice for '{}'", value.dump(), key));
    }
  }
  else if constexpr (std::is_integral_v<T>)
  {
    if (!value.is_number_integer())
    {
      throw std::invalid_argument(
        std::format("'{}' expects an integer, got {}", key, value.dump()));
    }
    out = value.get<T>();
  }
  else
  {
    if (!value.is_number())
    {
      throw std::invalid_argument(
        std::format("'{}' expects a number, got {}", key, value.dump()));
    }
    out = value.get<T>();
  }
}

template <typename T>
json writeValue(const T& value)
{
  if constexpr (std::is_same_v<T, Coordinate>)
  {
    return json::array({value.x(), value.y(), value.z()});
  }
  else if constexpr (std::is_enum_v<T>)
  {
    return boost::describe::enum_to_string(value, "?");
  }
  else
  {
    return value;
  }
}

void requirePositive(double value, const char* name)
{
  if (!(value > 0.0))
  {
    throw std::invalid_argument(
      std::format("{} must be positive, got {}", name, value));
  }
}

void requireNonNegative(double value, const char* name)
{
  if (!(value >= 0.0))
  {
    throw std::invalid_argument(
      std::format("{} must be non-negative, got {}", name, value));
  }
}

void requireUnitInterval(double value, const char* name)
{
  if (!(value >= 0.0 && value <= 1.0))
  {
    throw std::invalid_argument(
      std::format("{} must be in [0, 1], got {}", name, value));
  }
}

}  // namespace

void GameConfig::validate() const
{
  if (levelPath.empty())
  {
    throw std::invalid_argument("levelPath must not be empty");
  }
  if (windowWidth <= 0 || windowHeight <= 0)
  {
    throw std::invalid_argument(std::format(
      "Window size must be positive, got {}x{}", windowWidth, windowHeight));
  }

  requirePositive(ballRadius, "ballRadius");
  requirePositive(ballMass, "ballMass");
  requireUnitInterval(ballRestitution, "ballRestitution");
  requireNonNegative(ballFriction, "ballFriction");
  requireNonNegative(forceGain, "forceGain");
  requireNonNegative(torqueGain, "torqueGain");
  requirePositive(cameraDistance, "cameraDistance");
  requirePositive(cameraSensitivity, "cameraSensitivity");
  requirePositive(flySpeed, "flySpeed");
  requirePositive(flySensitivity, "flySensitivity");
  requireUnitInterval(colliderRestitution, "colliderRestitution");
  requireNonNegative(colliderFriction, "colliderFriction");
  requireNonNegative(rollingVolumeGain, "rollingVolumeGain");
  requireNonNegative(gravity, "gravity");

  if (!(pitchLimit > 0.0 && pitchLimit < 1.5707963267948966))
  {
    throw std::invalid_argument(
      std::format("pitchLimit must be in (0, pi/2), got {}", pitchLimit));
  }

  if (colliderBodyKind == BodyKind::Dynamic)
  {
    throw std::invalid_argument(
      "colliderBodyKind must be Static or Kinematic");
  }
}

GameConfig parseConfig(std::istream& input, const std::string& sourceName)
{
  // Comments are allowed so shipped files can annotate their keys
  json const document = json::parse(input, nullptr, false, true);
  if (document.is_discarded() || !document.is_object())
  {
    throw std::invalid_argument(
      std::format("{}: expected a JSON object", sourceName));
  }

  GameConfig config;

  for (const auto& item : document.items())
  {
    std::string const& key = item.key();

    bool found = false;
    boost::mp11::mp_for_each<
      boost::describe::describe_members<GameConfig,
                                        boost::describe::mod_public>>(
      [&](auto member)
      {
        if (!found && key == member.name)
        {
          found = true;
          try
          {
            readValue(item.value(), key, config.*member.pointer);
          }
          catch (const std::invalid_argument& e)
          {
            throw std::invalid_argument(
              std::format("{}: {}", sourceName, e.what()));
          }
        }
      });

    if (!found)
    {
      throw std::invalid_argument(
        std::format("{}: unknown key '{}'", sourceName, key));
    }
  }

  config.validate();
  return config;
}

GameConfig loadConfig(const std::filesystem::path& path)
{
  std::ifstream file{path};
  if (!file)
  {
    throw std::runtime_error("Cannot open configuration file: " +
                             path.string());
  }
  return parseConfig(file, path.string());
}

nlohmann::json toJson(const GameConfig& config)
{
  json document = json::object();
  boost::mp11::mp_for_each<
    boost::describe::describe_members<GameConfig,
                                      boost::describe::mod_public>>(
    [&](auto member)
    { document[member.name] = writeValue(config.*member.pointer); });
  return document;
}

std::vector<std::string> describeConfig(const GameConfig& config)
{
  std::vector<std::string> lines;
  boost::mp11::mp_for_each<
    boost::describe::describe_members<GameConfig,
                                      boost::describe::mod_public>>(
    [&](auto member)
    {
      lines.push_back(std::format(
        "{} = {}", member.name, writeValue(config.*member.pointer).dump()));
    });
  return lines;
}

}  // namespace rbg_sim

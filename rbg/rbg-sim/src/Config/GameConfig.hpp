// Ticket: 0016_json_game_config

#ifndef RBG_SIM_CONFIG_GAME_CONFIG_HPP
#define RBG_SIM_CONFIG_GAME_CONFIG_HPP

#include <cstdint>
#include <filesystem>
#include <istream>
#include <string>
#include <vector>

#include <boost/describe/class.hpp>
#include <boost/describe/enum.hpp>
#include <nlohmann/json.hpp>

#include "rbg-sim/src/DataTypes/Coordinate.hpp"
#include "rbg-sim/src/Physics/PhysicsEngine.hpp"

namespace rbg_sim
{

/**
 * @brief How movement keys are turned into an applied load on the ball
 *
 * - Force: a single camera-relative push on the XZ plane, W > S > A > D
 * - Torque: summed camera-relative torques that roll the ball
 */
enum class SteeringMode : uint8_t
{
  Force,
  Torque
};

BOOST_DESCRIBE_ENUM(SteeringMode, Force, Torque)

/**
 * @brief Every tunable of the game
 *
 * Field names double as keys of the JSON configuration file. Vector values
 * are arrays of three numbers, enums are strings naming the enumerator.
 */
struct GameConfig
{
  // Files
  std::string levelPath{"assets/levels/demo.gltf"};
  std::string soundDirectory{"assets/sounds"};
  bool hotReload{true};
  std::string logLevel{"info"};

  // Window
  int windowWidth{1280};
  int windowHeight{720};

  // Ball
  double ballRadius{0.5};
  double ballMass{1.0};
  double ballRestitution{0.0};
  double ballFriction{0.5};
  Coordinate spawnPosition{0.0, 1.0, 0.0};
  SteeringMode steeringMode{SteeringMode::Force};
  double forceGain{2.0};
  double torqueGain{0.5};

  // Cameras
  Coordinate cameraStartPosition{0.0, 2.0, 5.0};
  double cameraDistance{4.0};
  double cameraSensitivity{0.000002};
  double pitchLimit{1.54};  // [rad]
  double flySpeed{12.0};
  double flySensitivity{0.00012};

  // Level
  double colliderRestitution{0.8};
  double colliderFriction{0.5};
  BodyKind colliderBodyKind{BodyKind::Kinematic};
  double goalSpinRate{1.0};  // [rad/s]

  // Audio and world
  double rollingVolumeGain{0.1};
  double gravity{9.81};  // [m/s^2], pointing down -Y

  /**
   * @brief Check every value against its valid range
   * @throws std::invalid_argument naming the first offending field
   */
  void validate() const;
};

BOOST_DESCRIBE_STRUCT(GameConfig,
                      (),
                      (levelPath,
                       soundDirectory,
                       hotReload,
                       logLevel,
                       windowWidth,
                       windowHeight,
                       ballRadius,
                       ballMass,
                       ballRestitution,
                       ballFriction,
                       spawnPosition,
                       steeringMode,
                       forceGain,
                       torqueGain,
                       cameraStartPosition,
                       cameraDistance,
                       cameraSensitivity,
                       pitchLimit,
                       flySpeed,
                       flySensitivity,
                       colliderRestitution,
                       colliderFriction,
                       colliderBodyKind,
                       goalSpinRate,
                       rollingVolumeGain,
                       gravity))

/**
 * @brief Parse a JSON object on top of the defaults
 *
 * Every key must name a GameConfig field; missing keys keep their default.
 * C and C++ style comments are accepted.
 *
 * @param input Configuration text
 * @param sourceName Name used in error messages
 * @return Validated configuration
 * @throws std::invalid_argument on malformed JSON, unknown keys, values of
 *         the wrong type or values out of range
 */
GameConfig parseConfig(std::istream& input, const std::string& sourceName);

/**
 * @brief Read and parse a configuration file
 * @throws std::runtime_error if the file cannot be opened
 * @throws std::invalid_argument as parseConfig()
 */
GameConfig loadConfig(const std::filesystem::path& path);

/**
 * @brief JSON object holding every field, readable by parseConfig()
 */
nlohmann::json toJson(const GameConfig& config);

/**
 * @brief One `key = value` line per field, in declaration order
 */
std::vector<std::string> describeConfig(const GameConfig& config);

}  // namespace rbg_sim

#endif  // RBG_SIM_CONFIG_GAME_CONFIG_HPP

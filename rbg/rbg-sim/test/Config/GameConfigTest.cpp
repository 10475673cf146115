// Ticket: 0016_json_game_config

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "rbg-sim/src/Config/GameConfig.hpp"

using namespace rbg_sim;

namespace
{

GameConfig parse(const std::string& text)
{
  std::istringstream input{text};
  return parseConfig(input, "test.json");
}

}  // anonymous namespace

TEST(GameConfigTest, DefaultsAreValid)
{
  GameConfig const config;
  EXPECT_NO_THROW(config.validate());
  EXPECT_EQ(config.colliderBodyKind, BodyKind::Kinematic);
  EXPECT_EQ(config.steeringMode, SteeringMode::Force);
}

TEST(GameConfigTest, EmptyObjectKeepsDefaults)
{
  GameConfig const config = parse("{}");
  EXPECT_EQ(config.levelPath, GameConfig{}.levelPath);
  EXPECT_DOUBLE_EQ(config.ballRadius, 0.5);
}

TEST(GameConfigTest, ParseOverridesOnlyGivenKeys)
{
  GameConfig const config = parse(R"({
    // comment
    "levelPath": "levels/other.glb",
    "hotReload": false,
    "windowWidth": 800,
    "ballRadius": 0.25,
    "spawnPosition": [1, 2.5, -3],
    "cameraStartPosition": [0.0, 4.0, 8.0],
    "steeringMode": "Torque",
    "colliderBodyKind": "Static"
  })");

  EXPECT_EQ(config.levelPath, "levels/other.glb");
  EXPECT_FALSE(config.hotReload);
  EXPECT_EQ(config.windowWidth, 800);
  EXPECT_DOUBLE_EQ(config.ballRadius, 0.25);
  EXPECT_TRUE(config.spawnPosition.isApprox(Eigen::Vector3d{1.0, 2.5, -3.0}));
  EXPECT_TRUE(
    config.cameraStartPosition.isApprox(Eigen::Vector3d{0.0, 4.0, 8.0}));
  EXPECT_EQ(config.steeringMode, SteeringMode::Torque);
  EXPECT_EQ(config.colliderBodyKind, BodyKind::Static);

  // Untouched
  EXPECT_EQ(config.windowHeight, 720);
  EXPECT_DOUBLE_EQ(config.forceGain, 2.0);
}

TEST(GameConfigTest, UnknownKeyIsNamed)
{
  try
  {
    parse(R"({"ballRadius": 0.5, "ballColour": "red"})");
    FAIL() << "Expected std::invalid_argument";
  }
  catch (const std::invalid_argument& e)
  {
    std::string const message = e.what();
    EXPECT_NE(message.find("test.json"), std::string::npos);
    EXPECT_NE(message.find("ballColour"), std::string::npos);
  }
}

TEST(GameConfigTest, MalformedDocumentsThrow)
{
  EXPECT_THROW(parse(""), std::invalid_argument);
  EXPECT_THROW(parse("{\"ballRadius\": }"), std::invalid_argument);
  EXPECT_THROW(parse("[1, 2, 3]"), std::invalid_argument);
  EXPECT_THROW(parse("ballRadius = 0.5"), std::invalid_argument);
}

TEST(GameConfigTest, WrongValueTypesThrow)
{
  EXPECT_THROW(parse(R"({"ballRadius": "big"})"), std::invalid_argument);
  EXPECT_THROW(parse(R"({"hotReload": "maybe"})"), std::invalid_argument);
  EXPECT_THROW(parse(R"({"hotReload": 1})"), std::invalid_argument);
  EXPECT_THROW(parse(R"({"spawnPosition": [1, 2]})"), std::invalid_argument);
  EXPECT_THROW(parse(R"({"spawnPosition": [1, "2", 3]})"),
               std::invalid_argument);
  EXPECT_THROW(parse(R"({"steeringMode": "Hover"})"), std::invalid_argument);
  EXPECT_THROW(parse(R"({"windowWidth": 12.5})"), std::invalid_argument);
  EXPECT_THROW(parse(R"({"levelPath": 3})"), std::invalid_argument);
}

TEST(GameConfigTest, OutOfRangeValuesThrow)
{
  EXPECT_THROW(parse(R"({"ballRadius": 0})"), std::invalid_argument);
  EXPECT_THROW(parse(R"({"ballRestitution": 1.5})"), std::invalid_argument);
  EXPECT_THROW(parse(R"({"pitchLimit": 1.6})"), std::invalid_argument);
  EXPECT_THROW(parse(R"({"colliderBodyKind": "Dynamic"})"),
               std::invalid_argument);
  EXPECT_THROW(parse(R"({"windowHeight": -1})"), std::invalid_argument);
}

TEST(GameConfigTest, DescribeListsEveryKey)
{
  GameConfig config;
  config.steeringMode = SteeringMode::Torque;
  auto const lines = describeConfig(config);

  EXPECT_EQ(lines.front(), R"(levelPath = "assets/levels/demo.gltf")");
  EXPECT_NE(std::ranges::find(lines, R"(steeringMode = "Torque")"),
            lines.end());
  EXPECT_NE(std::ranges::find(lines, "hotReload = true"), lines.end());
  EXPECT_NE(std::ranges::find(lines, R"(colliderBodyKind = "Kinematic")"),
            lines.end());
}

TEST(GameConfigTest, JsonDocumentParsesBack)
{
  GameConfig original;
  original.ballMass = 2.5;
  original.spawnPosition = Coordinate{1.0, 2.0, 3.0};
  original.colliderBodyKind = BodyKind::Static;

  nlohmann::json const document = toJson(original);
  EXPECT_EQ(document.size(), describeConfig(original).size());

  GameConfig const parsed = parse(document.dump());
  EXPECT_DOUBLE_EQ(parsed.ballMass, 2.5);
  EXPECT_TRUE(parsed.spawnPosition.isApprox(original.spawnPosition));
  EXPECT_EQ(parsed.colliderBodyKind, BodyKind::Static);
  EXPECT_EQ(parsed.levelPath, original.levelPath);
}

TEST(GameConfigTest, LoadConfigFromFile)
{
  auto const path =
    std::filesystem::temp_directory_path() / "rbg_game_config_test.json";
  {
    std::ofstream file{path};
    file << R"({"gravity": 3.5})";
  }

  GameConfig const config = loadConfig(path);
  EXPECT_DOUBLE_EQ(config.gravity, 3.5);

  std::filesystem::remove(path);
  EXPECT_THROW(loadConfig(path), std::runtime_error);
}

TEST(GameConfigTest, ShippedConfigMatchesDefaults)
{
  auto const path =
    std::filesystem::path{RBG_SOURCE_DIR} / "config" / "game.json";
  GameConfig const shipped = loadConfig(path);
  GameConfig const defaults;

  EXPECT_EQ(describeConfig(shipped), describeConfig(defaults));
}

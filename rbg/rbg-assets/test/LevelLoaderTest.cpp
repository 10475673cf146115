#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "rbg-assets/src/LevelLoader.hpp"
#include "rbg-utils/src/Logging.hpp"

using rbg_assets::LevelLoader;
using rbg_sim::LevelData;
using rbg_sim::LoadEvent;

namespace
{

// One node carrying a single-triangle mesh placeholder and one bare marker.
// The buffer holds three float32 positions followed by three uint16 indices.
constexpr const char* kTriangleLevel = R"({
  "asset": {"version": "2.0"},
  "scene": 0,
  "scenes": [{"nodes": [0, 1]}],
  "nodes": [
    {"name": "Floor", "mesh": 0, "translation": [0.0, -0.5, 0.0]},
    {"name": "bottom", "translation": [0.0, -10.0, 0.0]}
  ],
  "meshes": [
    {"name": "collider_floor",
     "primitives": [{"attributes": {"POSITION": 0}, "indices": 1}]}
  ],
  "buffers": [
    {"byteLength": 44,
     "uri": "data:application/octet-stream;base64,AAAAAAAAAAAAAAAAAACAPwAAAAAAAAAAAAAAAAAAAAAAAIA/AAABAAIAAAA="}
  ],
  "bufferViews": [
    {"buffer": 0, "byteOffset": 0, "byteLength": 36},
    {"buffer": 0, "byteOffset": 36, "byteLength": 6}
  ],
  "accessors": [
    {"bufferView": 0, "componentType": 5126, "count": 3, "type": "VEC3",
     "min": [0.0, 0.0, 0.0], "max": [1.0, 0.0, 1.0]},
    {"bufferView": 1, "componentType": 5123, "count": 3, "type": "SCALAR"}
  ]
})";

std::optional<size_t> findNode(const LevelData& level, const std::string& name)
{
  auto it = std::ranges::find_if(
    level.nodes, [&name](const auto& node) { return node.name == name; });
  if (it == level.nodes.end())
  {
    return std::nullopt;
  }
  return static_cast<size_t>(std::distance(level.nodes.begin(), it));
}

// Poll until at least one event arrives or the deadline passes
std::vector<LoadEvent> pollUntilEvents(LevelLoader& loader)
{
  auto const deadline =
    std::chrono::steady_clock::now() + std::chrono::seconds{10};
  while (std::chrono::steady_clock::now() < deadline)
  {
    auto events = loader.poll();
    if (!events.empty())
    {
      return events;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds{5});
  }
  return {};
}

}  // anonymous namespace

class LevelLoaderTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    directory_ = std::filesystem::temp_directory_path() /
                 ("rbg_level_loader_" +
                  std::string{::testing::UnitTest::GetInstance()
                                ->current_test_info()
                                ->name()});
    std::filesystem::create_directories(directory_);
    levelPath_ = directory_ / "level.gltf";
    writeLevel();
  }

  void TearDown() override
  {
    std::error_code error;
    std::filesystem::remove_all(directory_, error);
  }

  void writeLevel() const
  {
    std::ofstream file{levelPath_, std::ios::trunc};
    file << kTriangleLevel;
  }

  std::filesystem::path directory_;
  std::filesystem::path levelPath_;
};

// ============================================================================
// Decoding
// ============================================================================

TEST_F(LevelLoaderTest, DecodeKeepsNodeAndMeshNames)
{
  auto const level = LevelLoader::decode(levelPath_);

  EXPECT_EQ(level->sourceName, "level.gltf");

  auto const floor = findNode(*level, "Floor");
  auto const collider = findNode(*level, "collider_floor");
  auto const bottom = findNode(*level, "bottom");
  ASSERT_TRUE(floor.has_value());
  ASSERT_TRUE(collider.has_value());
  ASSERT_TRUE(bottom.has_value());

  // The mesh is named differently from its node, so it becomes a child
  const auto& colliderNode = level->nodes[*collider];
  ASSERT_TRUE(colliderNode.parentIndex.has_value());
  EXPECT_EQ(*colliderNode.parentIndex, *floor);
  ASSERT_NE(colliderNode.mesh, nullptr);
  EXPECT_EQ(colliderNode.mesh->vertices.size(), 3u);
  EXPECT_EQ(colliderNode.mesh->indices.size(), 3u);

  EXPECT_EQ(level->nodes[*floor].mesh, nullptr);
  EXPECT_NEAR(level->nodes[*bottom].local.translation.y(), -10.0, 1e-6);
  EXPECT_NEAR(level->nodes[*floor].local.translation.y(), -0.5, 1e-6);
}

TEST_F(LevelLoaderTest, DecodeParentsPrecedeChildren)
{
  auto const level = LevelLoader::decode(levelPath_);
  for (size_t i = 0; i < level->nodes.size(); ++i)
  {
    if (level->nodes[i].parentIndex)
    {
      EXPECT_LT(*level->nodes[i].parentIndex, i);
    }
  }
}

TEST_F(LevelLoaderTest, DecodeMissingFileThrows)
{
  EXPECT_THROW(LevelLoader::decode(directory_ / "missing.gltf"),
               std::runtime_error);
}

// ============================================================================
// Polling
// ============================================================================

TEST_F(LevelLoaderTest, PollPublishesLoadedLevel)
{
  LevelLoader loader{levelPath_, false, rbg_utils::makeNullLogger()};

  auto const events = pollUntilEvents(loader);
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events.front().kind, LoadEvent::Kind::LoadedWithDependencies);
  EXPECT_EQ(events.front().source, levelPath_.string());
  ASSERT_NE(events.front().level, nullptr);
  EXPECT_TRUE(findNode(*events.front().level, "bottom").has_value());

  EXPECT_FALSE(loader.isLoading());
  EXPECT_TRUE(loader.poll().empty());
}

TEST_F(LevelLoaderTest, MissingFilePublishesNothing)
{
  LevelLoader loader{
    directory_ / "missing.gltf", true, rbg_utils::makeNullLogger()};

  for (int i = 0; i < 20; ++i)
  {
    EXPECT_TRUE(loader.poll().empty());
    std::this_thread::sleep_for(std::chrono::milliseconds{5});
  }
}

TEST_F(LevelLoaderTest, HotReloadFollowsWriteTime)
{
  LevelLoader loader{levelPath_, true, rbg_utils::makeNullLogger()};
  ASSERT_EQ(pollUntilEvents(loader).size(), 1u);

  // Unchanged file, nothing to publish
  EXPECT_TRUE(loader.poll().empty());

  writeLevel();
  std::filesystem::last_write_time(
    levelPath_,
    std::filesystem::last_write_time(levelPath_) + std::chrono::seconds{5});

  std::vector<LoadEvent> events = loader.poll();
  ASSERT_FALSE(events.empty());
  EXPECT_EQ(events.front().kind, LoadEvent::Kind::Reloading);
  EXPECT_EQ(events.front().level, nullptr);

  // The reload may finish within the same poll
  if (events.size() == 1)
  {
    events = pollUntilEvents(loader);
    ASSERT_EQ(events.size(), 1u);
  }
  else
  {
    events.erase(events.begin());
  }
  EXPECT_EQ(events.front().kind, LoadEvent::Kind::LoadedWithDependencies);
  ASSERT_NE(events.front().level, nullptr);
}

TEST_F(LevelLoaderTest, HotReloadDisabledIgnoresChanges)
{
  LevelLoader loader{levelPath_, false, rbg_utils::makeNullLogger()};
  ASSERT_EQ(pollUntilEvents(loader).size(), 1u);

  std::filesystem::last_write_time(
    levelPath_,
    std::filesystem::last_write_time(levelPath_) + std::chrono::seconds{5});

  EXPECT_TRUE(loader.poll().empty());
}

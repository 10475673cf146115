#ifndef RBG_SIM_TEST_HELPERS_LEVEL_BUILDERS_HPP
#define RBG_SIM_TEST_HELPERS_LEVEL_BUILDERS_HPP

#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "rbg-sim/src/DataTypes/Coordinate.hpp"
#include "rbg-sim/src/Scene/LevelData.hpp"
#include "rbg-sim/src/Scene/LevelSource.hpp"

namespace rbg_sim::test
{

/**
 * @brief Axis-aligned box mesh centered on the origin, 8 vertices, 12 triangles
 */
std::shared_ptr<const MeshData> makeBoxMesh(const std::string& name,
                                            const Coordinate& halfExtents);

/**
 * @brief Incrementally builds LevelData in the layout the asset loader emits
 */
class LevelBuilder
{
public:
  explicit LevelBuilder(std::string sourceName = "test_level");

  /**
   * @brief Add a node
   * @return Index of the node, usable as a parent index
   */
  size_t addNode(const std::string& name,
                 const Coordinate& translation,
                 std::optional<size_t> parent = std::nullopt);

  /**
   * @brief Add a box-mesh placeholder child (e.g. "collider_floor")
   */
  size_t addBoxPlaceholder(const std::string& name,
                           size_t owner,
                           const Coordinate& halfExtents);

  [[nodiscard]] std::shared_ptr<const LevelData> build() const;

private:
  LevelData level_;
};

/**
 * @brief Standard level: a floor slab at y = 0, a goal box at x = 5,
 * and a `bottom` marker at y = -10
 */
std::shared_ptr<const LevelData> makeStandardLevel();

/**
 * @brief LevelSource replaying queued batches, one per poll()
 */
class ScriptedLevelSource final : public LevelSource
{
public:
  void push(std::vector<LoadEvent> batch);

  void pushLoaded(std::shared_ptr<const LevelData> level);

  void pushReloading(const std::string& source = "test_level");

  std::vector<LoadEvent> poll() override;

  [[nodiscard]] size_t getPollCount() const
  {
    return pollCount_;
  }

private:
  std::deque<std::vector<LoadEvent>> batches_;
  size_t pollCount_{0};
};

}  // namespace rbg_sim::test

#endif  // RBG_SIM_TEST_HELPERS_LEVEL_BUILDERS_HPP

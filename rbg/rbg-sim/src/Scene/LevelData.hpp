#ifndef RBG_SIM_SCENE_LEVEL_DATA_HPP
#define RBG_SIM_SCENE_LEVEL_DATA_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "rbg-sim/src/DataTypes/Coordinate.hpp"
#include "rbg-sim/src/Scene/Transform.hpp"

namespace rbg_sim
{

/**
 * @brief Triangle mesh in the local space of the node that owns it
 */
struct MeshData
{
  std::string name;
  std::vector<Coordinate> vertices;
  std::vector<uint32_t> indices;  // Triangle list, three per face

  [[nodiscard]] size_t getTriangleCount() const
  {
    return indices.size() / 3;
  }
};

/**
 * @brief One node of a decoded level, before instantiation
 *
 * parentIndex refers to an earlier entry of LevelData::nodes, or is empty for
 * top-level nodes.
 */
struct LevelNodeData
{
  std::string name;
  std::optional<size_t> parentIndex;
  Transform local;
  std::shared_ptr<const MeshData> mesh;
};

/**
 * @brief A fully decoded level asset, ready to be instantiated into a scene
 */
struct LevelData
{
  std::string sourceName;
  std::vector<LevelNodeData> nodes;
};

}  // namespace rbg_sim

#endif  // RBG_SIM_SCENE_LEVEL_DATA_HPP

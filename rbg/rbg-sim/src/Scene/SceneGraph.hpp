#ifndef RBG_SIM_SCENE_GRAPH_HPP
#define RBG_SIM_SCENE_GRAPH_HPP

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <Eigen/Geometry>

#include "rbg-sim/src/DataTypes/Coordinate.hpp"
#include "rbg-sim/src/Scene/LevelData.hpp"
#include "rbg-sim/src/Scene/Transform.hpp"

namespace rbg_sim
{

using NodeId = uint32_t;

/**
 * @brief A named node of the scene hierarchy
 */
struct SceneNode
{
  NodeId id{0};
  std::string name;
  std::optional<NodeId> parent;
  std::vector<NodeId> children;
  Transform local;
  std::shared_ptr<const MeshData> mesh;  // May be null
};

/**
 * @brief Hierarchical scene: names, parent links, meshes and transforms
 *
 * Node ids are assigned in increasing order starting at 1 and are never
 * reused, so iterating getNodes() visits nodes in creation order.
 *
 * A decoded level is instantiated under a single level root node; a later
 * instantiate() or clearLevel() removes that whole subtree. Nodes created
 * outside instantiate() (the ball, for example) survive level reloads.
 *
 * Thread safety: Not thread-safe
 */
class SceneGraph
{
public:
  SceneGraph() = default;

  /**
   * @brief Create a node
   * @param name Node name (not required to be unique)
   * @param parent Parent node, or std::nullopt for a top-level node
   * @param local Transform relative to the parent
   * @param mesh Optional mesh in node-local space
   * @return Id of the new node
   * @throws std::out_of_range if parent does not exist
   */
  NodeId createNode(std::string name,
                    std::optional<NodeId> parent = std::nullopt,
                    const Transform& local = Transform{},
                    std::shared_ptr<const MeshData> mesh = nullptr);

  /**
   * @brief Remove a node together with its whole subtree
   * @return Ids of every removed node (empty if id did not exist)
   */
  std::vector<NodeId> removeNode(NodeId id);

  /**
   * @brief Instantiate a decoded level, replacing any previous level
   * @param level Decoded level; node parents must precede their children
   * @return Id of the new level root node
   * @throws std::invalid_argument if a parent index is out of order
   */
  NodeId instantiate(const LevelData& level);

  /**
   * @brief Remove the current level subtree, if any
   * @return Ids of every removed node
   */
  std::vector<NodeId> clearLevel();

  [[nodiscard]] std::optional<NodeId> getLevelRoot() const
  {
    return levelRoot_;
  }

  [[nodiscard]] bool contains(NodeId id) const;

  /**
   * @throws std::out_of_range if the node does not exist
   */
  [[nodiscard]] const SceneNode& getNode(NodeId id) const;
  SceneNode& getNode(NodeId id);

  [[nodiscard]] std::optional<std::reference_wrapper<const SceneNode>>
  findNode(NodeId id) const;

  /**
   * @brief First node (in creation order) whose name equals name exactly
   */
  [[nodiscard]] std::optional<NodeId> findFirstByName(
    std::string_view name) const;

  [[nodiscard]] const std::map<NodeId, SceneNode>& getNodes() const
  {
    return nodes_;
  }

  [[nodiscard]] size_t size() const
  {
    return nodes_.size();
  }

  /**
   * @brief Compose local transforms from the root down to the node
   * @throws std::out_of_range if the node does not exist
   */
  [[nodiscard]] Eigen::Affine3d getWorldTransform(NodeId id) const;

  [[nodiscard]] Coordinate getWorldPosition(NodeId id) const;

  /**
   * @brief World rotation with scale removed
   */
  [[nodiscard]] Eigen::Quaterniond getWorldRotation(NodeId id) const;

  void setLocalTransform(NodeId id, const Transform& local);

  /**
   * @brief Set the node's world position and rotation, keeping its local scale
   */
  void setWorldPose(NodeId id,
                    const Coordinate& position,
                    const Eigen::Quaterniond& rotation);

private:
  std::map<NodeId, SceneNode> nodes_;
  std::optional<NodeId> levelRoot_;
  NodeId nextId_{1};
};

}  // namespace rbg_sim

#endif  // RBG_SIM_SCENE_GRAPH_HPP

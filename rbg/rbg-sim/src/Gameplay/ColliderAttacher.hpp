// Ticket: 0004_collider_attacher

#ifndef RBG_SIM_GAMEPLAY_COLLIDER_ATTACHER_HPP
#define RBG_SIM_GAMEPLAY_COLLIDER_ATTACHER_HPP

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

#include "rbg-sim/src/Gameplay/WorldRegistry.hpp"
#include "rbg-sim/src/Physics/PhysicsEngine.hpp"
#include "rbg-sim/src/Scene/SceneGraph.hpp"

namespace rbg_sim
{

/**
 * @brief A level asset breaks the placeholder naming rules
 *
 * Fatal: the level cannot be played as authored.
 */
class LevelAuthoringError : public std::runtime_error
{
public:
  LevelAuthoringError(const std::string& nodeName, const std::string& problem)
    : std::runtime_error{"Level authoring error at node '" + nodeName +
                         "': " + problem},
      nodeName_{nodeName}
  {
  }

  [[nodiscard]] const std::string& getNodeName() const
  {
    return nodeName_;
  }

private:
  std::string nodeName_;
};

/**
 * @brief Number of bodies created by one attachment pass
 */
struct AttachmentSummary
{
  size_t solids{0};
  size_t sensors{0};
  bool thresholdFound{false};
};

/**
 * @brief Converts named placeholder meshes into physics bodies
 *
 * Naming convention:
 * - `collider_*`: the parent receives a solid triangle-mesh body built from
 *   this node's mesh and the meshes of its descendants
 * - `goal_*`: the parent receives a kinematic convex sensor body and the
 *   Goal tag
 * - `bottom`: its world Y is the fall threshold
 *
 * Shapes are expressed in the parent's frame with the parent's world scale
 * baked in, so the body pose is the parent's world translation and rotation.
 *
 * Thread safety: Not thread-safe
 */
class ColliderAttacher
{
public:
  static constexpr std::string_view kColliderPrefix{"collider_"};
  static constexpr std::string_view kGoalPrefix{"goal_"};
  static constexpr std::string_view kThresholdName{"bottom"};

  /**
   * @param material Surface of every level body
   * @param bodyKind Static or Kinematic, for solid bodies only
   * @throws std::invalid_argument if bodyKind is Dynamic
   */
  ColliderAttacher(MaterialProperties material,
                   BodyKind bodyKind,
                   std::shared_ptr<spdlog::logger> logger);

  /**
   * @brief Run the conversion pass over every node of the scene
   *
   * Parents that already own a body are skipped, so the pass never creates
   * duplicate bodies.
   *
   * @throws LevelAuthoringError for a placeholder with no parent, no mesh or
   *         degenerate geometry
   */
  AttachmentSummary attach(const SceneGraph& scene,
                           PhysicsEngine& physics,
                           WorldRegistry& registry) const;

private:
  // Placeholder subtree in the owner's frame
  struct Geometry
  {
    std::vector<Coordinate> points;
    std::vector<uint32_t> indices;
  };

  [[nodiscard]] Geometry collectGeometry(const SceneGraph& scene,
                                         const SceneNode& placeholder) const;

  [[nodiscard]] std::shared_ptr<const ConvexHull> buildHull(
    const SceneGraph& scene,
    const SceneNode& placeholder) const;

  [[nodiscard]] std::shared_ptr<const TriangleMesh> buildMesh(
    const SceneGraph& scene,
    const SceneNode& placeholder) const;

  MaterialProperties material_;
  BodyKind bodyKind_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace rbg_sim

#endif  // RBG_SIM_GAMEPLAY_COLLIDER_ATTACHER_HPP

// Ticket: 0004_collider_attacher

#include "rbg-sim/src/Gameplay/ColliderAttacher.hpp"

#include <cstdint>
#include <utility>
#include <vector>

namespace rbg_sim
{

ColliderAttacher::ColliderAttacher(MaterialProperties material,
                                   BodyKind bodyKind,
                                   std::shared_ptr<spdlog::logger> logger)
  : material_{material}, bodyKind_{bodyKind}, logger_{std::move(logger)}
{
  if (bodyKind_ == BodyKind::Dynamic)
  {
    throw std::invalid_argument("Level colliders cannot be dynamic");
  }
}

AttachmentSummary ColliderAttacher::attach(const SceneGraph& scene,
                                           PhysicsEngine& physics,
                                           WorldRegistry& registry) const
{
  AttachmentSummary summary;

  for (const auto& [id, node] : scene.getNodes())
  {
    if (node.name == kThresholdName)
    {
      registry.setThresholdNode(id);
      summary.thresholdFound = true;
      continue;
    }

    bool const isCollider = node.name.starts_with(kColliderPrefix);
    bool const isGoal = node.name.starts_with(kGoalPrefix);
    if (!isCollider && !isGoal)
    {
      continue;
    }

    if (!node.parent)
    {
      throw LevelAuthoringError{node.name, "placeholder has no parent"};
    }

    NodeId const owner = *node.parent;
    if (physics.hasBody(owner))
    {
      logger_->warn("Node '{}' already has a body, ignoring placeholder '{}'",
                    scene.getNode(owner).name,
                    node.name);
      continue;
    }

    BodyDescriptor descriptor;
    descriptor.material = material_;
    descriptor.sensor = isGoal;
    if (isGoal)
    {
      // Spun goal nodes must drag their sensor along; only kinematic bodies
      // follow their node
      descriptor.kind = BodyKind::Kinematic;
      descriptor.shape = buildHull(scene, node);
    }
    else
    {
      descriptor.kind = bodyKind_;
      descriptor.shape = buildMesh(scene, node);
    }

    physics.attachBody(owner,
                       descriptor,
                       scene.getWorldPosition(owner),
                       scene.getWorldRotation(owner));

    if (isGoal)
    {
      registry.tagGoal(owner);
      ++summary.sensors;
    }
    else
    {
      ++summary.solids;
    }
  }

  logger_->info("Inserted {} physics ({} solid, {} goal sensor)",
                summary.solids + summary.sensors,
                summary.solids,
                summary.sensors);

  return summary;
}

ColliderAttacher::Geometry ColliderAttacher::collectGeometry(
  const SceneGraph& scene,
  const SceneNode& placeholder) const
{
  // World -> owner body frame (rotation only, so the owner's world scale
  // stays baked into the shape)
  Eigen::Affine3d const ownerWorld = scene.getWorldTransform(*placeholder.parent);
  Eigen::Quaterniond const ownerRotation =
    scene.getWorldRotation(*placeholder.parent);
  Eigen::Vector3d const ownerTranslation = ownerWorld.translation();

  // Geometry of the placeholder and every node below it
  Geometry geometry;
  std::vector<NodeId> pending{placeholder.id};
  while (!pending.empty())
  {
    const SceneNode& node = scene.getNode(pending.back());
    pending.pop_back();
    pending.insert(pending.end(), node.children.begin(), node.children.end());

    if (!node.mesh)
    {
      continue;
    }

    auto const base = static_cast<uint32_t>(geometry.points.size());
    Eigen::Affine3d const nodeWorld = scene.getWorldTransform(node.id);
    for (const auto& vertex : node.mesh->vertices)
    {
      Eigen::Vector3d const world = nodeWorld * vertex;
      geometry.points.emplace_back(ownerRotation.conjugate() *
                                   (world - ownerTranslation));
    }
    for (uint32_t index : node.mesh->indices)
    {
      geometry.indices.push_back(base + index);
    }
  }

  if (geometry.points.empty())
  {
    throw LevelAuthoringError{placeholder.name, "placeholder has no mesh"};
  }

  return geometry;
}

std::shared_ptr<const ConvexHull> ColliderAttacher::buildHull(
  const SceneGraph& scene,
  const SceneNode& placeholder) const
{
  Geometry const geometry = collectGeometry(scene, placeholder);

  try
  {
    return std::make_shared<const ConvexHull>(geometry.points);
  }
  catch (const std::runtime_error& e)
  {
    throw LevelAuthoringError{placeholder.name,
                              std::string{"degenerate geometry: "} + e.what()};
  }
}

std::shared_ptr<const TriangleMesh> ColliderAttacher::buildMesh(
  const SceneGraph& scene,
  const SceneNode& placeholder) const
{
  Geometry geometry = collectGeometry(scene, placeholder);

  try
  {
    return std::make_shared<const TriangleMesh>(std::move(geometry.points),
                                                geometry.indices);
  }
  catch (const std::invalid_argument& e)
  {
    throw LevelAuthoringError{placeholder.name,
                              std::string{"degenerate geometry: "} + e.what()};
  }
}

}  // namespace rbg_sim

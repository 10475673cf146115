#include "rbg-sim/src/Scene/SceneGraph.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace rbg_sim
{

NodeId SceneGraph::createNode(std::string name,
                              std::optional<NodeId> parent,
                              const Transform& local,
                              std::shared_ptr<const MeshData> mesh)
{
  if (parent && !contains(*parent))
  {
    throw std::out_of_range("Parent node " + std::to_string(*parent) +
                            " does not exist");
  }

  NodeId const id = nextId_++;

  SceneNode node;
  node.id = id;
  node.name = std::move(name);
  node.parent = parent;
  node.local = local;
  node.mesh = std::move(mesh);
  nodes_.emplace(id, std::move(node));

  if (parent)
  {
    nodes_.at(*parent).children.push_back(id);
  }

  return id;
}

std::vector<NodeId> SceneGraph::removeNode(NodeId id)
{
  std::vector<NodeId> removed;
  if (!contains(id))
  {
    return removed;
  }

  // Detach from the parent first so the subtree walk sees a consistent tree
  if (auto parent = nodes_.at(id).parent; parent && contains(*parent))
  {
    auto& siblings = nodes_.at(*parent).children;
    siblings.erase(std::remove(siblings.begin(), siblings.end(), id),
                   siblings.end());
  }

  std::vector<NodeId> pending{id};
  while (!pending.empty())
  {
    NodeId const current = pending.back();
    pending.pop_back();

    auto it = nodes_.find(current);
    if (it == nodes_.end())
    {
      continue;
    }
    pending.insert(
      pending.end(), it->second.children.begin(), it->second.children.end());
    removed.push_back(current);
    nodes_.erase(it);
  }

  if (levelRoot_ && !contains(*levelRoot_))
  {
    levelRoot_.reset();
  }

  return removed;
}

NodeId SceneGraph::instantiate(const LevelData& level)
{
  clearLevel();

  NodeId const root = createNode(level.sourceName);

  std::vector<NodeId> created;
  created.reserve(level.nodes.size());

  for (size_t i = 0; i < level.nodes.size(); ++i)
  {
    const auto& data = level.nodes[i];

    NodeId parent = root;
    if (data.parentIndex)
    {
      if (*data.parentIndex >= i)
      {
        removeNode(root);
        throw std::invalid_argument("Level node '" + data.name +
                                    "' precedes its parent");
      }
      parent = created[*data.parentIndex];
    }

    created.push_back(createNode(data.name, parent, data.local, data.mesh));
  }

  levelRoot_ = root;
  return root;
}

std::vector<NodeId> SceneGraph::clearLevel()
{
  if (!levelRoot_)
  {
    return {};
  }
  NodeId const root = *levelRoot_;
  levelRoot_.reset();
  return removeNode(root);
}

bool SceneGraph::contains(NodeId id) const
{
  return nodes_.contains(id);
}

const SceneNode& SceneGraph::getNode(NodeId id) const
{
  auto it = nodes_.find(id);
  if (it == nodes_.end())
  {
    throw std::out_of_range("Scene node " + std::to_string(id) +
                            " does not exist");
  }
  return it->second;
}

SceneNode& SceneGraph::getNode(NodeId id)
{
  auto it = nodes_.find(id);
  if (it == nodes_.end())
  {
    throw std::out_of_range("Scene node " + std::to_string(id) +
                            " does not exist");
  }
  return it->second;
}

std::optional<std::reference_wrapper<const SceneNode>> SceneGraph::findNode(
  NodeId id) const
{
  auto it = nodes_.find(id);
  if (it == nodes_.end())
  {
    return std::nullopt;
  }
  return std::cref(it->second);
}

std::optional<NodeId> SceneGraph::findFirstByName(std::string_view name) const
{
  for (const auto& [id, node] : nodes_)
  {
    if (node.name == name)
    {
      return id;
    }
  }
  return std::nullopt;
}

Eigen::Affine3d SceneGraph::getWorldTransform(NodeId id) const
{
  const SceneNode* node = &getNode(id);
  Eigen::Affine3d world = node->local.toAffine();

  while (node->parent)
  {
    node = &getNode(*node->parent);
    world = node->local.toAffine() * world;
  }

  return world;
}

Coordinate SceneGraph::getWorldPosition(NodeId id) const
{
  return Coordinate{getWorldTransform(id).translation()};
}

Eigen::Quaterniond SceneGraph::getWorldRotation(NodeId id) const
{
  return Eigen::Quaterniond{getWorldTransform(id).rotation()}.normalized();
}

void SceneGraph::setLocalTransform(NodeId id, const Transform& local)
{
  getNode(id).local = local;
}

void SceneGraph::setWorldPose(NodeId id,
                              const Coordinate& position,
                              const Eigen::Quaterniond& rotation)
{
  auto& node = getNode(id);

  if (!node.parent)
  {
    node.local.translation = position;
    node.local.rotation = rotation;
    return;
  }

  Eigen::Affine3d desired = Eigen::Affine3d::Identity();
  desired.translate(position);
  desired.rotate(rotation);

  Eigen::Affine3d const local =
    getWorldTransform(*node.parent).inverse() * desired;

  node.local.translation = Coordinate{local.translation()};
  node.local.rotation = Eigen::Quaterniond{local.rotation()}.normalized();
}

}  // namespace rbg_sim

#include "rbg-assets/src/LevelLoader.hpp"

#include <chrono>
#include <stdexcept>
#include <string>
#include <system_error>

#include <assimp/Importer.hpp>
#include <assimp/postprocess.h>
#include <assimp/scene.h>

namespace rbg_assets
{

namespace
{

rbg_sim::Transform toTransform(const aiMatrix4x4& matrix)
{
  aiVector3D scaling;
  aiQuaternion rotation;
  aiVector3D position;
  matrix.Decompose(scaling, rotation, position);

  rbg_sim::Transform transform;
  transform.translation = rbg_sim::Coordinate{position.x, position.y, position.z};
  transform.rotation =
    Eigen::Quaterniond{rotation.w, rotation.x, rotation.y, rotation.z}
      .normalized();
  transform.scale = Eigen::Vector3d{scaling.x, scaling.y, scaling.z};
  return transform;
}

std::shared_ptr<const rbg_sim::MeshData> toMeshData(const aiMesh& mesh)
{
  auto data = std::make_shared<rbg_sim::MeshData>();
  data->name = mesh.mName.C_Str();

  data->vertices.reserve(mesh.mNumVertices);
  for (unsigned int i = 0; i < mesh.mNumVertices; ++i)
  {
    const aiVector3D& p = mesh.mVertices[i];
    data->vertices.emplace_back(p.x, p.y, p.z);
  }

  data->indices.reserve(static_cast<size_t>(mesh.mNumFaces) * 3);
  for (unsigned int f = 0; f < mesh.mNumFaces; ++f)
  {
    const aiFace& face = mesh.mFaces[f];
    // Points and lines carry no surface
    if (face.mNumIndices != 3)
    {
      continue;
    }
    for (unsigned int k = 0; k < 3; ++k)
    {
      data->indices.push_back(face.mIndices[k]);
    }
  }

  return data;
}

void appendNode(const aiNode& node,
                std::optional<size_t> parentIndex,
                const std::vector<std::shared_ptr<const rbg_sim::MeshData>>& meshes,
                rbg_sim::LevelData& level)
{
  size_t const index = level.nodes.size();

  rbg_sim::LevelNodeData entry;
  entry.name = node.mName.C_Str();
  entry.parentIndex = parentIndex;
  entry.local = toTransform(node.mTransformation);

  bool const ownsSingleMesh = node.mNumMeshes == 1 &&
                              meshes.at(node.mMeshes[0])->name == entry.name;
  if (ownsSingleMesh)
  {
    entry.mesh = meshes.at(node.mMeshes[0]);
  }
  level.nodes.push_back(std::move(entry));

  if (!ownsSingleMesh)
  {
    for (unsigned int m = 0; m < node.mNumMeshes; ++m)
    {
      const auto& mesh = meshes.at(node.mMeshes[m]);

      rbg_sim::LevelNodeData meshNode;
      meshNode.name = mesh->name;
      meshNode.parentIndex = index;
      meshNode.mesh = mesh;
      level.nodes.push_back(std::move(meshNode));
    }
  }

  for (unsigned int c = 0; c < node.mNumChildren; ++c)
  {
    appendNode(*node.mChildren[c], index, meshes, level);
  }
}

}  // namespace

LevelLoader::LevelLoader(std::filesystem::path path,
                         bool hotReload,
                         std::shared_ptr<spdlog::logger> logger)
  : path_{std::move(path)}, hotReload_{hotReload}, logger_{std::move(logger)}
{
}

std::vector<rbg_sim::LoadEvent> LevelLoader::poll()
{
  std::vector<rbg_sim::LoadEvent> events;

  if (!started_)
  {
    started_ = true;
    startLoad();
  }
  else if (hotReload_ && !isLoading())
  {
    auto const writeTime = currentWriteTime();
    if (writeTime && writeTime != loadedWriteTime_)
    {
      logger_->info("Level '{}' changed on disk, reloading", path_.string());
      events.push_back(rbg_sim::LoadEvent{
        rbg_sim::LoadEvent::Kind::Reloading, path_.string(), nullptr});
      startLoad();
    }
  }

  if (isLoading() &&
      pending_.wait_for(std::chrono::seconds{0}) == std::future_status::ready)
  {
    try
    {
      auto level = pending_.get();
      logger_->info("Level '{}' loaded: {} nodes",
                    path_.string(),
                    level->nodes.size());
      events.push_back(rbg_sim::LoadEvent{
        rbg_sim::LoadEvent::Kind::LoadedWithDependencies,
        path_.string(),
        std::move(level)});
    }
    catch (const std::runtime_error& e)
    {
      logger_->error("Failed to load level '{}': {}", path_.string(), e.what());
    }
  }

  return events;
}

std::shared_ptr<const rbg_sim::LevelData> LevelLoader::decode(
  const std::filesystem::path& path)
{
  Assimp::Importer importer;
  const aiScene* scene = importer.ReadFile(
    path.string(), aiProcess_Triangulate | aiProcess_JoinIdenticalVertices);

  if (scene == nullptr || (scene->mFlags & AI_SCENE_FLAGS_INCOMPLETE) != 0 ||
      scene->mRootNode == nullptr)
  {
    throw std::runtime_error(importer.GetErrorString());
  }

  std::vector<std::shared_ptr<const rbg_sim::MeshData>> meshes;
  meshes.reserve(scene->mNumMeshes);
  for (unsigned int i = 0; i < scene->mNumMeshes; ++i)
  {
    meshes.push_back(toMeshData(*scene->mMeshes[i]));
  }

  auto level = std::make_shared<rbg_sim::LevelData>();
  level->sourceName = path.filename().string();
  appendNode(*scene->mRootNode, std::nullopt, meshes, *level);

  return level;
}

void LevelLoader::startLoad()
{
  loadedWriteTime_ = currentWriteTime();
  logger_->debug("Decoding level '{}'", path_.string());
  pending_ = std::async(std::launch::async, &LevelLoader::decode, path_);
}

std::optional<std::filesystem::file_time_type> LevelLoader::currentWriteTime()
  const
{
  std::error_code error;
  auto const writeTime = std::filesystem::last_write_time(path_, error);
  if (error)
  {
    return std::nullopt;
  }
  return writeTime;
}

}  // namespace rbg_assets

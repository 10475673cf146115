#ifndef RBG_ASSETS_LEVEL_LOADER_HPP
#define RBG_ASSETS_LEVEL_LOADER_HPP

#include <filesystem>
#include <future>
#include <memory>
#include <optional>
#include <vector>

#include <spdlog/spdlog.h>

#include "rbg-sim/src/Scene/LevelData.hpp"
#include "rbg-sim/src/Scene/LevelSource.hpp"

namespace rbg_assets
{

/**
 * @brief Asynchronous level decoder backed by Assimp
 *
 * Any format Assimp reads (glTF, OBJ, FBX, ...) is accepted. Every Assimp
 * node becomes a level node carrying its name and local transform. Each mesh
 * referenced by a node becomes a child node named after the mesh, unless the
 * node has exactly one mesh with the node's own name, in which case the mesh
 * is attached to the node directly.
 *
 * The first poll() starts decoding on a std::async task; later polls check
 * the task without blocking and publish LoadedWithDependencies when it
 * finished. With hot reload enabled, a change of the file's modification time
 * publishes Reloading and starts a new decode. Decode failures are logged
 * and publish nothing.
 *
 * Thread safety: poll() must be called from a single thread
 */
class LevelLoader final : public rbg_sim::LevelSource
{
public:
  LevelLoader(std::filesystem::path path,
              bool hotReload,
              std::shared_ptr<spdlog::logger> logger);

  LevelLoader(const LevelLoader&) = delete;
  LevelLoader& operator=(const LevelLoader&) = delete;
  ~LevelLoader() override = default;

  std::vector<rbg_sim::LoadEvent> poll() override;

  [[nodiscard]] bool isLoading() const
  {
    return pending_.valid();
  }

  [[nodiscard]] const std::filesystem::path& getPath() const
  {
    return path_;
  }

  /**
   * @brief Decode a level file synchronously
   * @throws std::runtime_error if Assimp cannot read the file
   */
  static std::shared_ptr<const rbg_sim::LevelData> decode(
    const std::filesystem::path& path);

private:
  void startLoad();
  [[nodiscard]] std::optional<std::filesystem::file_time_type>
  currentWriteTime() const;

  std::filesystem::path path_;
  bool hotReload_;
  std::shared_ptr<spdlog::logger> logger_;

  bool started_{false};
  std::future<std::shared_ptr<const rbg_sim::LevelData>> pending_;
  std::optional<std::filesystem::file_time_type> loadedWriteTime_;
};

}  // namespace rbg_assets

#endif  // RBG_ASSETS_LEVEL_LOADER_HPP

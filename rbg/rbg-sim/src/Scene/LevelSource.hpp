#ifndef RBG_SIM_SCENE_LEVEL_SOURCE_HPP
#define RBG_SIM_SCENE_LEVEL_SOURCE_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "rbg-sim/src/Scene/LevelData.hpp"

namespace rbg_sim
{

/**
 * @brief Load-lifecycle event of the level asset
 *
 * - Reloading: the asset changed on disk and a new decode has started; any
 *   state derived from the previous load is stale.
 * - LoadedWithDependencies: the asset and everything it references finished
 *   decoding; `level` carries the result.
 */
struct LoadEvent
{
  enum class Kind : uint8_t
  {
    Reloading,
    LoadedWithDependencies
  };

  Kind kind{Kind::Reloading};
  std::string source;
  std::shared_ptr<const LevelData> level;
};

/**
 * @brief Producer of level load events
 *
 * poll() is called once per tick and returns the events produced since the
 * previous call. It must never block on an in-flight decode.
 */
class LevelSource
{
public:
  virtual ~LevelSource() = default;

  virtual std::vector<LoadEvent> poll() = 0;
};

}  // namespace rbg_sim

#endif  // RBG_SIM_SCENE_LEVEL_SOURCE_HPP

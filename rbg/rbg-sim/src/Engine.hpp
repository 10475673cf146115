// Ticket: 0001_engine

#ifndef RBG_SIM_ENGINE_HPP
#define RBG_SIM_ENGINE_HPP

#include <chrono>
#include <memory>
#include <vector>

#include <spdlog/spdlog.h>

#include "rbg-sim/src/Agent/InputCommands.hpp"
#include "rbg-sim/src/Camera/Camera.hpp"
#include "rbg-sim/src/Camera/CameraModeSwitch.hpp"
#include "rbg-sim/src/Camera/FreeFlyCamera.hpp"
#include "rbg-sim/src/Camera/OrbitCamera.hpp"
#include "rbg-sim/src/Config/GameConfig.hpp"
#include "rbg-sim/src/Gameplay/BallController.hpp"
#include "rbg-sim/src/Gameplay/BoundsMonitor.hpp"
#include "rbg-sim/src/Gameplay/ColliderAttacher.hpp"
#include "rbg-sim/src/Gameplay/CollisionClassifier.hpp"
#include "rbg-sim/src/Gameplay/ElapsedTimer.hpp"
#include "rbg-sim/src/Gameplay/GoalSpinner.hpp"
#include "rbg-sim/src/Gameplay/RestartController.hpp"
#include "rbg-sim/src/Gameplay/SceneLoadWatcher.hpp"
#include "rbg-sim/src/Gameplay/TransientUi.hpp"
#include "rbg-sim/src/Gameplay/WorldRegistry.hpp"
#include "rbg-sim/src/Physics/PhysicsWorld.hpp"
#include "rbg-sim/src/Scene/LevelSource.hpp"
#include "rbg-sim/src/Scene/SceneGraph.hpp"
#include "rbg-sim/src/Services/AudioSink.hpp"
#include "rbg-sim/src/Services/TextOverlay.hpp"

namespace rbg_sim
{

/**
 * @brief Top-level game orchestrator
 *
 * Owns the scene, the physics world, the registry and the camera, and runs
 * every gameplay system once per update() in a fixed order:
 *
 *  1. quit request
 *  2. camera mode switch
 *  3. level source poll; a decoded level replaces the previous one
 *  4. scene-load watcher (advance, then observe)
 *  5. collider attacher, when the watcher is ReadyToAttach
 *  6. bounds monitor load tracking and threshold resolution
 *  7. ball controller
 *  8. goal spinner
 *  9. physics step (kinematic bodies follow their nodes before, dynamic
 *     nodes follow their bodies after)
 * 10. collision classifier
 * 11. bounds monitor fall check
 * 12. restart controller
 * 13. active camera
 * 14. elapsed timer
 *
 * @note Not thread-safe. Single-threaded game loop assumed.
 */
class Engine
{
public:
  static constexpr const char* kBallNodeName = "Ball";

  /**
   * @param config Validated configuration
   * @param levelSource Producer of level load events
   * @param audio Audio output, must outlive the engine
   * @param overlay Text output, must outlive the engine
   * @throws std::invalid_argument if the configuration is invalid
   */
  Engine(GameConfig config,
         std::unique_ptr<LevelSource> levelSource,
         AudioSink& audio,
         TextOverlay& overlay,
         std::shared_ptr<spdlog::logger> logger);

  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;
  Engine(Engine&&) = delete;
  Engine& operator=(Engine&&) = delete;
  ~Engine() = default;

  /**
   * @brief Advance the game by one tick
   * @param input Commands of this tick
   * @param dt Tick duration
   * @throws LevelAuthoringError if the loaded level breaks naming rules
   */
  void update(const InputCommands& input, std::chrono::duration<double> dt);

  [[nodiscard]] bool isQuitRequested() const
  {
    return quitRequested_;
  }

  [[nodiscard]] const GameConfig& getConfig() const
  {
    return config_;
  }

  [[nodiscard]] const SceneGraph& getScene() const
  {
    return scene_;
  }

  [[nodiscard]] const PhysicsWorld& getPhysics() const
  {
    return physics_;
  }

  PhysicsWorld& getPhysics()
  {
    return physics_;
  }

  [[nodiscard]] const WorldRegistry& getRegistry() const
  {
    return registry_;
  }

  [[nodiscard]] const Camera& getCamera() const
  {
    return cameras_.front();
  }

  [[nodiscard]] NodeId getBallNode() const
  {
    return ballNode_;
  }

  [[nodiscard]] const SceneLoadWatcher& getLoadWatcher() const
  {
    return watcher_;
  }

  [[nodiscard]] const BoundsMonitor& getBoundsMonitor() const
  {
    return bounds_;
  }

  [[nodiscard]] const CollisionClassifier& getCollisionClassifier() const
  {
    return classifier_;
  }

  [[nodiscard]] const TransientUi& getTransientUi() const
  {
    return ui_;
  }

  [[nodiscard]] const ElapsedTimer& getElapsedTimer() const
  {
    return timer_;
  }

private:
  void spawnBall();
  void spawnCamera();
  void replaceLevel(const LevelData& level);
  void syncKinematicBodies();
  void syncDynamicNodes();
  void updateCamera(const InputCommands& input,
                    std::chrono::duration<double> dt);
  [[nodiscard]] std::optional<Eigen::Quaterniond> orbitOrientation() const;

  GameConfig config_;
  std::shared_ptr<spdlog::logger> logger_;
  std::unique_ptr<LevelSource> levelSource_;

  SceneGraph scene_;
  PhysicsWorld physics_;
  WorldRegistry registry_;
  std::vector<Camera> cameras_;
  NodeId ballNode_{0};

  TransientUi ui_;
  SceneLoadWatcher watcher_;
  ColliderAttacher attacher_;
  BoundsMonitor bounds_;
  CollisionClassifier classifier_;
  BallController ballController_;
  RestartController restart_;
  GoalSpinner spinner_;
  ElapsedTimer timer_;
  CameraModeSwitch modeSwitch_;
  OrbitCamera orbitCamera_;
  FreeFlyCamera flyCamera_;

  bool quitRequested_{false};
};

}  // namespace rbg_sim

#endif  // RBG_SIM_ENGINE_HPP

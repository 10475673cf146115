// Ticket: 0001_engine

#include "rbg-sim/src/Engine.hpp"

#include <format>
#include <stdexcept>

namespace rbg_sim
{

namespace
{

// Validates before any member is built from the configuration
GameConfig validated(GameConfig config)
{
  config.validate();
  return config;
}

}  // namespace

Engine::Engine(GameConfig config,
               std::unique_ptr<LevelSource> levelSource,
               AudioSink& audio,
               TextOverlay& overlay,
               std::shared_ptr<spdlog::logger> logger)
  : config_{validated(std::move(config))},
    logger_{std::move(logger)},
    levelSource_{std::move(levelSource)},
    physics_{Coordinate{0.0, -config_.gravity, 0.0}},
    ui_{overlay},
    watcher_{logger_},
    attacher_{MaterialProperties::create(config_.colliderRestitution,
                                         config_.colliderFriction),
              config_.colliderBodyKind,
              logger_},
    bounds_{audio, ui_, logger_},
    classifier_{audio, ui_, config_.rollingVolumeGain, logger_},
    ballController_{config_.steeringMode, config_.forceGain, config_.torqueGain},
    restart_{audio, ui_, classifier_, logger_},
    spinner_{config_.goalSpinRate},
    timer_{overlay},
    modeSwitch_{config_.cameraDistance, config_.cameraSensitivity, logger_},
    orbitCamera_{logger_, config_.pitchLimit},
    flyCamera_{config_.flySpeed, config_.flySensitivity, config_.pitchLimit}
{
  if (!levelSource_)
  {
    throw std::invalid_argument("Engine requires a level source");
  }

  spawnBall();
  spawnCamera();
}

void Engine::update(const InputCommands& input,
                    std::chrono::duration<double> dt)
{
  if (input.quit && !quitRequested_)
  {
    logger_->info("Quit requested");
    quitRequested_ = true;
  }

  modeSwitch_.update(input, cameras_, registry_);

  std::vector<LoadEvent> const loadEvents = levelSource_->poll();
  for (const auto& event : loadEvents)
  {
    if (event.kind != LoadEvent::Kind::LoadedWithDependencies)
    {
      logger_->info("Level '{}' is reloading", event.source);
      continue;
    }
    if (!event.level)
    {
      logger_->warn("Loaded event for '{}' carries no level", event.source);
      continue;
    }
    replaceLevel(*event.level);
  }

  watcher_.advance();
  watcher_.observe(loadEvents);

  if (watcher_.isReadyToAttach())
  {
    attacher_.attach(scene_, physics_, registry_);
    watcher_.markAttached();
  }

  bounds_.observe(loadEvents);
  bounds_.resolve(watcher_, registry_);

  ballController_.update(input, orbitOrientation(), registry_, physics_);

  spinner_.update(scene_, registry_, dt);

  syncKinematicBodies();
  physics_.step(dt);
  syncDynamicNodes();

  classifier_.update(physics_.getContactEvents(), registry_, physics_);

  bounds_.check(scene_, registry_);

  restart_.update(input, scene_, physics_, registry_);

  updateCamera(input, dt);

  timer_.update(dt);
}

void Engine::spawnBall()
{
  ballNode_ = scene_.createNode(kBallNodeName,
                                std::nullopt,
                                Transform::fromTranslation(config_.spawnPosition));

  BodyDescriptor descriptor;
  descriptor.kind = BodyKind::Dynamic;
  descriptor.shape = SphereShape{config_.ballRadius};
  descriptor.material = MaterialProperties::create(config_.ballRestitution,
                                                   config_.ballFriction);
  descriptor.mass = config_.ballMass;

  physics_.attachBody(ballNode_,
                      descriptor,
                      config_.spawnPosition,
                      Eigen::Quaterniond::Identity());

  Ball ball;
  ball.node = ballNode_;
  ball.radius = config_.ballRadius;
  ball.restartPosition = config_.spawnPosition;
  registry_.registerBall(std::move(ball));

  logger_->info("Ball spawned at {}",
                std::format("{:.2f}", config_.spawnPosition));
}

void Engine::spawnCamera()
{
  Camera camera;
  camera.position = config_.cameraStartPosition;
  camera.lookAt(config_.spawnPosition);
  camera.mode =
    OrbitMode{ballNode_, config_.cameraDistance, config_.cameraSensitivity};
  cameras_.push_back(camera);
}

void Engine::replaceLevel(const LevelData& level)
{
  std::vector<NodeId> const removed = scene_.clearLevel();
  for (NodeId const node : removed)
  {
    if (physics_.hasBody(node))
    {
      physics_.detachBody(node);
    }
  }
  registry_.forgetNodes(removed);
  if (!removed.empty())
  {
    classifier_.resetContacts(registry_);
  }

  scene_.instantiate(level);
  logger_->info("Level '{}' instantiated with {} nodes",
                level.sourceName,
                level.nodes.size());
}

void Engine::syncKinematicBodies()
{
  for (NodeId const node : physics_.getBodies())
  {
    if (physics_.getBodyKind(node) != BodyKind::Kinematic ||
        !scene_.contains(node))
    {
      continue;
    }
    physics_.setPose(
      node, scene_.getWorldPosition(node), scene_.getWorldRotation(node));
  }
}

void Engine::syncDynamicNodes()
{
  for (NodeId const node : physics_.getBodies())
  {
    if (physics_.getBodyKind(node) != BodyKind::Dynamic ||
        !scene_.contains(node))
    {
      continue;
    }
    auto const state = physics_.getBodyState(node);
    scene_.setWorldPose(node, state->position, state->orientation);
  }
}

void Engine::updateCamera(const InputCommands& input,
                          std::chrono::duration<double> dt)
{
  for (auto& camera : cameras_)
  {
    if (const auto* orbit = std::get_if<OrbitMode>(&camera.mode))
    {
      std::optional<Coordinate> target;
      if (scene_.contains(orbit->followTarget))
      {
        target = scene_.getWorldPosition(orbit->followTarget);
      }
      orbitCamera_.update(camera, *orbit, input, target);
    }
    else
    {
      flyCamera_.update(camera, input, dt);
    }
  }
}

std::optional<Eigen::Quaterniond> Engine::orbitOrientation() const
{
  for (const auto& camera : cameras_)
  {
    if (camera.isOrbit())
    {
      return camera.orientation;
    }
  }
  return std::nullopt;
}

}  // namespace rbg_sim

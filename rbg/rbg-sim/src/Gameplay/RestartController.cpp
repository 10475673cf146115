// Ticket: 0010_restart_controller

#include "rbg-sim/src/Gameplay/RestartController.hpp"

#include <format>

namespace rbg_sim
{

RestartController::RestartController(AudioSink& audio,
                                     TransientUi& ui,
                                     CollisionClassifier& classifier,
                                     std::shared_ptr<spdlog::logger> logger)
  : audio_{audio},
    ui_{ui},
    classifier_{classifier},
    logger_{std::move(logger)}
{
}

bool RestartController::update(const InputCommands& input,
                               SceneGraph& scene,
                               PhysicsEngine& physics,
                               WorldRegistry& registry)
{
  if (!input.restart)
  {
    return false;
  }
  return restart(scene, physics, registry);
}

bool RestartController::restart(SceneGraph& scene,
                                PhysicsEngine& physics,
                                WorldRegistry& registry)
{
  auto ballRef = registry.getBall();
  if (!ballRef)
  {
    logger_->debug("Restart requested without a ball");
    return false;
  }
  Ball& ball = ballRef->get();

  if (scene.contains(ball.node))
  {
    scene.setWorldPose(
      ball.node, ball.restartPosition, ball.restartOrientation);
  }

  if (physics.hasBody(ball.node))
  {
    physics.setPose(ball.node, ball.restartPosition, ball.restartOrientation);
    physics.resetVelocity(ball.node);
    physics.setExternalForce(
      ball.node, Coordinate{0.0, 0.0, 0.0}, Coordinate{0.0, 0.0, 0.0});
  }

  ball.isInBounds = true;
  audio_.playOneShot(SoundCue::Restart);
  ui_.clearFall();
  ui_.clearWin();
  classifier_.resetWin();

  logger_->info("Restarted at {}", std::format("{:.2f}", ball.restartPosition));
  return true;
}

}  // namespace rbg_sim

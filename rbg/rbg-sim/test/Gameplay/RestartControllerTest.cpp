// Ticket: 0010_restart_controller

#include <gtest/gtest.h>

#include <chrono>

#include "rbg-sim/src/Gameplay/RestartController.hpp"
#include "rbg-sim/src/Physics/PhysicsWorld.hpp"
#include "rbg-sim/test/Helpers/FakeServices.hpp"
#include "rbg-utils/src/Logging.hpp"

using namespace rbg_sim;

class RestartControllerTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    ballNode_ = scene_.createNode(
      "Ball", std::nullopt, Transform::fromTranslation(kSpawn));

    BodyDescriptor descriptor;
    descriptor.kind = BodyKind::Dynamic;
    physics_.attachBody(
      ballNode_, descriptor, kSpawn, Eigen::Quaterniond::Identity());

    Ball ball;
    ball.node = ballNode_;
    ball.restartPosition = kSpawn;
    registry_.registerBall(ball);
  }

  // Let the ball fall off and pick up speed
  void fall()
  {
    physics_.setExternalForce(
      ballNode_, Coordinate{1.0, 0.0, 0.0}, Coordinate{0.0, 1.0, 0.0});
    physics_.step(std::chrono::duration<double>{2.0});
    auto const state = physics_.getBodyState(ballNode_);
    scene_.setWorldPose(ballNode_, state->position, state->orientation);
    registry_.getBall()->get().isInBounds = false;
    ui_.showFall();
  }

  InputCommands restartInput() const
  {
    InputCommands input;
    input.restart = true;
    return input;
  }

  const Coordinate kSpawn{0.0, 1.0, 0.0};

  test::FakeAudioSink audio_;
  test::FakeTextOverlay overlay_;
  TransientUi ui_{overlay_};
  CollisionClassifier classifier_{audio_, ui_, 0.1, rbg_utils::makeNullLogger()};
  RestartController restart_{audio_, ui_, classifier_, rbg_utils::makeNullLogger()};
  SceneGraph scene_;
  PhysicsWorld physics_;
  WorldRegistry registry_;
  NodeId ballNode_{0};
};

TEST_F(RestartControllerTest, NoRestartWithoutKey)
{
  fall();
  EXPECT_FALSE(restart_.update(InputCommands{}, scene_, physics_, registry_));
  EXPECT_FALSE(registry_.getBall()->get().isInBounds);
  EXPECT_EQ(audio_.count(SoundCue::Restart), 0u);
}

TEST_F(RestartControllerTest, RestartResetsBallCompletely)
{
  fall();
  ASSERT_LT(scene_.getWorldPosition(ballNode_).y(), 0.0);

  EXPECT_TRUE(restart_.update(restartInput(), scene_, physics_, registry_));

  auto const state = physics_.getBodyState(ballNode_);
  EXPECT_TRUE(state->position.isApprox(kSpawn));
  EXPECT_TRUE(state->velocity.isZero());
  EXPECT_TRUE(state->angularVelocity.isZero());
  EXPECT_TRUE(state->appliedForce.isZero());
  EXPECT_TRUE(state->appliedTorque.isZero());
  EXPECT_TRUE(state->orientation.isApprox(Eigen::Quaterniond::Identity()));

  EXPECT_TRUE(scene_.getWorldPosition(ballNode_).isApprox(kSpawn));
  EXPECT_TRUE(registry_.getBall()->get().isInBounds);
  EXPECT_EQ(audio_.count(SoundCue::Restart), 1u);
  EXPECT_FALSE(ui_.hasFallBanner());
  EXPECT_TRUE(overlay_.banners.empty());
}

TEST_F(RestartControllerTest, RestartClearsWin)
{
  registry_.tagGoal(99);
  classifier_.update(
    {ContactEvent{ContactEvent::Type::Began, ballNode_, 99}}, registry_, physics_);
  ASSERT_TRUE(classifier_.hasWon());
  ASSERT_TRUE(ui_.hasWinBanner());

  restart_.update(restartInput(), scene_, physics_, registry_);

  EXPECT_FALSE(classifier_.hasWon());
  EXPECT_FALSE(ui_.hasWinBanner());
}

TEST_F(RestartControllerTest, RestartWhileInBoundsStillResets)
{
  physics_.step(std::chrono::duration<double>{0.5});

  EXPECT_TRUE(restart_.update(restartInput(), scene_, physics_, registry_));
  EXPECT_TRUE(physics_.getBodyState(ballNode_)->position.isApprox(kSpawn));
  EXPECT_EQ(audio_.count(SoundCue::Restart), 1u);
}

TEST(RestartControllerNoBallTest, RestartWithoutBallIsIgnored)
{
  test::FakeAudioSink audio;
  test::FakeTextOverlay overlay;
  TransientUi ui{overlay};
  CollisionClassifier classifier{audio, ui, 0.1, rbg_utils::makeNullLogger()};
  RestartController restart{audio, ui, classifier, rbg_utils::makeNullLogger()};

  SceneGraph scene;
  PhysicsWorld physics;
  WorldRegistry registry;
  InputCommands input;
  input.restart = true;

  EXPECT_FALSE(restart.update(input, scene, physics, registry));
  EXPECT_TRUE(audio.oneShots.empty());
}

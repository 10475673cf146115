// Ticket: 0014_goal_spinner

#include <gtest/gtest.h>

#include <chrono>
#include <cmath>
#include <numbers>

#include "rbg-sim/src/Gameplay/GoalSpinner.hpp"

using namespace rbg_sim;

TEST(GoalSpinnerTest, GoalRotatesAboutWorldUp)
{
  SceneGraph scene;
  NodeId const goal = scene.createNode("Goal");
  NodeId const other = scene.createNode("Other");
  WorldRegistry registry;
  registry.tagGoal(goal);

  GoalSpinner const spinner{1.0};
  spinner.update(scene, registry, std::chrono::duration<double>{0.5});

  Eigen::Quaterniond const expected{
    Eigen::AngleAxisd{0.5, Eigen::Vector3d::UnitY()}};
  EXPECT_TRUE(scene.getWorldRotation(goal).isApprox(expected, 1e-9));
  EXPECT_TRUE(scene.getWorldRotation(other).isApprox(
    Eigen::Quaterniond::Identity(), 1e-12));
}

TEST(GoalSpinnerTest, AxisStaysVerticalUnderTiltedParent)
{
  SceneGraph scene;
  Transform tilted;
  tilted.rotation =
    Eigen::AngleAxisd{std::numbers::pi / 4.0, Eigen::Vector3d::UnitX()};
  NodeId const parent = scene.createNode("Tilted", std::nullopt, tilted);
  NodeId const goal = scene.createNode("Goal", parent);

  WorldRegistry registry;
  registry.tagGoal(goal);

  Eigen::Quaterniond const before = scene.getWorldRotation(goal);
  GoalSpinner const spinner{2.0};
  spinner.update(scene, registry, std::chrono::duration<double>{0.25});

  Eigen::Quaterniond const delta =
    scene.getWorldRotation(goal) * before.conjugate();
  Eigen::AngleAxisd const axisAngle{delta};
  EXPECT_NEAR(axisAngle.angle(), 0.5, 1e-9);
  EXPECT_NEAR(std::abs(axisAngle.axis().y()), 1.0, 1e-9);
}

TEST(GoalSpinnerTest, RemovedGoalIsSkipped)
{
  SceneGraph scene;
  WorldRegistry registry;
  registry.tagGoal(12345);

  GoalSpinner const spinner{1.0};
  EXPECT_NO_THROW(
    spinner.update(scene, registry, std::chrono::duration<double>{0.1}));
}

// Ticket: 0015_free_fly_camera

#include <gtest/gtest.h>

#include <chrono>
#include <numbers>

#include "rbg-sim/src/Camera/FreeFlyCamera.hpp"

using namespace rbg_sim;

namespace
{

constexpr std::chrono::duration<double> kHalfSecond{0.5};

}  // anonymous namespace

TEST(FreeFlyCameraTest, MovesAlongCameraAxes)
{
  FreeFlyCamera const fly{12.0, 0.00012, 1.54};
  Camera camera;

  InputCommands input;
  input.moveForward = true;
  fly.update(camera, input, kHalfSecond);

  EXPECT_TRUE(camera.position.isApprox(Eigen::Vector3d{0.0, 0.0, -6.0}));
}

TEST(FreeFlyCameraTest, DiagonalSpeedIsNormalized)
{
  FreeFlyCamera const fly{10.0, 0.00012, 1.54};
  Camera camera;

  InputCommands input;
  input.moveForward = true;
  input.moveRight = true;
  input.moveUp = true;
  fly.update(camera, input, std::chrono::duration<double>{1.0});

  EXPECT_NEAR(camera.position.norm(), 10.0, 1e-9);
  EXPECT_GT(camera.position.y(), 0.0);
}

TEST(FreeFlyCameraTest, VerticalMovementUsesWorldUp)
{
  FreeFlyCamera const fly{4.0, 0.00012, 1.54};
  Camera camera;
  camera.orientation = composeYawPitch(0.0, -1.0);

  InputCommands input;
  input.moveDown = true;
  fly.update(camera, input, kHalfSecond);

  EXPECT_TRUE(camera.position.isApprox(Eigen::Vector3d{0.0, -2.0, 0.0}));
}

TEST(FreeFlyCameraTest, MouseLookUsesDegreesPerPixel)
{
  FreeFlyCamera const fly{12.0, 0.00012, 1.54};
  Camera camera;

  InputCommands input;
  input.cursorCaptured = true;
  input.windowWidth = 1280;
  input.windowHeight = 720;
  input.mouseMotion.emplace_back(10.0, 0.0);
  fly.update(camera, input, kHalfSecond);

  double const expectedYaw = -10.0 * 0.00012 * 720.0 * std::numbers::pi / 180.0;
  EXPECT_NEAR(decomposeYawPitch(camera.orientation).yaw, expectedYaw, 1e-9);
}

TEST(FreeFlyCameraTest, NoInputNoChange)
{
  FreeFlyCamera const fly{12.0, 0.00012, 1.54};
  Camera camera;
  camera.position = Coordinate{1.0, 2.0, 3.0};

  fly.update(camera, InputCommands{}, kHalfSecond);
  EXPECT_TRUE(camera.position.isApprox(Eigen::Vector3d{1.0, 2.0, 3.0}));
}

// Ticket: 0008_camera_mode_switch

#include <gtest/gtest.h>

#include <vector>

#include "rbg-sim/src/Camera/CameraModeSwitch.hpp"
#include "rbg-utils/src/Logging.hpp"

using namespace rbg_sim;

class CameraModeSwitchTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    cameras_.resize(1);
  }

  void registerBall(NodeId node)
  {
    Ball ball;
    ball.node = node;
    registry_.registerBall(ball);
  }

  CameraModeSwitch switch_{4.0, 0.000002, rbg_utils::makeNullLogger()};
  std::vector<Camera> cameras_;
  WorldRegistry registry_;
};

TEST_F(CameraModeSwitchTest, OrbitKeyFollowsBall)
{
  registerBall(8);
  InputCommands input;
  input.activateOrbitCamera = true;

  switch_.update(input, cameras_, registry_);

  ASSERT_TRUE(cameras_[0].isOrbit());
  const auto& mode = std::get<OrbitMode>(cameras_[0].mode);
  EXPECT_EQ(mode.followTarget, 8u);
  EXPECT_DOUBLE_EQ(mode.distance, 4.0);
  EXPECT_DOUBLE_EQ(mode.sensitivity, 0.000002);
}

TEST_F(CameraModeSwitchTest, OrbitKeyWithoutBallKeepsFreeFly)
{
  InputCommands input;
  input.activateOrbitCamera = true;

  switch_.update(input, cameras_, registry_);
  EXPECT_FALSE(cameras_[0].isOrbit());
}

TEST_F(CameraModeSwitchTest, RoundTripOrbitFlyOrbit)
{
  registerBall(8);
  InputCommands orbit;
  orbit.activateOrbitCamera = true;
  InputCommands fly;
  fly.activateFlyCamera = true;

  switch_.update(orbit, cameras_, registry_);
  ASSERT_TRUE(cameras_[0].isOrbit());

  switch_.update(fly, cameras_, registry_);
  EXPECT_TRUE(std::holds_alternative<FreeFlyMode>(cameras_[0].mode));

  switch_.update(orbit, cameras_, registry_);
  EXPECT_TRUE(cameras_[0].isOrbit());
}

TEST_F(CameraModeSwitchTest, ModeSwitchKeepsPose)
{
  registerBall(8);
  cameras_[0].position = Coordinate{3.0, 4.0, 5.0};
  cameras_[0].orientation = composeYawPitch(0.2, 0.1);
  Eigen::Quaterniond const orientation = cameras_[0].orientation;

  InputCommands orbit;
  orbit.activateOrbitCamera = true;
  switch_.update(orbit, cameras_, registry_);

  EXPECT_TRUE(cameras_[0].position.isApprox(Eigen::Vector3d{3.0, 4.0, 5.0}));
  EXPECT_TRUE(cameras_[0].orientation.isApprox(orientation));
}

TEST_F(CameraModeSwitchTest, NoKeysNoChange)
{
  registerBall(8);
  switch_.update(InputCommands{}, cameras_, registry_);
  EXPECT_FALSE(cameras_[0].isOrbit());
}

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <cstdint>
#include <stdexcept>
#include <utility>
#include <vector>

#include "rbg-sim/src/Physics/PhysicsWorld.hpp"

using namespace rbg_sim;
using namespace std::chrono_literals;

namespace
{

std::shared_ptr<const ConvexHull> makeSlab(double halfX,
                                           double halfY,
                                           double halfZ)
{
  return std::make_shared<const ConvexHull>(
    std::vector<Coordinate>{Coordinate{-halfX, -halfY, -halfZ},
                            Coordinate{halfX, -halfY, -halfZ},
                            Coordinate{halfX, halfY, -halfZ},
                            Coordinate{-halfX, halfY, -halfZ},
                            Coordinate{-halfX, -halfY, halfZ},
                            Coordinate{halfX, -halfY, halfZ},
                            Coordinate{halfX, halfY, halfZ},
                            Coordinate{-halfX, halfY, halfZ}});
}

// Two slabs side by side, x in [-6, -1] and [1, 6], top face at y = 0.
// The Z ends are left open.
std::shared_ptr<const TriangleMesh> makeGappedFloor()
{
  std::vector<Coordinate> vertices;
  std::vector<uint32_t> indices;
  for (auto const [minX, maxX] : {std::pair{-6.0, -1.0}, std::pair{1.0, 6.0}})
  {
    auto const base = static_cast<uint32_t>(vertices.size());
    for (double const y : {-0.5, 0.0})
    {
      vertices.emplace_back(minX, y, -3.0);
      vertices.emplace_back(maxX, y, -3.0);
      vertices.emplace_back(maxX, y, 3.0);
      vertices.emplace_back(minX, y, 3.0);
    }
    for (uint32_t const index : {4, 7, 6, 4, 6, 5,   // top
                                 0, 1, 2, 0, 2, 3,   // bottom
                                 1, 5, 6, 1, 6, 2,   // +X side
                                 0, 3, 7, 0, 7, 4})  // -X side
    {
      indices.push_back(base + index);
    }
  }
  return std::make_shared<const TriangleMesh>(std::move(vertices), indices);
}

BodyDescriptor meshDescriptor(std::shared_ptr<const TriangleMesh> mesh)
{
  BodyDescriptor descriptor;
  descriptor.kind = BodyKind::Static;
  descriptor.shape = std::move(mesh);
  return descriptor;
}

BodyDescriptor ballDescriptor(double radius = 0.5)
{
  BodyDescriptor descriptor;
  descriptor.kind = BodyKind::Dynamic;
  descriptor.shape = SphereShape{radius};
  descriptor.mass = 1.0;
  return descriptor;
}

BodyDescriptor hullDescriptor(std::shared_ptr<const ConvexHull> hull,
                              bool sensor = false)
{
  BodyDescriptor descriptor;
  descriptor.kind = BodyKind::Kinematic;
  descriptor.shape = std::move(hull);
  descriptor.sensor = sensor;
  return descriptor;
}

constexpr NodeId kBall = 1;
constexpr NodeId kFloor = 2;
constexpr NodeId kSensor = 3;

const Eigen::Quaterniond kIdentity = Eigen::Quaterniond::Identity();

}  // anonymous namespace

// ============================================================================
// Body management
// ============================================================================

TEST(PhysicsWorldTest, AttachAndDetach)
{
  PhysicsWorld world;
  world.attachBody(kBall, ballDescriptor(), Coordinate{0.0, 1.0, 0.0}, kIdentity);

  EXPECT_TRUE(world.hasBody(kBall));
  EXPECT_EQ(world.getBodyKind(kBall), BodyKind::Dynamic);
  EXPECT_FALSE(world.isSensor(kBall));
  ASSERT_TRUE(world.getBodyState(kBall).has_value());
  EXPECT_DOUBLE_EQ(world.getBodyState(kBall)->position.y(), 1.0);

  world.detachBody(kBall);
  EXPECT_FALSE(world.hasBody(kBall));
  EXPECT_FALSE(world.getBodyState(kBall).has_value());
}

TEST(PhysicsWorldTest, AttachRejectsInvalidBodies)
{
  PhysicsWorld world;
  world.attachBody(kBall, ballDescriptor(), Coordinate{}, kIdentity);

  EXPECT_THROW(world.attachBody(kBall, ballDescriptor(), Coordinate{}, kIdentity),
               std::invalid_argument);

  EXPECT_THROW(
    world.attachBody(kFloor, ballDescriptor(0.0), Coordinate{}, kIdentity),
    std::invalid_argument);

  BodyDescriptor dynamicHull = hullDescriptor(makeSlab(1.0, 1.0, 1.0));
  dynamicHull.kind = BodyKind::Dynamic;
  EXPECT_THROW(world.attachBody(kFloor, dynamicHull, Coordinate{}, kIdentity),
               std::invalid_argument);

  EXPECT_THROW(world.attachBody(kFloor,
                                hullDescriptor(nullptr),
                                Coordinate{},
                                kIdentity),
               std::invalid_argument);

  BodyDescriptor dynamicMesh = meshDescriptor(makeGappedFloor());
  dynamicMesh.kind = BodyKind::Dynamic;
  EXPECT_THROW(world.attachBody(kFloor, dynamicMesh, Coordinate{}, kIdentity),
               std::invalid_argument);

  EXPECT_THROW(world.attachBody(kFloor,
                                meshDescriptor(nullptr),
                                Coordinate{},
                                kIdentity),
               std::invalid_argument);

  BodyDescriptor massless = ballDescriptor();
  massless.mass = 0.0;
  EXPECT_THROW(world.attachBody(kSensor, massless, Coordinate{}, kIdentity),
               std::invalid_argument);
}

TEST(PhysicsWorldTest, UnknownBodyOperationsThrow)
{
  PhysicsWorld world;
  EXPECT_THROW(world.setExternalForce(kBall, Coordinate{}, Coordinate{}),
               std::out_of_range);
  EXPECT_THROW(world.setPose(kBall, Coordinate{}, kIdentity), std::out_of_range);
  EXPECT_THROW(world.resetVelocity(kBall), std::out_of_range);
}

// ============================================================================
// Dynamics
// ============================================================================

TEST(PhysicsWorldTest, FreeFallFollowsGravity)
{
  PhysicsWorld world;
  world.attachBody(kBall, ballDescriptor(), Coordinate{0.0, 10.0, 0.0}, kIdentity);

  world.step(0.5s);

  auto const state = world.getBodyState(kBall);
  ASSERT_TRUE(state.has_value());
  EXPECT_NEAR(state->velocity.y(), -9.81 * 0.5, 1e-9);
  // Semi-implicit Euler lands close to the analytic 10 - g t^2 / 2
  EXPECT_NEAR(state->position.y(), 10.0 - 0.5 * 9.81 * 0.25, 0.05);
}

TEST(PhysicsWorldTest, AppliedForceAcceleratesBall)
{
  PhysicsWorld world{Coordinate{0.0, 0.0, 0.0}};
  world.attachBody(kBall, ballDescriptor(), Coordinate{}, kIdentity);
  world.setExternalForce(kBall, Coordinate{2.0, 0.0, 0.0}, Coordinate{});

  world.step(1.0s);

  EXPECT_NEAR(world.getBodyState(kBall)->velocity.x(), 2.0, 1e-9);
}

TEST(PhysicsWorldTest, AppliedTorqueSpinsBall)
{
  PhysicsWorld world{Coordinate{0.0, 0.0, 0.0}};
  world.attachBody(kBall, ballDescriptor(), Coordinate{}, kIdentity);
  world.setExternalForce(kBall, Coordinate{}, Coordinate{0.0, 0.0, 1.0});

  world.step(0.1s);

  EXPECT_GT(world.getBodyState(kBall)->angularVelocity.z(), 0.0);
  EXPECT_NEAR(world.getBodyState(kBall)->velocity.norm(), 0.0, 1e-12);
}

TEST(PhysicsWorldTest, BallComesToRestOnFloor)
{
  PhysicsWorld world;
  world.attachBody(kFloor,
                   hullDescriptor(makeSlab(10.0, 0.5, 10.0)),
                   Coordinate{0.0, -0.5, 0.0},
                   kIdentity);
  world.attachBody(kBall, ballDescriptor(), Coordinate{0.0, 2.0, 0.0}, kIdentity);

  for (int i = 0; i < 180; ++i)
  {
    world.step(std::chrono::duration<double>{1.0 / 60.0});
  }

  auto const state = world.getBodyState(kBall);
  ASSERT_TRUE(state.has_value());
  EXPECT_NEAR(state->position.y(), 0.5, 0.02);
  EXPECT_NEAR(state->velocity.y(), 0.0, 0.2);
}

TEST(PhysicsWorldTest, BallFallsThroughGapInMeshFloor)
{
  PhysicsWorld world;
  world.attachBody(
    kFloor, meshDescriptor(makeGappedFloor()), Coordinate{}, kIdentity);
  world.attachBody(
    kBall, ballDescriptor(0.5), Coordinate{0.0, 2.0, 0.0}, kIdentity);

  for (int i = 0; i < 90; ++i)
  {
    world.step(std::chrono::duration<double>{1.0 / 60.0});
  }

  EXPECT_LT(world.getBodyState(kBall)->position.y(), 0.0);
}

TEST(PhysicsWorldTest, BallRestsOnMeshFloor)
{
  PhysicsWorld world;
  world.attachBody(
    kFloor, meshDescriptor(makeGappedFloor()), Coordinate{}, kIdentity);
  world.attachBody(
    kBall, ballDescriptor(0.5), Coordinate{3.5, 2.0, 0.0}, kIdentity);

  for (int i = 0; i < 180; ++i)
  {
    world.step(std::chrono::duration<double>{1.0 / 60.0});
  }

  auto const state = world.getBodyState(kBall);
  EXPECT_NEAR(state->position.y(), 0.5, 0.02);
  EXPECT_NEAR(state->velocity.y(), 0.0, 0.2);
}

TEST(PhysicsWorldTest, ResetVelocityAndSetPose)
{
  PhysicsWorld world;
  world.attachBody(kBall, ballDescriptor(), Coordinate{0.0, 10.0, 0.0}, kIdentity);
  world.step(0.5s);

  world.setPose(kBall, Coordinate{1.0, 2.0, 3.0}, kIdentity);
  world.resetVelocity(kBall);

  auto const state = world.getBodyState(kBall);
  EXPECT_TRUE(state->position.isApprox(Eigen::Vector3d{1.0, 2.0, 3.0}));
  EXPECT_TRUE(state->velocity.isZero());
  EXPECT_TRUE(state->angularVelocity.isZero());
}

// ============================================================================
// Contact events
// ============================================================================

TEST(PhysicsWorldTest, ContactBeganThenEnded)
{
  PhysicsWorld world{Coordinate{0.0, 0.0, 0.0}};
  world.attachBody(kFloor,
                   hullDescriptor(makeSlab(10.0, 0.5, 10.0)),
                   Coordinate{0.0, -0.5, 0.0},
                   kIdentity);
  world.attachBody(kBall, ballDescriptor(), Coordinate{0.0, 0.5, 0.0}, kIdentity);

  world.step(std::chrono::duration<double>{1.0 / 60.0});
  ASSERT_EQ(world.getContactEvents().size(), 1u);
  EXPECT_EQ(world.getContactEvents().front(),
            (ContactEvent{ContactEvent::Type::Began, kBall, kFloor}));

  // Still touching: no new event
  world.step(std::chrono::duration<double>{1.0 / 60.0});
  EXPECT_TRUE(world.getContactEvents().empty());

  world.setPose(kBall, Coordinate{0.0, 5.0, 0.0}, kIdentity);
  world.step(std::chrono::duration<double>{1.0 / 60.0});
  ASSERT_EQ(world.getContactEvents().size(), 1u);
  EXPECT_EQ(world.getContactEvents().front().type, ContactEvent::Type::Ended);
  EXPECT_TRUE(world.getContactEvents().front().involves(kFloor));
}

TEST(PhysicsWorldTest, SensorReportsOverlapWithoutPushing)
{
  PhysicsWorld world{Coordinate{0.0, 0.0, 0.0}};
  world.attachBody(kSensor,
                   hullDescriptor(makeSlab(1.0, 1.0, 1.0), true),
                   Coordinate{0.0, 0.0, 0.0},
                   kIdentity);
  world.attachBody(kBall, ballDescriptor(), Coordinate{0.0, 0.0, 0.0}, kIdentity);

  world.step(std::chrono::duration<double>{1.0 / 60.0});

  EXPECT_TRUE(world.isSensor(kSensor));
  ASSERT_EQ(world.getContactEvents().size(), 1u);
  EXPECT_EQ(world.getContactEvents().front().type, ContactEvent::Type::Began);
  EXPECT_TRUE(world.getContactEvents().front().involves(kSensor));

  // Deep inside the sensor, yet not pushed out
  EXPECT_TRUE(world.getBodyState(kBall)->position.isZero(1e-12));
}

TEST(PhysicsWorldTest, DetachDropsContactsSilently)
{
  PhysicsWorld world{Coordinate{0.0, 0.0, 0.0}};
  world.attachBody(kFloor,
                   hullDescriptor(makeSlab(10.0, 0.5, 10.0)),
                   Coordinate{0.0, -0.5, 0.0},
                   kIdentity);
  world.attachBody(kBall, ballDescriptor(), Coordinate{0.0, 0.5, 0.0}, kIdentity);
  world.step(std::chrono::duration<double>{1.0 / 60.0});
  ASSERT_EQ(world.getContactEvents().size(), 1u);

  world.detachBody(kFloor);
  world.step(std::chrono::duration<double>{1.0 / 60.0});
  EXPECT_TRUE(world.getContactEvents().empty());
}

TEST(PhysicsWorldTest, BouncyFloorReflectsFastBall)
{
  PhysicsWorld world{Coordinate{0.0, 0.0, 0.0}};

  BodyDescriptor floor = hullDescriptor(makeSlab(10.0, 0.5, 10.0));
  floor.material = MaterialProperties::create(1.0, 0.0);
  world.attachBody(kFloor, floor, Coordinate{0.0, -0.5, 0.0}, kIdentity);

  BodyDescriptor ball = ballDescriptor();
  ball.material = MaterialProperties::create(1.0, 0.0);
  world.attachBody(kBall, ball, Coordinate{0.0, 0.6, 0.0}, kIdentity);

  world.step(std::chrono::duration<double>{1.0 / 60.0});
  world.setPose(kBall, Coordinate{0.0, 0.6, 0.0}, kIdentity);

  // Drive the ball down into the floor at 5 m/s for one substep
  world.setExternalForce(kBall, Coordinate{0.0, -600.0, 0.0}, Coordinate{});
  world.step(std::chrono::duration<double>{1.0 / 120.0});
  world.setExternalForce(kBall, Coordinate{}, Coordinate{});
  for (int i = 0; i < 10; ++i)
  {
    world.step(std::chrono::duration<double>{1.0 / 120.0});
  }

  EXPECT_GT(world.getBodyState(kBall)->velocity.y(), 1.0);
}

#ifndef RBG_SIM_PHYSICS_PHYSICS_ENGINE_HPP
#define RBG_SIM_PHYSICS_PHYSICS_ENGINE_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <variant>
#include <vector>

#include <boost/describe/enum.hpp>
#include <Eigen/Geometry>

#include "rbg-sim/src/DataTypes/Coordinate.hpp"
#include "rbg-sim/src/Physics/ConvexHull.hpp"
#include "rbg-sim/src/Physics/MaterialProperties.hpp"
#include "rbg-sim/src/Physics/TriangleMesh.hpp"
#include "rbg-sim/src/Scene/SceneGraph.hpp"

namespace rbg_sim
{

/**
 * @brief How the solver treats a body
 *
 * - Static: never moves
 * - Kinematic: moved only through setPose(), pushes dynamic bodies
 * - Dynamic: integrated under gravity, contacts and applied force/torque
 */
enum class BodyKind : uint8_t
{
  Static,
  Kinematic,
  Dynamic
};

BOOST_DESCRIBE_ENUM(BodyKind, Static, Kinematic, Dynamic)

struct SphereShape
{
  double radius{0.5};
};

/**
 * @brief Collision geometry in the body's local frame
 *
 * Hulls and triangle meshes are limited to static and kinematic bodies.
 */
using CollisionShape = std::variant<SphereShape,
                                    std::shared_ptr<const ConvexHull>,
                                    std::shared_ptr<const TriangleMesh>>;

struct BodyDescriptor
{
  BodyKind kind{BodyKind::Static};
  CollisionShape shape{SphereShape{}};
  MaterialProperties material;
  bool sensor{false};  // Sensors report contacts but impart no forces
  double mass{1.0};    // Used by dynamic bodies only
};

/**
 * @brief Start or end of contact between two bodies
 *
 * `first` is always the lower node id of the pair.
 */
struct ContactEvent
{
  enum class Type : uint8_t
  {
    Began,
    Ended
  };

  Type type{Type::Began};
  NodeId first{0};
  NodeId second{0};

  [[nodiscard]] bool involves(NodeId node) const
  {
    return first == node || second == node;
  }

  bool operator==(const ContactEvent&) const = default;
};

/**
 * @brief Snapshot of a body, read by value
 */
struct BodyState
{
  Coordinate position;
  Eigen::Quaterniond orientation{Eigen::Quaterniond::Identity()};
  Coordinate velocity;
  Coordinate angularVelocity;
  Coordinate appliedForce;
  Coordinate appliedTorque;
};

/**
 * @brief Rigid-body solver surface used by the gameplay systems
 *
 * Bodies are keyed by the scene node that owns them; at most one body per
 * node. Contact events describe the most recent step() only.
 */
class PhysicsEngine
{
public:
  virtual ~PhysicsEngine() = default;

  /**
   * @throws std::invalid_argument if the node already has a body or the
   *         descriptor is not supported
   */
  virtual void attachBody(NodeId node,
                          const BodyDescriptor& descriptor,
                          const Coordinate& position,
                          const Eigen::Quaterniond& orientation) = 0;

  virtual void detachBody(NodeId node) = 0;

  [[nodiscard]] virtual bool hasBody(NodeId node) const = 0;

  [[nodiscard]] virtual std::optional<BodyState> getBodyState(
    NodeId node) const = 0;

  [[nodiscard]] virtual std::optional<BodyKind> getBodyKind(
    NodeId node) const = 0;

  [[nodiscard]] virtual bool isSensor(NodeId node) const = 0;

  [[nodiscard]] virtual std::vector<NodeId> getBodies() const = 0;

  /**
   * @brief Replace the persistent force and torque applied to a dynamic body
   */
  virtual void setExternalForce(NodeId node,
                                const Coordinate& force,
                                const Coordinate& torque) = 0;

  virtual void setPose(NodeId node,
                       const Coordinate& position,
                       const Eigen::Quaterniond& orientation) = 0;

  /**
   * @brief Zero linear and angular velocity
   */
  virtual void resetVelocity(NodeId node) = 0;

  virtual void step(std::chrono::duration<double> dt) = 0;

  [[nodiscard]] virtual const std::vector<ContactEvent>& getContactEvents()
    const = 0;
};

}  // namespace rbg_sim

#endif  // RBG_SIM_PHYSICS_PHYSICS_ENGINE_HPP

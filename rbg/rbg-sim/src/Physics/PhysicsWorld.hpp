#ifndef RBG_SIM_PHYSICS_PHYSICS_WORLD_HPP
#define RBG_SIM_PHYSICS_PHYSICS_WORLD_HPP

#include <map>
#include <optional>
#include <set>
#include <utility>
#include <vector>

#include "rbg-sim/src/Physics/PhysicsEngine.hpp"

namespace rbg_sim
{

/**
 * @brief Small impulse-based solver for dynamic spheres
 *
 * Dynamic bodies must be spheres. Static and kinematic bodies may be spheres,
 * convex hulls or triangle meshes. A sphere against a triangle mesh contacts
 * the nearest triangle only. Each step is split into substeps no longer than
 * kMaxSubstep; every substep integrates dynamic bodies semi-implicitly,
 * detects overlaps, pushes bodies apart and applies restitution and Coulomb
 * friction impulses. Sensor overlaps only produce events.
 *
 * Contact events are produced by diffing the set of touching pairs between
 * substeps. Pairs that contain no dynamic body are never tested.
 *
 * Thread safety: Not thread-safe
 */
class PhysicsWorld final : public PhysicsEngine
{
public:
  static constexpr double kMaxSubstep = 1.0 / 120.0;        // [s]
  static constexpr double kContactMargin = 1e-3;            // [m]
  static constexpr double kRestingSpeed = 0.2;              // [m/s]
  static constexpr double kSphereInertiaFactor = 2.0 / 5.0; // I = k m r^2

  explicit PhysicsWorld(const Coordinate& gravity = Coordinate{0.0,
                                                                -9.81,
                                                                0.0});

  void attachBody(NodeId node,
                  const BodyDescriptor& descriptor,
                  const Coordinate& position,
                  const Eigen::Quaterniond& orientation) override;

  void detachBody(NodeId node) override;

  [[nodiscard]] bool hasBody(NodeId node) const override;

  [[nodiscard]] std::optional<BodyState> getBodyState(
    NodeId node) const override;

  [[nodiscard]] std::optional<BodyKind> getBodyKind(
    NodeId node) const override;

  [[nodiscard]] bool isSensor(NodeId node) const override;

  [[nodiscard]] std::vector<NodeId> getBodies() const override;

  void setExternalForce(NodeId node,
                        const Coordinate& force,
                        const Coordinate& torque) override;

  void setPose(NodeId node,
               const Coordinate& position,
               const Eigen::Quaterniond& orientation) override;

  void resetVelocity(NodeId node) override;

  void step(std::chrono::duration<double> dt) override;

  [[nodiscard]] const std::vector<ContactEvent>& getContactEvents()
    const override
  {
    return events_;
  }

  [[nodiscard]] const Coordinate& getGravity() const
  {
    return gravity_;
  }

private:
  struct Body
  {
    BodyDescriptor descriptor;
    BodyState state;
  };

  // Normal points from the other body toward the dynamic one
  struct Contact
  {
    Coordinate normal;
    double separation{0.0};
  };

  using Pair = std::pair<NodeId, NodeId>;

  Body& getBody(NodeId node);

  void substep(double dt);
  void integrate(Body& body, double dt) const;

  static std::optional<double> sphereRadius(const Body& body);
  static std::optional<Contact> detect(const Body& sphere,
                                       double radius,
                                       const Body& other);
  static void resolve(Body& a, Body& b, const Contact& contact);

  Coordinate gravity_;
  std::map<NodeId, Body> bodies_;
  std::set<Pair> touching_;
  std::vector<ContactEvent> events_;
};

}  // namespace rbg_sim

#endif  // RBG_SIM_PHYSICS_PHYSICS_WORLD_HPP

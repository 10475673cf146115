#include "rbg-sim/src/Physics/PhysicsWorld.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace rbg_sim
{

namespace
{

bool isDynamic(BodyKind kind)
{
  return kind == BodyKind::Dynamic;
}

}  // namespace

PhysicsWorld::PhysicsWorld(const Coordinate& gravity) : gravity_{gravity}
{
}

void PhysicsWorld::attachBody(NodeId node,
                              const BodyDescriptor& descriptor,
                              const Coordinate& position,
                              const Eigen::Quaterniond& orientation)
{
  if (bodies_.contains(node))
  {
    throw std::invalid_argument("Node " + std::to_string(node) +
                                " already has a physics body");
  }

  if (const auto* sphere = std::get_if<SphereShape>(&descriptor.shape))
  {
    if (sphere->radius <= 0.0)
    {
      throw std::invalid_argument("Sphere radius must be positive");
    }
  }
  else
  {
    bool const isNull = std::visit(
      [](const auto& shape)
      {
        if constexpr (std::is_same_v<std::decay_t<decltype(shape)>,
                                     SphereShape>)
        {
          return false;
        }
        else
        {
          return shape == nullptr;
        }
      },
      descriptor.shape);
    if (isNull)
    {
      throw std::invalid_argument("Collision shape of node " +
                                  std::to_string(node) + " is null");
    }
    if (isDynamic(descriptor.kind))
    {
      throw std::invalid_argument(
        "Dynamic bodies must use a sphere shape (node " +
        std::to_string(node) + ")");
    }
  }

  if (isDynamic(descriptor.kind) && descriptor.mass <= 0.0)
  {
    throw std::invalid_argument("Dynamic body mass must be positive");
  }

  Body body;
  body.descriptor = descriptor;
  body.state.position = position;
  body.state.orientation = orientation.normalized();
  bodies_.emplace(node, std::move(body));
}

void PhysicsWorld::detachBody(NodeId node)
{
  bodies_.erase(node);
  std::erase_if(touching_,
                [node](const Pair& pair)
                { return pair.first == node || pair.second == node; });
}

bool PhysicsWorld::hasBody(NodeId node) const
{
  return bodies_.contains(node);
}

std::optional<BodyState> PhysicsWorld::getBodyState(NodeId node) const
{
  auto it = bodies_.find(node);
  if (it == bodies_.end())
  {
    return std::nullopt;
  }
  return it->second.state;
}

std::optional<BodyKind> PhysicsWorld::getBodyKind(NodeId node) const
{
  auto it = bodies_.find(node);
  if (it == bodies_.end())
  {
    return std::nullopt;
  }
  return it->second.descriptor.kind;
}

bool PhysicsWorld::isSensor(NodeId node) const
{
  auto it = bodies_.find(node);
  return it != bodies_.end() && it->second.descriptor.sensor;
}

std::vector<NodeId> PhysicsWorld::getBodies() const
{
  std::vector<NodeId> nodes;
  nodes.reserve(bodies_.size());
  for (const auto& [id, body] : bodies_)
  {
    nodes.push_back(id);
  }
  return nodes;
}

void PhysicsWorld::setExternalForce(NodeId node,
                                    const Coordinate& force,
                                    const Coordinate& torque)
{
  auto& state = getBody(node).state;
  state.appliedForce = force;
  state.appliedTorque = torque;
}

void PhysicsWorld::setPose(NodeId node,
                           const Coordinate& position,
                           const Eigen::Quaterniond& orientation)
{
  auto& state = getBody(node).state;
  state.position = position;
  state.orientation = orientation.normalized();
}

void PhysicsWorld::resetVelocity(NodeId node)
{
  auto& state = getBody(node).state;
  state.velocity = Coordinate{0.0, 0.0, 0.0};
  state.angularVelocity = Coordinate{0.0, 0.0, 0.0};
}

void PhysicsWorld::step(std::chrono::duration<double> dt)
{
  events_.clear();

  double const total = dt.count();
  if (total <= 0.0)
  {
    return;
  }

  auto const substeps =
    std::max(1, static_cast<int>(std::ceil(total / kMaxSubstep)));
  double const h = total / substeps;

  for (int i = 0; i < substeps; ++i)
  {
    substep(h);
  }
}

PhysicsWorld::Body& PhysicsWorld::getBody(NodeId node)
{
  auto it = bodies_.find(node);
  if (it == bodies_.end())
  {
    throw std::out_of_range("Node " + std::to_string(node) +
                            " has no physics body");
  }
  return it->second;
}

void PhysicsWorld::substep(double dt)
{
  for (auto& [id, body] : bodies_)
  {
    if (isDynamic(body.descriptor.kind))
    {
      integrate(body, dt);
    }
  }

  std::set<Pair> current;

  for (auto first = bodies_.begin(); first != bodies_.end(); ++first)
  {
    for (auto second = std::next(first); second != bodies_.end(); ++second)
    {
      Body* a = &first->second;
      Body* b = &second->second;

      // The sphere being tested must be dynamic
      if (!isDynamic(a->descriptor.kind))
      {
        std::swap(a, b);
      }
      if (!isDynamic(a->descriptor.kind))
      {
        continue;
      }

      auto const radius = sphereRadius(*a);
      if (!radius)
      {
        continue;
      }

      auto contact = detect(*a, *radius, *b);
      if (!contact || contact->separation >= kContactMargin)
      {
        continue;
      }

      current.emplace(first->first, second->first);

      if (!a->descriptor.sensor && !b->descriptor.sensor)
      {
        resolve(*a, *b, *contact);
      }
    }
  }

  for (const auto& pair : current)
  {
    if (!touching_.contains(pair))
    {
      events_.push_back(
        ContactEvent{ContactEvent::Type::Began, pair.first, pair.second});
    }
  }
  for (const auto& pair : touching_)
  {
    if (!current.contains(pair))
    {
      events_.push_back(
        ContactEvent{ContactEvent::Type::Ended, pair.first, pair.second});
    }
  }

  touching_ = std::move(current);
}

void PhysicsWorld::integrate(Body& body, double dt) const
{
  auto& state = body.state;
  double const mass = body.descriptor.mass;
  double const radius = sphereRadius(body).value_or(1.0);
  double const inertia = kSphereInertiaFactor * mass * radius * radius;

  state.velocity += (gravity_ + state.appliedForce / mass) * dt;
  state.angularVelocity += state.appliedTorque / inertia * dt;
  state.position += state.velocity * dt;

  double const angle = state.angularVelocity.norm() * dt;
  if (angle > 1e-12)
  {
    Eigen::Quaterniond const delta{
      Eigen::AngleAxisd{angle, state.angularVelocity.normalized()}};
    state.orientation = (delta * state.orientation).normalized();
  }
}

std::optional<double> PhysicsWorld::sphereRadius(const Body& body)
{
  if (const auto* sphere = std::get_if<SphereShape>(&body.descriptor.shape))
  {
    return sphere->radius;
  }
  return std::nullopt;
}

std::optional<PhysicsWorld::Contact> PhysicsWorld::detect(const Body& sphere,
                                                          double radius,
                                                          const Body& other)
{
  const Coordinate& center = sphere.state.position;

  if (auto otherRadius = sphereRadius(other))
  {
    Coordinate const delta{center - other.state.position};
    double const distance = delta.norm();
    Coordinate const normal = distance > 1e-12
                                ? Coordinate{delta / distance}
                                : Coordinate{0.0, 1.0, 0.0};
    return Contact{normal, distance - radius - *otherRadius};
  }

  Coordinate const local{other.state.orientation.conjugate() *
                         (center - other.state.position)};

  if (const auto* mesh = std::get_if<std::shared_ptr<const TriangleMesh>>(
        &other.descriptor.shape))
  {
    if (!(*mesh)->mayTouch(local, radius + kContactMargin))
    {
      return std::nullopt;
    }
    auto const closest = (*mesh)->closestPoint(local);
    return Contact{Coordinate{other.state.orientation * closest.normal},
                   closest.distance - radius};
  }

  const auto& hull =
    *std::get<std::shared_ptr<const ConvexHull>>(other.descriptor.shape);
  const Facet& facet = hull.getSeparatingFacet(local);

  return Contact{Coordinate{other.state.orientation * facet.normal},
                 facet.distanceTo(local) - radius};
}

void PhysicsWorld::resolve(Body& a, Body& b, const Contact& contact)
{
  const Coordinate& n = contact.normal;

  bool const bDynamic = isDynamic(b.descriptor.kind);
  double const invMassA = 1.0 / a.descriptor.mass;
  double const invMassB = bDynamic ? 1.0 / b.descriptor.mass : 0.0;
  double const invMassSum = invMassA + invMassB;

  double const radiusA = sphereRadius(a).value_or(0.0);
  double const radiusB = bDynamic ? sphereRadius(b).value_or(0.0) : 0.0;

  // Positional correction
  if (contact.separation < 0.0)
  {
    double const depth = -contact.separation;
    a.state.position += n * (depth * invMassA / invMassSum);
    if (bDynamic)
    {
      b.state.position -= n * (depth * invMassB / invMassSum);
    }
  }

  // Contact point offsets from each center
  Coordinate const armA{-radiusA * n};
  Coordinate const armB{radiusB * n};

  Coordinate velocityB{0.0, 0.0, 0.0};
  if (bDynamic)
  {
    velocityB = b.state.velocity + b.state.angularVelocity.cross(armB);
  }
  Coordinate const relative{a.state.velocity +
                            a.state.angularVelocity.cross(armA) - velocityB};

  double const normalSpeed = relative.dot(n);
  if (normalSpeed >= 0.0)
  {
    return;
  }

  double restitution = 0.5 * (a.descriptor.material.coefficientOfRestitution +
                              b.descriptor.material.coefficientOfRestitution);
  if (-normalSpeed < kRestingSpeed)
  {
    restitution = 0.0;
  }

  double const normalImpulse = -(1.0 + restitution) * normalSpeed / invMassSum;
  a.state.velocity += n * (normalImpulse * invMassA);
  if (bDynamic)
  {
    b.state.velocity -= n * (normalImpulse * invMassB);
  }

  // Coulomb friction at the contact point; for a solid sphere the
  // tangential effective inverse mass is (1 + 1/k) / m
  Coordinate const tangential{relative - normalSpeed * n};
  double const slip = tangential.norm();
  if (slip < 1e-9)
  {
    return;
  }
  Coordinate const t{tangential / slip};

  double const rotationalFactor = 1.0 + 1.0 / kSphereInertiaFactor;
  double const tangentialInvMass =
    rotationalFactor * invMassA + rotationalFactor * invMassB;

  double const mu = 0.5 * (a.descriptor.material.frictionCoefficient +
                           b.descriptor.material.frictionCoefficient);
  double const frictionImpulse =
    std::min(slip / tangentialInvMass, mu * normalImpulse);

  Coordinate const impulse{-frictionImpulse * t};

  a.state.velocity += impulse * invMassA;
  if (radiusA > 0.0)
  {
    double const inertiaA =
      kSphereInertiaFactor * a.descriptor.mass * radiusA * radiusA;
    a.state.angularVelocity += armA.cross(impulse) / inertiaA;
  }

  if (bDynamic)
  {
    b.state.velocity -= impulse * invMassB;
    if (radiusB > 0.0)
    {
      double const inertiaB =
        kSphereInertiaFactor * b.descriptor.mass * radiusB * radiusB;
      b.state.angularVelocity -= armB.cross(impulse) / inertiaB;
    }
  }
}

}  // namespace rbg_sim

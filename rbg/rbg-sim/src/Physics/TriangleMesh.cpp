// Ticket: 0011_triangle_mesh_colliders

#include "rbg-sim/src/Physics/TriangleMesh.hpp"

#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace rbg_sim
{

namespace
{

constexpr double kDegenerateArea = 1e-12;
constexpr double kOnSurface = 1e-9;

}  // namespace

TriangleMesh::TriangleMesh(std::vector<Coordinate> vertices,
                           const std::vector<uint32_t>& indices)
  : vertices_{std::move(vertices)}
{
  if (indices.size() % 3 != 0)
  {
    throw std::invalid_argument("Triangle index count " +
                                std::to_string(indices.size()) +
                                " is not a multiple of three");
  }

  for (size_t i = 0; i < indices.size(); i += 3)
  {
    Triangle const triangle{indices[i], indices[i + 1], indices[i + 2]};
    for (uint32_t index : triangle)
    {
      if (index >= vertices_.size())
      {
        throw std::invalid_argument("Triangle index " + std::to_string(index) +
                                    " is out of range");
      }
    }

    const Coordinate& a = vertices_[triangle[0]];
    Coordinate const ab{vertices_[triangle[1]] - a};
    Coordinate const ac{vertices_[triangle[2]] - a};
    if (ab.cross(ac).squaredNorm() < kDegenerateArea)
    {
      continue;
    }
    triangles_.push_back(triangle);
  }

  if (triangles_.empty())
  {
    throw std::invalid_argument("Triangle mesh has no non-degenerate faces");
  }

  double const inf = std::numeric_limits<double>::infinity();
  boundingBoxMin_ = Coordinate{inf, inf, inf};
  boundingBoxMax_ = Coordinate{-inf, -inf, -inf};
  for (const auto& triangle : triangles_)
  {
    for (uint32_t index : triangle)
    {
      boundingBoxMin_ = boundingBoxMin_.cwiseMin(vertices_[index]);
      boundingBoxMax_ = boundingBoxMax_.cwiseMax(vertices_[index]);
    }
  }
}

TriangleMesh::ClosestPoint TriangleMesh::closestPoint(
  const Coordinate& query) const
{
  ClosestPoint best;
  best.distance = std::numeric_limits<double>::infinity();
  const Triangle* bestTriangle = nullptr;

  for (const auto& triangle : triangles_)
  {
    const Coordinate& a = vertices_[triangle[0]];
    const Coordinate& b = vertices_[triangle[1]];
    const Coordinate& c = vertices_[triangle[2]];

    Coordinate const point = closestPointOnTriangle(query, a, b, c);
    double const distance = (query - point).norm();
    if (distance < best.distance)
    {
      best.point = point;
      best.distance = distance;
      bestTriangle = &triangle;
    }
  }

  if (best.distance > kOnSurface)
  {
    best.normal = Coordinate{(query - best.point) / best.distance};
    return best;
  }

  // On the surface: fall back to the face normal
  const Triangle& triangle = *bestTriangle;
  const Coordinate& a = vertices_[triangle[0]];
  Coordinate const face{
    (vertices_[triangle[1]] - a).cross(vertices_[triangle[2]] - a)};
  best.normal = Coordinate{face.normalized()};
  return best;
}

bool TriangleMesh::mayTouch(const Coordinate& query, double margin) const
{
  for (int axis = 0; axis < 3; ++axis)
  {
    if (query[axis] + margin < boundingBoxMin_[axis] ||
        query[axis] - margin > boundingBoxMax_[axis])
    {
      return false;
    }
  }
  return true;
}

Coordinate closestPointOnTriangle(const Coordinate& p,
                                  const Coordinate& a,
                                  const Coordinate& b,
                                  const Coordinate& c)
{
  Coordinate const ab{b - a};
  Coordinate const ac{c - a};

  Coordinate const ap{p - a};
  double const d1 = ab.dot(ap);
  double const d2 = ac.dot(ap);
  if (d1 <= 0.0 && d2 <= 0.0)
  {
    return a;
  }

  Coordinate const bp{p - b};
  double const d3 = ab.dot(bp);
  double const d4 = ac.dot(bp);
  if (d3 >= 0.0 && d4 <= d3)
  {
    return b;
  }

  double const vc = d1 * d4 - d3 * d2;
  if (vc <= 0.0 && d1 >= 0.0 && d3 <= 0.0)
  {
    return Coordinate{a + ab * (d1 / (d1 - d3))};
  }

  Coordinate const cp{p - c};
  double const d5 = ab.dot(cp);
  double const d6 = ac.dot(cp);
  if (d6 >= 0.0 && d5 <= d6)
  {
    return c;
  }

  double const vb = d5 * d2 - d1 * d6;
  if (vb <= 0.0 && d2 >= 0.0 && d6 <= 0.0)
  {
    return Coordinate{a + ac * (d2 / (d2 - d6))};
  }

  double const va = d3 * d6 - d5 * d4;
  if (va <= 0.0 && (d4 - d3) >= 0.0 && (d5 - d6) >= 0.0)
  {
    double const w = (d4 - d3) / ((d4 - d3) + (d5 - d6));
    return Coordinate{b + (c - b) * w};
  }

  double const denom = 1.0 / (va + vb + vc);
  return Coordinate{a + ab * (vb * denom) + ac * (vc * denom)};
}

}  // namespace rbg_sim

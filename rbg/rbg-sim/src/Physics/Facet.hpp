#ifndef RBG_SIM_PHYSICS_FACET_HPP
#define RBG_SIM_PHYSICS_FACET_HPP

#include <array>
#include <cstddef>
#include <utility>

#include "rbg-sim/src/DataTypes/Coordinate.hpp"

namespace rbg_sim
{

/**
 * @brief Triangular facet of a convex hull
 *
 * The plane of the facet is `normal.dot(x) + offset = 0` with the normal
 * pointing out of the hull.
 */
struct Facet
{
  static constexpr size_t kFacetSize = 3;

  std::array<size_t, kFacetSize> vertexIndices{};
  Coordinate normal;  // Outward-facing unit normal
  double offset{};

  Facet() = default;
  Facet(size_t v0, size_t v1, size_t v2, Coordinate n, double d)
    : vertexIndices{v0, v1, v2}, normal{std::move(n)}, offset{d}
  {
  }

  [[nodiscard]] double distanceTo(const Coordinate& point) const
  {
    return normal.dot(point) + offset;
  }
};

}  // namespace rbg_sim

#endif  // RBG_SIM_PHYSICS_FACET_HPP

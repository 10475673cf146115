#ifndef RBG_SIM_PHYSICS_CONVEX_HULL_HPP
#define RBG_SIM_PHYSICS_CONVEX_HULL_HPP

#include <cstddef>
#include <vector>

#include "rbg-sim/src/DataTypes/Coordinate.hpp"
#include "rbg-sim/src/Physics/Facet.hpp"

namespace rbg_sim
{

/**
 * @brief 3D convex hull used as a static or kinematic collision shape
 *
 * Wraps the reentrant Qhull library. The hull is expressed in the local frame
 * of the body that owns it; callers transform query points into that frame.
 */
class ConvexHull
{
public:
  /**
   * @brief Axis-aligned bounding box.
   */
  struct BoundingBox
  {
    Coordinate min;
    Coordinate max;
  };

  /**
   * @brief Compute the convex hull of a point cloud.
   *
   * Duplicate and interior points are removed.
   *
   * @param points Point cloud, at least four non-coplanar points
   * @throws std::runtime_error if the points are degenerate or Qhull fails
   */
  explicit ConvexHull(const std::vector<Coordinate>& points);

  [[nodiscard]] const std::vector<Coordinate>& getVertices() const
  {
    return vertices_;
  }

  [[nodiscard]] const std::vector<Facet>& getFacets() const
  {
    return facets_;
  }

  [[nodiscard]] size_t getVertexCount() const
  {
    return vertices_.size();
  }

  [[nodiscard]] size_t getFacetCount() const
  {
    return facets_.size();
  }

  [[nodiscard]] double getVolume() const
  {
    return volume_;
  }

  [[nodiscard]] Coordinate getCentroid() const
  {
    return centroid_;
  }

  [[nodiscard]] BoundingBox getBoundingBox() const
  {
    return BoundingBox{boundingBoxMin_, boundingBoxMax_};
  }

  /**
   * @brief Test if a point lies inside or on the hull
   * @param epsilon Tolerance for numerical precision
   */
  [[nodiscard]] bool contains(const Coordinate& point,
                              double epsilon = 1e-6) const;

  /**
   * @brief Largest signed distance from the point to any facet plane
   *
   * Negative inside the hull. Outside the hull this is a lower bound on the
   * Euclidean distance, exact whenever the closest feature is a facet.
   */
  [[nodiscard]] double signedDistance(const Coordinate& point) const;

  /**
   * @brief The facet whose plane is farthest in front of the point
   *
   * Its normal is the separating direction used for contact response.
   */
  [[nodiscard]] const Facet& getSeparatingFacet(const Coordinate& point) const;

private:
  void computeHull(const std::vector<Coordinate>& points);
  void computeCentroid();

  std::vector<Coordinate> vertices_;
  std::vector<Facet> facets_;
  double volume_{0.0};
  Coordinate boundingBoxMin_{0.0, 0.0, 0.0};
  Coordinate boundingBoxMax_{0.0, 0.0, 0.0};
  Coordinate centroid_{0.0, 0.0, 0.0};
};

}  // namespace rbg_sim

#endif  // RBG_SIM_PHYSICS_CONVEX_HULL_HPP

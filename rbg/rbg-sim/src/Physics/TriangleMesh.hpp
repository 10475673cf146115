// Ticket: 0011_triangle_mesh_colliders

#ifndef RBG_SIM_PHYSICS_TRIANGLE_MESH_HPP
#define RBG_SIM_PHYSICS_TRIANGLE_MESH_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "rbg-sim/src/DataTypes/Coordinate.hpp"

namespace rbg_sim
{

/**
 * @brief Triangle soup used as a static or kinematic collision shape
 *
 * Unlike ConvexHull this keeps concave geometry, holes and gaps exactly as
 * authored. Vertices are expressed in the local frame of the owning body.
 */
class TriangleMesh
{
public:
  using Triangle = std::array<uint32_t, 3>;

  struct BoundingBox
  {
    Coordinate min;
    Coordinate max;
  };

  /**
   * @brief Nearest point of the mesh surface to a query point
   *
   * `normal` points from the surface towards the query point. When the query
   * lies on the surface it is the face normal of the nearest triangle.
   */
  struct ClosestPoint
  {
    Coordinate point;
    Coordinate normal;
    double distance{0.0};
  };

  /**
   * @param vertices Vertex positions
   * @param indices Triangle list, three indices per face
   * @throws std::invalid_argument if the index count is not a multiple of
   *         three, an index is out of range, or every triangle is degenerate
   */
  TriangleMesh(std::vector<Coordinate> vertices,
               const std::vector<uint32_t>& indices);

  [[nodiscard]] const std::vector<Coordinate>& getVertices() const
  {
    return vertices_;
  }

  [[nodiscard]] const std::vector<Triangle>& getTriangles() const
  {
    return triangles_;
  }

  [[nodiscard]] size_t getTriangleCount() const
  {
    return triangles_.size();
  }

  [[nodiscard]] BoundingBox getBoundingBox() const
  {
    return BoundingBox{boundingBoxMin_, boundingBoxMax_};
  }

  /**
   * @brief Nearest surface point over every triangle
   */
  [[nodiscard]] ClosestPoint closestPoint(const Coordinate& query) const;

  /**
   * @brief True if the box around the query point of half-size `margin`
   *        overlaps the mesh bounds
   */
  [[nodiscard]] bool mayTouch(const Coordinate& query, double margin) const;

private:
  std::vector<Coordinate> vertices_;
  std::vector<Triangle> triangles_;
  Coordinate boundingBoxMin_{0.0, 0.0, 0.0};
  Coordinate boundingBoxMax_{0.0, 0.0, 0.0};
};

/**
 * @brief Closest point to `p` on triangle (a, b, c)
 *
 * Voronoi region walk over vertices, edges and the face.
 */
Coordinate closestPointOnTriangle(const Coordinate& p,
                                  const Coordinate& a,
                                  const Coordinate& b,
                                  const Coordinate& c);

}  // namespace rbg_sim

#endif  // RBG_SIM_PHYSICS_TRIANGLE_MESH_HPP

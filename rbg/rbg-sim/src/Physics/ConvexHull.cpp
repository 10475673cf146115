#include "rbg-sim/src/Physics/ConvexHull.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>
#include <stdexcept>
#include <string>
#include <unordered_map>

extern "C"
{
#include <libqhull_r/geom_r.h>
#include <libqhull_r/libqhull_r.h>
#include <libqhull_r/mem_r.h>
#include <libqhull_r/poly_r.h>
}

namespace rbg_sim
{

namespace
{

// Releases every Qhull allocation exactly once, whatever path leaves scope
class QhullSession
{
public:
  QhullSession()
  {
    qh_zero(&state_, stderr);
  }

  ~QhullSession()
  {
    int curlong{};
    int totlong{};
    qh_freeqhull(&state_, !qh_ALL);
    qh_memfreeshort(&state_, &curlong, &totlong);
  }

  QhullSession(const QhullSession&) = delete;
  QhullSession& operator=(const QhullSession&) = delete;

  qhT* get()
  {
    return &state_;
  }

private:
  qhT state_{};
};

}  // namespace

ConvexHull::ConvexHull(const std::vector<Coordinate>& points)
{
  if (points.empty())
  {
    throw std::runtime_error("Cannot create convex hull from empty point set");
  }
  computeHull(points);
}

bool ConvexHull::contains(const Coordinate& point, double epsilon) const
{
  return std::ranges::all_of(facets_,
                             [&](const Facet& facet)
                             { return facet.distanceTo(point) <= epsilon; });
}

double ConvexHull::signedDistance(const Coordinate& point) const
{
  if (facets_.empty())
  {
    return std::numeric_limits<double>::infinity();
  }
  return getSeparatingFacet(point).distanceTo(point);
}

const Facet& ConvexHull::getSeparatingFacet(const Coordinate& point) const
{
  if (facets_.empty())
  {
    throw std::logic_error("Convex hull has no facets");
  }

  return *std::ranges::max_element(
    facets_,
    [&](const Facet& a, const Facet& b)
    { return a.distanceTo(point) < b.distanceTo(point); });
}

void ConvexHull::computeHull(const std::vector<Coordinate>& points)
{
  if (points.size() < 4)
  {
    throw std::runtime_error(
      "Cannot create 3D convex hull from fewer than 4 points");
  }

  // Qhull expects a flat array of doubles
  std::vector<double> qhullPoints;
  qhullPoints.reserve(points.size() * 3);
  for (const auto& point : points)
  {
    qhullPoints.push_back(point.x());
    qhullPoints.push_back(point.y());
    qhullPoints.push_back(point.z());
  }

  QHULL_LIB_CHECK
  QhullSession session;
  qhT* qh = session.get();

  // "Qt" = triangulated output, "Pp" = no precision warnings
  char options[] = "qhull Qt Pp";
  int const exitcode = qh_new_qhull(qh,
                                    3,
                                    static_cast<int>(points.size()),
                                    qhullPoints.data(),
                                    False,
                                    options,
                                    nullptr,
                                    nullptr);
  if (exitcode != 0)
  {
    throw std::runtime_error("Qhull failed with exit code " +
                             std::to_string(exitcode) +
                             " (degenerate or coplanar input)");
  }

  qh_getarea(qh, qh->facet_list);
  volume_ = qh->totvol;

  std::unordered_map<int, size_t> vertexIdMap;

  vertexT* vertex{nullptr};
  FORALLvertices
  {
    pointT* point = vertex->point;
    vertexIdMap[qh_pointid(qh, point)] = vertices_.size();
    vertices_.emplace_back(point[0], point[1], point[2]);
  }

  facetT* facet{nullptr};
  FORALLfacets
  {
    if (!facet->simplicial)
    {
      continue;
    }

    Facet hullFacet;
    size_t idx = 0;
    vertexT** vertexp{nullptr};
    FOREACHvertex_(facet->vertices)
    {
      if (idx < Facet::kFacetSize)
      {
        hullFacet.vertexIndices[idx] =
          vertexIdMap.at(qh_pointid(qh, vertex->point));
      }
      ++idx;
    }
    if (idx != Facet::kFacetSize)
    {
      continue;
    }

    hullFacet.normal =
      Coordinate{facet->normal[0], facet->normal[1], facet->normal[2]};
    double const length = hullFacet.normal.norm();
    if (length > 1e-12)
    {
      hullFacet.normal /= length;
    }
    hullFacet.offset = facet->offset / (length > 1e-12 ? length : 1.0);

    facets_.push_back(hullFacet);
  }

  if (vertices_.empty() || facets_.empty())
  {
    throw std::runtime_error("Qhull produced an empty hull");
  }

  boundingBoxMin_ = vertices_.front();
  boundingBoxMax_ = vertices_.front();
  for (const auto& v : vertices_)
  {
    boundingBoxMin_ = Coordinate{boundingBoxMin_.cwiseMin(v)};
    boundingBoxMax_ = Coordinate{boundingBoxMax_.cwiseMax(v)};
  }

  computeCentroid();
}

void ConvexHull::computeCentroid()
{
  // Volume-weighted tetrahedron decomposition about an interior point
  Coordinate reference{0.0, 0.0, 0.0};
  for (const auto& v : vertices_)
  {
    reference += v;
  }
  reference /= static_cast<double>(vertices_.size());

  Coordinate centroidSum{0.0, 0.0, 0.0};
  double totalVolume = 0.0;

  for (const auto& facet : facets_)
  {
    Coordinate const a{vertices_[facet.vertexIndices[0]] - reference};
    Coordinate const b{vertices_[facet.vertexIndices[1]] - reference};
    Coordinate const c{vertices_[facet.vertexIndices[2]] - reference};

    double const tetVol = std::abs(a.dot(b.cross(c))) / 6.0;
    centroidSum += tetVol * (a + b + c) / 4.0;
    totalVolume += tetVol;
  }

  centroid_ = totalVolume > 0.0
                ? Coordinate{reference + centroidSum / totalVolume}
                : reference;
}

}  // namespace rbg_sim

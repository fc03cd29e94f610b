#pragma once
#include "models/CoreTypes.hpp"
#include "models/TripResult.hpp"
#include <vector>

// Intersects route paths with region boundaries and collapses the positive
// tests into a set keyed by region id. A region entered twice, or crossed by
// two legs, is one membership entry; every individual (region, leg) hit is
// still listed in CoverageResult::hits for auditing.
//
// Routes are WGS84 lon/lat. Region boundaries are reprojected from their
// catalog CRS (EPSG:4326 or EPSG:3857) before testing; an unsupported CRS or
// an invalid boundary fails that region only.
class CoverageResolver {
public:
  CoverageResult resolve(const std::vector<Region> &regions,
                         const std::vector<Route> &routes) const;

  // Boundary in WGS84 lon/lat, closed and with standard ring orientation.
  // Throws GeometryError when it cannot be used for intersection tests.
  static GeoMultiPolygon prepare_boundary(const Region &region);

  // True when the path touches or crosses the (prepared) boundary.
  static bool path_intersects(const std::vector<Coord> &path,
                              const GeoMultiPolygon &boundary);
};

#include "core/CoverageResolver.hpp"
#include "core/Errors.hpp"
#include "core/GeoUtils.hpp"
#include <boost/geometry.hpp>
#include <iostream>

namespace bg = boost::geometry;
using GeoLine = bg::model::linestring<GeoPoint>;
using GeoBox = bg::model::box<GeoPoint>;

// --- helper: reproject one ring in place
static void ring_to_wgs84(std::vector<GeoPoint> &ring, Crs crs) {
  if (crs == Crs::Wgs84)
    return;
  for (auto &p : ring) {
    const Coord c = GeoUtils::mercator_to_lon_lat(p.x(), p.y());
    p.x(c[0]);
    p.y(c[1]);
  }
}

GeoMultiPolygon CoverageResolver::prepare_boundary(const Region &region) {
  const Crs crs = GeoUtils::parse_crs(region.crs);
  if (crs == Crs::Unknown)
    throw GeometryError("unsupported coordinate system '" + region.crs + "'");
  if (region.boundary.empty())
    throw GeometryError("empty boundary");

  GeoMultiPolygon mp = region.boundary;
  for (auto &poly : mp) {
    ring_to_wgs84(poly.outer(), crs);
    for (auto &inner : poly.inners())
      ring_to_wgs84(inner, crs);
  }

  // closes open rings and fixes winding; does not repair self-intersections
  bg::correct(mp);
  std::string why;
  if (!bg::is_valid(mp, why))
    throw GeometryError("invalid boundary: " + why);
  return mp;
}

bool CoverageResolver::path_intersects(const std::vector<Coord> &path,
                                       const GeoMultiPolygon &boundary) {
  if (path.empty())
    return false;

  GeoLine line;
  for (const auto &c : path) {
    // drop consecutive duplicates; a zero-length leg collapses to one point
    if (!line.empty() && line.back().x() == c[0] && line.back().y() == c[1])
      continue;
    line.emplace_back(c[0], c[1]);
  }
  if (line.size() == 1)
    return bg::covered_by(line.front(), boundary);
  return bg::intersects(line, boundary);
}

CoverageResult CoverageResolver::resolve(const std::vector<Region> &regions,
                                         const std::vector<Route> &routes) const {
  CoverageResult out;

  // route envelopes once, for the cheap pre-filter
  std::vector<GeoUtils::BBox> route_boxes;
  route_boxes.reserve(routes.size());
  for (const auto &r : routes)
    route_boxes.push_back(GeoUtils::compute_bbox(r.path));

  for (const auto &region : regions) {
    bool visited = false;
    try {
      const GeoMultiPolygon boundary = prepare_boundary(region);
      GeoBox env;
      bg::envelope(boundary, env);
      const GeoUtils::BBox region_box{env.min_corner().x(),
                                      env.min_corner().y(),
                                      env.max_corner().x(),
                                      env.max_corner().y()};

      for (std::size_t i = 0; i < routes.size(); ++i) {
        const Route &route = routes[i];
        if (route.path.empty() ||
            !GeoUtils::bbox_overlap(route_boxes[i], region_box))
          continue;
        if (!path_intersects(route.path, boundary))
          continue;
        out.hits.push_back({region.id, route.segment.index});
        out.visited.insert(region.id); // set: repeated hits collapse here
        visited = true;
      }
    } catch (const GeometryError &e) {
      std::cerr << "[coverage] region " << region.id
                << " skipped: " << e.what() << "\n";
      out.failures.push_back({region.id, e.what()});
    }
    out.flags.push_back({region.id, region.name, visited});
  }
  return out;
}

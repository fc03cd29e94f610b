#pragma once

#include <array>
#include <boost/geometry/geometries/multi_polygon.hpp>
#include <boost/geometry/geometries/point_xy.hpp>
#include <boost/geometry/geometries/polygon.hpp>
#include <cstddef>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using Json = nlohmann::json;
using Coord = std::array<double, 2>; // [lon, lat]

// Planar geometry used for coverage tests. x = lon, y = lat once reprojected.
using GeoPoint = boost::geometry::model::d2::point_xy<double>;
using GeoPolygon = boost::geometry::model::polygon<GeoPoint>;
using GeoMultiPolygon = boost::geometry::model::multi_polygon<GeoPolygon>;

// A named stop on the itinerary. Order in the store is the visit order.
struct Waypoint {
  std::string name;
  Coord coord{0.0, 0.0}; // [lon, lat], WGS84
};

// Adjacent origin -> destination pair. `index` is the leg number (0-based).
struct Segment {
  std::size_t index = 0;
  Waypoint origin;
  Waypoint destination;
};

// Realized path for one Segment, exactly as the routing provider returned it.
struct Route {
  Segment segment;
  std::vector<Coord> path; // [lon, lat] polyline
  double distance_m = 0.0;
  double duration_s = 0.0;
};

// Administrative boundary (state/province) from the static catalog.
// `boundary` is kept in the catalog's own CRS; the resolver reprojects it.
struct Region {
  std::string id;
  std::string name;
  std::string crs = "EPSG:4326";
  GeoMultiPolygon boundary;
};

// A Route together with the display strings attached for presentation.
struct TripLeg {
  Route route;
  std::string distance_label; // e.g. "1,240 miles"
  std::string duration_label; // e.g. "16 hours 45 minutes"
};

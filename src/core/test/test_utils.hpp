#pragma once

#include "core/Errors.hpp"
#include "core/RouteProvider.hpp"
#include "models/CoreTypes.hpp"

#include <boost/geometry/algorithms/correct.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace tripmap_test {

// Great-circle length of a polyline in metres (mean earth radius).
inline double path_length_m(const std::vector<Coord> &path) {
  const double rad = M_PI / 180.0;
  double total = 0.0;
  for (std::size_t i = 0; i + 1 < path.size(); ++i) {
    const Coord &a = path[i];
    const Coord &b = path[i + 1];
    const double h =
        std::pow(std::sin((b[1] - a[1]) * rad / 2), 2) +
        std::cos(a[1] * rad) * std::cos(b[1] * rad) *
            std::pow(std::sin((b[0] - a[0]) * rad / 2), 2);
    total += 2 * 6371000.0 * std::asin(std::sqrt(std::min(1.0, h)));
  }
  return total;
}

// WGS84 degrees -> Web Mercator metres, for building EPSG:3857 fixtures.
inline Coord lon_lat_to_mercator(double lon, double lat) {
  const double r = 6378137.0;
  const double rad = M_PI / 180.0;
  return {r * lon * rad, r * std::log(std::tan(M_PI / 4.0 + lat * rad / 2.0))};
}

// Routes every segment along the straight line between its endpoints.
// Distance is the haversine length; duration assumes 25 m/s.
//
// Failures are injected per segment index: `unavailable` fails with
// RoutingUnavailable for the first `flaky_attempts` calls (or forever when
// flaky_attempts < 0), `no_route` always fails with NoRouteFound.
// `delay_ms` holds each call open so overlapping calls can be counted.
class StraightLineProvider : public RouteProvider {
public:
  std::set<std::size_t> unavailable;
  std::set<std::size_t> no_route;
  int flaky_attempts = -1;
  int delay_ms = 0;

  Route route(const Segment &segment) const override {
    const int n = record_call(segment.index);
    InFlight guard(*this);
    if (delay_ms > 0)
      std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
    if (no_route.count(segment.index))
      throw NoRouteFound("NoRoute: impossible route between points");
    if (unavailable.count(segment.index) &&
        (flaky_attempts < 0 || n <= flaky_attempts))
      throw RoutingUnavailable("request failed: Connection timed out");

    Route r;
    r.segment = segment;
    r.path = {segment.origin.coord, segment.destination.coord};
    r.distance_m = path_length_m(r.path);
    r.duration_s = r.distance_m / 25.0;
    return r;
  }

  int calls(std::size_t index) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = calls_.find(index);
    return it == calls_.end() ? 0 : it->second;
  }

  // Most calls ever running at once.
  int peak_in_flight() const {
    std::lock_guard<std::mutex> lock(mu_);
    return peak_;
  }

private:
  struct InFlight {
    const StraightLineProvider &p;
    explicit InFlight(const StraightLineProvider &owner) : p(owner) {
      std::lock_guard<std::mutex> lock(p.mu_);
      p.peak_ = std::max(p.peak_, ++p.in_flight_);
    }
    ~InFlight() {
      std::lock_guard<std::mutex> lock(p.mu_);
      --p.in_flight_;
    }
  };

  int record_call(std::size_t index) const {
    std::lock_guard<std::mutex> lock(mu_);
    return ++calls_[index];
  }

  mutable std::mutex mu_;
  mutable std::map<std::size_t, int> calls_;
  mutable int in_flight_ = 0;
  mutable int peak_ = 0;
};

inline Waypoint wp(const std::string &name, double lon, double lat) {
  Waypoint w;
  w.name = name;
  w.coord = {lon, lat};
  return w;
}

// Axis-aligned rectangle region in lon/lat.
inline Region rect_region(const std::string &id, double min_x, double min_y,
                          double max_x, double max_y) {
  Region r;
  r.id = id;
  r.name = "Region " + id;
  GeoPolygon poly;
  poly.outer() = {GeoPoint(min_x, min_y), GeoPoint(min_x, max_y),
                  GeoPoint(max_x, max_y), GeoPoint(max_x, min_y),
                  GeoPoint(min_x, min_y)};
  boost::geometry::correct(poly);
  r.boundary.push_back(poly);
  return r;
}

inline Route straight_route(std::size_t index, const Waypoint &a,
                            const Waypoint &b) {
  Route r;
  r.segment = Segment{index, a, b};
  r.path = {a.coord, b.coord};
  r.distance_m = path_length_m(r.path);
  r.duration_s = r.distance_m / 25.0;
  return r;
}

} // namespace tripmap_test

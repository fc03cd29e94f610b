#pragma once

#include "models/CoreTypes.hpp"
#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <set>
#include <string>
#include <vector>

// Results handed to presentation. Failures travel next to the successes so
// the caller can decide whether a partial trip is acceptable.

enum class FailureKind : std::uint8_t { RoutingUnavailable, NoRouteFound };

inline const char *to_string(FailureKind k) {
  switch (k) {
  case FailureKind::RoutingUnavailable:
    return "routing_unavailable";
  case FailureKind::NoRouteFound:
    return "no_route_found";
  }
  return "unknown";
}

// One leg the provider could not route.
struct SegmentFailure {
  Segment segment;
  FailureKind kind = FailureKind::RoutingUnavailable;
  std::string reason;
  int attempts = 0;
};

// One region whose intersection test could not be evaluated.
struct RegionFailure {
  std::string region_id;
  std::string reason;
};

// Diagnostic row: region `region_id` intersects the route of leg
// `route_index`. Several rows may name the same region.
struct RegionHit {
  std::string region_id;
  std::size_t route_index = 0;
};

// Per-region visited flag, in catalog order.
struct RegionFlag {
  std::string id;
  std::string name;
  bool visited = false;
};

struct CoverageResult {
  std::set<std::string> visited; // the coverage set, keyed by region id
  std::vector<RegionFlag> flags;
  std::vector<RegionHit> hits;
  std::vector<RegionFailure> failures;

  bool is_visited(const std::string &region_id) const {
    return visited.count(region_id) > 0;
  }
};

struct TripResult {
  std::vector<Waypoint> waypoints;
  std::vector<TripLeg> legs; // successful legs, in segment order
  std::vector<SegmentFailure> failures;
  CoverageResult coverage;

  double total_distance_m = 0.0;
  double total_duration_s = 0.0;
  std::string total_distance_label;
  std::string total_duration_label;

  bool ok() const { return failures.empty() && coverage.failures.empty(); }
};

// ---- to_json overloads (used by json(...) conversions) ----

inline void to_json(Json &j, const Waypoint &w) {
  j = Json{{"name", w.name}, {"lon", w.coord[0]}, {"lat", w.coord[1]}};
}

inline void to_json(Json &j, const TripLeg &leg) {
  const Route &r = leg.route;
  Json geom = Json::array();
  for (const auto &c : r.path)
    geom.push_back({c[0], c[1]});
  j = Json{{"index", r.segment.index},
           {"day", r.segment.index + 1},
           {"origin", r.segment.origin.name},
           {"destination", r.segment.destination.name},
           {"distance_m", r.distance_m},
           {"duration_s", r.duration_s},
           {"distance", leg.distance_label},
           {"duration", leg.duration_label},
           {"geometry", geom}};
}

inline void to_json(Json &j, const SegmentFailure &f) {
  j = Json{{"index", f.segment.index},
           {"origin", f.segment.origin.name},
           {"destination", f.segment.destination.name},
           {"kind", to_string(f.kind)},
           {"reason", f.reason},
           {"attempts", f.attempts}};
}

inline void to_json(Json &j, const RegionFailure &f) {
  j = Json{{"region_id", f.region_id}, {"reason", f.reason}};
}

inline void to_json(Json &j, const RegionHit &h) {
  j = Json{{"region_id", h.region_id}, {"route_index", h.route_index}};
}

inline void to_json(Json &j, const RegionFlag &f) {
  j = Json{{"id", f.id}, {"name", f.name}, {"visited", f.visited}};
}

inline void to_json(Json &j, const TripResult &t) {
  j = Json::object();
  j["ok"] = t.ok();
  j["waypoints"] = t.waypoints;
  j["legs"] = t.legs;
  j["totals"] = {{"distance_m", t.total_distance_m},
                 {"duration_s", t.total_duration_s},
                 {"distance", t.total_distance_label},
                 {"duration", t.total_duration_label}};
  j["regions"] = t.coverage.flags;
  // std::set iterates sorted, so the list is stable across runs
  j["coverage"] = Json(t.coverage.visited);
  j["hits"] = t.coverage.hits;
  j["failures"] = {{"segments", t.failures},
                   {"regions", t.coverage.failures}};
}

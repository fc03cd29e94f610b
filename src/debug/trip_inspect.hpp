#pragma once
#include "models/TripResult.hpp"
#include <algorithm>
#include <nlohmann/json.hpp>

// Compact digest of a trip run: counts, labels and a few sample coordinates
// per leg, without full geometries.
inline nlohmann::json summarize(const TripResult &t, std::size_t sample_n = 3) {
  using nlohmann::json;
  json out;
  out["ok"] = t.ok();
  out["waypoints"] = t.waypoints.size();

  json legs = json::array();
  for (const auto &leg : t.legs) {
    const Route &r = leg.route;
    json samples = json::array();
    const auto N = std::min(sample_n, r.path.size());
    for (std::size_t i = 0; i < N; ++i)
      samples.push_back({{"lon", r.path[i][0]}, {"lat", r.path[i][1]}});
    legs.push_back({{"index", r.segment.index},
                    {"label", r.segment.origin.name + " -> " +
                                  r.segment.destination.name},
                    {"geometry_points", r.path.size()},
                    {"distance", leg.distance_label},
                    {"duration", leg.duration_label},
                    {"sample_coords", samples}});
  }
  out["legs"] = legs;
  out["totals"] = {{"distance", t.total_distance_label},
                   {"duration", t.total_duration_label}};

  out["coverage"] = {{"regions", t.coverage.flags.size()},
                     {"visited", Json(t.coverage.visited)},
                     {"hits", t.coverage.hits.size()}};

  json failed_legs = json::array();
  for (const auto &f : t.failures)
    failed_legs.push_back(std::to_string(f.segment.index) + ": " +
                          to_string(f.kind) + " (" + f.reason + ")");
  json failed_regions = json::array();
  for (const auto &f : t.coverage.failures)
    failed_regions.push_back(f.region_id + ": " + f.reason);
  out["failures"] = {{"segments", failed_legs}, {"regions", failed_regions}};
  return out;
}

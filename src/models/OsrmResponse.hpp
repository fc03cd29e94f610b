#pragma once

#include "models/CoreTypes.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

// Structures modelling the subset of OSRM's /route JSON response we care
// about: route geometry, distance and duration. Requests always ask for
// `geometries=geojson&overview=full&steps=false`.

// ---------- Geometry ----------
struct Geometry {
  std::string type; // "LineString"
  std::vector<Coord> coordinates;
};

// ---------- Route -------------
struct OsrmRoute {
  Geometry geometry;
  double duration = 0.0;
  double distance = 0.0;
};

struct OsrmResponse {
  std::string code;    // "Ok", "NoRoute", "NoSegment", "InvalidQuery", ...
  std::string message; // only present on errors
  std::vector<OsrmRoute> routes;

  bool ok() const { return code == "Ok"; }
  // Provider reachable but no viable path between the points.
  bool no_route() const {
    return code == "NoRoute" || code == "NoSegment" ||
           (ok() && routes.empty());
  }
};

// Define from_json() overloads for structs to work with json::get() function

// --- Geometry ----
inline void from_json(const Json &j, Geometry &g) {
  g.type = j.value("type", "");
  g.coordinates.clear();
  if (j.contains("coordinates") && j["coordinates"].is_array()) {
    for (const auto &pt : j["coordinates"]) {
      // each point needs at least x and y
      if (pt.is_array() && pt.size() >= 2)
        g.coordinates.push_back({pt[0].get<double>(), pt[1].get<double>()});
    }
  }
}

// --- Route ----
inline void from_json(const Json &j, OsrmRoute &r) {
  if (j.contains("geometry") && j["geometry"].is_object())
    r.geometry = j["geometry"].get<Geometry>();
  r.duration = j.value("duration", 0.0);
  r.distance = j.value("distance", 0.0);
}

// --- OsrmResponse ----
inline void from_json(const Json &j, OsrmResponse &r) {
  if (!j.is_object())
    throw std::runtime_error("OSRM response is not a JSON object");
  r.code = j.value("code", "Error");
  r.message = j.value("message", "");
  r.routes.clear();
  if (j.contains("routes") && j["routes"].is_array()) {
    for (const auto &R : j["routes"])
      r.routes.push_back(R.get<OsrmRoute>());
  }
}

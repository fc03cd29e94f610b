#pragma once
#include "models/CoreTypes.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Ordered, immutable trip itinerary. All loaders validate coordinates and
// throw InputError on the first bad entry.
class WaypointStore {
public:
  WaypointStore() = default;
  explicit WaypointStore(std::vector<Waypoint> waypoints);

  // Accepts `[{name, longitude, latitude}, ...]` or `{"waypoints": [...]}`.
  // `lon`/`lat` are accepted as aliases.
  static WaypointStore from_json(const nlohmann::json &j);
  // CSV with a header row naming `name`, `longitude` and `latitude` columns.
  static WaypointStore from_csv(const std::string &text);
  // Dispatches on extension: .csv -> CSV, anything else -> JSON.
  static WaypointStore load_file(const std::string &path);

  const std::vector<Waypoint> &waypoints() const noexcept { return points_; }
  std::size_t size() const noexcept { return points_.size(); }
  bool empty() const noexcept { return points_.empty(); }

private:
  std::vector<Waypoint> points_;
};

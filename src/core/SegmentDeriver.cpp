#include "core/SegmentDeriver.hpp"

std::vector<Segment> derive_segments(const std::vector<Waypoint> &waypoints) {
  std::vector<Segment> segments;
  if (waypoints.size() < 2)
    return segments;

  segments.reserve(waypoints.size() - 1);
  for (std::size_t k = 0; k + 1 < waypoints.size(); ++k)
    segments.push_back(Segment{k, waypoints[k], waypoints[k + 1]});
  return segments;
}

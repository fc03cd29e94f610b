#pragma once
#include "models/CoreTypes.hpp"
#include <vector>

// Adjacent origin -> destination pairs of an itinerary: segment k joins
// waypoint k and waypoint k+1. Fewer than two waypoints give no segments.
std::vector<Segment> derive_segments(const std::vector<Waypoint> &waypoints);

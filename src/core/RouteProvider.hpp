#pragma once
#include "models/CoreTypes.hpp"

// Source of driving routes. Implementations throw RoutingUnavailable for
// transient failures and NoRouteFound when the points cannot be connected.
// route() is called from several worker threads at once and must not share
// mutable state between calls.
class RouteProvider {
public:
  virtual ~RouteProvider() = default;

  // Geometry, distance (m) and duration (s) for one segment, unconverted.
  virtual Route route(const Segment &segment) const = 0;
};

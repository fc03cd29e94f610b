#pragma once

#include <stdexcept>
#include <string>

// Error taxonomy for a trip run. InputError aborts the run; the others are
// caught per segment / per region and reported next to the successes.

// Bad waypoints, coordinates, documents or settings.
class InputError : public std::runtime_error {
public:
  explicit InputError(const std::string &what) : std::runtime_error(what) {}
};

// Transient provider failure: network, timeout, 5xx, malformed body.
class RoutingUnavailable : public std::runtime_error {
public:
  explicit RoutingUnavailable(const std::string &what)
      : std::runtime_error(what) {}
};

// Provider reachable but no viable path between the two points.
class NoRouteFound : public std::runtime_error {
public:
  explicit NoRouteFound(const std::string &what) : std::runtime_error(what) {}
};

// Invalid boundary or unsupported coordinate system for one region.
class GeometryError : public std::runtime_error {
public:
  explicit GeometryError(const std::string &what)
      : std::runtime_error(what) {}
};

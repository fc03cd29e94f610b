#pragma once
#include "core/RouteProvider.hpp"
#include "models/OsrmResponse.hpp"
#include "models/params.hpp"
#include <string>

// RouteProvider backed by an OSRM HTTP server (`/route/v1/{profile}/...`).
class OsrmRouteProvider final : public RouteProvider {
public:
  explicit OsrmRouteProvider(RoutingParams params);

  Route route(const Segment &segment) const override;

  // Request path (without host) for one segment.
  std::string request_path(const Segment &segment) const;

  // Turns a decoded response into a Route, or throws NoRouteFound /
  // RoutingUnavailable. Split out so it can be exercised without a server.
  static Route to_route(const Segment &segment, const OsrmResponse &resp);

private:
  RoutingParams params_;
};

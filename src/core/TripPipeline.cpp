#include "core/TripPipeline.hpp"
#include "core/Errors.hpp"
#include "core/RouteFetcher.hpp"
#include "core/SegmentDeriver.hpp"
#include <iostream>
#include <utility>

TripPipeline::TripPipeline(const RouteProvider &provider,
                           const RegionCatalog &catalog, TripParams params)
    : provider_(provider), catalog_(catalog), P(std::move(params)),
      fmt_(P.formatting) {}

TripLeg TripPipeline::make_leg(Route route) const {
  TripLeg leg;
  leg.distance_label = fmt_.format_distance(route.distance_m);
  leg.duration_label = fmt_.format_duration(route.duration_s);
  leg.route = std::move(route);
  return leg;
}

TripResult TripPipeline::run(const WaypointStore &store) const {
  if (store.size() < 2)
    throw InputError("a trip needs at least 2 waypoints, got " +
                     std::to_string(store.size()));

  TripResult result;
  result.waypoints = store.waypoints();

  // ---------------------- Segments + routes -------------------------------
  const std::vector<Segment> segments = derive_segments(store.waypoints());
  RouteFetcher fetcher(provider_, P.routing);
  FetchOutcome fetched = fetcher.fetch_all(segments);
  result.failures = std::move(fetched.failures);

  // ---------------------- Coverage ----------------------------------------
  // runs over successful routes only; failed legs have no geometry
  result.coverage = resolver_.resolve(catalog_.regions(), fetched.routes);

  // ---------------------- Labels ------------------------------------------
  result.legs.reserve(fetched.routes.size());
  for (auto &route : fetched.routes) {
    result.total_distance_m += route.distance_m;
    result.total_duration_s += route.duration_s;
    result.legs.push_back(make_leg(std::move(route)));
  }
  result.total_distance_label = fmt_.format_distance(result.total_distance_m);
  result.total_duration_label = fmt_.format_duration(result.total_duration_s);

  std::cout << "[trip] " << result.legs.size() << "/" << segments.size()
            << " legs routed, " << result.coverage.visited.size() << "/"
            << catalog_.size() << " regions visited";
  if (!result.ok())
    std::cout << ", " << result.failures.size() << " leg failures, "
              << result.coverage.failures.size() << " region failures";
  std::cout << std::endl;
  return result;
}

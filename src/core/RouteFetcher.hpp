#pragma once
#include "core/RouteProvider.hpp"
#include "models/TripResult.hpp"
#include "models/params.hpp"
#include <utility>
#include <vector>

// Result slot for one segment: either a route or the reason it failed.
struct FetchSlot {
  bool ok = false;
  Route route;
  SegmentFailure failure;
};

struct FetchOutcome {
  std::vector<Route> routes; // successful routes, in segment order
  std::vector<SegmentFailure> failures;
};

// Fans route requests out over a bounded pool of worker threads. Each
// segment owns the slot at its position, so results come back in trip order
// without sorting. RoutingUnavailable is retried with exponential backoff;
// NoRouteFound is final.
class RouteFetcher {
public:
  RouteFetcher(const RouteProvider &provider, RoutingParams params)
      : provider_(provider), P(std::move(params)) {}

  FetchOutcome fetch_all(const std::vector<Segment> &segments) const;

  // One segment, retries included. Never throws for provider failures.
  FetchSlot fetch_one(const Segment &segment) const;

  // Delay before retrying after failed `attempt` (1-based): backoff_ms
  // doubled per attempt, capped at max_backoff_ms.
  long long backoff_delay_ms(int attempt) const;

private:
  const RouteProvider &provider_;
  RoutingParams P;
};

#pragma once
#include "core/CoverageResolver.hpp"
#include "core/MeasurementFormatter.hpp"
#include "core/RegionCatalog.hpp"
#include "core/RouteProvider.hpp"
#include "core/WaypointStore.hpp"
#include "models/TripResult.hpp"
#include "models/params.hpp"

// Runs one trip: waypoints -> segments -> routes (concurrent, partial
// failures kept) -> formatted legs, and routes -> region coverage.
// Holds no per-run state; run() may be called repeatedly and concurrently.
class TripPipeline {
public:
  TripPipeline(const RouteProvider &provider, const RegionCatalog &catalog,
               TripParams params = TripParams{});

  // Throws InputError for fewer than two waypoints. Routing and geometry
  // failures are reported inside the result instead.
  TripResult run(const WaypointStore &store) const;

  TripLeg make_leg(Route route) const;
  const MeasurementFormatter &formatter() const noexcept { return fmt_; }

private:
  const RouteProvider &provider_;
  const RegionCatalog &catalog_;
  TripParams P;
  MeasurementFormatter fmt_;
  CoverageResolver resolver_;
};

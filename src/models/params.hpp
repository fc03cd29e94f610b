#pragma once

#include "core/Errors.hpp"
#include <nlohmann/json.hpp>
#include <string>

// Routing provider settings (`routing` section of config/settings.json).
struct RoutingParams {
  std::string base_url = "http://router.project-osrm.org";
  std::string profile = "driving";
  int timeout_seconds = 30;
  int max_concurrency = 4;
  int max_retries = 2;
  int backoff_ms = 250;       // first retry delay, doubled per attempt
  int max_backoff_ms = 10000; // ceiling on a single retry delay

  static constexpr int kMaxRetries = 10;

  static RoutingParams from_json(const nlohmann::json &j) {
    RoutingParams p;
    if (j.contains("base_url"))
      p.base_url = j.at("base_url").get<std::string>();
    if (j.contains("profile"))
      p.profile = j.at("profile").get<std::string>();
    if (j.contains("timeout_seconds"))
      p.timeout_seconds = j.at("timeout_seconds").get<int>();
    if (j.contains("max_concurrency"))
      p.max_concurrency = j.at("max_concurrency").get<int>();
    if (j.contains("max_retries"))
      p.max_retries = j.at("max_retries").get<int>();
    if (j.contains("backoff_ms"))
      p.backoff_ms = j.at("backoff_ms").get<int>();
    if (j.contains("max_backoff_ms"))
      p.max_backoff_ms = j.at("max_backoff_ms").get<int>();

    if (p.timeout_seconds <= 0)
      throw InputError("routing.timeout_seconds must be positive");
    if (p.max_concurrency <= 0)
      throw InputError("routing.max_concurrency must be positive");
    if (p.max_retries < 0 || p.max_retries > kMaxRetries)
      throw InputError("routing.max_retries must be between 0 and " +
                       std::to_string(kMaxRetries));
    if (p.backoff_ms < 0)
      throw InputError("routing.backoff_ms must not be negative");
    if (p.max_backoff_ms < p.backoff_ms)
      throw InputError("routing.max_backoff_ms must not be below backoff_ms");
    return p;
  }
};

// Display rounding (`formatting` section).
struct FormatParams {
  double distance_granularity = 10.0;   // miles
  int duration_increment_minutes = 15;

  static FormatParams from_json(const nlohmann::json &j) {
    FormatParams p;
    if (j.contains("distance_granularity"))
      p.distance_granularity = j.at("distance_granularity").get<double>();
    if (j.contains("duration_increment_minutes"))
      p.duration_increment_minutes =
          j.at("duration_increment_minutes").get<int>();

    if (!(p.distance_granularity > 0.0))
      throw InputError("formatting.distance_granularity must be positive");
    if (p.duration_increment_minutes <= 0)
      throw InputError(
          "formatting.duration_increment_minutes must be positive");
    return p;
  }
};

// Region catalog source (`regions` section).
struct CatalogParams {
  std::string catalog = "data/regions.geojson";
  std::string crs = "EPSG:4326";
  std::string id_property = "id";
  std::string name_property = "name";

  static CatalogParams from_json(const nlohmann::json &j) {
    CatalogParams p;
    if (j.contains("catalog"))
      p.catalog = j.at("catalog").get<std::string>();
    if (j.contains("crs"))
      p.crs = j.at("crs").get<std::string>();
    if (j.contains("id_property"))
      p.id_property = j.at("id_property").get<std::string>();
    if (j.contains("name_property"))
      p.name_property = j.at("name_property").get<std::string>();
    return p;
  }
};

// Whole settings document. Missing sections fall back to defaults.
struct TripParams {
  RoutingParams routing;
  FormatParams formatting;
  CatalogParams regions;

  static TripParams from_json(const nlohmann::json &j) {
    TripParams p;
    if (j.contains("routing"))
      p.routing = RoutingParams::from_json(j.at("routing"));
    if (j.contains("formatting"))
      p.formatting = FormatParams::from_json(j.at("formatting"));
    if (j.contains("regions"))
      p.regions = CatalogParams::from_json(j.at("regions"));
    return p;
  }
};

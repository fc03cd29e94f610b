#pragma once
#include "models/CoreTypes.hpp"
#include "models/params.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Static catalog of administrative boundaries, loaded once from a GeoJSON
// FeatureCollection of Polygon / MultiPolygon features and read-only after.
//
// Region ids come from `properties[id_property]` (strings or numbers) and
// must be unique. The CRS is the catalog's `crs` member when present,
// otherwise `CatalogParams::crs`. Boundaries are stored untouched; geometry
// problems surface later, per region, in the CoverageResolver.
class RegionCatalog {
public:
  RegionCatalog() = default;
  explicit RegionCatalog(std::vector<Region> regions);

  static RegionCatalog from_geojson(const nlohmann::json &fc,
                                    const CatalogParams &params);
  static RegionCatalog load_file(const CatalogParams &params);

  const std::vector<Region> &regions() const noexcept { return regions_; }
  std::size_t size() const noexcept { return regions_.size(); }
  // nullptr when the id is unknown
  const Region *find(const std::string &id) const;

private:
  std::vector<Region> regions_;
};

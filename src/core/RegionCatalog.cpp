#include "core/RegionCatalog.hpp"
#include "core/Errors.hpp"
#include <fstream>
#include <iostream>
#include <set>
#include <utility>

using json = nlohmann::json;

RegionCatalog::RegionCatalog(std::vector<Region> regions)
    : regions_(std::move(regions)) {
  std::set<std::string> seen;
  for (const auto &r : regions_) {
    if (!seen.insert(r.id).second)
      throw InputError("duplicate region id '" + r.id + "' in catalog");
  }
}

const Region *RegionCatalog::find(const std::string &id) const {
  for (const auto &r : regions_) {
    if (r.id == id)
      return &r;
  }
  return nullptr;
}

// --- GeoJSON helpers -----------------------------------------------------

// one linear ring: [[x,y], ...]
static void read_ring(const json &j, std::vector<GeoPoint> &ring) {
  ring.clear();
  if (!j.is_array())
    return;
  for (const auto &pt : j) {
    if (pt.is_array() && pt.size() >= 2 && pt[0].is_number() &&
        pt[1].is_number())
      ring.emplace_back(pt[0].get<double>(), pt[1].get<double>());
  }
}

// polygon: [outer, hole, hole, ...]
static GeoPolygon read_polygon(const json &rings) {
  GeoPolygon poly;
  if (!rings.is_array() || rings.empty())
    return poly;
  read_ring(rings[0], poly.outer());
  for (std::size_t i = 1; i < rings.size(); ++i) {
    poly.inners().emplace_back();
    read_ring(rings[i], poly.inners().back());
  }
  return poly;
}

static GeoMultiPolygon read_boundary(const json &geom) {
  GeoMultiPolygon mp;
  if (!geom.is_object())
    return mp;
  const std::string type = geom.value("type", "");
  const json &coords = geom.contains("coordinates") ? geom["coordinates"]
                                                    : json::array();
  if (type == "Polygon") {
    mp.push_back(read_polygon(coords));
  } else if (type == "MultiPolygon" && coords.is_array()) {
    for (const auto &p : coords)
      mp.push_back(read_polygon(p));
  }
  return mp;
}

static std::string property_string(const json &props, const std::string &key) {
  if (!props.is_object() || !props.contains(key))
    return {};
  const auto &v = props[key];
  if (v.is_string())
    return v.get<std::string>();
  if (v.is_number_integer())
    return std::to_string(v.get<long long>());
  if (v.is_number())
    return v.dump();
  return {};
}

RegionCatalog RegionCatalog::from_geojson(const json &fc,
                                          const CatalogParams &params) {
  if (!fc.is_object() || fc.value("type", "") != "FeatureCollection")
    throw InputError("region catalog must be a GeoJSON FeatureCollection");

  std::string crs = params.crs;
  // legacy GeoJSON: {"crs": {"type": "name", "properties": {"name": ...}}}
  if (fc.contains("crs") && fc["crs"].is_object()) {
    const auto &c = fc["crs"];
    if (c.contains("properties") && c["properties"].is_object())
      crs = c["properties"].value("name", crs);
  }

  std::vector<Region> regions;
  const auto &features = fc.value("features", json::array());
  regions.reserve(features.size());
  std::size_t i = 0;
  for (const auto &feat : features) {
    const json props =
        feat.contains("properties") ? feat["properties"] : json::object();
    Region r;
    r.id = property_string(props, params.id_property);
    if (r.id.empty() && feat.contains("id"))
      r.id = feat["id"].is_string() ? feat["id"].get<std::string>()
                                    : feat["id"].dump();
    if (r.id.empty())
      throw InputError("region feature " + std::to_string(i) +
                       " has no '" + params.id_property + "' property");
    r.name = property_string(props, params.name_property);
    if (r.name.empty())
      r.name = r.id;
    r.crs = crs;
    if (feat.contains("geometry"))
      r.boundary = read_boundary(feat["geometry"]);
    if (r.boundary.empty())
      std::cerr << "[catalog] region " << r.id
                << " has no polygon geometry\n";
    regions.push_back(std::move(r));
    ++i;
  }
  return RegionCatalog(std::move(regions));
}

RegionCatalog RegionCatalog::load_file(const CatalogParams &params) {
  std::ifstream in(params.catalog);
  if (!in)
    throw InputError("cannot open region catalog " + params.catalog);
  json fc;
  try {
    in >> fc;
  } catch (const json::parse_error &e) {
    throw InputError("region catalog " + params.catalog +
                     " is not valid JSON: " + e.what());
  }
  RegionCatalog cat = from_geojson(fc, params);
  std::cout << "[catalog] loaded " << cat.size() << " regions from "
            << params.catalog << "\n";
  return cat;
}

#pragma once
#include "models/CoreTypes.hpp"
#include <string>
#include <vector>

// Coordinate reference systems the engine can reconcile.
enum class Crs { Wgs84, WebMercator, Unknown };

class GeoUtils {
public:
  // true when lon in [-180,180] and lat in [-90,90], both finite
  static bool valid_lon_lat(const Coord &c);

  // "EPSG:4326", "urn:ogc:def:crs:OGC:1.3:CRS84", "EPSG:3857", ...
  static Crs parse_crs(const std::string &name);

  // Web Mercator (metres) -> WGS84 (degrees)
  static Coord mercator_to_lon_lat(double x, double y);

  struct BBox {
    double min_lon, min_lat, max_lon, max_lat;
  };
  // envelope of a polyline; all-zero box for an empty path
  static BBox compute_bbox(const std::vector<Coord> &pts);
  static bool bbox_overlap(const BBox &a, const BBox &b);
};

#include "core/GeoUtils.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

namespace {
constexpr double kMercatorRadiusM = 6378137.0; // WGS84 semi-major axis
constexpr double kDegToRad = M_PI / 180.0;
} // namespace

bool GeoUtils::valid_lon_lat(const Coord &c) {
  return std::isfinite(c[0]) && std::isfinite(c[1]) && c[0] >= -180.0 &&
         c[0] <= 180.0 && c[1] >= -90.0 && c[1] <= 90.0;
}

Crs GeoUtils::parse_crs(const std::string &name) {
  std::string s;
  s.reserve(name.size());
  for (char c : name)
    s.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));

  // accept "EPSG:4326", "urn:ogc:def:crs:EPSG::4326", "...OGC:1.3:CRS84"
  auto ends_with = [&s](const std::string &suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
  };
  if (s.empty() || ends_with(":4326") || ends_with("CRS84") || s == "WGS84")
    return Crs::Wgs84;
  if (ends_with(":3857") || ends_with(":900913") || ends_with(":3785"))
    return Crs::WebMercator;
  return Crs::Unknown;
}

Coord GeoUtils::mercator_to_lon_lat(double x, double y) {
  const double lon = (x / kMercatorRadiusM) / kDegToRad;
  const double lat =
      (2.0 * std::atan(std::exp(y / kMercatorRadiusM)) - M_PI / 2.0) /
      kDegToRad;
  return {lon, lat};
}

GeoUtils::BBox GeoUtils::compute_bbox(const std::vector<Coord> &pts) {
  if (pts.empty())
    return {0.0, 0.0, 0.0, 0.0};
  BBox b{std::numeric_limits<double>::infinity(),
         std::numeric_limits<double>::infinity(),
         -std::numeric_limits<double>::infinity(),
         -std::numeric_limits<double>::infinity()};
  for (const auto &p : pts) {
    b.min_lon = std::min(b.min_lon, p[0]);
    b.min_lat = std::min(b.min_lat, p[1]);
    b.max_lon = std::max(b.max_lon, p[0]);
    b.max_lat = std::max(b.max_lat, p[1]);
  }
  return b;
}

bool GeoUtils::bbox_overlap(const BBox &a, const BBox &b) {
  // closed intervals: touching edges overlap
  return a.min_lon <= b.max_lon && b.min_lon <= a.max_lon &&
         a.min_lat <= b.max_lat && b.min_lat <= a.max_lat;
}

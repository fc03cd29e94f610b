// OsrmRouteProvider issues one GET /route request per segment and maps the
// OSRM response onto a Route, translating every failure into the
// RoutingUnavailable / NoRouteFound pair.

#include "OsrmRouteProvider.hpp"
#include "core/Errors.hpp"
#include "httplib.h"
#include <cmath>
#include <iomanip>
#include <sstream>
#include <utility>

using json = nlohmann::json;

// Split "http://host:5000/osrm" into {"http://host:5000", "/osrm"}
static std::pair<std::string, std::string>
split_base_url(const std::string &url) {
  std::size_t start = 0;
  if (auto pos = url.find("://"); pos != std::string::npos)
    start = pos + 3;
  const auto slash = url.find('/', start);
  if (slash == std::string::npos)
    return {url, ""};
  std::string prefix = url.substr(slash);
  while (!prefix.empty() && prefix.back() == '/')
    prefix.pop_back();
  return {url.substr(0, slash), prefix};
}

OsrmRouteProvider::OsrmRouteProvider(RoutingParams params)
    : params_(std::move(params)) {}

std::string OsrmRouteProvider::request_path(const Segment &s) const {
  std::ostringstream path;
  path.setf(std::ios::fixed);
  path << std::setprecision(6);
  path << split_base_url(params_.base_url).second << "/route/v1/"
       << params_.profile << "/" << s.origin.coord[0] << ","
       << s.origin.coord[1] << ";" << s.destination.coord[0] << ","
       << s.destination.coord[1]
       << "?overview=full&geometries=geojson&steps=false&alternatives=false";
  return path.str();
}

Route OsrmRouteProvider::to_route(const Segment &segment,
                                  const OsrmResponse &resp) {
  if (resp.no_route()) {
    std::string why = resp.code;
    if (!resp.message.empty())
      why += ": " + resp.message;
    throw NoRouteFound(why);
  }
  if (!resp.ok())
    throw RoutingUnavailable("OSRM error " + resp.code +
                             (resp.message.empty() ? "" : ": " + resp.message));

  const OsrmRoute &best = resp.routes.front(); // no alternatives requested
  if (best.geometry.coordinates.empty())
    throw RoutingUnavailable("malformed response: route without geometry");
  if (!std::isfinite(best.distance) || best.distance < 0.0 ||
      !std::isfinite(best.duration) || best.duration < 0.0)
    throw RoutingUnavailable("malformed response: bad distance/duration");

  Route r;
  r.segment = segment;
  r.path = best.geometry.coordinates;
  r.distance_m = best.distance;
  r.duration_s = best.duration;
  return r;
}

Route OsrmRouteProvider::route(const Segment &segment) const {
  const std::string host = split_base_url(params_.base_url).first;
  // httplib::Client is not shareable across threads; one per request
  httplib::Client cli(host);
  cli.set_connection_timeout(params_.timeout_seconds, 0);
  cli.set_read_timeout(params_.timeout_seconds, 0);
  cli.set_write_timeout(params_.timeout_seconds, 0);
  httplib::Headers headers = {{"User-Agent", "tripmap/1.0"}};

  const std::string path = request_path(segment);
  auto res = cli.Get(path, headers);
  if (!res)
    throw RoutingUnavailable("request to " + host + " failed: " +
                             httplib::to_string(res.error()));
  if (res->status >= 500)
    throw RoutingUnavailable("OSRM returned HTTP " +
                             std::to_string(res->status));

  OsrmResponse resp;
  try {
    resp = json::parse(res->body).get<OsrmResponse>();
  } catch (const std::exception &e) {
    // 4xx bodies from proxies are usually HTML, not OSRM JSON
    throw RoutingUnavailable("malformed response (HTTP " +
                             std::to_string(res->status) + "): " + e.what());
  }
  return to_route(segment, resp);
}

#include "http_handler.hpp"
#include "core/Errors.hpp"
#include "debug/json_debug.hpp"
#include "debug/trip_inspect.hpp"
#include <iostream>

using json = nlohmann::json;

// ===== routes =====

void HttpHandler::callPostHandler(const std::string &action,
                                  const httplib::Request &req,
                                  httplib::Response &res) {
  if (action == "trip") {
    handleTrip(req, res);
  } else if (action == "debug") {
    handleDebug(req, res);
  } else {
    res.status = 404;
    res.set_content("Unknown action: " + action, "text/plain");
  }
}

void HttpHandler::callGetHandler(const std::string &action,
                                 const httplib::Request &req,
                                 httplib::Response &res) {
  if (action == "regions") {
    handleRegions(req, res);
  } else if (action == "ping") {
    handlePing(req, res);
  }
  // default
  else {
    res.status = 404;
    res.set_content("Unknown action: " + action, "text/plain");
  }
}

// --- helper: run the pipeline on a waypoint body, mapping errors to status.
// Returns false (with `res` filled) when the trip could not run at all.
static bool run_trip(const TripPipeline &pipeline, const json &body,
                     TripResult &out, httplib::Response &res) {
  try {
    out = pipeline.run(WaypointStore::from_json(body));
    return true;
  } catch (const InputError &e) {
    res.status = 400;
    res.set_content(
        json{{"ok", false}, {"kind", "input_error"}, {"what", e.what()}}.dump(),
        "application/json");
  } catch (const json::exception &e) {
    res.status = 400;
    res.set_content(
        json{{"ok", false}, {"kind", "type_error"}, {"what", e.what()}}.dump(),
        "application/json");
  }
  return false;
}

// ===== POST: /trip =====

void HttpHandler::handleTrip(const httplib::Request &req,
                             httplib::Response &res) {
  json body;
  try {
    body = json::parse(req.body);
  } catch (const json::parse_error &e) {
    res.status = 400;
    res.set_content(describe_parse_error(req.body, e).dump(),
                    "application/json");
    return;
  }

  TripResult trip;
  if (!run_trip(pipeline_, body, trip, res))
    return;
  res.set_content(json(trip).dump(), "application/json");
}

// ===== POST: /debug =====

void HttpHandler::handleDebug(const httplib::Request &req,
                              httplib::Response &res) {
  json body;
  try {
    body = json::parse(req.body);
  } catch (const json::parse_error &e) {
    res.status = 400;
    res.set_content(describe_parse_error(req.body, e).dump(2),
                    "application/json");
    return;
  }

  const std::string inspect =
      req.has_param("inspect") ? req.get_param_value("inspect") : "";
  if (inspect == "trip") {
    TripResult trip;
    if (!run_trip(pipeline_, body, trip, res))
      return;
    res.set_content(summarize(trip).dump(2), "application/json");
    return;
  }

  json ok = {{"ok", true}, {"message", "JSON parsed successfully"}};
  res.set_content(ok.dump(), "application/json");
}

// ===== GET: /regions =====

void HttpHandler::handleRegions(const httplib::Request &req,
                                httplib::Response &res) {
  // ?id=CO -> that one region
  if (req.has_param("id")) {
    const std::string id = req.get_param_value("id");
    const Region *r = catalog_.find(id);
    if (!r) {
      res.status = 404;
      res.set_content(json{{"ok", false}, {"what", "unknown region " + id}}.dump(),
                      "application/json");
      return;
    }
    res.set_content(json{{"id", r->id},
                         {"name", r->name},
                         {"crs", r->crs},
                         {"polygons", r->boundary.size()}}
                        .dump(),
                    "application/json");
    return;
  }

  json arr = json::array();
  for (const auto &r : catalog_.regions())
    arr.push_back({{"id", r.id}, {"name", r.name}, {"crs", r.crs}});
  res.set_content(json{{"count", arr.size()}, {"regions", arr}}.dump(),
                  "application/json");
}

// ===== GET: /ping =====

void HttpHandler::handlePing(const httplib::Request &, httplib::Response &res) {
  res.set_content(R"({"ok":true,"message":"tripmap alive"})",
                  "application/json");
}

#pragma once

#include "core/RegionCatalog.hpp"
#include "core/TripPipeline.hpp"
#include "httplib.h"
#include <nlohmann/json.hpp>
#include <string>

// Thin wrapper around httplib callbacks.  The main server forwards requests to
// these member functions based on the action string parsed from the URL.
class HttpHandler {
public:
  HttpHandler(const TripPipeline &pipeline, const RegionCatalog &catalog)
      : pipeline_(pipeline), catalog_(catalog) {}

  void callPostHandler(const std::string &action, const httplib::Request &req,
                       httplib::Response &res);
  void callGetHandler(const std::string &action, const httplib::Request &req,
                      httplib::Response &res);

private:
  const TripPipeline &pipeline_;
  const RegionCatalog &catalog_;

  // Individual request handlers
  void handleTrip(const httplib::Request &req, httplib::Response &res);
  void handleDebug(const httplib::Request &req, httplib::Response &res);
  void handleRegions(const httplib::Request &req, httplib::Response &res);
  void handlePing(const httplib::Request &req, httplib::Response &res);
};

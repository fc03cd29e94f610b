// Entry point for the tripmap engine.  It loads configuration and the region
// catalog, then either serves the REST endpoints handled by `HttpHandler`, or
// (with --waypoints) runs a single trip and writes the JSON report.

#include "core/Errors.hpp"
#include "core/RegionCatalog.hpp"
#include "core/TripPipeline.hpp"
#include "core/WaypointStore.hpp"
#include "http/http_handler.hpp"
#include "infra/OsrmRouteProvider.hpp"
#include <nlohmann/json.hpp>

#include <cstdio>
#include <cstring>
#include <execinfo.h>
#include <fstream>
#include <iostream>
#include <signal.h>
#include <unistd.h>

using json = nlohmann::json;

static void bt_handler(int sig) {
  void *bt[64];
  int n = backtrace(bt, 64);
  dprintf(2, "\n=== FATAL SIG %d ===\n", sig);
  backtrace_symbols_fd(bt, n, 2);
  _exit(128 + sig);
}
static void install_bt_handlers() {
  signal(SIGSEGV, bt_handler);
  signal(SIGABRT, bt_handler);
  signal(SIGFPE, bt_handler);
  signal(SIGILL, bt_handler);
  signal(SIGBUS, bt_handler);
}

struct CliArgs {
  std::string config = "config/settings.json";
  std::string waypoints; // batch mode when set
  std::string out;       // stdout when empty
};

static void usage(const char *argv0) {
  std::cerr << "usage: " << argv0
            << " [--config settings.json] [--waypoints trip.json|trip.csv"
               " [--out report.json]]\n";
}

static bool parse_args(int argc, char **argv, CliArgs &args) {
  for (int i = 1; i < argc; ++i) {
    const bool has_value = i + 1 < argc;
    if (!std::strcmp(argv[i], "--config") && has_value) {
      args.config = argv[++i];
    } else if (!std::strcmp(argv[i], "--waypoints") && has_value) {
      args.waypoints = argv[++i];
    } else if (!std::strcmp(argv[i], "--out") && has_value) {
      args.out = argv[++i];
    } else {
      return false;
    }
  }
  return true;
}

// Single trip from a file; exit 0 when clean, 2 when the report has failures.
static int run_batch(const TripPipeline &pipeline, const CliArgs &args) {
  TripResult trip = pipeline.run(WaypointStore::load_file(args.waypoints));
  const std::string report = json(trip).dump(2);
  if (args.out.empty()) {
    std::cout << report << std::endl;
  } else {
    std::ofstream out(args.out);
    if (!out) {
      std::cerr << "[main] cannot write " << args.out << "\n";
      return 1;
    }
    out << report << "\n";
    std::cerr << "[main] report written to " << args.out << "\n";
  }
  return trip.ok() ? 0 : 2;
}

int main(int argc, char **argv) {
  install_bt_handlers();

  CliArgs args;
  if (!parse_args(argc, argv, args)) {
    usage(argv[0]);
    return 1;
  }

  // ---------------------- Load configuration ------------------------------
  std::ifstream cfg(args.config);
  if (!cfg) {
    std::cerr << "[ERROR] Cannot open " << args.config << "\n";
    return 1;
  }
  json settings;
  TripParams params;
  try {
    cfg >> settings;
    params = TripParams::from_json(settings);
  } catch (const std::exception &e) {
    std::cerr << "[ERROR] Bad configuration " << args.config << ": "
              << e.what() << "\n";
    return 1;
  }

  // ---------------------- Region catalog + pipeline -----------------------
  RegionCatalog catalog;
  try {
    catalog = RegionCatalog::load_file(params.regions);
  } catch (const InputError &e) {
    std::cerr << "[main] " << e.what() << "\n";
    return 1;
  }
  OsrmRouteProvider provider(params.routing);
  TripPipeline pipeline(provider, catalog, params);

  if (!args.waypoints.empty()) {
    try {
      return run_batch(pipeline, args);
    } catch (const InputError &e) {
      std::cerr << "[main] " << e.what() << "\n";
      return 1;
    } catch (const std::exception &e) {
      std::cerr << "[main] EXCEPTION: " << e.what() << "\n";
      return 1;
    }
  }

  // ---------------------- HTTP server setup -------------------------------
  const json server_cfg = settings.value("server", json::object());
  int port = server_cfg.value("port", 5005);
  std::cout << "[DEBUG] Starting server on port " << port << std::endl;

  httplib::Server server;
  server.set_payload_max_length(1024ull * 1024ull * 16ull); // 16MB
  server.set_read_timeout(60, 0);
  server.set_write_timeout(60, 0);
  HttpHandler handler(pipeline, catalog);

  // ---------------------- Register POST endpoints -------------------------
  const json post_eps =
      server_cfg.value("post_endpoints", json::array({"/trip", "/debug"}));
  for (const auto &ep : post_eps) {
    std::string path = ep.get<std::string>();
    std::string action =
        (!path.empty() && path[0] == '/') ? path.substr(1) : path;
    server.Post(path, [action, &handler](const auto &req, auto &res) {
      try {
        handler.callPostHandler(action, req, res);
      } catch (const std::exception &e) {
        std::cerr << "[POST λ] EXCEPTION: " << e.what() << "\n";
        res.status = 500;
        res.set_content(std::string("exception: ") + e.what(), "text/plain");
      }
    });
  }

  // ---------------------- Register GET endpoints --------------------------
  const json get_eps =
      server_cfg.value("get_endpoints", json::array({"/regions", "/ping"}));
  for (const auto &ep : get_eps) {
    std::string path = ep.get<std::string>();
    std::string action =
        (!path.empty() && path[0] == '/') ? path.substr(1) : path;
    server.Get(path, [action, &handler](const auto &req, auto &res) {
      handler.callGetHandler(action, req, res);
    });
  }

  // ---------------------- Start server ------------------------------------
  if (!server.listen("0.0.0.0", port)) {
    std::cerr << "[main] cannot listen on port " << port << "\n";
    return 1;
  }
  return 0;
}

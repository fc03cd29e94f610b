// REST dispatch on hand-built requests (no socket)

#include "http/http_handler.hpp"
#include "test_utils.hpp"

#include <boost/test/unit_test.hpp>

using tripmap_test::rect_region;
using tripmap_test::StraightLineProvider;
using tripmap_test::wp;

namespace {

struct HandlerFixture {
  StraightLineProvider provider;
  RegionCatalog catalog{std::vector<Region>{
      rect_region("CO", -109, 37, -102, 41),
      rect_region("UT", -114, 37, -109, 42)}};
  TripPipeline pipeline{provider, catalog};
  HttpHandler handler{pipeline, catalog};
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(http_handler_tests, HandlerFixture)

BOOST_AUTO_TEST_CASE(regions_lists_the_catalog) {
  httplib::Request req;
  httplib::Response res;
  handler.callGetHandler("regions", req, res);
  const Json body = Json::parse(res.body);
  BOOST_CHECK_EQUAL(body["count"].get<int>(), 2);
  BOOST_CHECK_EQUAL(body["regions"][1]["id"].get<std::string>(), "UT");
}

BOOST_AUTO_TEST_CASE(region_lookup_by_id) {
  httplib::Request req;
  req.params.emplace("id", "UT");
  httplib::Response res;
  handler.callGetHandler("regions", req, res);
  BOOST_CHECK_NE(res.status, 404);
  const Json body = Json::parse(res.body);
  BOOST_CHECK_EQUAL(body["id"].get<std::string>(), "UT");
  BOOST_CHECK_EQUAL(body["name"].get<std::string>(), "Region UT");
  BOOST_CHECK_EQUAL(body["polygons"].get<int>(), 1);
}

BOOST_AUTO_TEST_CASE(unknown_region_id_is_404) {
  httplib::Request req;
  req.params.emplace("id", "TX");
  httplib::Response res;
  handler.callGetHandler("regions", req, res);
  BOOST_CHECK_EQUAL(res.status, 404);
}

BOOST_AUTO_TEST_CASE(trip_with_one_waypoint_is_400) {
  httplib::Request req;
  req.body = R"({"waypoints": [{"name": "Denver", "lon": -104.99, "lat": 39.74}]})";
  httplib::Response res;
  handler.callPostHandler("trip", req, res);
  BOOST_CHECK_EQUAL(res.status, 400);
  BOOST_CHECK_EQUAL(Json::parse(res.body)["kind"].get<std::string>(),
                    "input_error");
}

BOOST_AUTO_TEST_CASE(trip_reports_visited_regions) {
  httplib::Request req;
  req.body = R"([{"name": "Denver", "lon": -104.99, "lat": 39.74},
                 {"name": "Moab", "lon": -109.55, "lat": 38.57}])";
  httplib::Response res;
  handler.callPostHandler("trip", req, res);
  BOOST_CHECK_NE(res.status, 400);
  const Json body = Json::parse(res.body);
  BOOST_CHECK(body["ok"].get<bool>());
  BOOST_CHECK_EQUAL(body["coverage"].size(), 2u);
}

BOOST_AUTO_TEST_SUITE_END()

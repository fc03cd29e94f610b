// Distance and duration labels: rounding, day folding, pluralization

#include "core/Errors.hpp"
#include "core/MeasurementFormatter.hpp"

#include <boost/test/unit_test.hpp>

#include <limits>

BOOST_AUTO_TEST_SUITE(measurement_formatter_tests)

BOOST_AUTO_TEST_CASE(thousands_separator) {
  BOOST_CHECK_EQUAL(with_thousands(0), "0");
  BOOST_CHECK_EQUAL(with_thousands(999), "999");
  BOOST_CHECK_EQUAL(with_thousands(1000), "1,000");
  BOOST_CHECK_EQUAL(with_thousands(1240), "1,240");
  BOOST_CHECK_EQUAL(with_thousands(1234567), "1,234,567");
  BOOST_CHECK_EQUAL(with_thousands(-12345), "-12,345");
}

BOOST_AUTO_TEST_CASE(distance_rounds_to_nearest_ten_miles) {
  MeasurementFormatter fmt;
  BOOST_CHECK_EQUAL(fmt.format_distance(0.0), "0 miles");
  BOOST_CHECK_EQUAL(fmt.format_distance(1.0), "0 miles");
  // one mile is below half a step
  BOOST_CHECK_EQUAL(fmt.format_distance(1609.344), "0 miles");
  BOOST_CHECK_EQUAL(fmt.format_distance(1609.344 * 4), "0 miles");
  BOOST_CHECK_EQUAL(fmt.format_distance(1609.344 * 6), "10 miles");
  BOOST_CHECK_EQUAL(fmt.format_distance(1609.344 * 1237), "1,240 miles");
  BOOST_CHECK_EQUAL(fmt.format_distance(1609.344 * 12344), "12,340 miles");
}

BOOST_AUTO_TEST_CASE(distance_granularity_is_configurable) {
  FormatParams p;
  p.distance_granularity = 1.0;
  MeasurementFormatter whole(p);
  BOOST_CHECK_EQUAL(whole.format_distance(1609.344), "1 miles");
  BOOST_CHECK_EQUAL(whole.format_distance(1609.344 * 1237.4), "1,237 miles");

  p.distance_granularity = 0.5;
  MeasurementFormatter half(p);
  BOOST_CHECK_EQUAL(half.format_distance(1609.344 * 2.3), "2.5 miles");
  BOOST_CHECK_EQUAL(half.format_distance(1609.344 * 1000.1), "1,000.0 miles");
}

BOOST_AUTO_TEST_CASE(sub_hour_durations_have_no_hour_clause) {
  MeasurementFormatter fmt;
  BOOST_CHECK_EQUAL(fmt.format_duration(0), "0 minutes");
  BOOST_CHECK_EQUAL(fmt.format_duration(7 * 60), "0 minutes");
  BOOST_CHECK_EQUAL(fmt.format_duration(8 * 60), "15 minutes");
  BOOST_CHECK_EQUAL(fmt.format_duration(44 * 60), "45 minutes");
  // 53 minutes rounds up into the hour
  BOOST_CHECK_EQUAL(fmt.format_duration(53 * 60), "1 hour 0 minutes");
}

BOOST_AUTO_TEST_CASE(hours_are_pluralized_and_minutes_always_shown) {
  MeasurementFormatter fmt;
  BOOST_CHECK_EQUAL(fmt.format_duration(93 * 60), "1 hour 30 minutes");
  BOOST_CHECK_EQUAL(fmt.format_duration(60 * 60), "1 hour 0 minutes");
  BOOST_CHECK_EQUAL(fmt.format_duration(120 * 60), "2 hours 0 minutes");
  BOOST_CHECK_EQUAL(fmt.format_duration(1007 * 60), "16 hours 45 minutes");
}

BOOST_AUTO_TEST_CASE(days_fold_into_hours) {
  MeasurementFormatter fmt;
  BOOST_CHECK_EQUAL(fmt.format_duration(1440 * 60), "24 hours 0 minutes");
  BOOST_CHECK_EQUAL(fmt.format_duration(1500 * 60), "25 hours 0 minutes");
  BOOST_CHECK_EQUAL(fmt.format_duration(26 * 3600), "26 hours 0 minutes");
  BOOST_CHECK_EQUAL(fmt.format_duration(3 * 86400 + 2 * 3600 + 45 * 60),
                    "74 hours 45 minutes");
  // 1000 days
  BOOST_CHECK_EQUAL(fmt.format_duration(1000.0 * 86400),
                    "24,000 hours 0 minutes");

  for (double minutes : {1439.0, 1440.0, 1441.0, 2879.0, 2880.0, 10000.0}) {
    const std::string s = fmt.format_duration(minutes * 60);
    BOOST_CHECK_MESSAGE(s.find("day") == std::string::npos, s);
  }

  const DurationParts d = fmt.split_duration(1500 * 60);
  BOOST_CHECK_EQUAL(d.hours, 25);
  BOOST_CHECK_EQUAL(d.minutes, 0);
}

BOOST_AUTO_TEST_CASE(rerounding_is_idempotent) {
  MeasurementFormatter fmt;
  for (double s : {0.0, 93.0 * 60, 1007.0 * 60, 5555.5, 90000.0, 123456.0}) {
    const long long once = fmt.round_seconds(s);
    BOOST_CHECK_EQUAL(once % 900, 0);
    BOOST_CHECK_EQUAL(fmt.round_seconds(double(once)), once);
    BOOST_CHECK_EQUAL(fmt.format_duration(double(once)),
                      fmt.format_duration(s));
  }
}

BOOST_AUTO_TEST_CASE(duration_increment_is_configurable) {
  FormatParams p;
  p.duration_increment_minutes = 5;
  MeasurementFormatter fmt(p);
  BOOST_CHECK_EQUAL(fmt.format_duration(93 * 60), "1 hour 35 minutes");
  BOOST_CHECK_EQUAL(fmt.format_duration(2 * 60), "0 minutes");
  BOOST_CHECK_EQUAL(fmt.format_duration(3 * 60), "5 minutes");
}

BOOST_AUTO_TEST_CASE(rejects_negative_and_non_finite) {
  MeasurementFormatter fmt;
  BOOST_CHECK_THROW(fmt.format_distance(-1.0), InputError);
  BOOST_CHECK_THROW(fmt.format_duration(-0.5), InputError);
  BOOST_CHECK_THROW(
      fmt.format_duration(std::numeric_limits<double>::quiet_NaN()),
      InputError);
  BOOST_CHECK_THROW(
      fmt.format_distance(std::numeric_limits<double>::infinity()),
      InputError);
}

BOOST_AUTO_TEST_CASE(very_large_values_render_or_throw) {
  MeasurementFormatter fmt;
  // a billion hours still renders exactly
  BOOST_CHECK_EQUAL(fmt.format_duration(3.6e12),
                    "1,000,000,000 hours 0 minutes");
  BOOST_CHECK_EQUAL(fmt.format_distance(1609.344 * 1e15),
                    "1,000,000,000,000,000 miles");

  // rounded count times 900 s would pass LLONG_MAX
  BOOST_CHECK_THROW(fmt.format_duration(9.3e18), InputError);
  BOOST_CHECK_THROW(fmt.round_seconds(1e22), InputError);
  BOOST_CHECK_THROW(fmt.format_duration(std::numeric_limits<double>::max()),
                    InputError);
  BOOST_CHECK_THROW(fmt.format_distance(1e25), InputError);
  BOOST_CHECK_THROW(fmt.round_miles(std::numeric_limits<double>::max()),
                    InputError);
}

BOOST_AUTO_TEST_SUITE_END()

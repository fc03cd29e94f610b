#include "core/MeasurementFormatter.hpp"
#include "core/Errors.hpp"
#include <algorithm>
#include <climits>
#include <cmath>
#include <iomanip>
#include <sstream>

static void check_measurement(double v, const char *what) {
  if (!std::isfinite(v) || v < 0.0) {
    std::ostringstream os;
    os << what << " must be a finite non-negative number, got " << v;
    throw InputError(os.str());
  }
}

std::string with_thousands(long long value) {
  const bool neg = value < 0;
  // unsigned so that LLONG_MIN negates cleanly
  unsigned long long mag = neg ? 0ULL - static_cast<unsigned long long>(value)
                               : static_cast<unsigned long long>(value);
  std::string digits = std::to_string(mag);
  std::string out;
  out.reserve(digits.size() + digits.size() / 3 + 1);
  int lead = static_cast<int>(digits.size() % 3);
  if (lead == 0)
    lead = 3;
  for (std::size_t i = 0; i < digits.size(); ++i) {
    if (i != 0 && (static_cast<int>(i) - lead) % 3 == 0)
      out.push_back(',');
    out.push_back(digits[i]);
  }
  return neg ? "-" + out : out;
}

// ===== distance =====

double MeasurementFormatter::round_miles(double metres) const {
  check_measurement(metres, "distance");
  const double miles = metres / kMetresPerMile;
  const double g = P.distance_granularity;
  const double rounded = std::round(miles / g) * g;
  // rendered through long long; 2^63 is exact in double
  if (rounded >= static_cast<double>(LLONG_MAX)) {
    std::ostringstream os;
    os << "distance of " << metres << " m is too large to render";
    throw InputError(os.str());
  }
  return rounded;
}

std::string MeasurementFormatter::format_distance(double metres) const {
  const double rounded = round_miles(metres);
  const double g = P.distance_granularity;

  // whole-mile granularity renders as an integer with separators
  if (g >= 1.0 && std::floor(g) == g)
    return with_thousands(std::llround(rounded)) + " miles";

  // fractional granularity: enough decimals to show one step
  const int decimals =
      std::max(1, static_cast<int>(std::ceil(-std::log10(g))));
  std::ostringstream os;
  os << std::fixed << std::setprecision(decimals) << rounded;
  const std::string s = os.str();
  const auto dot = s.find('.');
  return with_thousands(std::stoll(s.substr(0, dot))) + s.substr(dot) +
         " miles";
}

// ===== duration =====

long long MeasurementFormatter::round_seconds(double seconds) const {
  check_measurement(seconds, "duration");
  const long long step = static_cast<long long>(P.duration_increment_minutes) * 60;
  const double count = std::round(seconds / static_cast<double>(step));
  // count * step must stay within long long
  if (count >= static_cast<double>(LLONG_MAX / step)) {
    std::ostringstream os;
    os << "duration of " << seconds << " s is too large to render";
    throw InputError(os.str());
  }
  return static_cast<long long>(count) * step;
}

DurationParts MeasurementFormatter::split_duration(double seconds) const {
  const long long rounded = round_seconds(seconds);

  // day/hour/minute period first, then days folded back into hours so the
  // output never carries a day unit
  const long long days = rounded / 86400;
  const long long rem = rounded % 86400;
  DurationParts parts;
  parts.hours = rem / 3600;
  parts.minutes = (rem % 3600) / 60;
  parts.hours += days * 24;
  return parts;
}

std::string MeasurementFormatter::format_duration(double seconds) const {
  const DurationParts d = split_duration(seconds);
  const std::string minutes = std::to_string(d.minutes) + " minutes";
  if (d.hours == 0)
    return minutes;
  const std::string hours =
      with_thousands(d.hours) + (d.hours == 1 ? " hour" : " hours");
  return hours + " " + minutes;
}

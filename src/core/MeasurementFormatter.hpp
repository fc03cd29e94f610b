#pragma once
#include "models/params.hpp"
#include <string>

// Hours/minutes split of a rounded duration. Whole days are already folded
// into `hours`.
struct DurationParts {
  long long hours = 0;
  long long minutes = 0;
};

// Turns provider units (metres, seconds) into display strings:
//   distance -> "1,240 miles"        (nearest `distance_granularity` miles)
//   duration -> "26 hours 0 minutes" (nearest `duration_increment_minutes`)
// Inputs must be finite and non-negative, and small enough that the rounded
// value fits a long long; anything else throws InputError.
class MeasurementFormatter {
public:
  static constexpr double kMetresPerMile = 1609.344;

  explicit MeasurementFormatter(FormatParams p = FormatParams{}) : P(p) {}

  std::string format_distance(double metres) const;
  std::string format_duration(double seconds) const;

  // Rounded miles before rendering.
  double round_miles(double metres) const;
  // Seconds rounded to the nearest increment.
  long long round_seconds(double seconds) const;
  // Rounds, then decomposes into hours and minutes with no day unit.
  DurationParts split_duration(double seconds) const;

  const FormatParams &params() const noexcept { return P; }

private:
  FormatParams P;
};

// "1234567" -> "1,234,567"; negative values keep their sign.
std::string with_thousands(long long value);

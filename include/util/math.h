#pragma once

#include <cmath>
#include <limits>

inline constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

// n decimals, ties to even
constexpr auto round(auto x, int n) {
  auto mult = std::pow(10, n);
  return std::nearbyint(x * mult) / mult;
}

inline bool missing(double x) {
  return std::isnan(x);
}

// num / den, or NaN when den is zero or missing, or the result is not finite
inline double safe_div(double num, double den) {
  if (den == 0.0 || std::isnan(den))
    return NaN;
  auto out = num / den;
  return std::isfinite(out) ? out : NaN;
}

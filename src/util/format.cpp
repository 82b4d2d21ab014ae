#include "util/format.h"
#include "ind/analog.h"
#include "ind/candle.h"
#include "ind/schema.h"
#include "util/math.h"
#include "util/times.h"

#include <string>

template <>
std::string to_str(const double& v) {
  return missing(v) ? "" : std::format("{}", v);
}

template <>
std::string to_str(const LocalTimePoint& datetime) {
  return std::format("{:%F %T}", datetime);
}

template <>
std::string to_str(const Candle& candle) {
  auto& [_, open, high, low, close, volume] = candle;
  return std::format("{} {:.2f} {:.2f} {:.2f} {:.2f} {}",  //
                     candle.time(), open, high, low, close, volume);
}

template <>
std::string to_str(const Flag& f) {
  return title_case(name_of(f));
}

template <>
std::string to_str(const Summary& s) {
  return std::format("{}% bullish next ({} of {} analogs), pattern {}",
                     s.probability_next_bullish, s.bullish_next, s.matches,
                     s.primary_pattern);
}

#include "util/times.h"

#include <format>
#include <sstream>
#include <stdexcept>

using namespace std::chrono;

inline bool try_parse(const std::string& str,
                      const char* fmt,
                      LocalTimePoint& out) {
  std::istringstream in{str};
  local_time<seconds> local;
  in >> parse(std::string{fmt}, local);
  if (in.fail())
    return false;
  out = local;
  return true;
}

LocalTimePoint datetime_to_local(std::string_view datetime) {
  std::string str{datetime};

  LocalTimePoint tp;
  for (auto fmt : {"%F %T", "%FT%T", "%F %R", "%F"})
    if (try_parse(str, fmt, tp))
      return tp;

  throw std::invalid_argument(std::format("unparsable datetime '{}'", str));
}

std::string datetime_to_string(LocalTimePoint tp) {
  return std::format("{:%F %T}", tp);
}

int day_of_week(LocalTimePoint tp) {
  weekday wd{floor<days>(tp)};
  return static_cast<int>(wd.iso_encoding()) - 1;
}

int month_of(LocalTimePoint tp) {
  year_month_day ymd{floor<days>(tp)};
  return static_cast<int>(static_cast<unsigned>(ymd.month()));
}

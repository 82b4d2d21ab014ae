#pragma once

#include <chrono>
#include <string>
#include <string_view>

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

using SysClock = std::chrono::system_clock;

using LocalTimePoint = std::chrono::local_time<std::chrono::seconds>;

using seconds = std::chrono::seconds;
using minutes = std::chrono::minutes;
using hours = std::chrono::hours;
using days = std::chrono::days;

inline constexpr minutes M_1{1}, H_1{hours{1}}, H_12{hours{12}},
    D_1{hours{24}};

// Accepts "%F %T", "%FT%T" and "%F". Throws std::invalid_argument when none
// of them match.
LocalTimePoint datetime_to_local(std::string_view datetime);

std::string datetime_to_string(LocalTimePoint tp);

// 0 = Monday ... 6 = Sunday
int day_of_week(LocalTimePoint tp);

// 1 ... 12
int month_of(LocalTimePoint tp);

struct Timer {
  TimePoint start;
  Timer() : start{Clock::now()} {}
  double diff_ms() const {
    return std::chrono::duration<double, std::milli>(Clock::now() - start)
        .count();
  }
};

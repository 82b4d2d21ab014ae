#include "ind/patterns.h"
#include "ind/errors.h"
#include "util/config.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

inline auto& pattern_config = config.pattern_config;

PatternDetector::PatternDetector(const Table& features) : table{features} {
  auto& o = table.column(Field::Open);
  auto& h = table.column(Field::High);
  auto& l = table.column(Field::Low);
  auto& c = table.column(Field::Close);

  auto n = table.size();
  bull.resize(n);
  bear.resize(n);
  body.resize(n);
  upper_wick.resize(n);
  lower_wick.resize(n);

  for (size_t i = 0; i < n; ++i) {
    bull[i] = c[i] > o[i];
    bear[i] = c[i] < o[i];
    body[i] = std::abs(c[i] - o[i]);
    upper_wick[i] = h[i] - std::max(o[i], c[i]);
    lower_wick[i] = std::min(o[i], c[i]) - l[i];
  }

  table.set(Flag::Bullish, bull);
  table.set(Flag::Bearish, bear);
}

const std::vector<bool>& PatternDetector::store(Flag f,
                                                std::vector<bool>&& flags) {
  table.set(f, std::move(flags));
  return table.column(f);
}

const std::vector<bool>& PatternDetector::bullish_engulfing() {
  auto n = table.size();
  std::vector<bool> out(n, false);

  for (size_t i = 1; i < n; ++i) {
    out[i] = bear[i - 1] && bull[i] &&  //
             table.open(i) < table.close(i - 1) &&
             table.close(i) > table.open(i - 1);
  }

  return store(Flag::BullishEngulfing, std::move(out));
}

const std::vector<bool>& PatternDetector::bearish_engulfing() {
  auto n = table.size();
  std::vector<bool> out(n, false);

  for (size_t i = 1; i < n; ++i) {
    out[i] = bull[i - 1] && bear[i] &&  //
             table.open(i) > table.close(i - 1) &&
             table.close(i) < table.open(i - 1);
  }

  return store(Flag::BearishEngulfing, std::move(out));
}

const std::vector<bool>& PatternDetector::hammer() {
  auto ratio = pattern_config.wick_body_ratio;
  std::vector<bool> out(table.size(), false);

  for (size_t i = 0; i < out.size(); ++i)
    out[i] = lower_wick[i] >= ratio * body[i] && upper_wick[i] <= body[i] &&
             body[i] > 0;

  return store(Flag::Hammer, std::move(out));
}

const std::vector<bool>& PatternDetector::shooting_star() {
  auto ratio = pattern_config.wick_body_ratio;
  std::vector<bool> out(table.size(), false);

  for (size_t i = 0; i < out.size(); ++i)
    out[i] = upper_wick[i] >= ratio * body[i] && lower_wick[i] <= body[i] &&
             body[i] > 0;

  return store(Flag::ShootingStar, std::move(out));
}

const std::vector<bool>& PatternDetector::doji(double threshold) {
  std::vector<bool> out(table.size(), false);

  for (size_t i = 0; i < out.size(); ++i) {
    // zero-range bars are judged on their absolute body
    double range = table.high(i) - table.low(i);
    if (range == 0.0)
      range = 1.0;
    out[i] = body[i] / range <= threshold;
  }

  return store(Flag::Doji, std::move(out));
}

const std::vector<bool>& PatternDetector::doji() {
  return doji(pattern_config.doji_threshold);
}

const std::vector<bool>& PatternDetector::inside_bar() {
  auto n = table.size();
  std::vector<bool> out(n, false);

  for (size_t i = 1; i < n; ++i)
    out[i] = table.high(i) <= table.high(i - 1) &&
             table.low(i) >= table.low(i - 1);

  return store(Flag::InsideBar, std::move(out));
}

const std::vector<bool>& PatternDetector::outside_bar() {
  auto n = table.size();
  std::vector<bool> out(n, false);

  for (size_t i = 1; i < n; ++i)
    out[i] = table.high(i) >= table.high(i - 1) &&
             table.low(i) <= table.low(i - 1);

  return store(Flag::OutsideBar, std::move(out));
}

const std::vector<bool>& PatternDetector::morning_star() {
  auto ratio = pattern_config.star_body_ratio;
  auto n = table.size();
  std::vector<bool> out(n, false);

  for (size_t i = 2; i < n; ++i) {
    double first_mid = (table.open(i - 2) + table.close(i - 2)) / 2;
    out[i] = bear[i - 2] && body[i - 1] <= body[i - 2] * ratio && bull[i] &&
             table.close(i) > first_mid;
  }

  return store(Flag::MorningStar, std::move(out));
}

const std::vector<bool>& PatternDetector::evening_star() {
  auto ratio = pattern_config.star_body_ratio;
  auto n = table.size();
  std::vector<bool> out(n, false);

  for (size_t i = 2; i < n; ++i) {
    double first_mid = (table.open(i - 2) + table.close(i - 2)) / 2;
    out[i] = bull[i - 2] && body[i - 1] <= body[i - 2] * ratio && bear[i] &&
             table.close(i) < first_mid;
  }

  return store(Flag::EveningStar, std::move(out));
}

Table PatternDetector::detect_all() {
  bullish_engulfing();
  bearish_engulfing();
  hammer();
  shooting_star();
  doji();
  inside_bar();
  outside_bar();
  morning_star();
  evening_star();

  if (!table.empty()) {
    auto it = std::find_if(pattern_priority.begin(), pattern_priority.end(),
                           [this](Flag f) { return table.get(f, -1); });
    spdlog::debug("[pattern] {} rows, last bar: {}", table.size(),
                  it == pattern_priority.end() ? "none" : name_of(*it));
  }

  return table;
}

#include "ind/analog.h"
#include "ind/errors.h"
#include "util/config.h"
#include "util/math.h"

#include <spdlog/spdlog.h>

inline auto& model_config = config.model_config;

AnalogProbabilityModel::AnalogProbabilityModel(const Table& annotated)
    : table{annotated} {
  if (table.empty())
    throw InsufficientHistoryError{0, "no rows to match against"};

  // fail before any matching if a column is absent
  table.column(Flag::Bullish);
  for (auto f : pattern_priority)
    table.column(f);
  table.trend();
  table.momentum();
  table.volatility();
}

std::optional<Flag> AnalogProbabilityModel::primary_pattern() const {
  for (auto f : pattern_priority)
    if (table.get(f, -1))
      return f;
  return std::nullopt;
}

std::vector<size_t> AnalogProbabilityModel::analogs() const {
  auto pattern = primary_pattern();
  auto& trend = table.trend(-1);
  auto momentum = table.momentum(-1);
  auto volatility = table.volatility(-1);

  std::vector<size_t> rows;
  for (size_t i = 0; i + 1 < table.size(); ++i) {
    if (table.trend(i) != trend)
      continue;
    if (pattern && !table.get(*pattern, i))
      continue;
    if (table.momentum(i) != momentum)
      continue;
    if (table.volatility(i) != volatility)
      continue;
    rows.push_back(i);
  }

  return rows;
}

double AnalogProbabilityModel::probability_next_bullish() const {
  return summary().probability_next_bullish;
}

Summary AnalogProbabilityModel::summary() const {
  auto pattern = primary_pattern();
  auto rows = analogs();

  size_t bullish_next = 0;
  for (auto i : rows)
    bullish_next += table.get(Flag::Bullish, i + 1);

  Summary s;
  s.primary_pattern = pattern ? std::string{name_of(*pattern)} : "none";
  s.last_trend = table.trend(-1);
  s.last_momentum = name_of(table.momentum(-1));
  s.last_volatility = name_of(table.volatility(-1));
  s.matches = rows.size();
  s.bullish_next = bullish_next;

  if (rows.empty()) {
    s.probability_next_bullish = model_config.neutral_probability;
  } else {
    auto frac = static_cast<double>(bullish_next) / rows.size();
    s.probability_next_bullish = round(100 * frac, model_config.precision);
  }

  spdlog::info("[model] pattern {}, trend {}, {} analogs, {} bullish next: {}%",
               s.primary_pattern, s.last_trend, s.matches, s.bullish_next,
               s.probability_next_bullish);

  return s;
}

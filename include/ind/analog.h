#pragma once

#include "ind/schema.h"
#include "ind/table.h"

#include <optional>
#include <string>
#include <vector>

/**
 * @brief Outcome of matching the latest bar against its historical analogs.
 */
struct Summary {
  double probability_next_bullish = 50.0;  // 0 - 100
  std::string primary_pattern = "none";
  std::string last_trend;
  std::string last_momentum;
  std::string last_volatility;
  size_t matches = 0;  // analog rows that had a following bar
  size_t bullish_next = 0;
};

/**
 * @brief Historical frequency estimate of P(next bar bullish | state).
 *
 * The state of the last row is its primary pattern (first true flag in
 * pattern_priority, or none), its trend label and its momentum and volatility
 * labels. A historical row is an analog when it has the same trend, momentum
 * and volatility and, unless the primary pattern is none, the same pattern
 * flag set. Each analog contributes the bullish flag of the row right after
 * it; the last row has no successor and never contributes.
 *
 * The table must carry the pattern flags and the trend, momentum and
 * volatility columns.
 */
class AnalogProbabilityModel {
  Table table;

 public:
  explicit AnalogProbabilityModel(const Table& annotated);

  std::optional<Flag> primary_pattern() const;

  // Rows matching the latest state that have a following row.
  std::vector<size_t> analogs() const;

  double probability_next_bullish() const;

  Summary summary() const;
};

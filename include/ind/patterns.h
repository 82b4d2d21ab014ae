#pragma once

#include "ind/schema.h"
#include "ind/table.h"

#include <vector>

/**
 * @brief Candlestick pattern flags from bar geometry.
 *
 * Works on its own copy of the table it is given. Every flag at row t reads
 * rows t, t-1 and t-2 only; a flag that needs more history than the row has
 * is false.
 *
 * Each pattern method computes its column, stores it in the working copy
 * and returns it. detect_all() runs every pattern and hands back the
 * annotated table.
 */
class PatternDetector {
  Table table;

  // per-row candle geometry, computed once
  std::vector<bool> bull;
  std::vector<bool> bear;
  std::vector<double> body;
  std::vector<double> upper_wick;
  std::vector<double> lower_wick;

  const std::vector<bool>& store(Flag f, std::vector<bool>&& flags);

 public:
  explicit PatternDetector(const Table& features);

  const std::vector<bool>& bullish_engulfing();
  const std::vector<bool>& bearish_engulfing();
  const std::vector<bool>& hammer();
  const std::vector<bool>& shooting_star();
  const std::vector<bool>& doji(double threshold);
  const std::vector<bool>& doji();
  const std::vector<bool>& inside_bar();
  const std::vector<bool>& outside_bar();
  const std::vector<bool>& morning_star();
  const std::vector<bool>& evening_star();

  Table detect_all();
};

#pragma once

#include "ind/schema.h"
#include "ind/table.h"

/**
 * @brief Momentum and volatility labels for every row.
 *
 * Momentum at row t reads RSI(14) and the MACD histogram of row t.
 * Volatility at row t compares ATR(14) of row t with the median ATR(14) of
 * rows 0..t, so the label of the last row is measured against the whole
 * table and no row sees later data.
 *
 * With regime_config.broadcast_labels the latest labels are copied onto
 * every row instead. That reproduces the first version of the analyzer,
 * where the momentum/volatility match filters could never exclude a row.
 *
 * Trend is not computed here; it arrives as an external column.
 */
class RegimeClassifier {
  Table table;

 public:
  explicit RegimeClassifier(const Table& features);

  const Table& classify() const { return table; }

  Momentum momentum_state() const { return table.momentum(-1); }
  Volatility volatility_state() const { return table.volatility(-1); }

  static Momentum momentum_of(double rsi, double hist);
  static Volatility volatility_of(double atr, double median_atr);
};

#include "ind/regime.h"
#include "ind/errors.h"
#include "ind/rolling.h"
#include "util/config.h"
#include "util/math.h"

#include <spdlog/spdlog.h>

#include <algorithm>

inline auto& regime_config = config.regime_config;

Momentum RegimeClassifier::momentum_of(double rsi, double hist) {
  if (missing(rsi) || missing(hist))
    return Momentum::Undefined;

  if (rsi > regime_config.rsi_bullish && hist > 0)
    return Momentum::Bullish;
  if (rsi < regime_config.rsi_bearish && hist < 0)
    return Momentum::Bearish;
  return Momentum::Neutral;
}

Volatility RegimeClassifier::volatility_of(double atr, double median_atr) {
  if (missing(atr) || missing(median_atr))
    return Volatility::Undefined;

  if (atr > median_atr * regime_config.atr_high_ratio)
    return Volatility::High;
  if (atr < median_atr * regime_config.atr_low_ratio)
    return Volatility::Low;
  return Volatility::Normal;
}

RegimeClassifier::RegimeClassifier(const Table& features) : table{features} {
  auto& rsi = table.column(Field::Rsi14);
  auto& hist = table.column(Field::MacdHist);
  auto& atr = table.column(Field::Atr14);

  auto n = table.size();
  if (n == 0)
    throw InsufficientHistoryError{n, "no rows to classify"};

  auto atr_median = expanding_median(atr);

  std::vector<Momentum> momentum(n);
  std::vector<Volatility> volatility(n);

  if (regime_config.broadcast_labels) {
    auto m = momentum_of(rsi.back(), hist.back());
    auto v = volatility_of(atr.back(), atr_median.back());
    std::fill(momentum.begin(), momentum.end(), m);
    std::fill(volatility.begin(), volatility.end(), v);
  } else {
    for (size_t i = 0; i < n; ++i) {
      momentum[i] = momentum_of(rsi[i], hist[i]);
      volatility[i] = volatility_of(atr[i], atr_median[i]);
    }
  }

  table.set_momentum(std::move(momentum));
  table.set_volatility(std::move(volatility));

  spdlog::debug("[regime] momentum {}, volatility {}{}",
                name_of(momentum_state()), name_of(volatility_state()),
                regime_config.broadcast_labels ? " (broadcast)" : "");
}

#pragma once

#include "ind/rolling.h"
#include "ind/schema.h"
#include "ind/table.h"

#include <algorithm>
#include <array>
#include <vector>

struct SMA {
  Series values;

  SMA() noexcept = default;
  SMA(const Series& prices, int period) noexcept;
};

struct EMA {
  Series values;

  EMA() noexcept = default;
  EMA(const Series& prices, int span) noexcept;
};

struct RSI {
  Series values;

  // Wilder-smoothed, NaN during warm-up
  Series avg_gain;
  Series avg_loss;

  RSI(const Series& closes, int period = RSI_PERIOD) noexcept;
};

struct MACD {
  Series macd_line;
  EMA signal_ema;
  Series histogram;

 private:
  EMA fast_ema;
  EMA slow_ema;

 public:
  MACD(const Series& closes,
       int fast = MACD_FAST,
       int slow = MACD_SLOW,
       int signal = MACD_SIGNAL) noexcept;
};

struct ATR {
  Series tr;
  Series values;

  ATR(const Series& high,
      const Series& low,
      const Series& close,
      int period = ATR_PERIOD) noexcept;

  static Series true_range(const Series& high,
                           const Series& low,
                           const Series& close) noexcept;
};

struct ADX {
  Series values;
  Series di_plus;
  Series di_minus;

  ADX(const Series& high,
      const Series& low,
      const ATR& atr,
      int period = ADX_PERIOD) noexcept;
};

struct Bollinger {
  Series mid;
  Series upper;
  Series lower;
  Series width;
  Series stdev;

  Bollinger(const Series& closes,
            int period = BB_PERIOD,
            double k = BB_K) noexcept;
};

/**
 * @brief Computes the full indicator set for a batch of bars.
 *
 * The input table must hold the datetime column and open/high/low/close;
 * volume is optional. All columns of the input (including an external trend
 * label) are carried into the output. Leading rows are trimmed until the core
 * indicator set is defined; see warmup_rows().
 *
 * Throws MissingColumnError for absent OHLC columns and
 * InsufficientHistoryError for fewer than two rows or an all-warm-up batch.
 */
class IndicatorEngine {
  Table table;
  size_t trimmed = 0;

 public:
  explicit IndicatorEngine(const Table& bars);
  explicit IndicatorEngine(const Candles& candles)
      : IndicatorEngine{Table{candles}} {}

  const Table& features() const { return table; }
  size_t trimmed_rows() const { return trimmed; }

  // Rows dropped from a well-formed batch, i.e. the first row at which every
  // trimmed column is defined: ADX needs 2 * period - 1.
  static constexpr size_t warmup_rows() noexcept {
    size_t n = 1;  // ret_1
    n = std::max<size_t>(n, ATR_PERIOD - 1);
    n = std::max<size_t>(n, 2 * ADX_PERIOD - 1);
    n = std::max<size_t>(n, BB_PERIOD - 1);
    n = std::max<size_t>(n, STDEV_SHORT);
    return n;
  }

  static constexpr std::array<Field, 13> trimmed_fields = {
      Field::Ret1,     Field::Sma20, Field::Sma50,   Field::Sma200,
      Field::Ema12,    Field::Ema26, Field::MacdLine, Field::Rsi14,
      Field::Atr14,    Field::Adx14, Field::BbMid20, Field::BbWidth20,
      Field::Stdev10,
  };
};

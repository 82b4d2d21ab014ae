#include "ind/indicators.h"
#include "ind/errors.h"
#include "util/config.h"
#include "util/math.h"

#include <spdlog/spdlog.h>

#include <cmath>

SMA::SMA(const Series& prices, int period) noexcept
    : values{rolling_mean(prices, period)} {}

EMA::EMA(const Series& prices, int span) noexcept
    : values{ema(prices, span)} {}

RSI::RSI(const Series& closes, int period) noexcept {
  auto delta = diff(closes);

  Series gains(delta.size(), NaN), losses(delta.size(), NaN);
  for (size_t i = 0; i < delta.size(); ++i) {
    if (missing(delta[i]))
      continue;
    gains[i] = delta[i] > 0 ? delta[i] : 0.0;
    losses[i] = delta[i] < 0 ? -delta[i] : 0.0;
  }

  avg_gain = wilder(gains, period);
  avg_loss = wilder(losses, period);

  // a flat loss side gives no RS; such rows read as neutral
  values.resize(closes.size());
  for (size_t i = 0; i < values.size(); ++i) {
    double rs = safe_div(avg_gain[i], avg_loss[i]);
    values[i] = missing(rs) ? 50.0 : 100.0 - (100.0 / (1.0 + rs));
  }
}

MACD::MACD(const Series& closes, int fast, int slow, int signal) noexcept
    : macd_line(closes.size()),
      fast_ema{closes, fast},
      slow_ema{closes, slow}  //
{
  size_t n = closes.size();
  for (size_t i = 0; i < n; ++i)
    macd_line[i] = fast_ema.values[i] - slow_ema.values[i];

  signal_ema = EMA(macd_line, signal);
  auto& signal_line = signal_ema.values;

  histogram.reserve(n);
  for (size_t i = 0; i < n; ++i)
    histogram.push_back(macd_line[i] - signal_line[i]);
}

Series ATR::true_range(const Series& high,
                       const Series& low,
                       const Series& close) noexcept {
  Series out(close.size(), NaN);

  for (size_t i = 0; i < close.size(); ++i) {
    double prev_close = i > 0 ? close[i - 1] : NaN;

    // max over whichever spreads are defined
    for (double v : {high[i] - low[i], std::abs(high[i] - prev_close),
                     std::abs(low[i] - prev_close)}) {
      if (!missing(v) && (missing(out[i]) || v > out[i]))
        out[i] = v;
    }
  }

  return out;
}

ATR::ATR(const Series& high,
         const Series& low,
         const Series& close,
         int period) noexcept
    : tr{true_range(high, low, close)}, values{wilder(tr, period)} {}

ADX::ADX(const Series& high,
         const Series& low,
         const ATR& atr,
         int period) noexcept {
  auto n = high.size();
  auto up_move = diff(high);
  auto down_move = diff(low);

  Series plus_dm(n, NaN), minus_dm(n, NaN);
  for (size_t i = 0; i < n; ++i) {
    double up = up_move[i];
    double down = -down_move[i];

    if (!missing(up))
      plus_dm[i] = (up > down && up > 0) ? up : 0.0;
    if (!missing(down))
      minus_dm[i] = (down > up && down > 0) ? down : 0.0;
  }

  auto smoothed_tr = wilder(atr.tr, period);
  auto smoothed_plus = wilder(plus_dm, period);
  auto smoothed_minus = wilder(minus_dm, period);

  di_plus.resize(n);
  di_minus.resize(n);
  Series dx(n, NaN);

  for (size_t i = 0; i < n; ++i) {
    di_plus[i] = 100 * safe_div(smoothed_plus[i], smoothed_tr[i]);
    di_minus[i] = 100 * safe_div(smoothed_minus[i], smoothed_tr[i]);
    dx[i] = 100 * safe_div(std::abs(di_plus[i] - di_minus[i]),
                           di_plus[i] + di_minus[i]);
  }

  values = wilder(dx, period);
}

Bollinger::Bollinger(const Series& closes, int period, double k) noexcept
    : mid{rolling_mean(closes, period)},
      stdev{rolling_std(closes, period, period)} {
  auto n = closes.size();
  upper.resize(n);
  lower.resize(n);
  width.resize(n);

  for (size_t i = 0; i < n; ++i) {
    upper[i] = mid[i] + k * stdev[i];
    lower[i] = mid[i] - k * stdev[i];
    width[i] = safe_div(upper[i] - lower[i], mid[i]);
  }
}

inline void require_prices(const Table& bars) {
  for (auto f : {Field::Open, Field::High, Field::Low, Field::Close})
    if (!bars.has(f))
      throw MissingColumnError{name_of(f)};
}

inline Series volume_spikes(const Series& ratio, double threshold) {
  Series out(ratio.size(), 0.0);
  for (size_t i = 0; i < ratio.size(); ++i)
    out[i] = ratio[i] >= threshold ? 1.0 : 0.0;
  return out;
}

inline void add_candle_anatomy(Table& t) {
  auto& o = t.column(Field::Open);
  auto& h = t.column(Field::High);
  auto& l = t.column(Field::Low);
  auto& c = t.column(Field::Close);

  auto n = t.size();
  Series range(n), body(n), upper(n), lower(n);
  Series body_pct(n), upper_pct(n), lower_pct(n);

  for (size_t i = 0; i < n; ++i) {
    range[i] = h[i] - l[i];
    if (range[i] == 0.0)
      range[i] = NaN;

    body[i] = std::abs(c[i] - o[i]);
    upper[i] = c[i] >= o[i] ? h[i] - c[i] : h[i] - o[i];
    lower[i] = c[i] >= o[i] ? o[i] - l[i] : c[i] - l[i];

    body_pct[i] = safe_div(body[i], range[i]);
    upper_pct[i] = safe_div(upper[i], range[i]);
    lower_pct[i] = safe_div(lower[i], range[i]);
  }

  t.set(Field::Range, std::move(range));
  t.set(Field::Body, std::move(body));
  t.set(Field::UpperWick, std::move(upper));
  t.set(Field::LowerWick, std::move(lower));
  t.set(Field::BodyPct, std::move(body_pct));
  t.set(Field::UpperWickPct, std::move(upper_pct));
  t.set(Field::LowerWickPct, std::move(lower_pct));
}

inline void add_calendar(Table& t) {
  Series dow(t.size()), month(t.size());
  for (size_t i = 0; i < t.size(); ++i) {
    dow[i] = day_of_week(t.datetime[i]);
    month[i] = month_of(t.datetime[i]);
  }
  t.set(Field::DayOfWeek, std::move(dow));
  t.set(Field::Month, std::move(month));
}

inline void replace_infinities(Table& t) {
  for (size_t f = 0; f < n_fields; ++f) {
    auto field = static_cast<Field>(f);
    if (!t.has(field))
      continue;

    auto col = t.column(field);
    bool changed = false;
    for (auto& v : col) {
      if (std::isinf(v)) {
        v = NaN;
        changed = true;
      }
    }
    if (changed)
      t.set(field, std::move(col));
  }
}

inline size_t first_complete_row(const Table& t, auto& required) {
  for (size_t i = 0; i < t.size(); ++i) {
    bool complete = true;
    for (auto f : required) {
      if (missing(t.get(f, i))) {
        complete = false;
        break;
      }
    }
    if (complete)
      return i;
  }
  return t.size();
}

IndicatorEngine::IndicatorEngine(const Table& bars) {
  require_prices(bars);
  if (bars.size() < 2)
    throw InsufficientHistoryError{bars.size(), "need at least 2 bars"};

  Table t = bars;

  auto& h = bars.column(Field::High);
  auto& l = bars.column(Field::Low);
  auto& c = bars.column(Field::Close);

  t.set(Field::Ret1, pct_change(c, 1));
  t.set(Field::Ret5, pct_change(c, 5));
  t.set(Field::Ret10, pct_change(c, 10));
  t.set(Field::Ret21, pct_change(c, 21));

  t.set(Field::Sma5, SMA{c, 5}.values);
  t.set(Field::Sma20, SMA{c, 20}.values);
  t.set(Field::Sma50, SMA{c, 50}.values);
  t.set(Field::Sma200, SMA{c, 200}.values);

  t.set(Field::Ema12, EMA{c, 12}.values);
  t.set(Field::Ema26, EMA{c, 26}.values);
  t.set(Field::Ema50, EMA{c, 50}.values);

  MACD macd{c};
  t.set(Field::MacdLine, std::move(macd.macd_line));
  t.set(Field::MacdSignal, std::move(macd.signal_ema.values));
  t.set(Field::MacdHist, std::move(macd.histogram));

  t.set(Field::Rsi14, RSI{c}.values);

  ATR atr{h, l, c};
  ADX adx{h, l, atr};
  t.set(Field::Tr, atr.tr);
  t.set(Field::Atr14, std::move(atr.values));
  t.set(Field::Adx14, std::move(adx.values));
  t.set(Field::DiPlus14, std::move(adx.di_plus));
  t.set(Field::DiMinus14, std::move(adx.di_minus));

  Bollinger bb{c};
  t.set(Field::BbWidthPct252, rolling_rank_pct(bb.width, WIDTH_PCT_WINDOW));
  t.set(Field::BbMid20, std::move(bb.mid));
  t.set(Field::BbUp20, std::move(bb.upper));
  t.set(Field::BbLo20, std::move(bb.lower));
  t.set(Field::BbWidth20, std::move(bb.width));
  t.set(Field::Stdev20, std::move(bb.stdev));

  t.set(Field::Stdev10,
        rolling_std(t.column(Field::Ret1), STDEV_SHORT, STDEV_SHORT));

  auto spike_ratio = config.ind_config.volume_spike_ratio;
  if (bars.has(Field::Volume)) {
    auto& v = bars.column(Field::Volume);
    auto vol_ma = rolling_mean(v, VOLUME_PERIOD);

    Series ratio(v.size());
    for (size_t i = 0; i < v.size(); ++i)
      ratio[i] = safe_div(v[i], vol_ma[i]);

    t.set(Field::VolSpike, volume_spikes(ratio, spike_ratio));
    t.set(Field::VolMa20, std::move(vol_ma));
    t.set(Field::VolRatio, std::move(ratio));
  } else {
    t.set(Field::VolMa20, Series(t.size(), NaN));
    t.set(Field::VolRatio, Series(t.size(), NaN));
    t.set(Field::VolSpike, Series(t.size(), 0.0));
  }

  add_candle_anatomy(t);
  add_calendar(t);
  replace_infinities(t);

  trimmed = first_complete_row(t, trimmed_fields);
  if (trimmed == t.size())
    throw InsufficientHistoryError{
        bars.size(), "warm-up trimming leaves no complete rows"};

  table = t.tail_from(trimmed);

  spdlog::debug("[ind] {} bars, {} warm-up rows trimmed, {} rows out",
                bars.size(), trimmed, table.size());
}

#pragma once

#include <array>
#include <cstddef>
#include <string_view>

// Column identifiers shared by every stage. Indicator periods are part of the
// column identity, so they live here as well.

inline constexpr int RSI_PERIOD = 14;
inline constexpr int ATR_PERIOD = 14;
inline constexpr int ADX_PERIOD = 14;
inline constexpr int MACD_FAST = 12;
inline constexpr int MACD_SLOW = 26;
inline constexpr int MACD_SIGNAL = 9;
inline constexpr int BB_PERIOD = 20;
inline constexpr double BB_K = 2.0;
inline constexpr int STDEV_SHORT = 10;
inline constexpr int WIDTH_PCT_WINDOW = 252;
inline constexpr int VOLUME_PERIOD = 20;

enum class Field : size_t {
  Open,
  High,
  Low,
  Close,
  Volume,

  Ret1,
  Ret5,
  Ret10,
  Ret21,

  Sma5,
  Sma20,
  Sma50,
  Sma200,

  Ema12,
  Ema26,
  Ema50,

  MacdLine,
  MacdSignal,
  MacdHist,

  Rsi14,

  Tr,
  Atr14,

  Adx14,
  DiPlus14,
  DiMinus14,

  BbMid20,
  BbUp20,
  BbLo20,
  BbWidth20,
  Stdev20,
  Stdev10,
  BbWidthPct252,

  VolMa20,
  VolRatio,
  VolSpike,

  Range,
  Body,
  UpperWick,
  LowerWick,
  BodyPct,
  UpperWickPct,
  LowerWickPct,

  DayOfWeek,
  Month,

  Count,
};

inline constexpr size_t n_fields = static_cast<size_t>(Field::Count);

inline constexpr std::array<std::string_view, n_fields> field_names = {
    "open",        "high",           "low",
    "close",       "volume",         "ret_1",
    "ret_5",       "ret_10",         "ret_21",
    "sma_5",       "sma_20",         "sma_50",
    "sma_200",     "ema_12",         "ema_26",
    "ema_50",      "macd_line",      "macd_signal",
    "macd_hist",   "rsi_14",         "tr",
    "atr_14",      "adx_14",         "di_plus_14",
    "di_minus_14", "bb_mid_20",      "bb_up_20_2",
    "bb_lo_20_2",  "bb_width_20",    "stdev_20",
    "stdev_10",    "bb_width_pct_252", "vol_ma20",
    "vol_ratio",   "vol_spike_flag", "range",
    "body",        "upper_wick",     "lower_wick",
    "body_pct",    "upper_wick_pct", "lower_wick_pct",
    "day_of_week", "month",
};

enum class Flag : size_t {
  Bullish,
  Bearish,
  BullishEngulfing,
  BearishEngulfing,
  Hammer,
  ShootingStar,
  Doji,
  InsideBar,
  OutsideBar,
  MorningStar,
  EveningStar,

  Count,
};

inline constexpr size_t n_flags = static_cast<size_t>(Flag::Count);

inline constexpr std::array<std::string_view, n_flags> flag_names = {
    "bullish",     "bearish",       "bullish_engulfing", "bearish_engulfing",
    "hammer",      "shooting_star", "doji",              "inside_bar",
    "outside_bar", "morning_star",  "evening_star",
};

// Order in which the last bar is scanned for its primary pattern.
inline constexpr std::array<Flag, 8> pattern_priority = {
    Flag::BullishEngulfing, Flag::BearishEngulfing, Flag::Hammer,
    Flag::ShootingStar,     Flag::MorningStar,      Flag::EveningStar,
    Flag::InsideBar,        Flag::OutsideBar,
};

enum class Momentum { Bullish, Bearish, Neutral, Undefined };
enum class Volatility { High, Low, Normal, Undefined };

constexpr std::string_view name_of(Field f) {
  return field_names[static_cast<size_t>(f)];
}

constexpr std::string_view name_of(Flag f) {
  return flag_names[static_cast<size_t>(f)];
}

constexpr std::string_view name_of(Momentum m) {
  switch (m) {
    case Momentum::Bullish:
      return "bullish";
    case Momentum::Bearish:
      return "bearish";
    case Momentum::Neutral:
      return "neutral";
    default:
      return "undefined";
  }
}

constexpr std::string_view name_of(Volatility v) {
  switch (v) {
    case Volatility::High:
      return "high";
    case Volatility::Low:
      return "low";
    case Volatility::Normal:
      return "normal";
    default:
      return "undefined";
  }
}

#pragma once

#include "util/times.h"

#include <vector>

struct Candle {
  LocalTimePoint datetime;
  double open = 0.0;
  double high = 0.0;
  double low = 0.0;
  double close = 0.0;
  double volume = 0.0;

  LocalTimePoint time() const { return datetime; }
};

using Candles = std::vector<Candle>;

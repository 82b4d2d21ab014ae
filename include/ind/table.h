#pragma once

#include "ind/candle.h"
#include "ind/schema.h"
#include "util/times.h"

#include <array>
#include <optional>
#include <string>
#include <vector>

// Column-oriented batch of bars and everything derived from them. Every
// column has exactly size() entries; absent columns are reported through
// has() and throw MissingColumnError when read.
struct Table {
  std::vector<LocalTimePoint> datetime;

 private:
  std::array<std::optional<std::vector<double>>, n_fields> fields;
  std::array<std::optional<std::vector<bool>>, n_flags> flags;

  std::optional<std::vector<std::string>> _trend;
  std::optional<std::vector<Momentum>> _momentum;
  std::optional<std::vector<Volatility>> _volatility;

  size_t sanitize(int idx) const {
    return idx < 0 ? size() + idx : idx;
  }

 public:
  Table() = default;
  explicit Table(const Candles& candles);

  size_t size() const { return datetime.size(); }
  bool empty() const { return datetime.empty(); }

  bool has(Field f) const { return fields[static_cast<size_t>(f)].has_value(); }
  bool has(Flag f) const { return flags[static_cast<size_t>(f)].has_value(); }
  bool has_trend() const { return _trend.has_value(); }
  bool has_momentum() const { return _momentum.has_value(); }
  bool has_volatility() const { return _volatility.has_value(); }

  const std::vector<double>& column(Field f) const;
  const std::vector<bool>& column(Flag f) const;
  const std::vector<std::string>& trend() const;
  const std::vector<Momentum>& momentum() const;
  const std::vector<Volatility>& volatility() const;

  double get(Field f, int idx) const { return column(f)[sanitize(idx)]; }
  bool get(Flag f, int idx) const { return column(f)[sanitize(idx)]; }
  const std::string& trend(int idx) const { return trend()[sanitize(idx)]; }
  Momentum momentum(int idx) const { return momentum()[sanitize(idx)]; }
  Volatility volatility(int idx) const { return volatility()[sanitize(idx)]; }
  LocalTimePoint time(int idx) const { return datetime[sanitize(idx)]; }

  double open(int idx) const { return get(Field::Open, idx); }
  double high(int idx) const { return get(Field::High, idx); }
  double low(int idx) const { return get(Field::Low, idx); }
  double close(int idx) const { return get(Field::Close, idx); }

  void set(Field f, std::vector<double> values);
  void set(Flag f, std::vector<bool> values);
  void set_trend(std::vector<std::string> values);
  void set_momentum(std::vector<Momentum> values);
  void set_volatility(std::vector<Volatility> values);

  // Rows [first, size()), re-indexed from 0. Every column is carried.
  Table tail_from(size_t first) const;

  Candle candle(int idx) const;
};

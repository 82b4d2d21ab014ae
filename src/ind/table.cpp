#include "ind/table.h"
#include "ind/errors.h"

#include <algorithm>
#include <format>
#include <stdexcept>

Table::Table(const Candles& candles) {
  auto n = candles.size();
  datetime.reserve(n);

  std::vector<double> open, high, low, close, volume;
  open.reserve(n);
  high.reserve(n);
  low.reserve(n);
  close.reserve(n);
  volume.reserve(n);

  for (auto& c : candles) {
    datetime.push_back(c.time());
    open.push_back(c.open);
    high.push_back(c.high);
    low.push_back(c.low);
    close.push_back(c.close);
    volume.push_back(c.volume);
  }

  set(Field::Open, std::move(open));
  set(Field::High, std::move(high));
  set(Field::Low, std::move(low));
  set(Field::Close, std::move(close));
  set(Field::Volume, std::move(volume));
}

const std::vector<double>& Table::column(Field f) const {
  auto& col = fields[static_cast<size_t>(f)];
  if (!col)
    throw MissingColumnError{name_of(f)};
  return *col;
}

const std::vector<bool>& Table::column(Flag f) const {
  auto& col = flags[static_cast<size_t>(f)];
  if (!col)
    throw MissingColumnError{name_of(f)};
  return *col;
}

const std::vector<std::string>& Table::trend() const {
  if (!_trend)
    throw MissingColumnError{"trend"};
  return *_trend;
}

const std::vector<Momentum>& Table::momentum() const {
  if (!_momentum)
    throw MissingColumnError{"momentum_state"};
  return *_momentum;
}

const std::vector<Volatility>& Table::volatility() const {
  if (!_volatility)
    throw MissingColumnError{"volatility_state"};
  return *_volatility;
}

inline void check_size(std::string_view name, size_t got, size_t expected) {
  if (got != expected)
    throw std::invalid_argument(
        std::format("column '{}' has {} rows, table has {}", name, got,
                    expected));
}

void Table::set(Field f, std::vector<double> values) {
  check_size(name_of(f), values.size(), size());
  fields[static_cast<size_t>(f)] = std::move(values);
}

void Table::set(Flag f, std::vector<bool> values) {
  check_size(name_of(f), values.size(), size());
  flags[static_cast<size_t>(f)] = std::move(values);
}

void Table::set_trend(std::vector<std::string> values) {
  check_size("trend", values.size(), size());
  _trend = std::move(values);
}

void Table::set_momentum(std::vector<Momentum> values) {
  check_size("momentum_state", values.size(), size());
  _momentum = std::move(values);
}

void Table::set_volatility(std::vector<Volatility> values) {
  check_size("volatility_state", values.size(), size());
  _volatility = std::move(values);
}

template <typename T>
inline auto tail(const std::optional<std::vector<T>>& col, size_t first) {
  std::optional<std::vector<T>> out;
  if (col)
    out.emplace(col->begin() + first, col->end());
  return out;
}

Table Table::tail_from(size_t first) const {
  first = std::min(first, size());

  Table out;
  out.datetime.assign(datetime.begin() + first, datetime.end());

  for (size_t i = 0; i < n_fields; ++i)
    out.fields[i] = tail(fields[i], first);
  for (size_t i = 0; i < n_flags; ++i)
    out.flags[i] = tail(flags[i], first);

  out._trend = tail(_trend, first);
  out._momentum = tail(_momentum, first);
  out._volatility = tail(_volatility, first);

  return out;
}

Candle Table::candle(int idx) const {
  Candle c;
  c.datetime = time(idx);
  c.open = open(idx);
  c.high = high(idx);
  c.low = low(idx);
  c.close = close(idx);
  c.volume = has(Field::Volume) ? get(Field::Volume, idx) : 0.0;
  return c;
}

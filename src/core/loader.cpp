#include "core/loader.h"
#include "ind/errors.h"
#include "ind/rolling.h"
#include "util/math.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <fstream>
#include <stdexcept>
#include <unordered_map>

inline const std::unordered_map<std::string, std::string> column_aliases = {
    {"date", "date"},       {"time", "date"},      {"datetime", "date"},
    {"timestamp", "date"},  {"open time", "date"},

    {"open", "open"},       {"o", "open"},         {"high", "high"},
    {"h", "high"},          {"low", "low"},        {"l", "low"},
    {"close", "close"},     {"c", "close"},        {"adj close", "close"},

    {"volume", "volume"},   {"v", "volume"},       {"vol", "volume"},
    {"tickvol", "volume"},
};

inline std::string trim(std::string_view s) {
  auto is_space = [](unsigned char ch) { return std::isspace(ch); };
  auto b = std::find_if_not(s.begin(), s.end(), is_space);
  auto e = std::find_if_not(s.rbegin(), s.rend(), is_space).base();
  return b < e ? std::string{b, e} : std::string{};
}

std::string normalize_column(std::string_view header) {
  auto key = trim(header);
  std::transform(key.begin(), key.end(), key.begin(),
                 [](unsigned char ch) { return std::tolower(ch); });

  auto it = column_aliases.find(key);
  return it == column_aliases.end() ? key : it->second;
}

// RFC 4180 cells: a double-quoted cell may hold commas, and "" inside it is
// a literal quote. Quoted line breaks are not supported.
inline std::vector<std::string> split(const std::string& line) {
  std::vector<std::string> cells;
  std::string cell;
  bool quoted = false;

  for (size_t i = 0; i < line.size(); ++i) {
    char ch = line[i];
    if (quoted) {
      if (ch != '"')
        cell += ch;
      else if (i + 1 < line.size() && line[i + 1] == '"')
        cell += line[++i];
      else
        quoted = false;
    } else if (ch == '"') {
      quoted = true;
    } else if (ch == ',') {
      cells.push_back(trim(cell));
      cell.clear();
    } else {
      cell += ch;
    }
  }
  cells.push_back(trim(cell));

  return cells;
}

inline double to_number(const std::string& cell) {
  if (cell.empty())
    return NaN;
  try {
    size_t used = 0;
    double v = std::stod(cell, &used);
    return used == cell.size() ? v : NaN;
  } catch (const std::invalid_argument&) {
    return NaN;
  } catch (const std::out_of_range&) {
    return NaN;
  }
}

struct Row {
  LocalTimePoint datetime;
  std::array<double, 5> ohlcv;
  std::string trend;
};

Table read_csv(std::istream& in) {
  std::string line;
  if (!std::getline(in, line))
    throw MissingColumnError{"date"};

  constexpr std::string_view utf8_bom = "\xEF\xBB\xBF";
  if (line.starts_with(utf8_bom))
    line.erase(0, utf8_bom.size());

  auto header = split(line);
  std::unordered_map<std::string, size_t> index;
  for (size_t i = 0; i < header.size(); ++i)
    index.try_emplace(normalize_column(header[i]), i);

  for (auto name : {"date", "open", "high", "low", "close"})
    if (!index.contains(name))
      throw MissingColumnError{name};

  constexpr std::array<std::string_view, 5> ohlcv_names = {
      "open", "high", "low", "close", "volume"};
  bool has_volume = index.contains("volume");
  bool has_trend = index.contains("trend");

  std::vector<Row> rows;
  size_t dropped = 0;

  while (std::getline(in, line)) {
    if (trim(line).empty())
      continue;

    auto cells = split(line);
    auto cell = [&cells](size_t i) {
      return i < cells.size() ? cells[i] : std::string{};
    };

    Row row;
    try {
      row.datetime = datetime_to_local(cell(index.at("date")));
    } catch (const std::invalid_argument&) {
      dropped++;
      continue;
    }

    for (size_t k = 0; k < ohlcv_names.size(); ++k) {
      auto it = index.find(std::string{ohlcv_names[k]});
      row.ohlcv[k] = it == index.end() ? 0.0 : to_number(cell(it->second));
    }
    if (has_trend)
      row.trend = cell(index.at("trend"));

    rows.push_back(std::move(row));
  }

  if (dropped > 0)
    spdlog::warn("[loader] dropped {} rows with unparsable dates", dropped);

  std::stable_sort(rows.begin(), rows.end(), [](auto& l, auto& r) {
    return l.datetime < r.datetime;
  });

  Table t;
  t.datetime.reserve(rows.size());
  for (auto& r : rows)
    t.datetime.push_back(r.datetime);

  constexpr std::array<Field, 5> ohlcv_fields = {
      Field::Open, Field::High, Field::Low, Field::Close, Field::Volume};
  for (size_t k = 0; k < ohlcv_fields.size(); ++k) {
    Series col(rows.size());
    for (size_t i = 0; i < rows.size(); ++i)
      col[i] = rows[i].ohlcv[k];
    t.set(ohlcv_fields[k], std::move(col));
  }

  if (has_trend) {
    std::vector<std::string> trend(rows.size());
    for (size_t i = 0; i < rows.size(); ++i)
      trend[i] = std::move(rows[i].trend);
    t.set_trend(std::move(trend));
  }

  spdlog::info("[loader] {} bars{}{}, timeframe {}", t.size(),
               has_volume ? "" : ", no volume", has_trend ? ", with trend" : "",
               detect_timeframe(t));
  return t;
}

Table read_csv(const std::string& path) {
  std::ifstream file{path};
  if (!file.is_open())
    throw std::runtime_error(std::format("couldn't open bars file {}", path));
  return read_csv(file);
}

std::string detect_timeframe(const Table& bars) {
  if (bars.size() < 2)
    return "unknown";

  Series gaps(bars.size() - 1);
  for (size_t i = 1; i < bars.size(); ++i)
    gaps[i - 1] = static_cast<double>(
        (bars.datetime[i] - bars.datetime[i - 1]).count());

  auto gap = seconds{static_cast<seconds::rep>(median(gaps))};

  if (gap < 2 * M_1)
    return "1m";
  if (gap < 10 * M_1)
    return "5m";
  if (gap < 20 * M_1)
    return "15m";
  if (gap < 40 * M_1)
    return "30m";
  if (gap < 90 * M_1)
    return "1h";
  if (gap < 3 * H_1)
    return "2h";
  if (gap < 6 * H_1)
    return "4h";
  if (gap < H_12)
    return "12h";
  if (gap < 2 * D_1)
    return "1d";
  if (gap < 10 * D_1)
    return "1w";
  return "1mo";
}

#include "core/report.h"
#include "util/format.h"

#include <spdlog/spdlog.h>
#include <fstream>
#include <glaze/glaze.hpp>

std::vector<Flag> active_patterns(const Table& t, int idx) {
  std::vector<Flag> out;
  for (auto f : pattern_priority)
    if (t.has(f) && t.get(f, idx))
      out.push_back(f);
  return out;
}

std::string text_summary(const Table& t, const Summary& s) {
  auto patterns = active_patterns(t);
  auto patterns_text =
      patterns.empty() ? "None" : join(patterns.begin(), patterns.end());

  std::string out;
  out += std::format("Last bar: {}\n", to_str(t.candle(-1)));
  out += std::format("Trend: {}\n", s.last_trend);
  out += std::format("Momentum: {}\n", s.last_momentum);
  out += std::format("Volatility: {}\n", s.last_volatility);
  out += std::format("Detected patterns: {}\n", patterns_text);
  out += std::format("Probability of next bullish bar: {}% ({} of {})\n",
                     s.probability_next_bullish, s.bullish_next, s.matches);
  return out;
}

std::string detailed_analysis(const Table& t, const Summary& s) {
  std::vector<std::string> lines;

  if (s.last_trend == "uptrend" || s.last_trend == "up")
    lines.emplace_back("Price is in an uptrend, which tends to favour "
                       "bullish continuation.");
  else if (s.last_trend == "downtrend" || s.last_trend == "down")
    lines.emplace_back("Price is in a downtrend; bullish signals tend to "
                       "follow through weakly here.");
  else
    lines.push_back(std::format(
        "Price is moving sideways (trend label '{}'), a sign of "
        "consolidation.",
        s.last_trend));

  if (s.last_momentum == "bullish")
    lines.emplace_back("Momentum is bullish: RSI above its upper band with a "
                       "rising MACD histogram.");
  else if (s.last_momentum == "bearish")
    lines.emplace_back("Momentum is bearish: RSI below its lower band with a "
                       "falling MACD histogram.");
  else if (s.last_momentum == "neutral")
    lines.emplace_back("Momentum is neutral.");
  else
    lines.emplace_back("Momentum is undefined for the last bar.");

  if (s.last_volatility == "high")
    lines.emplace_back("Volatility is high, ATR well above its median.");
  else if (s.last_volatility == "low")
    lines.emplace_back("Volatility is low, ATR well below its median.");
  else if (s.last_volatility == "normal")
    lines.emplace_back("Volatility is normal.");
  else
    lines.emplace_back("Volatility is undefined for the last bar.");

  auto patterns = active_patterns(t);
  if (patterns.empty())
    lines.emplace_back("No candle pattern on the last bar.");
  else
    lines.push_back(std::format("Candle pattern(s) on the last bar: {}.",
                                join(patterns.begin(), patterns.end())));

  auto prob = s.probability_next_bullish;
  if (s.matches == 0)
    lines.push_back(std::format(
        "No historical analogs; probability defaults to {}%.", prob));
  else if (prob >= 60)
    lines.push_back(std::format(
        "{}% of {} analogs were followed by a bullish bar: bullish lean.",
        prob, s.matches));
  else if (prob <= 40)
    lines.push_back(std::format(
        "Only {}% of {} analogs were followed by a bullish bar: bearish lean.",
        prob, s.matches));
  else
    lines.push_back(std::format(
        "{}% of {} analogs were followed by a bullish bar: mixed.", prob,
        s.matches));

  lines.emplace_back("The estimate conditions on trend and regime together "
                     "with the candle pattern of the last bar.");

  std::string out;
  for (auto& line : lines)
    out += line + "\n";
  return out;
}

void write_csv(const Table& t, std::ostream& out) {
  std::vector<Field> fields;
  for (size_t f = 0; f < n_fields; ++f)
    if (t.has(static_cast<Field>(f)))
      fields.push_back(static_cast<Field>(f));

  std::vector<Flag> flags;
  for (size_t f = 0; f < n_flags; ++f)
    if (t.has(static_cast<Flag>(f)))
      flags.push_back(static_cast<Flag>(f));

  out << "date";
  for (auto f : fields)
    out << ',' << name_of(f);
  for (auto f : flags)
    out << ',' << name_of(f);
  if (t.has_trend())
    out << ",trend";
  if (t.has_momentum())
    out << ",momentum_state";
  if (t.has_volatility())
    out << ",volatility_state";
  out << '\n';

  for (size_t i = 0; i < t.size(); ++i) {
    out << to_str(t.datetime[i]);
    for (auto f : fields)
      out << ',' << to_str(t.get(f, i));
    for (auto f : flags)
      out << ',' << (t.get(f, i) ? 1 : 0);
    if (t.has_trend())
      out << ',' << t.trend(i);
    if (t.has_momentum())
      out << ',' << name_of(t.momentum(i));
    if (t.has_volatility())
      out << ',' << name_of(t.volatility(i));
    out << '\n';
  }
}

bool write_csv(const Table& t, const std::string& path) {
  std::ofstream file{path};
  if (!file.is_open()) {
    spdlog::error("[report] couldn't open {}", path);
    return false;
  }
  write_csv(t, file);
  spdlog::info("[report] {} rows written to {}", t.size(), path);
  return true;
}

bool write_summary_json(const Summary& s, const std::string& path) {
  auto ec = glz::write_file_json(s, path, std::string{});
  if (ec) {
    spdlog::error("[report] error writing {}", path);
    return false;
  }
  return true;
}

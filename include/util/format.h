#pragma once

#include <cctype>
#include <concepts>
#include <format>
#include <string>
#include <string_view>

template <typename T>
std::string to_str(const T& t);

template <typename Str>
  requires std::constructible_from<std::string, Str>
std::string to_str(const Str& str) {
  return std::string{str};
}

inline std::string join(auto start, auto end, std::string sep = ", ") {
  std::string result;

  for (auto it = start; it != end; it++) {
    result += to_str(*it);

    auto _end = end;
    if (it != --_end)
      result += sep;
  }

  return result;
}

// "bullish_engulfing" -> "Bullish Engulfing"
inline std::string title_case(std::string_view name) {
  std::string out;
  bool upper = true;
  for (char ch : name) {
    if (ch == '_') {
      out += ' ';
      upper = true;
      continue;
    }
    out += upper ? static_cast<char>(std::toupper(ch)) : ch;
    upper = false;
  }
  return out;
}

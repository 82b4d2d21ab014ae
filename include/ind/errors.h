#pragma once

#include <format>
#include <stdexcept>
#include <string>
#include <string_view>

struct AnalysisError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

// A column a stage depends on is absent from its input table.
struct MissingColumnError : public AnalysisError {
  std::string column;

  explicit MissingColumnError(std::string_view col)
      : AnalysisError{std::format("missing required column '{}'", col)},
        column{col} {}
};

// Too few rows to compute anything, or warm-up trimming left nothing.
struct InsufficientHistoryError : public AnalysisError {
  size_t rows;

  InsufficientHistoryError(size_t n, std::string_view why)
      : AnalysisError{std::format("insufficient history ({} rows): {}", n, why)},
        rows{n} {}
};

#pragma once

#include "ind/table.h"

#include <istream>
#include <string>
#include <string_view>

// Lower-cased, trimmed header name mapped onto the canonical column name
// ("Adj Close" -> "close", "timestamp" -> "date", "vol" -> "volume", ...).
std::string normalize_column(std::string_view header);

/**
 * @brief Reads OHLCV bars from CSV into a Table, sorted by date.
 *
 * Required columns: date, open, high, low, close (MissingColumnError
 * otherwise). Volume defaults to 0 when the column is absent; a `trend`
 * column is carried as the external trend label. Cells that do not parse as
 * numbers become NaN; rows whose date does not parse are dropped.
 */
Table read_csv(std::istream& in);
Table read_csv(const std::string& path);

// "1m", "5m", ..., "1d", "1w", "1mo" from the median bar spacing, or
// "unknown" with fewer than two bars.
std::string detect_timeframe(const Table& bars);

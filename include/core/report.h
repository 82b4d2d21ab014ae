#pragma once

#include "ind/analog.h"
#include "ind/schema.h"
#include "ind/table.h"

#include <ostream>
#include <string>
#include <vector>

// Pattern flags set on row idx, in pattern_priority order.
std::vector<Flag> active_patterns(const Table& t, int idx = -1);

// Summary of the last bar: trend, momentum, volatility, patterns and the
// bullish probability.
std::string text_summary(const Table& t, const Summary& s);

// Plain-language reading of the summary, one sentence per line.
std::string detailed_analysis(const Table& t, const Summary& s);

// One line per row: datetime, every present numeric column, every present
// flag and the trend/momentum/volatility labels, headed by canonical names.
void write_csv(const Table& t, std::ostream& out);
bool write_csv(const Table& t, const std::string& path);

bool write_summary_json(const Summary& s, const std::string& path);

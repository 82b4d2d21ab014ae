#pragma once

#include "ind/analog.h"
#include "ind/table.h"

struct Analysis {
  Table table;  // indicators, pattern flags and regime labels
  Summary summary;
};

// bars -> indicators -> patterns -> regimes -> analog probability
Analysis analyze(const Table& bars);

#include "core/analyzer.h"
#include "ind/indicators.h"
#include "ind/patterns.h"
#include "ind/regime.h"
#include "util/times.h"

#include <spdlog/spdlog.h>

Analysis analyze(const Table& bars) {
  Timer timer;

  IndicatorEngine engine{bars};
  auto patterns = PatternDetector{engine.features()}.detect_all();
  RegimeClassifier regimes{patterns};
  AnalogProbabilityModel model{regimes.classify()};

  Analysis out{regimes.classify(), model.summary()};

  spdlog::info("[analyze] {} bars -> {} rows in {:.1f}ms", bars.size(),
               out.table.size(), timer.diff_ms());
  return out;
}

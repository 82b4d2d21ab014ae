#pragma once

#include <string>

struct IndicatorsConfig {
  static constexpr const char* name = "ind_config";
  static constexpr bool debug = true;

  // volume / vol_ma20 at or above this raises vol_spike_flag
  double volume_spike_ratio = 1.5;
};

struct PatternConfig {
  static constexpr const char* name = "pattern_config";
  static constexpr bool debug = true;

  double doji_threshold = 0.1;      // body / range
  double wick_body_ratio = 2.0;     // hammer, shooting star
  double star_body_ratio = 0.5;     // middle body vs first body
};

struct RegimeConfig {
  static constexpr const char* name = "regime_config";
  static constexpr bool debug = true;

  double rsi_bullish = 55.0;
  double rsi_bearish = 45.0;

  double atr_high_ratio = 1.2;
  double atr_low_ratio = 0.8;

  // write the latest labels onto every row, as the first version did
  bool broadcast_labels = false;
};

struct ModelConfig {
  static constexpr const char* name = "model_config";
  static constexpr bool debug = true;

  double neutral_probability = 50.0;
  int precision = 2;
};

struct Config {
  bool debug_en = false;
  bool broadcast_regimes = false;

  std::string input_path;
  std::string config_dir;
  std::string json_path;
  std::string csv_path;

  IndicatorsConfig ind_config;
  PatternConfig pattern_config;
  RegimeConfig regime_config;
  ModelConfig model_config;

  Config() = default;
  void read_args(int argc, char* argv[]);
  void update();
};

inline Config config;

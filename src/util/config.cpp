#include "util/config.h"

#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <filesystem>
#include <glaze/glaze.hpp>
#include <iostream>

namespace fs = std::filesystem;

template <typename T>
T read(const fs::path& path) {
  T t{};

  if (!fs::exists(path)) {
    spdlog::debug("[config] {} not found, using defaults", path.string());
    return t;
  }

  auto ec = glz::read_file_json(t, path.string(), std::string{});
  if (ec) {
    spdlog::error("[config] {} error {}", path.string(),
                  glz::format_error(ec));
    return T{};
  }

  if (T::debug) {
    std::string buffer;
    auto _ = glz::write<glz::opts{.prettify = true}>(t, buffer);
    spdlog::debug("[config] \"{}\": {}", T::name, buffer);
  }

  return t;
}

void Config::update() {
  if (!config_dir.empty()) {
    fs::path dir{config_dir};
    ind_config = read<IndicatorsConfig>(dir / "indicators.json");
    pattern_config = read<PatternConfig>(dir / "patterns.json");
    regime_config = read<RegimeConfig>(dir / "regime.json");
    model_config = read<ModelConfig>(dir / "model.json");
  }

  if (broadcast_regimes)
    regime_config.broadcast_labels = true;
}

void Config::read_args(int argc, char* argv[]) {
  argparse::ArgumentParser program("candlestat");

  program.add_argument("input").help("CSV file with date/open/high/low/close");

  program.add_argument("-d", "--debug")
      .default_value(false)
      .implicit_value(true)
      .help("Enable debug");

  program.add_argument("-c", "--config")
      .default_value(std::string{})
      .help("Directory holding indicators/patterns/regime/model.json");

  program.add_argument("-j", "--json")
      .default_value(std::string{})
      .help("Write the summary as JSON to this path");

  program.add_argument("-o", "--csv")
      .default_value(std::string{})
      .help("Write the annotated table as CSV to this path");

  program.add_argument("-b", "--broadcast-regimes")
      .default_value(false)
      .implicit_value(true)
      .help("Apply the latest momentum/volatility label to every row");

  try {
    program.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << "\n" << program << "\n";
    throw;
  }

  input_path = program.get<std::string>("input");
  debug_en = program.get<bool>("--debug");
  config_dir = program.get<std::string>("--config");
  json_path = program.get<std::string>("--json");
  csv_path = program.get<std::string>("--csv");
  broadcast_regimes = program.get<bool>("--broadcast-regimes");
}

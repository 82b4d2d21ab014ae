#include "core/analyzer.h"
#include "core/loader.h"
#include "core/report.h"
#include "util/config.h"
#include "util/format.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

inline void init_logging() {
  auto pwd = fs::current_path().generic_string();
  auto log_name = std::format("{}/logs/{:%F_%H-%M-%S}.log", pwd,
                              std::chrono::floor<seconds>(SysClock::now()));
  auto link_name = pwd + "/logs/output.log";

  std::error_code ec;
  fs::remove(link_name, ec);
  fs::create_symlink(log_name, link_name, ec);

  auto file_logger = spdlog::basic_logger_mt("file_logger", log_name);
  spdlog::set_default_logger(file_logger);

  auto level = config.debug_en ? spdlog::level::debug : spdlog::level::info;
  spdlog::set_level(level);
  spdlog::flush_on(level);

  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");
}

inline void ensure_directories_exist(const std::vector<std::string>& dirs) {
  for (const auto& dir : dirs) {
    fs::path path{dir};
    if (fs::exists(path))
      continue;
    if (fs::create_directories(path))
      std::cout << "Created: " << dir << '\n';
    else
      std::cerr << "Failed to create: " << dir << '\n';
  }
}

int main(int argc, char* argv[]) {
  try {
    config.read_args(argc, argv);
  } catch (const std::runtime_error&) {
    return 2;
  }

  ensure_directories_exist({"logs"});
  init_logging();
  config.update();

  try {
    auto bars = read_csv(config.input_path);
    auto [table, summary] = analyze(bars);

    std::cout << text_summary(table, summary) << '\n'
              << detailed_analysis(table, summary);

    bool written = true;
    if (!config.json_path.empty())
      written &= write_summary_json(summary, config.json_path);
    if (!config.csv_path.empty())
      written &= write_csv(table, config.csv_path);

    spdlog::info("[main] {}", to_str(summary));
    if (!written)
      return 1;
  } catch (const std::exception& e) {
    spdlog::error("[main] {}", e.what());
    std::cerr << "error: " << e.what() << '\n';
    return 1;
  }

  return 0;
}

#include "runner_shared.hpp"

#include "landsat_change/core/errors.hpp"
#include "landsat_change/core/utils.hpp"

#include <csignal>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>

namespace landsat_change::runner {

namespace fs = std::filesystem;

std::string format_bytes(uint64_t bytes) {
  static const char *kUnits[] = {"B", "KiB", "MiB", "GiB", "TiB"};
  double value = static_cast<double>(bytes);
  size_t unit = 0;
  while (value >= 1024.0 && unit + 1 < (sizeof(kUnits) / sizeof(kUnits[0]))) {
    value /= 1024.0;
    ++unit;
  }
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(unit == 0 ? 0 : 2) << value << " "
      << kUnits[unit];
  return oss.str();
}

uint64_t estimate_total_file_bytes(const std::vector<fs::path> &paths) {
  uint64_t total = 0;
  for (const auto &p : paths) {
    std::error_code ec;
    const auto sz = fs::file_size(p, ec);
    if (ec) {
      continue;
    }
    if (total <= std::numeric_limits<uint64_t>::max() - static_cast<uint64_t>(sz)) {
      total += static_cast<uint64_t>(sz);
    } else {
      total = std::numeric_limits<uint64_t>::max();
      break;
    }
  }
  return total;
}

TeeBuf::TeeBuf(std::streambuf *a, std::streambuf *b) : a_(a), b_(b) {}

int TeeBuf::overflow(int c) {
  if (c == EOF)
    return EOF;
  const int ra = a_ ? a_->sputc(static_cast<char>(c)) : c;
  const int rb = b_ ? b_->sputc(static_cast<char>(c)) : c;
  return (ra == EOF || rb == EOF) ? EOF : c;
}

int TeeBuf::sync() {
  int ra = a_ ? a_->pubsync() : 0;
  int rb = b_ ? b_->pubsync() : 0;
  return (ra == 0 && rb == 0) ? 0 : -1;
}

std::atomic<bool> &stop_flag() {
  static std::atomic<bool> flag{false};
  return flag;
}

namespace {
void handle_stop_signal(int) { stop_flag().store(true); }
} // namespace

void install_stop_handler() {
  stop_flag().store(false);
  std::signal(SIGINT, handle_stop_signal);
  std::signal(SIGTERM, handle_stop_signal);
}

config::Config load_run_config(const std::string &config_path, bool from_stdin,
                               std::string &cfg_text) {
  config::Config cfg;
  if (from_stdin || config_path == "-") {
    std::ostringstream ss;
    ss << std::cin.rdbuf();
    cfg_text = ss.str();
    if (cfg_text.empty()) {
      throw ConfigError("--stdin provided but no config YAML received");
    }
    cfg = config::Config::from_yaml(YAML::Load(cfg_text));
  } else {
    cfg = config::Config::load(config_path);
    cfg_text = core::read_text(config_path);
  }
  cfg.validate();
  return cfg;
}

fs::path prepare_run_dir(const fs::path &runs_dir, const std::string &run_id,
                         const std::string &cfg_text) {
  fs::path run_dir = fs::absolute(runs_dir / run_id);
  fs::create_directories(run_dir / "logs");
  fs::create_directories(run_dir / "outputs");
  fs::create_directories(run_dir / "artifacts");
  core::write_text(run_dir / "config.yaml", cfg_text);
  return run_dir;
}

} // namespace landsat_change::runner

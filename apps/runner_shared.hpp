#pragma once

#include "landsat_change/config/configuration.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <streambuf>
#include <string>
#include <vector>

namespace landsat_change::runner {

std::string format_bytes(uint64_t bytes);

uint64_t estimate_total_file_bytes(const std::vector<std::filesystem::path> &paths);

class TeeBuf : public std::streambuf {
public:
  TeeBuf(std::streambuf *a, std::streambuf *b);

protected:
  int overflow(int c) override;
  int sync() override;

private:
  std::streambuf *a_;
  std::streambuf *b_;
};

// Set by SIGINT/SIGTERM once install_stop_handler() has run.
std::atomic<bool> &stop_flag();
void install_stop_handler();

// Loads and validates the config from a file, or from stdin when
// `from_stdin` is set or the path is "-". `cfg_text` receives the raw YAML.
config::Config load_run_config(const std::string &config_path, bool from_stdin,
                               std::string &cfg_text);

// Creates runs/<run_id>/{logs,outputs,artifacts} and writes config.yaml.
std::filesystem::path prepare_run_dir(const std::filesystem::path &runs_dir,
                                      const std::string &run_id,
                                      const std::string &cfg_text);

} // namespace landsat_change::runner

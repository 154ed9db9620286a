#pragma once

#include <string>

int run_events_command(const std::string &config_path,
                       const std::string &trend_dir,
                       const std::string &runs_dir,
                       const std::string &run_id_override,
                       bool dry_run);

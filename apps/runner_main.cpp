#include "runner_composite.hpp"
#include "runner_events.hpp"

#include <CLI/CLI.hpp>

#include <iostream>
#include <string>

int main(int argc, char *argv[]) {
  CLI::App app{"Landsat change detection runner"};
  app.require_subcommand(1);

  std::string config_path, input_dir, trend_dir, runs_dir, run_id;
  bool dry_run = false;
  bool config_from_stdin = false;

  auto composite_cmd = app.add_subcommand(
      "composite", "Harmonize the archive, build yearly medoid composites and fitter input");
  composite_cmd->add_option("--config", config_path, "Path to config.yaml")->required();
  composite_cmd->add_option("--input-dir", input_dir, "Scene archive directory")->required();
  composite_cmd->add_option("--runs-dir", runs_dir, "Runs directory")->required();
  composite_cmd->add_option("--run-id", run_id, "Run id (default: timestamp + random)");
  composite_cmd->add_flag("--dry-run", dry_run, "Dry run");
  composite_cmd->add_flag("--stdin", config_from_stdin,
                          "Read config YAML from stdin (use with --config -)");

  auto events_cmd = app.add_subcommand(
      "events", "Select the most recent disturbance per pixel from a fitted trend model");
  events_cmd->add_option("--config", config_path, "Path to config.yaml")->required();
  events_cmd->add_option("--trend-dir", trend_dir, "Trend fitter output directory")->required();
  events_cmd->add_option("--runs-dir", runs_dir, "Runs directory")->required();
  events_cmd->add_option("--run-id", run_id, "Run id (default: timestamp + random)");
  events_cmd->add_flag("--dry-run", dry_run, "Dry run");

  CLI11_PARSE(app, argc, argv);

  if (composite_cmd->parsed()) {
    return run_composite_command(config_path, input_dir, runs_dir, run_id, dry_run,
                                 config_from_stdin);
  }

  if (events_cmd->parsed()) {
    return run_events_command(config_path, trend_dir, runs_dir, run_id, dry_run);
  }

  std::cerr << app.help() << std::endl;
  return 1;
}

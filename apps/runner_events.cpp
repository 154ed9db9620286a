#include "runner_events.hpp"

#include "landsat_change/config/configuration.hpp"
#include "landsat_change/core/errors.hpp"
#include "landsat_change/core/events.hpp"
#include "landsat_change/core/types.hpp"
#include "landsat_change/core/utils.hpp"
#include "landsat_change/index/spectral_index.hpp"
#include "landsat_change/io/products.hpp"
#include "landsat_change/segment/disturbance_events.hpp"

#include "runner_shared.hpp"

#include <fstream>
#include <iostream>
#include <vector>

namespace fs = std::filesystem;

namespace {
using landsat_change::runner::TeeBuf;
using landsat_change::runner::estimate_total_file_bytes;
using landsat_change::runner::format_bytes;
} // namespace

int run_events_command(const std::string &config_path, const std::string &trend_dir,
                       const std::string &runs_dir, const std::string &run_id_override,
                       bool dry_run) {
  using namespace landsat_change;

  fs::path t_dir(trend_dir);
  if (!fs::exists(t_dir)) {
    std::cerr << "Error: Trend directory not found: " << trend_dir << std::endl;
    return 1;
  }

  config::Config cfg;
  std::string cfg_text;
  try {
    cfg = runner::load_run_config(config_path, false, cfg_text);
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  std::string run_id = run_id_override.empty() ? core::get_run_id() : run_id_override;
  fs::path run_dir = runner::prepare_run_dir(runs_dir, run_id, cfg_text);

  std::ofstream event_log_file(run_dir / "logs" / "run_events.jsonl",
                               std::ios::out | std::ios::trunc);
  if (!event_log_file.is_open()) {
    std::cerr << "Error: cannot open events log file: "
              << (run_dir / "logs" / "run_events.jsonl") << std::endl;
    return 1;
  }
  TeeBuf tee_buf(std::cout.rdbuf(), event_log_file.rdbuf());
  std::ostream log_file(&tee_buf);

  const std::vector<uint8_t> cfg_bytes(cfg_text.begin(), cfg_text.end());
  const fs::path fitted_path = t_dir / cfg.trend.fitted_file;
  const fs::path vertex_path = t_dir / cfg.trend.vertex_file;
  const fs::path rmse_path = t_dir / cfg.trend.rmse_file;

  core::EventEmitter emitter;
  emitter.run_start(run_id,
                    {{"command", "events"},
                     {"config_path", config_path},
                     {"config_sha256", core::sha256_bytes(cfg_bytes)},
                     {"trend_dir", trend_dir},
                     {"run_dir", run_dir.string()},
                     {"dry_run", dry_run}},
                    log_file);

  std::cout << "Run ID: " << run_id << std::endl;
  std::cout << "Output: " << run_dir.string() << std::endl;

  if (dry_run) {
    emitter.phase_start(run_id, Phase::SEGMENTS, log_file);
    emitter.phase_end(run_id, Phase::SEGMENTS, "skipped",
                      {{"reason", "dry_run"}, {"trend_dir", trend_dir}}, log_file);
    std::cout << "Dry run - no processing" << std::endl;
    emitter.run_end(run_id, true, "ok", log_file);
    return 0;
  }

  Phase current = Phase::SEGMENTS;
  try {
    const index::IndexDefinition &def = index::definition(index::resolve_index(cfg.index.name));

    segment::EventOptions opts;
    opts.start_year = cfg.disturbance.start_year;
    opts.end_year = cfg.disturbance.end_year;
    opts.dsnr_threshold = cfg.disturbance.dsnr_threshold;
    opts.direction = cfg.segments.orientation_correct ? def.direction : 1;
    opts.parallel_workers = cfg.runtime_limits.parallel_workers;
    opts.tile_size = cfg.runtime_limits.tile_size;

    // Phase 5: SEGMENTS
    emitter.phase_start(run_id, current, log_file);

    const std::vector<fs::path> inputs = {fitted_path, vertex_path, rmse_path};
    std::cout << "Trend model: " << format_bytes(estimate_total_file_bytes(inputs))
              << std::endl;
    segment::TrendModel model = io::read_trend_model(fitted_path, vertex_path, rmse_path);

    emitter.phase_end(run_id, current, "ok",
                      {{"years", model.years.size()},
                       {"first_year", model.years.front()},
                       {"last_year", model.years.back()},
                       {"rows", model.rows()},
                       {"cols", model.cols()},
                       {"index", def.name},
                       {"direction", opts.direction}},
                      log_file);

    // Phase 6: EVENTS
    current = Phase::EVENTS;
    emitter.phase_start(run_id, current, log_file);

    segment::DisturbanceRaster raster = segment::extract_events(model, opts);

    const Matrix2Df &yod = raster.channel("yod");
    long with_event = 0;
    for (Eigen::Index i = 0; i < yod.size(); ++i) {
      if (!is_nodata(yod.data()[i]))
        ++with_event;
    }

    const fs::path events_path = run_dir / "outputs" / cfg.output.events_file;
    io::write_disturbance_raster(events_path, raster, opts);

    emitter.phase_end(run_id, current, "ok",
                      {{"pixels", yod.size()},
                       {"pixels_with_event", with_event},
                       {"start_year", opts.start_year},
                       {"end_year", opts.end_year},
                       {"dsnr_threshold", opts.dsnr_threshold},
                       {"output", events_path.string()}},
                      log_file);

    emitter.phase_start(run_id, Phase::DONE, log_file);
    emitter.phase_end(run_id, Phase::DONE, "ok", core::json::object(), log_file);
  } catch (const std::exception &e) {
    emitter.phase_end(run_id, current, "error", {{"error", e.what()}}, log_file);
    emitter.error(run_id, e.what(), log_file);
    emitter.run_end(run_id, false, "error", log_file);
    std::cerr << "Error during " << phase_to_string(current) << ": " << e.what() << std::endl;
    return 1;
  }

  emitter.run_end(run_id, true, "ok", log_file);
  return 0;
}

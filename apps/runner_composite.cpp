#include "runner_composite.hpp"

#include "landsat_change/archive/archive_merger.hpp"
#include "landsat_change/composite/medoid_compositor.hpp"
#include "landsat_change/config/configuration.hpp"
#include "landsat_change/core/errors.hpp"
#include "landsat_change/core/events.hpp"
#include "landsat_change/core/types.hpp"
#include "landsat_change/core/utils.hpp"
#include "landsat_change/harmonize/sensor_harmonizer.hpp"
#include "landsat_change/index/spectral_index.hpp"
#include "landsat_change/io/fits_io.hpp"
#include "landsat_change/io/image_archive.hpp"
#include "landsat_change/io/products.hpp"
#include "landsat_change/pipeline/tile_grid.hpp"

#include "runner_shared.hpp"

#include <algorithm>
#include <atomic>
#include <fstream>
#include <iostream>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

namespace fs = std::filesystem;

namespace {
using landsat_change::runner::TeeBuf;
using landsat_change::runner::estimate_total_file_bytes;
using landsat_change::runner::format_bytes;
} // namespace

int run_composite_command(const std::string &config_path, const std::string &input_dir,
                          const std::string &runs_dir, const std::string &run_id_override,
                          bool dry_run, bool config_from_stdin) {
  using namespace landsat_change;

  fs::path in_dir(input_dir);
  if (!fs::exists(in_dir)) {
    std::cerr << "Error: Input directory not found: " << input_dir << std::endl;
    return 1;
  }

  config::Config cfg;
  std::string cfg_text;
  try {
    cfg = runner::load_run_config(config_path, config_from_stdin, cfg_text);
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

  core::EventEmitter emitter;
  emitter.run_start(run_id,
                    {{"command", "composite"},
                     {"config_path", config_path},
                     {"config_sha256", core::sha256_bytes(cfg_bytes)},
                     {"input_dir", input_dir},
                     {"run_dir", run_dir.string()},
                     {"dry_run", dry_run}},
                    log_file);

  std::cout << "Run ID: " << run_id << std::endl;
  std::cout << "Output: " << run_dir.string() << std::endl;

  if (dry_run) {
    emitter.phase_start(run_id, Phase::SCAN_ARCHIVE, log_file);
    emitter.phase_end(run_id, Phase::SCAN_ARCHIVE, "skipped",
                      {{"reason", "dry_run"}, {"input_dir", input_dir}}, log_file);
    std::cout << "Dry run - no processing" << std::endl;
    emitter.run_end(run_id, true, "ok", log_file);
    return 0;
  }

  runner::install_stop_handler();
  std::atomic<bool> &stop = runner::stop_flag();

  Phase current = Phase::SCAN_ARCHIVE;
  try {
    const composite::SeasonWindow window =
        composite::parse_season_window(cfg.compositing.start_day, cfg.compositing.end_day);
    const archive::DateRange range = archive::archive_date_range(
        cfg.archive.start_year, cfg.archive.end_year, window.start, window.end);
    const index::SpectralIndex spectral_index = index::resolve_index(cfg.index.name);
    const std::vector<CanonicalBand> ftv_bands = index::resolve_ftv_bands(cfg.index.ftv_bands);

    // Phase 0: SCAN_ARCHIVE
    current = Phase::SCAN_ARCHIVE;
    emitter.phase_start(run_id, current, log_file);

    io::DirectoryArchive scene_archive(in_dir, cfg.archive.pattern);
    const auto scenes = scene_archive.scan();

    std::map<std::string, int> per_sensor;
    std::vector<fs::path> in_range_paths;
    for (const auto &s : scenes) {
      const bool wanted = std::find(cfg.archive.sensors.begin(), cfg.archive.sensors.end(),
                                    s.sensor) != cfg.archive.sensors.end();
      if (wanted && archive::in_range(s.date, range)) {
        per_sensor[s.sensor]++;
        in_range_paths.push_back(s.path);
      }
    }
    if (in_range_paths.empty()) {
      throw PipelineError("no scenes of the configured sensors between " +
                          core::date_to_string(range.first) + " and " +
                          core::date_to_string(range.last_exclusive) + " in " + input_dir);
    }

    harmonize::HarmonizeOptions hopts;
    hopts.interpolation = harmonize::interpolation_from_string(cfg.harmonization.interpolation);
    hopts.target_rows = cfg.harmonization.target_rows;
    hopts.target_cols = cfg.harmonization.target_cols;
    if (hopts.target_rows == 0 || hopts.target_cols == 0) {
      const auto [w, h, depth] = io::get_fits_dimensions(in_range_paths.front());
      (void)depth;
      hopts.target_rows = h;
      hopts.target_cols = w;
    }

    core::json sensor_counts = core::json::object();
    for (const auto &[sensor, n] : per_sensor)
      sensor_counts[sensor] = n;
    std::cout << "Scenes: " << in_range_paths.size() << " of " << scenes.size() << " ("
              << format_bytes(estimate_total_file_bytes(in_range_paths)) << ")" << std::endl;
    emitter.phase_end(run_id, current, "ok",
                      {{"scenes_total", scenes.size()},
                       {"scenes_in_range", in_range_paths.size()},
                       {"per_sensor", sensor_counts},
                       {"target_rows", hopts.target_rows},
                       {"target_cols", hopts.target_cols}},
                      log_file);

    // Phase 1: HARMONIZE
    current = Phase::HARMONIZE;
    emitter.phase_start(run_id, current, log_file);

    std::vector<TimeSeries> per_sensor_series;
    std::mutex progress_mutex;
    std::atomic<size_t> harmonized{0};
    std::atomic<size_t> skipped{0};
    const size_t total_scenes = in_range_paths.size();

    for (const auto &sensor : cfg.archive.sensors) {
      std::vector<RawImage> raws = scene_archive.collect(sensor, range);
      std::vector<std::optional<Image>> images(raws.size());

      pipeline::parallel_for(raws.size(), cfg.runtime_limits.parallel_workers, [&](size_t i) {
        try {
          images[i] = harmonize::harmonize(raws[i], hopts);
        } catch (const ValidationError &e) {
          if (cfg.pipeline.abort_on_fail)
            throw;
          skipped++;
          std::lock_guard<std::mutex> lock(progress_mutex);
          emitter.warning(run_id, "skipping scene " + raws[i].scene_id + ": " + e.what(),
                          log_file);
          return;
        }
        size_t done = ++harmonized;
        if (done % 10 == 0 || done == total_scenes) {
          std::lock_guard<std::mutex> lock(progress_mutex);
          emitter.phase_progress(run_id, Phase::HARMONIZE, static_cast<int>(done),
                                 static_cast<int>(total_scenes), sensor, "scenes", log_file);
        }
      });

      TimeSeries series;
      for (auto &img : images) {
        if (img)
          series.push_back(std::move(*img));
      }
      per_sensor_series.push_back(std::move(series));
    }

    emitter.phase_end(run_id, current, "ok",
                      {{"harmonized", harmonized.load()}, {"skipped", skipped.load()}},
                      log_file);

    // Phase 2: MERGE
    current = Phase::MERGE;
    emitter.phase_start(run_id, current, log_file);
    TimeSeries merged = archive::merge_time_series(per_sensor_series);
    per_sensor_series.clear();
    emitter.phase_end(run_id, current, "ok",
                      {{"observations", merged.size()},
                       {"first_date", merged.empty() ? "" : core::date_to_string(merged.front().date)},
                       {"last_date", merged.empty() ? "" : core::date_to_string(merged.back().date)}},
                      log_file);

    // Phase 3: COMPOSITE
    current = Phase::COMPOSITE;
    emitter.phase_start(run_id, current, log_file);

    const fs::path composites_dir = run_dir / "outputs" / cfg.output.composites_dir;
    if (cfg.output.write_composites)
      fs::create_directories(composites_dir);

    composite::CompositorOptions copts;
    copts.parallel_workers = cfg.runtime_limits.parallel_workers;
    copts.tile_size = cfg.runtime_limits.tile_size;

    const size_t n_years = composite::enumerate_years(merged).size();
    size_t years_done = 0;
    composite::CompositeRun run = composite::composite_series(
        merged, window, copts, &stop, [&](const composite::YearlyComposite &yc) {
          ++years_done;
          emitter.year_processed(run_id, Phase::COMPOSITE, yc.year,
                                 static_cast<int>(yc.n_observations),
                                 yc.empty_window ? "empty_window" : "ok", log_file);
          if (cfg.output.write_composites) {
            io::write_composite(composites_dir /
                                    ("composite_" + std::to_string(yc.year) + ".fits"),
                                yc);
          }
          emitter.phase_progress(run_id, Phase::COMPOSITE, static_cast<int>(years_done),
                                 static_cast<int>(n_years), std::to_string(yc.year), "years",
                                 log_file);
        });

    for (const auto &err : run.data_errors) {
      emitter.warning(run_id, err.what(), log_file);
    }

    if (run.cancelled) {
      emitter.phase_end(run_id, current, "stopped",
                        {{"years_done", run.composites.size()}, {"years_total", n_years}},
                        log_file);
      emitter.stop_requested(run_id, current, log_file);
      emitter.run_end(run_id, false, "stopped", log_file);
      std::cerr << "Stopped after " << run.composites.size() << " of " << n_years << " years"
                << std::endl;
      return 1;
    }

    emitter.phase_end(run_id, current, "ok",
                      {{"years", run.composites.size()},
                       {"empty_years", run.data_errors.size()}},
                      log_file);

    // Phase 4: INDEX_BANDS
    current = Phase::INDEX_BANDS;
    emitter.phase_start(run_id, current, log_file);

    TimeSeries composite_images;
    composite_images.reserve(run.composites.size());
    for (auto &yc : run.composites)
      composite_images.push_back(std::move(yc.image));
    run.composites.clear();

    const auto index_series =
        index::build_index_series(composite_images, spectral_index, ftv_bands);

    const fs::path fitter_dir = run_dir / "outputs" / cfg.output.fitter_input_dir;
    if (cfg.output.write_fitter_input) {
      fs::create_directories(fitter_dir);
      for (const auto &ii : index_series) {
        io::write_index_image(fitter_dir / (ii.index_name + "_" +
                                            std::to_string(ii.date.year) + ".fits"),
                              ii);
      }
    }

    emitter.phase_end(run_id, current, "ok",
                      {{"index", index::index_to_string(spectral_index)},
                       {"images", index_series.size()},
                       {"bands", index_series.empty() ? core::json::array()
                                                      : core::json(index_series.front().band_names)}},
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

#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace landsat_change::config {

namespace fs = std::filesystem;

struct PipelineConfig {
  bool abort_on_fail = true;
};

struct ArchiveConfig {
  std::vector<std::string> sensors{"LT05", "LE07", "LC08"};
  int start_year = 1985;
  int end_year = 2020;
  std::string pattern = "*.fit;*.fits;*.fts";
};

struct HarmonizationConfig {
  std::string interpolation = "bilinear"; // bilinear | nearest
  int target_rows = 0;                    // 0 = grid of the first scene
  int target_cols = 0;
};

struct CompositingConfig {
  std::string start_day = "06-20"; // MM-DD, inclusive
  std::string end_day = "09-10";   // MM-DD, inclusive
};

struct IndexConfig {
  std::string name = "NBR";
  std::vector<std::string> ftv_bands{"B4", "B5", "B7"};
};

struct SegmentsConfig {
  bool orientation_correct = true;
};

struct DisturbanceConfig {
  int start_year = 1990;
  int end_year = 2020;
  float dsnr_threshold = 1.0f;
};

struct TrendConfig {
  std::string fitted_file = "fitted.fits";
  std::string vertex_file = "vertex.fits";
  std::string rmse_file = "rmse.fits";
};

struct OutputConfig {
  std::string composites_dir = "composites";
  std::string fitter_input_dir = "fitter_input";
  std::string events_file = "disturbance_events.fits";
  bool write_composites = true;
  bool write_fitter_input = true;
};

struct RuntimeLimitsConfig {
  int parallel_workers = 4;
  int tile_size = 256;
};

struct Config {
  PipelineConfig pipeline;
  ArchiveConfig archive;
  HarmonizationConfig harmonization;
  CompositingConfig compositing;
  IndexConfig index;
  SegmentsConfig segments;
  DisturbanceConfig disturbance;
  TrendConfig trend;
  OutputConfig output;
  RuntimeLimitsConfig runtime_limits;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

} // namespace landsat_change::config

#include "landsat_change/config/configuration.hpp"
#include "landsat_change/core/errors.hpp"
#include "landsat_change/core/types.hpp"
#include "landsat_change/core/utils.hpp"
#include "landsat_change/harmonize/sensor_harmonizer.hpp"
#include "landsat_change/index/spectral_index.hpp"

#include <cmath>
#include <fstream>

namespace landsat_change::config {

static void read_string_list(const YAML::Node& n, std::vector<std::string>& out) {
    if (n && n.IsSequence()) {
        out.clear();
        for (const auto& it : n) {
            out.push_back(it.as<std::string>());
        }
    }
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node = YAML::LoadFile(path.string());
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    if (node["pipeline"]) {
        auto p = node["pipeline"];
        if (p["abort_on_fail"]) cfg.pipeline.abort_on_fail = p["abort_on_fail"].as<bool>();
    }

    if (node["archive"]) {
        auto a = node["archive"];
        read_string_list(a["sensors"], cfg.archive.sensors);
        if (a["start_year"]) cfg.archive.start_year = a["start_year"].as<int>();
        if (a["end_year"]) cfg.archive.end_year = a["end_year"].as<int>();
        if (a["pattern"]) cfg.archive.pattern = a["pattern"].as<std::string>();
    }

    if (node["harmonization"]) {
        auto h = node["harmonization"];
        if (h["interpolation"]) cfg.harmonization.interpolation = h["interpolation"].as<std::string>();
        if (h["target_rows"]) cfg.harmonization.target_rows = h["target_rows"].as<int>();
        if (h["target_cols"]) cfg.harmonization.target_cols = h["target_cols"].as<int>();
    }

    if (node["compositing"]) {
        auto c = node["compositing"];
        if (c["start_day"]) cfg.compositing.start_day = c["start_day"].as<std::string>();
        if (c["end_day"]) cfg.compositing.end_day = c["end_day"].as<std::string>();
    }

    if (node["index"]) {
        auto i = node["index"];
        if (i["name"]) cfg.index.name = i["name"].as<std::string>();
        read_string_list(i["ftv_bands"], cfg.index.ftv_bands);
    }

    if (node["segments"]) {
        auto s = node["segments"];
        if (s["orientation_correct"]) cfg.segments.orientation_correct = s["orientation_correct"].as<bool>();
    }

    if (node["disturbance"]) {
        auto d = node["disturbance"];
        if (d["start_year"]) cfg.disturbance.start_year = d["start_year"].as<int>();
        if (d["end_year"]) cfg.disturbance.end_year = d["end_year"].as<int>();
        if (d["dsnr_threshold"]) cfg.disturbance.dsnr_threshold = d["dsnr_threshold"].as<float>();
    }

    if (node["trend"]) {
        auto t = node["trend"];
        if (t["fitted_file"]) cfg.trend.fitted_file = t["fitted_file"].as<std::string>();
        if (t["vertex_file"]) cfg.trend.vertex_file = t["vertex_file"].as<std::string>();
        if (t["rmse_file"]) cfg.trend.rmse_file = t["rmse_file"].as<std::string>();
    }

    if (node["output"]) {
        auto o = node["output"];
        if (o["composites_dir"]) cfg.output.composites_dir = o["composites_dir"].as<std::string>();
        if (o["fitter_input_dir"]) cfg.output.fitter_input_dir = o["fitter_input_dir"].as<std::string>();
        if (o["events_file"]) cfg.output.events_file = o["events_file"].as<std::string>();
        if (o["write_composites"]) cfg.output.write_composites = o["write_composites"].as<bool>();
        if (o["write_fitter_input"]) cfg.output.write_fitter_input = o["write_fitter_input"].as<bool>();
    }

    if (node["runtime_limits"]) {
        auto r = node["runtime_limits"];
        if (r["parallel_workers"]) cfg.runtime_limits.parallel_workers = r["parallel_workers"].as<int>();
        if (r["tile_size"]) cfg.runtime_limits.tile_size = r["tile_size"].as<int>();
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["pipeline"]["abort_on_fail"] = pipeline.abort_on_fail;

    node["archive"]["sensors"] = archive.sensors;
    node["archive"]["start_year"] = archive.start_year;
    node["archive"]["end_year"] = archive.end_year;
    node["archive"]["pattern"] = archive.pattern;

    node["harmonization"]["interpolation"] = harmonization.interpolation;
    node["harmonization"]["target_rows"] = harmonization.target_rows;
    node["harmonization"]["target_cols"] = harmonization.target_cols;

    node["compositing"]["start_day"] = compositing.start_day;
    node["compositing"]["end_day"] = compositing.end_day;

    node["index"]["name"] = index.name;
    node["index"]["ftv_bands"] = index.ftv_bands;

    node["segments"]["orientation_correct"] = segments.orientation_correct;

    node["disturbance"]["start_year"] = disturbance.start_year;
    node["disturbance"]["end_year"] = disturbance.end_year;
    node["disturbance"]["dsnr_threshold"] = disturbance.dsnr_threshold;

    node["trend"]["fitted_file"] = trend.fitted_file;
    node["trend"]["vertex_file"] = trend.vertex_file;
    node["trend"]["rmse_file"] = trend.rmse_file;

    node["output"]["composites_dir"] = output.composites_dir;
    node["output"]["fitter_input_dir"] = output.fitter_input_dir;
    node["output"]["events_file"] = output.events_file;
    node["output"]["write_composites"] = output.write_composites;
    node["output"]["write_fitter_input"] = output.write_fitter_input;

    node["runtime_limits"]["parallel_workers"] = runtime_limits.parallel_workers;
    node["runtime_limits"]["tile_size"] = runtime_limits.tile_size;

    return node;
}

void Config::validate() const {
    if (archive.sensors.empty()) {
        throw ValidationError("archive.sensors must list at least one sensor");
    }
    for (const auto& s : archive.sensors) {
        if (harmonize::sensor_family_for(s) == SensorFamily::UNKNOWN) {
            throw ValidationError("archive.sensors: unsupported sensor '" + s + "'");
        }
    }
    if (archive.end_year < archive.start_year) {
        throw ValidationError("archive.end_year must be >= archive.start_year");
    }

    if (harmonization.interpolation != "bilinear" && harmonization.interpolation != "nearest") {
        throw ValidationError("harmonization.interpolation must be 'bilinear' or 'nearest'");
    }
    if (harmonization.target_rows < 0 || harmonization.target_cols < 0) {
        throw ValidationError("harmonization.target_rows/target_cols must be >= 0");
    }
    if ((harmonization.target_rows == 0) != (harmonization.target_cols == 0)) {
        throw ValidationError("harmonization.target_rows and target_cols must both be set or both be 0");
    }

    {
        const MonthDay start = core::parse_month_day(compositing.start_day);
        const MonthDay end = core::parse_month_day(compositing.end_day);
        if (end.month < start.month || (end.month == start.month && end.day < start.day)) {
            throw ValidationError("compositing window " + compositing.start_day + ".." +
                                  compositing.end_day + " wraps the year end");
        }
    }

    // Index and feature band errors are ConfigErrors, not ValidationErrors.
    (void)landsat_change::index::resolve_index(index.name);
    (void)landsat_change::index::resolve_ftv_bands(index.ftv_bands);

    if (disturbance.end_year < disturbance.start_year) {
        throw ValidationError("disturbance.end_year must be >= disturbance.start_year");
    }
    if (!std::isfinite(disturbance.dsnr_threshold)) {
        throw ValidationError("disturbance.dsnr_threshold must be finite");
    }

    if (output.events_file.empty()) {
        throw ValidationError("output.events_file must not be empty");
    }

    if (runtime_limits.parallel_workers < 1) {
        throw ValidationError("runtime_limits.parallel_workers must be >= 1");
    }
    if (runtime_limits.tile_size < 8) {
        throw ValidationError("runtime_limits.tile_size must be >= 8");
    }
}

} // namespace landsat_change::config

#include "landsat_change/io/products.hpp"
#include "landsat_change/core/errors.hpp"
#include "landsat_change/io/fits_io.hpp"

namespace landsat_change::io {

void write_composite(const fs::path& path, const composite::YearlyComposite& composite) {
    std::vector<Matrix2Df> planes(composite.image.bands.begin(), composite.image.bands.end());
    planes.push_back(composite.selected.cast<float>());

    std::vector<std::string> names(canonical_band_names().begin(), canonical_band_names().end());
    names.push_back("selected");

    FitsHeader hdr;
    hdr.set("YEAR", composite.year);
    hdr.set("NOBS", static_cast<int>(composite.n_observations));
    hdr.set("EMPTYWIN", composite.empty_window);
    hdr.set("SENSOR", composite.image.sensor);
    set_plane_names(hdr, names);
    write_fits_cube(path, planes, hdr);
}

void write_index_image(const fs::path& path, const index::IndexImage& image) {
    FitsHeader hdr;
    hdr.set("YEAR", image.date.year);
    hdr.set("INDEX", image.index_name);
    set_plane_names(hdr, image.band_names);
    write_fits_cube(path, image.planes, hdr);
}

segment::TrendModel read_trend_model(const fs::path& fitted_path, const fs::path& vertex_path,
                                     const fs::path& rmse_path) {
    FitsCube fitted = read_fits_cube(fitted_path);
    FitsCube flags = read_fits_cube(vertex_path);
    auto [rmse, rmse_hdr] = read_fits_float(rmse_path);
    (void)rmse_hdr;

    segment::TrendModel model;
    for (size_t k = 0; k < fitted.planes.size(); ++k) {
        const std::string key = "YEAR" + std::to_string(k + 1);
        auto year = fitted.header.get_int(key);
        if (!year) {
            throw FitsError("missing " + key + " key: " + fitted_path.string());
        }
        model.years.push_back(*year);
    }

    model.fitted = std::move(fitted.planes);
    model.vertex_flags = std::move(flags.planes);
    model.rmse = std::move(rmse);
    model.validate();
    return model;
}

void write_trend_model(const fs::path& fitted_path, const fs::path& vertex_path,
                       const fs::path& rmse_path, const segment::TrendModel& model) {
    model.validate();

    FitsHeader hdr;
    for (size_t k = 0; k < model.years.size(); ++k) {
        hdr.set("YEAR" + std::to_string(k + 1), model.years[k]);
    }
    write_fits_cube(fitted_path, model.fitted, hdr);
    write_fits_cube(vertex_path, model.vertex_flags, hdr);
    write_fits_float(rmse_path, model.rmse, FitsHeader{});
}

void write_disturbance_raster(const fs::path& path, const segment::DisturbanceRaster& raster,
                              const segment::EventOptions& opts) {
    const auto& names = segment::event_channel_names();

    FitsHeader hdr;
    hdr.set("STARTYR", opts.start_year);
    hdr.set("ENDYR", opts.end_year);
    hdr.set("DSNRMIN", static_cast<double>(opts.dsnr_threshold));
    hdr.set("DIR", opts.direction);
    set_plane_names(hdr, std::vector<std::string>(names.begin(), names.end()));
    write_fits_cube(path, std::vector<Matrix2Df>(raster.channels.begin(), raster.channels.end()),
                    hdr);
}

segment::DisturbanceRaster read_disturbance_raster(const fs::path& path) {
    FitsCube cube = read_fits_cube(path);
    if (cube.planes.size() != static_cast<size_t>(segment::kNumEventChannels)) {
        throw FitsError("event raster must have " + std::to_string(segment::kNumEventChannels) +
                        " planes: " + path.string());
    }

    const auto& expected = segment::event_channel_names();
    const auto names = plane_names(cube.header, cube.planes.size());

    segment::DisturbanceRaster raster;
    for (size_t k = 0; k < cube.planes.size(); ++k) {
        if (names[k] != expected[k]) {
            throw FitsError("event raster plane " + std::to_string(k + 1) + " is '" + names[k] +
                            "', expected '" + expected[k] + "': " + path.string());
        }
        raster.channels[k] = std::move(cube.planes[k]);
    }
    return raster;
}

} // namespace landsat_change::io

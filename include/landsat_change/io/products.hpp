#pragma once

#include "landsat_change/composite/medoid_compositor.hpp"
#include "landsat_change/index/spectral_index.hpp"
#include "landsat_change/segment/disturbance_events.hpp"

namespace landsat_change::io {

// 6 canonical band planes followed by the "selected" plane.
// Header: YEAR, NOBS, EMPTYWIN, BANDNAM<k>.
void write_composite(const fs::path& path, const composite::YearlyComposite& composite);

// Index plane then ftv_* planes. Header: YEAR, INDEX, BANDNAM<k>.
void write_index_image(const fs::path& path, const index::IndexImage& image);

// Fitted cube (plane k is year YEAR<k+1>), vertex-flag cube of the same
// shape, and a 2-D rmse image.
segment::TrendModel read_trend_model(const fs::path& fitted_path, const fs::path& vertex_path,
                                     const fs::path& rmse_path);

void write_trend_model(const fs::path& fitted_path, const fs::path& vertex_path,
                       const fs::path& rmse_path, const segment::TrendModel& model);

void write_disturbance_raster(const fs::path& path, const segment::DisturbanceRaster& raster,
                              const segment::EventOptions& opts);

segment::DisturbanceRaster read_disturbance_raster(const fs::path& path);

} // namespace landsat_change::io

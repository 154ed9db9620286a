#pragma once

#include "landsat_change/core/types.hpp"
#include "landsat_change/segment/segment_features.hpp"

#include <array>
#include <optional>
#include <string>
#include <vector>

namespace landsat_change::segment {

inline constexpr int kNumEventChannels = 8;

// yod, endYr, startVal, endVal, mag, dur, rate, dsnr
const std::array<std::string, kNumEventChannels>& event_channel_names();

using EventRecord = std::array<float, kNumEventChannels>;

// Segments with start_year >= lo, end_year <= hi and dsnr >= threshold.
// A NaN dsnr never passes.
std::vector<Segment> filter_segments(const std::vector<Segment>& segments, int lo, int hi,
                                     float dsnr_threshold);

// Most recent qualifying segment (largest start_year; ties keep sequence
// order). Throws ValidationError when lo > hi.
std::optional<Segment> select_most_recent(const std::vector<Segment>& segments, int lo, int hi,
                                          float dsnr_threshold);

// All channels NaN when there is no event.
EventRecord flatten(const std::optional<Segment>& event);

// External fitter output over a grid.
struct TrendModel {
    std::vector<int> years;
    std::vector<Matrix2Df> fitted;        // one plane per year
    std::vector<Matrix2Df> vertex_flags;  // one plane per year, non-zero = vertex
    Matrix2Df rmse;

    int rows() const { return static_cast<int>(rmse.rows()); }
    int cols() const { return static_cast<int>(rmse.cols()); }

    // Throws ValidationError on inconsistent plane counts or shapes.
    void validate() const;
};

struct DisturbanceRaster {
    std::array<Matrix2Df, kNumEventChannels> channels;

    static DisturbanceRaster nodata(int rows, int cols);
    const Matrix2Df& channel(const std::string& name) const;
};

struct EventOptions {
    int start_year = 0;
    int end_year = 0;
    float dsnr_threshold = 0.0f;
    int direction = 1;
    int parallel_workers = 1;
    int tile_size = 256;
};

// Per pixel: extract vertices, derive segments, select, flatten.
DisturbanceRaster extract_events(const TrendModel& model, const EventOptions& opts);

} // namespace landsat_change::segment

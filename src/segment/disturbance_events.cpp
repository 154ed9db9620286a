#include "landsat_change/segment/disturbance_events.hpp"
#include "landsat_change/core/errors.hpp"
#include "landsat_change/pipeline/tile_grid.hpp"

#include <algorithm>

namespace landsat_change::segment {

const std::array<std::string, kNumEventChannels>& event_channel_names() {
    static const std::array<std::string, kNumEventChannels> names = {
        "yod", "endYr", "startVal", "endVal", "mag", "dur", "rate", "dsnr"};
    return names;
}

std::vector<Segment> filter_segments(const std::vector<Segment>& segments, int lo, int hi,
                                     float dsnr_threshold) {
    std::vector<Segment> kept;
    for (const auto& s : segments) {
        if (s.start_year < lo || s.end_year > hi) continue;
        // NaN compares false, so a missing dsnr is dropped here.
        if (!(s.dsnr >= dsnr_threshold)) continue;
        kept.push_back(s);
    }
    return kept;
}

std::optional<Segment> select_most_recent(const std::vector<Segment>& segments, int lo, int hi,
                                          float dsnr_threshold) {
    if (lo > hi) {
        throw ValidationError("event year bounds " + std::to_string(lo) + ".." +
                              std::to_string(hi) + " are reversed");
    }

    std::vector<Segment> kept = filter_segments(segments, lo, hi, dsnr_threshold);
    if (kept.empty()) return std::nullopt;

    std::stable_sort(kept.begin(), kept.end(), [](const Segment& a, const Segment& b) {
        return a.start_year > b.start_year;
    });
    return kept.front();
}

EventRecord flatten(const std::optional<Segment>& event) {
    EventRecord r;
    if (!event) {
        r.fill(kNoData);
        return r;
    }
    const Segment& s = *event;
    r[0] = static_cast<float>(s.start_year);
    r[1] = static_cast<float>(s.end_year);
    r[2] = s.start_val;
    r[3] = s.end_val;
    r[4] = s.magnitude;
    r[5] = static_cast<float>(s.duration);
    r[6] = s.rate;
    r[7] = s.dsnr;
    return r;
}

void TrendModel::validate() const {
    if (years.empty()) {
        throw ValidationError("trend model has no years");
    }
    if (fitted.size() != years.size() || vertex_flags.size() != years.size()) {
        throw ValidationError("trend model: " + std::to_string(years.size()) + " years but " +
                              std::to_string(fitted.size()) + " fitted and " +
                              std::to_string(vertex_flags.size()) + " vertex planes");
    }
    for (size_t k = 0; k < years.size(); ++k) {
        if (fitted[k].rows() != rmse.rows() || fitted[k].cols() != rmse.cols() ||
            vertex_flags[k].rows() != rmse.rows() || vertex_flags[k].cols() != rmse.cols()) {
            throw ValidationError("trend model plane " + std::to_string(k) +
                                  " does not match the rmse grid");
        }
    }
}

DisturbanceRaster DisturbanceRaster::nodata(int rows, int cols) {
    DisturbanceRaster r;
    for (auto& c : r.channels) {
        c = Matrix2Df::Constant(rows, cols, kNoData);
    }
    return r;
}

const Matrix2Df& DisturbanceRaster::channel(const std::string& name) const {
    const auto& names = event_channel_names();
    for (size_t k = 0; k < names.size(); ++k) {
        if (names[k] == name) return channels[k];
    }
    throw ValidationError("unknown event channel '" + name + "'");
}

DisturbanceRaster extract_events(const TrendModel& model, const EventOptions& opts) {
    model.validate();
    if (opts.start_year > opts.end_year) {
        throw ValidationError("event year bounds " + std::to_string(opts.start_year) + ".." +
                              std::to_string(opts.end_year) + " are reversed");
    }

    const int rows = model.rows();
    const int cols = model.cols();
    DisturbanceRaster out = DisturbanceRaster::nodata(rows, cols);

    const size_t n_years = model.years.size();
    const TileGrid grid = pipeline::build_tile_grid(rows, cols, std::max(1, opts.tile_size));

    pipeline::run_tiles(grid, opts.parallel_workers, [&](const Tile& t) {
        std::vector<float> fitted(n_years);
        std::vector<float> flags(n_years);
        for (int y = t.y; y < t.y + t.height; ++y) {
            for (int x = t.x; x < t.x + t.width; ++x) {
                for (size_t k = 0; k < n_years; ++k) {
                    fitted[k] = model.fitted[k](y, x);
                    flags[k] = model.vertex_flags[k](y, x);
                }
                const auto vertices = extract_vertices(model.years, fitted, flags);
                const auto segments = compute_segments(vertices, model.rmse(y, x), opts.direction);
                const EventRecord rec = flatten(select_most_recent(
                    segments, opts.start_year, opts.end_year, opts.dsnr_threshold));
                for (int c = 0; c < kNumEventChannels; ++c) {
                    out.channels[static_cast<size_t>(c)](y, x) = rec[static_cast<size_t>(c)];
                }
            }
        }
    });

    return out;
}

} // namespace landsat_change::segment

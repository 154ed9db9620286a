#include "landsat_change/composite/medoid_compositor.hpp"
#include "landsat_change/core/utils.hpp"
#include "landsat_change/pipeline/tile_grid.hpp"

#include <algorithm>
#include <array>
#include <limits>
#include <set>

namespace landsat_change::composite {

SeasonWindow parse_season_window(const std::string& start_day, const std::string& end_day) {
    SeasonWindow w;
    w.start = core::parse_month_day(start_day);
    w.end = core::parse_month_day(end_day);
    if (w.end.month < w.start.month ||
        (w.end.month == w.start.month && w.end.day < w.start.day)) {
        throw ValidationError("season window " + start_day + ".." + end_day +
                              " wraps the year end");
    }
    return w;
}

std::vector<int> enumerate_years(const TimeSeries& series) {
    std::set<int> years;
    for (const auto& img : series) years.insert(img.date.year);
    return std::vector<int>(years.begin(), years.end());
}

archive::DateRange season_bounds(int year, const SeasonWindow& window) {
    archive::DateRange r;
    r.first = core::make_date(year, window.start.month, window.start.day);
    r.last_exclusive = core::add_days(core::make_date(year, window.end.month, window.end.day), 1);
    return r;
}

std::vector<size_t> filter_season(const TimeSeries& series, int year, const SeasonWindow& window) {
    const archive::DateRange r = season_bounds(year, window);
    std::vector<size_t> idx;
    for (size_t i = 0; i < series.size(); ++i) {
        if (archive::in_range(series[i].date, r)) idx.push_back(i);
    }
    return idx;
}

namespace {

void check_shapes(const TimeSeries& series) {
    if (series.empty()) return;
    const int rows = series.front().rows();
    const int cols = series.front().cols();
    for (const auto& img : series) {
        for (const auto& plane : img.bands) {
            if (plane.rows() != rows || plane.cols() != cols) {
                throw ValidationError("scene " + img.scene_id + " is " +
                                      std::to_string(plane.rows()) + "x" +
                                      std::to_string(plane.cols()) + ", expected " +
                                      std::to_string(rows) + "x" + std::to_string(cols));
            }
        }
    }
}

YearlyComposite empty_composite(int year, int rows, int cols) {
    YearlyComposite out;
    out.year = year;
    out.image.scene_id = "composite_" + std::to_string(year);
    out.image.sensor = kMedoidSensor;
    out.image.date = Date{year, 1, 1};
    for (auto& plane : out.image.bands) {
        plane = Matrix2Df::Constant(rows, cols, kNoData);
    }
    out.selected = Matrix2Di::Constant(rows, cols, -1);
    return out;
}

void composite_tile(const TimeSeries& series, const std::vector<size_t>& members,
                    const Tile& t, YearlyComposite& out) {
    std::vector<float> values;
    values.reserve(members.size());
    std::array<float, kNumCanonicalBands> median{};

    for (int y = t.y; y < t.y + t.height; ++y) {
        for (int x = t.x; x < t.x + t.width; ++x) {
            for (int b = 0; b < kNumCanonicalBands; ++b) {
                values.clear();
                for (size_t m : members) {
                    const float v = series[m].bands[static_cast<size_t>(b)](y, x);
                    if (!is_nodata(v)) values.push_back(v);
                }
                median[static_cast<size_t>(b)] = core::median_of(values);
            }

            long best = -1;
            double best_dist = std::numeric_limits<double>::infinity();
            for (size_t m : members) {
                const Image& img = series[m];
                double dist = 0.0;
                bool complete = true;
                for (int b = 0; b < kNumCanonicalBands; ++b) {
                    const float v = img.bands[static_cast<size_t>(b)](y, x);
                    if (is_nodata(v)) {
                        complete = false;
                        break;
                    }
                    const double d = static_cast<double>(v) -
                                     static_cast<double>(median[static_cast<size_t>(b)]);
                    dist += d * d;
                }
                if (!complete) continue;

                // Ties: earliest date, then earliest series position.
                if (best < 0 || dist < best_dist ||
                    (dist == best_dist && img.date < series[static_cast<size_t>(best)].date)) {
                    best = static_cast<long>(m);
                    best_dist = dist;
                }
            }

            if (best < 0) continue;
            const Image& sel = series[static_cast<size_t>(best)];
            for (int b = 0; b < kNumCanonicalBands; ++b) {
                out.image.bands[static_cast<size_t>(b)](y, x) =
                    sel.bands[static_cast<size_t>(b)](y, x);
            }
            out.selected(y, x) = static_cast<int32_t>(best);
        }
    }
}

} // namespace

YearlyComposite composite_year(const TimeSeries& series, const std::vector<size_t>& members,
                               int year, const CompositorOptions& opts) {
    check_shapes(series);
    const int rows = series.empty() ? 0 : series.front().rows();
    const int cols = series.empty() ? 0 : series.front().cols();

    YearlyComposite out = empty_composite(year, rows, cols);
    out.n_observations = members.size();
    if (members.empty()) {
        out.empty_window = true;
        return out;
    }
    for (size_t m : members) {
        if (m >= series.size()) {
            throw ValidationError("composite member index out of range");
        }
    }

    const TileGrid grid = pipeline::build_tile_grid(rows, cols, std::max(1, opts.tile_size));
    pipeline::run_tiles(grid, opts.parallel_workers,
                        [&](const Tile& t) { composite_tile(series, members, t, out); });
    return out;
}

CompositeRun composite_series(const TimeSeries& series, const SeasonWindow& window,
                              const CompositorOptions& opts, const std::atomic<bool>* stop,
                              const YearCallback& on_year) {
    check_shapes(series);

    CompositeRun run;
    for (int year : enumerate_years(series)) {
        if (stop && stop->load()) {
            run.cancelled = true;
            break;
        }

        const std::vector<size_t> members = filter_season(series, year, window);
        YearlyComposite yc = composite_year(series, members, year, opts);
        if (yc.empty_window) {
            run.data_errors.emplace_back("no observations in " +
                                         core::month_day_to_string(window.start) + ".." +
                                         core::month_day_to_string(window.end) + " of " +
                                         std::to_string(year));
        }
        if (on_year) on_year(yc);
        run.composites.push_back(std::move(yc));
    }
    return run;
}

} // namespace landsat_change::composite

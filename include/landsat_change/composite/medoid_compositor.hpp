#pragma once

#include "landsat_change/archive/archive_merger.hpp"
#include "landsat_change/core/errors.hpp"
#include "landsat_change/core/types.hpp"

#include <atomic>
#include <functional>
#include <string>
#include <vector>

namespace landsat_change::composite {

// Inclusive MM-DD window inside one calendar year.
struct SeasonWindow {
    MonthDay start;
    MonthDay end;
};

// Throws ValidationError on malformed MM-DD or a window that wraps the year.
SeasonWindow parse_season_window(const std::string& start_day, const std::string& end_day);

// Distinct acquisition years, ascending.
std::vector<int> enumerate_years(const TimeSeries& series);

// [start(Y), end(Y) + 1 day). 02-29 in a non-leap year becomes 03-01.
archive::DateRange season_bounds(int year, const SeasonWindow& window);

// Indices into `series` of the images inside the year's window, in series order.
std::vector<size_t> filter_season(const TimeSeries& series, int year, const SeasonWindow& window);

struct YearlyComposite {
    int year = 0;
    Image image;            // date = Jan 1 of year, sensor = "MEDOID"
    Matrix2Di selected;     // index into the input series, -1 = no data
    size_t n_observations = 0;
    bool empty_window = false;
};

struct CompositeRun {
    std::vector<YearlyComposite> composites;
    std::vector<DataError> data_errors;
    bool cancelled = false;
};

struct CompositorOptions {
    int parallel_workers = 1;
    int tile_size = 256;
};

inline constexpr const char* kMedoidSensor = "MEDOID";

// Per-pixel medoid over the given members of `series`. With no members the
// result is all no-data and flagged empty_window.
YearlyComposite composite_year(const TimeSeries& series, const std::vector<size_t>& members,
                               int year, const CompositorOptions& opts);

using YearCallback = std::function<void(const YearlyComposite&)>;

// One composite per year present in `series`. `stop` is checked before each
// year; finished years are kept when it fires. Images must share one shape.
CompositeRun composite_series(const TimeSeries& series, const SeasonWindow& window,
                              const CompositorOptions& opts,
                              const std::atomic<bool>* stop = nullptr,
                              const YearCallback& on_year = nullptr);

} // namespace landsat_change::composite

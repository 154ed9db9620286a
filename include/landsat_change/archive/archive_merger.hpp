#pragma once

#include "landsat_change/core/types.hpp"
#include <vector>

namespace landsat_change::archive {

// Concatenates the per-sensor series and stable-sorts by acquisition date.
// Equal dates keep series order, then position within the series. Nothing
// is deduplicated.
TimeSeries merge_time_series(const std::vector<TimeSeries>& series);

// Half-open collection window [first, last_exclusive).
struct DateRange {
    Date first;
    Date last_exclusive;
};

// [start_year-start_day, end_year-end_day + 1 day)
DateRange archive_date_range(int start_year, int end_year, const MonthDay& start_day,
                             const MonthDay& end_day);

bool in_range(const Date& d, const DateRange& range);

TimeSeries filter_date_range(const TimeSeries& series, const DateRange& range);

} // namespace landsat_change::archive

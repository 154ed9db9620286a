#include "landsat_change/archive/archive_merger.hpp"
#include "landsat_change/core/errors.hpp"
#include "landsat_change/core/utils.hpp"

#include <algorithm>

namespace landsat_change::archive {

TimeSeries merge_time_series(const std::vector<TimeSeries>& series) {
    size_t total = 0;
    for (const auto& s : series) total += s.size();

    TimeSeries merged;
    merged.reserve(total);
    for (const auto& s : series) {
        merged.insert(merged.end(), s.begin(), s.end());
    }

    std::stable_sort(merged.begin(), merged.end(),
                     [](const Image& a, const Image& b) { return a.date < b.date; });
    return merged;
}

DateRange archive_date_range(int start_year, int end_year, const MonthDay& start_day,
                             const MonthDay& end_day) {
    if (end_year < start_year) {
        throw ValidationError("archive end_year " + std::to_string(end_year) +
                              " precedes start_year " + std::to_string(start_year));
    }
    DateRange r;
    r.first = core::make_date(start_year, start_day.month, start_day.day);
    r.last_exclusive = core::add_days(core::make_date(end_year, end_day.month, end_day.day), 1);
    return r;
}

bool in_range(const Date& d, const DateRange& range) {
    return range.first <= d && d < range.last_exclusive;
}

TimeSeries filter_date_range(const TimeSeries& series, const DateRange& range) {
    TimeSeries out;
    for (const auto& img : series) {
        if (in_range(img.date, range)) out.push_back(img);
    }
    return out;
}

} // namespace landsat_change::archive

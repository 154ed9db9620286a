#pragma once

#include "types.hpp"
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace landsat_change::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// File utilities
std::vector<fs::path> discover_files(const fs::path& input_dir, const std::string& pattern = "*.fit*");
std::string read_text(const fs::path& path);
void write_text(const fs::path& path, const std::string& text);

// Hash utilities
std::string sha256_bytes(const std::vector<uint8_t>& data);

// Math utilities
// Median of the values; the mean of the two middle values for an even count.
// Reorders `v`. Returns kNoData for an empty input.
float median_of(std::vector<float>& v);

// String utilities
std::string to_lower(const std::string& s);
std::string to_upper(const std::string& s);
std::string trim(const std::string& s);
std::vector<std::string> split(const std::string& str, char delimiter);
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// Glob pattern matching
bool glob_match(const std::string& pattern, const std::string& str);

// Calendar utilities
bool is_leap_year(int year);
int days_in_month(int year, int month);
bool is_valid_date(const Date& d);
// Builds a date from Y/M/D, rolling an overflowing day into the next month
// (2001-02-29 -> 2001-03-01).
Date make_date(int year, int month, int day);
Date add_days(const Date& d, int days);
Date parse_date(const std::string& text);          // YYYY-MM-DD
MonthDay parse_month_day(const std::string& text); // MM-DD
std::string date_to_string(const Date& d);
std::string month_day_to_string(const MonthDay& md);

} // namespace landsat_change::core

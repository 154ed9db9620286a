#include "landsat_change/core/utils.hpp"
#include "landsat_change/core/errors.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <random>
#include <regex>
#include <sstream>

#include <openssl/sha.h>

namespace landsat_change::core {

std::string get_iso_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    gmtime_r(&time_t_now, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

std::string get_run_id() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf;
    localtime_r(&time_t_now, &tm_buf);

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y%m%d_%H%M%S") << '_';

    const char* hex = "0123456789abcdef";
    for (int i = 0; i < 8; ++i) {
        oss << hex[dis(gen)];
    }

    return oss.str();
}

std::vector<fs::path> discover_files(const fs::path& input_dir, const std::string& pattern) {
    std::vector<fs::path> files;

    if (!fs::exists(input_dir) || !fs::is_directory(input_dir)) {
        return files;
    }

    for (const auto& entry : fs::directory_iterator(input_dir)) {
        if (entry.is_regular_file()) {
            std::string filename = entry.path().filename().string();
            if (glob_match(pattern, filename)) {
                files.push_back(entry.path());
            }
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

std::string read_text(const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw IOError("Cannot open file: " + path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

void write_text(const fs::path& path, const std::string& text) {
    std::ofstream file(path);
    if (!file) {
        throw IOError("Cannot create file: " + path.string());
    }
    file << text;
}

std::string sha256_bytes(const std::vector<uint8_t>& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(data.data(), data.size(), hash);

    std::ostringstream oss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
        oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(hash[i]);
    }
    return oss.str();
}

float median_of(std::vector<float>& v) {
    if (v.empty()) return kNoData;
    const size_t n = v.size();
    const size_t mid = n / 2;
    std::nth_element(v.begin(), v.begin() + static_cast<std::ptrdiff_t>(mid), v.end());
    const float hi = v[mid];
    if ((n % 2) == 1) return hi;
    // Lower middle is the largest element left of mid after nth_element.
    const float lo = *std::max_element(v.begin(), v.begin() + static_cast<std::ptrdiff_t>(mid));
    return 0.5f * (lo + hi);
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(), ::tolower);
    return result;
}

std::string to_upper(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(), ::toupper);
    return result;
}

std::string trim(const std::string& s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    auto first = std::find_if(s.begin(), s.end(), not_space);
    auto last = std::find_if(s.rbegin(), s.rend(), not_space).base();
    if (first >= last) return std::string();
    return std::string(first, last);
}

std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    std::istringstream iss(str);
    std::string part;
    while (std::getline(iss, part, delimiter)) {
        parts.push_back(part);
    }
    return parts;
}

std::string join(const std::vector<std::string>& parts, const std::string& delimiter) {
    std::ostringstream oss;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) oss << delimiter;
        oss << parts[i];
    }
    return oss.str();
}

bool glob_match(const std::string& pattern, const std::string& str) {
    std::string regex_pattern;
    for (char c : pattern) {
        switch (c) {
            case '*': regex_pattern += ".*"; break;
            case '?': regex_pattern += "."; break;
            case '.': regex_pattern += "\\."; break;
            case '[': regex_pattern += "["; break;
            case ']': regex_pattern += "]"; break;
            default: regex_pattern += c; break;
        }
    }

    std::regex re(regex_pattern, std::regex::icase);
    return std::regex_match(str, re);
}

// --- Calendar utilities ---

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
}

int days_in_month(int year, int month) {
    static const int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) return 0;
    if (month == 2 && is_leap_year(year)) return 29;
    return kDays[month - 1];
}

bool is_valid_date(const Date& d) {
    return d.month >= 1 && d.month <= 12 && d.day >= 1 &&
           d.day <= days_in_month(d.year, d.month);
}

Date make_date(int year, int month, int day) {
    if (month < 1 || month > 12 || day < 1) {
        throw ValidationError("invalid date " + std::to_string(year) + "-" +
                              std::to_string(month) + "-" + std::to_string(day));
    }
    Date d{year, month, 1};
    return add_days(d, day - 1);
}

Date add_days(const Date& d, int days) {
    Date out = d;
    int remaining = days;
    while (remaining > 0) {
        const int left_in_month = days_in_month(out.year, out.month) - out.day;
        if (remaining <= left_in_month) {
            out.day += remaining;
            remaining = 0;
        } else {
            remaining -= left_in_month + 1;
            out.day = 1;
            if (++out.month > 12) {
                out.month = 1;
                ++out.year;
            }
        }
    }
    while (remaining < 0) {
        if (-remaining < out.day) {
            out.day += remaining;
            remaining = 0;
        } else {
            remaining += out.day;
            if (--out.month < 1) {
                out.month = 12;
                --out.year;
            }
            out.day = days_in_month(out.year, out.month);
        }
    }
    return out;
}

Date parse_date(const std::string& text) {
    int y = 0, m = 0, d = 0;
    char tail = 0;
    const std::string t = trim(text);
    // DATE-OBS may carry a time part; only the calendar date is kept.
    const std::string head = t.substr(0, std::min<size_t>(t.size(), 10));
    if (std::sscanf(head.c_str(), "%d-%d-%d%c", &y, &m, &d, &tail) != 3) {
        throw ValidationError("cannot parse date '" + text + "' (expected YYYY-MM-DD)");
    }
    Date out{y, m, d};
    if (!is_valid_date(out)) {
        throw ValidationError("date out of range: '" + text + "'");
    }
    return out;
}

MonthDay parse_month_day(const std::string& text) {
    int m = 0, d = 0;
    char tail = 0;
    const std::string t = trim(text);
    if (std::sscanf(t.c_str(), "%d-%d%c", &m, &d, &tail) != 2) {
        throw ValidationError("cannot parse month-day '" + text + "' (expected MM-DD)");
    }
    // Validated against a leap year so that 02-29 is accepted.
    if (m < 1 || m > 12 || d < 1 || d > days_in_month(2000, m)) {
        throw ValidationError("month-day out of range: '" + text + "'");
    }
    return MonthDay{m, d};
}

std::string date_to_string(const Date& d) {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << d.year << '-' << std::setw(2) << d.month
        << '-' << std::setw(2) << d.day;
    return oss.str();
}

std::string month_day_to_string(const MonthDay& md) {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(2) << md.month << '-' << std::setw(2) << md.day;
    return oss.str();
}

} // namespace landsat_change::core

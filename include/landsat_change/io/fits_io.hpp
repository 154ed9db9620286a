#pragma once

#include "landsat_change/core/types.hpp"
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace landsat_change::io {

struct FitsHeader {
    std::map<std::string, std::string> string_values;
    std::map<std::string, double> numeric_values;
    std::map<std::string, int> int_values;
    std::map<std::string, bool> bool_values;

    std::optional<std::string> get_string(const std::string& key) const;
    std::optional<double> get_double(const std::string& key) const;
    std::optional<int> get_int(const std::string& key) const;

    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, double value);
    void set(const std::string& key, int value);
    void set(const std::string& key, bool value);
};

// Multi-plane image: plane k of a NAXIS=3 file is planes[k].
struct FitsCube {
    std::vector<Matrix2Df> planes;
    FitsHeader header;
};

// Plane names are stored as BANDNAM1..BANDNAM9 (1-based, FITS keys are
// limited to 8 characters).
inline constexpr int kMaxNamedPlanes = 9;

std::pair<Matrix2Df, FitsHeader> read_fits_float(const fs::path& path);

void write_fits_float(const fs::path& path, const Matrix2Df& data, const FitsHeader& header);

FitsCube read_fits_cube(const fs::path& path);

// Primary header only; no pixel data is read.
FitsHeader read_fits_header(const fs::path& path);

void write_fits_cube(const fs::path& path, const std::vector<Matrix2Df>& planes,
                     const FitsHeader& header);

// Returns the BANDNAM<k> value for each of n planes; unnamed planes get "".
std::vector<std::string> plane_names(const FitsHeader& header, size_t n);
void set_plane_names(FitsHeader& header, const std::vector<std::string>& names);

// width, height, depth (depth is 1 for a 2-D image)
std::tuple<int, int, int> get_fits_dimensions(const fs::path& path);

} // namespace landsat_change::io

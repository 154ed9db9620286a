#pragma once

#include <Eigen/Dense>
#include <array>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <map>
#include <string>
#include <vector>

namespace landsat_change {

namespace fs = std::filesystem;

// Matrix types (row-major to match the raster scanline layout)
using Matrix2Df = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using Matrix2Dd = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using Matrix2Di = Eigen::Matrix<int32_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using MatrixQA = Eigen::Matrix<uint16_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using VectorXf = Eigen::VectorXf;
using VectorXd = Eigen::VectorXd;

// No-data sentinel carried on every stored value.
inline constexpr float kNoData = std::numeric_limits<float>::quiet_NaN();

inline bool is_nodata(float v) { return std::isnan(v); }
inline bool is_nodata(double v) { return std::isnan(v); }

// Canonical band order every sensor is normalized into.
enum class CanonicalBand {
    B1 = 0,
    B2 = 1,
    B3 = 2,
    B4 = 3,
    B5 = 4,
    B7 = 5
};

inline constexpr int kNumCanonicalBands = 6;

inline const std::array<std::string, kNumCanonicalBands>& canonical_band_names() {
    static const std::array<std::string, kNumCanonicalBands> names = {
        "B1", "B2", "B3", "B4", "B5", "B7"};
    return names;
}

inline std::string canonical_band_to_string(CanonicalBand band) {
    return canonical_band_names()[static_cast<size_t>(band)];
}

// Returns -1 if the name is not a canonical band.
inline int canonical_band_index(const std::string& name) {
    const auto& names = canonical_band_names();
    for (size_t i = 0; i < names.size(); ++i) {
        if (names[i] == name) return static_cast<int>(i);
    }
    return -1;
}

// Sensor family enumeration
enum class SensorFamily {
    UNKNOWN,
    TM,   // Thematic Mapper / ETM+ (Landsat 4, 5, 7)
    OLI   // Operational Land Imager (Landsat 8)
};

inline std::string sensor_family_to_string(SensorFamily family) {
    switch (family) {
        case SensorFamily::TM: return "TM";
        case SensorFamily::OLI: return "OLI";
        default: return "UNKNOWN";
    }
}

// Calendar date (proleptic Gregorian, no time of day)
struct Date {
    int year = 1970;
    int month = 1;
    int day = 1;
};

inline bool operator==(const Date& a, const Date& b) {
    return a.year == b.year && a.month == b.month && a.day == b.day;
}
inline bool operator!=(const Date& a, const Date& b) { return !(a == b); }
inline bool operator<(const Date& a, const Date& b) {
    if (a.year != b.year) return a.year < b.year;
    if (a.month != b.month) return a.month < b.month;
    return a.day < b.day;
}
inline bool operator<=(const Date& a, const Date& b) { return !(b < a); }
inline bool operator>(const Date& a, const Date& b) { return b < a; }
inline bool operator>=(const Date& a, const Date& b) { return !(a < b); }

// Month-day pair bounding a seasonal window ("MM-DD")
struct MonthDay {
    int month = 1;
    int day = 1;
};

// Unharmonized scene as delivered by an image archive.
struct RawImage {
    std::string scene_id;
    std::string sensor;                      // LT04 | LT05 | LE07 | LC08
    Date date;
    std::map<std::string, Matrix2Df> bands;  // source band name -> plane
    MatrixQA qa;                             // pixel_qa bit flags
};

// Canonical 6-band image; masked values are NaN.
struct Image {
    std::string scene_id;
    std::string sensor;
    Date date;
    std::array<Matrix2Df, kNumCanonicalBands> bands;

    int rows() const { return static_cast<int>(bands[0].rows()); }
    int cols() const { return static_cast<int>(bands[0].cols()); }
};

using TimeSeries = std::vector<Image>;

// Tile definition
struct Tile {
    int x;       // Top-left x coordinate
    int y;       // Top-left y coordinate
    int width;
    int height;
    int row;     // Grid row index
    int col;     // Grid column index
};

// Tile grid
struct TileGrid {
    int tile_size;
    int rows;
    int cols;
    int image_rows;
    int image_cols;
    std::vector<Tile> tiles;
};

// Pipeline phase enumeration
enum class Phase {
    SCAN_ARCHIVE = 0,
    HARMONIZE = 1,
    MERGE = 2,
    COMPOSITE = 3,
    INDEX_BANDS = 4,
    SEGMENTS = 5,
    EVENTS = 6,
    DONE = 7
};

inline std::string phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::SCAN_ARCHIVE: return "SCAN_ARCHIVE";
        case Phase::HARMONIZE: return "HARMONIZE";
        case Phase::MERGE: return "MERGE";
        case Phase::COMPOSITE: return "COMPOSITE";
        case Phase::INDEX_BANDS: return "INDEX_BANDS";
        case Phase::SEGMENTS: return "SEGMENTS";
        case Phase::EVENTS: return "EVENTS";
        case Phase::DONE: return "DONE";
        default: return "UNKNOWN";
    }
}

inline int phase_to_int(Phase phase) {
    return static_cast<int>(phase);
}

} // namespace landsat_change

#pragma once

#include "landsat_change/core/types.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace landsat_change::harmonize {

// pixel_qa flag bits that invalidate an observation
inline constexpr uint16_t kQaWater = 1u << 2;
inline constexpr uint16_t kQaCloudShadow = 1u << 3;
inline constexpr uint16_t kQaSnow = 1u << 4;
inline constexpr uint16_t kQaCloud = 1u << 5;
inline constexpr uint16_t kQaInvalidMask = kQaWater | kQaCloudShadow | kQaSnow | kQaCloud;

inline bool qa_is_valid(uint16_t qa) { return (qa & kQaInvalidMask) == 0; }

enum class Interpolation { BILINEAR, NEAREST };

Interpolation interpolation_from_string(const std::string& name);

// LT04/LT05/LE07 -> TM, LC08 -> OLI, anything else -> UNKNOWN.
SensorFamily sensor_family_for(const std::string& sensor_id);

// Source band feeding each canonical band, in canonical order.
struct BandMapping {
    std::array<std::string, kNumCanonicalBands> source_bands;
    bool recalibrate = false;
};

const BandMapping& default_band_mapping(SensorFamily family);

struct LinearCoefficients {
    double slope;
    double intercept;
};

// OLI -> TM surface reflectance coefficients per canonical band.
const std::array<LinearCoefficients, kNumCanonicalBands>& oli_coefficients();

// (dn - intercept*10000) / slope, truncated toward zero and saturated to
// int16. NaN stays NaN.
float recalibrate_value(float dn, const LinearCoefficients& c);

Matrix2Df resample_plane(const Matrix2Df& plane, int rows, int cols, Interpolation interp);
MatrixQA resample_qa(const MatrixQA& qa, int rows, int cols);

struct HarmonizeOptions {
    int target_rows = 0; // 0 = source shape
    int target_cols = 0;
    Interpolation interpolation = Interpolation::BILINEAR;
};

Image harmonize(const RawImage& raw, const BandMapping& mapping, const HarmonizeOptions& opts);

// Uses default_band_mapping() for the scene's sensor family.
Image harmonize(const RawImage& raw, const HarmonizeOptions& opts);

} // namespace landsat_change::harmonize

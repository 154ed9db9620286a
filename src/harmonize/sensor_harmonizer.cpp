#include "landsat_change/harmonize/sensor_harmonizer.hpp"
#include "landsat_change/core/errors.hpp"
#include "landsat_change/core/utils.hpp"

#include <opencv2/opencv.hpp>

#include <cmath>
#include <limits>

namespace landsat_change::harmonize {

Interpolation interpolation_from_string(const std::string& name) {
    const std::string n = core::to_lower(core::trim(name));
    if (n == "bilinear") return Interpolation::BILINEAR;
    if (n == "nearest") return Interpolation::NEAREST;
    throw ValidationError("unknown interpolation '" + name + "'");
}

SensorFamily sensor_family_for(const std::string& sensor_id) {
    if (sensor_id == "LT04" || sensor_id == "LT05" || sensor_id == "LE07") {
        return SensorFamily::TM;
    }
    if (sensor_id == "LC08") {
        return SensorFamily::OLI;
    }
    return SensorFamily::UNKNOWN;
}

const BandMapping& default_band_mapping(SensorFamily family) {
    static const BandMapping tm{{"B1", "B2", "B3", "B4", "B5", "B7"}, false};
    static const BandMapping oli{{"B2", "B3", "B4", "B5", "B6", "B7"}, true};
    switch (family) {
        case SensorFamily::TM: return tm;
        case SensorFamily::OLI: return oli;
        default:
            throw ValidationError("no band mapping for sensor family " +
                                  sensor_family_to_string(family));
    }
}

const std::array<LinearCoefficients, kNumCanonicalBands>& oli_coefficients() {
    static const std::array<LinearCoefficients, kNumCanonicalBands> coefs = {{
        {0.9785, -0.0095},
        {0.9542, -0.0016},
        {0.9825, -0.0022},
        {1.0073, -0.0021},
        {1.0171, -0.0030},
        {0.9949, 0.0029},
    }};
    return coefs;
}

float recalibrate_value(float dn, const LinearCoefficients& c) {
    if (is_nodata(dn)) return kNoData;
    double v = (static_cast<double>(dn) - c.intercept * 10000.0) / c.slope;
    v = std::trunc(v);
    constexpr double lo = std::numeric_limits<int16_t>::min();
    constexpr double hi = std::numeric_limits<int16_t>::max();
    if (v < lo) v = lo;
    if (v > hi) v = hi;
    return static_cast<float>(static_cast<int16_t>(v));
}

Matrix2Df resample_plane(const Matrix2Df& plane, int rows, int cols, Interpolation interp) {
    if (plane.rows() == rows && plane.cols() == cols) {
        return plane;
    }
    if (plane.size() == 0 || rows <= 0 || cols <= 0) {
        throw ValidationError("cannot resample an empty plane");
    }

    cv::Mat src(static_cast<int>(plane.rows()), static_cast<int>(plane.cols()), CV_32F,
                const_cast<float*>(plane.data()));
    Matrix2Df out(rows, cols);
    cv::Mat dst(rows, cols, CV_32F, out.data());
    cv::resize(src, dst, cv::Size(cols, rows), 0.0, 0.0,
               interp == Interpolation::NEAREST ? cv::INTER_NEAREST : cv::INTER_LINEAR);
    return out;
}

MatrixQA resample_qa(const MatrixQA& qa, int rows, int cols) {
    if (qa.rows() == rows && qa.cols() == cols) {
        return qa;
    }
    cv::Mat src(static_cast<int>(qa.rows()), static_cast<int>(qa.cols()), CV_16U,
                const_cast<uint16_t*>(qa.data()));
    MatrixQA out(rows, cols);
    cv::Mat dst(rows, cols, CV_16U, out.data());
    cv::resize(src, dst, cv::Size(cols, rows), 0.0, 0.0, cv::INTER_NEAREST);
    return out;
}

Image harmonize(const RawImage& raw, const BandMapping& mapping, const HarmonizeOptions& opts) {
    const SensorFamily family = sensor_family_for(raw.sensor);
    if (family == SensorFamily::UNKNOWN) {
        throw ValidationError("unsupported sensor '" + raw.sensor + "' in scene " + raw.scene_id);
    }
    if (raw.qa.size() == 0) {
        throw ValidationError("scene " + raw.scene_id + " has no pixel_qa plane");
    }

    const int src_rows = static_cast<int>(raw.qa.rows());
    const int src_cols = static_cast<int>(raw.qa.cols());
    const int rows = opts.target_rows > 0 ? opts.target_rows : src_rows;
    const int cols = opts.target_cols > 0 ? opts.target_cols : src_cols;

    Image out;
    out.scene_id = raw.scene_id;
    out.sensor = raw.sensor;
    out.date = raw.date;

    for (int b = 0; b < kNumCanonicalBands; ++b) {
        const std::string& name = mapping.source_bands[static_cast<size_t>(b)];
        auto it = raw.bands.find(name);
        if (it == raw.bands.end()) {
            throw ValidationError("scene " + raw.scene_id + " is missing band " + name);
        }
        if (it->second.rows() != src_rows || it->second.cols() != src_cols) {
            throw ValidationError("scene " + raw.scene_id + ": band " + name +
                                  " shape differs from pixel_qa");
        }

        Matrix2Df plane = resample_plane(it->second, rows, cols, opts.interpolation);
        if (mapping.recalibrate) {
            const LinearCoefficients& c = oli_coefficients()[static_cast<size_t>(b)];
            for (Eigen::Index i = 0; i < plane.size(); ++i) {
                plane.data()[i] = recalibrate_value(plane.data()[i], c);
            }
        }
        out.bands[static_cast<size_t>(b)] = std::move(plane);
    }

    const MatrixQA qa = resample_qa(raw.qa, rows, cols);
    for (Eigen::Index i = 0; i < qa.size(); ++i) {
        if (qa_is_valid(qa.data()[i])) continue;
        for (auto& plane : out.bands) {
            plane.data()[i] = kNoData;
        }
    }

    return out;
}

Image harmonize(const RawImage& raw, const HarmonizeOptions& opts) {
    const SensorFamily family = sensor_family_for(raw.sensor);
    if (family == SensorFamily::UNKNOWN) {
        throw ValidationError("unsupported sensor '" + raw.sensor + "' in scene " + raw.scene_id);
    }
    return harmonize(raw, default_band_mapping(family), opts);
}

} // namespace landsat_change::harmonize

#include "landsat_change/core/errors.hpp"
#include "landsat_change/core/types.hpp"
#include "landsat_change/harmonize/sensor_harmonizer.hpp"

#include <cmath>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace landsat_change;
namespace hz = landsat_change::harmonize;

namespace {

RawImage make_raw(const std::string& sensor, const std::vector<std::string>& bands, int rows,
                  int cols) {
  RawImage raw;
  raw.scene_id = sensor + "_scene";
  raw.sensor = sensor;
  raw.date = Date{2015, 7, 20};
  float v = 100.0f;
  for (const auto& b : bands) {
    raw.bands[b] = Matrix2Df::Constant(rows, cols, v);
    v += 100.0f;
  }
  raw.qa = MatrixQA::Zero(rows, cols);
  return raw;
}

} // namespace

TEST_CASE("sensor_ids_map_to_families") {
  REQUIRE(hz::sensor_family_for("LT04") == SensorFamily::TM);
  REQUIRE(hz::sensor_family_for("LT05") == SensorFamily::TM);
  REQUIRE(hz::sensor_family_for("LE07") == SensorFamily::TM);
  REQUIRE(hz::sensor_family_for("LC08") == SensorFamily::OLI);
  REQUIRE(hz::sensor_family_for("S2A") == SensorFamily::UNKNOWN);
}

TEST_CASE("oli_recalibration_truncates_toward_zero") {
  const auto& c = hz::oli_coefficients()[0];
  REQUIRE(c.slope == 0.9785);
  REQUIRE(c.intercept == -0.0095);
  // (5000 + 95) / 0.9785 = 5206.95
  REQUIRE(hz::recalibrate_value(5000.0f, c) == 5206.0f);

  const hz::LinearCoefficients unit{1.0, 0.0};
  REQUIRE(hz::recalibrate_value(-10.5f, unit) == -10.0f);
  REQUIRE(hz::recalibrate_value(10.9f, unit) == 10.0f);
}

TEST_CASE("oli_recalibration_saturates_and_keeps_nodata") {
  const hz::LinearCoefficients unit{1.0, 0.0};
  REQUIRE(hz::recalibrate_value(40000.0f, unit) == 32767.0f);
  REQUIRE(hz::recalibrate_value(-40000.0f, unit) == -32768.0f);
  REQUIRE(is_nodata(hz::recalibrate_value(kNoData, unit)));
}

TEST_CASE("qa_bits_2_to_5_invalidate") {
  REQUIRE(hz::qa_is_valid(0));
  REQUIRE(hz::qa_is_valid(1u << 1));
  REQUIRE(hz::qa_is_valid(1u << 6));
  REQUIRE_FALSE(hz::qa_is_valid(1u << 2));
  REQUIRE_FALSE(hz::qa_is_valid(1u << 3));
  REQUIRE_FALSE(hz::qa_is_valid(1u << 4));
  REQUIRE_FALSE(hz::qa_is_valid(1u << 5));
}

TEST_CASE("tm_bands_rename_one_to_one_and_mask_all_bands") {
  RawImage raw = make_raw("LT05", {"B1", "B2", "B3", "B4", "B5", "B6", "B7"}, 2, 2);
  raw.qa(0, 1) = 1u << 5;  // cloud
  raw.qa(1, 0) = 1u << 1;  // clear bit, stays valid

  Image img = hz::harmonize(raw, hz::HarmonizeOptions{});

  REQUIRE(img.rows() == 2);
  REQUIRE(img.cols() == 2);
  REQUIRE(img.sensor == "LT05");
  REQUIRE(img.scene_id == raw.scene_id);
  REQUIRE(img.date == raw.date);

  // B6 (600) is dropped; canonical B7 takes B7 (700).
  REQUIRE(img.bands[0](0, 0) == 100.0f);
  REQUIRE(img.bands[4](0, 0) == 500.0f);
  REQUIRE(img.bands[5](0, 0) == 700.0f);
  REQUIRE(img.bands[5](1, 0) == 700.0f);

  for (const auto& plane : img.bands) {
    REQUIRE(is_nodata(plane(0, 1)));
    REQUIRE_FALSE(is_nodata(plane(1, 1)));
  }
}

TEST_CASE("oli_bands_shift_and_recalibrate") {
  RawImage raw = make_raw("LC08", {"B1", "B2", "B3", "B4", "B5", "B6", "B7"}, 1, 1);
  raw.bands["B2"](0, 0) = 5000.0f;

  Image img = hz::harmonize(raw, hz::HarmonizeOptions{});

  REQUIRE(img.bands[0](0, 0) == 5206.0f);
  // canonical B7 comes from OLI B7 (700): (700 - 29) / 0.9949 = 674.44
  REQUIRE(img.bands[5](0, 0) == 674.0f);
}

TEST_CASE("missing_band_and_bad_qa_are_validation_errors") {
  RawImage raw = make_raw("LT05", {"B1", "B2", "B3", "B4", "B5"}, 2, 2);
  REQUIRE_THROWS_AS(hz::harmonize(raw, hz::HarmonizeOptions{}), ValidationError);

  RawImage raw2 = make_raw("LT05", {"B1", "B2", "B3", "B4", "B5", "B7"}, 2, 2);
  raw2.qa = MatrixQA::Zero(3, 2);
  REQUIRE_THROWS_AS(hz::harmonize(raw2, hz::HarmonizeOptions{}), ValidationError);

  RawImage raw3 = make_raw("S2A", {"B1", "B2", "B3", "B4", "B5", "B7"}, 2, 2);
  REQUIRE_THROWS_AS(hz::harmonize(raw3, hz::HarmonizeOptions{}), ValidationError);
}

TEST_CASE("resample_to_target_grid_uses_nearest_qa") {
  RawImage raw = make_raw("LE07", {"B1", "B2", "B3", "B4", "B5", "B7"}, 2, 2);
  raw.qa(0, 0) = 1u << 3;  // shadow in the top-left quadrant

  hz::HarmonizeOptions opts;
  opts.target_rows = 4;
  opts.target_cols = 4;
  Image img = hz::harmonize(raw, opts);

  REQUIRE(img.rows() == 4);
  REQUIRE(img.cols() == 4);
  REQUIRE(is_nodata(img.bands[0](0, 0)));
  REQUIRE(is_nodata(img.bands[0](1, 1)));
  REQUIRE(img.bands[0](3, 3) == Catch::Approx(100.0f));
  REQUIRE(img.bands[2](2, 3) == Catch::Approx(300.0f));
}

TEST_CASE("resample_to_own_shape_is_identity") {
  Matrix2Df p(2, 3);
  p << 1, 2, 3,
       4, 5, 6;
  Matrix2Df out = hz::resample_plane(p, 2, 3, hz::Interpolation::BILINEAR);
  REQUIRE(out == p);

  MatrixQA q = MatrixQA::Constant(2, 2, 32);
  MatrixQA qn = hz::resample_qa(q, 4, 4);
  REQUIRE(qn(3, 3) == 32);
}

TEST_CASE("interpolation_names") {
  REQUIRE(hz::interpolation_from_string("bilinear") == hz::Interpolation::BILINEAR);
  REQUIRE(hz::interpolation_from_string("nearest") == hz::Interpolation::NEAREST);
  REQUIRE_THROWS_AS(hz::interpolation_from_string("cubic"), ValidationError);
}

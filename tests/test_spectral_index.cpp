#include "landsat_change/core/errors.hpp"
#include "landsat_change/index/spectral_index.hpp"

#include <cmath>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace landsat_change;
namespace idx = landsat_change::index;

TEST_CASE("implemented_indices_resolve") {
  REQUIRE(idx::resolve_index("NDVI") == idx::SpectralIndex::NDVI);
  REQUIRE(idx::resolve_index("NBR") == idx::SpectralIndex::NBR);
  REQUIRE(idx::index_to_string(idx::SpectralIndex::NBR) == "NBR");

  const auto& nbr = idx::definition(idx::SpectralIndex::NBR);
  REQUIRE(nbr.p == CanonicalBand::B4);
  REQUIRE(nbr.q == CanonicalBand::B7);
  REQUIRE(nbr.direction == -1);
}

TEST_CASE("index_names_are_case_sensitive") {
  REQUIRE_THROWS_AS(idx::resolve_index("ndvi"), UnrecognizedIndexError);
  REQUIRE_THROWS_AS(idx::resolve_index("EVI"), UnrecognizedIndexError);
}

TEST_CASE("recognized_but_missing_index_is_unimplemented") {
  REQUIRE_THROWS_AS(idx::resolve_index("NDSI"), UnimplementedIndexError);
  REQUIRE_THROWS_AS(idx::resolve_index("TCW"), ConfigError);

  try {
    idx::resolve_index("NBR2");
    FAIL("expected UnimplementedIndexError");
  } catch (const UnimplementedIndexError& e) {
    const std::string msg = e.what();
    REQUIRE(msg.find("NBR") != std::string::npos);
    REQUIRE(msg.find("NDVI") != std::string::npos);
  }
}

TEST_CASE("normalized_difference_values") {
  REQUIRE(idx::normalized_difference(300.0f, 100.0f) == Catch::Approx(0.5f));
  REQUIRE(idx::normalized_difference(100.0f, 300.0f) == Catch::Approx(-0.5f));
  REQUIRE(idx::normalized_difference(0.0f, 250.0f) == Catch::Approx(-1.0f));
}

TEST_CASE("normalized_difference_nodata_cases") {
  REQUIRE(std::isnan(idx::normalized_difference(0.0f, 0.0f)));
  REQUIRE(std::isnan(idx::normalized_difference(-5.0f, 100.0f)));
  REQUIRE(std::isnan(idx::normalized_difference(100.0f, -1.0f)));
  REQUIRE(std::isnan(idx::normalized_difference(kNoData, 100.0f)));
}

TEST_CASE("index_image_scales_orients_and_appends_features") {
  Image c;
  c.scene_id = "composite_2003";
  c.sensor = "MEDOID";
  c.date = Date{2003, 1, 1};
  for (int b = 0; b < kNumCanonicalBands; ++b) {
    c.bands[static_cast<size_t>(b)] = Matrix2Df::Constant(2, 2, 100.0f * (b + 1));
  }
  c.bands[static_cast<size_t>(CanonicalBand::B4)].setConstant(300.0f);
  c.bands[static_cast<size_t>(CanonicalBand::B7)].setConstant(100.0f);
  c.bands[static_cast<size_t>(CanonicalBand::B4)](1, 1) = kNoData;

  const auto ftv = idx::resolve_ftv_bands({"B4", "B5", "B7"});
  const auto out = idx::build_index_image(c, idx::SpectralIndex::NBR, ftv);

  REQUIRE(out.date == Date{2003, 1, 1});
  REQUIRE(out.index_name == "NBR");
  const std::vector<std::string> names = {"NBR", "ftv_B4", "ftv_B5", "ftv_B7"};
  REQUIRE(out.band_names == names);
  REQUIRE(out.planes.size() == 4);
  REQUIRE(out.planes[0](0, 0) == Catch::Approx(-500.0f));
  REQUIRE(std::isnan(out.planes[0](1, 1)));
  REQUIRE(out.planes[1](0, 0) == 300.0f);
  REQUIRE(out.planes[2](0, 0) == 500.0f);
  REQUIRE(out.planes[3](0, 0) == 100.0f);
}

TEST_CASE("index_series_keeps_one_image_per_composite") {
  TimeSeries composites(3);
  for (size_t k = 0; k < composites.size(); ++k) {
    composites[k].date = Date{2000 + static_cast<int>(k), 1, 1};
    for (auto& plane : composites[k].bands) plane = Matrix2Df::Constant(1, 1, 200.0f);
  }
  const auto series = idx::build_index_series(composites, idx::SpectralIndex::NDVI, {});
  REQUIRE(series.size() == 3);
  REQUIRE(series[2].date.year == 2002);
  REQUIRE(series[0].planes.size() == 1);
  REQUIRE(series[0].planes[0](0, 0) == 0.0f);
}

TEST_CASE("unknown_feature_band_is_config_error") {
  REQUIRE_THROWS_AS(idx::resolve_ftv_bands({"B6"}), ConfigError);
  REQUIRE(idx::resolve_ftv_bands({}).empty());
}

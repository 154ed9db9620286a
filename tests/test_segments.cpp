#include "landsat_change/core/errors.hpp"
#include "landsat_change/segment/segment_features.hpp"

#include <cmath>
#include <limits>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace landsat_change::segment;

TEST_CASE("segment_between_two_vertices") {
  const std::vector<Vertex> v = {{2000, 200.0f}, {2005, 50.0f}};
  const auto segs = compute_segments(v, 20.0f, -1);

  REQUIRE(segs.size() == 1);
  const Segment& s = segs[0];
  REQUIRE(s.start_year == 2001);
  REQUIRE(s.end_year == 2005);
  REQUIRE(s.start_val == -200.0f);
  REQUIRE(s.end_val == -50.0f);
  REQUIRE(s.duration == 4);
  REQUIRE(s.magnitude == Catch::Approx(-150.0f));
  REQUIRE(s.rate == Catch::Approx(-37.5f));
  REQUIRE(s.dsnr == Catch::Approx(-7.5f));
}

TEST_CASE("positive_direction_keeps_values") {
  const std::vector<Vertex> v = {{1990, 10.0f}, {1995, 60.0f}, {2000, 40.0f}};
  const auto segs = compute_segments(v, 10.0f, 1);

  REQUIRE(segs.size() == 2);
  REQUIRE(segs[0].magnitude == Catch::Approx(50.0f));
  REQUIRE(segs[1].start_year == 1996);
  REQUIRE(segs[1].magnitude == Catch::Approx(-20.0f));
  REQUIRE(segs[1].dsnr == Catch::Approx(-2.0f));
}

TEST_CASE("consecutive_years_give_zero_duration_and_no_rate") {
  const std::vector<Vertex> v = {{2000, 0.0f}, {2001, 30.0f}, {2001, 90.0f}};
  const auto segs = compute_segments(v, 10.0f, 1);

  REQUIRE(segs.size() == 2);
  REQUIRE(segs[0].duration == 0);
  REQUIRE(std::isnan(segs[0].rate));
  REQUIRE(segs[0].dsnr == Catch::Approx(3.0f));
  // repeated vertex year
  REQUIRE(segs[1].start_year == 2002);
  REQUIRE(segs[1].end_year == 2001);
  REQUIRE(segs[1].duration == 0);
  REQUIRE(std::isnan(segs[1].rate));
}

TEST_CASE("zero_or_missing_rmse_gives_no_dsnr") {
  const std::vector<Vertex> v = {{2000, 0.0f}, {2004, 40.0f}};
  REQUIRE(std::isnan(compute_segments(v, 0.0f, 1)[0].dsnr));
  REQUIRE(std::isnan(compute_segments(v, std::numeric_limits<float>::quiet_NaN(), 1)[0].dsnr));
  REQUIRE(compute_segments(v, 0.0f, 1)[0].rate == Catch::Approx(10.0f));
}

TEST_CASE("fewer_than_two_vertices_give_no_segments") {
  REQUIRE(compute_segments({}, 1.0f, 1).empty());
  REQUIRE(compute_segments({{2000, 5.0f}}, 1.0f, 1).empty());
}

TEST_CASE("vertices_follow_flags_and_skip_missing_values") {
  const float nan = std::numeric_limits<float>::quiet_NaN();
  const std::vector<int> years = {2000, 2001, 2002, 2003, 2004};
  const std::vector<float> fitted = {10.0f, 20.0f, nan, 40.0f, 50.0f};
  const std::vector<float> flags = {1.0f, 0.0f, 1.0f, nan, 1.0f};

  const auto v = extract_vertices(years, fitted, flags);
  REQUIRE(v.size() == 2);
  REQUIRE(v[0].year == 2000);
  REQUIRE(v[1].year == 2004);
  REQUIRE(v[1].value == 50.0f);
}

TEST_CASE("vertex_inputs_must_have_equal_length") {
  REQUIRE_THROWS_AS(extract_vertices({2000, 2001}, {1.0f}, {1.0f, 1.0f}),
                    landsat_change::ValidationError);
}

#include "landsat_change/core/errors.hpp"
#include "landsat_change/core/types.hpp"
#include "landsat_change/core/utils.hpp"

#include <string>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

namespace core = landsat_change::core;
using landsat_change::Date;

TEST_CASE("median_of_odd_count_is_middle_value") {
  std::vector<float> v = {9.0f, 1.0f, 5.0f};
  REQUIRE(core::median_of(v) == 5.0f);
}

TEST_CASE("median_of_even_count_is_mean_of_middle_values") {
  std::vector<float> v = {4.0f, 1.0f, 3.0f, 100.0f};
  REQUIRE(core::median_of(v) == Catch::Approx(3.5f));
}

TEST_CASE("median_of_empty_is_nodata") {
  std::vector<float> v;
  REQUIRE(landsat_change::is_nodata(core::median_of(v)));
}

TEST_CASE("make_date_rolls_feb_29_in_non_leap_year") {
  const Date d = core::make_date(2001, 2, 29);
  REQUIRE(d == Date{2001, 3, 1});

  const Date leap = core::make_date(2004, 2, 29);
  REQUIRE(leap == Date{2004, 2, 29});
}

TEST_CASE("make_date_rejects_bad_month") {
  REQUIRE_THROWS_AS(core::make_date(2001, 13, 1), landsat_change::ValidationError);
  REQUIRE_THROWS_AS(core::make_date(2001, 0, 1), landsat_change::ValidationError);
  REQUIRE_THROWS_AS(core::make_date(2001, 5, 0), landsat_change::ValidationError);
}

TEST_CASE("add_days_crosses_month_and_year_boundaries") {
  REQUIRE(core::add_days(Date{2020, 9, 10}, 1) == Date{2020, 9, 11});
  REQUIRE(core::add_days(Date{1999, 12, 31}, 1) == Date{2000, 1, 1});
  REQUIRE(core::add_days(Date{2000, 2, 28}, 1) == Date{2000, 2, 29});
  REQUIRE(core::add_days(Date{2000, 3, 1}, -1) == Date{2000, 2, 29});
  REQUIRE(core::add_days(Date{2000, 1, 1}, -1) == Date{1999, 12, 31});
  REQUIRE(core::add_days(Date{2000, 1, 1}, 366) == Date{2001, 1, 1});
}

TEST_CASE("parse_date_accepts_iso_date_and_ignores_time_part") {
  REQUIRE(core::parse_date("1999-07-04") == Date{1999, 7, 4});
  REQUIRE(core::parse_date("2013-06-21T10:32:11") == Date{2013, 6, 21});
}

TEST_CASE("parse_date_rejects_garbage_and_impossible_dates") {
  REQUIRE_THROWS_AS(core::parse_date("yesterday"), landsat_change::ValidationError);
  REQUIRE_THROWS_AS(core::parse_date("2001-02-29"), landsat_change::ValidationError);
}

TEST_CASE("parse_month_day_validates_range") {
  const auto md = core::parse_month_day("06-20");
  REQUIRE(md.month == 6);
  REQUIRE(md.day == 20);
  REQUIRE(core::parse_month_day("02-29").day == 29);

  REQUIRE_THROWS_AS(core::parse_month_day("13-01"), landsat_change::ValidationError);
  REQUIRE_THROWS_AS(core::parse_month_day("04-31"), landsat_change::ValidationError);
  REQUIRE_THROWS_AS(core::parse_month_day("0620"), landsat_change::ValidationError);
}

TEST_CASE("date_and_month_day_format_zero_padded") {
  REQUIRE(core::date_to_string(Date{1985, 6, 2}) == "1985-06-02");
  REQUIRE(core::month_day_to_string({9, 1}) == "09-01");
}

TEST_CASE("glob_match_is_case_insensitive") {
  REQUIRE(core::glob_match("*.fits", "LT05_1999.FITS"));
  REQUIRE(core::glob_match("LC08_*.fit", "LC08_2015.fit"));
  REQUIRE_FALSE(core::glob_match("*.fits", "notes.txt"));
}

TEST_CASE("sha256_bytes_known_digest") {
  const std::string s = "abc";
  const std::vector<uint8_t> bytes(s.begin(), s.end());
  REQUIRE(core::sha256_bytes(bytes) ==
          "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("split_and_join") {
  const auto parts = core::split("*.fit;*.fits", ';');
  REQUIRE(parts.size() == 2);
  REQUIRE(parts[1] == "*.fits");
  REQUIRE(core::join(parts, "|") == "*.fit|*.fits");
}

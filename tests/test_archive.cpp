#include "landsat_change/archive/archive_merger.hpp"
#include "landsat_change/core/errors.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace landsat_change;
namespace archive = landsat_change::archive;

namespace {

Image make_image(const std::string& id, const std::string& sensor, Date date) {
  Image img;
  img.scene_id = id;
  img.sensor = sensor;
  img.date = date;
  for (auto& plane : img.bands) plane = Matrix2Df::Zero(1, 1);
  return img;
}

} // namespace

TEST_CASE("merge_orders_by_date_and_keeps_duplicates_stable") {
  TimeSeries tm = {make_image("tm_a", "LT05", Date{2000, 7, 1}),
                   make_image("tm_b", "LT05", Date{2013, 7, 10})};
  TimeSeries etm = {make_image("etm_a", "LE07", Date{2000, 6, 25}),
                    make_image("etm_b", "LE07", Date{2013, 7, 10})};
  TimeSeries oli = {make_image("oli_a", "LC08", Date{2013, 7, 10})};

  const TimeSeries merged = archive::merge_time_series({tm, etm, oli});

  REQUIRE(merged.size() == 5);
  REQUIRE(merged[0].scene_id == "etm_a");
  REQUIRE(merged[1].scene_id == "tm_a");
  REQUIRE(merged[2].scene_id == "tm_b");
  REQUIRE(merged[3].scene_id == "etm_b");
  REQUIRE(merged[4].scene_id == "oli_a");
}

TEST_CASE("merge_of_nothing_is_empty") {
  REQUIRE(archive::merge_time_series({}).empty());
  REQUIRE(archive::merge_time_series({TimeSeries{}, TimeSeries{}}).empty());
}

TEST_CASE("archive_range_includes_last_day") {
  const auto r = archive::archive_date_range(1985, 2020, MonthDay{6, 20}, MonthDay{9, 10});
  REQUIRE(r.first == Date{1985, 6, 20});
  REQUIRE(r.last_exclusive == Date{2020, 9, 11});

  REQUIRE(archive::in_range(Date{1985, 6, 20}, r));
  REQUIRE(archive::in_range(Date{2020, 9, 10}, r));
  REQUIRE(archive::in_range(Date{2003, 1, 15}, r));
  REQUIRE_FALSE(archive::in_range(Date{1985, 6, 19}, r));
  REQUIRE_FALSE(archive::in_range(Date{2020, 9, 11}, r));
}

TEST_CASE("archive_range_rejects_reversed_years") {
  REQUIRE_THROWS_AS(archive::archive_date_range(2020, 1985, MonthDay{6, 20}, MonthDay{9, 10}),
                    ValidationError);
}

TEST_CASE("filter_date_range_keeps_order") {
  TimeSeries s = {make_image("a", "LT05", Date{1984, 8, 1}),
          make_image("b", "LT05", Date{1990, 8, 1}),
          make_image("c", "LT05", Date{1995, 8, 1}),
          make_image("d", "LT05", Date{2021, 8, 1})};
  const auto r = archive::archive_date_range(1985, 2020, MonthDay{6, 20}, MonthDay{9, 10});

  const TimeSeries kept = archive::filter_date_range(s, r);
  REQUIRE(kept.size() == 2);
  REQUIRE(kept[0].scene_id == "b");
  REQUIRE(kept[1].scene_id == "c");
}

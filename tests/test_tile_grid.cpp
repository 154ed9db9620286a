#include "landsat_change/core/errors.hpp"
#include "landsat_change/pipeline/tile_grid.hpp"

#include <atomic>
#include <vector>

#include <catch2/catch_test_macros.hpp>

namespace pipeline = landsat_change::pipeline;

TEST_CASE("tile_grid_covers_every_pixel_once") {
  const auto grid = pipeline::build_tile_grid(10, 7, 4);
  REQUIRE(grid.rows == 3);
  REQUIRE(grid.cols == 2);
  REQUIRE(grid.tiles.size() == 6);

  std::vector<int> hits(10 * 7, 0);
  for (const auto& t : grid.tiles) {
    for (int y = t.y; y < t.y + t.height; ++y) {
      for (int x = t.x; x < t.x + t.width; ++x) {
        hits[static_cast<size_t>(y * 7 + x)]++;
      }
    }
  }
  for (int h : hits) REQUIRE(h == 1);

  const auto& last = grid.tiles.back();
  REQUIRE(last.height == 2);
  REQUIRE(last.width == 3);
}

TEST_CASE("tile_grid_of_empty_image_has_no_tiles") {
  const auto grid = pipeline::build_tile_grid(0, 0, 16);
  REQUIRE(grid.tiles.empty());
  REQUIRE_THROWS_AS(pipeline::build_tile_grid(4, 4, 0), landsat_change::ValidationError);
}

TEST_CASE("parallel_for_runs_each_index_once") {
  std::vector<std::atomic<int>> counts(97);
  for (auto& c : counts) c.store(0);

  pipeline::parallel_for(counts.size(), 4, [&](size_t i) { counts[i]++; });

  for (auto& c : counts) REQUIRE(c.load() == 1);
}

TEST_CASE("parallel_for_rethrows_worker_exception") {
  auto fn = [](size_t i) {
    if (i == 5) throw landsat_change::DataError("tile 5 failed");
  };
  REQUIRE_THROWS_AS(pipeline::parallel_for(32, 4, fn), landsat_change::DataError);
  REQUIRE_THROWS_AS(pipeline::parallel_for(32, 1, fn), landsat_change::DataError);
}

TEST_CASE("effective_workers_is_at_least_one_and_at_most_jobs") {
  REQUIRE(pipeline::effective_workers(0, 10) == 1);
  REQUIRE(pipeline::effective_workers(8, 1) == 1);
  REQUIRE(pipeline::effective_workers(8, 0) == 1);
}

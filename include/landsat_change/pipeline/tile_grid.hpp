#pragma once

#include "landsat_change/core/types.hpp"
#include <functional>

namespace landsat_change::pipeline {

// Non-overlapping tiles covering the full image; edge tiles are clipped.
TileGrid build_tile_grid(int image_rows, int image_cols, int tile_size);

// Caps the requested worker count to the CPU count and to `jobs`, minimum 1.
int effective_workers(int requested, size_t jobs);

// Runs fn(i) for i in [0, n) on `workers` threads. Workers claim indices
// from a shared atomic counter. The first exception thrown by fn stops
// further claims and is rethrown on the calling thread after all workers
// have joined.
void parallel_for(size_t n, int workers, const std::function<void(size_t)>& fn);

// parallel_for over the tiles of `grid`.
void run_tiles(const TileGrid& grid, int workers, const std::function<void(const Tile&)>& fn);

} // namespace landsat_change::pipeline

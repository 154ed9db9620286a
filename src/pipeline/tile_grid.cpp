#include "landsat_change/pipeline/tile_grid.hpp"
#include "landsat_change/core/errors.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace landsat_change::pipeline {

TileGrid build_tile_grid(int image_rows, int image_cols, int tile_size) {
    if (image_rows < 0 || image_cols < 0) {
        throw ValidationError("image shape must be non-negative");
    }
    if (tile_size < 1) {
        throw ValidationError("tile_size must be >= 1");
    }

    TileGrid grid;
    grid.tile_size = tile_size;
    grid.image_rows = image_rows;
    grid.image_cols = image_cols;
    grid.rows = (image_rows + tile_size - 1) / tile_size;
    grid.cols = (image_cols + tile_size - 1) / tile_size;

    for (int r = 0; r < grid.rows; ++r) {
        for (int c = 0; c < grid.cols; ++c) {
            const int y0 = r * tile_size;
            const int x0 = c * tile_size;
            const int th = std::min(tile_size, image_rows - y0);
            const int tw = std::min(tile_size, image_cols - x0);
            grid.tiles.push_back(Tile{x0, y0, tw, th, r, c});
        }
    }
    return grid;
}

int effective_workers(int requested, size_t jobs) {
    int cpu_cores = static_cast<int>(std::thread::hardware_concurrency());
    if (cpu_cores == 0)
        cpu_cores = 1;
    int n = std::min(requested, cpu_cores);
    if (jobs < static_cast<size_t>(std::max(n, 1)))
        n = static_cast<int>(jobs);
    return std::max(1, n);
}

void parallel_for(size_t n, int workers, const std::function<void(size_t)>& fn) {
    if (n == 0)
        return;

    const int n_workers = effective_workers(workers, n);
    if (n_workers == 1) {
        for (size_t i = 0; i < n; ++i) {
            fn(i);
        }
        return;
    }

    std::atomic<size_t> next_job{0};
    std::atomic<bool> failed{false};
    std::exception_ptr first_error;
    std::mutex error_mutex;

    std::vector<std::thread> pool;
    pool.reserve(static_cast<size_t>(n_workers));
    for (int w = 0; w < n_workers; ++w) {
        pool.emplace_back([&]() {
            while (!failed.load(std::memory_order_relaxed)) {
                const size_t i = next_job.fetch_add(1);
                if (i >= n)
                    break;
                try {
                    fn(i);
                } catch (...) {
                    std::lock_guard<std::mutex> lock(error_mutex);
                    if (!first_error)
                        first_error = std::current_exception();
                    failed.store(true);
                }
            }
        });
    }

    for (auto& worker : pool) {
        if (worker.joinable())
            worker.join();
    }

    if (first_error)
        std::rethrow_exception(first_error);
}

void run_tiles(const TileGrid& grid, int workers, const std::function<void(const Tile&)>& fn) {
    parallel_for(grid.tiles.size(), workers,
                 [&](size_t ti) { fn(grid.tiles[ti]); });
}

} // namespace landsat_change::pipeline

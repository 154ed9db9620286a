#pragma once

#include <vector>

namespace landsat_change::segment {

// Breakpoint of the fitted piecewise-linear trend.
struct Vertex {
    int year;
    float value;
};

struct Segment {
    int start_year;
    int end_year;
    float start_val;
    float end_val;
    float magnitude;
    int duration;   // >= 0
    float rate;     // NaN when duration == 0
    float dsnr;     // NaN when rmse is 0 or NaN
};

// Vertices are the (year, fitted) pairs whose flag is non-zero and whose
// fitted value is present. Throws ValidationError on length mismatch.
std::vector<Vertex> extract_vertices(const std::vector<int>& years,
                                     const std::vector<float>& fitted,
                                     const std::vector<float>& vertex_flags);

// One segment per consecutive vertex pair. `dir` is applied to the vertex
// values and again to the magnitude.
std::vector<Segment> compute_segments(const std::vector<Vertex>& vertices, float rmse, int dir);

} // namespace landsat_change::segment

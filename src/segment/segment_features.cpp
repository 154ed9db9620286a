#include "landsat_change/segment/segment_features.hpp"
#include "landsat_change/core/errors.hpp"
#include "landsat_change/core/types.hpp"

#include <algorithm>
#include <cmath>

namespace landsat_change::segment {

std::vector<Vertex> extract_vertices(const std::vector<int>& years,
                                     const std::vector<float>& fitted,
                                     const std::vector<float>& vertex_flags) {
    if (fitted.size() != years.size() || vertex_flags.size() != years.size()) {
        throw ValidationError("vertex extraction: " + std::to_string(years.size()) + " years, " +
                              std::to_string(fitted.size()) + " fitted values, " +
                              std::to_string(vertex_flags.size()) + " flags");
    }

    std::vector<Vertex> vertices;
    for (size_t i = 0; i < years.size(); ++i) {
        const float flag = vertex_flags[i];
        if (is_nodata(flag) || flag == 0.0f) continue;
        if (is_nodata(fitted[i])) continue;
        vertices.push_back(Vertex{years[i], fitted[i]});
    }
    return vertices;
}

std::vector<Segment> compute_segments(const std::vector<Vertex>& vertices, float rmse, int dir) {
    std::vector<Segment> segments;
    if (vertices.size() < 2) return segments;
    segments.reserve(vertices.size() - 1);

    const bool rmse_usable = !is_nodata(rmse) && rmse != 0.0f;
    const float d = static_cast<float>(dir);

    for (size_t i = 0; i + 1 < vertices.size(); ++i) {
        const Vertex& a = vertices[i];
        const Vertex& b = vertices[i + 1];

        Segment s;
        s.start_year = a.year + 1;
        s.end_year = b.year;
        s.start_val = a.value * d;
        s.end_val = b.value * d;
        // Repeated vertex years give end < start.
        s.duration = std::max(0, s.end_year - s.start_year);
        s.magnitude = (s.end_val - s.start_val) * d;
        s.rate = s.duration == 0 ? kNoData : s.magnitude / static_cast<float>(s.duration);
        s.dsnr = rmse_usable ? s.magnitude / rmse : kNoData;
        segments.push_back(s);
    }
    return segments;
}

} // namespace landsat_change::segment

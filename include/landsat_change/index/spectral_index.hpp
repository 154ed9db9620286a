#pragma once

#include "landsat_change/core/types.hpp"
#include <string>
#include <vector>

namespace landsat_change::index {

enum class SpectralIndex { NDVI, NBR };

struct IndexDefinition {
    SpectralIndex index;
    const char* name;
    CanonicalBand p;
    CanonicalBand q;
    int direction; // -1: disturbance lowers the index
};

const std::vector<IndexDefinition>& index_definitions();
const IndexDefinition& definition(SpectralIndex index);
std::string index_to_string(SpectralIndex index);

std::vector<std::string> supported_index_names();

// Recognized names without an implementation.
const std::vector<std::string>& unimplemented_index_names();

// Case-sensitive. Throws UnimplementedIndexError for a recognized but
// unimplemented name and UnrecognizedIndexError for anything else.
SpectralIndex resolve_index(const std::string& name);

// Throws ConfigError on a name outside the canonical band set.
std::vector<CanonicalBand> resolve_ftv_bands(const std::vector<std::string>& names);

// (p - q) / (p + q); no-data if an input is no-data or negative, or p + q == 0.
float normalized_difference(float p, float q);

// Fitter input for one composite: planes[0] is the index, followed by
// one ftv_<band> plane per feature band.
struct IndexImage {
    Date date;
    std::string index_name;
    std::vector<std::string> band_names;
    std::vector<Matrix2Df> planes;
};

IndexImage build_index_image(const Image& composite, SpectralIndex index,
                             const std::vector<CanonicalBand>& ftv_bands);

std::vector<IndexImage> build_index_series(const TimeSeries& composites, SpectralIndex index,
                                           const std::vector<CanonicalBand>& ftv_bands);

} // namespace landsat_change::index

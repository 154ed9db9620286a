#include "landsat_change/index/spectral_index.hpp"
#include "landsat_change/core/errors.hpp"
#include "landsat_change/core/utils.hpp"

#include <algorithm>

namespace landsat_change::index {

const std::vector<IndexDefinition>& index_definitions() {
    static const std::vector<IndexDefinition> defs = {
        {SpectralIndex::NDVI, "NDVI", CanonicalBand::B4, CanonicalBand::B3, -1},
        {SpectralIndex::NBR, "NBR", CanonicalBand::B4, CanonicalBand::B7, -1},
    };
    return defs;
}

const IndexDefinition& definition(SpectralIndex index) {
    for (const auto& d : index_definitions()) {
        if (d.index == index) return d;
    }
    throw ConfigError("no definition for spectral index " +
                      std::to_string(static_cast<int>(index)));
}

std::string index_to_string(SpectralIndex index) {
    return definition(index).name;
}

std::vector<std::string> supported_index_names() {
    std::vector<std::string> names;
    for (const auto& d : index_definitions()) names.emplace_back(d.name);
    return names;
}

const std::vector<std::string>& unimplemented_index_names() {
    static const std::vector<std::string> names = {"NDSI", "NDMI", "TCB", "TCG",
                                                   "TCW",  "TCA",  "NBR2"};
    return names;
}

SpectralIndex resolve_index(const std::string& name) {
    for (const auto& d : index_definitions()) {
        if (name == d.name) return d.index;
    }
    const auto& pending = unimplemented_index_names();
    if (std::find(pending.begin(), pending.end(), name) != pending.end()) {
        throw UnimplementedIndexError("'" + name + "' is not implemented yet; supported: " +
                                      core::join(supported_index_names(), ", "));
    }
    throw UnrecognizedIndexError("'" + name + "' is not a spectral index; supported: " +
                                 core::join(supported_index_names(), ", "));
}

std::vector<CanonicalBand> resolve_ftv_bands(const std::vector<std::string>& names) {
    std::vector<CanonicalBand> bands;
    bands.reserve(names.size());
    for (const auto& n : names) {
        const int idx = canonical_band_index(n);
        if (idx < 0) {
            throw ConfigError("unknown feature band '" + n + "'; expected one of " +
                              core::join(std::vector<std::string>(canonical_band_names().begin(),
                                                                  canonical_band_names().end()),
                                         ", "));
        }
        bands.push_back(static_cast<CanonicalBand>(idx));
    }
    return bands;
}

float normalized_difference(float p, float q) {
    if (is_nodata(p) || is_nodata(q)) return kNoData;
    if (p < 0.0f || q < 0.0f) return kNoData;
    const double sum = static_cast<double>(p) + static_cast<double>(q);
    if (sum == 0.0) return kNoData;
    return static_cast<float>((static_cast<double>(p) - static_cast<double>(q)) / sum);
}

IndexImage build_index_image(const Image& composite, SpectralIndex index,
                             const std::vector<CanonicalBand>& ftv_bands) {
    const IndexDefinition& def = definition(index);
    const Matrix2Df& p = composite.bands[static_cast<size_t>(def.p)];
    const Matrix2Df& q = composite.bands[static_cast<size_t>(def.q)];

    IndexImage out;
    out.date = composite.date;
    out.index_name = def.name;

    Matrix2Df idx(p.rows(), p.cols());
    for (Eigen::Index i = 0; i < idx.size(); ++i) {
        const float nd = normalized_difference(p.data()[i], q.data()[i]);
        idx.data()[i] = is_nodata(nd) ? kNoData
                                      : nd * static_cast<float>(def.direction) * 1000.0f;
    }
    out.band_names.push_back(def.name);
    out.planes.push_back(std::move(idx));

    for (CanonicalBand b : ftv_bands) {
        out.band_names.push_back("ftv_" + canonical_band_to_string(b));
        out.planes.push_back(composite.bands[static_cast<size_t>(b)]);
    }
    return out;
}

std::vector<IndexImage> build_index_series(const TimeSeries& composites, SpectralIndex index,
                                           const std::vector<CanonicalBand>& ftv_bands) {
    std::vector<IndexImage> out;
    out.reserve(composites.size());
    for (const auto& c : composites) {
        out.push_back(build_index_image(c, index, ftv_bands));
    }
    return out;
}

} // namespace landsat_change::index

#pragma once

#include "landsat_change/archive/archive_merger.hpp"
#include "landsat_change/core/types.hpp"
#include <string>
#include <vector>

namespace landsat_change::io {

// Source of raw Landsat scenes.
class ImageArchive {
public:
    virtual ~ImageArchive() = default;

    // Scenes of `sensor_id` acquired inside `range`, ordered by date.
    // Read failures propagate as IOError.
    virtual std::vector<RawImage> collect(const std::string& sensor_id,
                                          const archive::DateRange& range) = 0;

    virtual std::string name() const = 0;
};

// One FITS cube per scene. Header keys: SENSOR, DATE-OBS (YYYY-MM-DD),
// optional SCENEID, and BANDNAM<k> naming plane k ("B1".."B7", "pixel_qa").
class DirectoryArchive : public ImageArchive {
public:
    // `pattern` is a ';'-separated list of globs, e.g. "*.fit;*.fits".
    DirectoryArchive(fs::path dir, std::string pattern);

    std::vector<RawImage> collect(const std::string& sensor_id,
                                  const archive::DateRange& range) override;

    std::string name() const override;

    struct SceneInfo {
        fs::path path;
        std::string scene_id;
        std::string sensor;
        Date date;
    };

    // Header-only scan of every matching file, sorted by date then path.
    std::vector<SceneInfo> scan() const;

private:
    fs::path dir_;
    std::string pattern_;
};

RawImage read_scene(const fs::path& path);
void write_scene(const fs::path& path, const RawImage& scene);

} // namespace landsat_change::io

#include "landsat_change/io/image_archive.hpp"
#include "landsat_change/core/errors.hpp"
#include "landsat_change/core/utils.hpp"
#include "landsat_change/io/fits_io.hpp"

#include <algorithm>
#include <set>

namespace landsat_change::io {

namespace {

const char* kQaPlaneName = "pixel_qa";

DirectoryArchive::SceneInfo scene_info_from_header(const fs::path& path, const FitsHeader& hdr) {
    DirectoryArchive::SceneInfo info;
    info.path = path;

    auto sensor = hdr.get_string("SENSOR");
    if (!sensor) {
        throw FitsError("missing SENSOR key: " + path.string());
    }
    info.sensor = core::to_upper(core::trim(*sensor));

    auto date = hdr.get_string("DATE-OBS");
    if (!date) {
        throw FitsError("missing DATE-OBS key: " + path.string());
    }
    info.date = core::parse_date(*date);

    auto scene_id = hdr.get_string("SCENEID");
    info.scene_id = scene_id ? core::trim(*scene_id) : path.stem().string();
    return info;
}

} // namespace

DirectoryArchive::DirectoryArchive(fs::path dir, std::string pattern)
    : dir_(std::move(dir)), pattern_(std::move(pattern)) {}

std::string DirectoryArchive::name() const {
    return "directory:" + dir_.string();
}

std::vector<DirectoryArchive::SceneInfo> DirectoryArchive::scan() const {
    if (!fs::exists(dir_) || !fs::is_directory(dir_)) {
        throw IOError("archive directory not found: " + dir_.string());
    }

    std::set<fs::path> files;
    for (const auto& glob : core::split(pattern_, ';')) {
        const std::string g = core::trim(glob);
        if (g.empty()) continue;
        for (const auto& p : core::discover_files(dir_, g)) {
            files.insert(p);
        }
    }

    std::vector<SceneInfo> scenes;
    scenes.reserve(files.size());
    for (const auto& p : files) {
        scenes.push_back(scene_info_from_header(p, read_fits_header(p)));
    }

    std::stable_sort(scenes.begin(), scenes.end(),
                     [](const SceneInfo& a, const SceneInfo& b) { return a.date < b.date; });
    return scenes;
}

std::vector<RawImage> DirectoryArchive::collect(const std::string& sensor_id,
                                                const archive::DateRange& range) {
    std::vector<RawImage> out;
    for (const auto& info : scan()) {
        if (info.sensor != sensor_id) continue;
        if (!archive::in_range(info.date, range)) continue;
        out.push_back(read_scene(info.path));
    }
    return out;
}

RawImage read_scene(const fs::path& path) {
    FitsCube cube = read_fits_cube(path);
    DirectoryArchive::SceneInfo info = scene_info_from_header(path, cube.header);

    RawImage scene;
    scene.scene_id = info.scene_id;
    scene.sensor = info.sensor;
    scene.date = info.date;

    const auto names = plane_names(cube.header, cube.planes.size());
    bool have_qa = false;
    for (size_t k = 0; k < cube.planes.size(); ++k) {
        if (names[k].empty()) continue;
        if (names[k] == kQaPlaneName) {
            const Matrix2Df& q = cube.planes[k];
            scene.qa.resize(q.rows(), q.cols());
            for (Eigen::Index i = 0; i < q.size(); ++i) {
                const float v = q.data()[i];
                // NaN or a value outside uint16 carries no usable flags; treat it
                // as fully flagged.
                const bool representable = v >= 0.0f && v <= 65535.0f;
                scene.qa.data()[i] = representable ? static_cast<uint16_t>(v)
                                                   : static_cast<uint16_t>(0xFFFF);
            }
            have_qa = true;
        } else {
            scene.bands[names[k]] = std::move(cube.planes[k]);
        }
    }

    if (!have_qa) {
        throw FitsError("scene has no pixel_qa plane: " + path.string());
    }
    return scene;
}

void write_scene(const fs::path& path, const RawImage& scene) {
    std::vector<Matrix2Df> planes;
    std::vector<std::string> names;
    for (const auto& [name, plane] : scene.bands) {
        planes.push_back(plane);
        names.push_back(name);
    }
    planes.push_back(scene.qa.cast<float>());
    names.push_back(kQaPlaneName);

    FitsHeader hdr;
    hdr.set("SENSOR", scene.sensor);
    hdr.set("DATE-OBS", core::date_to_string(scene.date));
    hdr.set("SCENEID", scene.scene_id);
    set_plane_names(hdr, names);
    write_fits_cube(path, planes, hdr);
}

} // namespace landsat_change::io

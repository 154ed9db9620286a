#include "landsat_change/io/fits_io.hpp"
#include "landsat_change/core/errors.hpp"
#include "landsat_change/core/utils.hpp"

#include <fitsio.h>
#include <algorithm>
#include <stdexcept>

namespace landsat_change::io {

std::optional<std::string> FitsHeader::get_string(const std::string& key) const {
    auto it = string_values.find(key);
    if (it != string_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<double> FitsHeader::get_double(const std::string& key) const {
    auto it = numeric_values.find(key);
    if (it != numeric_values.end()) {
        return it->second;
    }
    auto iit = int_values.find(key);
    if (iit != int_values.end()) {
        return static_cast<double>(iit->second);
    }
    return std::nullopt;
}

std::optional<int> FitsHeader::get_int(const std::string& key) const {
    auto it = int_values.find(key);
    if (it != int_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

void FitsHeader::set(const std::string& key, const std::string& value) {
    string_values[key] = value;
}

void FitsHeader::set(const std::string& key, double value) {
    numeric_values[key] = value;
}

void FitsHeader::set(const std::string& key, int value) {
    int_values[key] = value;
}

void FitsHeader::set(const std::string& key, bool value) {
    bool_values[key] = value;
}

namespace {

struct FitsFile {
    fitsfile* fptr = nullptr;
    ~FitsFile() {
        if (fptr) {
            int status = 0;
            fits_close_file(fptr, &status);
        }
    }
};

FitsHeader read_header(fitsfile* fptr) {
    FitsHeader header;
    int status = 0;

    char card[FLEN_CARD];
    int nkeys = 0;
    fits_get_hdrspace(fptr, &nkeys, nullptr, &status);

    for (int i = 1; i <= nkeys; ++i) {
        fits_read_record(fptr, i, card, &status);
        if (status) {
            status = 0;
            continue;
        }

        char keyname[FLEN_KEYWORD];
        char value[FLEN_VALUE];
        char comment[FLEN_COMMENT];
        int keylen = 0;

        fits_get_keyname(card, keyname, &keylen, &status);
        if (status) {
            status = 0;
            continue;
        }

        std::string key(keyname);
        if (key.empty() || key == "COMMENT" || key == "HISTORY" || key == "END") {
            continue;
        }

        char dtype;
        fits_get_keytype(card, &dtype, &status);
        if (status) {
            status = 0;
            continue;
        }

        fits_parse_value(card, value, comment, &status);
        if (status) {
            status = 0;
            continue;
        }

        std::string val_str(value);
        val_str.erase(0, val_str.find_first_not_of(" '"));
        val_str.erase(val_str.find_last_not_of(" '") + 1);

        switch (dtype) {
            case 'C':
                header.set(key, val_str);
                break;
            case 'L':
                header.set(key, val_str == "T" || val_str == "1");
                break;
            case 'I':
                try {
                    header.set(key, std::stoi(val_str));
                } catch (const std::exception&) {
                    header.set(key, val_str);
                }
                break;
            case 'F':
                try {
                    header.set(key, std::stod(val_str));
                } catch (const std::exception&) {
                    header.set(key, val_str);
                }
                break;
            default:
                header.set(key, val_str);
                break;
        }
    }
    return header;
}

void write_header(fitsfile* fptr, const FitsHeader& header, int& status) {
    for (const auto& [key, value] : header.string_values) {
        if (key.size() <= 8) {
            fits_update_key(fptr, TSTRING, key.c_str(),
                            const_cast<char*>(value.c_str()), nullptr, &status);
        }
    }

    for (const auto& [key, value] : header.numeric_values) {
        if (key.size() <= 8) {
            double val = value;
            fits_update_key(fptr, TDOUBLE, key.c_str(), &val, nullptr, &status);
        }
    }

    for (const auto& [key, value] : header.int_values) {
        if (key.size() <= 8) {
            int val = value;
            fits_update_key(fptr, TINT, key.c_str(), &val, nullptr, &status);
        }
    }

    for (const auto& [key, value] : header.bool_values) {
        if (key.size() <= 8) {
            int val = value ? 1 : 0;
            fits_update_key(fptr, TLOGICAL, key.c_str(), &val, nullptr, &status);
        }
    }
}

} // namespace

std::pair<Matrix2Df, FitsHeader> read_fits_float(const fs::path& path) {
    FitsCube cube = read_fits_cube(path);
    return {std::move(cube.planes.front()), std::move(cube.header)};
}

void write_fits_float(const fs::path& path, const Matrix2Df& data, const FitsHeader& header) {
    write_fits_cube(path, {data}, header);
}

FitsCube read_fits_cube(const fs::path& path) {
    FitsFile file;
    int status = 0;

    if (fits_open_file(&file.fptr, path.string().c_str(), READONLY, &status)) {
        throw FitsError("Cannot open FITS file: " + path.string());
    }

    int naxis = 0;
    long naxes[3] = {0, 0, 0};
    int bitpix = 0;

    fits_get_img_param(file.fptr, 3, &bitpix, &naxis, naxes, &status);
    if (status) {
        throw FitsError("Cannot read FITS image parameters: " + path.string());
    }
    if (naxis < 2) {
        throw FitsError("FITS file has less than 2 dimensions: " + path.string());
    }

    const long width = naxes[0];
    const long height = naxes[1];
    const long depth = (naxis >= 3) ? naxes[2] : 1;
    if (width < 1 || height < 1 || depth < 1) {
        throw FitsError("FITS file has an empty image axis: " + path.string());
    }
    const long plane_pixels = width * height;

    std::vector<float> buffer(static_cast<size_t>(plane_pixels * depth));
    long fpixel[3] = {1, 1, 1};
    // NaN in the file stays NaN (nulval = nullptr disables substitution).
    fits_read_pix(file.fptr, TFLOAT, fpixel, plane_pixels * depth, nullptr, buffer.data(),
                  nullptr, &status);
    if (status) {
        throw FitsError("Cannot read FITS pixel data: " + path.string());
    }

    FitsCube cube;
    cube.header = read_header(file.fptr);
    cube.planes.reserve(static_cast<size_t>(depth));
    for (long z = 0; z < depth; ++z) {
        Matrix2Df plane(height, width);
        const float* src = buffer.data() + z * plane_pixels;
        std::copy(src, src + plane_pixels, plane.data());
        cube.planes.push_back(std::move(plane));
    }
    return cube;
}

void write_fits_cube(const fs::path& path, const std::vector<Matrix2Df>& planes,
                     const FitsHeader& header) {
    if (planes.empty()) {
        throw FitsError("No planes to write: " + path.string());
    }
    const long rows = planes.front().rows();
    const long cols = planes.front().cols();
    for (const auto& p : planes) {
        if (p.rows() != rows || p.cols() != cols) {
            throw ValidationError("FITS cube planes differ in shape: " + path.string());
        }
    }

    FitsFile file;
    int status = 0;

    std::string filepath = "!" + path.string();
    if (fits_create_file(&file.fptr, filepath.c_str(), &status)) {
        throw FitsError("Cannot create FITS file: " + path.string());
    }

    const int naxis = planes.size() > 1 ? 3 : 2;
    long naxes[3] = {cols, rows, static_cast<long>(planes.size())};

    fits_create_img(file.fptr, FLOAT_IMG, naxis, naxes, &status);
    if (status) {
        throw FitsError("Cannot create FITS image: " + path.string());
    }

    write_header(file.fptr, header, status);
    if (status) {
        throw FitsError("Cannot write FITS header: " + path.string());
    }

    const long plane_pixels = rows * cols;
    std::vector<float> buffer(static_cast<size_t>(plane_pixels) * planes.size());
    for (size_t z = 0; z < planes.size(); ++z) {
        std::copy(planes[z].data(), planes[z].data() + plane_pixels,
                  buffer.begin() + static_cast<std::ptrdiff_t>(z * plane_pixels));
    }

    long fpixel[3] = {1, 1, 1};
    fits_write_pix(file.fptr, TFLOAT, fpixel, static_cast<LONGLONG>(buffer.size()),
                   buffer.data(), &status);
    if (status) {
        throw FitsError("Cannot write FITS pixel data: " + path.string());
    }

    int close_status = 0;
    fits_close_file(file.fptr, &close_status);
    file.fptr = nullptr;
    if (close_status) {
        throw FitsError("Cannot close FITS file: " + path.string());
    }
}

FitsHeader read_fits_header(const fs::path& path) {
    FitsFile file;
    int status = 0;

    if (fits_open_file(&file.fptr, path.string().c_str(), READONLY, &status)) {
        throw FitsError("Cannot open FITS file: " + path.string());
    }
    return read_header(file.fptr);
}

std::vector<std::string> plane_names(const FitsHeader& header, size_t n) {
    std::vector<std::string> names(n);
    for (size_t k = 0; k < n; ++k) {
        auto v = header.get_string("BANDNAM" + std::to_string(k + 1));
        if (v) names[k] = core::trim(*v);
    }
    return names;
}

void set_plane_names(FitsHeader& header, const std::vector<std::string>& names) {
    if (names.size() > static_cast<size_t>(kMaxNamedPlanes)) {
        throw ValidationError("Too many named planes: " + std::to_string(names.size()));
    }
    for (size_t k = 0; k < names.size(); ++k) {
        header.set("BANDNAM" + std::to_string(k + 1), names[k]);
    }
}

std::tuple<int, int, int> get_fits_dimensions(const fs::path& path) {
    FitsFile file;
    int status = 0;

    if (fits_open_file(&file.fptr, path.string().c_str(), READONLY, &status)) {
        throw FitsError("Cannot open FITS file: " + path.string());
    }

    int naxis = 0;
    long naxes[3] = {0, 0, 0};
    int bitpix = 0;

    fits_get_img_param(file.fptr, 3, &bitpix, &naxis, naxes, &status);
    if (status) {
        throw FitsError("Cannot read FITS dimensions: " + path.string());
    }

    const int depth = naxis >= 3 ? static_cast<int>(naxes[2]) : 1;
    return {static_cast<int>(naxes[0]), static_cast<int>(naxes[1]), depth};
}

} // namespace landsat_change::io

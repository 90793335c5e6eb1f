#include "roi_mask/io/fits_io.hpp"
#include "roi_mask/core/errors.hpp"
#include "roi_mask/core/utils.hpp"

#include <fitsio.h>
#include <cstdint>
#include <stdexcept>
#include <vector>

namespace roi_mask::io {

namespace {

struct ImageParams {
    int bitpix = 0;
    int naxis = 0;
    long naxes[3] = {0, 0, 0};
};

fitsfile* open_image(const fs::path& path, ImageParams& params) {
    fitsfile* fptr = nullptr;
    int status = 0;

    if (fits_open_file(&fptr, path.string().c_str(), READONLY, &status)) {
        throw FitsError("Cannot open FITS file: " + path.string());
    }

    fits_get_img_param(fptr, 3, &params.bitpix, &params.naxis, params.naxes, &status);
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot read FITS image parameters: " + path.string());
    }
    if (params.naxis < 2 || params.naxis > 3) {
        fits_close_file(fptr, &status);
        throw FitsError("FITS image must have 2 or 3 axes, got " +
                        std::to_string(params.naxis) + ": " + path.string());
    }
    return fptr;
}

std::vector<float> read_pixels(fitsfile* fptr, const fs::path& path, long npixels) {
    std::vector<float> buffer(static_cast<size_t>(npixels));
    int status = 0;
    long fpixel[3] = {1, 1, 1};
    fits_read_pix(fptr, TFLOAT, fpixel, npixels, nullptr, buffer.data(), nullptr, &status);
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot read FITS pixel data: " + path.string());
    }
    return buffer;
}

FitsHeader read_header(fitsfile* fptr) {
    FitsHeader header;
    int status = 0;

    int nkeys = 0;
    fits_get_hdrspace(fptr, &nkeys, nullptr, &status);
    if (status) {
        return header;
    }

    char card[FLEN_CARD];
    for (int i = 1; i <= nkeys; ++i) {
        status = 0;
        fits_read_record(fptr, i, card, &status);
        if (status) continue;

        char keyname[FLEN_KEYWORD];
        char value[FLEN_VALUE];
        char comment[FLEN_COMMENT];
        int keylen = 0;

        fits_get_keyname(card, keyname, &keylen, &status);
        if (status) continue;

        std::string key(keyname);
        if (key.empty() || key == "COMMENT" || key == "HISTORY" || key == "END") {
            continue;
        }

        fits_parse_value(card, value, comment, &status);
        if (status) continue;

        char dtype = 0;
        fits_get_keytype(value, &dtype, &status);
        if (status) continue;

        std::string val_str(value);
        val_str.erase(0, val_str.find_first_not_of(" '"));
        val_str.erase(val_str.find_last_not_of(" '") + 1);

        if (dtype == 'I') {
            try {
                header.set(key, std::stoi(val_str));
            } catch (const std::logic_error&) {
                header.set(key, val_str);
            }
        } else {
            header.set(key, val_str);
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
    for (const auto& [key, value] : header.int_values) {
        if (key.size() <= 8) {
            int val = value;
            fits_update_key(fptr, TINT, key.c_str(), &val, nullptr, &status);
        }
    }
}

fitsfile* create_image(const fs::path& path, int bitpix, long width, long height) {
    fitsfile* fptr = nullptr;
    int status = 0;

    std::string filepath = "!" + path.string();
    if (fits_create_file(&fptr, filepath.c_str(), &status)) {
        throw FitsError("Cannot create FITS file: " + path.string());
    }

    long naxes[2] = {width, height};
    fits_create_img(fptr, bitpix, 2, naxes, &status);
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot create FITS image: " + path.string());
    }
    return fptr;
}

} // namespace

std::optional<std::string> FitsHeader::get_string(const std::string& key) const {
    auto it = string_values.find(key);
    if (it != string_values.end()) {
        return it->second;
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

void FitsHeader::set(const std::string& key, int value) {
    int_values[key] = value;
}

bool is_fits_image_path(const fs::path& path) {
    std::string ext = core::to_lower(path.extension().string());
    return ext == ".fit" || ext == ".fits" || ext == ".fts";
}

std::pair<DataArray, FitsHeader> read_fits_data(const fs::path& path) {
    ImageParams params;
    fitsfile* fptr = open_image(path, params);

    const long width = params.naxes[0];
    const long height = params.naxes[1];
    const long depth = params.naxis == 3 ? params.naxes[2] : 1;
    std::vector<float> buffer = read_pixels(fptr, path, width * height * depth);
    FitsHeader header = read_header(fptr);

    int status = 0;
    fits_close_file(fptr, &status);

    if (params.naxis == 2) {
        PixelMatrix pixels(height, width);
        for (long p = 0; p < height; ++p) {
            for (long t = 0; t < width; ++t) {
                pixels(p, t) = buffer[p * width + t];
            }
        }
        return {DataArray{std::move(pixels)}, header};
    }

    FrameStack stack;
    stack.frames.reserve(static_cast<size_t>(depth));
    for (long t = 0; t < depth; ++t) {
        Matrix2Df frame(height, width);
        const float* src = buffer.data() + t * width * height;
        for (long y = 0; y < height; ++y) {
            for (long x = 0; x < width; ++x) {
                frame(y, x) = src[y * width + x];
            }
        }
        stack.frames.push_back(std::move(frame));
    }
    return {DataArray{std::move(stack)}, header};
}

MaskArray read_fits_mask(const fs::path& path) {
    ImageParams params;
    fitsfile* fptr = open_image(path, params);

    const long width = params.naxes[0];
    const long height = params.naxes[1];
    const long depth = params.naxis == 3 ? params.naxes[2] : 1;
    std::vector<float> buffer = read_pixels(fptr, path, width * height * depth);

    int status = 0;
    fits_close_file(fptr, &status);

    MaskArray mask;
    mask.rows = static_cast<int>(height);
    mask.cols = static_cast<int>(width);
    mask.planes = static_cast<int>(depth);
    mask.logical = params.bitpix == BYTE_IMG;
    for (float v : buffer) {
        if (v != 0.0f && v != 1.0f) {
            mask.logical = false;
            break;
        }
    }
    mask.values = std::move(buffer);
    return mask;
}

void write_fits_float(const fs::path& path, const Matrix2Df& data, const FitsHeader& header) {
    fitsfile* fptr = create_image(path, FLOAT_IMG, data.cols(), data.rows());
    int status = 0;
    write_header(fptr, header, status);

    std::vector<float> buffer(static_cast<size_t>(data.size()));
    for (long y = 0; y < data.rows(); ++y) {
        for (long x = 0; x < data.cols(); ++x) {
            buffer[y * data.cols() + x] = data(y, x);
        }
    }

    long fpixel[2] = {1, 1};
    fits_write_pix(fptr, TFLOAT, fpixel, data.size(), buffer.data(), &status);
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot write FITS pixel data: " + path.string());
    }

    fits_close_file(fptr, &status);
}

void write_fits_mask(const fs::path& path, const MaskMatrix& mask, const FitsHeader& header) {
    fitsfile* fptr = create_image(path, BYTE_IMG, mask.cols(), mask.rows());
    int status = 0;
    write_header(fptr, header, status);

    std::vector<unsigned char> buffer(static_cast<size_t>(mask.size()));
    for (Eigen::Index i = 0; i < mask.size(); ++i) {
        buffer[static_cast<size_t>(i)] = mask.data()[i] ? 1 : 0;
    }

    long fpixel[2] = {1, 1};
    fits_write_pix(fptr, TBYTE, fpixel, mask.size(), buffer.data(), &status);
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot write FITS mask data: " + path.string());
    }

    fits_close_file(fptr, &status);
}

} // namespace roi_mask::io

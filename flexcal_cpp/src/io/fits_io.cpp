#include "flexcal/io/fits_io.hpp"
#include "flexcal/core/errors.hpp"
#include "flexcal/core/utils.hpp"

#include <cstdlib>
#include <fitsio.h>
#include <memory>
#include <set>

namespace flexcal::io {

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
    auto it_int = int_values.find(key);
    if (it_int != int_values.end()) {
        return static_cast<double>(it_int->second);
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

std::optional<bool> FitsHeader::get_bool(const std::string& key) const {
    auto it = bool_values.find(key);
    if (it != bool_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

void FitsHeader::set(const std::string& key, const std::string& value,
                     const std::string& comment) {
    string_values[key] = value;
    if (!comment.empty()) comments[key] = comment;
}

void FitsHeader::set(const std::string& key, const char* value, const std::string& comment) {
    set(key, std::string(value), comment);
}

void FitsHeader::set(const std::string& key, double value, const std::string& comment) {
    numeric_values[key] = value;
    if (!comment.empty()) comments[key] = comment;
}

void FitsHeader::set(const std::string& key, int value, const std::string& comment) {
    int_values[key] = value;
    if (!comment.empty()) comments[key] = comment;
}

void FitsHeader::set(const std::string& key, bool value, const std::string& comment) {
    bool_values[key] = value;
    if (!comment.empty()) comments[key] = comment;
}

bool is_fits_path(const fs::path& path) {
    std::string ext = core::to_lower(path.extension().string());
    return ext == ".fit" || ext == ".fits" || ext == ".fts";
}

namespace {

std::string fits_status_text(int status) {
    char text[FLEN_STATUS];
    fits_get_errstatus(status, text);
    return std::string(text);
}

// Closes the file when leaving scope
struct FitsCloser {
    void operator()(fitsfile* f) const {
        int status = 0;
        fits_close_file(f, &status);
    }
};
using FitsPtr = std::unique_ptr<fitsfile, FitsCloser>;

FitsPtr open_fits(const fs::path& path, int mode) {
    fitsfile* fptr = nullptr;
    int status = 0;
    if (fits_open_file(&fptr, path.string().c_str(), mode, &status)) {
        throw FitsError("Cannot open FITS file: " + path.string() + " (" +
                        fits_status_text(status) + ")");
    }
    return FitsPtr(fptr);
}

void move_to_hdu(fitsfile* fptr, int hdu, const fs::path& path) {
    int status = 0;
    int hdutype = 0;
    if (fits_movabs_hdu(fptr, hdu + 1, &hdutype, &status)) {
        throw FitsError("Cannot move to HDU " + std::to_string(hdu) + " of " + path.string());
    }
}

FitsHeader read_current_header(fitsfile* fptr) {
    FitsHeader header;
    int status = 0;
    int nkeys = 0;
    fits_get_hdrspace(fptr, &nkeys, nullptr, &status);

    char card[FLEN_CARD];
    for (int i = 1; i <= nkeys; ++i) {
        status = 0;
        if (fits_read_record(fptr, i, card, &status)) continue;

        char keyname[FLEN_KEYWORD];
        char value[FLEN_VALUE];
        char comment[FLEN_COMMENT];
        int keylen = 0;
        if (fits_get_keyname(card, keyname, &keylen, &status)) continue;

        std::string key(keyname);
        if (key.empty() || key == "COMMENT" || key == "HISTORY" || key == "END") {
            continue;
        }
        if (fits_parse_value(card, value, comment, &status)) continue;

        char dtype = 0;
        if (fits_get_keytype(value, &dtype, &status)) {
            status = 0;
            dtype = 'C';
        }

        std::string val_str(value);
        val_str.erase(0, val_str.find_first_not_of(" '"));
        val_str.erase(val_str.find_last_not_of(" '") + 1);

        char* end = nullptr;
        switch (dtype) {
            case 'L':
                header.set(key, val_str == "T", comment);
                break;
            case 'I': {
                long v = std::strtol(val_str.c_str(), &end, 10);
                if (end != val_str.c_str() && *end == '\0') {
                    header.set(key, static_cast<int>(v), comment);
                } else {
                    header.set(key, val_str, comment);
                }
                break;
            }
            case 'F': {
                double v = std::strtod(val_str.c_str(), &end);
                if (end != val_str.c_str() && *end == '\0') {
                    header.set(key, v, comment);
                } else {
                    header.set(key, val_str, comment);
                }
                break;
            }
            default:
                header.set(key, val_str, comment);
                break;
        }
    }
    return header;
}

Matrix2Dd read_current_image(fitsfile* fptr, const std::string& where) {
    int status = 0;
    int naxis = 0;
    int bitpix = 0;
    long naxes[2] = {0, 0};
    fits_get_img_param(fptr, 2, &bitpix, &naxis, naxes, &status);
    if (status) {
        throw FitsError("Cannot read FITS image parameters: " + where);
    }
    if (naxis < 1 || naxis > 2) {
        throw FitsError("Expected a 1-D or 2-D image in " + where + ", found naxis=" +
                        std::to_string(naxis));
    }

    const long width = naxes[0];
    const long height = naxis == 2 ? naxes[1] : 1;
    Matrix2Dd data(height, width);
    long fpixel[2] = {1, 1};
    // Row-major storage matches the FITS pixel order
    fits_read_pix(fptr, TDOUBLE, fpixel, width * height, nullptr, data.data(), nullptr, &status);
    if (status) {
        throw FitsError("Cannot read FITS pixel data: " + where);
    }
    return data;
}

// Cards cfitsio maintains itself
bool is_structural_key(const std::string& key) {
    static const std::set<std::string> reserved{"SIMPLE", "XTENSION", "BITPIX", "NAXIS",
                                                "NAXIS1", "NAXIS2", "EXTEND", "PCOUNT",
                                                "GCOUNT", "EXTNAME", "BSCALE", "BZERO"};
    return reserved.count(key) > 0;
}

void write_header_cards(fitsfile* fptr, const FitsHeader& header, const fs::path& path) {
    int status = 0;
    auto comment_of = [&header](const std::string& key) -> const char* {
        auto it = header.comments.find(key);
        return it == header.comments.end() ? nullptr : it->second.c_str();
    };

    for (const auto& [key, value] : header.string_values) {
        if (key.size() <= 8 && !is_structural_key(key)) {
            fits_update_key(fptr, TSTRING, key.c_str(), const_cast<char*>(value.c_str()),
                            comment_of(key), &status);
        }
    }
    for (const auto& [key, value] : header.numeric_values) {
        if (key.size() <= 8 && !is_structural_key(key)) {
            double val = value;
            fits_update_key(fptr, TDOUBLE, key.c_str(), &val, comment_of(key), &status);
        }
    }
    for (const auto& [key, value] : header.int_values) {
        if (key.size() <= 8 && !is_structural_key(key)) {
            int val = value;
            fits_update_key(fptr, TINT, key.c_str(), &val, comment_of(key), &status);
        }
    }
    for (const auto& [key, value] : header.bool_values) {
        if (key.size() <= 8 && !is_structural_key(key)) {
            int val = value ? 1 : 0;
            fits_update_key(fptr, TLOGICAL, key.c_str(), &val, comment_of(key), &status);
        }
    }
    if (status) {
        throw FitsError("Cannot write FITS header of " + path.string() + " (" +
                        fits_status_text(status) + ")");
    }
}

void write_image_hdu(fitsfile* fptr, const Matrix2Dd& data, const fs::path& path) {
    int status = 0;
    long naxes[2] = {static_cast<long>(data.cols()), static_cast<long>(data.rows())};
    fits_create_img(fptr, DOUBLE_IMG, 2, naxes, &status);
    if (status) {
        throw FitsError("Cannot create FITS image: " + path.string());
    }
    if (data.size() == 0) return;

    long fpixel[2] = {1, 1};
    fits_write_pix(fptr, TDOUBLE, fpixel, static_cast<LONGLONG>(data.size()),
                   const_cast<double*>(data.data()), &status);
    if (status) {
        throw FitsError("Cannot write FITS pixel data: " + path.string());
    }
}

} // namespace

FitsHeader read_fits_header(const fs::path& path, int hdu) {
    FitsPtr fptr = open_fits(path, READONLY);
    move_to_hdu(fptr.get(), hdu, path);
    return read_current_header(fptr.get());
}

Matrix2Dd read_fits_image(const fs::path& path, int hdu) {
    FitsPtr fptr = open_fits(path, READONLY);
    move_to_hdu(fptr.get(), hdu, path);
    return read_current_image(fptr.get(), path.string() + "[" + std::to_string(hdu) + "]");
}

Matrix2Dd read_fits_image(const fs::path& path, const std::string& extname) {
    FitsPtr fptr = open_fits(path, READONLY);
    int status = 0;
    if (fits_movnam_hdu(fptr.get(), IMAGE_HDU, const_cast<char*>(extname.c_str()), 0, &status)) {
        throw FitsError("No extension " + extname + " in " + path.string());
    }
    return read_current_image(fptr.get(), path.string() + "[" + extname + "]");
}

VectorXd read_fits_vector(const fs::path& path, int hdu) {
    const Matrix2Dd img = read_fits_image(path, hdu);
    if (img.rows() != 1 && img.cols() != 1) {
        throw FitsError("HDU " + std::to_string(hdu) + " of " + path.string() +
                        " is not one-dimensional");
    }
    return Eigen::Map<const VectorXd>(img.data(), img.size());
}

std::vector<FitsImage> read_fits_extensions(const fs::path& path) {
    FitsPtr fptr = open_fits(path, READONLY);
    int status = 0;
    int nhdus = 0;
    if (fits_get_num_hdus(fptr.get(), &nhdus, &status)) {
        throw FitsError("Cannot count HDUs of " + path.string());
    }

    std::vector<FitsImage> images;
    for (int hdu = 1; hdu < nhdus; ++hdu) {
        move_to_hdu(fptr.get(), hdu, path);
        int hdutype = 0;
        fits_get_hdu_type(fptr.get(), &hdutype, &status);
        if (status || hdutype != IMAGE_HDU) {
            status = 0;
            continue;
        }
        FitsImage image;
        image.header = read_current_header(fptr.get());
        image.extname = image.header.get_string("EXTNAME").value_or("");
        image.data = read_current_image(fptr.get(), path.string() + "[" + std::to_string(hdu) + "]");
        images.push_back(std::move(image));
    }
    return images;
}

void write_fits(const fs::path& path,
                const FitsHeader& header,
                const std::optional<Matrix2Dd>& primary,
                const std::vector<FitsImage>& extensions) {
    fitsfile* raw = nullptr;
    int status = 0;
    std::string filepath = "!" + path.string();
    if (fits_create_file(&raw, filepath.c_str(), &status)) {
        throw FitsError("Cannot create FITS file: " + path.string());
    }
    FitsPtr fptr(raw);

    if (primary) {
        write_image_hdu(fptr.get(), *primary, path);
    } else {
        fits_create_img(fptr.get(), BYTE_IMG, 0, nullptr, &status);
        if (status) {
            throw FitsError("Cannot create primary HDU: " + path.string());
        }
    }
    write_header_cards(fptr.get(), header, path);

    for (const auto& ext : extensions) {
        write_image_hdu(fptr.get(), ext.data, path);
        if (!ext.extname.empty()) {
            fits_update_key(fptr.get(), TSTRING, "EXTNAME", const_cast<char*>(ext.extname.c_str()),
                            nullptr, &status);
            if (status) {
                throw FitsError("Cannot name extension " + ext.extname + " in " + path.string());
            }
        }
        write_header_cards(fptr.get(), ext.header, path);
    }
}

std::pair<VectorXd, VectorXd> read_sky_archive(const fs::path& path) {
    if (!fs::exists(path)) {
        throw IOError("Sky archive not found: " + path.string());
    }
    VectorXd wave = read_fits_vector(path, 0);
    VectorXd flux = read_fits_vector(path, 1);
    if (wave.size() != flux.size()) {
        throw FitsError("Sky archive " + path.string() + ": wavelength and flux differ in length");
    }
    return {std::move(wave), std::move(flux)};
}

void write_sky_archive(const fs::path& path, const VectorXd& wave, const VectorXd& flux) {
    Matrix2Dd primary = Eigen::Map<const Matrix2Dd>(wave.data(), 1, wave.size());
    Matrix2Dd ext = Eigen::Map<const Matrix2Dd>(flux.data(), 1, flux.size());
    write_fits(path, FitsHeader(), primary, {FitsImage{"FLUX", ext}});
}

} // namespace flexcal::io

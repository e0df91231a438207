#pragma once

#include "flexcal/core/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace flexcal::io {

struct FitsHeader {
    std::map<std::string, std::string> string_values;
    std::map<std::string, double> numeric_values;
    std::map<std::string, int> int_values;
    std::map<std::string, bool> bool_values;
    std::map<std::string, std::string> comments;

    std::optional<std::string> get_string(const std::string& key) const;
    std::optional<double> get_double(const std::string& key) const;
    std::optional<int> get_int(const std::string& key) const;
    std::optional<bool> get_bool(const std::string& key) const;

    void set(const std::string& key, const std::string& value, const std::string& comment = "");
    void set(const std::string& key, const char* value, const std::string& comment = "");
    void set(const std::string& key, double value, const std::string& comment = "");
    void set(const std::string& key, int value, const std::string& comment = "");
    void set(const std::string& key, bool value, const std::string& comment = "");
};

// An image HDU; 1-D images read as a single row
struct FitsImage {
    std::string extname;
    Matrix2Dd data;
    FitsHeader header;   // extra cards of the extension
};

bool is_fits_path(const fs::path& path);

// hdu is 0-based (0 = primary)
FitsHeader read_fits_header(const fs::path& path, int hdu = 0);
Matrix2Dd read_fits_image(const fs::path& path, int hdu);
Matrix2Dd read_fits_image(const fs::path& path, const std::string& extname);
VectorXd read_fits_vector(const fs::path& path, int hdu);

// Every image extension after the primary HDU, in file order
std::vector<FitsImage> read_fits_extensions(const fs::path& path);

/**
 * Write a primary HDU carrying header (and primary data when given) followed
 * by one named image extension per entry of extensions. Existing files are
 * replaced.
 */
void write_fits(const fs::path& path,
                const FitsHeader& header,
                const std::optional<Matrix2Dd>& primary,
                const std::vector<FitsImage>& extensions);

/**
 * Archived sky spectrum: wavelengths in the primary HDU, flux in the first
 * extension.
 */
std::pair<VectorXd, VectorXd> read_sky_archive(const fs::path& path);
void write_sky_archive(const fs::path& path, const VectorXd& wave, const VectorXd& flux);

} // namespace flexcal::io

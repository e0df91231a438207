#include "flexcal/io/master_frame.hpp"
#include "flexcal/core/errors.hpp"
#include "flexcal/core/logging.hpp"
#include "flexcal/core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <utility>

namespace flexcal::io {

bool MasterLoad::loaded() const {
    return header.has_value() ||
           std::any_of(data.begin(), data.end(), [](const auto& d) { return d.has_value(); });
}

MasterFrame::MasterFrame(std::string master_type,
                         fs::path master_dir,
                         std::string master_key,
                         std::string file_format,
                         bool reuse_masters,
                         core::Logger* logger)
    : master_type_(std::move(master_type)),
      master_dir_(master_dir.empty() ? fs::current_path() : std::move(master_dir)),
      master_key_(std::move(master_key)),
      file_format_(std::move(file_format)),
      reuse_masters_(reuse_masters),
      logger_(logger) {
    if (file_format_ != "fits") {
        throw ValidationError("Unsupported master file format: " + file_format_);
    }
}

core::Logger& MasterFrame::log() const {
    return logger_ ? *logger_ : core::default_logger();
}

std::string MasterFrame::file_name() const {
    return "Master" + master_type_ + "_" + master_key_ + "." + file_format_;
}

fs::path MasterFrame::file_path() const {
    return master_dir_ / file_name();
}

void MasterFrame::save(const std::vector<Matrix2Dd>& data,
                       const std::vector<std::string>& extnames,
                       const std::optional<fs::path>& outfile,
                       bool overwrite,
                       const std::vector<std::string>& raw_files,
                       const std::vector<std::string>& steps) const {
    if (data.size() != extnames.size()) {
        throw ValidationError("Number of arrays (" + std::to_string(data.size()) +
                              ") does not match number of extension names (" +
                              std::to_string(extnames.size()) + ")");
    }

    const fs::path path = outfile ? *outfile : file_path();
    if (fs::exists(path) && !overwrite) {
        log().warn("Master file exists: " + path.string() + " (use overwrite to replace it)");
        return;
    }
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }

    FitsHeader header;
    header.set("FRAMETYP", master_type_, "Calibration frame type");
    header.set("STEPS", core::join(steps, ","), "Completed processing steps");
    const std::size_t ndig = core::decimal_width(raw_files.size());
    for (std::size_t i = 0; i < raw_files.size(); ++i) {
        header.set("F" + core::zero_pad(i + 1, ndig), raw_files[i]);
    }

    std::vector<FitsImage> extensions;
    extensions.reserve(data.size());
    for (std::size_t i = 0; i < data.size(); ++i) {
        extensions.push_back(FitsImage{extnames[i], data[i]});
    }

    write_fits(path, header, std::nullopt, extensions);
    log().info("Master frame written to " + path.string());
}

MasterLoad MasterFrame::load(const std::vector<std::string>& extnames,
                             const std::optional<fs::path>& ifile,
                             bool return_header) const {
    MasterLoad result;
    result.data.resize(extnames.size());
    if (!reuse_masters_) {
        return result;
    }

    const fs::path path = ifile ? *ifile : file_path();
    if (!fs::exists(path)) {
        log().warn("No master frame found: " + path.string());
        return result;
    }

    log().info("Loading master frame: " + path.string());
    for (std::size_t i = 0; i < extnames.size(); ++i) {
        result.data[i] = read_fits_image(path, extnames[i]);
    }
    if (return_header) {
        result.header = read_fits_header(path, 0);
    }
    return result;
}

std::vector<std::string> MasterFrame::parse_hdr_raw_files(const FitsHeader& header) {
    std::vector<std::pair<long, std::string>> indexed;
    for (const auto& [key, value] : header.string_values) {
        if (key.size() < 2 || key[0] != 'F') continue;
        const std::string digits = key.substr(1);
        if (!std::all_of(digits.begin(), digits.end(),
                         [](unsigned char c) { return std::isdigit(c); })) {
            continue;
        }
        indexed.emplace_back(std::strtol(digits.c_str(), nullptr, 10), value);
    }
    std::sort(indexed.begin(), indexed.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<std::string> files;
    files.reserve(indexed.size());
    for (auto& entry : indexed) {
        files.push_back(std::move(entry.second));
    }
    return files;
}

} // namespace flexcal::io

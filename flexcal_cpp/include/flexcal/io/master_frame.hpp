#pragma once

#include "flexcal/core/types.hpp"
#include "flexcal/io/fits_io.hpp"

#include <optional>
#include <string>
#include <vector>

namespace flexcal::core {
class Logger;
}

namespace flexcal::io {

// Result of MasterFrame::load; every slot empty means nothing was loaded
struct MasterLoad {
    std::vector<std::optional<Matrix2Dd>> data;   // one slot per requested extension
    std::optional<FitsHeader> header;             // present iff requested and loaded

    bool loaded() const;
};

/**
 * Naming, saving and reloading of processed calibration masters.
 *
 * A master is a FITS file Master<type>_<key>.<format> whose primary header
 * records the frame type, the processing steps and the raw files used, and
 * whose extensions hold one named image each.
 */
class MasterFrame {
public:
    MasterFrame(std::string master_type,
                fs::path master_dir = {},
                std::string master_key = "master",
                std::string file_format = "fits",
                bool reuse_masters = false,
                core::Logger* logger = nullptr);

    const std::string& master_type() const { return master_type_; }
    const fs::path& master_dir() const { return master_dir_; }
    const std::string& master_key() const { return master_key_; }
    bool reuse_masters() const { return reuse_masters_; }

    std::string file_name() const;
    fs::path file_path() const;

    /**
     * Write arrays as extensions named by extnames. An existing file is left
     * alone (with a warning) unless overwrite is set.
     */
    void save(const std::vector<Matrix2Dd>& data,
              const std::vector<std::string>& extnames,
              const std::optional<fs::path>& outfile = std::nullopt,
              bool overwrite = true,
              const std::vector<std::string>& raw_files = {},
              const std::vector<std::string>& steps = {}) const;

    MasterLoad load(const std::vector<std::string>& extnames,
                    const std::optional<fs::path>& ifile = std::nullopt,
                    bool return_header = false) const;

    // Raw-file names from the F<i> cards, in index order
    static std::vector<std::string> parse_hdr_raw_files(const FitsHeader& header);

private:
    core::Logger& log() const;

    std::string master_type_;
    fs::path master_dir_;
    std::string master_key_;
    std::string file_format_;
    bool reuse_masters_;
    core::Logger* logger_;
};

} // namespace flexcal::io

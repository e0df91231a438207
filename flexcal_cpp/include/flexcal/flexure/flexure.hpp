#pragma once

#include "flexcal/config/parameter_set.hpp"
#include "flexcal/core/events.hpp"
#include "flexcal/core/logging.hpp"
#include "flexcal/core/types.hpp"
#include "flexcal/spectrum/spectrum.hpp"

#include <map>
#include <string>
#include <vector>

namespace flexcal::flexure {

inline constexpr int MIN_OVERLAP_PIXELS = 50;
inline constexpr int N_BRIGHTEST_LINES = 5;
inline constexpr int SUBPIX_HALF_WIDTH = 3;

// One extraction of a spectral object
struct Extraction {
    VectorXd wave;
    VectorXd sky;

    bool has_wave() const { return wave.size() > 0; }
};

// Extracted object; extractions are keyed by method ("boxcar", "optimal")
struct SpecObj {
    std::string name;
    std::map<std::string, Extraction> extractions;

    const Extraction* find(const std::string& method) const;
};

enum class FlexureStatus {
    Success,
    InsufficientOverlap,
    UnsupportedExtractionMethod,
    InvalidExtraction
};

std::string flexure_status_to_string(FlexureStatus status);

// Result of the cross-correlation between object and archive sky
struct ShiftEstimate {
    VectorXd polyfit;            // [c, b, a]
    double shift = 0.0;          // pixels
    VectorXd subpix;             // lag grid of the peak fit
    VectorXd corr;               // correlation sampled on subpix
    int corr_cen = 0;
    double smooth_sig_pix = 0.0;
    double arx_resolution = 0.0; // median R of the brightest archive lines
    double obj_resolution = 0.0;
    spectrum::Spectrum1D arx_spec;  // smoothed, rebinned archive
    spectrum::Spectrum1D obj_spec;  // rebinned object sky
};

struct FlexureRecord {
    int index = 0;
    std::string object;
    FlexureStatus status = FlexureStatus::Success;
    std::string message;

    VectorXd polyfit;
    double shift = 0.0;
    VectorXd subpix;
    VectorXd corr;
    int corr_cen = 0;
    double smooth_sig_pix = 0.0;
    spectrum::Spectrum1D arx_spec;
    spectrum::Spectrum1D sky_spec;

    bool ok() const { return status == FlexureStatus::Success; }
    core::json to_json() const;
};

struct FlexureFailure {
    int index = 0;
    std::string object;
    std::string reason;
};

struct FlexureDetectorResult {
    std::string spec_file;
    std::vector<FlexureRecord> records;   // one per input object, in order
    std::vector<FlexureFailure> failures;

    int n_success() const;
};

/**
 * Archive file for a run: the explicit "spectrum" setting, else the
 * spectrograph default. Returns a bare file name.
 */
std::string archive_file_name(const config::ParameterSet& flexure_par,
                              const std::string& spectrograph);

// Archive path under "spec_dir"; throws ConfigurationError if it does not exist
fs::path resolve_archive_path(const config::ParameterSet& flexure_par,
                              const std::string& spectrograph);

spectrum::Spectrum1D load_sky_archive(const fs::path& path);

/**
 * Sub-pixel shift of obj_sky relative to arx_sky. The archive is smoothed
 * to the object resolution when it is sharper, both are rebinned onto the
 * object wavelengths in the overlap, and the correlation peak within
 * +/- max_shift is refined with a parabola.
 */
ShiftEstimate estimate_shift(const spectrum::Spectrum1D& arx_sky,
                             const spectrum::Spectrum1D& obj_sky,
                             int max_shift,
                             core::Logger& logger);

// Wavelengths resampled at fractional pixel i + shift, extrapolating at the ends
VectorXd shift_wavelengths(const VectorXd& wave, double shift);

class FlexureCorrector {
public:
    FlexureCorrector(const config::ParameterSet& flexure_par,
                     core::Logger& logger,
                     core::EventEmitter* events = nullptr);

    const std::string& method() const { return method_; }
    int max_shift() const { return max_shift_; }

    /**
     * Estimate and apply the flexure shift to every extraction of obj that
     * has wavelengths. Throws UnsupportedExtractionMethod,
     * InvalidExtraction or InsufficientOverlap; obj is left untouched in that
     * case.
     */
    FlexureRecord correct_object(SpecObj& obj, const spectrum::Spectrum1D& archive) const;

    /**
     * Correct all objects of one detector. Per-object flexure failures are
     * logged and recorded; the remaining objects are still processed.
     */
    FlexureDetectorResult correct_detector(std::vector<SpecObj>& objects,
                                           const spectrum::Spectrum1D& archive,
                                           const std::string& spec_file,
                                           int det = 1) const;

private:
    std::string method_;
    int max_shift_;
    int workers_;
    core::Logger& logger_;
    core::EventEmitter* events_;
};

} // namespace flexcal::flexure

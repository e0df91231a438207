#include "flexcal/flexure/flexure.hpp"
#include "flexcal/config/pars.hpp"
#include "flexcal/core/errors.hpp"
#include "flexcal/core/utils.hpp"
#include "flexcal/spectrum/correlation.hpp"
#include "flexcal/spectrum/line_detection.hpp"
#include "flexcal/spectrum/polyfit.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <exception>
#include <limits>
#include <mutex>
#include <sstream>
#include <thread>

namespace flexcal::flexure {

const Extraction* SpecObj::find(const std::string& method) const {
    auto it = extractions.find(method);
    return it == extractions.end() ? nullptr : &it->second;
}

std::string flexure_status_to_string(FlexureStatus status) {
    switch (status) {
        case FlexureStatus::Success: return "ok";
        case FlexureStatus::InsufficientOverlap: return "insufficient_overlap";
        case FlexureStatus::UnsupportedExtractionMethod: return "unsupported_method";
        case FlexureStatus::InvalidExtraction: return "invalid_extraction";
    }
    return "unknown";
}

namespace {

std::vector<double> to_std(const VectorXd& v) {
    return std::vector<double>(v.data(), v.data() + v.size());
}

std::string fmt(double v) {
    std::ostringstream oss;
    oss << v;
    return oss.str();
}

} // namespace

core::json FlexureRecord::to_json() const {
    core::json j;
    j["object"] = object;
    j["status"] = flexure_status_to_string(status);
    if (!ok()) {
        j["message"] = message;
        return j;
    }
    j["shift"] = shift;
    j["polyfit"] = to_std(polyfit);
    j["subpix"] = to_std(subpix);
    j["corr"] = to_std(corr);
    j["corr_cen"] = corr_cen;
    j["smooth_sig_pix"] = smooth_sig_pix;
    j["npix_overlap"] = sky_spec.npix();
    return j;
}

int FlexureDetectorResult::n_success() const {
    return static_cast<int>(std::count_if(records.begin(), records.end(),
                                          [](const FlexureRecord& r) { return r.ok(); }));
}

VectorXd shift_wavelengths(const VectorXd& wave, double shift) {
    const Eigen::Index npix = wave.size();
    if (npix < 2) {
        throw ValidationError("Cannot shift a wavelength array with fewer than two pixels");
    }
    // Normalised pixel coordinate; a shift of one pixel is 1/(npix-1)
    const VectorXd x = VectorXd::LinSpaced(npix, 0.0, 1.0);
    const VectorXd xi = (x.array() + shift / static_cast<double>(npix - 1)).matrix();
    return spectrum::interp_extrapolate(x, wave, xi);
}

namespace {

struct LineStats {
    std::vector<double> sig;    // line sigma, Angstrom
    std::vector<double> res;    // lambda / FWHM
    std::vector<double> disp;   // dispersion at the line
};

LineStats line_stats(const spectrum::Spectrum1D& spec, const VectorXd& disp) {
    LineStats stats;
    const spectrum::DetectedLines lines = spectrum::detect_lines(spec.flux);
    const int npix = spec.npix();
    for (int k : lines.brightest(N_BRIGHTEST_LINES)) {
        int idx = static_cast<int>(lines.cent[k] + 0.5);
        idx = std::clamp(idx, 0, npix - 1);
        const double wid = lines.wid[k];
        stats.res.push_back(spec.wave[idx] / (disp[idx] * FWHM_PER_SIGMA * wid));
        stats.sig.push_back(disp[idx] * wid);
        stats.disp.push_back(disp[idx]);
    }
    return stats;
}

} // namespace

ShiftEstimate estimate_shift(const spectrum::Spectrum1D& arx_sky,
                             const spectrum::Spectrum1D& obj_sky,
                             int max_shift,
                             core::Logger& logger) {
    ShiftEstimate est;

    // Resolution of the brightest lines in each spectrum
    const VectorXd arx_disp = spectrum::dispersion(arx_sky.wave);
    const VectorXd obj_disp = spectrum::dispersion(obj_sky.wave);
    const LineStats arx = line_stats(arx_sky, arx_disp);
    const LineStats obj = line_stats(obj_sky, obj_disp);

    est.arx_resolution = core::compute_median(arx.res);
    est.obj_resolution = core::compute_median(obj.res);
    logger.info("Resolution of Archive=" + fmt(est.arx_resolution) +
                " and Observation=" + fmt(est.obj_resolution));

    spectrum::Spectrum1D arx_work = arx_sky;
    if (arx.sig.empty() || obj.sig.empty()) {
        logger.warn("No emission lines detected in " +
                    std::string(arx.sig.empty() ? "archive" : "object") +
                    " sky spectrum; not smoothing the archive");
    } else {
        // Square of the median line sigma
        const double arx_med_sig2 = std::pow(core::compute_median(arx.sig), 2);
        const double obj_med_sig2 = std::pow(core::compute_median(obj.sig), 2);
        if (obj_med_sig2 >= arx_med_sig2) {
            const double smooth_sig = std::sqrt(obj_med_sig2 - arx_med_sig2);  // Angstrom
            est.smooth_sig_pix = smooth_sig / core::compute_median(arx.disp);
        } else {
            logger.warn("Prefer archival sky spectrum to have higher resolution");
            est.smooth_sig_pix = 0.0;
        }
    }
    if (est.smooth_sig_pix > 0.0) {
        logger.work("Smoothing archive by " + fmt(est.smooth_sig_pix) + " pixels");
        arx_work = arx_work.gauss_smooth(est.smooth_sig_pix * FWHM_PER_SIGMA);
    }

    // Overlap on the object's native grid
    const double min_wave = std::max(arx_sky.wave_min(), obj_sky.wave_min());
    const double max_wave = std::min(arx_sky.wave_max(), obj_sky.wave_max());
    std::vector<double> keep;
    for (Eigen::Index i = 0; i < obj_sky.wave.size(); ++i) {
        const double w = obj_sky.wave[i];
        if (w >= min_wave && w <= max_wave) keep.push_back(w);
    }
    if (static_cast<int>(keep.size()) < MIN_OVERLAP_PIXELS) {
        throw InsufficientOverlap(static_cast<int>(keep.size()), MIN_OVERLAP_PIXELS);
    }
    const VectorXd keep_wave =
        Eigen::Map<const VectorXd>(keep.data(), static_cast<Eigen::Index>(keep.size()));

    est.arx_spec = arx_work.rebin(keep_wave);
    est.obj_spec = obj_sky.rebin(keep_wave);

    const VectorXd corr = spectrum::correlate_same(est.arx_spec.flux, est.obj_spec.flux);
    const int n = static_cast<int>(corr.size());
    const int lag0 = n / 2;
    est.corr_cen = lag0;

    // Search window around zero lag, kept clear of the ends for the peak fit
    const int lo = std::max(SUBPIX_HALF_WIDTH, lag0 - max_shift);
    const int hi = std::min(n - SUBPIX_HALF_WIDTH, lag0 + max_shift);
    if (hi <= lo) {
        throw FlexureError("Empty correlation search window (max_shift=" +
                           std::to_string(max_shift) + ", npix=" + std::to_string(n) + ")");
    }
    Eigen::Index rel = 0;
    corr.segment(lo, hi - lo).maxCoeff(&rel);
    const int max_corr = lo + static_cast<int>(rel);

    const int ngrid = 2 * SUBPIX_HALF_WIDTH + 1;
    est.subpix = VectorXd::LinSpaced(ngrid, static_cast<double>(max_corr - SUBPIX_HALF_WIDTH),
                                     static_cast<double>(max_corr + SUBPIX_HALF_WIDTH));
    est.corr.resize(ngrid);
    for (int i = 0; i < ngrid; ++i) {
        est.corr[i] = corr[max_corr - SUBPIX_HALF_WIDTH + i];
    }

    est.polyfit = spectrum::fit_polynomial(est.subpix, est.corr, 2);
    double max_fit = -0.5 * est.polyfit[1] / est.polyfit[2];
    if (!(est.polyfit[2] < 0.0) || !std::isfinite(max_fit)) {
        logger.warn("Correlation peak fit is not concave; using the integer peak");
        max_fit = max_corr;
    }
    max_fit = std::clamp(max_fit, static_cast<double>(lo), static_cast<double>(hi - 1));

    est.shift = max_fit - lag0;
    logger.info("Flexure correction of " + fmt(est.shift) + " pixels");
    return est;
}

FlexureCorrector::FlexureCorrector(const config::ParameterSet& flexure_par,
                                   core::Logger& logger,
                                   core::EventEmitter* events)
    : method_(flexure_par.get_string("method")),
      max_shift_(flexure_par.get_int("max_shift")),
      workers_(flexure_par.get("parallel_workers") ? flexure_par.get_int("parallel_workers") : 1),
      logger_(logger),
      events_(events) {
    if (max_shift_ <= 0) {
        throw ValidationError("flexure.max_shift must be > 0");
    }
    if (workers_ < 1) {
        throw ValidationError("flexure.parallel_workers must be >= 1");
    }
}

FlexureRecord FlexureCorrector::correct_object(SpecObj& obj,
                                               const spectrum::Spectrum1D& archive) const {
    const auto& supported = config::supported_flexure_methods();
    if (std::find(supported.begin(), supported.end(), method_) == supported.end()) {
        throw UnsupportedExtractionMethod(method_);
    }
    const Extraction* ext = obj.find(method_);
    if (ext == nullptr || !ext->has_wave()) {
        logger_.warn("Object " + obj.name + " has no " + method_ + " extraction");
        throw UnsupportedExtractionMethod(method_);
    }

    if (ext->wave.size() != ext->sky.size()) {
        throw InvalidExtraction(method_ + " extraction of " + obj.name + " has " +
                                std::to_string(ext->wave.size()) + " wavelengths but " +
                                std::to_string(ext->sky.size()) + " sky samples");
    }
    // The overlap can never exceed the object's own pixel count
    if (ext->wave.size() < MIN_OVERLAP_PIXELS) {
        throw InsufficientOverlap(static_cast<int>(ext->wave.size()), MIN_OVERLAP_PIXELS);
    }

    const VectorXd sky_wave = ext->wave;
    const spectrum::Spectrum1D obj_sky(ext->wave, ext->sky);

    ShiftEstimate est = estimate_shift(archive, obj_sky, max_shift_, logger_);

    for (const char* attr : {"boxcar", "optimal"}) {
        auto it = obj.extractions.find(attr);
        if (it == obj.extractions.end() || !it->second.has_wave()) continue;
        logger_.info("Applying flexure correction to " + std::string(attr) +
                     " extraction for object " + obj.name);
        it->second.wave = shift_wavelengths(sky_wave, est.shift);
    }

    FlexureRecord rec;
    rec.object = obj.name;
    rec.polyfit = std::move(est.polyfit);
    rec.shift = est.shift;
    rec.subpix = std::move(est.subpix);
    rec.corr = std::move(est.corr);
    rec.corr_cen = est.corr_cen;
    rec.smooth_sig_pix = est.smooth_sig_pix;
    rec.sky_spec = spectrum::Spectrum1D(shift_wavelengths(est.obj_spec.wave, est.shift),
                                        est.obj_spec.flux);
    rec.arx_spec = std::move(est.arx_spec);
    return rec;
}

FlexureDetectorResult FlexureCorrector::correct_detector(std::vector<SpecObj>& objects,
                                                         const spectrum::Spectrum1D& archive,
                                                         const std::string& spec_file,
                                                         int det) const {
    FlexureDetectorResult result;
    result.spec_file = spec_file;
    result.records.resize(objects.size());

    logger_.info("Using " + spec_file + " file for Sky spectrum");
    if (events_) events_->detector_start(det, static_cast<int>(objects.size()));

    auto process = [&](std::size_t i) {
        FlexureRecord& rec = result.records[i];
        try {
            // Each object works on its own copy of the archive
            const spectrum::Spectrum1D arx_copy = archive;
            rec = correct_object(objects[i], arx_copy);
        } catch (const InsufficientOverlap& e) {
            rec.status = FlexureStatus::InsufficientOverlap;
            rec.message = e.what();
        } catch (const UnsupportedExtractionMethod& e) {
            rec.status = FlexureStatus::UnsupportedExtractionMethod;
            rec.message = e.what();
        } catch (const InvalidExtraction& e) {
            rec.status = FlexureStatus::InvalidExtraction;
            rec.message = e.what();
        }
        rec.index = static_cast<int>(i);
        rec.object = objects[i].name;
    };

    std::exception_ptr first_error;
    if (workers_ > 1 && objects.size() > 1) {
        std::vector<std::thread> workers;
        std::atomic<size_t> next_obj{0};
        std::mutex error_mutex;
        const int n_workers = std::min<int>(workers_, static_cast<int>(objects.size()));
        logger_.work("Processing " + std::to_string(objects.size()) + " objects with " +
                     std::to_string(n_workers) + " workers");

        for (int w = 0; w < n_workers; ++w) {
            workers.emplace_back([&]() {
                while (true) {
                    size_t i = next_obj.fetch_add(1);
                    if (i >= objects.size()) break;
                    try {
                        process(i);
                    } catch (...) {
                        std::lock_guard<std::mutex> lock(error_mutex);
                        if (!first_error) first_error = std::current_exception();
                    }
                }
            });
        }
        for (auto& worker : workers) {
            worker.join();
        }
    } else {
        for (size_t i = 0; i < objects.size(); ++i) {
            process(i);
        }
    }
    if (first_error) {
        std::rethrow_exception(first_error);
    }

    // Report in input order
    for (const auto& rec : result.records) {
        if (rec.ok()) {
            if (events_) events_->object_processed(det, rec.index, rec.to_json());
            continue;
        }
        logger_.warn("Flexure correction failed for object " + rec.object + ": " + rec.message);
        result.failures.push_back({rec.index, rec.object, rec.message});
        if (events_) events_->object_failed(det, rec.index, rec.message);
    }

    if (events_) {
        events_->detector_end(det, result.n_success(), static_cast<int>(result.failures.size()));
    }
    return result;
}

} // namespace flexcal::flexure

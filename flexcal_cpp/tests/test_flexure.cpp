#include "flexcal/config/pars.hpp"
#include "flexcal/core/errors.hpp"
#include "flexcal/core/events.hpp"
#include "flexcal/core/logging.hpp"
#include "flexcal/flexure/flexure.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
using flexcal::VectorXd;
using flexcal::config::Value;
using namespace flexcal::flexure;

namespace {

constexpr int NPIX = 400;
constexpr double WAVE0 = 5000.0;
constexpr double STEP = 1.0;

VectorXd sky_flux(int n, const std::vector<double>& centres, double sigma) {
    VectorXd flux = VectorXd::Constant(n, 1.0);
    for (int i = 0; i < n; ++i) {
        for (double c : centres) {
            flux[i] += 100.0 * std::exp(-0.5 * std::pow((i - c) / sigma, 2));
        }
    }
    return flux;
}

VectorXd linear_wave(int n, double start) {
    return VectorXd::LinSpaced(n, start, start + STEP * (n - 1));
}

flexcal::spectrum::Spectrum1D make_archive() {
    return flexcal::spectrum::Spectrum1D(linear_wave(NPIX, WAVE0),
                                         sky_flux(NPIX, {100.0, 200.0, 300.0}, 1.5));
}

// Object sky whose features sit `shift` pixels earlier than in the archive
SpecObj make_object(const std::string& name, double shift, double sigma = 2.25) {
    SpecObj obj;
    obj.name = name;
    Extraction ext;
    ext.wave = linear_wave(NPIX, WAVE0);
    ext.sky = sky_flux(NPIX, {100.0 - shift, 200.0 - shift, 300.0 - shift}, sigma);
    obj.extractions["boxcar"] = ext;
    obj.extractions["optimal"] = ext;
    return obj;
}

flexcal::core::Logger& quiet_logger() {
    static flexcal::core::Logger logger(0);
    return logger;
}

} // namespace

TEST_CASE("estimate_shift_recovers_positive_shift_and_smooths_archive") {
    const auto arx = make_archive();
    SpecObj obj = make_object("obj", 2.0);
    const Extraction& ext = obj.extractions["boxcar"];
    const flexcal::spectrum::Spectrum1D obj_sky(ext.wave, ext.sky);

    ShiftEstimate est = estimate_shift(arx, obj_sky, 20, quiet_logger());

    REQUIRE(est.shift == Catch::Approx(2.0).margin(0.1));
    REQUIRE(est.smooth_sig_pix == Catch::Approx(std::sqrt(2.25 * 2.25 - 1.5 * 1.5)).epsilon(1e-3));
    REQUIRE(est.corr_cen == NPIX / 2);
    REQUIRE(est.subpix.size() == 2 * SUBPIX_HALF_WIDTH + 1);
    REQUIRE(est.corr.size() == est.subpix.size());
    REQUIRE(est.polyfit.size() == 3);
    REQUIRE(est.polyfit[2] < 0.0);
    REQUIRE(est.arx_resolution > est.obj_resolution);
}

TEST_CASE("estimate_shift_smooths_with_median_line_sigma") {
    const std::vector<double> centres{80.0, 160.0, 240.0, 320.0};
    const std::vector<double> obj_sigmas{2.0, 2.0, 3.0, 3.0};
    VectorXd obj_flux = VectorXd::Constant(NPIX, 1.0);
    for (int i = 0; i < NPIX; ++i) {
        for (std::size_t k = 0; k < centres.size(); ++k) {
            obj_flux[i] += 100.0 * std::exp(-0.5 * std::pow((i - centres[k]) / obj_sigmas[k], 2));
        }
    }
    const flexcal::spectrum::Spectrum1D arx(linear_wave(NPIX, WAVE0),
                                            sky_flux(NPIX, centres, 1.5));
    const flexcal::spectrum::Spectrum1D obj(linear_wave(NPIX, WAVE0), obj_flux);

    ShiftEstimate est = estimate_shift(arx, obj, 20, quiet_logger());

    // Median sigma 2.5 against 1.5 gives 2.0; the median of the variances would give 2.06
    REQUIRE(est.smooth_sig_pix == Catch::Approx(2.0).margin(0.02));
    REQUIRE(est.shift == Catch::Approx(0.0).margin(0.1));
}

TEST_CASE("estimate_shift_recovers_negative_shift") {
    const auto arx = make_archive();
    SpecObj obj = make_object("obj", -3.0, 1.5);
    const Extraction& ext = obj.extractions["boxcar"];
    ShiftEstimate est = estimate_shift(arx, flexcal::spectrum::Spectrum1D(ext.wave, ext.sky), 20,
                                       quiet_logger());
    REQUIRE(est.shift == Catch::Approx(-3.0).margin(0.1));
    REQUIRE(est.smooth_sig_pix == Catch::Approx(0.0).margin(1e-6));
}

TEST_CASE("estimate_shift_stays_inside_search_window") {
    const auto arx = make_archive();
    SpecObj obj = make_object("obj", 8.0, 1.5);
    const Extraction& ext = obj.extractions["boxcar"];
    ShiftEstimate est = estimate_shift(arx, flexcal::spectrum::Spectrum1D(ext.wave, ext.sky), 4,
                                       quiet_logger());
    REQUIRE(est.shift >= -4.0);
    REQUIRE(est.shift <= 4.0);
}

TEST_CASE("estimate_shift_requires_overlap") {
    const auto arx = make_archive();
    const flexcal::spectrum::Spectrum1D far(linear_wave(100, WAVE0 + NPIX - 20),
                                            sky_flux(100, {50.0}, 1.5));
    try {
        estimate_shift(arx, far, 20, quiet_logger());
        FAIL("expected InsufficientOverlap");
    } catch (const flexcal::InsufficientOverlap& e) {
        REQUIRE(e.n_overlap() == 20);
    }
}

TEST_CASE("shift_wavelengths_resamples_at_fractional_pixel") {
    VectorXd wave(5);
    wave << 0.0, 1.0, 4.0, 9.0, 16.0;
    VectorXd shifted = shift_wavelengths(wave, 0.5);
    REQUIRE(shifted[0] == Catch::Approx(0.5));
    REQUIRE(shifted[1] == Catch::Approx(2.5));
    REQUIRE(shifted[3] == Catch::Approx(12.5));
    // Extrapolated past the last pixel
    REQUIRE(shifted[4] == Catch::Approx(19.5));

    VectorXd back = shift_wavelengths(linear_wave(10, 100.0), -1.0);
    REQUIRE(back[0] == Catch::Approx(99.0));

    REQUIRE_THROWS_AS(shift_wavelengths(VectorXd::Constant(1, 1.0), 1.0), flexcal::ValidationError);
}

TEST_CASE("correct_object_updates_both_extractions") {
    auto par = flexcal::config::flexure_par();
    FlexureCorrector corrector(*par, quiet_logger());
    const auto arx = make_archive();
    SpecObj obj = make_object("obj", 2.0);
    const VectorXd original = obj.extractions["boxcar"].wave;

    FlexureRecord rec = corrector.correct_object(obj, arx);

    REQUIRE(rec.ok());
    REQUIRE(rec.shift == Catch::Approx(2.0).margin(0.1));
    for (const char* method : {"boxcar", "optimal"}) {
        const VectorXd& wave = obj.extractions[method].wave;
        REQUIRE(wave[0] == Catch::Approx(original[0] + rec.shift * STEP));
        REQUIRE(wave[NPIX - 1] == Catch::Approx(original[NPIX - 1] + rec.shift * STEP));
    }
    REQUIRE(rec.sky_spec.npix() == NPIX);
    REQUIRE(rec.arx_spec.npix() == NPIX);
    REQUIRE(rec.sky_spec.wave[10] == Catch::Approx(original[10] + rec.shift * STEP));
}

TEST_CASE("correct_object_rejects_unsupported_method") {
    auto par = flexcal::config::flexure_par();
    par->set("method", Value("slitcen"));
    FlexureCorrector corrector(*par, quiet_logger());
    SpecObj obj = make_object("obj", 1.0);
    const VectorXd original = obj.extractions["boxcar"].wave;

    REQUIRE_THROWS_AS(corrector.correct_object(obj, make_archive()),
                      flexcal::UnsupportedExtractionMethod);
    REQUIRE(obj.extractions["boxcar"].wave == original);
}

TEST_CASE("correct_object_requires_configured_extraction") {
    auto par = flexcal::config::flexure_par();
    par->set("method", Value("optimal"));
    FlexureCorrector corrector(*par, quiet_logger());
    SpecObj obj = make_object("obj", 1.0);
    obj.extractions.erase("optimal");

    REQUIRE_THROWS_AS(corrector.correct_object(obj, make_archive()),
                      flexcal::UnsupportedExtractionMethod);
}

TEST_CASE("correct_detector_records_failures_and_continues") {
    auto par = flexcal::config::flexure_par();
    std::ostringstream stream;
    flexcal::core::EventEmitter events("test-run", &stream);
    FlexureCorrector corrector(*par, quiet_logger(), &events);

    std::vector<SpecObj> objects{make_object("a", 1.0), make_object("b", -2.0)};
    SpecObj far;
    far.name = "far";
    Extraction ext;
    ext.wave = linear_wave(100, WAVE0 + NPIX - 20);
    ext.sky = sky_flux(100, {50.0}, 1.5);
    far.extractions["boxcar"] = ext;
    objects.insert(objects.begin() + 1, far);

    FlexureDetectorResult result = corrector.correct_detector(objects, make_archive(),
                                                              "paranal_sky.fits");

    REQUIRE(result.spec_file == "paranal_sky.fits");
    REQUIRE(result.records.size() == 3);
    REQUIRE(result.n_success() == 2);
    REQUIRE(result.failures.size() == 1);
    REQUIRE(result.failures[0].index == 1);
    REQUIRE(result.failures[0].object == "far");
    REQUIRE(result.records[1].status == FlexureStatus::InsufficientOverlap);
    REQUIRE(result.records[0].shift == Catch::Approx(1.0).margin(0.1));
    REQUIRE(result.records[2].shift == Catch::Approx(-2.0).margin(0.1));
    REQUIRE(objects[1].extractions["boxcar"].wave == ext.wave);

    std::vector<std::string> types;
    std::string line;
    std::istringstream lines(stream.str());
    while (std::getline(lines, line)) {
        types.push_back(flexcal::core::json::parse(line)["type"].get<std::string>());
    }
    const std::vector<std::string> expected{"detector_start", "flexure_object",
                                            "flexure_object_failed", "flexure_object",
                                            "detector_end"};
    REQUIRE(types == expected);
}

TEST_CASE("correct_detector_survives_degenerate_extractions") {
    auto par = flexcal::config::flexure_par();
    FlexureCorrector corrector(*par, quiet_logger());

    SpecObj single;
    single.name = "single";
    Extraction one;
    one.wave = linear_wave(1, WAVE0);
    one.sky = VectorXd::Constant(1, 5.0);
    single.extractions["boxcar"] = one;

    SpecObj mismatched;
    mismatched.name = "mismatched";
    Extraction bad;
    bad.wave = linear_wave(NPIX, WAVE0);
    bad.sky = VectorXd::Constant(NPIX - 1, 1.0);
    mismatched.extractions["boxcar"] = bad;

    std::vector<SpecObj> objects{single, make_object("good", 1.0), mismatched};
    FlexureDetectorResult result;
    REQUIRE_NOTHROW(result = corrector.correct_detector(objects, make_archive(), "arx"));

    REQUIRE(result.records.size() == 3);
    REQUIRE(result.n_success() == 1);
    REQUIRE(result.records[0].status == FlexureStatus::InsufficientOverlap);
    REQUIRE(result.records[1].ok());
    REQUIRE(result.records[1].shift == Catch::Approx(1.0).margin(0.1));
    REQUIRE(result.records[2].status == FlexureStatus::InvalidExtraction);
    REQUIRE(flexure_status_to_string(result.records[2].status) == "invalid_extraction");
    REQUIRE(result.failures.size() == 2);
    REQUIRE(objects[0].extractions["boxcar"].wave == one.wave);
}

TEST_CASE("correct_detector_parallel_matches_serial") {
    auto serial_par = flexcal::config::flexure_par();
    auto parallel_par = flexcal::config::flexure_par();
    parallel_par->set("parallel_workers", Value(3));

    std::vector<SpecObj> serial_objs;
    std::vector<SpecObj> parallel_objs;
    for (int i = 0; i < 5; ++i) {
        serial_objs.push_back(make_object("o" + std::to_string(i), 0.5 * i - 1.0));
        parallel_objs.push_back(make_object("o" + std::to_string(i), 0.5 * i - 1.0));
    }

    const auto arx = make_archive();
    FlexureDetectorResult a =
        FlexureCorrector(*serial_par, quiet_logger()).correct_detector(serial_objs, arx, "arx");
    FlexureDetectorResult b =
        FlexureCorrector(*parallel_par, quiet_logger()).correct_detector(parallel_objs, arx, "arx");

    REQUIRE(a.records.size() == b.records.size());
    for (std::size_t i = 0; i < a.records.size(); ++i) {
        REQUIRE(b.records[i].object == a.records[i].object);
        REQUIRE(b.records[i].shift == a.records[i].shift);
        REQUIRE(parallel_objs[i].extractions["boxcar"].wave ==
                serial_objs[i].extractions["boxcar"].wave);
    }
}

TEST_CASE("flexure_corrector_validates_settings") {
    auto par = flexcal::config::flexure_par();
    par->set("max_shift", Value(0));
    REQUIRE_THROWS_AS(FlexureCorrector(*par, quiet_logger()), flexcal::ValidationError);
}

TEST_CASE("flexure_record_serialises_to_json") {
    FlexureRecord rec;
    rec.object = "obj";
    rec.status = FlexureStatus::UnsupportedExtractionMethod;
    rec.message = "Not ready";
    auto j = rec.to_json();
    REQUIRE(j["status"] == "unsupported_method");
    REQUIRE(j["message"] == "Not ready");
    REQUIRE_FALSE(j.contains("shift"));
}

TEST_CASE("archive_file_name_depends_on_spectrograph") {
    auto par = flexcal::config::flexure_par();
    REQUIRE(archive_file_name(*par, "kast_blue") == "sky_kastb_600.fits");
    REQUIRE(archive_file_name(*par, "lris_blue") == "sky_kastb_600.fits");
    REQUIRE(archive_file_name(*par, "shane_kast_red") == "paranal_sky.fits");
    REQUIRE(archive_file_name(*par, "") == "paranal_sky.fits");

    par->set("spectrum", Value("custom_sky.fits"));
    REQUIRE(archive_file_name(*par, "kast_blue") == "custom_sky.fits");
}

TEST_CASE("resolve_archive_path_requires_existing_file") {
    const fs::path dir = fs::temp_directory_path() / "flexcal_test_archive";
    fs::create_directories(dir);
    std::ofstream(dir / "paranal_sky.fits") << "placeholder";

    auto par = flexcal::config::flexure_par();
    par->set("spec_dir", Value(dir.string()));
    REQUIRE(resolve_archive_path(*par, "any") == dir / "paranal_sky.fits");
    REQUIRE_THROWS_AS(resolve_archive_path(*par, "kast_blue"), flexcal::ConfigurationError);

    fs::remove_all(dir);
}

#include "flexcal/core/errors.hpp"
#include "flexcal/core/logging.hpp"
#include "flexcal/flexure/spec1d_io.hpp"
#include "flexcal/io/fits_io.hpp"
#include "flexcal/io/master_frame.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <filesystem>

namespace fs = std::filesystem;
using flexcal::Matrix2Dd;
using flexcal::VectorXd;
namespace io = flexcal::io;

namespace {

fs::path scratch_dir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / ("flexcal_test_" + name);
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

flexcal::core::Logger& quiet_logger() {
    static flexcal::core::Logger logger(0);
    return logger;
}

} // namespace

TEST_CASE("fits_write_then_read_named_extensions_and_header") {
    const fs::path dir = scratch_dir("fits");
    const fs::path path = dir / "frame.fits";

    Matrix2Dd img(2, 3);
    img << 1.0, 2.0, 3.0,
           4.0, 5.0, 6.0;
    io::FitsHeader header;
    header.set("OBJECT", "sky", "Target");
    header.set("EXPTIME", 30.5);
    header.set("NCOMB", 4);
    header.set("FLEXOK", true);

    io::FitsImage ext{"SCI", img, {}};
    ext.header.set("GAIN", 1.2);
    io::write_fits(path, header, std::nullopt, {ext});

    io::FitsHeader back = io::read_fits_header(path, 0);
    REQUIRE(back.get_string("OBJECT").value() == "sky");
    REQUIRE(back.get_double("EXPTIME").value() == Catch::Approx(30.5));
    REQUIRE(back.get_int("NCOMB").value() == 4);
    REQUIRE(back.get_bool("FLEXOK").value());

    Matrix2Dd data = io::read_fits_image(path, "SCI");
    REQUIRE(data.rows() == 2);
    REQUIRE(data.cols() == 3);
    REQUIRE(data(1, 2) == Catch::Approx(6.0));
    REQUIRE(data(0, 1) == Catch::Approx(2.0));

    auto exts = io::read_fits_extensions(path);
    REQUIRE(exts.size() == 1);
    REQUIRE(exts[0].extname == "SCI");
    REQUIRE(exts[0].header.get_double("GAIN").value() == Catch::Approx(1.2));

    REQUIRE_THROWS_AS(io::read_fits_image(path, "MISSING"), flexcal::FitsError);
    REQUIRE_THROWS_AS(io::read_fits_header(dir / "absent.fits"), flexcal::FitsError);
    fs::remove_all(dir);
}

TEST_CASE("sky_archive_round_trip") {
    const fs::path dir = scratch_dir("sky");
    const fs::path path = dir / "paranal_sky.fits";
    VectorXd wave = VectorXd::LinSpaced(50, 6000.0, 6049.0);
    VectorXd flux = VectorXd::LinSpaced(50, 1.0, 50.0);
    io::write_sky_archive(path, wave, flux);

    auto [w, f] = io::read_sky_archive(path);
    REQUIRE(w.size() == 50);
    REQUIRE(f.size() == 50);
    REQUIRE(w[10] == Catch::Approx(6010.0));
    REQUIRE(f[49] == Catch::Approx(50.0));

    auto spec = flexcal::flexure::load_sky_archive(path);
    REQUIRE(spec.npix() == 50);
    REQUIRE_THROWS_AS(io::read_sky_archive(dir / "none.fits"), flexcal::IOError);
    fs::remove_all(dir);
}

TEST_CASE("master_frame_names_and_paths") {
    io::MasterFrame master("Bias", "/data/masters", "A_1_01");
    REQUIRE(master.file_name() == "MasterBias_A_1_01.fits");
    REQUIRE(master.file_path() == fs::path("/data/masters") / "MasterBias_A_1_01.fits");

    io::MasterFrame defaults("Arc");
    REQUIRE(defaults.file_name() == "MasterArc_master.fits");
    REQUIRE(defaults.master_dir() == fs::current_path());

    REQUIRE_THROWS_AS(io::MasterFrame("Arc", "", "master", "npz"), flexcal::ValidationError);
}

TEST_CASE("master_frame_save_and_load") {
    const fs::path dir = scratch_dir("master");
    io::MasterFrame master("Flat", dir, "B_1_01", "fits", true, &quiet_logger());

    Matrix2Dd pixel = Matrix2Dd::Constant(3, 4, 1.5);
    Matrix2Dd illum = Matrix2Dd::Constant(3, 4, 0.75);
    std::vector<std::string> raw(12);
    for (std::size_t i = 0; i < raw.size(); ++i) raw[i] = "raw" + std::to_string(i) + ".fits";

    master.save({pixel, illum}, {"PIXELFLAT", "ILLUMFLAT"}, std::nullopt, true, raw,
                {"bias", "trim"});
    REQUIRE(fs::exists(master.file_path()));

    io::MasterLoad loaded = master.load({"ILLUMFLAT", "PIXELFLAT"}, std::nullopt, true);
    REQUIRE(loaded.loaded());
    REQUIRE(loaded.data.size() == 2);
    REQUIRE((*loaded.data[0])(2, 3) == Catch::Approx(0.75));
    REQUIRE((*loaded.data[1])(0, 0) == Catch::Approx(1.5));
    REQUIRE(loaded.header.has_value());
    REQUIRE(loaded.header->get_string("FRAMETYP").value() == "Flat");
    REQUIRE(loaded.header->get_string("STEPS").value() == "bias,trim");
    REQUIRE(io::MasterFrame::parse_hdr_raw_files(*loaded.header) == raw);
    fs::remove_all(dir);
}

TEST_CASE("master_frame_load_without_reuse_or_file_is_empty") {
    const fs::path dir = scratch_dir("master_empty");
    io::MasterFrame no_reuse("Bias", dir, "x", "fits", false, &quiet_logger());
    io::MasterLoad a = no_reuse.load({"BIAS"}, std::nullopt, true);
    REQUIRE_FALSE(a.loaded());
    REQUIRE(a.data.size() == 1);
    REQUIRE_FALSE(a.data[0].has_value());
    REQUIRE_FALSE(a.header.has_value());

    io::MasterFrame reuse("Bias", dir, "x", "fits", true, &quiet_logger());
    io::MasterLoad b = reuse.load({"BIAS"});
    REQUIRE_FALSE(b.loaded());
    fs::remove_all(dir);
}

TEST_CASE("master_frame_respects_overwrite_flag") {
    const fs::path dir = scratch_dir("master_overwrite");
    io::MasterFrame master("Bias", dir, "x", "fits", true, &quiet_logger());
    master.save({Matrix2Dd::Constant(2, 2, 1.0)}, {"BIAS"});
    master.save({Matrix2Dd::Constant(2, 2, 9.0)}, {"BIAS"}, std::nullopt, false);

    io::MasterLoad loaded = master.load({"BIAS"});
    REQUIRE((*loaded.data[0])(0, 0) == Catch::Approx(1.0));

    REQUIRE_THROWS_AS(master.save({Matrix2Dd::Zero(2, 2)}, {"A", "B"}), flexcal::ValidationError);
    fs::remove_all(dir);
}

TEST_CASE("parse_hdr_raw_files_orders_by_index") {
    io::FitsHeader header;
    header.set("F10", "j.fits");
    header.set("F2", "b.fits");
    header.set("F1", "a.fits");
    header.set("FILTER", "R");
    REQUIRE(io::MasterFrame::parse_hdr_raw_files(header) ==
            std::vector<std::string>{"a.fits", "b.fits", "j.fits"});
}

TEST_CASE("spec1d_round_trip_with_flexure_cards") {
    using namespace flexcal::flexure;
    const fs::path dir = scratch_dir("spec1d");
    const fs::path path = dir / "spec1d.fits";

    Extraction ext;
    ext.wave = VectorXd::LinSpaced(20, 4000.0, 4019.0);
    ext.sky = VectorXd::Constant(20, 2.0);
    std::vector<SpecObj> objects(2);
    objects[0].name = "SPAT0100-SLIT01";
    objects[0].extractions["boxcar"] = ext;
    objects[0].extractions["optimal"] = ext;
    objects[1].name = "SPAT0200";
    objects[1].extractions["boxcar"] = ext;

    FlexureDetectorResult result;
    result.records.resize(2);
    result.records[0].shift = 1.25;
    result.records[1].status = FlexureStatus::InsufficientOverlap;
    write_spec1d(path, objects, &result);

    std::vector<SpecObj> back = read_spec1d(path);
    REQUIRE(back.size() == 2);
    REQUIRE(back[0].name == "SPAT0100-SLIT01");
    REQUIRE(back[0].extractions.size() == 2);
    REQUIRE(back[1].find("boxcar") != nullptr);
    REQUIRE(back[1].find("optimal") == nullptr);
    REQUIRE(back[0].find("optimal")->wave[19] == Catch::Approx(4019.0));

    auto exts = io::read_fits_extensions(path);
    REQUIRE(exts[0].extname == extraction_extname("SPAT0100-SLIT01", "boxcar"));
    REQUIRE(exts[0].header.get_double("FLEXSHFT").value() == Catch::Approx(1.25));
    REQUIRE(exts[2].header.get_string("FLEXSTAT").value() == "insufficient_overlap");
    REQUIRE_FALSE(exts[2].header.get_double("FLEXSHFT").has_value());
    fs::remove_all(dir);
}

#include "flexcal/core/errors.hpp"
#include "flexcal/core/events.hpp"
#include "flexcal/core/logging.hpp"
#include "flexcal/core/types.hpp"
#include "flexcal/core/utils.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <sstream>

namespace fs = std::filesystem;
using namespace flexcal::core;

TEST_CASE("compute_median_even_and_odd") {
    flexcal::VectorXd odd(3);
    odd << 3.0, 1.0, 2.0;
    REQUIRE(compute_median(odd) == Catch::Approx(2.0));
    REQUIRE(compute_median(std::vector<double>{4.0, 1.0, 3.0, 2.0}) == Catch::Approx(2.5));
}

TEST_CASE("robust_sigma_scales_mad") {
    flexcal::VectorXd v(5);
    v << 1.0, 2.0, 3.0, 4.0, 100.0;
    REQUIRE(compute_mad(v) == Catch::Approx(1.0));
    REQUIRE(compute_robust_sigma(v) == Catch::Approx(1.4826));
}

TEST_CASE("wrap_text_breaks_on_words") {
    auto lines = wrap_text("the quick brown fox jumps", 10);
    REQUIRE(lines == std::vector<std::string>{"the quick", "brown fox", "jumps"});
    REQUIRE(wrap_text("   ", 10).empty());
}

TEST_CASE("zero_pad_and_decimal_width") {
    REQUIRE(zero_pad(3, 2) == "03");
    REQUIRE(zero_pad(12, 1) == "12");
    REQUIRE(decimal_width(9) == 1);
    REQUIRE(decimal_width(10) == 2);
    REQUIRE(decimal_width(123) == 3);
}

TEST_CASE("format_double_is_shortest_and_marked_float") {
    REQUIRE(format_double(2.0) == "2.0");
    REQUIRE(format_double(0.1) == "0.1");
    REQUIRE(format_double(1e-20) == "1e-20");
    REQUIRE(std::stod(format_double(1.0 / 3.0)) == 1.0 / 3.0);
}

TEST_CASE("string_helpers") {
    REQUIRE(trim("  a b \t") == "a b");
    REQUIRE(starts_with("flexure", "flex"));
    REQUIRE(join({"a", "b", "c"}, ", ") == "a, b, c");
    REQUIRE(to_lower("BoxCar") == "boxcar");
}

TEST_CASE("write_and_read_text") {
    const fs::path path = fs::temp_directory_path() / "flexcal_test_text.txt";
    write_text(path, "one\ntwo\n");
    write_text(path, "three\n", true);
    REQUIRE(read_lines(path) == std::vector<std::string>{"one", "two", "three"});
    fs::remove(path);
}

TEST_CASE("logger_error_throws_and_log_file_captures_everything") {
    const fs::path path = fs::temp_directory_path() / "flexcal_test_log.txt";
    {
        Logger logger(0);
        logger.open_log_file(path);
        logger.info("hello");
        logger.work("detail");
        REQUIRE_THROWS_AS(logger.error("fatal"), flexcal::FlexcalError);
    }
    const std::string text = join(read_lines(path), "\n");
    REQUIRE(text.find("flexcal") != std::string::npos);
    REQUIRE(text.find("[INFO]") != std::string::npos);
    REQUIRE(text.find("detail") != std::string::npos);
    REQUIRE(text.find("fatal") != std::string::npos);
    fs::remove(path);
}

TEST_CASE("event_emitter_writes_json_lines") {
    std::ostringstream out;
    EventEmitter events("run-1", &out);
    events.detector_start(2, 5);
    events.warning("careful");

    std::istringstream lines(out.str());
    std::string line;
    std::getline(lines, line);
    json first = json::parse(line);
    REQUIRE(first["type"] == "detector_start");
    REQUIRE(first["run_id"] == "run-1");
    REQUIRE(first["det"] == 2);
    REQUIRE(first["n_objects"] == 5);
    REQUIRE(first.contains("ts"));

    std::getline(lines, line);
    REQUIRE(json::parse(line)["message"] == "careful");
}

TEST_CASE("errors_share_a_common_base") {
    REQUIRE_THROWS_AS(throw flexcal::InsufficientOverlap(10, 50), flexcal::FlexureError);
    REQUIRE_THROWS_AS(throw flexcal::TypeError("x"), flexcal::ValidationError);
    REQUIRE_THROWS_AS(throw flexcal::FitsError("x"), flexcal::IOError);
    flexcal::UnsupportedExtractionMethod e("slitcen");
    REQUIRE(e.method() == "slitcen");
}

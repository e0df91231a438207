#include "flexcal/config/pars.hpp"
#include "flexcal/core/errors.hpp"
#include "flexcal/core/utils.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;
using namespace flexcal::config;

TEST_CASE("flexure_par_defaults") {
    auto par = flexure_par();
    REQUIRE(par->cfg_section() == "flexure");
    REQUIRE(par->get_string("method") == "boxcar");
    REQUIRE_FALSE(par->get("spectrum").has_value());
    REQUIRE(par->get_int("max_shift") == DEFAULT_MAX_SHIFT);
    REQUIRE(par->get_string("spec_dir") == "data/sky_spec");
    REQUIRE(par->get_int("parallel_workers") == 1);
}

TEST_CASE("flexure_par_method_options") {
    auto par = flexure_par();
    par->set("method", Value("optimal"));
    par->set("method", Value("slitcen"));
    REQUIRE_THROWS_AS(par->set("method", Value("median")), flexcal::ValidationError);
    REQUIRE_THROWS_AS(par->set("max_shift", Value(2.5)), flexcal::TypeError);
}

TEST_CASE("run_par_verbosity_options") {
    auto par = run_par();
    REQUIRE(par->get_int("verbosity") == 1);
    par->set("verbosity", Value(2));
    REQUIRE_THROWS_AS(par->set("verbosity", Value(3)), flexcal::ValidationError);
}

TEST_CASE("redux_par_renders_one_section_per_nested_set") {
    auto par = redux_par();
    auto lines = par->to_config("", "", 0, false, false);
    REQUIRE(lines.front() == "[rdx]");
    REQUIRE(std::find(lines.begin(), lines.end(), "[flexure]") != lines.end());
    REQUIRE(std::find(lines.begin(), lines.end(), "    method = boxcar") != lines.end());
}

TEST_CASE("redux_par_config_round_trip") {
    auto par = redux_par();
    auto flex = par->get("flexure")->as_parset();
    flex->set("method", Value("optimal"));
    flex->set("max_shift", Value(10));
    par->get("rdx")->as_parset()->set("spectrograph", Value("kast_blue"));

    ParameterSet back = ParameterSet::from_config(par->to_config(), *redux_par());
    REQUIRE(back == *par);
    REQUIRE(back.get_parset("flexure").get_int("max_shift") == 10);
    REQUIRE(back.get_parset("rdx").get_string("spectrograph") == "kast_blue");
}

TEST_CASE("redux_par_rejects_unknown_section") {
    REQUIRE_THROWS_AS(ParameterSet::from_config({"[bogus]", "x = 1"}, *redux_par()),
                      flexcal::ValidationError);
}

TEST_CASE("load_redux_par_reads_config_and_yaml") {
    const fs::path dir = fs::temp_directory_path() / "flexcal_test_pars";
    fs::create_directories(dir);

    const fs::path cfg = dir / "redux.cfg";
    flexcal::core::write_text(cfg, "[flexure]\n    method = optimal\n    max_shift = 7\n");
    ParameterSet from_cfg = load_redux_par(cfg);
    REQUIRE(from_cfg.get_parset("flexure").get_string("method") == "optimal");
    REQUIRE(from_cfg.get_parset("flexure").get_int("max_shift") == 7);
    REQUIRE(from_cfg.get_parset("rdx").get_int("verbosity") == 1);

    const fs::path yml = dir / "redux.yaml";
    flexcal::core::write_text(yml, "rdx:\n  spectrograph: lris_blue\nflexure:\n  max_shift: 12\n");
    ParameterSet from_yaml = load_redux_par(yml);
    REQUIRE(from_yaml.get_parset("rdx").get_string("spectrograph") == "lris_blue");
    REQUIRE(from_yaml.get_parset("flexure").get_int("max_shift") == 12);

    REQUIRE_THROWS_AS(load_redux_par(dir / "missing.cfg"), flexcal::IOError);
    fs::remove_all(dir);
}

TEST_CASE("validate_redux_par_rejects_unset_required_keys") {
    REQUIRE_NOTHROW(validate_redux_par(*redux_par()));

    ParameterSet cleared = ParameterSet::from_config(
        {"[flexure]", "    max_shift = None", "    spectrum = None"}, *redux_par());
    REQUIRE_FALSE(cleared.get_parset("flexure").get("max_shift").has_value());
    try {
        validate_redux_par(cleared);
        FAIL("expected ValidationError");
    } catch (const flexcal::ValidationError& e) {
        const std::string msg = e.what();
        REQUIRE(msg.find("max_shift") != std::string::npos);
        REQUIRE(msg.find("spectrum") == std::string::npos);
    }

    ParameterSet optional_unset = ParameterSet::from_config(
        {"[flexure]", "    parallel_workers = None"}, *redux_par());
    REQUIRE_NOTHROW(validate_redux_par(optional_unset));
}

#include "flexcal/config/pars.hpp"
#include "flexcal/core/errors.hpp"
#include "flexcal/core/events.hpp"
#include "flexcal/core/logging.hpp"
#include "flexcal/core/utils.hpp"
#include "flexcal/flexure/flexure.hpp"
#include "flexcal/flexure/spec1d_io.hpp"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

static void print_json(const json& j) {
    std::cout << j.dump(2) << std::endl;
}

// ============================================================================
// get-schema
// ============================================================================
int cmd_get_schema() {
    print_json(flexcal::config::redux_par()->schema_json());
    return 0;
}

// ============================================================================
// write-config <path> [--yaml] [--no-descr]
// ============================================================================
int cmd_write_config(const std::string& path, bool as_yaml, bool include_descr) {
    const auto par = flexcal::config::redux_par();
    if (as_yaml) {
        YAML::Emitter out;
        out << par->to_yaml();
        flexcal::core::write_text(path, std::string(out.c_str()) + "\n");
    } else {
        par->write_config(path, "", "", false, false, include_descr);
    }
    json result;
    result["ok"] = true;
    result["path"] = path;
    print_json(result);
    return 0;
}

// ============================================================================
// validate-config <path> [--strict-exit-codes]
// ============================================================================
int cmd_validate_config(const std::string& path, bool strict_exit) {
    json result;
    result["valid"] = false;
    result["errors"] = json::array();
    result["path"] = path;

    try {
        const auto par = flexcal::config::load_redux_par(path);
        flexcal::config::validate_redux_par(par);
        result["valid"] = true;
    } catch (const flexcal::FlexcalError& e) {
        result["errors"].push_back(e.what());
    }

    print_json(result);
    if (strict_exit) {
        return result["valid"].get<bool>() ? 0 : 1;
    }
    return 0;
}

// ============================================================================
// correct --config <cfg> --spec1d <file> [--out <file>] [--events <file>]
//         [--spectrograph <name>] [--det N]
// ============================================================================
int cmd_correct(const std::string& config_path,
                const std::string& spec1d_path,
                std::string out_path,
                const std::string& events_path,
                const std::string& spectrograph_arg,
                int det) {
    using namespace flexcal;

    const config::ParameterSet par = config::load_redux_par(config_path);
    config::validate_redux_par(par);
    const config::ParameterSet& rdx = par.get_parset("rdx");
    const config::ParameterSet& flex = par.get_parset("flexure");

    core::Logger logger(rdx.get_int("verbosity"), true);
    if (rdx.get("log_file")) {
        logger.open_log_file(rdx.get_string("log_file"));
    }

    std::ofstream events_file;
    std::ostream* events_out = &std::cout;
    if (!events_path.empty()) {
        events_file.open(events_path, std::ios::trunc);
        if (!events_file) {
            throw IOError("Cannot open events file: " + events_path);
        }
        events_out = &events_file;
    }
    core::EventEmitter events(core::get_run_id(), events_out);

    std::string spectrograph = spectrograph_arg;
    if (spectrograph.empty() && rdx.get("spectrograph")) {
        spectrograph = rdx.get_string("spectrograph");
    }

    json start;
    start["config"] = config_path;
    start["spec1d"] = spec1d_path;
    start["spectrograph"] = spectrograph;
    events.run_start(start);

    const fs::path archive_path = flexure::resolve_archive_path(flex, spectrograph);
    const spectrum::Spectrum1D archive = flexure::load_sky_archive(archive_path);

    std::vector<flexure::SpecObj> objects = flexure::read_spec1d(spec1d_path);
    logger.info("Read " + std::to_string(objects.size()) + " objects from " + spec1d_path);

    const flexure::FlexureCorrector corrector(flex, logger, &events);
    const flexure::FlexureDetectorResult result =
        corrector.correct_detector(objects, archive, archive_path.filename().string(), det);

    if (out_path.empty()) {
        const fs::path in(spec1d_path);
        out_path = (in.parent_path() / (in.stem().string() + "_flex" + in.extension().string()))
                       .string();
    }
    flexure::write_spec1d(out_path, objects, &result);
    logger.info("Corrected spectra written to " + out_path);

    const bool all_ok = result.failures.empty();
    events.run_end(all_ok, all_ok ? "ok" : "partial");
    return 0;
}

void print_usage() {
    std::cout << "Usage: flexcal_cli <command> [options]\n"
              << "\nCommands:\n"
              << "  get-schema                      Print JSON schema of the reduction parameters\n"
              << "  write-config <path> [--yaml] [--no-descr]  Write the default configuration\n"
              << "  validate-config <path> [--strict-exit-codes]  Validate a configuration file\n"
              << "  correct --config C --spec1d F [--out O] [--events E] [--spectrograph S] [--det N]\n"
              << "                                  Flexure-correct the objects of one detector\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string command = argv[1];

    auto get_arg = [&](const char* name) -> std::string {
        for (int i = 2; i < argc - 1; ++i) {
            if (std::strcmp(argv[i], name) == 0) {
                return argv[i + 1];
            }
        }
        return "";
    };

    auto has_flag = [&](const char* name) -> bool {
        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], name) == 0) return true;
        }
        return false;
    };

    auto get_positional = [&](int pos) -> std::string {
        int count = 0;
        for (int i = 2; i < argc; ++i) {
            if (argv[i][0] != '-') {
                if (count == pos) return argv[i];
                ++count;
            }
        }
        return "";
    };

    try {
        if (command == "get-schema") {
            return cmd_get_schema();
        }

        if (command == "write-config") {
            std::string path = get_positional(0);
            if (path.empty()) {
                std::cerr << "write-config requires a path argument\n";
                return 1;
            }
            return cmd_write_config(path, has_flag("--yaml"), !has_flag("--no-descr"));
        }

        if (command == "validate-config") {
            std::string path = get_positional(0);
            if (path.empty()) {
                std::cerr << "validate-config requires a path argument\n";
                return 1;
            }
            return cmd_validate_config(path, has_flag("--strict-exit-codes"));
        }

        if (command == "correct") {
            std::string config_path = get_arg("--config");
            std::string spec1d_path = get_arg("--spec1d");
            if (config_path.empty() || spec1d_path.empty()) {
                std::cerr << "correct requires --config and --spec1d\n";
                return 1;
            }
            std::string det_arg = get_arg("--det");
            int det = det_arg.empty() ? 1 : std::stoi(det_arg);
            return cmd_correct(config_path, spec1d_path, get_arg("--out"), get_arg("--events"),
                               get_arg("--spectrograph"), det);
        }
    } catch (const flexcal::FlexcalError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 3;
    }

    std::cerr << "Unknown command: " << command << "\n";
    print_usage();
    return 1;
}

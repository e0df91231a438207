#include "flexcal/config/pars.hpp"
#include "flexcal/core/errors.hpp"
#include "flexcal/core/utils.hpp"

#include <yaml-cpp/yaml.h>

namespace flexcal::config {

std::shared_ptr<ParameterSet> flexure_par() {
    std::vector<std::string> keys{"method", "spectrum", "max_shift", "spec_dir",
                                  "parallel_workers"};
    std::vector<OptionalValue> defaults{
        Value("boxcar"),
        std::nullopt,
        Value(DEFAULT_MAX_SHIFT),
        Value("data/sky_spec"),
        Value(1),
    };
    std::vector<std::vector<Value>> options{
        {Value("boxcar"), Value("optimal"), Value("slitcen")},
        {},
        {},
        {},
        {},
    };
    std::vector<std::vector<ValueKind>> dtypes{
        {ValueKind::String},
        {ValueKind::String},
        {ValueKind::Int},
        {ValueKind::String},
        {ValueKind::Int},
    };
    std::vector<std::string> descr{
        "Method used to correct for flexure. Use boxcar for a boxcar extraction or optimal "
        "for an optimal extraction. slitcen is accepted by the configuration but not yet "
        "supported by the corrector.",
        "Archive sky spectrum to be used for the flexure correction. If not set, the "
        "archive is chosen from the spectrograph.",
        "Maximum allowed flexure shift in pixels.",
        "Directory holding the archived sky spectra.",
        "Number of worker threads used to process the objects of one detector.",
    };
    return std::make_shared<ParameterSet>(keys, std::vector<OptionalValue>{}, defaults, options,
                                          dtypes, std::vector<bool>{}, descr, "flexure",
                                          "Flexure correction parameters");
}

std::shared_ptr<ParameterSet> run_par() {
    std::vector<std::string> keys{"spectrograph", "verbosity", "log_file"};
    std::vector<OptionalValue> defaults{std::nullopt, Value(1), std::nullopt};
    std::vector<std::vector<Value>> options{
        {},
        {Value(0), Value(1), Value(2)},
        {},
    };
    std::vector<std::vector<ValueKind>> dtypes{
        {ValueKind::String},
        {ValueKind::Int},
        {ValueKind::String},
    };
    std::vector<std::string> descr{
        "Spectrograph that provided the data to be reduced.",
        "Level of verbosity: 0 silent, 1 normal, 2 also reports detailed progress.",
        "File that receives a copy of every log message.",
    };
    return std::make_shared<ParameterSet>(keys, std::vector<OptionalValue>{}, defaults, options,
                                          dtypes, std::vector<bool>{}, descr, "rdx",
                                          "Run-level reduction parameters");
}

std::shared_ptr<ParameterSet> redux_par() {
    std::vector<std::string> keys{"rdx", "flexure"};
    std::vector<OptionalValue> values{Value(run_par()), Value(flexure_par())};
    std::vector<std::vector<ValueKind>> dtypes{{ValueKind::ParSet}, {ValueKind::ParSet}};
    std::vector<std::string> descr{
        "Run-level parameters",
        "Flexure correction parameters",
    };
    return std::make_shared<ParameterSet>(keys, values, std::vector<OptionalValue>{},
                                          std::vector<std::vector<Value>>{}, dtypes,
                                          std::vector<bool>{}, descr);
}

ParameterSet load_redux_par(const fs::path& path) {
    if (!fs::exists(path)) {
        throw IOError("Configuration file not found: " + path.string());
    }
    const auto schema = redux_par();
    const std::string ext = core::to_lower(path.extension().string());
    if (ext == ".yaml" || ext == ".yml") {
        YAML::Node node;
        try {
            node = YAML::LoadFile(path.string());
        } catch (const YAML::Exception& e) {
            throw ValidationError("Cannot parse " + path.string() + ": " + e.what());
        }
        return ParameterSet::from_yaml(node, *schema);
    }
    return ParameterSet::from_config_file(path, *schema);
}

void validate_redux_par(const ParameterSet& par) {
    par.validate_keys(std::vector<std::string>{"rdx", "flexure"}, std::nullopt);
    par.get_parset("rdx").validate_keys(
        std::vector<std::string>{"verbosity"},
        std::vector<std::string>{"spectrograph", "log_file"});
    par.get_parset("flexure").validate_keys(
        std::vector<std::string>{"method", "max_shift", "spec_dir"},
        std::vector<std::string>{"spectrum", "parallel_workers"});
}

const std::vector<std::string>& supported_flexure_methods() {
    static const std::vector<std::string> methods{"boxcar", "optimal"};
    return methods;
}

} // namespace flexcal::config

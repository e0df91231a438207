#pragma once

#include "flexcal/config/parameter_set.hpp"

#include <memory>

namespace flexcal::config {

inline constexpr int DEFAULT_MAX_SHIFT = 20;

/**
 * Parameter sets of the reduction. Each factory returns a fresh set holding
 * the defaults; pass values to override them (they are validated).
 */

// [flexure]: method, spectrum, max_shift, spec_dir, parallel_workers
std::shared_ptr<ParameterSet> flexure_par();

// [rdx]: spectrograph, verbosity, log_file
std::shared_ptr<ParameterSet> run_par();

// Top level: [rdx] and [flexure]
std::shared_ptr<ParameterSet> redux_par();

/**
 * Read a reduction configuration into redux_par(). Files ending in .yaml or
 * .yml are read as YAML, anything else as a bracketed config file.
 */
ParameterSet load_redux_par(const fs::path& path);

/**
 * Check that a loaded reduction configuration can drive a run: every key
 * other than the optional ones (rdx.spectrograph, rdx.log_file,
 * flexure.spectrum, flexure.parallel_workers) must be set. Throws
 * ValidationError naming the unset keys.
 */
void validate_redux_par(const ParameterSet& par);

// Extraction methods the flexure corrector understands
const std::vector<std::string>& supported_flexure_methods();

} // namespace flexcal::config

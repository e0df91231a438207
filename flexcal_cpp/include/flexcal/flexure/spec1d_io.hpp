#pragma once

#include "flexcal/flexure/flexure.hpp"

#include <string>
#include <vector>

namespace flexcal::flexure {

/**
 * Extracted-spectra file: one image extension per object and extraction,
 * named "<object>-<METHOD>" (e.g. "SPAT0412-BOXCAR"), with the wavelengths in
 * row 0 and the sky in row 1. Objects keep the order of their first
 * extension.
 */
std::string extraction_extname(const std::string& object, const std::string& method);

std::vector<SpecObj> read_spec1d(const fs::path& path);

// Writes objects in the same layout; with a result, each extension also
// carries FLEXSHFT and FLEXSTAT cards for its object
void write_spec1d(const fs::path& path,
                  const std::vector<SpecObj>& objects,
                  const FlexureDetectorResult* result = nullptr);

} // namespace flexcal::flexure

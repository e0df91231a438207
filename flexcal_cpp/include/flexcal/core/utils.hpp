#pragma once

#include "types.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace flexcal::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// File utilities
std::vector<std::string> read_lines(const fs::path& path);
void write_text(const fs::path& path, const std::string& text, bool append = false);

// Math utilities
double compute_median(const VectorXd& data);
double compute_median(std::vector<double> data);
double compute_mad(const VectorXd& data);
double compute_robust_sigma(const VectorXd& data);

// String utilities
std::string to_lower(const std::string& s);
std::string trim(const std::string& s);
bool starts_with(const std::string& str, const std::string& prefix);
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

/**
 * Greedy word wrap: whitespace runs collapse, words longer than width are
 * broken. Returns no lines for blank text.
 */
std::vector<std::string> wrap_text(const std::string& text, std::size_t width);

// Zero-padded decimal index, e.g. zero_pad(3, 2) == "03"
std::string zero_pad(std::size_t value, std::size_t width);

// Number of decimal digits needed to print count (floor(log10(count)) + 1)
std::size_t decimal_width(std::size_t count);

// Shortest decimal text that parses back to exactly the same double
std::string format_double(double value);

} // namespace flexcal::core

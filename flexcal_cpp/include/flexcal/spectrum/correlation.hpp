#pragma once

#include "flexcal/core/types.hpp"

namespace flexcal::spectrum {

/**
 * Cross-correlation of two equal-length arrays, "same" size output:
 *   c[i] = sum_n a[n + i - N/2] * v[n]
 * Zero lag sits at index N/2 (integer division). A peak at N/2 + k means
 * v matches a advanced by k samples.
 */
VectorXd correlate_same(const VectorXd& a, const VectorXd& v);

} // namespace flexcal::spectrum

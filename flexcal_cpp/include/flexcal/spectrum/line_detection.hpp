#pragma once

#include "flexcal/core/types.hpp"

#include <vector>

namespace flexcal::spectrum {

struct LineDetectionOptions {
    double nsigma = 5.0;        // detection threshold above background
    int fit_half_width = 2;     // pixels either side of the peak used in the fit
    double max_width = 20.0;    // widest accepted line (sigma, pixels)
};

/**
 * Emission lines found in a 1-D spectrum. Arrays are per candidate peak;
 * valid lists the candidates whose Gaussian fit succeeded.
 */
struct DetectedLines {
    VectorXd amp;
    VectorXd cent;   // pixel
    VectorXd wid;    // Gaussian sigma, pixels
    std::vector<int> valid;

    int size() const { return static_cast<int>(amp.size()); }

    // Indices of the k strongest valid lines, ascending in amplitude
    std::vector<int> brightest(int k) const;
};

DetectedLines detect_lines(const VectorXd& flux,
                           const LineDetectionOptions& opts = LineDetectionOptions());

} // namespace flexcal::spectrum

#include "flexcal/spectrum/line_detection.hpp"
#include "flexcal/core/utils.hpp"
#include "flexcal/spectrum/polyfit.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace flexcal::spectrum {

std::vector<int> DetectedLines::brightest(int k) const {
    std::vector<int> order = valid;
    std::stable_sort(order.begin(), order.end(),
                     [this](int lhs, int rhs) { return amp[lhs] < amp[rhs]; });
    if (k >= 0 && static_cast<int>(order.size()) > k) {
        order.erase(order.begin(), order.end() - k);
    }
    return order;
}

namespace {

struct GaussFit {
    double amp = std::numeric_limits<double>::quiet_NaN();
    double cent = std::numeric_limits<double>::quiet_NaN();
    double wid = std::numeric_limits<double>::quiet_NaN();
};

// Gaussian through the log of the background-subtracted peak samples
GaussFit fit_peak(const VectorXd& flux, double background, int peak, int half_width) {
    const int n = static_cast<int>(flux.size());
    const int lo = std::max(0, peak - half_width);
    const int hi = std::min(n - 1, peak + half_width);

    std::vector<double> xs;
    std::vector<double> ys;
    for (int i = lo; i <= hi; ++i) {
        const double f = flux[i] - background;
        if (f <= 0.0 || !std::isfinite(f)) continue;
        xs.push_back(static_cast<double>(i - peak));
        ys.push_back(std::log(f));
    }

    GaussFit fit;
    if (xs.size() < 3) return fit;

    VectorXd x = Eigen::Map<VectorXd>(xs.data(), static_cast<Eigen::Index>(xs.size()));
    VectorXd y = Eigen::Map<VectorXd>(ys.data(), static_cast<Eigen::Index>(ys.size()));
    const VectorXd c = fit_polynomial(x, y, 2);
    if (!(c[2] < 0.0)) return fit;

    const double offset = -c[1] / (2.0 * c[2]);
    fit.wid = std::sqrt(-1.0 / (2.0 * c[2]));
    fit.cent = peak + offset;
    fit.amp = std::exp(c[0] - c[1] * c[1] / (4.0 * c[2]));
    return fit;
}

} // namespace

DetectedLines detect_lines(const VectorXd& flux, const LineDetectionOptions& opts) {
    DetectedLines lines;
    const int n = static_cast<int>(flux.size());
    if (n < 3) {
        return lines;
    }

    const double background = core::compute_median(flux);
    const double noise = core::compute_robust_sigma(flux);
    const double threshold = background + opts.nsigma * std::max(noise, 0.0);

    std::vector<int> peaks;
    for (int i = 1; i < n - 1; ++i) {
        if (flux[i] > flux[i - 1] && flux[i] >= flux[i + 1] && flux[i] > threshold) {
            peaks.push_back(i);
        }
    }

    const int np = static_cast<int>(peaks.size());
    lines.amp.resize(np);
    lines.cent.resize(np);
    lines.wid.resize(np);
    for (int k = 0; k < np; ++k) {
        const GaussFit fit = fit_peak(flux, background, peaks[k], opts.fit_half_width);
        lines.amp[k] = fit.amp;
        lines.cent[k] = fit.cent;
        lines.wid[k] = fit.wid;

        const bool ok = std::isfinite(fit.amp) && std::isfinite(fit.cent) &&
                        std::isfinite(fit.wid) && fit.wid > 0.0 && fit.wid < opts.max_width &&
                        fit.cent >= 0.0 && fit.cent <= n - 1;
        if (ok) lines.valid.push_back(k);
    }
    return lines;
}

} // namespace flexcal::spectrum

#include "flexcal/spectrum/correlation.hpp"
#include "flexcal/core/errors.hpp"

#include <algorithm>

namespace flexcal::spectrum {

VectorXd correlate_same(const VectorXd& a, const VectorXd& v) {
    if (a.size() != v.size()) {
        throw ValidationError("correlate_same: inputs differ in length (" +
                              std::to_string(a.size()) + " vs " + std::to_string(v.size()) +
                              ")");
    }
    const Eigen::Index n = a.size();
    const Eigen::Index half = n / 2;

    VectorXd corr = VectorXd::Zero(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        const Eigen::Index lag = i - half;
        const Eigen::Index start = std::max<Eigen::Index>(0, -lag);
        const Eigen::Index stop = std::min<Eigen::Index>(n, n - lag);
        if (stop <= start) continue;
        corr[i] = a.segment(start + lag, stop - start).dot(v.segment(start, stop - start));
    }
    return corr;
}

} // namespace flexcal::spectrum

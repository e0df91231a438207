#include "flexcal/spectrum/polyfit.hpp"
#include "flexcal/core/errors.hpp"

#include <Eigen/QR>

namespace flexcal::spectrum {

VectorXd fit_polynomial(const VectorXd& x, const VectorXd& y, int degree) {
    if (degree < 0) {
        throw ValidationError("Polynomial degree must be >= 0");
    }
    if (x.size() != y.size()) {
        throw ValidationError("Polynomial fit: x and y differ in length");
    }
    if (x.size() <= degree) {
        throw ValidationError("Polynomial fit of degree " + std::to_string(degree) +
                              " needs more than " + std::to_string(degree) + " points");
    }

    Eigen::MatrixXd vander(x.size(), degree + 1);
    for (Eigen::Index i = 0; i < x.size(); ++i) {
        double p = 1.0;
        for (int j = 0; j <= degree; ++j) {
            vander(i, j) = p;
            p *= x[i];
        }
    }
    return vander.colPivHouseholderQr().solve(y);
}

double polyval(const VectorXd& coeffs, double x) {
    double result = 0.0;
    for (Eigen::Index j = coeffs.size() - 1; j >= 0; --j) {
        result = result * x + coeffs[j];
    }
    return result;
}

VectorXd polyval(const VectorXd& coeffs, const VectorXd& x) {
    VectorXd out(x.size());
    for (Eigen::Index i = 0; i < x.size(); ++i) {
        out[i] = polyval(coeffs, x[i]);
    }
    return out;
}

} // namespace flexcal::spectrum

#pragma once

#include "flexcal/core/types.hpp"

namespace flexcal::spectrum {

// Least-squares polynomial fit; coefficients in ascending power order
VectorXd fit_polynomial(const VectorXd& x, const VectorXd& y, int degree);

double polyval(const VectorXd& coeffs, double x);
VectorXd polyval(const VectorXd& coeffs, const VectorXd& x);

} // namespace flexcal::spectrum

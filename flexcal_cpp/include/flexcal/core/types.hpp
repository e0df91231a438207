#pragma once

#include <Eigen/Dense>
#include <cmath>
#include <filesystem>
#include <string>
#include <vector>

namespace flexcal {

namespace fs = std::filesystem;

// Array types
using Matrix2Dd = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using VectorXd = Eigen::VectorXd;
using VectorXi = Eigen::VectorXi;

// Gaussian FWHM = FWHM_PER_SIGMA * sigma
inline const double FWHM_PER_SIGMA = 2.0 * std::sqrt(2.0 * std::log(2.0));

} // namespace flexcal

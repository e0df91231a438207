#include "flexcal/spectrum/spectrum.hpp"
#include "flexcal/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <opencv2/imgproc.hpp>

namespace flexcal::spectrum {

Spectrum1D::Spectrum1D(VectorXd wave_in, VectorXd flux_in)
    : wave(std::move(wave_in)), flux(std::move(flux_in)) {
    if (wave.size() != flux.size()) {
        throw ValidationError("Spectrum wave and flux differ in length (" +
                              std::to_string(wave.size()) + " vs " +
                              std::to_string(flux.size()) + ")");
    }
}

double Spectrum1D::wave_min() const {
    if (wave.size() == 0) return std::numeric_limits<double>::quiet_NaN();
    return wave.minCoeff();
}

double Spectrum1D::wave_max() const {
    if (wave.size() == 0) return std::numeric_limits<double>::quiet_NaN();
    return wave.maxCoeff();
}

Spectrum1D Spectrum1D::gauss_smooth(double fwhm_pix) const {
    if (!(fwhm_pix > 0.0) || flux.size() == 0) {
        return *this;
    }
    const double sigma = fwhm_pix / FWHM_PER_SIGMA;
    const int n = static_cast<int>(flux.size());
    const int ksize = 2 * static_cast<int>(std::ceil(4.0 * sigma)) + 1;

    cv::Mat src(1, n, CV_64F, const_cast<double*>(flux.data()));
    cv::Mat dst;
    cv::GaussianBlur(src, dst, cv::Size(ksize, 1), sigma, 0.0, cv::BORDER_REPLICATE);

    VectorXd smoothed(n);
    for (int i = 0; i < n; ++i) {
        smoothed[i] = dst.at<double>(0, i);
    }
    return Spectrum1D(wave, std::move(smoothed));
}

Spectrum1D Spectrum1D::rebin(const VectorXd& new_wave) const {
    return Spectrum1D(new_wave, trapezoidal_rebin(wave, flux, new_wave));
}

VectorXd dispersion(const VectorXd& wave) {
    const Eigen::Index n = wave.size();
    if (n == 0) return VectorXd();
    if (n < 2) {
        throw ValidationError("Dispersion needs at least two wavelength samples");
    }
    VectorXd disp(n);
    disp.tail(n - 1) = wave.tail(n - 1) - wave.head(n - 1);
    disp[0] = disp[1];
    return disp;
}

VectorXd interp_extrapolate(const VectorXd& x, const VectorXd& y, const VectorXd& xi) {
    const Eigen::Index n = x.size();
    if (n < 2 || y.size() != n) {
        throw ValidationError("Interpolation needs at least two matching (x, y) samples");
    }

    VectorXd out(xi.size());
    const double* xb = x.data();
    const double* xe = x.data() + n;
    for (Eigen::Index i = 0; i < xi.size(); ++i) {
        const double v = xi[i];
        Eigen::Index hi = static_cast<Eigen::Index>(std::upper_bound(xb, xe, v) - xb);
        hi = std::clamp<Eigen::Index>(hi, 1, n - 1);
        const Eigen::Index lo = hi - 1;
        const double t = (v - x[lo]) / (x[hi] - x[lo]);
        out[i] = y[lo] + t * (y[hi] - y[lo]);
    }
    return out;
}

namespace {

double interp_clamped(const VectorXd& x, const VectorXd& y, double xi) {
    const Eigen::Index n = x.size();
    if (xi <= x[0]) return y[0];
    if (xi >= x[n - 1]) return y[n - 1];

    const double* it = std::lower_bound(x.data(), x.data() + n, xi);
    const Eigen::Index hi = static_cast<Eigen::Index>(it - x.data());
    const Eigen::Index lo = hi - 1;
    const double w = (xi - x[lo]) / (x[hi] - x[lo]);
    return y[lo] * (1.0 - w) + y[hi] * w;
}

// Pixel edges from centres: e_0, c_0, e_1, c_1, ...
VectorXd make_edges(const VectorXd& centres) {
    const Eigen::Index n = centres.size();
    VectorXd edges(n + 1);
    edges[0] = centres[0] - 0.5 * (centres[1] - centres[0]);
    for (Eigen::Index i = 1; i < n; ++i) {
        edges[i] = 0.5 * (centres[i - 1] + centres[i]);
    }
    edges[n] = centres[n - 1] + 0.5 * (centres[n - 1] - centres[n - 2]);
    return edges;
}

VectorXd cumulative_trapz(const VectorXd& x, const VectorXd& y) {
    const Eigen::Index n = x.size();
    VectorXd cum(n);
    cum[0] = 0.0;
    for (Eigen::Index i = 1; i < n; ++i) {
        cum[i] = cum[i - 1] + 0.5 * (y[i] + y[i - 1]) * (x[i] - x[i - 1]);
    }
    return cum;
}

} // namespace

VectorXd trapezoidal_rebin(const VectorXd& wave_in, const VectorXd& flux_in,
                           const VectorXd& wave_out) {
    if (wave_in.size() < 2 || flux_in.size() != wave_in.size()) {
        throw ValidationError("Rebin needs at least two matching input samples");
    }
    if (wave_out.size() < 2) {
        throw ValidationError("Rebin needs at least two output samples");
    }

    const VectorXd out_edges = make_edges(wave_out);
    const VectorXd cum = cumulative_trapz(wave_in, flux_in);
    const Eigen::Index n_in = wave_in.size();

    // Integral of the input from wave_in[0] to xi
    auto integral_at = [&](double xi) -> double {
        if (xi <= wave_in[0]) return 0.0;
        if (xi >= wave_in[n_in - 1]) return cum[n_in - 1];

        const double* it = std::lower_bound(wave_in.data(), wave_in.data() + n_in, xi);
        const Eigen::Index hi = static_cast<Eigen::Index>(it - wave_in.data());
        const Eigen::Index lo = hi - 1;
        const double f_lo = flux_in[lo];
        const double f_hi = interp_clamped(wave_in, flux_in, xi);
        return cum[lo] + 0.5 * (f_lo + f_hi) * (xi - wave_in[lo]);
    };

    VectorXd out(wave_out.size());
    for (Eigen::Index i = 0; i < wave_out.size(); ++i) {
        const double lo = out_edges[i];
        const double hi = out_edges[i + 1];
        const double width = hi - lo;
        if (width > 0.0) {
            out[i] = (integral_at(hi) - integral_at(lo)) / width;
        } else {
            out[i] = interp_clamped(wave_in, flux_in, wave_out[i]);
        }
    }
    return out;
}

namespace {

VectorXd air_vac_factor(const VectorXd& wave) {
    VectorXd factor(wave.size());
    for (Eigen::Index i = 0; i < wave.size(); ++i) {
        if (wave[i] < 2000.0) {
            factor[i] = 1.0;
            continue;
        }
        const double sigma_sq = std::pow(1.0e4 / wave[i], 2);
        factor[i] = 1.0 + 5.792105e-2 / (238.0185 - sigma_sq) + 1.67918e-3 / (57.362 - sigma_sq);
    }
    return factor;
}

} // namespace

VectorXd air_to_vac(const VectorXd& wave) {
    return wave.cwiseProduct(air_vac_factor(wave));
}

VectorXd vac_to_air(const VectorXd& wave) {
    return wave.cwiseQuotient(air_vac_factor(wave));
}

} // namespace flexcal::spectrum

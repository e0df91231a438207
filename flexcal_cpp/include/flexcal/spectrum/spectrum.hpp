#pragma once

#include "flexcal/core/types.hpp"

namespace flexcal::spectrum {

/**
 * 1-D spectrum sampled at increasing wavelengths (Angstrom).
 */
struct Spectrum1D {
    VectorXd wave;
    VectorXd flux;

    Spectrum1D() = default;
    // Throws ValidationError when the arrays differ in length
    Spectrum1D(VectorXd wave_in, VectorXd flux_in);

    int npix() const { return static_cast<int>(wave.size()); }
    double wave_min() const;
    double wave_max() const;

    // Gaussian convolution with the given FWHM in pixels; fwhm <= 0 copies
    Spectrum1D gauss_smooth(double fwhm_pix) const;

    // Flux-conserving resample onto new_wave
    Spectrum1D rebin(const VectorXd& new_wave) const;
};

/**
 * Per-pixel wavelength step: forward difference with the first element
 * replicated, so the result has the input length.
 */
VectorXd dispersion(const VectorXd& wave);

// Linear interpolation of y(x) at xi, linear extrapolation outside x
VectorXd interp_extrapolate(const VectorXd& x, const VectorXd& y, const VectorXd& xi);

// Trapezoidal flux-conserving rebin of (wave_in, flux_in) onto wave_out
VectorXd trapezoidal_rebin(const VectorXd& wave_in, const VectorXd& flux_in,
                           const VectorXd& wave_out);

// Air <-> vacuum conversion; wavelengths below 2000 A are left untouched
VectorXd air_to_vac(const VectorXd& wave);
VectorXd vac_to_air(const VectorXd& wave);

} // namespace flexcal::spectrum

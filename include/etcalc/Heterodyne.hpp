#pragma once
#include "Sensor.hpp"

#include <optional>

namespace etcalc {

struct HeterodyneParams {
    Real aperture_efficiency  = 1.0;
    Real main_beam_efficiency = 1.0;
    Real receiver_temp_K      = 0.0;
    Real eta_fss              = 1.0;    // forward scattering efficiency
    Real lambda_line_nm       = 0.0;    // wavelength the SNR is evaluated at
    Real kappa                = 1.0;    // backend degradation factor
    std::optional<Real> n_on;           // on source integrations
    std::optional<Real> n_eff;          // explicit effective integration count
    Real   d_aperture_m = 1.0;
    Vector wl_bins;                     // nm
    Real   wl_delta_nm  = 0.0;          // spectral channel width
};

/*
 * Superheterodyne spectrometer.  Signal and background are converted to
 * antenna temperatures in the Rayleigh-Jeans limit; the noise follows the
 * radiometer equation
 *
 *      ΔT_rms = κ T_sys / sqrt(Δν t n_eff),   T_sys = T_rx + T_bg
 */
class Heterodyne : public ISensor {
public:
    Heterodyne(RadiantPtr parent, HeterodyneParams params);

    SensorResult compute_snr(Real exposure_time) const override;
    SensorResult compute_exposure_time(Real snr) const override;
    SensorResult compute_sensitivity(Real exposure_time, Real snr) const override;
    std::string name() const override { return "Heterodyne"; }

    static Real radiometer_rms(Real t_sys, Real kappa, Real delta_nu, Real exposure_time, Real n_eff);

    // n_eff = 1 / (1 + 1 / sqrt(n_on)) unless given explicitly
    Real n_eff() const noexcept { return n_eff_; }

    const SpectralQty& t_signal() const noexcept { return t_signal_; }
    const SpectralQty& t_background() const noexcept { return t_background_; }
    const SpectralQty& delta_nu() const noexcept { return delta_nu_; }

private:
    SpectralQty rms_spectrum(Real exposure_time) const;
    void log_details(const std::string& prefix, Real t_rms, Real t_sig) const;

    RadiantPtr       parent_;
    HeterodyneParams p_;
    Real             n_eff_;

    SpectralQty t_signal_;
    SpectralQty t_background_;
    SpectralQty t_sys_;
    SpectralQty delta_nu_;
    std::optional<Real> mag_;
};

} // namespace etcalc

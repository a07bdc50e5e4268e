#include "etcalc/Heterodyne.hpp"
#include "etcalc/Errors.hpp"
#include "etcalc/Log.hpp"
#include "etcalc/Physics.hpp"
#include "etcalc/RootFinding.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <vector>

namespace etcalc {

namespace {
constexpr Real kMagStep  = 5.0;
constexpr Real kMagLimit = 60.0;

void check_efficiency(Real v, const char* what)
{
    if (!(v > 0.0 && v <= 1.0))
        throw ConfigurationError(std::string("Heterodyne: ") + what + " must be within (0, 1]");
}

// Wavelength grid with the line inserted
Vector with_line(const Vector& wl, Real line)
{
    std::vector<Real> v(wl.data(), wl.data() + wl.size());
    if (std::find(v.begin(), v.end(), line) == v.end()) {
        v.push_back(line);
        std::sort(v.begin(), v.end());
    }
    return Eigen::Map<const Vector>(v.data(), static_cast<Eigen::Index>(v.size()));
}

// Rayleigh-Jeans temperature of a per-frequency density: T = q λ² / (2 k) · factor
SpectralQty rj_temperature(const SpectralQty& per_hz, const Unit& si_unit, Real factor)
{
    const Real fv = per_hz.unit().factor_to(si_unit);
    const Real fw = per_hz.wl_unit().factor_to(units::m);
    return per_hz.transform(
        [=](Real l, Real v) {
            const Real wl_m = l * fw;
            return v * fv * wl_m * wl_m / (2.0 * phys::k_B) * factor;
        },
        units::K);
}
} // anonymous namespace

Heterodyne::Heterodyne(RadiantPtr parent, HeterodyneParams params)
    : parent_(std::move(parent)),
      p_(std::move(params)),
      n_eff_(1.0),
      t_signal_(Vector::Constant(1, 0.0), Vector::Constant(1, 0.0)),
      t_background_(t_signal_),
      t_sys_(t_signal_),
      delta_nu_(t_signal_)
{
    if (!parent_)
        throw ConfigurationError("Heterodyne without parent element");
    check_efficiency(p_.aperture_efficiency,  "aperture efficiency");
    check_efficiency(p_.main_beam_efficiency, "main beam efficiency");
    check_efficiency(p_.eta_fss,              "forward scattering efficiency");
    if (p_.receiver_temp_K < 0.0)
        throw ConfigurationError("Heterodyne: negative receiver temperature");
    if (!(p_.kappa > 0.0))
        throw ConfigurationError("Heterodyne: backend degradation factor must be positive");
    if (!(p_.d_aperture_m > 0.0) || !(p_.wl_delta_nm > 0.0))
        throw ConfigurationError("Heterodyne: aperture and channel width must be positive");
    if (p_.wl_bins.size() == 0 ||
        p_.lambda_line_nm < p_.wl_bins.minCoeff() || p_.lambda_line_nm > p_.wl_bins.maxCoeff())
        throw ConfigurationError("Heterodyne: line wavelength outside of the wavelength grid");

    if (p_.n_eff) {
        if (!(*p_.n_eff > 0.0))
            throw ConfigurationError("Heterodyne: n_eff must be positive");
        n_eff_ = *p_.n_eff;
    } else {
        const Real n_on = p_.n_on.value_or(1.0);
        if (!(n_on > 0.0))
            throw ConfigurationError("Heterodyne: n_on must be positive");
        n_eff_ = 1.0 / (1.0 + 1.0 / std::sqrt(n_on));
    }
    mag_ = parent_->magnitude();

    /* ---- temperatures ---------------------------------------------- */
    log::info(name(), "Calculating the system temperature.");
    const Vector grid = with_line(p_.wl_bins, p_.lambda_line_nm);

    const SpectralQty bg = phys::per_nm_to_per_hz(parent_->background().rebin(grid));
    t_background_ = rj_temperature(bg, units::radiance_nu, p_.main_beam_efficiency * p_.eta_fss);

    log::info(name(), "Calculating the signal temperature.");
    const SpectralQty sig = phys::per_nm_to_per_hz(parent_->signal().rebin(grid));
    if (parent_->size() == TargetSize::Point) {
        // T = η_ap η_fss A S_ν / (2 k)
        const Real area = phys::pi * p_.d_aperture_m * p_.d_aperture_m / 4.0;
        const Real fv  = sig.unit().factor_to(units::flux_density_nu);
        const Real eff = p_.aperture_efficiency * p_.eta_fss;
        t_signal_ = sig.transform(
            [=](Real, Real v) { return v * fv * eff * area / (2.0 * phys::k_B); },
            units::K);
    } else {
        t_signal_ = rj_temperature(sig, units::radiance_nu, p_.main_beam_efficiency * p_.eta_fss);
    }

    t_sys_ = t_background_ + SpectralQty::constant(grid, p_.receiver_temp_K, units::K);

    const Real dl = p_.wl_delta_nm;
    delta_nu_ = SpectralQty::from_function(
        grid, [dl](Real l) { return phys::frequency(l) / (l / dl + 1.0); }, units::Hz);
}

Real Heterodyne::radiometer_rms(Real t_sys, Real kappa, Real delta_nu, Real exposure_time, Real n_eff)
{
    return kappa * t_sys / std::sqrt(delta_nu * exposure_time * n_eff);
}

SpectralQty Heterodyne::rms_spectrum(Real exposure_time) const
{
    const Real kappa = p_.kappa, n_eff = n_eff_;
    Vector v(t_sys_.size());
    for (Eigen::Index i = 0; i < v.size(); ++i)
        v[i] = radiometer_rms(t_sys_.values()[i], kappa, delta_nu_.values()[i], exposure_time, n_eff);
    return SpectralQty(t_sys_.wl(), std::move(v), units::K);
}

void Heterodyne::log_details(const std::string& prefix, Real t_rms, Real t_sig) const
{
    if (!log::enabled(log::Level::Info)) return;
    const Real l = p_.lambda_line_nm;
    char buf[160];
    std::snprintf(buf, sizeof buf, "%sSystem temperature:        %1.2e K", prefix.c_str(), t_sys_.at(l));
    log::info(name(), buf);
    std::snprintf(buf, sizeof buf, "%sNoise bandwidth:           %1.2e Hz", prefix.c_str(), delta_nu_.at(l));
    log::info(name(), buf);
    std::snprintf(buf, sizeof buf, "%sRMS antenna temperature:   %1.2e K", prefix.c_str(), t_rms);
    log::info(name(), buf);
    std::snprintf(buf, sizeof buf, "%sAntenna temperature:       %1.2e K", prefix.c_str(), t_sig);
    log::info(name(), buf);
}

/* ---------------------------------------------------------------- */
SensorResult Heterodyne::compute_snr(Real exposure_time) const
{
    if (!(exposure_time > 0.0))
        throw ConfigurationError("Heterodyne: exposure time must be positive");

    const Real l = p_.lambda_line_nm;
    const SpectralQty rms = rms_spectrum(exposure_time);
    const Real t_rms = rms.at(l);
    const Real t_sig = t_signal_.at(l);

    char prefix[64];
    std::snprintf(prefix, sizeof prefix, "t_exp=%.2f s: ", exposure_time);
    log_details(prefix, t_rms, t_sig);

    SensorResult res;
    res.kind          = SensorResult::Kind::SNR;
    res.snr           = t_sig / t_rms;
    res.value         = res.snr;
    res.unit          = units::one;
    res.exposure_time = exposure_time;
    res.spectra       = TemperatureSpectra{t_signal_, t_background_, rms};
    return res;
}

SensorResult Heterodyne::compute_exposure_time(Real snr) const
{
    if (!(snr > 0.0))
        throw ConfigurationError("Heterodyne: SNR must be positive");

    const Real l = p_.lambda_line_nm;
    const Real t_sig = t_signal_.at(l);
    if (!(t_sig > 0.0))
        throw NoSolutionError("Heterodyne: no signal at the line wavelength");

    const Real t_rms = t_sig / snr;
    const Real t = std::pow(p_.kappa * t_sys_.at(l) / t_rms, 2) / (delta_nu_.at(l) * n_eff_);
    if (!std::isfinite(t) || t <= 0.0)
        throw NoSolutionError("Heterodyne: no positive exposure time reaches SNR " + std::to_string(snr));

    char prefix[64];
    std::snprintf(prefix, sizeof prefix, "SNR=%.2f: ", snr);
    log_details(prefix, t_rms, t_sig);

    SensorResult res;
    res.kind          = SensorResult::Kind::ExposureTime;
    res.exposure_time = t;
    res.value         = t;
    res.unit          = units::s;
    res.snr           = snr;
    res.spectra       = TemperatureSpectra{t_signal_, t_background_, rms_spectrum(t)};
    return res;
}

SensorResult Heterodyne::compute_sensitivity(Real exposure_time, Real snr) const
{
    if (!(exposure_time > 0.0) || !(snr > 0.0))
        throw ConfigurationError("Heterodyne: exposure time and SNR must be positive");
    if (!mag_)
        throw ConfigurationError("Heterodyne: sensitivity requires a target calibrated to a magnitude");

    const Real l = p_.lambda_line_nm;
    const SpectralQty rms = rms_spectrum(exposure_time);
    const Real t_rms = rms.at(l);
    const Real t_sig = t_signal_.at(l);
    const Real ref   = *mag_;

    const Real mag = find_root_expanding(
        [&](Real m) { return t_sig * std::pow(10.0, -0.4 * (m - ref)) / t_rms - snr; },
        ref, kMagStep, kMagLimit);

    char prefix[80];
    std::snprintf(prefix, sizeof prefix, "SNR=%.2f t_exp=%.2f s: ", snr, exposure_time);
    log_details(prefix, t_rms, t_rms * snr);

    SensorResult res;
    res.kind          = SensorResult::Kind::Sensitivity;
    res.value         = mag;
    res.unit          = units::one;
    res.exposure_time = exposure_time;
    res.snr           = snr;
    res.spectra       = TemperatureSpectra{t_signal_, t_background_, rms};
    return res;
}

} // namespace etcalc

#include "etcalc/Imager.hpp"
#include "etcalc/Errors.hpp"
#include "etcalc/Log.hpp"
#include "etcalc/Physics.hpp"
#include "etcalc/Rebin.hpp"
#include "etcalc/RootFinding.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>
#include <sstream>

namespace etcalc {

namespace {
constexpr Real kMinRadiusStep = 0.5;     // px, search step of the 'min' aperture
constexpr Real kMagStep       = 5.0;     // mag, bracket growth for sensitivities
constexpr Real kMagLimit      = 60.0;
constexpr int  kMaxApertureIterations = 8;

inline Real mag_scale(Real mag, Real ref) { return std::pow(10.0, -0.4 * (mag - ref)); }
} // anonymous namespace

Imager::Imager(RadiantPtr parent, ImagerParams params, PsfPtr psf)
    : parent_(std::move(parent)), p_(std::move(params)), psf_(std::move(psf))
{
    if (!parent_)
        throw ConfigurationError("Imager without parent element");
    if (p_.rows <= 0 || p_.cols <= 0)
        throw ConfigurationError("Imager: pixel geometry must be positive");
    if (p_.pixel_size_m <= 0.0 || p_.f_number <= 0.0 || p_.d_aperture_m <= 0.0)
        throw ConfigurationError("Imager: pixel size, f-number and aperture must be positive");
    if (p_.read_noise < 0.0 || p_.dark_current < 0.0)
        throw ConfigurationError("Imager: read noise and dark current must not be negative");
    if (p_.contained_pixels && *p_.contained_pixels < 1.0)
        throw ConfigurationError("Imager: the aperture must contain at least one pixel");
    if (p_.full_well && *p_.full_well <= 0.0)
        throw ConfigurationError("Imager: full well capacity must be positive");

    const Unit qe_unit = p_.quantum_efficiency.unit();
    if (qe_unit.dimensionless())
        p_.quantum_efficiency = SpectralQty(p_.quantum_efficiency.wl(),
                                            p_.quantum_efficiency.values() * qe_unit.factor_to(units::one),
                                            units::electron / units::photon,
                                            p_.quantum_efficiency.extrapolation(),
                                            p_.quantum_efficiency.wl_unit());
    else if (!qe_unit.equivalent(units::electron / units::photon))
        throw UnitMismatchError("Quantum efficiency must be given in electrons per photon, got '" +
                                qe_unit.to_string() + "'");

    size_ = parent_->size();
    mag_  = parent_->magnitude();
    if (size_ == TargetSize::Point && !psf_)
        throw ConfigurationError("Imager: a point source requires a PSF");

    // signal over the aperture area, background over the étendue of one pixel
    const SpectralQty signal     = parent_->signal();
    const SpectralQty background = parent_->background();
    const Real etendue = phys::pi * p_.pixel_size_m * p_.pixel_size_m /
                         (4.0 * p_.f_number * p_.f_number + 1.0);

    if (size_ == TargetSize::Point) {
        if (!signal.unit().equivalent(units::flux_density))
            throw UnitMismatchError("Point source signal must be a spectral flux density, got '" +
                                    signal.unit().to_string() + "'");
        const Real area = phys::pi * p_.d_aperture_m * p_.d_aperture_m / 4.0;
        signal_current_ = electron_current(signal, {area, units::m * units::m});
    } else {
        if (!signal.unit().equivalent(units::radiance))
            throw UnitMismatchError("Extended source signal must be a spectral radiance, got '" +
                                    signal.unit().to_string() + "'");
        signal_current_ = electron_current(signal, {etendue, units::m * units::m * units::sr});
    }
    background_current_ = electron_current(background, {etendue, units::m * units::m * units::sr});

    std::ostringstream os;
    os << "signal current " << signal_current_ << " e-/s"
       << (size_ == TargetSize::Point ? "" : " per pixel")
       << ", background current " << background_current_ << " e-/(pix s)";
    log::info(name(), os.str());
}

Real Imager::electron_current(const SpectralQty& q, const Quantity& collecting) const
{
    const Real fw = q.wl_unit().factor_to(units::nm);
    const SpectralQty power   = q * collecting;
    const SpectralQty photons = power.transform(
        [fw](Real l, Real v) { return v / phys::photon_energy(l * fw); },
        power.unit() / (units::J / units::photon));
    return band_limited(photons * p_.quantum_efficiency).integrate().to(units::electron_rate);
}

// Restricted to [wl_min, wl_max] of the configured grid, zero outside the source
SpectralQty Imager::band_limited(const SpectralQty& q) const
{
    if (p_.wl_bins.size() < 2) return q;
    const Real fw = q.wl_unit().factor_to(units::nm);
    const Real lo = p_.wl_bins.minCoeff(), hi = p_.wl_bins.maxCoeff();
    const Vector grid = merge_grids(q.wl() * fw, p_.wl_bins, lo, hi) / fw;
    return q.with_extrapolation(Extrapolation::Zero).rebin(grid);
}

/* ---------------------------------------------------------------- *
 *  photometric aperture                                            *
 * ---------------------------------------------------------------- */
Imager::Exposure Imager::expose(Real radius_px) const
{
    PixelMask mask(p_.rows, p_.cols, p_.pixel_size_m, p_.center_offset_px);
    if (size_ == TargetSize::Extended)
        mask.create_photometric_aperture(ApertureShape::Circle, 0.0, Eigen::Vector2d::Zero());
    else if (p_.contained_pixels)
        mask.create_photometric_aperture(ApertureShape::Square, radius_px);
    else
        mask.create_photometric_aperture(p_.shape, radius_px);

    Exposure e;
    e.box    = mask.bounds();
    e.radius = radius_px;
    e.pixels = mask.count();

    const Matrix sub = mask.mask().block(e.box.row0, e.box.col0, e.box.rows, e.box.cols);
    e.signal     = size_ == TargetSize::Point ? Matrix(psf_->map_to_pixel_mask(mask) * signal_current_)
                                              : Matrix(sub * signal_current_);
    e.background = sub * background_current_;
    e.dark       = sub * p_.dark_current;
    e.read       = sub * p_.read_noise;
    return e;
}

Real Imager::resolve_radius(const std::function<Real(const Exposure&)>& merit) const
{
    if (size_ == TargetSize::Extended) return 0.0;
    if (p_.contained_pixels) return std::sqrt(*p_.contained_pixels) / 2.0;
    if (p_.contained_energy.kind != ContainedEnergy::Kind::Min)
        return psf_->aperture_radius(p_.contained_energy);

    // largest radius worth trying: nearly all energy, at most the whole array
    const Real r_frame = 0.5 * std::hypot(static_cast<Real>(p_.rows), static_cast<Real>(p_.cols));
    const Real r_max   = std::min(r_frame, psf_->radius_for_fraction(0.999));

    Real best_r = kMinRadiusStep;
    Real best   = merit(expose(best_r));
    for (Real r = 2.0 * kMinRadiusStep; r <= r_max + 1e-9; r += kMinRadiusStep) {
        const Real m = merit(expose(r));
        if (m > best && (std::isinf(best) || m - best > 1e-12 * std::abs(best))) {
            best   = m;
            best_r = r;
        }
    }
    std::ostringstream os;
    os << "aperture radius maximising the SNR: " << best_r << " px";
    log::debug(name(), os.str());
    return best_r;
}

/* ---------------------------------------------------------------- *
 *  CCD equation                                                    *
 * ---------------------------------------------------------------- */
Real Imager::snr_of(const Exposure& e, Real t, Real scale)
{
    const Real s = e.signal.sum() * scale;
    const Real n = e.signal.sum() * scale + e.background.sum() + e.dark.sum();
    const Real r2 = e.read.squaredNorm();
    const Real var = t * n + r2;
    if (var <= 0.0) return 0.0;
    return s * t / std::sqrt(var);
}

Real Imager::time_of(const Exposure& e, Real snr, Real scale)
{
    const Real s  = e.signal.sum() * scale;
    const Real n  = s + e.background.sum() + e.dark.sum();
    const Real r2 = e.read.squaredNorm();
    if (s <= 0.0)
        throw NoSolutionError("Imager: no signal within the photometric aperture");

    // S² t² - SNR² (S + B + D) t - SNR² R² = 0
    const Real snr2 = snr * snr;
    const Real a = s * s;
    const Real b = -snr2 * n;
    const Real c = -snr2 * r2;
    const Real t = (-b + std::sqrt(b * b - 4.0 * a * c)) / (2.0 * a);
    if (!std::isfinite(t) || t <= 0.0)
        throw NoSolutionError("Imager: no positive exposure time reaches SNR " + std::to_string(snr));
    return t;
}

void Imager::check_saturation(const Exposure& e, Real t, Real scale) const
{
    if (!p_.full_well) return;
    const Real peak = (e.signal * scale + e.background + e.dark).maxCoeff() * t;
    if (peak > *p_.full_well) {
        std::ostringstream os;
        os << "Imager: peak pixel collects " << peak << " e- in " << t
           << " s, exceeding the full well capacity of " << *p_.full_well << " e-";
        throw SaturationError(os.str());
    }
}

PixelBreakdown Imager::breakdown(const Exposure& e, Real t, Real scale) const
{
    PixelBreakdown b;
    b.signal     = e.signal * scale * t;
    b.background = e.background * t;
    b.dark       = e.dark * t;
    b.read_noise = e.read;
    b.row0 = e.box.row0;
    b.col0 = e.box.col0;
    b.frame_rows = p_.rows;
    b.frame_cols = p_.cols;
    b.aperture_radius_px = e.radius;
    b.aperture_pixels    = e.pixels;
    return b;
}

void Imager::log_budget(const Exposure& e, Real t, Real scale) const
{
    if (!log::enabled(log::Level::Info)) return;
    const Real s  = e.signal.sum() * scale * t;
    const Real bg = e.background.sum() * t;
    const Real d  = e.dark.sum() * t;
    const Real r2 = e.read.squaredNorm();
    const Real n  = std::sqrt(s + bg + d + r2);

    char buf[256];
    std::snprintf(buf, sizeof buf, "aperture radius %.2f px, %ld pixels",
                  e.radius, static_cast<long>(e.pixels));
    log::info(name(), buf);
    std::snprintf(buf, sizeof buf, "t=%.4g s: signal %.4e e-, background %.4e e-, dark %.4e e-, "
                  "read noise %.4e e-, total noise %.4e e-", t, s, bg, d, std::sqrt(r2), n);
    log::info(name(), buf);
}

/* ---------------------------------------------------------------- *
 *  requests                                                        *
 * ---------------------------------------------------------------- */
SensorResult Imager::compute_snr(Real exposure_time) const
{
    if (!(exposure_time > 0.0))
        throw ConfigurationError("Imager: exposure time must be positive");

    const Real r = resolve_radius([&](const Exposure& e) { return snr_of(e, exposure_time, 1.0); });
    const Exposure e = expose(r);
    check_saturation(e, exposure_time, 1.0);
    log_budget(e, exposure_time, 1.0);

    SensorResult res;
    res.kind          = SensorResult::Kind::SNR;
    res.snr           = snr_of(e, exposure_time, 1.0);
    res.value         = res.snr;
    res.unit          = units::one;
    res.exposure_time = exposure_time;
    res.pixels        = breakdown(e, exposure_time, 1.0);
    return res;
}

SensorResult Imager::compute_exposure_time(Real snr) const
{
    if (!(snr > 0.0))
        throw ConfigurationError("Imager: SNR must be positive");

    const Real r = resolve_radius([&](const Exposure& e) {
        return e.signal.sum() > 0.0 ? -time_of(e, snr, 1.0) : -std::numeric_limits<Real>::infinity();
    });
    const Exposure e = expose(r);
    const Real t = time_of(e, snr, 1.0);
    check_saturation(e, t, 1.0);
    log_budget(e, t, 1.0);

    SensorResult res;
    res.kind          = SensorResult::Kind::ExposureTime;
    res.exposure_time = t;
    res.value         = t;
    res.unit          = units::s;
    res.snr           = snr;
    res.pixels        = breakdown(e, t, 1.0);
    return res;
}

SensorResult Imager::compute_sensitivity(Real exposure_time, Real snr) const
{
    if (!(exposure_time > 0.0) || !(snr > 0.0))
        throw ConfigurationError("Imager: exposure time and SNR must be positive");
    if (!mag_)
        throw ConfigurationError("Imager: sensitivity requires a target calibrated to a magnitude");

    const Real ref = *mag_;
    const bool adaptive = size_ == TargetSize::Point && !p_.contained_pixels &&
                          p_.contained_energy.kind == ContainedEnergy::Kind::Min;
    Real mag = ref, r = -1.0;
    Exposure e;
    // the 'min' aperture depends on the brightness: iterate until the radius settles
    for (int it = 0; it < (adaptive ? kMaxApertureIterations : 1); ++it) {
        const Real s = mag_scale(mag, ref);
        const Real r_new = resolve_radius([&](const Exposure& x) { return snr_of(x, exposure_time, s); });
        if (r_new == r) break;
        r = r_new;
        e = expose(r);
        mag = find_root_expanding(
            [&](Real m) { return snr_of(e, exposure_time, mag_scale(m, ref)) - snr; },
            ref, kMagStep, kMagLimit);
    }
    const Real scale = mag_scale(mag, ref);
    check_saturation(e, exposure_time, scale);
    log_budget(e, exposure_time, scale);

    SensorResult res;
    res.kind          = SensorResult::Kind::Sensitivity;
    res.value         = mag;
    res.unit          = units::one;
    res.exposure_time = exposure_time;
    res.snr           = snr;
    res.pixels        = breakdown(e, exposure_time, scale);
    return res;
}

} // namespace etcalc

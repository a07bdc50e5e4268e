#pragma once
#include "PSF.hpp"
#include "PixelMask.hpp"
#include "Sensor.hpp"

#include <functional>
#include <optional>

namespace etcalc {

struct ImagerParams {
    SpectralQty     quantum_efficiency = SpectralQty(Vector::Constant(1, 1.0), Vector::Constant(1, 1.0));
    Eigen::Index    rows = 1, cols = 1;              // pixel geometry
    Real            pixel_size_m  = 1e-5;
    Real            read_noise    = 0.0;             // e- rms per pixel
    Real            dark_current  = 0.0;             // e- / (pixel s)
    Real            f_number      = 1.0;
    Real            d_aperture_m  = 1.0;
    Eigen::Vector2d center_offset_px = Eigen::Vector2d::Zero();   // PSF centre, (x, y)
    ApertureShape   shape = ApertureShape::Circle;
    ContainedEnergy contained_energy;
    std::optional<Real> contained_pixels;            // overrides contained_energy
    std::optional<Real> full_well;                   // e- per pixel
    Vector          wl_bins;                         // nm, integration range; empty: whole spectra
};

/*
 * CCD / CMOS imager.  Counts follow the CCD equation
 *
 *      SNR = S t / sqrt( t (S + B + D) + R² )
 *
 * with S, B, D the electron rates of signal, background and dark current
 * summed over the photometric aperture and R² the summed read noise
 * variance.
 */
class Imager : public ISensor {
public:
    // psf may be null for extended targets
    Imager(RadiantPtr parent, ImagerParams params, PsfPtr psf);

    SensorResult compute_snr(Real exposure_time) const override;
    SensorResult compute_exposure_time(Real snr) const override;
    SensorResult compute_sensitivity(Real exposure_time, Real snr) const override;
    std::string name() const override { return "Imager"; }

    // Whole target (point) or per pixel (extended) signal, e- / s
    Real signal_current() const noexcept { return signal_current_; }
    // Background per pixel, e- / s
    Real background_current() const noexcept { return background_current_; }

    const IRadiant& parent() const noexcept { return *parent_; }

private:
    // Electron rates within the aperture bounding box
    struct Exposure {
        Matrix signal, background, dark, read;
        PixelMask::Bounds box;
        Real radius = 0.0;
        Eigen::Index pixels = 0;
    };

    Real electron_current(const SpectralQty& q, const Quantity& collecting) const;
    SpectralQty band_limited(const SpectralQty& q) const;

    Exposure expose(Real radius_px) const;
    Real resolve_radius(const std::function<Real(const Exposure&)>& merit) const;

    static Real snr_of(const Exposure& e, Real t, Real scale);
    static Real time_of(const Exposure& e, Real snr, Real scale);
    void check_saturation(const Exposure& e, Real t, Real scale) const;
    PixelBreakdown breakdown(const Exposure& e, Real t, Real scale) const;
    void log_budget(const Exposure& e, Real t, Real scale) const;

    RadiantPtr   parent_;
    ImagerParams p_;
    PsfPtr       psf_;

    TargetSize          size_;
    std::optional<Real> mag_;
    Real signal_current_     = 0.0;
    Real background_current_ = 0.0;
};

} // namespace etcalc

#pragma once
#include "AkimaSpline.hpp"
#include "PSF.hpp"

#include <optional>

namespace etcalc {

struct AiryParams {
    Real f_number      = 1.0;
    Real wl_nm         = 500.0;   // wavelength the pattern is computed for
    Real d_aperture_m  = 1.0;
    Real pixel_size_m  = 1e-5;
    int  osf           = 10;      // oversampling of a detector pixel
    Real jitter_sigma_arcsec = 0.0;
    Real obstruction   = 0.0;     // A_ob / A_ap
};

/*
 * Diffraction pattern of a circular aperture with a central obstruction
 * of linear ratio ε = sqrt(A_ob / A_ap).  Internally radii are reduced
 * angles y in units of λ / D.
 */
class AiryPSF : public IPSF {
public:
    explicit AiryPSF(const AiryParams& p);

    Real fraction_enclosed(Real radius_px) const override;
    Matrix image(Eigen::Index rows, Eigen::Index cols, int osf,
                 const Eigen::Vector2d& centre) const override;
    Real peak_radius() const override;
    Real fwhm_radius() const override;
    int osf() const override { return params_.osf; }
    std::string name() const override { return "AiryPSF"; }

    // Peak normalised intensity at x = π y
    static Real airy(Real x, Real eps = 0.0);
    // Encircled energy within x = π y, 1 at infinity
    static Real airy_int(Real x, Real eps = 0.0);

    // Size of a detector pixel in λ / D
    Real pixel_scale() const noexcept { return px_; }

private:
    Real intensity(Real y) const;           // jitter included
    Real first_zero() const;                // in λ / D
    void build_jitter_profile();

    AiryParams params_;
    Real eps_;
    Real px_;
    Real norm_;                             // ∫ airy d²y

    // radial profile with pointing jitter
    Vector                     radii_;
    Vector                     profile_;
    Vector                     enclosed_;
    std::optional<AkimaSpline> profile_spline_;
};

} // namespace etcalc

#pragma once
#include "PSF.hpp"

namespace etcalc {

// Sampled PSF as delivered by an optical design tool
struct PsfGrid {
    Matrix          values;            // relative intensities, (row, col)
    Real            grid_delta_m = 0;  // edge length of a grid cell on the focal plane
    Eigen::Vector2d centre { 0, 0 };   // (row, col) of the PSF centre on the grid
};

struct GriddedParams {
    Real f_number     = 1.0;
    Real d_aperture_m = 1.0;
    Real pixel_size_m = 1e-5;
    int  osf          = 10;
    Real jitter_sigma_arcsec = 0.0;
};

/*
 * PSF from a 2D grid.  The grid is oversampled (bilinear) to at least
 * `osf` samples per detector pixel, blurred with the pointing jitter and
 * normalised to unit energy.
 */
class GriddedPSF : public IPSF {
public:
    GriddedPSF(PsfGrid grid, const GriddedParams& p, std::string name = "GriddedPSF");

    Real fraction_enclosed(Real radius_px) const override;
    Matrix image(Eigen::Index rows, Eigen::Index cols, int osf,
                 const Eigen::Vector2d& centre) const override;
    Real peak_radius() const override;
    Real fwhm_radius() const override;
    int osf() const override { return params_.osf; }
    std::string name() const override { return name_; }

    // Working grid after oversampling and jitter; sums to 1
    const Matrix& samples() const noexcept { return work_; }
    Real sample_size() const noexcept { return step_; }

private:
    // Energy fraction per m² at a focal plane offset (row, col direction) in metres
    Real density(Real dy_m, Real dx_m) const;
    // Azimuthal mean of the working grid in rings of one sample width
    Vector radial_profile() const;

    GriddedParams   params_;
    std::string     name_;
    Matrix          work_;
    Real            step_;
    Eigen::Vector2d centre_;
};

} // namespace etcalc

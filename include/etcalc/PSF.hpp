#pragma once
#include "PixelMask.hpp"
#include "Types.hpp"

#include <memory>
#include <string>

namespace etcalc {

// Energy to be contained in the photometric aperture
struct ContainedEnergy {
    enum class Kind {
        Percent,   // explicit percentage of the total PSF energy
        Peak,      // up to the first zero (minimum) of the PSF profile
        FWHM,      // up to the half-maximum radius
        Min        // aperture maximising the SNR, chosen by the detector
    };
    Kind kind    = Kind::FWHM;
    Real percent = 0.0;

    static ContainedEnergy from_percent(Real p);
    // "peak" | "fwhm" | "min" | "<number>" (case insensitive)
    static ContainedEnergy parse(const std::string& s);
    std::string to_string() const;
};

/*
 * Point spread function on the focal plane.  Radii are given in
 * detector pixels from the PSF centre; pointing jitter configured on the
 * model is always included.
 */
class IPSF {
public:
    virtual ~IPSF() = default;

    // Fraction of the total energy inside `radius_px`, monotonic, → 1
    virtual Real fraction_enclosed(Real radius_px) const = 0;

    /*
     * Energy fractions on a (rows·osf) × (cols·osf) sub-pixel grid.
     * `centre` is the PSF centre in (row, col) pixel index coordinates
     * of the grid's native resolution.
     */
    virtual Matrix image(Eigen::Index rows, Eigen::Index cols, int osf,
                         const Eigen::Vector2d& centre) const = 0;

    // Radius of the first minimum of the profile
    virtual Real peak_radius() const = 0;
    // Radius where the profile falls to half of its maximum
    virtual Real fwhm_radius() const = 0;

    virtual int osf() const = 0;
    virtual std::string name() const = 0;

    // Radius containing `fraction` (0..1) of the energy
    Real radius_for_fraction(Real fraction) const;

    // Radius for a contained-energy request other than Kind::Min
    Real aperture_radius(const ContainedEnergy& ce) const;

    /*
     * Energy fraction of each aperture pixel, restricted to the mask's
     * bounding box (see PixelMask::bounds()).  Pixels outside the
     * aperture are zero.
     */
    Matrix map_to_pixel_mask(const PixelMask& mask) const;
};

using PsfPtr = std::shared_ptr<const IPSF>;

} // namespace etcalc

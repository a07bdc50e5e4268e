#pragma once
#include "Types.hpp"

#include <optional>
#include <string>

namespace etcalc {

enum class ApertureShape { Circle, Square };

// "circle" | "square" (case insensitive); throws ConfigurationError otherwise
ApertureShape parse_aperture_shape(const std::string& s);

/*
 * Exposure mask of a detector array.  Indices are (row, col) with the
 * origin in the upper left corner; a pixel centre sits at integer
 * indices.  Offsets are given in pixels as (x, y) = (col, row).
 */
class PixelMask {
public:
    struct Bounds {
        Eigen::Index row0 = 0, col0 = 0;   // first row / column
        Eigen::Index rows = 0, cols = 0;   // extent
    };

    PixelMask(Eigen::Index rows, Eigen::Index cols, Real pixel_size_m,
              Eigen::Vector2d psf_offset_px = Eigen::Vector2d::Zero());

    Eigen::Index rows() const noexcept { return mask_.rows(); }
    Eigen::Index cols() const noexcept { return mask_.cols(); }
    Real pixel_size() const noexcept { return pixel_size_; }

    // Centre of the array, (row, col)
    Eigen::Vector2d center_ind() const;
    // Centre of the PSF, (row, col)
    Eigen::Vector2d psf_center_ind() const { return psf_center_; }

    /*
     * Mark the pixels of a photometric aperture with 1.  A circle takes
     * every pixel whose centre lies within `radius_px`, a square every
     * pixel within `radius_px` (half the side length) in both directions.
     * The pixel closest to the centre is always part of the aperture.
     * `offset_px` is relative to the array centre; without it the
     * aperture is centred on the PSF.
     */
    void create_photometric_aperture(ApertureShape shape, Real radius_px,
                                     std::optional<Eigen::Vector2d> offset_px = std::nullopt);

    const Matrix& mask() const noexcept { return mask_; }
    Eigen::Index count() const;

    // Smallest rectangle holding all marked pixels; ConfigurationError if none
    Bounds bounds() const;

private:
    Matrix          mask_;
    Real            pixel_size_;
    Eigen::Vector2d psf_center_;
};

} // namespace etcalc

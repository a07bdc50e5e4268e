#include "etcalc/PixelMask.hpp"
#include "etcalc/Errors.hpp"
#include "etcalc/Log.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace etcalc {

ApertureShape parse_aperture_shape(const std::string& s)
{
    std::string l = s;
    std::transform(l.begin(), l.end(), l.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (l == "circle") return ApertureShape::Circle;
    if (l == "square") return ApertureShape::Square;
    throw ConfigurationError("Unknown photometric aperture shape '" + s + "'");
}

PixelMask::PixelMask(Eigen::Index rows, Eigen::Index cols, Real pixel_size_m,
                     Eigen::Vector2d psf_offset_px)
    : mask_(Matrix::Zero(rows, cols)), pixel_size_(pixel_size_m)
{
    if (rows <= 0 || cols <= 0)
        throw ConfigurationError("Pixel geometry must be positive");
    if (pixel_size_m <= 0.0)
        throw ConfigurationError("Pixel size must be positive");
    psf_center_ = center_ind() + Eigen::Vector2d(psf_offset_px.y(), psf_offset_px.x());
}

Eigen::Vector2d PixelMask::center_ind() const
{
    return {rows() / 2.0 - 0.5, cols() / 2.0 - 0.5};
}

void PixelMask::create_photometric_aperture(ApertureShape shape, Real radius_px,
                                            std::optional<Eigen::Vector2d> offset_px)
{
    if (radius_px < 0.0)
        throw ConfigurationError("Negative photometric aperture radius");

    const Eigen::Vector2d c = offset_px
        ? Eigen::Vector2d(center_ind() + Eigen::Vector2d(offset_px->y(), offset_px->x()))
        : psf_center_;
    const Real yc = c.x(), xc = c.y();

    if (xc - radius_px < 0.0 || yc - radius_px < 0.0 ||
        xc + radius_px > cols() - 1 || yc + radius_px > rows() - 1)
        log::warning("PixelMask", "Some parts of the photometric aperture are outside of the array.");

    const Real eps = 1e-9;
    for (Eigen::Index r = 0; r < rows(); ++r) {
        for (Eigen::Index q = 0; q < cols(); ++q) {
            const Real dy = r - yc, dx = q - xc;
            const bool inside = shape == ApertureShape::Circle
                ? dx * dx + dy * dy <= radius_px * radius_px + eps
                : std::abs(dx) <= radius_px + eps && std::abs(dy) <= radius_px + eps;
            if (inside) mask_(r, q) = 1.0;
        }
    }

    const auto r0 = static_cast<Eigen::Index>(std::lround(yc));
    const auto c0 = static_cast<Eigen::Index>(std::lround(xc));
    if (r0 >= 0 && r0 < rows() && c0 >= 0 && c0 < cols())
        mask_(r0, c0) = 1.0;
}

Eigen::Index PixelMask::count() const
{
    return (mask_.array() != 0.0).count();
}

PixelMask::Bounds PixelMask::bounds() const
{
    Eigen::Index rmin = rows(), rmax = -1, cmin = cols(), cmax = -1;
    for (Eigen::Index r = 0; r < rows(); ++r)
        for (Eigen::Index q = 0; q < cols(); ++q)
            if (mask_(r, q) != 0.0) {
                rmin = std::min(rmin, r); rmax = std::max(rmax, r);
                cmin = std::min(cmin, q); cmax = std::max(cmax, q);
            }
    if (rmax < 0)
        throw ConfigurationError("Photometric aperture does not cover any pixel of the array");
    return {rmin, cmin, rmax - rmin + 1, cmax - cmin + 1};
}

} // namespace etcalc

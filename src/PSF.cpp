#include "etcalc/PSF.hpp"
#include "etcalc/Errors.hpp"
#include "etcalc/ImageOps.hpp"
#include "etcalc/RootFinding.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace etcalc {

/* ---------------------------------------------------------------- */
ContainedEnergy ContainedEnergy::from_percent(Real p)
{
    if (!(p > 0.0 && p < 100.0))
        throw ConfigurationError("Contained energy must be within (0, 100) percent");
    return {Kind::Percent, p};
}

ContainedEnergy ContainedEnergy::parse(const std::string& s)
{
    std::string l = s;
    std::transform(l.begin(), l.end(), l.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (l == "peak") return {Kind::Peak, 0.0};
    if (l == "fwhm") return {Kind::FWHM, 0.0};
    if (l == "min")  return {Kind::Min,  0.0};

    std::size_t pos = 0;
    double p = 0.0;
    try {
        p = std::stod(l, &pos);
    } catch (const std::logic_error&) {
        throw ConfigurationError("Contained energy must be a percentage or one of "
                                 "[peak, FWHM, min], got '" + s + "'");
    }
    if (pos != l.size())
        throw ConfigurationError("Trailing characters in contained energy '" + s + "'");
    return from_percent(p);
}

std::string ContainedEnergy::to_string() const
{
    switch (kind) {
    case Kind::Peak: return "peak";
    case Kind::FWHM: return "FWHM";
    case Kind::Min:  return "min";
    case Kind::Percent: break;
    }
    std::ostringstream os;
    os << percent << " %";
    return os.str();
}

/* ---------------------------------------------------------------- */
Real IPSF::radius_for_fraction(Real fraction) const
{
    if (!(fraction > 0.0 && fraction < 1.0))
        throw ConfigurationError("Encircled energy fraction must be within (0, 1)");

    Real hi = 1.0;
    for (int i = 0; fraction_enclosed(hi) < fraction; ++i) {
        if (i > 20)
            throw NoSolutionError(name() + ": encircled energy of " +
                                  std::to_string(fraction) + " is never reached");
        hi *= 2.0;
    }
    // sampled PSFs give a step function; radii need no more than 24 bits
    return find_root([&](Real r) { return fraction_enclosed(r) - fraction; }, 0.0, hi,
                     kMaxRootIterations, 24);
}

Real IPSF::aperture_radius(const ContainedEnergy& ce) const
{
    switch (ce.kind) {
    case ContainedEnergy::Kind::Peak:    return peak_radius();
    case ContainedEnergy::Kind::FWHM:    return fwhm_radius();
    case ContainedEnergy::Kind::Percent: return radius_for_fraction(ce.percent / 100.0);
    case ContainedEnergy::Kind::Min:     break;
    }
    throw ConfigurationError(name() + ": the 'min' aperture depends on the detector noise");
}

Matrix IPSF::map_to_pixel_mask(const PixelMask& mask) const
{
    const PixelMask::Bounds b = mask.bounds();
    const Eigen::Vector2d centre =
        mask.psf_center_ind() - Eigen::Vector2d(static_cast<Real>(b.row0), static_cast<Real>(b.col0));

    const int k = osf();
    const Matrix binned = bin_down(image(b.rows, b.cols, k, centre), k);
    return binned.cwiseProduct(mask.mask().block(b.row0, b.col0, b.rows, b.cols));
}

} // namespace etcalc

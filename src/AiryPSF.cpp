#include "etcalc/AiryPSF.hpp"
#include "etcalc/Errors.hpp"
#include "etcalc/ImageOps.hpp"
#include "etcalc/Log.hpp"
#include "etcalc/Physics.hpp"
#include "etcalc/Rebin.hpp"
#include "etcalc/RootFinding.hpp"

#include <boost/math/quadrature/gauss_kronrod.hpp>
#include <boost/math/special_functions/bessel.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

namespace etcalc {

namespace {
constexpr Real kWindow     = 10.0;   // λ / D rendered around the centre for jitter
constexpr Eigen::Index kMaxHalfWidth = 600;

inline Real j0(Real x) { return boost::math::cyl_bessel_j(0, x); }
inline Real j1(Real x) { return boost::math::cyl_bessel_j(1, x); }
} // anonymous namespace

AiryPSF::AiryPSF(const AiryParams& p) : params_(p)
{
    if (p.f_number <= 0.0 || p.wl_nm <= 0.0 || p.d_aperture_m <= 0.0 || p.pixel_size_m <= 0.0)
        throw ConfigurationError("AiryPSF: f-number, wavelength, aperture and pixel size must be positive");
    if (p.osf < 1)
        throw ConfigurationError("AiryPSF: oversampling factor must be >= 1");
    if (p.obstruction < 0.0 || p.obstruction >= 1.0)
        throw ConfigurationError("AiryPSF: obstruction must be within [0, 1)");
    if (p.jitter_sigma_arcsec < 0.0)
        throw ConfigurationError("AiryPSF: negative jitter sigma");

    eps_  = std::sqrt(p.obstruction);
    px_   = p.pixel_size_m / (p.f_number * p.wl_nm * 1e-9);
    norm_ = 4.0 / (phys::pi * (1.0 - eps_ * eps_));

    if (p.jitter_sigma_arcsec > 0.0)
        build_jitter_profile();
}

/* ---------------------------------------------------------------- *
 *  analytic pattern                                                *
 * ---------------------------------------------------------------- */
Real AiryPSF::airy(Real x, Real eps)
{
    if (std::abs(x) < 1e-8) return 1.0;
    if (eps <= 0.0) {
        const Real v = 2.0 * j1(x) / x;
        return v * v;
    }
    const Real v = 2.0 * (j1(x) - eps * j1(eps * x)) / x;
    const Real n = 1.0 - eps * eps;
    return v * v / (n * n);
}

Real AiryPSF::airy_int(Real x, Real eps)
{
    if (!std::isfinite(x)) return 1.0;
    if (x <= 0.0) return 0.0;

    const Real unobstructed = 1.0 - j0(x) * j0(x) - j1(x) * j1(x);
    if (eps <= 0.0) return unobstructed;

    const Real ex = eps * x;
    const Real cross = boost::math::quadrature::gauss_kronrod<Real, 61>::integrate(
        [eps](Real t) { return t > 0.0 ? j1(t) * j1(eps * t) / t : 0.0; },
        0.0, x, 15, 1e-9);
    const Real r = (unobstructed + eps * eps * (1.0 - j0(ex) * j0(ex) - j1(ex) * j1(ex))
                    - 4.0 * eps * cross) / (1.0 - eps * eps);
    return std::clamp(r, 0.0, 1.0);
}

Real AiryPSF::first_zero() const
{
    auto g = [this](Real x) { return j1(x) - eps_ * j1(eps_ * x); };
    Real lo = 0.5;
    for (Real hi = lo + 0.05; hi < 40.0; lo = hi, hi += 0.05) {
        if ((g(lo) > 0.0) != (g(hi) > 0.0))
            return find_root(g, lo, hi) / phys::pi;
    }
    throw NoSolutionError("AiryPSF: no zero of the diffraction pattern found");
}

/* ---------------------------------------------------------------- *
 *  pointing jitter                                                 *
 * ---------------------------------------------------------------- */
void AiryPSF::build_jitter_profile()
{
    const Real sigma = params_.jitter_sigma_arcsec * phys::arcsec *
                       params_.d_aperture_m / (params_.wl_nm * 1e-9);
    const Real window = kWindow + 5.0 * sigma;

    Real dx = px_ / params_.osf;
    Eigen::Index hw = static_cast<Eigen::Index>(std::ceil(window / dx));
    if (hw > kMaxHalfWidth) {
        hw = kMaxHalfWidth;
        dx = window / static_cast<Real>(hw);
    }
    const Eigen::Index n = 2 * hw + 1;

    Matrix img(n, n);
    for (Eigen::Index r = 0; r < n; ++r)
        for (Eigen::Index c = 0; c < n; ++c) {
            const Real y = std::hypot(static_cast<Real>(r - hw), static_cast<Real>(c - hw)) * dx;
            img(r, c) = airy(phys::pi * y, eps_);
        }
    const Matrix blurred = gaussian_blur(img, sigma / dx);
    const Real scale = img.sum() / blurred.sum();

    radii_.resize(hw + 1);
    profile_.resize(hw + 1);
    for (Eigen::Index k = 0; k <= hw; ++k) {
        radii_[k]   = k * dx;
        profile_[k] = blurred(hw, hw + k) * scale;
    }

    // E(r) = ∫ 2π r' I(r') dr' / norm
    enclosed_ = Vector::Zero(hw + 1);
    for (Eigen::Index k = 1; k <= hw; ++k) {
        const Real a = radii_[k - 1] * profile_[k - 1];
        const Real b = radii_[k] * profile_[k];
        enclosed_[k] = enclosed_[k - 1] + phys::pi * (a + b) * dx / norm_;
    }
    profile_spline_.emplace(radii_, profile_, Extrapolation::Zero);

    std::ostringstream os;
    os << "jitter sigma " << sigma << " lambda/D, profile of " << hw + 1
       << " samples up to " << radii_[hw] << " lambda/D";
    log::debug(name(), os.str());
}

Real AiryPSF::intensity(Real y) const
{
    if (profile_spline_) {
        if (y <= radii_[radii_.size() - 1])
            return std::max(0.0, (*profile_spline_)(y));
        return airy(phys::pi * y, eps_);
    }
    return airy(phys::pi * y, eps_);
}

/* ---------------------------------------------------------------- */
Real AiryPSF::fraction_enclosed(Real radius_px) const
{
    if (radius_px <= 0.0) return 0.0;
    const Real y = radius_px * px_;
    const Real analytic = airy_int(phys::pi * y, eps_);
    if (!profile_spline_) return analytic;

    const Real y_max = radii_[radii_.size() - 1];
    if (y >= y_max)
        return std::min(1.0, std::max(enclosed_[enclosed_.size() - 1], analytic));
    return std::min(1.0, interp_linear(radii_, enclosed_, y));
}

Matrix AiryPSF::image(Eigen::Index rows, Eigen::Index cols, int osf,
                      const Eigen::Vector2d& centre) const
{
    if (osf < 1)
        throw ConfigurationError("AiryPSF: oversampling factor must be >= 1");
    const Real d = px_ / osf;
    const Real area = d * d / norm_;

    Matrix out(rows * osf, cols * osf);
    for (Eigen::Index r = 0; r < out.rows(); ++r) {
        const Real pr = (r + 0.5) / osf - 0.5 - centre.x();
        for (Eigen::Index c = 0; c < out.cols(); ++c) {
            const Real pc = (c + 0.5) / osf - 0.5 - centre.y();
            out(r, c) = intensity(std::hypot(pr, pc) * px_) * area;
        }
    }
    return out;
}

Real AiryPSF::peak_radius() const
{
    return first_zero() / px_;
}

Real AiryPSF::fwhm_radius() const
{
    if (!profile_spline_)
        return find_root([this](Real y) { return airy(phys::pi * y, eps_) - 0.5; },
                         0.0, first_zero()) / px_;

    const Real half = 0.5 * profile_[0];
    return find_root([&](Real y) { return std::max(0.0, (*profile_spline_)(y)) - half; },
                     0.0, radii_[radii_.size() - 1]) / px_;
}

} // namespace etcalc

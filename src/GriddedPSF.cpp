#include "etcalc/GriddedPSF.hpp"
#include "etcalc/Errors.hpp"
#include "etcalc/ImageOps.hpp"
#include "etcalc/Log.hpp"
#include "etcalc/Physics.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace etcalc {

namespace {
// Bilinear sample of m at fractional (row, col); zero outside the grid
Real bilinear(const Matrix& m, Real r, Real c)
{
    if (r < 0.0 || c < 0.0 || r > m.rows() - 1 || c > m.cols() - 1) return 0.0;
    const auto r0 = static_cast<Eigen::Index>(std::floor(r));
    const auto c0 = static_cast<Eigen::Index>(std::floor(c));
    const Eigen::Index r1 = std::min<Eigen::Index>(r0 + 1, m.rows() - 1);
    const Eigen::Index c1 = std::min<Eigen::Index>(c0 + 1, m.cols() - 1);
    const Real fr = r - r0, fc = c - c0;
    return (1 - fr) * ((1 - fc) * m(r0, c0) + fc * m(r0, c1)) +
                fr  * ((1 - fc) * m(r1, c0) + fc * m(r1, c1));
}
} // anonymous namespace

GriddedPSF::GriddedPSF(PsfGrid grid, const GriddedParams& p, std::string name)
    : params_(p), name_(std::move(name))
{
    if (grid.values.size() == 0)
        throw ConfigurationError(name_ + ": empty PSF grid");
    if (grid.grid_delta_m <= 0.0)
        throw ConfigurationError(name_ + ": grid spacing must be positive");
    if (!(grid.centre.x() >= 0.0 && grid.centre.x() <= grid.values.rows() - 1 &&
          grid.centre.y() >= 0.0 && grid.centre.y() <= grid.values.cols() - 1)) {
        std::ostringstream os;
        os << name_ << ": PSF centre (" << grid.centre.x() << ", " << grid.centre.y()
           << ") outside of the " << grid.values.rows() << "x" << grid.values.cols() << " grid";
        throw ConfigurationError(os.str());
    }
    if (p.f_number <= 0.0 || p.d_aperture_m <= 0.0 || p.pixel_size_m <= 0.0)
        throw ConfigurationError(name_ + ": f-number, aperture and pixel size must be positive");
    if (p.osf < 1)
        throw ConfigurationError(name_ + ": oversampling factor must be >= 1");
    if (p.jitter_sigma_arcsec < 0.0)
        throw ConfigurationError(name_ + ": negative jitter sigma");

    /* ---- oversample -------------------------------------------------- */
    const Matrix src = grid.values.cwiseMax(0.0);
    const int k = std::max(1, static_cast<int>(std::ceil(
        grid.grid_delta_m / (p.pixel_size_m / p.osf) - 1e-9)));
    step_ = grid.grid_delta_m / k;

    if (k == 1) {
        work_   = src;
        centre_ = grid.centre;
    } else {
        work_.resize(src.rows() * k, src.cols() * k);
        for (Eigen::Index r = 0; r < work_.rows(); ++r)
            for (Eigen::Index c = 0; c < work_.cols(); ++c)
                work_(r, c) = bilinear(src, (r + 0.5) / k - 0.5, (c + 0.5) / k - 0.5);
        centre_ = ((grid.centre.array() + 0.5) * k - 0.5).matrix();
    }

    /* ---- jitter ------------------------------------------------------ */
    if (p.jitter_sigma_arcsec > 0.0) {
        // angular jitter → focal plane
        const Real sigma = p.jitter_sigma_arcsec * phys::arcsec * p.f_number * p.d_aperture_m / step_;
        const Eigen::Index hw = gaussian_half_width(sigma);
        work_ = gaussian_blur(pad(work_, hw), sigma);
        centre_.array() += static_cast<Real>(hw);
    }

    const Real total = work_.sum();
    if (!(total > 0.0))
        throw ConfigurationError(name_ + ": PSF grid carries no energy");
    work_ /= total;

    std::ostringstream os;
    os << "grid " << work_.rows() << "x" << work_.cols() << " samples of "
       << step_ * 1e6 << " um, oversampled by " << k;
    log::debug(name_, os.str());
}

Real GriddedPSF::density(Real dy_m, Real dx_m) const
{
    return bilinear(work_, centre_.x() + dy_m / step_, centre_.y() + dx_m / step_) / (step_ * step_);
}

Real GriddedPSF::fraction_enclosed(Real radius_px) const
{
    if (radius_px <= 0.0) return 0.0;
    if (!std::isfinite(radius_px)) return 1.0;
    const Real r2 = std::pow(radius_px * params_.pixel_size_m / step_, 2);

    Real sum = 0.0;
    for (Eigen::Index r = 0; r < work_.rows(); ++r)
        for (Eigen::Index c = 0; c < work_.cols(); ++c) {
            const Real dr = r - centre_.x(), dc = c - centre_.y();
            if (dr * dr + dc * dc <= r2) sum += work_(r, c);
        }
    return std::min(1.0, sum);
}

Matrix GriddedPSF::image(Eigen::Index rows, Eigen::Index cols, int osf,
                         const Eigen::Vector2d& centre) const
{
    if (osf < 1)
        throw ConfigurationError(name_ + ": oversampling factor must be >= 1");
    const Real p    = params_.pixel_size_m;
    const Real area = std::pow(p / osf, 2);

    Matrix out(rows * osf, cols * osf);
    for (Eigen::Index r = 0; r < out.rows(); ++r) {
        const Real dy = ((r + 0.5) / osf - 0.5 - centre.x()) * p;
        for (Eigen::Index c = 0; c < out.cols(); ++c) {
            const Real dx = ((c + 0.5) / osf - 0.5 - centre.y()) * p;
            out(r, c) = density(dy, dx) * area;
        }
    }
    return out;
}

Vector GriddedPSF::radial_profile() const
{
    // farthest sample from the centre is one of the corners
    const Real dr = std::max(centre_.x(), work_.rows() - 1 - centre_.x());
    const Real dc = std::max(centre_.y(), work_.cols() - 1 - centre_.y());
    const auto n  = static_cast<Eigen::Index>(std::ceil(std::hypot(dr, dc))) + 1;
    Vector sum = Vector::Zero(n), cnt = Vector::Zero(n);

    for (Eigen::Index r = 0; r < work_.rows(); ++r)
        for (Eigen::Index c = 0; c < work_.cols(); ++c) {
            const auto b = static_cast<Eigen::Index>(
                std::lround(std::hypot(r - centre_.x(), c - centre_.y())));
            sum[b] += work_(r, c);
            cnt[b] += 1.0;
        }

    Eigen::Index used = n;
    while (used > 1 && cnt[used - 1] == 0.0) --used;
    Vector prof(used);
    for (Eigen::Index i = 0; i < used; ++i)
        prof[i] = cnt[i] > 0.0 ? sum[i] / cnt[i] : 0.0;
    return prof;
}

Real GriddedPSF::peak_radius() const
{
    const Vector prof = radial_profile();
    const Real to_px = step_ / params_.pixel_size_m;
    for (Eigen::Index i = 1; i + 1 < prof.size(); ++i)
        if (prof[i] <= 0.0 || prof[i + 1] > prof[i])
            return i * to_px;
    return (prof.size() - 1) * to_px;
}

Real GriddedPSF::fwhm_radius() const
{
    const Vector prof = radial_profile();
    const Real to_px = step_ / params_.pixel_size_m;
    const Real half  = 0.5 * prof.maxCoeff();
    for (Eigen::Index i = 1; i < prof.size(); ++i)
        if (prof[i] < half && prof[i - 1] >= half) {
            const Real t = (prof[i - 1] - half) / (prof[i - 1] - prof[i]);
            return (i - 1 + t) * to_px;
        }
    throw NoSolutionError(name_ + ": PSF never falls below half of its maximum");
}

} // namespace etcalc

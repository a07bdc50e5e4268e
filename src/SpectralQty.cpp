#include "etcalc/SpectralQty.hpp"
#include "etcalc/Errors.hpp"
#include "etcalc/Rebin.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <ostream>
#include <sstream>

namespace etcalc {

namespace {

constexpr Real kInf = std::numeric_limits<Real>::infinity();

bool same_grid(const Vector& a, const Vector& b)
{
    if (a.size() != b.size()) return false;
    for (Eigen::Index i = 0; i < a.size(); ++i)
        if (a[i] != b[i]) return false;
    return true;
}

// Effective lower/upper wavelength bound of a quantity
Real lower_bound_of(const SpectralQty& q)
{
    return q.extrapolation() == Extrapolation::None ? q.wl_min() : -kInf;
}
Real upper_bound_of(const SpectralQty& q)
{
    return q.extrapolation() == Extrapolation::None ? q.wl_max() : kInf;
}

// Sample q on `grid`; outside its range the quantity contributes zero
Vector sample_zero_filled(const SpectralQty& q, const Vector& grid)
{
    Vector out(grid.size());
    for (Eigen::Index i = 0; i < grid.size(); ++i) {
        const Real x = grid[i];
        if ((x < q.wl_min() || x > q.wl_max()) &&
            q.extrapolation() != Extrapolation::Linear)
            out[i] = 0.0;
        else
            out[i] = q.at(x);
    }
    return out;
}

// Express b's wavelength grid in a's wavelength unit
SpectralQty align_wl_unit(const SpectralQty& a, const SpectralQty& b)
{
    if (a.wl_unit() == b.wl_unit()) return b;
    const Real f = b.wl_unit().factor_to(a.wl_unit());
    return SpectralQty(b.wl() * f, b.values(), b.unit(), b.extrapolation(), a.wl_unit());
}

Extrapolation combined_policy(const SpectralQty& a, const SpectralQty& b)
{
    // the more restrictive of the two
    return static_cast<Extrapolation>(std::min(static_cast<int>(a.extrapolation()),
                                               static_cast<int>(b.extrapolation())));
}

enum class GridMode { Union, Overlap };

template <typename Op>
SpectralQty combine(const SpectralQty& a, const SpectralQty& b_in,
                    GridMode mode, const Unit& result_unit, Real b_factor, Op op,
                    const char* what)
{
    const SpectralQty b = align_wl_unit(a, b_in);

    if (same_grid(a.wl(), b.wl())) {
        Vector v(a.size());
        for (Eigen::Index i = 0; i < a.size(); ++i)
            v[i] = op(a.values()[i], b.values()[i] * b_factor);
        return SpectralQty(a.wl(), std::move(v), result_unit,
                           combined_policy(a, b), a.wl_unit());
    }

    Vector grid;
    Vector va, vb;
    if (mode == GridMode::Union) {
        grid = merge_grids(a.wl(), b.wl(), -kInf, kInf);
        va = sample_zero_filled(a, grid);
        vb = sample_zero_filled(b, grid);
    } else {
        const Real lo = std::max(lower_bound_of(a), lower_bound_of(b));
        const Real hi = std::min(upper_bound_of(a), upper_bound_of(b));
        if (lo > hi)
            throw DomainError(std::string("Spectral ranges do not overlap for ") + what);
        grid = merge_grids(a.wl(), b.wl(), lo, hi);
        if (grid.size() == 0)
            throw DomainError(std::string("No common wavelength samples for ") + what);
        va = sample_zero_filled(a, grid);
        vb = sample_zero_filled(b, grid);
    }

    Vector v(grid.size());
    for (Eigen::Index i = 0; i < grid.size(); ++i)
        v[i] = op(va[i], vb[i] * b_factor);
    return SpectralQty(std::move(grid), std::move(v), result_unit,
                       combined_policy(a, b), a.wl_unit());
}

} // namespace

/* ==============================================================
 *  construction
 * =============================================================*/
SpectralQty::SpectralQty(Vector wl, Vector values, Unit unit,
                         Extrapolation extrapolation, Unit wl_unit)
    : wl_(std::move(wl)),
      values_(std::move(values)),
      unit_(unit),
      wl_unit_(wl_unit),
      extrapolation_(extrapolation)
{
    if (wl_.size() != values_.size())
        throw ConfigurationError("SpectralQty: wavelength and value arrays differ in length");
    if (wl_.size() == 0)
        throw ConfigurationError("SpectralQty: empty wavelength grid");
    if (!wl_unit_.equivalent(units::m))
        throw UnitMismatchError("SpectralQty: wavelength unit '" + wl_unit_.to_string() +
                                "' is not a length");
    for (Eigen::Index i = 1; i < wl_.size(); ++i)
        if (!(wl_[i] > wl_[i - 1]))
            throw ConfigurationError("SpectralQty: wavelengths must be strictly increasing");
}

SpectralQty SpectralQty::constant(const Vector& wl, Real value, Unit unit,
                                  Extrapolation extrapolation)
{
    return SpectralQty(wl, Vector::Constant(wl.size(), value), unit, extrapolation);
}

SpectralQty SpectralQty::from_function(const Vector& wl,
                                       const std::function<Real(Real)>& f,
                                       Unit unit, Unit wl_unit)
{
    Vector v(wl.size());
    for (Eigen::Index i = 0; i < wl.size(); ++i) v[i] = f(wl[i]);
    return SpectralQty(wl, std::move(v), unit, Extrapolation::None, wl_unit);
}

/* ==============================================================
 *  sampling
 * =============================================================*/
Real SpectralQty::at(Real wl) const
{
    if (wl < wl_min() || wl > wl_max()) {
        switch (extrapolation_) {
        case Extrapolation::None: {
            std::ostringstream os;
            os << "Wavelength " << wl << " outside of [" << wl_min() << ", " << wl_max() << "]";
            throw DomainError(os.str());
        }
        case Extrapolation::Zero:
            return 0.0;
        case Extrapolation::Linear:
            break;
        }
    }
    return interp_linear(wl_, values_, wl);
}

SpectralQty SpectralQty::rebin(const Vector& grid) const
{
    if (grid.size() == 0)
        throw DomainError("SpectralQty::rebin: empty target grid");
    if (extrapolation_ == Extrapolation::None &&
        (grid.minCoeff() < wl_min() || grid.maxCoeff() > wl_max())) {
        std::ostringstream os;
        os << "Rebinning grid [" << grid.minCoeff() << ", " << grid.maxCoeff()
           << "] extends beyond the source range [" << wl_min() << ", " << wl_max() << "]";
        throw DomainError(os.str());
    }
    Vector v(grid.size());
    for (Eigen::Index i = 0; i < grid.size(); ++i) v[i] = at(grid[i]);
    return SpectralQty(grid, std::move(v), unit_, extrapolation_, wl_unit_);
}

Quantity SpectralQty::integrate() const
{
    return {trapz(wl_, values_), unit_ * wl_unit_};
}

SpectralQty SpectralQty::to(const Unit& target) const
{
    const Real f = unit_.factor_to(target);
    return SpectralQty(wl_, values_ * f, target, extrapolation_, wl_unit_);
}

SpectralQty SpectralQty::with_extrapolation(Extrapolation e) const
{
    return SpectralQty(wl_, values_, unit_, e, wl_unit_);
}

SpectralQty SpectralQty::transform(const std::function<Real(Real, Real)>& f,
                                   Unit result_unit) const
{
    Vector v(values_.size());
    for (Eigen::Index i = 0; i < v.size(); ++i) v[i] = f(wl_[i], values_[i]);
    return SpectralQty(wl_, std::move(v), result_unit, extrapolation_, wl_unit_);
}

bool SpectralQty::approx_equal(const SpectralQty& other, Real rel_tol, Real abs_tol) const
{
    if (!unit_.equivalent(other.unit_) || !wl_unit_.equivalent(other.wl_unit_))
        return false;
    if (size() != other.size()) return false;

    const Real fwl = other.wl_unit_.factor_to(wl_unit_);
    const Real fv  = other.unit_.factor_to(unit_);
    auto close = [&](Real x, Real y) {
        return std::abs(x - y) <= std::max(rel_tol * std::max(std::abs(x), std::abs(y)), abs_tol);
    };
    for (Eigen::Index i = 0; i < size(); ++i) {
        if (!close(wl_[i], other.wl_[i] * fwl)) return false;
        if (!close(values_[i], other.values_[i] * fv)) return false;
    }
    return true;
}

/* ==============================================================
 *  arithmetic
 * =============================================================*/
SpectralQty operator+(const SpectralQty& a, const SpectralQty& b)
{
    if (!a.unit().equivalent(b.unit()))
        throw UnitMismatchError("Units are not matching for addition: '" + a.unit().to_string() +
                                "' + '" + b.unit().to_string() + "'");
    return combine(a, b, GridMode::Union, a.unit(), b.unit().factor_to(a.unit()),
                   [](Real x, Real y) { return x + y; }, "addition");
}

SpectralQty operator-(const SpectralQty& a, const SpectralQty& b)
{
    if (!a.unit().equivalent(b.unit()))
        throw UnitMismatchError("Units are not matching for subtraction: '" + a.unit().to_string() +
                                "' - '" + b.unit().to_string() + "'");
    return combine(a, b, GridMode::Overlap, a.unit(), b.unit().factor_to(a.unit()),
                   [](Real x, Real y) { return x - y; }, "subtraction");
}

SpectralQty operator*(const SpectralQty& a, const SpectralQty& b)
{
    return combine(a, b, GridMode::Overlap, a.unit() * b.unit(), 1.0,
                   [](Real x, Real y) { return x * y; }, "multiplication");
}

SpectralQty operator/(const SpectralQty& a, const SpectralQty& b)
{
    return combine(a, b, GridMode::Overlap, a.unit() / b.unit(), 1.0,
                   [](Real x, Real y) { return x / y; }, "division");
}

SpectralQty operator*(const SpectralQty& a, Real k)
{
    return SpectralQty(a.wl(), a.values() * k, a.unit(), a.extrapolation(), a.wl_unit());
}

SpectralQty operator*(Real k, const SpectralQty& a) { return a * k; }

SpectralQty operator/(const SpectralQty& a, Real k)
{
    return SpectralQty(a.wl(), a.values() / k, a.unit(), a.extrapolation(), a.wl_unit());
}

SpectralQty operator*(const SpectralQty& a, const Quantity& k)
{
    return SpectralQty(a.wl(), a.values() * k.value, a.unit() * k.unit,
                       a.extrapolation(), a.wl_unit());
}

SpectralQty operator*(const Quantity& k, const SpectralQty& a) { return a * k; }

SpectralQty operator/(const SpectralQty& a, const Quantity& k)
{
    return SpectralQty(a.wl(), a.values() / k.value, a.unit() / k.unit,
                       a.extrapolation(), a.wl_unit());
}

SpectralQty operator+(const SpectralQty& a, const Quantity& k)
{
    const Real v = k.to(a.unit());
    return SpectralQty(a.wl(), (a.values().array() + v).matrix(), a.unit(),
                       a.extrapolation(), a.wl_unit());
}

SpectralQty operator+(const SpectralQty& a, Real k)
{
    return a + Quantity{k, units::one};
}

SpectralQty operator-(Real k, const SpectralQty& a)
{
    if (!a.unit().dimensionless())
        throw UnitMismatchError("Cannot subtract '" + a.unit().to_string() +
                                "' from a dimensionless scalar");
    const Real f = a.unit().factor_to(units::one);
    return SpectralQty(a.wl(), (k - (a.values() * f).array()).matrix(), units::one,
                       a.extrapolation(), a.wl_unit());
}

std::ostream& operator<<(std::ostream& os, const SpectralQty& q)
{
    os << "SpectralQty[" << q.size() << " samples, "
       << q.wl_min() << " .. " << q.wl_max() << " " << q.wl_unit().to_string()
       << ", unit '" << q.unit().to_string() << "']";
    return os;
}

} // namespace etcalc

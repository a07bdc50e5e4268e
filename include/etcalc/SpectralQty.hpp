#pragma once
#include "Types.hpp"
#include "Units.hpp"

#include <functional>
#include <iosfwd>

namespace etcalc {

// Behaviour when a spectral quantity is sampled outside its wavelength range
enum class Extrapolation {
    None,     // resampling outside the range is a DomainError
    Zero,     // the quantity is zero outside the range
    Linear    // extend the outermost segments linearly
};

/*
 * A physical quantity sampled on a strictly increasing wavelength grid.
 *
 * Instances are immutable: every operation returns a new object.  Binary
 * operations between two spectral quantities resample both operands onto
 * the union of their grids first.  Addition treats each operand as zero
 * outside its own range; subtraction, multiplication and division are
 * restricted to the range where both operands are defined.
 */
class SpectralQty {
public:
    SpectralQty(Vector wl,
                Vector values,
                Unit unit = units::one,
                Extrapolation extrapolation = Extrapolation::None,
                Unit wl_unit = units::nm);

    static SpectralQty constant(const Vector& wl,
                                Real value,
                                Unit unit = units::one,
                                Extrapolation extrapolation = Extrapolation::None);

    // Sample f(λ) on the given grid, λ in `wl_unit`
    static SpectralQty from_function(const Vector& wl,
                                     const std::function<Real(Real)>& f,
                                     Unit unit,
                                     Unit wl_unit = units::nm);

    const Vector& wl()      const noexcept { return wl_; }
    const Vector& values()  const noexcept { return values_; }
    const Unit&   unit()    const noexcept { return unit_; }
    const Unit&   wl_unit() const noexcept { return wl_unit_; }
    Extrapolation extrapolation() const noexcept { return extrapolation_; }

    Eigen::Index size() const noexcept { return wl_.size(); }
    Real wl_min() const { return wl_[0]; }
    Real wl_max() const { return wl_[wl_.size() - 1]; }

    // Value at a single wavelength, honouring the extrapolation policy
    Real at(Real wl) const;

    // Linear resampling onto `grid` (same wavelength unit)
    SpectralQty rebin(const Vector& grid) const;

    // ∫ q dλ ; the result unit gains the wavelength unit
    Quantity integrate() const;

    // Convert the values to an equivalent unit
    SpectralQty to(const Unit& target) const;

    SpectralQty with_extrapolation(Extrapolation e) const;

    // Apply f(λ, value) element-wise
    SpectralQty transform(const std::function<Real(Real, Real)>& f, Unit result_unit) const;

    // Grid and values within a relative tolerance (plus an absolute floor)
    bool approx_equal(const SpectralQty& other,
                      Real rel_tol = 1e-5,
                      Real abs_tol = 0.0) const;

    bool operator==(const SpectralQty& other) const { return approx_equal(other); }

private:
    Vector        wl_;
    Vector        values_;
    Unit          unit_;
    Unit          wl_unit_;
    Extrapolation extrapolation_ = Extrapolation::None;
};

SpectralQty operator+(const SpectralQty& a, const SpectralQty& b);
SpectralQty operator-(const SpectralQty& a, const SpectralQty& b);
SpectralQty operator*(const SpectralQty& a, const SpectralQty& b);
SpectralQty operator/(const SpectralQty& a, const SpectralQty& b);

// Scalars: bare doubles are dimensionless
SpectralQty operator*(const SpectralQty& a, Real k);
SpectralQty operator*(Real k, const SpectralQty& a);
SpectralQty operator/(const SpectralQty& a, Real k);
SpectralQty operator*(const SpectralQty& a, const Quantity& k);
SpectralQty operator*(const Quantity& k, const SpectralQty& a);
SpectralQty operator/(const SpectralQty& a, const Quantity& k);

// Addition of a scalar requires a dimensionless quantity
SpectralQty operator+(const SpectralQty& a, Real k);
SpectralQty operator-(Real k, const SpectralQty& a);
SpectralQty operator+(const SpectralQty& a, const Quantity& k);

std::ostream& operator<<(std::ostream& os, const SpectralQty& q);

} // namespace etcalc

#pragma once

#include "SpectralQty.hpp"
#include "Types.hpp"
#include <boost/math/interpolators/makima.hpp>

#include <vector>

namespace etcalc {

// Modified Akima interpolation of tabulated y(x), x strictly increasing
class AkimaSpline {
private:
    mutable decltype(boost::math::interpolators::makima(
        std::vector<Real>(), std::vector<Real>())) spline_;

    Real x_min_, x_max_;
    Real y_min_, y_max_;
    Real deriv_min_, deriv_max_;
    Extrapolation extrapolation_;

public:
    // Needs at least four samples
    AkimaSpline(const Vector& x, const Vector& y,
                Extrapolation extrapolation = Extrapolation::Zero);

    Real x_min() const noexcept { return x_min_; }
    Real x_max() const noexcept { return x_max_; }

    // Throws DomainError outside [x_min, x_max] under Extrapolation::None
    Real operator()(Real x) const;
    Vector operator()(const Vector& x) const;
};

} // namespace etcalc

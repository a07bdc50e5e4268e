#pragma once
#include "Types.hpp"

namespace etcalc {

// Linear interpolation of y(x) at xi, x strictly increasing.  Values
// outside [x_0, x_n] are extrapolated linearly from the closest segment.
Real interp_linear(const Vector& x, const Vector& y, Real xi);

Vector interp_linear(const Vector& x, const Vector& y, const Vector& xi);

// Trapezoidal integral of y(x)
Real trapz(const Vector& x, const Vector& y);

// Sorted union of two strictly increasing grids, restricted to [lo, hi]
Vector merge_grids(const Vector& a, const Vector& b, Real lo, Real hi);

} // namespace etcalc

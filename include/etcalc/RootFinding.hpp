#pragma once
#include "Types.hpp"

#include <functional>

namespace etcalc {

inline constexpr int kMaxRootIterations = 200;

/*
 * Root of f in [lo, hi] by TOMS 748, to `bits` binary digits.  f(lo)
 * and f(hi) must differ in sign; otherwise, or when the iteration cap is
 * hit, NoSolutionError.
 */
Real find_root(const std::function<Real(Real)>& f, Real lo, Real hi,
               int max_iter = kMaxRootIterations, int bits = 48);

/*
 * Root of a monotonic f near x0.  The bracket [x0 - k·step, x0 + k·step]
 * grows until it changes sign or exceeds `limit` from x0.
 */
Real find_root_expanding(const std::function<Real(Real)>& f, Real x0,
                         Real step, Real limit,
                         int max_iter = kMaxRootIterations);

} // namespace etcalc

#include "etcalc/RootFinding.hpp"
#include "etcalc/Errors.hpp"

#include <boost/math/tools/roots.hpp>

#include <cmath>
#include <cstdint>
#include <sstream>

namespace etcalc {

Real find_root(const std::function<Real(Real)>& f, Real lo, Real hi, int max_iter, int bits)
{
    const Real flo = f(lo);
    const Real fhi = f(hi);
    if (!std::isfinite(flo) || !std::isfinite(fhi)) {
        std::ostringstream os;
        os << "Root finding: non-finite function value at [" << lo << ", " << hi << "]";
        throw NoSolutionError(os.str());
    }
    if (flo == 0.0) return lo;
    if (fhi == 0.0) return hi;
    if ((flo > 0.0) == (fhi > 0.0)) {
        std::ostringstream os;
        os << "Root finding: no sign change in [" << lo << ", " << hi << "]";
        throw NoSolutionError(os.str());
    }

    std::uintmax_t it = static_cast<std::uintmax_t>(max_iter);
    const auto tol = boost::math::tools::eps_tolerance<Real>(bits);
    const auto r = boost::math::tools::toms748_solve(f, lo, hi, flo, fhi, tol, it);
    if (it >= static_cast<std::uintmax_t>(max_iter))
        throw NoSolutionError("Root finding: no convergence within " +
                              std::to_string(max_iter) + " iterations");
    return 0.5 * (r.first + r.second);
}

Real find_root_expanding(const std::function<Real(Real)>& f, Real x0,
                         Real step, Real limit, int max_iter)
{
    if (step <= 0.0)
        throw NoSolutionError("Root finding: bracket step must be positive");

    const Real f0 = f(x0);
    if (f0 == 0.0) return x0;

    for (Real d = step; d <= limit + 1e-12; d += step) {
        const Real lo = x0 - d, hi = x0 + d;
        const Real flo = f(lo);
        if ((flo > 0.0) != (f0 > 0.0)) return find_root(f, lo, x0, max_iter);
        const Real fhi = f(hi);
        if ((fhi > 0.0) != (f0 > 0.0)) return find_root(f, x0, hi, max_iter);
    }
    std::ostringstream os;
    os << "Root finding: no sign change within " << limit << " of " << x0;
    throw NoSolutionError(os.str());
}

} // namespace etcalc

#include "etcalc/Rebin.hpp"
#include <algorithm>
#include <cmath>
#include <vector>

namespace etcalc {

/* -------------------------------------------------------------- *
 *  linear interpolation of y(x) for a *monotonic* array          *
 * -------------------------------------------------------------- */
Real interp_linear(const Vector& x, const Vector& y, Real xi)
{
    const Eigen::Index n = x.size();
    if (n == 1) return y[0];

    Eigen::Index hi;
    if (xi <= x[0])
        hi = 1;
    else if (xi >= x[n - 1])
        hi = n - 1;
    else
        hi = static_cast<Eigen::Index>(
                 std::upper_bound(x.data(), x.data() + n, xi) - x.data());
    const Eigen::Index lo = hi - 1;

    const Real w = (xi - x[lo]) / (x[hi] - x[lo]);
    return y[lo] * (1.0 - w) + y[hi] * w;
}

Vector interp_linear(const Vector& x, const Vector& y, const Vector& xi)
{
    Vector out(xi.size());
    for (Eigen::Index i = 0; i < xi.size(); ++i)
        out[i] = interp_linear(x, y, xi[i]);
    return out;
}

Real trapz(const Vector& x, const Vector& y)
{
    Real sum = 0.0;
    for (Eigen::Index i = 1; i < x.size(); ++i)
        sum += 0.5 * (y[i] + y[i - 1]) * (x[i] - x[i - 1]);
    return sum;
}

/* -------------------------------------------------------------- *
 *  union of two grids; points closer than a relative 1e-12 are   *
 *  considered identical                                          *
 * -------------------------------------------------------------- */
Vector merge_grids(const Vector& a, const Vector& b, Real lo, Real hi)
{
    std::vector<Real> g;
    g.reserve(a.size() + b.size());
    for (Eigen::Index i = 0; i < a.size(); ++i)
        if (a[i] >= lo && a[i] <= hi) g.push_back(a[i]);
    for (Eigen::Index i = 0; i < b.size(); ++i)
        if (b[i] >= lo && b[i] <= hi) g.push_back(b[i]);

    std::sort(g.begin(), g.end());
    g.erase(std::unique(g.begin(), g.end(),
                        [](Real p, Real q) {
                            return std::abs(p - q) <= 1e-12 * std::abs(p);
                        }),
            g.end());
    return Eigen::Map<Vector>(g.data(), static_cast<Eigen::Index>(g.size()));
}

} // namespace etcalc

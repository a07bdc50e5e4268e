#include "etcalc/AkimaSpline.hpp"
#include "etcalc/Errors.hpp"

#include <string>

namespace etcalc {

namespace {
std::vector<Real> to_std(const Vector& v, const char* what)
{
    if (v.size() < 4)
        throw ConfigurationError(std::string("AkimaSpline: at least four ") + what +
                                 " samples required");
    return std::vector<Real>(v.data(), v.data() + v.size());
}
} // anonymous namespace

AkimaSpline::AkimaSpline(const Vector& x, const Vector& y, Extrapolation extrapolation)
    : spline_(to_std(x, "x"), to_std(y, "y")),
      x_min_(x[0]),
      x_max_(x[x.size() - 1]),
      extrapolation_(extrapolation)
{
    y_min_ = spline_(x_min_);
    y_max_ = spline_(x_max_);

    // one-sided slopes for linear extrapolation
    const Real h = 1e-6 * (x_max_ - x_min_);
    deriv_min_ = (spline_(x_min_ + h) - y_min_) / h;
    deriv_max_ = (y_max_ - spline_(x_max_ - h)) / h;
}

Real AkimaSpline::operator()(Real x) const
{
    if (x >= x_min_ && x <= x_max_)
        return spline_(x);

    switch (extrapolation_) {
    case Extrapolation::Zero:
        return 0.0;
    case Extrapolation::Linear:
        return x < x_min_ ? y_min_ + deriv_min_ * (x - x_min_)
                          : y_max_ + deriv_max_ * (x - x_max_);
    case Extrapolation::None:
        break;
    }
    throw DomainError("AkimaSpline: " + std::to_string(x) + " outside of [" +
                      std::to_string(x_min_) + ", " + std::to_string(x_max_) + "]");
}

Vector AkimaSpline::operator()(const Vector& x) const
{
    Vector out(x.size());
    for (Eigen::Index i = 0; i < x.size(); ++i) {
        out[i] = operator()(x[i]);
    }
    return out;
}

} // namespace etcalc

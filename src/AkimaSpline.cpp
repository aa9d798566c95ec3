#include "snclass/AkimaSpline.hpp"
#include <stdexcept>

namespace snclass {

static std::vector<Real> checked_knots(const Vector& x, const Vector& y)
{
    if (x.size() != y.size())
        throw std::invalid_argument("AkimaSpline: x and y differ in length");
    if (x.size() < AkimaSpline::kMinKnots)
        throw std::invalid_argument("AkimaSpline: need at least "
                                    + std::to_string(AkimaSpline::kMinKnots)
                                    + " knots, got " + std::to_string(x.size()));
    return std::vector<Real>(x.data(), x.data() + x.size());
}

AkimaSpline::AkimaSpline(const Vector& x, const Vector& y)
    : spline_(checked_knots(x, y),
              std::vector<Real>(y.data(), y.data() + y.size())),
      x_min_(x[0]),
      x_max_(x[x.size() - 1]),
      y_min_(y[0]),
      y_max_(y[y.size() - 1])
{}

Real AkimaSpline::operator()(Real x) const
{
    if (x <= x_min_) return y_min_;
    if (x >= x_max_) return y_max_;
    return spline_(x);
}

Vector AkimaSpline::operator()(const Vector& x) const
{
    Vector out(x.size());
    for (Eigen::Index i = 0; i < x.size(); ++i)
        out[i] = operator()(x[i]);
    return out;
}

} // namespace snclass

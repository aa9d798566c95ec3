#pragma once

#include "Types.hpp"
#include <boost/math/interpolators/makima.hpp>
#include <vector>

namespace snclass {

/*
 * Modified Akima spline through (x, y) knots.  x must be strictly
 * increasing with at least four knots.  Outside the knot range the
 * spline is held at its end values.
 */
class AkimaSpline {
private:
    using Impl = decltype(boost::math::interpolators::makima(
        std::vector<Real>(), std::vector<Real>()));

    mutable Impl spline_;
    Real x_min_, x_max_;
    Real y_min_, y_max_;

public:
    static constexpr int kMinKnots = 4;

    AkimaSpline(const Vector& x, const Vector& y);

    Real operator()(Real x) const;
    Vector operator()(const Vector& x) const;
};

} // namespace snclass

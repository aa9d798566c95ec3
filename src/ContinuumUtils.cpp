#include "snclass/ContinuumUtils.hpp"
#include "snclass/AkimaSpline.hpp"
#include <algorithm>
#include <cmath>

namespace snclass {

Vector minmax_scale(const Vector& f)
{
    if (f.size() == 0) return f;
    const double lo = f.minCoeff();
    const double hi = f.maxCoeff();
    if (!(hi - lo > 1e-12 * std::max(1.0, std::abs(hi))))
        return Vector::Zero(f.size());
    return ((f.array() - lo) / (hi - lo)).matrix();
}

/* ---------------------------------------------------------------------- */
Vector fit_continuum(const Vector& lambda, const Vector& flux,
                     Eigen::Index begin, Eigen::Index end, int knots)
{
    Vector cont = Vector::Ones(flux.size());
    const Eigen::Index n = end - begin;
    if (knots < AkimaSpline::kMinKnots || n < 2 * knots) return cont;

    Vector kx(knots), ky(knots);
    for (int k = 0; k < knots; ++k) {
        const Eigen::Index a = begin + (n * k) / knots;
        const Eigen::Index b = begin + (n * (k + 1)) / knots;
        kx[k] = lambda.segment(a, b - a).mean();
        ky[k] = flux.segment(a, b - a).mean();
    }
    if ((ky.array() <= 0.0).any()) return cont;         // no usable continuum

    const AkimaSpline spline(kx, ky);
    for (Eigen::Index i = begin; i < end; ++i) {
        const double c = spline(lambda[i]);
        cont[i] = c > 0.0 ? c : 1.0;
    }
    return cont;
}

Vector remove_continuum(const Vector& lambda, const Vector& flux,
                        Eigen::Index begin, Eigen::Index end, int knots)
{
    const Vector plus = (flux.array() + 1.0).matrix();
    const Vector cont = fit_continuum(lambda, plus, begin, end, knots);

    Vector out = Vector::Zero(flux.size());
    if (end <= begin) return out;

    const Vector divided = (plus.segment(begin, end - begin).array()
                            / cont.segment(begin, end - begin).array() - 1.0).matrix();
    out.segment(begin, end - begin) = minmax_scale(divided);
    return out;
}

/* ---------------------------------------------------------------------- */
Vector mean_zero(const Vector& f, Eigen::Index begin, Eigen::Index end)
{
    Vector out = f;
    if (end <= begin) return out;
    const double m = f.segment(begin, end - begin).mean();
    out.segment(begin, end - begin).array() -= m;
    return out;
}

Vector apodize(const Vector& f, Eigen::Index begin, Eigen::Index end,
               double fraction)
{
    Vector out = f;
    const auto nsquash = static_cast<Eigen::Index>(f.size() * fraction);
    if (nsquash <= 1 || end <= begin) return out;

    for (Eigen::Index i = 0; i < nsquash; ++i) {
        const Eigen::Index lo = begin + i;
        const Eigen::Index hi = end - 1 - i;
        if (lo > hi) break;
        const double factor = 0.5 * (1.0 - std::cos(M_PI * i / (nsquash - 1)));
        out[lo] *= factor;
        if (hi != lo) out[hi] *= factor;
    }
    return out;
}

Vector fill_outside(const Vector& f, Eigen::Index begin, Eigen::Index end,
                    double value)
{
    Vector out = f;
    out.head(std::max<Eigen::Index>(begin, 0)).setConstant(value);
    out.tail(std::max<Eigen::Index>(f.size() - end, 0)).setConstant(value);
    return out;
}

} // namespace snclass

#pragma once
#include "Types.hpp"

namespace snclass {

/*
 * Flux conditioning helpers.  All of them act on a grid-sized flux and a
 * half-open valid range [begin, end); bins outside the range are treated
 * as padding.
 */

// (f - min) / (max - min); a constant input maps to zeros
Vector minmax_scale(const Vector& f);

/**
 * Smooth continuum of `flux` over [begin, end): the range is split into
 * `knots` equal segments, the (λ, flux) means of each become the knots of
 * a modified Akima spline.  Outside the range, and when there are too few
 * bins for a spline, the continuum is 1.
 */
Vector fit_continuum(const Vector& lambda, const Vector& flux,
                     Eigen::Index begin, Eigen::Index end, int knots);

/**
 * (flux + 1) / continuum(flux + 1) - 1, min-max scaled over the valid
 * range and zero outside it.
 */
Vector remove_continuum(const Vector& lambda, const Vector& flux,
                        Eigen::Index begin, Eigen::Index end, int knots);

// subtract the mean of [begin, end) from that range only
Vector mean_zero(const Vector& f, Eigen::Index begin, Eigen::Index end);

// cosine bell over int(size * fraction) bins at both valid edges
Vector apodize(const Vector& f, Eigen::Index begin, Eigen::Index end,
               double fraction);

Vector fill_outside(const Vector& f, Eigen::Index begin, Eigen::Index end,
                    double value);

} // namespace snclass

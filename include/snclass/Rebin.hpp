#pragma once
#include "Types.hpp"

namespace snclass {

/*
 * Linear interpolation of y(x) onto the (sorted) points x_out.  Points
 * outside [x_0, x_{n-1}] receive `fill`.  The half-open index range of
 * covered output points is returned through [begin, end); begin == end
 * when nothing overlaps.
 */
Vector interp_onto(const Vector& x,
                   const Vector& y,
                   const Vector& x_out,
                   double        fill,
                   Eigen::Index& begin,
                   Eigen::Index& end);

/*
 * Running median of odd width over y[begin, end).  The window shrinks
 * symmetrically near the range edges; values outside the range are
 * copied unchanged.
 */
Vector median_filter(const Vector& y, int width,
                     Eigen::Index begin, Eigen::Index end);

} // namespace snclass

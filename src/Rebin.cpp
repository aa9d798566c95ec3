#include "snclass/Rebin.hpp"
#include "snclass/Spectrum.hpp"
#include <algorithm>
#include <stdexcept>

namespace snclass {

/* ==============================================================
 *  interp_onto
 * =============================================================*/
Vector interp_onto(const Vector& x,
                   const Vector& y,
                   const Vector& x_out,
                   double        fill,
                   Eigen::Index& begin,
                   Eigen::Index& end)
{
    const Eigen::Index n_in  = x.size();
    const Eigen::Index n_out = x_out.size();
    if (n_in < 2 || y.size() != n_in)
        throw std::invalid_argument("interp_onto(): need >= 2 matching samples");

    Vector out = Vector::Constant(n_out, fill);
    const double lo = x[0];
    const double hi = x[n_in - 1];

    begin = std::lower_bound(x_out.data(), x_out.data() + n_out, lo) - x_out.data();
    end   = std::upper_bound(x_out.data(), x_out.data() + n_out, hi) - x_out.data();
    if (end <= begin) {
        begin = end = 0;
        return out;
    }

    /* single forward scan; x_out is sorted */
    Eigen::Index seg = 0;
    for (Eigen::Index k = begin; k < end; ++k) {
        const double xi = x_out[k];
        while (seg < n_in - 2 && x[seg + 1] < xi) ++seg;

        const double dx = x[seg + 1] - x[seg];
        const double w  = (xi - x[seg]) / dx;
        out[k] = y[seg] * (1.0 - w) + y[seg + 1] * w;
    }
    return out;
}

/* ==============================================================
 *  median_filter
 * =============================================================*/
Vector median_filter(const Vector& y, int width,
                     Eigen::Index begin, Eigen::Index end)
{
    Vector out = y;
    if (width < 3 || end - begin < 3) return out;

    const Eigen::Index half = width / 2;
    for (Eigen::Index i = begin; i < end; ++i) {
        const Eigen::Index h = std::min({half, i - begin, end - 1 - i});
        out[i] = median(y.segment(i - h, 2 * h + 1));
    }
    return out;
}

} // namespace snclass

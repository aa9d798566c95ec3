#include "snclass/CrossCorrelation.hpp"
#include "snclass/Errors.hpp"
#include <algorithm>
#include <cmath>
#include <exception>
#include <sstream>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace snclass {

namespace {

/* --------------------------------------------------------------------
 *  mean-zeroed flux inside [begin, end), zero elsewhere
 * ------------------------------------------------------------------*/
Vector prepare(const Spectrum& s)
{
    Vector out = Vector::Zero(s.flux.size());
    const Eigen::Index n = s.valid_size();
    const auto seg = s.flux.segment(s.valid_begin, n);
    out.segment(s.valid_begin, n) = (seg.array() - seg.mean()).matrix();
    return out;
}

/* --------------------------------------------------------------------
 *  correlation function over all lags  -(N-1) … N-1
 * ------------------------------------------------------------------*/
struct Correlation {
    Eigen::Index        offset;     // index of lag 0
    std::vector<double> c;
    std::vector<int>    overlap;    // overlapping bins, 0 = invalid lag

    bool valid(Eigen::Index k) const
    {
        const Eigen::Index i = k + offset;
        return i >= 0 && i < static_cast<Eigen::Index>(c.size()) && overlap[i] > 0;
    }
    double at(Eigen::Index k) const { return c[k + offset]; }
};

Correlation correlate(const Vector& x, Eigen::Index xb, Eigen::Index xe,
                      const Vector& y, Eigen::Index yb, Eigen::Index ye,
                      int min_overlap)
{
    const Eigen::Index N = x.size();
    Correlation cc;
    cc.offset = N - 1;
    cc.c.assign(static_cast<std::size_t>(2 * N - 1), 0.0);
    cc.overlap.assign(static_cast<std::size_t>(2 * N - 1), 0);

    const double sx = std::sqrt(x.squaredNorm() / N);
    const double sy = std::sqrt(y.squaredNorm() / N);
    const double norm = N * sx * sy;
    if (!(norm > 0.0)) return cc;

    for (Eigen::Index k = -(N - 1); k <= N - 1; ++k) {
        const Eigen::Index lo = std::max(xb, yb + k);
        const Eigen::Index hi = std::min(xe, ye + k);
        const Eigen::Index len = hi - lo;
        if (len < min_overlap || len <= 0) continue;

        const double sum = x.segment(lo, len).dot(y.segment(lo - k, len));
        cc.c[k + cc.offset]       = sum / norm;
        cc.overlap[k + cc.offset] = static_cast<int>(len);
    }
    return cc;
}

// distance (bins, interpolated) from k0 to where c drops below half
double half_width(const Correlation& cc, Eigen::Index k0, int dir, double half)
{
    Eigen::Index k = k0;
    while (cc.valid(k + dir)) {
        const double a = cc.at(k);
        const double b = cc.at(k + dir);
        if (b < half) return std::abs(k - k0) + (a - half) / (a - b);
        k += dir;
    }
    return static_cast<double>(std::abs(k - k0));
}

} // unnamed namespace

/* ==================================================================== */
CrossCorrelationMatcher::CrossCorrelationMatcher(GridPtr grid, MatcherConfig cfg)
    : grid_(std::move(grid)), cfg_(cfg)
{
    if (!grid_)
        throw ConfigurationError("CrossCorrelationMatcher: no wavelength grid");
    if (!(cfg_.z_min > -1.0) || !(cfg_.z_max > cfg_.z_min))
        throw ConfigurationError("matcher: need -1 < zMin < zMax");
    if (!(cfg_.lap_min >= 0.0))
        throw ConfigurationError("matcher: lapMin must be >= 0");
}

void CrossCorrelationMatcher::check_on_grid_(const Spectrum& s, const char* what) const
{
    if (s.flux.size() != grid_->size())
        throw ValidationError(std::string(what) + " '" + s.file_name + "' has "
                              + std::to_string(s.flux.size())
                              + " bins, the template grid has "
                              + std::to_string(grid_->size()));
    if (s.state == ProcessingState::Raw || s.valid_size() <= 0 ||
        s.valid_begin < 0 || s.valid_end > s.flux.size())
        throw ValidationError(std::string(what) + " '" + s.file_name
                              + "' is not normalized onto the template grid");
}

/* -------------------------------------------------------------------- */
std::optional<TemplateMatch>
CrossCorrelationMatcher::score(const Spectrum& spectrum, const Template& tmpl) const
{
    check_on_grid_(spectrum, "spectrum");
    check_on_grid_(tmpl.spectrum, "template");

    const double dwlog = grid_->dwlog();
    const Vector x = prepare(spectrum);
    const Vector y = prepare(tmpl.spectrum);
    const int min_overlap = std::max(1, static_cast<int>(std::ceil(cfg_.lap_min / dwlog - 1e-9)));

    const Correlation cc = correlate(x, spectrum.valid_begin, spectrum.valid_end,
                                     y, tmpl.spectrum.valid_begin, tmpl.spectrum.valid_end,
                                     min_overlap);

    /* ---------------- peak inside the redshift window ---------------- */
    const auto kmin = static_cast<Eigen::Index>(std::ceil(grid_->shift_of_redshift(cfg_.z_min) - 1e-9));
    const auto kmax = static_cast<Eigen::Index>(std::floor(grid_->shift_of_redshift(cfg_.z_max) + 1e-9));

    Eigen::Index kpk = 0;
    bool have = false;
    for (Eigen::Index k = kmin; k <= kmax; ++k) {
        if (!cc.valid(k)) continue;
        if (!have || cc.at(k) > cc.at(kpk)) { kpk = k; have = true; }
    }
    if (!have || !(cc.at(kpk) > 0.0)) return std::nullopt;

    /* ---------------- parabolic refinement --------------------------- */
    double shift = static_cast<double>(kpk);
    double h     = cc.at(kpk);
    if (cc.valid(kpk - 1) && cc.valid(kpk + 1)) {
        const double cm = cc.at(kpk - 1), c0 = cc.at(kpk), cp = cc.at(kpk + 1);
        const double den = cm - 2.0 * c0 + cp;
        if (den < 0.0) {
            const double d = std::clamp(0.5 * (cm - cp) / den, -0.5, 0.5);
            shift += d;
            h = c0 - 0.25 * (cm - cp) * d;
        }
    }
    const double z = std::clamp(grid_->redshift_of_shift(shift), cfg_.z_min, cfg_.z_max);

    /* ---------------- antisymmetric noise ---------------------------- */
    double sum2 = 0.0;
    int    nj   = 0;
    for (Eigen::Index j = 1; cc.valid(kpk + j) || cc.valid(kpk - j); ++j) {
        if (!cc.valid(kpk + j) || !cc.valid(kpk - j)) continue;
        const double a = cc.at(kpk + j) - cc.at(kpk - j);
        sum2 += a * a;
        ++nj;
    }
    const double sigma_a = std::max(1e-4, nj > 0 ? std::sqrt(sum2 / nj) : 0.0);

    TemplateMatch m;
    m.key           = {tmpl.sn_type, tmpl.age_bin};
    m.template_name = tmpl.name;
    m.redshift      = z;
    m.peak_height   = h;
    m.r             = h / (std::sqrt(2.0) * sigma_a);
    m.lap           = cc.overlap[kpk + cc.offset] * dwlog;
    m.rlap          = m.r * m.lap;

    /* ---------------- width -> uncertainty --------------------------- */
    const double w = half_width(cc, kpk, -1, 0.5 * h) + half_width(cc, kpk, +1, 0.5 * h);
    m.redshift_error = (1.0 + z) * (3.0 / 8.0) * w * dwlog / (1.0 + m.r);
    return m;
}

/* -------------------------------------------------------------------- */
std::vector<TemplateMatch>
CrossCorrelationMatcher::rank(const Spectrum& spectrum,
                              const std::vector<TemplatePtr>& candidates) const
{
    check_on_grid_(spectrum, "spectrum");

    std::vector<std::optional<TemplateMatch>> slots(candidates.size());
    std::vector<std::exception_ptr>           errors(candidates.size());
    const long n = static_cast<long>(candidates.size());

    // exceptions may not leave the parallel region; rethrown below in order
    #pragma omp parallel for schedule(dynamic)
    for (long i = 0; i < n; ++i) {
        const auto k = static_cast<std::size_t>(i);
        try {
            if (!candidates[k]) throw PipelineError("null template in candidate set");
            slots[k] = score(spectrum, *candidates[k]);
        } catch (...) {
            errors[k] = std::current_exception();
        }
    }
    for (const auto& e : errors)
        if (e) std::rethrow_exception(e);

    std::vector<TemplateMatch> out;
    out.reserve(slots.size());
    for (auto& s : slots)
        if (s) out.push_back(std::move(*s));

    std::stable_sort(out.begin(), out.end(),
                     [](const TemplateMatch& a, const TemplateMatch& b) { return a.rlap > b.rlap; });
    return out;
}

RedshiftEstimate
CrossCorrelationMatcher::estimate(const Spectrum& spectrum,
                                  const std::vector<TemplatePtr>& candidates) const
{
    RedshiftEstimate est;
    if (candidates.empty()) {
        est.message = "No valid templates found: the candidate set is empty";
        return est;
    }

    const auto ranked = rank(spectrum, candidates);
    std::ostringstream s;
    if (ranked.empty()) {
        s << "No valid templates found: no correlation peak within z in ["
          << cfg_.z_min << ", " << cfg_.z_max << "]";
    } else if (ranked.front().rlap < cfg_.rlap_min) {
        s << "No valid templates found above RLAP " << cfg_.rlap_min
          << " (best " << ranked.front().template_name
          << " with RLAP " << ranked.front().rlap << ")";
    } else {
        est.match = ranked.front();
        s << "Redshift estimated from template '" << est.match->template_name
          << "' (RLAP " << est.match->rlap << ")";
    }
    est.message = s.str();
    return est;
}

} // namespace snclass

#include "snclass/SpectrumNormalizer.hpp"
#include "snclass/ContinuumUtils.hpp"
#include "snclass/Errors.hpp"
#include "snclass/Rebin.hpp"
#include <cmath>
#include <sstream>
#include <vector>

namespace snclass {

SpectrumNormalizer::SpectrumNormalizer(GridPtr grid, Config cfg)
    : grid_(std::move(grid)), cfg_(cfg)
{
    if (!grid_)
        throw ConfigurationError("SpectrumNormalizer: no wavelength grid");
    if (cfg_.min_points < 2)
        throw ConfigurationError("normalizer.minPoints must be >= 2");
}

/* ---------------------------------------------------------------------- */
void SpectrumNormalizer::check_options_(const NormalizeOptions& opt) const
{
    if (opt.smoothing < 0 || opt.smoothing > cfg_.max_smoothing)
        throw ValidationError("smoothing must be between 0 and "
                              + std::to_string(cfg_.max_smoothing)
                              + " (got " + std::to_string(opt.smoothing) + ")");

    if (opt.known_z && !opt.z_value)
        throw ValidationError("knownZ is set but no redshift value was given");

    if (opt.known_z) {
        const double z = *opt.z_value;
        if (!std::isfinite(z) || z <= -1.0 || z > cfg_.max_redshift) {
            std::ostringstream s;
            s << "redshift " << z << " outside (-1, " << cfg_.max_redshift << "]";
            throw ValidationError(s.str());
        }
    }

    const double lo = opt.min_wave.value_or(grid_->config().w0);
    const double hi = opt.max_wave.value_or(grid_->config().w1);
    if (!std::isfinite(lo) || !std::isfinite(hi) || !(lo < hi)) {
        std::ostringstream s;
        s << "minWave (" << lo << ") must be smaller than maxWave (" << hi << ")";
        throw ValidationError(s.str());
    }
}

/* ---------------------------------------------------------------------- */
Spectrum SpectrumNormalizer::normalize(const Spectrum& raw,
                                       const NormalizeOptions& opt) const
{
    validate_spectrum(raw);
    check_options_(opt);

    /* ---------------- 1. clip to [minWave, maxWave] ------------------------ */
    const double lo = opt.min_wave.value_or(grid_->config().w0);
    const double hi = opt.max_wave.value_or(grid_->config().w1);

    std::vector<Eigen::Index> keep;
    keep.reserve(static_cast<std::size_t>(raw.size()));
    for (Eigen::Index i = 0; i < raw.size(); ++i)
        if (raw.lambda[i] >= lo && raw.lambda[i] <= hi) keep.push_back(i);

    if (static_cast<int>(keep.size()) < cfg_.min_points) {
        std::ostringstream s;
        s << "only " << keep.size() << " points within [" << lo << ", " << hi
          << "] Angstrom (need " << cfg_.min_points << ")";
        throw ValidationError(s.str());
    }

    const auto n = static_cast<Eigen::Index>(keep.size());
    Vector lam(n), flux(n);
    for (Eigen::Index k = 0; k < n; ++k) {
        lam[k]  = raw.lambda[keep[k]];
        flux[k] = raw.flux[keep[k]];
    }

    /* ---------------- 2. de-redshift --------------------------------------- */
    const double z = opt.known_z ? *opt.z_value : 0.0;
    if (z != 0.0) lam /= (1.0 + z);

    /* ---------------- 3. scale + resample ---------------------------------- */
    Eigen::Index begin = 0, end = 0;
    Vector f = interp_onto(lam, minmax_scale(flux), grid_->lambda(), 0.0, begin, end);

    if (end - begin < cfg_.min_points) {
        std::ostringstream s;
        s << "spectrum covers " << (end - begin) << " bins of the "
          << grid_->config().w0 << "-" << grid_->config().w1
          << " Angstrom grid";
        if (z != 0.0) s << " at z=" << z;
        s << " (need " << cfg_.min_points << ")";
        throw ValidationError(s.str());
    }

    /* ---------------- 4. smoothing ----------------------------------------- */
    if (opt.smoothing > 0)
        f = median_filter(f, (opt.smoothing / 2) * 2 + 1, begin, end);

    /* ---------------- 5. conditioning -------------------------------------- */
    if (cfg_.condition) {
        f = remove_continuum(grid_->lambda(), f, begin, end, cfg_.spline_knots);
        f = mean_zero(f, begin, end);
        f = apodize(f, begin, end, cfg_.apodize_fraction);
        f = minmax_scale(f);
        f = fill_outside(f, begin, end, cfg_.outer_value);
    }

    if (!f.allFinite())
        throw PipelineError("normalization of '" + raw.file_name
                            + "' produced non-finite flux");

    Spectrum out;
    out.lambda      = grid_->lambda();
    out.flux        = std::move(f);
    out.format      = raw.format;
    out.file_name   = raw.file_name;
    out.metadata    = raw.metadata;
    out.state       = opt.known_z ? ProcessingState::Deredshifted
                                  : ProcessingState::Normalized;
    out.redshift    = z;
    out.valid_begin = begin;
    out.valid_end   = end;
    return out;
}

} // namespace snclass

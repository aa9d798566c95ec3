#pragma once
#include "TemplateLibrary.hpp"
#include "WavelengthGrid.hpp"
#include <optional>
#include <string>
#include <vector>

namespace snclass {

struct MatcherConfig {
    double z_min    = 0.0;      // redshift search range
    double z_max    = 1.0;
    double rlap_min = 5.0;      // acceptance threshold for estimate()
    double lap_min  = 0.4;      // minimum overlap in ln(λ)
};

struct TemplateMatch {
    TemplateKey key;
    std::string template_name;
    double redshift       = 0.0;
    double redshift_error = 0.0;
    double r              = 0.0;    // Tonry & Davis r
    double lap            = 0.0;    // overlap in ln(λ) at the peak
    double rlap           = 0.0;
    double peak_height    = 0.0;
};

// Outcome of a redshift search: the best match or an explicit "no match"
struct RedshiftEstimate {
    std::optional<TemplateMatch> match;
    std::string                  message;

    bool found() const { return match.has_value(); }
};

/*
 * Fourier-free cross-correlation of two spectra on the canonical log
 * grid.  A lag of k bins corresponds to 1+z = exp(k · dwlog).
 *
 *     c(k) = Σ_n x[n] · y[n-k] / (N σx σy)
 *
 * x, y are the mean-zeroed fluxes inside their valid ranges and zero
 * outside.  Lags whose overlap is shorter than lap_min are ignored.
 */
class CrossCorrelationMatcher {
public:
    explicit CrossCorrelationMatcher(GridPtr grid, MatcherConfig cfg = MatcherConfig{});

    // nullopt when no lag in the search range is usable or the peak is not positive
    std::optional<TemplateMatch> score(const Spectrum& spectrum,
                                       const Template& tmpl) const;

    // RLAP descending, ties keep candidate order
    std::vector<TemplateMatch> rank(const Spectrum& spectrum,
                                    const std::vector<TemplatePtr>& candidates) const;

    RedshiftEstimate estimate(const Spectrum& spectrum,
                              const std::vector<TemplatePtr>& candidates) const;

    const MatcherConfig& config() const { return cfg_; }

private:
    void check_on_grid_(const Spectrum& s, const char* what) const;

    GridPtr       grid_;
    MatcherConfig cfg_;
};

} // namespace snclass

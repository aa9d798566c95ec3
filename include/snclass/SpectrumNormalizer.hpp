#pragma once
#include "Spectrum.hpp"
#include "WavelengthGrid.hpp"
#include <optional>

namespace snclass {

// Per-request preprocessing options
struct NormalizeOptions {
    int                   smoothing = 0;     // median window, 0 = off
    bool                  known_z   = false;
    std::optional<double> z_value;           // required when known_z
    std::optional<double> min_wave;          // default: grid w0
    std::optional<double> max_wave;          // default: grid w1
};

/*
 * Clip -> de-redshift -> resample onto the canonical grid -> smooth ->
 * condition.  Stateless apart from its configuration; one instance is
 * shared by all requests.
 */
struct SpectrumNormalizerConfig {
    int    min_points       = 10;     // after clipping and after resampling
    int    spline_knots     = 13;
    double apodize_fraction = 0.05;
    double outer_value      = 0.5;
    bool   condition        = true;   // continuum division, mean zero, apodize
    double max_redshift     = 10.0;
    int    max_smoothing    = 20;
};

class SpectrumNormalizer {
public:
    using Config = SpectrumNormalizerConfig;

    explicit SpectrumNormalizer(GridPtr grid, Config cfg = Config{});

    Spectrum normalize(const Spectrum& raw, const NormalizeOptions& opt = {}) const;

    const WavelengthGrid& grid()     const { return *grid_; }
    const GridPtr&        grid_ptr() const { return grid_; }
    const Config&         config()   const { return cfg_; }

private:
    void check_options_(const NormalizeOptions& opt) const;

    GridPtr grid_;
    Config  cfg_;
};

} // namespace snclass

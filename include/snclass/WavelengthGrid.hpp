#pragma once
#include "Types.hpp"
#include <memory>

namespace snclass {

/*
 * Log-uniform wavelength grid shared by templates and observations.
 *
 *      λ_i = w0 · exp(i · dwlog),   dwlog = ln(w1 / w0) / nw,   i = 0 … nw-1
 *
 * A shift of one bin corresponds to a redshift factor exp(dwlog).
 */
struct WavelengthGridConfig {
    double w0 = 3500.0;
    double w1 = 10000.0;
    int    nw = 1024;
};

class WavelengthGrid {
public:
    using Config = WavelengthGridConfig;

    explicit WavelengthGrid(const Config& cfg = Config{});

    const Config& config() const { return cfg_; }
    const Vector& lambda() const { return lambda_; }
    Eigen::Index  size()   const { return lambda_.size(); }
    double        dwlog()  const { return dwlog_; }

    // Bin shift ↔ redshift
    double redshift_of_shift(double shift) const;
    double shift_of_redshift(double z) const;

private:
    Config cfg_;
    double dwlog_;
    Vector lambda_;
};

using GridPtr = std::shared_ptr<const WavelengthGrid>;

GridPtr make_grid(const WavelengthGrid::Config& cfg = WavelengthGrid::Config{});

} // namespace snclass

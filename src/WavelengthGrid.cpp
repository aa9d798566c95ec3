#include "snclass/WavelengthGrid.hpp"
#include "snclass/Errors.hpp"
#include <cmath>

namespace snclass {

WavelengthGrid::WavelengthGrid(const Config& cfg)
    : cfg_(cfg)
{
    if (!(cfg.w0 > 0.0) || !(cfg.w1 > cfg.w0))
        throw ConfigurationError("grid: need 0 < w0 < w1 (got w0="
                                 + std::to_string(cfg.w0) + ", w1="
                                 + std::to_string(cfg.w1) + ")");
    if (cfg.nw < 16)
        throw ConfigurationError("grid: nw must be at least 16 (got "
                                 + std::to_string(cfg.nw) + ")");

    dwlog_ = std::log(cfg.w1 / cfg.w0) / cfg.nw;

    lambda_.resize(cfg.nw);
    for (int i = 0; i < cfg.nw; ++i)
        lambda_[i] = cfg.w0 * std::exp(i * dwlog_);
}

double WavelengthGrid::redshift_of_shift(double shift) const
{
    return std::exp(shift * dwlog_) - 1.0;
}

double WavelengthGrid::shift_of_redshift(double z) const
{
    return std::log1p(z) / dwlog_;
}

GridPtr make_grid(const WavelengthGrid::Config& cfg)
{
    return std::make_shared<const WavelengthGrid>(cfg);
}

} // namespace snclass

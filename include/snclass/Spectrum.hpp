#pragma once
#include "Types.hpp"
#include <map>
#include <string>

namespace snclass {

enum class SpectrumFormat { Fits, Text, Csv, Lnw };

enum class ProcessingState { Raw, Normalized, Deredshifted };

const char* to_string(SpectrumFormat format);
const char* to_string(ProcessingState state);

// Container for one spectrum, raw or resampled onto the canonical grid
struct Spectrum {
    Vector               lambda;       // Å, strictly increasing
    Vector               flux;         // arbitrary units

    /* provenance */
    SpectrumFormat       format    = SpectrumFormat::Text;
    std::string          file_name;
    std::map<std::string, std::string> metadata;   // header keys (LNW, FITS)

    /* processing */
    ProcessingState      state     = ProcessingState::Raw;
    double               redshift  = 0.0;          // applied de-redshift

    /* Half-open index range of grid bins covered by real data.  Only
     * meaningful once normalized; bins outside carry fill values.       */
    Eigen::Index         valid_begin = 0;
    Eigen::Index         valid_end   = 0;

    Eigen::Index size() const { return lambda.size(); }
    Eigen::Index valid_size() const { return valid_end - valid_begin; }

    // Model-facing shape of the flux vector: {1, N}
    InputShape shape() const { return {1, static_cast<std::int64_t>(flux.size())}; }
};

/*
 * Throws ValidationError unless lambda/flux have equal length (>= 2),
 * contain only finite values and lambda is strictly increasing.
 */
void validate_spectrum(const Spectrum& sp);

// Median of a vector (copy is partially sorted); throws on empty input
Real median(Vector v);

std::string format_shape(const InputShape& shape);   // "[1, 1024]"

} // namespace snclass

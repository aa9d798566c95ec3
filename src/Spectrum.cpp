#include "snclass/Spectrum.hpp"
#include "snclass/Errors.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace snclass {

const char* to_string(SpectrumFormat format)
{
    switch (format) {
        case SpectrumFormat::Fits: return "fits";
        case SpectrumFormat::Text: return "text";
        case SpectrumFormat::Csv:  return "csv";
        case SpectrumFormat::Lnw:  return "lnw";
    }
    return "unknown";
}

const char* to_string(ProcessingState state)
{
    switch (state) {
        case ProcessingState::Raw:          return "raw";
        case ProcessingState::Normalized:   return "normalized";
        case ProcessingState::Deredshifted: return "deredshifted";
    }
    return "unknown";
}

void validate_spectrum(const Spectrum& sp)
{
    const std::string who = sp.file_name.empty() ? std::string("spectrum")
                                                 : "'" + sp.file_name + "'";
    if (sp.lambda.size() != sp.flux.size())
        throw ValidationError(who + ": wavelength and flux lengths differ ("
                              + std::to_string(sp.lambda.size()) + " vs "
                              + std::to_string(sp.flux.size()) + ")");
    if (sp.lambda.size() < 2)
        throw ValidationError(who + ": at least two points are required");
    if (!sp.lambda.allFinite())
        throw ValidationError(who + ": wavelength contains NaN/Inf");
    if (!sp.flux.allFinite())
        throw ValidationError(who + ": flux contains NaN/Inf");

    for (Eigen::Index i = 1; i < sp.lambda.size(); ++i) {
        if (!(sp.lambda[i] > sp.lambda[i - 1])) {
            std::ostringstream s;
            s << who << ": wavelength is not strictly increasing at index "
              << i << " (" << sp.lambda[i - 1] << " -> " << sp.lambda[i] << ")";
            throw ValidationError(s.str());
        }
    }
}

Real median(Vector v)
{
    const Eigen::Index n = v.size();
    if (n == 0)
        throw std::invalid_argument("median(): empty vector");

    Eigen::Index k = n / 2;
    std::nth_element(v.data(), v.data() + k, v.data() + n);

    Real m = v[k];
    if ((n & 1) == 0) {
        const Real max_lo = *std::max_element(v.data(), v.data() + k);
        m = 0.5 * (m + max_lo);
    }
    return m;
}

std::string format_shape(const InputShape& shape)
{
    std::ostringstream s;
    s << '[';
    for (std::size_t i = 0; i < shape.size(); ++i) {
        if (i) s << ", ";
        s << shape[i];
    }
    s << ']';
    return s.str();
}

} // namespace snclass

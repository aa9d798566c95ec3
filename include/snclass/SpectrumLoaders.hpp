// SpectrumLoaders.hpp
#pragma once
#include "snclass/Spectrum.hpp"          //  λ, flux container
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace snclass {

struct ParseOptions {
    int lnw_epoch = 0;                    // flux column of multi-epoch LNW files
};

using SpectrumParser =
    std::function<Spectrum(const Bytes&, const std::string&, const ParseOptions&)>;

// ---------------------------------------------------------------------------
// format tags
// ---------------------------------------------------------------------------
// "fits", "dat", "txt", "ascii", "flm", "csv", "lnw" (case-insensitive)
std::optional<SpectrumFormat> format_from_tag(const std::string& tag);

// Sniff from the file extension; nullopt when unknown
std::optional<SpectrumFormat> sniff_format(const std::string& file_name);

// Declared tag wins; otherwise sniffed.  FormatError lists supported formats.
SpectrumFormat resolve_format(const std::string& file_name,
                              const std::optional<SpectrumFormat>& declared);

const std::vector<std::string>& supported_extensions();

// ---------------------------------------------------------------------------
// individual readers (raw state, sorted by wavelength)
// ---------------------------------------------------------------------------
Spectrum parse_text(const std::string& content, const std::string& file_name);
Spectrum parse_csv (const std::string& content, const std::string& file_name);
Spectrum parse_lnw (const std::string& content, const std::string& file_name,
                    int epoch = 0);
Spectrum parse_fits(const Bytes& content, const std::string& file_name);

// main entry points ---------------------------------------------------------
Spectrum parse_spectrum(const Bytes& content,
                        const std::string& file_name,
                        const std::optional<SpectrumFormat>& format = std::nullopt,
                        const ParseOptions& options = {});

Spectrum load_spectrum(const std::string& path,
                       const std::optional<SpectrumFormat>& format = std::nullopt,
                       const ParseOptions& options = {});

// Two-column text with full double precision; parse_text() reads it back
std::string write_ascii(const Spectrum& spectrum);

Bytes read_file(const std::string& path);

} // namespace snclass

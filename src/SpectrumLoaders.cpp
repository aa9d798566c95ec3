#include "snclass/SpectrumLoaders.hpp"
#include "snclass/Errors.hpp"
#include <CCfits/CCfits>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iterator>
#include <fstream>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_map>
#include <valarray>
#include <vector>

namespace fs = std::filesystem;

namespace snclass {
namespace {

struct Token {
    std::string text;
    int         column;                   // 1-based
};

struct Row {
    double lambda;
    double flux;
    int    line;
};

// upper bound for epoch/point/knot counts read from an LNW header
constexpr double kMaxHeaderCount = 1.0e6;

std::string lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string upper(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

// ----------------------------------------------------------------------------
//  split a line on any of `delims`, remembering where every token starts
// ----------------------------------------------------------------------------
std::vector<Token> tokenize(const std::string& line, const char* delims)
{
    std::vector<Token> out;
    std::size_t i = 0;
    while (i < line.size()) {
        i = line.find_first_not_of(delims, i);
        if (i == std::string::npos) break;
        std::size_t j = line.find_first_of(delims, i);
        if (j == std::string::npos) j = line.size();
        out.push_back({line.substr(i, j - i), static_cast<int>(i) + 1});
        i = j;
    }
    return out;
}

// Split on a single delimiter keeping empty cells (CSV semantics)
std::vector<Token> split_cells(const std::string& line, char delim)
{
    std::vector<Token> out;
    std::size_t start = 0;
    while (true) {
        std::size_t end = line.find(delim, start);
        if (end == std::string::npos) end = line.size();
        std::size_t a = start;
        std::size_t b = end;
        while (a < b && std::isspace(static_cast<unsigned char>(line[a]))) ++a;
        while (b > a && std::isspace(static_cast<unsigned char>(line[b - 1]))) --b;
        out.push_back({line.substr(a, b - a), static_cast<int>(a) + 1});
        if (end == line.size()) break;
        start = end + 1;
    }
    return out;
}

bool parse_number(const std::string& text, double& out)
{
    if (text.empty()) return false;
    const char* begin = text.c_str();
    char* end = nullptr;
    out = std::strtod(begin, &end);
    return end == begin + text.size();
}

bool is_blank_or_comment(const std::string& line)
{
    auto it = std::find_if_not(line.begin(), line.end(),
                               [](unsigned char c) { return std::isspace(c); });
    return it == line.end() || *it == '#';
}

std::vector<std::string> split_lines(const std::string& content)
{
    std::vector<std::string> lines;
    std::istringstream in(content);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(std::move(line));
    }
    return lines;
}

Row parse_row(const std::vector<Token>& toks, std::size_t wave_idx,
              std::size_t flux_idx, int line_no, const std::string& file)
{
    Row r{0.0, 0.0, line_no};
    if (!parse_number(toks[wave_idx].text, r.lambda))
        throw FormatError(file, line_no, toks[wave_idx].column,
                          "cannot parse '" + toks[wave_idx].text + "' as a wavelength");
    if (!parse_number(toks[flux_idx].text, r.flux))
        throw FormatError(file, line_no, toks[flux_idx].column,
                          "cannot parse '" + toks[flux_idx].text + "' as a flux");
    return r;
}

// Whitespace/comma separated two-column body starting at lines[first].
// A single non-numeric line before the first data row is a column header.
std::vector<Row> read_two_column(const std::vector<std::string>& lines,
                                 std::size_t first, const std::string& file)
{
    std::vector<Row> rows;
    for (std::size_t li = first; li < lines.size(); ++li) {
        const std::string& line = lines[li];
        if (is_blank_or_comment(line)) continue;
        const int line_no = static_cast<int>(li) + 1;

        const auto toks = tokenize(line, " \t,");
        if (toks.size() < 2)
            throw FormatError(file, line_no, toks.empty() ? 1 : toks.front().column,
                              "expected two columns (wavelength, flux), found "
                              + std::to_string(toks.size()));

        double a = 0.0, b = 0.0;
        if (rows.empty() && !parse_number(toks[0].text, a) && !parse_number(toks[1].text, b))
            continue;

        rows.push_back(parse_row(toks, 0, 1, line_no, file));
    }
    return rows;
}

// ----------------------------------------------------------------------------
//  Sort rows by λ ascending and move into Eigen vectors
// ----------------------------------------------------------------------------
Spectrum to_spectrum(std::vector<Row> rows, const std::string& file,
                     SpectrumFormat format)
{
    if (rows.size() < 2)
        throw FormatError(file, 0, 0, "contains no valid data (found "
                          + std::to_string(rows.size()) + " data rows, need 2)");

    std::stable_sort(rows.begin(), rows.end(),
                     [](const Row& a, const Row& b) { return a.lambda < b.lambda; });

    const std::size_t n = rows.size();
    Spectrum sp;
    sp.lambda.resize(n);
    sp.flux.resize(n);
    for (std::size_t k = 0; k < n; ++k) {
        if (k > 0 && rows[k].lambda == rows[k - 1].lambda) {
            std::ostringstream s;
            s << "duplicate wavelength " << rows[k].lambda
              << " (also on line " << rows[k - 1].line << ")";
            throw FormatError(file, rows[k].line, 1, s.str());
        }
        sp.lambda[k] = rows[k].lambda;
        sp.flux[k]   = rows[k].flux;
    }
    sp.format    = format;
    sp.file_name = file;
    sp.state     = ProcessingState::Raw;
    return sp;
}

// ----------------------------------------------------------------------------
//  FITS decoding goes through a scratch file; CCfits only opens paths
// ----------------------------------------------------------------------------
class ScratchFile {
public:
    explicit ScratchFile(const Bytes& content)
    {
        static std::atomic<unsigned long> counter{0};
        std::ostringstream name;
        name << "snclass-" << std::hash<std::thread::id>{}(std::this_thread::get_id())
             << '-' << counter.fetch_add(1) << ".fits";
        path_ = (fs::temp_directory_path() / name.str()).string();

        std::ofstream out(path_, std::ios::binary);
        if (!out)
            throw PipelineError("cannot create scratch file '" + path_ + "'");
        out.write(reinterpret_cast<const char*>(content.data()),
                  static_cast<std::streamsize>(content.size()));
        if (!out)
            throw PipelineError("cannot write scratch file '" + path_ + "'");
    }
    ~ScratchFile()
    {
        std::error_code ec;
        fs::remove(path_, ec);
    }
    ScratchFile(const ScratchFile&) = delete;
    ScratchFile& operator=(const ScratchFile&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

std::vector<double> read_fits_column(CCfits::Column& col, long rows)
{
    std::vector<double> buf;
    if (col.varLength() || col.repeat() > 1) {            // whole spectrum in row 1
        std::valarray<double> cell;
        col.read(cell, 1);
        buf.assign(std::begin(cell), std::end(cell));
    } else {
        col.read(buf, 1, rows);
    }
    return buf;
}

CCfits::Column* find_fits_column(CCfits::Table& table,
                                 std::initializer_list<const char*> names)
{
    for (const auto& [name, col] : table.column()) {
        const std::string n = lower(name);
        for (const char* want : names)
            if (n == want) return col;
    }
    return nullptr;
}

bool try_read_key(CCfits::HDU& hdu, const std::string& key, double& out)
{
    try {
        hdu.readKey(key, out);
        return true;
    } catch (const CCfits::HDU::NoSuchKeyword&) {
        return false;
    }
}

Spectrum fits_table_spectrum(CCfits::Table& table, const std::string& file)
{
    CCfits::Column* wave = find_fits_column(table, {"wavelength", "wave", "lambda", "loglam"});
    CCfits::Column* flux = find_fits_column(table, {"flux"});
    if (wave == nullptr || flux == nullptr) {
        std::vector<CCfits::Column*> cols;
        for (const auto& kv : table.column()) cols.push_back(kv.second);
        std::sort(cols.begin(), cols.end(),
                  [](const CCfits::Column* a, const CCfits::Column* b)
                  { return a->index() < b->index(); });
        if (cols.size() < 2)
            throw FormatError(file, 0, 0, "FITS table '" + table.name()
                              + "' has fewer than two columns");
        wave = cols[0];
        flux = cols[1];
    }

    const long rows = table.rows();
    std::vector<double> lam = read_fits_column(*wave, rows);
    std::vector<double> fl  = read_fits_column(*flux, rows);
    if (lam.size() != fl.size())
        throw FormatError(file, 0, 0, "FITS columns '" + wave->name() + "' and '"
                          + flux->name() + "' differ in length");

    const bool log10_wave = lower(wave->name()) == "loglam";
    std::vector<Row> out;
    out.reserve(lam.size());
    for (std::size_t i = 0; i < lam.size(); ++i)
        out.push_back({log10_wave ? std::pow(10.0, lam[i]) : lam[i], fl[i],
                       static_cast<int>(i) + 1});
    Spectrum sp = to_spectrum(std::move(out), file, SpectrumFormat::Fits);
    sp.metadata["extension"] = table.name();
    return sp;
}

Spectrum fits_image_spectrum(CCfits::PHDU& ph, const std::string& file)
{
    if (ph.axes() < 1 || ph.axis(0) < 2)
        throw FormatError(file, 0, 0, "no spectrum table and no 1-D primary image");

    std::valarray<double> data;
    ph.read(data);
    const long n = ph.axis(0);                    // first row of multispec images

    double crval = 0.0, cdelt = 0.0, crpix = 1.0, dcflag = 0.0;
    if (!try_read_key(ph, "CRVAL1", crval) ||
        !(try_read_key(ph, "CDELT1", cdelt) || try_read_key(ph, "CD1_1", cdelt)))
        throw FormatError(file, 0, 0,
                          "no spectrum table and no WCS (CRVAL1/CDELT1) in primary HDU");
    try_read_key(ph, "CRPIX1", crpix);
    try_read_key(ph, "DC-FLAG", dcflag);

    std::vector<Row> out;
    out.reserve(static_cast<std::size_t>(n));
    for (long i = 0; i < n; ++i) {
        // FITS pixel indices are 1-based
        double w = crval + (static_cast<double>(i) + 1.0 - crpix) * cdelt;
        if (dcflag == 1.0) w = std::pow(10.0, w);
        out.push_back({w, data[static_cast<std::size_t>(i)], static_cast<int>(i) + 1});
    }
    Spectrum sp = to_spectrum(std::move(out), file, SpectrumFormat::Fits);
    sp.metadata["extension"] = "PRIMARY";
    return sp;
}

} // unnamed namespace
// ============================================================================
//  Public reader implementations
// ============================================================================

Spectrum parse_text(const std::string& content, const std::string& file)
{
    return to_spectrum(read_two_column(split_lines(content), 0, file), file,
                       SpectrumFormat::Text);
}

// ----------------------------------------------------------------------------
Spectrum parse_csv(const std::string& content, const std::string& file)
{
    const auto lines = split_lines(content);

    std::size_t first = 0;
    while (first < lines.size() && is_blank_or_comment(lines[first])) ++first;
    if (first == lines.size())
        throw FormatError(file, 0, 0, "contains no valid data");

    const char delim = lines[first].find(',') != std::string::npos ? ',' : '\t';

    /* -------------------- header ------------------------------------------- */
    const auto header = split_cells(lines[first], delim);
    std::size_t wave_idx = 0, flux_idx = 1;
    bool has_header = false;
    {
        std::optional<std::size_t> w, f;
        for (std::size_t i = 0; i < header.size(); ++i) {
            const std::string h = upper(header[i].text);
            if (h == "WAVE" || h == "WAVELENGTH" || h == "LAMBDA" || h == "WL") w = i;
            if (h == "FLUX" || h == "FLUX_DENSITY" || h == "F")                 f = i;
        }
        double dummy = 0.0;
        has_header = !parse_number(header[0].text, dummy);
        if (w && f) { wave_idx = *w; flux_idx = *f; }
    }

    /* -------------------- rows --------------------------------------------- */
    std::vector<Row> rows;
    for (std::size_t li = has_header ? first + 1 : first; li < lines.size(); ++li) {
        if (is_blank_or_comment(lines[li])) continue;
        const int line_no = static_cast<int>(li) + 1;
        const auto cells = split_cells(lines[li], delim);
        const std::size_t need = std::max(wave_idx, flux_idx) + 1;
        if (cells.size() < need)
            throw FormatError(file, line_no,
                              static_cast<int>(lines[li].size()) + 1,
                              "expected at least " + std::to_string(need)
                              + " columns, found " + std::to_string(cells.size()));
        rows.push_back(parse_row(cells, wave_idx, flux_idx, line_no, file));
    }
    return to_spectrum(std::move(rows), file, SpectrumFormat::Csv);
}

// ----------------------------------------------------------------------------
//  SNID template (.lnw):
//      header      n_epochs n_wave w0 w1 n_knots name dm15 type subtype ...
//      n_knots+1   continuum spline lines      (skipped)
//      ages        0 age_1 ... age_n
//      n_wave      λ flux_1 ... flux_n
// ----------------------------------------------------------------------------
Spectrum parse_lnw(const std::string& content, const std::string& file, int epoch)
{
    const auto lines = split_lines(content);
    std::size_t li = 0;
    while (li < lines.size() && is_blank_or_comment(lines[li])) ++li;
    if (li == lines.size())
        throw FormatError(file, 0, 0, "contains no valid data");

    const auto header = tokenize(lines[li], " \t");
    std::map<std::string, std::string> meta;
    meta["header"] = lines[li];
    ++li;

    double nums[5] = {0, 0, 0, 0, 0};
    bool snid = header.size() >= 6;
    for (std::size_t i = 0; snid && i < 5; ++i)
        snid = parse_number(header[i].text, nums[i]);

    if (!snid) {
        /* legacy two-column body under a free-form header line */
        Spectrum sp = to_spectrum(read_two_column(lines, li, file), file,
                                  SpectrumFormat::Lnw);
        sp.metadata = std::move(meta);
        return sp;
    }

    // counts must be whole numbers that fit an int before they are cast
    for (std::size_t i : {0u, 1u, 4u}) {
        if (!std::isfinite(nums[i]) || nums[i] != std::floor(nums[i])
            || nums[i] < 0.0 || nums[i] > kMaxHeaderCount)
            throw FormatError(file, 1, header[i].column,
                              "implausible SNID header value '" + header[i].text + "'");
    }
    const int n_epochs = static_cast<int>(nums[0]);
    const int n_wave   = static_cast<int>(nums[1]);
    const int n_knots  = static_cast<int>(nums[4]);
    static const char* kKeys[] = {"n_epochs", "n_wave", "w0", "w1", "n_knots",
                                  "name", "dm15", "type", "subtype", "subsubtype"};
    for (std::size_t i = 0; i < header.size() && i < std::size(kKeys); ++i)
        meta[kKeys[i]] = header[i].text;

    if (n_epochs < 1 || n_wave < 2 || n_knots < 0)
        throw FormatError(file, 1, header[0].column, "implausible SNID header values");
    if (epoch < 0 || epoch >= n_epochs)
        throw FormatError(file, 1, header[0].column,
                          "epoch " + std::to_string(epoch) + " out of range (file has "
                          + std::to_string(n_epochs) + " epochs)");

    /* -------------------- continuum knots, ages ---------------------------- */
    for (int k = 0; k < n_knots + 1 && li < lines.size(); ++li) {
        if (!is_blank_or_comment(lines[li])) ++k;
    }
    while (li < lines.size() && is_blank_or_comment(lines[li])) ++li;
    if (li == lines.size())
        throw FormatError(file, static_cast<int>(li), 0, "missing ages line");

    const auto ages = tokenize(lines[li], " \t");
    if (static_cast<int>(ages.size()) < n_epochs + 1)
        throw FormatError(file, static_cast<int>(li) + 1, 1,
                          "ages line has " + std::to_string(ages.size() - 1)
                          + " entries, header declares " + std::to_string(n_epochs));
    std::string age_list;
    for (int e = 1; e <= n_epochs; ++e) {
        double age = 0.0;
        if (!parse_number(ages[e].text, age))
            throw FormatError(file, static_cast<int>(li) + 1, ages[e].column,
                              "cannot parse '" + ages[e].text + "' as an age");
        if (e > 1) age_list += ' ';
        age_list += ages[e].text;
    }
    meta["ages"] = age_list;
    meta["age"]  = ages[epoch + 1].text;
    ++li;

    /* -------------------- flux table --------------------------------------- */
    std::vector<Row> rows;
    const std::size_t need = static_cast<std::size_t>(epoch) + 2;
    for (; li < lines.size() && static_cast<int>(rows.size()) < n_wave; ++li) {
        if (is_blank_or_comment(lines[li])) continue;
        const int line_no = static_cast<int>(li) + 1;
        const auto toks = tokenize(lines[li], " \t");
        if (toks.size() < need)
            throw FormatError(file, line_no, toks.empty() ? 1 : toks.back().column,
                              "expected " + std::to_string(need) + " columns, found "
                              + std::to_string(toks.size()));
        rows.push_back(parse_row(toks, 0, need - 1, line_no, file));
    }
    if (static_cast<int>(rows.size()) != n_wave)
        throw FormatError(file, static_cast<int>(lines.size()), 0,
                          "expected " + std::to_string(n_wave) + " data rows, found "
                          + std::to_string(rows.size()));

    Spectrum sp = to_spectrum(std::move(rows), file, SpectrumFormat::Lnw);
    sp.metadata = std::move(meta);
    return sp;
}

// ----------------------------------------------------------------------------
Spectrum parse_fits(const Bytes& content, const std::string& file)
{
    ScratchFile scratch(content);
    try {
        CCfits::FITS f(scratch.path(), CCfits::Read);

        CCfits::Table* table = nullptr;
        static const char* kPreferred[] = {"SPECTRUM", "SPECTRA", "FLUX", "DATA"};
        for (const char* want : kPreferred) {
            for (const auto& [name, hdu] : f.extension()) {
                if (upper(name) == want) table = dynamic_cast<CCfits::Table*>(hdu);
                if (table) break;
            }
            if (table) break;
        }
        if (table == nullptr) {
            int best = 0;
            for (const auto& kv : f.extension()) {
                auto* t = dynamic_cast<CCfits::Table*>(kv.second);
                if (t && (best == 0 || kv.second->index() < best)) {
                    table = t;
                    best  = kv.second->index();
                }
            }
        }
        return table ? fits_table_spectrum(*table, file)
                     : fits_image_spectrum(f.pHDU(), file);
    } catch (const CCfits::FitsException& ex) {
        throw FormatError(file, 0, 0, "FITS read failed: " + ex.message());
    }
}

// ============================================================================
//  Dispatcher / auto-detection
// ============================================================================
static const std::unordered_map<std::string, SpectrumFormat> kExtensionMap = {
    {"fits",  SpectrumFormat::Fits},
    {"fit",   SpectrumFormat::Fits},
    {"fts",   SpectrumFormat::Fits},
    {"dat",   SpectrumFormat::Text},
    {"txt",   SpectrumFormat::Text},
    {"ascii", SpectrumFormat::Text},
    {"flm",   SpectrumFormat::Text},
    {"csv",   SpectrumFormat::Csv},
    {"lnw",   SpectrumFormat::Lnw}
};

static const std::unordered_map<SpectrumFormat, SpectrumParser> kParserMap = {
    {SpectrumFormat::Fits, [](const Bytes& b, const std::string& n, const ParseOptions&)
                           { return parse_fits(b, n); }},
    {SpectrumFormat::Text, [](const Bytes& b, const std::string& n, const ParseOptions&)
                           { return parse_text(std::string(b.begin(), b.end()), n); }},
    {SpectrumFormat::Csv,  [](const Bytes& b, const std::string& n, const ParseOptions&)
                           { return parse_csv(std::string(b.begin(), b.end()), n); }},
    {SpectrumFormat::Lnw,  [](const Bytes& b, const std::string& n, const ParseOptions& o)
                           { return parse_lnw(std::string(b.begin(), b.end()), n, o.lnw_epoch); }}
};

const std::vector<std::string>& supported_extensions()
{
    static const std::vector<std::string> exts = {
        "fits", "fit", "fts", "dat", "txt", "ascii", "flm", "csv", "lnw"};
    return exts;
}

std::optional<SpectrumFormat> format_from_tag(const std::string& tag)
{
    std::string t = lower(tag);
    if (!t.empty() && t.front() == '.') t.erase(0, 1);
    auto it = kExtensionMap.find(t);
    if (it == kExtensionMap.end()) return std::nullopt;
    return it->second;
}

std::optional<SpectrumFormat> sniff_format(const std::string& file_name)
{
    const std::string ext = fs::path(file_name).extension().string();
    if (ext.empty()) return std::nullopt;
    return format_from_tag(ext);
}

SpectrumFormat resolve_format(const std::string& file_name,
                              const std::optional<SpectrumFormat>& declared)
{
    if (declared) return *declared;
    if (auto f = sniff_format(file_name)) return *f;

    std::string list;
    for (const auto& e : supported_extensions()) {
        if (!list.empty()) list += ", ";
        list += e;
    }
    const std::string ext = fs::path(file_name).extension().string();
    throw FormatError("Unsupported file format '" + (ext.empty() ? std::string("<none>") : ext)
                      + "' for '" + file_name + "'; supported formats: " + list);
}

Spectrum parse_spectrum(const Bytes& content,
                        const std::string& file_name,
                        const std::optional<SpectrumFormat>& format,
                        const ParseOptions& options)
{
    const SpectrumFormat f = resolve_format(file_name, format);
    Spectrum sp = kParserMap.at(f)(content, file_name, options);
    validate_spectrum(sp);
    return sp;
}

Bytes read_file(const std::string& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        throw NotFoundError("Cannot open '" + path + "'");
    return Bytes(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

Spectrum load_spectrum(const std::string& path,
                       const std::optional<SpectrumFormat>& format,
                       const ParseOptions& options)
{
    return parse_spectrum(read_file(path), fs::path(path).filename().string(),
                          format, options);
}

std::string write_ascii(const Spectrum& spectrum)
{
    std::ostringstream out;
    out << "# wavelength flux\n";
    out << std::setprecision(17);
    for (Eigen::Index i = 0; i < spectrum.lambda.size(); ++i)
        out << spectrum.lambda[i] << ' ' << spectrum.flux[i] << '\n';
    return out.str();
}

} // namespace snclass

// =============================================================================
// test_spectrum_loaders.cpp - text, CSV, LNW and FITS readers
// =============================================================================

#include <gtest/gtest.h>
#include "TestHelpers.hpp"
#include "snclass/Errors.hpp"
#include "snclass/SpectrumLoaders.hpp"

#include <CCfits/CCfits>
#include <fstream>
#include <iterator>
#include <valarray>

using namespace snclass;
using namespace snclass::test;

class SpectrumLoadersTest : public ::testing::Test {
protected:
    TempDir tmp;

    static std::string lnw_two_epochs()
    {
        return
            "    2    5   2500.00  10000.00    2     sn1999aa  1.05  Ia  Ia-norm\n"
            "     0.0  0.1  0.2\n"
            "     1.0  0.3  0.4\n"
            "     2.0  0.5  0.6\n"
            "       0   -3.10    5.20\n"
            "  4000.0  0.10  1.10\n"
            "  4100.0  0.20  1.20\n"
            "  4200.0  0.30  1.30\n"
            "  4300.0  0.40  1.40\n"
            "  4400.0  0.50  1.50\n";
    }
};

// -----------------------------------------------------------------------------
// Plain text
// -----------------------------------------------------------------------------

TEST_F(SpectrumLoadersTest, TextRoundTripKeepsEveryValue) {
    const Spectrum in = synthetic_sn(0.02, 200);
    const Spectrum out = parse_text(write_ascii(in), "roundtrip.dat");

    ASSERT_EQ(out.size(), in.size());
    for (Eigen::Index i = 0; i < in.size(); ++i) {
        EXPECT_DOUBLE_EQ(out.lambda[i], in.lambda[i]);
        EXPECT_DOUBLE_EQ(out.flux[i], in.flux[i]);
    }
    EXPECT_EQ(out.format, SpectrumFormat::Text);
    EXPECT_EQ(out.state, ProcessingState::Raw);
}

TEST_F(SpectrumLoadersTest, TextSkipsCommentsHeaderAndExtraColumns) {
    const std::string content =
        "# observed 2019-04-01\n"
        "wavelength flux error\n"
        "\n"
        "4000.0 1.5 0.1\n"
        "4002.0,1.6,0.1\n"
        "4004.0\t1.7\t0.1\n";
    const Spectrum sp = parse_text(content, "obs.txt");

    ASSERT_EQ(sp.size(), 3);
    EXPECT_DOUBLE_EQ(sp.lambda[2], 4004.0);
    EXPECT_DOUBLE_EQ(sp.flux[1], 1.6);
}

TEST_F(SpectrumLoadersTest, TextRowsAreSortedByWavelength) {
    const Spectrum sp = parse_text("5000 3\n4000 1\n4500 2\n", "unsorted.dat");
    ASSERT_EQ(sp.size(), 3);
    EXPECT_DOUBLE_EQ(sp.lambda[0], 4000.0);
    EXPECT_DOUBLE_EQ(sp.flux[0], 1.0);
    EXPECT_DOUBLE_EQ(sp.flux[2], 3.0);
}

TEST_F(SpectrumLoadersTest, BadNumberReportsLineAndColumn) {
    try {
        parse_text("4000 1.0\n4001 abc\n", "bad.dat");
        FAIL() << "expected FormatError";
    } catch (const FormatError& e) {
        EXPECT_EQ(e.line(), 2);
        EXPECT_EQ(e.column(), 6);
        EXPECT_NE(std::string(e.what()).find("bad.dat:2:6"), std::string::npos);
        EXPECT_EQ(e.kind(), ErrorKind::Format);
    }
}

TEST_F(SpectrumLoadersTest, SingleColumnLineIsRejected) {
    EXPECT_THROW(parse_text("4000 1.0\n4001\n", "short.dat"), FormatError);
}

TEST_F(SpectrumLoadersTest, DelimiterOnlyLineIsRejected) {
    try {
        parse_text("4000 1.0\n,,,\n4001 2.0\n", "commas.dat");
        FAIL() << "expected FormatError";
    } catch (const FormatError& e) {
        EXPECT_EQ(e.line(), 2);
        EXPECT_EQ(e.column(), 1);
        EXPECT_NE(std::string(e.what()).find("found 0"), std::string::npos);
    }
}

TEST_F(SpectrumLoadersTest, SingleColumnMessageCountsTokens) {
    try {
        parse_text("4000 1.0\n4001\n", "short.dat");
        FAIL() << "expected FormatError";
    } catch (const FormatError& e) {
        EXPECT_NE(std::string(e.what()).find("found 1"), std::string::npos);
    }
}

TEST_F(SpectrumLoadersTest, DuplicateWavelengthIsRejected) {
    EXPECT_THROW(parse_text("4000 1.0\n4001 2.0\n4000 3.0\n", "dup.dat"), FormatError);
}

TEST_F(SpectrumLoadersTest, EmptyInputIsAFormatError) {
    EXPECT_THROW(parse_text("# nothing here\n\n", "empty.dat"), FormatError);
}

TEST_F(SpectrumLoadersTest, NonFiniteFluxFailsValidation) {
    EXPECT_THROW(parse_spectrum(to_bytes("4000 1\n4001 nan\n4002 1\n"), "nan.dat"),
                 ValidationError);
}

// -----------------------------------------------------------------------------
// CSV
// -----------------------------------------------------------------------------

TEST_F(SpectrumLoadersTest, CsvUsesNamedColumns) {
    const std::string content =
        "flux,error,Wavelength\n"
        "1.0,0.1,4000\n"
        "2.0,0.1,4010\n"
        "3.0,0.1,4020\n";
    const Spectrum sp = parse_csv(content, "named.csv");

    ASSERT_EQ(sp.size(), 3);
    EXPECT_DOUBLE_EQ(sp.lambda[0], 4000.0);
    EXPECT_DOUBLE_EQ(sp.flux[2], 3.0);
    EXPECT_EQ(sp.format, SpectrumFormat::Csv);
}

TEST_F(SpectrumLoadersTest, CsvWithoutHeaderTakesFirstTwoColumns) {
    const Spectrum sp = parse_csv("4000,1\n4010,2\n", "plain.csv");
    ASSERT_EQ(sp.size(), 2);
    EXPECT_DOUBLE_EQ(sp.flux[1], 2.0);
}

TEST_F(SpectrumLoadersTest, CsvAcceptsTabDelimiter) {
    const Spectrum sp = parse_csv("wave\tflux\n4000\t1\n4010\t2\n", "tabs.csv");
    ASSERT_EQ(sp.size(), 2);
    EXPECT_DOUBLE_EQ(sp.lambda[1], 4010.0);
}

TEST_F(SpectrumLoadersTest, CsvShortRowIsRejected) {
    EXPECT_THROW(parse_csv("wave,error,flux\n4000,0.1,1\n4010,0.1\n", "short.csv"),
                 FormatError);
}

// -----------------------------------------------------------------------------
// SNID templates
// -----------------------------------------------------------------------------

TEST_F(SpectrumLoadersTest, LnwReadsHeaderAndSelectedEpoch) {
    const Spectrum e0 = parse_lnw(lnw_two_epochs(), "sn1999aa.lnw", 0);
    const Spectrum e1 = parse_lnw(lnw_two_epochs(), "sn1999aa.lnw", 1);

    ASSERT_EQ(e0.size(), 5);
    EXPECT_DOUBLE_EQ(e0.flux[0], 0.10);
    EXPECT_DOUBLE_EQ(e1.flux[0], 1.10);
    EXPECT_DOUBLE_EQ(e1.lambda[4], 4400.0);

    EXPECT_EQ(e0.metadata.at("name"), "sn1999aa");
    EXPECT_EQ(e0.metadata.at("type"), "Ia");
    EXPECT_EQ(e0.metadata.at("subtype"), "Ia-norm");
    EXPECT_EQ(e0.metadata.at("age"), "-3.10");
    EXPECT_EQ(e1.metadata.at("age"), "5.20");
    EXPECT_EQ(e0.format, SpectrumFormat::Lnw);
}

TEST_F(SpectrumLoadersTest, LnwEpochOutOfRange) {
    EXPECT_THROW(parse_lnw(lnw_two_epochs(), "sn1999aa.lnw", 2), FormatError);
}

TEST_F(SpectrumLoadersTest, LnwHeaderCountsMustFitAnInt) {
    std::string huge = lnw_two_epochs();
    huge.replace(huge.find("    2    5"), 10, " 1e20    5");
    try {
        parse_lnw(huge, "huge.lnw");
        FAIL() << "expected FormatError";
    } catch (const FormatError& e) {
        EXPECT_EQ(e.line(), 1);
        EXPECT_NE(std::string(e.what()).find("1e20"), std::string::npos);
    }

    std::string fractional = lnw_two_epochs();
    fractional.replace(fractional.find("    2    5"), 10, "    2  5.5");
    EXPECT_THROW(parse_lnw(fractional, "fractional.lnw"), FormatError);
}

TEST_F(SpectrumLoadersTest, LnwFreeFormHeaderFallsBackToTwoColumns) {
    const Spectrum sp = parse_lnw("sn2001xx Ib peculiar\n4000 1\n4010 2\n4020 3\n", "old.lnw");
    ASSERT_EQ(sp.size(), 3);
    EXPECT_EQ(sp.metadata.at("header"), "sn2001xx Ib peculiar");
}

TEST_F(SpectrumLoadersTest, LnwEpochIsTakenFromParseOptions) {
    ParseOptions po;
    po.lnw_epoch = 1;
    const Spectrum sp = parse_spectrum(to_bytes(lnw_two_epochs()), "sn1999aa.lnw",
                                       std::nullopt, po);
    EXPECT_DOUBLE_EQ(sp.flux[2], 1.30);
}

// -----------------------------------------------------------------------------
// Format resolution
// -----------------------------------------------------------------------------

TEST_F(SpectrumLoadersTest, ExtensionSniffingIsCaseInsensitive) {
    EXPECT_EQ(sniff_format("SN2011FE.DAT"), SpectrumFormat::Text);
    EXPECT_EQ(sniff_format("spec.Fits"), SpectrumFormat::Fits);
    EXPECT_EQ(sniff_format("spec.flm"), SpectrumFormat::Text);
    EXPECT_EQ(sniff_format("spec.csv"), SpectrumFormat::Csv);
    EXPECT_FALSE(sniff_format("spec").has_value());
    EXPECT_EQ(format_from_tag(".LNW"), SpectrumFormat::Lnw);
}

TEST_F(SpectrumLoadersTest, UnsupportedExtensionListsSupportedFormats) {
    try {
        parse_spectrum(to_bytes("4000 1\n4001 2\n"), "spectrum.xyz");
        FAIL() << "expected FormatError";
    } catch (const FormatError& e) {
        const std::string msg = e.what();
        EXPECT_NE(msg.find(".xyz"), std::string::npos);
        for (const auto& ext : supported_extensions())
            EXPECT_NE(msg.find(ext), std::string::npos) << ext;
    }
}

TEST_F(SpectrumLoadersTest, DeclaredFormatOverridesExtension) {
    const Spectrum sp = parse_spectrum(to_bytes("4000 1\n4001 2\n"), "upload.bin",
                                       SpectrumFormat::Text);
    EXPECT_EQ(sp.size(), 2);
}

TEST_F(SpectrumLoadersTest, LoadSpectrumReadsFromDisk) {
    const std::string path = tmp.write("sn.dat", write_ascii(synthetic_sn(0.0, 50)));
    const Spectrum sp = load_spectrum(path);
    EXPECT_EQ(sp.size(), 50);
    EXPECT_EQ(sp.file_name, "sn.dat");
}

TEST_F(SpectrumLoadersTest, MissingFileIsNotFound) {
    EXPECT_THROW(read_file((tmp.path() / "missing.dat").string()), NotFoundError);
}

// -----------------------------------------------------------------------------
// FITS
// -----------------------------------------------------------------------------

static Bytes slurp(const std::string& path)
{
    std::ifstream in(path, std::ios::binary);
    return Bytes(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

TEST_F(SpectrumLoadersTest, FitsBinaryTableWithNamedColumns) {
    const std::string path = (tmp.path() / "table.fits").string();
    const int rows = 64;
    {
        CCfits::FITS f("!" + path, CCfits::Write);
        std::vector<std::string> names{"FLUX", "WAVELENGTH"};
        std::vector<std::string> forms{"1D", "1D"};
        std::vector<std::string> units{"erg/s/cm2/A", "Angstrom"};
        CCfits::Table* t = f.addTable("SPECTRUM", rows, names, forms, units);

        std::vector<double> wave(rows), flux(rows);
        for (int i = 0; i < rows; ++i) {
            wave[i] = 4000.0 + 10.0 * i;
            flux[i] = 1.0 + 0.01 * i;
        }
        t->column("WAVELENGTH").write(wave, 1);
        t->column("FLUX").write(flux, 1);
    }

    const Spectrum sp = parse_spectrum(slurp(path), "table.fits");
    ASSERT_EQ(sp.size(), rows);
    EXPECT_DOUBLE_EQ(sp.lambda[0], 4000.0);
    EXPECT_DOUBLE_EQ(sp.flux[10], 1.1);
    EXPECT_EQ(sp.format, SpectrumFormat::Fits);
    EXPECT_EQ(sp.metadata.at("extension"), "SPECTRUM");
}

TEST_F(SpectrumLoadersTest, FitsPrimaryImageUsesWcs) {
    const std::string path = (tmp.path() / "image.fits").string();
    const long n = 32;
    {
        long naxes[1] = {n};
        CCfits::FITS f("!" + path, DOUBLE_IMG, 1, naxes);
        f.pHDU().addKey("CRVAL1", 5000.0, "first pixel wavelength");
        f.pHDU().addKey("CDELT1", 2.5, "dispersion");
        f.pHDU().addKey("CRPIX1", 1.0, "reference pixel");

        std::valarray<double> data(static_cast<std::size_t>(n));
        for (long i = 0; i < n; ++i) data[static_cast<std::size_t>(i)] = static_cast<double>(i);
        f.pHDU().write(1, n, data);
    }

    const Spectrum sp = parse_spectrum(slurp(path), "image.fits");
    ASSERT_EQ(sp.size(), n);
    EXPECT_DOUBLE_EQ(sp.lambda[0], 5000.0);
    EXPECT_DOUBLE_EQ(sp.lambda[4], 5010.0);
    EXPECT_DOUBLE_EQ(sp.flux[4], 4.0);
}

TEST_F(SpectrumLoadersTest, GarbageFitsIsAFormatError) {
    EXPECT_THROW(parse_spectrum(to_bytes("SIMPLE = nonsense"), "broken.fits"), FormatError);
}

// =============================================================================
// test_pipeline.cpp - end-to-end classification and redshift requests
// =============================================================================

#include <gtest/gtest.h>
#include "TestHelpers.hpp"
#include "snclass/ClassificationPipeline.hpp"
#include "snclass/Errors.hpp"
#include "snclass/ReportUtils.hpp"

#include <chrono>
#include <thread>

using namespace snclass;
using namespace snclass::test;

class PipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        grid = make_grid();
        norm = std::make_shared<const SpectrumNormalizer>(grid);

        auto lib = std::make_shared<TemplateLibrary>();
        lib->add(make_template(*norm, "Ia-norm", "2 to 6", "sn1999aa", synthetic_sn()));
        lib->add(make_template(*norm, "II-P", "2 to 6", "sn1999em", unrelated_spectrum()));
        templates = lib;

        MatcherConfig mc;
        mc.rlap_min = 0.0;
        matcher = std::make_shared<const CrossCorrelationMatcher>(grid, mc);

        registry = std::make_shared<ModelRegistry>();
        registry->set_builtin(test_descriptor("dash"), fixed_backend({3.0, 1.0, 0.5, 0.0}));

        seen_input = std::make_shared<Matrix>();
        auto seen = seen_input;
        registry->set_builtin(test_descriptor("transformer", ModelKind::BuiltinTransformer),
                              [seen](const Matrix& in) {
                                  *seen = in;
                                  Vector out(4);
                                  out << 0.1, 0.2, 0.6, 0.1;
                                  return out;
                              });
        dispatcher = std::make_shared<const ModelDispatcher>(registry);
    }

    ClassificationPipeline pipeline(ClassificationPipeline::Config cfg = {}) const {
        return ClassificationPipeline(norm, templates, matcher, dispatcher, cfg);
    }

    static NamedFile file_of(const Spectrum& sp, const std::string& name = "sn.dat") {
        return NamedFile{name, to_bytes(write_ascii(sp))};
    }

    static ClassificationRequest request_of(const Spectrum& sp) {
        ClassificationRequest req;
        req.file = file_of(sp);
        return req;
    }

    GridPtr grid;
    std::shared_ptr<const SpectrumNormalizer> norm;
    LibraryPtr templates;
    std::shared_ptr<const CrossCorrelationMatcher> matcher;
    std::shared_ptr<ModelRegistry> registry;
    std::shared_ptr<const ModelDispatcher> dispatcher;
    std::shared_ptr<Matrix> seen_input;
};

// -----------------------------------------------------------------------------
// classify
// -----------------------------------------------------------------------------

TEST_F(PipelineTest, ClassifyWalksEveryStage) {
    const ClassificationOutcome out = pipeline().classify(request_of(synthetic_sn()));

    const std::vector<PipelineState> expected = {
        PipelineState::Received, PipelineState::Parsed, PipelineState::Normalized,
        PipelineState::RedshiftSkipped, PipelineState::Classified, PipelineState::Done};
    EXPECT_EQ(out.trace, expected);

    ASSERT_EQ(out.best_matches.size(), 3u);
    EXPECT_EQ(out.best_matches[0].type, "Ia-norm");
    EXPECT_EQ(out.best_matches[0].age, "2 to 6");
    EXPECT_FALSE(out.best_matches[0].rlap.has_value());
    EXPECT_EQ(out.spectrum.state, ProcessingState::Normalized);
    EXPECT_EQ(out.file_name, "sn.dat");
    EXPECT_FALSE(out.redshift.has_value());
}

TEST_F(PipelineTest, TypeProbabilitiesAggregateAgeBins) {
    const ClassificationOutcome out = pipeline().classify(request_of(synthetic_sn()));

    ASSERT_EQ(out.type_probabilities.size(), 3u);
    EXPECT_EQ(out.type_probabilities[0].label, "Ia-norm");

    double ia = 0.0, total = 0.0;
    for (const auto& p : out.result.ranked) {
        total += p.probability;
        if (p.label.rfind("Ia-norm:", 0) == 0) ia += p.probability;
    }
    EXPECT_NEAR(out.type_probabilities[0].probability, ia, 1e-12);
    EXPECT_NEAR(total, 1.0, 1e-9);
}

TEST_F(PipelineTest, TopNLimitsBestMatches) {
    ClassificationRequest req = request_of(synthetic_sn());
    req.options.top_n = 1;
    EXPECT_EQ(pipeline().classify(req).best_matches.size(), 1u);
}

TEST_F(PipelineTest, KnownRedshiftSkipsEstimation) {
    ClassificationRequest req = request_of(synthetic_sn(0.05));
    req.options.normalize.known_z = true;
    req.options.normalize.z_value = 0.05;
    req.options.redshift_context  = RedshiftContext{"Ia-norm", std::string("2 to 6")};

    const ClassificationOutcome out = pipeline().classify(req);
    EXPECT_EQ(out.spectrum.state, ProcessingState::Deredshifted);
    EXPECT_DOUBLE_EQ(out.spectrum.redshift, 0.05);
    EXPECT_EQ(out.result.state, ProcessingState::Deredshifted);
    EXPECT_FALSE(out.redshift.has_value());
    EXPECT_EQ(out.trace[3], PipelineState::RedshiftSkipped);
}

TEST_F(PipelineTest, RedshiftContextEstimatesBeforeClassifying) {
    ClassificationRequest req = request_of(synthetic_sn(0.05));
    req.options.redshift_context = RedshiftContext{"Ia-norm", std::string("2 to 6")};

    const ClassificationOutcome out = pipeline().classify(req);
    ASSERT_TRUE(out.redshift.has_value());
    ASSERT_TRUE(out.redshift->found()) << out.redshift->message;
    EXPECT_NEAR(out.redshift->match->redshift, 0.05, 0.005);
    EXPECT_EQ(out.spectrum.state, ProcessingState::Deredshifted);
    EXPECT_DOUBLE_EQ(out.spectrum.redshift, out.redshift->match->redshift);
    EXPECT_EQ(out.trace[3], PipelineState::RedshiftEstimated);
}

TEST_F(PipelineTest, UnknownRedshiftContextIsNotFound) {
    ClassificationRequest req = request_of(synthetic_sn());
    req.options.redshift_context = RedshiftContext{"Ia", std::string("2 to 6")};
    EXPECT_THROW(pipeline().classify(req), NotFoundError);
}

TEST_F(PipelineTest, RlapIsAttachedToTheBestMatch) {
    ClassificationPipeline::Config cfg;
    cfg.rlap_warning = 1e9;
    ClassificationRequest req = request_of(synthetic_sn());
    req.options.calculate_rlap = true;

    const ClassificationOutcome out = pipeline(cfg).classify(req);
    ASSERT_TRUE(out.best_matches[0].rlap.has_value());
    EXPECT_GT(*out.best_matches[0].rlap, 0.0);
    ASSERT_TRUE(out.best_matches[0].rlap_warning.has_value());
    EXPECT_NE(out.best_matches[0].rlap_warning->find("Low RLAP"), std::string::npos);
    EXPECT_FALSE(out.best_matches[1].rlap.has_value());
}

TEST_F(PipelineTest, TransformerSeesResampledSpectrum) {
    ClassificationRequest req = request_of(synthetic_sn(0.0, 1500, 5000.0, 8000.0));
    req.options.model = BuiltinModel{"transformer"};
    req.options.normalize.known_z = true;
    req.options.normalize.z_value = 0.0;

    const ClassificationOutcome out = pipeline().classify(req);
    EXPECT_EQ(out.result.kind, ModelKind::BuiltinTransformer);
    EXPECT_EQ(out.best_matches[0].type, "II-P");

    ASSERT_EQ(seen_input->rows(), 3);
    EXPECT_DOUBLE_EQ((*seen_input)(1, 0), 0.0);           // unconditioned fill
    EXPECT_DOUBLE_EQ((*seen_input)(1, 0), out.spectrum.flux[0]);
    EXPECT_DOUBLE_EQ((*seen_input)(0, 10), grid->lambda()[10]);
}

TEST_F(PipelineTest, TransformerGetsTheEstimatedRedshift) {
    ClassificationRequest req = request_of(synthetic_sn(0.05));
    req.options.model = BuiltinModel{"transformer"};
    req.options.redshift_context = RedshiftContext{"Ia-norm", std::string("2 to 6")};

    const ClassificationOutcome out = pipeline().classify(req);
    ASSERT_TRUE(out.redshift && out.redshift->found());
    EXPECT_NEAR((*seen_input)(2, 0), out.redshift->match->redshift, 1e-12);
    EXPECT_NEAR((*seen_input)(2, 0), 0.05, 0.005);
}

TEST_F(PipelineTest, TransformerWithoutRedshiftIsRejected) {
    ClassificationRequest req = request_of(synthetic_sn());
    req.options.model = BuiltinModel{"transformer"};
    try {
        pipeline().classify(req);
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(std::string(e.what()), "Redshift is required for Transformer model");
    }
    EXPECT_EQ(seen_input->size(), 0);
}

// -----------------------------------------------------------------------------
// failures
// -----------------------------------------------------------------------------

TEST_F(PipelineTest, ParseFailureRecordsTheTrace) {
    ClassificationRequest req;
    req.file = NamedFile{"broken.dat", to_bytes("4000 x\n4001 1\n")};
    try {
        pipeline().classify(req);
        FAIL() << "expected FormatError";
    } catch (const FormatError& e) {
        EXPECT_EQ(e.trace(), (std::vector<std::string>{"received", "failed"}));
    }
}

TEST_F(PipelineTest, NormalizationFailureRecordsTheTrace) {
    ClassificationRequest req = request_of(synthetic_sn());
    req.options.normalize.smoothing = 40;
    try {
        pipeline().classify(req);
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.trace(), (std::vector<std::string>{"received", "parsed", "failed"}));
        EXPECT_EQ(error_json(e)["trace"].back().get<std::string>(), "failed");
    }
}

TEST_F(PipelineTest, ParseErrorsKeepTheirKind) {
    ClassificationRequest req;
    req.file = NamedFile{"broken.dat", to_bytes("4000 x\n4001 1\n")};
    EXPECT_THROW(pipeline().classify(req), FormatError);

    req.file.name = "broken.xyz";
    EXPECT_THROW(pipeline().classify(req), FormatError);
}

TEST_F(PipelineTest, InvalidOptionsAreValidationErrors) {
    ClassificationRequest req = request_of(synthetic_sn());
    req.options.normalize.smoothing = 40;
    EXPECT_THROW(pipeline().classify(req), ValidationError);
}

TEST_F(PipelineTest, BackendFailureIsAnExternalServiceError) {
    registry->register_user(test_descriptor("broken", ModelKind::UserUploaded),
                            [](const Matrix&) -> Vector {
                                throw std::runtime_error("session closed");
                            });
    ClassificationRequest req = request_of(synthetic_sn());
    req.options.model = UserModel{"broken"};
    EXPECT_THROW(pipeline().classify(req), ExternalServiceError);
}

TEST_F(PipelineTest, SlowModelTimesOut) {
    registry->register_user(test_descriptor("slow", ModelKind::UserUploaded),
                            [](const Matrix&) {
                                std::this_thread::sleep_for(std::chrono::milliseconds(500));
                                return Vector(Vector::Constant(4, 0.25));
                            });
    ClassificationPipeline::Config cfg;
    cfg.timeout_seconds = 0.1;

    ClassificationRequest req = request_of(synthetic_sn());
    req.options.model = UserModel{"slow"};

    const auto t0 = std::chrono::steady_clock::now();
    EXPECT_THROW(pipeline(cfg).classify(req), TimeoutError);
    const auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - t0).count();
    EXPECT_LT(waited, 450);
}

// -----------------------------------------------------------------------------
// redshift only
// -----------------------------------------------------------------------------

TEST_F(PipelineTest, EstimateRedshiftFromFile) {
    const RedshiftEstimate est = pipeline().estimate_redshift(
        file_of(synthetic_sn(0.08)), std::nullopt, {}, "Ia-norm", "2 to 6");
    ASSERT_TRUE(est.found()) << est.message;
    EXPECT_NEAR(est.match->redshift, 0.08, 0.005);
}

TEST_F(PipelineTest, EstimateRedshiftWithUnknownKey) {
    try {
        pipeline().estimate_redshift(file_of(synthetic_sn()), std::nullopt, {}, "Ia", "2 to 6");
        FAIL() << "expected NotFoundError";
    } catch (const NotFoundError& e) {
        const std::string msg = e.what();
        EXPECT_NE(msg.find("'Ia'"), std::string::npos);
        EXPECT_NE(msg.find("'2 to 6'"), std::string::npos);
    }
}

// -----------------------------------------------------------------------------
// JSON documents
// -----------------------------------------------------------------------------

TEST_F(PipelineTest, ClassificationJsonCarriesSpectrumAndMatches) {
    ClassificationRequest req = request_of(synthetic_sn(0.05));
    req.options.redshift_context = RedshiftContext{"Ia-norm", std::nullopt};

    const nlohmann::json j = classification_json(pipeline().classify(req));
    EXPECT_EQ(j["spectrum"]["x"].size(), 1024u);
    EXPECT_EQ(j["spectrum"]["y"].size(), 1024u);
    EXPECT_EQ(j["classification"]["model_type"].get<std::string>(), "dash");
    EXPECT_EQ(j["classification"]["best_matches"].size(), 3u);
    EXPECT_EQ(j["classification"]["trace"].back().get<std::string>(), "done");
    EXPECT_TRUE(j.contains("redshift"));
}

TEST_F(PipelineTest, NoMatchRedshiftJsonHasNullEstimate) {
    RedshiftEstimate est;
    est.message = "No valid templates found: the candidate set is empty";
    const nlohmann::json j = redshift_json(est);
    EXPECT_TRUE(j["estimated_redshift"].is_null());
    EXPECT_EQ(j["message"].get<std::string>(), est.message);

    const nlohmann::json e = error_json("boom", ErrorKind::Timeout);
    EXPECT_EQ(e["error_type"].get<std::string>(), "TimeoutError");
}

// =============================================================================
// test_model_dispatcher.cpp - descriptors, registry snapshots and inference
// =============================================================================

#include <gtest/gtest.h>
#include "TestHelpers.hpp"
#include "snclass/Bootstrap.hpp"
#include "snclass/Errors.hpp"
#include "snclass/ModelDispatcher.hpp"
#include "snclass/ModelRegistry.hpp"

#include <nlohmann/json.hpp>
#include <thread>

using namespace snclass;
using namespace snclass::test;

class ModelDispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry = std::make_shared<ModelRegistry>();
        registry->set_builtin(test_descriptor("dash"), fixed_backend({2.0, 0.5, 0.1, -1.0}));
        dispatcher = std::make_unique<ModelDispatcher>(registry);

        norm = std::make_unique<SpectrumNormalizer>(make_grid());
        spectrum = norm->normalize(synthetic_sn());
    }

    static nlohmann::json upload_metadata(const std::string& id, int outputs, int labels) {
        nlohmann::json mapping = nlohmann::json::object();
        for (int i = 0; i < labels; ++i) mapping["class " + std::to_string(i)] = i;
        return {
            {"model_id", id},
            {"class_mapping", mapping},
            {"input_shape", {1, 1024}},
            {"output_shape", {1, outputs}}
        };
    }

    static BackendLoader uniform_loader() {
        return [](const std::string&, const ModelDescriptor& d) {
            return fixed_backend(std::vector<double>(d.classes.size(), 1.0));
        };
    }

    std::shared_ptr<ModelRegistry> registry;
    std::unique_ptr<ModelDispatcher> dispatcher;
    std::unique_ptr<SpectrumNormalizer> norm;
    Spectrum spectrum;
};

// -----------------------------------------------------------------------------
// Descriptors
// -----------------------------------------------------------------------------

TEST_F(ModelDispatcherTest, ClassMappingMustBeContiguous) {
    EXPECT_NO_THROW(ClassMapping::from_json({{"a", 0}, {"b", 1}}));
    EXPECT_THROW(ClassMapping::from_json({{"a", 0}, {"b", 2}}), ValidationError);
    EXPECT_THROW(ClassMapping::from_json({{"a", 1}, {"b", 1}}), ValidationError);
    EXPECT_THROW(ClassMapping::from_json({{"a", "zero"}}), ValidationError);
    EXPECT_THROW(ClassMapping::from_json(nlohmann::json::object()), ValidationError);

    const ClassMapping m = ClassMapping::from_json({{"b", 1}, {"a", 0}});
    EXPECT_EQ(m.label(0), "a");
    EXPECT_EQ(m.to_json()["b"].get<int>(), 1);
}

TEST_F(ModelDispatcherTest, OutputShapeMustMatchClassCount) {
    try {
        descriptor_from_json(upload_metadata("m1", 4, 5));
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(std::string(e.what()),
                  "Model output shape [1, 4] does not match class mapping size 5");
    }
}

TEST_F(ModelDispatcherTest, MetadataAcceptsSeveralInputShapes) {
    nlohmann::json meta = upload_metadata("multi", 3, 3);
    meta["input_shape"] = {{1, 1024}, {1, 2048}};
    const ModelDescriptor d = descriptor_from_json(meta);
    EXPECT_TRUE(d.accepts({1, 1024}));
    EXPECT_TRUE(d.accepts({1, 2048}));
    EXPECT_FALSE(d.accepts({1, 512}));
}

TEST_F(ModelDispatcherTest, MetadataWithoutRequiredKeys) {
    nlohmann::json meta = upload_metadata("m", 2, 2);
    meta.erase("output_shape");
    EXPECT_THROW(descriptor_from_json(meta), ValidationError);
}

// -----------------------------------------------------------------------------
// Registry
// -----------------------------------------------------------------------------

TEST_F(ModelDispatcherTest, DuplicateUploadIsAConflict) {
    upload_model(*registry, upload_metadata("mine", 3, 3), "mine.pt", uniform_loader());
    EXPECT_THROW(upload_model(*registry, upload_metadata("mine", 3, 3), "mine.pt",
                              uniform_loader()),
                 ConflictError);
}

TEST_F(ModelDispatcherTest, UnknownUserModelIsNotFound) {
    try {
        dispatcher->classify(spectrum, UserModel{"ghost"});
        FAIL() << "expected NotFoundError";
    } catch (const NotFoundError& e) {
        EXPECT_EQ(std::string(e.what()), "Model with ID 'ghost' not found");
    }
}

TEST_F(ModelDispatcherTest, SnapshotsAreImmutable) {
    const auto before = registry->snapshot();
    upload_model(*registry, upload_metadata("late", 2, 2), "late.pt", uniform_loader());

    EXPECT_TRUE(before->models.find("late") == before->models.end());
    const auto after = registry->snapshot();
    EXPECT_TRUE(after->models.find("late") != after->models.end());
    EXPECT_NO_THROW(registry->user("late"));
}

TEST_F(ModelDispatcherTest, ConcurrentUploadsAreAllVisible) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([this, t] {
            upload_model(*registry, upload_metadata("model-" + std::to_string(t), 2, 2),
                         "x.pt", uniform_loader());
        });
    }
    for (auto& th : threads) th.join();

    const auto ids = registry->user_ids();
    ASSERT_EQ(ids.size(), 8u);
    EXPECT_TRUE(std::is_sorted(ids.begin(), ids.end()));
}

TEST_F(ModelDispatcherTest, UnconfiguredBuiltinIsNotFound) {
    EXPECT_THROW(dispatcher->classify(spectrum, BuiltinModel{"transformer"}), NotFoundError);
    EXPECT_FALSE(registry->has_builtin(ModelKind::BuiltinTransformer));
}

// -----------------------------------------------------------------------------
// Inference
// -----------------------------------------------------------------------------

TEST_F(ModelDispatcherTest, UnknownModelTagIsRejected) {
    try {
        dispatcher->classify(spectrum, BuiltinModel{"resnet"});
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_NE(std::string(e.what()).find("'resnet'"), std::string::npos);
    }
    EXPECT_EQ(builtin_kind_from_tag("CNN"), ModelKind::BuiltinCnn);
}

TEST_F(ModelDispatcherTest, ProbabilitiesSumToOneAndAreRanked) {
    const ClassificationResult r = dispatcher->classify(spectrum, BuiltinModel{"dash"});

    ASSERT_EQ(r.ranked.size(), 4u);
    double sum = 0.0;
    for (const auto& p : r.ranked) sum += p.probability;
    EXPECT_NEAR(sum, 1.0, 1e-9);
    EXPECT_EQ(r.ranked.front().label, "Ia-norm: 2 to 6");
    for (std::size_t i = 1; i < r.ranked.size(); ++i)
        EXPECT_GE(r.ranked[i - 1].probability, r.ranked[i].probability);
    EXPECT_EQ(r.model_id, "dash");
    EXPECT_EQ(r.kind, ModelKind::BuiltinCnn);
}

TEST_F(ModelDispatcherTest, SimplexOutputKeepsItsValues) {
    Vector raw(4);
    raw << 0.1, 0.6, 0.2, 0.1;
    const Vector p = ModelDispatcher::to_probabilities(raw);
    EXPECT_NEAR(p[1], 0.6, 1e-12);
    EXPECT_NEAR(p.sum(), 1.0, 1e-12);
}

TEST_F(ModelDispatcherTest, LogitsGoThroughSoftmax) {
    Vector raw(2);
    raw << 0.0, std::log(3.0);
    const Vector p = ModelDispatcher::to_probabilities(raw);
    EXPECT_NEAR(p[0], 0.25, 1e-12);
    EXPECT_NEAR(p[1], 0.75, 1e-12);
}

TEST_F(ModelDispatcherTest, ShapeMismatchNamesBothShapes) {
    ModelDescriptor d = test_descriptor("wide", ModelKind::UserUploaded, 2048);
    registry->register_user(d, fixed_backend({1, 0, 0, 0}));

    try {
        dispatcher->classify(spectrum, UserModel{"wide"});
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        const std::string msg = e.what();
        EXPECT_NE(msg.find("[1, 1024]"), std::string::npos);
        EXPECT_NE(msg.find("[1, 2048]"), std::string::npos);
    }
}

TEST_F(ModelDispatcherTest, WrongOutputLengthIsAModelConfigurationError) {
    registry->register_user(test_descriptor("short", ModelKind::UserUploaded),
                            fixed_backend({0.5, 0.5}));
    EXPECT_THROW(dispatcher->classify(spectrum, UserModel{"short"}), ModelConfigurationError);
}

TEST_F(ModelDispatcherTest, BackendFailureIsAnExternalServiceError) {
    registry->register_user(test_descriptor("flaky", ModelKind::UserUploaded),
                            [](const Matrix&) -> Vector {
                                throw std::runtime_error("device lost");
                            });
    try {
        dispatcher->classify(spectrum, UserModel{"flaky"});
        FAIL() << "expected ExternalServiceError";
    } catch (const ExternalServiceError& e) {
        EXPECT_NE(std::string(e.what()).find("device lost"), std::string::npos);
    }
}

TEST_F(ModelDispatcherTest, NonFiniteOutputIsAPipelineError) {
    registry->register_user(test_descriptor("nan", ModelKind::UserUploaded),
                            fixed_backend({std::nan(""), 0.0, 0.0, 0.0}));
    EXPECT_THROW(dispatcher->classify(spectrum, UserModel{"nan"}), PipelineError);
}

TEST_F(ModelDispatcherTest, TransformerInputCarriesWavelengthAndRedshift) {
    Spectrum sp = spectrum;
    sp.redshift = 0.07;
    const Matrix in = ModelDispatcher::build_input(sp, ModelKind::BuiltinTransformer);
    ASSERT_EQ(in.rows(), 3);
    ASSERT_EQ(in.cols(), 1024);
    EXPECT_DOUBLE_EQ(in(0, 0), sp.lambda[0]);
    EXPECT_DOUBLE_EQ(in(1, 10), sp.flux[10]);
    EXPECT_DOUBLE_EQ(in(2, 500), 0.07);

    const Matrix cnn = ModelDispatcher::build_input(sp, ModelKind::BuiltinCnn);
    EXPECT_EQ(cnn.rows(), 1);
}

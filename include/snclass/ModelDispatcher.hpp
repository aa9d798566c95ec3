#pragma once
#include "ModelRegistry.hpp"
#include "Spectrum.hpp"
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace snclass {

struct BuiltinModel { std::string tag; };      // "dash" | "cnn" | "transformer"
struct UserModel    { std::string id;  };

using ModelSelector = std::variant<BuiltinModel, UserModel>;

// ValidationError listing the supported tags
ModelKind builtin_kind_from_tag(const std::string& tag);

std::string describe(const ModelSelector& sel);

struct ClassProbability {
    std::string label;
    double      probability = 0.0;
};

struct ClassificationResult {
    std::vector<ClassProbability> ranked;     // probability descending
    std::string                   model_id;
    ModelKind                     kind  = ModelKind::BuiltinCnn;
    ProcessingState               state = ProcessingState::Normalized;
};

/*
 * Resolves a selector through the registry, builds the input tensor for
 * the model kind, runs inference and turns the raw output into a ranked
 * probability distribution over the model's class mapping.
 */
class ModelDispatcher {
public:
    explicit ModelDispatcher(std::shared_ptr<const ModelRegistry> registry);

    ModelPtr resolve(const ModelSelector& sel) const;

    ClassificationResult classify(const Spectrum& spectrum, const ModelSelector& sel) const;
    ClassificationResult classify(const Spectrum& spectrum, const RegisteredModel& model) const;

    /* CNN / user:   1 x N flux
     * Transformer:  3 x N  (wavelength, flux, applied redshift)        */
    static Matrix build_input(const Spectrum& spectrum, ModelKind kind);

    // Simplex outputs are renormalised, anything else goes through softmax
    static Vector to_probabilities(const Vector& raw);

    const ModelRegistry& registry() const { return *registry_; }

private:
    std::shared_ptr<const ModelRegistry> registry_;
};

} // namespace snclass

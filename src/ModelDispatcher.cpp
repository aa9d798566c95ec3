#include "snclass/ModelDispatcher.hpp"
#include "snclass/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <numeric>

namespace snclass {

ModelKind builtin_kind_from_tag(const std::string& tag)
{
    std::string t = tag;
    std::transform(t.begin(), t.end(), t.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (t == "dash" || t == "cnn") return ModelKind::BuiltinCnn;
    if (t == "transformer")        return ModelKind::BuiltinTransformer;
    throw ValidationError("Unknown model type '" + tag
                          + "'; supported: dash, cnn, transformer");
}

std::string describe(const ModelSelector& sel)
{
    if (const auto* b = std::get_if<BuiltinModel>(&sel)) return "built-in '" + b->tag + "'";
    return "user model '" + std::get<UserModel>(sel).id + "'";
}

ModelDispatcher::ModelDispatcher(std::shared_ptr<const ModelRegistry> registry)
    : registry_(std::move(registry))
{
    if (!registry_)
        throw ConfigurationError("ModelDispatcher: no model registry");
}

ModelPtr ModelDispatcher::resolve(const ModelSelector& sel) const
{
    if (const auto* b = std::get_if<BuiltinModel>(&sel))
        return registry_->builtin(builtin_kind_from_tag(b->tag));
    return registry_->user(std::get<UserModel>(sel).id);
}

/* ---------------------------------------------------------------------- */
Matrix ModelDispatcher::build_input(const Spectrum& spectrum, ModelKind kind)
{
    const Eigen::Index n = spectrum.flux.size();
    if (kind == ModelKind::BuiltinTransformer) {
        Matrix m(3, n);
        m.row(0) = spectrum.lambda.transpose();
        m.row(1) = spectrum.flux.transpose();
        m.row(2).setConstant(spectrum.redshift);
        return m;
    }
    Matrix m(1, n);
    m.row(0) = spectrum.flux.transpose();
    return m;
}

Vector ModelDispatcher::to_probabilities(const Vector& raw)
{
    if (raw.size() == 0)
        throw PipelineError("model returned an empty output");
    if (!raw.allFinite())
        throw PipelineError("model output contains NaN/Inf");

    const double sum = raw.sum();
    if (raw.minCoeff() >= 0.0 && std::abs(sum - 1.0) <= 1e-3)
        return raw / sum;

    const Vector e = (raw.array() - raw.maxCoeff()).exp().matrix();
    return e / e.sum();
}

/* ---------------------------------------------------------------------- */
ClassificationResult ModelDispatcher::classify(const Spectrum& spectrum,
                                               const ModelSelector& sel) const
{
    const ModelPtr m = resolve(sel);
    return classify(spectrum, *m);
}

ClassificationResult ModelDispatcher::classify(const Spectrum& spectrum,
                                               const RegisteredModel& model) const
{
    const ModelDescriptor& d = model.descriptor;

    const InputShape shape = spectrum.shape();
    if (!d.accepts(shape)) {
        std::string accepted;
        for (const auto& s : d.input_shapes) {
            if (!accepted.empty()) accepted += ", ";
            accepted += format_shape(s);
        }
        throw ValidationError("Spectrum shape " + format_shape(shape)
                              + " does not match model '" + d.id
                              + "' input shape " + accepted);
    }

    const Matrix input = build_input(spectrum, d.kind);

    Vector raw;
    try {
        raw = model.backend(input);
    } catch (const std::exception& e) {
        throw ExternalServiceError("inference with model '" + d.id + "' failed: " + e.what());
    }

    if (raw.size() != static_cast<Eigen::Index>(d.classes.size()))
        throw ModelConfigurationError("model '" + d.id + "' returned " + std::to_string(raw.size())
                                      + " outputs but its class mapping has "
                                      + std::to_string(d.classes.size()) + " labels");

    const Vector p = to_probabilities(raw);

    std::vector<std::size_t> order(static_cast<std::size_t>(p.size()));
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&](std::size_t a, std::size_t b) { return p[a] > p[b]; });

    ClassificationResult res;
    res.model_id = d.id;
    res.kind     = d.kind;
    res.state    = spectrum.state;
    res.ranked.reserve(order.size());
    for (std::size_t i : order)
        res.ranked.push_back({d.classes.label(i), p[static_cast<Eigen::Index>(i)]});
    return res;
}

} // namespace snclass

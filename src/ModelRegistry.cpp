#include "snclass/ModelRegistry.hpp"
#include "snclass/Errors.hpp"
#include <algorithm>

namespace snclass {

ModelRegistry::ModelRegistry()
    : users_(std::make_shared<const Snapshot>())
{}

/* -------- built-ins -------------------------------------------------- */
void ModelRegistry::set_builtin(ModelDescriptor d, InferenceBackend backend)
{
    if (d.kind == ModelKind::UserUploaded)
        throw ConfigurationError("model '" + d.id + "' is not a built-in kind");
    if (!backend)
        throw ConfigurationError("built-in model '" + d.id + "' has no inference backend");
    try {
        validate_descriptor(d);
    } catch (const ValidationError& e) {
        throw ConfigurationError(std::string("built-in model: ") + e.what());
    }

    const ModelKind kind = d.kind;
    auto m = std::make_shared<const RegisteredModel>(
                 RegisteredModel{std::move(d), std::move(backend)});
    (kind == ModelKind::BuiltinCnn ? builtin_cnn_ : builtin_transformer_) = std::move(m);
}

bool ModelRegistry::has_builtin(ModelKind kind) const
{
    return kind == ModelKind::BuiltinCnn         ? builtin_cnn_ != nullptr
         : kind == ModelKind::BuiltinTransformer ? builtin_transformer_ != nullptr
                                                 : false;
}

ModelPtr ModelRegistry::builtin(ModelKind kind) const
{
    if (!has_builtin(kind))
        throw NotFoundError(std::string("built-in model '") + to_string(kind)
                            + "' is not configured");
    return kind == ModelKind::BuiltinCnn ? builtin_cnn_ : builtin_transformer_;
}

/* -------- user models ------------------------------------------------ */
ModelPtr ModelRegistry::register_user(ModelDescriptor d, InferenceBackend backend)
{
    d.kind = ModelKind::UserUploaded;
    validate_descriptor(d);
    if (!backend)
        throw ValidationError("model '" + d.id + "' has no inference backend");

    std::lock_guard lk(write_mtx_);
    SnapshotPtr cur = users_.load();
    if (cur->models.find(d.id) != cur->models.end())
        throw ConflictError("model id '" + d.id + "' is already registered");

    auto next = std::make_shared<Snapshot>(*cur);
    const std::string id = d.id;
    auto m = std::make_shared<const RegisteredModel>(
                 RegisteredModel{std::move(d), std::move(backend)});
    next->models.emplace(id, m);
    users_.store(std::move(next));
    return m;
}

ModelPtr ModelRegistry::user(const std::string& id) const
{
    SnapshotPtr snap = users_.load();
    auto it = snap->models.find(id);
    if (it == snap->models.end())
        throw NotFoundError("Model with ID '" + id + "' not found");
    return it->second;
}

std::vector<std::string> ModelRegistry::user_ids() const
{
    SnapshotPtr snap = users_.load();
    std::vector<std::string> ids;
    for (const auto& kv : snap->models) ids.push_back(kv.first);
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace snclass

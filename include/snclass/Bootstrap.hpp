#pragma once
#include "BatchProcessor.hpp"
#include "ClassificationPipeline.hpp"
#include "ModelRegistry.hpp"
#include "Settings.hpp"

#include <functional>
#include <memory>
#include <string>

namespace snclass {

// Turns a model artifact on disk into an inference callable
using BackendLoader =
    std::function<InferenceBackend(const std::string& artifact, const ModelDescriptor& d)>;

// Every long-lived component, wired once at startup
struct Services {
    Settings                                       settings;
    GridPtr                                        grid;
    std::shared_ptr<const SpectrumNormalizer>      normalizer;
    LibraryPtr                                     templates;
    std::shared_ptr<const CrossCorrelationMatcher> matcher;
    std::shared_ptr<ModelRegistry>                 registry;
    std::shared_ptr<const ModelDispatcher>         dispatcher;
    std::shared_ptr<const ClassificationPipeline>  pipeline;
    std::shared_ptr<const BatchProcessor>          batch;
};

/*
 * Build grid, normalizer, template library, matcher and registry from the
 * settings.  A configured built-in model or template manifest that fails
 * to load is a ConfigurationError; unconfigured ones are simply absent.
 */
Services bootstrap(const Settings& settings, const BackendLoader& loader);

/*
 * Validate upload metadata, load the artifact and publish the model.
 * ValidationError / ConflictError as for ModelRegistry::register_user.
 */
ModelPtr upload_model(ModelRegistry& registry,
                      const nlohmann::json& metadata,
                      const std::string& artifact,
                      const BackendLoader& loader);

/*
 * Register every "<id>.json" metadata file in `dir`; the artifact is the
 * metadata's "artifact" entry or "<id>.pt" beside it.  Returns the number
 * of models registered; broken entries are reported and skipped.
 */
std::size_t load_user_models(ModelRegistry& registry,
                             const std::string& dir,
                             const BackendLoader& loader,
                             bool verbose = false);

} // namespace snclass

#include "snclass/Bootstrap.hpp"
#include "snclass/Errors.hpp"
#include "snclass/JsonUtils.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace snclass {

static void install_builtin(ModelRegistry& registry,
                            ModelKind kind,
                            const ModelSettings& ms,
                            const BackendLoader& loader,
                            bool verbose)
{
    if (!ms.configured()) return;

    ModelDescriptor d;
    d.id           = to_string(kind);
    d.name         = fs::path(ms.artifact).filename().string();
    d.kind         = kind;
    d.input_shapes = ms.input_shapes;
    d.output_shape = ms.output_shape;
    try {
        d.classes = ClassMapping::from_json(ms.class_mapping);
        validate_descriptor(d);
    } catch (const ValidationError& e) {
        throw ConfigurationError(std::string("built-in model '") + d.id + "': " + e.what());
    }

    InferenceBackend backend;
    try {
        backend = loader(ms.artifact, d);
    } catch (const ConfigurationError&) {
        throw;
    } catch (const std::exception& e) {
        throw ConfigurationError("cannot load built-in model '" + d.id + "' from '"
                                 + ms.artifact + "': " + e.what());
    }
    registry.set_builtin(std::move(d), std::move(backend));

    if (verbose)
        std::cout << "Loaded: model '" << to_string(kind) << "' from " << ms.artifact << '\n';
}

/* ---------------------------------------------------------------------- */
Services bootstrap(const Settings& settings, const BackendLoader& loader)
{
    Services s;
    s.settings   = settings;
    s.grid       = make_grid(settings.grid);
    s.normalizer = std::make_shared<const SpectrumNormalizer>(s.grid, settings.normalizer);

    if (!settings.template_manifest.empty()) {
        s.templates = std::make_shared<const TemplateLibrary>(
            TemplateLibrary::load(settings.template_manifest, *s.normalizer,
                                  settings.ages, settings.verbose));
    } else {
        s.templates = std::make_shared<const TemplateLibrary>();
    }

    s.matcher  = std::make_shared<const CrossCorrelationMatcher>(s.grid, settings.matcher);
    s.registry = std::make_shared<ModelRegistry>();

    install_builtin(*s.registry, ModelKind::BuiltinCnn, settings.dash, loader, settings.verbose);
    install_builtin(*s.registry, ModelKind::BuiltinTransformer, settings.transformer, loader,
                    settings.verbose);

    if (!settings.user_models_dir.empty())
        load_user_models(*s.registry, settings.user_models_dir, loader, settings.verbose);

    s.dispatcher = std::make_shared<const ModelDispatcher>(s.registry);

    ClassificationPipeline::Config pc;
    pc.timeout_seconds = settings.timeout_seconds;
    pc.verbose         = settings.verbose;
    s.pipeline = std::make_shared<const ClassificationPipeline>(
        s.normalizer, s.templates, s.matcher, s.dispatcher, pc);

    BatchProcessor::Config bc;
    bc.workers = settings.batch_workers;
    bc.verbose = settings.verbose;
    s.batch = std::make_shared<const BatchProcessor>(s.pipeline, bc);
    return s;
}

/* ---------------------------------------------------------------------- */
ModelPtr upload_model(ModelRegistry& registry,
                      const nlohmann::json& metadata,
                      const std::string& artifact,
                      const BackendLoader& loader)
{
    ModelDescriptor d = descriptor_from_json(metadata, ModelKind::UserUploaded);
    const auto snap = registry.snapshot();
    if (snap->models.find(d.id) != snap->models.end())
        throw ConflictError("model id '" + d.id + "' is already registered");

    InferenceBackend backend;
    try {
        backend = loader(artifact, d);
    } catch (const Error&) {
        throw;
    } catch (const std::exception& e) {
        throw ValidationError("cannot load model artifact '" + artifact + "': " + e.what());
    }
    return registry.register_user(std::move(d), std::move(backend));
}

std::size_t load_user_models(ModelRegistry& registry,
                             const std::string& dir,
                             const BackendLoader& loader,
                             bool verbose)
{
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        std::cerr << "userModelsDir '" << dir << "' is not a directory\n";
        return 0;
    }

    std::vector<fs::path> meta_files;
    for (const auto& e : fs::directory_iterator(dir))
        if (e.is_regular_file() && e.path().extension() == ".json")
            meta_files.push_back(e.path());
    std::sort(meta_files.begin(), meta_files.end());

    std::size_t n = 0;
    for (const auto& p : meta_files) {
        try {
            nlohmann::json meta = load_json(p.string());
            expand_env(meta);
            const std::string artifact = meta.contains("artifact")
                ? resolve_path(dir, meta["artifact"].get<std::string>())
                : (p.parent_path() / (p.stem().string() + ".pt")).string();
            upload_model(registry, meta, artifact, loader);
            ++n;
        } catch (const Error& e) {
            std::cerr << "Skipping user model " << p << ": " << e.what() << '\n';
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "Skipping user model " << p << ": " << e.what() << '\n';
        }
    }
    if (verbose)
        std::cout << "Loaded: " << n << " user models from " << dir << '\n';
    return n;
}

} // namespace snclass

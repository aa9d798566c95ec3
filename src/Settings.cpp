#include "snclass/Settings.hpp"
#include "snclass/Errors.hpp"
#include "snclass/JsonUtils.hpp"
#include "snclass/ModelDescriptor.hpp"

#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace snclass {

static constexpr const char* kSettingsName = "snclass_settings.json";

static ModelSettings model_settings(const nlohmann::json& j,
                                    const std::string& base_dir,
                                    int nw)
{
    ModelSettings m;
    if (j.contains("artifact"))
        m.artifact = resolve_path(base_dir, j["artifact"].get<std::string>());

    if (j.contains("class_mapping")) {
        const auto& cm = j["class_mapping"];
        m.class_mapping = cm.is_string()
                        ? load_json(resolve_path(base_dir, cm.get<std::string>()))
                        : cm;
    }

    m.input_shapes = j.contains("input_shape")
                   ? input_shapes_from_json(j["input_shape"])
                   : std::vector<InputShape>{InputShape{1, nw}};
    if (j.contains("output_shape")) {
        for (const auto& v : j["output_shape"]) m.output_shape.push_back(v.get<std::int64_t>());
    } else if (m.class_mapping.is_object()) {
        m.output_shape = {1, static_cast<std::int64_t>(m.class_mapping.size())};
    }

    if (m.configured() && !m.class_mapping.is_object())
        throw ConfigurationError("model '" + m.artifact + "' has no class_mapping");
    return m;
}

Settings settings_from_json(const nlohmann::json& j, const std::string& base_dir)
{
    Settings s;
    try {
        if (j.contains("grid")) {
            const auto& g = j["grid"];
            s.grid.w0 = g.value("w0", s.grid.w0);
            s.grid.w1 = g.value("w1", s.grid.w1);
            s.grid.nw = g.value("nw", s.grid.nw);
        }
        if (j.contains("templates") && j["templates"].contains("manifest"))
            s.template_manifest =
                resolve_path(base_dir, j["templates"]["manifest"].get<std::string>());

        if (j.contains("models")) {
            const auto& m = j["models"];
            if (m.contains("dash"))
                s.dash = model_settings(m["dash"], base_dir, s.grid.nw);
            if (m.contains("transformer"))
                s.transformer = model_settings(m["transformer"], base_dir, s.grid.nw);
        }
        if (j.contains("userModelsDir"))
            s.user_models_dir = resolve_path(base_dir, j["userModelsDir"].get<std::string>());

        if (j.contains("matcher")) {
            const auto& m = j["matcher"];
            s.matcher.z_min    = m.value("zMin",    s.matcher.z_min);
            s.matcher.z_max    = m.value("zMax",    s.matcher.z_max);
            s.matcher.rlap_min = m.value("rlapMin", s.matcher.rlap_min);
            s.matcher.lap_min  = m.value("lapMin",  s.matcher.lap_min);
        }
        if (j.contains("normalizer")) {
            const auto& n = j["normalizer"];
            s.normalizer.min_points   = n.value("minPoints",   s.normalizer.min_points);
            s.normalizer.spline_knots = n.value("splineKnots", s.normalizer.spline_knots);
        }
        if (j.contains("batch"))
            s.batch_workers = j["batch"].value("workers", s.batch_workers);

        s.timeout_seconds = j.value("timeoutSeconds", s.timeout_seconds);
        s.verbose         = j.value("verbose", s.verbose);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError(std::string("settings: ") + e.what());
    } catch (const ValidationError& e) {
        throw ConfigurationError(std::string("settings: ") + e.what());
    }

    if (s.timeout_seconds < 0.0)
        throw ConfigurationError("settings: timeoutSeconds must be >= 0");
    return s;
}

/* ---------------------------------------------------------------------- */
std::optional<std::string> find_settings_file()
{
    std::vector<fs::path> search_paths = {fs::path(kSettingsName)};

    std::error_code ec;
    const fs::path exe = fs::canonical("/proc/self/exe", ec);
    if (!ec) search_paths.push_back(exe.parent_path() / kSettingsName);

    search_paths.push_back(fs::path("..") / kSettingsName);
    search_paths.push_back(fs::path("..") / ".." / kSettingsName);

    for (const auto& p : search_paths)
        if (fs::exists(p, ec)) return p.string();
    return std::nullopt;
}

Settings load_settings(const std::optional<std::string>& path)
{
    const std::optional<std::string> file = path ? path : find_settings_file();
    if (!file) {
        std::cerr << "No " << kSettingsName << " found, using defaults\n";
        return Settings{};
    }

    nlohmann::json j = load_json(*file);
    expand_env(j);

    const std::string base = fs::absolute(*file).parent_path().string();
    Settings s = settings_from_json(j, base);
    s.source = *file;
    if (s.verbose)
        std::cout << "Loaded config from: " << *file << '\n';
    return s;
}

} // namespace snclass

#pragma once
#include "AgeBinning.hpp"
#include "CrossCorrelation.hpp"
#include "SpectrumNormalizer.hpp"
#include "Types.hpp"
#include "WavelengthGrid.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace snclass {

// Built-in model entry of the settings file
struct ModelSettings {
    std::string             artifact;          // empty = backend not configured
    nlohmann::json          class_mapping;     // {label: index}
    std::vector<InputShape> input_shapes;
    InputShape              output_shape;

    bool configured() const { return !artifact.empty(); }
};

struct Settings {
    std::string source;                        // file the settings came from

    WavelengthGrid::Config     grid;
    std::string                template_manifest;
    ModelSettings              dash;
    ModelSettings              transformer;
    std::string                user_models_dir;
    MatcherConfig              matcher;
    SpectrumNormalizer::Config normalizer;
    AgeBinning                 ages;
    unsigned                   batch_workers   = 0;
    double                     timeout_seconds = 0.0;
    bool                       verbose         = false;
};

/*
 * Relative paths inside the settings are resolved against base_dir.
 * ConfigurationError on wrong types or invalid values.
 */
Settings settings_from_json(const nlohmann::json& j, const std::string& base_dir);

/*
 * snclass_settings.json in the working directory, next to the
 * executable, then one and two levels up.  nullopt when none exists.
 */
std::optional<std::string> find_settings_file();

// Explicit path wins; otherwise the search above; defaults when nothing is found
Settings load_settings(const std::optional<std::string>& path = std::nullopt);

} // namespace snclass

#pragma once
#include <nlohmann/json.hpp>
#include <string>

namespace snclass {

// ConfigurationError when the file is missing or not valid JSON
nlohmann::json load_json(const std::string& path);

// Replace ${VAR} in every string value with the environment variable
void expand_env(nlohmann::json& j);

// Relative paths are taken relative to `base_dir`
std::string resolve_path(const std::string& base_dir, const std::string& path);

} // namespace snclass

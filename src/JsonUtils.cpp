#include "snclass/JsonUtils.hpp"
#include "snclass/Errors.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <regex>

namespace snclass {

nlohmann::json load_json(const std::string& path)
{
    std::ifstream f(path);
    if (!f)
        throw ConfigurationError("Cannot open JSON file '" + path + "'");
    try {
        nlohmann::json j;
        f >> j;
        return j;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError("Invalid JSON in '" + path + "': " + e.what());
    }
}

static std::string expand(const std::string& input)
{
    static const std::regex re(R"(\$\{([^}]+)\})");
    std::string out = input;
    std::smatch m;
    while (std::regex_search(out, m, re)) {
        std::string var = m[1];
        const char* env = std::getenv(var.c_str());
        out.replace(m.position(0), m.length(0), env ? env : "");
    }
    return out;
}

void expand_env(nlohmann::json& j)
{
    if (j.is_string()) {
        j = expand(j.get<std::string>());
    } else if (j.is_array() || j.is_object()) {
        for (auto& el : j) expand_env(el);
    }
}

std::string resolve_path(const std::string& base_dir, const std::string& path)
{
    const std::filesystem::path p(path);
    if (p.is_absolute() || base_dir.empty()) return p.string();
    return (std::filesystem::path(base_dir) / p).lexically_normal().string();
}

} // namespace snclass

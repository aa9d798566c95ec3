#include "snclass/TemplateLibrary.hpp"
#include "snclass/Errors.hpp"
#include "snclass/JsonUtils.hpp"
#include "snclass/SpectrumLoaders.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace snclass {

/* -------- build ------------------------------------------------------ */
void TemplateLibrary::add(Template t)
{
    if (t.sn_type.empty() || t.age_bin.empty())
        throw ConfigurationError("template '" + t.name + "' has an empty type or age bin");
    if (t.spectrum.state == ProcessingState::Raw)
        throw ConfigurationError("template '" + t.name + "' is not normalized");

    auto& bucket = index_[t.sn_type][t.age_bin];
    bucket.push_back(std::make_shared<const Template>(std::move(t)));
    ++count_;
}

static Template template_from_entry(const nlohmann::json& e,
                                    const std::string& base_dir,
                                    const SpectrumNormalizer& normalizer,
                                    const AgeBinning& ages)
{
    Template t;
    const std::string file = e.at("file").get<std::string>();
    t.sn_type = e.at("type").get<std::string>();
    t.name    = e.value("name", fs::path(file).stem().string());

    std::optional<SpectrumFormat> format;
    if (e.contains("format")) {
        const std::string tag = e["format"].get<std::string>();
        format = format_from_tag(tag);
        if (!format)
            throw ConfigurationError("template '" + file + "': unknown format '" + tag + "'");
    }

    ParseOptions po;
    po.lnw_epoch = e.value("epoch", 0);
    Spectrum raw = load_spectrum(resolve_path(base_dir, file), format, po);

    if (e.contains("age_bin")) {
        t.age_bin = e["age_bin"].get<std::string>();
    } else if (e.contains("age")) {
        t.age_bin = ages.label(e["age"].get<double>());
    } else if (auto it = raw.metadata.find("age"); it != raw.metadata.end()) {
        t.age_bin = ages.label(std::stod(it->second));
    } else {
        throw ConfigurationError("template '" + file + "': neither age_bin nor age given");
    }

    t.spectrum = normalizer.normalize(raw);
    return t;
}

TemplateLibrary TemplateLibrary::from_json(const nlohmann::json& manifest,
                                           const std::string& base_dir,
                                           const SpectrumNormalizer& normalizer,
                                           const AgeBinning& ages)
{
    if (!manifest.contains("templates") || !manifest["templates"].is_array())
        throw ConfigurationError("template manifest has no \"templates\" array");

    TemplateLibrary lib;
    std::size_t i = 0;
    for (const auto& e : manifest["templates"]) {
        try {
            lib.add(template_from_entry(e, base_dir, normalizer, ages));
        } catch (const ConfigurationError&) {
            throw;
        } catch (const Error& ex) {
            throw ConfigurationError("template entry " + std::to_string(i)
                                     + ": " + ex.what());
        } catch (const nlohmann::json::exception& ex) {
            throw ConfigurationError("template entry " + std::to_string(i)
                                     + ": " + ex.what());
        } catch (const std::logic_error& ex) {            // std::stod on a bad LNW age
            throw ConfigurationError("template entry " + std::to_string(i)
                                     + ": " + ex.what());
        }
        ++i;
    }
    return lib;
}

TemplateLibrary TemplateLibrary::load(const std::string& manifest_path,
                                      const SpectrumNormalizer& normalizer,
                                      const AgeBinning& ages,
                                      bool verbose)
{
    nlohmann::json manifest = load_json(manifest_path);
    expand_env(manifest);

    const std::string base_dir = fs::path(manifest_path).parent_path().string();
    TemplateLibrary lib = from_json(manifest, base_dir, normalizer, ages);

    if (verbose)
        std::cout << "Loaded: " << lib.size() << " templates in "
                  << lib.keys().size() << " (type, age) bins from "
                  << manifest_path << '\n';
    return lib;
}

/* -------- lookups ---------------------------------------------------- */
const std::vector<TemplatePtr>&
TemplateLibrary::find(const std::string& sn_type, const std::string& age_bin) const
{
    auto t = index_.find(sn_type);
    if (t != index_.end()) {
        auto a = t->second.find(age_bin);
        if (a != t->second.end()) return a->second;
    }
    throw NotFoundError("No template found for sn_type='" + sn_type
                        + "', age_bin='" + age_bin + "'");
}

bool TemplateLibrary::contains(const std::string& sn_type,
                               const std::string& age_bin) const
{
    auto t = index_.find(sn_type);
    return t != index_.end() && t->second.find(age_bin) != t->second.end();
}

std::vector<TemplatePtr> TemplateLibrary::of_type(const std::string& sn_type) const
{
    auto t = index_.find(sn_type);
    if (t == index_.end())
        throw NotFoundError("No template found for sn_type='" + sn_type + "'");

    // deterministic order: by age bin label
    std::vector<std::string> bins;
    for (const auto& kv : t->second) bins.push_back(kv.first);
    std::sort(bins.begin(), bins.end());

    std::vector<TemplatePtr> out;
    for (const auto& b : bins) {
        const auto& bucket = t->second.at(b);
        out.insert(out.end(), bucket.begin(), bucket.end());
    }
    return out;
}

std::vector<TemplateKey> TemplateLibrary::keys() const
{
    std::vector<TemplateKey> out;
    for (const auto& [type, bins] : index_)
        for (const auto& kv : bins) out.push_back({type, kv.first});
    std::sort(out.begin(), out.end());
    return out;
}

std::vector<std::string> TemplateLibrary::types() const
{
    std::vector<std::string> out;
    for (const auto& kv : index_) out.push_back(kv.first);
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace snclass

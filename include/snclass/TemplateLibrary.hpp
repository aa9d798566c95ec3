/* ===================================================================== *
 *  include/snclass/TemplateLibrary.hpp  ––  (type, age bin) -> templates
 * ===================================================================== */
#pragma once
#include "AgeBinning.hpp"
#include "Spectrum.hpp"
#include "SpectrumNormalizer.hpp"

#include <ankerl/unordered_dense.h>
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

namespace snclass {

struct Template {
    std::string sn_type;      // "Ia-norm"
    std::string age_bin;      // "2 to 6"
    std::string name;         // source object, e.g. "sn1999aa"
    Spectrum    spectrum;     // normalized onto the canonical grid
};

using TemplatePtr = std::shared_ptr<const Template>;

struct TemplateKey {
    std::string sn_type;
    std::string age_bin;

    bool operator==(const TemplateKey&) const = default;
    auto operator<=>(const TemplateKey&) const = default;
};

/*
 * Reference spectra grouped by (SN type, age bin).
 *
 * Built once at startup (load / from_json / add) and then published as a
 * LibraryPtr; all lookups are const and need no locking.
 *
 * Manifest:
 *     { "templates": [ { "type": "Ia-norm", "age_bin": "2 to 6",
 *                        "file": "sn1999aa.lnw", "epoch": 0,
 *                        "format": "lnw", "name": "sn1999aa" }, … ] }
 *
 * "age" (days) may replace "age_bin"; LNW files fall back to the age of
 * the selected epoch.
 */
class TemplateLibrary {
public:
    TemplateLibrary() = default;

    /* ------------ construction ------------------------------------- */
    static TemplateLibrary load(const std::string& manifest_path,
                                const SpectrumNormalizer& normalizer,
                                const AgeBinning& ages = {},
                                bool verbose = false);

    static TemplateLibrary from_json(const nlohmann::json& manifest,
                                     const std::string& base_dir,
                                     const SpectrumNormalizer& normalizer,
                                     const AgeBinning& ages = {});

    // spectrum must already be on the canonical grid
    void add(Template t);

    /* ------------ lookups ------------------------------------------ */
    // NotFoundError when the key is unknown
    const std::vector<TemplatePtr>& find(const std::string& sn_type,
                                         const std::string& age_bin) const;
    std::vector<TemplatePtr>        of_type(const std::string& sn_type) const;
    bool contains(const std::string& sn_type, const std::string& age_bin) const;

    std::vector<TemplateKey> keys()  const;          // sorted
    std::vector<std::string> types() const;          // sorted
    std::size_t size()  const { return count_; }
    bool        empty() const { return count_ == 0; }

private:
    using Bucket = std::vector<TemplatePtr>;
    using AgeMap = ankerl::unordered_dense::map<std::string, Bucket>;

    ankerl::unordered_dense::map<std::string, AgeMap> index_;   // type -> bin -> templates
    std::size_t count_ = 0;
};

using LibraryPtr = std::shared_ptr<const TemplateLibrary>;

} // namespace snclass

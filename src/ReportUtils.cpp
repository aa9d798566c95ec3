#include "snclass/ReportUtils.hpp"

#include <fstream>
#include <iostream>

namespace snclass {

/* ===================================================================== */
/*                             h e l p e r s                              */
/* ===================================================================== */
static nlohmann::json to_array(const Vector& v)
{
    nlohmann::json a = nlohmann::json::array();
    for (Eigen::Index i = 0; i < v.size(); ++i) a.push_back(v[i]);
    return a;
}

static nlohmann::json best_match_json(const BestMatch& b)
{
    nlohmann::json j = {
        {"type",        b.type},
        {"age",         b.age},
        {"probability", b.probability}
    };
    if (b.rlap)         j["rlap"]         = *b.rlap;
    if (b.rlap_warning) j["rlap_warning"] = *b.rlap_warning;
    return j;
}

/* ===================================================================== */
nlohmann::json redshift_json(const RedshiftEstimate& est)
{
    nlohmann::json j;
    if (est.match) {
        j["estimated_redshift"]       = est.match->redshift;
        j["estimated_redshift_error"] = est.match->redshift_error;
        j["template"] = {
            {"name",    est.match->template_name},
            {"type",    est.match->key.sn_type},
            {"age_bin", est.match->key.age_bin}
        };
        j["rlap"] = est.match->rlap;
    } else {
        j["estimated_redshift"]       = nullptr;
        j["estimated_redshift_error"] = nullptr;
    }
    j["message"] = est.message;
    return j;
}

nlohmann::json classification_json(const ClassificationOutcome& out)
{
    nlohmann::json spectrum = {
        {"x",        to_array(out.spectrum.lambda)},
        {"y",        to_array(out.spectrum.flux)},
        {"redshift", out.spectrum.redshift}
    };

    nlohmann::json matches = nlohmann::json::array();
    for (const auto& b : out.best_matches) matches.push_back(best_match_json(b));

    nlohmann::json probs = nlohmann::json::array();
    for (const auto& p : out.result.ranked)
        probs.push_back(nlohmann::json{{"label", p.label}, {"probability", p.probability}});

    nlohmann::json types = nlohmann::json::array();
    for (const auto& p : out.type_probabilities)
        types.push_back(nlohmann::json{{"type", p.label}, {"probability", p.probability}});

    nlohmann::json trace = nlohmann::json::array();
    for (auto s : out.trace) trace.push_back(to_string(s));

    nlohmann::json cls = {
        {"model_type",    to_string(out.result.kind)},
        {"model_id",      out.result.model_id},
        {"state",         to_string(out.result.state)},
        {"best_matches",  matches},
        {"probabilities", probs},
        {"type_probabilities", types},
        {"trace",         trace}
    };
    if (!out.best_matches.empty())
        cls["best_match"] = best_match_json(out.best_matches.front());

    nlohmann::json j = {{"spectrum", spectrum}, {"classification", cls}};
    if (out.redshift) j["redshift"] = redshift_json(*out.redshift);
    return j;
}

nlohmann::json batch_json(const BatchReport& report)
{
    nlohmann::json results = nlohmann::json::array();
    for (const auto& it : report.items) {
        nlohmann::json r;
        if (it.ok()) {
            r = classification_json(*it.outcome);
        } else {
            r = error_json(it.error, it.error_kind.value_or(ErrorKind::Pipeline), it.trace);
        }
        r["file_name"] = it.name;
        results.push_back(std::move(r));
    }
    return {
        {"results", results},
        {"summary", {{"total",     report.total()},
                     {"succeeded", report.succeeded},
                     {"failed",    report.failed}}}
    };
}

nlohmann::json error_json(const std::string& message, ErrorKind kind,
                          const std::vector<std::string>& trace)
{
    nlohmann::json j = {{"error", message}, {"error_type", to_string(kind)}};
    if (!trace.empty()) j["trace"] = trace;
    return j;
}

nlohmann::json error_json(const Error& e)
{
    return error_json(e.what(), e.kind(), e.trace());
}

void write_json(const nlohmann::json& j, const std::string& path)
{
    if (path.empty() || path == "-") {
        std::cout << j.dump(2) << '\n';
        return;
    }
    std::ofstream f(path);
    if (!f)
        throw PipelineError("cannot write '" + path + "'");
    f << j.dump(2) << '\n';
}

} // namespace snclass

#pragma once
#include "BatchProcessor.hpp"
#include "ClassificationPipeline.hpp"
#include "CrossCorrelation.hpp"
#include "Errors.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace snclass {

/* --------------------------------------------------------------------- */
/*                 result  ->  response JSON documents                    */
/* --------------------------------------------------------------------- */

// {"estimated_redshift", "estimated_redshift_error", "message"[, "template", "rlap"]}
nlohmann::json redshift_json(const RedshiftEstimate& est);

// {"spectrum": {...}, "classification": {...}[, "redshift": {...}]}
nlohmann::json classification_json(const ClassificationOutcome& out);

// {"results": [...], "summary": {"total", "succeeded", "failed"}}
nlohmann::json batch_json(const BatchReport& report);

// {"error": message, "error_type": kind[, "trace": [...]]}
nlohmann::json error_json(const std::string& message, ErrorKind kind,
                          const std::vector<std::string>& trace = {});
nlohmann::json error_json(const Error& e);

// Pretty-printed to `path`, or to stdout when path is empty or "-"
void write_json(const nlohmann::json& j, const std::string& path);

} // namespace snclass

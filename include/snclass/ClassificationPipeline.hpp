#pragma once
#include "CrossCorrelation.hpp"
#include "ModelDispatcher.hpp"
#include "SpectrumLoaders.hpp"
#include "SpectrumNormalizer.hpp"
#include "TemplateLibrary.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace snclass {

struct NamedFile {
    std::string name;
    Bytes       content;
};

// Templates used to estimate the redshift before classification
struct RedshiftContext {
    std::string                sn_type;
    std::optional<std::string> age_bin;        // all bins of the type when empty
};

struct ClassificationOptions {
    NormalizeOptions               normalize;
    ParseOptions                   parse;
    ModelSelector                  model = BuiltinModel{"dash"};
    bool                           calculate_rlap = false;
    std::optional<RedshiftContext> redshift_context;
    std::size_t                    top_n = 3;
};

struct ClassificationRequest {
    NamedFile                     file;
    std::optional<SpectrumFormat> format;      // sniffed from the name when empty
    ClassificationOptions         options;
};

enum class PipelineState {
    Received,
    Parsed,
    Normalized,
    RedshiftEstimated,
    RedshiftSkipped,
    Classified,
    Done,
    Failed
};

const char* to_string(PipelineState s);

struct BestMatch {
    std::string                type;
    std::string                age;
    double                     probability = 0.0;
    std::optional<double>      rlap;
    std::optional<std::string> rlap_warning;
};

struct ClassificationOutcome {
    std::string                     file_name;
    Spectrum                        spectrum;          // as handed to the model
    ClassificationResult            result;
    std::vector<BestMatch>          best_matches;      // top N, best first
    std::vector<ClassProbability>   type_probabilities;
    std::optional<RedshiftEstimate> redshift;
    std::vector<PipelineState>      trace;
};

/*
 *   received -> parsed -> normalized -> (redshift-estimated | skipped)
 *            -> classified -> done
 *
 * Any stage may end in `failed`: snclass::Error subclasses propagate
 * unchanged, everything else becomes a PipelineError naming the stage.
 * Either way the error carries the trace up to and including `failed`.
 *
 * The pipeline object is a bundle of shared, immutable components; it is
 * cheap to copy and safe to use from many threads.
 */
struct ClassificationPipelineConfig {
    double timeout_seconds = 0.0;        // 0 = no deadline
    double rlap_warning    = 6.0;        // below this the best match is flagged
    bool   verbose         = false;
};

class ClassificationPipeline {
public:
    using Config = ClassificationPipelineConfig;

    ClassificationPipeline(std::shared_ptr<const SpectrumNormalizer>      normalizer,
                           LibraryPtr                                     templates,
                           std::shared_ptr<const CrossCorrelationMatcher> matcher,
                           std::shared_ptr<const ModelDispatcher>         dispatcher,
                           Config cfg = Config{});

    ClassificationOutcome classify(const ClassificationRequest& request) const;

    RedshiftEstimate estimate_redshift(const NamedFile& file,
                                       const std::optional<SpectrumFormat>& format,
                                       const NormalizeOptions& options,
                                       const std::string& sn_type,
                                       const std::string& age_bin,
                                       const ParseOptions& parse = {}) const;

    const Config&     config()    const { return cfg_; }
    const LibraryPtr& templates() const { return templates_; }

private:
    class Deadline {
    public:
        explicit Deadline(double seconds);
        void check(PipelineState next) const;    // TimeoutError when passed
    private:
        bool                                  enabled_;
        double                                seconds_;
        std::chrono::steady_clock::time_point at_;
    };

    ClassificationOutcome run_(const ClassificationRequest& request,
                               const Deadline& deadline) const;

    RedshiftEstimate estimate_(const Spectrum& normalized,
                               const RedshiftContext& ctx) const;

    void attach_rlap_(const Spectrum& normalized, BestMatch& best) const;

    std::shared_ptr<const SpectrumNormalizer>      normalizer_;   // conditioned
    std::shared_ptr<const SpectrumNormalizer>      plain_;        // resample only
    LibraryPtr                                     templates_;
    std::shared_ptr<const CrossCorrelationMatcher> matcher_;
    std::shared_ptr<const ModelDispatcher>         dispatcher_;
    Config                                         cfg_;
};

} // namespace snclass

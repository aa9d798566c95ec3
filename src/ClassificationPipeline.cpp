#include "snclass/ClassificationPipeline.hpp"
#include "snclass/AgeBinning.hpp"
#include "snclass/Errors.hpp"

#include <algorithm>
#include <future>
#include <iostream>
#include <map>
#include <sstream>
#include <thread>

namespace snclass {

const char* to_string(PipelineState s)
{
    switch (s) {
        case PipelineState::Received:          return "received";
        case PipelineState::Parsed:            return "parsed";
        case PipelineState::Normalized:        return "normalized";
        case PipelineState::RedshiftEstimated: return "redshift-estimated";
        case PipelineState::RedshiftSkipped:   return "redshift-skipped";
        case PipelineState::Classified:        return "classified";
        case PipelineState::Done:              return "done";
        case PipelineState::Failed:            return "failed";
    }
    return "unknown";
}

namespace {

/* --------------------------------------------------------------------
 *  Run `fn` on a detached worker and give up after `seconds`.  The
 *  worker owns copies of everything it touches.
 * ------------------------------------------------------------------*/
template <class R, class F>
R run_with_timeout(double seconds, const std::string& what, F fn)
{
    if (seconds <= 0.0) return fn();

    std::packaged_task<R()> task(std::move(fn));
    std::future<R> fut = task.get_future();
    std::thread(std::move(task)).detach();

    if (fut.wait_for(std::chrono::duration<double>(seconds)) != std::future_status::ready) {
        std::ostringstream s;
        s << what << " exceeded the time limit of " << seconds << " s";
        throw TimeoutError(s.str());
    }
    return fut.get();
}

std::vector<std::string> stage_names(const std::vector<PipelineState>& trace)
{
    std::vector<std::string> names;
    names.reserve(trace.size());
    for (auto s : trace) names.emplace_back(to_string(s));
    return names;
}

std::shared_ptr<const SpectrumNormalizer>
resample_only(const std::shared_ptr<const SpectrumNormalizer>& n)
{
    SpectrumNormalizer::Config cfg = n->config();
    cfg.condition = false;
    return std::make_shared<const SpectrumNormalizer>(n->grid_ptr(), cfg);
}

} // unnamed namespace

/* ==================================================================== */
ClassificationPipeline::Deadline::Deadline(double seconds)
    : enabled_(seconds > 0.0)
    , seconds_(seconds)
    , at_(std::chrono::steady_clock::now()
          + std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                std::chrono::duration<double>(std::max(seconds, 0.0))))
{}

void ClassificationPipeline::Deadline::check(PipelineState next) const
{
    if (enabled_ && std::chrono::steady_clock::now() > at_) {
        std::ostringstream s;
        s << "time limit of " << seconds_ << " s reached before stage '"
          << to_string(next) << "'";
        throw TimeoutError(s.str());
    }
}

ClassificationPipeline::ClassificationPipeline(
        std::shared_ptr<const SpectrumNormalizer>      normalizer,
        LibraryPtr                                     templates,
        std::shared_ptr<const CrossCorrelationMatcher> matcher,
        std::shared_ptr<const ModelDispatcher>         dispatcher,
        Config                                         cfg)
    : normalizer_(std::move(normalizer))
    , templates_(std::move(templates))
    , matcher_(std::move(matcher))
    , dispatcher_(std::move(dispatcher))
    , cfg_(cfg)
{
    if (!normalizer_ || !matcher_ || !dispatcher_)
        throw ConfigurationError("ClassificationPipeline: missing component");
    plain_ = resample_only(normalizer_);
}

/* -------------------------------------------------------------------- */
ClassificationOutcome
ClassificationPipeline::classify(const ClassificationRequest& request) const
{
    auto self = std::make_shared<const ClassificationPipeline>(*this);
    const Deadline deadline(cfg_.timeout_seconds);

    return run_with_timeout<ClassificationOutcome>(
        cfg_.timeout_seconds, "classification of '" + request.file.name + "'",
        [self, request, deadline] { return self->run_(request, deadline); });
}

RedshiftEstimate
ClassificationPipeline::estimate_redshift(const NamedFile& file,
                                          const std::optional<SpectrumFormat>& format,
                                          const NormalizeOptions& options,
                                          const std::string& sn_type,
                                          const std::string& age_bin,
                                          const ParseOptions& parse) const
{
    auto self = std::make_shared<const ClassificationPipeline>(*this);
    const Deadline deadline(cfg_.timeout_seconds);

    return run_with_timeout<RedshiftEstimate>(
        cfg_.timeout_seconds, "redshift estimation for '" + file.name + "'",
        [self, file, format, options, sn_type, age_bin, parse, deadline] {
            Spectrum raw = parse_spectrum(file.content, file.name, format, parse);
            deadline.check(PipelineState::Normalized);

            NormalizeOptions opt = options;
            opt.known_z = false;
            const Spectrum sp = self->normalizer_->normalize(raw, opt);
            deadline.check(PipelineState::RedshiftEstimated);

            return self->estimate_(sp, RedshiftContext{sn_type, age_bin});
        });
}

/* -------------------------------------------------------------------- */
RedshiftEstimate ClassificationPipeline::estimate_(const Spectrum& normalized,
                                                   const RedshiftContext& ctx) const
{
    if (!templates_)
        throw NotFoundError("No template library is loaded");

    const std::vector<TemplatePtr> candidates =
        ctx.age_bin ? templates_->find(ctx.sn_type, *ctx.age_bin)
                    : templates_->of_type(ctx.sn_type);
    return matcher_->estimate(normalized, candidates);
}

void ClassificationPipeline::attach_rlap_(const Spectrum& normalized, BestMatch& best) const
{
    if (!templates_ || best.age.empty() || !templates_->contains(best.type, best.age))
        return;

    const auto ranked = matcher_->rank(normalized, templates_->find(best.type, best.age));
    if (ranked.empty()) return;

    best.rlap = ranked.front().rlap;
    if (*best.rlap < cfg_.rlap_warning) {
        std::ostringstream s;
        s << "Low RLAP (" << *best.rlap << " < " << cfg_.rlap_warning
          << "): the best match may be unreliable";
        best.rlap_warning = s.str();
    }
}

/* -------------------------------------------------------------------- */
ClassificationOutcome
ClassificationPipeline::run_(const ClassificationRequest& request,
                             const Deadline& deadline) const
{
    const ClassificationOptions& opt = request.options;

    ClassificationOutcome out;
    out.file_name = request.file.name;
    out.trace.push_back(PipelineState::Received);

    PipelineState next = PipelineState::Parsed;
    try {
        const ModelPtr model = dispatcher_->resolve(opt.model);
        const ModelKind kind = model->descriptor.kind;

        /* ---------------- parse ---------------------------------------- */
        deadline.check(next);
        const Spectrum raw = parse_spectrum(request.file.content, request.file.name,
                                            request.format, opt.parse);
        out.trace.push_back(PipelineState::Parsed);

        /* ---------------- normalize ------------------------------------ */
        next = PipelineState::Normalized;
        deadline.check(next);
        NormalizeOptions norm = opt.normalize;
        Spectrum conditioned = normalizer_->normalize(raw, norm);
        out.trace.push_back(PipelineState::Normalized);

        /* ---------------- redshift ------------------------------------- */
        if (opt.redshift_context && !norm.known_z) {
            next = PipelineState::RedshiftEstimated;
            deadline.check(next);
            out.redshift = estimate_(conditioned, *opt.redshift_context);
            if (out.redshift->found()) {
                norm.known_z = true;
                norm.z_value = out.redshift->match->redshift;
                conditioned  = normalizer_->normalize(raw, norm);
            }
            out.trace.push_back(PipelineState::RedshiftEstimated);
        } else {
            out.trace.push_back(PipelineState::RedshiftSkipped);
        }

        /* ---------------- classify ------------------------------------- */
        next = PipelineState::Classified;
        deadline.check(next);
        if (kind == ModelKind::BuiltinTransformer && !norm.known_z)
            throw ValidationError("Redshift is required for Transformer model");
        out.spectrum = kind == ModelKind::BuiltinTransformer
                     ? plain_->normalize(raw, norm)
                     : std::move(conditioned);
        out.result = dispatcher_->classify(out.spectrum, *model);
        out.trace.push_back(PipelineState::Classified);

        /* ---------------- assemble ------------------------------------- */
        next = PipelineState::Done;
        deadline.check(next);

        const std::size_t n = std::min(opt.top_n, out.result.ranked.size());
        for (std::size_t i = 0; i < n; ++i) {
            const auto& cp = out.result.ranked[i];
            auto [type, age] = split_class_label(cp.label);
            out.best_matches.push_back(BestMatch{type, age, cp.probability, {}, {}});
        }

        std::map<std::string, double> per_type;
        for (const auto& cp : out.result.ranked)
            per_type[split_class_label(cp.label).first] += cp.probability;
        for (const auto& [type, p] : per_type)
            out.type_probabilities.push_back({type, p});
        std::stable_sort(out.type_probabilities.begin(), out.type_probabilities.end(),
                         [](const ClassProbability& a, const ClassProbability& b)
                         { return a.probability > b.probability; });

        if (opt.calculate_rlap && kind == ModelKind::BuiltinCnn && !out.best_matches.empty())
            attach_rlap_(out.spectrum, out.best_matches.front());

        out.trace.push_back(PipelineState::Done);
    } catch (Error& e) {
        out.trace.push_back(PipelineState::Failed);
        e.set_trace(stage_names(out.trace));
        if (cfg_.verbose)
            std::cerr << "Failed: " << request.file.name << " before '" << to_string(next)
                      << "': " << e.what() << '\n';
        throw;
    } catch (const std::exception& e) {
        out.trace.push_back(PipelineState::Failed);
        PipelineError err("'" + request.file.name + "' failed before stage '"
                          + to_string(next) + "': " + e.what());
        err.set_trace(stage_names(out.trace));
        throw err;
    }

    if (cfg_.verbose && !out.best_matches.empty())
        std::cout << "Classified: " << out.file_name << " -> "
                  << out.best_matches.front().type << " "
                  << out.best_matches.front().age << " ("
                  << out.best_matches.front().probability << ")\n";
    return out;
}

} // namespace snclass

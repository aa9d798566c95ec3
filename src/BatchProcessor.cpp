#include "snclass/BatchProcessor.hpp"
#include "snclass/ThreadPool.hpp"
#include "snclass/ZipArchive.hpp"

#include <algorithm>
#include <functional>
#include <iostream>

namespace snclass {

BatchProcessor::BatchProcessor(std::shared_ptr<const ClassificationPipeline> pipeline,
                               Config cfg)
    : pipeline_(std::move(pipeline)), cfg_(cfg)
{
    if (!pipeline_)
        throw ConfigurationError("BatchProcessor: no classification pipeline");
}

namespace {

struct WorkItem {
    std::string                  name;
    std::function<NamedFile()>   fetch;       // may throw FormatError (bad member)
};

BatchItemOutcome run_item(const ClassificationPipeline& pipeline,
                          const WorkItem& item,
                          const ClassificationOptions& options)
{
    BatchItemOutcome out;
    out.name = item.name;
    try {
        ClassificationRequest req;
        req.file    = item.fetch();
        req.options = options;
        out.outcome = pipeline.classify(req);
    } catch (const Error& e) {
        out.error_kind = e.kind();
        out.error      = e.what();
        out.trace      = e.trace();
    } catch (const std::exception& e) {
        out.error_kind = ErrorKind::Pipeline;
        out.error      = e.what();
    }
    return out;
}

} // unnamed namespace

/* ---------------------------------------------------------------------- */
BatchReport BatchProcessor::process(const BatchRequest& request) const
{
    std::vector<WorkItem> work;

    if (request.archive) {
        auto zip = std::make_shared<const ZipArchive>(*request.archive);
        for (const auto& m : zip->members()) {
            if (is_skippable_member(m)) continue;
            work.push_back({m.name, [zip, m] { return NamedFile{m.name, zip->extract(m)}; }});
        }
        if (cfg_.verbose)
            std::cout << "Loaded: " << work.size() << " spectra from "
                      << request.archive_name << '\n';
    } else if (!request.files.empty()) {
        for (const auto& f : request.files)
            work.push_back({f.name, [&f] { return f; }});
    } else {
        throw ValidationError("Either a zip archive or a list of files must be provided");
    }

    BatchReport report;
    if (!work.empty()) {
        const unsigned want = cfg_.workers == 0 ? std::thread::hardware_concurrency()
                                                : cfg_.workers;
        ThreadPool pool(std::clamp<unsigned>(want, 1u, static_cast<unsigned>(work.size())));

        std::vector<std::future<BatchItemOutcome>> futures;
        futures.reserve(work.size());
        for (const auto& item : work)
            futures.push_back(pool.enqueue(run_item, std::cref(*pipeline_),
                                           std::cref(item), std::cref(request.options)));

        report.items.reserve(futures.size());
        for (auto& f : futures) report.items.push_back(f.get());
    }

    for (const auto& it : report.items) {
        if (it.ok()) {
            ++report.succeeded;
        } else {
            ++report.failed;
            if (cfg_.verbose)
                std::cerr << "Failed: " << it.name << ": " << it.error << '\n';
        }
    }
    return report;
}

} // namespace snclass

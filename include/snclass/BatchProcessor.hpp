#pragma once
#include "ClassificationPipeline.hpp"
#include "Errors.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace snclass {

struct BatchRequest {
    std::optional<Bytes>   archive;          // zip; wins over `files`
    std::string            archive_name = "archive.zip";
    std::vector<NamedFile> files;
    ClassificationOptions  options;          // shared by every item
};

struct BatchItemOutcome {
    std::string                          name;
    std::optional<ClassificationOutcome> outcome;
    std::optional<ErrorKind>             error_kind;
    std::string                          error;
    std::vector<std::string>             trace;      // stages reached by a failed item

    bool ok() const { return outcome.has_value(); }
};

struct BatchReport {
    std::vector<BatchItemOutcome> items;     // input order
    std::size_t succeeded = 0;
    std::size_t failed    = 0;

    std::size_t total() const { return items.size(); }
};

/*
 * Runs the classification pipeline over every archive member or file on
 * a bounded worker pool.  A failing item is recorded and never affects
 * its siblings.
 */
struct BatchProcessorConfig {
    unsigned workers = 0;                // 0 = hardware concurrency
    bool     verbose = false;
};

class BatchProcessor {
public:
    using Config = BatchProcessorConfig;

    explicit BatchProcessor(std::shared_ptr<const ClassificationPipeline> pipeline,
                            Config cfg = Config{});

    // ValidationError without input, FormatError for an unreadable archive
    BatchReport process(const BatchRequest& request) const;

private:
    std::shared_ptr<const ClassificationPipeline> pipeline_;
    Config                                        cfg_;
};

} // namespace snclass

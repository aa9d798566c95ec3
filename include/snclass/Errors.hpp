#pragma once
#include <stdexcept>
#include <string>
#include <vector>

namespace snclass {

enum class ErrorKind {
    Format,
    Validation,
    NotFound,
    Conflict,
    Pipeline,
    Configuration,
    ModelConfiguration,
    ExternalService,
    Timeout
};

const char* to_string(ErrorKind kind);

/*
 * Root of the error taxonomy.  Every failure the core reports is an
 * snclass::Error; callers switch on kind() instead of on dynamic type
 * when they only need to map it to a response.
 */
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

    // Pipeline stages reached before the failure, ending in "failed".
    // Empty when the error did not come out of a classification run.
    const std::vector<std::string>& trace() const noexcept { return trace_; }
    void set_trace(std::vector<std::string> trace) { trace_ = std::move(trace); }

private:
    ErrorKind                kind_;
    std::vector<std::string> trace_;
};

// Unrecognized or unparsable input file.  line/column are 1-based, 0 if unknown.
class FormatError : public Error {
public:
    explicit FormatError(const std::string& what)
        : Error(ErrorKind::Format, what) {}
    FormatError(const std::string& file, int line, int column,
                const std::string& what);

    int line()   const noexcept { return line_; }
    int column() const noexcept { return column_; }

private:
    int line_   = 0;
    int column_ = 0;
};

class ValidationError : public Error {
public:
    explicit ValidationError(const std::string& what)
        : Error(ErrorKind::Validation, what) {}
};

class NotFoundError : public Error {
public:
    explicit NotFoundError(const std::string& what)
        : Error(ErrorKind::NotFound, what) {}
};

class ConflictError : public Error {
public:
    explicit ConflictError(const std::string& what)
        : Error(ErrorKind::Conflict, what) {}
};

class PipelineError : public Error {
public:
    explicit PipelineError(const std::string& what)
        : Error(ErrorKind::Pipeline, what) {}
};

// Startup failure (templates, built-in models, settings).  Fatal.
class ConfigurationError : public Error {
public:
    explicit ConfigurationError(const std::string& what)
        : Error(ErrorKind::Configuration, what) {}
};

// A registered model disagrees with its own descriptor at inference time.
class ModelConfigurationError : public Error {
public:
    explicit ModelConfigurationError(const std::string& what)
        : Error(ErrorKind::ModelConfiguration, what) {}
};

class ExternalServiceError : public Error {
public:
    explicit ExternalServiceError(const std::string& what)
        : Error(ErrorKind::ExternalService, what) {}
};

class TimeoutError : public Error {
public:
    explicit TimeoutError(const std::string& what)
        : Error(ErrorKind::Timeout, what) {}
};

} // namespace snclass

#include "snclass/Errors.hpp"

namespace snclass {

const char* to_string(ErrorKind kind)
{
    switch (kind) {
        case ErrorKind::Format:             return "FormatError";
        case ErrorKind::Validation:         return "ValidationError";
        case ErrorKind::NotFound:           return "NotFoundError";
        case ErrorKind::Conflict:           return "ConflictError";
        case ErrorKind::Pipeline:           return "PipelineError";
        case ErrorKind::Configuration:      return "ConfigurationError";
        case ErrorKind::ModelConfiguration: return "ModelConfigurationError";
        case ErrorKind::ExternalService:    return "ExternalServiceError";
        case ErrorKind::Timeout:            return "TimeoutError";
    }
    return "Error";
}

static std::string where(const std::string& file, int line, int column)
{
    std::string s = file.empty() ? std::string("<input>") : file;
    if (line > 0)   s += ":" + std::to_string(line);
    if (column > 0) s += ":" + std::to_string(column);
    return s;
}

FormatError::FormatError(const std::string& file, int line, int column,
                         const std::string& what)
    : Error(ErrorKind::Format, where(file, line, column) + ": " + what)
    , line_(line)
    , column_(column)
{}

} // namespace snclass

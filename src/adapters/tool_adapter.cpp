#include "devagent/adapters/tool_adapter.hpp"
#include "devagent/error.hpp"

namespace devagent {

std::string_view error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidParams:  return "INVALID_PARAMS";
        case ErrorCode::NotFound:       return "NOT_FOUND";
        case ErrorCode::RateLimited:    return "RATE_LIMITED";
        case ErrorCode::Timeout:        return "TIMEOUT";
        case ErrorCode::InternalError:  return "INTERNAL_ERROR";
        case ErrorCode::GitHubCliError: return "GITHUB_CLI_ERROR";
        case ErrorCode::IndexerError:   return "INDEXER_ERROR";
        case ErrorCode::Unavailable:    return "UNAVAILABLE";
    }
    return "INTERNAL_ERROR";
}

int wire_code(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidParams:  return error::InvalidParams;
        case ErrorCode::Timeout:        return error::Timeout;
        case ErrorCode::InternalError:  return error::InternalError;
        case ErrorCode::GitHubCliError: return error::GitHubCliError;
        case ErrorCode::IndexerError:   return error::IndexerError;
        case ErrorCode::NotFound:
        case ErrorCode::RateLimited:
        case ErrorCode::Unavailable:
            return error::ToolExecutionError;
    }
    return error::ToolExecutionError;
}

} // namespace devagent

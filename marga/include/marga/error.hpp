#pragma once
// Errors: outcome kinds surfaced to callers
//
// Nothing in the public API throws. Failures travel as values.

#include <string>

namespace marga {

enum class RetrievalError {
    None,
    UpstreamUnavailable,   // Graph store unreachable or errored; not retried
    Timeout,               // Upstream exceeded the caller's budget
    MalformedPath,         // Path violates the vertex/edge invariant (dropped)
    CacheWriteRejected,    // Best-effort caching declined; result still returned
    InvalidArgument        // Bad request or configuration
};

inline const char* error_name(RetrievalError e) {
    switch (e) {
        case RetrievalError::None:                return "none";
        case RetrievalError::UpstreamUnavailable: return "upstream_unavailable";
        case RetrievalError::Timeout:             return "timeout";
        case RetrievalError::MalformedPath:       return "malformed_path";
        case RetrievalError::CacheWriteRejected:  return "cache_write_rejected";
        case RetrievalError::InvalidArgument:     return "invalid_argument";
    }
    return "unknown";
}

} // namespace marga

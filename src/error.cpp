#include "error.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::RESOURCE_EXHAUSTED: return "RESOURCE_EXHAUSTED";
        case ErrorCode::RATE_LIMITED: return "RATE_LIMITED";
        case ErrorCode::DATA_VALIDATION_FAILED: return "DATA_VALIDATION_FAILED";
        case ErrorCode::PIPELINE_STAGE_FAILED: return "PIPELINE_STAGE_FAILED";
        case ErrorCode::CIRCUIT_OPEN: return "CIRCUIT_OPEN";
        case ErrorCode::COLLABORATOR_UNAVAILABLE: return "COLLABORATOR_UNAVAILABLE";
    }
    return "UNKNOWN";
}

const char* to_string(PipelineErrorKind kind) {
    switch (kind) {
        case PipelineErrorKind::TRANSFORM: return "transform_error";
        case PipelineErrorKind::CACHE: return "cache_error";
        case PipelineErrorKind::BROADCAST: return "broadcast_error";
        case PipelineErrorKind::TIMEOUT: return "timeout_error";
        case PipelineErrorKind::NETWORK: return "network_error";
        case PipelineErrorKind::UNKNOWN: return "unknown_error";
    }
    return "unknown_error";
}

PipelineErrorKind classify_pipeline_error(const std::string& message) {
    const std::string lower = boost::algorithm::to_lower_copy(message);
    if (boost::algorithm::contains(lower, "transform")) return PipelineErrorKind::TRANSFORM;
    if (boost::algorithm::contains(lower, "cache")) return PipelineErrorKind::CACHE;
    if (boost::algorithm::contains(lower, "broadcast")) return PipelineErrorKind::BROADCAST;
    if (boost::algorithm::contains(lower, "timeout")) return PipelineErrorKind::TIMEOUT;
    if (boost::algorithm::contains(lower, "network")) return PipelineErrorKind::NETWORK;
    return PipelineErrorKind::UNKNOWN;
}

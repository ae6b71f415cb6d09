#pragma once
#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>

enum class ErrorCode : uint16_t {
    RESOURCE_EXHAUSTED = 1,
    RATE_LIMITED = 2,
    DATA_VALIDATION_FAILED = 3,
    PIPELINE_STAGE_FAILED = 4,
    CIRCUIT_OPEN = 5,
    COLLABORATOR_UNAVAILABLE = 6
};

enum class PipelineErrorKind : uint8_t {
    TRANSFORM,
    CACHE,
    BROADCAST,
    TIMEOUT,
    NETWORK,
    UNKNOWN
};

const char* to_string(ErrorCode code);
const char* to_string(PipelineErrorKind kind);

template<typename C, typename T>
std::basic_ostream<C, T>& operator<<(std::basic_ostream<C, T>& strm, ErrorCode code) {
    strm << to_string(code);
    return strm;
}

template<typename C, typename T>
std::basic_ostream<C, T>& operator<<(std::basic_ostream<C, T>& strm, PipelineErrorKind kind) {
    strm << to_string(kind);
    return strm;
}

// Buckets a failure message into a small fixed label set by substring match.
PipelineErrorKind classify_pipeline_error(const std::string& message);

class QRError : public std::runtime_error {
    public:
        QRError(ErrorCode code, const std::string& message)
            : std::runtime_error(message), code_(code) {}

        ErrorCode code() const noexcept {return code_;}

    private:
        ErrorCode code_;
};

class ResourceExhaustedError : public QRError {
    public:
        explicit ResourceExhaustedError(const std::string& message)
            : QRError(ErrorCode::RESOURCE_EXHAUSTED, message) {}
};

class RateLimitedError : public QRError {
    public:
        RateLimitedError(const std::string& message, int64_t retry_after_ms)
            : QRError(ErrorCode::RATE_LIMITED, message), retry_after_ms_(retry_after_ms) {}

        int64_t retry_after_ms() const noexcept {return retry_after_ms_;}

    private:
        int64_t retry_after_ms_;
};

class ValidationError : public QRError {
    public:
        explicit ValidationError(const std::string& message)
            : QRError(ErrorCode::DATA_VALIDATION_FAILED, message) {}
};

class PipelineStageError : public QRError {
    public:
        PipelineStageError(PipelineErrorKind kind, const std::string& message)
            : QRError(ErrorCode::PIPELINE_STAGE_FAILED, message), kind_(kind) {}

        PipelineErrorKind kind() const noexcept {return kind_;}

    private:
        PipelineErrorKind kind_;
};

class CircuitOpenError : public QRError {
    public:
        explicit CircuitOpenError(const std::string& message)
            : QRError(ErrorCode::CIRCUIT_OPEN, message) {}
};

class CollaboratorUnavailableError : public QRError {
    public:
        explicit CollaboratorUnavailableError(const std::string& message)
            : QRError(ErrorCode::COLLABORATOR_UNAVAILABLE, message) {}
};

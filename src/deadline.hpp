#pragma once
#include <chrono>
#include <future>
#include <string>

#include "error.hpp"

// Waits for a collaborator call to settle within timeout. On expiry throws a
// timeout PipelineStageError; the call keeps running and its result is dropped.
template<typename T>
T await_with_deadline(std::future<T> future, std::chrono::milliseconds timeout, const std::string& stage) {
    if (!future.valid()) {
        throw PipelineStageError(PipelineErrorKind::UNKNOWN, stage + " returned no result");
    }
    if (future.wait_for(timeout) != std::future_status::ready) {
        throw PipelineStageError(
            PipelineErrorKind::TIMEOUT,
            stage + " timeout after " + std::to_string(timeout.count()) + "ms"
        );
    }
    return future.get();
}

inline void await_with_deadline(std::future<void> future, std::chrono::milliseconds timeout, const std::string& stage) {
    if (!future.valid()) {
        throw PipelineStageError(PipelineErrorKind::UNKNOWN, stage + " returned no result");
    }
    if (future.wait_for(timeout) != std::future_status::ready) {
        throw PipelineStageError(
            PipelineErrorKind::TIMEOUT,
            stage + " timeout after " + std::to_string(timeout.count()) + "ms"
        );
    }
    future.get();
}

#include "upload/retry.hpp"

#include <algorithm>

namespace cw::upload {

std::string_view toString(const ErrorClass c) noexcept {
    switch (c) {
        case ErrorClass::RateLimited: return "rate-limited";
        case ErrorClass::TransientRetryable: return "transient";
        case ErrorClass::AmbiguousTimeout: return "ambiguous-timeout";
        case ErrorClass::PermanentFailure: return "permanent";
        case ErrorClass::UserCancelled: return "cancelled";
        default: return "unknown";
    }
}

std::string_view toString(const Phase p) noexcept {
    switch (p) {
        case Phase::Request: return "request";
        case Phase::SequenceInit: return "sequence-init";
        case Phase::SequenceComplete: return "sequence-complete";
        case Phase::PartUpload: return "part-upload";
        default: return "unknown";
    }
}

ErrorClass classify(const long httpStatus, const Phase phase) noexcept {
    if (httpStatus == 429) return ErrorClass::RateLimited;
    if (phase == Phase::PartUpload) return ErrorClass::TransientRetryable;
    if (httpStatus == 503 && phase == Phase::SequenceComplete) return ErrorClass::AmbiguousTimeout;
    if (httpStatus == 0 || httpStatus == 400 || httpStatus == 404) return ErrorClass::TransientRetryable;
    return ErrorClass::PermanentFailure;
}

RetryPolicy RetryPolicy::forRequests(const config::RetryConfig& cfg, Sleeper sleeper) {
    return {
        .maxAttempts = std::max(1u, cfg.request_attempts),
        .baseDelay = cfg.base_delay,
        .rateLimitDelay = std::chrono::duration_cast<std::chrono::milliseconds>(cfg.rate_limit_delay),
        .sleep = std::move(sleeper)
    };
}

RetryPolicy RetryPolicy::forParts(const config::RetryConfig& cfg, Sleeper sleeper) {
    return {
        .maxAttempts = std::max(1u, cfg.part_attempts),
        .baseDelay = cfg.base_delay,
        .rateLimitDelay = std::chrono::duration_cast<std::chrono::milliseconds>(cfg.rate_limit_delay),
        .sleep = std::move(sleeper)
    };
}

std::chrono::milliseconds RetryPolicy::delayFor(const ErrorClass cls, const unsigned int attempt) const {
    if (cls == ErrorClass::RateLimited) return rateLimitDelay;
    return baseDelay * (1LL << std::min(attempt, 20u));
}

}

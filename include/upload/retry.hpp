#pragma once

#include "api/HttpError.hpp"
#include "config/Config.hpp"
#include "log/Registry.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string_view>
#include <thread>

namespace cw::upload {

enum class ErrorClass : uint8_t {
    RateLimited,
    TransientRetryable,
    AmbiguousTimeout,
    PermanentFailure,
    UserCancelled
};

// Which call failed decides how a status code is read.
enum class Phase : uint8_t {
    Request,            // asset, metadata, link calls
    SequenceInit,
    SequenceComplete,
    PartUpload
};

std::string_view toString(ErrorClass c) noexcept;
std::string_view toString(Phase p) noexcept;

[[nodiscard]] ErrorClass classify(long httpStatus, Phase phase) noexcept;

using Sleeper = std::function<void(std::chrono::milliseconds)>;

inline void realSleep(const std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }

struct RetryPolicy {
    unsigned int maxAttempts = 5;
    std::chrono::milliseconds baseDelay{1000};
    std::chrono::milliseconds rateLimitDelay{60000};
    Sleeper sleep = realSleep;

    static RetryPolicy forRequests(const config::RetryConfig& cfg, Sleeper sleeper = realSleep);
    static RetryPolicy forParts(const config::RetryConfig& cfg, Sleeper sleeper = realSleep);

    // base * 2^attempt for transient errors, the fixed rate-limit delay for 429s.
    [[nodiscard]] std::chrono::milliseconds delayFor(ErrorClass cls, unsigned int attempt) const;
};

// Runs fn until it returns, a non-retryable HttpError is thrown, or the attempt budget runs out.
// AmbiguousTimeout is rethrown untouched for the caller to interpret.
template <class Fn>
auto withRetry(const Phase phase, const RetryPolicy& policy, std::string_view what, Fn&& fn) -> decltype(fn()) {
    for (unsigned int attempt = 0;; ++attempt) {
        try {
            return fn();
        } catch (const api::HttpError& e) {
            const auto cls = classify(e.status(), phase);
            if (cls == ErrorClass::AmbiguousTimeout) throw;

            const bool retryable = cls == ErrorClass::RateLimited || cls == ErrorClass::TransientRetryable;
            if (!retryable || attempt + 1 >= policy.maxAttempts) {
                log::Registry::sequence()->error("[Retry] {} failed ({}, HTTP {}) after {} attempt(s): {}",
                                                 what, toString(cls), e.status(), attempt + 1, e.what());
                throw;
            }

            const auto delay = policy.delayFor(cls, attempt);
            log::Registry::sequence()->warn("[Retry] {} attempt {}/{} failed ({}, HTTP {}), retrying in {}ms",
                                            what, attempt + 1, policy.maxAttempts, toString(cls),
                                            e.status(), delay.count());
            policy.sleep(delay);
        }
    }
}

}

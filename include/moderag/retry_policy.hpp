#pragma once

#include <chrono>
#include <functional>
#include <string>

#include <spdlog/spdlog.h>

#include "moderag/errors.hpp"

namespace moderag {

struct CallStats {
    int attempts = 0;
};

// Bounded exponential backoff shared by every network-facing component.
// Delay before retry n (1-based) is min(maxDelay, baseDelay * 2^(n-1)),
// spread by +/- jitterRatio.
class RetryPolicy {
public:
    using Predicate = std::function<bool(const ModerationError&)>;
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    RetryPolicy();
    RetryPolicy(int maxAttempts,
                std::chrono::milliseconds baseDelay,
                std::chrono::milliseconds maxDelay = std::chrono::milliseconds(5000),
                double jitterRatio = 0.2);

    int maxAttempts() const { return maxAttempts_; }
    std::chrono::milliseconds baseDelay() const { return baseDelay_; }

    std::chrono::milliseconds delayFor(int attempt) const;
    bool isRetryable(const ModerationError& error) const { return retryable_(error); }

    void setRetryable(Predicate predicate) { retryable_ = std::move(predicate); }
    void setSleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }

    template <typename F>
    auto execute(F&& fn, CallStats* stats, const std::string& what) const -> decltype(fn()) {
        for (int attempt = 1;; ++attempt) {
            if (stats) {
                stats->attempts = attempt;
            }
            try {
                return fn();
            } catch (ModerationError& e) {
                e.attempts = attempt;
                if (attempt >= maxAttempts_ || !retryable_(e)) {
                    spdlog::error("{} failed after {} attempt(s): {}", what, attempt, e.what());
                    throw;
                }
                auto delay = delayFor(attempt);
                spdlog::warn("{} attempt {}/{} failed ({}), retrying in {}ms",
                             what, attempt, maxAttempts_, e.what(), delay.count());
                sleeper_(delay);
            }
        }
    }

private:
    int maxAttempts_;
    std::chrono::milliseconds baseDelay_;
    std::chrono::milliseconds maxDelay_;
    double jitterRatio_;
    Predicate retryable_;
    Sleeper sleeper_;
};

} // namespace moderag

#include "moderag/retry_policy.hpp"

#include <algorithm>
#include <random>
#include <thread>

namespace moderag {

RetryPolicy::RetryPolicy()
    : RetryPolicy(3, std::chrono::milliseconds(100)) {}

RetryPolicy::RetryPolicy(int maxAttempts,
                         std::chrono::milliseconds baseDelay,
                         std::chrono::milliseconds maxDelay,
                         double jitterRatio)
    : maxAttempts_(std::max(1, maxAttempts)),
      baseDelay_(baseDelay),
      maxDelay_(maxDelay),
      jitterRatio_(std::clamp(jitterRatio, 0.0, 1.0)),
      retryable_([](const ModerationError& e) { return e.retryable(); }),
      sleeper_([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }) {}

std::chrono::milliseconds RetryPolicy::delayFor(int attempt) const {
    if (attempt < 1 || baseDelay_.count() <= 0) {
        return std::chrono::milliseconds(0);
    }
    const int shift = std::min(attempt - 1, 20);
    const long long raw = baseDelay_.count() * (1LL << shift);
    double delay = static_cast<double>(std::min<long long>(raw, maxDelay_.count()));

    if (jitterRatio_ > 0.0) {
        thread_local std::mt19937 rng{std::random_device{}()};
        std::uniform_real_distribution<double> spread(1.0 - jitterRatio_, 1.0 + jitterRatio_);
        delay *= spread(rng);
    }
    return std::chrono::milliseconds(static_cast<long long>(delay));
}

} // namespace moderag

#pragma once

#include "../ports/RetryPolicy.hpp"
#include <algorithm>
#include <cmath>

namespace metersim::adapters {

/**
 * @brief Broker reconnection backoff
 *
 * Defaults: 5 s doubling per attempt up to a 300 s ceiling, 50 attempts.
 */
class ExponentialBackoffRetryPolicy : public ports::RetryPolicy {
public:
    ExponentialBackoffRetryPolicy(std::chrono::milliseconds baseDelay = std::chrono::seconds(5),
                                double multiplier = 2.0,
                                std::chrono::milliseconds maxDelay = std::chrono::minutes(5),
                                int maxAttempts = 50)
        : baseDelay_(baseDelay), multiplier_(multiplier), maxDelay_(maxDelay), maxAttempts_(maxAttempts) {}

    std::chrono::milliseconds getBackoffDelay(int attemptCount) const override {
        const int exponent = std::max(attemptCount - 1, 0);
        const double raw = baseDelay_.count() * std::pow(multiplier_, exponent);
        if (raw >= static_cast<double>(maxDelay_.count())) {
            return maxDelay_;
        }
        return std::chrono::milliseconds(static_cast<long long>(raw));
    }

    bool shouldRetry(int attemptCount) const override {
        return attemptCount < maxAttempts_;
    }

    int maxAttempts() const { return maxAttempts_; }

private:
    std::chrono::milliseconds baseDelay_;
    double multiplier_;
    std::chrono::milliseconds maxDelay_;
    int maxAttempts_;
};

} // namespace metersim::adapters

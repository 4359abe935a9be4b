#pragma once

#include <chrono>

namespace metersim::ports {

struct RetryPolicy {
    virtual ~RetryPolicy() = default;

    /// Delay before attempt number attemptCount (1-based)
    virtual std::chrono::milliseconds getBackoffDelay(int attemptCount) const = 0;
    virtual bool shouldRetry(int attemptCount) const = 0;
};

} // namespace metersim::ports

#pragma once

#include "../IClock.hpp"
#include <chrono>
#include <mutex>
#include <string>

namespace metersim::sim {

/**
 * @brief Test clock; frozen unless unfreezeTime() lets real time flow on top
 */
class SimulatedClock : public IClock {
public:
    explicit SimulatedClock(std::chrono::system_clock::time_point startTime = defaultStart());
    ~SimulatedClock() override = default;

    // IClock interface
    std::chrono::system_clock::time_point now() const override;
    uint64_t epochSeconds() const override;
    std::string iso8601() const override;

    // Simulation controls
    void advance(std::chrono::milliseconds duration);
    void setCurrentTime(std::chrono::system_clock::time_point time);

    void freezeTime();
    void unfreezeTime();
    bool isFrozen() const;

    /// 2025-01-01T00:00:00Z
    static std::chrono::system_clock::time_point defaultStart();

private:
    mutable std::mutex mutex_;
    std::chrono::system_clock::time_point simulatedTime_;
    std::chrono::steady_clock::time_point realStartTime_;
    bool frozen_ = true;

    std::chrono::system_clock::time_point nowLocked() const;
};

} // namespace metersim::sim

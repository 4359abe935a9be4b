#include "SimulatedClock.hpp"

namespace metersim::sim {

SimulatedClock::SimulatedClock(std::chrono::system_clock::time_point startTime)
    : simulatedTime_(startTime), realStartTime_(std::chrono::steady_clock::now()) {
}

std::chrono::system_clock::time_point SimulatedClock::defaultStart() {
    return std::chrono::system_clock::time_point(std::chrono::seconds(1735689600));
}

std::chrono::system_clock::time_point SimulatedClock::now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return nowLocked();
}

std::chrono::system_clock::time_point SimulatedClock::nowLocked() const {
    if (frozen_) {
        return simulatedTime_;
    }

    // Simulated time plus real time elapsed since the last reference point
    auto realElapsed = std::chrono::steady_clock::now() - realStartTime_;
    return simulatedTime_ + std::chrono::duration_cast<std::chrono::system_clock::duration>(realElapsed);
}

uint64_t SimulatedClock::epochSeconds() const {
    return std::chrono::duration_cast<std::chrono::seconds>(now().time_since_epoch()).count();
}

std::string SimulatedClock::iso8601() const {
    return formatIso8601(now());
}

void SimulatedClock::advance(std::chrono::milliseconds duration) {
    std::lock_guard<std::mutex> lock(mutex_);
    simulatedTime_ = nowLocked() + duration;
    realStartTime_ = std::chrono::steady_clock::now(); // Reset real time reference
}

void SimulatedClock::setCurrentTime(std::chrono::system_clock::time_point time) {
    std::lock_guard<std::mutex> lock(mutex_);
    simulatedTime_ = time;
    realStartTime_ = std::chrono::steady_clock::now(); // Reset real time reference
}

void SimulatedClock::freezeTime() {
    std::lock_guard<std::mutex> lock(mutex_);
    simulatedTime_ = nowLocked();
    frozen_ = true;
}

void SimulatedClock::unfreezeTime() {
    std::lock_guard<std::mutex> lock(mutex_);
    realStartTime_ = std::chrono::steady_clock::now();
    frozen_ = false;
}

bool SimulatedClock::isFrozen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frozen_;
}

} // namespace metersim::sim

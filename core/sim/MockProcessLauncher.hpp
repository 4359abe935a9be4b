#pragma once

#include "../ports/IProcessLauncher.hpp"
#include <memory>
#include <string>
#include <vector>

namespace metersim::sim {

/// Observable state of one fake child process
struct MockProcessState {
    int pid = 0;
    ports::WorkerSpec spec;
    bool alive = true;
    bool ignoreTerminate = false;   ///< Survives SIGTERM
    bool ignoreKill = false;        ///< Survives SIGKILL as well
    int terminateCalls = 0;
    int killCalls = 0;
};

class MockProcessHandle : public ports::IProcessHandle {
public:
    explicit MockProcessHandle(std::shared_ptr<MockProcessState> state) : state_(std::move(state)) {}

    int pid() const override { return state_->pid; }
    bool isAlive() override { return state_->alive; }

    bool terminate() override {
        ++state_->terminateCalls;
        if (!state_->ignoreTerminate) {
            state_->alive = false;
        }
        return true;
    }

    bool kill() override {
        ++state_->killCalls;
        if (!state_->ignoreKill) {
            state_->alive = false;
        }
        return true;
    }

    bool waitForExit(std::chrono::milliseconds timeout) override {
        (void)timeout;
        return !state_->alive;
    }

private:
    std::shared_ptr<MockProcessState> state_;
};

class MockProcessLauncher : public ports::IProcessLauncher {
public:
    std::unique_ptr<ports::IProcessHandle> launch(const ports::WorkerSpec& spec) override {
        if (failLaunch_) {
            return nullptr;
        }
        auto state = std::make_shared<MockProcessState>();
        state->pid = nextPid_++;
        state->spec = spec;
        if (nextIgnoresTerminate_) {
            state->ignoreTerminate = true;
            nextIgnoresTerminate_ = false;
        }
        launched_.push_back(state);
        return std::make_unique<MockProcessHandle>(state);
    }

    void setFailLaunch(bool fail) { failLaunch_ = fail; }

    /// The next launched process ignores the graceful request
    void nextIgnoresTerminate() { nextIgnoresTerminate_ = true; }

    const std::vector<std::shared_ptr<MockProcessState>>& launched() const { return launched_; }

    std::shared_ptr<MockProcessState> latest(const std::string& deviceId) const {
        for (auto it = launched_.rbegin(); it != launched_.rend(); ++it) {
            if ((*it)->spec.deviceId == deviceId) {
                return *it;
            }
        }
        return nullptr;
    }

    int liveCount(const std::string& deviceId) const {
        int count = 0;
        for (const auto& state : launched_) {
            if (state->spec.deviceId == deviceId && state->alive) {
                ++count;
            }
        }
        return count;
    }

private:
    std::vector<std::shared_ptr<MockProcessState>> launched_;
    int nextPid_ = 1000;
    bool failLaunch_ = false;
    bool nextIgnoresTerminate_ = false;
};

} // namespace metersim::sim

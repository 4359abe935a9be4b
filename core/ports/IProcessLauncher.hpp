#pragma once

#include "../DeviceType.hpp"
#include <chrono>
#include <memory>
#include <string>

namespace metersim::ports {

/// What a worker process is bound to
struct WorkerSpec {
    std::string deviceId;
    DeviceType deviceType = DeviceType::PV;
    int intervalSeconds = 5;
};

/**
 * @brief Owner of one spawned child process
 *
 * Destroying a handle does not kill the process.
 */
class IProcessHandle {
public:
    virtual ~IProcessHandle() = default;

    virtual int pid() const = 0;

    /// Reaps the child when it has exited
    virtual bool isAlive() = 0;

    virtual bool terminate() = 0;   ///< Graceful request (SIGTERM)
    virtual bool kill() = 0;        ///< Forced (SIGKILL)

    /// True if the process exited within the timeout
    virtual bool waitForExit(std::chrono::milliseconds timeout) = 0;
};

class IProcessLauncher {
public:
    virtual ~IProcessLauncher() = default;

    /// nullptr when the process could not be spawned
    virtual std::unique_ptr<IProcessHandle> launch(const WorkerSpec& spec) = 0;
};

} // namespace metersim::ports

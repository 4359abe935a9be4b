#pragma once

#include "ports/IProcessLauncher.hpp"
#include <string>
#include <vector>

namespace metersim {

class PosixProcessHandle : public ports::IProcessHandle {
public:
    explicit PosixProcessHandle(int pid) : pid_(pid) {}
    ~PosixProcessHandle() override;

    PosixProcessHandle(const PosixProcessHandle&) = delete;
    PosixProcessHandle& operator=(const PosixProcessHandle&) = delete;

    int pid() const override { return pid_; }
    bool isAlive() override;
    bool terminate() override;
    bool kill() override;
    bool waitForExit(std::chrono::milliseconds timeout) override;

private:
    static constexpr auto kPollInterval = std::chrono::milliseconds(50);

    int pid_;
    bool exited_ = false;
};

/**
 * @brief Spawns workers with posix_spawn
 *
 * The child runs executable with prefixArgs followed by
 * "--device-id <id> --device-type <type_id> --interval <seconds>". Stdin is
 * /dev/null; stdout and stderr are inherited. Each child gets its own process
 * group so a terminal interrupt reaches only the supervisor, which then stops
 * its workers in order.
 */
class PosixProcessLauncher : public ports::IProcessLauncher {
public:
    PosixProcessLauncher(std::string executable, std::vector<std::string> prefixArgs);

    /// Re-executes the running binary as "metersim --config <file> worker ..."
    static PosixProcessLauncher forWorker(const std::string& configPath);

    std::unique_ptr<ports::IProcessHandle> launch(const ports::WorkerSpec& spec) override;

private:
    std::string executable_;
    std::vector<std::string> prefixArgs_;
};

} // namespace metersim

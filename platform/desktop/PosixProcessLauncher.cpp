#include "PosixProcessLauncher.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <spawn.h>
#include <stdexcept>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern char** environ;

namespace metersim {

PosixProcessHandle::~PosixProcessHandle() {
    // Reap if it already exited; a live child is left running
    if (!exited_) {
        isAlive();
    }
}

bool PosixProcessHandle::isAlive() {
    if (exited_) {
        return false;
    }

    int status = 0;
    pid_t rc = ::waitpid(pid_, &status, WNOHANG);
    if (rc == 0) {
        return true;
    }
    if (rc == pid_ || (rc < 0 && errno == ECHILD)) {
        exited_ = true;
        return false;
    }
    std::cerr << "[Launcher] waitpid(" << pid_ << ") failed: " << std::strerror(errno) << std::endl;
    return true;
}

bool PosixProcessHandle::terminate() {
    if (!isAlive()) {
        return false;
    }
    return ::kill(pid_, SIGTERM) == 0;
}

bool PosixProcessHandle::kill() {
    if (!isAlive()) {
        return false;
    }
    return ::kill(pid_, SIGKILL) == 0;
}

bool PosixProcessHandle::waitForExit(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (isAlive()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(kPollInterval);
    }
    return true;
}

PosixProcessLauncher::PosixProcessLauncher(std::string executable, std::vector<std::string> prefixArgs)
    : executable_(std::move(executable)), prefixArgs_(std::move(prefixArgs)) {
    if (executable_.empty()) {
        throw std::invalid_argument("PosixProcessLauncher requires an executable");
    }
}

PosixProcessLauncher PosixProcessLauncher::forWorker(const std::string& configPath) {
    return PosixProcessLauncher("/proc/self/exe", {"--config", configPath, "worker"});
}

std::unique_ptr<ports::IProcessHandle> PosixProcessLauncher::launch(const ports::WorkerSpec& spec) {
    std::vector<std::string> args;
    args.push_back(executable_);
    args.insert(args.end(), prefixArgs_.begin(), prefixArgs_.end());
    args.push_back("--device-id");
    args.push_back(spec.deviceId);
    args.push_back("--device-type");
    args.push_back(DeviceRegistry::spec(spec.deviceType).typeId);
    args.push_back("--interval");
    args.push_back(std::to_string(spec.intervalSeconds));

    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    posix_spawn_file_actions_t actions;
    posix_spawnattr_t attr;
    posix_spawn_file_actions_init(&actions);
    posix_spawnattr_init(&attr);

    posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETPGROUP);
    posix_spawnattr_setpgroup(&attr, 0);

    pid_t pid = 0;
    int rc = posix_spawn(&pid, executable_.c_str(), &actions, &attr, argv.data(), environ);

    posix_spawnattr_destroy(&attr);
    posix_spawn_file_actions_destroy(&actions);

    if (rc != 0) {
        std::cerr << "[Launcher] Failed to spawn worker for " << spec.deviceId << ": "
                  << std::strerror(rc) << std::endl;
        return nullptr;
    }

    return std::make_unique<PosixProcessHandle>(pid);
}

} // namespace metersim

/**
 * @file main_cli.cpp
 * @brief Command-line interface for the energy metering fleet simulator
 *
 * One binary, two roles. As the control surface it drives the device
 * supervisor: one-shot commands edit the fleet and the settings files, and
 * `run` supervises worker processes in the foreground with an interactive
 * shell. As `metersim worker ...` it is the per-device worker process the
 * supervisor spawns.
 *
 * @note Signal handling ends the shell, the headless loop and the worker loop
 * @note Configuration via TOML file plus environment overrides
 */

#include "DeviceStatusStore.hpp"
#include "DeviceType.hpp"
#include "IClock.hpp"
#include "IRng.hpp"
#include "Measurement.hpp"
#include "PahoMqttClient.hpp"
#include "PosixProcessLauncher.hpp"
#include "Settings.hpp"
#include "TomlConfig.hpp"
#include "adapters/DefaultPolicies.hpp"
#include "adapters/SqliteMeasurementSink.hpp"
#include "adapters/StatusFileRegistrationLedger.hpp"
#include "domain/DeviceSupervisor.hpp"
#include "domain/DeviceWorker.hpp"
#include "domain/UplinkSession.hpp"
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <signal.h>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace metersim;

/// Global flag for graceful shutdown coordination
static volatile bool g_running = true;

/**
 * @brief Signal handler for graceful shutdown
 *
 * Handles SIGINT (Ctrl+C) and SIGTERM. Installed without SA_RESTART so a
 * blocking read of the shell returns.
 */
void signalHandler(int) {
    g_running = false;
}

void installSignalHandlers() {
    struct sigaction action {};
    action.sa_handler = signalHandler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " [--config file] <command> [args]\n"
              << "Commands:\n"
              << "  add <type>                 Add a device (PV, HeatPump, MainGrid)\n"
              << "  delete <id>                Delete a device and its measurements\n"
              << "  status <id>                Show one device\n"
              << "  list                       List all devices\n"
              << "  interval [seconds]         Show or set the sampling interval (1-300)\n"
              << "  uplink show                Show the uplink settings\n"
              << "  uplink set key=value...    Change uplink settings\n"
              << "  run [--autostart id...] [--headless]\n"
              << "                             Supervise workers in the foreground\n"
              << "  worker --device-id <id> --device-type <type> --interval <s>\n"
              << "                             Run one device worker (spawned by run)\n"
              << "\nOptions:\n"
              << "  --config <file>            Configuration file (default: metersim.toml)\n"
              << "  --help                     Show this help message\n"
              << "\nEnvironment:\n"
              << "  METERSIM_STATUS_FILE, METERSIM_DB_PATH override the storage paths\n"
              << "\nConfiguration file format (TOML):\n"
              << "  [storage]\n"
              << "  status_file = \"device_status.json\"\n"
              << "  database_path = \"iot_devices.db\"\n"
              << std::endl;
}

std::string safeGetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : "";
}

/// Application config from the TOML file, then the environment overrides
AppConfig loadConfig(const std::string& configFile) {
    AppConfig config = TomlConfig::loadFromFile(configFile);

    std::string statusFile = safeGetEnv("METERSIM_STATUS_FILE");
    std::string databasePath = safeGetEnv("METERSIM_DB_PATH");
    if (!statusFile.empty()) config.statusFile = statusFile;
    if (!databasePath.empty()) config.databasePath = databasePath;

    return config;
}

domain::SupervisorOptions supervisorOptions(const AppConfig& config) {
    domain::SupervisorOptions options;
    options.stopGrace = std::chrono::seconds(config.stopGraceSeconds);
    options.killGrace = std::chrono::seconds(config.killGraceSeconds);
    return options;
}

void printRecord(const DeviceRecord& record, bool running) {
    const DeviceTypeSpec& spec = DeviceRegistry::spec(record.deviceType);
    std::cout << std::left << std::setw(14) << record.deviceId
              << std::setw(12) << spec.displayName
              << std::setw(9) << deviceStatusToString(record.status)
              << std::setw(10) << (running ? "running" : "-")
              << record.createdAt << std::endl;
}

void printDevice(domain::DeviceSupervisor& supervisor, const DeviceStatusStore& store,
                 const std::string& deviceId) {
    auto record = supervisor.getStatus(deviceId);
    if (!record) {
        std::cout << "Device " << deviceId << " not found" << std::endl;
        return;
    }

    const DeviceTypeSpec& spec = DeviceRegistry::spec(record->deviceType);
    std::cout << "Device:     " << record->deviceId << "\n"
              << "Type:       " << spec.displayName << "\n"
              << "Status:     " << deviceStatusToString(record->status) << "\n"
              << "Created:    " << record->createdAt << std::endl;

    auto pid = supervisor.workerPid(deviceId);
    if (pid) {
        std::cout << "Worker pid: " << *pid << std::endl;
    }

    auto registration = store.registration(deviceId);
    if (registration && registration->registered) {
        std::cout << "Registered: " << registration->deviceName << " at "
                  << registration->registeredAt << std::endl;
    }
}

void printList(domain::DeviceSupervisor& supervisor) {
    auto records = supervisor.listAll();
    if (records.empty()) {
        std::cout << "No devices" << std::endl;
        return;
    }
    std::cout << std::left << std::setw(14) << "ID" << std::setw(12) << "TYPE"
              << std::setw(9) << "STATUS" << std::setw(10) << "WORKER" << "CREATED" << std::endl;
    for (const auto& record : records) {
        printRecord(record, supervisor.isRunning(record.deviceId));
    }
}

bool addDevice(domain::DeviceSupervisor& supervisor, const std::string& typeText) {
    auto type = DeviceRegistry::parse(typeText);
    if (!type) {
        std::cerr << "Unknown device type: " << typeText << std::endl;
        return false;
    }
    std::cout << supervisor.addDevice(*type) << std::endl;
    return true;
}

/// Show or set the sampling interval; empty text shows it
bool handleInterval(DeviceSettingsStore& settings, const std::string& text) {
    if (text.empty()) {
        std::cout << "Measurement interval: " << settings.measurementInterval() << "s" << std::endl;
        return true;
    }

    int seconds = 0;
    try {
        size_t used = 0;
        seconds = std::stoi(text, &used);
        if (used != text.size()) {
            throw std::invalid_argument(text);
        }
    } catch (const std::exception&) {
        std::cerr << "Invalid interval: " << text << std::endl;
        return false;
    }

    int stored = settings.setMeasurementInterval(seconds);
    std::cout << "Measurement interval set to " << stored << "s" << std::endl;
    return true;
}

void printUplinkSettings(const UplinkSettings& settings) {
    std::cout << "enabled            = " << (settings.enabled ? "true" : "false") << "\n"
              << "broker_host        = " << settings.brokerHost << "\n"
              << "broker_port        = " << settings.brokerPort
              << " (effective " << settings.effectivePort() << ")\n"
              << "username           = " << settings.username << "\n"
              << "password           = " << (settings.password.empty() ? "" : "********") << "\n"
              << "tenant             = " << settings.tenant << "\n"
              << "use_ssl            = " << (settings.useSsl ? "true" : "false") << "\n"
              << "ca_cert_path       = " << settings.caCertPath << "\n"
              << "client_cert_path   = " << settings.clientCertPath << "\n"
              << "client_key_path    = " << settings.clientKeyPath << "\n"
              << "device_name_prefix = " << settings.deviceNamePrefix << std::endl;
}

int handleUplink(const AppConfig& config, const std::vector<std::string>& args) {
    UplinkSettingsStore store(config.uplinkSettingsFile);

    if (args.empty() || args[0] == "show") {
        printUplinkSettings(store.load());
        return 0;
    }

    if (args[0] != "set" || args.size() < 2) {
        std::cerr << "Usage: uplink show | uplink set key=value..." << std::endl;
        return 1;
    }

    UplinkSettings settings = store.load();
    for (size_t i = 1; i < args.size(); ++i) {
        size_t equalPos = args[i].find('=');
        if (equalPos == std::string::npos) {
            std::cerr << "Expected key=value, got '" << args[i] << "'" << std::endl;
            return 1;
        }
        const std::string key = args[i].substr(0, equalPos);
        const std::string value = args[i].substr(equalPos + 1);
        if (!UplinkSettingsStore::applyAssignment(settings, key, value)) {
            std::cerr << "Invalid uplink setting: " << args[i] << std::endl;
            return 1;
        }
    }

    if (!store.save(settings)) {
        std::cerr << "Failed to write " << store.path() << std::endl;
        return 1;
    }
    std::cout << "Uplink settings saved to " << store.path() << std::endl;
    return 0;
}

/**
 * @brief Worker process entry: sample one device until signalled
 *
 * Uplink failures at startup do not stop sampling; a broker that is merely
 * unreachable keeps being retried in the background.
 */
int runWorker(const AppConfig& config, const std::vector<std::string>& args) {
    std::string deviceId;
    std::string typeText;
    std::string intervalText;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--device-id" && i + 1 < args.size()) {
            deviceId = args[++i];
        } else if (arg == "--device-type" && i + 1 < args.size()) {
            typeText = args[++i];
        } else if (arg == "--interval" && i + 1 < args.size()) {
            intervalText = args[++i];
        } else {
            std::cerr << "Unknown worker option: " << arg << std::endl;
            return 1;
        }
    }

    if (deviceId.empty()) {
        std::cerr << "worker requires --device-id" << std::endl;
        return 1;
    }

    std::optional<DeviceType> type = typeText.empty() ? DeviceRegistry::fromDeviceId(deviceId)
                                                      : DeviceRegistry::parse(typeText);
    if (!type) {
        std::cerr << "Cannot resolve device type of " << deviceId << std::endl;
        return 1;
    }

    int intervalSeconds = DeviceSettingsStore(config.deviceSettingsFile).measurementInterval();
    if (!intervalText.empty()) {
        try {
            intervalSeconds = clampMeasurementInterval(std::stoi(intervalText));
        } catch (const std::exception&) {
            std::cerr << "Invalid interval '" << intervalText << "', using "
                      << intervalSeconds << "s" << std::endl;
        }
    }

    SystemClock clock;
    StandardRng rng;
    MeasurementGenerator generator(rng, clock);
    adapters::SqliteMeasurementSink sink(config.databasePath);

    UplinkSettings uplinkSettings = UplinkSettingsStore(config.uplinkSettingsFile).load();
    DeviceStatusStore statusStore(config.statusFile);
    adapters::StatusFileRegistrationLedger ledger(statusStore);

    std::unique_ptr<PahoMqttClient> mqttClient;
    std::unique_ptr<domain::UplinkSession> uplink;

    if (uplinkSettings.enabled && !uplinkSettings.brokerHost.empty()) {
        domain::UplinkOptions options;
        options.connectTimeout = std::chrono::seconds(config.connectTimeoutSeconds);
        options.heartbeatInterval = std::chrono::seconds(config.heartbeatSeconds);
        options.restartDelay = std::chrono::seconds(config.restartDelaySeconds);
        options.retryPolicy = std::make_shared<adapters::ExponentialBackoffRetryPolicy>();

        mqttClient = std::make_unique<PahoMqttClient>();
        uplink = std::make_unique<domain::UplinkSession>(deviceId, uplinkSettings, *mqttClient,
                                                         ledger, clock, options);

        const std::string deviceName = uplinkSettings.deviceNamePrefix + deviceId;
        if (!uplink->start(DeviceRegistry::spec(*type).displayName, deviceName)) {
            std::cerr << "[Worker " << deviceId << "] Uplink not ready ("
                      << domain::connectFailureToString(uplink->lastConnectFailure())
                      << "), sampling locally" << std::endl;
        }
    }

    domain::DeviceWorker worker(deviceId, *type, std::chrono::seconds(intervalSeconds),
                                generator, sink, uplink.get());
    worker.run([] { return g_running; });

    // The session joins its threads before the client goes away
    uplink.reset();
    mqttClient.reset();
    return 0;
}

void printShellHelp() {
    std::cout << "\nCommands:\n"
              << "  add <type>        Add a device\n"
              << "  start <id>        Start a worker\n"
              << "  stop <id>         Stop a worker\n"
              << "  delete <id>       Delete a device\n"
              << "  status <id>       Show one device\n"
              << "  list              List all devices\n"
              << "  interval [s]      Show or set the sampling interval\n"
              << "  quit              Stop all workers and exit\n"
              << std::endl;
}

void runShell(domain::DeviceSupervisor& supervisor, const DeviceStatusStore& store,
              DeviceSettingsStore& settings) {
    printShellHelp();

    std::string line;
    while (g_running) {
        std::cout << "> " << std::flush;
        if (!std::getline(std::cin, line)) {
            break;
        }

        std::istringstream input(line);
        std::string cmd;
        std::string arg;
        input >> cmd >> arg;

        if (cmd.empty()) {
            continue;
        } else if (cmd == "add" && !arg.empty()) {
            addDevice(supervisor, arg);
        } else if (cmd == "start" && !arg.empty()) {
            if (!supervisor.startDevice(arg)) {
                std::cout << "Could not start " << arg << std::endl;
            }
        } else if (cmd == "stop" && !arg.empty()) {
            supervisor.stopDevice(arg);
        } else if (cmd == "delete" && !arg.empty()) {
            if (!supervisor.deleteDevice(arg)) {
                std::cout << "Delete of " << arg << " was incomplete" << std::endl;
            }
        } else if (cmd == "status" && !arg.empty()) {
            printDevice(supervisor, store, arg);
        } else if (cmd == "list") {
            printList(supervisor);
        } else if (cmd == "interval") {
            handleInterval(settings, arg);
        } else if (cmd == "quit" || cmd == "q") {
            g_running = false;
        } else if (cmd == "help") {
            printShellHelp();
        } else {
            std::cout << "Unknown command" << std::endl;
        }
    }
}

int runSupervisor(const AppConfig& config, const std::string& configFile,
                  const std::vector<std::string>& args) {
    bool headless = false;
    std::vector<std::string> autostart;

    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--headless") {
            headless = true;
        } else if (args[i] == "--autostart") {
            while (i + 1 < args.size() && args[i + 1].rfind("--", 0) != 0) {
                autostart.push_back(args[++i]);
            }
        } else {
            std::cerr << "Unknown run option: " << args[i] << std::endl;
            return 1;
        }
    }

    SystemClock clock;
    DeviceStatusStore statusStore(config.statusFile);
    DeviceSettingsStore deviceSettings(config.deviceSettingsFile);
    adapters::SqliteMeasurementSink sink(config.databasePath);
    PosixProcessLauncher launcher = PosixProcessLauncher::forWorker(configFile);

    domain::DeviceSupervisor supervisor(statusStore, deviceSettings, launcher, sink, clock,
                                        supervisorOptions(config));
    supervisor.reconcileOnStartup();

    std::cout << "Starting metersim supervisor" << std::endl;
    std::cout << "Status file: " << statusStore.path() << std::endl;
    std::cout << "Database: " << sink.path() << std::endl;

    for (const auto& deviceId : autostart) {
        if (!supervisor.startDevice(deviceId)) {
            std::cerr << "Autostart of " << deviceId << " failed" << std::endl;
        }
    }

    if (headless) {
        std::cout << "Running in headless mode. Press Ctrl+C to stop." << std::endl;
        int ticks = 0;
        while (g_running) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1000));
            // Reap workers that exited on their own
            if (++ticks % 5 == 0) {
                supervisor.listAll();
            }
        }
    } else {
        runShell(supervisor, statusStore, deviceSettings);
    }

    std::cout << "Stopping workers..." << std::endl;
    supervisor.cleanup();
    std::cout << "Supervisor stopped." << std::endl;
    return 0;
}

/**
 * @brief One-shot fleet commands
 *
 * These do not own any worker, so records are loaded without demotion and
 * a running supervisor's Active records are left alone.
 */
int runFleetCommand(const AppConfig& config, const std::string& command,
                    const std::vector<std::string>& args) {
    SystemClock clock;
    DeviceStatusStore statusStore(config.statusFile);
    DeviceSettingsStore deviceSettings(config.deviceSettingsFile);

    if (command == "interval") {
        return handleInterval(deviceSettings, args.empty() ? "" : args[0]) ? 0 : 1;
    }

    adapters::SqliteMeasurementSink sink(config.databasePath);
    PosixProcessLauncher launcher = PosixProcessLauncher::forWorker("");
    domain::DeviceSupervisor supervisor(statusStore, deviceSettings, launcher, sink, clock,
                                        supervisorOptions(config));
    supervisor.load();

    if (command == "list") {
        printList(supervisor);
        return 0;
    }

    if (args.empty()) {
        std::cerr << command << " requires an argument" << std::endl;
        return 1;
    }

    if (command == "add") {
        return addDevice(supervisor, args[0]) ? 0 : 1;
    } else if (command == "delete") {
        return supervisor.deleteDevice(args[0]) ? 0 : 1;
    } else if (command == "status") {
        printDevice(supervisor, statusStore, args[0]);
        if (supervisor.getStatus(args[0])) {
            std::cout << "Samples:    " << sink.measurementCount(args[0]) << std::endl;
            return 0;
        }
        return 1;
    }

    std::cerr << "Unknown command: " << command << std::endl;
    return 1;
}

int main(int argc, char* argv[]) {
    installSignalHandlers();

    std::string configFile = "metersim.toml";
    std::string command;
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (command.empty() && arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (command.empty() && arg == "--config") {
            if (i + 1 < argc) {
                configFile = argv[++i];
            }
        } else if (command.empty()) {
            command = arg;
        } else {
            args.push_back(arg);
        }
    }

    if (command.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    AppConfig config = loadConfig(configFile);

    try {
        if (command == "worker") {
            return runWorker(config, args);
        } else if (command == "run") {
            return runSupervisor(config, configFile, args);
        } else if (command == "uplink") {
            return handleUplink(config, args);
        } else if (command == "add" || command == "delete" || command == "status" ||
                   command == "list" || command == "interval") {
            return runFleetCommand(config, command, args);
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::cerr << "Unknown command: " << command << std::endl;
    printUsage(argv[0]);
    return 1;
}

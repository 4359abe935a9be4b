#include "UplinkSession.hpp"
#include "../adapters/DefaultPolicies.hpp"
#include <iostream>
#include <stdexcept>

namespace metersim::domain {

namespace {

const adapters::ExponentialBackoffRetryPolicy& defaultRetryPolicy() {
    static const adapters::ExponentialBackoffRetryPolicy policy;
    return policy;
}

/// Outcome of one tracked publish, shared with the delivery callback
struct AckWaiter {
    std::mutex mutex;
    std::condition_variable cv;
    bool done = false;
    bool delivered = false;
};

void joinIfJoinable(std::thread& thread) {
    if (!thread.joinable()) {
        return;
    }
    if (thread.get_id() == std::this_thread::get_id()) {
        thread.detach();
    } else {
        thread.join();
    }
}

} // namespace

std::string connectionStateToString(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting:   return "connecting";
        case ConnectionState::Connected:    return "connected";
    }
    return "unknown";
}

std::string connectFailureToString(ConnectFailure failure) {
    switch (failure) {
        case ConnectFailure::None:              return "none";
        case ConnectFailure::ProtocolMismatch:  return "unacceptable protocol version";
        case ConnectFailure::BadIdentifier:     return "client identifier rejected";
        case ConnectFailure::ServerUnavailable: return "server unavailable";
        case ConnectFailure::BadCredentials:    return "bad username or password";
        case ConnectFailure::NotAuthorized:     return "not authorized";
        case ConnectFailure::Timeout:           return "timed out";
        case ConnectFailure::TransportError:    return "transport error";
    }
    return "unknown";
}

ConnectFailure connectFailureFromReturnCode(int returnCode) {
    switch (returnCode) {
        case connack::kAccepted:           return ConnectFailure::None;
        case connack::kProtocolMismatch:   return ConnectFailure::ProtocolMismatch;
        case connack::kIdentifierRejected: return ConnectFailure::BadIdentifier;
        case connack::kServerUnavailable:  return ConnectFailure::ServerUnavailable;
        case connack::kBadCredentials:     return ConnectFailure::BadCredentials;
        case connack::kNotAuthorized:      return ConnectFailure::NotAuthorized;
        default:                           return ConnectFailure::TransportError;
    }
}

UplinkSession::UplinkSession(std::string deviceId,
                             UplinkSettings settings,
                             IMqttClient& client,
                             ports::IRegistrationLedger& ledger,
                             const IClock& clock,
                             UplinkOptions options)
    : deviceId_(std::move(deviceId)),
      settings_(std::move(settings)),
      client_(client),
      ledger_(ledger),
      clock_(clock),
      options_(std::move(options)) {
    if (deviceId_.empty()) {
        throw std::invalid_argument("UplinkSession requires a device id");
    }

    client_.setConnectionCallback([this](bool connected, int returnCode, const std::string& reason) {
        onConnectionChanged(connected, returnCode, reason);
    });
    client_.setMessageCallback([this](const MqttMessage& message) {
        onMessage(message);
    });
}

UplinkSession::~UplinkSession() {
    disconnect();
    client_.setConnectionCallback(nullptr);
    client_.setMessageCallback(nullptr);
}

bool UplinkSession::connect() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = false;
        autoReconnect_ = true;
    }
    return attemptConnect();
}

bool UplinkSession::attemptConnect() {
    std::lock_guard<std::mutex> attempt(connectMutex_);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return false;
        }
        if (state_ == ConnectionState::Connected) {
            return true;
        }
        state_ = ConnectionState::Connecting;
        lastFailure_ = ConnectFailure::None;
    }

    const std::string clientId = deviceId_ + "_" + std::to_string(clock_.epochSeconds());
    const std::string username = settings_.qualifiedUsername();
    const std::uint16_t port = settings_.effectivePort();

    std::cout << tag() << " Connecting to " << settings_.brokerHost << ":" << port
              << (settings_.useSsl ? " (TLS)" : "") << std::endl;

    bool initiated;
    if (settings_.useSsl) {
        TlsConfig tls;
        tls.caPath = settings_.caCertPath;
        tls.certPath = settings_.clientCertPath;
        tls.keyPath = settings_.clientKeyPath;
        initiated = client_.connectWithTls(settings_.brokerHost, port, clientId, username,
                                           settings_.password, tls);
    } else {
        initiated = client_.connect(settings_.brokerHost, port, clientId, username, settings_.password);
    }

    std::unique_lock<std::mutex> lock(mutex_);
    if (!initiated) {
        state_ = ConnectionState::Disconnected;
        lastFailure_ = ConnectFailure::TransportError;
        std::cerr << tag() << " Connection could not be started" << std::endl;
        return false;
    }

    cv_.wait_for(lock, options_.connectTimeout, [this] {
        return state_ != ConnectionState::Connecting || stopping_;
    });

    if (state_ == ConnectionState::Connected) {
        lastFailure_ = ConnectFailure::None;
        lock.unlock();
        std::cout << tag() << " Connected" << std::endl;
        startHeartbeatLoop();
        return true;
    }

    if (state_ == ConnectionState::Connecting) {
        state_ = ConnectionState::Disconnected;
        lastFailure_ = stopping_ ? ConnectFailure::TransportError : ConnectFailure::Timeout;
        lock.unlock();
        std::cerr << tag() << " Connection attempt timed out after "
                  << options_.connectTimeout.count() << " ms" << std::endl;
        client_.disconnect();
        return false;
    }

    std::cerr << tag() << " Connection refused: " << connectFailureToString(lastFailure_) << std::endl;
    return false;
}

bool UplinkSession::registerDevice(const std::string& deviceType, const std::string& deviceName, bool force) {
    std::lock_guard<std::mutex> registration(registrationMutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        registrationTarget_ = std::make_pair(deviceType, deviceName);
        if (state_ != ConnectionState::Connected) {
            std::cerr << tag() << " Cannot register while " << connectionStateToString(state_) << std::endl;
            return false;
        }
    }

    if (!force) {
        auto known = ledger_.lookup(deviceId_);
        if (known && known->registered) {
            std::cout << tag() << " Already registered as " << known->deviceName << std::endl;
            subscribeCommands();
            std::lock_guard<std::mutex> lock(mutex_);
            registered_ = true;
            return true;
        }
    }

    auto waiter = std::make_shared<AckWaiter>();
    const bool started = client_.publishWithAck(
        SmartRestCodec::kUpstreamTopic,
        SmartRestCodec::registration(deviceName, deviceType),
        kRegistrationQos,
        [waiter](bool delivered) {
            {
                std::lock_guard<std::mutex> lock(waiter->mutex);
                waiter->done = true;
                waiter->delivered = delivered;
            }
            waiter->cv.notify_all();
        });

    if (!started) {
        std::cerr << tag() << " Registration publish failed" << std::endl;
        return false;
    }

    bool delivered = false;
    {
        std::unique_lock<std::mutex> lock(waiter->mutex);
        waiter->cv.wait_for(lock, options_.ackTimeout, [&] { return waiter->done; });
        delivered = waiter->done && waiter->delivered;
    }
    if (!delivered) {
        std::cerr << tag() << " Registration was not acknowledged" << std::endl;
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        lastMessageAt_ = clock_.now();
    }

    ports::RegistrationInfo info;
    info.registered = true;
    info.deviceName = deviceName;
    info.registeredAt = clock_.iso8601();
    if (!ledger_.record(deviceId_, info)) {
        std::cerr << tag() << " Registration succeeded but could not be recorded" << std::endl;
    }

    std::cout << tag() << " Registered as " << deviceName << " (" << deviceType << ")" << std::endl;
    subscribeCommands();

    std::lock_guard<std::mutex> lock(mutex_);
    registered_ = true;
    return true;
}

bool UplinkSession::start(const std::string& deviceType, const std::string& deviceName) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        registrationTarget_ = std::make_pair(deviceType, deviceName);
    }

    if (connect()) {
        return registerDevice(deviceType, deviceName, false);
    }

    const ConnectFailure failure = lastConnectFailure();
    if (failure == ConnectFailure::Timeout || failure == ConnectFailure::TransportError) {
        std::cout << tag() << " Broker unreachable, retrying in the background" << std::endl;
        startReconnectLoop();
    }
    return false;
}

void UplinkSession::subscribeCommands() {
    if (!client_.subscribe(SmartRestCodec::kDownstreamTopic, kCommandQos)) {
        std::cerr << tag() << " Subscribe to " << SmartRestCodec::kDownstreamTopic << " failed" << std::endl;
    }
}

void UplinkSession::restoreRegistration() {
    std::optional<std::pair<std::string, std::string>> target;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        target = registrationTarget_;
    }
    if (target) {
        registerDevice(target->first, target->second, false);
    }
}

bool UplinkSession::sendMeasurement(const MeasurementSample& sample) {
    if (!isConnected()) {
        bool tryInline = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            tryInline = options_.reconnectOnSend && autoReconnect_ && !reconnecting_ && !stopping_;
        }
        if (!tryInline || !attemptConnect()) {
            return false;
        }
        restoreRegistration();
    }
    return publishUpstream(SmartRestCodec::measurement(sample), kTelemetryQos);
}

bool UplinkSession::sendAlarm(const std::string& alarmType, const std::string& text, AlarmSeverity severity) {
    if (!isConnected()) {
        return false;
    }
    return publishUpstream(SmartRestCodec::alarm(alarmType, text, severity), kTelemetryQos);
}

bool UplinkSession::publishUpstream(const std::string& payload, int qos) {
    if (!client_.publish(SmartRestCodec::kUpstreamTopic, payload, qos)) {
        std::cerr << tag() << " Publish failed" << std::endl;
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    lastMessageAt_ = clock_.now();
    return true;
}

void UplinkSession::disconnect() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        autoReconnect_ = false;
        stopping_ = true;
    }
    cv_.notify_all();

    joinIfJoinable(reconnectThread_);
    joinIfJoinable(heartbeatThread_);
    joinIfJoinable(commandThread_);

    bool wasConnected = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        wasConnected = state_ != ConnectionState::Disconnected;
        state_ = ConnectionState::Disconnected;
        registered_ = false;
    }
    if (wasConnected) {
        client_.disconnect();
        std::cout << tag() << " Disconnected" << std::endl;
    }
}

void UplinkSession::onConnectionChanged(bool connected, int returnCode, const std::string& reason) {
    bool lost = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (connected) {
            if (state_ == ConnectionState::Connecting) {
                state_ = ConnectionState::Connected;
            }
        } else if (state_ == ConnectionState::Connecting) {
            state_ = ConnectionState::Disconnected;
            lastFailure_ = connectFailureFromReturnCode(returnCode);
        } else if (state_ == ConnectionState::Connected) {
            state_ = ConnectionState::Disconnected;
            registered_ = false;
            lost = !stopping_;
        }
    }
    cv_.notify_all();

    if (lost) {
        std::cerr << tag() << " Connection lost: " << reason << std::endl;
        startReconnectLoop();
    }
}

void UplinkSession::onMessage(const MqttMessage& message) {
    if (message.topic != SmartRestCodec::kDownstreamTopic) {
        std::cout << tag() << " Ignoring message on " << message.topic << std::endl;
        return;
    }

    for (const auto& line : SmartRestCodec::parse(message.payload)) {
        if (line.code == SmartRestCodec::kRestartCommand) {
            std::cout << tag() << " Restart command received" << std::endl;
            startRestartSequence();
        } else {
            std::cout << tag() << " Ignoring command " << line.code << std::endl;
        }
    }
}

void UplinkSession::startReconnectLoop() {
    std::thread previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (reconnecting_ || stopping_ || !autoReconnect_) {
            return;
        }
        reconnecting_ = true;
        previous = std::move(reconnectThread_);
        reconnectThread_ = std::thread(&UplinkSession::reconnectLoop, this);
    }
    joinIfJoinable(previous);
}

void UplinkSession::startHeartbeatLoop() {
    std::thread previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (heartbeatRunning_ || stopping_) {
            return;
        }
        heartbeatRunning_ = true;
        previous = std::move(heartbeatThread_);
        heartbeatThread_ = std::thread(&UplinkSession::heartbeatLoop, this);
    }
    joinIfJoinable(previous);
}

void UplinkSession::startRestartSequence() {
    std::thread previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        if (commandRunning_) {
            std::cout << tag() << " Restart already in progress, ignoring" << std::endl;
            return;
        }
        commandRunning_ = true;
        previous = std::move(commandThread_);
        commandThread_ = std::thread(&UplinkSession::restartSequence, this);
    }
    joinIfJoinable(previous);
}

void UplinkSession::reconnectLoop() {
    const ports::RetryPolicy& policy = retryPolicy();

    while (true) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (stopping_ || !autoReconnect_) {
                reconnecting_ = false;
                return;
            }
            if (!policy.shouldRetry(reconnectAttempts_)) {
                autoReconnect_ = false;
                reconnecting_ = false;
                std::cerr << tag() << " Giving up after " << reconnectAttempts_
                          << " reconnection attempts" << std::endl;
                return;
            }

            ++reconnectAttempts_;
            const auto delay = policy.getBackoffDelay(reconnectAttempts_);
            std::cout << tag() << " Reconnection attempt " << reconnectAttempts_
                      << " in " << delay.count() << " ms" << std::endl;

            cv_.wait_for(lock, delay, [this] { return stopping_ || !autoReconnect_; });
            if (stopping_ || !autoReconnect_) {
                reconnecting_ = false;
                return;
            }
        }

        if (!attemptConnect()) {
            continue;
        }
        restoreRegistration();

        std::lock_guard<std::mutex> lock(mutex_);
        // A loss during re-registration keeps the loop going
        if (state_ == ConnectionState::Connected) {
            std::cout << tag() << " Reconnected after " << reconnectAttempts_ << " attempt(s)" << std::endl;
            reconnectAttempts_ = 0;
            reconnecting_ = false;
            return;
        }
    }
}

void UplinkSession::heartbeatLoop() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (!stopping_ && state_ == ConnectionState::Connected) {
        cv_.wait_for(lock, options_.heartbeatInterval, [this] {
            return stopping_ || state_ != ConnectionState::Connected;
        });
        if (stopping_ || state_ != ConnectionState::Connected) {
            break;
        }

        const auto now = clock_.now();
        if (lastMessageAt_ && now - *lastMessageAt_ < options_.heartbeatInterval) {
            continue;
        }

        lock.unlock();
        const bool sent = client_.publish(SmartRestCodec::kUpstreamTopic, SmartRestCodec::heartbeat(), kTelemetryQos);
        lock.lock();

        if (sent) {
            lastHeartbeatAt_ = now;
        } else {
            std::cerr << tag() << " Heartbeat publish failed" << std::endl;
        }
    }

    heartbeatRunning_ = false;
}

void UplinkSession::restartSequence() {
    const std::string fragment = "c8y_Restart";

    if (!publishUpstream(SmartRestCodec::operationExecuting(fragment), kTelemetryQos)) {
        std::cerr << tag() << " Could not acknowledge restart" << std::endl;
    }

    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, options_.restartDelay, [this] { return stopping_; });
    if (stopping_) {
        commandRunning_ = false;
        return;
    }
    lock.unlock();

    if (publishUpstream(SmartRestCodec::operationSuccessful(fragment), kTelemetryQos)) {
        std::cout << tag() << " Restart simulated" << std::endl;
    } else {
        std::cerr << tag() << " Could not report restart completion" << std::endl;
    }

    lock.lock();
    commandRunning_ = false;
}

ConnectionState UplinkSession::connectionState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool UplinkSession::isConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == ConnectionState::Connected;
}

bool UplinkSession::isRegistered() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registered_;
}

ConnectFailure UplinkSession::lastConnectFailure() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastFailure_;
}

int UplinkSession::reconnectAttempts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reconnectAttempts_;
}

bool UplinkSession::autoReconnectEnabled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return autoReconnect_;
}

bool UplinkSession::isReconnecting() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reconnecting_;
}

std::optional<std::chrono::system_clock::time_point> UplinkSession::lastMessageAt() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastMessageAt_;
}

std::optional<std::chrono::system_clock::time_point> UplinkSession::lastHeartbeatAt() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastHeartbeatAt_;
}

const ports::RetryPolicy& UplinkSession::retryPolicy() const {
    if (options_.retryPolicy) {
        return *options_.retryPolicy;
    }
    return defaultRetryPolicy();
}

std::string UplinkSession::tag() const {
    return "[Uplink " + deviceId_ + "]";
}

} // namespace metersim::domain

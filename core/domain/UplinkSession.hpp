/**
 * @file UplinkSession.hpp
 * @brief Per-device telemetry session against the Cumulocity MQTT endpoint
 *
 * State machine on top of the callback-driven MQTT client:
 *
 *   Disconnected -> Connecting -> Connected (-> Registered)
 *
 * connect() blocks on a condition variable that the connection callback
 * signals, bounded by the connect timeout. An unexpected loss of an
 * established connection starts the reconnection loop; a heartbeat loop runs
 * while connected; a restart command runs its acknowledgement sequence on a
 * command thread. All session state is guarded by one mutex.
 */

#pragma once

#include "../IClock.hpp"
#include "../IMqttClient.hpp"
#include "../Measurement.hpp"
#include "../Settings.hpp"
#include "../SmartRestCodec.hpp"
#include "../ports/IRegistrationLedger.hpp"
#include "../ports/RetryPolicy.hpp"
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace metersim::domain {

enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected
};

enum class ConnectFailure {
    None,
    ProtocolMismatch,
    BadIdentifier,
    ServerUnavailable,
    BadCredentials,
    NotAuthorized,
    Timeout,
    TransportError
};

std::string connectionStateToString(ConnectionState state);
std::string connectFailureToString(ConnectFailure failure);
ConnectFailure connectFailureFromReturnCode(int returnCode);

struct UplinkOptions {
    std::chrono::milliseconds connectTimeout{std::chrono::seconds(10)};
    std::chrono::milliseconds ackTimeout{std::chrono::seconds(10)};
    std::chrono::milliseconds heartbeatInterval{std::chrono::seconds(60)};
    std::chrono::milliseconds restartDelay{std::chrono::seconds(2)};
    bool reconnectOnSend = false;                          ///< One inline reconnect in sendMeasurement
    std::shared_ptr<const ports::RetryPolicy> retryPolicy; ///< nullptr selects the 5 s / 300 s / 50 default
};

class UplinkSession {
public:
    UplinkSession(std::string deviceId,
                  UplinkSettings settings,
                  IMqttClient& client,
                  ports::IRegistrationLedger& ledger,
                  const IClock& clock,
                  UplinkOptions options = {});
    ~UplinkSession();

    UplinkSession(const UplinkSession&) = delete;
    UplinkSession& operator=(const UplinkSession&) = delete;

    /**
     * @brief Open the broker connection and wait for the outcome
     * @return false on timeout or rejection; see lastConnectFailure()
     * @note Re-enables automatic reconnection after a disconnect()
     */
    bool connect();

    /**
     * @brief Register the device remotely, at most once per device id
     *
     * Unless forced, an entry in the ledger short-circuits the publish. The
     * command channel is subscribed either way. The registration line is
     * published with QoS 1 and the call waits for the broker acknowledgement.
     */
    bool registerDevice(const std::string& deviceType, const std::string& deviceName, bool force = false);

    /**
     * @brief Connect and register; on a timeout or transport failure keep
     *        trying in the background and register once connected
     * @return true if the device is connected and registered now
     */
    bool start(const std::string& deviceType, const std::string& deviceName);

    bool sendMeasurement(const MeasurementSample& sample);
    bool sendAlarm(const std::string& alarmType, const std::string& text, AlarmSeverity severity);

    /// Graceful close; disables automatic reconnection and joins the loops
    void disconnect();

    ConnectionState connectionState() const;
    bool isConnected() const;
    bool isRegistered() const;
    ConnectFailure lastConnectFailure() const;
    int reconnectAttempts() const;
    bool autoReconnectEnabled() const;
    bool isReconnecting() const;
    std::optional<std::chrono::system_clock::time_point> lastMessageAt() const;
    std::optional<std::chrono::system_clock::time_point> lastHeartbeatAt() const;

    const std::string& deviceId() const { return deviceId_; }

private:
    static constexpr int kTelemetryQos = 0;
    static constexpr int kRegistrationQos = 1;
    static constexpr int kCommandQos = 1;

    std::string deviceId_;
    UplinkSettings settings_;
    IMqttClient& client_;
    ports::IRegistrationLedger& ledger_;
    const IClock& clock_;
    UplinkOptions options_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::mutex connectMutex_;   ///< Serializes connection attempts
    std::mutex registrationMutex_;  ///< Held from ledger lookup to ledger record

    ConnectionState state_ = ConnectionState::Disconnected;
    bool registered_ = false;
    ConnectFailure lastFailure_ = ConnectFailure::None;
    int reconnectAttempts_ = 0;
    bool autoReconnect_ = true;
    bool stopping_ = false;
    std::optional<std::chrono::system_clock::time_point> lastMessageAt_;
    std::optional<std::chrono::system_clock::time_point> lastHeartbeatAt_;

    // Remembered for re-registration after a reconnect
    std::optional<std::pair<std::string, std::string>> registrationTarget_;

    bool reconnecting_ = false;
    bool heartbeatRunning_ = false;
    bool commandRunning_ = false;
    std::thread reconnectThread_;
    std::thread heartbeatThread_;
    std::thread commandThread_;

    bool attemptConnect();
    void restoreRegistration();
    void subscribeCommands();
    bool publishUpstream(const std::string& payload, int qos);

    void onConnectionChanged(bool connected, int returnCode, const std::string& reason);
    void onMessage(const MqttMessage& message);

    void startReconnectLoop();
    void startHeartbeatLoop();
    void startRestartSequence();

    void reconnectLoop();
    void heartbeatLoop();
    void restartSequence();

    const ports::RetryPolicy& retryPolicy() const;
    std::string tag() const;
};

} // namespace metersim::domain

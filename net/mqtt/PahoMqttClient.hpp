/**
 * @file PahoMqttClient.hpp
 * @brief Paho MQTT C library implementation for desktop platforms
 *
 * Provides MQTT client implementation using Eclipse Paho MQTT C async library.
 * Supports username/password authentication over TCP or TLS, with optional
 * client certificates for mutual TLS.
 *
 * @note Thread-safe implementation with proper callback handling
 */

#pragma once

#include "IMqttClient.hpp"
#include <MQTTAsync.h>
#include <atomic>
#include <map>
#include <string>
#include <memory>
#include <mutex>
#include <cstdint>

namespace metersim {

/**
 * @brief Paho MQTT C library implementation for desktop platforms
 *
 * Concrete implementation of IMqttClient using the Eclipse Paho MQTT C async
 * library. Each connect() creates a fresh Paho client handle, so one instance
 * can be reconnected any number of times.
 *
 * Features:
 * - Plain TCP (tcp://) or TLS (ssl://) transport
 * - CONNACK return codes surfaced to the connection callback
 * - Tracked publishes reporting the broker acknowledgement
 *
 * @note Messages published while disconnected are dropped, not queued
 */
class PahoMqttClient : public IMqttClient {
public:
    /**
     * @brief Construct new Paho MQTT client instance
     * @note Client is not connected after construction - call connect() method
     */
    PahoMqttClient();

    /**
     * @brief Destructor - ensures clean disconnection and resource cleanup
     * @note Automatically disconnects if still connected
     */
    ~PahoMqttClient() override;

    // Disable copy and assignment to prevent resource management issues
    PahoMqttClient(const PahoMqttClient&) = delete;
    PahoMqttClient& operator=(const PahoMqttClient&) = delete;
    PahoMqttClient(PahoMqttClient&&) = delete;
    PahoMqttClient& operator=(PahoMqttClient&&) = delete;

    bool connect(const std::string& host, std::uint16_t port,
                const std::string& clientId,
                const std::string& username,
                const std::string& password) override;

    bool connectWithTls(const std::string& host, std::uint16_t port,
                       const std::string& clientId,
                       const std::string& username,
                       const std::string& password,
                       const TlsConfig& tlsConfig) override;

    void disconnect() override;
    bool isConnected() const override;

    bool publish(const std::string& topic, const std::string& payload,
                int qos = 0, bool retained = false) override;

    bool publishWithAck(const std::string& topic, const std::string& payload,
                       int qos, DeliveryCallback onDelivery) override;

    bool subscribe(const std::string& topic, int qos = 0) override;

    void setMessageCallback(MessageCallback callback) override;
    void setConnectionCallback(ConnectionCallback callback) override;

private:
    /// Keep-alive interval sent in CONNECT (seconds)
    static constexpr int kKeepAliveIntervalSeconds = 60;

    /// Paho-level connect timeout (seconds)
    static constexpr int kConnectionTimeoutSeconds = 10;

    /// Time allowed for in-flight messages on disconnect (milliseconds)
    static constexpr int kDisconnectTimeoutMs = 1000;

    MQTTAsync client_;                      ///< Paho MQTT client handle
    std::atomic<bool> connected_{false};    ///< Current connection state

    std::mutex callbackMutex_;              ///< Guards the two user callbacks
    MessageCallback messageCallback_;       ///< User callback for incoming messages
    ConnectionCallback connectionCallback_; ///< User callback for connection events

    // Connect options point into these for the duration of the async connect
    std::string username_;
    std::string password_;
    TlsConfig tlsConfig_;

    std::mutex deliveryMutex_;                                  ///< Guards the two maps below
    std::map<MQTTAsync_token, DeliveryCallback> pendingDeliveries_;
    std::map<MQTTAsync_token, bool> earlyDeliveries_;           ///< Acks that beat the token registration

    /**
     * @brief Create a fresh client handle and start the asynchronous connect
     * @param serverURI "tcp://host:port" or "ssl://host:port"
     * @param clientId Unique client identifier
     * @param useTls Attach the stored TLS configuration
     */
    bool startConnect(const std::string& serverURI, const std::string& clientId, bool useTls);

    /// Copies of the user callbacks taken under callbackMutex_
    MessageCallback messageCallback();
    ConnectionCallback connectionCallback();

    /// Report a connection event through the current connection callback
    void notifyConnection(bool connected, int code, const std::string& reason);

    /// Disconnect (if needed) and free the current client handle
    void destroyClient();

    void completeDelivery(MQTTAsync_token token, bool delivered);
    void failPendingDeliveries();

    static int messageArrived(void* context, char* topicName, int topicLen, MQTTAsync_message* message);
    static void onConnected(void* context, MQTTAsync_successData* response);
    static void onConnectFailure(void* context, MQTTAsync_failureData* response);
    static void connectionLost(void* context, char* cause);
    static void onDisconnected(void* context, MQTTAsync_successData* response);
    static void onPublishSuccess(void* context, MQTTAsync_successData* response);
    static void onPublishFailure(void* context, MQTTAsync_failureData* response);

    /**
     * @brief Validate certificate files exist and are readable
     * @param tlsConfig TLS configuration with certificate paths
     * @return true if every configured file is accessible, false otherwise
     */
    bool validateCertificateFiles(const TlsConfig& tlsConfig) const;
};

} // namespace metersim

/**
 * @file IMqttClient.hpp
 * @brief MQTT client interface for the Cumulocity uplink
 *
 * Provides a platform-independent MQTT client abstraction with username and
 * password authentication over plain TCP or TLS (server verification and
 * optional client certificate).
 *
 * @note Connection results, deliveries and inbound messages arrive through
 *       callbacks on the client's own thread
 */

#pragma once

#include <string>
#include <functional>
#include <memory>
#include <cstdint>

namespace metersim {

/**
 * @brief MQTT message structure for inbound and outbound messages
 *
 * @note QoS levels: 0 (at most once), 1 (at least once), 2 (exactly once)
 */
struct MqttMessage {
    std::string topic;              ///< MQTT topic (e.g., "s/us")
    std::string payload;            ///< Message payload (SmartREST lines)
    int qos = 0;                   ///< Quality of Service level (0, 1, or 2)
    bool retained = false;         ///< Retain flag for persistent messages
};

/**
 * @brief TLS configuration for the broker connection
 *
 * certPath and keyPath are only needed for mutual TLS. An empty caPath
 * leaves the choice of trust store to the TLS library.
 *
 * @note Certificate files must be in PEM format
 * @note Private key must match the public key in the certificate
 */
struct TlsConfig {
    std::string certPath;          ///< Client certificate file (.pem), optional
    std::string keyPath;           ///< Private key file (.pem), optional
    std::string caPath;            ///< Root CA certificate file (.pem)
    bool verifyServer = true;      ///< Enable server certificate validation
};

/// CONNACK return codes as delivered to the connection callback
namespace connack {
constexpr int kAccepted = 0;
constexpr int kProtocolMismatch = 1;
constexpr int kIdentifierRejected = 2;
constexpr int kServerUnavailable = 3;
constexpr int kBadCredentials = 4;
constexpr int kNotAuthorized = 5;
constexpr int kTransportError = -1;   ///< No CONNACK: socket, TLS or loss
} // namespace connack

/**
 * @brief Platform-independent MQTT client interface
 *
 * @note Callback-based design enables event-driven architecture
 * @note Implementations must not invoke callbacks while holding locks the
 *       caller could need
 */
class IMqttClient {
public:
    /// Virtual destructor for proper cleanup in derived classes
    virtual ~IMqttClient() = default;

    /// Callback function type for incoming MQTT messages
    using MessageCallback = std::function<void(const MqttMessage&)>;

    /**
     * @brief Callback function type for connection state changes
     *
     * connected=true reports an accepted connection. connected=false reports
     * either a failed attempt (returnCode is the CONNACK code or
     * connack::kTransportError) or the loss of an established connection.
     */
    using ConnectionCallback = std::function<void(bool connected, int returnCode, const std::string& reason)>;

    /// Callback for a tracked publish: true once the broker acknowledged it
    using DeliveryCallback = std::function<void(bool delivered)>;

    /**
     * @brief Connect to MQTT broker over plain TCP
     * @param host MQTT broker hostname (e.g., "tenant.cumulocity.com")
     * @param port MQTT broker port (typically 1883)
     * @param clientId Unique client identifier
     * @param username MQTT username ("tenant/user" for Cumulocity)
     * @param password MQTT password
     * @return true if connection initiated successfully, false otherwise
     * @note This method initiates asynchronous connection - use callback for status
     */
    virtual bool connect(const std::string& host, std::uint16_t port,
                        const std::string& clientId,
                        const std::string& username,
                        const std::string& password) = 0;

    /**
     * @brief Connect to MQTT broker over TLS
     * @param host MQTT broker hostname
     * @param port MQTT broker port (typically 8883)
     * @param clientId Unique client identifier
     * @param username MQTT username
     * @param password MQTT password
     * @param tlsConfig TLS configuration with certificate paths
     * @return true if connection initiated successfully, false otherwise
     * @note This method initiates asynchronous connection - use callback for status
     */
    virtual bool connectWithTls(const std::string& host, std::uint16_t port,
                               const std::string& clientId,
                               const std::string& username,
                               const std::string& password,
                               const TlsConfig& tlsConfig) = 0;

    /**
     * @brief Disconnect from MQTT broker
     * @note Pending tracked publishes are reported as not delivered
     */
    virtual void disconnect() = 0;

    /**
     * @brief Check if currently connected to MQTT broker
     * @return true if connected, false otherwise
     */
    virtual bool isConnected() const = 0;

    /**
     * @brief Publish message to MQTT topic
     * @param topic MQTT topic to publish to
     * @param payload Message payload
     * @param qos Quality of Service level (0, 1, or 2)
     * @param retained Whether message should be retained by broker
     * @return true if the message was handed to the client, false otherwise
     */
    virtual bool publish(const std::string& topic, const std::string& payload,
                        int qos = 0, bool retained = false) = 0;

    /**
     * @brief Publish and report the broker acknowledgement
     * @return false if the publish could not be started; onDelivery is then never called
     */
    virtual bool publishWithAck(const std::string& topic, const std::string& payload,
                               int qos, DeliveryCallback onDelivery) = 0;

    /**
     * @brief Subscribe to MQTT topic
     * @param topic MQTT topic to subscribe to (supports wildcards)
     * @param qos Maximum Quality of Service level for received messages
     * @return true if subscription succeeded, false otherwise
     */
    virtual bool subscribe(const std::string& topic, int qos = 0) = 0;

    /**
     * @brief Set callback for incoming MQTT messages
     * @param callback Function to call when message is received
     * @note Callback is called from MQTT thread - ensure thread safety
     */
    virtual void setMessageCallback(MessageCallback callback) = 0;

    /**
     * @brief Set callback for connection state changes
     * @param callback Function to call when connection state changes
     * @note Callback is called from MQTT thread - ensure thread safety
     */
    virtual void setConnectionCallback(ConnectionCallback callback) = 0;

protected:
    // Protected constructors to prevent direct instantiation
    IMqttClient() = default;
    IMqttClient(const IMqttClient&) = default;
    IMqttClient& operator=(const IMqttClient&) = default;
    IMqttClient(IMqttClient&&) = default;
    IMqttClient& operator=(IMqttClient&&) = default;
};

} // namespace metersim

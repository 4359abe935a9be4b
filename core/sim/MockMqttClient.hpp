#pragma once

#include "../IMqttClient.hpp"
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <vector>

namespace metersim::sim {

struct MockMessage {
    std::string topic;
    std::string payload;
    int qos = 0;
};

/**
 * @brief Scripted MQTT client for session tests
 *
 * Connection results and acknowledgements are delivered synchronously from
 * the calling thread unless the behaviour says otherwise.
 */
class MockMqttClient : public IMqttClient {
public:
    enum class ConnectBehavior {
        Accept,     ///< Callback reports success
        Reject,     ///< Callback reports rejectCode
        Silent,     ///< Attempt starts, no callback ever arrives
        FailStart   ///< connect() itself returns false
    };

    MockMqttClient() = default;
    ~MockMqttClient() override = default;

    // IMqttClient interface
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

    // Mock-specific methods for testing
    void setConnectBehavior(ConnectBehavior behavior, int rejectCode = connack::kBadCredentials);
    void setAckDeliveries(bool ack) { std::lock_guard<std::mutex> lock(mutex_); ackDeliveries_ = ack; }
    void setFailPublish(bool fail) { std::lock_guard<std::mutex> lock(mutex_); failPublish_ = fail; }

    void simulateConnectionLoss();
    void injectMessage(const std::string& topic, const std::string& payload);

    std::vector<MockMessage> publishedMessages() const;
    std::vector<MockMessage> publishedWithPrefix(const std::string& prefix) const;
    std::vector<std::string> subscriptions() const;
    void clearPublishedMessages();

    int connectAttempts() const;
    int disconnectCalls() const;
    std::string lastClientId() const;
    std::string lastUsername() const;
    std::string lastHost() const;
    std::uint16_t lastPort() const;
    bool lastUsedTls() const;
    TlsConfig lastTlsConfig() const;

    /// Blocks until at least count messages starting with prefix were published
    bool waitForPublished(const std::string& prefix, std::size_t count,
                          std::chrono::milliseconds timeout) const;

    bool waitForConnectAttempts(int count, std::chrono::milliseconds timeout) const;

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;

    bool connected_ = false;
    bool failPublish_ = false;
    bool ackDeliveries_ = true;
    ConnectBehavior behavior_ = ConnectBehavior::Accept;
    int rejectCode_ = connack::kBadCredentials;

    MessageCallback messageCallback_;
    ConnectionCallback connectionCallback_;

    std::vector<MockMessage> publishedMessages_;
    std::vector<std::string> subscriptions_;

    int connectAttempts_ = 0;
    int disconnectCalls_ = 0;
    std::string lastClientId_;
    std::string lastUsername_;
    std::string lastHost_;
    std::uint16_t lastPort_ = 0;
    bool lastUsedTls_ = false;
    TlsConfig lastTlsConfig_;

    bool startConnect();
};

} // namespace metersim::sim

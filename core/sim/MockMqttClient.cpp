#include "MockMqttClient.hpp"

namespace metersim::sim {

bool MockMqttClient::connect(const std::string& host, std::uint16_t port,
                             const std::string& clientId,
                             const std::string& username,
                             const std::string& password) {
    (void)password;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        lastHost_ = host;
        lastPort_ = port;
        lastClientId_ = clientId;
        lastUsername_ = username;
        lastUsedTls_ = false;
        lastTlsConfig_ = TlsConfig{};
    }
    return startConnect();
}

bool MockMqttClient::connectWithTls(const std::string& host, std::uint16_t port,
                                    const std::string& clientId,
                                    const std::string& username,
                                    const std::string& password,
                                    const TlsConfig& tlsConfig) {
    (void)password;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        lastHost_ = host;
        lastPort_ = port;
        lastClientId_ = clientId;
        lastUsername_ = username;
        lastUsedTls_ = true;
        lastTlsConfig_ = tlsConfig;
    }
    return startConnect();
}

bool MockMqttClient::startConnect() {
    ConnectBehavior behavior;
    int rejectCode;
    ConnectionCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++connectAttempts_;
        behavior = behavior_;
        rejectCode = rejectCode_;
        callback = connectionCallback_;
        connected_ = behavior == ConnectBehavior::Accept;
    }
    cv_.notify_all();

    switch (behavior) {
        case ConnectBehavior::Accept:
            if (callback) callback(true, connack::kAccepted, "Connected successfully");
            return true;
        case ConnectBehavior::Reject:
            if (callback) callback(false, rejectCode, "Connection refused");
            return true;
        case ConnectBehavior::Silent:
            return true;
        case ConnectBehavior::FailStart:
            return false;
    }
    return false;
}

void MockMqttClient::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    connected_ = false;
    ++disconnectCalls_;
}

bool MockMqttClient::isConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connected_;
}

bool MockMqttClient::publish(const std::string& topic, const std::string& payload, int qos, bool retained) {
    (void)retained;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!connected_ || failPublish_) {
            return false;
        }
        publishedMessages_.push_back({topic, payload, qos});
    }
    cv_.notify_all();
    return true;
}

bool MockMqttClient::publishWithAck(const std::string& topic, const std::string& payload,
                                    int qos, DeliveryCallback onDelivery) {
    bool ack;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!connected_ || failPublish_) {
            return false;
        }
        publishedMessages_.push_back({topic, payload, qos});
        ack = ackDeliveries_;
    }
    cv_.notify_all();

    if (ack && onDelivery) {
        onDelivery(true);
    }
    return true;
}

bool MockMqttClient::subscribe(const std::string& topic, int qos) {
    (void)qos;
    std::lock_guard<std::mutex> lock(mutex_);
    if (!connected_) {
        return false;
    }
    subscriptions_.push_back(topic);
    return true;
}

void MockMqttClient::setMessageCallback(MessageCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    messageCallback_ = std::move(callback);
}

void MockMqttClient::setConnectionCallback(ConnectionCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    connectionCallback_ = std::move(callback);
}

void MockMqttClient::setConnectBehavior(ConnectBehavior behavior, int rejectCode) {
    std::lock_guard<std::mutex> lock(mutex_);
    behavior_ = behavior;
    rejectCode_ = rejectCode;
}

void MockMqttClient::simulateConnectionLoss() {
    ConnectionCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connected_ = false;
        callback = connectionCallback_;
    }
    if (callback) {
        callback(false, connack::kTransportError, "Connection lost");
    }
}

void MockMqttClient::injectMessage(const std::string& topic, const std::string& payload) {
    MessageCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = messageCallback_;
    }
    if (callback) {
        MqttMessage msg;
        msg.topic = topic;
        msg.payload = payload;
        msg.qos = 1;
        callback(msg);
    }
}

std::vector<MockMessage> MockMqttClient::publishedMessages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return publishedMessages_;
}

std::vector<MockMessage> MockMqttClient::publishedWithPrefix(const std::string& prefix) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<MockMessage> matching;
    for (const auto& msg : publishedMessages_) {
        if (msg.payload.compare(0, prefix.size(), prefix) == 0) {
            matching.push_back(msg);
        }
    }
    return matching;
}

std::vector<std::string> MockMqttClient::subscriptions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_;
}

void MockMqttClient::clearPublishedMessages() {
    std::lock_guard<std::mutex> lock(mutex_);
    publishedMessages_.clear();
}

int MockMqttClient::connectAttempts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connectAttempts_;
}

int MockMqttClient::disconnectCalls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return disconnectCalls_;
}

std::string MockMqttClient::lastClientId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastClientId_;
}

std::string MockMqttClient::lastUsername() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastUsername_;
}

std::string MockMqttClient::lastHost() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastHost_;
}

std::uint16_t MockMqttClient::lastPort() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastPort_;
}

bool MockMqttClient::lastUsedTls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastUsedTls_;
}

TlsConfig MockMqttClient::lastTlsConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastTlsConfig_;
}

bool MockMqttClient::waitForPublished(const std::string& prefix, std::size_t count,
                                      std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&] {
        std::size_t matching = 0;
        for (const auto& msg : publishedMessages_) {
            if (msg.payload.compare(0, prefix.size(), prefix) == 0) {
                ++matching;
            }
        }
        return matching >= count;
    });
}

bool MockMqttClient::waitForConnectAttempts(int count, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&] { return connectAttempts_ >= count; });
}

} // namespace metersim::sim

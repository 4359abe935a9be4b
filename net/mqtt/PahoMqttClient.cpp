#include "PahoMqttClient.hpp"
#include <iostream>
#include <optional>
#include <fstream>
#include <vector>

namespace metersim {

namespace {

const char* optionalPath(const std::string& path) {
    return path.empty() ? nullptr : path.c_str();
}

} // namespace

PahoMqttClient::PahoMqttClient() : client_(nullptr) {}

PahoMqttClient::~PahoMqttClient() {
    destroyClient();
}

bool PahoMqttClient::connect(const std::string& host, std::uint16_t port,
                            const std::string& clientId,
                            const std::string& username,
                            const std::string& password) {
    username_ = username;
    password_ = password;
    tlsConfig_ = TlsConfig{};

    std::string serverURI = "tcp://" + host + ":" + std::to_string(port);
    std::cout << "[MQTT] Connecting to " << serverURI << " as " << username << std::endl;
    return startConnect(serverURI, clientId, false);
}

bool PahoMqttClient::connectWithTls(const std::string& host, std::uint16_t port,
                                   const std::string& clientId,
                                   const std::string& username,
                                   const std::string& password,
                                   const TlsConfig& tlsConfig) {

    std::cout << "[MQTT] Connecting with TLS to " << host << ":" << port << std::endl;
    std::cout << "[MQTT] Client ID: " << clientId << std::endl;
    std::cout << "[MQTT] Username: " << username << std::endl;
    if (!tlsConfig.caPath.empty()) {
        std::cout << "[MQTT] CA: " << tlsConfig.caPath << std::endl;
    }
    if (!tlsConfig.certPath.empty()) {
        std::cout << "[MQTT] Client cert: " << tlsConfig.certPath << std::endl;
    }

    // Validate certificate files before attempting connection
    if (!validateCertificateFiles(tlsConfig)) {
        return false;
    }

    username_ = username;
    password_ = password;
    tlsConfig_ = tlsConfig;

    std::string serverURI = "ssl://" + host + ":" + std::to_string(port);
    return startConnect(serverURI, clientId, true);
}

bool PahoMqttClient::startConnect(const std::string& serverURI, const std::string& clientId, bool useTls) {
    destroyClient();

    int rc = MQTTAsync_create(&client_, serverURI.c_str(), clientId.c_str(),
                             MQTTCLIENT_PERSISTENCE_NONE, nullptr);
    if (rc != MQTTASYNC_SUCCESS) {
        std::cerr << "[MQTT] Failed to create client, error code: " << rc << std::endl;
        client_ = nullptr;
        return false;
    }

    rc = MQTTAsync_setCallbacks(client_, this, connectionLost, messageArrived, nullptr);
    if (rc != MQTTASYNC_SUCCESS) {
        std::cerr << "[MQTT] Failed to set callbacks, error code: " << rc << std::endl;
        destroyClient();
        return false;
    }

    MQTTAsync_connectOptions conn_opts = MQTTAsync_connectOptions_initializer;
    MQTTAsync_SSLOptions ssl_opts = MQTTAsync_SSLOptions_initializer;

    conn_opts.keepAliveInterval = kKeepAliveIntervalSeconds;
    conn_opts.cleansession = 1;
    conn_opts.connectTimeout = kConnectionTimeoutSeconds;
    conn_opts.onSuccess = onConnected;
    conn_opts.onFailure = onConnectFailure;
    conn_opts.context = this;
    conn_opts.username = username_.empty() ? nullptr : username_.c_str();
    conn_opts.password = password_.empty() ? nullptr : password_.c_str();

    if (useTls) {
        ssl_opts.trustStore = optionalPath(tlsConfig_.caPath);       // Root CA certificate (.pem)
        ssl_opts.keyStore = optionalPath(tlsConfig_.certPath);       // Client certificate (.pem)
        ssl_opts.privateKey = optionalPath(tlsConfig_.keyPath);      // Private key (.pem)
        ssl_opts.enableServerCertAuth = tlsConfig_.verifyServer ? 1 : 0;
        ssl_opts.verify = tlsConfig_.verifyServer ? 1 : 0;
        ssl_opts.enabledCipherSuites = nullptr;  // Use default cipher suites
        ssl_opts.sslVersion = MQTT_SSL_VERSION_TLS_1_2;
        conn_opts.ssl = &ssl_opts;
    }

    rc = MQTTAsync_connect(client_, &conn_opts);
    if (rc != MQTTASYNC_SUCCESS) {
        std::cerr << "[MQTT] Connection attempt failed, error code: " << rc << std::endl;
        return false;
    }
    return true;
}

void PahoMqttClient::destroyClient() {
    if (!client_) {
        return;
    }
    if (MQTTAsync_isConnected(client_)) {
        MQTTAsync_disconnectOptions disc_opts = MQTTAsync_disconnectOptions_initializer;
        disc_opts.timeout = kDisconnectTimeoutMs;
        MQTTAsync_disconnect(client_, &disc_opts);
    }
    connected_ = false;
    MQTTAsync_destroy(&client_);
    client_ = nullptr;
    failPendingDeliveries();
}

void PahoMqttClient::disconnect() {
    if (client_ && connected_) {
        MQTTAsync_disconnectOptions disc_opts = MQTTAsync_disconnectOptions_initializer;
        disc_opts.timeout = kDisconnectTimeoutMs;
        disc_opts.onSuccess = onDisconnected;
        disc_opts.context = this;

        int rc = MQTTAsync_disconnect(client_, &disc_opts);
        if (rc != MQTTASYNC_SUCCESS) {
            std::cerr << "[MQTT] Disconnect request failed, error code: " << rc << std::endl;
        }
    }
    connected_ = false;
    failPendingDeliveries();
}

bool PahoMqttClient::isConnected() const {
    return connected_;
}

bool PahoMqttClient::publish(const std::string& topic, const std::string& payload,
                           int qos, bool retained) {
    if (!client_ || !connected_) {
        return false;
    }

    MQTTAsync_message pubmsg = MQTTAsync_message_initializer;
    MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;

    pubmsg.payload = const_cast<void*>(static_cast<const void*>(payload.c_str()));
    pubmsg.payloadlen = static_cast<int>(payload.length());
    pubmsg.qos = qos;
    pubmsg.retained = retained ? 1 : 0;

    int rc = MQTTAsync_sendMessage(client_, topic.c_str(), &pubmsg, &opts);
    if (rc != MQTTASYNC_SUCCESS) {
        std::cerr << "[MQTT] Publish to " << topic << " failed, error code: " << rc << std::endl;
        return false;
    }
    return true;
}

bool PahoMqttClient::publishWithAck(const std::string& topic, const std::string& payload,
                                   int qos, DeliveryCallback onDelivery) {
    if (!client_ || !connected_) {
        return false;
    }

    MQTTAsync_message pubmsg = MQTTAsync_message_initializer;
    MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;

    pubmsg.payload = const_cast<void*>(static_cast<const void*>(payload.c_str()));
    pubmsg.payloadlen = static_cast<int>(payload.length());
    pubmsg.qos = qos;
    pubmsg.retained = 0;

    opts.onSuccess = onPublishSuccess;
    opts.onFailure = onPublishFailure;
    opts.context = this;

    int rc = MQTTAsync_sendMessage(client_, topic.c_str(), &pubmsg, &opts);
    if (rc != MQTTASYNC_SUCCESS) {
        std::cerr << "[MQTT] Publish to " << topic << " failed, error code: " << rc << std::endl;
        return false;
    }

    // The acknowledgement can arrive on the Paho thread before we get here
    std::optional<bool> early;
    {
        std::lock_guard<std::mutex> lock(deliveryMutex_);
        auto it = earlyDeliveries_.find(opts.token);
        if (it != earlyDeliveries_.end()) {
            early = it->second;
            earlyDeliveries_.erase(it);
        } else {
            pendingDeliveries_[opts.token] = std::move(onDelivery);
        }
    }
    if (early && onDelivery) {
        onDelivery(*early);
    }
    return true;
}

bool PahoMqttClient::subscribe(const std::string& topic, int qos) {
    if (!client_ || !connected_) {
        return false;
    }

    MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;

    int rc = MQTTAsync_subscribe(client_, topic.c_str(), qos, &opts);
    return rc == MQTTASYNC_SUCCESS;
}

void PahoMqttClient::setMessageCallback(MessageCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    messageCallback_ = std::move(callback);
}

void PahoMqttClient::setConnectionCallback(ConnectionCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    connectionCallback_ = std::move(callback);
}

PahoMqttClient::MessageCallback PahoMqttClient::messageCallback() {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    return messageCallback_;
}

PahoMqttClient::ConnectionCallback PahoMqttClient::connectionCallback() {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    return connectionCallback_;
}

void PahoMqttClient::notifyConnection(bool connected, int code, const std::string& reason) {
    // Called outside callbackMutex_
    ConnectionCallback callback = connectionCallback();
    if (callback) {
        callback(connected, code, reason);
    }
}

void PahoMqttClient::completeDelivery(MQTTAsync_token token, bool delivered) {
    DeliveryCallback callback;
    {
        std::lock_guard<std::mutex> lock(deliveryMutex_);
        auto it = pendingDeliveries_.find(token);
        if (it == pendingDeliveries_.end()) {
            earlyDeliveries_[token] = delivered;
            return;
        }
        callback = std::move(it->second);
        pendingDeliveries_.erase(it);
    }
    if (callback) {
        callback(delivered);
    }
}

void PahoMqttClient::failPendingDeliveries() {
    std::vector<DeliveryCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(deliveryMutex_);
        for (auto& [token, callback] : pendingDeliveries_) {
            callbacks.push_back(std::move(callback));
        }
        pendingDeliveries_.clear();
        earlyDeliveries_.clear();
    }
    for (auto& callback : callbacks) {
        if (callback) {
            callback(false);
        }
    }
}

int PahoMqttClient::messageArrived(void* context, char* topicName, int topicLen, MQTTAsync_message* message) {
    auto* client = static_cast<PahoMqttClient*>(context);

    MessageCallback callback = client->messageCallback();
    if (callback) {
        MqttMessage msg;
        msg.topic = topicLen > 0 ? std::string(topicName, topicLen) : std::string(topicName);
        msg.payload = std::string(static_cast<char*>(message->payload), message->payloadlen);
        msg.qos = message->qos;
        msg.retained = message->retained != 0;

        callback(msg);
    }

    MQTTAsync_freeMessage(&message);
    MQTTAsync_free(topicName);
    return 1;
}

void PahoMqttClient::onConnected(void* context, MQTTAsync_successData* response) {
    (void)response;

    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_ = true;

    client->notifyConnection(true, connack::kAccepted, "Connected successfully");
}

void PahoMqttClient::onConnectFailure(void* context, MQTTAsync_failureData* response) {
    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_ = false;

    int code = connack::kTransportError;
    std::string reason = "Connection failed";
    if (response) {
        // Positive codes come straight from a refusing CONNACK
        if (response->code >= connack::kProtocolMismatch && response->code <= connack::kNotAuthorized) {
            code = response->code;
        }
        reason = "return code " + std::to_string(response->code);
        if (response->message) {
            reason += " (" + std::string(response->message) + ")";
        }
    }

    client->notifyConnection(false, code, reason);
}

void PahoMqttClient::connectionLost(void* context, char* cause) {
    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_ = false;
    client->failPendingDeliveries();

    std::string reason = cause ? std::string(cause) : "Connection lost";
    client->notifyConnection(false, connack::kTransportError, reason);
}

void PahoMqttClient::onDisconnected(void* context, MQTTAsync_successData* response) {
    (void)response;

    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_ = false;
}

void PahoMqttClient::onPublishSuccess(void* context, MQTTAsync_successData* response) {
    auto* client = static_cast<PahoMqttClient*>(context);
    if (response) {
        client->completeDelivery(response->token, true);
    }
}

void PahoMqttClient::onPublishFailure(void* context, MQTTAsync_failureData* response) {
    auto* client = static_cast<PahoMqttClient*>(context);
    if (response) {
        std::cerr << "[MQTT] Delivery failed, error code: " << response->code << std::endl;
        client->completeDelivery(response->token, false);
    }
}

bool PahoMqttClient::validateCertificateFiles(const TlsConfig& tlsConfig) const {
    const std::pair<const char*, const std::string*> files[] = {
        {"CA file", &tlsConfig.caPath},
        {"Certificate file", &tlsConfig.certPath},
        {"Private key file", &tlsConfig.keyPath},
    };

    for (const auto& [label, path] : files) {
        if (path->empty()) {
            continue;
        }
        std::ifstream file(*path);
        if (!file.good()) {
            std::cerr << "[MQTT] ERROR: " << label << " not found: " << *path << std::endl;
            return false;
        }
    }

    if (tlsConfig.certPath.empty() != tlsConfig.keyPath.empty()) {
        std::cerr << "[MQTT] ERROR: Client certificate and private key must be given together" << std::endl;
        return false;
    }
    return true;
}

} // namespace metersim

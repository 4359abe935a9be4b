#include <gtest/gtest.h>
#include "../core/adapters/DefaultPolicies.hpp"
#include "../core/domain/UplinkSession.hpp"
#include "../core/sim/InMemoryStores.hpp"
#include "../core/sim/MockMqttClient.hpp"
#include "../core/sim/SimulatedClock.hpp"
#include <functional>
#include <memory>
#include <thread>
#include <vector>

using namespace metersim;
using namespace std::chrono_literals;

using Behavior = sim::MockMqttClient::ConnectBehavior;

namespace {

bool waitUntil(const std::function<bool()>& condition, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!condition()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(5ms);
    }
    return true;
}

// Widens the gap between the ledger check and the registration publish
class SlowLookupLedger : public sim::InMemoryRegistrationLedger {
public:
    std::optional<ports::RegistrationInfo> lookup(const std::string& deviceId) const override {
        std::this_thread::sleep_for(20ms);
        return sim::InMemoryRegistrationLedger::lookup(deviceId);
    }
};

} // namespace

class UplinkSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_.enabled = true;
        settings_.brokerHost = "mqtt.example.com";
        settings_.tenant = "t100";
        settings_.username = "device_user";
        settings_.password = "secret";

        options_.connectTimeout = 200ms;
        options_.ackTimeout = 200ms;
        options_.heartbeatInterval = 1h;
        options_.restartDelay = 20ms;
        options_.retryPolicy = std::make_shared<adapters::ExponentialBackoffRetryPolicy>(10ms, 2.0, 50ms, 50);
    }

    std::unique_ptr<domain::UplinkSession> makeSession(const std::string& deviceId = "pv001") {
        return std::make_unique<domain::UplinkSession>(deviceId, settings_, client_, ledger_, clock_, options_);
    }

    MeasurementSample sample() const {
        MeasurementSample s;
        s.deviceId = "pv001";
        s.timestamp = clock_.iso8601();
        s.voltage = 231.5;
        s.current = 9.75;
        s.power = 2257.13;
        s.kwh = 0.42;
        return s;
    }

    sim::MockMqttClient client_;
    sim::InMemoryRegistrationLedger ledger_;
    sim::SimulatedClock clock_;
    UplinkSettings settings_;
    domain::UplinkOptions options_;
};

TEST_F(UplinkSessionTest, ConnectUsesTenantCredentials) {
    auto session = makeSession();

    EXPECT_TRUE(session->connect());
    EXPECT_TRUE(session->isConnected());
    EXPECT_EQ(session->connectionState(), domain::ConnectionState::Connected);
    EXPECT_EQ(session->lastConnectFailure(), domain::ConnectFailure::None);

    EXPECT_EQ(client_.lastHost(), "mqtt.example.com");
    EXPECT_EQ(client_.lastPort(), 1883);
    EXPECT_EQ(client_.lastUsername(), "t100/device_user");
    EXPECT_EQ(client_.lastClientId(), "pv001_1735689600");
    EXPECT_FALSE(client_.lastUsedTls());
}

TEST_F(UplinkSessionTest, TlsMovesToSecurePort) {
    settings_.useSsl = true;
    settings_.caCertPath = "/etc/ssl/ca.pem";
    settings_.clientCertPath = "/etc/ssl/dev.crt";
    settings_.clientKeyPath = "/etc/ssl/dev.key";
    auto session = makeSession();

    EXPECT_TRUE(session->connect());
    EXPECT_TRUE(client_.lastUsedTls());
    EXPECT_EQ(client_.lastPort(), 8883);
    EXPECT_EQ(client_.lastTlsConfig().caPath, "/etc/ssl/ca.pem");
    EXPECT_EQ(client_.lastTlsConfig().certPath, "/etc/ssl/dev.crt");
    EXPECT_EQ(client_.lastTlsConfig().keyPath, "/etc/ssl/dev.key");
}

TEST_F(UplinkSessionTest, RejectionReportsReason) {
    client_.setConnectBehavior(Behavior::Reject, connack::kNotAuthorized);
    auto session = makeSession();

    EXPECT_FALSE(session->connect());
    EXPECT_EQ(session->lastConnectFailure(), domain::ConnectFailure::NotAuthorized);
    EXPECT_EQ(session->connectionState(), domain::ConnectionState::Disconnected);
    EXPECT_FALSE(session->isReconnecting());
}

TEST_F(UplinkSessionTest, SilentBrokerTimesOut) {
    client_.setConnectBehavior(Behavior::Silent);
    options_.connectTimeout = 100ms;
    auto session = makeSession();

    const auto started = std::chrono::steady_clock::now();
    EXPECT_FALSE(session->connect());
    EXPECT_GE(std::chrono::steady_clock::now() - started, 100ms);
    EXPECT_EQ(session->lastConnectFailure(), domain::ConnectFailure::Timeout);
    EXPECT_GE(client_.disconnectCalls(), 1);
}

TEST_F(UplinkSessionTest, StartFailureIsTransportError) {
    client_.setConnectBehavior(Behavior::FailStart);
    auto session = makeSession();

    EXPECT_FALSE(session->connect());
    EXPECT_EQ(session->lastConnectFailure(), domain::ConnectFailure::TransportError);
}

TEST_F(UplinkSessionTest, ReturnCodesMapToFailures) {
    EXPECT_EQ(domain::connectFailureFromReturnCode(connack::kProtocolMismatch), domain::ConnectFailure::ProtocolMismatch);
    EXPECT_EQ(domain::connectFailureFromReturnCode(connack::kIdentifierRejected), domain::ConnectFailure::BadIdentifier);
    EXPECT_EQ(domain::connectFailureFromReturnCode(connack::kServerUnavailable), domain::ConnectFailure::ServerUnavailable);
    EXPECT_EQ(domain::connectFailureFromReturnCode(connack::kBadCredentials), domain::ConnectFailure::BadCredentials);
    EXPECT_EQ(domain::connectFailureFromReturnCode(connack::kTransportError), domain::ConnectFailure::TransportError);
}

TEST_F(UplinkSessionTest, RegistersOnceWithoutForce) {
    auto session = makeSession();
    ASSERT_TRUE(session->connect());

    EXPECT_TRUE(session->registerDevice("PV", "iot_sim_pv001"));
    EXPECT_TRUE(session->registerDevice("PV", "iot_sim_pv001"));
    EXPECT_TRUE(session->isRegistered());

    auto registrations = client_.publishedWithPrefix("100,");
    ASSERT_EQ(registrations.size(), 1u);
    EXPECT_EQ(registrations[0].topic, "s/us");
    EXPECT_EQ(registrations[0].payload, "100,iot_sim_pv001,PV");
    EXPECT_EQ(registrations[0].qos, 1);
    EXPECT_EQ(ledger_.recordCount(), 1);
    EXPECT_EQ(ledger_.lookup("pv001")->deviceName, "iot_sim_pv001");

    auto subscriptions = client_.subscriptions();
    ASSERT_FALSE(subscriptions.empty());
    EXPECT_EQ(subscriptions.back(), "s/ds");

    EXPECT_TRUE(session->registerDevice("PV", "iot_sim_pv001", true));
    EXPECT_EQ(client_.publishedWithPrefix("100,").size(), 2u);
}

TEST_F(UplinkSessionTest, LedgerShortCircuitsRegistration) {
    ports::RegistrationInfo info;
    info.registered = true;
    info.deviceName = "iot_sim_pv001";
    ledger_.record("pv001", info);

    auto session = makeSession();
    ASSERT_TRUE(session->connect());

    EXPECT_TRUE(session->registerDevice("PV", "iot_sim_pv001"));
    EXPECT_TRUE(client_.publishedWithPrefix("100,").empty());
    EXPECT_TRUE(session->isRegistered());
    EXPECT_EQ(client_.subscriptions().size(), 1u);
}

TEST_F(UplinkSessionTest, UnacknowledgedRegistrationFails) {
    client_.setAckDeliveries(false);
    options_.ackTimeout = 50ms;
    auto session = makeSession();
    ASSERT_TRUE(session->connect());

    EXPECT_FALSE(session->registerDevice("PV", "iot_sim_pv001"));
    EXPECT_FALSE(session->isRegistered());
    EXPECT_EQ(ledger_.recordCount(), 0);
}

TEST_F(UplinkSessionTest, ConcurrentRegistrationsPublishOnce) {
    SlowLookupLedger ledger;
    domain::UplinkSession session("pv001", settings_, client_, ledger, clock_, options_);
    ASSERT_TRUE(session.connect());

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&session] { session.registerDevice("PV", "iot_sim_pv001"); });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_TRUE(session.isRegistered());
    EXPECT_EQ(client_.publishedWithPrefix("100,").size(), 1u);
    EXPECT_EQ(ledger.recordCount(), 1);
}

TEST_F(UplinkSessionTest, RegisterRequiresConnection) {
    auto session = makeSession();
    EXPECT_FALSE(session->registerDevice("PV", "iot_sim_pv001"));
    EXPECT_TRUE(client_.publishedMessages().empty());
}

TEST_F(UplinkSessionTest, MeasurementIsOnePublish) {
    auto session = makeSession();
    ASSERT_TRUE(session->connect());

    EXPECT_TRUE(session->sendMeasurement(sample()));

    auto messages = client_.publishedMessages();
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0].topic, "s/us");
    EXPECT_EQ(messages[0].qos, 0);
    EXPECT_EQ(messages[0].payload, SmartRestCodec::measurement(sample()));
    ASSERT_TRUE(session->lastMessageAt().has_value());
    EXPECT_TRUE(*session->lastMessageAt() == clock_.now());
}

TEST_F(UplinkSessionTest, MeasurementWhileDisconnectedIsDropped) {
    auto session = makeSession();
    EXPECT_FALSE(session->sendMeasurement(sample()));
    EXPECT_TRUE(client_.publishedMessages().empty());
    EXPECT_EQ(client_.connectAttempts(), 0);
}

TEST_F(UplinkSessionTest, ReconnectOnSendTriesInline) {
    options_.reconnectOnSend = true;
    auto session = makeSession();

    EXPECT_TRUE(session->sendMeasurement(sample()));
    EXPECT_EQ(client_.connectAttempts(), 1);
    EXPECT_EQ(client_.publishedWithPrefix("200,").size(), 1u);
}

TEST_F(UplinkSessionTest, AlarmUsesSeverityCode) {
    auto session = makeSession();
    ASSERT_TRUE(session->connect());

    EXPECT_TRUE(session->sendAlarm("c8y_OverVoltage", "Voltage above range", AlarmSeverity::Major));
    EXPECT_EQ(client_.publishedWithPrefix("302,c8y_OverVoltage,Voltage above range").size(), 1u);
}

TEST_F(UplinkSessionTest, RestartCommandIsAcknowledged) {
    auto session = makeSession();
    ASSERT_TRUE(session->connect());
    ASSERT_TRUE(session->registerDevice("PV", "iot_sim_pv001"));
    client_.clearPublishedMessages();

    client_.injectMessage("s/ds", "510,iot_sim_pv001");

    ASSERT_TRUE(client_.waitForPublished("503,", 1, 2s));
    auto messages = client_.publishedMessages();
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[0].payload, "501,c8y_Restart");
    EXPECT_EQ(messages[1].payload, "503,c8y_Restart");
    EXPECT_TRUE(session->isConnected());
}

TEST_F(UplinkSessionTest, OverlappingRestartIsIgnored) {
    options_.restartDelay = 300ms;
    auto session = makeSession();
    ASSERT_TRUE(session->connect());

    client_.injectMessage("s/ds", "510,iot_sim_pv001");
    ASSERT_TRUE(client_.waitForPublished("501,", 1, 2s));
    client_.injectMessage("s/ds", "510,iot_sim_pv001");
    client_.injectMessage("other/topic", "510,iot_sim_pv001");

    ASSERT_TRUE(client_.waitForPublished("503,", 1, 2s));
    EXPECT_EQ(client_.publishedWithPrefix("501,").size(), 1u);
}

TEST_F(UplinkSessionTest, ReconnectsAfterConnectionLoss) {
    auto session = makeSession();
    ASSERT_TRUE(session->connect());
    ASSERT_TRUE(session->registerDevice("PV", "iot_sim_pv001"));

    client_.simulateConnectionLoss();

    ASSERT_TRUE(client_.waitForConnectAttempts(2, 2s));
    ASSERT_TRUE(waitUntil([&] { return session->isConnected() && !session->isReconnecting(); }, 2s));
    EXPECT_TRUE(waitUntil([&] { return session->isRegistered(); }, 2s));
    EXPECT_EQ(session->reconnectAttempts(), 0);

    // The ledger remembers the first registration
    EXPECT_EQ(client_.publishedWithPrefix("100,").size(), 1u);
    EXPECT_GE(client_.subscriptions().size(), 2u);
}

TEST_F(UplinkSessionTest, ReconnectionGivesUpAfterMaxAttempts) {
    options_.retryPolicy = std::make_shared<adapters::ExponentialBackoffRetryPolicy>(5ms, 2.0, 20ms, 3);
    auto session = makeSession();
    ASSERT_TRUE(session->connect());

    client_.setConnectBehavior(Behavior::Reject, connack::kServerUnavailable);
    client_.simulateConnectionLoss();

    ASSERT_TRUE(waitUntil([&] { return !session->autoReconnectEnabled(); }, 2s));
    EXPECT_TRUE(waitUntil([&] { return !session->isReconnecting(); }, 1s));
    EXPECT_EQ(client_.connectAttempts(), 1 + 3);
    EXPECT_EQ(session->lastConnectFailure(), domain::ConnectFailure::ServerUnavailable);

    // An explicit connect re-enables automatic reconnection
    client_.setConnectBehavior(Behavior::Accept);
    EXPECT_TRUE(session->connect());
    EXPECT_TRUE(session->autoReconnectEnabled());
}

TEST_F(UplinkSessionTest, HeartbeatWhenIdle) {
    options_.heartbeatInterval = 50ms;
    auto session = makeSession();
    ASSERT_TRUE(session->connect());

    ASSERT_TRUE(client_.waitForPublished("400,c8y_Heartbeat,Device heartbeat", 1, 2s));
    EXPECT_TRUE(waitUntil([&] { return session->lastHeartbeatAt().has_value(); }, 1s));
}

TEST_F(UplinkSessionTest, RecentTrafficSuppressesHeartbeat) {
    options_.heartbeatInterval = 50ms;
    auto session = makeSession();
    ASSERT_TRUE(session->connect());
    ASSERT_TRUE(session->sendMeasurement(sample()));

    // The simulated clock is frozen, so the measurement stays recent
    std::this_thread::sleep_for(200ms);
    EXPECT_TRUE(client_.publishedWithPrefix("400,").empty());
}

TEST_F(UplinkSessionTest, DisconnectDisablesReconnect) {
    auto session = makeSession();
    ASSERT_TRUE(session->connect());

    session->disconnect();
    EXPECT_FALSE(session->autoReconnectEnabled());
    EXPECT_FALSE(session->isConnected());
    EXPECT_FALSE(session->isRegistered());
    EXPECT_EQ(client_.disconnectCalls(), 1);

    client_.simulateConnectionLoss();
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(client_.connectAttempts(), 1);
    EXPECT_FALSE(session->sendMeasurement(sample()));
}

TEST_F(UplinkSessionTest, StartRetriesUnreachableBrokerInBackground) {
    client_.setConnectBehavior(Behavior::Silent);
    options_.connectTimeout = 50ms;
    auto session = makeSession();

    EXPECT_FALSE(session->start("PV", "iot_sim_pv001"));
    EXPECT_FALSE(session->isConnected());

    client_.setConnectBehavior(Behavior::Accept);
    ASSERT_TRUE(waitUntil([&] { return session->isRegistered(); }, 3s));
    EXPECT_EQ(client_.publishedWithPrefix("100,iot_sim_pv001,PV").size(), 1u);
}

TEST_F(UplinkSessionTest, StartDoesNotRetryRejection) {
    client_.setConnectBehavior(Behavior::Reject, connack::kBadCredentials);
    auto session = makeSession();

    EXPECT_FALSE(session->start("PV", "iot_sim_pv001"));
    EXPECT_EQ(session->lastConnectFailure(), domain::ConnectFailure::BadCredentials);
    EXPECT_FALSE(session->isReconnecting());
    EXPECT_EQ(client_.connectAttempts(), 1);
}

TEST_F(UplinkSessionTest, StartRegistersWhenReachable) {
    auto session = makeSession("heatpump001");
    EXPECT_TRUE(session->start("Heat Pump", "iot_sim_heatpump001"));
    EXPECT_EQ(client_.publishedWithPrefix("100,iot_sim_heatpump001,Heat Pump").size(), 1u);
}

TEST_F(UplinkSessionTest, EmptyDeviceIdIsRejected) {
    EXPECT_THROW(makeSession(""), std::invalid_argument);
}

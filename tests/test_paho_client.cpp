#include <gtest/gtest.h>
#include "../net/mqtt/PahoMqttClient.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <thread>

using namespace metersim;
using namespace std::chrono_literals;

namespace {

bool waitUntil(const std::function<bool()>& condition, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!condition()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(10ms);
    }
    return true;
}

// Port 1 on loopback has no listener, so the connect is refused
constexpr const char* kClosedHost = "127.0.0.1";
constexpr std::uint16_t kClosedPort = 1;

} // namespace

TEST(PahoMqttClientTest, OperationsFailWithoutConnection) {
    PahoMqttClient client;

    EXPECT_FALSE(client.isConnected());
    EXPECT_FALSE(client.publish("s/us", "400", 1, false));
    EXPECT_FALSE(client.subscribe("s/ds", 1));
    client.disconnect();
    EXPECT_FALSE(client.isConnected());
}

TEST(PahoMqttClientTest, RefusedConnectReportedThroughCallback) {
    PahoMqttClient client;
    std::atomic<int> failures{0};
    std::atomic<int> code{0};
    client.setConnectionCallback([&](bool connected, int returnCode, const std::string&) {
        if (!connected) {
            code = returnCode;
            ++failures;
        }
    });

    ASSERT_TRUE(client.connect(kClosedHost, kClosedPort, "metersim_test", "", ""));
    ASSERT_TRUE(waitUntil([&] { return failures.load() > 0; }, 15s));
    EXPECT_EQ(code.load(), connack::kTransportError);
    EXPECT_FALSE(client.isConnected());
}

TEST(PahoMqttClientTest, CallbacksReplacedWhileConnectFails) {
    PahoMqttClient client;
    std::atomic<int> failures{0};
    auto counting = [&](bool connected, int, const std::string&) {
        if (!connected) {
            ++failures;
        }
    };
    auto countingAgain = [&](bool connected, int, const std::string&) {
        if (!connected) {
            ++failures;
        }
    };
    client.setConnectionCallback(counting);

    ASSERT_TRUE(client.connect(kClosedHost, kClosedPort, "metersim_test", "", ""));

    // Swap the callbacks from this thread while Paho reports the failure on its own
    std::atomic<bool> done{false};
    std::thread swapper([&] {
        while (!done) {
            client.setConnectionCallback(countingAgain);
            client.setMessageCallback(nullptr);
            client.setConnectionCallback(counting);
            client.setMessageCallback([](const MqttMessage&) {});
        }
    });

    bool reported = waitUntil([&] { return failures.load() > 0; }, 15s);
    done = true;
    swapper.join();

    EXPECT_TRUE(reported);
    client.setConnectionCallback(nullptr);
    client.setMessageCallback(nullptr);
}

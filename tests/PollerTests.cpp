// PollerTests.cpp
// Background status polling: change-only notification, one fetch per device,
// and dropping results that no longer belong to a registered device.

#include <gtest/gtest.h>

#include "controller/Poller.hpp"
#include "TestDoubles.hpp"

#include <atomic>

using namespace openfan::controller;
using namespace std::chrono_literals;
using openfan::test::eventually;
using openfan::test::FakeHttpClient;

class PollerTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry = std::make_shared<DeviceRegistry>();
        client = std::make_shared<FakeHttpClient>();
        device = std::make_shared<Device>("AB12", "AB12", "10.0.0.5", 80, client);
        registry->add(device);
        registry->subscribe([this](const DeviceEvent& ev) {
            if (ev.type == DeviceEvent::Type::StateChanged) ++stateChanged;
        });
    }

    std::shared_ptr<DeviceRegistry> registry;
    std::shared_ptr<FakeHttpClient> client;
    std::shared_ptr<Device> device;
    std::atomic<int> stateChanged{0};
};

//==============================================================================
// Diffing
//==============================================================================

TEST_F(PollerTest, ChangedReadingUpdatesDeviceAndNotifies) {
    client->setReading(1400, 55);
    Poller poller(registry, 20ms);
    poller.startUpdates();

    ASSERT_TRUE(eventually([&] { return stateChanged.load() >= 1; }));
    poller.stopUpdates();

    auto st = device->state();
    EXPECT_TRUE(st.isOn);
    EXPECT_EQ(st.speedPercent, 55);
    EXPECT_EQ(st.rpm, 1400);
}

TEST_F(PollerTest, IdenticalReadingsNotifyOnlyOnce) {
    client->setReading(1400, 55);
    Poller poller(registry, 10ms);
    poller.startUpdates();

    ASSERT_TRUE(eventually([&] { return client->statusRequests() >= 6; }));
    poller.stopUpdates();
    EXPECT_EQ(stateChanged.load(), 1);
}

TEST_F(PollerTest, ReadingEqualToCachedStateIsSilent) {
    // device starts at 0/0 and the fan reports 0/0
    Poller poller(registry, 10ms);
    poller.startUpdates();
    ASSERT_TRUE(eventually([&] { return client->statusRequests() >= 3; }));
    poller.stopUpdates();
    EXPECT_EQ(stateChanged.load(), 0);
}

TEST_F(PollerTest, FailedFetchLeavesStateAlone) {
    client->setFailure(FakeHttpClient::Failure::HttpError);
    Poller poller(registry, 10ms);
    poller.startUpdates();
    ASSERT_TRUE(eventually([&] { return client->statusRequests() >= 3; }));
    poller.stopUpdates();
    EXPECT_EQ(stateChanged.load(), 0);
    EXPECT_EQ(device->state().speedPercent, 0);
}

//==============================================================================
// Scheduling
//==============================================================================

TEST_F(PollerTest, AtMostOneOutstandingFetchPerDevice) {
    client->setDelay(60ms);
    Poller poller(registry, 1ms);
    poller.startUpdates();
    std::this_thread::sleep_for(400ms);
    poller.stopUpdates();

    EXPECT_EQ(client->maxConcurrent(), 1);
    EXPECT_GE(client->statusRequests(), 2u);
    // 400ms / 60ms per fetch bounds the count when ticks skip busy devices
    EXPECT_LE(client->statusRequests(), 8u);
}

TEST_F(PollerTest, PollNowBypassesInterval) {
    Poller poller(registry, 60s);
    poller.startUpdates();
    ASSERT_TRUE(eventually([&] { return client->statusRequests() >= 1; }));
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(client->statusRequests(), 1u);

    poller.pollNow();
    EXPECT_TRUE(eventually([&] { return client->statusRequests() >= 2; }));
    poller.stopUpdates();
}

TEST_F(PollerTest, SetIntervalWhileRunning) {
    Poller poller(registry, 60s);
    poller.startUpdates();
    ASSERT_TRUE(eventually([&] { return client->statusRequests() >= 1; }));

    poller.setInterval(10ms);
    EXPECT_EQ(poller.interval(), 10ms);
    EXPECT_TRUE(eventually([&] { return client->statusRequests() >= 4; }));
    poller.stopUpdates();
}

//==============================================================================
// Lifecycle / stale results
//==============================================================================

TEST_F(PollerTest, StopIsSafeWhenNotRunning) {
    Poller poller(registry);
    EXPECT_FALSE(poller.isRunning());
    poller.stopUpdates();
    poller.startUpdates();
    EXPECT_TRUE(poller.isRunning());
    poller.stopUpdates();
    poller.stopUpdates();
    EXPECT_FALSE(poller.isRunning());
}

TEST_F(PollerTest, ResultsAfterStopAreDropped) {
    client->block();
    client->setReading(1000, 40);
    Poller poller(registry, 10ms);
    poller.startUpdates();
    ASSERT_TRUE(client->waitForRequests(1, 2s));

    std::thread releaser([&] {
        std::this_thread::sleep_for(50ms);
        client->release();
    });
    poller.stopUpdates();
    releaser.join();

    EXPECT_EQ(stateChanged.load(), 0);
    EXPECT_EQ(device->state().speedPercent, 0);
}

TEST_F(PollerTest, ResultForReplacedDeviceIsDropped) {
    client->block();
    client->setReading(1000, 40);
    Poller poller(registry, 10ms);
    poller.startUpdates();
    ASSERT_TRUE(client->waitForRequests(1, 2s));

    // same serial, new Device, different fan behind it
    auto otherClient = std::make_shared<FakeHttpClient>("10.0.0.6", 80);
    registry->remove("AB12");
    auto replacement = std::make_shared<Device>("AB12", "AB12", "10.0.0.6", 80, otherClient);
    registry->add(replacement);

    client->release();
    std::this_thread::sleep_for(100ms);
    poller.stopUpdates();

    EXPECT_EQ(device->state().speedPercent, 0);
    EXPECT_EQ(replacement->state().speedPercent, 0);
    EXPECT_EQ(stateChanged.load(), 0);
}

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "unit/core/fake_channel.hpp"
#include "devmux/core/device_aggregate.h"
#include "devmux/core/device_store.h"
#include "devmux/utils/clock.hpp"
#include <filesystem>
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace devmux::core;
using ::testing::_;
using ::testing::ElementsAre;
using ::testing::Field;
using ::testing::IsEmpty;
using ::testing::NiceMock;
using ::testing::Ref;
using ::testing::UnorderedElementsAre;

class DeviceAggregateTest : public ::testing::Test {
protected:
    void SetUp() override {
        device = DeviceAggregate::create("device-1", std::make_shared<ImmediateDispatcher>());
        observer = std::make_shared<NiceMock<MockDeviceObserver>>();
        device->setObserver(observer);
    }

    std::shared_ptr<FakeChannel> addChannel(const std::string& type, bool connectable = true) {
        auto channel = FakeChannel::make(type, type + "-id", connectable);
        EXPECT_TRUE(device->addChannel(channel));
        return channel;
    }

    std::shared_ptr<DeviceAggregate> device;
    std::shared_ptr<NiceMock<MockDeviceObserver>> observer;
};

// Channel management

TEST_F(DeviceAggregateTest, DuplicateChannelTypeKeepsFirst) {
    auto first = addChannel("DIAL");
    auto second = FakeChannel::make("DIAL", "other-id");

    EXPECT_FALSE(device->addChannel(second));

    ASSERT_EQ(device->channels().size(), 1u);
    EXPECT_EQ(device->channel("DIAL"), first);
}

TEST_F(DeviceAggregateTest, RemoveAbsentChannelIsNoOp) {
    addChannel("DIAL");
    device->removeChannel("AirPlay");
    EXPECT_EQ(device->channels().size(), 1u);

    device->removeChannel("DIAL");
    EXPECT_FALSE(device->hasChannels());
}

TEST_F(DeviceAggregateTest, MetadataFromFirstChannelThatSuppliesIt) {
    auto dial = FakeChannel::make("DIAL", "dial-id");
    dial->description()->modelName = "Stick";
    auto webos = FakeChannel::make("webOS TV", "webos-id");
    webos->description()->friendlyName = "Living Room";
    webos->description()->modelName = "OLED";

    device->setFriendlyName("Stored Name");
    EXPECT_EQ(device->friendlyName(), "Stored Name");

    device->addChannel(dial);
    device->addChannel(webos);

    EXPECT_EQ(device->friendlyName(), "Living Room");
    EXPECT_EQ(device->modelName(), "Stick");
}

// Capabilities

TEST_F(DeviceAggregateTest, CapabilitiesAreTheUnion) {
    auto a = addChannel("A");
    auto b = addChannel("B");
    a->capabilities().addAll({"Launcher.App", "MediaControl.Play"});
    b->capabilities().addAll({"MediaControl.Play", "VolumeControl.Set"});

    EXPECT_THAT(device->capabilities(),
                UnorderedElementsAre("Launcher.App", "MediaControl.Play", "VolumeControl.Set"));
    EXPECT_TRUE(device->hasCapability("Launcher.App.Any"));
    EXPECT_TRUE(device->hasCapabilities({"Launcher.App", "VolumeControl.Set"}));
    EXPECT_FALSE(device->hasCapabilities({"Launcher.App", "PowerControl.Off"}));
    EXPECT_TRUE(device->hasAnyCapability({"PowerControl.Off", "MediaControl.Any"}));
}

TEST_F(DeviceAggregateTest, CapabilityDeltasAreUnionDeltas) {
    auto a = addChannel("A");
    auto b = addChannel("B");
    a->capabilities().add("MediaControl.Play");

    // Already offered by A
    EXPECT_CALL(*observer, onCapabilitiesChanged(_, _, _)).Times(0);
    b->capabilities().add("MediaControl.Play");
    a->capabilities().remove("MediaControl.Play");
    ::testing::Mock::VerifyAndClearExpectations(observer.get());

    EXPECT_CALL(*observer, onCapabilitiesChanged(Ref(*device), IsEmpty(), ElementsAre("MediaControl.Play")));
    b->capabilities().remove("MediaControl.Play");
}

TEST_F(DeviceAggregateTest, AddingChannelReportsItsNewCapabilities) {
    auto a = addChannel("A");
    a->capabilities().add("Launcher.App");

    auto b = FakeChannel::make("B", "b-id");
    b->capabilities().addAll({"Launcher.App", "ToastControl.Show"});

    EXPECT_CALL(*observer, onCapabilitiesChanged(Ref(*device), ElementsAre("ToastControl.Show"), IsEmpty()));
    device->addChannel(b);

    EXPECT_CALL(*observer, onCapabilitiesChanged(Ref(*device), IsEmpty(), ElementsAre("ToastControl.Show")));
    device->removeChannel("B");
}

TEST_F(DeviceAggregateTest, ResolutionPicksHighestPriority) {
    auto a = addChannel("A");
    auto b = addChannel("B");
    a->setCapabilityPriority(CapabilityFamily::MediaControl, 1);
    b->setCapabilityPriority(CapabilityFamily::MediaControl, 2);
    a->capabilities().add("MediaControl.Play");
    b->capabilities().add("MediaControl.Pause");

    EXPECT_EQ(device->channelFor(CapabilityFamily::MediaControl), b);

    device->removeChannel("B");
    EXPECT_EQ(device->channelFor(CapabilityFamily::MediaControl), a);
}

TEST_F(DeviceAggregateTest, ResolutionTieGoesToFirstRegistered) {
    auto a = addChannel("A");
    auto b = addChannel("B");
    a->setCapabilityPriority(CapabilityFamily::Launcher, CapabilityPriority::Normal);
    b->setCapabilityPriority(CapabilityFamily::Launcher, CapabilityPriority::Normal);
    b->capabilities().add("Launcher.App");
    EXPECT_EQ(device->channelFor(CapabilityFamily::Launcher), b);

    a->capabilities().add("Launcher.Browser");
    EXPECT_EQ(device->channelFor(CapabilityFamily::Launcher), a);
}

TEST_F(DeviceAggregateTest, ResolutionFollowsCapabilityRemoval) {
    auto a = addChannel("A");
    auto b = addChannel("B");
    a->setCapabilityPriority(CapabilityFamily::VolumeControl, CapabilityPriority::Low);
    b->setCapabilityPriority(CapabilityFamily::VolumeControl, CapabilityPriority::High);
    a->capabilities().add("VolumeControl.Set");
    b->capabilities().add("VolumeControl.Set");
    ASSERT_EQ(device->channelFor(CapabilityFamily::VolumeControl), b);

    b->capabilities().remove("VolumeControl.Set");
    EXPECT_EQ(device->channelFor(CapabilityFamily::VolumeControl), a);

    a->capabilities().remove("VolumeControl.Set");
    EXPECT_EQ(device->channelFor(CapabilityFamily::VolumeControl), nullptr);
}

TEST_F(DeviceAggregateTest, ResolutionRefreshAfterPriorityChange) {
    auto a = addChannel("A");
    auto b = addChannel("B");
    a->setCapabilityPriority(CapabilityFamily::PowerControl, 10);
    a->capabilities().add("PowerControl.Off");
    b->capabilities().add("PowerControl.Off");
    ASSERT_EQ(device->channelFor(CapabilityFamily::PowerControl), a);

    b->setCapabilityPriority(CapabilityFamily::PowerControl, 20);
    device->refreshCapabilityResolution();
    EXPECT_EQ(device->channelFor(CapabilityFamily::PowerControl), b);
}

// Connect

TEST_F(DeviceAggregateTest, ConnectWithNoConnectableChannelsIsReadyImmediately) {
    addChannel("DIAL", false);

    EXPECT_CALL(*observer, onDeviceReady(Ref(*device)));
    device->connect();

    EXPECT_TRUE(device->isConnected());
    EXPECT_GT(device->lastConnected(), 0.0);
}

TEST_F(DeviceAggregateTest, EmptyAggregateIsReadyImmediately) {
    EXPECT_CALL(*observer, onDeviceReady(Ref(*device)));
    device->connect();
}

TEST_F(DeviceAggregateTest, ReadyOnlyAfterEveryConnectableChannel) {
    auto a = addChannel("A");
    auto b = addChannel("B");
    auto c = addChannel("C", false);
    a->autoConnect = false;
    b->autoConnect = false;

    EXPECT_CALL(*observer, onDeviceReady(_)).Times(0);
    device->connect();
    EXPECT_EQ(c->connectCalls, 0);

    // Out of order completion
    b->completeConnect(b->currentAttempt());
    EXPECT_FALSE(device->isConnected());
    ::testing::Mock::VerifyAndClearExpectations(observer.get());

    EXPECT_CALL(*observer, onDeviceReady(Ref(*device)));
    a->completeConnect(a->currentAttempt());

    EXPECT_TRUE(device->isConnected());
    EXPECT_EQ(device->connectedChannelNames(), "A, B");
}

TEST_F(DeviceAggregateTest, ChannelFailureDoesNotBlockSiblings) {
    auto a = addChannel("A");
    auto b = addChannel("B");
    a->autoConnect = false;

    EXPECT_CALL(*observer, onChannelConnected(Ref(*device), Ref(*b)));
    EXPECT_CALL(*observer, onChannelConnectionFailed(Ref(*device), Ref(*a),
                                                     Field(&Error::code, ErrorCode::ConnectionFailed)));
    EXPECT_CALL(*observer, onConnectionFailed(Ref(*device), Field(&Error::message, "refused")));
    EXPECT_CALL(*observer, onDeviceReady(_)).Times(0);

    device->connect();
    a->failConnect(a->currentAttempt(), Error(ErrorCode::ConnectionFailed, "refused"));

    EXPECT_TRUE(b->isConnected());
    EXPECT_FALSE(device->isConnected());
}

TEST_F(DeviceAggregateTest, PairingKeepsDeviceNotReady) {
    auto tv = addChannel("webOS TV");
    tv->autoConnect = false;

    EXPECT_CALL(*observer, onPairingRequired(Ref(*device), Ref(*tv), PairingType::PinCode, _));
    EXPECT_CALL(*observer, onDeviceReady(_)).Times(0);

    device->connect();
    tv->requirePairing(tv->currentAttempt(), PairingType::PinCode, nlohmann::json::object());
    EXPECT_FALSE(device->isConnected());
    ::testing::Mock::VerifyAndClearExpectations(observer.get());

    tv->autoPair = false;
    tv->pair({{"pin", "1234"}});
    const auto attempt = tv->currentAttempt();

    EXPECT_CALL(*observer, onPairingSucceeded(Ref(*device), Ref(*tv)));
    EXPECT_CALL(*observer, onDeviceReady(_)).Times(0);
    tv->completePairing(attempt);
    ::testing::Mock::VerifyAndClearExpectations(observer.get());

    EXPECT_CALL(*observer, onDeviceReady(Ref(*device)));
    tv->completeConnect(attempt);
}

TEST_F(DeviceAggregateTest, PairingFailureSettlesConnect) {
    auto tv = addChannel("webOS TV");
    tv->autoConnect = false;
    tv->autoPair = false;
    device->connect();
    tv->requirePairing(tv->currentAttempt(), PairingType::FirstScreen, nlohmann::json::object());
    tv->pair(nlohmann::json::object());

    EXPECT_CALL(*observer, onPairingFailed(Ref(*device), Ref(*tv), _));
    EXPECT_CALL(*observer, onConnectionFailed(Ref(*device), Field(&Error::message, "rejected")));
    tv->failPairing(tv->currentAttempt(), Error(ErrorCode::ConnectionFailed, "rejected"));
}

TEST_F(DeviceAggregateTest, ConnectionRequiredForChannelJoiningConnectedDevice) {
    device->connect();

    auto late = FakeChannel::make("Roku", "roku-id");
    EXPECT_CALL(*observer, onChannelConnectionRequired(Ref(*device), Ref(*late)));
    device->addChannel(late);
}

TEST_F(DeviceAggregateTest, ChannelJoiningDuringConnectIsAwaited) {
    auto a = addChannel("A");
    a->autoConnect = false;
    device->connect();

    auto late = FakeChannel::make("B", "B-id");
    late->autoConnect = false;
    EXPECT_CALL(*observer, onDeviceReady(_)).Times(0);
    ASSERT_TRUE(device->addChannel(late));
    EXPECT_EQ(late->connectCalls, 1);

    a->completeConnect(a->currentAttempt());
    EXPECT_FALSE(device->isConnected());
    ::testing::Mock::VerifyAndClearExpectations(observer.get());

    EXPECT_CALL(*observer, onDeviceReady(Ref(*device)));
    late->completeConnect(late->currentAttempt());

    EXPECT_TRUE(device->isConnected());
    EXPECT_EQ(device->connectedChannelNames(), "A, B");
}

// Disconnect

TEST_F(DeviceAggregateTest, DisconnectWithNothingConnectedReportsImmediately) {
    addChannel("A");
    addChannel("B", false);

    EXPECT_CALL(*observer, onDeviceDisconnected(Ref(*device)));
    device->disconnect();
}

TEST_F(DeviceAggregateTest, DisconnectReportedAfterLastChannel) {
    auto a = addChannel("A");
    auto b = addChannel("B");
    device->connect();
    a->autoDisconnect = false;
    b->autoDisconnect = false;

    EXPECT_CALL(*observer, onDeviceDisconnected(_)).Times(0);
    device->disconnect();
    a->completeDisconnect();
    ::testing::Mock::VerifyAndClearExpectations(observer.get());

    EXPECT_CALL(*observer, onChannelDisconnected(Ref(*device), Ref(*b), _));
    EXPECT_CALL(*observer, onDeviceDisconnected(Ref(*device)));
    b->completeDisconnect();

    EXPECT_EQ(device->connectedChannelNames(), "");
}

TEST_F(DeviceAggregateTest, DisconnectMidConnectSupersedesCompletion) {
    auto a = addChannel("A");
    a->autoConnect = false;
    device->connect();
    const auto attempt = a->currentAttempt();

    EXPECT_CALL(*observer, onDeviceReady(_)).Times(0);
    EXPECT_CALL(*observer, onDeviceDisconnected(Ref(*device)));
    device->disconnect();
    a->completeConnect(attempt);

    EXPECT_FALSE(a->isConnected());
}

// Readiness persistence

TEST_F(DeviceAggregateTest, ReadyDeviceIsWrittenToStore) {
    const auto path = std::filesystem::temp_directory_path() / "devmux_aggregate_store_test.json";
    std::filesystem::remove(path);

    DeviceStoreConfig config;
    config.storagePath = path.string();
    auto store = std::make_shared<DeviceStore>(config);
    device->setStore(store);
    device->setLastDetection(devmux::utils::epochSeconds());

    device->connect();

    EXPECT_THAT(store->storedIds(), ElementsAre("device-1"));
    EXPECT_TRUE(std::filesystem::exists(path));
    std::filesystem::remove(path);
}

// Session closing

TEST_F(DeviceAggregateTest, CloseSessionDelegatesToOwningChannel) {
    auto a = addChannel("A");
    a->mediaClosing = true;

    LaunchSession session;
    session.kind = SessionKind::Media;
    session.channel = a;

    int successes = 0;
    device->closeSession(session, [&successes]() { ++successes; },
                         [](const Error& error) { FAIL() << error; });

    EXPECT_EQ(successes, 1);
    EXPECT_EQ(a->mediaCloses, 1);
}

TEST_F(DeviceAggregateTest, CloseSessionWithoutCapabilityIsArgumentError) {
    auto a = addChannel("A");

    LaunchSession session;
    session.kind = SessionKind::App;
    session.channel = a;

    std::vector<Error> failures;
    device->closeSession(session, []() { FAIL() << "unexpected success"; },
                         [&failures](const Error& error) { failures.push_back(error); });

    ASSERT_EQ(failures.size(), 1u);
    EXPECT_EQ(failures[0].code, ErrorCode::ArgumentError);
}

TEST_F(DeviceAggregateTest, CloseSessionForForeignChannelIsArgumentError) {
    auto foreign = FakeChannel::make("A", "elsewhere");
    foreign->appClosing = true;

    LaunchSession session;
    session.kind = SessionKind::App;
    session.channel = foreign;

    std::vector<Error> failures;
    device->closeSession(session, []() { FAIL() << "unexpected success"; },
                         [&failures](const Error& error) { failures.push_back(error); });

    ASSERT_EQ(failures.size(), 1u);
    EXPECT_EQ(failures[0].code, ErrorCode::ArgumentError);
    EXPECT_EQ(foreign->appCloses, 0);
}

TEST_F(DeviceAggregateTest, CloseSessionWithoutChannelIsArgumentError) {
    LaunchSession session;
    session.kind = SessionKind::App;

    std::vector<Error> failures;
    device->closeSession(session, nullptr,
                         [&failures](const Error& error) { failures.push_back(error); });

    ASSERT_EQ(failures.size(), 1u);
    EXPECT_EQ(failures[0].code, ErrorCode::ArgumentError);
}

// Threading

namespace {

// Records whether every callback arrived on the dispatcher's worker
class WorkerCheckingObserver : public DeviceObserver {
public:
    explicit WorkerCheckingObserver(const SerialDispatcher& dispatcher) : dispatcher_(dispatcher) {}

    void onDeviceReady(DeviceAggregate& /*device*/) override {
        check();
        ++ready;
    }

    void onChannelConnected(DeviceAggregate& /*device*/, DeviceChannel& /*channel*/) override {
        check();
        ++channelsConnected;
    }

    void onConnectionFailed(DeviceAggregate& /*device*/, const Error& /*error*/) override {
        check();
        ++failed;
    }

    std::atomic<int> ready{0};
    std::atomic<int> channelsConnected{0};
    std::atomic<int> failed{0};
    std::atomic<bool> allOnWorker{true};

private:
    void check() {
        if (!dispatcher_.isWorkerThread()) {
            allOnWorker = false;
        }
    }

    const SerialDispatcher& dispatcher_;
};

} // namespace

TEST(DeviceAggregateThreadingTest, CompletionsFromManyThreadsAreSerialized) {
    const auto path = std::filesystem::temp_directory_path() / "devmux_aggregate_threading_test.json";
    std::filesystem::remove(path);

    auto dispatcher = std::make_shared<SerialDispatcher>();
    auto observer = std::make_shared<WorkerCheckingObserver>(*dispatcher);

    DeviceStoreConfig config;
    config.storagePath = path.string();
    auto store = std::make_shared<DeviceStore>(config);

    for (int round = 0; round < 20; ++round) {
        auto device = DeviceAggregate::create("device-1", dispatcher);
        device->setObserver(observer);
        device->setStore(store);

        std::vector<std::shared_ptr<FakeChannel>> channels;
        for (int i = 0; i < 4; ++i) {
            auto channel = FakeChannel::make("channel-" + std::to_string(i), "id-" + std::to_string(i));
            channel->autoConnect = false;
            ASSERT_TRUE(device->addChannel(channel));
            channels.push_back(channel);
        }

        device->connect();

        // Complete in reverse order, each from its own thread, while the store is read
        std::vector<std::thread> completers;
        for (auto it = channels.rbegin(); it != channels.rend(); ++it) {
            auto channel = *it;
            completers.emplace_back([channel]() { channel->completeConnect(channel->currentAttempt()); });
        }
        auto entry = device->toJson(RecordCodec::getInstance());
        EXPECT_EQ(entry["id"], "device-1");
        for (auto& completer : completers) {
            completer.join();
        }
        dispatcher->flush();

        EXPECT_TRUE(device->isConnected());
    }

    EXPECT_EQ(observer->ready.load(), 20);
    EXPECT_EQ(observer->channelsConnected.load(), 80);
    EXPECT_EQ(observer->failed.load(), 0);
    EXPECT_TRUE(observer->allOnWorker.load());
    EXPECT_THAT(store->storedIds(), ElementsAre("device-1"));
    std::filesystem::remove(path);
}

#include <gtest/gtest.h>
#include "Connector/DeviceConnector.hpp"
#include "TestHelpers.hpp"

#include <arpa/inet.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace std::chrono;

class DeviceConnectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        detector_ = std::make_shared<FakeDetector>();
        log_ = std::make_shared<FakeChannelLog>();
        config_.connectTimeout = milliseconds{200};
        config_.discoveryGracePeriod = milliseconds{100};
    }

    void TearDown() override {
        connector_.reset();
        safeClose(fd_);
    }

    DeviceConnector &makeConnector(FakeChannelScript script = {}) {
        connector_ = std::make_unique<DeviceConnector>(detector_, FakeChannel::factory(script, log_), config_);
        return *connector_;
    }

    //connector listening with device "A" (id 1) and "B" (id 2) present
    DeviceConnector &makeConnectorWithDevices(FakeChannelScript script = {}) {
        detector_->initialEvents = {test_attached(1, "A"), test_attached(2, "B")};
        DeviceConnector &connector = makeConnector(script);
        EXPECT_EQ(connector.connectedDevices(), (std::set<std::string>{"A", "B"}));
        return connector;
    }

    std::shared_ptr<FakeDetector> detector_;
    std::shared_ptr<FakeChannelLog> log_;
    ConnectorConfig config_;
    std::unique_ptr<DeviceConnector> connector_;
    int fd_ = -1;
};

TEST_F(DeviceConnectorTest, RequiresDetectorAndFactory) {
    EXPECT_THROW(DeviceConnector(nullptr, FakeChannel::factory({}, log_), config_), tihmstar::exception);
    EXPECT_THROW(DeviceConnector(detector_, nullptr, config_), tihmstar::exception);
}

TEST_F(DeviceConnectorTest, DoesNotListenBeforeFirstUse) {
    makeConnector();
    EXPECT_EQ(detector_->listenCalls.load(), 0);
}

TEST_F(DeviceConnectorTest, FirstQueryListensAndReportsAttachedDevices) {
    DeviceConnector &connector = makeConnectorWithDevices();
    EXPECT_EQ(detector_->listenCalls.load(), 1);
    EXPECT_EQ(connector.snapshotDeviceSerials(), (std::set<std::string>{"A", "B"}));
}

TEST_F(DeviceConnectorTest, GracePeriodOnlyAppliesWhenListeningStarts) {
    DeviceConnector &connector = makeConnector();

    auto start = steady_clock::now();
    connector.connectedDevices();
    EXPECT_GE(steady_clock::now() - start, config_.discoveryGracePeriod);

    start = steady_clock::now();
    connector.connectedDevices();
    EXPECT_LT(steady_clock::now() - start, config_.discoveryGracePeriod / 2);
    EXPECT_EQ(detector_->listenCalls.load(), 1);
}

TEST_F(DeviceConnectorTest, ConcurrentFirstQueriesListenOnce) {
    detector_->listenDelay = milliseconds{50};
    DeviceConnector &connector = makeConnector();
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; i++) {
        threads.emplace_back([&]{
            connector.connectedDevices();
        });
    }
    for (auto &t : threads) t.join();
    EXPECT_EQ(detector_->listenCalls.load(), 1);
}

TEST_F(DeviceConnectorTest, FailedListenIsRetriedOnNextQuery) {
    detector_->listenResult = false;
    DeviceConnector &connector = makeConnector();

    auto start = steady_clock::now();
    EXPECT_TRUE(connector.connectedDevices().empty());
    //no grace period when nothing started listening
    EXPECT_LT(steady_clock::now() - start, config_.discoveryGracePeriod);
    EXPECT_EQ(detector_->listenCalls.load(), 1);

    detector_->listenResult = true;
    detector_->initialEvents = {test_attached(1, "A")};
    EXPECT_EQ(connector.connectedDevices(), (std::set<std::string>{"A"}));
    EXPECT_EQ(detector_->listenCalls.load(), 2);
}

TEST_F(DeviceConnectorTest, DetachRemovesDeviceAndNotifies) {
    DeviceConnector &connector = makeConnectorWithDevices();
    std::vector<DeviceNotification> notes;
    connector.observers().addObserver([&](const DeviceNotification &note){
        notes.push_back(note);
    });

    detector_->emit(test_detached(1));

    EXPECT_EQ(connector.connectedDevices(), (std::set<std::string>{"B"}));
    ASSERT_EQ(notes.size(), 1u);
    EXPECT_EQ(notes[0].type, DeviceNotification::DEVICE_DETACHED);
    EXPECT_EQ(notes[0].deviceID, 1u);
}

TEST_F(DeviceConnectorTest, DetachOfUnknownDeviceStillNotifies) {
    DeviceConnector &connector = makeConnectorWithDevices();
    int detaches = 0;
    connector.observers().addObserver([&](const DeviceNotification &note){
        if (note.type == DeviceNotification::DEVICE_DETACHED) detaches++;
    });

    detector_->emit(test_detached(42));
    EXPECT_EQ(detaches, 1);
    EXPECT_EQ(connector.connectedDevices().size(), 2u);
}

TEST_F(DeviceConnectorTest, AttachNotifiesAfterRegistryUpdate) {
    DeviceConnector &connector = makeConnectorWithDevices();
    bool sawDevice = false;
    connector.observers().addObserver([&](const DeviceNotification &note){
        if (note.type == DeviceNotification::DEVICE_ATTACHED) {
            sawDevice = connector.snapshotDeviceSerials().count(note.serial) == 1;
        }
    });

    detector_->emit(test_attached(3, "C"));
    EXPECT_TRUE(sawDevice);
}

TEST_F(DeviceConnectorTest, UnrecognizedBroadcastIsIgnored) {
    DeviceConnector &connector = makeConnectorWithDevices();
    int calls = 0;
    connector.observers().addObserver([&](const DeviceNotification &){ calls++; });

    detector_->emit({BroadcastEvent::EVENT_UNRECOGNIZED, 0, {}, "<plist/>"});
    EXPECT_EQ(calls, 0);
    EXPECT_EQ(connector.connectedDevices().size(), 2u);
}

TEST_F(DeviceConnectorTest, BroadcastErrorCancelsDetector) {
    DeviceConnector &connector = makeConnector();
    ASSERT_TRUE(connector.ensureListening());
    ASSERT_TRUE(detector_->hasHandler());

    detector_->emitError();
    EXPECT_EQ(detector_->cancelCalls.load(), 1);
    EXPECT_FALSE(detector_->hasHandler());
}

TEST_F(DeviceConnectorTest, BrokenFeedKeepsLastKnownDevices) {
    DeviceConnector &connector = makeConnectorWithDevices();

    detector_->emitError();
    EXPECT_EQ(detector_->cancelCalls.load(), 1);
    EXPECT_TRUE(connector.ensureListening());

    auto start = steady_clock::now();
    EXPECT_EQ(connector.connectedDevices(), (std::set<std::string>{"A", "B"}));
    EXPECT_LT(steady_clock::now() - start, config_.discoveryGracePeriod);
    EXPECT_EQ(detector_->listenCalls.load(), 1);
}

TEST_F(DeviceConnectorTest, DestructorCancelsActiveDetector) {
    makeConnector().ensureListening();
    connector_.reset();
    EXPECT_EQ(detector_->cancelCalls.load(), 1);
}

TEST_F(DeviceConnectorTest, DestructorLeavesIdleDetectorAlone) {
    makeConnector();
    connector_.reset();
    EXPECT_EQ(detector_->cancelCalls.load(), 0);
}

#pragma mark connectToDevice
TEST_F(DeviceConnectorTest, ConnectsToKnownDevice) {
    DeviceConnector &connector = makeConnectorWithDevices();

    ConnectResult res = connector.connectToDevice("B", 62078);
    ASSERT_EQ(res.err, CONNERR_OK) << res.message;
    ASSERT_GE(res.fd, 0);
    fd_ = res.fd;

    EXPECT_EQ(log_->opened, 1);
    EXPECT_EQ(log_->released, 1);
    EXPECT_EQ(log_->lastMessageType, "Connect");
    EXPECT_EQ(log_->lastDeviceID, 2u);
    EXPECT_EQ(log_->lastPortNumber, htons(62078));

    //the stream is usable by the caller
    ASSERT_EQ(write(fd_, "ping", 4), 4);
    char buf[4] = {};
    ASSERT_EQ(read(log_->peerFd, buf, sizeof(buf)), 4);
    EXPECT_EQ(std::string(buf, 4), "ping");
}

TEST_F(DeviceConnectorTest, ConnectsWithAsynchronousCompletions) {
    FakeChannelScript script;
    script.asyncCompletion = true;
    DeviceConnector &connector = makeConnectorWithDevices(script);

    ConnectResult res = connector.connectToDevice("A", 22);
    ASSERT_EQ(res.err, CONNERR_OK) << res.message;
    fd_ = res.fd;
    EXPECT_EQ(log_->lastDeviceID, 1u);
}

TEST_F(DeviceConnectorTest, ConnectUsesLatestDeviceIDAfterReattach) {
    DeviceConnector &connector = makeConnectorWithDevices();
    detector_->emit(test_attached(5, "A"));

    ConnectResult res = connector.connectToDevice("A", 22);
    ASSERT_EQ(res.err, CONNERR_OK) << res.message;
    fd_ = res.fd;
    EXPECT_EQ(log_->lastDeviceID, 5u);
}

TEST_F(DeviceConnectorTest, UnknownDeviceFailsWithoutOpeningChannel) {
    DeviceConnector &connector = makeConnectorWithDevices();

    auto start = steady_clock::now();
    ConnectResult res = connector.connectToDevice("Z", 22);
    EXPECT_LT(steady_clock::now() - start, config_.connectTimeout);

    EXPECT_EQ(res.err, CONNERR_DEVICE_NOT_FOUND);
    EXPECT_EQ(res.fd, -1);
    EXPECT_FALSE(res.message.empty());
    EXPECT_EQ(log_->opened, 0);
}

TEST_F(DeviceConnectorTest, ConnectStartsListeningWhenNeeded) {
    detector_->initialEvents = {test_attached(1, "A")};
    DeviceConnector &connector = makeConnector();

    ConnectResult res = connector.connectToDevice("A", 22);
    ASSERT_EQ(res.err, CONNERR_OK) << res.message;
    fd_ = res.fd;
    EXPECT_EQ(detector_->listenCalls.load(), 1);
}

TEST_F(DeviceConnectorTest, DetachedDeviceIsNotFound) {
    DeviceConnector &connector = makeConnectorWithDevices();
    detector_->emit(test_detached(1));

    ConnectResult res = connector.connectToDevice("A", 22);
    EXPECT_EQ(res.err, CONNERR_DEVICE_NOT_FOUND);
}

TEST_F(DeviceConnectorTest, ChannelConstructionFailure) {
    FakeChannelScript script;
    script.failConstruction = true;
    DeviceConnector &connector = makeConnectorWithDevices(script);

    ConnectResult res = connector.connectToDevice("A", 22);
    EXPECT_EQ(res.err, CONNERR_CHANNEL_CONSTRUCTION_FAILED);
    EXPECT_EQ(res.fd, -1);
}

TEST_F(DeviceConnectorTest, SendFailure) {
    FakeChannelScript script;
    script.send = FakeChannelScript::SEND_ERROR;
    DeviceConnector &connector = makeConnectorWithDevices(script);

    ConnectResult res = connector.connectToDevice("A", 22);
    EXPECT_EQ(res.err, CONNERR_SEND_FAILED);
    EXPECT_EQ(log_->receiveCalls, 0);
}

TEST_F(DeviceConnectorTest, SendTimeout) {
    FakeChannelScript script;
    script.send = FakeChannelScript::SEND_HANG;
    DeviceConnector &connector = makeConnectorWithDevices(script);

    auto start = steady_clock::now();
    ConnectResult res = connector.connectToDevice("A", 22);
    EXPECT_GE(steady_clock::now() - start, config_.connectTimeout);

    EXPECT_EQ(res.err, CONNERR_SEND_TIMEDOUT);
    EXPECT_EQ(log_->receiveCalls, 0);
    EXPECT_EQ(log_->released, 0);
}

TEST_F(DeviceConnectorTest, ReceiveFailure) {
    FakeChannelScript script;
    script.receive = FakeChannelScript::RECEIVE_ERROR;
    DeviceConnector &connector = makeConnectorWithDevices(script);

    ConnectResult res = connector.connectToDevice("A", 22);
    EXPECT_EQ(res.err, CONNERR_RECEIVE_FAILED);
    EXPECT_EQ(log_->released, 0);
}

TEST_F(DeviceConnectorTest, ReceiveTimeout) {
    FakeChannelScript script;
    script.receive = FakeChannelScript::RECEIVE_HANG;
    DeviceConnector &connector = makeConnectorWithDevices(script);

    auto start = steady_clock::now();
    ConnectResult res = connector.connectToDevice("A", 22);
    auto elapsed = steady_clock::now() - start;

    EXPECT_EQ(res.err, CONNERR_RECEIVE_TIMEDOUT);
    EXPECT_EQ(res.fd, -1);
    EXPECT_GE(elapsed, config_.connectTimeout);
    EXPECT_LT(elapsed, config_.connectTimeout + seconds{1});
}

TEST_F(DeviceConnectorTest, ReplyThatIsNotAResultFails) {
    FakeChannelScript script;
    script.receive = FakeChannelScript::RECEIVE_NOT_RESULT;
    DeviceConnector &connector = makeConnectorWithDevices(script);

    ConnectResult res = connector.connectToDevice("A", 22);
    EXPECT_EQ(res.err, CONNERR_RECEIVE_FAILED);
}

TEST_F(DeviceConnectorTest, RefusedConnection) {
    FakeChannelScript script;
    script.resultNumber = RESULT_CONNREFUSED;
    DeviceConnector &connector = makeConnectorWithDevices(script);

    ConnectResult res = connector.connectToDevice("A", 1234);
    EXPECT_EQ(res.err, CONNERR_CONNECTION_REFUSED);
    EXPECT_EQ(res.fd, -1);
    EXPECT_EQ(log_->released, 0);
}

TEST(ConnectErrorTest, EveryErrorHasAName) {
    EXPECT_STREQ(connect_error_str(CONNERR_OK), "OK");
    EXPECT_STREQ(connect_error_str(CONNERR_DEVICE_NOT_FOUND), "DeviceNotFound");
    EXPECT_STREQ(connect_error_str(CONNERR_RECEIVE_TIMEDOUT), "ReceiveTimedOut");
    EXPECT_STREQ(connect_error_str(CONNERR_CONNECTION_REFUSED), "ConnectionRefused");
    EXPECT_STREQ(connect_error_str((connect_error)1000), "Unknown");
}

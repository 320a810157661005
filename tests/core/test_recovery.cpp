// test_recovery.cpp — Backoff, retry queue, reconnection coordinator, transfer state

#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>

#include "cosmicconnect/Error.h"
#include "cosmicconnect/Recovery.h"
#include "cosmicconnect/TransferTracker.h"

namespace fs = std::filesystem;
using namespace CosmicConnect;
using namespace std::chrono_literals;

// ═══════════════════════════════════════════════════════════
// ReconnectBackoff
// ═══════════════════════════════════════════════════════════

TEST(ReconnectBackoffTest, NominalSequenceIsCapped) {
    ReconnectBackoff backoff;
    std::vector<int64_t> expected = {1000, 2000, 4000, 8000, 16000, 32000, 60000, 60000};
    for (size_t i = 0; i < expected.size(); ++i) {
        EXPECT_EQ(backoff.nominalDelay(i).count(), expected[i]) << "attempt " << i;
    }
}

TEST(ReconnectBackoffTest, JitterStaysWithinBounds) {
    for (uint32_t seed = 0; seed < 50; ++seed) {
        ReconnectBackoff backoff(BackoffConfig{}, seed);
        auto first = backoff.nextDelay().count();
        EXPECT_GE(first, 800);
        EXPECT_LE(first, 1200);
        auto second = backoff.nextDelay().count();
        EXPECT_GE(second, 1600);
        EXPECT_LE(second, 2400);
    }
}

TEST(ReconnectBackoffTest, ResetRestartsSequence) {
    BackoffConfig config;
    config.jitter = 0.0;
    ReconnectBackoff backoff(config);
    backoff.nextDelay();
    backoff.nextDelay();
    EXPECT_EQ(backoff.attempts(), 2u);
    EXPECT_EQ(backoff.nextDelay().count(), 4000);

    backoff.reset();
    EXPECT_EQ(backoff.attempts(), 0u);
    EXPECT_EQ(backoff.nextDelay().count(), 1000);
}

// ═══════════════════════════════════════════════════════════
// RetryQueue
// ═══════════════════════════════════════════════════════════

TEST(RetryQueueTest, FlushPreservesOrder) {
    RetryQueue queue;
    auto now = RetryQueue::Clock::now();
    queue.enqueue("dev1", Packet("cconnect.test.a"), now);
    queue.enqueue("dev1", Packet("cconnect.test.b"), now);
    queue.enqueue("dev2", Packet("cconnect.test.c"), now);
    EXPECT_EQ(queue.total(), 3u);

    std::vector<std::string> sent;
    size_t n = queue.flush("dev1", [&](const std::string&, const Packet& p) { sent.push_back(p.type); }, now);
    EXPECT_EQ(n, 2u);
    EXPECT_EQ(sent, (std::vector<std::string>{"cconnect.test.a", "cconnect.test.b"}));
    EXPECT_EQ(queue.size("dev1"), 0u);
    EXPECT_EQ(queue.devices(), std::vector<std::string>{"dev2"});
}

TEST(RetryQueueTest, FailedPacketWaitsThenIsDropped) {
    RetryConfig config;
    config.maxRetries = 2;
    config.retrySpacingMs = 500;
    RetryQueue queue(config);
    auto now = RetryQueue::Clock::now();
    queue.enqueue("dev1", Packet("cconnect.test.a"), now);
    queue.enqueue("dev1", Packet("cconnect.test.b"), now);

    int calls = 0;
    auto failing = [&](const std::string&, const Packet&) {
        ++calls;
        throw ProtocolError(ErrorKind::Backpressure, "queue full");
    };

    EXPECT_EQ(queue.flush("dev1", failing, now), 0u);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(queue.size("dev1"), 2u);

    // До истечения интервала повтор не выполняется
    EXPECT_EQ(queue.flush("dev1", failing, now + 100ms), 0u);
    EXPECT_EQ(calls, 1);

    // Вторая неудача исчерпывает попытки для первого пакета
    queue.flush("dev1", failing, now + 600ms);
    EXPECT_EQ(queue.size("dev1"), 1u);

    std::vector<std::string> sent;
    queue.flush("dev1", [&](const std::string&, const Packet& p) { sent.push_back(p.type); }, now + 1200ms);
    EXPECT_EQ(sent, std::vector<std::string>{"cconnect.test.b"});
}

TEST(RetryQueueTest, SenderFailureOfAnyKindKeepsPacketQueued) {
    RetryQueue queue;
    auto now = RetryQueue::Clock::now();
    queue.enqueue("dev1", Packet("cconnect.test.a"), now);

    // Исключение не из иерархии ProtocolError не выходит из flush
    size_t n = 0;
    EXPECT_NO_THROW(n = queue.flush("dev1", [](const std::string&, const Packet&) {
        throw std::runtime_error("socket gone");
    }, now));
    EXPECT_EQ(n, 0u);
    EXPECT_EQ(queue.size("dev1"), 1u);
}

TEST(RetryQueueTest, CapacityPerDevice) {
    RetryConfig config;
    config.maxQueuedPerDevice = 2;
    RetryQueue queue(config);
    EXPECT_TRUE(queue.enqueue("dev1", Packet("cconnect.test")));
    EXPECT_TRUE(queue.enqueue("dev1", Packet("cconnect.test")));
    EXPECT_FALSE(queue.enqueue("dev1", Packet("cconnect.test")));
    EXPECT_TRUE(queue.enqueue("dev2", Packet("cconnect.test")));

    queue.clear("dev1");
    EXPECT_EQ(queue.size("dev1"), 0u);
}

// ═══════════════════════════════════════════════════════════
// RecoveryCoordinator
// ═══════════════════════════════════════════════════════════

class RecoveryCoordinatorTest : public ::testing::Test {
protected:
    using Clock = RecoveryCoordinator::Clock;

    std::unique_ptr<RecoveryCoordinator> recovery;
    std::vector<std::string> connectCalls;
    std::vector<std::string> resumeCalls;
    bool connectSucceeds = false;

    void SetUp() override {
        RecoveryConfig config;
        config.backoff.maxAttempts = 3;
        recovery = std::make_unique<RecoveryCoordinator>(config, std::make_shared<TransferTracker>());
        recovery->setConnector([this](const std::string& id) {
            connectCalls.push_back(id);
            if (!connectSucceeds) {
                throw ProtocolError(ErrorKind::TransportUnavailable, "peer offline");
            }
        });
        recovery->setResumeHandler([this](const std::string& id) { resumeCalls.push_back(id); });
    }

    static ConnectionEvent connected(const std::string& id) {
        ConnectionEvent event;
        event.type = ConnectionEventType::Connected;
        event.deviceId = id;
        return event;
    }

    static ConnectionEvent disconnected(const std::string& id, DisconnectReason reason) {
        ConnectionEvent event;
        event.type = ConnectionEventType::Disconnected;
        event.deviceId = id;
        event.reason = reason;
        return event;
    }
};

TEST_F(RecoveryCoordinatorTest, UnexpectedDisconnectSchedulesReconnect) {
    auto before = Clock::now();
    recovery->handleConnectionEvent(connected("dev1"));
    EXPECT_TRUE(recovery->isConnected("dev1"));

    recovery->handleConnectionEvent(disconnected("dev1", DisconnectReason::RemoteClosed));
    EXPECT_FALSE(recovery->isConnected("dev1"));

    auto next = recovery->nextAttempt("dev1");
    ASSERT_TRUE(next.has_value());
    EXPECT_GE(*next, before + 800ms);
    EXPECT_LE(*next, Clock::now() + 1200ms);

    recovery->tick(Clock::now());
    EXPECT_TRUE(connectCalls.empty());

    connectSucceeds = true;
    recovery->tick(Clock::now() + 2s);
    EXPECT_EQ(connectCalls, std::vector<std::string>{"dev1"});
    EXPECT_EQ(recovery->failedAttempts("dev1"), 0u);
}

TEST_F(RecoveryCoordinatorTest, LocalDisconnectDoesNotReconnect) {
    recovery->handleConnectionEvent(connected("dev1"));
    recovery->handleConnectionEvent(disconnected("dev1", DisconnectReason::LocalRequest));
    EXPECT_FALSE(recovery->nextAttempt("dev1").has_value());

    recovery->handleConnectionEvent(connected("dev2"));
    recovery->handleConnectionEvent(disconnected("dev2", DisconnectReason::Unpaired));
    EXPECT_FALSE(recovery->nextAttempt("dev2").has_value());
}

TEST_F(RecoveryCoordinatorTest, PolicyFiltersDevices) {
    recovery->setReconnectPolicy([](const std::string& id) { return id == "wanted"; });
    recovery->handleConnectionEvent(disconnected("other", DisconnectReason::RemoteClosed));
    recovery->handleConnectionEvent(disconnected("wanted", DisconnectReason::RemoteClosed));
    EXPECT_FALSE(recovery->nextAttempt("other").has_value());
    EXPECT_TRUE(recovery->nextAttempt("wanted").has_value());
}

TEST_F(RecoveryCoordinatorTest, GivesUpAndRevivesOnDiscovery) {
    recovery->handleConnectionEvent(disconnected("dev1", DisconnectReason::TransportUnavailable));

    auto now = Clock::now();
    for (int i = 1; i <= 3; ++i) {
        now += 120s;
        recovery->tick(now);
        EXPECT_EQ(recovery->failedAttempts("dev1"), static_cast<size_t>(i));
    }
    EXPECT_TRUE(recovery->hasGivenUp("dev1"));
    EXPECT_FALSE(recovery->nextAttempt("dev1").has_value());

    recovery->tick(now + 600s);
    EXPECT_EQ(connectCalls.size(), 3u);

    DeviceInfo info;
    info.deviceId = "dev1";
    recovery->handleDiscoveryEvent(DiscoveryEvent::found(info, "10.0.0.5"));
    EXPECT_FALSE(recovery->hasGivenUp("dev1"));
    EXPECT_EQ(recovery->failedAttempts("dev1"), 0u);

    connectSucceeds = true;
    recovery->tick(Clock::now() + 1s);
    EXPECT_EQ(connectCalls.size(), 4u);
}

TEST_F(RecoveryCoordinatorTest, DiscoveryTriggersImmediateAttempt) {
    DeviceInfo info;
    info.deviceId = "dev1";
    recovery->handleDiscoveryEvent(DiscoveryEvent::found(info, "10.0.0.5"));
    ASSERT_TRUE(recovery->nextAttempt("dev1").has_value());

    connectSucceeds = true;
    recovery->tick(Clock::now() + 10ms);
    EXPECT_EQ(connectCalls, std::vector<std::string>{"dev1"});

    // Подключённое устройство не переподключается
    recovery->handleConnectionEvent(connected("dev1"));
    recovery->handleDiscoveryEvent(DiscoveryEvent::found(info, "10.0.0.5"));
    EXPECT_FALSE(recovery->nextAttempt("dev1").has_value());
}

TEST_F(RecoveryCoordinatorTest, ResumeOfferedOncePerConnection) {
    recovery->handleConnectionEvent(connected("dev1"));
    recovery->tick(Clock::now());
    recovery->tick(Clock::now());
    EXPECT_EQ(resumeCalls, std::vector<std::string>{"dev1"});

    recovery->handleConnectionEvent(disconnected("dev1", DisconnectReason::IdleTimeout));
    recovery->handleConnectionEvent(connected("dev1"));
    recovery->tick(Clock::now());
    EXPECT_EQ(resumeCalls.size(), 2u);
}

TEST_F(RecoveryCoordinatorTest, QueuedPacketsFlushedAfterReconnect) {
    bool online = false;
    std::vector<std::string> delivered;
    recovery->setSender([&](const std::string&, const Packet& packet) {
        if (!online) {
            throw ProtocolError(ErrorKind::TransportUnavailable, "no session");
        }
        delivered.push_back(packet.type);
    });

    EXPECT_FALSE(recovery->sendOrQueue("dev1", Packet("cconnect.test.a")));
    EXPECT_FALSE(recovery->sendOrQueue("dev1", Packet("cconnect.test.b")));
    EXPECT_EQ(recovery->queuedPackets("dev1"), 2u);

    // Без сессии очередь не трогается
    recovery->tick(Clock::now());
    EXPECT_TRUE(delivered.empty());

    online = true;
    recovery->handleConnectionEvent(connected("dev1"));
    recovery->tick(Clock::now());
    EXPECT_EQ(delivered, (std::vector<std::string>{"cconnect.test.a", "cconnect.test.b"}));
    EXPECT_EQ(recovery->queuedPackets("dev1"), 0u);

    EXPECT_TRUE(recovery->sendOrQueue("dev1", Packet("cconnect.test.c")));
}

TEST_F(RecoveryCoordinatorTest, NonRetryableErrorsPropagate) {
    EXPECT_THROW(recovery->sendOrQueue("dev1", Packet("cconnect.test")), ProtocolError);

    recovery->setSender([](const std::string&, const Packet&) {
        throw ProtocolError(ErrorKind::Unauthorized, "not paired");
    });
    try {
        recovery->sendOrQueue("dev1", Packet("cconnect.test"));
        FAIL() << "expected Unauthorized";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Unauthorized);
    }
    EXPECT_EQ(recovery->queuedPackets("dev1"), 0u);
}

// ═══════════════════════════════════════════════════════════
// TransferTracker
// ═══════════════════════════════════════════════════════════

class TransferTrackerTest : public ::testing::Test {
protected:
    std::string tempDir;
    std::string path;

    void SetUp() override {
        tempDir = fs::temp_directory_path().string() + "/cc_recovery_" +
                  std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
        fs::create_directories(tempDir);
        path = tempDir + "/" + RECOVERY_STATE_FILE;
    }

    void TearDown() override {
        fs::remove_all(tempDir);
    }

    static TransferState makeState(const std::string& id, const std::string& device, TransferDirection dir) {
        TransferState state;
        state.transferId = id;
        state.deviceId = device;
        state.filename = id + ".bin";
        state.localPath = "/tmp/" + id + ".bin";
        state.bytesTotal = 1000;
        state.direction = dir;
        return state;
    }
};

TEST_F(TransferTrackerTest, ProgressSurvivesRestart) {
    {
        TransferTracker tracker(path);
        ASSERT_TRUE(tracker.load());
        tracker.begin(makeState("t1", "dev1", TransferDirection::Send));
        tracker.begin(makeState("t2", "dev1", TransferDirection::Receive));
        tracker.begin(makeState("t3", "dev2", TransferDirection::Send));
        EXPECT_TRUE(tracker.update("t1", 400));
        EXPECT_FALSE(tracker.update("missing", 1));
    }

    TransferTracker reloaded(path);
    ASSERT_TRUE(reloaded.load());
    EXPECT_EQ(reloaded.list().size(), 3u);

    auto t1 = reloaded.get("t1");
    ASSERT_TRUE(t1.has_value());
    EXPECT_EQ(t1->bytesTransferred, 400u);
    EXPECT_EQ(t1->bytesTotal, 1000u);
    EXPECT_GT(t1->startedAt, 0);
    EXPECT_DOUBLE_EQ(t1->progressPercentage(), 40.0);

    EXPECT_EQ(reloaded.forDevice("dev1").size(), 2u);
    EXPECT_EQ(reloaded.forDevice("dev1", TransferDirection::Receive).size(), 1u);
    EXPECT_TRUE(reloaded.forDevice("dev3").empty());
}

TEST_F(TransferTrackerTest, CompleteRemovesRecord) {
    TransferTracker tracker(path);
    tracker.begin(makeState("t1", "dev1", TransferDirection::Send));
    EXPECT_TRUE(tracker.complete("t1"));
    EXPECT_FALSE(tracker.complete("t1"));

    TransferTracker reloaded(path);
    ASSERT_TRUE(reloaded.load());
    EXPECT_TRUE(reloaded.list().empty());
}

TEST_F(TransferTrackerTest, CleanupDropsStaleRecords) {
    TransferTracker tracker(path);
    tracker.begin(makeState("t1", "dev1", TransferDirection::Send));
    int64_t lastUpdate = tracker.get("t1")->lastUpdate;

    EXPECT_EQ(tracker.cleanup(TRANSFER_STATE_MAX_AGE_MS, lastUpdate + 1000), 0u);
    EXPECT_EQ(tracker.cleanup(TRANSFER_STATE_MAX_AGE_MS, lastUpdate + TRANSFER_STATE_MAX_AGE_MS + 1), 1u);
    EXPECT_FALSE(tracker.get("t1").has_value());
}

TEST_F(TransferTrackerTest, CorruptStateReportsError) {
    {
        std::ofstream out(path);
        out << "{\"transfers\": 5}";
    }
    TransferTracker tracker(path);
    EXPECT_FALSE(tracker.load());
    EXPECT_FALSE(tracker.getLastError().empty());
}

TEST_F(TransferTrackerTest, MalformedRecordRejected) {
    nlohmann::json missingDevice = {{"transfer_id", "t1"}};
    EXPECT_FALSE(TransferTracker::fromJson(missingDevice).has_value());

    auto json = TransferTracker::toJson(makeState("t1", "dev1", TransferDirection::Receive));
    auto state = TransferTracker::fromJson(json);
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->direction, TransferDirection::Receive);
    EXPECT_EQ(state->filename, "t1.bin");
}

// test_daemon.cpp — Два демона на loopback: discovery, pairing, пакеты, файлы, восстановление

#include <gtest/gtest.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <memory>
#include <mutex>
#include <thread>

#include "cosmicconnect/Certificate.h"
#include "cosmicconnect/Daemon.h"
#include "cosmicconnect/Error.h"
#include "cosmicconnect/Network/ConnectionManager.h"
#include "cosmicconnect/Pairing.h"

namespace fs = std::filesystem;
using namespace CosmicConnect;
using namespace std::chrono_literals;

namespace {

template <typename Pred>
bool waitFor(Pred pred, std::chrono::milliseconds timeout = 10s) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(20ms);
    }
    return pred();
}

/// Свободный UDP порт на loopback (закрывается сразу после выбора)
uint16_t freeUdpPort() {
    int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) return 0;
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    uint16_t port = 0;
    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0) {
        socklen_t len = sizeof(addr);
        if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
            port = ntohs(addr.sin_port);
        }
    }
    ::close(fd);
    return port;
}

/// События одного демона
struct EventLog {
    std::mutex mutex;
    std::vector<DiscoveryEvent> discovery;
    std::vector<PairingEvent> pairing;
    std::vector<ConnectionEvent> connection;
    std::vector<std::pair<TransferState, TransferStatus>> transfers;

    void attach(Daemon& daemon) {
        daemon.onDiscoveryEvent([this](const DiscoveryEvent& e) {
            std::lock_guard<std::mutex> lock(mutex);
            discovery.push_back(e);
        });
        daemon.onPairingEvent([this](const PairingEvent& e) {
            std::lock_guard<std::mutex> lock(mutex);
            pairing.push_back(e);
        });
        daemon.onConnectionEvent([this](const ConnectionEvent& e) {
            std::lock_guard<std::mutex> lock(mutex);
            connection.push_back(e);
        });
        daemon.onTransferEvent([this](const TransferState& state, TransferStatus status, const std::string&) {
            std::lock_guard<std::mutex> lock(mutex);
            transfers.emplace_back(state, status);
        });
    }

    bool hasPairing(PairingEventType type, const std::string& deviceId) {
        std::lock_guard<std::mutex> lock(mutex);
        return std::any_of(pairing.begin(), pairing.end(), [&](const PairingEvent& e) {
            return e.type == type && e.deviceId == deviceId;
        });
    }

    std::optional<PairingEvent> findPairing(PairingEventType type) {
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& e : pairing) {
            if (e.type == type) return e;
        }
        return std::nullopt;
    }

    bool hasPacket(const std::string& type) {
        std::lock_guard<std::mutex> lock(mutex);
        return std::any_of(connection.begin(), connection.end(), [&](const ConnectionEvent& e) {
            return e.type == ConnectionEventType::PacketReceived && e.packet && e.packet->isType(type);
        });
    }

    size_t count(ConnectionEventType type) {
        std::lock_guard<std::mutex> lock(mutex);
        return static_cast<size_t>(std::count_if(connection.begin(), connection.end(),
                                                 [&](const ConnectionEvent& e) { return e.type == type; }));
    }

    std::optional<TransferState> findTransfer(TransferStatus status) {
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& t : transfers) {
            if (t.second == status) return t.first;
        }
        return std::nullopt;
    }
};

bool contains(const std::vector<std::string>& ids, const std::string& id) {
    return std::find(ids.begin(), ids.end(), id) != ids.end();
}

} // anonymous namespace

class DaemonTest : public ::testing::Test {
protected:
    // alice < bob: alice инициирует автоматические подключения
    const std::string aliceId = "aaaa1111aaaa1111aaaa1111aaaa1111";
    const std::string bobId = "bbbb2222bbbb2222bbbb2222bbbb2222";

    std::string tempDir;
    uint16_t alicePort = 0;
    uint16_t bobPort = 0;

    std::unique_ptr<Daemon> alice;
    std::unique_ptr<Daemon> bob;
    EventLog aliceLog;
    EventLog bobLog;

    void SetUp() override {
        tempDir = fs::temp_directory_path().string() + "/cc_daemon_" +
                  std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
        fs::create_directories(tempDir);
        alicePort = freeUdpPort();
        bobPort = freeUdpPort();
        ASSERT_NE(alicePort, 0);
        ASSERT_NE(bobPort, 0);
    }

    void TearDown() override {
        stopBoth();
        fs::remove_all(tempDir);
    }

    /// Остановка обоих демонов с ограничением по времени: зависание = провал теста
    bool stopBoth(std::chrono::milliseconds timeout = 30s) {
        auto stopped = std::make_shared<std::promise<void>>();
        auto done = stopped->get_future();
        std::thread stopper([a = std::move(alice), b = std::move(bob), stopped]() mutable {
            a.reset();
            b.reset();
            stopped->set_value();
        });
        if (done.wait_for(timeout) == std::future_status::ready) {
            stopper.join();
            return true;
        }
        ADD_FAILURE() << "daemon shutdown did not finish in " << timeout.count() << " ms";
        stopper.detach();
        return false;
    }

    DaemonConfig makeConfig(const std::string& name, const std::string& id,
                            uint16_t ownPort, uint16_t peerPort) {
        DaemonConfig config;
        config.deviceName = name;
        config.deviceId = id;
        config.stateDir = tempDir + "/" + name;
        config.tcpPort = 0;
        config.allowAnyPort = true;
        config.discoveryPort = ownPort;
        config.broadcastPort = peerPort;
        config.broadcast = false;
        config.customDevices = {"127.0.0.1"};
        config.broadcastIntervalMs = 200;
        return config;
    }

    void startAlice() {
        alice = std::make_unique<Daemon>(makeConfig("alice", aliceId, alicePort, bobPort));
        aliceLog.attach(*alice);
        ASSERT_TRUE(alice->start()) << alice->getLastError();
    }

    void startBob() {
        bob = std::make_unique<Daemon>(makeConfig("bob", bobId, bobPort, alicePort));
        bobLog.attach(*bob);
        ASSERT_TRUE(bob->start()) << bob->getLastError();
    }

    void startBoth() {
        startBob();
        startAlice();
        ASSERT_TRUE(waitFor([&]() { return alice->getDevice(bobId).has_value(); }));
        ASSERT_TRUE(waitFor([&]() { return bob->getDevice(aliceId).has_value(); }));
    }

    void pairBoth() {
        alice->pair(bobId);
        ASSERT_TRUE(waitFor([&]() { return bobLog.hasPairing(PairingEventType::ConfirmationRequired, aliceId); }));
        bob->confirmPairing(aliceId, true);
        alice->confirmPairing(bobId, true);

        ASSERT_TRUE(waitFor([&]() {
            return aliceLog.hasPairing(PairingEventType::PairingCompleted, bobId) &&
                   bobLog.hasPairing(PairingEventType::PairingCompleted, aliceId);
        }));
        ASSERT_TRUE(waitFor([&]() {
            return contains(alice->getConnectedDevices(), bobId) &&
                   contains(bob->getConnectedDevices(), aliceId);
        }));
    }

    std::string writeFile(const std::string& name, size_t size) {
        std::string path = tempDir + "/" + name;
        std::ofstream out(path, std::ios::binary);
        for (size_t i = 0; i < size; ++i) {
            out.put(static_cast<char>((i * 31 + 7) & 0xFF));
        }
        return path;
    }

    static std::string readFile(const std::string& path) {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }
};

// ═══════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════

TEST_F(DaemonTest, CommandsRequireRunningDaemon) {
    Daemon daemon(makeConfig("idle", aliceId, alicePort, bobPort));
    EXPECT_EQ(daemon.getState(), Daemon::DaemonState::Stopped);

    try {
        daemon.pair(bobId);
        FAIL() << "expected InvalidState";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidState);
    }
    EXPECT_THROW(daemon.sendPacket(bobId, Packet::ping()), ProtocolError);
    EXPECT_TRUE(daemon.getConnectedDevices().empty());
}

TEST_F(DaemonTest, StartAndStop) {
    startAlice();
    EXPECT_EQ(alice->getState(), Daemon::DaemonState::Running);
    EXPECT_NE(alice->getTcpPort(), 0);
    EXPECT_EQ(alice->getDiscoveryPort(), alicePort);

    DeviceInfo identity = alice->getLocalIdentity();
    EXPECT_EQ(identity.deviceId, aliceId);
    EXPECT_EQ(identity.deviceName, "alice");
    EXPECT_EQ(identity.tcpPort.value_or(0), alice->getTcpPort());
    EXPECT_TRUE(identity.incomingCapabilities.count(PACKET_TYPE_PING));
    EXPECT_FALSE(alice->getLocalFingerprint().empty());

    // Второй start не меняет состояние
    EXPECT_TRUE(alice->start());

    alice->stop();
    EXPECT_EQ(alice->getState(), Daemon::DaemonState::Stopped);
    alice->stop();
}

TEST_F(DaemonTest, StartFailsWithUnusableStateDir) {
    std::string blocker = tempDir + "/blocker";
    std::ofstream(blocker) << "file";

    DaemonConfig config = makeConfig("broken", aliceId, alicePort, bobPort);
    config.stateDir = blocker + "/state";
    Daemon daemon(config);

    EXPECT_FALSE(daemon.start());
    EXPECT_EQ(daemon.getState(), Daemon::DaemonState::Error);
    EXPECT_FALSE(daemon.getLastError().empty());
}

TEST_F(DaemonTest, IdentityIsPersistedAcrossRestarts) {
    DaemonConfig config = makeConfig("persist", "", alicePort, bobPort);
    std::string firstId;
    std::string firstFingerprint;
    {
        Daemon daemon(config);
        ASSERT_TRUE(daemon.start()) << daemon.getLastError();
        firstId = daemon.getLocalIdentity().deviceId;
        firstFingerprint = daemon.getLocalFingerprint();
    }
    EXPECT_EQ(firstId.size(), 32u);

    Daemon again(config);
    ASSERT_TRUE(again.start()) << again.getLastError();
    EXPECT_EQ(again.getLocalIdentity().deviceId, firstId);
    EXPECT_EQ(again.getLocalFingerprint(), firstFingerprint);
}

// ═══════════════════════════════════════════════════════════
// Discovery + pairing
// ═══════════════════════════════════════════════════════════

TEST_F(DaemonTest, DiscoversPeerOverLoopback) {
    startBoth();

    auto device = alice->getDevice(bobId);
    ASSERT_TRUE(device.has_value());
    EXPECT_EQ(device->info.deviceName, "bob");
    EXPECT_EQ(device->host, "127.0.0.1");
    EXPECT_EQ(device->port, bob->getTcpPort());
    EXPECT_FALSE(device->isTrusted);

    std::lock_guard<std::mutex> lock(aliceLog.mutex);
    EXPECT_TRUE(std::any_of(aliceLog.discovery.begin(), aliceLog.discovery.end(), [&](const DiscoveryEvent& e) {
        return e.type == DiscoveryEventType::DeviceFound && e.info.deviceId == bobId;
    }));
}

TEST_F(DaemonTest, PairingShowsMatchingFingerprints) {
    startBoth();
    alice->pair(bobId);

    ASSERT_TRUE(waitFor([&]() { return bobLog.findPairing(PairingEventType::ConfirmationRequired).has_value(); }));
    auto request = bobLog.findPairing(PairingEventType::ConfirmationRequired);
    EXPECT_EQ(request->deviceId, aliceId);
    EXPECT_EQ(request->peerFingerprint, alice->getLocalFingerprint());
    EXPECT_EQ(request->localFingerprint, bob->getLocalFingerprint());

    // До подтверждения сессия ограничена
    EXPECT_FALSE(contains(alice->getConnectedDevices(), bobId));
    bob->confirmPairing(aliceId, false);
    ASSERT_TRUE(waitFor([&]() { return aliceLog.hasPairing(PairingEventType::PairingRejected, bobId); }));
    EXPECT_FALSE(alice->pairing()->isPaired(bobId));
}

TEST_F(DaemonTest, PairedPeersExchangePing) {
    startBoth();
    pairBoth();

    EXPECT_TRUE(alice->getDevice(bobId)->isTrusted);
    EXPECT_TRUE(bob->getDevice(aliceId)->isTrusted);

    EXPECT_TRUE(alice->sendPacket(bobId, Packet::ping()));
    EXPECT_TRUE(waitFor([&]() { return bobLog.hasPacket(PACKET_TYPE_PING); }));
    // PingPlugin на стороне bob отвечает
    EXPECT_TRUE(waitFor([&]() { return aliceLog.hasPacket(PACKET_TYPE_PING); }));
}

TEST_F(DaemonTest, UnpairDisconnectsBothSides) {
    startBoth();
    pairBoth();

    alice->unpair(bobId);
    EXPECT_TRUE(waitFor([&]() { return bobLog.hasPairing(PairingEventType::Unpaired, aliceId); }));
    EXPECT_TRUE(waitFor([&]() {
        return !contains(alice->getConnectedDevices(), bobId) &&
               !contains(bob->getConnectedDevices(), aliceId);
    }));
    EXPECT_FALSE(alice->getDevice(bobId)->isTrusted);
}

// ═══════════════════════════════════════════════════════════
// Recovery
// ═══════════════════════════════════════════════════════════

TEST_F(DaemonTest, ReconnectsAfterTransportFailure) {
    startBoth();
    pairBoth();

    auto session = alice->connections()->getSession(bobId);
    ASSERT_NE(session, nullptr);
    size_t connectedBefore = aliceLog.count(ConnectionEventType::Connected);
    session->close(DisconnectReason::TransportUnavailable);

    EXPECT_TRUE(waitFor([&]() { return aliceLog.count(ConnectionEventType::Connected) > connectedBefore; }, 15s));
    EXPECT_TRUE(waitFor([&]() {
        return contains(alice->getConnectedDevices(), bobId) &&
               contains(bob->getConnectedDevices(), aliceId);
    }));

    EXPECT_TRUE(alice->sendPacket(bobId, Packet::ping()));
}

TEST_F(DaemonTest, TrustedPeersReconnectAfterRestart) {
    startBoth();
    pairBoth();

    alice->stop();
    bob->stop();
    alice.reset();
    bob.reset();

    startBob();
    startAlice();

    // Пары сохранены; alice подключается сама после discovery
    EXPECT_TRUE(alice->pairing()->isPaired(bobId));
    EXPECT_TRUE(bob->pairing()->isPaired(aliceId));
    EXPECT_TRUE(waitFor([&]() {
        return contains(alice->getConnectedDevices(), bobId) &&
               contains(bob->getConnectedDevices(), aliceId);
    }, 15s));
}

TEST_F(DaemonTest, ChangedCertificateBreaksTrust) {
    startBoth();
    pairBoth();

    bob->stop();
    bob.reset();
    fs::remove(tempDir + "/bob/" + CERTIFICATE_FILE);
    fs::remove(tempDir + "/bob/" + PRIVATE_KEY_FILE);
    startBob();

    // Автоподключение alice обнаруживает новый сертификат
    EXPECT_TRUE(waitFor([&]() { return aliceLog.hasPairing(PairingEventType::TrustBroken, bobId); }, 15s));
    EXPECT_FALSE(alice->pairing()->isPaired(bobId));
    EXPECT_FALSE(contains(alice->getConnectedDevices(), bobId));
}

// ═══════════════════════════════════════════════════════════
// File transfer
// ═══════════════════════════════════════════════════════════

TEST_F(DaemonTest, SendsFileToPairedPeer) {
    startBoth();
    pairBoth();

    const size_t size = 5 * 1024 * 1024;
    std::string source = writeFile("report.bin", size);
    std::string transferId = alice->sendFile(bobId, source);
    EXPECT_FALSE(transferId.empty());

    ASSERT_TRUE(waitFor([&]() { return bobLog.findTransfer(TransferStatus::Completed).has_value(); }, 30s));
    ASSERT_TRUE(waitFor([&]() { return aliceLog.findTransfer(TransferStatus::Completed).has_value(); }, 30s));

    auto received = bobLog.findTransfer(TransferStatus::Completed);
    EXPECT_EQ(received->filename, "report.bin");
    EXPECT_EQ(received->bytesTransferred, size);
    EXPECT_EQ(received->direction, TransferDirection::Receive);
    EXPECT_EQ(fs::path(received->localPath).parent_path(), fs::path(bob->config().downloadDir));
    EXPECT_EQ(readFile(received->localPath), readFile(source));

    EXPECT_FALSE(bobLog.findTransfer(TransferStatus::Failed).has_value());
    EXPECT_TRUE(waitFor([&]() { return alice->getMemoryStats().bytesInFlight == 0; }));
    EXPECT_TRUE(waitFor([&]() { return bob->getMemoryStats().activeTransfers == 0; }));
}

TEST_F(DaemonTest, SendFileToUntrustedPeerFails) {
    startBoth();
    std::string source = writeFile("secret.bin", 1024);
    EXPECT_THROW(alice->sendFile(bobId, source), ProtocolError);
}

TEST_F(DaemonTest, StopWhileSessionsCloseDoesNotHang) {
    startBoth();
    pairBoth();

    for (int round = 0; round < 3; ++round) {
        // Сессия закрывается одновременно с остановкой обоих демонов
        alice->disconnect(bobId);
        ASSERT_TRUE(stopBoth()) << "round " << round;

        startBob();
        startAlice();
        ASSERT_TRUE(waitFor([&]() {
            return contains(alice->getConnectedDevices(), bobId) &&
                   contains(bob->getConnectedDevices(), aliceId);
        }, 15s)) << "round " << round;
    }

    // Остановка с открытыми сессиями
    ASSERT_TRUE(stopBoth());
    EXPECT_TRUE(alice == nullptr);
    EXPECT_TRUE(bob == nullptr);
}

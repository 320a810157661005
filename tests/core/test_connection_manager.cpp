// test_connection_manager.cpp — Sessions between two managers over loopback TLS

#include <gtest/gtest.h>
#include <chrono>
#include <future>
#include <mutex>
#include <sstream>
#include <thread>

#include "cosmicconnect/Certificate.h"
#include "cosmicconnect/DeviceManager.h"
#include "cosmicconnect/Error.h"
#include "cosmicconnect/Pairing.h"
#include "cosmicconnect/Plugin.h"
#include "cosmicconnect/Plugins/PingPlugin.h"
#include "cosmicconnect/TransferManager.h"
#include "cosmicconnect/TrustedPeerStore.h"
#include "cosmicconnect/Network/ConnectionManager.h"
#include "cosmicconnect/Network/PayloadChannel.h"
#include "cosmicconnect/Network/TlsStream.h"

using namespace CosmicConnect;
using namespace std::chrono_literals;

namespace {

template <typename Predicate>
bool waitFor(Predicate predicate, std::chrono::milliseconds timeout = 5000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) return true;
        std::this_thread::sleep_for(20ms);
    }
    return predicate();
}

/// Одна сторона соединения: сертификат, реестр устройств, pairing и менеджер
struct Peer {
    std::string id;
    LocalCertificate certificate;
    std::shared_ptr<DeviceManager> devices = std::make_shared<DeviceManager>();
    std::shared_ptr<TrustedPeerStore> store = std::make_shared<TrustedPeerStore>();
    std::shared_ptr<PluginRegistry> plugins = PluginRegistry::createDefault();
    std::shared_ptr<Pairing> pairing;
    std::unique_ptr<ConnectionManager> connections;

    std::mutex mutex;
    std::vector<ConnectionEvent> connectionEvents;
    std::vector<PairingEvent> pairingEvents;

    explicit Peer(const std::string& deviceId)
        : id(deviceId)
        , certificate(LocalCertificate::generate(deviceId)) {
        pairing = std::make_shared<Pairing>(devices, store, certificate.fingerprint());

        ConnectionManagerConfig config;
        config.tcpPort = 0;
        auto registry = plugins;
        connections = std::make_unique<ConnectionManager>(
            config, certificate,
            [deviceId, registry]() {
                DeviceInfo info;
                info.deviceId = deviceId;
                info.deviceName = "Test " + deviceId.substr(0, 4);
                info.deviceType = DeviceType::Desktop;
                info.protocolVersion = PROTOCOL_VERSION;
                info.incomingCapabilities = registry->incomingCapabilities();
                info.outgoingCapabilities = registry->outgoingCapabilities();
                return info;
            },
            devices, plugins, std::make_shared<ResourceManager>());

        ConnectionManager* cm = connections.get();
        pairing->setPacketSender([cm](const std::string& target, const Packet& packet) {
            cm->send(target, packet);
        });
        pairing->setEventCallback([this, cm](const PairingEvent& event) {
            if (event.type == PairingEventType::PairingCompleted) {
                cm->promoteSession(event.deviceId);
            } else if (event.type == PairingEventType::Unpaired ||
                       event.type == PairingEventType::TrustBroken) {
                cm->handleUnpaired(event.deviceId);
            }
            std::lock_guard<std::mutex> lock(mutex);
            pairingEvents.push_back(event);
        });
        connections->setPairing(pairing);
        connections->setEventCallback([this](const ConnectionEvent& event) {
            std::lock_guard<std::mutex> lock(mutex);
            connectionEvents.push_back(event);
        });
    }

    ~Peer() {
        connections->stop();
        pairing->stop();
    }

    size_t countConnection(ConnectionEventType type) {
        std::lock_guard<std::mutex> lock(mutex);
        size_t n = 0;
        for (const auto& e : connectionEvents) {
            if (e.type == type) ++n;
        }
        return n;
    }

    bool hasPairingEvent(PairingEventType type) {
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& e : pairingEvents) {
            if (e.type == type) return true;
        }
        return false;
    }

    std::optional<Packet> receivedPacket(const std::string& type) {
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& e : connectionEvents) {
            if (e.type == ConnectionEventType::PacketReceived && e.packet && e.packet->isType(type)) {
                return e.packet;
            }
        }
        return std::nullopt;
    }
};

} // anonymous namespace

class ConnectionManagerTest : public ::testing::Test {
protected:
    std::unique_ptr<Peer> alice;
    std::unique_ptr<Peer> bob;

    void SetUp() override {
        alice = std::make_unique<Peer>("aaaa1111aaaa1111aaaa1111aaaa1111");
        bob = std::make_unique<Peer>("bbbb2222bbbb2222bbbb2222bbbb2222");
        ASSERT_TRUE(alice->connections->start());
        ASSERT_TRUE(bob->connections->start());
        alice->pairing->start();
        bob->pairing->start();
    }

    void TearDown() override {
        alice.reset();
        bob.reset();
    }

    void connectAliceToBob() {
        std::string peerId = alice->connections->connectToAddress("127.0.0.1", bob->connections->getPort());
        ASSERT_EQ(peerId, bob->id);
        ASSERT_TRUE(waitFor([&]() { return bob->connections->getSession(alice->id) != nullptr; }));
    }

    void pairAliceWithBob() {
        connectAliceToBob();
        alice->pairing->requestPairing(bob->id);
        ASSERT_TRUE(waitFor([&]() { return bob->pairing->hasPendingRequest(alice->id); }));
        bob->pairing->confirm(alice->id, true);
        alice->pairing->confirm(bob->id, true);
        ASSERT_TRUE(waitFor([&]() {
            return alice->pairing->isPaired(bob->id) && bob->pairing->isPaired(alice->id);
        }));
        ASSERT_TRUE(waitFor([&]() {
            return alice->countConnection(ConnectionEventType::Connected) == 1 &&
                   bob->countConnection(ConnectionEventType::Connected) == 1;
        }));
    }
};

TEST_F(ConnectionManagerTest, StartsOnFreePort) {
    EXPECT_TRUE(alice->connections->isRunning());
    EXPECT_NE(alice->connections->getPort(), 0);
    EXPECT_NE(alice->connections->getPort(), bob->connections->getPort());
    EXPECT_EQ(alice->countConnection(ConnectionEventType::ManagerStarted), 1u);
}

TEST_F(ConnectionManagerTest, UntrustedPeerGetsRestrictedSession) {
    connectAliceToBob();

    auto session = alice->connections->getSession(bob->id);
    ASSERT_NE(session, nullptr);
    EXPECT_TRUE(session->isRestricted());
    EXPECT_EQ(session->transportKind(), TransportKind::Tls);
    EXPECT_TRUE(alice->connections->connectedDevices().empty());
    EXPECT_EQ(alice->countConnection(ConnectionEventType::Connected), 0u);

    // Данные до pairing запрещены
    try {
        alice->connections->send(bob->id, Packet::ping());
        FAIL() << "expected Unauthorized";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Unauthorized);
    }

    // Устройство узнано из identity вместе с отпечатком
    auto device = alice->devices->get(bob->id);
    ASSERT_TRUE(device.has_value());
    EXPECT_EQ(device->certificateFingerprint, bob->certificate.fingerprint());
    EXPECT_FALSE(device->isTrusted);
}

TEST_F(ConnectionManagerTest, PairingPromotesSessionAndPingRoundTrips) {
    pairAliceWithBob();

    auto session = alice->connections->getSession(bob->id);
    ASSERT_NE(session, nullptr);
    EXPECT_FALSE(session->isRestricted());
    EXPECT_EQ(alice->connections->connectedDevices(), std::vector<std::string>{bob->id});
    EXPECT_EQ(alice->devices->get(bob->id)->connectionState, ConnectionState::Connected);
    EXPECT_TRUE(alice->store->contains(bob->id));
    EXPECT_EQ(alice->store->get(bob->id)->certificateDer, bob->certificate.der());

    auto* ping = dynamic_cast<PingPlugin*>(session->findPlugin(PingPlugin::NAME));
    ASSERT_NE(ping, nullptr);
    ping->sendPing();

    EXPECT_TRUE(waitFor([&]() { return ping->repliesReceived() == 1; }));
    auto bobSession = bob->connections->getSession(alice->id);
    ASSERT_NE(bobSession, nullptr);
    auto* bobPing = dynamic_cast<PingPlugin*>(bobSession->findPlugin(PingPlugin::NAME));
    ASSERT_NE(bobPing, nullptr);
    EXPECT_EQ(bobPing->pingsReceived(), 1u);
    EXPECT_TRUE(bob->receivedPacket(PACKET_TYPE_PING).has_value());
}

TEST_F(ConnectionManagerTest, DisconnectEmitsReason) {
    pairAliceWithBob();

    EXPECT_TRUE(alice->connections->disconnect(bob->id));
    ASSERT_TRUE(waitFor([&]() { return alice->countConnection(ConnectionEventType::Disconnected) == 1; }));
    EXPECT_TRUE(waitFor([&]() { return bob->countConnection(ConnectionEventType::Disconnected) == 1; }));

    {
        std::lock_guard<std::mutex> lock(alice->mutex);
        for (const auto& e : alice->connectionEvents) {
            if (e.type == ConnectionEventType::Disconnected) {
                EXPECT_EQ(e.reason, DisconnectReason::LocalRequest);
            }
        }
    }
    EXPECT_FALSE(alice->connections->isConnected(bob->id));
    EXPECT_FALSE(alice->connections->disconnect(bob->id));
    EXPECT_EQ(alice->devices->get(bob->id)->connectionState, ConnectionState::Disconnected);
}

TEST_F(ConnectionManagerTest, ReconnectToTrustedPeerByDeviceId) {
    pairAliceWithBob();
    alice->connections->disconnect(bob->id);
    ASSERT_TRUE(waitFor([&]() { return !alice->connections->isConnected(bob->id); }));

    alice->connections->connect(bob->id);
    EXPECT_TRUE(alice->connections->isConnected(bob->id));
    EXPECT_TRUE(waitFor([&]() { return alice->countConnection(ConnectionEventType::Connected) == 2; }));

    // Повторный Connect при живой сессии ничего не делает
    EXPECT_NO_THROW(alice->connections->connect(bob->id));
}

TEST_F(ConnectionManagerTest, UnpairClosesSession) {
    pairAliceWithBob();

    alice->pairing->unpair(bob->id);
    ASSERT_TRUE(waitFor([&]() { return alice->countConnection(ConnectionEventType::Disconnected) == 1; }));
    EXPECT_FALSE(alice->store->contains(bob->id));
    EXPECT_TRUE(waitFor([&]() { return !bob->pairing->isPaired(alice->id); }));
}

TEST_F(ConnectionManagerTest, ChangedCertificateBreaksTrust) {
    auto impostorDer = LocalCertificate::generate(bob->id).der();

    TrustedPeerRecord record;
    record.deviceId = bob->id;
    record.name = "Bob";
    record.certificateDer = impostorDer;
    record.fingerprintSha256 = Crypto::fingerprint(impostorDer);
    ASSERT_TRUE(alice->store->put(record));
    alice->devices->addTrusted(record);

    DeviceInfo info;
    info.deviceId = bob->id;
    info.deviceName = "Bob";
    info.protocolVersion = PROTOCOL_VERSION;
    info.tcpPort = bob->connections->getPort();
    alice->devices->updateFromIdentity(info, "127.0.0.1", bob->connections->getPort());

    try {
        alice->connections->connect(bob->id);
        FAIL() << "expected CertificateMismatch";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::CertificateMismatch);
    }

    EXPECT_TRUE(alice->hasPairingEvent(PairingEventType::TrustBroken));
    EXPECT_FALSE(alice->devices->isTrusted(bob->id));
    EXPECT_FALSE(alice->store->contains(bob->id));
    EXPECT_EQ(alice->connections->getSession(bob->id), nullptr);
}

TEST_F(ConnectionManagerTest, CommandErrors) {
    try {
        alice->connections->connect("nobody");
        FAIL() << "expected NotFound";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NotFound);
    }

    try {
        alice->connections->send("nobody", Packet::ping());
        FAIL() << "expected TransportUnavailable";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::TransportUnavailable);
    }

    alice->connections->stop();
    try {
        alice->connections->connect(bob->id);
        FAIL() << "expected InvalidState";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidState);
    }
}

TEST_F(ConnectionManagerTest, PayloadRequiresPairing) {
    connectAliceToBob();
    try {
        alice->connections->sendWithPayload(bob->id, Packet(PACKET_TYPE_SHARE_REQUEST), 10);
        FAIL() << "expected Unauthorized";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Unauthorized);
    }
    EXPECT_EQ(alice->connections->resources().stats().activeTransfers, 0u);
}

TEST_F(ConnectionManagerTest, PayloadTransferBetweenPairedPeers) {
    pairAliceWithBob();

    std::string data(256 * 1024, 'x');
    for (size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<char>(i % 251);
    }

    Packet offer(PACKET_TYPE_SHARE_REQUEST, {{"filename", "blob.bin"}});
    auto upload = alice->connections->sendWithPayload(bob->id, offer, data.size());
    EXPECT_EQ(alice->connections->resources().stats().bytesInFlight, data.size());

    auto senderFuture = std::async(std::launch::async, [&]() {
        auto stream = alice->connections->acceptPayload(upload);
        std::istringstream source(data);
        return PayloadChannel::send(*stream, source, data.size());
    });

    ASSERT_TRUE(waitFor([&]() { return bob->receivedPacket(PACKET_TYPE_SHARE_REQUEST).has_value(); }));
    auto packet = *bob->receivedPacket(PACKET_TYPE_SHARE_REQUEST);
    ASSERT_TRUE(packet.hasPayload());
    EXPECT_EQ(*packet.payloadSize, static_cast<int64_t>(data.size()));

    auto download = bob->connections->openPayload(alice->id, packet);
    std::ostringstream sink;
    PayloadChannel::receive(*download.stream, sink, download.size);

    EXPECT_EQ(senderFuture.get(), data.size());
    EXPECT_EQ(sink.str(), data);

    upload.grant.release();
    download.grant.release();
    EXPECT_EQ(alice->connections->resources().stats().bytesInFlight, 0u);
    EXPECT_EQ(bob->connections->resources().stats().bytesInFlight, 0u);
}

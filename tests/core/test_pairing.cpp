// test_pairing.cpp — Pairing state machine

#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <mutex>

#include "cosmicconnect/Certificate.h"
#include "cosmicconnect/DeviceManager.h"
#include "cosmicconnect/Error.h"
#include "cosmicconnect/Pairing.h"
#include "cosmicconnect/TrustedPeerStore.h"

using namespace CosmicConnect;
using namespace std::chrono_literals;

class PairingTest : public ::testing::Test {
protected:
    std::shared_ptr<DeviceManager> devices = std::make_shared<DeviceManager>();
    std::shared_ptr<TrustedPeerStore> store = std::make_shared<TrustedPeerStore>();
    std::unique_ptr<Pairing> pairing;

    std::mutex mutex;
    std::vector<std::pair<std::string, Packet>> sent;
    std::vector<PairingEvent> events;

    const std::vector<uint8_t> peerDer = {0x30, 0x82, 0x01, 0x0a, 0x02, 0x82};

    void SetUp() override {
        makePairing();

        DeviceInfo info;
        info.deviceId = "peer1";
        info.deviceName = "Peer";
        info.deviceType = DeviceType::Phone;
        devices->updateFromIdentity(info, "127.0.0.1", 1716);
    }

    void makePairing() {
        PairingConfig config;
        config.timeoutMs = 1000;
        config.checkIntervalMs = 60000;
        pairing = std::make_unique<Pairing>(devices, store, "LOCAL:FP", config);
        pairing->setPacketSender([this](const std::string& id, const Packet& packet) {
            std::lock_guard<std::mutex> lock(mutex);
            sent.emplace_back(id, packet);
        });
        pairing->setEventCallback([this](const PairingEvent& event) {
            std::lock_guard<std::mutex> lock(mutex);
            events.push_back(event);
        });
    }

    void connectPeer() {
        pairing->setPeerCertificate("peer1", peerDer);
    }

    bool lastPairValue() {
        std::lock_guard<std::mutex> lock(mutex);
        return !sent.empty() && sent.back().second.body["pair"].get<bool>();
    }

    bool hasEvent(PairingEventType type) {
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& e : events) {
            if (e.type == type) return true;
        }
        return false;
    }
};

TEST_F(PairingTest, RequestRequiresSecureLink) {
    try {
        pairing->requestPairing("peer1");
        FAIL() << "expected TransportUnavailable";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::TransportUnavailable);
    }
    EXPECT_EQ(pairing->getStatus("peer1"), PairingStatus::NotPaired);
}

TEST_F(PairingTest, RequestForUnknownDevice) {
    try {
        pairing->requestPairing("ghost");
        FAIL() << "expected NotFound";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NotFound);
    }
}

TEST_F(PairingTest, OutgoingRequestCompletesAfterPeerAndLocalConfirm) {
    connectPeer();
    pairing->requestPairing("peer1");

    EXPECT_EQ(pairing->getStatus("peer1"), PairingStatus::Requested);
    EXPECT_TRUE(pairing->hasPendingRequest("peer1"));
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].second.type, PACKET_TYPE_PAIR);
    EXPECT_TRUE(lastPairValue());

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, PairingEventType::ConfirmationRequired);
    EXPECT_EQ(events[0].localFingerprint, "LOCAL:FP");
    EXPECT_EQ(events[0].peerFingerprint, Crypto::fingerprint(peerDer));

    // Второй запрос во время ожидания
    EXPECT_THROW(pairing->requestPairing("peer1"), ProtocolError);

    pairing->handlePacket("peer1", Packet::pair(true));
    EXPECT_FALSE(pairing->isPaired("peer1"));

    pairing->confirm("peer1", true);
    EXPECT_TRUE(pairing->isPaired("peer1"));
    EXPECT_FALSE(pairing->hasPendingRequest("peer1"));
    EXPECT_TRUE(hasEvent(PairingEventType::PairingCompleted));
    EXPECT_TRUE(devices->isTrusted("peer1"));

    auto record = store->get("peer1");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->certificateDer, peerDer);
    EXPECT_EQ(record->name, "Peer");

    EXPECT_THROW(pairing->requestPairing("peer1"), ProtocolError);
}

TEST_F(PairingTest, StoreWriteFailureLeavesPeerUnpaired) {
    namespace fs = std::filesystem;
    // Родитель файла хранилища является обычным файлом: запись невозможна
    std::string blocker = fs::temp_directory_path().string() + "/cc_pairing_blocker_" +
        std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
    std::ofstream(blocker) << "x";
    store = std::make_shared<TrustedPeerStore>(blocker + "/trusted_devices.json");
    makePairing();

    connectPeer();
    pairing->requestPairing("peer1");
    pairing->handlePacket("peer1", Packet::pair(true));
    pairing->confirm("peer1", true);

    EXPECT_FALSE(pairing->isPaired("peer1"));
    EXPECT_EQ(pairing->getStatus("peer1"), PairingStatus::NotPaired);
    EXPECT_FALSE(pairing->hasPendingRequest("peer1"));
    EXPECT_FALSE(store->contains("peer1"));
    EXPECT_FALSE(hasEvent(PairingEventType::PairingCompleted));
    EXPECT_TRUE(hasEvent(PairingEventType::PairingRejected));
    EXPECT_FALSE(lastPairValue());

    fs::remove(blocker);
}

TEST_F(PairingTest, LocalConfirmBeforePeerAccept) {
    connectPeer();
    pairing->requestPairing("peer1");
    pairing->confirm("peer1", true);
    EXPECT_FALSE(pairing->isPaired("peer1"));

    pairing->handlePacket("peer1", Packet::pair(true));
    EXPECT_TRUE(pairing->isPaired("peer1"));
}

TEST_F(PairingTest, IncomingRequestAcceptedLocally) {
    connectPeer();
    pairing->handlePacket("peer1", Packet::pair(true));

    EXPECT_EQ(pairing->getStatus("peer1"), PairingStatus::RequestedByPeer);
    EXPECT_TRUE(hasEvent(PairingEventType::PairingRequested));
    EXPECT_TRUE(hasEvent(PairingEventType::ConfirmationRequired));

    pairing->confirm("peer1", true);
    EXPECT_TRUE(pairing->isPaired("peer1"));
    EXPECT_TRUE(lastPairValue());
}

TEST_F(PairingTest, RequestPairingAcceptsPendingPeerRequest) {
    connectPeer();
    pairing->handlePacket("peer1", Packet::pair(true));
    pairing->requestPairing("peer1");
    EXPECT_TRUE(pairing->isPaired("peer1"));
}

TEST_F(PairingTest, IncomingRequestWithoutCertificateIgnored) {
    pairing->handlePacket("peer1", Packet::pair(true));
    EXPECT_FALSE(pairing->hasPendingRequest("peer1"));
    EXPECT_TRUE(events.empty());
}

TEST_F(PairingTest, LocalRejectSendsCancel) {
    connectPeer();
    pairing->handlePacket("peer1", Packet::pair(true));
    pairing->confirm("peer1", false);

    EXPECT_EQ(pairing->getStatus("peer1"), PairingStatus::NotPaired);
    EXPECT_FALSE(lastPairValue());
    EXPECT_TRUE(hasEvent(PairingEventType::PairingRejected));
    EXPECT_FALSE(store->contains("peer1"));
}

TEST_F(PairingTest, PeerRejectsOutgoingRequest) {
    connectPeer();
    pairing->requestPairing("peer1");
    pairing->handlePacket("peer1", Packet::pair(false));

    EXPECT_EQ(pairing->getStatus("peer1"), PairingStatus::Rejected);
    EXPECT_TRUE(hasEvent(PairingEventType::PairingRejected));
    EXPECT_THROW(pairing->confirm("peer1", true), ProtocolError);
}

TEST_F(PairingTest, ConfirmWithoutRequestIsInvalid) {
    try {
        pairing->confirm("peer1", true);
        FAIL() << "expected InvalidState";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidState);
    }
}

TEST_F(PairingTest, PendingRequestTimesOut) {
    connectPeer();
    pairing->requestPairing("peer1");

    pairing->checkTimeouts(Pairing::Clock::now() + 500ms);
    EXPECT_TRUE(pairing->hasPendingRequest("peer1"));

    pairing->checkTimeouts(Pairing::Clock::now() + 1500ms);
    EXPECT_FALSE(pairing->hasPendingRequest("peer1"));
    EXPECT_EQ(pairing->getStatus("peer1"), PairingStatus::NotPaired);
    EXPECT_TRUE(hasEvent(PairingEventType::PairingTimedOut));
}

TEST_F(PairingTest, UnpairRemovesTrust) {
    connectPeer();
    pairing->handlePacket("peer1", Packet::pair(true));
    pairing->confirm("peer1", true);
    ASSERT_TRUE(store->contains("peer1"));

    pairing->unpair("peer1");
    EXPECT_FALSE(pairing->isPaired("peer1"));
    EXPECT_FALSE(store->contains("peer1"));
    EXPECT_FALSE(devices->isTrusted("peer1"));
    EXPECT_FALSE(lastPairValue());
    EXPECT_TRUE(hasEvent(PairingEventType::Unpaired));

    EXPECT_THROW(pairing->unpair("ghost"), ProtocolError);
}

TEST_F(PairingTest, PeerUnpairRemovesTrust) {
    connectPeer();
    pairing->handlePacket("peer1", Packet::pair(true));
    pairing->confirm("peer1", true);

    pairing->handlePacket("peer1", Packet::pair(false));
    EXPECT_FALSE(pairing->isPaired("peer1"));
    EXPECT_FALSE(store->contains("peer1"));
    EXPECT_TRUE(hasEvent(PairingEventType::Unpaired));
}

TEST_F(PairingTest, RepeatedRequestFromPairedPeerConfirmed) {
    connectPeer();
    pairing->handlePacket("peer1", Packet::pair(true));
    pairing->confirm("peer1", true);
    size_t before = sent.size();

    pairing->handlePacket("peer1", Packet::pair(true));
    EXPECT_EQ(sent.size(), before + 1);
    EXPECT_TRUE(lastPairValue());
    EXPECT_TRUE(pairing->isPaired("peer1"));
}

TEST_F(PairingTest, CertificateMismatchBreaksTrust) {
    connectPeer();
    pairing->handlePacket("peer1", Packet::pair(true));
    pairing->confirm("peer1", true);

    pairing->handleCertificateMismatch("peer1", "fingerprint changed");
    EXPECT_FALSE(pairing->isPaired("peer1"));
    EXPECT_FALSE(store->contains("peer1"));
    EXPECT_TRUE(hasEvent(PairingEventType::TrustBroken));

    // Новый сертификат требует нового pairing
    EXPECT_THROW(pairing->requestPairing("peer1"), ProtocolError);
}

TEST_F(PairingTest, MalformedPairPacketIgnored) {
    connectPeer();
    Packet packet = Packet::pair(true);
    packet.body["pair"] = "yes";
    pairing->handlePacket("peer1", packet);
    EXPECT_FALSE(pairing->hasPendingRequest("peer1"));
}

TEST_F(PairingTest, StartLoadsTrustedPeers) {
    TrustedPeerRecord record;
    record.deviceId = "laptop1";
    record.name = "Laptop";
    record.certificateDer = peerDer;
    record.fingerprintSha256 = Crypto::fingerprint(peerDer);
    ASSERT_TRUE(store->put(record));

    pairing->start();
    EXPECT_TRUE(pairing->isPaired("laptop1"));
    EXPECT_TRUE(devices->isTrusted("laptop1"));
    pairing->stop();
}

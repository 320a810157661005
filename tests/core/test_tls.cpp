// test_tls.cpp — Certificates, crypto helpers and mutual TLS over loopback

#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <future>
#include <regex>
#include <thread>

#include "cosmicconnect/Certificate.h"
#include "cosmicconnect/Error.h"
#include "cosmicconnect/Network/TcpTransport.h"
#include "cosmicconnect/Network/TlsStream.h"

namespace fs = std::filesystem;
using namespace CosmicConnect;
using namespace std::chrono_literals;

// ═══════════════════════════════════════════════════════════
// Crypto
// ═══════════════════════════════════════════════════════════

TEST(CryptoTest, UuidIsVersion4) {
    std::string uuid = Crypto::generateUUID();
    std::regex pattern("^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");
    EXPECT_TRUE(std::regex_match(uuid, pattern)) << uuid;
    EXPECT_NE(uuid, Crypto::generateUUID());
}

TEST(CryptoTest, Sha256KnownVector) {
    std::vector<uint8_t> abc = {'a', 'b', 'c'};
    EXPECT_EQ(Crypto::toHex(Crypto::sha256(abc)),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(CryptoTest, Base64) {
    std::vector<uint8_t> data = {'h', 'e', 'l', 'l', 'o'};
    EXPECT_EQ(Crypto::base64Encode(data), "aGVsbG8=");
    auto decoded = Crypto::base64Decode("aGVsbG8=");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, data);
    EXPECT_FALSE(Crypto::base64Decode("***").has_value());
}

TEST(CryptoTest, RandomBytesLength) {
    EXPECT_EQ(Crypto::randomBytes(32).size(), 32u);
}

// ═══════════════════════════════════════════════════════════
// LocalCertificate
// ═══════════════════════════════════════════════════════════

class CertificateTest : public ::testing::Test {
protected:
    std::string tempDir;

    void SetUp() override {
        tempDir = fs::temp_directory_path().string() + "/cc_cert_" +
                  std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
        fs::create_directories(tempDir);
    }

    void TearDown() override {
        fs::remove_all(tempDir);
    }
};

TEST_F(CertificateTest, GeneratedCertificateHasDeviceIdAsCommonName) {
    auto cert = LocalCertificate::generate("device_one");
    EXPECT_EQ(cert.commonName(), "device_one");
    EXPECT_FALSE(cert.der().empty());

    auto cn = Crypto::certificateCommonName(cert.der());
    ASSERT_TRUE(cn.has_value());
    EXPECT_EQ(*cn, "device_one");

    std::regex fingerprint("^([0-9A-F]{2}:){31}[0-9A-F]{2}$");
    EXPECT_TRUE(std::regex_match(cert.fingerprint(), fingerprint)) << cert.fingerprint();
    EXPECT_EQ(cert.fingerprint(), Crypto::fingerprint(cert.der()));
}

TEST_F(CertificateTest, PemRoundTrip) {
    auto cert = LocalCertificate::generate("device_pem");
    auto loaded = LocalCertificate::fromPem(cert.certificatePem(), cert.privateKeyPem());
    EXPECT_EQ(loaded.fingerprint(), cert.fingerprint());
}

TEST_F(CertificateTest, MismatchedKeyRejected) {
    auto a = LocalCertificate::generate("device_a");
    auto b = LocalCertificate::generate("device_b");
    EXPECT_THROW(LocalCertificate::fromPem(a.certificatePem(), b.privateKeyPem()), std::runtime_error);
}

TEST_F(CertificateTest, LoadOrCreatePersists) {
    auto first = LocalCertificate::loadOrCreate(tempDir, "device_persist");
    EXPECT_TRUE(fs::exists(fs::path(tempDir) / CERTIFICATE_FILE));
    EXPECT_TRUE(fs::exists(fs::path(tempDir) / PRIVATE_KEY_FILE));

    auto perms = fs::status(fs::path(tempDir) / PRIVATE_KEY_FILE).permissions();
    EXPECT_EQ(perms & (fs::perms::group_all | fs::perms::others_all), fs::perms::none);

    auto second = LocalCertificate::loadOrCreate(tempDir, "device_persist");
    EXPECT_EQ(first.fingerprint(), second.fingerprint());
}

TEST_F(CertificateTest, LoadOrCreateRegeneratesForNewDeviceId) {
    auto first = LocalCertificate::loadOrCreate(tempDir, "device_old");
    auto second = LocalCertificate::loadOrCreate(tempDir, "device_new");
    EXPECT_EQ(second.commonName(), "device_new");
    EXPECT_NE(first.fingerprint(), second.fingerprint());
}

// ═══════════════════════════════════════════════════════════
// TlsStream
// ═══════════════════════════════════════════════════════════

TEST(TlsRoleTest, SmallerDeviceIdIsClient) {
    EXPECT_EQ(tlsRoleFor("aaaa", "bbbb"), TlsRole::Client);
    EXPECT_EQ(tlsRoleFor("bbbb", "aaaa"), TlsRole::Server);
}

class TlsStreamTest : public ::testing::Test {
protected:
    LocalCertificate clientCert = LocalCertificate::generate("aaaa_client");
    LocalCertificate serverCert = LocalCertificate::generate("bbbb_server");
    TcpListener listener;

    void SetUp() override {
        ASSERT_TRUE(listener.start(0));
    }

    /// Пара TLS-потоков поверх loopback TCP
    std::pair<std::unique_ptr<TlsStream>, std::unique_ptr<TlsStream>> connectPair() {
        auto serverFuture = std::async(std::launch::async, [this]() {
            auto raw = listener.accept(5000ms);
            if (!raw) throw ProtocolError(ErrorKind::Timeout, "no client");
            return TlsStream::handshake(std::move(raw), TlsRole::Server, serverCert, 5000ms);
        });
        auto raw = TcpTransport::connect("127.0.0.1", listener.getPort());
        auto client = TlsStream::handshake(std::move(raw), TlsRole::Client, clientCert, 5000ms);
        return {std::move(client), serverFuture.get()};
    }
};

TEST_F(TlsStreamTest, HandshakeExchangesCertificates) {
    auto streams = connectPair();
    auto& client = streams.first;
    auto& server = streams.second;

    EXPECT_EQ(client->peerCommonName(), "bbbb_server");
    EXPECT_EQ(server->peerCommonName(), "aaaa_client");
    EXPECT_EQ(client->peerFingerprint(), serverCert.fingerprint());
    EXPECT_EQ(server->peerCertificateDer(), clientCert.der());
    EXPECT_EQ(client->kind(), TransportKind::Tls);
    EXPECT_EQ(client->role(), TlsRole::Client);
    EXPECT_FALSE(client->protocolVersion().empty());

    client->writeAll("ping\n");
    uint8_t buffer[5];
    server->readExact(buffer, sizeof(buffer));
    EXPECT_EQ(std::string(reinterpret_cast<char*>(buffer), 5), "ping\n");
}

TEST_F(TlsStreamTest, VerifyPeerAcceptsPinnedCertificate) {
    auto streams = connectPair();
    EXPECT_NO_THROW(streams.first->verifyPeer("bbbb_server", serverCert.der()));
    EXPECT_NO_THROW(streams.first->verifyPeer("bbbb_server", {}));
}

TEST_F(TlsStreamTest, VerifyPeerRejectsWrongIdentity) {
    auto streams = connectPair();
    try {
        streams.first->verifyPeer("someone_else", {});
        FAIL() << "expected PeerIdentityMismatch";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::PeerIdentityMismatch);
    }
}

TEST_F(TlsStreamTest, VerifyPeerRejectsChangedCertificate) {
    auto streams = connectPair();
    auto other = LocalCertificate::generate("bbbb_server");
    try {
        streams.first->verifyPeer("bbbb_server", other.der());
        FAIL() << "expected CertificateMismatch";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::CertificateMismatch);
    }
}

TEST_F(TlsStreamTest, HandshakeFailsAgainstPlainPeer) {
    std::thread server([this]() {
        auto raw = listener.accept(5000ms);
        if (raw) {
            raw->writeAll("this is not TLS\n");
            raw->close();
        }
    });

    auto raw = TcpTransport::connect("127.0.0.1", listener.getPort());
    try {
        TlsStream::handshake(std::move(raw), TlsRole::Client, clientCert, 2000ms);
        ADD_FAILURE() << "expected HandshakeFailed";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::HandshakeFailed);
    }
    server.join();
}

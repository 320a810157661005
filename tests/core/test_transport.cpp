// test_transport.cpp — TCP listener/transport, RFCOMM chunking, candidate ordering

#include <gtest/gtest.h>
#include <sys/socket.h>
#include <unistd.h>
#include <chrono>
#include <string>
#include <thread>

#include "cosmicconnect/Network/BluetoothTransport.h"
#include "cosmicconnect/Network/TcpTransport.h"
#include "cosmicconnect/Error.h"

using namespace CosmicConnect;
using namespace std::chrono_literals;

// ═══════════════════════════════════════════════════════════
// TCP
// ═══════════════════════════════════════════════════════════

TEST(TcpTransportTest, ListenerPicksFreePort) {
    TcpListener listener;
    ASSERT_TRUE(listener.start(0)) << listener.getLastError();
    EXPECT_TRUE(listener.isRunning());
    EXPECT_GT(listener.getPort(), 0);
    listener.stop();
    EXPECT_FALSE(listener.isRunning());
}

TEST(TcpTransportTest, AcceptTimesOutWithoutClient) {
    TcpListener listener;
    ASSERT_TRUE(listener.start(0));
    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(listener.accept(100ms), nullptr);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
}

TEST(TcpTransportTest, ExchangeBytesOverLoopback) {
    TcpListener listener;
    ASSERT_TRUE(listener.start(0));
    uint16_t port = listener.getPort();

    std::unique_ptr<Transport> server;
    std::thread acceptThread([&]() { server = listener.accept(5000ms); });

    auto client = TcpTransport::connect("127.0.0.1", port, 5000ms);
    acceptThread.join();
    ASSERT_NE(server, nullptr);
    EXPECT_EQ(client->kind(), TransportKind::Tcp);
    EXPECT_TRUE(client->capabilities().supportsEncryptionUpgrade);

    client->writeAll("hello\n");
    uint8_t buffer[6];
    server->readExact(buffer, sizeof(buffer));
    EXPECT_EQ(std::string(reinterpret_cast<char*>(buffer), 6), "hello\n");

    client->close();
    EXPECT_FALSE(client->isOpen());
    uint8_t byte;
    EXPECT_EQ(server->read(&byte, 1), 0u);
}

TEST(TcpTransportTest, ReadTimeoutThrowsTimeout) {
    TcpListener listener;
    ASSERT_TRUE(listener.start(0));

    std::unique_ptr<Transport> server;
    std::thread acceptThread([&]() { server = listener.accept(5000ms); });
    auto client = TcpTransport::connect("127.0.0.1", listener.getPort());
    acceptThread.join();
    ASSERT_NE(server, nullptr);

    server->setReadTimeout(100ms);
    uint8_t byte;
    try {
        server->read(&byte, 1);
        FAIL() << "expected Timeout";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Timeout);
    }
}

TEST(TcpTransportTest, ConnectToClosedPortFails) {
    TcpListener listener;
    ASSERT_TRUE(listener.start(0));
    uint16_t port = listener.getPort();
    listener.stop();

    try {
        TcpTransport::connect("127.0.0.1", port, 1000ms);
        FAIL() << "expected TransportUnavailable";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::TransportUnavailable);
    }
}

TEST(TcpTransportTest, ReadExactFailsOnEarlyClose) {
    TcpListener listener;
    ASSERT_TRUE(listener.start(0));

    std::unique_ptr<Transport> server;
    std::thread acceptThread([&]() { server = listener.accept(5000ms); });
    auto client = TcpTransport::connect("127.0.0.1", listener.getPort());
    acceptThread.join();
    ASSERT_NE(server, nullptr);

    client->writeAll("abc");
    client->close();

    uint8_t buffer[8];
    EXPECT_THROW(server->readExact(buffer, sizeof(buffer)), ProtocolError);
}

// ═══════════════════════════════════════════════════════════
// Bluetooth (RFCOMM поверх socketpair)
// ═══════════════════════════════════════════════════════════

TEST(BluetoothTransportTest, WritesAreBoundedByMtu) {
    int fds[2];
    ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);

    BluetoothTransport left(fds[0], "AA:BB:CC:DD:EE:FF", 4);
    BluetoothTransport right(fds[1], "11:22:33:44:55:66", 4);

    EXPECT_EQ(left.kind(), TransportKind::Bluetooth);
    EXPECT_EQ(left.capabilities().mtu, 4u);
    EXPECT_FALSE(left.capabilities().supportsEncryptionUpgrade);
    EXPECT_EQ(left.remoteAddress(), "AA:BB:CC:DD:EE:FF");

    const std::string message = "0123456789";
    size_t written = left.write(reinterpret_cast<const uint8_t*>(message.data()), message.size());
    EXPECT_GT(written, 0u);
    EXPECT_LE(written, 4u);

    left.writeAll(reinterpret_cast<const uint8_t*>(message.data()) + written, message.size() - written);

    uint8_t buffer[10];
    right.readExact(buffer, sizeof(buffer));
    EXPECT_EQ(std::string(reinterpret_cast<char*>(buffer), 10), message);
}

// ═══════════════════════════════════════════════════════════
// Выбор транспорта
// ═══════════════════════════════════════════════════════════

static TransportCandidate tcpCandidate() {
    return {TransportAddress::tcp("192.168.1.5", 1716), tcpCapabilities()};
}

static TransportCandidate bluetoothCandidate() {
    return {TransportAddress::bluetooth("AA:BB:CC:DD:EE:FF"), bluetoothCapabilities()};
}

TEST(TransportSelectionTest, PreferTcpOrdersByLatency) {
    auto ordered = orderCandidates({bluetoothCandidate(), tcpCandidate()}, TransportPreference::PreferTcp);
    ASSERT_EQ(ordered.size(), 2u);
    EXPECT_EQ(ordered[0].address.kind, TransportKind::Tcp);
    EXPECT_EQ(ordered[1].address.kind, TransportKind::Bluetooth);
}

TEST(TransportSelectionTest, PreferBluetoothPutsBluetoothFirst) {
    auto ordered = orderCandidates({tcpCandidate(), bluetoothCandidate()}, TransportPreference::PreferBluetooth);
    ASSERT_EQ(ordered.size(), 2u);
    EXPECT_EQ(ordered[0].address.kind, TransportKind::Bluetooth);
}

TEST(TransportSelectionTest, OnlyPreferencesFilter) {
    auto tcpOnly = orderCandidates({tcpCandidate(), bluetoothCandidate()}, TransportPreference::TcpOnly);
    ASSERT_EQ(tcpOnly.size(), 1u);
    EXPECT_EQ(tcpOnly[0].address.kind, TransportKind::Tcp);

    auto btOnly = orderCandidates({tcpCandidate(), bluetoothCandidate()}, TransportPreference::BluetoothOnly);
    ASSERT_EQ(btOnly.size(), 1u);
    EXPECT_EQ(btOnly[0].address.kind, TransportKind::Bluetooth);
}

TEST(TransportSelectionTest, UnreliableCandidatesDropped) {
    auto unreliable = tcpCandidate();
    unreliable.capabilities.reliable = false;
    EXPECT_TRUE(orderCandidates({unreliable}, TransportPreference::PreferTcp).empty());
}

TEST(TransportSelectionTest, AddressToString) {
    EXPECT_EQ(TransportAddress::bluetooth("AA:BB").toString(), "bt://AA:BB");
    EXPECT_EQ(TransportAddress::tcp("::1", 1716).toString(), "[::1]:1716");
}

// test_payload.cpp — Payload side channel and CSMR stream frames

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <sstream>
#include <sys/socket.h>
#include <vector>

#include "cosmicconnect/Certificate.h"
#include "cosmicconnect/Error.h"
#include "cosmicconnect/Network/BluetoothTransport.h"
#include "cosmicconnect/Network/FrameCodec.h"
#include "cosmicconnect/Network/PayloadChannel.h"

using namespace CosmicConnect;
using namespace std::chrono_literals;

// ═══════════════════════════════════════════════════════════
// FrameCodec
// ═══════════════════════════════════════════════════════════

TEST(FrameCodecTest, HeaderLayout) {
    StreamFrame frame;
    frame.type = FrameType::Cursor;
    frame.timestamp = 0x0102030405060708ull;
    frame.payload = {0xAA, 0xBB, 0xCC};

    auto bytes = FrameCodec::encode(frame);
    ASSERT_EQ(bytes.size(), STREAM_FRAME_HEADER_SIZE + 3);
    EXPECT_EQ(std::string(bytes.begin(), bytes.begin() + 4), "CSMR");
    EXPECT_EQ(bytes[4], 0x02);
    EXPECT_EQ(bytes[5], 0x01);
    EXPECT_EQ(bytes[12], 0x08);
    EXPECT_EQ(bytes[13], 0x00);
    EXPECT_EQ(bytes[16], 0x03);
    EXPECT_EQ(bytes[17], 0xAA);
}

TEST(FrameCodecTest, DecodeRejectsBadMagic) {
    uint8_t header[STREAM_FRAME_HEADER_SIZE] = {'X', 'S', 'M', 'R'};
    FrameType type;
    uint64_t timestamp;
    uint32_t size;
    try {
        FrameCodec::decodeHeader(header, type, timestamp, size);
        FAIL() << "expected InvalidPacket";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidPacket);
    }
}

TEST(FrameCodecTest, DecodeRejectsOversizeFrame) {
    uint8_t header[STREAM_FRAME_HEADER_SIZE] = {'C', 'S', 'M', 'R', 0x01};
    header[13] = 0x7F;      // ~2 GiB
    FrameType type;
    uint64_t timestamp;
    uint32_t size;
    try {
        FrameCodec::decodeHeader(header, type, timestamp, size);
        FAIL() << "expected PacketSizeExceeded";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::PacketSizeExceeded);
    }
}

TEST(FrameCodecTest, EncodeRejectsOversizePayload) {
    StreamFrame frame;
    frame.payload.resize(MAX_STREAM_FRAME_SIZE + 1);
    EXPECT_THROW(FrameCodec::encode(frame), ProtocolError);
}

TEST(FrameReaderTest, ReassemblesSplitFrames) {
    StreamFrame first;
    first.type = FrameType::Video;
    first.timestamp = 1000;
    first.payload.assign(100, 0x11);
    StreamFrame last;
    last.type = FrameType::EndOfStream;
    last.timestamp = 2000;

    auto bytes = FrameCodec::encode(first);
    auto tail = FrameCodec::encode(last);
    bytes.insert(bytes.end(), tail.begin(), tail.end());

    FrameReader reader;
    std::vector<StreamFrame> frames;
    // Порции по 7 байт
    for (size_t i = 0; i < bytes.size(); i += 7) {
        size_t n = std::min<size_t>(7, bytes.size() - i);
        reader.feed(bytes.data() + i, n);
        while (auto frame = reader.next()) {
            frames.push_back(std::move(*frame));
        }
    }

    ASSERT_EQ(frames.size(), 2u);
    EXPECT_EQ(frames[0].type, FrameType::Video);
    EXPECT_EQ(frames[0].timestamp, 1000u);
    EXPECT_EQ(frames[0].payload.size(), 100u);
    EXPECT_EQ(frames[1].type, FrameType::EndOfStream);
    EXPECT_TRUE(frames[1].payload.empty());
    EXPECT_EQ(reader.buffered(), 0u);
}

TEST(FrameReaderTest, BadMagicResetsBuffer) {
    FrameReader reader;
    std::vector<uint8_t> garbage(STREAM_FRAME_HEADER_SIZE, 0x42);
    reader.feed(garbage.data(), garbage.size());
    EXPECT_THROW(reader.next(), ProtocolError);
    EXPECT_EQ(reader.buffered(), 0u);
}

TEST(FrameCodecTest, ReadWriteOverTransport) {
    int fds[2];
    ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
    BluetoothTransport writer(fds[0], "writer", 64);
    BluetoothTransport reader(fds[1], "reader", 64);

    StreamFrame frame;
    frame.type = FrameType::Annotation;
    frame.timestamp = 77;
    frame.payload.assign(300, 0x5A);
    FrameCodec::write(writer, frame);
    writer.close();

    auto received = FrameCodec::read(reader);
    ASSERT_TRUE(received.has_value());
    EXPECT_EQ(received->type, FrameType::Annotation);
    EXPECT_EQ(received->timestamp, 77u);
    EXPECT_EQ(received->payload, frame.payload);

    EXPECT_FALSE(FrameCodec::read(reader).has_value());
}

// ═══════════════════════════════════════════════════════════
// PayloadChannel
// ═══════════════════════════════════════════════════════════

class PayloadChannelTest : public ::testing::Test {
protected:
    LocalCertificate senderCert = LocalCertificate::generate("aaaa_sender");
    LocalCertificate receiverCert = LocalCertificate::generate("bbbb_receiver");

    static std::string makeData(size_t size) {
        std::string data(size, '\0');
        for (size_t i = 0; i < size; ++i) {
            data[i] = static_cast<char>((i * 31 + 7) & 0xFF);
        }
        return data;
    }
};

TEST_F(PayloadChannelTest, TransfersExactBytes) {
    auto server = PayloadServer::open();
    ASSERT_GE(server->port(), PAYLOAD_PORT_MIN);
    uint16_t port = server->port();

    const std::string data = makeData(3 * 1024 * 1024 + 123);

    auto senderFuture = std::async(std::launch::async, [&]() {
        auto stream = server->accept(senderCert, "bbbb_receiver", receiverCert.der(), 5000ms);
        std::istringstream source(data);
        return PayloadChannel::send(*stream, source, data.size());
    });

    auto stream = PayloadChannel::connect("127.0.0.1", port, receiverCert, "aaaa_sender",
                                          senderCert.der(), 5000ms);
    std::ostringstream sink;
    std::vector<uint64_t> progress;
    uint64_t received = PayloadChannel::receive(*stream, sink, data.size(),
                                                [&](uint64_t n) { progress.push_back(n); });

    EXPECT_EQ(senderFuture.get(), data.size());
    EXPECT_EQ(received, data.size());
    EXPECT_EQ(sink.str(), data);
    ASSERT_FALSE(progress.empty());
    EXPECT_EQ(progress.back(), data.size());
    for (size_t i = 1; i < progress.size(); ++i) {
        EXPECT_GT(progress[i], progress[i - 1]);
    }
}

TEST_F(PayloadChannelTest, AcceptTimesOutWithoutPeer) {
    auto server = PayloadServer::open();
    try {
        server->accept(senderCert, "bbbb_receiver", {}, 200ms);
        FAIL() << "expected Timeout";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Timeout);
    }
}

TEST_F(PayloadChannelTest, WrongPinnedCertificateRejected) {
    auto server = PayloadServer::open();
    uint16_t port = server->port();
    auto stranger = LocalCertificate::generate("bbbb_receiver");

    auto senderFuture = std::async(std::launch::async, [&]() {
        try {
            server->accept(senderCert, "bbbb_receiver", receiverCert.der(), 5000ms);
            return ErrorKind::Io;
        } catch (const ProtocolError& e) {
            return e.kind();
        }
    });

    try {
        auto stream = PayloadChannel::connect("127.0.0.1", port, stranger, "aaaa_sender",
                                              senderCert.der(), 5000ms);
        std::ostringstream sink;
        PayloadChannel::receive(*stream, sink, 10);
    } catch (const ProtocolError&) {
        // Сервер закрывает соединение после отказа
    }

    EXPECT_EQ(senderFuture.get(), ErrorKind::CertificateMismatch);
}

TEST_F(PayloadChannelTest, SourceShorterThanSizeFails) {
    int fds[2];
    ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
    BluetoothTransport writer(fds[0], "writer", 1024);
    BluetoothTransport reader(fds[1], "reader", 1024);

    std::istringstream source("short");
    try {
        PayloadChannel::send(writer, source, 100);
        FAIL() << "expected Io";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Io);
    }
}

TEST_F(PayloadChannelTest, CancelStopsTransfer) {
    int fds[2];
    ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
    BluetoothTransport writer(fds[0], "writer", 1024);
    BluetoothTransport reader(fds[1], "reader", 1024);

    std::atomic<bool> cancel{true};
    std::istringstream source(makeData(1024));
    try {
        PayloadChannel::send(writer, source, 1024, {}, &cancel);
        FAIL() << "expected cancellation";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Timeout);
    }
}

TEST_F(PayloadChannelTest, ReceiveFailsWhenStreamEndsEarly) {
    int fds[2];
    ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
    BluetoothTransport writer(fds[0], "writer", 1024);
    BluetoothTransport reader(fds[1], "reader", 1024);

    writer.writeAll("abc");
    writer.close();

    std::ostringstream sink;
    EXPECT_THROW(PayloadChannel::receive(reader, sink, 10), ProtocolError);
}

// test_packet.cpp — Packet codec, line framing and packet ids

#include <gtest/gtest.h>
#include <string>

#include "cosmicconnect/Network/Packet.h"
#include "cosmicconnect/Error.h"

using namespace CosmicConnect;

// ═══════════════════════════════════════════════════════════
// Serialization
// ═══════════════════════════════════════════════════════════

TEST(PacketCodecTest, SerializeEndsWithSingleNewline) {
    Packet packet(PACKET_TYPE_PING, {{"message", "hello\nworld"}});
    packet.id = 42;

    std::string line = PacketCodec::serialize(packet);
    ASSERT_FALSE(line.empty());
    EXPECT_EQ(line.back(), '\n');
    EXPECT_EQ(line.find('\n'), line.size() - 1);
}

TEST(PacketCodecTest, ParsePreservesFields) {
    Packet packet("kdeconnect.share.request", {{"filename", "a.txt"}, {"n", 3}});
    packet.id = 1700000000123;
    packet.setPayload(5, 1739);

    std::string line = PacketCodec::serialize(packet);
    line.pop_back();
    Packet parsed = PacketCodec::parse(line);

    EXPECT_EQ(parsed.type, "kdeconnect.share.request");
    EXPECT_EQ(parsed.id, 1700000000123);
    EXPECT_EQ(parsed.body["filename"], "a.txt");
    EXPECT_EQ(parsed.body["n"], 3);
    ASSERT_TRUE(parsed.payloadSize.has_value());
    EXPECT_EQ(*parsed.payloadSize, 5);
    ASSERT_TRUE(parsed.payloadTransferInfo.has_value());
    EXPECT_EQ(parsed.payloadTransferInfo->port, 1739);
    EXPECT_TRUE(parsed.hasPayload());
}

TEST(PacketCodecTest, ParseAcceptsStringId) {
    Packet parsed = PacketCodec::parse(R"({"type":"kdeconnect.ping","id":"123","body":{}})");
    EXPECT_EQ(parsed.id, 123);
}

TEST(PacketCodecTest, ParseMissingBodyGivesEmptyObject) {
    Packet parsed = PacketCodec::parse(R"({"type":"kdeconnect.ping","id":1})");
    EXPECT_TRUE(parsed.body.is_object());
    EXPECT_TRUE(parsed.body.empty());
}

TEST(PacketCodecTest, ParseRejectsMalformedInput) {
    const char* bad[] = {
        "not json",
        "[1,2,3]",
        R"({"id":1,"body":{}})",
        R"({"type":"","id":1})",
        R"({"type":"kdeconnect.ping","body":[1]})",
        R"({"type":"kdeconnect.ping","id":{}})",
        R"({"type":"kdeconnect.ping","id":"12abc"})",
        R"({"type":"kdeconnect.ping","id":"abc"})",
        R"({"type":"x","payloadSize":10})",
        R"({"type":"x","payloadSize":10,"payloadTransferInfo":{"port":0}})",
        R"({"type":"x","payloadSize":-5,"payloadTransferInfo":{"port":1739}})",
    };
    for (const char* line : bad) {
        try {
            PacketCodec::parse(line);
            ADD_FAILURE() << "accepted: " << line;
        } catch (const ProtocolError& e) {
            EXPECT_EQ(e.kind(), ErrorKind::InvalidPacket) << line;
        }
    }
}

TEST(PacketCodecTest, SerializeRejectsOversizeLine) {
    Packet packet(PACKET_TYPE_PING, {{"blob", std::string(2000, 'x')}});
    try {
        PacketCodec::serialize(packet, 1024);
        FAIL() << "expected PacketSizeExceeded";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::PacketSizeExceeded);
    }
}

TEST(PacketCodecTest, SerializeRequiresPayloadFieldsTogether) {
    Packet packet(PACKET_TYPE_PING);
    packet.payloadSize = 10;
    EXPECT_THROW(PacketCodec::serialize(packet), ProtocolError);
}

// ═══════════════════════════════════════════════════════════
// Packet helpers
// ═══════════════════════════════════════════════════════════

TEST(PacketTest, TypeAliasesMatch) {
    EXPECT_TRUE(packetTypesMatch("kdeconnect.ping", "cconnect.ping"));
    EXPECT_TRUE(packetTypesMatch("cconnect.share.request", "kdeconnect.share.request"));
    EXPECT_FALSE(packetTypesMatch("kdeconnect.ping", "kdeconnect.pair"));
    EXPECT_FALSE(packetTypesMatch("other.ping", "kdeconnect.ping"));

    Packet packet("cconnect.ping");
    EXPECT_TRUE(packet.isType(PACKET_TYPE_PING));
}

TEST(PacketTest, SupportedProtocolVersions) {
    EXPECT_FALSE(isSupportedProtocolVersion(6));
    EXPECT_TRUE(isSupportedProtocolVersion(7));
    EXPECT_TRUE(isSupportedProtocolVersion(8));
    EXPECT_FALSE(isSupportedProtocolVersion(9));
}

TEST(PacketTest, NoPayloadForZeroSize) {
    Packet packet(PACKET_TYPE_PING);
    EXPECT_FALSE(packet.hasPayload());
    packet.setPayload(0, 1739);
    EXPECT_FALSE(packet.hasPayload());
    packet.setPayload(-1, 1739);
    EXPECT_TRUE(packet.hasPayload());
}

TEST(PacketTest, IdentityRoundTripsDeviceInfo) {
    DeviceInfo info;
    info.deviceId = "abc123";
    info.deviceName = "Laptop";
    info.deviceType = DeviceType::Laptop;
    info.protocolVersion = 8;
    info.incomingCapabilities = {"kdeconnect.ping"};
    info.outgoingCapabilities = {"kdeconnect.ping", "kdeconnect.share.request"};
    info.tcpPort = 1716;

    auto parsed = deviceInfoFromIdentity(Packet::identity(info));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->deviceId, "abc123");
    EXPECT_EQ(parsed->deviceName, "Laptop");
    EXPECT_EQ(parsed->deviceType, DeviceType::Laptop);
    EXPECT_EQ(parsed->protocolVersion, 8);
    EXPECT_EQ(parsed->outgoingCapabilities.size(), 2u);
    ASSERT_TRUE(parsed->tcpPort.has_value());
    EXPECT_EQ(*parsed->tcpPort, 1716);
}

TEST(PacketTest, IdentityWithoutDeviceIdIsRejected) {
    Packet packet(PACKET_TYPE_IDENTITY, {{"deviceName", "x"}});
    EXPECT_FALSE(deviceInfoFromIdentity(packet).has_value());
    EXPECT_FALSE(deviceInfoFromIdentity(Packet::ping()).has_value());
}

TEST(PacketTest, IdentityIgnoresBadPort) {
    Packet packet(PACKET_TYPE_IDENTITY, {{"deviceId", "x"}, {"tcpPort", 70000}});
    auto info = deviceInfoFromIdentity(packet);
    ASSERT_TRUE(info.has_value());
    EXPECT_FALSE(info->tcpPort.has_value());
}

// ═══════════════════════════════════════════════════════════
// LineReader
// ═══════════════════════════════════════════════════════════

static void feedString(LineReader& reader, const std::string& data) {
    reader.feed(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

TEST(LineReaderTest, SplitsAcrossChunks) {
    LineReader reader;
    std::string line;

    feedString(reader, "{\"a\":");
    EXPECT_FALSE(reader.nextLine(line));
    feedString(reader, "1}\n{\"b\":2}\n{\"c\"");

    ASSERT_TRUE(reader.nextLine(line));
    EXPECT_EQ(line, "{\"a\":1}");
    ASSERT_TRUE(reader.nextLine(line));
    EXPECT_EQ(line, "{\"b\":2}");
    EXPECT_FALSE(reader.nextLine(line));
    EXPECT_EQ(reader.buffered(), 4u);
}

TEST(LineReaderTest, OversizeLineThrows) {
    LineReader reader(16);
    std::string line;
    feedString(reader, std::string(32, 'x'));
    try {
        reader.nextLine(line);
        FAIL() << "expected PacketSizeExceeded";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::PacketSizeExceeded);
    }
    EXPECT_EQ(reader.buffered(), 0u);
}

TEST(LineReaderTest, TerminatedOversizeLineThrowsAndSkipsIt) {
    LineReader reader(8);
    std::string line;
    feedString(reader, "123456789\nok\n");
    try {
        reader.nextLine(line);
        FAIL() << "expected PacketSizeExceeded";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::PacketSizeExceeded);
    }
    ASSERT_TRUE(reader.nextLine(line));
    EXPECT_EQ(line, "ok");
}

TEST(LineReaderTest, LineAtLimitIsAccepted) {
    LineReader reader(8);
    std::string line;
    feedString(reader, "12345678\n");
    ASSERT_TRUE(reader.nextLine(line));
    EXPECT_EQ(line, "12345678");
}

// ═══════════════════════════════════════════════════════════
// PacketIdGenerator
// ═══════════════════════════════════════════════════════════

TEST(PacketIdGeneratorTest, MonotonicWhenClockGoesBack) {
    PacketIdGenerator ids;
    EXPECT_EQ(ids.next(1000), 1000);
    EXPECT_EQ(ids.next(900), 1001);
    EXPECT_EQ(ids.next(1001), 1002);
    EXPECT_EQ(ids.next(5000), 5000);
    EXPECT_EQ(ids.last(), 5000);
}

TEST(PacketIdGeneratorTest, UsesWallClock) {
    PacketIdGenerator ids;
    int64_t before = nowUnixMs();
    int64_t id = ids.next();
    EXPECT_GE(id, before);
    EXPECT_GT(ids.next(), id);
}

// ═══════════════════════════════════════════════════════════
// Errors
// ═══════════════════════════════════════════════════════════

TEST(ProtocolErrorTest, KindAndClassification) {
    ProtocolError error(ErrorKind::Backpressure, "queue full");
    EXPECT_EQ(error.kind(), ErrorKind::Backpressure);
    EXPECT_TRUE(error.isRecoverable());
    EXPECT_FALSE(error.requiresUserAction());
    EXPECT_NE(std::string(error.what()).find("queue full"), std::string::npos);

    EXPECT_TRUE(requiresUserAction(ErrorKind::CertificateMismatch));
    EXPECT_FALSE(isRecoverable(ErrorKind::CertificateMismatch));

    auto size = ProtocolError::sizeExceeded(20, 10);
    EXPECT_EQ(size.kind(), ErrorKind::PacketSizeExceeded);
}

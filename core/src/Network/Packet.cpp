// Packet.cpp — KDE Connect packet codec

#include "cosmicconnect/Network/Packet.h"
#include "cosmicconnect/Error.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstring>

namespace CosmicConnect {

using json = nlohmann::json;

namespace {

constexpr const char* KDE_PREFIX = "kdeconnect.";
constexpr const char* CC_PREFIX = "cconnect.";

// "kdeconnect.ping" -> "ping", "cconnect.ping" -> "ping", other -> nullopt
std::optional<std::string> aliasSuffix(const std::string& type) {
    const size_t kdeLen = std::strlen(KDE_PREFIX);
    const size_t ccLen = std::strlen(CC_PREFIX);
    if (type.compare(0, kdeLen, KDE_PREFIX) == 0) {
        return type.substr(kdeLen);
    }
    if (type.compare(0, ccLen, CC_PREFIX) == 0) {
        return type.substr(ccLen);
    }
    return std::nullopt;
}

std::set<std::string> readStringSet(const json& body, const char* key) {
    std::set<std::string> result;
    auto it = body.find(key);
    if (it == body.end() || !it->is_array()) return result;
    for (const auto& v : *it) {
        if (v.is_string()) result.insert(v.get<std::string>());
    }
    return result;
}

} // anonymous namespace

bool packetTypesMatch(const std::string& a, const std::string& b) {
    if (a == b) return true;
    auto sa = aliasSuffix(a);
    auto sb = aliasSuffix(b);
    return sa && sb && *sa == *sb;
}

bool isSupportedProtocolVersion(int32_t version) {
    return version >= MIN_PROTOCOL_VERSION && version <= PROTOCOL_VERSION;
}

// ═══════════════════════════════════════════════════════════
// Packet
// ═══════════════════════════════════════════════════════════

Packet::Packet(std::string packetType, json packetBody)
    : type(std::move(packetType))
    , body(std::move(packetBody)) {
    if (body.is_null()) body = json::object();
}

bool Packet::isType(const std::string& packetType) const {
    return packetTypesMatch(type, packetType);
}

bool Packet::hasPayload() const {
    return payloadSize.has_value() && payloadTransferInfo.has_value() &&
           (*payloadSize > 0 || *payloadSize == -1);
}

void Packet::setPayload(int64_t size, uint16_t port) {
    payloadSize = size;
    payloadTransferInfo = PayloadTransferInfo{port};
}

Packet Packet::identity(const DeviceInfo& info) {
    json b = {
        {"deviceId", info.deviceId},
        {"deviceName", info.deviceName},
        {"deviceType", deviceTypeToString(info.deviceType)},
        {"protocolVersion", info.protocolVersion},
        {"incomingCapabilities", info.incomingCapabilities},
        {"outgoingCapabilities", info.outgoingCapabilities}
    };
    if (info.tcpPort) {
        b["tcpPort"] = *info.tcpPort;
    }
    return Packet(PACKET_TYPE_IDENTITY, std::move(b));
}

Packet Packet::pair(bool pair) {
    return Packet(PACKET_TYPE_PAIR, json{{"pair", pair}});
}

Packet Packet::ping(bool reply) {
    if (reply) {
        return Packet(PACKET_TYPE_PING, json{{"reply", true}});
    }
    return Packet(PACKET_TYPE_PING);
}

std::optional<DeviceInfo> deviceInfoFromIdentity(const Packet& packet) {
    if (!packet.isType(PACKET_TYPE_IDENTITY) || !packet.body.is_object()) {
        return std::nullopt;
    }

    try {
        const auto& b = packet.body;
        DeviceInfo info;
        info.deviceId = b.value("deviceId", "");
        if (info.deviceId.empty()) {
            return std::nullopt;
        }
        info.deviceName = b.value("deviceName", "");
        info.deviceType = deviceTypeFromString(b.value("deviceType", "unknown"));
        info.protocolVersion = b.value("protocolVersion", 0);
        info.incomingCapabilities = readStringSet(b, "incomingCapabilities");
        info.outgoingCapabilities = readStringSet(b, "outgoingCapabilities");

        auto port = b.find("tcpPort");
        if (port != b.end() && port->is_number_integer()) {
            int64_t p = port->get<int64_t>();
            if (p > 0 && p <= 65535) {
                info.tcpPort = static_cast<uint16_t>(p);
            }
        }
        return info;
    } catch (const json::exception& e) {
        spdlog::debug("Packet: Malformed identity body: {}", e.what());
        return std::nullopt;
    }
}

// ═══════════════════════════════════════════════════════════
// PacketCodec
// ═══════════════════════════════════════════════════════════

json PacketCodec::toJson(const Packet& packet) {
    json j = {
        {"type", packet.type},
        {"id", packet.id},
        {"body", packet.body.is_null() ? json::object() : packet.body}
    };
    if (packet.payloadSize && packet.payloadTransferInfo) {
        j["payloadSize"] = *packet.payloadSize;
        j["payloadTransferInfo"] = {{"port", packet.payloadTransferInfo->port}};
    }
    return j;
}

std::string PacketCodec::serialize(const Packet& packet, size_t maxLineSize) {
    if (packet.type.empty()) {
        throw ProtocolError(ErrorKind::InvalidPacket, "packet type is empty");
    }
    if (packet.payloadSize.has_value() != packet.payloadTransferInfo.has_value()) {
        throw ProtocolError(ErrorKind::InvalidPacket,
                            "payloadSize and payloadTransferInfo must be set together");
    }

    std::string line;
    try {
        // dump() escapes control characters, so the line never contains '\n'
        line = toJson(packet).dump();
    } catch (const json::exception& e) {
        throw ProtocolError(ErrorKind::InvalidPacket, e.what());
    }

    if (line.size() > maxLineSize) {
        throw ProtocolError::sizeExceeded(line.size(), maxLineSize);
    }
    line.push_back('\n');
    return line;
}

Packet PacketCodec::parse(const std::string& line) {
    json j;
    try {
        j = json::parse(line);
    } catch (const json::exception& e) {
        throw ProtocolError(ErrorKind::InvalidPacket, std::string("malformed JSON: ") + e.what());
    }

    if (!j.is_object()) {
        throw ProtocolError(ErrorKind::InvalidPacket, "packet is not a JSON object");
    }

    Packet packet;

    auto type = j.find("type");
    if (type == j.end() || !type->is_string() || type->get<std::string>().empty()) {
        throw ProtocolError(ErrorKind::InvalidPacket, "missing packet type");
    }
    packet.type = type->get<std::string>();

    auto id = j.find("id");
    if (id != j.end()) {
        if (id->is_number_integer()) {
            packet.id = id->get<int64_t>();
        } else if (id->is_string()) {
            const std::string text = id->get<std::string>();
            size_t consumed = 0;
            try {
                packet.id = std::stoll(text, &consumed);
            } catch (const std::exception&) {
                throw ProtocolError(ErrorKind::InvalidPacket, "non-numeric packet id");
            }
            if (consumed != text.size()) {
                throw ProtocolError(ErrorKind::InvalidPacket, "non-numeric packet id: " + text);
            }
        } else {
            throw ProtocolError(ErrorKind::InvalidPacket, "invalid packet id");
        }
    }

    auto body = j.find("body");
    if (body != j.end() && !body->is_null()) {
        if (!body->is_object()) {
            throw ProtocolError(ErrorKind::InvalidPacket, "packet body is not an object");
        }
        packet.body = *body;
    }

    auto size = j.find("payloadSize");
    auto info = j.find("payloadTransferInfo");
    bool hasSize = size != j.end() && !size->is_null();
    bool hasInfo = info != j.end() && !info->is_null();
    if (hasSize != hasInfo) {
        throw ProtocolError(ErrorKind::InvalidPacket,
                            "payloadSize and payloadTransferInfo must appear together");
    }
    if (hasSize) {
        if (!size->is_number_integer() || size->get<int64_t>() < -1) {
            throw ProtocolError(ErrorKind::InvalidPacket, "invalid payloadSize");
        }
        auto port = info->is_object() ? info->find("port") : info->end();
        if (!info->is_object() || port == info->end() || !port->is_number_integer()) {
            throw ProtocolError(ErrorKind::InvalidPacket, "invalid payloadTransferInfo");
        }
        int64_t p = port->get<int64_t>();
        if (p <= 0 || p > 65535) {
            throw ProtocolError(ErrorKind::InvalidPacket, "payload port out of range");
        }
        packet.setPayload(size->get<int64_t>(), static_cast<uint16_t>(p));
    }

    return packet;
}

// ═══════════════════════════════════════════════════════════
// LineReader
// ═══════════════════════════════════════════════════════════

LineReader::LineReader(size_t maxLineSize)
    : m_maxLineSize(maxLineSize) {}

void LineReader::feed(const uint8_t* data, size_t size) {
    // Compact consumed prefix before growing
    if (m_offset > 0 && m_offset * 2 >= m_buffer.size()) {
        m_buffer.erase(0, m_offset);
        m_scanFrom -= m_offset;
        m_offset = 0;
    }
    m_buffer.append(reinterpret_cast<const char*>(data), size);
}

bool LineReader::nextLine(std::string& line) {
    size_t pos = m_buffer.find('\n', std::max(m_scanFrom, m_offset));
    if (pos == std::string::npos) {
        m_scanFrom = m_buffer.size();
        if (m_buffer.size() - m_offset > m_maxLineSize) {
            size_t pending = m_buffer.size() - m_offset;
            m_buffer.clear();
            m_offset = 0;
            m_scanFrom = 0;
            throw ProtocolError(ErrorKind::PacketSizeExceeded,
                                "line exceeds " + std::to_string(m_maxLineSize) +
                                " bytes (" + std::to_string(pending) + " buffered)");
        }
        return false;
    }

    size_t length = pos - m_offset;
    if (length > m_maxLineSize) {
        m_buffer.erase(0, pos + 1);
        m_offset = 0;
        m_scanFrom = 0;
        throw ProtocolError(ErrorKind::PacketSizeExceeded,
                            "line of " + std::to_string(length) + " bytes exceeds " +
                            std::to_string(m_maxLineSize));
    }

    line.assign(m_buffer, m_offset, length);
    m_offset = pos + 1;
    m_scanFrom = m_offset;
    if (m_offset == m_buffer.size()) {
        m_buffer.clear();
        m_offset = 0;
        m_scanFrom = 0;
    }
    return true;
}

// ═══════════════════════════════════════════════════════════
// PacketIdGenerator
// ═══════════════════════════════════════════════════════════

int64_t PacketIdGenerator::next() {
    return next(nowUnixMs());
}

int64_t PacketIdGenerator::next(int64_t wallClockMs) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_last = std::max(wallClockMs, m_last + 1);
    return m_last;
}

int64_t PacketIdGenerator::last() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_last;
}

} // namespace CosmicConnect

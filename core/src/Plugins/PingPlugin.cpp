#include "cosmicconnect/Plugins/PingPlugin.h"
#include "cosmicconnect/Error.h"
#include <spdlog/spdlog.h>

namespace CosmicConnect {

PluginCapabilities PingPlugin::capabilities() const {
    PluginCapabilities caps;
    caps.incoming = {PACKET_TYPE_PING};
    caps.outgoing = {PACKET_TYPE_PING};
    return caps;
}

void PingPlugin::init(const Device& device, PacketSender sender) {
    std::lock_guard<std::mutex> lock(m_senderMutex);
    m_deviceId = device.id();
    m_sender = std::move(sender);
}

void PingPlugin::handlePacket(const Packet& packet, Device& device) {
    bool reply = packet.body.is_object() && packet.body.value("reply", false);
    if (reply) {
        ++m_repliesReceived;
        spdlog::debug("Ping: Reply from {}", device.id());
        return;
    }

    ++m_pingsReceived;
    if (packet.body.contains("message") && packet.body["message"].is_string()) {
        spdlog::info("Ping: '{}' from {}", packet.body["message"].get<std::string>(), device.id());
    } else {
        spdlog::debug("Ping: Ping from {}", device.id());
    }

    PacketSender sender;
    {
        std::lock_guard<std::mutex> lock(m_senderMutex);
        sender = m_sender;
    }
    if (sender) {
        sender(Packet::ping(true));
    }
}

void PingPlugin::shutdown() {
    std::lock_guard<std::mutex> lock(m_senderMutex);
    m_sender = nullptr;
}

void PingPlugin::sendPing() {
    PacketSender sender;
    {
        std::lock_guard<std::mutex> lock(m_senderMutex);
        sender = m_sender;
    }
    if (!sender) {
        throw ProtocolError(ErrorKind::InvalidState, "ping plugin is not attached to a session");
    }
    sender(Packet::ping(false));
}

std::shared_ptr<PluginFactory> PingPlugin::factory() {
    return std::make_shared<FunctionPluginFactory>(
        NAME, PingPlugin().capabilities(),
        []() { return std::make_unique<PingPlugin>(); });
}

} // namespace CosmicConnect

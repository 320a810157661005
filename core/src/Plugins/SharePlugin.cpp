#include "cosmicconnect/Plugins/SharePlugin.h"
#include "cosmicconnect/TransferManager.h"
#include <spdlog/spdlog.h>

namespace CosmicConnect {

SharePlugin::SharePlugin(std::weak_ptr<TransferManager> transfers)
    : m_transfers(std::move(transfers)) {}

PluginCapabilities SharePlugin::defaultCapabilities() {
    PluginCapabilities caps;
    caps.incoming = {PACKET_TYPE_SHARE_REQUEST, PACKET_TYPE_TRANSFER_RESUME, PACKET_TYPE_TRANSFER_RESUME_ACK};
    caps.outgoing = caps.incoming;
    return caps;
}

PluginCapabilities SharePlugin::capabilities() const {
    return defaultCapabilities();
}

void SharePlugin::init(const Device& device, PacketSender /*sender*/) {
    // Отправка идёт через TransferManager -> ConnectionManager
    m_deviceId = device.id();
}

void SharePlugin::handlePacket(const Packet& packet, Device& device) {
    auto transfers = m_transfers.lock();
    if (!transfers) {
        spdlog::warn("Share: No transfer manager, dropping {} from {}", packet.type, device.id());
        return;
    }
    transfers->handlePacket(device.id(), packet);
}

void SharePlugin::shutdown() {
    spdlog::debug("Share: Session with {} closed", m_deviceId);
}

std::shared_ptr<PluginFactory> SharePlugin::factory(std::weak_ptr<TransferManager> transfers) {
    return std::make_shared<FunctionPluginFactory>(
        NAME, defaultCapabilities(),
        [transfers]() { return std::make_unique<SharePlugin>(transfers); });
}

} // namespace CosmicConnect

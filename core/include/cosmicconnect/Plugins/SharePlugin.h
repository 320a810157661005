// SharePlugin.h — kdeconnect.share.request и возобновление передач

#pragma once

#include "../Plugin.h"
#include <memory>

namespace CosmicConnect {

class TransferManager;

/// Передаёт пакеты передач в TransferManager (тот живёт дольше сессий)
class CC_API SharePlugin : public Plugin {
public:
    static constexpr const char* NAME = "share";

    explicit SharePlugin(std::weak_ptr<TransferManager> transfers);

    std::string name() const override { return NAME; }
    PluginCapabilities capabilities() const override;

    void init(const Device& device, PacketSender sender) override;
    void handlePacket(const Packet& packet, Device& device) override;
    void shutdown() override;

    static PluginCapabilities defaultCapabilities();

    static std::shared_ptr<PluginFactory> factory(std::weak_ptr<TransferManager> transfers);

private:
    std::weak_ptr<TransferManager> m_transfers;
    std::string m_deviceId;
};

} // namespace CosmicConnect

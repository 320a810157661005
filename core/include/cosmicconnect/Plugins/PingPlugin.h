// PingPlugin.h — Встроенный плагин kdeconnect.ping

#pragma once

#include "../Plugin.h"
#include <atomic>
#include <mutex>

namespace CosmicConnect {

/// Считает входящие ping и отвечает {"reply": true} на каждый запрос
class CC_API PingPlugin : public Plugin {
public:
    static constexpr const char* NAME = "ping";

    std::string name() const override { return NAME; }
    PluginCapabilities capabilities() const override;

    void init(const Device& device, PacketSender sender) override;
    void handlePacket(const Packet& packet, Device& device) override;
    void shutdown() override;

    /// Отправить ping пиру
    void sendPing();

    uint64_t pingsReceived() const { return m_pingsReceived; }
    uint64_t repliesReceived() const { return m_repliesReceived; }

    static std::shared_ptr<PluginFactory> factory();

private:
    std::mutex m_senderMutex;
    PacketSender m_sender;
    std::string m_deviceId;
    std::atomic<uint64_t> m_pingsReceived{0};
    std::atomic<uint64_t> m_repliesReceived{0};
};

} // namespace CosmicConnect

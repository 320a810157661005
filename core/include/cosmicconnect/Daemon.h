// Daemon.h — Координатор: владеет компонентами стека, команды и поток событий для UI

#pragma once

#include "export.h"
#include "Config.h"
#include "Events.h"
#include "Models.h"
#include "TransferManager.h"
#include "Network/Packet.h"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace CosmicConnect {

class ConnectionManager;
class DeviceManager;
class Pairing;
class PluginRegistry;
class RecoveryCoordinator;

// ═══════════════════════════════════════════════════════════
// Daemon
// ═══════════════════════════════════════════════════════════

class CC_API Daemon {
public:
    enum class DaemonState {
        Stopped,
        Starting,
        Running,
        Stopping,
        Error
    };

    explicit Daemon(DaemonConfig config);
    ~Daemon();

    // Запрет копирования
    Daemon(const Daemon&) = delete;
    Daemon& operator=(const Daemon&) = delete;

    // ═══════════════════════════════════════════════════════════
    // Lifecycle
    // ═══════════════════════════════════════════════════════════

    /// Загрузить identity/сертификат/доверенных пиров, открыть порты, запустить discovery
    /// @return false при ошибке (getLastError)
    bool start();

    /// Закрыть сессии (Shutdown) и остановить все потоки
    void stop();

    DaemonState getState() const;
    bool isRunning() const;
    std::string getLastError() const;

    // ═══════════════════════════════════════════════════════════
    // Команды
    // ═══════════════════════════════════════════════════════════

    /// Pair(device_id): подключиться при необходимости и отправить запрос
    /// @throws ProtocolError
    void pair(const std::string& deviceId);

    /// Unpair(device_id)
    /// @throws ProtocolError(NotFound)
    void unpair(const std::string& deviceId);

    /// ConfirmPairing(device_id, accept)
    /// @throws ProtocolError(InvalidState)
    void confirmPairing(const std::string& deviceId, bool accept);

    /// Connect(device_id)
    /// @throws ProtocolError
    void connect(const std::string& deviceId);

    /// Подключиться по адресу (устройство вне discovery)
    /// @return device_id пира
    /// @throws ProtocolError
    std::string connectToAddress(const std::string& host, uint16_t port);

    /// Disconnect(device_id)
    /// @return false если сессии нет
    bool disconnect(const std::string& deviceId);

    /// SendPacket(device_id, packet); при Backpressure / отсутствии сессии пакет
    /// ставится в очередь повторов
    /// @return true если отправлен сразу
    /// @throws ProtocolError(Unauthorized | PacketSizeExceeded), переполнение очереди
    bool sendPacket(const std::string& deviceId, const Packet& packet);

    /// SendFile(device_id, path)
    /// @return transfer_id
    /// @throws ProtocolError(NotFound | ResourceExhausted | TransportUnavailable | Unauthorized)
    std::string sendFile(const std::string& deviceId, const std::string& path);

    // ═══════════════════════════════════════════════════════════
    // Состояние
    // ═══════════════════════════════════════════════════════════

    DeviceInfo getLocalIdentity() const;
    std::string getLocalFingerprint() const;

    std::vector<Device> getDevices() const;
    std::optional<Device> getDevice(const std::string& deviceId) const;
    std::vector<std::string> getConnectedDevices() const;

    uint16_t getTcpPort() const;
    uint16_t getDiscoveryPort() const;

    MemoryStats getMemoryStats() const;

    const DaemonConfig& config() const;

    // Компоненты (после start())
    std::shared_ptr<DeviceManager> devices() const;
    std::shared_ptr<ConnectionManager> connections() const;
    std::shared_ptr<Pairing> pairing() const;
    std::shared_ptr<PluginRegistry> plugins() const;
    std::shared_ptr<TransferManager> transfers() const;
    std::shared_ptr<RecoveryCoordinator> recovery() const;

    // ═══════════════════════════════════════════════════════════
    // Callbacks (поток событий)
    // ═══════════════════════════════════════════════════════════

    void onDiscoveryEvent(DiscoveryCallback callback);
    void onPairingEvent(PairingCallback callback);
    void onConnectionEvent(ConnectionCallback callback);
    void onTransferEvent(TransferManager::TransferCallback callback);

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

CC_API const char* daemonStateToString(Daemon::DaemonState state);

} // namespace CosmicConnect

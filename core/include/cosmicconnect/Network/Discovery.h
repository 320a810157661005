// Discovery.h — Обнаружение устройств через UDP broadcast identity-пакетов

#pragma once

#include "../export.h"
#include "../Models.h"
#include "../Events.h"
#include <string>
#include <vector>
#include <memory>
#include <optional>

namespace CosmicConnect {

// ═══════════════════════════════════════════════════════════
// Константы
// ═══════════════════════════════════════════════════════════

constexpr int BROADCAST_INTERVAL_MS = 30000;    // Интервал анонсов (30 сек)
constexpr double BROADCAST_JITTER = 0.2;        // ±20 %
constexpr int DEVICE_TIMEOUT_MS = 90000;        // DeviceLost после 90 сек тишины
constexpr int COALESCE_WINDOW_MS = 1000;        // Пакеты от одного источника за 1 сек схлопываются
constexpr size_t MAX_DATAGRAM_SIZE = 65507;

struct DiscoveryConfig {
    uint16_t port = DISCOVERY_PORT;             // Порт приёма (0 = любой свободный)
    uint16_t broadcastPort = DISCOVERY_PORT;    // Порт назначения анонсов
    int broadcastIntervalMs = BROADCAST_INTERVAL_MS;
    int deviceTimeoutMs = DEVICE_TIMEOUT_MS;
    int coalesceWindowMs = COALESCE_WINDOW_MS;
    bool broadcast = true;                      // 255.255.255.255 и адреса интерфейсов
    bool enableIpv6 = true;                     // ff02::1
    std::vector<std::string> extraTargets;      // Дополнительные unicast адреса
};

// ═══════════════════════════════════════════════════════════
// Discovery — анонсы и приём identity-пакетов
// ═══════════════════════════════════════════════════════════

class CC_API Discovery {
public:
    explicit Discovery(DiscoveryConfig config = {});
    ~Discovery();

    // Запрет копирования
    Discovery(const Discovery&) = delete;
    Discovery& operator=(const Discovery&) = delete;

    // ═══════════════════════════════════════════════════════════
    // Lifecycle
    // ═══════════════════════════════════════════════════════════

    /// Запустить discovery
    /// @param thisDevice Identity этого устройства
    /// @return true если сокеты созданы и потоки запущены
    bool start(const DeviceInfo& thisDevice);

    void stop();

    bool isRunning() const;

    /// Фактический UDP порт приёма
    uint16_t getPort() const;

    std::string getLastError() const;

    // ═══════════════════════════════════════════════════════════
    // Анонсы
    // ═══════════════════════════════════════════════════════════

    /// Отправить identity немедленно
    void announceNow();

    /// Обновить локальную identity и анонсировать её
    void updateIdentity(const DeviceInfo& thisDevice);

    // ═══════════════════════════════════════════════════════════
    // Устройства
    // ═══════════════════════════════════════════════════════════

    std::vector<DeviceInfo> getDevices() const;

    std::optional<DeviceInfo> getDevice(const std::string& deviceId) const;

    /// Адрес, с которого последний раз пришёл анонс
    std::optional<std::string> getDeviceAddress(const std::string& deviceId) const;

    /// Обработать датаграмму (вызывается потоком приёма)
    void handleDatagram(const std::string& data, const std::string& senderAddress);

    // ═══════════════════════════════════════════════════════════
    // Callbacks
    // ═══════════════════════════════════════════════════════════

    /// DeviceFound / DeviceLost / DiscoveryError
    void setEventCallback(DiscoveryCallback callback);

    // ═══════════════════════════════════════════════════════════
    // Сетевые адреса
    // ═══════════════════════════════════════════════════════════

    static std::vector<std::string> getLocalIpAddresses();

    /// Broadcast адреса интерфейсов + 255.255.255.255
    static std::vector<std::string> getBroadcastAddresses();

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace CosmicConnect

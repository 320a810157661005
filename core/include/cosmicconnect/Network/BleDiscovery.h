// BleDiscovery.h — Обнаружение через Bluetooth LE
// Анонс: service UUID KDE Connect, device_id в service data (UTF-8).
// Сканирование: устройства с этим UUID, device_id из service data или manufacturer data.

#pragma once

#include "../export.h"
#include "../Models.h"
#include "../Events.h"
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace CosmicConnect {

constexpr int BLE_DEVICE_TIMEOUT_MS = 90000;
constexpr uint16_t BLE_MANUFACTURER_ID = 0xFFFF;   // Bluetooth SIG: внутреннее использование

/// Одно наблюдение рекламного пакета
struct BleAdvertisement {
    std::string address;                                    // "AA:BB:CC:DD:EE:FF"
    std::string name;
    std::vector<std::string> serviceUuids;
    std::map<std::string, std::vector<uint8_t>> serviceData;    // UUID (нижний регистр) -> данные
    std::map<uint16_t, std::vector<uint8_t>> manufacturerData;  // company id -> данные
    std::optional<int16_t> rssi;
};

// ═══════════════════════════════════════════════════════════
// BleScanner — системный BLE стек (BlueZ)
// ═══════════════════════════════════════════════════════════

class CC_API BleScanner {
public:
    using AdvertisementCallback = std::function<void(const BleAdvertisement&)>;

    virtual ~BleScanner() = default;

    /// Начать сканирование устройств с данным service UUID
    virtual bool startScan(const std::string& serviceUuid, AdvertisementCallback callback) = 0;
    virtual void stopScan() = 0;

    /// Анонсировать пакет (UUID, service data, manufacturer data)
    virtual bool startAdvertising(const BleAdvertisement& advertisement) = 0;
    virtual void stopAdvertising() = 0;

    virtual std::string getLastError() const = 0;
};

struct BleDiscoveryConfig {
    int deviceTimeoutMs = BLE_DEVICE_TIMEOUT_MS;
    int checkIntervalMs = 1000;
    bool advertise = true;
};

// ═══════════════════════════════════════════════════════════
// BleDiscovery
// ═══════════════════════════════════════════════════════════

class CC_API BleDiscovery {
public:
    using Clock = std::chrono::steady_clock;

    BleDiscovery(std::shared_ptr<BleScanner> scanner, BleDiscoveryConfig config = {});
    ~BleDiscovery();

    // Запрет копирования
    BleDiscovery(const BleDiscovery&) = delete;
    BleDiscovery& operator=(const BleDiscovery&) = delete;

    /// Запустить сканирование и анонс
    /// @return false если сканер не запустился (анонс необязателен)
    bool start(const std::string& localDeviceId);
    void stop();
    bool isRunning() const;

    std::string getLastError() const;

    void setEventCallback(DiscoveryCallback callback);

    /// Обработать рекламный пакет (вызывается сканером; открыт для тестов)
    void handleAdvertisement(const BleAdvertisement& advertisement);

    /// DeviceLost для устройств без анонсов дольше deviceTimeoutMs
    void expireDevices(Clock::time_point now);

    std::vector<DeviceInfo> getDevices() const;

    /// device_id из service data KDE Connect или manufacturer data
    static std::optional<std::string> deviceIdFromAdvertisement(const BleAdvertisement& advertisement);

    /// Локальный анонс: device_id и в service data, и в manufacturer data
    static BleAdvertisement makeAdvertisement(const std::string& localDeviceId);

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace CosmicConnect

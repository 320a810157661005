#include "cosmicconnect/Network/BleDiscovery.h"
#include "cosmicconnect/Network/BluetoothTransport.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace CosmicConnect {

namespace {

struct SeenDevice {
    DeviceInfo info;
    BleDiscovery::Clock::time_point lastSeen;
};

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

/// Печатный ASCII без пробелов, 1..64 символа
std::optional<std::string> printableId(const std::vector<uint8_t>& data) {
    if (data.empty() || data.size() > 64) return std::nullopt;
    std::string id;
    for (uint8_t byte : data) {
        if (byte == 0) break;
        if (byte < 0x21 || byte > 0x7e) return std::nullopt;
        id.push_back(static_cast<char>(byte));
    }
    if (id.empty()) return std::nullopt;
    return id;
}

} // anonymous namespace

std::optional<std::string> BleDiscovery::deviceIdFromAdvertisement(const BleAdvertisement& advertisement) {
    const std::string serviceUuid = BLUETOOTH_SERVICE_UUID;
    for (const auto& [uuid, data] : advertisement.serviceData) {
        if (toLower(uuid) == serviceUuid) {
            if (auto id = printableId(data)) return id;
        }
    }

    bool advertisesService = std::any_of(
        advertisement.serviceUuids.begin(), advertisement.serviceUuids.end(),
        [&](const std::string& uuid) { return toLower(uuid) == serviceUuid; });
    if (!advertisesService) return std::nullopt;

    for (const auto& [company, data] : advertisement.manufacturerData) {
        if (auto id = printableId(data)) return id;
    }
    return std::nullopt;
}

BleAdvertisement BleDiscovery::makeAdvertisement(const std::string& localDeviceId) {
    std::vector<uint8_t> id(localDeviceId.begin(), localDeviceId.end());
    BleAdvertisement advertisement;
    advertisement.serviceUuids.push_back(BLUETOOTH_SERVICE_UUID);
    advertisement.serviceData[BLUETOOTH_SERVICE_UUID] = id;
    advertisement.manufacturerData[BLE_MANUFACTURER_ID] = id;
    return advertisement;
}

// ═══════════════════════════════════════════════════════════
// BleDiscovery::Impl
// ═══════════════════════════════════════════════════════════

class BleDiscovery::Impl {
public:
    Impl(std::shared_ptr<BleScanner> scanner, BleDiscoveryConfig config)
        : m_scanner(std::move(scanner))
        , m_config(config) {}

    ~Impl() {
        stop();
    }

    bool start(const std::string& localDeviceId) {
        if (m_running) return true;
        if (!m_scanner) {
            m_lastError = "no BLE scanner";
            return false;
        }
        m_localId = localDeviceId;

        bool scanning = m_scanner->startScan(BLUETOOTH_SERVICE_UUID,
            [this](const BleAdvertisement& advertisement) { handleAdvertisement(advertisement); });
        if (!scanning) {
            m_lastError = "BLE scan failed: " + m_scanner->getLastError();
            spdlog::warn("BleDiscovery: {}", m_lastError);
            return false;
        }

        if (m_config.advertise) {
            if (!m_scanner->startAdvertising(makeAdvertisement(localDeviceId))) {
                spdlog::warn("BleDiscovery: Advertising unavailable: {}", m_scanner->getLastError());
            }
        }

        m_running = true;
        m_expiryThread = std::thread([this]() { expiryLoop(); });
        spdlog::info("BleDiscovery: Started");
        return true;
    }

    void stop() {
        if (!m_running.exchange(false)) return;
        m_wakeup.notify_all();
        if (m_expiryThread.joinable()) m_expiryThread.join();

        m_scanner->stopScan();
        if (m_config.advertise) {
            m_scanner->stopAdvertising();
        }
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_devices.clear();
        }
        spdlog::info("BleDiscovery: Stopped");
    }

    bool isRunning() const { return m_running; }

    std::string getLastError() const { return m_lastError; }

    void setEventCallback(DiscoveryCallback callback) {
        std::lock_guard<std::mutex> lock(m_callbackMutex);
        m_onEvent = std::move(callback);
    }

    void handleAdvertisement(const BleAdvertisement& advertisement) {
        auto deviceId = deviceIdFromAdvertisement(advertisement);
        if (!deviceId) {
            spdlog::debug("BleDiscovery: No device id in advertisement from {}", advertisement.address);
            return;
        }
        if (*deviceId == m_localId) return;

        DeviceInfo info;
        info.deviceId = *deviceId;
        info.bluetoothAddress = advertisement.address;

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_devices.find(*deviceId);
            if (it == m_devices.end()) {
                spdlog::info("BleDiscovery: New device {} at {}", *deviceId, advertisement.address);
            }
            m_devices[*deviceId] = SeenDevice{info, Clock::now()};
        }

        emit(DiscoveryEvent::found(info, advertisement.address));
    }

    void expireDevices(Clock::time_point now) {
        std::vector<std::string> lost;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            for (auto it = m_devices.begin(); it != m_devices.end(); ) {
                auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                    now - it->second.lastSeen).count();
                if (elapsed > m_config.deviceTimeoutMs) {
                    spdlog::info("BleDiscovery: Device {} lost", it->first);
                    lost.push_back(it->first);
                    it = m_devices.erase(it);
                } else {
                    ++it;
                }
            }
        }
        for (const auto& deviceId : lost) {
            emit(DiscoveryEvent::lost(deviceId));
        }
    }

    std::vector<DeviceInfo> getDevices() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<DeviceInfo> result;
        for (const auto& [id, device] : m_devices) {
            result.push_back(device.info);
        }
        return result;
    }

private:
    std::shared_ptr<BleScanner> m_scanner;
    BleDiscoveryConfig m_config;
    std::string m_localId;
    std::string m_lastError;

    std::atomic<bool> m_running{false};
    std::thread m_expiryThread;
    std::mutex m_wakeMutex;
    std::condition_variable m_wakeup;

    mutable std::mutex m_mutex;
    std::map<std::string, SeenDevice> m_devices;

    std::mutex m_callbackMutex;
    DiscoveryCallback m_onEvent;

    void emit(const DiscoveryEvent& event) {
        DiscoveryCallback callback;
        {
            std::lock_guard<std::mutex> lock(m_callbackMutex);
            callback = m_onEvent;
        }
        if (callback) {
            callback(event);
        }
    }

    void expiryLoop() {
        while (m_running) {
            {
                std::unique_lock<std::mutex> lock(m_wakeMutex);
                m_wakeup.wait_for(lock, std::chrono::milliseconds(m_config.checkIntervalMs),
                                  [this]() { return !m_running.load(); });
            }
            if (!m_running) break;
            expireDevices(Clock::now());
        }
    }
};

// ═══════════════════════════════════════════════════════════
// Public Interface
// ═══════════════════════════════════════════════════════════

BleDiscovery::BleDiscovery(std::shared_ptr<BleScanner> scanner, BleDiscoveryConfig config)
    : m_impl(std::make_unique<Impl>(std::move(scanner), config)) {}

BleDiscovery::~BleDiscovery() = default;

bool BleDiscovery::start(const std::string& localDeviceId) {
    return m_impl->start(localDeviceId);
}

void BleDiscovery::stop() {
    m_impl->stop();
}

bool BleDiscovery::isRunning() const {
    return m_impl->isRunning();
}

std::string BleDiscovery::getLastError() const {
    return m_impl->getLastError();
}

void BleDiscovery::setEventCallback(DiscoveryCallback callback) {
    m_impl->setEventCallback(std::move(callback));
}

void BleDiscovery::handleAdvertisement(const BleAdvertisement& advertisement) {
    m_impl->handleAdvertisement(advertisement);
}

void BleDiscovery::expireDevices(Clock::time_point now) {
    m_impl->expireDevices(now);
}

std::vector<DeviceInfo> BleDiscovery::getDevices() const {
    return m_impl->getDevices();
}

} // namespace CosmicConnect

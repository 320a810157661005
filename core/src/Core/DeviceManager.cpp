// DeviceManager.cpp — std::shared_mutex, один писатель / много читателей

#include "cosmicconnect/DeviceManager.h"
#include "cosmicconnect/Certificate.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <map>
#include <mutex>
#include <shared_mutex>

namespace CosmicConnect {

// ═══════════════════════════════════════════════════════════
// DeviceManager::Impl
// ═══════════════════════════════════════════════════════════

class DeviceManager::Impl {
public:
    std::optional<Device> get(const std::string& deviceId) const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_devices.find(deviceId);
        if (it == m_devices.end()) return std::nullopt;
        return it->second;
    }

    std::vector<Device> list() const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        std::vector<Device> result;
        result.reserve(m_devices.size());
        for (const auto& [id, device] : m_devices) {
            result.push_back(device);
        }
        return result;
    }

    bool contains(const std::string& deviceId) const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        return m_devices.count(deviceId) > 0;
    }

    bool isTrusted(const std::string& deviceId) const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_devices.find(deviceId);
        return it != m_devices.end() && it->second.isTrusted;
    }

    size_t count() const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        return m_devices.size();
    }

    void updateFromIdentity(const DeviceInfo& info, const std::string& host, uint16_t port) {
        if (info.deviceId.empty()) return;

        Device snapshot;
        {
            std::unique_lock<std::shared_mutex> lock(m_mutex);
            auto& device = m_devices[info.deviceId];

            // BLE-анонс не знает имени и capabilities; не затираем известные
            std::optional<std::string> btAddress = info.bluetoothAddress ? info.bluetoothAddress
                                                                        : device.info.bluetoothAddress;
            if (!info.deviceName.empty() || device.info.deviceId.empty()) {
                std::optional<uint16_t> tcpPort = info.tcpPort ? info.tcpPort : device.info.tcpPort;
                device.info = info;
                device.info.tcpPort = tcpPort;
            }
            device.info.deviceId = info.deviceId;
            device.info.bluetoothAddress = btAddress;

            if (!host.empty()) {
                device.host = host;
            }
            if (port != 0) {
                device.port = port;
            } else if (info.tcpPort) {
                device.port = *info.tcpPort;
            }
            device.lastSeen = nowUnixMs();
            snapshot = device;
        }
        notify(snapshot);
    }

    void addTrusted(const TrustedPeerRecord& record) {
        if (record.deviceId.empty() || record.certificateDer.empty()) return;

        Device snapshot;
        {
            std::unique_lock<std::shared_mutex> lock(m_mutex);
            auto& device = m_devices[record.deviceId];
            device.info.deviceId = record.deviceId;
            if (device.info.deviceName.empty()) device.info.deviceName = record.name;
            if (device.info.deviceType == DeviceType::Unknown) device.info.deviceType = record.deviceType;
            device.pairingStatus = PairingStatus::Paired;
            device.certificateData = record.certificateDer;
            device.certificateFingerprint = Crypto::fingerprint(record.certificateDer);
            device.isTrusted = true;
            device.lastSeen = std::max(device.lastSeen, record.lastSeenAt);
            snapshot = device;
        }
        notify(snapshot);
    }

    bool setConnectionState(const std::string& deviceId, ConnectionState state) {
        Device snapshot;
        {
            std::unique_lock<std::shared_mutex> lock(m_mutex);
            auto it = m_devices.find(deviceId);
            if (it == m_devices.end()) return false;

            if (state == ConnectionState::Connected && !it->second.isTrusted) {
                spdlog::warn("DeviceManager: Refusing Connected for untrusted device {}", deviceId);
                return false;
            }
            if (it->second.connectionState == state) return true;

            it->second.connectionState = state;
            if (state == ConnectionState::Connected) {
                it->second.lastConnected = nowUnixMs();
            }
            snapshot = it->second;
        }
        notify(snapshot);
        return true;
    }

    bool setPairingStatus(const std::string& deviceId, PairingStatus status) {
        if (status == PairingStatus::Paired) return false;

        Device snapshot;
        {
            std::unique_lock<std::shared_mutex> lock(m_mutex);
            auto it = m_devices.find(deviceId);
            if (it == m_devices.end()) return false;

            Device& device = it->second;
            device.pairingStatus = status;
            device.certificateData.clear();
            device.isTrusted = false;
            if (device.connectionState == ConnectionState::Connected) {
                // Недоверенное устройство не может оставаться Connected
                device.connectionState = ConnectionState::Connecting;
            }
            snapshot = device;
        }
        notify(snapshot);
        return true;
    }

    bool markPaired(const std::string& deviceId, const std::vector<uint8_t>& certificateDer) {
        if (certificateDer.empty()) return false;

        Device snapshot;
        {
            std::unique_lock<std::shared_mutex> lock(m_mutex);
            auto it = m_devices.find(deviceId);
            if (it == m_devices.end()) return false;

            Device& device = it->second;
            device.pairingStatus = PairingStatus::Paired;
            device.certificateData = certificateDer;
            device.certificateFingerprint = Crypto::fingerprint(certificateDer);
            device.isTrusted = true;
            snapshot = device;
        }
        notify(snapshot);
        return true;
    }

    bool setCertificateFingerprint(const std::string& deviceId, const std::string& fingerprint) {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_devices.find(deviceId);
        if (it == m_devices.end()) return false;
        if (it->second.isTrusted) return true;   // Закреплённый отпечаток не меняется
        it->second.certificateFingerprint = fingerprint;
        return true;
    }

    void touch(const std::string& deviceId) {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_devices.find(deviceId);
        if (it != m_devices.end()) {
            it->second.lastSeen = nowUnixMs();
        }
    }

    bool remove(const std::string& deviceId) {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        return m_devices.erase(deviceId) > 0;
    }

    void clear() {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        m_devices.clear();
    }

    void onDeviceChanged(DeviceCallback callback) {
        std::lock_guard<std::mutex> lock(m_callbackMutex);
        m_onDeviceChanged = std::move(callback);
    }

private:
    mutable std::shared_mutex m_mutex;
    std::map<std::string, Device> m_devices;

    std::mutex m_callbackMutex;
    DeviceCallback m_onDeviceChanged;

    void notify(const Device& device) {
        DeviceCallback callback;
        {
            std::lock_guard<std::mutex> lock(m_callbackMutex);
            callback = m_onDeviceChanged;
        }
        if (callback) {
            callback(device);
        }
    }
};

// ═══════════════════════════════════════════════════════════
// DeviceManager Public Interface
// ═══════════════════════════════════════════════════════════

DeviceManager::DeviceManager() : m_impl(std::make_unique<Impl>()) {}
DeviceManager::~DeviceManager() = default;

std::optional<Device> DeviceManager::get(const std::string& deviceId) const {
    return m_impl->get(deviceId);
}

std::vector<Device> DeviceManager::list() const {
    return m_impl->list();
}

bool DeviceManager::contains(const std::string& deviceId) const {
    return m_impl->contains(deviceId);
}

bool DeviceManager::isTrusted(const std::string& deviceId) const {
    return m_impl->isTrusted(deviceId);
}

size_t DeviceManager::count() const {
    return m_impl->count();
}

void DeviceManager::updateFromIdentity(const DeviceInfo& info, const std::string& host, uint16_t port) {
    m_impl->updateFromIdentity(info, host, port);
}

void DeviceManager::addTrusted(const TrustedPeerRecord& record) {
    m_impl->addTrusted(record);
}

bool DeviceManager::setConnectionState(const std::string& deviceId, ConnectionState state) {
    return m_impl->setConnectionState(deviceId, state);
}

bool DeviceManager::setPairingStatus(const std::string& deviceId, PairingStatus status) {
    return m_impl->setPairingStatus(deviceId, status);
}

bool DeviceManager::markPaired(const std::string& deviceId, const std::vector<uint8_t>& certificateDer) {
    return m_impl->markPaired(deviceId, certificateDer);
}

bool DeviceManager::setCertificateFingerprint(const std::string& deviceId, const std::string& fingerprint) {
    return m_impl->setCertificateFingerprint(deviceId, fingerprint);
}

void DeviceManager::touch(const std::string& deviceId) {
    m_impl->touch(deviceId);
}

bool DeviceManager::remove(const std::string& deviceId) {
    return m_impl->remove(deviceId);
}

void DeviceManager::clear() {
    m_impl->clear();
}

void DeviceManager::onDeviceChanged(DeviceCallback callback) {
    m_impl->onDeviceChanged(std::move(callback));
}

} // namespace CosmicConnect

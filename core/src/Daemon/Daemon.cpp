#include "cosmicconnect/Daemon.h"
#include "cosmicconnect/Certificate.h"
#include "cosmicconnect/DeviceManager.h"
#include "cosmicconnect/Error.h"
#include "cosmicconnect/Pairing.h"
#include "cosmicconnect/Plugin.h"
#include "cosmicconnect/Recovery.h"
#include "cosmicconnect/ResourceManager.h"
#include "cosmicconnect/TransferTracker.h"
#include "cosmicconnect/TrustedPeerStore.h"
#include "cosmicconnect/Network/BleDiscovery.h"
#include "cosmicconnect/Network/BluetoothTransport.h"
#include "cosmicconnect/Network/ConnectionManager.h"
#include "cosmicconnect/Network/Discovery.h"
#include "cosmicconnect/Plugins/SharePlugin.h"
#include "../Core/FileUtil.h"
#ifdef COSMICCONNECT_HAVE_BLUEZ
#include "cosmicconnect/Network/BluezBackend.h"
#endif
#include <spdlog/spdlog.h>
#include <atomic>
#include <mutex>

namespace CosmicConnect {

const char* daemonStateToString(Daemon::DaemonState state) {
    switch (state) {
        case Daemon::DaemonState::Stopped: return "stopped";
        case Daemon::DaemonState::Starting: return "starting";
        case Daemon::DaemonState::Running: return "running";
        case Daemon::DaemonState::Stopping: return "stopping";
        case Daemon::DaemonState::Error: return "error";
    }
    return "unknown";
}

// ═══════════════════════════════════════════════════════════
// Implementation
// ═══════════════════════════════════════════════════════════

class Daemon::Impl {
public:
    explicit Impl(DaemonConfig config)
        : m_config(config.resolved()) {}

    ~Impl() {
        stop();
    }

    bool start() {
        {
            std::lock_guard<std::mutex> lock(m_stateMutex);
            if (m_state == DaemonState::Running || m_state == DaemonState::Starting) return true;
            m_state = DaemonState::Starting;
        }

        try {
            startComponents();
        } catch (const std::exception& e) {
            {
                std::lock_guard<std::mutex> lock(m_stateMutex);
                m_lastError = e.what();
            }
            spdlog::error("Daemon: Start failed: {}", e.what());
            stopComponents();
            setState(DaemonState::Error);
            return false;
        }

        setState(DaemonState::Running);
        spdlog::info("Daemon: Running as '{}' ({}), TCP port {}, fingerprint {}",
                     m_config.deviceName, m_deviceId, m_connections->getPort(),
                     m_certificate->fingerprint());
        return true;
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(m_stateMutex);
            if (m_state == DaemonState::Stopped || m_state == DaemonState::Stopping) return;
            m_state = DaemonState::Stopping;
        }
        spdlog::info("Daemon: Stopping");
        stopComponents();
        setState(DaemonState::Stopped);
        spdlog::info("Daemon: Stopped");
    }

    DaemonState getState() const {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        return m_state;
    }

    bool isRunning() const { return getState() == DaemonState::Running; }

    std::string getLastError() const {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        return m_lastError;
    }

    // ═══════════════════════════════════════════════════════════
    // Commands
    // ═══════════════════════════════════════════════════════════

    void pair(const std::string& deviceId) {
        requireRunning();
        // Pairing идёт по TLS-связи; для недоверенного пира это ограниченная сессия
        if (!m_connections->getSession(deviceId)) {
            m_connections->connect(deviceId);
        }
        m_pairing->requestPairing(deviceId);
    }

    void unpair(const std::string& deviceId) {
        requireRunning();
        m_pairing->unpair(deviceId);
    }

    void confirmPairing(const std::string& deviceId, bool accept) {
        requireRunning();
        m_pairing->confirm(deviceId, accept);
    }

    void connect(const std::string& deviceId) {
        requireRunning();
        m_connections->connect(deviceId);
    }

    std::string connectToAddress(const std::string& host, uint16_t port) {
        requireRunning();
        return m_connections->connectToAddress(host, port);
    }

    bool disconnect(const std::string& deviceId) {
        requireRunning();
        return m_connections->disconnect(deviceId, DisconnectReason::LocalRequest);
    }

    bool sendPacket(const std::string& deviceId, const Packet& packet) {
        requireRunning();
        return m_recovery->sendOrQueue(deviceId, packet);
    }

    std::string sendFile(const std::string& deviceId, const std::string& path) {
        requireRunning();
        return m_transfers->sendFile(deviceId, path);
    }

    // ═══════════════════════════════════════════════════════════
    // Queries
    // ═══════════════════════════════════════════════════════════

    DeviceInfo localIdentity() const {
        DeviceInfo info;
        info.deviceId = m_deviceId;
        info.deviceName = m_config.deviceName;
        info.deviceType = m_config.deviceType;
        info.protocolVersion = m_config.protocolVersion;
        if (m_plugins) {
            info.incomingCapabilities = m_plugins->incomingCapabilities();
            info.outgoingCapabilities = m_plugins->outgoingCapabilities();
        }
        if (m_connections && m_connections->getPort() != 0) {
            info.tcpPort = m_connections->getPort();
        }
        return info;
    }

    std::string localFingerprint() const {
        return m_certificate ? m_certificate->fingerprint() : std::string();
    }

    std::vector<Device> getDevices() const {
        return m_devices ? m_devices->list() : std::vector<Device>{};
    }

    std::optional<Device> getDevice(const std::string& deviceId) const {
        return m_devices ? m_devices->get(deviceId) : std::nullopt;
    }

    std::vector<std::string> getConnectedDevices() const {
        return m_connections ? m_connections->connectedDevices() : std::vector<std::string>{};
    }

    uint16_t getTcpPort() const { return m_connections ? m_connections->getPort() : 0; }
    uint16_t getDiscoveryPort() const { return m_discovery ? m_discovery->getPort() : 0; }

    MemoryStats getMemoryStats() const {
        return m_resources ? m_resources->stats() : MemoryStats{};
    }

    const DaemonConfig& config() const { return m_config; }

    std::shared_ptr<DeviceManager> devices() const { return m_devices; }
    std::shared_ptr<ConnectionManager> connections() const { return m_connections; }
    std::shared_ptr<Pairing> pairing() const { return m_pairing; }
    std::shared_ptr<PluginRegistry> plugins() const { return m_plugins; }
    std::shared_ptr<TransferManager> transfers() const { return m_transfers; }
    std::shared_ptr<RecoveryCoordinator> recovery() const { return m_recovery; }

    // ═══════════════════════════════════════════════════════════
    // Callbacks
    // ═══════════════════════════════════════════════════════════

    void onDiscoveryEvent(DiscoveryCallback callback) {
        std::lock_guard<std::mutex> lock(m_callbackMutex);
        m_onDiscovery = std::move(callback);
    }

    void onPairingEvent(PairingCallback callback) {
        std::lock_guard<std::mutex> lock(m_callbackMutex);
        m_onPairing = std::move(callback);
    }

    void onConnectionEvent(ConnectionCallback callback) {
        std::lock_guard<std::mutex> lock(m_callbackMutex);
        m_onConnection = std::move(callback);
    }

    void onTransferEvent(TransferManager::TransferCallback callback) {
        std::lock_guard<std::mutex> lock(m_callbackMutex);
        m_onTransfer = std::move(callback);
    }

private:
    DaemonConfig m_config;
    std::string m_deviceId;
    std::string m_lastError;

    mutable std::mutex m_stateMutex;
    DaemonState m_state = DaemonState::Stopped;

    std::unique_ptr<LocalCertificate> m_certificate;
    std::shared_ptr<DeviceManager> m_devices;
    std::shared_ptr<TrustedPeerStore> m_store;
    std::shared_ptr<TransferTracker> m_tracker;
    std::shared_ptr<ResourceManager> m_resources;
    std::shared_ptr<PluginRegistry> m_plugins;
    std::shared_ptr<ConnectionManager> m_connections;
    std::shared_ptr<TransferManager> m_transfers;
    std::shared_ptr<Pairing> m_pairing;
    std::shared_ptr<RecoveryCoordinator> m_recovery;
    std::unique_ptr<Discovery> m_discovery;
    std::shared_ptr<BluetoothBackend> m_bluetooth;
    std::unique_ptr<BleDiscovery> m_bleDiscovery;

    std::mutex m_callbackMutex;
    DiscoveryCallback m_onDiscovery;
    PairingCallback m_onPairing;
    ConnectionCallback m_onConnection;
    TransferManager::TransferCallback m_onTransfer;

    void setState(DaemonState state) {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_state = state;
    }

    void requireRunning() const {
        if (!isRunning()) {
            throw ProtocolError(ErrorKind::InvalidState, "daemon is not running");
        }
    }

    void startComponents() {
        std::string error;
        if (!FileUtil::ensureDirectory(m_config.stateDir, &error)) {
            throw ProtocolError(ErrorKind::Configuration, "state directory: " + error);
        }

        m_deviceId = m_config.deviceId.empty() ? loadOrCreateDeviceId(m_config.stateDir) : m_config.deviceId;
        m_certificate = std::make_unique<LocalCertificate>(
            LocalCertificate::loadOrCreate(m_config.stateDir, m_deviceId));

        m_devices = std::make_shared<DeviceManager>();

        m_store = std::make_shared<TrustedPeerStore>(FileUtil::joinPath(m_config.stateDir, TRUSTED_PEERS_FILE));
        if (!m_store->load()) {
            spdlog::warn("Daemon: Trusted peers not loaded: {}", m_store->getLastError());
        }

        m_tracker = std::make_shared<TransferTracker>(FileUtil::joinPath(m_config.stateDir, RECOVERY_STATE_FILE));

        ResourceConfig resources;
        resources.bytesBudget = m_config.memoryBudgetBytes;
        resources.maxConcurrent = m_config.maxConcurrentTransfers;
        m_resources = std::make_shared<ResourceManager>(resources);

        m_plugins = PluginRegistry::createDefault();

        ConnectionManagerConfig cmConfig;
        cmConfig.tcpPort = m_config.tcpPort;
        cmConfig.allowAnyPort = m_config.allowAnyPort;
        cmConfig.maxConnections = m_config.maxConnections;
        cmConfig.transportPreference = m_config.transportPreference;
        m_connections = std::make_shared<ConnectionManager>(
            cmConfig, *m_certificate, [this]() { return localIdentity(); },
            m_devices, m_plugins, m_resources);

        TransferConfig transferConfig;
        transferConfig.downloadDir = m_config.downloadDir;
        m_transfers = std::make_shared<TransferManager>(transferConfig, m_connections, m_tracker);
        m_transfers->setEventCallback(
            [this](const TransferState& state, TransferStatus status, const std::string& error) {
                TransferManager::TransferCallback callback;
                {
                    std::lock_guard<std::mutex> lock(m_callbackMutex);
                    callback = m_onTransfer;
                }
                if (callback) callback(state, status, error);
            });
        m_plugins->registerFactory(SharePlugin::factory(m_transfers));

        m_pairing = std::make_shared<Pairing>(m_devices, m_store, m_certificate->fingerprint());
        std::weak_ptr<ConnectionManager> weakConnections = m_connections;
        m_pairing->setPacketSender([weakConnections](const std::string& deviceId, const Packet& packet) {
            auto connections = weakConnections.lock();
            if (!connections) {
                throw ProtocolError(ErrorKind::TransportUnavailable, "connection manager is gone");
            }
            connections->send(deviceId, packet);
        });
        m_pairing->setEventCallback([this](const PairingEvent& event) { handlePairingEvent(event); });
        m_connections->setPairing(m_pairing);
        m_connections->setEventCallback([this](const ConnectionEvent& event) { handleConnectionEvent(event); });

        m_recovery = std::make_shared<RecoveryCoordinator>(RecoveryConfig{}, m_tracker);
        m_recovery->setConnector([weakConnections](const std::string& deviceId) {
            if (auto connections = weakConnections.lock()) {
                connections->connect(deviceId);
            }
        });
        m_recovery->setSender([weakConnections](const std::string& deviceId, const Packet& packet) {
            auto connections = weakConnections.lock();
            if (!connections) {
                throw ProtocolError(ErrorKind::TransportUnavailable, "connection manager is gone");
            }
            connections->send(deviceId, packet);
        });
        m_recovery->setReconnectPolicy([this](const std::string& deviceId) { return wantsAutoConnect(deviceId); });
        std::weak_ptr<TransferManager> weakTransfers = m_transfers;
        m_recovery->setResumeHandler([weakTransfers](const std::string& deviceId) {
            if (auto transfers = weakTransfers.lock()) {
                transfers->resumeTransfers(deviceId);
            }
        });
        m_recovery->start();

        startBluetooth();

        m_pairing->start();

        if (!m_connections->start()) {
            throw ProtocolError(ErrorKind::TransportUnavailable, m_connections->getLastError());
        }


        DiscoveryConfig discoveryConfig;
        discoveryConfig.port = m_config.discoveryPort;
        discoveryConfig.broadcastPort = m_config.broadcastPort;
        discoveryConfig.broadcastIntervalMs = m_config.broadcastIntervalMs;
        discoveryConfig.deviceTimeoutMs = m_config.deviceTimeoutMs;
        discoveryConfig.broadcast = m_config.broadcast;
        discoveryConfig.extraTargets = m_config.customDevices;
        m_discovery = std::make_unique<Discovery>(discoveryConfig);
        m_discovery->setEventCallback([this](const DiscoveryEvent& event) { handleDiscoveryEvent(event); });
        if (!m_discovery->start(localIdentity())) {
            // Подключение по адресу и входящие соединения продолжают работать
            spdlog::warn("Daemon: Discovery unavailable: {}", m_discovery->getLastError());
        }

        if (m_bleDiscovery && !m_bleDiscovery->start(m_deviceId)) {
            spdlog::warn("Daemon: BLE discovery unavailable: {}", m_bleDiscovery->getLastError());
        }
    }

    void startBluetooth() {
        if (!m_config.enableBluetooth) return;
#ifdef COSMICCONNECT_HAVE_BLUEZ
        auto backend = std::make_shared<BluezBackend>();
        if (!backend->start()) {
            spdlog::warn("Daemon: Bluetooth unavailable: {}", backend->getLastError());
        } else {
            m_connections->setBluetoothBackend(backend);
        }
        m_bluetooth = backend;
        m_bleDiscovery = std::make_unique<BleDiscovery>(backend);
        m_bleDiscovery->setEventCallback([this](const DiscoveryEvent& event) { handleDiscoveryEvent(event); });
#else
        spdlog::warn("Daemon: Built without BlueZ support, Bluetooth disabled");
#endif
    }

    void stopComponents() {
        if (m_bleDiscovery) m_bleDiscovery->stop();
        if (m_discovery) m_discovery->stop();
        if (m_recovery) m_recovery->stop();
        if (m_transfers) m_transfers->stop();
        if (m_connections) m_connections->stop();
        if (m_pairing) m_pairing->stop();
        if (m_bluetooth) m_bluetooth->stop();
    }

    /// Автоматически подключаемся только к доверенным и только со стороны TLS-клиента,
    /// чтобы два демона не открывали встречные соединения одновременно
    bool wantsAutoConnect(const std::string& deviceId) const {
        if (!m_devices->isTrusted(deviceId)) return false;
        if (m_connections->getSession(deviceId)) return false;
        return m_deviceId < deviceId;
    }

    // ═══════════════════════════════════════════════════════════
    // Event routing
    // ═══════════════════════════════════════════════════════════

    void handleDiscoveryEvent(const DiscoveryEvent& event) {
        if (event.type == DiscoveryEventType::DeviceFound) {
            bool viaBluetooth = event.info.bluetoothAddress && *event.info.bluetoothAddress == event.sourceAddress;
            if (viaBluetooth) {
                m_devices->updateFromIdentity(event.info);
            } else {
                m_devices->updateFromIdentity(event.info, event.sourceAddress, event.info.tcpPort.value_or(0));
            }
            if (m_recovery) {
                m_recovery->handleDiscoveryEvent(event);
            }
        }

        DiscoveryCallback callback;
        {
            std::lock_guard<std::mutex> lock(m_callbackMutex);
            callback = m_onDiscovery;
        }
        if (callback) callback(event);
    }

    void handlePairingEvent(const PairingEvent& event) {
        switch (event.type) {
            case PairingEventType::PairingCompleted:
                m_connections->promoteSession(event.deviceId);
                break;
            case PairingEventType::Unpaired:
            case PairingEventType::TrustBroken:
                m_connections->handleUnpaired(event.deviceId);
                break;
            default:
                break;
        }

        PairingCallback callback;
        {
            std::lock_guard<std::mutex> lock(m_callbackMutex);
            callback = m_onPairing;
        }
        if (callback) callback(event);
    }

    void handleConnectionEvent(const ConnectionEvent& event) {
        if (m_recovery) {
            m_recovery->handleConnectionEvent(event);
        }

        ConnectionCallback callback;
        {
            std::lock_guard<std::mutex> lock(m_callbackMutex);
            callback = m_onConnection;
        }
        if (callback) callback(event);
    }
};

// ═══════════════════════════════════════════════════════════
// Public Interface
// ═══════════════════════════════════════════════════════════

Daemon::Daemon(DaemonConfig config)
    : m_impl(std::make_unique<Impl>(std::move(config))) {}

Daemon::~Daemon() = default;

bool Daemon::start() {
    return m_impl->start();
}

void Daemon::stop() {
    m_impl->stop();
}

Daemon::DaemonState Daemon::getState() const {
    return m_impl->getState();
}

bool Daemon::isRunning() const {
    return m_impl->isRunning();
}

std::string Daemon::getLastError() const {
    return m_impl->getLastError();
}

void Daemon::pair(const std::string& deviceId) {
    m_impl->pair(deviceId);
}

void Daemon::unpair(const std::string& deviceId) {
    m_impl->unpair(deviceId);
}

void Daemon::confirmPairing(const std::string& deviceId, bool accept) {
    m_impl->confirmPairing(deviceId, accept);
}

void Daemon::connect(const std::string& deviceId) {
    m_impl->connect(deviceId);
}

std::string Daemon::connectToAddress(const std::string& host, uint16_t port) {
    return m_impl->connectToAddress(host, port);
}

bool Daemon::disconnect(const std::string& deviceId) {
    return m_impl->disconnect(deviceId);
}

bool Daemon::sendPacket(const std::string& deviceId, const Packet& packet) {
    return m_impl->sendPacket(deviceId, packet);
}

std::string Daemon::sendFile(const std::string& deviceId, const std::string& path) {
    return m_impl->sendFile(deviceId, path);
}

DeviceInfo Daemon::getLocalIdentity() const {
    return m_impl->localIdentity();
}

std::string Daemon::getLocalFingerprint() const {
    return m_impl->localFingerprint();
}

std::vector<Device> Daemon::getDevices() const {
    return m_impl->getDevices();
}

std::optional<Device> Daemon::getDevice(const std::string& deviceId) const {
    return m_impl->getDevice(deviceId);
}

std::vector<std::string> Daemon::getConnectedDevices() const {
    return m_impl->getConnectedDevices();
}

uint16_t Daemon::getTcpPort() const {
    return m_impl->getTcpPort();
}

uint16_t Daemon::getDiscoveryPort() const {
    return m_impl->getDiscoveryPort();
}

MemoryStats Daemon::getMemoryStats() const {
    return m_impl->getMemoryStats();
}

const DaemonConfig& Daemon::config() const {
    return m_impl->config();
}

std::shared_ptr<DeviceManager> Daemon::devices() const {
    return m_impl->devices();
}

std::shared_ptr<ConnectionManager> Daemon::connections() const {
    return m_impl->connections();
}

std::shared_ptr<Pairing> Daemon::pairing() const {
    return m_impl->pairing();
}

std::shared_ptr<PluginRegistry> Daemon::plugins() const {
    return m_impl->plugins();
}

std::shared_ptr<TransferManager> Daemon::transfers() const {
    return m_impl->transfers();
}

std::shared_ptr<RecoveryCoordinator> Daemon::recovery() const {
    return m_impl->recovery();
}

void Daemon::onDiscoveryEvent(DiscoveryCallback callback) {
    m_impl->onDiscoveryEvent(std::move(callback));
}

void Daemon::onPairingEvent(PairingCallback callback) {
    m_impl->onPairingEvent(std::move(callback));
}

void Daemon::onConnectionEvent(ConnectionCallback callback) {
    m_impl->onConnectionEvent(std::move(callback));
}

void Daemon::onTransferEvent(TransferManager::TransferCallback callback) {
    m_impl->onTransferEvent(std::move(callback));
}

} // namespace CosmicConnect

// Discovery.cpp — UDP broadcast discovery of KDE Connect identity packets

#include "cosmicconnect/Network/Discovery.h"
#include "cosmicconnect/Network/Packet.h"
#include "SocketCompat.h"
#include <spdlog/spdlog.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <random>
#include <thread>

namespace CosmicConnect {

using Clock = std::chrono::steady_clock;

namespace {

// ═══════════════════════════════════════════════════════════
// DiscoveredDevice: внутренняя структура с timestamp
// ═══════════════════════════════════════════════════════════

struct DiscoveredDevice {
    DeviceInfo info;
    std::string address;
    Clock::time_point lastSeen;
};

/// Окно схлопывания для одного источника
struct SourceWindow {
    Clock::time_point lastProcessed;
    std::optional<std::string> pending;     // последний датаграм внутри окна
};

std::string trimLine(const std::string& data) {
    size_t end = data.find_last_not_of("\r\n\0 ", std::string::npos, 4);
    return end == std::string::npos ? std::string() : data.substr(0, end + 1);
}

} // anonymous namespace

// ═══════════════════════════════════════════════════════════
// Discovery::Impl
// ═══════════════════════════════════════════════════════════

class Discovery::Impl {
public:
    explicit Impl(DiscoveryConfig config)
        : m_config(std::move(config))
        , m_rng(std::random_device{}()) {}

    ~Impl() {
        stop();
    }

    bool start(const DeviceInfo& thisDevice) {
        if (m_running) return true;

        {
            std::lock_guard<std::mutex> lock(m_identityMutex);
            m_thisDevice = thisDevice;
        }

        if (!createSockets()) {
            return false;
        }

        m_running = true;

        m_broadcastThread = std::thread([this]() { broadcastLoop(); });
        m_listenThread = std::thread([this]() { listenLoop(); });
        m_cleanupThread = std::thread([this]() { cleanupLoop(); });

        spdlog::info("Discovery: Started for device '{}' ({}) on UDP port {}",
                     thisDevice.deviceName, thisDevice.deviceId, m_port);
        return true;
    }

    void stop() {
        if (!m_running.exchange(false)) return;

        m_wakeup.notify_all();

        if (m_broadcastThread.joinable()) m_broadcastThread.join();
        if (m_listenThread.joinable()) m_listenThread.join();
        if (m_cleanupThread.joinable()) m_cleanupThread.join();

        closeSockets();

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_devices.clear();
            m_sources.clear();
        }

        spdlog::info("Discovery: Stopped");
    }

    bool isRunning() const { return m_running; }
    uint16_t getPort() const { return m_port; }
    std::string getLastError() const { return m_lastError; }

    void announceNow() {
        {
            std::lock_guard<std::mutex> lock(m_wakeMutex);
            m_announceRequested = true;
        }
        m_wakeup.notify_all();
    }

    void updateIdentity(const DeviceInfo& thisDevice) {
        {
            std::lock_guard<std::mutex> lock(m_identityMutex);
            m_thisDevice = thisDevice;
        }
        announceNow();
    }

    std::vector<DeviceInfo> getDevices() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<DeviceInfo> result;
        result.reserve(m_devices.size());
        for (const auto& [id, device] : m_devices) {
            result.push_back(device.info);
        }
        return result;
    }

    std::optional<DeviceInfo> getDevice(const std::string& deviceId) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_devices.find(deviceId);
        if (it != m_devices.end()) {
            return it->second.info;
        }
        return std::nullopt;
    }

    std::optional<std::string> getDeviceAddress(const std::string& deviceId) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_devices.find(deviceId);
        if (it != m_devices.end()) {
            return it->second.address;
        }
        return std::nullopt;
    }

    void setEventCallback(DiscoveryCallback callback) {
        std::lock_guard<std::mutex> lock(m_callbackMutex);
        m_onEvent = std::move(callback);
    }

    void handleDatagram(const std::string& data, const std::string& senderAddress) {
        auto now = Clock::now();
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto& window = m_sources[senderAddress];
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                now - window.lastProcessed).count();
            if (window.lastProcessed.time_since_epoch().count() != 0 &&
                elapsed < m_config.coalesceWindowMs) {
                // Внутри окна: сохраняем только последний
                window.pending = data;
                return;
            }
            window.lastProcessed = now;
            window.pending.reset();
        }
        processDatagram(data, senderAddress);
    }

private:
    DiscoveryConfig m_config;
    std::atomic<bool> m_running{false};
    uint16_t m_port = 0;
    std::string m_lastError;

    std::mutex m_identityMutex;
    DeviceInfo m_thisDevice;

    socket_t m_socket = SOCKET_INVALID;
    socket_t m_socket6 = SOCKET_INVALID;

    std::thread m_broadcastThread;
    std::thread m_listenThread;
    std::thread m_cleanupThread;

    std::mutex m_wakeMutex;
    std::condition_variable m_wakeup;
    bool m_announceRequested = false;

    mutable std::mutex m_mutex;
    std::map<std::string, DiscoveredDevice> m_devices;
    std::map<std::string, SourceWindow> m_sources;

    std::mutex m_callbackMutex;
    DiscoveryCallback m_onEvent;

    std::mt19937 m_rng;

    void emit(const DiscoveryEvent& event) {
        DiscoveryCallback callback;
        {
            std::lock_guard<std::mutex> lock(m_callbackMutex);
            callback = m_onEvent;
        }
        if (callback) callback(event);
    }

    bool createSockets() {
        m_socket = socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
        if (m_socket == SOCKET_INVALID) {
            m_lastError = "Failed to create socket: " + socketErrorString(SOCKET_ERROR_CODE);
            spdlog::error("Discovery: {}", m_lastError);
            return false;
        }

        int enable = 1;
        setsockopt(m_socket, SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(enable));
#ifdef SO_REUSEPORT
        setsockopt(m_socket, SOL_SOCKET, SO_REUSEPORT, &enable, sizeof(enable));
#endif
        if (setsockopt(m_socket, SOL_SOCKET, SO_BROADCAST, &enable, sizeof(enable)) < 0) {
            spdlog::warn("Discovery: Failed to enable broadcast: {}",
                         socketErrorString(SOCKET_ERROR_CODE));
        }

        sockaddr_in bindAddr{};
        bindAddr.sin_family = AF_INET;
        bindAddr.sin_port = htons(m_config.port);
        bindAddr.sin_addr.s_addr = INADDR_ANY;

        if (bind(m_socket, reinterpret_cast<sockaddr*>(&bindAddr), sizeof(bindAddr)) < 0) {
            m_lastError = "Failed to bind UDP port " + std::to_string(m_config.port) + ": " +
                          socketErrorString(SOCKET_ERROR_CODE);
            spdlog::error("Discovery: {}", m_lastError);
            closeSockets();
            return false;
        }

        sockaddr_in bound{};
        socklen_t len = sizeof(bound);
        getsockname(m_socket, reinterpret_cast<sockaddr*>(&bound), &len);
        m_port = ntohs(bound.sin_port);

        if (m_config.enableIpv6) {
            createIpv6Socket();
        }
        return true;
    }

    void createIpv6Socket() {
        m_socket6 = socket(AF_INET6, SOCK_DGRAM, IPPROTO_UDP);
        if (m_socket6 == SOCKET_INVALID) {
            spdlog::debug("Discovery: IPv6 unavailable");
            return;
        }
        int enable = 1;
        setsockopt(m_socket6, SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(enable));
#ifdef SO_REUSEPORT
        setsockopt(m_socket6, SOL_SOCKET, SO_REUSEPORT, &enable, sizeof(enable));
#endif
        setsockopt(m_socket6, IPPROTO_IPV6, IPV6_V6ONLY, &enable, sizeof(enable));

        sockaddr_in6 addr{};
        addr.sin6_family = AF_INET6;
        addr.sin6_port = htons(m_port);
        addr.sin6_addr = in6addr_any;
        if (bind(m_socket6, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
            spdlog::debug("Discovery: IPv6 bind failed: {}", socketErrorString(SOCKET_ERROR_CODE));
            CLOSE_SOCKET(m_socket6);
            m_socket6 = SOCKET_INVALID;
        }
    }

    void closeSockets() {
        if (m_socket != SOCKET_INVALID) {
            CLOSE_SOCKET(m_socket);
            m_socket = SOCKET_INVALID;
        }
        if (m_socket6 != SOCKET_INVALID) {
            CLOSE_SOCKET(m_socket6);
            m_socket6 = SOCKET_INVALID;
        }
    }

    std::string createAnnounceMessage() {
        DeviceInfo identity;
        {
            std::lock_guard<std::mutex> lock(m_identityMutex);
            identity = m_thisDevice;
        }
        Packet packet = Packet::identity(identity);
        packet.id = nowUnixMs();
        return PacketCodec::serialize(packet);
    }

    void sendAnnouncement() {
        std::string message;
        try {
            message = createAnnounceMessage();
        } catch (const ProtocolError& e) {
            spdlog::error("Discovery: Cannot encode identity: {}", e.what());
            return;
        }

        std::vector<std::string> targets = m_config.extraTargets;
        if (m_config.broadcast) {
            auto broadcasts = getBroadcastAddresses();
            targets.insert(targets.end(), broadcasts.begin(), broadcasts.end());
        }

        for (const auto& target : targets) {
            sockaddr_in destAddr{};
            destAddr.sin_family = AF_INET;
            destAddr.sin_port = htons(m_config.broadcastPort);
            if (inet_pton(AF_INET, target.c_str(), &destAddr.sin_addr) != 1) {
                spdlog::debug("Discovery: Skipping invalid target {}", target);
                continue;
            }
            if (sendto(m_socket, message.data(), message.size(), 0,
                       reinterpret_cast<sockaddr*>(&destAddr), sizeof(destAddr)) < 0) {
                int err = SOCKET_ERROR_CODE;
                spdlog::debug("Discovery: sendto {} failed: {}", target, socketErrorString(err));
            }
        }

        if (m_socket6 != SOCKET_INVALID && m_config.broadcast) {
            sendIpv6Multicast(message);
        }
    }

    void sendIpv6Multicast(const std::string& message) {
        struct ifaddrs* ifap = nullptr;
        if (getifaddrs(&ifap) != 0) return;

        std::vector<unsigned int> indexes;
        for (auto* ifa = ifap; ifa; ifa = ifa->ifa_next) {
            if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET6) continue;
            if (!(ifa->ifa_flags & IFF_UP) || (ifa->ifa_flags & IFF_LOOPBACK)) continue;
            if (!(ifa->ifa_flags & IFF_MULTICAST)) continue;
            unsigned int index = if_nametoindex(ifa->ifa_name);
            if (index != 0 && std::find(indexes.begin(), indexes.end(), index) == indexes.end()) {
                indexes.push_back(index);
            }
        }
        freeifaddrs(ifap);

        for (unsigned int index : indexes) {
            sockaddr_in6 dest{};
            dest.sin6_family = AF_INET6;
            dest.sin6_port = htons(m_config.broadcastPort);
            dest.sin6_scope_id = index;
            inet_pton(AF_INET6, "ff02::1", &dest.sin6_addr);
            setsockopt(m_socket6, IPPROTO_IPV6, IPV6_MULTICAST_IF, &index, sizeof(index));
            sendto(m_socket6, message.data(), message.size(), 0,
                   reinterpret_cast<sockaddr*>(&dest), sizeof(dest));
        }
    }

    std::chrono::milliseconds nextInterval() {
        std::uniform_real_distribution<double> jitter(1.0 - BROADCAST_JITTER, 1.0 + BROADCAST_JITTER);
        return std::chrono::milliseconds(
            static_cast<int64_t>(m_config.broadcastIntervalMs * jitter(m_rng)));
    }

    void broadcastLoop() {
        spdlog::debug("Discovery: Broadcast thread started");

        while (m_running) {
            sendAnnouncement();

            std::unique_lock<std::mutex> lock(m_wakeMutex);
            m_wakeup.wait_for(lock, nextInterval(), [this]() {
                return !m_running || m_announceRequested;
            });
            m_announceRequested = false;
        }

        spdlog::debug("Discovery: Broadcast thread stopped");
    }

    void listenLoop() {
        spdlog::debug("Discovery: Listen thread started");

        std::vector<char> buffer(MAX_DATAGRAM_SIZE + 1);

        while (m_running) {
            pollfd fds[2];
            nfds_t count = 0;
            fds[count++] = pollfd{m_socket, POLLIN, 0};
            if (m_socket6 != SOCKET_INVALID) {
                fds[count++] = pollfd{m_socket6, POLLIN, 0};
            }

            int r = ::poll(fds, count, 1000);
            if (r <= 0) continue;   // Timeout или EINTR

            for (nfds_t i = 0; i < count; ++i) {
                if (!(fds[i].revents & POLLIN)) continue;

                sockaddr_storage senderAddr{};
                socklen_t senderLen = sizeof(senderAddr);
                ssize_t received = recvfrom(fds[i].fd, buffer.data(), MAX_DATAGRAM_SIZE, 0,
                                            reinterpret_cast<sockaddr*>(&senderAddr), &senderLen);
                if (received <= 0) continue;

                std::string sender = sockaddrToString(senderAddr);
                try {
                    handleDatagram(std::string(buffer.data(), static_cast<size_t>(received)), sender);
                } catch (const std::exception& e) {
                    spdlog::warn("Discovery: Error handling datagram from {}: {}", sender, e.what());
                }
            }
        }

        spdlog::debug("Discovery: Listen thread stopped");
    }

    void processDatagram(const std::string& data, const std::string& senderAddress) {
        Packet packet;
        try {
            packet = PacketCodec::parse(trimLine(data));
        } catch (const ProtocolError& e) {
            spdlog::debug("Discovery: Failed to parse datagram from {}: {}", senderAddress, e.what());
            return;
        }

        if (!packet.isType(PACKET_TYPE_IDENTITY)) {
            spdlog::debug("Discovery: Ignoring {} from {}", packet.type, senderAddress);
            return;
        }

        auto info = deviceInfoFromIdentity(packet);
        if (!info) {
            spdlog::debug("Discovery: Identity without deviceId from {}", senderAddress);
            return;
        }

        {
            std::lock_guard<std::mutex> lock(m_identityMutex);
            if (info->deviceId == m_thisDevice.deviceId) return;   // свой анонс
        }

        if (!isSupportedProtocolVersion(info->protocolVersion)) {
            std::string detail = "device " + info->deviceId + " at " + senderAddress +
                                 " speaks protocol " + std::to_string(info->protocolVersion);
            spdlog::warn("Discovery: ProtocolVersionMismatch: {}", detail);
            emit(DiscoveryEvent::error(ErrorKind::ProtocolVersionMismatch, detail));
            return;
        }

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_devices.find(info->deviceId);
            if (it == m_devices.end()) {
                spdlog::info("Discovery: New device '{}' ({}) at {}",
                             info->deviceName, info->deviceId, senderAddress);
            }
            m_devices[info->deviceId] = DiscoveredDevice{*info, senderAddress, Clock::now()};
        }

        emit(DiscoveryEvent::found(*info, senderAddress));
    }

    void flushPendingSources() {
        auto now = Clock::now();
        std::vector<std::pair<std::string, std::string>> ready;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            for (auto it = m_sources.begin(); it != m_sources.end(); ) {
                auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                    now - it->second.lastProcessed).count();
                if (elapsed >= m_config.coalesceWindowMs) {
                    if (it->second.pending) {
                        ready.emplace_back(it->first, *it->second.pending);
                        it->second.pending.reset();
                        it->second.lastProcessed = now;
                    } else if (elapsed >= m_config.deviceTimeoutMs) {
                        it = m_sources.erase(it);
                        continue;
                    }
                }
                ++it;
            }
        }
        for (const auto& [source, data] : ready) {
            processDatagram(data, source);
        }
    }

    void expireDevices() {
        auto now = Clock::now();
        std::vector<std::string> lostDevices;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            for (auto it = m_devices.begin(); it != m_devices.end(); ) {
                auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                    now - it->second.lastSeen).count();
                if (elapsed > m_config.deviceTimeoutMs) {
                    spdlog::info("Discovery: Device '{}' lost", it->second.info.deviceName);
                    lostDevices.push_back(it->first);
                    it = m_devices.erase(it);
                } else {
                    ++it;
                }
            }
        }

        for (const auto& deviceId : lostDevices) {
            emit(DiscoveryEvent::lost(deviceId));
        }
    }

    void cleanupLoop() {
        spdlog::debug("Discovery: Cleanup thread started");

        const auto tick = std::chrono::milliseconds(
            std::max(10, std::min(100, m_config.coalesceWindowMs / 4)));

        while (m_running) {
            {
                std::unique_lock<std::mutex> lock(m_wakeMutex);
                m_wakeup.wait_for(lock, tick, [this]() { return !m_running.load(); });
            }
            if (!m_running) break;

            try {
                flushPendingSources();
                expireDevices();
            } catch (const std::exception& e) {
                spdlog::warn("Discovery: Cleanup error: {}", e.what());
            }
        }

        spdlog::debug("Discovery: Cleanup thread stopped");
    }
};

// ═══════════════════════════════════════════════════════════
// Discovery Public Interface
// ═══════════════════════════════════════════════════════════

Discovery::Discovery(DiscoveryConfig config) : m_impl(std::make_unique<Impl>(std::move(config))) {}
Discovery::~Discovery() = default;

bool Discovery::start(const DeviceInfo& thisDevice) {
    return m_impl->start(thisDevice);
}

void Discovery::stop() {
    m_impl->stop();
}

bool Discovery::isRunning() const {
    return m_impl->isRunning();
}

uint16_t Discovery::getPort() const {
    return m_impl->getPort();
}

std::string Discovery::getLastError() const {
    return m_impl->getLastError();
}

void Discovery::announceNow() {
    m_impl->announceNow();
}

void Discovery::updateIdentity(const DeviceInfo& thisDevice) {
    m_impl->updateIdentity(thisDevice);
}

std::vector<DeviceInfo> Discovery::getDevices() const {
    return m_impl->getDevices();
}

std::optional<DeviceInfo> Discovery::getDevice(const std::string& deviceId) const {
    return m_impl->getDevice(deviceId);
}

std::optional<std::string> Discovery::getDeviceAddress(const std::string& deviceId) const {
    return m_impl->getDeviceAddress(deviceId);
}

void Discovery::handleDatagram(const std::string& data, const std::string& senderAddress) {
    m_impl->handleDatagram(data, senderAddress);
}

void Discovery::setEventCallback(DiscoveryCallback callback) {
    m_impl->setEventCallback(std::move(callback));
}

// ═══════════════════════════════════════════════════════════
// Static helpers
// ═══════════════════════════════════════════════════════════

std::vector<std::string> Discovery::getLocalIpAddresses() {
    std::vector<std::string> addresses;

    struct ifaddrs* ifap;
    if (getifaddrs(&ifap) == 0) {
        for (auto* ifa = ifap; ifa; ifa = ifa->ifa_next) {
            if (!ifa->ifa_addr) continue;
            if (ifa->ifa_addr->sa_family != AF_INET) continue;
            if (!(ifa->ifa_flags & IFF_UP)) continue;
            if (ifa->ifa_flags & IFF_LOOPBACK) continue;

            auto* sin = reinterpret_cast<sockaddr_in*>(ifa->ifa_addr);
            char ip[INET_ADDRSTRLEN];
            inet_ntop(AF_INET, &sin->sin_addr, ip, sizeof(ip));
            addresses.push_back(ip);
        }
        freeifaddrs(ifap);
    }

    return addresses;
}

std::vector<std::string> Discovery::getBroadcastAddresses() {
    std::vector<std::string> broadcasts;

    struct ifaddrs* ifap;
    if (getifaddrs(&ifap) == 0) {
        for (auto* ifa = ifap; ifa; ifa = ifa->ifa_next) {
            if (!ifa->ifa_addr) continue;
            if (ifa->ifa_addr->sa_family != AF_INET) continue;
            if (!(ifa->ifa_flags & IFF_UP)) continue;
            if (ifa->ifa_flags & IFF_LOOPBACK) continue;
            if (!(ifa->ifa_flags & IFF_BROADCAST)) continue;
            if (!ifa->ifa_broadaddr) continue;

            auto* sin = reinterpret_cast<sockaddr_in*>(ifa->ifa_broadaddr);
            char ip[INET_ADDRSTRLEN];
            inet_ntop(AF_INET, &sin->sin_addr, ip, sizeof(ip));
            if (std::find(broadcasts.begin(), broadcasts.end(), ip) == broadcasts.end()) {
                broadcasts.push_back(ip);
            }
        }
        freeifaddrs(ifap);
    }

    broadcasts.push_back("255.255.255.255");
    return broadcasts;
}

} // namespace CosmicConnect

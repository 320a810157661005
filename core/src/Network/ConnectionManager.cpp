#include "cosmicconnect/Network/ConnectionManager.h"
#include "cosmicconnect/Network/BluetoothTransport.h"
#include "cosmicconnect/Network/PayloadChannel.h"
#include "cosmicconnect/Network/TcpTransport.h"
#include "cosmicconnect/Network/TlsStream.h"
#include "cosmicconnect/Certificate.h"
#include "cosmicconnect/DeviceManager.h"
#include "cosmicconnect/Pairing.h"
#include "cosmicconnect/Plugin.h"
#include <spdlog/spdlog.h>
#include <atomic>
#include <condition_variable>
#include <exception>
#include <list>
#include <map>
#include <mutex>
#include <set>
#include <thread>

namespace CosmicConnect {

using std::chrono::milliseconds;

// ═══════════════════════════════════════════════════════════
// PayloadUpload / PayloadDownload
// ═══════════════════════════════════════════════════════════

PayloadUpload::PayloadUpload() = default;
PayloadUpload::~PayloadUpload() = default;
PayloadUpload::PayloadUpload(PayloadUpload&&) noexcept = default;
PayloadUpload& PayloadUpload::operator=(PayloadUpload&&) noexcept = default;

PayloadDownload::PayloadDownload() = default;
PayloadDownload::~PayloadDownload() = default;
PayloadDownload::PayloadDownload(PayloadDownload&&) noexcept = default;
PayloadDownload& PayloadDownload::operator=(PayloadDownload&&) noexcept = default;

// ═══════════════════════════════════════════════════════════
// Implementation
// ═══════════════════════════════════════════════════════════

class ConnectionManager::Impl {
public:
    Impl(ConnectionManagerConfig config,
         const LocalCertificate& certificate,
         IdentityProvider identity,
         std::shared_ptr<DeviceManager> devices,
         std::shared_ptr<PluginRegistry> plugins,
         std::shared_ptr<ResourceManager> resources)
        : m_config(std::move(config))
        , m_certificate(certificate)
        , m_identity(std::move(identity))
        , m_devices(std::move(devices))
        , m_plugins(std::move(plugins))
        , m_resources(resources ? std::move(resources) : std::make_shared<ResourceManager>()) {}

    ~Impl() {
        stop();
    }

    // ═══════════════════════════════════════════════════════════
    // Lifecycle
    // ═══════════════════════════════════════════════════════════

    bool start() {
        if (m_running) {
            return true;
        }

        bool listening = m_config.tcpPort == 0
            ? m_listener.start(0)
            : m_listener.startInRange(m_config.tcpPort, m_config.maxTcpPort, m_config.allowAnyPort);
        if (!listening) {
            setLastError("No TCP port available in " + std::to_string(m_config.tcpPort) + ".." +
                         std::to_string(m_config.maxTcpPort) + ": " + m_listener.getLastError());
            spdlog::error("ConnectionManager: {}", getLastError());
            return false;
        }

        m_running = true;
        m_acceptThread = std::thread([this]() { acceptLoop(m_listener, "TCP"); });

        auto bluetooth = bluetoothRef();
        if (bluetooth) {
            if (bluetooth->start()) {
                m_bluetoothListener = std::make_unique<BluetoothListener>(bluetooth);
                m_bluetoothThread = std::thread([this]() { acceptLoop(*m_bluetoothListener, "Bluetooth"); });
            } else {
                spdlog::warn("ConnectionManager: Bluetooth unavailable: {}", bluetooth->getLastError());
            }
        }

        m_reaperThread = std::thread([this]() { reaperLoop(); });

        uint16_t port = m_listener.getPort();
        spdlog::info("ConnectionManager: Listening on TCP port {}", port);

        ConnectionEvent event;
        event.type = ConnectionEventType::ManagerStarted;
        event.port = port;
        emit(event);
        return true;
    }

    void stop() {
        if (!m_running.exchange(false)) {
            return;
        }
        spdlog::info("ConnectionManager: Stopping...");

        m_listener.stop();
        if (m_bluetoothListener) m_bluetoothListener->stop();
        if (m_acceptThread.joinable()) m_acceptThread.join();
        if (m_bluetoothThread.joinable()) m_bluetoothThread.join();

        // Незавершённые handshake ограничены таймаутами
        std::list<Handshake> handshakes;
        {
            std::lock_guard<std::mutex> lock(m_handshakesMutex);
            handshakes.swap(m_handshakes);
        }
        for (auto& h : handshakes) {
            if (h.thread.joinable()) h.thread.join();
        }

        // Reaper останавливается до join сессий: дальше их join выполняет только stop()
        m_reaperCv.notify_all();
        if (m_reaperThread.joinable()) m_reaperThread.join();

        std::vector<std::shared_ptr<Session>> sessions;
        {
            std::lock_guard<std::mutex> lock(m_sessionsMutex);
            for (const auto& [serial, session] : m_allSessions) {
                sessions.push_back(session);
            }
        }
        for (auto& session : sessions) {
            session->close(DisconnectReason::Shutdown, "connection manager stopped");
        }
        for (auto& session : sessions) {
            session->join();
        }
        reapClosed();
        reapHandshakes();

        {
            std::lock_guard<std::mutex> lock(m_sessionsMutex);
            m_sessions.clear();
            m_allSessions.clear();
            m_connectedSerials.clear();
        }

        ConnectionEvent event;
        event.type = ConnectionEventType::ManagerStopped;
        emit(event);
        spdlog::info("ConnectionManager: Stopped");
    }

    bool isRunning() const { return m_running; }

    uint16_t getPort() const { return m_listener.getPort(); }

    std::string getLastError() const {
        std::lock_guard<std::mutex> lock(m_errorMutex);
        return m_lastError;
    }

    void setPairing(std::shared_ptr<Pairing> pairing) {
        std::lock_guard<std::mutex> lock(m_refsMutex);
        m_pairing = std::move(pairing);
    }

    void setBluetoothBackend(std::shared_ptr<BluetoothBackend> backend) {
        std::lock_guard<std::mutex> lock(m_refsMutex);
        m_bluetooth = std::move(backend);
    }

    void setEventCallback(ConnectionCallback callback) {
        std::lock_guard<std::mutex> lock(m_callbackMutex);
        m_callback = std::move(callback);
    }

    // ═══════════════════════════════════════════════════════════
    // Commands
    // ═══════════════════════════════════════════════════════════

    void connect(const std::string& deviceId) {
        if (!m_running) {
            throw ProtocolError(ErrorKind::InvalidState, "connection manager is not running");
        }

        std::shared_ptr<Attempt> attempt;
        bool owner = false;
        {
            std::lock_guard<std::mutex> lock(m_connectMutex);
            auto it = m_attempts.find(deviceId);
            if (it != m_attempts.end()) {
                attempt = it->second;
            } else {
                if (isConnected(deviceId)) {
                    return;
                }
                attempt = std::make_shared<Attempt>();
                m_attempts[deviceId] = attempt;
                owner = true;
            }
        }

        if (!owner) {
            spdlog::debug("ConnectionManager: Joining pending connect to {}", deviceId);
            std::unique_lock<std::mutex> lock(m_connectMutex);
            m_connectCv.wait(lock, [&]() { return attempt->done; });
            if (attempt->error) {
                std::rethrow_exception(attempt->error);
            }
            return;
        }

        std::exception_ptr error;
        try {
            connectOnce(deviceId);
        } catch (const std::exception&) {
            error = std::current_exception();
        }

        {
            std::lock_guard<std::mutex> lock(m_connectMutex);
            attempt->done = true;
            attempt->error = error;
            m_attempts.erase(deviceId);
        }
        m_connectCv.notify_all();

        if (error) {
            std::rethrow_exception(error);
        }
    }

    std::string connectToAddress(const std::string& host, uint16_t port) {
        if (!m_running) {
            throw ProtocolError(ErrorKind::InvalidState, "connection manager is not running");
        }
        auto transport = TcpTransport::connect(host, port, milliseconds(m_config.connectTimeoutMs));
        auto session = establish(std::move(transport), {});
        return session->deviceId();
    }

    bool disconnect(const std::string& deviceId, DisconnectReason reason) {
        auto session = getSession(deviceId);
        if (!session) {
            return false;
        }
        spdlog::info("ConnectionManager: Disconnecting {} ({})", deviceId, disconnectReasonToString(reason));
        session->close(reason, "disconnect requested");
        return true;
    }

    void send(const std::string& deviceId, const Packet& packet) {
        auto session = getSession(deviceId);
        if (!session || !session->isOpen()) {
            throw ProtocolError(ErrorKind::TransportUnavailable, "device " + deviceId + " is not connected");
        }
        session->send(packet);
    }

    void promoteSession(const std::string& deviceId) {
        auto session = getSession(deviceId);
        if (!session || !session->isRestricted()) {
            return;
        }
        session->setPlugins(createPlugins(session));
        session->setRestricted(false);
        markConnected(session);
    }

    void handleUnpaired(const std::string& deviceId) {
        disconnect(deviceId, DisconnectReason::Unpaired);
    }

    // ═══════════════════════════════════════════════════════════
    // Payload
    // ═══════════════════════════════════════════════════════════

    PayloadUpload sendWithPayload(const std::string& deviceId, Packet packet, uint64_t size) {
        auto session = requireTrustedSession(deviceId);
        auto device = m_devices->get(deviceId);
        if (!device || !device->isTrusted) {
            throw ProtocolError(ErrorKind::Unauthorized, "device " + deviceId + " is not paired");
        }

        PayloadUpload upload;
        upload.grant = m_resources->admit(deviceId, size);
        upload.server = PayloadServer::open();
        upload.deviceId = deviceId;
        upload.size = size;
        upload.pinnedDer = device->certificateData;

        packet.setPayload(static_cast<int64_t>(size), upload.server->port());
        session->send(packet);
        spdlog::debug("ConnectionManager: Offered {} bytes to {} on port {}",
                      size, deviceId, upload.server->port());
        return upload;
    }

    std::unique_ptr<TlsStream> acceptPayload(PayloadUpload& upload) {
        if (!upload.server) {
            throw ProtocolError(ErrorKind::InvalidState, "payload server already used");
        }
        auto stream = upload.server->accept(m_certificate, upload.deviceId, upload.pinnedDer,
                                            milliseconds(m_config.payloadTimeoutMs));
        upload.server.reset();
        return stream;
    }

    PayloadDownload openPayload(const std::string& deviceId, const Packet& packet) {
        if (!packet.hasPayload() || !packet.payloadSize || *packet.payloadSize < 0) {
            throw ProtocolError(ErrorKind::InvalidPacket, packet.type + " carries no sized payload");
        }
        auto session = requireTrustedSession(deviceId);
        auto device = m_devices->get(deviceId);
        if (!device || !device->isTrusted) {
            throw ProtocolError(ErrorKind::Unauthorized, "device " + deviceId + " is not paired");
        }

        auto size = static_cast<uint64_t>(*packet.payloadSize);
        PayloadDownload download;
        download.grant = m_resources->admit(deviceId, size);
        download.stream = PayloadChannel::connect(session->remoteAddress(), packet.payloadTransferInfo->port,
                                                  m_certificate, deviceId, device->certificateData,
                                                  milliseconds(m_config.payloadTimeoutMs));
        download.deviceId = deviceId;
        download.size = size;
        return download;
    }

    // ═══════════════════════════════════════════════════════════
    // State
    // ═══════════════════════════════════════════════════════════

    bool isConnected(const std::string& deviceId) const {
        auto session = getSession(deviceId);
        return session && session->isOpen();
    }

    std::vector<std::string> connectedDevices() const {
        std::lock_guard<std::mutex> lock(m_sessionsMutex);
        std::vector<std::string> result;
        for (const auto& [id, session] : m_sessions) {
            if (session->isOpen() && !session->isRestricted()) {
                result.push_back(id);
            }
        }
        return result;
    }

    size_t sessionCount() const {
        std::lock_guard<std::mutex> lock(m_sessionsMutex);
        return m_sessions.size();
    }

    std::shared_ptr<Session> getSession(const std::string& deviceId) const {
        std::lock_guard<std::mutex> lock(m_sessionsMutex);
        auto it = m_sessions.find(deviceId);
        return it == m_sessions.end() ? nullptr : it->second;
    }

    ResourceManager& resources() { return *m_resources; }

private:
    struct Handshake {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    struct Attempt {
        bool done = false;
        std::exception_ptr error;
    };

    ConnectionManagerConfig m_config;
    const LocalCertificate& m_certificate;
    IdentityProvider m_identity;
    std::shared_ptr<DeviceManager> m_devices;
    std::shared_ptr<PluginRegistry> m_plugins;
    std::shared_ptr<ResourceManager> m_resources;

    mutable std::mutex m_refsMutex;
    std::shared_ptr<Pairing> m_pairing;
    std::shared_ptr<BluetoothBackend> m_bluetooth;

    TcpListener m_listener;
    std::unique_ptr<BluetoothListener> m_bluetoothListener;

    std::atomic<bool> m_running{false};
    std::thread m_acceptThread;
    std::thread m_bluetoothThread;
    std::thread m_reaperThread;

    // Сессии: текущая на устройство + все живые (включая вытесненные)
    mutable std::mutex m_sessionsMutex;
    std::map<std::string, std::shared_ptr<Session>> m_sessions;
    std::map<uint64_t, std::shared_ptr<Session>> m_allSessions;
    std::set<uint64_t> m_connectedSerials;
    std::vector<std::shared_ptr<Session>> m_closed;
    std::mutex m_reaperMutex;
    std::condition_variable m_reaperCv;

    std::mutex m_handshakesMutex;
    std::list<Handshake> m_handshakes;
    std::atomic<size_t> m_pendingHandshakes{0};

    std::mutex m_connectMutex;
    std::condition_variable m_connectCv;
    std::map<std::string, std::shared_ptr<Attempt>> m_attempts;

    std::mutex m_callbackMutex;
    ConnectionCallback m_callback;

    mutable std::mutex m_errorMutex;
    std::string m_lastError;

    void setLastError(const std::string& error) {
        std::lock_guard<std::mutex> lock(m_errorMutex);
        m_lastError = error;
    }

    std::shared_ptr<Pairing> pairingRef() const {
        std::lock_guard<std::mutex> lock(m_refsMutex);
        return m_pairing;
    }

    std::shared_ptr<BluetoothBackend> bluetoothRef() const {
        std::lock_guard<std::mutex> lock(m_refsMutex);
        return m_bluetooth;
    }

    void emit(const ConnectionEvent& event) {
        ConnectionCallback callback;
        {
            std::lock_guard<std::mutex> lock(m_callbackMutex);
            callback = m_callback;
        }
        if (callback) {
            callback(event);
        }
    }

    void emitError(const std::string& deviceId, ErrorKind kind, const std::string& message) {
        ConnectionEvent event;
        event.type = ConnectionEventType::ConnectionError;
        event.deviceId = deviceId;
        event.errorKind = kind;
        event.message = message;
        emit(event);
    }

    DeviceInfo localIdentity() const {
        DeviceInfo info = m_identity ? m_identity() : DeviceInfo{};
        if (info.deviceId.empty()) {
            info.deviceId = m_certificate.commonName();
        }
        uint16_t port = m_listener.getPort();
        if (port != 0) {
            info.tcpPort = port;
        }
        return info;
    }

    // ═══════════════════════════════════════════════════════════
    // Accept
    // ═══════════════════════════════════════════════════════════

    void acceptLoop(TransportListener& listener, const char* label) {
        spdlog::debug("ConnectionManager: {} accept loop started", label);

        while (m_running) {
            auto transport = listener.accept(milliseconds(500));
            if (!transport) continue;
            if (!m_running) break;

            size_t active = sessionCount() + m_pendingHandshakes.load();
            if (active >= m_config.maxConnections) {
                spdlog::warn("ConnectionManager: Refusing {} connection from {}: {} connections active",
                             label, transport->remoteAddress(), active);
                transport->close();
                continue;
            }

            spawnHandshake(std::move(transport));
        }

        spdlog::debug("ConnectionManager: {} accept loop stopped", label);
    }

    void spawnHandshake(std::unique_ptr<Transport> transport) {
        auto done = std::make_shared<std::atomic<bool>>(false);
        ++m_pendingHandshakes;

        std::thread thread([this, done, stream = std::move(transport)]() mutable {
            std::string remote = stream->remoteAddress();
            try {
                establish(std::move(stream), {});
            } catch (const ProtocolError& e) {
                spdlog::warn("ConnectionManager: Incoming connection from {} failed: {}", remote, e.what());
                emitError({}, e.kind(), remote + ": " + e.what());
            } catch (const std::exception& e) {
                spdlog::error("ConnectionManager: Incoming connection from {} failed: {}", remote, e.what());
                emitError({}, ErrorKind::Io, remote + ": " + e.what());
            }
            --m_pendingHandshakes;
            done->store(true);
            m_reaperCv.notify_one();
        });

        std::lock_guard<std::mutex> lock(m_handshakesMutex);
        m_handshakes.push_back(Handshake{std::move(thread), done});
    }

    // ═══════════════════════════════════════════════════════════
    // Outbound
    // ═══════════════════════════════════════════════════════════

    void connectOnce(const std::string& deviceId) {
        auto device = m_devices->get(deviceId);
        if (!device) {
            throw ProtocolError(ErrorKind::NotFound, "unknown device " + deviceId);
        }

        auto bluetooth = bluetoothRef();
        std::vector<TransportCandidate> candidates;
        if (!device->host.empty()) {
            uint16_t port = device->info.tcpPort.value_or(device->port != 0 ? device->port : DEFAULT_TCP_PORT);
            candidates.push_back({TransportAddress::tcp(device->host, port), tcpCapabilities()});
        }
        // Bluetooth без TLS: только для доверенных
        if (device->info.bluetoothAddress && bluetooth && device->isTrusted) {
            candidates.push_back({TransportAddress::bluetooth(*device->info.bluetoothAddress),
                                  bluetoothCapabilities()});
        }
        candidates = orderCandidates(std::move(candidates), m_config.transportPreference);

        if (candidates.empty()) {
            std::string message = "no usable transport for " + deviceId;
            emitError(deviceId, ErrorKind::TransportUnavailable, message);
            throw ProtocolError(ErrorKind::TransportUnavailable, message);
        }

        m_devices->setConnectionState(deviceId, ConnectionState::Connecting);

        std::string lastError;
        for (const auto& candidate : candidates) {
            spdlog::info("ConnectionManager: Connecting to {} via {}", deviceId, candidate.address.toString());
            try {
                std::unique_ptr<Transport> transport;
                if (candidate.address.kind == TransportKind::Bluetooth) {
                    transport = bluetooth->connect(candidate.address.bluetoothAddress,
                                                   milliseconds(m_config.connectTimeoutMs));
                } else {
                    transport = TcpTransport::connect(candidate.address.host, candidate.address.port,
                                                      milliseconds(m_config.connectTimeoutMs));
                }
                establish(std::move(transport), deviceId);
                return;
            } catch (const ProtocolError& e) {
                if (e.kind() == ErrorKind::CertificateMismatch || e.kind() == ErrorKind::PeerIdentityMismatch) {
                    m_devices->setConnectionState(deviceId, ConnectionState::Failed);
                    emitError(deviceId, e.kind(), e.what());
                    throw;
                }
                lastError = candidate.address.toString() + ": " + e.what();
                spdlog::warn("ConnectionManager: {} failed: {}", deviceId, lastError);
            }
        }

        m_devices->setConnectionState(deviceId, ConnectionState::Failed);
        emitError(deviceId, ErrorKind::TransportUnavailable, lastError);
        throw ProtocolError(ErrorKind::TransportUnavailable, "cannot connect to " + deviceId + ": " + lastError);
    }

    // ═══════════════════════════════════════════════════════════
    // Establishment
    // ═══════════════════════════════════════════════════════════

    std::string readIdentityLine(Transport& transport) {
        // Побайтно: всё после '\n' принадлежит TLS
        std::string line;
        uint8_t byte = 0;
        while (true) {
            if (transport.read(&byte, 1) == 0) {
                throw ProtocolError(ErrorKind::Io, "connection closed during identity exchange");
            }
            if (byte == '\n') break;
            line.push_back(static_cast<char>(byte));
            if (line.size() > m_config.session.maxLineSize) {
                throw ProtocolError::sizeExceeded(line.size(), m_config.session.maxLineSize);
            }
        }
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        return line;
    }

    DeviceInfo exchangeIdentity(Transport& transport, const std::string& localId) {
        transport.writeAll(PacketCodec::serialize(Packet::identity(localIdentity())));

        transport.setReadTimeout(milliseconds(m_config.identityTimeoutMs));
        std::string line = readIdentityLine(transport);
        transport.setReadTimeout(milliseconds(0));

        Packet packet = PacketCodec::parse(line);
        if (!packet.isType(PACKET_TYPE_IDENTITY)) {
            throw ProtocolError(ErrorKind::InvalidPacket, "expected identity, got " + packet.type);
        }
        auto info = deviceInfoFromIdentity(packet);
        if (!info) {
            throw ProtocolError(ErrorKind::InvalidPacket, "identity without deviceId");
        }
        if (!isSupportedProtocolVersion(info->protocolVersion)) {
            throw ProtocolError(ErrorKind::ProtocolVersionMismatch,
                                info->deviceId + " speaks protocol " + std::to_string(info->protocolVersion));
        }
        if (info->deviceId == localId) {
            throw ProtocolError(ErrorKind::PeerIdentityMismatch, "connected to self");
        }
        return *info;
    }

    /// identity -> TLS -> проверка -> Session
    /// @param expectedId пустой для входящих
    std::shared_ptr<Session> establish(std::unique_ptr<Transport> transport, const std::string& expectedId) {
        const std::string localId = localIdentity().deviceId;
        DeviceInfo peer = exchangeIdentity(*transport, localId);

        if (!expectedId.empty() && peer.deviceId != expectedId) {
            throw ProtocolError(ErrorKind::PeerIdentityMismatch,
                                "expected " + expectedId + ", peer identified as " + peer.deviceId);
        }

        auto device = m_devices->get(peer.deviceId);
        bool trusted = device && device->isTrusted;
        std::string host = transport->remoteAddress();
        TransportKind kind = transport->kind();

        std::unique_ptr<Transport> stream;
        std::vector<uint8_t> peerDer;

        if (kind == TransportKind::Bluetooth) {
            if (!trusted) {
                throw ProtocolError(ErrorKind::Unauthorized,
                                    "Bluetooth link from unpaired device " + peer.deviceId);
            }
            stream = std::move(transport);
        } else {
            auto tls = TlsStream::handshake(std::move(transport), tlsRoleFor(localId, peer.deviceId),
                                            m_certificate, milliseconds(m_config.handshakeTimeoutMs));
            try {
                tls->verifyPeer(peer.deviceId, trusted ? device->certificateData : std::vector<uint8_t>{});
            } catch (const ProtocolError& e) {
                if (e.kind() == ErrorKind::CertificateMismatch) {
                    auto pairing = pairingRef();
                    if (pairing) pairing->handleCertificateMismatch(peer.deviceId, e.what());
                }
                throw;
            }
            peerDer = tls->peerCertificateDer();
            stream = std::move(tls);
        }

        if (kind == TransportKind::Bluetooth) {
            m_devices->updateFromIdentity(peer);
        } else {
            m_devices->updateFromIdentity(peer, host, peer.tcpPort.value_or(0));
            m_devices->setCertificateFingerprint(peer.deviceId, Crypto::fingerprint(peerDer));
        }

        spdlog::info("ConnectionManager: {} ({}) authenticated via {}{}",
                     peer.deviceName, peer.deviceId, transportKindToString(kind),
                     trusted ? "" : ", unpaired");

        return installSession(peer.deviceId, std::move(stream), !trusted, peerDer);
    }

    std::shared_ptr<Session> installSession(const std::string& deviceId, std::unique_ptr<Transport> stream,
                                            bool restricted, const std::vector<uint8_t>& peerDer) {
        auto pairing = pairingRef();
        if (pairing && !peerDer.empty()) {
            pairing->setPeerCertificate(deviceId, peerDer);
        }

        auto session = std::make_shared<Session>(deviceId, std::move(stream), restricted, m_config.session);
        if (!restricted) {
            session->setPlugins(createPlugins(session));
        }

        std::shared_ptr<Session> previous;
        {
            std::lock_guard<std::mutex> lock(m_sessionsMutex);
            if (!m_running) {
                throw ProtocolError(ErrorKind::InvalidState, "connection manager is stopping");
            }
            auto it = m_sessions.find(deviceId);
            if (it != m_sessions.end()) {
                previous = it->second;
            }
            m_sessions[deviceId] = session;
            m_allSessions[session->serial()] = session;
        }

        if (previous) {
            spdlog::warn("ConnectionManager: Replacing session #{} with {}", previous->serial(), deviceId);
            previous->close(DisconnectReason::SupersededByNewConnection, "replaced by a newer connection");
        }

        session->start(
            [this](Session& s, const Packet& packet) { handlePacket(s, packet); },
            [this](Session& s, DisconnectReason reason, const std::string& message) {
                handleSessionClosed(s, reason, message);
            });

        if (!restricted) {
            markConnected(session);
        }
        return session;
    }

    PluginSet createPlugins(const std::shared_ptr<Session>& session) {
        auto device = m_devices->get(session->deviceId());
        if (!device || !m_plugins) {
            return PluginSet();
        }

        std::weak_ptr<Session> weak = session;
        std::string deviceId = session->deviceId();
        PacketSender sender = [weak, deviceId](const Packet& packet) {
            auto target = weak.lock();
            if (!target) {
                throw ProtocolError(ErrorKind::TransportUnavailable, "session with " + deviceId + " is closed");
            }
            target->send(packet);
        };
        return m_plugins->instantiate(*device, sender);
    }

    void markConnected(const std::shared_ptr<Session>& session) {
        {
            std::lock_guard<std::mutex> lock(m_sessionsMutex);
            auto it = m_sessions.find(session->deviceId());
            if (it == m_sessions.end() || it->second != session || !session->isOpen()) {
                return;
            }
            if (!m_connectedSerials.insert(session->serial()).second) {
                return;
            }
        }

        m_devices->setConnectionState(session->deviceId(), ConnectionState::Connected);

        ConnectionEvent event;
        event.type = ConnectionEventType::Connected;
        event.deviceId = session->deviceId();
        event.remoteAddress = session->remoteAddress();
        emit(event);
    }

    // ═══════════════════════════════════════════════════════════
    // Session callbacks (поток чтения сессии)
    // ═══════════════════════════════════════════════════════════

    void handlePacket(Session& session, const Packet& packet) {
        const std::string& deviceId = session.deviceId();

        if (packet.isType(PACKET_TYPE_IDENTITY)) {
            auto info = deviceInfoFromIdentity(packet);
            if (info && info->deviceId == deviceId) {
                m_devices->updateFromIdentity(*info);
            } else {
                spdlog::warn("ConnectionManager: Ignoring foreign identity on session with {}", deviceId);
            }
            return;
        }

        if (packet.isType(PACKET_TYPE_PAIR)) {
            auto pairing = pairingRef();
            if (pairing) {
                pairing->handlePacket(deviceId, packet);
            }
            return;
        }

        if (session.isRestricted()) {
            spdlog::debug("ConnectionManager: Dropping {} from unpaired {}", packet.type, deviceId);
            return;
        }

        m_devices->touch(deviceId);

        ConnectionEvent event;
        event.type = ConnectionEventType::PacketReceived;
        event.deviceId = deviceId;
        event.packet = packet;
        emit(event);

        auto device = m_devices->get(deviceId);
        if (device) {
            session.dispatchToPlugins(packet, *device);
        }
    }

    void handleSessionClosed(Session& session, DisconnectReason reason, const std::string& message) {
        const std::string deviceId = session.deviceId();
        bool current = false;
        bool announced = false;
        {
            std::lock_guard<std::mutex> lock(m_sessionsMutex);
            auto it = m_sessions.find(deviceId);
            if (it != m_sessions.end() && it->second.get() == &session) {
                m_sessions.erase(it);
                current = true;
            }
            announced = m_connectedSerials.erase(session.serial()) > 0;

            auto live = m_allSessions.find(session.serial());
            if (live != m_allSessions.end()) {
                m_closed.push_back(live->second);
                m_allSessions.erase(live);
            }
        }

        if (current) {
            auto pairing = pairingRef();
            if (pairing) pairing->clearPeerCertificate(deviceId);
            m_devices->setConnectionState(deviceId, ConnectionState::Disconnected);
        }

        if (announced) {
            ConnectionEvent event;
            event.type = ConnectionEventType::Disconnected;
            event.deviceId = deviceId;
            event.reason = reason;
            event.message = message;
            emit(event);
        }

        m_reaperCv.notify_one();
    }

    // ═══════════════════════════════════════════════════════════
    // Reaper: join закрытых сессий и завершённых handshake
    // ═══════════════════════════════════════════════════════════

    void reaperLoop() {
        while (m_running) {
            {
                std::unique_lock<std::mutex> lock(m_reaperMutex);
                m_reaperCv.wait_for(lock, milliseconds(1000));
            }
            reapClosed();
            reapHandshakes();
        }
    }

    void reapClosed() {
        std::vector<std::shared_ptr<Session>> closed;
        {
            std::lock_guard<std::mutex> lock(m_sessionsMutex);
            closed.swap(m_closed);
        }
        for (auto& session : closed) {
            session->join();
        }
    }

    void reapHandshakes() {
        std::list<Handshake> finished;
        {
            std::lock_guard<std::mutex> lock(m_handshakesMutex);
            for (auto it = m_handshakes.begin(); it != m_handshakes.end(); ) {
                if (it->done->load()) {
                    finished.splice(finished.end(), m_handshakes, it++);
                } else {
                    ++it;
                }
            }
        }
        for (auto& h : finished) {
            if (h.thread.joinable()) h.thread.join();
        }
    }

    std::shared_ptr<Session> requireTrustedSession(const std::string& deviceId) {
        auto session = getSession(deviceId);
        if (!session || !session->isOpen()) {
            throw ProtocolError(ErrorKind::TransportUnavailable, "device " + deviceId + " is not connected");
        }
        if (session->isRestricted()) {
            throw ProtocolError(ErrorKind::Unauthorized, "device " + deviceId + " is not paired");
        }
        if (session->transportKind() == TransportKind::Bluetooth) {
            throw ProtocolError(ErrorKind::TransportUnavailable, "payload needs a TCP link to " + deviceId);
        }
        return session;
    }
};

// ═══════════════════════════════════════════════════════════
// Public Interface
// ═══════════════════════════════════════════════════════════

ConnectionManager::ConnectionManager(ConnectionManagerConfig config,
                                     const LocalCertificate& certificate,
                                     IdentityProvider identity,
                                     std::shared_ptr<DeviceManager> devices,
                                     std::shared_ptr<PluginRegistry> plugins,
                                     std::shared_ptr<ResourceManager> resources)
    : m_impl(std::make_unique<Impl>(std::move(config), certificate, std::move(identity),
                                    std::move(devices), std::move(plugins), std::move(resources))) {}

ConnectionManager::~ConnectionManager() = default;

bool ConnectionManager::start() {
    return m_impl->start();
}

void ConnectionManager::stop() {
    m_impl->stop();
}

bool ConnectionManager::isRunning() const {
    return m_impl->isRunning();
}

uint16_t ConnectionManager::getPort() const {
    return m_impl->getPort();
}

std::string ConnectionManager::getLastError() const {
    return m_impl->getLastError();
}

void ConnectionManager::setPairing(std::shared_ptr<Pairing> pairing) {
    m_impl->setPairing(std::move(pairing));
}

void ConnectionManager::setBluetoothBackend(std::shared_ptr<BluetoothBackend> backend) {
    m_impl->setBluetoothBackend(std::move(backend));
}

void ConnectionManager::setEventCallback(ConnectionCallback callback) {
    m_impl->setEventCallback(std::move(callback));
}

void ConnectionManager::connect(const std::string& deviceId) {
    m_impl->connect(deviceId);
}

std::string ConnectionManager::connectToAddress(const std::string& host, uint16_t port) {
    return m_impl->connectToAddress(host, port);
}

bool ConnectionManager::disconnect(const std::string& deviceId, DisconnectReason reason) {
    return m_impl->disconnect(deviceId, reason);
}

void ConnectionManager::send(const std::string& deviceId, const Packet& packet) {
    m_impl->send(deviceId, packet);
}

void ConnectionManager::promoteSession(const std::string& deviceId) {
    m_impl->promoteSession(deviceId);
}

void ConnectionManager::handleUnpaired(const std::string& deviceId) {
    m_impl->handleUnpaired(deviceId);
}

PayloadUpload ConnectionManager::sendWithPayload(const std::string& deviceId, Packet packet, uint64_t size) {
    return m_impl->sendWithPayload(deviceId, std::move(packet), size);
}

std::unique_ptr<TlsStream> ConnectionManager::acceptPayload(PayloadUpload& upload) {
    return m_impl->acceptPayload(upload);
}

PayloadDownload ConnectionManager::openPayload(const std::string& deviceId, const Packet& packet) {
    return m_impl->openPayload(deviceId, packet);
}

bool ConnectionManager::isConnected(const std::string& deviceId) const {
    return m_impl->isConnected(deviceId);
}

std::vector<std::string> ConnectionManager::connectedDevices() const {
    return m_impl->connectedDevices();
}

size_t ConnectionManager::sessionCount() const {
    return m_impl->sessionCount();
}

std::shared_ptr<Session> ConnectionManager::getSession(const std::string& deviceId) const {
    return m_impl->getSession(deviceId);
}

ResourceManager& ConnectionManager::resources() {
    return m_impl->resources();
}

} // namespace CosmicConnect

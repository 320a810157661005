// Pairing.cpp — Pairing state machine

#include "cosmicconnect/Pairing.h"
#include "cosmicconnect/DeviceManager.h"
#include "cosmicconnect/TrustedPeerStore.h"
#include "cosmicconnect/Certificate.h"
#include "cosmicconnect/Error.h"
#include <spdlog/spdlog.h>
#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>

namespace CosmicConnect {

namespace {

/// Запрос в процессе (Requested / RequestedByPeer)
struct PendingRequest {
    PairingStatus status = PairingStatus::Requested;
    Pairing::Clock::time_point startedAt;
    bool peerAccepted = false;
    bool localConfirmed = false;
};

/// Действия, выполняемые после освобождения лока
struct Outbox {
    std::vector<PairingEvent> events;
    std::vector<std::pair<std::string, Packet>> packets;

    void event(PairingEventType type, const std::string& deviceId, const std::string& detail = {}) {
        PairingEvent e;
        e.type = type;
        e.deviceId = deviceId;
        e.detail = detail;
        events.push_back(std::move(e));
    }
};

} // anonymous namespace

// ═══════════════════════════════════════════════════════════
// Pairing::Impl
// ═══════════════════════════════════════════════════════════

class Pairing::Impl {
public:
    Impl(std::shared_ptr<DeviceManager> devices, std::shared_ptr<TrustedPeerStore> store,
         std::string localFingerprint, PairingConfig config)
        : m_devices(std::move(devices))
        , m_store(std::move(store))
        , m_localFingerprint(std::move(localFingerprint))
        , m_config(config) {}

    ~Impl() {
        stop();
    }

    void start() {
        if (m_running) return;

        for (const auto& record : m_store->list()) {
            m_devices->addTrusted(record);
        }

        m_running = true;
        m_monitorThread = std::thread([this]() { monitorLoop(); });
        spdlog::info("Pairing: Started ({} trusted peers)", m_store->list().size());
    }

    void stop() {
        if (!m_running.exchange(false)) return;
        m_monitorCv.notify_all();
        if (m_monitorThread.joinable()) {
            m_monitorThread.join();
        }
        spdlog::info("Pairing: Stopped");
    }

    void setPacketSender(PacketSender sender) {
        std::lock_guard<std::mutex> lock(m_senderMutex);
        m_sender = std::move(sender);
    }

    void setEventCallback(PairingCallback callback) {
        std::lock_guard<std::mutex> lock(m_callbackMutex);
        m_onEvent = std::move(callback);
    }

    void requestPairing(const std::string& deviceId) {
        auto device = m_devices->get(deviceId);
        if (!device) {
            throw ProtocolError(ErrorKind::NotFound, "unknown device " + deviceId);
        }

        {
            std::unique_lock<std::mutex> lock(m_mutex);
            auto it = m_pending.find(deviceId);
            if (it != m_pending.end() && it->second.status == PairingStatus::RequestedByPeer) {
                lock.unlock();
                confirm(deviceId, true);
                return;
            }
            if (device->isPaired()) {
                throw ProtocolError(ErrorKind::InvalidState, "device " + deviceId + " is already paired");
            }
            if (it != m_pending.end()) {
                throw ProtocolError(ErrorKind::InvalidState, "pairing with " + deviceId + " already requested");
            }
            if (m_peerCerts.find(deviceId) == m_peerCerts.end()) {
                throw ProtocolError(ErrorKind::TransportUnavailable,
                                    "no secure link to " + deviceId + " for pairing");
            }

            PendingRequest request;
            request.status = PairingStatus::Requested;
            request.startedAt = Clock::now();
            m_pending[deviceId] = request;
            m_devices->setPairingStatus(deviceId, PairingStatus::Requested);
        }

        try {
            send(deviceId, Packet::pair(true));
        } catch (const ProtocolError& e) {
            spdlog::warn("Pairing: Failed to send request to {}: {}", deviceId, e.what());
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_pending.erase(deviceId);
            }
            m_devices->setPairingStatus(deviceId, PairingStatus::NotPaired);
            throw;
        }

        spdlog::info("Pairing: Requested pairing with {}", deviceId);
        emit(confirmationEvent(deviceId));
    }

    void confirm(const std::string& deviceId, bool accept) {
        Outbox outbox;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_pending.find(deviceId);
            if (it == m_pending.end()) {
                throw ProtocolError(ErrorKind::InvalidState, "no pairing request pending for " + deviceId);
            }

            if (!accept) {
                m_pending.erase(it);
                m_devices->setPairingStatus(deviceId, PairingStatus::NotPaired);
                outbox.packets.emplace_back(deviceId, Packet::pair(false));
                outbox.event(PairingEventType::PairingRejected, deviceId, "rejected locally");
                spdlog::info("Pairing: Rejected pairing with {}", deviceId);
            } else if (it->second.status == PairingStatus::RequestedByPeer) {
                outbox.packets.emplace_back(deviceId, Packet::pair(true));
                completeLocked(deviceId, outbox);
            } else {
                it->second.localConfirmed = true;
                if (it->second.peerAccepted) {
                    completeLocked(deviceId, outbox);
                } else {
                    spdlog::debug("Pairing: Local confirmation for {}, waiting for peer", deviceId);
                }
            }
        }
        flush(outbox);
    }

    void unpair(const std::string& deviceId) {
        auto device = m_devices->get(deviceId);
        if (!device) {
            throw ProtocolError(ErrorKind::NotFound, "unknown device " + deviceId);
        }

        Outbox outbox;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            bool wasPending = m_pending.erase(deviceId) > 0;
            if (device->isPaired() || wasPending) {
                outbox.packets.emplace_back(deviceId, Packet::pair(false));
            }
            removeTrustLocked(deviceId);
            outbox.event(PairingEventType::Unpaired, deviceId);
        }
        spdlog::info("Pairing: Unpaired {}", deviceId);
        flush(outbox);
    }

    void setPeerCertificate(const std::string& deviceId, const std::vector<uint8_t>& der) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_peerCerts[deviceId] = der;
        }
        m_devices->setCertificateFingerprint(deviceId, Crypto::fingerprint(der));
    }

    void clearPeerCertificate(const std::string& deviceId) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_peerCerts.erase(deviceId);
    }

    void handlePacket(const std::string& deviceId, const Packet& packet) {
        if (!packet.body.contains("pair") || !packet.body["pair"].is_boolean()) {
            spdlog::warn("Pairing: Malformed pair packet from {}", deviceId);
            return;
        }
        bool pair = packet.body["pair"].get<bool>();

        Outbox outbox;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (pair) {
                handlePairRequestLocked(deviceId, outbox);
            } else {
                handlePairCancelLocked(deviceId, outbox);
            }
        }
        flush(outbox);
    }

    void handleCertificateMismatch(const std::string& deviceId, const std::string& detail) {
        Outbox outbox;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_pending.erase(deviceId);
            m_peerCerts.erase(deviceId);
            removeTrustLocked(deviceId);
            outbox.event(PairingEventType::TrustBroken, deviceId, detail);
        }
        spdlog::warn("Pairing: Trust with {} broken: {}", deviceId, detail);
        flush(outbox);
    }

    void checkTimeouts(Clock::time_point now) {
        Outbox outbox;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            for (auto it = m_pending.begin(); it != m_pending.end(); ) {
                auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                    now - it->second.startedAt).count();
                if (elapsed >= m_config.timeoutMs) {
                    spdlog::info("Pairing: Request with {} timed out", it->first);
                    m_devices->setPairingStatus(it->first, PairingStatus::NotPaired);
                    outbox.event(PairingEventType::PairingTimedOut, it->first);
                    it = m_pending.erase(it);
                } else {
                    ++it;
                }
            }
        }
        flush(outbox);
    }

    PairingStatus getStatus(const std::string& deviceId) const {
        auto device = m_devices->get(deviceId);
        return device ? device->pairingStatus : PairingStatus::NotPaired;
    }

    bool hasPendingRequest(const std::string& deviceId) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_pending.count(deviceId) > 0;
    }

    const std::string& localFingerprint() const { return m_localFingerprint; }

private:
    std::shared_ptr<DeviceManager> m_devices;
    std::shared_ptr<TrustedPeerStore> m_store;
    std::string m_localFingerprint;
    PairingConfig m_config;

    mutable std::mutex m_mutex;
    std::map<std::string, PendingRequest> m_pending;
    std::map<std::string, std::vector<uint8_t>> m_peerCerts;

    std::mutex m_senderMutex;
    PacketSender m_sender;

    std::mutex m_callbackMutex;
    PairingCallback m_onEvent;

    std::atomic<bool> m_running{false};
    std::thread m_monitorThread;
    std::mutex m_monitorMutex;
    std::condition_variable m_monitorCv;

    void handlePairRequestLocked(const std::string& deviceId, Outbox& outbox) {
        auto device = m_devices->get(deviceId);
        if (!device) {
            spdlog::warn("Pairing: Pair request from unknown device {}", deviceId);
            return;
        }

        if (device->isPaired()) {
            // Пир потерял состояние, но TLS уже проверил закреплённый сертификат
            spdlog::info("Pairing: {} requested pairing while paired, confirming", deviceId);
            outbox.packets.emplace_back(deviceId, Packet::pair(true));
            return;
        }

        auto it = m_pending.find(deviceId);
        if (it != m_pending.end()) {
            if (it->second.status == PairingStatus::Requested) {
                it->second.peerAccepted = true;
                if (it->second.localConfirmed) {
                    completeLocked(deviceId, outbox);
                } else {
                    spdlog::debug("Pairing: {} accepted, waiting for local confirmation", deviceId);
                }
            }
            return;
        }

        if (m_peerCerts.find(deviceId) == m_peerCerts.end()) {
            spdlog::warn("Pairing: Pair request from {} without TLS certificate", deviceId);
            return;
        }

        PendingRequest request;
        request.status = PairingStatus::RequestedByPeer;
        request.startedAt = Clock::now();
        m_pending[deviceId] = request;
        m_devices->setPairingStatus(deviceId, PairingStatus::RequestedByPeer);

        spdlog::info("Pairing: {} requested pairing", deviceId);
        outbox.event(PairingEventType::PairingRequested, deviceId);
        outbox.events.push_back(confirmationEventLocked(deviceId));
    }

    void handlePairCancelLocked(const std::string& deviceId, Outbox& outbox) {
        auto it = m_pending.find(deviceId);
        if (it != m_pending.end()) {
            PairingStatus next = it->second.status == PairingStatus::Requested
                ? PairingStatus::Rejected : PairingStatus::NotPaired;
            m_pending.erase(it);
            m_devices->setPairingStatus(deviceId, next);
            outbox.event(PairingEventType::PairingRejected, deviceId, "rejected by peer");
            spdlog::info("Pairing: {} rejected pairing", deviceId);
            return;
        }

        if (m_devices->isTrusted(deviceId)) {
            removeTrustLocked(deviceId);
            outbox.event(PairingEventType::Unpaired, deviceId, "unpaired by peer");
            spdlog::info("Pairing: {} unpaired us", deviceId);
        }
    }

    void completeLocked(const std::string& deviceId, Outbox& outbox) {
        m_pending.erase(deviceId);

        auto certIt = m_peerCerts.find(deviceId);
        auto device = m_devices->get(deviceId);
        if (certIt == m_peerCerts.end() || certIt->second.empty() || !device) {
            m_devices->setPairingStatus(deviceId, PairingStatus::NotPaired);
            outbox.event(PairingEventType::PairingRejected, deviceId, "peer certificate unavailable");
            spdlog::warn("Pairing: Cannot complete pairing with {}: no certificate", deviceId);
            return;
        }

        TrustedPeerRecord record;
        record.deviceId = deviceId;
        record.name = device->info.deviceName;
        record.deviceType = device->info.deviceType;
        record.certificateDer = certIt->second;
        record.fingerprintSha256 = Crypto::fingerprint(certIt->second);
        record.firstPairedAt = nowUnixMs();
        record.lastSeenAt = record.firstPairedAt;

        bool stored = false;
        std::string storeError;
        try {
            stored = m_store->put(record);
            if (!stored) storeError = m_store->getLastError();
        } catch (const std::exception& e) {
            storeError = e.what();
        }

        // Без сохранённого доверия пир не считается спаренным
        if (!stored) {
            spdlog::error("Pairing: Failed to persist trust for {}: {}", deviceId, storeError);
            m_devices->setPairingStatus(deviceId, PairingStatus::NotPaired);
            outbox.packets.emplace_back(deviceId, Packet::pair(false));
            outbox.event(PairingEventType::PairingRejected, deviceId,
                         "failed to persist trust: " + storeError);
            return;
        }
        m_devices->markPaired(deviceId, record.certificateDer);

        spdlog::info("Pairing: Paired with '{}' ({}), fingerprint {}",
                     record.name, deviceId, record.fingerprintSha256);
        outbox.event(PairingEventType::PairingCompleted, deviceId);
    }

    void removeTrustLocked(const std::string& deviceId) {
        if (m_store->contains(deviceId) && !m_store->remove(deviceId)) {
            spdlog::error("Pairing: Failed to remove trust for {}: {}", deviceId, m_store->getLastError());
        }
        m_devices->setPairingStatus(deviceId, PairingStatus::NotPaired);
    }

    PairingEvent confirmationEventLocked(const std::string& deviceId) const {
        PairingEvent e;
        e.type = PairingEventType::ConfirmationRequired;
        e.deviceId = deviceId;
        e.localFingerprint = m_localFingerprint;
        auto it = m_peerCerts.find(deviceId);
        if (it != m_peerCerts.end()) {
            e.peerFingerprint = Crypto::fingerprint(it->second);
        }
        return e;
    }

    PairingEvent confirmationEvent(const std::string& deviceId) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return confirmationEventLocked(deviceId);
    }

    void send(const std::string& deviceId, const Packet& packet) {
        PacketSender sender;
        {
            std::lock_guard<std::mutex> lock(m_senderMutex);
            sender = m_sender;
        }
        if (!sender) {
            throw ProtocolError(ErrorKind::TransportUnavailable, "no packet sender configured");
        }
        sender(deviceId, packet);
    }

    void emit(const PairingEvent& event) {
        PairingCallback callback;
        {
            std::lock_guard<std::mutex> lock(m_callbackMutex);
            callback = m_onEvent;
        }
        if (callback) {
            callback(event);
        }
    }

    void flush(Outbox& outbox) {
        for (const auto& [deviceId, packet] : outbox.packets) {
            try {
                send(deviceId, packet);
            } catch (const ProtocolError& e) {
                spdlog::warn("Pairing: Failed to send {} to {}: {}", packet.type, deviceId, e.what());
            }
        }
        for (const auto& event : outbox.events) {
            emit(event);
        }
    }

    void monitorLoop() {
        while (m_running) {
            {
                std::unique_lock<std::mutex> lock(m_monitorMutex);
                m_monitorCv.wait_for(lock, std::chrono::milliseconds(m_config.checkIntervalMs),
                                     [this]() { return !m_running.load(); });
            }
            if (!m_running) break;
            checkTimeouts(Clock::now());
        }
    }
};

// ═══════════════════════════════════════════════════════════
// Pairing Public Interface
// ═══════════════════════════════════════════════════════════

Pairing::Pairing(std::shared_ptr<DeviceManager> devices, std::shared_ptr<TrustedPeerStore> store,
                 std::string localFingerprint, PairingConfig config)
    : m_impl(std::make_unique<Impl>(std::move(devices), std::move(store),
                                    std::move(localFingerprint), config)) {}

Pairing::~Pairing() = default;

void Pairing::start() {
    m_impl->start();
}

void Pairing::stop() {
    m_impl->stop();
}

void Pairing::setPacketSender(PacketSender sender) {
    m_impl->setPacketSender(std::move(sender));
}

void Pairing::setEventCallback(PairingCallback callback) {
    m_impl->setEventCallback(std::move(callback));
}

void Pairing::requestPairing(const std::string& deviceId) {
    m_impl->requestPairing(deviceId);
}

void Pairing::confirm(const std::string& deviceId, bool accept) {
    m_impl->confirm(deviceId, accept);
}

void Pairing::unpair(const std::string& deviceId) {
    m_impl->unpair(deviceId);
}

void Pairing::setPeerCertificate(const std::string& deviceId, const std::vector<uint8_t>& der) {
    m_impl->setPeerCertificate(deviceId, der);
}

void Pairing::clearPeerCertificate(const std::string& deviceId) {
    m_impl->clearPeerCertificate(deviceId);
}

void Pairing::handlePacket(const std::string& deviceId, const Packet& packet) {
    m_impl->handlePacket(deviceId, packet);
}

void Pairing::handleCertificateMismatch(const std::string& deviceId, const std::string& detail) {
    m_impl->handleCertificateMismatch(deviceId, detail);
}

void Pairing::checkTimeouts(Clock::time_point now) {
    m_impl->checkTimeouts(now);
}

PairingStatus Pairing::getStatus(const std::string& deviceId) const {
    return m_impl->getStatus(deviceId);
}

bool Pairing::isPaired(const std::string& deviceId) const {
    return m_impl->getStatus(deviceId) == PairingStatus::Paired;
}

bool Pairing::hasPendingRequest(const std::string& deviceId) const {
    return m_impl->hasPendingRequest(deviceId);
}

const std::string& Pairing::localFingerprint() const {
    return m_impl->localFingerprint();
}

} // namespace CosmicConnect

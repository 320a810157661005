// Pairing.h — Конечный автомат pairing: доверие через сертификат TLS + подтверждение пользователя
//
//   NotPaired --local request--> Requested --peer accepts + local confirm--> Paired
//   NotPaired --peer request---> RequestedByPeer --local accept--> Paired
//   Requested / RequestedByPeer --30 s--> NotPaired
//   Requested --peer rejects--> Rejected
//   Any --unpair--> NotPaired

#pragma once

#include "export.h"
#include "Models.h"
#include "Events.h"
#include "Network/Packet.h"
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace CosmicConnect {

class DeviceManager;
class TrustedPeerStore;

constexpr int PAIRING_TIMEOUT_MS = 30000;

struct PairingConfig {
    int timeoutMs = PAIRING_TIMEOUT_MS;
    int checkIntervalMs = 500;          // Период проверки таймаутов
};

// ═══════════════════════════════════════════════════════════
// Pairing
// ═══════════════════════════════════════════════════════════

class CC_API Pairing {
public:
    using Clock = std::chrono::steady_clock;

    /// Отправка pair-пакета пиру
    /// @throws ProtocolError если соединения нет
    using PacketSender = std::function<void(const std::string& deviceId, const Packet& packet)>;

    /// @param localFingerprint отпечаток локального сертификата (для ConfirmationRequired)
    Pairing(std::shared_ptr<DeviceManager> devices,
            std::shared_ptr<TrustedPeerStore> store,
            std::string localFingerprint,
            PairingConfig config = {});
    ~Pairing();

    // Запрет копирования
    Pairing(const Pairing&) = delete;
    Pairing& operator=(const Pairing&) = delete;

    // ═══════════════════════════════════════════════════════════
    // Lifecycle
    // ═══════════════════════════════════════════════════════════

    /// Загрузить доверенных пиров в DeviceManager и запустить монитор таймаутов
    void start();
    void stop();

    void setPacketSender(PacketSender sender);
    void setEventCallback(PairingCallback callback);

    // ═══════════════════════════════════════════════════════════
    // Команды
    // ═══════════════════════════════════════════════════════════

    /// Pair(device_id): отправить запрос, показать отпечатки для подтверждения
    /// @throws ProtocolError(NotFound) если устройство неизвестно
    /// @throws ProtocolError(InvalidState) если уже Paired или запрос в процессе
    /// @throws ProtocolError(TransportUnavailable) если нет TLS-связи с пиром
    void requestPairing(const std::string& deviceId);

    /// ConfirmPairing(device_id, accept)
    /// @throws ProtocolError(InvalidState) если подтверждать нечего
    void confirm(const std::string& deviceId, bool accept);

    /// Unpair(device_id): удалить доверие и закреплённый сертификат
    /// @throws ProtocolError(NotFound) если устройство неизвестно
    void unpair(const std::string& deviceId);

    // ═══════════════════════════════════════════════════════════
    // Входящие данные от Connection Manager
    // ═══════════════════════════════════════════════════════════

    /// Сертификат, предъявленный пиром в TLS handshake (кандидат)
    void setPeerCertificate(const std::string& deviceId, const std::vector<uint8_t>& der);

    /// Связь с пиром закрылась: кандидат больше недействителен
    void clearPeerCertificate(const std::string& deviceId);

    /// Обработать kdeconnect.pair
    void handlePacket(const std::string& deviceId, const Packet& packet);

    /// Пир доверенный, но предъявил другой сертификат
    void handleCertificateMismatch(const std::string& deviceId, const std::string& detail);

    /// Проверить таймауты (вызывается монитором; открыт для тестов)
    void checkTimeouts(Clock::time_point now);

    // ═══════════════════════════════════════════════════════════
    // Состояние
    // ═══════════════════════════════════════════════════════════

    PairingStatus getStatus(const std::string& deviceId) const;

    bool isPaired(const std::string& deviceId) const;

    /// Есть ли запрос, ожидающий подтверждения
    bool hasPendingRequest(const std::string& deviceId) const;

    const std::string& localFingerprint() const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace CosmicConnect

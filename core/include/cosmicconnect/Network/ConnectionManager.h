// ConnectionManager.h — Установление сессий, маршрутизация пакетов, payload-каналы
//
// Исходящее и входящее соединение проходят одинаково:
//   identity (plaintext) -> TLS (роль по device_id) -> проверка пира -> Session
// Недоверенный пир получает ограниченную сессию (только identity и pair),
// которая повышается до полной после PairingCompleted.

#pragma once

#include "../export.h"
#include "../Events.h"
#include "../ResourceManager.h"
#include "Packet.h"
#include "Session.h"
#include "TcpTransport.h"
#include "TlsStream.h"
#include "Transport.h"
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace CosmicConnect {

class BluetoothBackend;
class DeviceManager;
class LocalCertificate;
class Pairing;
class PayloadServer;
class PluginRegistry;

constexpr size_t DEFAULT_MAX_CONNECTIONS = 50;
constexpr int IDENTITY_EXCHANGE_TIMEOUT_MS = 10000;
constexpr int PAYLOAD_TIMEOUT_MS = 30000;

struct ConnectionManagerConfig {
    uint16_t tcpPort = DEFAULT_TCP_PORT;
    uint16_t maxTcpPort = MAX_TCP_PORT;
    bool allowAnyPort = false;              // После диапазона взять любой свободный
    size_t maxConnections = DEFAULT_MAX_CONNECTIONS;
    TransportPreference transportPreference = TransportPreference::PreferTcp;
    int connectTimeoutMs = TCP_CONNECT_TIMEOUT_MS;
    int handshakeTimeoutMs = TLS_HANDSHAKE_TIMEOUT_MS;
    int identityTimeoutMs = IDENTITY_EXCHANGE_TIMEOUT_MS;
    int payloadTimeoutMs = PAYLOAD_TIMEOUT_MS;
    SessionConfig session;
};

// ═══════════════════════════════════════════════════════════
// Payload — результат допуска ResourceManager
// ═══════════════════════════════════════════════════════════

/// Исходящий payload: пакет уже отправлен, ждём подключения пира
struct CC_API PayloadUpload {
    std::string deviceId;
    uint64_t size = 0;
    ResourceGrant grant;
    std::unique_ptr<PayloadServer> server;
    std::vector<uint8_t> pinnedDer;

    PayloadUpload();
    ~PayloadUpload();
    PayloadUpload(PayloadUpload&&) noexcept;
    PayloadUpload& operator=(PayloadUpload&&) noexcept;
};

/// Входящий payload: соединение установлено, можно читать size байт
struct CC_API PayloadDownload {
    std::string deviceId;
    uint64_t size = 0;
    ResourceGrant grant;
    std::unique_ptr<TlsStream> stream;

    PayloadDownload();
    ~PayloadDownload();
    PayloadDownload(PayloadDownload&&) noexcept;
    PayloadDownload& operator=(PayloadDownload&&) noexcept;
};

// ═══════════════════════════════════════════════════════════
// ConnectionManager
// ═══════════════════════════════════════════════════════════

class CC_API ConnectionManager {
public:
    /// Актуальная identity локального устройства (tcpPort заполняется менеджером)
    using IdentityProvider = std::function<DeviceInfo()>;

    ConnectionManager(ConnectionManagerConfig config,
                      const LocalCertificate& certificate,
                      IdentityProvider identity,
                      std::shared_ptr<DeviceManager> devices,
                      std::shared_ptr<PluginRegistry> plugins,
                      std::shared_ptr<ResourceManager> resources);
    ~ConnectionManager();

    // Запрет копирования
    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    // ═══════════════════════════════════════════════════════════
    // Lifecycle
    // ═══════════════════════════════════════════════════════════

    /// Открыть TCP порт (1716..1764), запустить accept-циклы
    /// @return false если ни один порт не доступен
    bool start();

    /// Закрыть все сессии (Shutdown) и остановить потоки
    void stop();

    bool isRunning() const;

    /// Фактический TCP порт
    uint16_t getPort() const;

    std::string getLastError() const;

    /// Pairing получает pair-пакеты и сертификаты пиров
    void setPairing(std::shared_ptr<Pairing> pairing);

    /// Bluetooth (RFCOMM) бэкенд, опционально
    void setBluetoothBackend(std::shared_ptr<BluetoothBackend> backend);

    void setEventCallback(ConnectionCallback callback);

    // ═══════════════════════════════════════════════════════════
    // Команды
    // ═══════════════════════════════════════════════════════════

    /// Connect(device_id). Параллельные вызовы для одного устройства
    /// сворачиваются в одну попытку. Возвращается, когда сессия установлена
    /// (для недоверенного пира ограниченная, Connected не выдаётся).
    /// @throws ProtocolError(NotFound) если устройство неизвестно
    /// @throws ProtocolError(TransportUnavailable) если ни один транспорт не сработал
    /// @throws ProtocolError(CertificateMismatch | PeerIdentityMismatch)
    void connect(const std::string& deviceId);

    /// Подключиться по адресу (пир определяется по identity)
    /// @return device_id пира
    /// @throws ProtocolError
    std::string connectToAddress(const std::string& host, uint16_t port);

    /// Disconnect(device_id)
    /// @return false если сессии нет
    bool disconnect(const std::string& deviceId,
                    DisconnectReason reason = DisconnectReason::LocalRequest);

    /// SendPacket(device_id, packet)
    /// @throws ProtocolError(TransportUnavailable) если сессии нет
    /// @throws ProtocolError(Backpressure | Unauthorized | PacketSizeExceeded)
    void send(const std::string& deviceId, const Packet& packet);

    // ═══════════════════════════════════════════════════════════
    // Реакция на pairing
    // ═══════════════════════════════════════════════════════════

    /// Снять ограничение с сессии, создать плагины, выдать Connected
    void promoteSession(const std::string& deviceId);

    /// Доверие удалено: закрыть сессию с причиной Unpaired
    void handleUnpaired(const std::string& deviceId);

    // ═══════════════════════════════════════════════════════════
    // Payload
    // ═══════════════════════════════════════════════════════════

    /// Допустить передачу, открыть payload-сервер, отправить пакет с
    /// payloadTransferInfo. Соединение принимается через acceptPayload().
    /// @throws ProtocolError(ResourceExhausted) без ввода-вывода
    /// @throws ProtocolError(TransportUnavailable | Unauthorized)
    PayloadUpload sendWithPayload(const std::string& deviceId, Packet packet, uint64_t size);

    /// Дождаться подключения пира к payload-серверу (TLS client)
    /// @throws ProtocolError(Timeout | HandshakeFailed | CertificateMismatch)
    std::unique_ptr<TlsStream> acceptPayload(PayloadUpload& upload);

    /// Допустить входящий payload и подключиться к пиру (TLS server)
    /// @throws ProtocolError(ResourceExhausted | InvalidPacket | TransportUnavailable)
    PayloadDownload openPayload(const std::string& deviceId, const Packet& packet);

    // ═══════════════════════════════════════════════════════════
    // Состояние
    // ═══════════════════════════════════════════════════════════

    bool isConnected(const std::string& deviceId) const;

    std::vector<std::string> connectedDevices() const;

    size_t sessionCount() const;

    /// Сессия устройства (nullptr если нет)
    std::shared_ptr<Session> getSession(const std::string& deviceId) const;

    ResourceManager& resources();

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace CosmicConnect

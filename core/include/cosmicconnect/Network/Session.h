// Session.h — Аутентифицированный канал пакетов с одним устройством
// Поток чтения, поток записи с ограниченной очередью, монитор простоя

#pragma once

#include "../export.h"
#include "../Events.h"
#include "../Plugin.h"
#include "Packet.h"
#include "Transport.h"
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace CosmicConnect {

class TlsStream;

constexpr size_t SESSION_QUEUE_CAPACITY = 256;
constexpr int SESSION_SEND_TIMEOUT_MS = 5000;
constexpr int SESSION_IDLE_TIMEOUT_MS = 120000;     // Keepalive после 2 мин тишины
constexpr int SESSION_PING_TIMEOUT_MS = 30000;      // Ответ на keepalive

struct SessionConfig {
    size_t queueCapacity = SESSION_QUEUE_CAPACITY;
    int sendTimeoutMs = SESSION_SEND_TIMEOUT_MS;
    int idleTimeoutMs = SESSION_IDLE_TIMEOUT_MS;
    int pingTimeoutMs = SESSION_PING_TIMEOUT_MS;
    size_t maxLineSize = MAX_PACKET_LINE_SIZE;
};

// ═══════════════════════════════════════════════════════════
// Session
// ═══════════════════════════════════════════════════════════

class CC_API Session {
public:
    using Clock = std::chrono::steady_clock;

    /// Входящий пакет (поток чтения, порядок как на проводе)
    using PacketHandler = std::function<void(Session& session, const Packet& packet)>;

    /// Сессия закрыта (поток чтения, ровно один раз)
    using CloseHandler = std::function<void(Session& session, DisconnectReason reason,
                                            const std::string& message)>;

    /// @param stream TLS поток (TCP) или RFCOMM транспорт; сессия владеет им
    /// @param restricted пир ещё не доверенный: только identity и pair
    Session(std::string deviceId, std::unique_ptr<Transport> stream,
            bool restricted, SessionConfig config = {});
    ~Session();

    // Запрет копирования
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /// Запустить потоки чтения, записи и монитор простоя
    void start(PacketHandler onPacket, CloseHandler onClose);

    /// Поставить пакет в очередь. id назначается здесь (монотонно).
    /// @throws ProtocolError(PacketSizeExceeded) если пакет больше лимита строки
    /// @throws ProtocolError(Unauthorized) для сессии с недоверенным пиром
    /// @throws ProtocolError(Backpressure) если очередь полна дольше sendTimeoutMs
    /// @throws ProtocolError(TransportUnavailable) если сессия закрыта
    void send(const Packet& packet);

    /// Закрыть сессию (идемпотентно, первая причина сохраняется)
    void close(DisconnectReason reason, const std::string& message = {});

    /// Дождаться завершения потоков. Нельзя вызывать из потоков сессии.
    void join();

    bool isOpen() const;

    // ═══════════════════════════════════════════════════════════
    // Информация
    // ═══════════════════════════════════════════════════════════

    const std::string& deviceId() const;

    /// Порядковый номер сессии в процессе (для различения старой и новой)
    uint64_t serial() const;

    std::string remoteAddress() const;

    TransportKind transportKind() const;

    /// TLS поток, если сессия идёт через TLS
    TlsStream* tlsStream() const;

    bool isRestricted() const;

    /// Снять ограничение после завершения pairing
    void setRestricted(bool restricted);

    Clock::time_point lastActivity() const;

    size_t queuedPackets() const;

    /// Плагины сессии (создаются Connection Manager)
    void setPlugins(PluginSet plugins);

    /// Разослать пакет плагинам сессии
    size_t dispatchToPlugins(const Packet& packet, Device& device);

    /// Найти плагин сессии по имени
    Plugin* findPlugin(const std::string& name) const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace CosmicConnect

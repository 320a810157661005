// PayloadChannel.h — Побочный TLS-канал для payload пакета
//
// Отправитель открывает эфемерный порт (1739..1764, затем любой), кладёт его
// в payloadTransferInfo и принимает одно соединение. Как в KDE Connect,
// принимающая TCP сторона (отправитель) выступает TLS client.

#pragma once

#include "../export.h"
#include "TcpTransport.h"
#include "TlsStream.h"
#include <atomic>
#include <chrono>
#include <functional>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace CosmicConnect {

constexpr uint16_t PAYLOAD_PORT_MIN = 1739;
constexpr uint16_t PAYLOAD_PORT_MAX = 1764;
constexpr size_t PAYLOAD_BUFFER_SIZE = 64 * 1024;           // 64 KiB
constexpr uint64_t PAYLOAD_CHUNK_SIZE = 1024 * 1024;        // Гранулярность прогресса

// ═══════════════════════════════════════════════════════════
// PayloadServer
// ═══════════════════════════════════════════════════════════

class CC_API PayloadServer {
public:
    ~PayloadServer();

    // Запрет копирования
    PayloadServer(const PayloadServer&) = delete;
    PayloadServer& operator=(const PayloadServer&) = delete;

    /// Открыть слушающий порт
    /// @throws ProtocolError(TransportUnavailable) если порт не получен
    static std::unique_ptr<PayloadServer> open(uint16_t first = PAYLOAD_PORT_MIN,
                                               uint16_t last = PAYLOAD_PORT_MAX);

    uint16_t port() const;

    /// Принять одно соединение, закрыть listener, TLS handshake (client), проверить пира
    /// @throws ProtocolError(Timeout) если пир не подключился
    /// @throws ProtocolError(HandshakeFailed | PeerIdentityMismatch | CertificateMismatch)
    std::unique_ptr<TlsStream> accept(const LocalCertificate& certificate,
                                      const std::string& peerDeviceId,
                                      const std::vector<uint8_t>& pinnedDer,
                                      std::chrono::milliseconds timeout);

    void close();

private:
    PayloadServer();

    TcpListener m_listener;
};

// ═══════════════════════════════════════════════════════════
// PayloadChannel
// ═══════════════════════════════════════════════════════════

class CC_API PayloadChannel {
public:
    /// Вызывается перед каждым блоком PAYLOAD_CHUNK_SIZE и по завершении
    /// @param transferred байт передано с начала этого вызова
    using ChunkCallback = std::function<void(uint64_t transferred)>;

    /// Подключиться к payload-порту пира (TLS server)
    /// @throws ProtocolError(TransportUnavailable | HandshakeFailed | CertificateMismatch)
    static std::unique_ptr<TlsStream> connect(const std::string& host, uint16_t port,
                                              const LocalCertificate& certificate,
                                              const std::string& peerDeviceId,
                                              const std::vector<uint8_t>& pinnedDer,
                                              std::chrono::milliseconds timeout);

    /// Записать size байт из source
    /// @return записано байт
    /// @throws ProtocolError(Io) при ошибке потока или если source кончился раньше
    /// @throws ProtocolError(Timeout) при отмене через cancel
    static uint64_t send(Transport& stream, std::istream& source, uint64_t size,
                         const ChunkCallback& onChunk = {},
                         const std::atomic<bool>* cancel = nullptr);

    /// Прочитать ровно size байт в sink
    /// @return прочитано байт
    /// @throws ProtocolError(Io) если поток закрылся раньше
    static uint64_t receive(Transport& stream, std::ostream& sink, uint64_t size,
                            const ChunkCallback& onChunk = {},
                            const std::atomic<bool>* cancel = nullptr);
};

} // namespace CosmicConnect

#include "cosmicconnect/Network/PayloadChannel.h"
#include "cosmicconnect/Error.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <istream>
#include <ostream>

namespace CosmicConnect {

namespace {

void checkCancelled(const std::atomic<bool>* cancel) {
    if (cancel && cancel->load()) {
        throw ProtocolError(ErrorKind::Timeout, "payload transfer cancelled");
    }
}

} // anonymous namespace

// ═══════════════════════════════════════════════════════════
// PayloadServer
// ═══════════════════════════════════════════════════════════

PayloadServer::PayloadServer() = default;

PayloadServer::~PayloadServer() {
    close();
}

std::unique_ptr<PayloadServer> PayloadServer::open(uint16_t first, uint16_t last) {
    std::unique_ptr<PayloadServer> server(new PayloadServer());
    if (!server->m_listener.startInRange(first, last, true)) {
        throw ProtocolError(ErrorKind::TransportUnavailable,
                            "cannot open payload port: " + server->m_listener.getLastError());
    }
    spdlog::debug("PayloadServer: Listening on port {}", server->port());
    return server;
}

uint16_t PayloadServer::port() const {
    return m_listener.getPort();
}

std::unique_ptr<TlsStream> PayloadServer::accept(const LocalCertificate& certificate,
                                                 const std::string& peerDeviceId,
                                                 const std::vector<uint8_t>& pinnedDer,
                                                 std::chrono::milliseconds timeout) {
    auto transport = m_listener.accept(timeout);
    // Только одно соединение на payload
    m_listener.stop();
    if (!transport) {
        throw ProtocolError(ErrorKind::Timeout,
                            "peer " + peerDeviceId + " did not connect to payload port");
    }

    auto tls = TlsStream::handshake(std::move(transport), TlsRole::Client, certificate, timeout);
    tls->verifyPeer(peerDeviceId, pinnedDer);
    return tls;
}

void PayloadServer::close() {
    m_listener.stop();
}

// ═══════════════════════════════════════════════════════════
// PayloadChannel
// ═══════════════════════════════════════════════════════════

std::unique_ptr<TlsStream> PayloadChannel::connect(const std::string& host, uint16_t port,
                                                   const LocalCertificate& certificate,
                                                   const std::string& peerDeviceId,
                                                   const std::vector<uint8_t>& pinnedDer,
                                                   std::chrono::milliseconds timeout) {
    auto transport = TcpTransport::connect(host, port, timeout);
    auto tls = TlsStream::handshake(std::move(transport), TlsRole::Server, certificate, timeout);
    tls->verifyPeer(peerDeviceId, pinnedDer);
    return tls;
}

uint64_t PayloadChannel::send(Transport& stream, std::istream& source, uint64_t size,
                              const ChunkCallback& onChunk, const std::atomic<bool>* cancel) {
    std::vector<char> buffer(PAYLOAD_BUFFER_SIZE);
    uint64_t sent = 0;

    while (sent < size) {
        if (onChunk && sent % PAYLOAD_CHUNK_SIZE == 0) {
            onChunk(sent);
        }

        // Не пересекать границу блока, чтобы прогресс шёл ровно по 1 MiB
        uint64_t toChunkEnd = PAYLOAD_CHUNK_SIZE - (sent % PAYLOAD_CHUNK_SIZE);
        size_t want = static_cast<size_t>(std::min<uint64_t>({buffer.size(), size - sent, toChunkEnd}));

        checkCancelled(cancel);
        source.read(buffer.data(), static_cast<std::streamsize>(want));
        auto got = static_cast<size_t>(source.gcount());
        if (got == 0) {
            throw ProtocolError(ErrorKind::Io, "payload source ended after " +
                                std::to_string(sent) + " of " + std::to_string(size) + " bytes");
        }

        stream.writeAll(reinterpret_cast<const uint8_t*>(buffer.data()), got);
        sent += got;
    }

    if (onChunk) onChunk(sent);
    return sent;
}

uint64_t PayloadChannel::receive(Transport& stream, std::ostream& sink, uint64_t size,
                                 const ChunkCallback& onChunk, const std::atomic<bool>* cancel) {
    std::vector<uint8_t> buffer(PAYLOAD_BUFFER_SIZE);
    uint64_t received = 0;
    uint64_t lastReported = 0;

    while (received < size) {
        checkCancelled(cancel);
        size_t want = static_cast<size_t>(std::min<uint64_t>(buffer.size(), size - received));
        size_t got = stream.read(buffer.data(), want);
        if (got == 0) {
            throw ProtocolError(ErrorKind::Io, "payload stream closed after " +
                                std::to_string(received) + " of " + std::to_string(size) + " bytes");
        }

        sink.write(reinterpret_cast<const char*>(buffer.data()), static_cast<std::streamsize>(got));
        if (!sink) {
            throw ProtocolError(ErrorKind::Io, "failed to write payload data");
        }
        received += got;

        if (onChunk && received - lastReported >= PAYLOAD_CHUNK_SIZE) {
            lastReported = received;
            onChunk(received);
        }
    }

    sink.flush();
    if (onChunk && lastReported != received) onChunk(received);
    return received;
}

} // namespace CosmicConnect

// TlsStream.h — Взаимная TLS-аутентификация поверх любого Transport
// Сертификаты self-signed, доверие через закреплённый DER (pinning)

#pragma once

#include "Transport.h"
#include "../Certificate.h"
#include <memory>
#include <string>
#include <vector>

namespace CosmicConnect {

constexpr int TLS_HANDSHAKE_TIMEOUT_MS = 30000;

enum class TlsRole {
    Client,
    Server
};

/// Роль определяется детерминированно: меньший device_id — TLS client
CC_API TlsRole tlsRoleFor(const std::string& localDeviceId, const std::string& peerDeviceId);

// ═══════════════════════════════════════════════════════════
// TlsStream
// ═══════════════════════════════════════════════════════════

class CC_API TlsStream : public Transport {
public:
    ~TlsStream() override;

    // Запрет копирования
    TlsStream(const TlsStream&) = delete;
    TlsStream& operator=(const TlsStream&) = delete;

    /// Выполнить TLS handshake поверх inner.
    /// Любой сертификат пира принимается на этапе handshake; проверка
    /// закреплённого DER и CN выполняется через verifyPeer().
    /// @throws ProtocolError(HandshakeFailed)
    static std::unique_ptr<TlsStream> handshake(
        std::unique_ptr<Transport> inner,
        TlsRole role,
        const LocalCertificate& certificate,
        std::chrono::milliseconds timeout = std::chrono::milliseconds(TLS_HANDSHAKE_TIMEOUT_MS));

    // Transport
    TransportKind kind() const override { return TransportKind::Tls; }
    TransportCapabilities capabilities() const override;
    size_t read(uint8_t* buffer, size_t size) override;
    size_t write(const uint8_t* data, size_t size) override;
    void close() override;
    bool isOpen() const override;
    void setReadTimeout(std::chrono::milliseconds timeout) override;
    bool waitReadable(std::chrono::milliseconds timeout) override;
    std::string remoteAddress() const override;

    // ═══════════════════════════════════════════════════════════
    // Peer
    // ═══════════════════════════════════════════════════════════

    /// DER сертификата пира
    const std::vector<uint8_t>& peerCertificateDer() const;

    /// CN сертификата пира
    std::string peerCommonName() const;

    /// SHA-256 отпечаток сертификата пира
    std::string peerFingerprint() const;

    /// Версия протокола ("TLSv1.3")
    std::string protocolVersion() const;

    /// Проверить идентичность пира
    /// @param expectedDeviceId ожидаемый CN
    /// @param pinnedDer закреплённый DER; пустой = пир ещё не доверенный
    /// @throws ProtocolError(PeerIdentityMismatch) если CN не совпадает
    /// @throws ProtocolError(CertificateMismatch) если DER не совпадает с закреплённым
    void verifyPeer(const std::string& expectedDeviceId,
                    const std::vector<uint8_t>& pinnedDer) const;

    TlsRole role() const;

    /// Нижележащий транспорт
    Transport& inner();

private:
    TlsStream();

    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace CosmicConnect

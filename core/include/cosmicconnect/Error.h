// Error.h — Таксономия ошибок протокольного стека

#pragma once

#include "export.h"
#include <stdexcept>
#include <string>
#include <cstdint>

namespace CosmicConnect {

// ═══════════════════════════════════════════════════════════
// ErrorKind
// ═══════════════════════════════════════════════════════════

enum class ErrorKind : int32_t {
    Io = 1,
    InvalidPacket,
    PacketSizeExceeded,
    InvalidState,
    ProtocolVersionMismatch,
    HandshakeFailed,
    CertificateMismatch,
    PeerIdentityMismatch,
    Unauthorized,
    PairingTimeout,
    PairingRejected,
    Backpressure,
    ResourceExhausted,
    TransportUnavailable,
    NotFound,
    Timeout,
    Configuration,
    Plugin
};

CC_API const char* errorKindToString(ErrorKind kind);

/// Можно ли повторить операцию позже без вмешательства пользователя
CC_API bool isRecoverable(ErrorKind kind);

/// Нужно ли действие пользователя (повторный pairing, подтверждение)
CC_API bool requiresUserAction(ErrorKind kind);

// ═══════════════════════════════════════════════════════════
// ProtocolError
// ═══════════════════════════════════════════════════════════

class CC_API ProtocolError : public std::runtime_error {
public:
    ProtocolError(ErrorKind kind, const std::string& message);

    /// PacketSizeExceeded(actual, max)
    static ProtocolError sizeExceeded(uint64_t actual, uint64_t max);

    ErrorKind kind() const noexcept { return m_kind; }
    bool isRecoverable() const noexcept { return CosmicConnect::isRecoverable(m_kind); }
    bool requiresUserAction() const noexcept { return CosmicConnect::requiresUserAction(m_kind); }

private:
    ErrorKind m_kind;
};

} // namespace CosmicConnect

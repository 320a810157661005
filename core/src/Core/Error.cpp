#include "cosmicconnect/Error.h"

namespace CosmicConnect {

const char* errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Io:                      return "Io";
        case ErrorKind::InvalidPacket:           return "InvalidPacket";
        case ErrorKind::PacketSizeExceeded:      return "PacketSizeExceeded";
        case ErrorKind::InvalidState:            return "InvalidState";
        case ErrorKind::ProtocolVersionMismatch: return "ProtocolVersionMismatch";
        case ErrorKind::HandshakeFailed:         return "HandshakeFailed";
        case ErrorKind::CertificateMismatch:     return "CertificateMismatch";
        case ErrorKind::PeerIdentityMismatch:    return "PeerIdentityMismatch";
        case ErrorKind::Unauthorized:            return "Unauthorized";
        case ErrorKind::PairingTimeout:          return "PairingTimeout";
        case ErrorKind::PairingRejected:         return "PairingRejected";
        case ErrorKind::Backpressure:            return "Backpressure";
        case ErrorKind::ResourceExhausted:       return "ResourceExhausted";
        case ErrorKind::TransportUnavailable:    return "TransportUnavailable";
        case ErrorKind::NotFound:                return "NotFound";
        case ErrorKind::Timeout:                 return "Timeout";
        case ErrorKind::Configuration:           return "Configuration";
        case ErrorKind::Plugin:                  return "Plugin";
        default:                                 return "Unknown";
    }
}

bool isRecoverable(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Io:
        case ErrorKind::Timeout:
        case ErrorKind::Backpressure:
        case ErrorKind::ResourceExhausted:
        case ErrorKind::TransportUnavailable:
            return true;
        default:
            return false;
    }
}

bool requiresUserAction(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::CertificateMismatch:
        case ErrorKind::PairingRejected:
        case ErrorKind::PairingTimeout:
        case ErrorKind::Unauthorized:
            return true;
        default:
            return false;
    }
}

ProtocolError::ProtocolError(ErrorKind kind, const std::string& message)
    : std::runtime_error(std::string(errorKindToString(kind)) + ": " + message)
    , m_kind(kind) {}

ProtocolError ProtocolError::sizeExceeded(uint64_t actual, uint64_t max) {
    return ProtocolError(ErrorKind::PacketSizeExceeded,
                         std::to_string(actual) + " bytes exceeds limit of " + std::to_string(max));
}

} // namespace CosmicConnect

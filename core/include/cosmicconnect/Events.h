// Events.h — События ядра для UI и внутренних компонентов

#pragma once

#include "export.h"
#include "Models.h"
#include "Error.h"
#include "Network/Packet.h"
#include <functional>
#include <optional>
#include <string>

namespace CosmicConnect {

// ═══════════════════════════════════════════════════════════
// DiscoveryEvent
// ═══════════════════════════════════════════════════════════

enum class DiscoveryEventType {
    DeviceFound,
    DeviceLost,
    DiscoveryError
};

struct DiscoveryEvent {
    DiscoveryEventType type = DiscoveryEventType::DeviceFound;
    DeviceInfo info;                    // DeviceFound
    std::string sourceAddress;          // DeviceFound: IP или MAC
    std::string deviceId;               // DeviceFound / DeviceLost
    ErrorKind errorKind = ErrorKind::Io;
    std::string detail;                 // DiscoveryError

    static DiscoveryEvent found(const DeviceInfo& info, const std::string& source);
    static DiscoveryEvent lost(const std::string& deviceId);
    static DiscoveryEvent error(ErrorKind kind, const std::string& detail);
};

// ═══════════════════════════════════════════════════════════
// PairingEvent
// ═══════════════════════════════════════════════════════════

enum class PairingEventType {
    PairingRequested,
    ConfirmationRequired,
    PairingCompleted,
    PairingRejected,
    PairingTimedOut,
    Unpaired,
    TrustBroken
};

CC_API const char* pairingEventTypeToString(PairingEventType type);

struct PairingEvent {
    PairingEventType type = PairingEventType::PairingRequested;
    std::string deviceId;
    std::string peerFingerprint;        // ConfirmationRequired
    std::string localFingerprint;       // ConfirmationRequired
    std::string detail;
};

// ═══════════════════════════════════════════════════════════
// ConnectionEvent
// ═══════════════════════════════════════════════════════════

enum class DisconnectReason {
    LocalRequest,                       // Disconnect(device_id)
    RemoteClosed,
    TransportUnavailable,               // ошибка I/O транспорта или TLS
    IdleTimeout,                        // нет ответа на keepalive
    SupersededByNewConnection,
    ProtocolViolation,                  // невалидный пакет
    Unpaired,
    Shutdown
};

CC_API const char* disconnectReasonToString(DisconnectReason reason);

/// Нужно ли переподключаться после такого разрыва
CC_API bool shouldReconnectAfter(DisconnectReason reason);

enum class ConnectionEventType {
    Connected,
    Disconnected,
    PacketReceived,
    ConnectionError,
    ManagerStarted,
    ManagerStopped
};

struct ConnectionEvent {
    ConnectionEventType type = ConnectionEventType::Connected;
    std::string deviceId;
    std::string remoteAddress;                          // Connected
    DisconnectReason reason = DisconnectReason::RemoteClosed;   // Disconnected
    std::optional<Packet> packet;                       // PacketReceived
    ErrorKind errorKind = ErrorKind::Io;                // ConnectionError
    std::string message;                                // ConnectionError / Disconnected
    uint16_t port = 0;                                  // ManagerStarted
};

using DiscoveryCallback = std::function<void(const DiscoveryEvent&)>;
using PairingCallback = std::function<void(const PairingEvent&)>;
using ConnectionCallback = std::function<void(const ConnectionEvent&)>;

} // namespace CosmicConnect

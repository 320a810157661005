#include "cosmicconnect/Events.h"

namespace CosmicConnect {

DiscoveryEvent DiscoveryEvent::found(const DeviceInfo& info, const std::string& source) {
    DiscoveryEvent e;
    e.type = DiscoveryEventType::DeviceFound;
    e.info = info;
    e.deviceId = info.deviceId;
    e.sourceAddress = source;
    return e;
}

DiscoveryEvent DiscoveryEvent::lost(const std::string& deviceId) {
    DiscoveryEvent e;
    e.type = DiscoveryEventType::DeviceLost;
    e.deviceId = deviceId;
    return e;
}

DiscoveryEvent DiscoveryEvent::error(ErrorKind kind, const std::string& detail) {
    DiscoveryEvent e;
    e.type = DiscoveryEventType::DiscoveryError;
    e.errorKind = kind;
    e.detail = detail;
    return e;
}

const char* pairingEventTypeToString(PairingEventType type) {
    switch (type) {
        case PairingEventType::PairingRequested: return "PairingRequested";
        case PairingEventType::ConfirmationRequired: return "ConfirmationRequired";
        case PairingEventType::PairingCompleted: return "PairingCompleted";
        case PairingEventType::PairingRejected: return "PairingRejected";
        case PairingEventType::PairingTimedOut: return "PairingTimedOut";
        case PairingEventType::Unpaired: return "Unpaired";
        case PairingEventType::TrustBroken: return "TrustBroken";
        default: return "Unknown";
    }
}

const char* disconnectReasonToString(DisconnectReason reason) {
    switch (reason) {
        case DisconnectReason::LocalRequest: return "LocalRequest";
        case DisconnectReason::RemoteClosed: return "RemoteClosed";
        case DisconnectReason::TransportUnavailable: return "TransportUnavailable";
        case DisconnectReason::IdleTimeout: return "IdleTimeout";
        case DisconnectReason::SupersededByNewConnection: return "SupersededByNewConnection";
        case DisconnectReason::ProtocolViolation: return "ProtocolViolation";
        case DisconnectReason::Unpaired: return "Unpaired";
        case DisconnectReason::Shutdown: return "Shutdown";
        default: return "Unknown";
    }
}

bool shouldReconnectAfter(DisconnectReason reason) {
    switch (reason) {
        case DisconnectReason::LocalRequest:
        case DisconnectReason::SupersededByNewConnection:
        case DisconnectReason::Unpaired:
        case DisconnectReason::Shutdown:
            return false;
        default:
            return true;
    }
}

} // namespace CosmicConnect

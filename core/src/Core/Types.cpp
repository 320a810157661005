#include "cosmicconnect/Types.h"
#include <algorithm>
#include <cctype>

namespace CosmicConnect {

namespace {

std::string toLower(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return lower;
}

} // anonymous namespace

// ═══════════════════════════════════════════════════════════
// DeviceType
// ═══════════════════════════════════════════════════════════

const char* deviceTypeToString(DeviceType type) {
    switch (type) {
        case DeviceType::Desktop: return "desktop";
        case DeviceType::Laptop:  return "laptop";
        case DeviceType::Phone:   return "phone";
        case DeviceType::Tablet:  return "tablet";
        case DeviceType::TV:      return "tv";
        default:                  return "unknown";
    }
}

DeviceType deviceTypeFromString(const std::string& str) {
    std::string lower = toLower(str);

    if (lower == "desktop") return DeviceType::Desktop;
    if (lower == "laptop")  return DeviceType::Laptop;
    // "smartphone" встречается у старых клиентов
    if (lower == "phone" || lower == "smartphone") return DeviceType::Phone;
    if (lower == "tablet")  return DeviceType::Tablet;
    if (lower == "tv")      return DeviceType::TV;
    return DeviceType::Unknown;
}

// ═══════════════════════════════════════════════════════════
// ConnectionState / PairingStatus
// ═══════════════════════════════════════════════════════════

const char* connectionStateToString(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting:   return "connecting";
        case ConnectionState::Connected:    return "connected";
        case ConnectionState::Failed:       return "failed";
        default:                            return "disconnected";
    }
}

const char* pairingStatusToString(PairingStatus status) {
    switch (status) {
        case PairingStatus::NotPaired:       return "not_paired";
        case PairingStatus::Requested:       return "requested";
        case PairingStatus::RequestedByPeer: return "requested_by_peer";
        case PairingStatus::Paired:          return "paired";
        case PairingStatus::Rejected:        return "rejected";
        default:                             return "not_paired";
    }
}

// ═══════════════════════════════════════════════════════════
// TransferDirection
// ═══════════════════════════════════════════════════════════

const char* transferDirectionToString(TransferDirection direction) {
    return direction == TransferDirection::Receive ? "receive" : "send";
}

TransferDirection transferDirectionFromString(const std::string& str) {
    return toLower(str) == "receive" ? TransferDirection::Receive : TransferDirection::Send;
}

// ═══════════════════════════════════════════════════════════
// TransportPreference
// ═══════════════════════════════════════════════════════════

const char* transportPreferenceToString(TransportPreference pref) {
    switch (pref) {
        case TransportPreference::PreferTcp:       return "prefer_tcp";
        case TransportPreference::PreferBluetooth: return "prefer_bluetooth";
        case TransportPreference::TcpOnly:         return "tcp_only";
        case TransportPreference::BluetoothOnly:   return "bluetooth_only";
        default:                                   return "prefer_tcp";
    }
}

TransportPreference transportPreferenceFromString(const std::string& str) {
    std::string lower = toLower(str);

    if (lower == "prefer_bluetooth") return TransportPreference::PreferBluetooth;
    if (lower == "tcp_only")         return TransportPreference::TcpOnly;
    if (lower == "bluetooth_only")   return TransportPreference::BluetoothOnly;
    return TransportPreference::PreferTcp;
}

} // namespace CosmicConnect

#pragma once

#include "Types.h"
#include <string>
#include <vector>
#include <set>
#include <optional>
#include <cstdint>

namespace CosmicConnect {

// ═══════════════════════════════════════════════════════════
// DeviceInfo — стабильная идентичность устройства
// ═══════════════════════════════════════════════════════════

struct DeviceInfo {
    std::string deviceId;
    std::string deviceName;
    DeviceType deviceType = DeviceType::Unknown;
    int32_t protocolVersion = 0;
    std::set<std::string> incomingCapabilities;
    std::set<std::string> outgoingCapabilities;
    std::optional<uint16_t> tcpPort;
    std::optional<std::string> bluetoothAddress;   // "AA:BB:CC:DD:EE:FF" из BLE discovery

    bool hasIncomingCapability(const std::string& capability) const;
    bool hasOutgoingCapability(const std::string& capability) const;
};

// ═══════════════════════════════════════════════════════════
// Device — runtime запись, принадлежит DeviceManager
// ═══════════════════════════════════════════════════════════

struct Device {
    DeviceInfo info;
    ConnectionState connectionState = ConnectionState::Disconnected;
    PairingStatus pairingStatus = PairingStatus::NotPaired;
    bool isTrusted = false;
    int64_t lastSeen = 0;                   // Unix ms
    std::optional<int64_t> lastConnected;   // Unix ms
    std::string host;
    uint16_t port = 0;
    std::string certificateFingerprint;     // "AB:CD:..." SHA-256 от DER
    std::vector<uint8_t> certificateData;   // DER, непустой только если paired

    const std::string& id() const { return info.deviceId; }
    const std::string& name() const { return info.deviceName; }
    bool isConnected() const { return connectionState == ConnectionState::Connected; }
    bool isPaired() const { return pairingStatus == PairingStatus::Paired; }
};

// ═══════════════════════════════════════════════════════════
// TrustedPeerRecord — персистентная запись о доверенном пире
// ═══════════════════════════════════════════════════════════

struct TrustedPeerRecord {
    std::string deviceId;
    std::string name;
    DeviceType deviceType = DeviceType::Unknown;
    std::vector<uint8_t> certificateDer;
    std::string fingerprintSha256;
    int64_t firstPairedAt = 0;   // Unix ms
    int64_t lastSeenAt = 0;      // Unix ms
};

// ═══════════════════════════════════════════════════════════
// TransferState — состояние возобновляемой передачи
// ═══════════════════════════════════════════════════════════

struct TransferState {
    std::string transferId;
    std::string deviceId;
    std::string filename;
    std::string localPath;       // Источник (Send) или частичный файл (Receive)
    uint64_t bytesTotal = 0;
    uint64_t bytesTransferred = 0;
    TransferDirection direction = TransferDirection::Send;
    int64_t startedAt = 0;       // Unix ms
    int64_t lastUpdate = 0;      // Unix ms

    bool isComplete() const { return bytesTotal > 0 && bytesTransferred >= bytesTotal; }
    double progressPercentage() const;
};

// ═══════════════════════════════════════════════════════════
// MemoryStats — снимок ResourceManager
// ═══════════════════════════════════════════════════════════

struct MemoryStats {
    size_t activeTransfers = 0;
    uint64_t bytesInFlight = 0;
    uint64_t bytesBudget = 0;
};

/// Текущее время в миллисекундах (Unix epoch)
CC_API int64_t nowUnixMs();

} // namespace CosmicConnect

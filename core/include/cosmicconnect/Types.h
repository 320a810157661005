#pragma once

#include "export.h"
#include <cstdint>
#include <string>

namespace CosmicConnect {

// ═══════════════════════════════════════════════════════════
// Типы устройств (значения на проводе: "phone", "desktop", ...)
// ═══════════════════════════════════════════════════════════

enum class DeviceType : int32_t {
    Unknown = 0,
    Desktop = 1,
    Laptop = 2,
    Phone = 3,
    Tablet = 4,
    TV = 5
};

CC_API const char* deviceTypeToString(DeviceType type);
CC_API DeviceType deviceTypeFromString(const std::string& str);

// ═══════════════════════════════════════════════════════════
// Состояние соединения с устройством
// ═══════════════════════════════════════════════════════════

enum class ConnectionState : int32_t {
    Disconnected = 0,
    Connecting = 1,
    Connected = 2,
    Failed = 3
};

CC_API const char* connectionStateToString(ConnectionState state);

// ═══════════════════════════════════════════════════════════
// Статус pairing
// ═══════════════════════════════════════════════════════════

enum class PairingStatus : int32_t {
    NotPaired = 0,
    Requested = 1,          // Мы отправили запрос
    RequestedByPeer = 2,    // Пир отправил запрос
    Paired = 3,
    Rejected = 4
};

CC_API const char* pairingStatusToString(PairingStatus status);

// ═══════════════════════════════════════════════════════════
// Направление передачи
// ═══════════════════════════════════════════════════════════

enum class TransferDirection : int32_t {
    Send = 0,
    Receive = 1
};

CC_API const char* transferDirectionToString(TransferDirection direction);
CC_API TransferDirection transferDirectionFromString(const std::string& str);

// ═══════════════════════════════════════════════════════════
// Предпочтение транспорта
// ═══════════════════════════════════════════════════════════

enum class TransportPreference : int32_t {
    PreferTcp = 0,
    PreferBluetooth = 1,
    TcpOnly = 2,
    BluetoothOnly = 3
};

CC_API const char* transportPreferenceToString(TransportPreference pref);
CC_API TransportPreference transportPreferenceFromString(const std::string& str);

} // namespace CosmicConnect

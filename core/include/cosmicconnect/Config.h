// Config.h — Конфигурация демона (JSON) и стабильный device_id (identity.json)

#pragma once

#include "export.h"
#include "Types.h"
#include "Network/Packet.h"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace CosmicConnect {

constexpr const char* IDENTITY_FILE = "identity.json";

// ═══════════════════════════════════════════════════════════
// DaemonConfig
// ═══════════════════════════════════════════════════════════

struct CC_API DaemonConfig {
    std::string deviceName;                 // Пусто = hostname
    DeviceType deviceType = DeviceType::Desktop;
    std::string deviceId;                   // Пусто = из identity.json или новый UUID
    std::string stateDir;                   // Пусто = defaultStateDir()
    std::string downloadDir;                // Пусто = <stateDir>/downloads

    uint16_t tcpPort = DEFAULT_TCP_PORT;
    uint16_t discoveryPort = DISCOVERY_PORT;
    uint16_t broadcastPort = DISCOVERY_PORT;        // Порт назначения анонсов
    bool broadcast = true;
    std::vector<std::string> customDevices;         // Unicast адреса для анонсов
    int broadcastIntervalMs = 30000;
    int deviceTimeoutMs = 90000;
    int32_t protocolVersion = PROTOCOL_VERSION;
    TransportPreference transportPreference = TransportPreference::PreferTcp;
    bool enableBluetooth = false;
    size_t maxConnections = 50;
    bool allowAnyPort = false;              // После 1716..1764 взять любой свободный порт

    uint64_t memoryBudgetBytes = 256ull * 1024 * 1024;
    size_t maxConcurrentTransfers = 8;

    std::string logLevel = "info";
    std::string logFile;                    // Пусто = только консоль

    /// Разобрать JSON. Неизвестные ключи игнорируются.
    /// @throws ProtocolError(Configuration) при неверном типе или значении
    static DaemonConfig fromJson(const nlohmann::json& json);

    /// Загрузить файл; отсутствующий файл = значения по умолчанию
    /// @throws ProtocolError(Configuration) если файл не разбирается
    static DaemonConfig load(const std::string& path);

    nlohmann::json toJson() const;

    /// stateDir / downloadDir / deviceName с подставленными значениями по умолчанию
    DaemonConfig resolved() const;
};

/// $XDG_STATE_HOME/cosmicconnect или ~/.local/state/cosmicconnect
CC_API std::string defaultStateDir();

/// Имя хоста (для deviceName по умолчанию)
CC_API std::string localHostName();

/// Прочитать device_id из <stateDir>/identity.json или создать новый UUID и сохранить
/// @throws ProtocolError(Configuration) если файл повреждён
/// @throws ProtocolError(Io) если файл не записывается
CC_API std::string loadOrCreateDeviceId(const std::string& stateDir);

} // namespace CosmicConnect

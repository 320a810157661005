#include "cosmicconnect/Config.h"
#include "cosmicconnect/Certificate.h"
#include "cosmicconnect/Error.h"
#include "FileUtil.h"
#include <spdlog/spdlog.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>

namespace CosmicConnect {

using json = nlohmann::json;

namespace {

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

[[noreturn]] void configError(const std::string& key, const std::string& detail) {
    throw ProtocolError(ErrorKind::Configuration, "config key '" + key + "': " + detail);
}

template <typename T>
void readKey(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    try {
        out = it->get<T>();
    } catch (const json::exception& e) {
        configError(key, e.what());
    }
}

template <typename T>
void readNumber(const json& j, const char* key, T& out, T minValue, T maxValue) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    if (!it->is_number_integer()) {
        configError(key, "expected an integer, got " + std::string(it->type_name()));
    }
    if (it->is_number_unsigned()) {
        auto value = it->get<uint64_t>();
        if (value < static_cast<uint64_t>(std::max<T>(minValue, 0)) || value > static_cast<uint64_t>(maxValue)) {
            configError(key, "value " + std::to_string(value) + " out of range");
        }
        out = static_cast<T>(value);
    } else {
        auto value = it->get<int64_t>();
        if (value < static_cast<int64_t>(minValue) ||
            (value > 0 && static_cast<uint64_t>(value) > static_cast<uint64_t>(maxValue))) {
            configError(key, "value " + std::to_string(value) + " out of range");
        }
        out = static_cast<T>(value);
    }
}

} // anonymous namespace

// ═══════════════════════════════════════════════════════════
// DaemonConfig
// ═══════════════════════════════════════════════════════════

DaemonConfig DaemonConfig::fromJson(const json& j) {
    if (!j.is_object()) {
        throw ProtocolError(ErrorKind::Configuration, "configuration must be a JSON object");
    }

    DaemonConfig config;
    readKey(j, "device_name", config.deviceName);
    readKey(j, "device_id", config.deviceId);
    readKey(j, "state_dir", config.stateDir);
    readKey(j, "download_dir", config.downloadDir);
    readKey(j, "enable_bluetooth", config.enableBluetooth);
    readKey(j, "broadcast", config.broadcast);
    readKey(j, "custom_devices", config.customDevices);
    readKey(j, "allow_any_port", config.allowAnyPort);
    readKey(j, "log_level", config.logLevel);
    readKey(j, "log_file", config.logFile);

    readNumber<uint16_t>(j, "tcp_port", config.tcpPort, 0, std::numeric_limits<uint16_t>::max());
    readNumber<uint16_t>(j, "discovery_port", config.discoveryPort, 0, std::numeric_limits<uint16_t>::max());
    config.broadcastPort = config.discoveryPort != 0 ? config.discoveryPort : DISCOVERY_PORT;
    readNumber<uint16_t>(j, "broadcast_port", config.broadcastPort, 1, std::numeric_limits<uint16_t>::max());
    readNumber<int>(j, "broadcast_interval_ms", config.broadcastIntervalMs, 100, std::numeric_limits<int>::max());
    readNumber<int>(j, "device_timeout_ms", config.deviceTimeoutMs, 1000, std::numeric_limits<int>::max());
    readNumber<int32_t>(j, "protocol_version", config.protocolVersion, 0, std::numeric_limits<int32_t>::max());
    readNumber<size_t>(j, "max_connections", config.maxConnections, 1, 100000);
    readNumber<uint64_t>(j, "memory_budget_bytes", config.memoryBudgetBytes, 1,
                         std::numeric_limits<uint64_t>::max());
    readNumber<size_t>(j, "max_concurrent_transfers", config.maxConcurrentTransfers, 1, 10000);

    if (!isSupportedProtocolVersion(config.protocolVersion)) {
        configError("protocol_version", "unsupported version " + std::to_string(config.protocolVersion));
    }

    if (j.contains("device_type")) {
        std::string type;
        readKey(j, "device_type", type);
        config.deviceType = deviceTypeFromString(type);
        if (config.deviceType == DeviceType::Unknown) {
            configError("device_type", "unknown type '" + type + "'");
        }
    }

    if (j.contains("transport_preference")) {
        std::string pref;
        readKey(j, "transport_preference", pref);
        config.transportPreference = transportPreferenceFromString(pref);
        if (toLower(pref) != transportPreferenceToString(config.transportPreference)) {
            configError("transport_preference", "unknown preference '" + pref + "'");
        }
    }

    static const char* levels[] = {"trace", "debug", "info", "warn", "warning", "error", "critical", "off"};
    std::string level = toLower(config.logLevel);
    if (std::none_of(std::begin(levels), std::end(levels), [&](const char* l) { return level == l; })) {
        configError("log_level", "unknown level '" + config.logLevel + "'");
    }

    return config;
}

DaemonConfig DaemonConfig::load(const std::string& path) {
    auto content = FileUtil::readFile(path);
    if (!content) {
        spdlog::info("Config: {} not found, using defaults", path);
        return DaemonConfig{};
    }

    json j;
    try {
        j = json::parse(*content);
    } catch (const json::parse_error& e) {
        throw ProtocolError(ErrorKind::Configuration, "cannot parse " + path + ": " + e.what());
    }
    return fromJson(j);
}

json DaemonConfig::toJson() const {
    return json{
        {"device_name", deviceName},
        {"device_type", deviceTypeToString(deviceType)},
        {"device_id", deviceId},
        {"state_dir", stateDir},
        {"download_dir", downloadDir},
        {"tcp_port", tcpPort},
        {"discovery_port", discoveryPort},
        {"broadcast_port", broadcastPort},
        {"broadcast", broadcast},
        {"custom_devices", customDevices},
        {"broadcast_interval_ms", broadcastIntervalMs},
        {"device_timeout_ms", deviceTimeoutMs},
        {"protocol_version", protocolVersion},
        {"transport_preference", transportPreferenceToString(transportPreference)},
        {"enable_bluetooth", enableBluetooth},
        {"max_connections", maxConnections},
        {"allow_any_port", allowAnyPort},
        {"memory_budget_bytes", memoryBudgetBytes},
        {"max_concurrent_transfers", maxConcurrentTransfers},
        {"log_level", logLevel},
        {"log_file", logFile}
    };
}

DaemonConfig DaemonConfig::resolved() const {
    DaemonConfig copy = *this;
    if (copy.stateDir.empty()) {
        copy.stateDir = defaultStateDir();
    }
    if (copy.downloadDir.empty()) {
        copy.downloadDir = FileUtil::joinPath(copy.stateDir, "downloads");
    }
    if (copy.deviceName.empty()) {
        copy.deviceName = localHostName();
    }
    return copy;
}

// ═══════════════════════════════════════════════════════════
// Пути и identity
// ═══════════════════════════════════════════════════════════

std::string defaultStateDir() {
    if (const char* xdg = std::getenv("XDG_STATE_HOME"); xdg && *xdg) {
        return FileUtil::joinPath(xdg, "cosmicconnect");
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return FileUtil::joinPath(FileUtil::joinPath(home, ".local/state"), "cosmicconnect");
    }
    return "/tmp/cosmicconnect";
}

std::string localHostName() {
    char buffer[256] = {};
    if (gethostname(buffer, sizeof(buffer) - 1) == 0 && buffer[0] != '\0') {
        return buffer;
    }
    return "cosmicconnect";
}

std::string loadOrCreateDeviceId(const std::string& stateDir) {
    std::string path = FileUtil::joinPath(stateDir, IDENTITY_FILE);

    if (auto content = FileUtil::readFile(path)) {
        try {
            json j = json::parse(*content);
            std::string id = j.value("device_id", "");
            if (!id.empty()) {
                return id;
            }
        } catch (const json::exception& e) {
            throw ProtocolError(ErrorKind::Configuration, "cannot parse " + path + ": " + e.what());
        }
        spdlog::warn("Config: {} has no device_id, generating a new one", path);
    }

    std::string error;
    if (!FileUtil::ensureDirectory(stateDir, &error)) {
        throw ProtocolError(ErrorKind::Io, error);
    }

    // KDE Connect допускает только [a-zA-Z0-9_]
    std::string id = Crypto::generateUUID();
    id.erase(std::remove(id.begin(), id.end(), '-'), id.end());

    json j = {{"device_id", id}, {"created_at", nowUnixMs()}};
    if (!FileUtil::writeFileAtomic(path, j.dump(2), true, &error)) {
        throw ProtocolError(ErrorKind::Io, error);
    }
    spdlog::info("Config: Generated device id {}", id);
    return id;
}

} // namespace CosmicConnect

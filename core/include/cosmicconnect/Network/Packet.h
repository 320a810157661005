// Packet.h — Пакеты протокола KDE Connect (newline-delimited JSON)

#pragma once

#include "../export.h"
#include "../Models.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <cstdint>
#include <optional>
#include <mutex>

namespace CosmicConnect {

// ═══════════════════════════════════════════════════════════
// Константы протокола
// ═══════════════════════════════════════════════════════════

constexpr int32_t PROTOCOL_VERSION = 8;                 // Объявляемая версия по умолчанию
constexpr int32_t MIN_PROTOCOL_VERSION = 7;
constexpr size_t MAX_PACKET_LINE_SIZE = 1024 * 1024;    // 1 MiB без '\n'
constexpr uint16_t DEFAULT_TCP_PORT = 1716;
constexpr uint16_t MAX_TCP_PORT = 1764;
constexpr uint16_t DISCOVERY_PORT = 1716;

constexpr const char* PACKET_TYPE_IDENTITY = "kdeconnect.identity";
constexpr const char* PACKET_TYPE_PAIR = "kdeconnect.pair";
constexpr const char* PACKET_TYPE_PING = "kdeconnect.ping";
constexpr const char* PACKET_TYPE_TRANSFER_RESUME = "cconnect.transfer.resume";
constexpr const char* PACKET_TYPE_TRANSFER_RESUME_ACK = "cconnect.transfer.resume_ack";

/// Сравнение типов пакетов с учётом алиасов cconnect.* / kdeconnect.*
CC_API bool packetTypesMatch(const std::string& a, const std::string& b);

/// Проверка поддерживаемой версии протокола (7 или 8)
CC_API bool isSupportedProtocolVersion(int32_t version);

// ═══════════════════════════════════════════════════════════
// Packet
// ═══════════════════════════════════════════════════════════

struct PayloadTransferInfo {
    uint16_t port = 0;
};

struct CC_API Packet {
    std::string type;
    int64_t id = 0;                                         // ms с epoch
    nlohmann::json body = nlohmann::json::object();
    std::optional<PayloadTransferInfo> payloadTransferInfo;
    std::optional<int64_t> payloadSize;                     // -1 = поток без размера

    Packet() = default;
    Packet(std::string packetType, nlohmann::json packetBody = nlohmann::json::object());

    /// Тип совпадает (с учётом алиасов)
    bool isType(const std::string& packetType) const;

    /// Ссылается ли пакет на payload-канал
    bool hasPayload() const;

    /// Привязать payload (размер и порт всегда вместе)
    void setPayload(int64_t size, uint16_t port);

    // Фабрики стандартных пакетов
    static Packet identity(const DeviceInfo& info);
    static Packet pair(bool pair);
    static Packet ping(bool reply = false);
};

/// Разобрать тело identity-пакета
/// @return DeviceInfo или nullopt если нет deviceId
CC_API std::optional<DeviceInfo> deviceInfoFromIdentity(const Packet& packet);

// ═══════════════════════════════════════════════════════════
// PacketCodec — сериализация строк
// ═══════════════════════════════════════════════════════════

class CC_API PacketCodec {
public:
    /// Сериализовать пакет в строку, завершённую '\n'
    /// @throws ProtocolError(PacketSizeExceeded) если строка больше maxLineSize
    static std::string serialize(const Packet& packet, size_t maxLineSize = MAX_PACKET_LINE_SIZE);

    /// Разобрать одну строку (без '\n')
    /// @throws ProtocolError(InvalidPacket) при неверном JSON или отсутствии type
    static Packet parse(const std::string& line);

    /// JSON-представление без завершающего '\n'
    static nlohmann::json toJson(const Packet& packet);
};

// ═══════════════════════════════════════════════════════════
// LineReader — накопление байт и выдача строк
// ═══════════════════════════════════════════════════════════

class CC_API LineReader {
public:
    explicit LineReader(size_t maxLineSize = MAX_PACKET_LINE_SIZE);

    /// Добавить прочитанные байты
    void feed(const uint8_t* data, size_t size);

    /// Извлечь следующую полную строку
    /// @return false если полной строки ещё нет
    /// @throws ProtocolError(InvalidPacket) если строка длиннее лимита
    bool nextLine(std::string& line);

    size_t buffered() const { return m_buffer.size() - m_offset; }

private:
    std::string m_buffer;
    size_t m_offset = 0;
    size_t m_scanFrom = 0;
    size_t m_maxLineSize;
};

// ═══════════════════════════════════════════════════════════
// PacketIdGenerator — монотонные id в пределах сессии
// ═══════════════════════════════════════════════════════════

class CC_API PacketIdGenerator {
public:
    /// Следующий id: текущее время в ms, но не меньше last + 1
    int64_t next();

    /// Вариант с заданным временем (тесты, перевод часов назад)
    int64_t next(int64_t wallClockMs);

    int64_t last() const;

private:
    mutable std::mutex m_mutex;
    int64_t m_last = 0;
};

} // namespace CosmicConnect

// FrameCodec.h — Бинарные кадры потоковой передачи (screen share)
// Формат: "CSMR" | type (1B) | timestamp (8B BE) | size (4B BE) | payload[size]

#pragma once

#include "../export.h"
#include <vector>
#include <string>
#include <optional>
#include <cstdint>

namespace CosmicConnect {

class Transport;

constexpr uint8_t STREAM_FRAME_MAGIC[4] = {'C', 'S', 'M', 'R'};
constexpr size_t STREAM_FRAME_HEADER_SIZE = 17;
constexpr size_t MAX_STREAM_FRAME_SIZE = 10 * 1024 * 1024;   // 10 MiB

enum class FrameType : uint8_t {
    Video = 0x01,
    Cursor = 0x02,
    Annotation = 0x03,
    EndOfStream = 0xFF
};

CC_API const char* frameTypeName(FrameType type);

struct StreamFrame {
    FrameType type = FrameType::Video;
    uint64_t timestamp = 0;             // нс, задаётся отправителем
    std::vector<uint8_t> payload;
};

// ═══════════════════════════════════════════════════════════
// FrameCodec
// ═══════════════════════════════════════════════════════════

class CC_API FrameCodec {
public:
    /// Закодировать кадр
    /// @throws ProtocolError(PacketSizeExceeded) если payload больше лимита
    static std::vector<uint8_t> encode(const StreamFrame& frame);

    /// Разобрать заголовок
    /// @param size [out] размер payload
    /// @throws ProtocolError(InvalidPacket) при неверном magic
    /// @throws ProtocolError(PacketSizeExceeded) если size больше лимита
    static void decodeHeader(const uint8_t* header, FrameType& type, uint64_t& timestamp, uint32_t& size);

    /// Записать кадр в транспорт
    static void write(Transport& transport, const StreamFrame& frame);

    /// Прочитать один кадр (блокирующий вызов)
    /// @return nullopt если поток закрыт до начала кадра
    static std::optional<StreamFrame> read(Transport& transport);
};

// ═══════════════════════════════════════════════════════════
// FrameReader — инкрементальный разбор из произвольных порций
// ═══════════════════════════════════════════════════════════

class CC_API FrameReader {
public:
    void feed(const uint8_t* data, size_t size);

    /// Следующий полный кадр
    /// @throws ProtocolError при неверном заголовке
    std::optional<StreamFrame> next();

    size_t buffered() const { return m_buffer.size() - m_offset; }

private:
    std::vector<uint8_t> m_buffer;
    size_t m_offset = 0;
};

} // namespace CosmicConnect

// FrameCodec.cpp — CSMR stream frames

#include "cosmicconnect/Network/FrameCodec.h"
#include "cosmicconnect/Network/Transport.h"
#include "cosmicconnect/Error.h"
#include <cstring>

namespace CosmicConnect {

const char* frameTypeName(FrameType type) {
    switch (type) {
        case FrameType::Video: return "Video";
        case FrameType::Cursor: return "Cursor";
        case FrameType::Annotation: return "Annotation";
        case FrameType::EndOfStream: return "EndOfStream";
        default: return "Unknown";
    }
}

// ═══════════════════════════════════════════════════════════
// FrameCodec
// ═══════════════════════════════════════════════════════════

std::vector<uint8_t> FrameCodec::encode(const StreamFrame& frame) {
    if (frame.payload.size() > MAX_STREAM_FRAME_SIZE) {
        throw ProtocolError::sizeExceeded(frame.payload.size(), MAX_STREAM_FRAME_SIZE);
    }

    std::vector<uint8_t> result(STREAM_FRAME_HEADER_SIZE + frame.payload.size());
    uint8_t* ptr = result.data();

    std::memcpy(ptr, STREAM_FRAME_MAGIC, 4);
    ptr += 4;

    *ptr++ = static_cast<uint8_t>(frame.type);

    // timestamp (8 bytes, big-endian)
    for (int i = 7; i >= 0; --i) {
        *ptr++ = static_cast<uint8_t>((frame.timestamp >> (i * 8)) & 0xFF);
    }

    // size (4 bytes, big-endian)
    uint32_t size = static_cast<uint32_t>(frame.payload.size());
    ptr[0] = (size >> 24) & 0xFF;
    ptr[1] = (size >> 16) & 0xFF;
    ptr[2] = (size >> 8) & 0xFF;
    ptr[3] = size & 0xFF;
    ptr += 4;

    if (!frame.payload.empty()) {
        std::memcpy(ptr, frame.payload.data(), frame.payload.size());
    }
    return result;
}

void FrameCodec::decodeHeader(const uint8_t* header, FrameType& type, uint64_t& timestamp, uint32_t& size) {
    if (std::memcmp(header, STREAM_FRAME_MAGIC, 4) != 0) {
        throw ProtocolError(ErrorKind::InvalidPacket, "invalid stream frame magic");
    }

    type = static_cast<FrameType>(header[4]);

    timestamp = 0;
    for (int i = 0; i < 8; ++i) {
        timestamp = (timestamp << 8) | header[5 + i];
    }

    size = (static_cast<uint32_t>(header[13]) << 24) |
           (static_cast<uint32_t>(header[14]) << 16) |
           (static_cast<uint32_t>(header[15]) << 8) |
           static_cast<uint32_t>(header[16]);

    if (size > MAX_STREAM_FRAME_SIZE) {
        throw ProtocolError::sizeExceeded(size, MAX_STREAM_FRAME_SIZE);
    }
}

void FrameCodec::write(Transport& transport, const StreamFrame& frame) {
    auto bytes = encode(frame);
    transport.writeAll(bytes.data(), bytes.size());
}

std::optional<StreamFrame> FrameCodec::read(Transport& transport) {
    uint8_t header[STREAM_FRAME_HEADER_SIZE];

    // Чистый EOF до заголовка: конец потока
    size_t got = transport.read(header, sizeof(header));
    if (got == 0) {
        return std::nullopt;
    }
    if (got < sizeof(header)) {
        transport.readExact(header + got, sizeof(header) - got);
    }

    StreamFrame frame;
    uint32_t size = 0;
    decodeHeader(header, frame.type, frame.timestamp, size);

    frame.payload.resize(size);
    if (size > 0) {
        transport.readExact(frame.payload.data(), size);
    }
    return frame;
}

// ═══════════════════════════════════════════════════════════
// FrameReader
// ═══════════════════════════════════════════════════════════

void FrameReader::feed(const uint8_t* data, size_t size) {
    if (m_offset > 0) {
        m_buffer.erase(m_buffer.begin(), m_buffer.begin() + static_cast<std::ptrdiff_t>(m_offset));
        m_offset = 0;
    }
    m_buffer.insert(m_buffer.end(), data, data + size);
}

std::optional<StreamFrame> FrameReader::next() {
    size_t available = m_buffer.size() - m_offset;
    if (available < STREAM_FRAME_HEADER_SIZE) {
        return std::nullopt;
    }

    StreamFrame frame;
    uint32_t size = 0;
    const uint8_t* header = m_buffer.data() + m_offset;
    try {
        FrameCodec::decodeHeader(header, frame.type, frame.timestamp, size);
    } catch (const ProtocolError&) {
        // Поток рассинхронизирован: сбрасываем буфер
        m_buffer.clear();
        m_offset = 0;
        throw;
    }

    if (available < STREAM_FRAME_HEADER_SIZE + size) {
        return std::nullopt;
    }

    const uint8_t* payload = header + STREAM_FRAME_HEADER_SIZE;
    frame.payload.assign(payload, payload + size);
    m_offset += STREAM_FRAME_HEADER_SIZE + size;
    return frame;
}

} // namespace CosmicConnect

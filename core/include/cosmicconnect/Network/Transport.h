// Transport.h — Абстракция упорядоченного надёжного потока байт

#pragma once

#include "../export.h"
#include "../Types.h"
#include <string>
#include <vector>
#include <memory>
#include <chrono>
#include <cstdint>

namespace CosmicConnect {

// ═══════════════════════════════════════════════════════════
// Capabilities
// ═══════════════════════════════════════════════════════════

enum class LatencyClass : int32_t {
    UltraLow = 0,   // < 10 ms
    Low = 1,        // < 50 ms
    Medium = 2,     // < 200 ms
    High = 3
};

enum class TransportKind : int32_t {
    Tcp = 0,
    Bluetooth = 1,
    Tls = 2
};

CC_API const char* latencyClassToString(LatencyClass latency);
CC_API const char* transportKindToString(TransportKind kind);

struct TransportCapabilities {
    bool reliable = true;
    bool ordered = true;
    uint32_t mtu = 0;                       // 0 = без ограничения
    LatencyClass latency = LatencyClass::Low;
    bool supportsEncryptionUpgrade = false;
};

/// Адрес для исходящего соединения
struct TransportAddress {
    TransportKind kind = TransportKind::Tcp;
    std::string host;                       // IP или hostname (TCP)
    uint16_t port = 0;
    std::string bluetoothAddress;           // "AA:BB:CC:DD:EE:FF"

    static TransportAddress tcp(const std::string& host, uint16_t port);
    static TransportAddress bluetooth(const std::string& address);

    std::string toString() const;
};

// ═══════════════════════════════════════════════════════════
// Transport
// ═══════════════════════════════════════════════════════════

/// Двунаправленный поток байт.
/// read/write блокируют вызывающий поток; close() потокобезопасен
/// и разблокирует ожидающий read().
class CC_API Transport {
public:
    virtual ~Transport() = default;

    virtual TransportKind kind() const = 0;
    virtual TransportCapabilities capabilities() const = 0;

    /// Прочитать до size байт
    /// @return количество байт, 0 при закрытии соединения пиром
    /// @throws ProtocolError(Io) при ошибке, ProtocolError(Timeout) по таймауту чтения
    virtual size_t read(uint8_t* buffer, size_t size) = 0;

    /// Записать до size байт
    /// @return количество записанных байт (> 0)
    /// @throws ProtocolError(Io) при ошибке
    virtual size_t write(const uint8_t* data, size_t size) = 0;

    /// Закрыть поток (идемпотентно)
    virtual void close() = 0;

    virtual bool isOpen() const = 0;

    /// Таймаут для read(); 0 = бесконечно
    virtual void setReadTimeout(std::chrono::milliseconds timeout) = 0;

    /// Дождаться готовности данных
    /// @return true если read() не заблокируется
    virtual bool waitReadable(std::chrono::milliseconds timeout) = 0;

    /// Адрес пира (host для TCP, MAC для Bluetooth)
    virtual std::string remoteAddress() const = 0;

    /// Записать все байты
    /// @throws ProtocolError(Io)
    void writeAll(const uint8_t* data, size_t size);
    void writeAll(const std::string& data);

    /// Прочитать ровно size байт
    /// @throws ProtocolError(Io) если поток закрылся раньше
    void readExact(uint8_t* buffer, size_t size);
};

// ═══════════════════════════════════════════════════════════
// TransportListener
// ═══════════════════════════════════════════════════════════

class CC_API TransportListener {
public:
    virtual ~TransportListener() = default;

    /// Принять входящее соединение (блокирующий вызов)
    /// @return транспорт или nullptr при остановке/таймауте
    virtual std::unique_ptr<Transport> accept(std::chrono::milliseconds timeout) = 0;

    /// Остановить приём (разблокирует accept)
    virtual void stop() = 0;

    virtual bool isRunning() const = 0;
};

// ═══════════════════════════════════════════════════════════
// Выбор транспорта
// ═══════════════════════════════════════════════════════════

/// Кандидат для подключения
struct TransportCandidate {
    TransportAddress address;
    TransportCapabilities capabilities;
};

/// Упорядочить кандидатов: фильтр ненадёжных, фильтр/порядок по предпочтению,
/// затем по классу задержки (стабильно)
CC_API std::vector<TransportCandidate> orderCandidates(std::vector<TransportCandidate> candidates,
                                                       TransportPreference preference);

/// Стандартные capabilities бэкендов
CC_API TransportCapabilities tcpCapabilities();
CC_API TransportCapabilities bluetoothCapabilities(uint32_t mtu = 512);

} // namespace CosmicConnect

// BluetoothTransport.h — RFCOMM транспорт и интерфейс Bluetooth-бэкенда
// Сокеты RFCOMM выдаёт BlueZ (Profile1.NewConnection), здесь только поток байт

#pragma once

#include "TcpTransport.h"
#include <functional>
#include <memory>
#include <string>

namespace CosmicConnect {

// ═══════════════════════════════════════════════════════════
// UUID сервиса KDE Connect
// ═══════════════════════════════════════════════════════════

constexpr const char* BLUETOOTH_SERVICE_UUID = "185f3df4-3268-4e3f-9fca-d4d5059915bd";
constexpr const char* BLUETOOTH_READ_CHARACTERISTIC_UUID = "38756f49-7e00-4f2d-95d0-2c83d4dba7cf";
constexpr const char* BLUETOOTH_WRITE_CHARACTERISTIC_UUID = "d7d3a9d0-2cf4-4c0c-931e-6baefa65fdf3";
constexpr uint32_t BLUETOOTH_DEFAULT_MTU = 512;

// ═══════════════════════════════════════════════════════════
// BluetoothTransport
// ═══════════════════════════════════════════════════════════

class CC_API BluetoothTransport : public SocketTransport {
public:
    /// Принимает владение RFCOMM дескриптором
    BluetoothTransport(int socket, std::string address, uint32_t mtu = BLUETOOTH_DEFAULT_MTU);

    TransportKind kind() const override { return TransportKind::Bluetooth; }
    TransportCapabilities capabilities() const override { return bluetoothCapabilities(m_mtu); }

    /// Запись порциями не больше MTU
    size_t write(const uint8_t* data, size_t size) override;

private:
    uint32_t m_mtu;
};

// ═══════════════════════════════════════════════════════════
// BluetoothBackend — системный стек (BlueZ)
// ═══════════════════════════════════════════════════════════

class CC_API BluetoothBackend {
public:
    virtual ~BluetoothBackend() = default;

    /// Зарегистрировать профиль и начать приём соединений
    virtual bool start() = 0;
    virtual void stop() = 0;
    virtual bool isRunning() const = 0;

    /// Подключиться к устройству по MAC
    /// @throws ProtocolError(TransportUnavailable)
    virtual std::unique_ptr<Transport> connect(const std::string& address,
                                               std::chrono::milliseconds timeout) = 0;

    /// Входящее соединение (блокирующий вызов)
    /// @return nullptr при остановке/таймауте
    virtual std::unique_ptr<Transport> accept(std::chrono::milliseconds timeout) = 0;

    virtual std::string getLastError() const = 0;
};

/// Адаптер BluetoothBackend -> TransportListener для accept-цикла
class CC_API BluetoothListener : public TransportListener {
public:
    explicit BluetoothListener(std::shared_ptr<BluetoothBackend> backend);

    std::unique_ptr<Transport> accept(std::chrono::milliseconds timeout) override;
    void stop() override;
    bool isRunning() const override;

private:
    std::shared_ptr<BluetoothBackend> m_backend;
};

} // namespace CosmicConnect

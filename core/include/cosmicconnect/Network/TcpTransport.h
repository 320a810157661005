// TcpTransport.h — Транспорт поверх POSIX сокетов (TCP, RFCOMM)

#pragma once

#include "Transport.h"
#include <atomic>
#include <memory>
#include <string>

namespace CosmicConnect {

constexpr int TCP_CONNECT_TIMEOUT_MS = 10000;
constexpr int TCP_LISTEN_BACKLOG = 16;

// ═══════════════════════════════════════════════════════════
// SocketTransport — общий код для потоковых сокетов
// ═══════════════════════════════════════════════════════════

class CC_API SocketTransport : public Transport {
public:
    ~SocketTransport() override;

    // Запрет копирования
    SocketTransport(const SocketTransport&) = delete;
    SocketTransport& operator=(const SocketTransport&) = delete;

    size_t read(uint8_t* buffer, size_t size) override;
    size_t write(const uint8_t* data, size_t size) override;
    void close() override;
    bool isOpen() const override;
    void setReadTimeout(std::chrono::milliseconds timeout) override;
    bool waitReadable(std::chrono::milliseconds timeout) override;
    std::string remoteAddress() const override { return m_remoteAddress; }

    int nativeHandle() const { return m_socket; }

protected:
    /// Принимает владение дескриптором
    SocketTransport(int socket, std::string remoteAddress);

private:
    int m_socket;
    std::atomic<bool> m_open{true};
    std::string m_remoteAddress;
};

// ═══════════════════════════════════════════════════════════
// TcpTransport
// ═══════════════════════════════════════════════════════════

class CC_API TcpTransport : public SocketTransport {
public:
    TcpTransport(int socket, std::string host, uint16_t port);

    /// Подключиться к host:port (IPv4/IPv6)
    /// @throws ProtocolError(TransportUnavailable) если соединение не установлено
    static std::unique_ptr<TcpTransport> connect(
        const std::string& host, uint16_t port,
        std::chrono::milliseconds timeout = std::chrono::milliseconds(TCP_CONNECT_TIMEOUT_MS));

    TransportKind kind() const override { return TransportKind::Tcp; }
    TransportCapabilities capabilities() const override { return tcpCapabilities(); }

    uint16_t remotePort() const { return m_port; }

private:
    uint16_t m_port;
};

// ═══════════════════════════════════════════════════════════
// TcpListener
// ═══════════════════════════════════════════════════════════

class CC_API TcpListener : public TransportListener {
public:
    TcpListener();
    ~TcpListener() override;

    // Запрет копирования
    TcpListener(const TcpListener&) = delete;
    TcpListener& operator=(const TcpListener&) = delete;

    /// Запустить на порту (0 = выбрать свободный)
    /// @return true если сервер слушает
    bool start(uint16_t port);

    /// Перебрать порты first..last, затем (если allowAnyPort) любой свободный
    bool startInRange(uint16_t first, uint16_t last, bool allowAnyPort = false);

    std::unique_ptr<Transport> accept(std::chrono::milliseconds timeout) override;
    void stop() override;
    bool isRunning() const override;

    /// Фактический порт (после start)
    uint16_t getPort() const;

    std::string getLastError() const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace CosmicConnect

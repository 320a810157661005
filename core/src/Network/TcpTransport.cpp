// TcpTransport.cpp — POSIX stream sockets

#include "cosmicconnect/Network/TcpTransport.h"
#include "cosmicconnect/Error.h"
#include "SocketCompat.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <mutex>
#include <thread>

namespace CosmicConnect {

// ═══════════════════════════════════════════════════════════
// SocketTransport
// ═══════════════════════════════════════════════════════════

SocketTransport::SocketTransport(int socket, std::string remoteAddress)
    : m_socket(socket)
    , m_remoteAddress(std::move(remoteAddress)) {
#ifdef SO_NOSIGPIPE
    int one = 1;
    setsockopt(m_socket, SOL_SOCKET, SO_NOSIGPIPE, &one, sizeof(one));
#endif
}

SocketTransport::~SocketTransport() {
    close();
    if (m_socket != SOCKET_INVALID) {
        CLOSE_SOCKET(m_socket);
        m_socket = SOCKET_INVALID;
    }
}

size_t SocketTransport::read(uint8_t* buffer, size_t size) {
    while (true) {
        if (!m_open) {
            return 0;
        }
        ssize_t n = ::recv(m_socket, buffer, size, 0);
        if (n >= 0) {
            return static_cast<size_t>(n);
        }
        int err = SOCKET_ERROR_CODE;
        if (err == EINTR) continue;
        if (err == EAGAIN || err == EWOULDBLOCK) {
            throw ProtocolError(ErrorKind::Timeout, "read timed out from " + m_remoteAddress);
        }
        if (!m_open) {
            return 0;
        }
        throw ProtocolError(ErrorKind::Io, "recv failed: " + socketErrorString(err));
    }
}

size_t SocketTransport::write(const uint8_t* data, size_t size) {
    while (true) {
        if (!m_open) {
            throw ProtocolError(ErrorKind::Io, "transport closed");
        }
        ssize_t n = ::send(m_socket, data, size, MSG_NOSIGNAL);
        if (n > 0) {
            return static_cast<size_t>(n);
        }
        int err = SOCKET_ERROR_CODE;
        if (n < 0 && err == EINTR) continue;
        throw ProtocolError(ErrorKind::Io, "send failed: " + socketErrorString(err));
    }
}

void SocketTransport::close() {
    // shutdown разблокирует recv в другом потоке; дескриптор закрывается в деструкторе
    if (m_open.exchange(false) && m_socket != SOCKET_INVALID) {
        ::shutdown(m_socket, SHUT_RDWR);
    }
}

bool SocketTransport::isOpen() const {
    return m_open;
}

void SocketTransport::setReadTimeout(std::chrono::milliseconds timeout) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    if (setsockopt(m_socket, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
        spdlog::warn("Transport: SO_RCVTIMEO failed: {}", socketErrorString(SOCKET_ERROR_CODE));
    }
}

bool SocketTransport::waitReadable(std::chrono::milliseconds timeout) {
    if (!m_open) return true;   // read() вернёт 0
    pollfd pfd{};
    pfd.fd = m_socket;
    pfd.events = POLLIN;
    int r = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (r < 0) {
        return SOCKET_ERROR_CODE != EINTR;
    }
    return r > 0;
}

// ═══════════════════════════════════════════════════════════
// TcpTransport
// ═══════════════════════════════════════════════════════════

TcpTransport::TcpTransport(int socket, std::string host, uint16_t port)
    : SocketTransport(socket, std::move(host))
    , m_port(port) {
    int one = 1;
    setsockopt(socket, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
    setsockopt(socket, SOL_SOCKET, SO_KEEPALIVE, &one, sizeof(one));
}

std::unique_ptr<TcpTransport> TcpTransport::connect(const std::string& host, uint16_t port,
                                                    std::chrono::milliseconds timeout) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    addrinfo* results = nullptr;
    std::string portStr = std::to_string(port);
    int gai = getaddrinfo(host.c_str(), portStr.c_str(), &hints, &results);
    if (gai != 0 || !results) {
        throw ProtocolError(ErrorKind::TransportUnavailable,
                            "cannot resolve " + host + ": " + gai_strerror(gai));
    }

    std::string lastError = "no addresses";
    for (addrinfo* ai = results; ai; ai = ai->ai_next) {
        socket_t sock = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock == SOCKET_INVALID) {
            lastError = "socket: " + socketErrorString(SOCKET_ERROR_CODE);
            continue;
        }

        // Неблокирующий connect с таймаутом через poll
        int flags = fcntl(sock, F_GETFL, 0);
        fcntl(sock, F_SETFL, flags | O_NONBLOCK);

        int r = ::connect(sock, ai->ai_addr, ai->ai_addrlen);
        if (r < 0 && SOCKET_ERROR_CODE == EINPROGRESS) {
            pollfd pfd{};
            pfd.fd = sock;
            pfd.events = POLLOUT;
            r = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
            if (r == 0) {
                lastError = "connect timed out";
                CLOSE_SOCKET(sock);
                continue;
            }
            int soError = 0;
            socklen_t len = sizeof(soError);
            getsockopt(sock, SOL_SOCKET, SO_ERROR, &soError, &len);
            r = (r > 0 && soError == 0) ? 0 : -1;
            if (r < 0) errno = soError ? soError : errno;
        }
        if (r < 0) {
            lastError = "connect: " + socketErrorString(SOCKET_ERROR_CODE);
            CLOSE_SOCKET(sock);
            continue;
        }

        fcntl(sock, F_SETFL, flags);
        freeaddrinfo(results);
        spdlog::debug("TcpTransport: Connected to {}:{}", host, port);
        return std::make_unique<TcpTransport>(sock, host, port);
    }

    freeaddrinfo(results);
    throw ProtocolError(ErrorKind::TransportUnavailable,
                        "cannot connect to " + host + ":" + portStr + ": " + lastError);
}

// ═══════════════════════════════════════════════════════════
// TcpListener::Impl
// ═══════════════════════════════════════════════════════════

class TcpListener::Impl {
public:
    ~Impl() {
        stop();
    }

    bool start(uint16_t port) {
        if (m_running) return true;

        // Dual-stack IPv6, при отсутствии IPv6: IPv4
        if (!bindSocket(AF_INET6, port) && !bindSocket(AF_INET, port)) {
            return false;
        }

        if (listen(m_listenSocket, TCP_LISTEN_BACKLOG) < 0) {
            m_lastError = "Failed to listen: " + socketErrorString(SOCKET_ERROR_CODE);
            closeSocket();
            return false;
        }

        // Реальный порт (важно при port=0)
        sockaddr_storage bound{};
        socklen_t len = sizeof(bound);
        if (getsockname(m_listenSocket, reinterpret_cast<sockaddr*>(&bound), &len) != 0) {
            m_lastError = "Failed to get bound port";
            closeSocket();
            return false;
        }
        sockaddrToString(bound, &m_port);

        m_running = true;
        spdlog::info("TcpListener: Listening on port {}", m_port);
        return true;
    }

    void stop() {
        bool wasRunning = m_running.exchange(false);
        std::lock_guard<std::mutex> lock(m_socketMutex);
        if (m_listenSocket != SOCKET_INVALID) {
            ::shutdown(m_listenSocket, SHUT_RDWR);
            CLOSE_SOCKET(m_listenSocket);
            m_listenSocket = SOCKET_INVALID;
        }
        if (wasRunning) {
            spdlog::info("TcpListener: Stopped (port {})", m_port);
        }
    }

    bool isRunning() const { return m_running; }

    std::unique_ptr<Transport> accept(std::chrono::milliseconds timeout) {
        auto deadline = std::chrono::steady_clock::now() + timeout;

        while (m_running) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) return nullptr;

            socket_t listenSocket;
            {
                std::lock_guard<std::mutex> lock(m_socketMutex);
                listenSocket = m_listenSocket;
            }
            if (listenSocket == SOCKET_INVALID) return nullptr;

            // Короткие интервалы, чтобы заметить stop()
            pollfd pfd{};
            pfd.fd = listenSocket;
            pfd.events = POLLIN;
            int slice = static_cast<int>(std::min<int64_t>(remaining.count(), 250));
            int r = ::poll(&pfd, 1, slice);
            if (r <= 0 || !m_running) continue;

            sockaddr_storage clientAddr{};
            socklen_t clientLen = sizeof(clientAddr);
            socket_t clientSocket = ::accept(listenSocket,
                                             reinterpret_cast<sockaddr*>(&clientAddr),
                                             &clientLen);
            if (clientSocket == SOCKET_INVALID) {
                if (m_running) {
                    m_lastError = "Accept failed: " + socketErrorString(SOCKET_ERROR_CODE);
                    spdlog::debug("TcpListener: {}", m_lastError);
                }
                continue;
            }

            uint16_t clientPort = 0;
            std::string clientIp = sockaddrToString(clientAddr, &clientPort);
            spdlog::debug("TcpListener: Incoming connection from {}:{}", clientIp, clientPort);
            return std::make_unique<TcpTransport>(clientSocket, clientIp, clientPort);
        }
        return nullptr;
    }

    uint16_t getPort() const { return m_port; }
    std::string getLastError() const { return m_lastError; }

private:
    socket_t m_listenSocket = SOCKET_INVALID;
    std::mutex m_socketMutex;
    uint16_t m_port = 0;
    std::atomic<bool> m_running{false};
    std::string m_lastError;

    bool bindSocket(int family, uint16_t port) {
        m_listenSocket = ::socket(family, SOCK_STREAM, IPPROTO_TCP);
        if (m_listenSocket == SOCKET_INVALID) {
            m_lastError = "Failed to create socket: " + socketErrorString(SOCKET_ERROR_CODE);
            return false;
        }

        int reuseAddr = 1;
        setsockopt(m_listenSocket, SOL_SOCKET, SO_REUSEADDR, &reuseAddr, sizeof(reuseAddr));

        int r;
        if (family == AF_INET6) {
            int v6only = 0;
            setsockopt(m_listenSocket, IPPROTO_IPV6, IPV6_V6ONLY, &v6only, sizeof(v6only));
            sockaddr_in6 addr{};
            addr.sin6_family = AF_INET6;
            addr.sin6_port = htons(port);
            addr.sin6_addr = in6addr_any;
            r = bind(m_listenSocket, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        } else {
            sockaddr_in addr{};
            addr.sin_family = AF_INET;
            addr.sin_port = htons(port);
            addr.sin_addr.s_addr = INADDR_ANY;
            r = bind(m_listenSocket, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        }

        if (r < 0) {
            m_lastError = "Failed to bind port " + std::to_string(port) + ": " +
                          socketErrorString(SOCKET_ERROR_CODE);
            closeSocket();
            return false;
        }
        return true;
    }

    void closeSocket() {
        if (m_listenSocket != SOCKET_INVALID) {
            CLOSE_SOCKET(m_listenSocket);
            m_listenSocket = SOCKET_INVALID;
        }
    }
};

// ═══════════════════════════════════════════════════════════
// TcpListener Public Interface
// ═══════════════════════════════════════════════════════════

TcpListener::TcpListener() : m_impl(std::make_unique<Impl>()) {}
TcpListener::~TcpListener() = default;

bool TcpListener::start(uint16_t port) {
    return m_impl->start(port);
}

bool TcpListener::startInRange(uint16_t first, uint16_t last, bool allowAnyPort) {
    for (uint32_t port = first; port <= last; ++port) {
        if (m_impl->start(static_cast<uint16_t>(port))) {
            return true;
        }
    }
    if (allowAnyPort) {
        return m_impl->start(0);
    }
    return false;
}

std::unique_ptr<Transport> TcpListener::accept(std::chrono::milliseconds timeout) {
    return m_impl->accept(timeout);
}

void TcpListener::stop() {
    m_impl->stop();
}

bool TcpListener::isRunning() const {
    return m_impl->isRunning();
}

uint16_t TcpListener::getPort() const {
    return m_impl->getPort();
}

std::string TcpListener::getLastError() const {
    return m_impl->getLastError();
}

} // namespace CosmicConnect

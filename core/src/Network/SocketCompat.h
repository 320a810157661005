// SocketCompat.h — POSIX сокеты (внутренний заголовок)

#pragma once

#include <sys/socket.h>
#include <sys/types.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <string>

using socket_t = int;
#define SOCKET_INVALID (-1)
#define CLOSE_SOCKET ::close
#define SOCKET_ERROR_CODE errno

namespace CosmicConnect {

inline std::string socketErrorString(int code) {
    return std::string(std::strerror(code)) + " (" + std::to_string(code) + ")";
}

/// Текстовый IP из sockaddr; IPv4-mapped IPv6 приводится к IPv4
inline std::string sockaddrToString(const sockaddr_storage& addr, uint16_t* port = nullptr) {
    char buf[INET6_ADDRSTRLEN] = {0};
    if (addr.ss_family == AF_INET) {
        const auto* in = reinterpret_cast<const sockaddr_in*>(&addr);
        inet_ntop(AF_INET, &in->sin_addr, buf, sizeof(buf));
        if (port) *port = ntohs(in->sin_port);
        return buf;
    }
    if (addr.ss_family == AF_INET6) {
        const auto* in6 = reinterpret_cast<const sockaddr_in6*>(&addr);
        if (port) *port = ntohs(in6->sin6_port);
        if (IN6_IS_ADDR_V4MAPPED(&in6->sin6_addr)) {
            in_addr v4;
            std::memcpy(&v4, &in6->sin6_addr.s6_addr[12], sizeof(v4));
            inet_ntop(AF_INET, &v4, buf, sizeof(buf));
            return buf;
        }
        inet_ntop(AF_INET6, &in6->sin6_addr, buf, sizeof(buf));
        return buf;
    }
    return {};
}

} // namespace CosmicConnect

// Transport.cpp — Общие операции транспорта и политика выбора

#include "cosmicconnect/Network/Transport.h"
#include "cosmicconnect/Error.h"
#include <algorithm>

namespace CosmicConnect {

const char* latencyClassToString(LatencyClass latency) {
    switch (latency) {
        case LatencyClass::UltraLow: return "ultra_low";
        case LatencyClass::Low: return "low";
        case LatencyClass::Medium: return "medium";
        case LatencyClass::High: return "high";
        default: return "unknown";
    }
}

const char* transportKindToString(TransportKind kind) {
    switch (kind) {
        case TransportKind::Tcp: return "tcp";
        case TransportKind::Bluetooth: return "bluetooth";
        case TransportKind::Tls: return "tls";
        default: return "unknown";
    }
}

// ═══════════════════════════════════════════════════════════
// TransportAddress
// ═══════════════════════════════════════════════════════════

TransportAddress TransportAddress::tcp(const std::string& host, uint16_t port) {
    TransportAddress a;
    a.kind = TransportKind::Tcp;
    a.host = host;
    a.port = port;
    return a;
}

TransportAddress TransportAddress::bluetooth(const std::string& address) {
    TransportAddress a;
    a.kind = TransportKind::Bluetooth;
    a.bluetoothAddress = address;
    return a;
}

std::string TransportAddress::toString() const {
    if (kind == TransportKind::Bluetooth) {
        return "bt://" + bluetoothAddress;
    }
    if (host.find(':') != std::string::npos) {
        return "[" + host + "]:" + std::to_string(port);
    }
    return host + ":" + std::to_string(port);
}

// ═══════════════════════════════════════════════════════════
// Transport helpers
// ═══════════════════════════════════════════════════════════

void Transport::writeAll(const uint8_t* data, size_t size) {
    size_t offset = 0;
    while (offset < size) {
        size_t n = write(data + offset, size - offset);
        if (n == 0) {
            throw ProtocolError(ErrorKind::Io, "transport closed during write");
        }
        offset += n;
    }
}

void Transport::writeAll(const std::string& data) {
    writeAll(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

void Transport::readExact(uint8_t* buffer, size_t size) {
    size_t offset = 0;
    while (offset < size) {
        size_t n = read(buffer + offset, size - offset);
        if (n == 0) {
            throw ProtocolError(ErrorKind::Io,
                                "connection closed after " + std::to_string(offset) +
                                " of " + std::to_string(size) + " bytes");
        }
        offset += n;
    }
}

// ═══════════════════════════════════════════════════════════
// Selection policy
// ═══════════════════════════════════════════════════════════

TransportCapabilities tcpCapabilities() {
    TransportCapabilities caps;
    caps.reliable = true;
    caps.ordered = true;
    caps.mtu = 0;
    caps.latency = LatencyClass::Low;
    caps.supportsEncryptionUpgrade = true;
    return caps;
}

TransportCapabilities bluetoothCapabilities(uint32_t mtu) {
    TransportCapabilities caps;
    caps.reliable = true;
    caps.ordered = true;
    caps.mtu = mtu;
    caps.latency = LatencyClass::Medium;
    caps.supportsEncryptionUpgrade = false;
    return caps;
}

std::vector<TransportCandidate> orderCandidates(std::vector<TransportCandidate> candidates,
                                                TransportPreference preference) {
    candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
                                    [preference](const TransportCandidate& c) {
        if (!c.capabilities.reliable) return true;
        if (preference == TransportPreference::TcpOnly &&
            c.address.kind != TransportKind::Tcp) return true;
        if (preference == TransportPreference::BluetoothOnly &&
            c.address.kind != TransportKind::Bluetooth) return true;
        return false;
    }), candidates.end());

    auto rank = [preference](const TransportCandidate& c) {
        if (preference == TransportPreference::PreferBluetooth) {
            return c.address.kind == TransportKind::Bluetooth ? 0 : 1;
        }
        return 0;
    };

    std::stable_sort(candidates.begin(), candidates.end(),
                     [&rank](const TransportCandidate& a, const TransportCandidate& b) {
        int ra = rank(a);
        int rb = rank(b);
        if (ra != rb) return ra < rb;
        return static_cast<int>(a.capabilities.latency) < static_cast<int>(b.capabilities.latency);
    });
    return candidates;
}

} // namespace CosmicConnect

#include "cosmicconnect/Network/BluetoothTransport.h"
#include <algorithm>

namespace CosmicConnect {

BluetoothTransport::BluetoothTransport(int socket, std::string address, uint32_t mtu)
    : SocketTransport(socket, std::move(address))
    , m_mtu(mtu == 0 ? BLUETOOTH_DEFAULT_MTU : mtu) {}

size_t BluetoothTransport::write(const uint8_t* data, size_t size) {
    return SocketTransport::write(data, std::min<size_t>(size, m_mtu));
}

BluetoothListener::BluetoothListener(std::shared_ptr<BluetoothBackend> backend)
    : m_backend(std::move(backend)) {}

std::unique_ptr<Transport> BluetoothListener::accept(std::chrono::milliseconds timeout) {
    if (!m_backend) return nullptr;
    return m_backend->accept(timeout);
}

void BluetoothListener::stop() {
    if (m_backend) m_backend->stop();
}

bool BluetoothListener::isRunning() const {
    return m_backend && m_backend->isRunning();
}

} // namespace CosmicConnect

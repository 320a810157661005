#include "cosmicconnect/Models.h"
#include "cosmicconnect/Network/Packet.h"
#include <algorithm>
#include <chrono>

namespace CosmicConnect {

namespace {

bool containsCapability(const std::set<std::string>& caps, const std::string& capability) {
    if (caps.count(capability) > 0) return true;
    return std::any_of(caps.begin(), caps.end(), [&](const std::string& c) {
        return packetTypesMatch(c, capability);
    });
}

} // anonymous namespace

bool DeviceInfo::hasIncomingCapability(const std::string& capability) const {
    return containsCapability(incomingCapabilities, capability);
}

bool DeviceInfo::hasOutgoingCapability(const std::string& capability) const {
    return containsCapability(outgoingCapabilities, capability);
}

double TransferState::progressPercentage() const {
    if (bytesTotal == 0) return 0.0;
    return static_cast<double>(bytesTransferred) * 100.0 / static_cast<double>(bytesTotal);
}

int64_t nowUnixMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace CosmicConnect

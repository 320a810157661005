#include "cosmicconnect/ResourceManager.h"
#include "cosmicconnect/Error.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <map>
#include <mutex>

namespace CosmicConnect {

/// Общее состояние: гранты могут пережить менеджер
struct ResourceGrant::State {
    std::mutex mutex;
    uint64_t bytesInFlight = 0;
    size_t activeTransfers = 0;
    std::map<std::string, size_t> perDevice;

    void release(const std::string& deviceId, uint64_t bytes) {
        std::lock_guard<std::mutex> lock(mutex);
        bytesInFlight -= std::min(bytesInFlight, bytes);
        if (activeTransfers > 0) --activeTransfers;
        auto it = perDevice.find(deviceId);
        if (it != perDevice.end()) {
            if (--it->second == 0) perDevice.erase(it);
        }
    }
};

// ═══════════════════════════════════════════════════════════
// ResourceGrant
// ═══════════════════════════════════════════════════════════

ResourceGrant::ResourceGrant(std::shared_ptr<State> state, std::string deviceId, uint64_t bytes)
    : m_state(std::move(state))
    , m_deviceId(std::move(deviceId))
    , m_bytes(bytes) {}

ResourceGrant::~ResourceGrant() {
    release();
}

ResourceGrant::ResourceGrant(ResourceGrant&& other) noexcept
    : m_state(std::move(other.m_state))
    , m_deviceId(std::move(other.m_deviceId))
    , m_bytes(other.m_bytes) {
    other.m_state.reset();
    other.m_bytes = 0;
}

ResourceGrant& ResourceGrant::operator=(ResourceGrant&& other) noexcept {
    if (this != &other) {
        release();
        m_state = std::move(other.m_state);
        m_deviceId = std::move(other.m_deviceId);
        m_bytes = other.m_bytes;
        other.m_state.reset();
        other.m_bytes = 0;
    }
    return *this;
}

void ResourceGrant::release() {
    if (!m_state) return;
    m_state->release(m_deviceId, m_bytes);
    m_state.reset();
}

// ═══════════════════════════════════════════════════════════
// ResourceManager
// ═══════════════════════════════════════════════════════════

ResourceManager::ResourceManager(ResourceConfig config)
    : m_config(config)
    , m_state(std::make_shared<ResourceGrant::State>()) {}

ResourceManager::~ResourceManager() = default;

std::optional<std::string> ResourceManager::reserve(const std::string& deviceId, uint64_t transferSize) {
    if (m_config.maxTransferSize > 0 && transferSize > m_config.maxTransferSize) {
        return "transfer of " + std::to_string(transferSize) + " bytes exceeds per-transfer cap " +
               std::to_string(m_config.maxTransferSize);
    }

    std::lock_guard<std::mutex> lock(m_state->mutex);
    if (m_state->activeTransfers >= m_config.maxConcurrent) {
        return "too many active transfers (" + std::to_string(m_state->activeTransfers) + ")";
    }
    auto it = m_state->perDevice.find(deviceId);
    if (it != m_state->perDevice.end() && it->second >= m_config.maxPerDevice) {
        return "too many active transfers for " + deviceId;
    }
    if (transferSize > m_config.bytesBudget - std::min(m_config.bytesBudget, m_state->bytesInFlight)) {
        return "memory budget exhausted (" + std::to_string(m_state->bytesInFlight) + " of " +
               std::to_string(m_config.bytesBudget) + " bytes in flight, " +
               std::to_string(transferSize) + " requested)";
    }

    m_state->bytesInFlight += transferSize;
    ++m_state->activeTransfers;
    ++m_state->perDevice[deviceId];
    return std::nullopt;
}

ResourceGrant ResourceManager::admit(const std::string& deviceId, uint64_t transferSize) {
    auto refusal = reserve(deviceId, transferSize);
    if (refusal) {
        spdlog::warn("ResourceManager: Rejected transfer for {}: {}", deviceId, *refusal);
        throw ProtocolError(ErrorKind::ResourceExhausted, *refusal);
    }
    spdlog::debug("ResourceManager: Admitted {} bytes for {}", transferSize, deviceId);
    return ResourceGrant(m_state, deviceId, transferSize);
}

std::optional<ResourceGrant> ResourceManager::tryAdmit(const std::string& deviceId, uint64_t transferSize) {
    if (reserve(deviceId, transferSize)) {
        return std::nullopt;
    }
    return ResourceGrant(m_state, deviceId, transferSize);
}

MemoryStats ResourceManager::stats() const {
    std::lock_guard<std::mutex> lock(m_state->mutex);
    MemoryStats stats;
    stats.activeTransfers = m_state->activeTransfers;
    stats.bytesInFlight = m_state->bytesInFlight;
    stats.bytesBudget = m_config.bytesBudget;
    return stats;
}

size_t ResourceManager::activeForDevice(const std::string& deviceId) const {
    std::lock_guard<std::mutex> lock(m_state->mutex);
    auto it = m_state->perDevice.find(deviceId);
    return it == m_state->perDevice.end() ? 0 : it->second;
}

const ResourceConfig& ResourceManager::config() const {
    return m_config;
}

} // namespace CosmicConnect

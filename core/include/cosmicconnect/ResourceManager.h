// ResourceManager.h — Бюджет памяти и лимиты параллельных передач

#pragma once

#include "export.h"
#include "Models.h"
#include <memory>
#include <optional>
#include <string>

namespace CosmicConnect {

constexpr uint64_t DEFAULT_MEMORY_BUDGET = 256ull * 1024 * 1024;    // 256 MiB
constexpr size_t DEFAULT_MAX_CONCURRENT_TRANSFERS = 8;
constexpr size_t DEFAULT_MAX_TRANSFERS_PER_DEVICE = 3;

struct ResourceConfig {
    uint64_t bytesBudget = DEFAULT_MEMORY_BUDGET;
    size_t maxConcurrent = DEFAULT_MAX_CONCURRENT_TRANSFERS;
    size_t maxPerDevice = DEFAULT_MAX_TRANSFERS_PER_DEVICE;
    uint64_t maxTransferSize = 0;           // 0 = без ограничения
};

class ResourceManager;

// ═══════════════════════════════════════════════════════════
// ResourceGrant — допуск передачи, освобождается в деструкторе
// ═══════════════════════════════════════════════════════════

class CC_API ResourceGrant {
public:
    ResourceGrant() = default;
    ~ResourceGrant();

    ResourceGrant(ResourceGrant&& other) noexcept;
    ResourceGrant& operator=(ResourceGrant&& other) noexcept;

    // Запрет копирования
    ResourceGrant(const ResourceGrant&) = delete;
    ResourceGrant& operator=(const ResourceGrant&) = delete;

    /// Вернуть бюджет досрочно (идемпотентно)
    void release();

    bool valid() const { return m_state != nullptr; }
    uint64_t bytes() const { return m_bytes; }
    const std::string& deviceId() const { return m_deviceId; }

private:
    friend class ResourceManager;
    struct State;

    ResourceGrant(std::shared_ptr<State> state, std::string deviceId, uint64_t bytes);

    std::shared_ptr<State> m_state;
    std::string m_deviceId;
    uint64_t m_bytes = 0;
};

// ═══════════════════════════════════════════════════════════
// ResourceManager
// ═══════════════════════════════════════════════════════════

/// Допуск: bytesInFlight + size <= budget, activeTransfers < maxConcurrent,
/// активных передач устройства < maxPerDevice.
class CC_API ResourceManager {
public:
    explicit ResourceManager(ResourceConfig config = {});
    ~ResourceManager();

    // Запрет копирования
    ResourceManager(const ResourceManager&) = delete;
    ResourceManager& operator=(const ResourceManager&) = delete;

    /// Допустить передачу
    /// @throws ProtocolError(ResourceExhausted) без какого-либо ввода-вывода
    ResourceGrant admit(const std::string& deviceId, uint64_t transferSize);

    /// То же без исключения
    std::optional<ResourceGrant> tryAdmit(const std::string& deviceId, uint64_t transferSize);

    MemoryStats stats() const;

    size_t activeForDevice(const std::string& deviceId) const;

    const ResourceConfig& config() const;

private:
    ResourceConfig m_config;
    std::shared_ptr<ResourceGrant::State> m_state;

    /// @return причина отказа или nullopt при успехе
    std::optional<std::string> reserve(const std::string& deviceId, uint64_t transferSize);
};

} // namespace CosmicConnect

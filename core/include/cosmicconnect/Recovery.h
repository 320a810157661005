// Recovery.h — Переподключение с экспоненциальной задержкой, очередь повторов,
// координатор восстановления между Connection Manager, Discovery и передачами

#pragma once

#include "export.h"
#include "Events.h"
#include "TransferTracker.h"
#include "Network/Packet.h"
#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace CosmicConnect {

// ═══════════════════════════════════════════════════════════
// ReconnectBackoff
// ═══════════════════════════════════════════════════════════

struct BackoffConfig {
    int64_t initialDelayMs = 1000;
    double factor = 2.0;
    int64_t maxDelayMs = 60000;
    double jitter = 0.2;                    // ±20 %
    int64_t stableResetMs = 10 * 60 * 1000; // Сброс после 10 мин стабильной связи
    size_t maxAttempts = 10;                // Подряд неудачных попыток до остановки
};

/// Задержки 1, 2, 4, 8, 16, 32, 60, 60 ... с, каждая ±jitter
class CC_API ReconnectBackoff {
public:
    explicit ReconnectBackoff(BackoffConfig config = {}, uint32_t seed = std::random_device{}());

    /// Следующая задержка (со случайным отклонением), счётчик попыток растёт
    std::chrono::milliseconds nextDelay();

    /// Задержка без jitter для попытки attempt (0 = первая)
    std::chrono::milliseconds nominalDelay(size_t attempt) const;

    void reset();

    size_t attempts() const { return m_attempt; }

    const BackoffConfig& config() const { return m_config; }

private:
    BackoffConfig m_config;
    size_t m_attempt = 0;
    std::mt19937 m_rng;
};

// ═══════════════════════════════════════════════════════════
// RetryQueue — пакеты, не ушедшие из-за Backpressure или разрыва
// ═══════════════════════════════════════════════════════════

struct RetryConfig {
    size_t maxRetries = 3;
    int retrySpacingMs = 500;
    size_t maxQueuedPerDevice = 64;
};

class CC_API RetryQueue {
public:
    using Clock = std::chrono::steady_clock;
    using Sender = std::function<void(const std::string& deviceId, const Packet& packet)>;

    explicit RetryQueue(RetryConfig config = {});

    /// @return false если очередь устройства переполнена
    bool enqueue(const std::string& deviceId, const Packet& packet, Clock::time_point now = Clock::now());

    /// Отправить готовые пакеты устройства по порядку.
    /// Неудачный пакет откладывается на retrySpacingMs и после maxRetries отбрасывается.
    /// @return отправлено пакетов
    size_t flush(const std::string& deviceId, const Sender& sender, Clock::time_point now = Clock::now());

    size_t size(const std::string& deviceId) const;
    size_t total() const;
    std::vector<std::string> devices() const;
    void clear(const std::string& deviceId);

private:
    struct Entry {
        Packet packet;
        size_t attempts = 0;
        Clock::time_point notBefore;
    };

    RetryConfig m_config;
    mutable std::mutex m_mutex;
    std::map<std::string, std::deque<Entry>> m_queues;
};

// ═══════════════════════════════════════════════════════════
// RecoveryCoordinator
// ═══════════════════════════════════════════════════════════

struct RecoveryConfig {
    BackoffConfig backoff;
    RetryConfig retry;
    int tickIntervalMs = 250;
    int64_t cleanupIntervalMs = 60 * 60 * 1000;
    int64_t transferMaxAgeMs = TRANSFER_STATE_MAX_AGE_MS;
};

class CC_API RecoveryCoordinator {
public:
    using Clock = std::chrono::steady_clock;

    /// Подключиться к устройству
    /// @throws ProtocolError при неудаче
    using Connector = std::function<void(const std::string& deviceId)>;

    /// Отправка пакета в сессию
    /// @throws ProtocolError(Backpressure | TransportUnavailable)
    using Sender = std::function<void(const std::string& deviceId, const Packet& packet)>;

    /// Нужно ли автоматически подключаться к устройству
    using ReconnectPolicy = std::function<bool(const std::string& deviceId)>;

    /// Устройство снова на связи: предложить возобновление передач
    using ResumeHandler = std::function<void(const std::string& deviceId)>;

    RecoveryCoordinator(RecoveryConfig config, std::shared_ptr<TransferTracker> transfers);
    ~RecoveryCoordinator();

    // Запрет копирования
    RecoveryCoordinator(const RecoveryCoordinator&) = delete;
    RecoveryCoordinator& operator=(const RecoveryCoordinator&) = delete;

    void setConnector(Connector connector);
    void setSender(Sender sender);
    void setReconnectPolicy(ReconnectPolicy policy);
    void setResumeHandler(ResumeHandler handler);

    /// Загрузить состояния передач и запустить таймер
    void start();
    void stop();
    bool isRunning() const;

    // ═══════════════════════════════════════════════════════════
    // События
    // ═══════════════════════════════════════════════════════════

    void handleConnectionEvent(const ConnectionEvent& event);
    void handleDiscoveryEvent(const DiscoveryEvent& event);

    /// Отправить или поставить в очередь повторов
    /// @return true если отправлено сразу
    /// @throws ProtocolError для ошибок, не подлежащих повтору
    bool sendOrQueue(const std::string& deviceId, const Packet& packet);

    /// Выполнить просроченные попытки (вызывается таймером; открыт для тестов)
    void tick(Clock::time_point now);

    // ═══════════════════════════════════════════════════════════
    // Состояние
    // ═══════════════════════════════════════════════════════════

    std::optional<Clock::time_point> nextAttempt(const std::string& deviceId) const;
    size_t failedAttempts(const std::string& deviceId) const;
    bool hasGivenUp(const std::string& deviceId) const;
    bool isConnected(const std::string& deviceId) const;
    size_t queuedPackets(const std::string& deviceId) const;

    TransferTracker& transfers();

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace CosmicConnect

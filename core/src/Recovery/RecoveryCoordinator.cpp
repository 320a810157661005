#include "cosmicconnect/Recovery.h"
#include "cosmicconnect/Error.h"
#include <spdlog/spdlog.h>
#include <atomic>
#include <condition_variable>
#include <map>
#include <set>
#include <thread>

namespace CosmicConnect {

using std::chrono::milliseconds;

// ═══════════════════════════════════════════════════════════
// Implementation
// ═══════════════════════════════════════════════════════════

class RecoveryCoordinator::Impl {
public:
    Impl(RecoveryConfig config, std::shared_ptr<TransferTracker> transfers)
        : m_config(config)
        , m_transfers(transfers ? std::move(transfers) : std::make_shared<TransferTracker>())
        , m_retry(config.retry) {}

    ~Impl() {
        stop();
    }

    void setConnector(Connector connector) {
        std::lock_guard<std::mutex> lock(m_callbackMutex);
        m_connector = std::move(connector);
    }

    void setSender(Sender sender) {
        std::lock_guard<std::mutex> lock(m_callbackMutex);
        m_sender = std::move(sender);
    }

    void setReconnectPolicy(ReconnectPolicy policy) {
        std::lock_guard<std::mutex> lock(m_callbackMutex);
        m_policy = std::move(policy);
    }

    void setResumeHandler(ResumeHandler handler) {
        std::lock_guard<std::mutex> lock(m_callbackMutex);
        m_resume = std::move(handler);
    }

    void start() {
        if (m_running) return;

        if (!m_transfers->load()) {
            spdlog::warn("RecoveryCoordinator: Starting without saved transfers: {}",
                         m_transfers->getLastError());
        }
        m_transfers->cleanup(m_config.transferMaxAgeMs);
        m_lastCleanup = Clock::now();

        m_running = true;
        m_timerThread = std::thread([this]() { timerLoop(); });
        spdlog::info("RecoveryCoordinator: Started");
    }

    void stop() {
        if (!m_running.exchange(false)) return;
        m_timerCv.notify_all();
        if (m_timerThread.joinable()) {
            m_timerThread.join();
        }
        spdlog::info("RecoveryCoordinator: Stopped");
    }

    bool isRunning() const { return m_running; }

    // ═══════════════════════════════════════════════════════════
    // Events
    // ═══════════════════════════════════════════════════════════

    void handleConnectionEvent(const ConnectionEvent& event) {
        auto now = Clock::now();

        switch (event.type) {
            case ConnectionEventType::Connected: {
                std::lock_guard<std::mutex> lock(m_mutex);
                auto& state = m_devices[event.deviceId];
                state.connected = true;
                state.connectedAt = now;
                state.nextAttempt.reset();
                state.failures = 0;
                state.givenUp = false;
                state.pendingResume = true;
                break;
            }

            case ConnectionEventType::Disconnected: {
                bool reconnect = shouldReconnectAfter(event.reason) && wantsConnection(event.deviceId);
                std::lock_guard<std::mutex> lock(m_mutex);
                auto& state = m_devices[event.deviceId];
                state.connected = false;
                state.pendingResume = false;

                if (state.connectedAt &&
                    now - *state.connectedAt >= milliseconds(m_config.backoff.stableResetMs)) {
                    state.backoff.reset();
                }
                state.connectedAt.reset();

                if (reconnect && !state.givenUp) {
                    scheduleLocked(event.deviceId, state, now);
                } else {
                    state.nextAttempt.reset();
                }
                break;
            }

            case ConnectionEventType::ManagerStopped: {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_devices.clear();
                break;
            }

            default:
                break;
        }

        if (event.type == ConnectionEventType::Connected) {
            m_timerCv.notify_all();
        }
    }

    void handleDiscoveryEvent(const DiscoveryEvent& event) {
        if (event.type != DiscoveryEventType::DeviceFound) return;
        const std::string& deviceId = event.info.deviceId.empty() ? event.deviceId : event.info.deviceId;
        if (deviceId.empty() || !wantsConnection(deviceId)) return;

        std::lock_guard<std::mutex> lock(m_mutex);
        auto& state = m_devices[deviceId];
        if (state.connected || state.inProgress) return;

        if (state.givenUp) {
            spdlog::info("RecoveryCoordinator: {} seen again, resuming reconnection", deviceId);
            state.givenUp = false;
            state.failures = 0;
            state.backoff.reset();
            state.nextAttempt = Clock::now();
        } else if (!state.nextAttempt) {
            state.nextAttempt = Clock::now();
        }
        m_timerCv.notify_all();
    }

    bool sendOrQueue(const std::string& deviceId, const Packet& packet) {
        Sender sender;
        {
            std::lock_guard<std::mutex> lock(m_callbackMutex);
            sender = m_sender;
        }
        if (!sender) {
            throw ProtocolError(ErrorKind::InvalidState, "no packet sender configured");
        }

        try {
            sender(deviceId, packet);
            return true;
        } catch (const ProtocolError& e) {
            if (e.kind() != ErrorKind::Backpressure && e.kind() != ErrorKind::TransportUnavailable) {
                throw;
            }
            spdlog::debug("RecoveryCoordinator: Queueing {} for {}: {}", packet.type, deviceId, e.what());
            if (!m_retry.enqueue(deviceId, packet)) {
                throw;
            }
            return false;
        }
    }

    // ═══════════════════════════════════════════════════════════
    // Timer
    // ═══════════════════════════════════════════════════════════

    void tick(Clock::time_point now) {
        Connector connector;
        Sender sender;
        ResumeHandler resume;
        {
            std::lock_guard<std::mutex> lock(m_callbackMutex);
            connector = m_connector;
            sender = m_sender;
            resume = m_resume;
        }

        std::vector<std::string> due;
        std::vector<std::string> resumable;
        std::set<std::string> connected;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            for (auto& [id, state] : m_devices) {
                if (state.connected) {
                    connected.insert(id);
                    if (state.pendingResume) {
                        state.pendingResume = false;
                        resumable.push_back(id);
                    }
                    continue;
                }
                if (state.nextAttempt && *state.nextAttempt <= now && !state.inProgress) {
                    state.inProgress = true;
                    state.nextAttempt.reset();
                    due.push_back(id);
                }
            }
        }

        for (const auto& id : due) {
            attemptReconnect(id, connector, now);
        }

        for (const auto& id : resumable) {
            if (resume) {
                try {
                    resume(id);
                } catch (const std::exception& e) {
                    spdlog::warn("RecoveryCoordinator: Resume for {} failed: {}", id, e.what());
                }
            }
        }

        if (sender) {
            for (const auto& id : m_retry.devices()) {
                if (connected.count(id) == 0) continue;
                size_t sent = m_retry.flush(id, sender, now);
                if (sent > 0) {
                    spdlog::debug("RecoveryCoordinator: Re-sent {} queued packets to {}", sent, id);
                }
            }
        }

        if (now - m_lastCleanup >= milliseconds(m_config.cleanupIntervalMs)) {
            m_lastCleanup = now;
            m_transfers->cleanup(m_config.transferMaxAgeMs);
        }
    }

    // ═══════════════════════════════════════════════════════════
    // State
    // ═══════════════════════════════════════════════════════════

    std::optional<Clock::time_point> nextAttempt(const std::string& deviceId) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_devices.find(deviceId);
        if (it == m_devices.end()) return std::nullopt;
        return it->second.nextAttempt;
    }

    size_t failedAttempts(const std::string& deviceId) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_devices.find(deviceId);
        return it == m_devices.end() ? 0 : it->second.failures;
    }

    bool hasGivenUp(const std::string& deviceId) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_devices.find(deviceId);
        return it != m_devices.end() && it->second.givenUp;
    }

    bool isConnected(const std::string& deviceId) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_devices.find(deviceId);
        return it != m_devices.end() && it->second.connected;
    }

    size_t queuedPackets(const std::string& deviceId) const {
        return m_retry.size(deviceId);
    }

    TransferTracker& transfers() { return *m_transfers; }

private:
    struct DeviceRecovery {
        explicit DeviceRecovery(const BackoffConfig& config) : backoff(config) {}

        ReconnectBackoff backoff;
        std::optional<Clock::time_point> nextAttempt;
        std::optional<Clock::time_point> connectedAt;
        size_t failures = 0;
        bool connected = false;
        bool inProgress = false;
        bool givenUp = false;
        bool pendingResume = false;
    };

    /// Карта с конструированием по конфигурации
    class DeviceMap {
    public:
        explicit DeviceMap(const BackoffConfig& config) : m_config(config) {}

        DeviceRecovery& operator[](const std::string& deviceId) {
            auto it = m_items.find(deviceId);
            if (it == m_items.end()) {
                it = m_items.emplace(deviceId, DeviceRecovery(m_config)).first;
            }
            return it->second;
        }

        using Items = std::map<std::string, DeviceRecovery>;

        Items::const_iterator find(const std::string& deviceId) const { return m_items.find(deviceId); }
        Items::const_iterator end() const { return m_items.end(); }
        Items::iterator begin() { return m_items.begin(); }
        Items::iterator end() { return m_items.end(); }
        void clear() { m_items.clear(); }

    private:
        BackoffConfig m_config;
        Items m_items;
    };

    RecoveryConfig m_config;
    std::shared_ptr<TransferTracker> m_transfers;
    RetryQueue m_retry;

    mutable std::mutex m_mutex;
    DeviceMap m_devices{m_config.backoff};

    std::mutex m_callbackMutex;
    Connector m_connector;
    Sender m_sender;
    ReconnectPolicy m_policy;
    ResumeHandler m_resume;

    std::atomic<bool> m_running{false};
    std::thread m_timerThread;
    std::mutex m_timerMutex;
    std::condition_variable m_timerCv;
    Clock::time_point m_lastCleanup;

    bool wantsConnection(const std::string& deviceId) {
        ReconnectPolicy policy;
        {
            std::lock_guard<std::mutex> lock(m_callbackMutex);
            policy = m_policy;
        }
        return policy ? policy(deviceId) : true;
    }

    void scheduleLocked(const std::string& deviceId, DeviceRecovery& state, Clock::time_point now) {
        auto delay = state.backoff.nextDelay();
        state.nextAttempt = now + delay;
        spdlog::info("RecoveryCoordinator: Reconnecting to {} in {} ms", deviceId, delay.count());
    }

    void attemptReconnect(const std::string& deviceId, const Connector& connector, Clock::time_point now) {
        std::string error;
        bool ok = false;
        if (!connector) {
            error = "no connector configured";
        } else {
            try {
                connector(deviceId);
                ok = true;
            } catch (const std::exception& e) {
                error = e.what();
            }
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        auto& state = m_devices[deviceId];
        state.inProgress = false;
        if (ok) {
            state.failures = 0;
            return;
        }

        ++state.failures;
        spdlog::warn("RecoveryCoordinator: Reconnect to {} failed ({}/{}): {}",
                     deviceId, state.failures, m_config.backoff.maxAttempts, error);
        if (state.failures >= m_config.backoff.maxAttempts) {
            state.givenUp = true;
            state.nextAttempt.reset();
            spdlog::warn("RecoveryCoordinator: Giving up on {} until it is discovered again", deviceId);
            return;
        }
        if (!state.connected) {
            scheduleLocked(deviceId, state, now);
        }
    }

    void timerLoop() {
        while (m_running) {
            {
                std::unique_lock<std::mutex> lock(m_timerMutex);
                m_timerCv.wait_for(lock, milliseconds(m_config.tickIntervalMs),
                                   [this]() { return !m_running; });
            }
            if (!m_running) break;

            try {
                tick(Clock::now());
            } catch (const std::exception& e) {
                spdlog::error("RecoveryCoordinator: Timer tick failed: {}", e.what());
            }
        }
    }
};

// ═══════════════════════════════════════════════════════════
// Public Interface
// ═══════════════════════════════════════════════════════════

RecoveryCoordinator::RecoveryCoordinator(RecoveryConfig config, std::shared_ptr<TransferTracker> transfers)
    : m_impl(std::make_unique<Impl>(config, std::move(transfers))) {}

RecoveryCoordinator::~RecoveryCoordinator() = default;

void RecoveryCoordinator::setConnector(Connector connector) {
    m_impl->setConnector(std::move(connector));
}

void RecoveryCoordinator::setSender(Sender sender) {
    m_impl->setSender(std::move(sender));
}

void RecoveryCoordinator::setReconnectPolicy(ReconnectPolicy policy) {
    m_impl->setReconnectPolicy(std::move(policy));
}

void RecoveryCoordinator::setResumeHandler(ResumeHandler handler) {
    m_impl->setResumeHandler(std::move(handler));
}

void RecoveryCoordinator::start() {
    m_impl->start();
}

void RecoveryCoordinator::stop() {
    m_impl->stop();
}

bool RecoveryCoordinator::isRunning() const {
    return m_impl->isRunning();
}

void RecoveryCoordinator::handleConnectionEvent(const ConnectionEvent& event) {
    m_impl->handleConnectionEvent(event);
}

void RecoveryCoordinator::handleDiscoveryEvent(const DiscoveryEvent& event) {
    m_impl->handleDiscoveryEvent(event);
}

bool RecoveryCoordinator::sendOrQueue(const std::string& deviceId, const Packet& packet) {
    return m_impl->sendOrQueue(deviceId, packet);
}

void RecoveryCoordinator::tick(Clock::time_point now) {
    m_impl->tick(now);
}

std::optional<RecoveryCoordinator::Clock::time_point>
RecoveryCoordinator::nextAttempt(const std::string& deviceId) const {
    return m_impl->nextAttempt(deviceId);
}

size_t RecoveryCoordinator::failedAttempts(const std::string& deviceId) const {
    return m_impl->failedAttempts(deviceId);
}

bool RecoveryCoordinator::hasGivenUp(const std::string& deviceId) const {
    return m_impl->hasGivenUp(deviceId);
}

bool RecoveryCoordinator::isConnected(const std::string& deviceId) const {
    return m_impl->isConnected(deviceId);
}

size_t RecoveryCoordinator::queuedPackets(const std::string& deviceId) const {
    return m_impl->queuedPackets(deviceId);
}

TransferTracker& RecoveryCoordinator::transfers() {
    return m_impl->transfers();
}

} // namespace CosmicConnect

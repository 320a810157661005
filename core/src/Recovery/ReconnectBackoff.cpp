#include "cosmicconnect/Recovery.h"
#include "cosmicconnect/Error.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

namespace CosmicConnect {

// ═══════════════════════════════════════════════════════════
// ReconnectBackoff
// ═══════════════════════════════════════════════════════════

ReconnectBackoff::ReconnectBackoff(BackoffConfig config, uint32_t seed)
    : m_config(config)
    , m_rng(seed) {}

std::chrono::milliseconds ReconnectBackoff::nominalDelay(size_t attempt) const {
    double delay = static_cast<double>(m_config.initialDelayMs) *
                   std::pow(m_config.factor, static_cast<double>(attempt));
    delay = std::min(delay, static_cast<double>(m_config.maxDelayMs));
    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

std::chrono::milliseconds ReconnectBackoff::nextDelay() {
    auto nominal = nominalDelay(m_attempt);
    ++m_attempt;

    if (m_config.jitter <= 0.0) {
        return nominal;
    }
    std::uniform_real_distribution<double> dist(1.0 - m_config.jitter, 1.0 + m_config.jitter);
    return std::chrono::milliseconds(static_cast<int64_t>(static_cast<double>(nominal.count()) * dist(m_rng)));
}

void ReconnectBackoff::reset() {
    m_attempt = 0;
}

// ═══════════════════════════════════════════════════════════
// RetryQueue
// ═══════════════════════════════════════════════════════════

RetryQueue::RetryQueue(RetryConfig config)
    : m_config(config) {}

bool RetryQueue::enqueue(const std::string& deviceId, const Packet& packet, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto& queue = m_queues[deviceId];
    if (queue.size() >= m_config.maxQueuedPerDevice) {
        spdlog::warn("RetryQueue: Queue for {} is full, dropping {}", deviceId, packet.type);
        return false;
    }
    queue.push_back(Entry{packet, 0, now});
    return true;
}

size_t RetryQueue::flush(const std::string& deviceId, const Sender& sender, Clock::time_point now) {
    size_t sent = 0;

    while (true) {
        Packet packet;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_queues.find(deviceId);
            if (it == m_queues.end() || it->second.empty()) break;
            if (it->second.front().notBefore > now) break;
            packet = it->second.front().packet;
        }

        bool ok = false;
        std::string error;
        try {
            sender(deviceId, packet);
            ok = true;
        } catch (const ProtocolError& e) {
            error = e.what();
        } catch (const std::exception& e) {
            error = std::string("sender failed: ") + e.what();
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_queues.find(deviceId);
        if (it == m_queues.end() || it->second.empty()) break;
        auto& front = it->second.front();

        if (ok) {
            it->second.pop_front();
            ++sent;
            continue;
        }

        ++front.attempts;
        if (front.attempts >= m_config.maxRetries) {
            spdlog::warn("RetryQueue: Giving up on {} to {} after {} retries: {}",
                         front.packet.type, deviceId, front.attempts, error);
            it->second.pop_front();
            continue;
        }
        front.notBefore = now + std::chrono::milliseconds(m_config.retrySpacingMs);
        // Порядок важнее: остальные ждут этот пакет
        break;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_queues.find(deviceId);
    if (it != m_queues.end() && it->second.empty()) {
        m_queues.erase(it);
    }
    return sent;
}

size_t RetryQueue::size(const std::string& deviceId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_queues.find(deviceId);
    return it == m_queues.end() ? 0 : it->second.size();
}

size_t RetryQueue::total() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t count = 0;
    for (const auto& [id, queue] : m_queues) {
        count += queue.size();
    }
    return count;
}

std::vector<std::string> RetryQueue::devices() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> result;
    for (const auto& [id, queue] : m_queues) {
        if (!queue.empty()) result.push_back(id);
    }
    return result;
}

void RetryQueue::clear(const std::string& deviceId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_queues.erase(deviceId);
}

} // namespace CosmicConnect

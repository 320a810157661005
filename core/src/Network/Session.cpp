// Session.cpp — read loop, write loop, keepalive

#include "cosmicconnect/Network/Session.h"
#include "cosmicconnect/Network/TlsStream.h"
#include "cosmicconnect/Error.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>

namespace CosmicConnect {

namespace {

std::atomic<uint64_t> g_nextSerial{1};

constexpr size_t READ_BUFFER_SIZE = 64 * 1024;
constexpr int DRAIN_TIMEOUT_MS = 2000;

int64_t toTicks(Session::Clock::time_point tp) {
    return tp.time_since_epoch().count();
}

Session::Clock::time_point fromTicks(int64_t ticks) {
    return Session::Clock::time_point(Session::Clock::duration(ticks));
}

/// Локальные причины: очередь дописывается перед закрытием
bool isGracefulReason(DisconnectReason reason) {
    return reason == DisconnectReason::LocalRequest ||
           reason == DisconnectReason::Unpaired ||
           reason == DisconnectReason::Shutdown;
}

DisconnectReason reasonForError(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidPacket:
        case ErrorKind::PacketSizeExceeded:
            return DisconnectReason::ProtocolViolation;
        default:
            return DisconnectReason::TransportUnavailable;
    }
}

} // anonymous namespace

// ═══════════════════════════════════════════════════════════
// Session::Impl
// ═══════════════════════════════════════════════════════════

class Session::Impl {
public:
    Impl(Session& owner, std::string deviceId, std::unique_ptr<Transport> stream,
         bool restricted, SessionConfig config)
        : m_owner(owner)
        , m_deviceId(std::move(deviceId))
        , m_serial(g_nextSerial++)
        , m_stream(std::move(stream))
        , m_tls(dynamic_cast<TlsStream*>(m_stream.get()))
        , m_restricted(restricted)
        , m_config(config) {
        auto now = toTicks(Clock::now());
        m_lastActivity = now;
        m_lastRead = now;
        m_remoteAddress = m_stream ? m_stream->remoteAddress() : std::string();
        m_open = m_stream && m_stream->isOpen();
    }

    ~Impl() {
        close(DisconnectReason::Shutdown, {});
        join();
    }

    void start(PacketHandler onPacket, CloseHandler onClose) {
        if (m_started.exchange(true)) return;

        m_onPacket = std::move(onPacket);
        m_onClose = std::move(onClose);

        if (!m_open) {
            spdlog::warn("Session: Starting closed session with {}", m_deviceId);
        }

        {
            std::lock_guard<std::mutex> joinLock(m_joinMutex);
            if (m_joined) return;
            m_readThread = std::thread([this]() { readLoop(); });
            m_writeThread = std::thread([this]() { writeLoop(); });
            m_idleThread = std::thread([this]() { idleLoop(); });
        }

        spdlog::info("Session: Started #{} with {} at {} ({}{})",
                     m_serial, m_deviceId, m_remoteAddress,
                     transportKindToString(m_stream->kind()),
                     m_restricted ? ", restricted" : "");
    }

    void send(const Packet& packet) {
        if (m_restricted && !packet.isType(PACKET_TYPE_IDENTITY) && !packet.isType(PACKET_TYPE_PAIR)) {
            throw ProtocolError(ErrorKind::Unauthorized,
                                "device " + m_deviceId + " is not paired, cannot send " + packet.type);
        }
        enqueue(packet);
    }

    void close(DisconnectReason reason, const std::string& message) {
        {
            std::lock_guard<std::mutex> lock(m_closeMutex);
            if (m_closeRequested) return;
            m_closeRequested = true;
            m_closeReason = reason;
            m_closeMessage = message;
        }

        {
            std::lock_guard<std::mutex> lock(m_queueMutex);
            m_open = false;
            m_graceful = m_started && isGracefulReason(reason);
        }

        if (!m_graceful && m_stream) {
            m_stream->close();
        }

        m_queueNotEmpty.notify_all();
        m_queueNotFull.notify_all();
        m_idleCv.notify_all();

        spdlog::debug("Session: Closing #{} with {} ({})", m_serial, m_deviceId,
                      disconnectReasonToString(reason));
    }

    void join() {
        // Повторный или параллельный join ждёт первого и ничего не делает
        std::lock_guard<std::mutex> joinLock(m_joinMutex);
        if (m_joined) return;

        auto self = std::this_thread::get_id();
        for (std::thread* thread : {&m_readThread, &m_writeThread, &m_idleThread}) {
            if (!thread->joinable()) continue;
            if (thread->get_id() == self) {
                thread->detach();
            } else {
                thread->join();
            }
        }

        m_joined = true;

        std::lock_guard<std::mutex> lock(m_pluginsMutex);
        m_plugins.shutdownAll();
    }

    bool isOpen() const { return m_open; }

    const std::string& deviceId() const { return m_deviceId; }
    uint64_t serial() const { return m_serial; }
    std::string remoteAddress() const { return m_remoteAddress; }
    TransportKind transportKind() const { return m_stream ? m_stream->kind() : TransportKind::Tcp; }
    TlsStream* tlsStream() const { return m_tls; }

    bool isRestricted() const { return m_restricted; }

    void setRestricted(bool restricted) {
        if (m_restricted.exchange(restricted) != restricted) {
            spdlog::info("Session: #{} with {} is now {}", m_serial, m_deviceId,
                         restricted ? "restricted" : "trusted");
        }
    }

    Clock::time_point lastActivity() const { return fromTicks(m_lastActivity); }

    size_t queuedPackets() const {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        return m_queue.size();
    }

    void setPlugins(PluginSet plugins) {
        PluginSet old;
        {
            std::lock_guard<std::mutex> lock(m_pluginsMutex);
            old = std::move(m_plugins);
            m_plugins = std::move(plugins);
        }
        old.shutdownAll();
    }

    size_t dispatchToPlugins(const Packet& packet, Device& device) {
        std::lock_guard<std::mutex> lock(m_pluginsMutex);
        return m_plugins.dispatch(packet, device);
    }

    Plugin* findPlugin(const std::string& name) const {
        std::lock_guard<std::mutex> lock(m_pluginsMutex);
        return m_plugins.find(name);
    }

private:
    Session& m_owner;
    std::string m_deviceId;
    uint64_t m_serial;
    std::unique_ptr<Transport> m_stream;
    TlsStream* m_tls;
    std::string m_remoteAddress;
    std::atomic<bool> m_restricted;
    SessionConfig m_config;

    std::atomic<bool> m_started{false};
    std::atomic<bool> m_open{false};

    std::mutex m_closeMutex;
    bool m_closeRequested = false;
    DisconnectReason m_closeReason = DisconnectReason::RemoteClosed;
    std::string m_closeMessage;

    // Исходящая очередь (готовые строки)
    mutable std::mutex m_queueMutex;
    std::condition_variable m_queueNotEmpty;
    std::condition_variable m_queueNotFull;
    std::deque<std::string> m_queue;
    bool m_graceful = false;
    bool m_writerDone = false;
    PacketIdGenerator m_ids;

    std::atomic<int64_t> m_lastActivity{0};
    std::atomic<int64_t> m_lastRead{0};

    std::mutex m_idleMutex;
    std::condition_variable m_idleCv;

    std::thread m_readThread;
    std::thread m_writeThread;
    std::thread m_idleThread;
    std::mutex m_joinMutex;
    bool m_joined = false;

    PacketHandler m_onPacket;
    CloseHandler m_onClose;

    mutable std::mutex m_pluginsMutex;
    PluginSet m_plugins;

    void touch() {
        m_lastActivity = toTicks(Clock::now());
    }

    void enqueue(const Packet& packet) {
        Packet outgoing = packet;

        std::unique_lock<std::mutex> lock(m_queueMutex);
        if (!m_open) {
            throw ProtocolError(ErrorKind::TransportUnavailable, "session with " + m_deviceId + " is closed");
        }

        bool ready = m_queueNotFull.wait_for(lock, std::chrono::milliseconds(m_config.sendTimeoutMs), [this]() {
            return !m_open || m_queue.size() < m_config.queueCapacity;
        });
        if (!m_open) {
            throw ProtocolError(ErrorKind::TransportUnavailable, "session with " + m_deviceId + " is closed");
        }
        if (!ready) {
            throw ProtocolError(ErrorKind::Backpressure,
                                "outbound queue for " + m_deviceId + " is full (" +
                                std::to_string(m_config.queueCapacity) + " packets)");
        }

        outgoing.id = m_ids.next();
        m_queue.push_back(PacketCodec::serialize(outgoing, m_config.maxLineSize));
        lock.unlock();

        m_queueNotEmpty.notify_one();
        spdlog::debug("Session: Queued {} for {}", outgoing.type, m_deviceId);
    }

    void readLoop() {
        LineReader reader(m_config.maxLineSize);
        std::vector<uint8_t> buffer(READ_BUFFER_SIZE);

        DisconnectReason reason = DisconnectReason::RemoteClosed;
        std::string message = "connection closed by peer";

        try {
            while (true) {
                size_t received = m_stream->read(buffer.data(), buffer.size());
                if (received == 0) {
                    break;
                }

                auto now = toTicks(Clock::now());
                m_lastRead = now;
                m_lastActivity = now;

                reader.feed(buffer.data(), received);
                std::string line;
                while (reader.nextLine(line)) {
                    if (line.empty() || line == "\r") continue;
                    handleLine(line);
                }
            }
        } catch (const ProtocolError& e) {
            reason = reasonForError(e.kind());
            message = e.what();
        } catch (const std::exception& e) {
            reason = DisconnectReason::TransportUnavailable;
            message = e.what();
        }

        close(reason, message);

        DisconnectReason finalReason;
        std::string finalMessage;
        {
            std::lock_guard<std::mutex> lock(m_closeMutex);
            finalReason = m_closeReason;
            finalMessage = m_closeMessage;
        }

        if (finalReason == DisconnectReason::ProtocolViolation ||
            finalReason == DisconnectReason::TransportUnavailable) {
            spdlog::error("Session: #{} with {} failed: {}", m_serial, m_deviceId, finalMessage);
        } else {
            spdlog::info("Session: #{} with {} closed ({})", m_serial, m_deviceId,
                         disconnectReasonToString(finalReason));
        }

        if (m_onClose) {
            try {
                m_onClose(m_owner, finalReason, finalMessage);
            } catch (const std::exception& e) {
                spdlog::warn("Session: Close handler for {} failed: {}", m_deviceId, e.what());
            }
        }
    }

    void handleLine(const std::string& line) {
        Packet packet;
        try {
            packet = PacketCodec::parse(line);
        } catch (const ProtocolError& e) {
            // Строка целая, следующий пакет разбирается нормально
            spdlog::warn("Session: Dropping malformed packet from {}: {}", m_deviceId, e.what());
            return;
        }

        spdlog::debug("Session: Received {} from {}", packet.type, m_deviceId);

        if (!m_onPacket) return;
        try {
            m_onPacket(m_owner, packet);
        } catch (const std::exception& e) {
            spdlog::warn("Session: Handler for {} from {} failed: {}", packet.type, m_deviceId, e.what());
        }
    }

    void writeLoop() {
        while (true) {
            std::string line;
            {
                std::unique_lock<std::mutex> lock(m_queueMutex);
                m_queueNotEmpty.wait(lock, [this]() { return !m_open || !m_queue.empty(); });
                if (!m_open) break;
                line = std::move(m_queue.front());
                m_queue.pop_front();
            }
            m_queueNotFull.notify_one();

            try {
                m_stream->writeAll(line);
                touch();
            } catch (const ProtocolError& e) {
                spdlog::warn("Session: Write to {} failed: {}", m_deviceId, e.what());
                close(DisconnectReason::TransportUnavailable, e.what());
                break;
            }
        }

        drainOnClose();

        {
            std::lock_guard<std::mutex> lock(m_queueMutex);
            m_writerDone = true;
        }
        m_idleCv.notify_all();
    }

    void drainOnClose() {
        std::deque<std::string> remaining;
        bool graceful;
        {
            std::lock_guard<std::mutex> lock(m_queueMutex);
            remaining.swap(m_queue);
            graceful = m_graceful;
        }
        m_queueNotFull.notify_all();

        if (graceful) {
            try {
                for (const auto& line : remaining) {
                    m_stream->writeAll(line);
                }
            } catch (const ProtocolError& e) {
                spdlog::debug("Session: Drain to {} stopped: {}", m_deviceId, e.what());
            }
            m_stream->close();
        } else if (!remaining.empty()) {
            spdlog::debug("Session: Dropped {} queued packets for {}", remaining.size(), m_deviceId);
        }
    }

    void idleLoop() {
        const int shortest = std::min(m_config.idleTimeoutMs, m_config.pingTimeoutMs);
        const auto tick = std::chrono::milliseconds(std::max(10, std::min(1000, shortest / 4)));

        bool pingOutstanding = false;
        Clock::time_point pingSentAt;

        while (m_open) {
            {
                std::unique_lock<std::mutex> lock(m_idleMutex);
                m_idleCv.wait_for(lock, tick, [this]() { return !m_open.load(); });
            }
            if (!m_open) break;

            // Ограниченная сессия ждёт pairing: ping пир всё равно отбросит
            if (m_restricted) {
                pingOutstanding = false;
                continue;
            }

            auto now = Clock::now();
            if (pingOutstanding) {
                if (fromTicks(m_lastRead) > pingSentAt) {
                    pingOutstanding = false;
                } else if (now - pingSentAt >= std::chrono::milliseconds(m_config.pingTimeoutMs)) {
                    spdlog::warn("Session: {} did not answer keepalive", m_deviceId);
                    close(DisconnectReason::IdleTimeout, "no response to keepalive");
                    break;
                }
            }

            if (!pingOutstanding &&
                now - fromTicks(m_lastActivity) >= std::chrono::milliseconds(m_config.idleTimeoutMs)) {
                try {
                    enqueue(Packet::ping());
                    pingOutstanding = true;
                    pingSentAt = now;
                    spdlog::debug("Session: Keepalive to {}", m_deviceId);
                } catch (const ProtocolError& e) {
                    spdlog::debug("Session: Keepalive to {} not queued: {}", m_deviceId, e.what());
                }
            }
        }

        // Писатель дописывает очередь; затем поток закрывается принудительно
        {
            std::unique_lock<std::mutex> lock(m_idleMutex);
            m_idleCv.wait_for(lock, std::chrono::milliseconds(DRAIN_TIMEOUT_MS), [this]() {
                std::lock_guard<std::mutex> queueLock(m_queueMutex);
                return m_writerDone;
            });
        }
        m_stream->close();
    }
};

// ═══════════════════════════════════════════════════════════
// Session Public Interface
// ═══════════════════════════════════════════════════════════

Session::Session(std::string deviceId, std::unique_ptr<Transport> stream,
                 bool restricted, SessionConfig config)
    : m_impl(std::make_unique<Impl>(*this, std::move(deviceId), std::move(stream), restricted, config)) {}

Session::~Session() = default;

void Session::start(PacketHandler onPacket, CloseHandler onClose) {
    m_impl->start(std::move(onPacket), std::move(onClose));
}

void Session::send(const Packet& packet) {
    m_impl->send(packet);
}

void Session::close(DisconnectReason reason, const std::string& message) {
    m_impl->close(reason, message);
}

void Session::join() {
    m_impl->join();
}

bool Session::isOpen() const {
    return m_impl->isOpen();
}

const std::string& Session::deviceId() const {
    return m_impl->deviceId();
}

uint64_t Session::serial() const {
    return m_impl->serial();
}

std::string Session::remoteAddress() const {
    return m_impl->remoteAddress();
}

TransportKind Session::transportKind() const {
    return m_impl->transportKind();
}

TlsStream* Session::tlsStream() const {
    return m_impl->tlsStream();
}

bool Session::isRestricted() const {
    return m_impl->isRestricted();
}

void Session::setRestricted(bool restricted) {
    m_impl->setRestricted(restricted);
}

Session::Clock::time_point Session::lastActivity() const {
    return m_impl->lastActivity();
}

size_t Session::queuedPackets() const {
    return m_impl->queuedPackets();
}

void Session::setPlugins(PluginSet plugins) {
    m_impl->setPlugins(std::move(plugins));
}

size_t Session::dispatchToPlugins(const Packet& packet, Device& device) {
    return m_impl->dispatchToPlugins(packet, device);
}

Plugin* Session::findPlugin(const std::string& name) const {
    return m_impl->findPlugin(name);
}

} // namespace CosmicConnect

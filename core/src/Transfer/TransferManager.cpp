#include "cosmicconnect/TransferManager.h"
#include "cosmicconnect/TransferTracker.h"
#include "cosmicconnect/Network/ConnectionManager.h"
#include "cosmicconnect/Network/PayloadChannel.h"
#include "cosmicconnect/Network/TlsStream.h"
#include "cosmicconnect/Certificate.h"
#include "cosmicconnect/Error.h"
#include <spdlog/spdlog.h>
#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <list>
#include <mutex>
#include <set>
#include <thread>

namespace CosmicConnect {

namespace fs = std::filesystem;

const char* transferStatusToString(TransferStatus status) {
    switch (status) {
        case TransferStatus::Pending: return "pending";
        case TransferStatus::InProgress: return "in_progress";
        case TransferStatus::Completed: return "completed";
        case TransferStatus::Failed: return "failed";
    }
    return "unknown";
}

namespace {

/// Только имя файла, без каталогов пира
std::string sanitizeFilename(const std::string& name) {
    std::string base = fs::path(name).filename().string();
    if (base.empty() || base == "." || base == "..") {
        return "unnamed";
    }
    return base;
}

/// "name.ext", затем "name (1).ext", "name (2).ext" ...
std::string uniquePath(const std::string& dir, const std::string& filename) {
    fs::path candidate = fs::path(dir) / filename;
    std::error_code ec;
    if (!fs::exists(candidate, ec)) {
        return candidate.string();
    }

    fs::path base(filename);
    std::string stem = base.stem().string();
    std::string ext = base.extension().string();
    for (int i = 1; i < 10000; ++i) {
        candidate = fs::path(dir) / (stem + " (" + std::to_string(i) + ")" + ext);
        if (!fs::exists(candidate, ec)) {
            return candidate.string();
        }
    }
    return (fs::path(dir) / (stem + "-" + Crypto::generateUUID() + ext)).string();
}

uint64_t fileSizeOrZero(const std::string& path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    return ec ? 0 : static_cast<uint64_t>(size);
}

} // anonymous namespace

// ═══════════════════════════════════════════════════════════
// Implementation
// ═══════════════════════════════════════════════════════════

class TransferManager::Impl {
public:
    Impl(TransferConfig config,
         std::shared_ptr<ConnectionManager> connections,
         std::shared_ptr<TransferTracker> tracker)
        : m_config(std::move(config))
        , m_connections(std::move(connections))
        , m_tracker(tracker ? std::move(tracker) : std::make_shared<TransferTracker>()) {
        if (m_config.downloadDir.empty()) {
            m_config.downloadDir = fs::temp_directory_path().string();
        }
    }

    ~Impl() {
        stop();
    }

    // ═══════════════════════════════════════════════════════════
    // Sender
    // ═══════════════════════════════════════════════════════════

    std::string sendFile(const std::string& deviceId, const std::string& path) {
        std::error_code ec;
        if (!fs::is_regular_file(path, ec)) {
            throw ProtocolError(ErrorKind::NotFound, "no such file: " + path);
        }
        auto size = static_cast<uint64_t>(fs::file_size(path, ec));
        if (ec) {
            throw ProtocolError(ErrorKind::Io, "cannot stat " + path + ": " + ec.message());
        }

        TransferState state;
        state.transferId = Crypto::generateUUID();
        state.deviceId = deviceId;
        state.filename = sanitizeFilename(path);
        state.localPath = fs::absolute(path, ec).string();
        state.bytesTotal = size;
        state.direction = TransferDirection::Send;
        state.startedAt = nowUnixMs();

        m_tracker->begin(state);
        try {
            startUpload(state, 0);
        } catch (const ProtocolError&) {
            m_tracker->remove(state.transferId);
            throw;
        }

        spdlog::info("TransferManager: Sending {} ({} bytes) to {} as {}",
                     state.filename, size, deviceId, state.transferId);
        return state.transferId;
    }

    void resumeTransfers(const std::string& deviceId) {
        for (const auto& state : m_tracker->forDevice(deviceId, TransferDirection::Send)) {
            if (isActive(state.transferId)) continue;

            Packet offer(PACKET_TYPE_TRANSFER_RESUME, {
                {"transferId", state.transferId},
                {"offset", state.bytesTransferred}
            });
            try {
                m_connections->send(deviceId, offer);
                spdlog::info("TransferManager: Offering to resume {} at {} of {} bytes",
                             state.transferId, state.bytesTransferred, state.bytesTotal);
            } catch (const ProtocolError& e) {
                spdlog::warn("TransferManager: Cannot offer resume of {}: {}", state.transferId, e.what());
            }
        }
    }

    // ═══════════════════════════════════════════════════════════
    // Incoming packets
    // ═══════════════════════════════════════════════════════════

    void handlePacket(const std::string& deviceId, const Packet& packet) {
        if (packet.isType(PACKET_TYPE_SHARE_REQUEST)) {
            handleShareRequest(deviceId, packet);
        } else if (packet.isType(PACKET_TYPE_TRANSFER_RESUME)) {
            handleResumeOffer(deviceId, packet);
        } else if (packet.isType(PACKET_TYPE_TRANSFER_RESUME_ACK)) {
            handleResumeAck(deviceId, packet);
        }
    }

    void setEventCallback(TransferCallback callback) {
        std::lock_guard<std::mutex> lock(m_callbackMutex);
        m_callback = std::move(callback);
    }

    void stop() {
        m_stopping = true;
        std::list<Worker> workers;
        {
            std::lock_guard<std::mutex> lock(m_workersMutex);
            workers.swap(m_workers);
        }
        for (auto& worker : workers) {
            if (worker.thread.joinable()) worker.thread.join();
        }
    }

    size_t activeTransfers() const {
        std::lock_guard<std::mutex> lock(m_activeMutex);
        return m_active.size();
    }

    bool waitIdle(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(m_activeMutex);
        return m_idleCv.wait_for(lock, timeout, [this]() { return m_active.empty(); });
    }

    const std::string& downloadDir() const { return m_config.downloadDir; }

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    TransferConfig m_config;
    std::shared_ptr<ConnectionManager> m_connections;
    std::shared_ptr<TransferTracker> m_tracker;

    std::atomic<bool> m_stopping{false};

    std::mutex m_workersMutex;
    std::list<Worker> m_workers;

    mutable std::mutex m_activeMutex;
    std::set<std::string> m_active;
    std::condition_variable m_idleCv;

    std::mutex m_callbackMutex;
    TransferCallback m_callback;

    bool isActive(const std::string& transferId) const {
        std::lock_guard<std::mutex> lock(m_activeMutex);
        return m_active.count(transferId) > 0;
    }

    bool markActive(const std::string& transferId) {
        std::lock_guard<std::mutex> lock(m_activeMutex);
        return m_active.insert(transferId).second;
    }

    void markInactive(const std::string& transferId) {
        {
            std::lock_guard<std::mutex> lock(m_activeMutex);
            m_active.erase(transferId);
        }
        m_idleCv.notify_all();
    }

    void notify(const TransferState& state, TransferStatus status, const std::string& error = {}) {
        TransferCallback callback;
        {
            std::lock_guard<std::mutex> lock(m_callbackMutex);
            callback = m_callback;
        }
        if (callback) {
            callback(state, status, error);
        }
    }

    void spawn(std::function<void()> body) {
        auto done = std::make_shared<std::atomic<bool>>(false);
        std::thread thread([body = std::move(body), done]() {
            body();
            done->store(true);
        });

        std::list<Worker> finished;
        {
            std::lock_guard<std::mutex> lock(m_workersMutex);
            for (auto it = m_workers.begin(); it != m_workers.end(); ) {
                if (it->done->load()) {
                    finished.splice(finished.end(), m_workers, it++);
                } else {
                    ++it;
                }
            }
            m_workers.push_back(Worker{std::move(thread), done});
        }
        for (auto& worker : finished) {
            if (worker.thread.joinable()) worker.thread.join();
        }
    }

    /// Допуск + порт + пакет (синхронно), передача (в рабочем потоке)
    void startUpload(const TransferState& state, uint64_t offset) {
        if (m_stopping) {
            throw ProtocolError(ErrorKind::InvalidState, "transfer manager is stopping");
        }
        if (!markActive(state.transferId)) {
            throw ProtocolError(ErrorKind::InvalidState, "transfer " + state.transferId + " is already running");
        }

        Packet packet(PACKET_TYPE_SHARE_REQUEST, {
            {"filename", state.filename},
            {"transferId", state.transferId},
            {"totalSize", state.bytesTotal},
            {"offset", offset}
        });

        std::shared_ptr<PayloadUpload> upload;
        try {
            upload = std::make_shared<PayloadUpload>(
                m_connections->sendWithPayload(state.deviceId, packet, state.bytesTotal - offset));
        } catch (const ProtocolError&) {
            markInactive(state.transferId);
            throw;
        }

        if (offset > 0) {
            m_tracker->update(state.transferId, offset);
        }
        notify(state, TransferStatus::Pending);

        spawn([this, state, offset, upload]() { sendWorker(state, offset, *upload); });
    }

    void sendWorker(TransferState state, uint64_t offset, PayloadUpload& upload) {
        try {
            auto stream = m_connections->acceptPayload(upload);
            stream->setReadTimeout(std::chrono::milliseconds(PAYLOAD_TIMEOUT_MS));

            std::ifstream source(state.localPath, std::ios::binary);
            if (!source) {
                throw ProtocolError(ErrorKind::NotFound, "cannot open " + state.localPath);
            }
            source.seekg(static_cast<std::streamoff>(offset));

            notify(state, TransferStatus::InProgress);
            auto lastNotify = std::chrono::steady_clock::now();
            PayloadChannel::send(*stream, source, upload.size, [&](uint64_t sent) {
                state.bytesTransferred = offset + sent;
                m_tracker->update(state.transferId, state.bytesTransferred);
                auto now = std::chrono::steady_clock::now();
                if (now - lastNotify >= std::chrono::milliseconds(m_config.progressIntervalMs)) {
                    lastNotify = now;
                    notify(state, TransferStatus::InProgress);
                }
            }, &m_stopping);
            stream->close();

            upload.grant.release();
            m_tracker->complete(state.transferId);
            markInactive(state.transferId);
            spdlog::info("TransferManager: Sent {} to {}", state.filename, state.deviceId);
            notify(state, TransferStatus::Completed);
        } catch (const std::exception& e) {
            // Состояние остаётся в трекере для возобновления
            upload.grant.release();
            markInactive(state.transferId);
            spdlog::error("TransferManager: Sending {} to {} failed at {} bytes: {}",
                          state.filename, state.deviceId, state.bytesTransferred, e.what());
            notify(state, TransferStatus::Failed, e.what());
        }
    }

    // ═══════════════════════════════════════════════════════════
    // Receiver
    // ═══════════════════════════════════════════════════════════

    std::string partialPath(const std::string& transferId) const {
        return (fs::path(m_config.downloadDir) / (transferId + ".part")).string();
    }

    void handleShareRequest(const std::string& deviceId, const Packet& packet) {
        if (!packet.hasPayload()) {
            if (packet.body.contains("text") || packet.body.contains("url")) {
                spdlog::info("TransferManager: {} shared {}", deviceId,
                             packet.body.contains("url") ? "a URL" : "text");
            } else {
                spdlog::warn("TransferManager: Share request from {} without payload", deviceId);
            }
            return;
        }

        const auto& body = packet.body;
        std::string transferId = body.value("transferId", "");
        if (transferId.empty()) {
            transferId = Crypto::generateUUID();
        }
        uint64_t offset = body.value("offset", uint64_t{0});
        uint64_t payloadSize = (packet.payloadSize && *packet.payloadSize > 0)
            ? static_cast<uint64_t>(*packet.payloadSize) : 0;

        TransferState state;
        auto existing = m_tracker->get(transferId);
        if (offset > 0) {
            if (!existing || existing->deviceId != deviceId ||
                existing->direction != TransferDirection::Receive ||
                existing->bytesTransferred < offset || fileSizeOrZero(existing->localPath) < offset) {
                spdlog::warn("TransferManager: Cannot resume {} from {} at {}, no matching partial file",
                             transferId, deviceId, offset);
                return;
            }
            state = *existing;
        } else {
            state.transferId = transferId;
            state.deviceId = deviceId;
            state.filename = sanitizeFilename(body.value("filename", "unnamed"));
            state.localPath = partialPath(transferId);
            state.bytesTotal = body.value("totalSize", payloadSize);
            state.direction = TransferDirection::Receive;
            state.startedAt = nowUnixMs();
            m_tracker->begin(state);
        }

        if (!markActive(transferId)) {
            spdlog::warn("TransferManager: Transfer {} already running", transferId);
            return;
        }
        state.bytesTransferred = offset;
        notify(state, TransferStatus::Pending);

        spawn([this, deviceId, packet, state, offset]() { receiveWorker(deviceId, packet, state, offset); });
    }

    void receiveWorker(const std::string& deviceId, const Packet& packet, TransferState state, uint64_t offset) {
        try {
            auto download = m_connections->openPayload(deviceId, packet);
            download.stream->setReadTimeout(std::chrono::milliseconds(PAYLOAD_TIMEOUT_MS));

            std::error_code ec;
            fs::create_directories(m_config.downloadDir, ec);

            std::ofstream sink;
            if (offset == 0) {
                sink.open(state.localPath, std::ios::binary | std::ios::trunc);
            } else {
                fs::resize_file(state.localPath, offset, ec);
                if (ec) {
                    throw ProtocolError(ErrorKind::Io, "cannot truncate " + state.localPath + ": " + ec.message());
                }
                sink.open(state.localPath, std::ios::binary | std::ios::app);
            }
            if (!sink) {
                throw ProtocolError(ErrorKind::Io, "cannot open " + state.localPath);
            }

            notify(state, TransferStatus::InProgress);
            auto lastNotify = std::chrono::steady_clock::now();
            PayloadChannel::receive(*download.stream, sink, download.size, [&](uint64_t received) {
                state.bytesTransferred = offset + received;
                m_tracker->update(state.transferId, state.bytesTransferred);
                auto now = std::chrono::steady_clock::now();
                if (now - lastNotify >= std::chrono::milliseconds(m_config.progressIntervalMs)) {
                    lastNotify = now;
                    notify(state, TransferStatus::InProgress);
                }
            }, &m_stopping);
            sink.close();
            download.stream->close();
            download.grant.release();

            std::string finalPath = uniquePath(m_config.downloadDir, state.filename);
            fs::rename(state.localPath, finalPath, ec);
            if (ec) {
                throw ProtocolError(ErrorKind::Io, "cannot move " + state.localPath + " to " +
                                    finalPath + ": " + ec.message());
            }

            m_tracker->complete(state.transferId);
            markInactive(state.transferId);
            state.localPath = finalPath;
            spdlog::info("TransferManager: Received {} from {} ({} bytes)",
                         finalPath, deviceId, state.bytesTransferred);
            notify(state, TransferStatus::Completed);
        } catch (const std::exception& e) {
            markInactive(state.transferId);
            spdlog::error("TransferManager: Receiving {} from {} failed at {} bytes: {}",
                          state.filename, deviceId, state.bytesTransferred, e.what());
            notify(state, TransferStatus::Failed, e.what());
        }
    }

    void handleResumeOffer(const std::string& deviceId, const Packet& packet) {
        std::string transferId = packet.body.value("transferId", "");
        uint64_t offered = packet.body.value("offset", uint64_t{0});
        if (transferId.empty()) return;

        uint64_t ack = 0;
        auto state = m_tracker->get(transferId);
        if (state && state->deviceId == deviceId && state->direction == TransferDirection::Receive &&
            !isActive(transferId)) {
            uint64_t have = std::min(state->bytesTransferred, fileSizeOrZero(state->localPath));
            ack = std::min(have, offered);
            if (ack == 0) {
                m_tracker->remove(transferId);
            }
        }

        spdlog::info("TransferManager: {} offers to resume {} at {}, acknowledging {}",
                     deviceId, transferId, offered, ack);
        m_connections->send(deviceId, Packet(PACKET_TYPE_TRANSFER_RESUME_ACK, {
            {"transferId", transferId},
            {"offset", ack}
        }));
    }

    void handleResumeAck(const std::string& deviceId, const Packet& packet) {
        std::string transferId = packet.body.value("transferId", "");
        uint64_t ack = packet.body.value("offset", uint64_t{0});

        auto state = m_tracker->get(transferId);
        if (!state || state->deviceId != deviceId || state->direction != TransferDirection::Send) {
            spdlog::debug("TransferManager: Ignoring resume ack for unknown transfer {}", transferId);
            return;
        }

        uint64_t offset = std::min(ack, state->bytesTransferred);
        if (offset == 0) {
            state->bytesTransferred = 0;
        }
        try {
            startUpload(*state, offset);
            spdlog::info("TransferManager: Resuming {} to {} from {} bytes", state->filename, deviceId, offset);
        } catch (const ProtocolError& e) {
            spdlog::warn("TransferManager: Cannot resume {}: {}", transferId, e.what());
            notify(*state, TransferStatus::Failed, e.what());
        }
    }
};

// ═══════════════════════════════════════════════════════════
// Public Interface
// ═══════════════════════════════════════════════════════════

TransferManager::TransferManager(TransferConfig config,
                                 std::shared_ptr<ConnectionManager> connections,
                                 std::shared_ptr<TransferTracker> tracker)
    : m_impl(std::make_unique<Impl>(std::move(config), std::move(connections), std::move(tracker))) {}

TransferManager::~TransferManager() = default;

std::string TransferManager::sendFile(const std::string& deviceId, const std::string& path) {
    return m_impl->sendFile(deviceId, path);
}

void TransferManager::handlePacket(const std::string& deviceId, const Packet& packet) {
    m_impl->handlePacket(deviceId, packet);
}

void TransferManager::resumeTransfers(const std::string& deviceId) {
    m_impl->resumeTransfers(deviceId);
}

void TransferManager::setEventCallback(TransferCallback callback) {
    m_impl->setEventCallback(std::move(callback));
}

void TransferManager::stop() {
    m_impl->stop();
}

size_t TransferManager::activeTransfers() const {
    return m_impl->activeTransfers();
}

bool TransferManager::waitIdle(std::chrono::milliseconds timeout) {
    return m_impl->waitIdle(timeout);
}

const std::string& TransferManager::downloadDir() const {
    return m_impl->downloadDir();
}

} // namespace CosmicConnect

// TransferTracker.cpp — recovery_state.json

#include "cosmicconnect/TransferTracker.h"
#include "../Core/FileUtil.h"
#include <spdlog/spdlog.h>

namespace CosmicConnect {

using json = nlohmann::json;

json TransferTracker::toJson(const TransferState& state) {
    return json{
        {"transfer_id", state.transferId},
        {"device_id", state.deviceId},
        {"filename", state.filename},
        {"local_path", state.localPath},
        {"bytes_total", state.bytesTotal},
        {"bytes_transferred", state.bytesTransferred},
        {"direction", transferDirectionToString(state.direction)},
        {"started_at", state.startedAt},
        {"last_update", state.lastUpdate}
    };
}

std::optional<TransferState> TransferTracker::fromJson(const json& j) {
    if (!j.is_object()) return std::nullopt;

    try {
        TransferState state;
        state.transferId = j.at("transfer_id").get<std::string>();
        state.deviceId = j.at("device_id").get<std::string>();
        if (state.transferId.empty() || state.deviceId.empty()) {
            return std::nullopt;
        }
        state.filename = j.value("filename", "");
        state.localPath = j.value("local_path", "");
        state.bytesTotal = j.value("bytes_total", uint64_t{0});
        state.bytesTransferred = j.value("bytes_transferred", uint64_t{0});
        state.direction = transferDirectionFromString(j.value("direction", "send"));
        state.startedAt = j.value("started_at", int64_t{0});
        state.lastUpdate = j.value("last_update", state.startedAt);
        return state;
    } catch (const json::exception& e) {
        spdlog::debug("TransferTracker: Malformed record: {}", e.what());
        return std::nullopt;
    }
}

TransferTracker::TransferTracker(std::string path)
    : m_path(std::move(path)) {}

bool TransferTracker::load() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_states.clear();

    if (m_path.empty()) return true;

    auto content = FileUtil::readFile(m_path);
    if (!content) {
        return true;
    }

    try {
        json root = json::parse(*content);
        const json& items = root.is_object() ? root.value("transfers", json::array()) : root;
        if (!items.is_array()) {
            m_lastError = "recovery state has no transfer list";
            spdlog::error("TransferTracker: {}", m_lastError);
            return false;
        }
        for (const auto& item : items) {
            auto state = fromJson(item);
            if (!state) {
                spdlog::warn("TransferTracker: Skipping malformed transfer state");
                continue;
            }
            m_states[state->transferId] = std::move(*state);
        }
    } catch (const json::exception& e) {
        m_lastError = std::string("Failed to parse recovery state: ") + e.what();
        spdlog::error("TransferTracker: {}", m_lastError);
        return false;
    }

    spdlog::info("TransferTracker: Loaded {} unfinished transfers", m_states.size());
    return true;
}

void TransferTracker::begin(const TransferState& state) {
    std::lock_guard<std::mutex> lock(m_mutex);
    TransferState copy = state;
    if (copy.startedAt == 0) copy.startedAt = nowUnixMs();
    copy.lastUpdate = nowUnixMs();
    m_states[copy.transferId] = std::move(copy);
    saveLocked();
}

bool TransferTracker::update(const std::string& transferId, uint64_t bytesTransferred) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_states.find(transferId);
    if (it == m_states.end()) return false;
    it->second.bytesTransferred = bytesTransferred;
    it->second.lastUpdate = nowUnixMs();
    return saveLocked();
}

bool TransferTracker::complete(const std::string& transferId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_states.erase(transferId) == 0) return false;
    return saveLocked();
}

bool TransferTracker::remove(const std::string& transferId) {
    return complete(transferId);
}

std::optional<TransferState> TransferTracker::get(const std::string& transferId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_states.find(transferId);
    if (it == m_states.end()) return std::nullopt;
    return it->second;
}

std::vector<TransferState> TransferTracker::forDevice(const std::string& deviceId,
                                                      std::optional<TransferDirection> direction) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<TransferState> result;
    for (const auto& [id, state] : m_states) {
        if (state.deviceId != deviceId) continue;
        if (direction && state.direction != *direction) continue;
        result.push_back(state);
    }
    return result;
}

std::vector<TransferState> TransferTracker::list() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<TransferState> result;
    result.reserve(m_states.size());
    for (const auto& [id, state] : m_states) {
        result.push_back(state);
    }
    return result;
}

size_t TransferTracker::cleanup(int64_t maxAgeMs, int64_t nowMs) {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t removed = 0;
    for (auto it = m_states.begin(); it != m_states.end(); ) {
        if (nowMs - it->second.lastUpdate > maxAgeMs) {
            spdlog::info("TransferTracker: Discarding stale transfer {} ({})",
                         it->first, it->second.filename);
            it = m_states.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        saveLocked();
    }
    return removed;
}

std::string TransferTracker::getLastError() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lastError;
}

bool TransferTracker::saveLocked() {
    if (m_path.empty()) return true;

    json items = json::array();
    for (const auto& [id, state] : m_states) {
        items.push_back(toJson(state));
    }
    json root = {{"version", 1}, {"transfers", items}};

    std::string error;
    if (!FileUtil::writeFileAtomic(m_path, root.dump(2), true, &error)) {
        m_lastError = error;
        spdlog::error("TransferTracker: {}", error);
        return false;
    }
    return true;
}

} // namespace CosmicConnect

// TrustedPeerStore.cpp — trusted_peers.json

#include "cosmicconnect/TrustedPeerStore.h"
#include "cosmicconnect/Certificate.h"
#include "../Core/FileUtil.h"
#include <spdlog/spdlog.h>
#include <map>
#include <mutex>

namespace CosmicConnect {

using json = nlohmann::json;

// ═══════════════════════════════════════════════════════════
// JSON
// ═══════════════════════════════════════════════════════════

json TrustedPeerStore::toJson(const TrustedPeerRecord& record) {
    return json{
        {"device_id", record.deviceId},
        {"name", record.name},
        {"device_type", deviceTypeToString(record.deviceType)},
        {"cert_der_b64", Crypto::base64Encode(record.certificateDer)},
        {"fingerprint_hex", record.fingerprintSha256},
        {"first_paired_at", record.firstPairedAt},
        {"last_seen_at", record.lastSeenAt}
    };
}

std::optional<TrustedPeerRecord> TrustedPeerStore::fromJson(const json& j) {
    if (!j.is_object() || !j.contains("device_id") || !j["device_id"].is_string() ||
        !j.contains("cert_der_b64") || !j["cert_der_b64"].is_string()) {
        return std::nullopt;
    }

    auto der = Crypto::base64Decode(j["cert_der_b64"].get<std::string>());
    if (!der || der->empty()) {
        return std::nullopt;
    }

    TrustedPeerRecord record;
    record.deviceId = j["device_id"].get<std::string>();
    if (record.deviceId.empty()) {
        return std::nullopt;
    }
    record.name = j.value("name", "");
    record.deviceType = deviceTypeFromString(j.value("device_type", "unknown"));
    record.certificateDer = std::move(*der);
    record.fingerprintSha256 = j.value("fingerprint_hex", "");
    record.firstPairedAt = j.value("first_paired_at", int64_t{0});
    record.lastSeenAt = j.value("last_seen_at", int64_t{0});

    // Отпечаток всегда пересчитывается из DER
    std::string computed = Crypto::fingerprint(record.certificateDer);
    if (!record.fingerprintSha256.empty() && record.fingerprintSha256 != computed) {
        spdlog::warn("TrustedPeerStore: Stored fingerprint for {} does not match certificate", record.deviceId);
    }
    record.fingerprintSha256 = computed;
    return record;
}

// ═══════════════════════════════════════════════════════════
// TrustedPeerStore::Impl
// ═══════════════════════════════════════════════════════════

class TrustedPeerStore::Impl {
public:
    explicit Impl(std::string path) : m_path(std::move(path)) {}

    bool load() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_records.clear();

        if (m_path.empty()) return true;

        auto content = FileUtil::readFile(m_path);
        if (!content) {
            spdlog::debug("TrustedPeerStore: {} not found, starting empty", m_path);
            return true;
        }

        try {
            json root = json::parse(*content);
            if (!root.is_array()) {
                m_lastError = "trusted peers file is not a JSON array";
                spdlog::error("TrustedPeerStore: {}", m_lastError);
                return false;
            }
            for (const auto& item : root) {
                auto record = fromJson(item);
                if (!record) {
                    spdlog::warn("TrustedPeerStore: Skipping malformed record");
                    continue;
                }
                m_records[record->deviceId] = std::move(*record);
            }
        } catch (const json::exception& e) {
            m_lastError = std::string("Failed to parse trusted peers: ") + e.what();
            spdlog::error("TrustedPeerStore: {}", m_lastError);
            m_records.clear();
            return false;
        }

        spdlog::info("TrustedPeerStore: Loaded {} trusted peers", m_records.size());
        return true;
    }

    std::vector<TrustedPeerRecord> list() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<TrustedPeerRecord> result;
        result.reserve(m_records.size());
        for (const auto& [id, record] : m_records) {
            result.push_back(record);
        }
        return result;
    }

    std::optional<TrustedPeerRecord> get(const std::string& deviceId) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_records.find(deviceId);
        if (it == m_records.end()) return std::nullopt;
        return it->second;
    }

    bool contains(const std::string& deviceId) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_records.count(deviceId) > 0;
    }

    bool put(const TrustedPeerRecord& record) {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto previous = m_records.find(record.deviceId);
        std::optional<TrustedPeerRecord> before;
        if (previous != m_records.end()) before = previous->second;

        m_records[record.deviceId] = record;
        if (saveLocked()) return true;

        // Память остаётся согласованной с файлом
        if (before) {
            m_records[record.deviceId] = *before;
        } else {
            m_records.erase(record.deviceId);
        }
        return false;
    }

    bool remove(const std::string& deviceId) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_records.erase(deviceId) == 0) return false;
        return saveLocked();
    }

    bool touch(const std::string& deviceId, int64_t lastSeenAt) {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_records.find(deviceId);
        if (it == m_records.end()) return false;
        it->second.lastSeenAt = lastSeenAt;
        return saveLocked();
    }

    const std::string& path() const { return m_path; }

    std::string getLastError() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_lastError;
    }

private:
    std::string m_path;
    mutable std::mutex m_mutex;
    std::map<std::string, TrustedPeerRecord> m_records;
    std::string m_lastError;

    bool saveLocked() {
        if (m_path.empty()) return true;

        json root = json::array();
        for (const auto& [id, record] : m_records) {
            root.push_back(toJson(record));
        }

        std::string error;
        if (!FileUtil::writeFileAtomic(m_path, root.dump(2), true, &error)) {
            m_lastError = error;
            spdlog::error("TrustedPeerStore: {}", error);
            return false;
        }
        return true;
    }
};

// ═══════════════════════════════════════════════════════════
// TrustedPeerStore Public Interface
// ═══════════════════════════════════════════════════════════

TrustedPeerStore::TrustedPeerStore(std::string path)
    : m_impl(std::make_unique<Impl>(std::move(path))) {}

TrustedPeerStore::~TrustedPeerStore() = default;

bool TrustedPeerStore::load() {
    return m_impl->load();
}

std::vector<TrustedPeerRecord> TrustedPeerStore::list() const {
    return m_impl->list();
}

std::optional<TrustedPeerRecord> TrustedPeerStore::get(const std::string& deviceId) const {
    return m_impl->get(deviceId);
}

bool TrustedPeerStore::contains(const std::string& deviceId) const {
    return m_impl->contains(deviceId);
}

bool TrustedPeerStore::put(const TrustedPeerRecord& record) {
    return m_impl->put(record);
}

bool TrustedPeerStore::remove(const std::string& deviceId) {
    return m_impl->remove(deviceId);
}

bool TrustedPeerStore::touch(const std::string& deviceId, int64_t lastSeenAt) {
    return m_impl->touch(deviceId, lastSeenAt);
}

const std::string& TrustedPeerStore::path() const {
    return m_impl->path();
}

std::string TrustedPeerStore::getLastError() const {
    return m_impl->getLastError();
}

} // namespace CosmicConnect

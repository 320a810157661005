// TrustedPeerStore.h — Персистентный список доверенных пиров (trusted_peers.json)

#pragma once

#include "export.h"
#include "Models.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <memory>
#include <optional>

namespace CosmicConnect {

constexpr const char* TRUSTED_PEERS_FILE = "trusted_peers.json";

// ═══════════════════════════════════════════════════════════
// TrustedPeerStore
// ═══════════════════════════════════════════════════════════

/// Хранилище записей о доверенных пирах.
/// Каждое изменение сразу записывается на диск (temp + rename).
/// Пустой путь = только в памяти.
class CC_API TrustedPeerStore {
public:
    explicit TrustedPeerStore(std::string path = {});
    ~TrustedPeerStore();

    // Запрет копирования
    TrustedPeerStore(const TrustedPeerStore&) = delete;
    TrustedPeerStore& operator=(const TrustedPeerStore&) = delete;

    /// Загрузить файл. Отсутствующий файл = пустой список.
    /// @return false если файл повреждён (записи не загружены)
    bool load();

    std::vector<TrustedPeerRecord> list() const;

    std::optional<TrustedPeerRecord> get(const std::string& deviceId) const;

    bool contains(const std::string& deviceId) const;

    /// Добавить или заменить запись
    /// @return false при ошибке записи на диск
    bool put(const TrustedPeerRecord& record);

    /// @return false если записи не было или запись на диск не удалась
    bool remove(const std::string& deviceId);

    /// Обновить last_seen_at
    bool touch(const std::string& deviceId, int64_t lastSeenAt);

    const std::string& path() const;

    std::string getLastError() const;

    /// JSON-сериализация одной записи (формат файла)
    static nlohmann::json toJson(const TrustedPeerRecord& record);

    /// @return nullopt если обязательные поля отсутствуют или cert_der_b64 не декодируется
    static std::optional<TrustedPeerRecord> fromJson(const nlohmann::json& json);

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace CosmicConnect

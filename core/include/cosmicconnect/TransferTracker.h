// TransferTracker.h — Учёт возобновляемых передач (recovery_state.json)

#pragma once

#include "export.h"
#include "Models.h"
#include <nlohmann/json.hpp>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace CosmicConnect {

constexpr const char* RECOVERY_STATE_FILE = "recovery_state.json";
constexpr int64_t TRANSFER_STATE_MAX_AGE_MS = 24ll * 60 * 60 * 1000;    // 24 ч

// ═══════════════════════════════════════════════════════════
// TransferTracker
// ═══════════════════════════════════════════════════════════

class CC_API TransferTracker {
public:
    /// @param path путь к файлу; пустой = только в памяти (тесты)
    explicit TransferTracker(std::string path = {});

    // Запрет копирования
    TransferTracker(const TransferTracker&) = delete;
    TransferTracker& operator=(const TransferTracker&) = delete;

    /// Загрузить состояния с диска.
    /// Отсутствующий файл — не ошибка.
    /// @return false если файл есть, но не разбирается
    bool load();

    /// Зарегистрировать передачу (перезаписывает запись с тем же id)
    void begin(const TransferState& state);

    /// Обновить прогресс
    /// @return false если передача неизвестна
    bool update(const std::string& transferId, uint64_t bytesTransferred);

    /// Передача завершена: запись удаляется
    bool complete(const std::string& transferId);

    bool remove(const std::string& transferId);

    std::optional<TransferState> get(const std::string& transferId) const;

    /// Незавершённые передачи устройства
    std::vector<TransferState> forDevice(const std::string& deviceId,
                                         std::optional<TransferDirection> direction = std::nullopt) const;

    std::vector<TransferState> list() const;

    /// Удалить записи, не обновлявшиеся дольше maxAgeMs
    /// @return количество удалённых
    size_t cleanup(int64_t maxAgeMs = TRANSFER_STATE_MAX_AGE_MS, int64_t nowMs = nowUnixMs());

    const std::string& path() const { return m_path; }

    std::string getLastError() const;

    static nlohmann::json toJson(const TransferState& state);

    /// @return nullopt при неверной записи
    static std::optional<TransferState> fromJson(const nlohmann::json& json);

private:
    std::string m_path;
    mutable std::mutex m_mutex;
    std::map<std::string, TransferState> m_states;
    std::string m_lastError;

    bool saveLocked();
};

} // namespace CosmicConnect

// DeviceManager.h — Реестр известных устройств (единственный владелец Device)

#pragma once

#include "export.h"
#include "Models.h"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace CosmicConnect {

// ═══════════════════════════════════════════════════════════
// DeviceManager
// ═══════════════════════════════════════════════════════════

/// Карта device_id -> Device.
/// Читатели получают копии; запись под коротким эксклюзивным локом.
/// Инвариант: isTrusted == (pairingStatus == Paired && !certificateData.empty()).
class CC_API DeviceManager {
public:
    DeviceManager();
    ~DeviceManager();

    // Запрет копирования
    DeviceManager(const DeviceManager&) = delete;
    DeviceManager& operator=(const DeviceManager&) = delete;

    // ═══════════════════════════════════════════════════════════
    // Чтение
    // ═══════════════════════════════════════════════════════════

    std::optional<Device> get(const std::string& deviceId) const;

    std::vector<Device> list() const;

    bool contains(const std::string& deviceId) const;

    bool isTrusted(const std::string& deviceId) const;

    size_t count() const;

    // ═══════════════════════════════════════════════════════════
    // Обновления
    // ═══════════════════════════════════════════════════════════

    /// Устройство обнаружено (UDP, BLE) или прислало identity.
    /// Создаёт запись при необходимости, обновляет info и last_seen.
    /// Пустой host не затирает известный адрес.
    void updateFromIdentity(const DeviceInfo& info, const std::string& host = {}, uint16_t port = 0);

    /// Загрузить доверенного пира из хранилища
    void addTrusted(const TrustedPeerRecord& record);

    /// Сменить состояние соединения.
    /// @return false если устройство неизвестно или Connected запрошен для недоверенного
    bool setConnectionState(const std::string& deviceId, ConnectionState state);

    /// Сменить статус pairing (не Paired).
    /// Любой статус кроме Paired сбрасывает сертификат и доверие.
    /// @return false если устройство неизвестно или status == Paired
    bool setPairingStatus(const std::string& deviceId, PairingStatus status);

    /// Перевести в Paired с закреплённым сертификатом
    /// @return false если устройство неизвестно или DER пуст
    bool markPaired(const std::string& deviceId, const std::vector<uint8_t>& certificateDer);

    /// Отпечаток сертификата, предъявленного в TLS (кандидат для pairing)
    bool setCertificateFingerprint(const std::string& deviceId, const std::string& fingerprint);

    void touch(const std::string& deviceId);

    bool remove(const std::string& deviceId);

    void clear();

    // ═══════════════════════════════════════════════════════════
    // Callbacks
    // ═══════════════════════════════════════════════════════════

    using DeviceCallback = std::function<void(const Device&)>;

    /// Вызывается после каждого изменения записи (вне лока)
    void onDeviceChanged(DeviceCallback callback);

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace CosmicConnect

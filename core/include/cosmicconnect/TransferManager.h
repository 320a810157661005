// TransferManager.h — Передача файлов через payload-канал с возобновлением
//
// Отправитель: kdeconnect.share.request {filename, transferId, totalSize, offset}
// с payloadTransferInfo; после разрыва предлагает cconnect.transfer.resume,
// получатель отвечает resume_ack с меньшим из смещений (0 = заново).

#pragma once

#include "export.h"
#include "Models.h"
#include "Network/Packet.h"
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace CosmicConnect {

class ConnectionManager;
class TransferTracker;

constexpr const char* PACKET_TYPE_SHARE_REQUEST = "kdeconnect.share.request";

enum class TransferStatus {
    Pending,
    InProgress,
    Completed,
    Failed
};

CC_API const char* transferStatusToString(TransferStatus status);

struct TransferConfig {
    std::string downloadDir;
    int progressIntervalMs = 500;           // Не чаще для уведомлений о прогрессе
};

// ═══════════════════════════════════════════════════════════
// TransferManager
// ═══════════════════════════════════════════════════════════

class CC_API TransferManager {
public:
    /// @param error непустой для Failed
    using TransferCallback = std::function<void(const TransferState& state, TransferStatus status,
                                                const std::string& error)>;

    TransferManager(TransferConfig config,
                    std::shared_ptr<ConnectionManager> connections,
                    std::shared_ptr<TransferTracker> tracker);
    ~TransferManager();

    // Запрет копирования
    TransferManager(const TransferManager&) = delete;
    TransferManager& operator=(const TransferManager&) = delete;

    /// SendFile(device_id, path)
    /// @return transfer_id (UUIDv4)
    /// @throws ProtocolError(NotFound) если файла нет
    /// @throws ProtocolError(ResourceExhausted) без ввода-вывода
    /// @throws ProtocolError(TransportUnavailable | Unauthorized)
    std::string sendFile(const std::string& deviceId, const std::string& path);

    /// share.request, transfer.resume, transfer.resume_ack от устройства
    void handlePacket(const std::string& deviceId, const Packet& packet);

    /// Устройство переподключилось: предложить возобновление исходящих передач
    void resumeTransfers(const std::string& deviceId);

    void setEventCallback(TransferCallback callback);

    /// Отменить активные передачи и дождаться рабочих потоков
    void stop();

    size_t activeTransfers() const;

    /// Дождаться завершения всех рабочих потоков (тесты)
    bool waitIdle(std::chrono::milliseconds timeout);

    const std::string& downloadDir() const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace CosmicConnect

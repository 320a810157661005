// Certificate.h — Локальный сертификат устройства и криптографические утилиты
// RSA-2048, self-signed, CN = device_id

#pragma once

#include "export.h"
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <cstdint>

namespace CosmicConnect {

// ═══════════════════════════════════════════════════════════
// Константы
// ═══════════════════════════════════════════════════════════

constexpr int CERTIFICATE_KEY_BITS = 2048;
constexpr int CERTIFICATE_VALIDITY_DAYS = 3650;     // 10 лет
constexpr const char* CERTIFICATE_ORGANIZATION = "KDE";
constexpr const char* CERTIFICATE_ORG_UNIT = "Kde connect";
constexpr const char* CERTIFICATE_FILE = "certificate.pem";
constexpr const char* PRIVATE_KEY_FILE = "private_key.pem";

// ═══════════════════════════════════════════════════════════
// Crypto — утилиты (OpenSSL, libuuid)
// ═══════════════════════════════════════════════════════════

namespace Crypto {

/// Криптографически стойкие случайные байты
/// @throws std::runtime_error если RAND_bytes не сработал
CC_API std::vector<uint8_t> randomBytes(size_t count);

/// UUIDv4 в нижнем регистре ("xxxxxxxx-xxxx-4xxx-...")
CC_API std::string generateUUID();

/// SHA-256 от данных
CC_API std::vector<uint8_t> sha256(const uint8_t* data, size_t size);
CC_API std::vector<uint8_t> sha256(const std::vector<uint8_t>& data);

/// Hex в нижнем регистре без разделителей
CC_API std::string toHex(const std::vector<uint8_t>& data);

/// Отпечаток: SHA-256 от DER, "AB:CD:EF:..."
CC_API std::string fingerprint(const std::vector<uint8_t>& der);

CC_API std::string base64Encode(const std::vector<uint8_t>& data);

/// @return nullopt при неверном вводе
CC_API std::optional<std::vector<uint8_t>> base64Decode(const std::string& text);

/// Common Name субъекта из DER сертификата
/// @return nullopt если DER не разбирается
CC_API std::optional<std::string> certificateCommonName(const std::vector<uint8_t>& der);

} // namespace Crypto

// ═══════════════════════════════════════════════════════════
// LocalCertificate — долгоживущая пара ключ/сертификат
// ═══════════════════════════════════════════════════════════

class CC_API LocalCertificate {
public:
    ~LocalCertificate();

    LocalCertificate(LocalCertificate&&) noexcept;
    LocalCertificate& operator=(LocalCertificate&&) noexcept;

    // Запрет копирования
    LocalCertificate(const LocalCertificate&) = delete;
    LocalCertificate& operator=(const LocalCertificate&) = delete;

    /// Сгенерировать новый self-signed сертификат для deviceId
    /// @throws std::runtime_error при ошибке OpenSSL
    static LocalCertificate generate(const std::string& deviceId);

    /// Загрузить из PEM-строк
    /// @throws std::runtime_error если PEM не разбирается или ключ не совпадает
    static LocalCertificate fromPem(const std::string& certificatePem, const std::string& privateKeyPem);

    /// Загрузить из stateDir или создать и сохранить (файлы 0600).
    /// Если CN сохранённого сертификата не равен deviceId, сертификат пересоздаётся.
    /// @throws std::runtime_error при ошибке ввода-вывода или OpenSSL
    static LocalCertificate loadOrCreate(const std::string& stateDir, const std::string& deviceId);

    /// Сохранить в stateDir
    /// @return false при ошибке записи
    bool save(const std::string& stateDir) const;

    const std::string& certificatePem() const;
    const std::string& privateKeyPem() const;

    /// DER-кодировка сертификата
    const std::vector<uint8_t>& der() const;

    /// SHA-256 отпечаток ("AB:CD:...")
    std::string fingerprint() const;

    /// CN сертификата (= device_id)
    std::string commonName() const;

private:
    LocalCertificate();

    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace CosmicConnect

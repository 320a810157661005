// Certificate.cpp — Генерация и хранение сертификата устройства
// Криптография через OpenSSL

#include "cosmicconnect/Certificate.h"
#include "../Core/FileUtil.h"
#include <spdlog/spdlog.h>
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rand.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>
#include <uuid/uuid.h>
#include <stdexcept>
#include <cstdio>

namespace CosmicConnect {

namespace {

std::string lastOpenSslError() {
    unsigned long err = ERR_get_error();
    if (err == 0) return "Unknown OpenSSL error";
    char buf[256];
    ERR_error_string_n(err, buf, sizeof(buf));
    return buf;
}

struct BioDeleter { void operator()(BIO* b) const { BIO_free(b); } };
struct X509Deleter { void operator()(X509* x) const { X509_free(x); } };
struct PkeyDeleter { void operator()(EVP_PKEY* k) const { EVP_PKEY_free(k); } };
struct PkeyCtxDeleter { void operator()(EVP_PKEY_CTX* c) const { EVP_PKEY_CTX_free(c); } };

using BioPtr = std::unique_ptr<BIO, BioDeleter>;
using X509Ptr = std::unique_ptr<X509, X509Deleter>;
using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;

std::string bioToString(BIO* bio) {
    BUF_MEM* mem = nullptr;
    BIO_get_mem_ptr(bio, &mem);
    if (!mem || !mem->data) return {};
    return std::string(mem->data, mem->length);
}

std::vector<uint8_t> x509ToDer(X509* cert) {
    int len = i2d_X509(cert, nullptr);
    if (len <= 0) {
        throw std::runtime_error("i2d_X509 failed: " + lastOpenSslError());
    }
    std::vector<uint8_t> der(static_cast<size_t>(len));
    unsigned char* p = der.data();
    i2d_X509(cert, &p);
    return der;
}

std::string x509CommonName(X509* cert) {
    X509_NAME* subject = X509_get_subject_name(cert);
    if (!subject) return {};
    char buf[256];
    int len = X509_NAME_get_text_by_NID(subject, NID_commonName, buf, sizeof(buf));
    if (len < 0) return {};
    return std::string(buf, static_cast<size_t>(len));
}

PkeyPtr generateRsaKey() {
    PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr));
    if (!ctx) {
        throw std::runtime_error("EVP_PKEY_CTX_new_id failed: " + lastOpenSslError());
    }
    if (EVP_PKEY_keygen_init(ctx.get()) <= 0 ||
        EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), CERTIFICATE_KEY_BITS) <= 0) {
        throw std::runtime_error("RSA keygen setup failed: " + lastOpenSslError());
    }
    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &raw) <= 0) {
        throw std::runtime_error("RSA keygen failed: " + lastOpenSslError());
    }
    return PkeyPtr(raw);
}

} // anonymous namespace

// ═══════════════════════════════════════════════════════════
// Crypto namespace implementation
// ═══════════════════════════════════════════════════════════

namespace Crypto {

std::vector<uint8_t> randomBytes(size_t count) {
    std::vector<uint8_t> result(count);
    if (count > 0 && RAND_bytes(result.data(), static_cast<int>(count)) != 1) {
        spdlog::error("Crypto::randomBytes: RAND_bytes failed");
        throw std::runtime_error("Failed to generate random bytes");
    }
    return result;
}

std::string generateUUID() {
    uuid_t uuid;
    uuid_generate_random(uuid);
    char uuidStr[37];
    uuid_unparse_lower(uuid, uuidStr);
    return std::string(uuidStr);
}

std::vector<uint8_t> sha256(const uint8_t* data, size_t size) {
    std::vector<uint8_t> hash(EVP_MAX_MD_SIZE);
    unsigned int length = 0;

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    bool ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1 &&
              EVP_DigestUpdate(ctx, data, size) == 1 &&
              EVP_DigestFinal_ex(ctx, hash.data(), &length) == 1;
    EVP_MD_CTX_free(ctx);

    if (!ok) {
        throw std::runtime_error("SHA-256 failed: " + lastOpenSslError());
    }
    hash.resize(length);
    return hash;
}

std::vector<uint8_t> sha256(const std::vector<uint8_t>& data) {
    return sha256(data.data(), data.size());
}

std::string toHex(const std::vector<uint8_t>& data) {
    static const char* digits = "0123456789abcdef";
    std::string result;
    result.reserve(data.size() * 2);
    for (uint8_t b : data) {
        result.push_back(digits[b >> 4]);
        result.push_back(digits[b & 0x0F]);
    }
    return result;
}

std::string fingerprint(const std::vector<uint8_t>& der) {
    static const char* digits = "0123456789ABCDEF";
    auto hash = sha256(der);
    std::string result;
    result.reserve(hash.size() * 3);
    for (size_t i = 0; i < hash.size(); ++i) {
        if (i > 0) result.push_back(':');
        result.push_back(digits[hash[i] >> 4]);
        result.push_back(digits[hash[i] & 0x0F]);
    }
    return result;
}

std::string base64Encode(const std::vector<uint8_t>& data) {
    if (data.empty()) return {};
    std::string result(4 * ((data.size() + 2) / 3) + 1, '\0');
    int len = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&result[0]),
                              data.data(), static_cast<int>(data.size()));
    result.resize(static_cast<size_t>(len));
    return result;
}

std::optional<std::vector<uint8_t>> base64Decode(const std::string& text) {
    if (text.empty()) return std::vector<uint8_t>{};
    if (text.size() % 4 != 0) return std::nullopt;

    std::vector<uint8_t> result(text.size() / 4 * 3);
    int len = EVP_DecodeBlock(result.data(),
                              reinterpret_cast<const unsigned char*>(text.data()),
                              static_cast<int>(text.size()));
    if (len < 0) return std::nullopt;

    // EVP_DecodeBlock не учитывает '=' в длине результата
    size_t padding = 0;
    if (text[text.size() - 1] == '=') ++padding;
    if (text[text.size() - 2] == '=') ++padding;
    result.resize(static_cast<size_t>(len) - padding);
    return result;
}

std::optional<std::string> certificateCommonName(const std::vector<uint8_t>& der) {
    const unsigned char* p = der.data();
    X509Ptr cert(d2i_X509(nullptr, &p, static_cast<long>(der.size())));
    if (!cert) return std::nullopt;
    return x509CommonName(cert.get());
}

} // namespace Crypto

// ═══════════════════════════════════════════════════════════
// LocalCertificate::Impl
// ═══════════════════════════════════════════════════════════

class LocalCertificate::Impl {
public:
    std::string certificatePem;
    std::string privateKeyPem;
    std::vector<uint8_t> der;
    std::string commonName;

    void load(const std::string& certPem, const std::string& keyPem) {
        BioPtr certBio(BIO_new_mem_buf(certPem.data(), static_cast<int>(certPem.size())));
        BioPtr keyBio(BIO_new_mem_buf(keyPem.data(), static_cast<int>(keyPem.size())));
        if (!certBio || !keyBio) {
            throw std::runtime_error("BIO_new_mem_buf failed");
        }

        X509Ptr cert(PEM_read_bio_X509(certBio.get(), nullptr, nullptr, nullptr));
        if (!cert) {
            throw std::runtime_error("Invalid certificate PEM: " + lastOpenSslError());
        }
        PkeyPtr key(PEM_read_bio_PrivateKey(keyBio.get(), nullptr, nullptr, nullptr));
        if (!key) {
            throw std::runtime_error("Invalid private key PEM: " + lastOpenSslError());
        }
        if (X509_check_private_key(cert.get(), key.get()) != 1) {
            throw std::runtime_error("Private key does not match certificate");
        }

        certificatePem = certPem;
        privateKeyPem = keyPem;
        der = x509ToDer(cert.get());
        commonName = x509CommonName(cert.get());
    }
};

LocalCertificate::LocalCertificate() : m_impl(std::make_unique<Impl>()) {}
LocalCertificate::~LocalCertificate() = default;
LocalCertificate::LocalCertificate(LocalCertificate&&) noexcept = default;
LocalCertificate& LocalCertificate::operator=(LocalCertificate&&) noexcept = default;

LocalCertificate LocalCertificate::generate(const std::string& deviceId) {
    if (deviceId.empty()) {
        throw std::runtime_error("Cannot generate certificate for empty device id");
    }

    PkeyPtr key = generateRsaKey();

    X509Ptr cert(X509_new());
    if (!cert) {
        throw std::runtime_error("X509_new failed");
    }

    X509_set_version(cert.get(), 2);

    // Случайный положительный serial (63 бита)
    auto serialBytes = Crypto::randomBytes(8);
    uint64_t serial = 0;
    for (uint8_t b : serialBytes) serial = (serial << 8) | b;
    serial &= 0x7FFFFFFFFFFFFFFFULL;
    ASN1_INTEGER_set_uint64(X509_get_serialNumber(cert.get()), serial);

    // notBefore на сутки назад, чтобы пережить рассинхрон часов
    X509_gmtime_adj(X509_getm_notBefore(cert.get()), -24L * 60 * 60);
    X509_time_adj_ex(X509_getm_notAfter(cert.get()), CERTIFICATE_VALIDITY_DAYS, 0, nullptr);

    X509_NAME* name = X509_get_subject_name(cert.get());
    auto addEntry = [name](const char* field, const std::string& value) {
        if (X509_NAME_add_entry_by_txt(name, field, MBSTRING_UTF8,
                                       reinterpret_cast<const unsigned char*>(value.c_str()),
                                       -1, -1, 0) != 1) {
            throw std::runtime_error(std::string("Failed to set ") + field + ": " + lastOpenSslError());
        }
    };
    addEntry("O", CERTIFICATE_ORGANIZATION);
    addEntry("OU", CERTIFICATE_ORG_UNIT);
    addEntry("CN", deviceId);
    X509_set_issuer_name(cert.get(), name);

    if (X509_set_pubkey(cert.get(), key.get()) != 1) {
        throw std::runtime_error("X509_set_pubkey failed: " + lastOpenSslError());
    }
    if (X509_sign(cert.get(), key.get(), EVP_sha256()) <= 0) {
        throw std::runtime_error("X509_sign failed: " + lastOpenSslError());
    }

    BioPtr certBio(BIO_new(BIO_s_mem()));
    BioPtr keyBio(BIO_new(BIO_s_mem()));
    if (!certBio || !keyBio ||
        PEM_write_bio_X509(certBio.get(), cert.get()) != 1 ||
        PEM_write_bio_PrivateKey(keyBio.get(), key.get(), nullptr, nullptr, 0, nullptr, nullptr) != 1) {
        throw std::runtime_error("PEM encoding failed: " + lastOpenSslError());
    }

    LocalCertificate result;
    result.m_impl->load(bioToString(certBio.get()), bioToString(keyBio.get()));
    spdlog::info("Certificate: Generated new certificate for {} ({})",
                 deviceId, result.fingerprint());
    return result;
}

LocalCertificate LocalCertificate::fromPem(const std::string& certificatePem,
                                           const std::string& privateKeyPem) {
    LocalCertificate result;
    result.m_impl->load(certificatePem, privateKeyPem);
    return result;
}

LocalCertificate LocalCertificate::loadOrCreate(const std::string& stateDir,
                                                const std::string& deviceId) {
    std::string error;
    if (!FileUtil::ensureDirectory(stateDir, &error)) {
        throw std::runtime_error(error);
    }

    auto certPem = FileUtil::readFile(FileUtil::joinPath(stateDir, CERTIFICATE_FILE));
    auto keyPem = FileUtil::readFile(FileUtil::joinPath(stateDir, PRIVATE_KEY_FILE));

    if (certPem && keyPem) {
        try {
            LocalCertificate existing = fromPem(*certPem, *keyPem);
            if (existing.commonName() == deviceId) {
                spdlog::info("Certificate: Loaded certificate {}", existing.fingerprint());
                return existing;
            }
            spdlog::warn("Certificate: Stored CN '{}' does not match device id, regenerating",
                         existing.commonName());
        } catch (const std::runtime_error& e) {
            spdlog::warn("Certificate: Stored certificate unusable ({}), regenerating", e.what());
        }
    }

    LocalCertificate created = generate(deviceId);
    if (!created.save(stateDir)) {
        throw std::runtime_error("Failed to persist certificate in " + stateDir);
    }
    return created;
}

bool LocalCertificate::save(const std::string& stateDir) const {
    std::string error;
    if (!FileUtil::writeFileAtomic(FileUtil::joinPath(stateDir, CERTIFICATE_FILE),
                                   m_impl->certificatePem, true, &error) ||
        !FileUtil::writeFileAtomic(FileUtil::joinPath(stateDir, PRIVATE_KEY_FILE),
                                   m_impl->privateKeyPem, true, &error)) {
        spdlog::error("Certificate: {}", error);
        return false;
    }
    return true;
}

const std::string& LocalCertificate::certificatePem() const { return m_impl->certificatePem; }
const std::string& LocalCertificate::privateKeyPem() const { return m_impl->privateKeyPem; }
const std::vector<uint8_t>& LocalCertificate::der() const { return m_impl->der; }
std::string LocalCertificate::fingerprint() const { return Crypto::fingerprint(m_impl->der); }
std::string LocalCertificate::commonName() const { return m_impl->commonName; }

} // namespace CosmicConnect

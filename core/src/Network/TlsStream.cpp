// TlsStream.cpp — Mutual TLS over an abstract Transport using OpenSSL

#include "cosmicconnect/Network/TlsStream.h"
#include "cosmicconnect/Error.h"
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <mutex>

namespace CosmicConnect {

// ═══════════════════════════════════════════════════════════
// OpenSSL initialization
// ═══════════════════════════════════════════════════════════

namespace {

class OpenSslInit {
public:
    OpenSslInit() {
        OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);
    }
};

static OpenSslInit g_openSslInit;

std::string getOpenSslError() {
    unsigned long err = ERR_get_error();
    if (err == 0) return "Unknown SSL error";
    char buf[256];
    ERR_error_string_n(err, buf, sizeof(buf));
    ERR_clear_error();
    return buf;
}

/// Состояние, доступное из BIO-колбэков
struct BioContext {
    Transport* transport = nullptr;
    std::string error;
    ErrorKind errorKind = ErrorKind::Io;
};

int bioWrite(BIO* bio, const char* data, int size) {
    auto* ctx = static_cast<BioContext*>(BIO_get_data(bio));
    BIO_clear_retry_flags(bio);
    if (!ctx || !ctx->transport || size <= 0) return -1;
    try {
        ctx->transport->writeAll(reinterpret_cast<const uint8_t*>(data), static_cast<size_t>(size));
        return size;
    } catch (const ProtocolError& e) {
        ctx->error = e.what();
        ctx->errorKind = e.kind();
        return -1;
    }
}

int bioRead(BIO* bio, char* buffer, int size) {
    auto* ctx = static_cast<BioContext*>(BIO_get_data(bio));
    BIO_clear_retry_flags(bio);
    if (!ctx || !ctx->transport || size <= 0) return -1;
    try {
        size_t n = ctx->transport->read(reinterpret_cast<uint8_t*>(buffer), static_cast<size_t>(size));
        return static_cast<int>(n);
    } catch (const ProtocolError& e) {
        ctx->error = e.what();
        ctx->errorKind = e.kind();
        return -1;
    }
}

long bioCtrl(BIO*, int cmd, long, void*) {
    // Буферизации нет: flush всегда успешен
    return cmd == BIO_CTRL_FLUSH ? 1 : 0;
}

int bioCreate(BIO* bio) {
    BIO_set_init(bio, 1);
    return 1;
}

int bioDestroy(BIO* bio) {
    BIO_set_data(bio, nullptr);
    BIO_set_init(bio, 0);
    return 1;
}

BIO_METHOD* transportBioMethod() {
    static BIO_METHOD* method = [] {
        BIO_METHOD* m = BIO_meth_new(BIO_get_new_index() | BIO_TYPE_SOURCE_SINK, "cosmicconnect-transport");
        if (m) {
            BIO_meth_set_write(m, bioWrite);
            BIO_meth_set_read(m, bioRead);
            BIO_meth_set_ctrl(m, bioCtrl);
            BIO_meth_set_create(m, bioCreate);
            BIO_meth_set_destroy(m, bioDestroy);
        }
        return m;
    }();
    return method;
}

// Self-signed сертификаты принимаются; доверие решает verifyPeer()
int acceptAnyCertificate(int, X509_STORE_CTX*) {
    return 1;
}

} // anonymous namespace

TlsRole tlsRoleFor(const std::string& localDeviceId, const std::string& peerDeviceId) {
    return localDeviceId < peerDeviceId ? TlsRole::Client : TlsRole::Server;
}

// ═══════════════════════════════════════════════════════════
// TlsStream::Impl
// ═══════════════════════════════════════════════════════════

class TlsStream::Impl {
public:
    ~Impl() {
        if (m_ssl) {
            SSL_free(m_ssl);    // освобождает и BIO
            m_ssl = nullptr;
        }
        if (m_ctx) {
            SSL_CTX_free(m_ctx);
            m_ctx = nullptr;
        }
    }

    void handshake(std::unique_ptr<Transport> inner, TlsRole role,
                   const LocalCertificate& certificate, std::chrono::milliseconds timeout) {
        m_inner = std::move(inner);
        m_role = role;
        m_bioContext.transport = m_inner.get();

        setupContext(certificate);

        m_ssl = SSL_new(m_ctx);
        if (!m_ssl) {
            fail("Failed to create SSL object: " + getOpenSslError());
        }

        BIO* bio = BIO_new(transportBioMethod());
        if (!bio) {
            fail("Failed to create transport BIO: " + getOpenSslError());
        }
        BIO_set_data(bio, &m_bioContext);
        SSL_set_bio(m_ssl, bio, bio);

        if (role == TlsRole::Client) {
            SSL_set_connect_state(m_ssl);
        } else {
            SSL_set_accept_state(m_ssl);
        }

        m_inner->setReadTimeout(timeout);
        int result = SSL_do_handshake(m_ssl);
        m_inner->setReadTimeout(std::chrono::milliseconds(0));

        if (result != 1) {
            int err = SSL_get_error(m_ssl, result);
            std::string detail = m_bioContext.error.empty() ? getOpenSslError() : m_bioContext.error;
            fail("TLS handshake failed (" + std::to_string(err) + "): " + detail);
        }

        X509* peer = SSL_get_peer_certificate(m_ssl);
        if (!peer) {
            fail("Peer presented no certificate");
        }
        int len = i2d_X509(peer, nullptr);
        if (len > 0) {
            m_peerDer.resize(static_cast<size_t>(len));
            unsigned char* p = m_peerDer.data();
            i2d_X509(peer, &p);
        }
        char cn[256];
        int cnLen = X509_NAME_get_text_by_NID(X509_get_subject_name(peer), NID_commonName, cn, sizeof(cn));
        if (cnLen > 0) {
            m_peerCommonName.assign(cn, static_cast<size_t>(cnLen));
        }
        X509_free(peer);

        m_open = true;
        spdlog::debug("TlsStream: {} handshake complete with {} ({}, CN={})",
                      role == TlsRole::Client ? "Client" : "Server",
                      m_inner->remoteAddress(), SSL_get_version(m_ssl), m_peerCommonName);
    }

    size_t read(uint8_t* buffer, size_t size) {
        auto deadline = std::chrono::steady_clock::now() + m_readTimeout;

        while (true) {
            if (!m_open) return 0;

            bool pending;
            {
                std::lock_guard<std::mutex> lock(m_sslMutex);
                pending = SSL_pending(m_ssl) > 0;
            }

            // Ждём данных без блокировки SSL, чтобы писатель не простаивал
            if (!pending) {
                bool ready = m_inner->waitReadable(std::chrono::milliseconds(250));
                if (!ready) {
                    if (m_readTimeout.count() > 0 && std::chrono::steady_clock::now() >= deadline) {
                        throw ProtocolError(ErrorKind::Timeout, "TLS read timed out");
                    }
                    continue;
                }
            }

            std::lock_guard<std::mutex> lock(m_sslMutex);
            if (!m_open) return 0;

            m_bioContext.error.clear();
            int n = SSL_read(m_ssl, buffer, static_cast<int>(size));
            if (n > 0) {
                return static_cast<size_t>(n);
            }

            int err = SSL_get_error(m_ssl, n);
            if (err == SSL_ERROR_ZERO_RETURN) {
                return 0;
            }
            if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
                // Обработана служебная запись (например, session ticket)
                continue;
            }
            if (err == SSL_ERROR_SYSCALL && m_bioContext.error.empty()) {
                // EOF на нижнем уровне без close_notify
                return 0;
            }
            if (!m_open) return 0;
            if (!m_bioContext.error.empty()) {
                throw ProtocolError(m_bioContext.errorKind, m_bioContext.error);
            }
            throw ProtocolError(ErrorKind::Io, "SSL_read error " + std::to_string(err) + ": " + getOpenSslError());
        }
    }

    size_t write(const uint8_t* data, size_t size) {
        if (size == 0) return 0;
        std::lock_guard<std::mutex> lock(m_sslMutex);
        if (!m_open) {
            throw ProtocolError(ErrorKind::Io, "TLS stream closed");
        }

        m_bioContext.error.clear();
        int n = SSL_write(m_ssl, data, static_cast<int>(size));
        if (n > 0) {
            return static_cast<size_t>(n);
        }
        int err = SSL_get_error(m_ssl, n);
        if (!m_bioContext.error.empty()) {
            throw ProtocolError(m_bioContext.errorKind, m_bioContext.error);
        }
        throw ProtocolError(ErrorKind::Io, "SSL_write error " + std::to_string(err) + ": " + getOpenSslError());
    }

    void close() {
        if (!m_open.exchange(false)) {
            if (m_inner) m_inner->close();
            return;
        }
        {
            // close_notify, если писатель не занят
            std::unique_lock<std::mutex> lock(m_sslMutex, std::try_to_lock);
            if (lock.owns_lock() && m_ssl) {
                SSL_shutdown(m_ssl);
            }
        }
        if (m_inner) m_inner->close();
    }

    bool waitReadable(std::chrono::milliseconds timeout) {
        if (!m_open) return true;
        {
            std::lock_guard<std::mutex> lock(m_sslMutex);
            if (SSL_pending(m_ssl) > 0) return true;
        }
        return m_inner->waitReadable(timeout);
    }

    void verifyPeer(const std::string& expectedDeviceId, const std::vector<uint8_t>& pinnedDer) const {
        if (m_peerCommonName != expectedDeviceId) {
            throw ProtocolError(ErrorKind::PeerIdentityMismatch,
                                "certificate CN '" + m_peerCommonName +
                                "' does not match device id '" + expectedDeviceId + "'");
        }
        if (!pinnedDer.empty() && pinnedDer != m_peerDer) {
            throw ProtocolError(ErrorKind::CertificateMismatch,
                                "presented certificate " + Crypto::fingerprint(m_peerDer) +
                                " differs from pinned " + Crypto::fingerprint(pinnedDer));
        }
    }

    std::unique_ptr<Transport> m_inner;
    TlsRole m_role = TlsRole::Client;
    std::vector<uint8_t> m_peerDer;
    std::string m_peerCommonName;
    std::atomic<bool> m_open{false};
    std::chrono::milliseconds m_readTimeout{0};
    SSL* m_ssl = nullptr;

private:
    SSL_CTX* m_ctx = nullptr;
    std::mutex m_sslMutex;
    BioContext m_bioContext;

    [[noreturn]] void fail(const std::string& message) {
        spdlog::warn("TlsStream: {}", message);
        if (m_inner) m_inner->close();
        throw ProtocolError(ErrorKind::HandshakeFailed, message);
    }

    void setupContext(const LocalCertificate& certificate) {
        m_ctx = SSL_CTX_new(m_role == TlsRole::Client ? TLS_client_method() : TLS_server_method());
        if (!m_ctx) {
            fail("Failed to create SSL context: " + getOpenSslError());
        }

        SSL_CTX_set_min_proto_version(m_ctx, TLS1_2_VERSION);

        // Без auto-retry SSL_read возвращает управление после служебных записей
        SSL_CTX_clear_mode(m_ctx, SSL_MODE_AUTO_RETRY);
        SSL_CTX_set_num_tickets(m_ctx, 0);

        SSL_CTX_set_verify(m_ctx, SSL_VERIFY_PEER | SSL_VERIFY_FAIL_IF_NO_PEER_CERT, acceptAnyCertificate);

        const std::string& certPem = certificate.certificatePem();
        const std::string& keyPem = certificate.privateKeyPem();
        BIO* certBio = BIO_new_mem_buf(certPem.data(), static_cast<int>(certPem.size()));
        BIO* keyBio = BIO_new_mem_buf(keyPem.data(), static_cast<int>(keyPem.size()));
        X509* cert = certBio ? PEM_read_bio_X509(certBio, nullptr, nullptr, nullptr) : nullptr;
        EVP_PKEY* key = keyBio ? PEM_read_bio_PrivateKey(keyBio, nullptr, nullptr, nullptr) : nullptr;
        BIO_free(certBio);
        BIO_free(keyBio);

        bool ok = cert && key &&
                  SSL_CTX_use_certificate(m_ctx, cert) == 1 &&
                  SSL_CTX_use_PrivateKey(m_ctx, key) == 1 &&
                  SSL_CTX_check_private_key(m_ctx) == 1;
        X509_free(cert);
        EVP_PKEY_free(key);
        if (!ok) {
            fail("Failed to load local certificate: " + getOpenSslError());
        }
    }
};

// ═══════════════════════════════════════════════════════════
// TlsStream Public Interface
// ═══════════════════════════════════════════════════════════

TlsStream::TlsStream() : m_impl(std::make_unique<Impl>()) {}

TlsStream::~TlsStream() {
    close();
}

std::unique_ptr<TlsStream> TlsStream::handshake(std::unique_ptr<Transport> inner, TlsRole role,
                                                const LocalCertificate& certificate,
                                                std::chrono::milliseconds timeout) {
    if (!inner || !inner->isOpen()) {
        throw ProtocolError(ErrorKind::HandshakeFailed, "transport is not open");
    }
    std::unique_ptr<TlsStream> stream(new TlsStream());
    stream->m_impl->handshake(std::move(inner), role, certificate, timeout);
    return stream;
}

TransportCapabilities TlsStream::capabilities() const {
    TransportCapabilities caps = m_impl->m_inner->capabilities();
    caps.supportsEncryptionUpgrade = false;
    return caps;
}

size_t TlsStream::read(uint8_t* buffer, size_t size) {
    return m_impl->read(buffer, size);
}

size_t TlsStream::write(const uint8_t* data, size_t size) {
    return m_impl->write(data, size);
}

void TlsStream::close() {
    m_impl->close();
}

bool TlsStream::isOpen() const {
    return m_impl->m_open && m_impl->m_inner && m_impl->m_inner->isOpen();
}

void TlsStream::setReadTimeout(std::chrono::milliseconds timeout) {
    m_impl->m_readTimeout = timeout;
}

bool TlsStream::waitReadable(std::chrono::milliseconds timeout) {
    return m_impl->waitReadable(timeout);
}

std::string TlsStream::remoteAddress() const {
    return m_impl->m_inner ? m_impl->m_inner->remoteAddress() : std::string();
}

const std::vector<uint8_t>& TlsStream::peerCertificateDer() const {
    return m_impl->m_peerDer;
}

std::string TlsStream::peerCommonName() const {
    return m_impl->m_peerCommonName;
}

std::string TlsStream::peerFingerprint() const {
    return Crypto::fingerprint(m_impl->m_peerDer);
}

std::string TlsStream::protocolVersion() const {
    return m_impl->m_ssl ? SSL_get_version(m_impl->m_ssl) : "";
}

void TlsStream::verifyPeer(const std::string& expectedDeviceId,
                           const std::vector<uint8_t>& pinnedDer) const {
    m_impl->verifyPeer(expectedDeviceId, pinnedDer);
}

TlsRole TlsStream::role() const {
    return m_impl->m_role;
}

Transport& TlsStream::inner() {
    return *m_impl->m_inner;
}

} // namespace CosmicConnect

#include <shelter/net/tls_socket.h>

#include <openssl/err.h>
#include <openssl/x509v3.h>

#include <algorithm>
#include <mutex>

namespace shelter::net {

namespace {

void init_openssl_once() {
    static std::once_flag once;
    std::call_once(once, []() {
        OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);
    });
}

std::string openssl_error_string(const char* fallback) {
    unsigned long code = ERR_get_error();
    if (code == 0) return fallback;
    char buffer[256];
    ERR_error_string_n(code, buffer, sizeof(buffer));
    return buffer;
}

} // namespace

TlsSocket::TlsSocket() = default;

TlsSocket::~TlsSocket() {
    close();
    if (ssl_ != nullptr) {
        SSL_free(ssl_);
        ssl_ = nullptr;
    }
    if (ctx_ != nullptr) {
        SSL_CTX_free(ctx_);
        ctx_ = nullptr;
    }
}

bool TlsSocket::connect(const std::string& host, int fd) {
    init_openssl_once();

    ctx_ = SSL_CTX_new(TLS_client_method());
    if (ctx_ == nullptr) {
        last_error_ = openssl_error_string("SSL_CTX_new() failed");
        return false;
    }
    SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);
    if (SSL_CTX_set_default_verify_paths(ctx_) != 1) {
        last_error_ = "SSL_CTX_set_default_verify_paths() failed";
        return false;
    }

    ssl_ = SSL_new(ctx_);
    if (ssl_ == nullptr) {
        last_error_ = openssl_error_string("SSL_new() failed");
        return false;
    }

    SSL_set_tlsext_host_name(ssl_, host.c_str());
    // Hostname check happens inside the handshake
    SSL_set1_host(ssl_, host.c_str());
    SSL_set_fd(ssl_, fd);

    while (true) {
        int rc = SSL_connect(ssl_);
        if (rc == 1) break;

        int ssl_error = SSL_get_error(ssl_, rc);
        if (ssl_error == SSL_ERROR_WANT_READ || ssl_error == SSL_ERROR_WANT_WRITE) {
            continue;
        }

        long verify = SSL_get_verify_result(ssl_);
        if (verify != X509_V_OK) {
            last_error_ = std::string("TLS certificate verification failed: ") +
                          X509_verify_cert_error_string(verify);
        } else {
            last_error_ = openssl_error_string("TLS handshake failed");
        }
        return false;
    }

    connected_ = true;
    return true;
}

bool TlsSocket::send(const uint8_t* data, size_t len) {
    if (!connected_) return false;

    size_t written = 0;
    while (written < len) {
        size_t chunk = std::min<size_t>(len - written, 1 << 20);
        int rc = SSL_write(ssl_, data + written, static_cast<int>(chunk));
        if (rc > 0) {
            written += static_cast<size_t>(rc);
            continue;
        }

        int ssl_error = SSL_get_error(ssl_, rc);
        if (ssl_error == SSL_ERROR_WANT_READ || ssl_error == SSL_ERROR_WANT_WRITE) {
            continue;
        }
        last_error_ = openssl_error_string("SSL_write() failed");
        return false;
    }
    return true;
}

std::optional<std::vector<uint8_t>> TlsSocket::recv() {
    if (!connected_) return std::nullopt;

    uint8_t buffer[16384];
    while (true) {
        int rc = SSL_read(ssl_, buffer, sizeof(buffer));
        if (rc > 0) {
            return std::vector<uint8_t>(buffer, buffer + rc);
        }

        int ssl_error = SSL_get_error(ssl_, rc);
        if (ssl_error == SSL_ERROR_WANT_READ || ssl_error == SSL_ERROR_WANT_WRITE) {
            continue;
        }
        if (ssl_error == SSL_ERROR_ZERO_RETURN) {
            return std::vector<uint8_t>{};
        }
        // Servers that close without close_notify still delivered the body
        if (ssl_error == SSL_ERROR_SYSCALL && ERR_peek_error() == 0) {
            return std::vector<uint8_t>{};
        }
        last_error_ = openssl_error_string("SSL_read() failed");
        return std::nullopt;
    }
}

void TlsSocket::close() {
    if (connected_ && ssl_ != nullptr) {
        SSL_shutdown(ssl_);
    }
    connected_ = false;
}

bool TlsSocket::is_connected() const {
    return connected_;
}

const std::string& TlsSocket::last_error() const {
    return last_error_;
}

} // namespace shelter::net

#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <openssl/ssl.h>

namespace shelter::net {

class TlsSocket {
public:
    TlsSocket();
    ~TlsSocket();

    // Non-copyable, non-movable
    TlsSocket(const TlsSocket&) = delete;
    TlsSocket& operator=(const TlsSocket&) = delete;
    TlsSocket(TlsSocket&&) = delete;
    TlsSocket& operator=(TlsSocket&&) = delete;

    // Handshake over an already connected socket fd, verifying the peer
    // certificate against the system trust store and host name.
    // The TlsSocket does NOT own the fd; caller is responsible for closing it.
    bool connect(const std::string& host, int fd);

    bool send(const uint8_t* data, size_t len);

    // Returns std::nullopt on error, empty vector on EOF/connection close.
    std::optional<std::vector<uint8_t>> recv();

    // Close the TLS session (does NOT close the underlying fd)
    void close();

    bool is_connected() const;
    const std::string& last_error() const;

private:
    SSL_CTX* ctx_ = nullptr;
    SSL* ssl_ = nullptr;
    bool connected_ = false;
    std::string last_error_;
};

} // namespace shelter::net

#pragma once
#include <shelter/net/fetcher.h>
#include <shelter/net/request.h>
#include <shelter/net/response.h>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace shelter::net {

// ---------------------------------------------------------------------------
// HttpClient: blocking HTTP/1.1 over plain sockets or TLS. Each request uses
// its own connection ("Connection: close").
// ---------------------------------------------------------------------------
class HttpClient : public Fetcher {
public:
    HttpClient();
    ~HttpClient() override;

    // Synchronous fetch (blocking). Follows redirects.
    std::optional<Response> fetch(const Request& request) override;

    // Set connection timeout
    void set_timeout(std::chrono::milliseconds timeout);

    // Set max redirect count
    void set_max_redirects(int max);

    // Default User-Agent sent when the request carries none
    void set_user_agent(std::string user_agent);

private:
    std::chrono::milliseconds timeout_{std::chrono::seconds(30)};
    int max_redirects_ = 20;
    std::string user_agent_;

    // Low-level: connect, send request, read response
    std::optional<Response> do_request(const Request& request);
    int connect_to(const std::string& host, uint16_t port);
    bool send_all(int fd, const uint8_t* data, size_t len);
    std::optional<std::vector<uint8_t>> recv_response(int fd);
};

// Resolve a Location header against the URL that produced it.
std::string resolve_redirect(const Request& current, const std::string& location);

} // namespace shelter::net

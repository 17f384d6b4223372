#pragma once
#include <shelter/net/request.h>
#include <shelter/net/response.h>
#include <optional>

namespace shelter::net {

// Network seam used by the worker. An empty result means the request never
// produced a response (DNS, connect, TLS or read failure); any HTTP status,
// including errors, is a response.
class Fetcher {
public:
    virtual ~Fetcher() = default;
    virtual std::optional<Response> fetch(const Request& request) = 0;
};

} // namespace shelter::net

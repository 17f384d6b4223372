#pragma once
#include <shelter/net/request.h>
#include <compare>
#include <string>

namespace shelter::cache {

// Identity of a cached request: method plus canonical URL (query included,
// fragment dropped).
struct RequestKey {
    std::string method;
    std::string url;

    std::string str() const { return method + " " + url; }

    auto operator<=>(const RequestKey&) const = default;
};

RequestKey make_request_key(const net::Request& request);
RequestKey make_request_key(net::Method method, const std::string& url);

} // namespace shelter::cache

#include <shelter/cache/request_key.h>
#include <shelter/url/url.h>

namespace shelter::cache {

RequestKey make_request_key(net::Method method, const std::string& url) {
    RequestKey key;
    key.method = net::method_to_string(method);
    key.url = shelter::url::canonicalize(url);
    if (key.url.empty()) {
        // Not a URL we can normalize; fall back to an exact-match identity
        key.url = url;
    }
    return key;
}

RequestKey make_request_key(const net::Request& request) {
    return make_request_key(request.method, request.url);
}

} // namespace shelter::cache

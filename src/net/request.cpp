#include <shelter/net/request.h>
#include <shelter/url/url.h>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace shelter::net {

std::string method_to_string(Method method) {
    switch (method) {
        case Method::GET:           return "GET";
        case Method::POST:          return "POST";
        case Method::PUT:           return "PUT";
        case Method::DELETE_METHOD: return "DELETE";
        case Method::HEAD:          return "HEAD";
        case Method::OPTIONS:       return "OPTIONS";
        case Method::PATCH:         return "PATCH";
    }
    return "GET";
}

Method string_to_method(const std::string& str) {
    std::string upper = str;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return std::toupper(c); });

    if (upper == "GET")     return Method::GET;
    if (upper == "POST")    return Method::POST;
    if (upper == "PUT")     return Method::PUT;
    if (upper == "DELETE")  return Method::DELETE_METHOD;
    if (upper == "HEAD")    return Method::HEAD;
    if (upper == "OPTIONS") return Method::OPTIONS;
    if (upper == "PATCH")   return Method::PATCH;

    return Method::GET;  // default
}

bool Request::parse_url() {
    auto parsed = shelter::url::parse(url);
    if (!parsed || (parsed->scheme != "http" && parsed->scheme != "https")) {
        return false;
    }

    host = parsed->host;
    use_tls = (parsed->scheme == "https");
    port = parsed->effective_port();
    path = parsed->path.empty() ? "/" : parsed->path;
    query = parsed->query;
    return true;
}

void Request::set_body(const std::string& text) {
    body.assign(text.begin(), text.end());
}

std::string Request::body_as_string() const {
    return std::string(body.begin(), body.end());
}

std::vector<uint8_t> Request::serialize() const {
    std::ostringstream oss;

    // Request line
    oss << method_to_string(method) << " " << path;
    if (!query.empty()) {
        oss << "?" << query;
    }
    oss << " HTTP/1.1\r\n";

    // Host header (always first)
    oss << "Host: " << host;
    if ((port != 80) && (port != 443)) {
        oss << ":" << port;
    }
    oss << "\r\n";

    oss << "Connection: close\r\n";

    if (!headers.has("accept")) {
        oss << "Accept: */*\r\n";
    }

    if (!headers.has("accept-encoding")) {
        oss << "Accept-Encoding: gzip, deflate\r\n";
    }

    for (const auto& [name, value] : headers) {
        if (name == "host" || name == "connection") {
            continue;
        }
        oss << name << ": " << value << "\r\n";
    }

    // Bodies are always framed, including an empty POST
    bool sends_body = !body.empty() || method == Method::POST ||
                      method == Method::PUT || method == Method::PATCH;
    if (sends_body && !headers.has("content-length")) {
        oss << "Content-Length: " << body.size() << "\r\n";
    }

    oss << "\r\n";

    std::string header_str = oss.str();
    std::vector<uint8_t> result(header_str.begin(), header_str.end());
    result.insert(result.end(), body.begin(), body.end());
    return result;
}

} // namespace shelter::net

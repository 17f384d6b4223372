#pragma once
#include <shelter/net/header_map.h>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace shelter::net {

// How the response relates to the page that asked for it. Only Basic
// (same-origin) responses are eligible for the static asset cache.
enum class ResponseType {
    Basic,
    Cors,
    Opaque,
    Error,
};

const char* response_type_name(ResponseType type);
std::optional<ResponseType> response_type_from_name(const std::string& name);

struct Response {
    uint16_t status = 0;
    std::string status_text;
    HeaderMap headers;
    std::vector<uint8_t> body;
    std::string url;
    bool was_redirected = false;
    ResponseType type = ResponseType::Basic;

    // Parse from raw HTTP/1.1 response bytes
    static std::optional<Response> parse(const std::vector<uint8_t>& data);

    // Convenience: body as string
    std::string body_as_string() const;
    void set_body(const std::string& text);

    // 200-299
    bool ok() const;
};

} // namespace shelter::net

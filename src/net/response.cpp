#include <shelter/net/response.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstring>
#include <string>
#include <string_view>
#include <zlib.h>

namespace shelter::net {

const char* response_type_name(ResponseType type) {
    switch (type) {
        case ResponseType::Basic:  return "basic";
        case ResponseType::Cors:   return "cors";
        case ResponseType::Opaque: return "opaque";
        case ResponseType::Error:  return "error";
    }
    return "basic";
}

std::optional<ResponseType> response_type_from_name(const std::string& name) {
    if (name == "basic")  return ResponseType::Basic;
    if (name == "cors")   return ResponseType::Cors;
    if (name == "opaque") return ResponseType::Opaque;
    if (name == "error")  return ResponseType::Error;
    return std::nullopt;
}

std::string Response::body_as_string() const {
    return std::string(body.begin(), body.end());
}

void Response::set_body(const std::string& text) {
    body.assign(text.begin(), text.end());
}

bool Response::ok() const {
    return status >= 200 && status <= 299;
}

namespace {

size_t find_header_end(const std::vector<uint8_t>& data) {
    const char* sep = "\r\n\r\n";
    const size_t sep_len = 4;
    if (data.size() < sep_len) return std::string::npos;

    for (size_t i = 0; i <= data.size() - sep_len; ++i) {
        if (std::memcmp(data.data() + i, sep, sep_len) == 0) {
            return i + sep_len;
        }
    }
    return std::string::npos;
}

std::vector<uint8_t> parse_chunked_body(const uint8_t* data, size_t len) {
    std::vector<uint8_t> result;
    size_t pos = 0;

    while (pos < len) {
        size_t line_end = pos;
        while (line_end + 1 < len &&
               !(data[line_end] == '\r' && data[line_end + 1] == '\n')) {
            ++line_end;
        }
        if (line_end + 1 >= len) break;

        std::string_view size_str(reinterpret_cast<const char*>(data + pos),
                                  line_end - pos);
        auto semi = size_str.find(';');
        if (semi != std::string_view::npos) {
            size_str = size_str.substr(0, semi);
        }

        size_t chunk_size = 0;
        auto [ptr, ec] = std::from_chars(size_str.data(),
                                         size_str.data() + size_str.size(),
                                         chunk_size, 16);
        if (ec != std::errc{} || chunk_size == 0) break;

        size_t chunk_data_start = line_end + 2;
        if (chunk_data_start + chunk_size > len) break;

        result.insert(result.end(),
                      data + chunk_data_start,
                      data + chunk_data_start + chunk_size);
        pos = chunk_data_start + chunk_size + 2;
    }

    return result;
}

bool try_inflate(const std::vector<uint8_t>& compressed, int window_bits,
                 std::vector<uint8_t>& output) {
    z_stream strm{};
    if (inflateInit2(&strm, window_bits) != Z_OK) return false;

    strm.avail_in = static_cast<uInt>(compressed.size());
    strm.next_in = const_cast<Bytef*>(compressed.data());

    output.clear();
    output.reserve(compressed.size() * 4);

    uint8_t buffer[32768];
    int ret;
    do {
        strm.avail_out = sizeof(buffer);
        strm.next_out = buffer;
        ret = inflate(&strm, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            inflateEnd(&strm);
            return false;
        }
        size_t have = sizeof(buffer) - strm.avail_out;
        output.insert(output.end(), buffer, buffer + have);
    } while (ret != Z_STREAM_END);

    inflateEnd(&strm);
    return true;
}

// gzip and zlib-wrapped deflate first, raw deflate second. Undecodable
// bodies are passed through unchanged.
std::vector<uint8_t> decompress_body(const std::vector<uint8_t>& compressed) {
    if (compressed.empty()) return {};

    std::vector<uint8_t> result;
    if (try_inflate(compressed, 15 + 32, result)) {
        return result;
    }
    if (try_inflate(compressed, -15, result)) {
        return result;
    }
    return compressed;
}

} // namespace

std::optional<Response> Response::parse(const std::vector<uint8_t>& data) {
    size_t header_end = find_header_end(data);
    if (header_end == std::string::npos) {
        return std::nullopt;
    }

    std::string header_section(data.begin(), data.begin() + static_cast<std::ptrdiff_t>(header_end));

    auto first_crlf = header_section.find("\r\n");
    std::string status_line = header_section.substr(0, first_crlf);

    // "HTTP/1.1 <status_code> [<status_text>]"
    if (status_line.rfind("HTTP/", 0) != 0) {
        return std::nullopt;
    }
    auto sp1 = status_line.find(' ');
    if (sp1 == std::string::npos) {
        return std::nullopt;
    }
    auto sp2 = status_line.find(' ', sp1 + 1);
    std::string code_str = status_line.substr(
        sp1 + 1, sp2 == std::string::npos ? std::string::npos : sp2 - sp1 - 1);

    Response resp;
    unsigned code = 0;
    auto [ptr, ec] = std::from_chars(code_str.data(), code_str.data() + code_str.size(), code);
    if (ec != std::errc{} || ptr != code_str.data() + code_str.size() || code < 100 || code > 999) {
        return std::nullopt;
    }
    resp.status = static_cast<uint16_t>(code);
    if (sp2 != std::string::npos) {
        resp.status_text = status_line.substr(sp2 + 1);
    }

    size_t pos = first_crlf + 2;
    while (pos < header_end - 2) {
        auto line_end = header_section.find("\r\n", pos);
        if (line_end == std::string::npos || line_end == pos) break;

        std::string line = header_section.substr(pos, line_end - pos);
        auto colon = line.find(':');
        if (colon != std::string::npos) {
            std::string name = line.substr(0, colon);
            std::string value = line.substr(colon + 1);
            size_t val_start = value.find_first_not_of(" \t");
            value = val_start == std::string::npos ? std::string{} : value.substr(val_start);
            while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) {
                value.pop_back();
            }
            resp.headers.append(name, value);
        }

        pos = line_end + 2;
    }

    size_t body_start = header_end;
    auto te = resp.headers.get("transfer-encoding");
    if (te.has_value() && te->find("chunked") != std::string::npos) {
        resp.body = parse_chunked_body(data.data() + body_start,
                                       data.size() - body_start);
        // The body is now de-chunked; keep the snapshot self-consistent.
        resp.headers.remove("transfer-encoding");
    } else {
        size_t content_length = data.size() - body_start;
        if (auto cl = resp.headers.get("content-length")) {
            size_t declared = 0;
            auto [p, e] = std::from_chars(cl->data(), cl->data() + cl->size(), declared);
            if (e == std::errc{} && declared < content_length) {
                content_length = declared;
            }
        }
        resp.body.assign(data.begin() + static_cast<std::ptrdiff_t>(body_start),
                         data.begin() + static_cast<std::ptrdiff_t>(body_start + content_length));
    }

    auto ce = resp.headers.get("content-encoding");
    if (ce.has_value()) {
        std::string encoding = *ce;
        std::transform(encoding.begin(), encoding.end(), encoding.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        if (encoding.find("gzip") != std::string::npos ||
            encoding.find("deflate") != std::string::npos) {
            resp.body = decompress_body(resp.body);
            resp.headers.remove("content-encoding");
            resp.headers.set("content-length", std::to_string(resp.body.size()));
        }
    }

    return resp;
}

} // namespace shelter::net

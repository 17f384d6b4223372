#include <shelter/net/http_client.h>
#include <shelter/net/tls_socket.h>
#include <shelter/url/url.h>

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <string>

namespace shelter::net {

namespace {

std::string to_lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return out;
}

// True once the buffer holds a full response according to its framing
// (Content-Length or the terminating zero chunk). Responses framed only by
// connection close are never "complete" here.
bool response_complete(const std::vector<uint8_t>& buffer) {
    const char* sep = "\r\n\r\n";
    auto it = std::search(buffer.begin(), buffer.end(), sep, sep + 4);
    if (it == buffer.end()) {
        return false;
    }
    size_t header_end = static_cast<size_t>(it - buffer.begin()) + 4;
    std::string lower_header = to_lower(std::string(buffer.begin(), it));

    std::string cl_header = "content-length:";
    auto cl_pos = lower_header.find(cl_header);
    if (cl_pos != std::string::npos) {
        auto val_start = lower_header.find_first_not_of(' ', cl_pos + cl_header.size());
        if (val_start == std::string::npos) {
            return false;
        }
        auto val_end = lower_header.find("\r\n", val_start);
        std::string val = lower_header.substr(val_start, val_end == std::string::npos
                                                             ? std::string::npos
                                                             : val_end - val_start);
        size_t content_length = 0;
        auto [ptr, ec] = std::from_chars(val.data(), val.data() + val.size(), content_length);
        if (ec != std::errc{}) {
            return false;
        }
        return buffer.size() >= header_end + content_length;
    }

    if (lower_header.find("transfer-encoding: chunked") != std::string::npos ||
        lower_header.find("transfer-encoding:chunked") != std::string::npos) {
        auto body_start = buffer.begin() + static_cast<std::ptrdiff_t>(header_end);
        const char* end7 = "\r\n0\r\n\r\n";
        if (std::search(body_start, buffer.end(), end7, end7 + 7) != buffer.end()) {
            return true;
        }
        const char* end5 = "0\r\n\r\n";
        return std::distance(body_start, buffer.end()) >= 5 &&
               std::equal(end5, end5 + 5, body_start);
    }

    return false;
}

bool is_redirect(uint16_t status) {
    return status == 301 || status == 302 || status == 303 ||
           status == 307 || status == 308;
}

} // namespace

std::string resolve_redirect(const Request& current, const std::string& location) {
    auto base = shelter::url::parse(current.url);
    if (!base) {
        return location;
    }
    auto target = shelter::url::parse(location, &*base);
    return target ? target->serialize() : location;
}

HttpClient::HttpClient() = default;
HttpClient::~HttpClient() = default;

void HttpClient::set_timeout(std::chrono::milliseconds timeout) {
    timeout_ = timeout;
}

void HttpClient::set_max_redirects(int max) {
    max_redirects_ = max;
}

void HttpClient::set_user_agent(std::string user_agent) {
    user_agent_ = std::move(user_agent);
}

int HttpClient::connect_to(const std::string& host, uint16_t port) {
    struct addrinfo hints {};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    std::string port_str = std::to_string(port);

    struct addrinfo* result = nullptr;
    int rv = ::getaddrinfo(host.c_str(), port_str.c_str(), &hints, &result);
    if (rv != 0 || result == nullptr) {
        return -1;
    }

    int fd = -1;
    for (auto* rp = result; rp != nullptr; rp = rp->ai_next) {
        fd = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (fd < 0) continue;

        // Non-blocking connect so the timeout applies to the handshake too
        int flags = ::fcntl(fd, F_GETFL, 0);
        if (flags >= 0) {
            ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
        }

        bool connected = false;
        rv = ::connect(fd, rp->ai_addr, rp->ai_addrlen);
        if (rv == 0) {
            connected = true;
        } else if (errno == EINPROGRESS) {
            struct pollfd pfd {};
            pfd.fd = fd;
            pfd.events = POLLOUT;

            int poll_rv = ::poll(&pfd, 1, static_cast<int>(timeout_.count()));
            if (poll_rv > 0 && (pfd.revents & POLLOUT)) {
                int sock_err = 0;
                socklen_t err_len = sizeof(sock_err);
                ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &sock_err, &err_len);
                connected = (sock_err == 0);
            }
        }

        if (connected) {
            if (flags >= 0) {
                ::fcntl(fd, F_SETFL, flags);
            }
            // Blocking reads and writes below (TLS included) honour the timeout
            struct timeval tv {};
            tv.tv_sec = static_cast<time_t>(timeout_.count() / 1000);
            tv.tv_usec = static_cast<suseconds_t>((timeout_.count() % 1000) * 1000);
            ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
            ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
            break;
        }

        ::close(fd);
        fd = -1;
    }

    ::freeaddrinfo(result);
    return fd;
}

bool HttpClient::send_all(int fd, const uint8_t* data, size_t len) {
    size_t sent = 0;
    while (sent < len) {
        ssize_t n = ::send(fd, data + sent, len - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (n == 0) return false;
        sent += static_cast<size_t>(n);
    }
    return true;
}

std::optional<std::vector<uint8_t>> HttpClient::recv_response(int fd) {
    std::vector<uint8_t> buffer;
    constexpr size_t kChunkSize = 8192;
    auto deadline = std::chrono::steady_clock::now() + timeout_;

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            break;
        }

        struct pollfd pfd {};
        pfd.fd = fd;
        pfd.events = POLLIN;

        int poll_rv = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (poll_rv < 0 && errno == EINTR) continue;
        if (poll_rv <= 0) {
            break;
        }

        uint8_t chunk[kChunkSize];
        ssize_t n = ::recv(fd, chunk, kChunkSize, 0);
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (n == 0) {
            break;  // peer closed
        }

        buffer.insert(buffer.end(), chunk, chunk + n);
        if (response_complete(buffer)) {
            break;
        }
    }

    if (buffer.empty()) {
        return std::nullopt;
    }
    return buffer;
}

std::optional<Response> HttpClient::do_request(const Request& request) {
    Request outgoing = request;
    if (!user_agent_.empty() && !outgoing.headers.has("user-agent")) {
        outgoing.headers.set("User-Agent", user_agent_);
    }
    auto data = outgoing.serialize();

    int fd = connect_to(request.host, request.port);
    if (fd < 0) {
        return std::nullopt;
    }

    std::optional<std::vector<uint8_t>> raw;
    if (request.use_tls) {
        TlsSocket tls;
        if (tls.connect(request.host, fd) && tls.send(data.data(), data.size())) {
            std::vector<uint8_t> buffer;
            while (true) {
                auto chunk = tls.recv();
                if (!chunk.has_value() || chunk->empty()) {
                    break;
                }
                buffer.insert(buffer.end(), chunk->begin(), chunk->end());
                if (response_complete(buffer)) {
                    break;
                }
            }
            if (!buffer.empty()) {
                raw = std::move(buffer);
            }
        }
        tls.close();
    } else if (send_all(fd, data.data(), data.size())) {
        raw = recv_response(fd);
    }

    ::close(fd);

    if (!raw.has_value()) {
        return std::nullopt;
    }
    return Response::parse(*raw);
}

std::optional<Response> HttpClient::fetch(const Request& request) {
    Request current = request;
    if (!current.parse_url()) {
        return std::nullopt;
    }

    int redirects = 0;
    bool was_redirected = false;

    while (true) {
        auto resp = do_request(current);
        if (!resp.has_value()) {
            return std::nullopt;
        }

        resp->url = current.url;
        resp->was_redirected = was_redirected;

        if (!is_redirect(resp->status) || redirects >= max_redirects_) {
            return resp;
        }

        auto location = resp->headers.get("location");
        if (!location.has_value()) {
            return resp;
        }

        // 303 always, and 301/302 for POST, continue as GET without a body
        if (resp->status == 303 ||
            ((resp->status == 301 || resp->status == 302) && current.method == Method::POST)) {
            current.method = Method::GET;
            current.body.clear();
            current.headers.remove("content-length");
            current.headers.remove("content-type");
        }

        current.url = resolve_redirect(current, *location);
        if (!current.parse_url()) {
            return resp;
        }
        ++redirects;
        was_redirected = true;
    }
}

} // namespace shelter::net

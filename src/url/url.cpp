#include <shelter/url/url.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <string>
#include <vector>

namespace shelter::url {

namespace {

std::optional<uint16_t> default_port_for(const std::string& scheme) {
    if (scheme == "http" || scheme == "ws") return 80;
    if (scheme == "https" || scheme == "wss") return 443;
    if (scheme == "ftp") return 21;
    return std::nullopt;
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return out;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

// Length of a leading "scheme:" (excluding the colon), or 0 if none.
size_t scheme_length(std::string_view input) {
    if (input.empty() || !std::isalpha(static_cast<unsigned char>(input[0]))) return 0;
    for (size_t i = 1; i < input.size(); ++i) {
        char c = input[i];
        if (c == ':') return i;
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.') {
            return 0;
        }
    }
    return 0;
}

// RFC 3986 section 5.2.4
std::string remove_dot_segments(const std::string& path) {
    if (path.empty()) return path;

    std::vector<std::string> segments;
    size_t pos = 0;
    if (path[0] == '/') pos = 1;

    bool trailing_slash = false;
    while (pos <= path.size()) {
        size_t next = path.find('/', pos);
        std::string segment = path.substr(pos, next == std::string::npos ? std::string::npos : next - pos);
        bool last = (next == std::string::npos);

        if (segment == "..") {
            if (!segments.empty()) segments.pop_back();
            trailing_slash = last;
        } else if (segment == ".") {
            trailing_slash = last;
        } else {
            segments.push_back(segment);
            trailing_slash = false;
        }

        if (last) break;
        pos = next + 1;
    }

    std::string result = path[0] == '/' ? "/" : "";
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) result += '/';
        result += segments[i];
    }
    if (trailing_slash && result.back() != '/') result += '/';
    return result;
}

// Split "path?query#fragment" into the three URL fields.
void split_path_query_fragment(std::string_view rest, URL& out) {
    auto hash = rest.find('#');
    if (hash != std::string_view::npos) {
        out.fragment = std::string(rest.substr(hash + 1));
        rest = rest.substr(0, hash);
    } else {
        out.fragment.clear();
    }

    auto qmark = rest.find('?');
    if (qmark != std::string_view::npos) {
        out.query = std::string(rest.substr(qmark + 1));
        rest = rest.substr(0, qmark);
    } else {
        out.query.clear();
    }

    out.path = std::string(rest);
}

bool parse_authority(std::string_view authority, URL& out) {
    auto at = authority.rfind('@');
    if (at != std::string_view::npos) {
        std::string_view userinfo = authority.substr(0, at);
        authority = authority.substr(at + 1);
        auto colon = userinfo.find(':');
        if (colon != std::string_view::npos) {
            out.username = std::string(userinfo.substr(0, colon));
            out.password = std::string(userinfo.substr(colon + 1));
        } else {
            out.username = std::string(userinfo);
        }
    }

    std::string_view host = authority;
    std::string_view port_text;
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string_view::npos) return false;
        host = authority.substr(0, close + 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') return false;
            port_text = authority.substr(close + 2);
        }
    } else {
        auto colon = authority.rfind(':');
        if (colon != std::string_view::npos) {
            host = authority.substr(0, colon);
            port_text = authority.substr(colon + 1);
        }
    }

    out.host = to_lower(host);

    if (!port_text.empty()) {
        unsigned value = 0;
        auto [ptr, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), value);
        if (ec != std::errc{} || ptr != port_text.data() + port_text.size() || value > 65535) {
            return false;
        }
        auto port = static_cast<uint16_t>(value);
        if (default_port_for(out.scheme) != port) {
            out.port = port;
        }
    }

    if (out.host.empty() && out.is_special() && out.scheme != "file") {
        return false;
    }
    return true;
}

std::optional<URL> parse_absolute(std::string_view input, size_t scheme_len) {
    URL out;
    out.scheme = to_lower(input.substr(0, scheme_len));
    std::string_view rest = input.substr(scheme_len + 1);

    if (rest.substr(0, 2) == "//") {
        rest.remove_prefix(2);
        auto end = rest.find_first_of("/?#");
        std::string_view authority = rest.substr(0, end);
        if (!parse_authority(authority, out)) return std::nullopt;
        rest = end == std::string_view::npos ? std::string_view{} : rest.substr(end);
        split_path_query_fragment(rest, out);
        out.path = remove_dot_segments(out.path);
        if (out.path.empty() && out.is_special()) out.path = "/";
        return out;
    }

    if (out.is_special()) {
        // "http:example.com" and similar are not accepted
        return std::nullopt;
    }

    // Opaque path (mailto:, data:, ...)
    split_path_query_fragment(rest, out);
    return out;
}

std::string directory_of(const std::string& path) {
    auto slash = path.rfind('/');
    if (slash == std::string::npos) return "/";
    return path.substr(0, slash + 1);
}

} // namespace

bool URL::is_special() const {
    return scheme == "http" || scheme == "https" ||
           scheme == "ftp" || scheme == "ws" ||
           scheme == "wss" || scheme == "file";
}

uint16_t URL::effective_port() const {
    if (port.has_value()) return *port;
    return default_port_for(scheme).value_or(0);
}

std::string URL::serialize() const {
    std::string result;
    result += scheme;
    result += ':';

    if (!host.empty() || scheme == "file") {
        result += "//";

        if (!username.empty() || !password.empty()) {
            result += username;
            if (!password.empty()) {
                result += ':';
                result += password;
            }
            result += '@';
        }

        result += host;

        if (port.has_value()) {
            result += ':';
            result += std::to_string(port.value());
        }
    }

    result += path;

    if (!query.empty()) {
        result += '?';
        result += query;
    }

    if (!fragment.empty()) {
        result += '#';
        result += fragment;
    }

    return result;
}

std::string URL::origin() const {
    if (scheme == "file" || !is_special()) {
        return "null";
    }

    std::string result = scheme + "://" + host;
    if (port.has_value()) {
        result += ':';
        result += std::to_string(port.value());
    }
    return result;
}

std::optional<URL> parse(std::string_view input, const URL* base) {
    input = trim(input);

    size_t scheme_len = scheme_length(input);
    if (scheme_len > 0) {
        return parse_absolute(input, scheme_len);
    }

    if (base == nullptr || base->host.empty()) {
        return std::nullopt;
    }

    // Scheme-relative
    if (input.substr(0, 2) == "//") {
        std::string absolute = base->scheme + ":" + std::string(input);
        return parse_absolute(absolute, base->scheme.size());
    }

    URL out = *base;
    out.fragment.clear();

    if (input.empty()) {
        return out;
    }

    if (input.front() == '#') {
        out.fragment = std::string(input.substr(1));
        return out;
    }

    if (input.front() == '?') {
        split_path_query_fragment(input, out);
        out.path = base->path;
        return out;
    }

    std::string previous_path = base->path;
    split_path_query_fragment(input, out);
    if (out.path.empty() || out.path.front() != '/') {
        out.path = directory_of(previous_path) + out.path;
    }
    out.path = remove_dot_segments(out.path);
    if (out.path.empty()) out.path = "/";
    return out;
}

bool urls_same_origin(const URL& a, const URL& b) {
    if (a.origin() == "null" || b.origin() == "null") {
        return false;
    }
    return a.scheme == b.scheme && a.host == b.host &&
           a.effective_port() == b.effective_port();
}

std::string canonicalize(std::string_view input, const URL* base) {
    auto parsed = parse(input, base);
    if (!parsed) return {};
    parsed->fragment.clear();
    return parsed->serialize();
}

} // namespace shelter::url

#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace shelter::url {

struct URL {
    std::string scheme;
    std::string username;
    std::string password;
    std::string host;
    std::optional<uint16_t> port;   // empty when the scheme default applies
    std::string path;
    std::string query;
    std::string fragment;

    std::string serialize() const;
    std::string origin() const;
    bool is_special() const;
    uint16_t effective_port() const;
};

std::optional<URL> parse(std::string_view input, const URL* base = nullptr);
bool urls_same_origin(const URL& a, const URL& b);

// Serialized form used as a cache identity: lowercase scheme and host,
// default port dropped, dot segments removed, query kept, fragment dropped.
// Returns an empty string when the input does not parse.
std::string canonicalize(std::string_view input, const URL* base = nullptr);

} // namespace shelter::url

#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace shelter::net {

// Case-insensitive header list. Names are stored lowercase and insertion
// order is kept so a stored snapshot replays headers exactly as received.
class HeaderMap {
public:
    using Entry = std::pair<std::string, std::string>;
    using iterator = std::vector<Entry>::const_iterator;

    void set(const std::string& name, const std::string& value);
    void append(const std::string& name, const std::string& value);
    std::optional<std::string> get(const std::string& name) const;
    std::vector<std::string> get_all(const std::string& name) const;
    bool has(const std::string& name) const;
    void remove(const std::string& name);
    size_t size() const;
    bool empty() const;

    iterator begin() const;
    iterator end() const;

    bool operator==(const HeaderMap& other) const = default;

private:
    std::vector<Entry> entries_;
    static std::string normalize_name(const std::string& name);
};

} // namespace shelter::net

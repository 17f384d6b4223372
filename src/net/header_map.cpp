#include <shelter/net/header_map.h>
#include <algorithm>
#include <cctype>

namespace shelter::net {

std::string HeaderMap::normalize_name(const std::string& name) {
    std::string result = name;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

void HeaderMap::set(const std::string& name, const std::string& value) {
    auto key = normalize_name(name);
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&key](const Entry& e) { return e.first == key; });
    if (it == entries_.end()) {
        entries_.emplace_back(key, value);
        return;
    }
    // Replace in place so the header keeps its position, then drop duplicates
    it->second = value;
    auto first_dup = std::remove_if(std::next(it), entries_.end(),
                                    [&key](const Entry& e) { return e.first == key; });
    entries_.erase(first_dup, entries_.end());
}

void HeaderMap::append(const std::string& name, const std::string& value) {
    entries_.emplace_back(normalize_name(name), value);
}

std::optional<std::string> HeaderMap::get(const std::string& name) const {
    auto key = normalize_name(name);
    for (const auto& [k, v] : entries_) {
        if (k == key) return v;
    }
    return std::nullopt;
}

std::vector<std::string> HeaderMap::get_all(const std::string& name) const {
    auto key = normalize_name(name);
    std::vector<std::string> result;
    for (const auto& [k, v] : entries_) {
        if (k == key) result.push_back(v);
    }
    return result;
}

bool HeaderMap::has(const std::string& name) const {
    return get(name).has_value();
}

void HeaderMap::remove(const std::string& name) {
    auto key = normalize_name(name);
    entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                  [&key](const Entry& e) { return e.first == key; }),
                   entries_.end());
}

size_t HeaderMap::size() const {
    return entries_.size();
}

bool HeaderMap::empty() const {
    return entries_.empty();
}

HeaderMap::iterator HeaderMap::begin() const {
    return entries_.begin();
}

HeaderMap::iterator HeaderMap::end() const {
    return entries_.end();
}

} // namespace shelter::net

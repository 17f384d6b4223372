#include <shelter/cache/cache_storage.h>
#include <shelter/ipc/serializer.h>

#include <algorithm>
#include <map>

namespace shelter::cache {

namespace {

constexpr uint32_t kSnapshotMagic = 0x53484353;  // "SHCS"
constexpr uint32_t kSnapshotVersion = 1;

struct ParsedCache {
    std::string name;
    std::vector<std::pair<RequestKey, net::Response>> entries;
};

void write_response(ipc::Serializer& s, const net::Response& response) {
    s.write_u16(response.status);
    s.write_string(response.status_text);
    s.write_string(net::response_type_name(response.type));
    s.write_string(response.url);
    s.write_bool(response.was_redirected);
    s.write_u32(static_cast<uint32_t>(response.headers.size()));
    for (const auto& [name, value] : response.headers) {
        s.write_string(name);
        s.write_string(value);
    }
    s.write_bytes(response.body);
}

net::Response read_response(ipc::Deserializer& d) {
    net::Response response;
    response.status = d.read_u16();
    response.status_text = d.read_string();
    auto type = net::response_type_from_name(d.read_string());
    if (!type) {
        throw CacheError("cache snapshot: unknown response type");
    }
    response.type = *type;
    response.url = d.read_string();
    response.was_redirected = d.read_bool();
    uint32_t header_count = d.read_u32();
    for (uint32_t i = 0; i < header_count; ++i) {
        std::string name = d.read_string();
        std::string value = d.read_string();
        response.headers.append(name, value);
    }
    response.body = d.read_bytes();
    return response;
}

std::vector<ParsedCache> parse_snapshot(const std::vector<uint8_t>& data) {
    std::vector<ParsedCache> caches;
    try {
        ipc::Deserializer d(data);
        if (d.read_u32() != kSnapshotMagic) {
            throw CacheError("cache snapshot: bad magic");
        }
        if (d.read_u32() != kSnapshotVersion) {
            throw CacheError("cache snapshot: unsupported version");
        }
        uint32_t cache_count = d.read_u32();
        for (uint32_t c = 0; c < cache_count; ++c) {
            ParsedCache parsed;
            parsed.name = d.read_string();
            uint32_t entry_count = d.read_u32();
            for (uint32_t e = 0; e < entry_count; ++e) {
                RequestKey key;
                key.method = d.read_string();
                key.url = d.read_string();
                parsed.entries.emplace_back(std::move(key), read_response(d));
            }
            caches.push_back(std::move(parsed));
        }
        if (d.has_remaining()) {
            throw CacheError("cache snapshot: trailing bytes");
        }
    } catch (const ipc::DeserializeError& e) {
        throw CacheError(std::string("cache snapshot truncated: ") + e.what());
    }
    return caches;
}

} // namespace

// ===========================================================================
// StorageQuota
// ===========================================================================

StorageQuota::StorageQuota(size_t limit_bytes)
    : limit_(limit_bytes) {}

void StorageQuota::adjust(size_t shrink, size_t grow) {
    std::lock_guard lock(mutex_);
    size_t base = used_ - std::min(shrink, used_);
    if (grow > limit_ || base > limit_ - grow) {
        throw QuotaExceededError("cache quota exceeded: " + std::to_string(base + grow) +
                                 " bytes requested, limit " + std::to_string(limit_));
    }
    used_ = base + grow;
}

void StorageQuota::release(size_t bytes) {
    std::lock_guard lock(mutex_);
    used_ -= std::min(bytes, used_);
}

size_t StorageQuota::used() const {
    std::lock_guard lock(mutex_);
    return used_;
}

size_t StorageQuota::limit() const {
    std::lock_guard lock(mutex_);
    return limit_;
}

size_t snapshot_size(const RequestKey& key, const net::Response& response) {
    size_t s = key.method.size() + key.url.size() + response.url.size() +
               response.status_text.size() + response.body.size();
    for (const auto& [k, v] : response.headers) {
        s += k.size() + v.size();
    }
    return s + sizeof(net::Response);
}

// ===========================================================================
// Cache
// ===========================================================================

Cache::Cache(std::string name, std::shared_ptr<StorageQuota> quota)
    : name_(std::move(name)), quota_(std::move(quota)) {}

const std::string& Cache::name() const {
    return name_;
}

void Cache::check_storable(const net::Request& request) {
    if (request.method != net::Method::GET) {
        throw CacheError("cannot cache a " + net::method_to_string(request.method) +
                         " request: " + request.url);
    }
}

std::optional<net::Response> Cache::match(const net::Request& request) const {
    return match(make_request_key(request));
}

std::optional<net::Response> Cache::match(const RequestKey& key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(key.str());
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return *it->second.snapshot;
}

void Cache::put(const net::Request& request, const net::Response& response) {
    put_all({{request, response}});
}

void Cache::put_all(const Batch& batch) {
    // Build every snapshot before touching the namespace
    std::map<std::string, Entry> incoming;
    std::vector<std::string> incoming_order;
    for (const auto& [request, response] : batch) {
        check_storable(request);
        Entry entry;
        entry.key = make_request_key(request);
        entry.snapshot = std::make_shared<const net::Response>(response);
        entry.bytes = snapshot_size(entry.key, response);
        auto id = entry.key.str();
        if (incoming.find(id) == incoming.end()) {
            incoming_order.push_back(id);
        }
        incoming[id] = std::move(entry);
    }

    std::lock_guard lock(mutex_);
    if (detached_) {
        throw CacheError("cache '" + name_ + "' was deleted");
    }

    size_t shrink = 0;
    size_t grow = 0;
    for (const auto& [id, entry] : incoming) {
        auto existing = entries_.find(id);
        if (existing != entries_.end()) {
            shrink += existing->second.bytes;
        }
        grow += entry.bytes;
    }
    quota_->adjust(shrink, grow);

    for (const auto& id : incoming_order) {
        auto existing = entries_.find(id);
        if (existing != entries_.end()) {
            order_.erase(std::find(order_.begin(), order_.end(), id));
        }
        entries_[id] = std::move(incoming[id]);
        order_.push_back(id);
    }
    bytes_ = bytes_ - shrink + grow;
}

bool Cache::remove(const net::Request& request) {
    auto id = make_request_key(request).str();
    std::lock_guard lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return false;
    }
    quota_->release(it->second.bytes);
    bytes_ -= it->second.bytes;
    entries_.erase(it);
    order_.erase(std::find(order_.begin(), order_.end(), id));
    return true;
}

std::vector<RequestKey> Cache::keys() const {
    std::lock_guard lock(mutex_);
    std::vector<RequestKey> result;
    result.reserve(order_.size());
    for (const auto& id : order_) {
        result.push_back(entries_.at(id).key);
    }
    return result;
}

size_t Cache::size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

size_t Cache::bytes() const {
    std::lock_guard lock(mutex_);
    return bytes_;
}

void Cache::detach() {
    std::lock_guard lock(mutex_);
    quota_->release(bytes_);
    entries_.clear();
    order_.clear();
    bytes_ = 0;
    detached_ = true;
}

// ===========================================================================
// CacheStorage
// ===========================================================================

CacheStorage::CacheStorage(size_t quota_bytes)
    : quota_(std::make_shared<StorageQuota>(quota_bytes)) {}

std::shared_ptr<Cache> CacheStorage::open(const std::string& name) {
    std::lock_guard lock(mutex_);
    for (const auto& cache : caches_) {
        if (cache->name() == name) {
            return cache;
        }
    }
    auto cache = std::make_shared<Cache>(name, quota_);
    caches_.push_back(cache);
    return cache;
}

std::shared_ptr<Cache> CacheStorage::get(const std::string& name) const {
    std::lock_guard lock(mutex_);
    for (const auto& cache : caches_) {
        if (cache->name() == name) {
            return cache;
        }
    }
    return nullptr;
}

bool CacheStorage::has(const std::string& name) const {
    return get(name) != nullptr;
}

bool CacheStorage::remove(const std::string& name) {
    std::shared_ptr<Cache> removed;
    {
        std::lock_guard lock(mutex_);
        auto it = std::find_if(caches_.begin(), caches_.end(),
                               [&name](const auto& cache) { return cache->name() == name; });
        if (it == caches_.end()) {
            return false;
        }
        removed = *it;
        caches_.erase(it);
    }
    removed->detach();
    return true;
}

std::vector<std::string> CacheStorage::keys() const {
    std::lock_guard lock(mutex_);
    std::vector<std::string> names;
    names.reserve(caches_.size());
    for (const auto& cache : caches_) {
        names.push_back(cache->name());
    }
    return names;
}

std::optional<net::Response> CacheStorage::match(const net::Request& request) const {
    std::vector<std::shared_ptr<Cache>> caches;
    {
        std::lock_guard lock(mutex_);
        caches = caches_;
    }
    auto key = make_request_key(request);
    for (const auto& cache : caches) {
        if (auto hit = cache->match(key)) {
            return hit;
        }
    }
    return std::nullopt;
}

size_t CacheStorage::used_bytes() const {
    return quota_->used();
}

size_t CacheStorage::quota_bytes() const {
    return quota_->limit();
}

std::vector<uint8_t> CacheStorage::serialize() const {
    std::vector<std::shared_ptr<Cache>> caches;
    {
        std::lock_guard lock(mutex_);
        caches = caches_;
    }

    ipc::Serializer s;
    s.write_u32(kSnapshotMagic);
    s.write_u32(kSnapshotVersion);
    s.write_u32(static_cast<uint32_t>(caches.size()));
    for (const auto& cache : caches) {
        std::lock_guard cache_lock(cache->mutex_);
        s.write_string(cache->name_);
        s.write_u32(static_cast<uint32_t>(cache->order_.size()));
        for (const auto& id : cache->order_) {
            const auto& entry = cache->entries_.at(id);
            s.write_string(entry.key.method);
            s.write_string(entry.key.url);
            write_response(s, *entry.snapshot);
        }
    }
    return s.take_data();
}

void CacheStorage::deserialize(const std::vector<uint8_t>& data) {
    auto parsed = parse_snapshot(data);

    // Build the replacement namespaces off to the side
    size_t total = 0;
    std::vector<std::shared_ptr<Cache>> rebuilt;
    for (auto& pc : parsed) {
        auto cache = std::make_shared<Cache>(pc.name, quota_);
        for (auto& [key, response] : pc.entries) {
            Cache::Entry entry;
            entry.bytes = snapshot_size(key, response);
            entry.key = key;
            entry.snapshot = std::make_shared<const net::Response>(std::move(response));
            auto id = entry.key.str();
            if (cache->entries_.count(id) == 0) {
                cache->order_.push_back(id);
            } else {
                cache->bytes_ -= cache->entries_[id].bytes;
            }
            cache->bytes_ += entry.bytes;
            cache->entries_[id] = std::move(entry);
        }
        total += cache->bytes_;
        rebuilt.push_back(std::move(cache));
    }

    if (total > quota_->limit()) {
        throw QuotaExceededError("cache snapshot of " + std::to_string(total) +
                                 " bytes exceeds quota");
    }

    std::vector<std::shared_ptr<Cache>> previous;
    {
        std::lock_guard lock(mutex_);
        previous.swap(caches_);
        caches_ = std::move(rebuilt);
    }
    for (const auto& cache : previous) {
        cache->detach();
    }
    quota_->adjust(0, total);
}

} // namespace shelter::cache

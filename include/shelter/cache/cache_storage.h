#pragma once
#include <shelter/cache/request_key.h>
#include <shelter/core/config.h>
#include <shelter/net/request.h>
#include <shelter/net/response.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace shelter::cache {

class CacheError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class QuotaExceededError : public CacheError {
public:
    using CacheError::CacheError;
};

// Byte budget shared by every namespace of one CacheStorage.
class StorageQuota {
public:
    explicit StorageQuota(size_t limit_bytes);

    // Account for `grow` more bytes after `shrink` are released. Throws
    // QuotaExceededError and changes nothing if the result is over the limit.
    void adjust(size_t shrink, size_t grow);
    void release(size_t bytes);

    size_t used() const;
    size_t limit() const;

private:
    mutable std::mutex mutex_;
    size_t limit_;
    size_t used_ = 0;
};

// Approximate in-memory footprint of a snapshot
size_t snapshot_size(const RequestKey& key, const net::Response& response);

// ---------------------------------------------------------------------------
// Cache: one named namespace. Entries are immutable snapshots; a put swaps
// the whole snapshot under the lock, so readers see the old or the new one.
// ---------------------------------------------------------------------------
class Cache {
public:
    using Batch = std::vector<std::pair<net::Request, net::Response>>;

    Cache(std::string name, std::shared_ptr<StorageQuota> quota);

    const std::string& name() const;

    std::optional<net::Response> match(const net::Request& request) const;
    std::optional<net::Response> match(const RequestKey& key) const;

    // Insert or replace. Only GET requests are storable. Throws CacheError
    // (QuotaExceededError when over budget).
    void put(const net::Request& request, const net::Response& response);

    // Store every pair or none of them.
    void put_all(const Batch& batch);

    bool remove(const net::Request& request);

    // Insertion order
    std::vector<RequestKey> keys() const;
    size_t size() const;
    size_t bytes() const;

private:
    friend class CacheStorage;

    struct Entry {
        RequestKey key;
        std::shared_ptr<const net::Response> snapshot;
        size_t bytes = 0;
    };

    // Called by CacheStorage when the namespace is deleted
    void detach();

    static void check_storable(const net::Request& request);

    std::string name_;
    std::shared_ptr<StorageQuota> quota_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    std::vector<std::string> order_;
    size_t bytes_ = 0;
    bool detached_ = false;
};

// ---------------------------------------------------------------------------
// CacheStorage: the set of namespaces, in creation order.
// ---------------------------------------------------------------------------
class CacheStorage {
public:
    explicit CacheStorage(size_t quota_bytes = core::config::kDefaultCacheQuotaBytes);

    // Existing namespace or a new empty one
    std::shared_ptr<Cache> open(const std::string& name);

    // nullptr when absent
    std::shared_ptr<Cache> get(const std::string& name) const;

    bool has(const std::string& name) const;
    bool remove(const std::string& name);
    std::vector<std::string> keys() const;

    // First match across namespaces, oldest namespace first
    std::optional<net::Response> match(const net::Request& request) const;

    size_t used_bytes() const;
    size_t quota_bytes() const;

    // Binary snapshot of every namespace and entry
    std::vector<uint8_t> serialize() const;

    // Replace the whole content from serialize() output. Throws CacheError on
    // malformed input and leaves the current content untouched.
    void deserialize(const std::vector<uint8_t>& data);

private:
    std::shared_ptr<StorageQuota> quota_;
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<Cache>> caches_;
};

} // namespace shelter::cache

#pragma once
#include <shelter/core/diagnostics.h>
#include <shelter/net/fetcher.h>
#include <shelter/net/request.h>

#include <cstdint>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace shelter::worker {

inline constexpr const char kIdempotencyHeader[] = "Idempotency-Key";

// Replay stopped early; the remaining actions stay queued for the next sync
class SyncError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct PendingSyncAction {
    std::string id;
    std::string tag;
    net::Request request;
    std::int64_t created_at_ms = 0;
    std::uint32_t attempts = 0;
};

struct ReplayReport {
    size_t delivered = 0;
    size_t rejected = 0;   // origin answered 4xx; dropped
    size_t remaining = 0;
};

// 32 hex characters
std::string generate_action_id();

class SyncQueue {
public:
    SyncQueue(net::Fetcher& fetcher, core::DiagnosticEmitter& diagnostics);

    // Queue a request for the next sync with `tag`. The request is stamped
    // with an Idempotency-Key so a replay that reaches the origin twice is
    // applied once. Returns the action id.
    std::string enqueue(net::Request request, const std::string& tag);

    // Send every action queued under `tag`, oldest first. Delivered and
    // rejected actions are consumed; a network failure or 5xx stops the
    // replay and throws SyncError.
    ReplayReport replay(const std::string& tag);

    size_t size() const;
    std::vector<PendingSyncAction> pending() const;

    std::vector<uint8_t> serialize() const;
    // Throws SyncError on malformed input
    void deserialize(const std::vector<uint8_t>& data);

private:
    void consume(const std::string& id);

    net::Fetcher& fetcher_;
    core::DiagnosticEmitter& diagnostics_;
    mutable std::mutex mutex_;
    std::mutex replay_mutex_;
    std::deque<PendingSyncAction> actions_;
};

} // namespace shelter::worker

#include <shelter/worker/background_sync.h>
#include <shelter/ipc/serializer.h>

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <random>

namespace shelter::worker {

namespace {

constexpr const char kModule[] = "sync";
constexpr uint32_t kQueueMagic = 0x53485351;  // "SHSQ"

std::int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

} // namespace

std::string generate_action_id() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> dist;
    char buffer[33];
    std::snprintf(buffer, sizeof(buffer), "%016llx%016llx",
                  static_cast<unsigned long long>(dist(rng)),
                  static_cast<unsigned long long>(dist(rng)));
    return buffer;
}

SyncQueue::SyncQueue(net::Fetcher& fetcher, core::DiagnosticEmitter& diagnostics)
    : fetcher_(fetcher), diagnostics_(diagnostics) {}

std::string SyncQueue::enqueue(net::Request request, const std::string& tag) {
    PendingSyncAction action;
    action.id = generate_action_id();
    action.tag = tag;
    action.created_at_ms = now_ms();
    request.headers.set(kIdempotencyHeader, action.id);
    action.request = std::move(request);

    diagnostics_.info(kModule, "enqueue", "queued " + net::method_to_string(action.request.method) +
                                              " " + action.request.url + " for '" + tag +
                                              "' as " + action.id);

    std::lock_guard lock(mutex_);
    actions_.push_back(std::move(action));
    return actions_.back().id;
}

ReplayReport SyncQueue::replay(const std::string& tag) {
    // One replay at a time; a second sync for the same tag waits its turn
    std::lock_guard replay_lock(replay_mutex_);
    diagnostics_.info(kModule, "replay", "Background sync for " + tag);

    std::vector<PendingSyncAction> batch;
    {
        std::lock_guard lock(mutex_);
        for (const auto& action : actions_) {
            if (action.tag == tag) {
                batch.push_back(action);
            }
        }
    }

    ReplayReport report;
    for (size_t i = 0; i < batch.size(); ++i) {
        const auto& action = batch[i];
        auto response = fetcher_.fetch(action.request);

        if (response && response->status < 500) {
            consume(action.id);
            if (response->ok()) {
                ++report.delivered;
            } else {
                ++report.rejected;
                diagnostics_.warning(kModule, "replay",
                                     "origin rejected " + action.id + " with status " +
                                         std::to_string(response->status) + "; dropping it");
            }
            continue;
        }

        {
            std::lock_guard lock(mutex_);
            for (auto& queued : actions_) {
                if (queued.id == action.id) {
                    ++queued.attempts;
                }
            }
        }
        report.remaining = batch.size() - i;
        std::string reason = response ? "status " + std::to_string(response->status)
                                      : std::string("network unavailable");
        throw SyncError("replay of " + action.id + " failed (" + reason + "); " +
                        std::to_string(report.remaining) + " action(s) left for '" + tag + "'");
    }

    diagnostics_.info(kModule, "replay", "delivered " + std::to_string(report.delivered) +
                                             ", rejected " + std::to_string(report.rejected));
    return report;
}

void SyncQueue::consume(const std::string& id) {
    std::lock_guard lock(mutex_);
    actions_.erase(std::remove_if(actions_.begin(), actions_.end(),
                                  [&id](const PendingSyncAction& a) { return a.id == id; }),
                   actions_.end());
}

size_t SyncQueue::size() const {
    std::lock_guard lock(mutex_);
    return actions_.size();
}

std::vector<PendingSyncAction> SyncQueue::pending() const {
    std::lock_guard lock(mutex_);
    return {actions_.begin(), actions_.end()};
}

std::vector<uint8_t> SyncQueue::serialize() const {
    std::lock_guard lock(mutex_);
    ipc::Serializer s;
    s.write_u32(kQueueMagic);
    s.write_u32(static_cast<uint32_t>(actions_.size()));
    for (const auto& action : actions_) {
        s.write_string(action.id);
        s.write_string(action.tag);
        s.write_i64(action.created_at_ms);
        s.write_u32(action.attempts);
        s.write_string(net::method_to_string(action.request.method));
        s.write_string(action.request.url);
        s.write_u32(static_cast<uint32_t>(action.request.headers.size()));
        for (const auto& [name, value] : action.request.headers) {
            s.write_string(name);
            s.write_string(value);
        }
        s.write_bytes(action.request.body);
    }
    return s.take_data();
}

void SyncQueue::deserialize(const std::vector<uint8_t>& data) {
    std::deque<PendingSyncAction> restored;
    try {
        ipc::Deserializer d(data);
        if (d.read_u32() != kQueueMagic) {
            throw SyncError("sync queue snapshot: bad magic");
        }
        uint32_t count = d.read_u32();
        for (uint32_t i = 0; i < count; ++i) {
            PendingSyncAction action;
            action.id = d.read_string();
            action.tag = d.read_string();
            action.created_at_ms = d.read_i64();
            action.attempts = d.read_u32();
            action.request.method = net::string_to_method(d.read_string());
            action.request.url = d.read_string();
            uint32_t header_count = d.read_u32();
            for (uint32_t h = 0; h < header_count; ++h) {
                std::string name = d.read_string();
                std::string value = d.read_string();
                action.request.headers.append(name, value);
            }
            action.request.body = d.read_bytes();
            restored.push_back(std::move(action));
        }
    } catch (const ipc::DeserializeError& e) {
        throw SyncError(std::string("sync queue snapshot truncated: ") + e.what());
    }

    std::lock_guard lock(mutex_);
    actions_ = std::move(restored);
}

} // namespace shelter::worker

#pragma once
#include <shelter/cache/cache_storage.h>
#include <shelter/core/config.h>
#include <shelter/core/diagnostics.h>
#include <shelter/net/fetcher.h>
#include <shelter/platform/thread_pool.h>
#include <shelter/worker/background_sync.h>
#include <shelter/worker/control_channel.h>
#include <shelter/worker/events.h>
#include <shelter/worker/fetch_strategy.h>
#include <shelter/worker/host.h>
#include <shelter/worker/keep_alive.h>
#include <shelter/worker/lifecycle.h>
#include <shelter/worker/push_dispatcher.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <future>
#include <mutex>
#include <string>
#include <unordered_map>

namespace shelter::worker {

// ---------------------------------------------------------------------------
// ServiceWorker: owns the cache store, sync queue and every handler, and
// routes host events to them. Each event runs as its own task on the event
// pool; detached cache writes run on the background pool under KeepAlive.
// A handler failure never escapes: it is logged through the control channel
// and the outcome is marked failed.
// ---------------------------------------------------------------------------
class ServiceWorker {
public:
    ServiceWorker(core::EngineConfig config, net::Fetcher& fetcher,
                  NotificationSurface& notifications, ClientsSurface& clients,
                  core::DiagnosticEmitter& diagnostics);
    ~ServiceWorker();

    ServiceWorker(const ServiceWorker&) = delete;
    ServiceWorker& operator=(const ServiceWorker&) = delete;

    std::future<EventOutcome> dispatch(Event event);

    // dispatch() and wait for the outcome
    EventOutcome dispatch_sync(Event event);

    // Every queued event and every keep-alive task has finished
    void wait_until_idle();

    // The host's set of open clients changed; a waiting worker may now be
    // able to activate. Returns true if it did.
    bool notify_clients_changed();

    WorkerState state() const;
    const std::string& cache_name() const;
    const core::EngineConfig& config() const;

    cache::CacheStorage& cache_storage();
    SyncQueue& sync_queue();
    ControlChannel& control_channel();
    KeepAlive& keep_alive();

    // Resume from state persisted by the host
    void restore(WorkerState state);

private:
    using Handler = std::function<void(const Event&, EventOutcome&)>;

    void register_handlers();
    EventOutcome run(const Event& event, std::uint64_t correlation_id);
    bool maybe_activate(std::uint64_t correlation_id);

    void on_install(const Event& event, EventOutcome& outcome);
    void on_activate(const Event& event, EventOutcome& outcome);
    void on_fetch(const Event& event, EventOutcome& outcome);
    void on_sync(const Event& event, EventOutcome& outcome);
    void on_push(const Event& event, EventOutcome& outcome);
    void on_notification_click(const Event& event, EventOutcome& outcome);
    void on_message(const Event& event, EventOutcome& outcome);
    void on_error(const Event& event, EventOutcome& outcome);

    core::EngineConfig config_;
    std::string cache_name_;
    core::DiagnosticEmitter& diagnostics_;
    ClientsSurface& clients_;

    cache::CacheStorage storage_;
    platform::ThreadPool background_pool_;
    ControlChannel control_;
    KeepAlive keep_alive_;
    LifecycleManager lifecycle_;
    SyncQueue sync_queue_;
    FetchStrategyEngine fetch_engine_;
    PushDispatcher push_;

    std::unordered_map<EventKind, Handler> handlers_;
    std::mutex activation_mutex_;
    std::atomic<std::uint64_t> next_correlation_id_{1};

    // Last member: its workers stop before anything they use is destroyed
    platform::ThreadPool event_pool_;
};

} // namespace shelter::worker

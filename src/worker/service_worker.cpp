#include <shelter/worker/service_worker.h>

#include <exception>
#include <utility>

namespace shelter::worker {

namespace {
constexpr const char kModule[] = "worker";
} // namespace

ServiceWorker::ServiceWorker(core::EngineConfig config, net::Fetcher& fetcher,
                             NotificationSurface& notifications, ClientsSurface& clients,
                             core::DiagnosticEmitter& diagnostics)
    : config_(std::move(config)),
      cache_name_(config_.cache_name()),
      diagnostics_(diagnostics),
      clients_(clients),
      storage_(config_.cache_quota_bytes),
      background_pool_(config_.background_threads),
      control_(diagnostics),
      keep_alive_(background_pool_,
                  [this](const std::string& label, const std::string& message,
                         std::uint64_t correlation_id) {
                      control_.report_error(label, message, correlation_id);
                  }),
      lifecycle_(storage_, fetcher, diagnostics),
      sync_queue_(fetcher, diagnostics),
      fetch_engine_(config_, storage_, fetcher, keep_alive_, diagnostics, &sync_queue_),
      push_(config_, notifications, clients, diagnostics),
      event_pool_(config_.event_threads) {
    register_handlers();

    control_.on(kSkipWaitingMessage, [this](const ControlMessage&) {
        lifecycle_.skip_waiting();
        maybe_activate(0);
    });
}

ServiceWorker::~ServiceWorker() {
    event_pool_.shutdown();
    keep_alive_.wait_idle();
    background_pool_.shutdown();
}

void ServiceWorker::register_handlers() {
    handlers_[EventKind::Install] = [this](const Event& e, EventOutcome& o) { on_install(e, o); };
    handlers_[EventKind::Activate] = [this](const Event& e, EventOutcome& o) { on_activate(e, o); };
    handlers_[EventKind::Fetch] = [this](const Event& e, EventOutcome& o) { on_fetch(e, o); };
    handlers_[EventKind::Sync] = [this](const Event& e, EventOutcome& o) { on_sync(e, o); };
    handlers_[EventKind::Push] = [this](const Event& e, EventOutcome& o) { on_push(e, o); };
    handlers_[EventKind::NotificationClick] = [this](const Event& e, EventOutcome& o) {
        on_notification_click(e, o);
    };
    handlers_[EventKind::Message] = [this](const Event& e, EventOutcome& o) { on_message(e, o); };
    handlers_[EventKind::Error] = [this](const Event& e, EventOutcome& o) { on_error(e, o); };
}

std::future<EventOutcome> ServiceWorker::dispatch(Event event) {
    std::uint64_t cid = next_correlation_id_.fetch_add(1);
    return event_pool_.submit([this, event = std::move(event), cid]() { return run(event, cid); });
}

EventOutcome ServiceWorker::dispatch_sync(Event event) {
    return dispatch(std::move(event)).get();
}

EventOutcome ServiceWorker::run(const Event& event, std::uint64_t correlation_id) {
    EventOutcome outcome;
    outcome.kind = event_kind(event);
    outcome.correlation_id = correlation_id;

    auto it = handlers_.find(outcome.kind);
    if (it == handlers_.end()) {
        return outcome;
    }

    try {
        it->second(event, outcome);
    } catch (const std::exception& e) {
        outcome.ok = false;
        outcome.error = e.what();
        control_.report_error(event_kind_name(outcome.kind), e.what(), correlation_id);
    } catch (...) {
        outcome.ok = false;
        outcome.error = "unknown exception";
        control_.report_error(event_kind_name(outcome.kind), outcome.error, correlation_id);
    }
    return outcome;
}

bool ServiceWorker::maybe_activate(std::uint64_t correlation_id) {
    std::lock_guard lock(activation_mutex_);
    if (!lifecycle_.ready_to_activate(clients_.clients_controlled_by_other(cache_name_))) {
        return false;
    }
    lifecycle_.activate(cache_name_, config_.cache_prefix + "-", &clients_);
    diagnostics_.emit(core::Severity::Info, kModule, "activate",
                      "now controlling clients with " + cache_name_, correlation_id);
    return true;
}

void ServiceWorker::on_install(const Event&, EventOutcome& outcome) {
    lifecycle_.install(cache_name_, config_.precache_manifest, config_.origin);
    if (config_.skip_waiting_on_install) {
        lifecycle_.skip_waiting();
    }
    maybe_activate(outcome.correlation_id);
}

void ServiceWorker::on_activate(const Event&, EventOutcome&) {
    std::lock_guard lock(activation_mutex_);
    WorkerState current = lifecycle_.state();
    if (current != WorkerState::Installed && current != WorkerState::Activated) {
        throw InstallError(std::string("cannot activate a worker that is ") +
                           worker_state_name(current));
    }
    lifecycle_.activate(cache_name_, config_.cache_prefix + "-", &clients_);
}

void ServiceWorker::on_fetch(const Event& event, EventOutcome& outcome) {
    const auto& fetch = std::get<FetchEvent>(event);
    if (lifecycle_.state() != WorkerState::Activated) {
        // Not controlling yet: the host performs the default fetch
        return;
    }
    auto result = fetch_engine_.handle(fetch, cache_name_, outcome.correlation_id);
    diagnostics_.emit(core::Severity::Info, kModule, "fetch",
                      std::string(request_class_name(result.request_class)) + " " +
                          fetch.request.url + " -> " + std::to_string(result.response.status) +
                          " from " + response_source_name(result.source),
                      outcome.correlation_id);
    outcome.response = std::move(result.response);
}

void ServiceWorker::on_sync(const Event& event, EventOutcome& outcome) {
    const auto& sync = std::get<SyncEvent>(event);
    if (sync.tag != config_.sync_tag) {
        diagnostics_.emit(core::Severity::Info, kModule, "sync",
                          "ignoring sync tag '" + sync.tag + "'", outcome.correlation_id);
        return;
    }
    sync_queue_.replay(sync.tag);
}

void ServiceWorker::on_push(const Event& event, EventOutcome& outcome) {
    const auto& push = std::get<PushEvent>(event);
    outcome.notification = push_.handle_push(push.data, outcome.correlation_id);
}

void ServiceWorker::on_notification_click(const Event& event, EventOutcome& outcome) {
    const auto& click = std::get<NotificationClickEvent>(event);
    outcome.navigation = push_.handle_click(click.notification, click.action,
                                            outcome.correlation_id);
}

void ServiceWorker::on_message(const Event& event, EventOutcome&) {
    control_.dispatch(std::get<MessageEvent>(event).message);
}

void ServiceWorker::on_error(const Event& event, EventOutcome& outcome) {
    const auto& error = std::get<ErrorEvent>(event);
    if (error.unhandled_rejection) {
        control_.report_unhandled_rejection("worker", error.message, outcome.correlation_id);
    } else {
        control_.report_error("worker", error.message, outcome.correlation_id);
    }
    outcome.ok = false;
    outcome.error = error.message;
}

void ServiceWorker::wait_until_idle() {
    event_pool_.wait_idle();
    keep_alive_.wait_idle();
}

bool ServiceWorker::notify_clients_changed() {
    return maybe_activate(0);
}

WorkerState ServiceWorker::state() const {
    return lifecycle_.state();
}

const std::string& ServiceWorker::cache_name() const {
    return cache_name_;
}

const core::EngineConfig& ServiceWorker::config() const {
    return config_;
}

cache::CacheStorage& ServiceWorker::cache_storage() {
    return storage_;
}

SyncQueue& ServiceWorker::sync_queue() {
    return sync_queue_;
}

ControlChannel& ServiceWorker::control_channel() {
    return control_;
}

KeepAlive& ServiceWorker::keep_alive() {
    return keep_alive_;
}

void ServiceWorker::restore(WorkerState state) {
    lifecycle_.restore(state);
}

} // namespace shelter::worker

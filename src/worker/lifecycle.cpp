#include <shelter/worker/lifecycle.h>
#include <shelter/url/url.h>

namespace shelter::worker {

namespace {
constexpr const char kModule[] = "lifecycle";
} // namespace

const char* worker_state_name(WorkerState state) {
    switch (state) {
        case WorkerState::Parsed:     return "parsed";
        case WorkerState::Installing: return "installing";
        case WorkerState::Installed:  return "installed";
        case WorkerState::Activating: return "activating";
        case WorkerState::Activated:  return "activated";
        case WorkerState::Redundant:  return "redundant";
    }
    return "unknown";
}

std::optional<WorkerState> worker_state_from_name(const std::string& name) {
    if (name == "parsed")     return WorkerState::Parsed;
    if (name == "installing") return WorkerState::Installing;
    if (name == "installed")  return WorkerState::Installed;
    if (name == "activating") return WorkerState::Activating;
    if (name == "activated")  return WorkerState::Activated;
    if (name == "redundant")  return WorkerState::Redundant;
    return std::nullopt;
}

std::vector<std::string> stale_cache_names(const std::vector<std::string>& names,
                                           const std::string& current,
                                           const std::string& prefix) {
    std::vector<std::string> stale;
    for (const auto& name : names) {
        if (name != current && name.rfind(prefix, 0) == 0) {
            stale.push_back(name);
        }
    }
    return stale;
}

std::optional<std::string> resolve_against_origin(const std::string& origin,
                                                  const std::string& url) {
    auto base = shelter::url::parse(origin);
    auto resolved = shelter::url::parse(url, base ? &*base : nullptr);
    if (!resolved) {
        return std::nullopt;
    }
    return resolved->serialize();
}

LifecycleManager::LifecycleManager(cache::CacheStorage& storage, net::Fetcher& fetcher,
                                   core::DiagnosticEmitter& diagnostics)
    : storage_(storage), fetcher_(fetcher), diagnostics_(diagnostics) {}

InstallReport LifecycleManager::install(const std::string& cache_name,
                                        const std::vector<std::string>& manifest,
                                        const std::string& origin) {
    bool reinstall = false;
    {
        std::lock_guard lock(mutex_);
        if (installing_ || state_ == WorkerState::Activating) {
            throw InstallError(std::string("cannot install while ") +
                               (installing_ ? "installing" : worker_state_name(state_)));
        }
        installing_ = true;
        // An active worker keeps serving while its caches are refreshed
        reinstall = state_ == WorkerState::Activated;
        if (!reinstall) {
            state_ = WorkerState::Installing;
        }
    }
    diagnostics_.info(kModule, "install", reinstall ? "Reinstalling..." : "Installing...");

    // Settles the state on every exit path, exceptions included
    struct Settle {
        LifecycleManager& self;
        WorkerState state;
        ~Settle() { self.finish_install(state); }
    } settle{*this, reinstall ? WorkerState::Activated : WorkerState::Redundant};

    bool existed = storage_.has(cache_name);
    auto fail = [&](const std::string& reason) {
        if (!existed) {
            auto cache = storage_.get(cache_name);
            if (cache && cache->size() == 0) {
                storage_.remove(cache_name);
            }
        }
        diagnostics_.error(kModule, "install", "Cache failed: " + reason);
        if (reinstall) {
            diagnostics_.warning(kModule, "install", "keeping the active version");
        }
        return InstallError(reason);
    };

    // Fetch everything first; a single miss aborts before any write
    cache::Cache::Batch batch;
    InstallReport report;
    report.cache_name = cache_name;
    for (const auto& entry : manifest) {
        auto resolved = resolve_against_origin(origin, entry);
        if (!resolved) {
            throw fail("invalid manifest URL '" + entry + "'");
        }

        net::Request request;
        request.url = *resolved;
        request.method = net::Method::GET;

        auto response = fetcher_.fetch(request);
        if (!response) {
            throw fail("unreachable: " + *resolved);
        }
        if (!response->ok()) {
            throw fail("bad status " + std::to_string(response->status) + " for " + *resolved);
        }
        batch.emplace_back(std::move(request), std::move(*response));
        report.cached_urls.push_back(*resolved);
    }

    diagnostics_.info(kModule, "install", "Caching files");
    try {
        storage_.open(cache_name)->put_all(batch);
    } catch (const cache::CacheError& e) {
        throw fail(e.what());
    }

    settle.state = reinstall ? WorkerState::Activated : WorkerState::Installed;
    diagnostics_.info(kModule, "install", "Cached all files successfully (" +
                                              std::to_string(batch.size()) + " entries)");
    return report;
}

ActivateReport LifecycleManager::activate(const std::string& cache_name,
                                          const std::string& prefix,
                                          ClientsSurface* clients) {
    set_state(WorkerState::Activating);
    diagnostics_.info(kModule, "activate", "Activating...");

    ActivateReport report;
    report.cache_name = cache_name;
    for (const auto& name : stale_cache_names(storage_.keys(), cache_name, prefix)) {
        diagnostics_.info(kModule, "activate", "Deleting old cache " + name);
        if (storage_.remove(name)) {
            report.deleted_caches.push_back(name);
        }
    }

    set_state(WorkerState::Activated);
    if (clients != nullptr) {
        clients->claim(cache_name);
    }
    diagnostics_.info(kModule, "activate", "Activated");
    return report;
}

void LifecycleManager::skip_waiting() {
    std::lock_guard lock(mutex_);
    skip_waiting_ = true;
}

bool LifecycleManager::skip_waiting_requested() const {
    std::lock_guard lock(mutex_);
    return skip_waiting_;
}

bool LifecycleManager::ready_to_activate(size_t clients_on_other_versions) const {
    std::lock_guard lock(mutex_);
    return state_ == WorkerState::Installed &&
           (skip_waiting_ || clients_on_other_versions == 0);
}

WorkerState LifecycleManager::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

void LifecycleManager::restore(WorkerState state) {
    // A persisted transitional state means the process died mid-step
    if (state == WorkerState::Installing || state == WorkerState::Activating) {
        state = WorkerState::Parsed;
    }
    set_state(state);
}

void LifecycleManager::set_state(WorkerState state) {
    std::lock_guard lock(mutex_);
    state_ = state;
}

void LifecycleManager::finish_install(WorkerState state) {
    std::lock_guard lock(mutex_);
    installing_ = false;
    state_ = state;
}

} // namespace shelter::worker

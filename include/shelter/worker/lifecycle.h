#pragma once
#include <shelter/cache/cache_storage.h>
#include <shelter/core/diagnostics.h>
#include <shelter/net/fetcher.h>
#include <shelter/worker/host.h>

#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace shelter::worker {

enum class WorkerState {
    Parsed,
    Installing,
    Installed,    // waiting to activate
    Activating,
    Activated,
    Redundant,
};

const char* worker_state_name(WorkerState state);
std::optional<WorkerState> worker_state_from_name(const std::string& name);

class InstallError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct InstallReport {
    std::string cache_name;
    std::vector<std::string> cached_urls;
};

struct ActivateReport {
    std::string cache_name;
    std::vector<std::string> deleted_caches;
};

// Names among `names` that carry `prefix` but are not `current`
std::vector<std::string> stale_cache_names(const std::vector<std::string>& names,
                                           const std::string& current,
                                           const std::string& prefix);

// Resolve a manifest entry against the app origin
std::optional<std::string> resolve_against_origin(const std::string& origin,
                                                  const std::string& url);

class LifecycleManager {
public:
    LifecycleManager(cache::CacheStorage& storage, net::Fetcher& fetcher,
                     core::DiagnosticEmitter& diagnostics);

    // Fetch every manifest URL and store them all in `cache_name`, or store
    // nothing. Throws InstallError; the worker is Redundant afterwards,
    // unless it was already Activated. An Activated worker stays Activated
    // for the whole install whether it succeeds or fails.
    InstallReport install(const std::string& cache_name,
                          const std::vector<std::string>& manifest,
                          const std::string& origin);

    // Delete stale namespaces of this app and take control of open clients.
    // Repeating it with the same cache name deletes nothing.
    ActivateReport activate(const std::string& cache_name, const std::string& prefix,
                            ClientsSurface* clients);

    void skip_waiting();
    bool skip_waiting_requested() const;

    // Installed, and either skip_waiting() was called or no client is still
    // held by an older version.
    bool ready_to_activate(size_t clients_on_other_versions) const;

    WorkerState state() const;

    // Resume from a state persisted by the host
    void restore(WorkerState state);

private:
    void set_state(WorkerState state);
    void finish_install(WorkerState state);

    cache::CacheStorage& storage_;
    net::Fetcher& fetcher_;
    core::DiagnosticEmitter& diagnostics_;

    mutable std::mutex mutex_;
    WorkerState state_ = WorkerState::Parsed;
    bool skip_waiting_ = false;
    bool installing_ = false;
};

} // namespace shelter::worker

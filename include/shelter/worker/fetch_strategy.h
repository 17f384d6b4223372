#pragma once
#include <shelter/cache/cache_storage.h>
#include <shelter/core/config.h>
#include <shelter/core/diagnostics.h>
#include <shelter/net/fetcher.h>
#include <shelter/net/response.h>
#include <shelter/worker/background_sync.h>
#include <shelter/worker/events.h>
#include <shelter/worker/keep_alive.h>

#include <cstdint>
#include <optional>
#include <string>

namespace shelter::worker {

enum class RequestClass {
    DynamicData,   // path under the API prefix; network first
    StaticAsset,   // cache first
    Navigation,    // cache first, offline page on failure
};

const char* request_class_name(RequestClass request_class);

// Exactly one class per request. The API prefix wins over navigate mode.
RequestClass classify(const FetchEvent& event, const std::string& api_prefix);

// basic for same-origin responses; cross-origin ones are cors when the
// request asked for it and opaque otherwise.
net::ResponseType response_type_for(const std::string& page_origin, const std::string& url,
                                    RequestMode mode);

// 503 JSON body the front-end recognizes as "offline"
net::Response make_offline_json_response();
// Self-contained page shown for a navigation that cannot be served
net::Response make_offline_html_response();
// 503 "Offline" for anything else
net::Response make_generic_offline_response();

// Where the served response came from
enum class ResponseSource {
    Network,
    Cache,
    Fallback,
};

const char* response_source_name(ResponseSource source);

struct FetchResult {
    net::Response response;
    RequestClass request_class = RequestClass::StaticAsset;
    ResponseSource source = ResponseSource::Network;
    std::optional<std::string> queued_action_id;
};

// ---------------------------------------------------------------------------
// FetchStrategyEngine: answers one intercepted request. Always produces a
// response; network failures are recovered from the cache or a synthetic
// fallback. Cache writes run detached under the keep-alive tracker and
// their failures are only logged.
//
// Detached writes hold a reference to `storage`: the owner must call
// keep_alive.wait_idle() before the CacheStorage is destroyed.
// ---------------------------------------------------------------------------
class FetchStrategyEngine {
public:
    FetchStrategyEngine(const core::EngineConfig& config, cache::CacheStorage& storage,
                        net::Fetcher& fetcher, KeepAlive& keep_alive,
                        core::DiagnosticEmitter& diagnostics, SyncQueue* sync_queue = nullptr);

    FetchResult handle(const FetchEvent& event, const std::string& cache_name,
                       std::uint64_t correlation_id = 0);

private:
    FetchResult network_first(const FetchEvent& event, const std::string& cache_name,
                               std::uint64_t correlation_id);
    FetchResult cache_first(const FetchEvent& event, RequestClass request_class,
                            const std::string& cache_name, std::uint64_t correlation_id);

    std::optional<net::Response> fetch_from_network(const FetchEvent& event);
    void store_in_background(const std::string& cache_name, const net::Request& request,
                             const net::Response& response, std::uint64_t correlation_id);
    bool is_queueable(const net::Request& request) const;

    const core::EngineConfig& config_;
    cache::CacheStorage& storage_;
    net::Fetcher& fetcher_;
    KeepAlive& keep_alive_;
    core::DiagnosticEmitter& diagnostics_;
    SyncQueue* sync_queue_;
};

} // namespace shelter::worker

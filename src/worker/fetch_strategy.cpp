#include <shelter/worker/fetch_strategy.h>
#include <shelter/url/url.h>
#include <shelter/worker/lifecycle.h>

#include <algorithm>

namespace shelter::worker {

namespace {

constexpr const char kModule[] = "fetch";

constexpr const char kOfflineJson[] =
    R"({"success":false,"error":"You are offline. Please check your connection.","offline":true})";

constexpr const char kOfflinePage[] = R"html(<!DOCTYPE html>
<html>
<head>
  <meta charset="UTF-8">
  <meta name="viewport" content="width=device-width, initial-scale=1.0">
  <title>Offline - Attendance Tracker</title>
  <style>
    body {
      font-family: -apple-system, BlinkMacSystemFont, 'Segoe UI', Roboto, sans-serif;
      display: flex;
      justify-content: center;
      align-items: center;
      min-height: 100vh;
      margin: 0;
      background: linear-gradient(135deg, #667eea 0%, #764ba2 100%);
      color: white;
      text-align: center;
      padding: 20px;
    }
    .offline-container {
      max-width: 400px;
      background: rgba(255,255,255,0.1);
      padding: 40px;
      border-radius: 20px;
    }
    .retry-btn {
      background: #007bff;
      color: white;
      border: none;
      padding: 12px 24px;
      border-radius: 8px;
      cursor: pointer;
      margin-top: 20px;
    }
  </style>
</head>
<body>
  <div class="offline-container">
    <h1>You're Offline</h1>
    <p>The attendance tracker is currently unavailable. Please check your internet connection and try again.</p>
    <button class="retry-btn" onclick="window.location.reload()">Try Again</button>
  </div>
</body>
</html>
)html";

std::string path_of(const std::string& url) {
    auto parsed = shelter::url::parse(url);
    if (parsed) {
        return parsed->path.empty() ? "/" : parsed->path;
    }
    // Not absolute: treat it as a path, minus query and fragment
    auto end = url.find_first_of("?#");
    return url.substr(0, end);
}

net::Response synthetic(uint16_t status, const std::string& status_text,
                        const std::string& content_type, const std::string& body) {
    net::Response response;
    response.status = status;
    response.status_text = status_text;
    response.headers.set("Content-Type", content_type);
    response.set_body(body);
    response.headers.set("Content-Length", std::to_string(response.body.size()));
    response.type = net::ResponseType::Basic;
    return response;
}

} // namespace

const char* request_class_name(RequestClass request_class) {
    switch (request_class) {
        case RequestClass::DynamicData: return "dynamic";
        case RequestClass::StaticAsset: return "static";
        case RequestClass::Navigation:  return "navigation";
    }
    return "unknown";
}

const char* response_source_name(ResponseSource source) {
    switch (source) {
        case ResponseSource::Network:  return "network";
        case ResponseSource::Cache:    return "cache";
        case ResponseSource::Fallback: return "fallback";
    }
    return "unknown";
}

RequestClass classify(const FetchEvent& event, const std::string& api_prefix) {
    if (!api_prefix.empty() && path_of(event.request.url).starts_with(api_prefix)) {
        return RequestClass::DynamicData;
    }
    if (event.is_navigation()) {
        return RequestClass::Navigation;
    }
    return RequestClass::StaticAsset;
}

net::ResponseType response_type_for(const std::string& page_origin, const std::string& url,
                                    RequestMode mode) {
    auto page = shelter::url::parse(page_origin);
    auto target = shelter::url::parse(url);
    if (page && target && shelter::url::urls_same_origin(*page, *target)) {
        return net::ResponseType::Basic;
    }
    return mode == RequestMode::Cors ? net::ResponseType::Cors : net::ResponseType::Opaque;
}

net::Response make_offline_json_response() {
    return synthetic(503, "Service Unavailable", "application/json", kOfflineJson);
}

net::Response make_offline_html_response() {
    return synthetic(200, "OK", "text/html", kOfflinePage);
}

net::Response make_generic_offline_response() {
    return synthetic(503, "Service Unavailable", "text/plain", "Offline");
}

FetchStrategyEngine::FetchStrategyEngine(const core::EngineConfig& config,
                                         cache::CacheStorage& storage, net::Fetcher& fetcher,
                                         KeepAlive& keep_alive,
                                         core::DiagnosticEmitter& diagnostics,
                                         SyncQueue* sync_queue)
    : config_(config),
      storage_(storage),
      fetcher_(fetcher),
      keep_alive_(keep_alive),
      diagnostics_(diagnostics),
      sync_queue_(sync_queue) {}

FetchResult FetchStrategyEngine::handle(const FetchEvent& event, const std::string& cache_name,
                                        std::uint64_t correlation_id) {
    RequestClass request_class = classify(event, config_.api_prefix);
    if (request_class == RequestClass::DynamicData) {
        return network_first(event, cache_name, correlation_id);
    }
    return cache_first(event, request_class, cache_name, correlation_id);
}

std::optional<net::Response> FetchStrategyEngine::fetch_from_network(const FetchEvent& event) {
    auto response = fetcher_.fetch(event.request);
    if (response) {
        const std::string& final_url = response->url.empty() ? event.request.url : response->url;
        response->type = response_type_for(config_.origin, final_url, event.mode);
    }
    return response;
}

FetchResult FetchStrategyEngine::network_first(const FetchEvent& event,
                                               const std::string& cache_name,
                                               std::uint64_t correlation_id) {
    FetchResult result;
    result.request_class = RequestClass::DynamicData;

    auto live = fetch_from_network(event);
    if (live) {
        if (live->status == 200) {
            store_in_background(cache_name, event.request, *live, correlation_id);
        }
        result.response = std::move(*live);
        result.source = ResponseSource::Network;
        return result;
    }

    diagnostics_.emit(core::Severity::Warning, kModule, "network-first",
                      "network failed for " + event.request.url, correlation_id);

    if (sync_queue_ != nullptr && is_queueable(event.request)) {
        result.queued_action_id = sync_queue_->enqueue(event.request, config_.sync_tag);
    }

    if (auto cached = storage_.match(event.request)) {
        result.response = std::move(*cached);
        result.source = ResponseSource::Cache;
        return result;
    }

    result.response = make_offline_json_response();
    result.source = ResponseSource::Fallback;
    return result;
}

FetchResult FetchStrategyEngine::cache_first(const FetchEvent& event, RequestClass request_class,
                                             const std::string& cache_name,
                                             std::uint64_t correlation_id) {
    FetchResult result;
    result.request_class = request_class;

    if (auto cached = storage_.match(event.request)) {
        diagnostics_.emit(core::Severity::Info, kModule, "cache-first",
                          "Serving from cache " + event.request.url, correlation_id);
        result.response = std::move(*cached);
        result.source = ResponseSource::Cache;
        return result;
    }

    diagnostics_.emit(core::Severity::Info, kModule, "cache-first",
                      "Fetching from network " + event.request.url, correlation_id);
    auto live = fetch_from_network(event);
    if (live) {
        if (live->status == 200 && live->type == net::ResponseType::Basic) {
            store_in_background(cache_name, event.request, *live, correlation_id);
        }
        result.response = std::move(*live);
        result.source = ResponseSource::Network;
        return result;
    }

    result.source = ResponseSource::Fallback;
    if (event.is_navigation()) {
        net::Request root;
        root.method = net::Method::GET;
        root.url = resolve_against_origin(config_.origin, "/").value_or(config_.origin + "/");
        if (auto shell = storage_.match(root)) {
            result.response = std::move(*shell);
            result.source = ResponseSource::Cache;
            return result;
        }
        result.response = make_offline_html_response();
        return result;
    }

    result.response = make_generic_offline_response();
    return result;
}

void FetchStrategyEngine::store_in_background(const std::string& cache_name,
                                              const net::Request& request,
                                              const net::Response& response,
                                              std::uint64_t correlation_id) {
    auto& storage = storage_;
    keep_alive_.extend(
        "cache-put " + request.url,
        [&storage, cache_name, request, response]() {
            storage.open(cache_name)->put(request, response);
        },
        correlation_id);
}

bool FetchStrategyEngine::is_queueable(const net::Request& request) const {
    if (request.method == net::Method::GET || request.method == net::Method::HEAD) {
        return false;
    }
    std::string path = path_of(request.url);
    return std::find(config_.queueable_paths.begin(), config_.queueable_paths.end(), path) !=
           config_.queueable_paths.end();
}

} // namespace shelter::worker

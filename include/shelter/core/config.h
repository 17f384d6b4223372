#ifndef SHELTER_CORE_CONFIG_H
#define SHELTER_CORE_CONFIG_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace shelter::core::config {

inline constexpr const char kCachePrefix[] = "attendance-tracker";
inline constexpr const char kCacheVersion[] = "v1.0.0";
inline constexpr const char kApiPrefix[] = "/api/";
inline constexpr const char kSyncTag[] = "attendance-sync";
inline constexpr const char kDefaultOrigin[] = "http://127.0.0.1:5000";

inline constexpr const char kNotificationTitle[] = "Attendance Tracker";
inline constexpr const char kDefaultPushBody[] = "Attendance reminder";
inline constexpr const char kNotificationIcon[] = "/static/icon-192.png";
inline constexpr const char kNotificationBadge[] = "/static/icon-72.png";
inline constexpr const char kActionIcon[] = "/static/icon-96.png";
inline constexpr const char kNotificationPrimaryKey[] = "attendance-notification";

inline constexpr const char kCheckInEndpoint[] = "/api/checkin";
inline constexpr const char kCheckOutEndpoint[] = "/api/checkout";

inline constexpr std::size_t kDefaultCacheQuotaBytes = 50 * 1024 * 1024;  // 50 MB
inline constexpr std::size_t kDefaultEventThreads = 4;
inline constexpr std::size_t kDefaultBackgroundThreads = 2;
inline constexpr std::uint32_t kDefaultNetworkTimeoutMs = 15000;
inline constexpr const char kUserAgent[] = "shelter/1.0 (offline-worker)";

}  // namespace shelter::core::config

namespace shelter::core {

// Everything the worker needs to know about the app it fronts. Passed by
// value into each component; nothing reads ambient globals.
struct EngineConfig {
    std::string origin = config::kDefaultOrigin;
    std::string cache_prefix = config::kCachePrefix;
    std::string cache_version = config::kCacheVersion;
    std::string api_prefix = config::kApiPrefix;
    std::vector<std::string> precache_manifest;
    std::string sync_tag = config::kSyncTag;

    // Non-GET requests to these paths are queued for background sync when
    // the network is down.
    std::vector<std::string> queueable_paths = {config::kCheckInEndpoint,
                                                config::kCheckOutEndpoint};

    std::string notification_title = config::kNotificationTitle;
    std::string default_push_body = config::kDefaultPushBody;
    std::string notification_icon = config::kNotificationIcon;
    std::string notification_badge = config::kNotificationBadge;
    std::string action_icon = config::kActionIcon;
    std::vector<int> vibrate_pattern = {100, 50, 100};

    bool skip_waiting_on_install = true;
    std::size_t cache_quota_bytes = config::kDefaultCacheQuotaBytes;
    std::size_t event_threads = config::kDefaultEventThreads;
    std::size_t background_threads = config::kDefaultBackgroundThreads;
    std::uint32_t network_timeout_ms = config::kDefaultNetworkTimeoutMs;

    EngineConfig();

    // "<prefix>-<version>", e.g. attendance-tracker-v1.0.0
    std::string cache_name() const;
};

// App shell, icons, manifest and the socket.io client the shell loads.
std::vector<std::string> default_precache_manifest();

}  // namespace shelter::core

#endif  // SHELTER_CORE_CONFIG_H

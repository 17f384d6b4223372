#include <shelter/worker/events.h>

#include <type_traits>

namespace shelter::worker {

const char* event_kind_name(EventKind kind) {
    switch (kind) {
        case EventKind::Install:           return "install";
        case EventKind::Activate:          return "activate";
        case EventKind::Fetch:             return "fetch";
        case EventKind::Sync:              return "sync";
        case EventKind::Push:              return "push";
        case EventKind::NotificationClick: return "notificationclick";
        case EventKind::Message:           return "message";
        case EventKind::Error:             return "error";
    }
    return "unknown";
}

EventKind event_kind(const Event& event) {
    return std::visit([](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, InstallEvent>) return EventKind::Install;
        else if constexpr (std::is_same_v<T, ActivateEvent>) return EventKind::Activate;
        else if constexpr (std::is_same_v<T, FetchEvent>) return EventKind::Fetch;
        else if constexpr (std::is_same_v<T, SyncEvent>) return EventKind::Sync;
        else if constexpr (std::is_same_v<T, PushEvent>) return EventKind::Push;
        else if constexpr (std::is_same_v<T, NotificationClickEvent>) return EventKind::NotificationClick;
        else if constexpr (std::is_same_v<T, MessageEvent>) return EventKind::Message;
        else return EventKind::Error;
    }, event);
}

} // namespace shelter::worker

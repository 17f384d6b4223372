#pragma once
#include <shelter/ipc/message.h>
#include <shelter/net/request.h>
#include <shelter/net/response.h>
#include <shelter/worker/notification.h>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace shelter::worker {

enum class EventKind {
    Install,
    Activate,
    Fetch,
    Sync,
    Push,
    NotificationClick,
    Message,
    Error,
};

const char* event_kind_name(EventKind kind);

enum class RequestMode {
    Navigate,
    SameOrigin,
    NoCors,
    Cors,
};

struct InstallEvent {};

struct ActivateEvent {};

struct FetchEvent {
    net::Request request;
    RequestMode mode = RequestMode::NoCors;

    bool is_navigation() const { return mode == RequestMode::Navigate; }
};

struct SyncEvent {
    std::string tag;
    bool last_chance = false;
};

struct PushEvent {
    std::optional<std::string> data;
};

struct NotificationClickEvent {
    NotificationRequest notification;
    std::string action;   // empty for a click on the body
};

struct MessageEvent {
    ipc::Message message;
};

// Script error or an asynchronous failure nobody handled
struct ErrorEvent {
    std::string message;
    bool unhandled_rejection = false;
};

using Event = std::variant<InstallEvent, ActivateEvent, FetchEvent, SyncEvent,
                           PushEvent, NotificationClickEvent, MessageEvent, ErrorEvent>;

EventKind event_kind(const Event& event);

// What a handler reports back to the host once the event settles
struct EventOutcome {
    EventKind kind = EventKind::Error;
    bool ok = true;
    std::string error;
    std::uint64_t correlation_id = 0;

    // Fetch: the response to serve. Empty when the worker did not intercept
    // and the host should perform the default fetch itself.
    std::optional<net::Response> response;
    std::optional<NotificationRequest> notification;
    std::optional<NavigationIntent> navigation;
};

} // namespace shelter::worker

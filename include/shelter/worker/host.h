#pragma once
#include <shelter/worker/notification.h>
#include <cstddef>
#include <string>

namespace shelter::worker {

// Where notifications are shown. Implemented by the hosting shell.
class NotificationSurface {
public:
    virtual ~NotificationSurface() = default;

    // Blocks until the notification is on screen. Throws on failure.
    virtual void show(const NotificationRequest& notification) = 0;
    virtual void close(const NotificationRequest& notification) = 0;
};

// The host's window/tab manager.
class ClientsSurface {
public:
    virtual ~ClientsSurface() = default;

    virtual void open_window(const NavigationIntent& intent) = 0;

    // Route every open client's requests through the worker of `cache_name`
    virtual void claim(const std::string& cache_name) = 0;

    // Clients still controlled by a version other than `cache_name`
    virtual size_t clients_controlled_by_other(const std::string& cache_name) const = 0;
};

} // namespace shelter::worker

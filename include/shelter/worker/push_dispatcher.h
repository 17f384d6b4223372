#pragma once
#include <shelter/core/config.h>
#include <shelter/core/diagnostics.h>
#include <shelter/worker/host.h>
#include <shelter/worker/notification.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace shelter::worker {

// "/?action=checkin", "/?action=checkout", or "/" for anything else
NavigationIntent navigation_for_action(const std::string& action);

// Notification for a push payload. An absent payload uses the default
// reminder text.
NotificationRequest build_notification(const core::EngineConfig& config,
                                       const std::optional<std::string>& payload,
                                       std::chrono::system_clock::time_point arrived);

class PushDispatcher {
public:
    PushDispatcher(const core::EngineConfig& config, NotificationSurface& notifications,
                   ClientsSurface& clients, core::DiagnosticEmitter& diagnostics);

    // Shows the notification before returning. Surface errors propagate.
    NotificationRequest handle_push(const std::optional<std::string>& payload,
                                    std::uint64_t correlation_id = 0);

    // Closes the notification, then opens exactly one window.
    NavigationIntent handle_click(const NotificationRequest& notification,
                                  const std::string& action, std::uint64_t correlation_id = 0);

private:
    const core::EngineConfig& config_;
    NotificationSurface& notifications_;
    ClientsSurface& clients_;
    core::DiagnosticEmitter& diagnostics_;
};

} // namespace shelter::worker

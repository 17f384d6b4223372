#include <shelter/worker/push_dispatcher.h>

namespace shelter::worker {

namespace {
constexpr const char kModule[] = "push";
} // namespace

NavigationIntent navigation_for_action(const std::string& action) {
    if (action == kActionCheckIn) {
        return {"/?action=checkin"};
    }
    if (action == kActionCheckOut) {
        return {"/?action=checkout"};
    }
    return {"/"};
}

NotificationRequest build_notification(const core::EngineConfig& config,
                                       const std::optional<std::string>& payload,
                                       std::chrono::system_clock::time_point arrived) {
    NotificationRequest n;
    n.title = config.notification_title;
    n.body = payload ? *payload : config.default_push_body;
    n.icon = config.notification_icon;
    n.badge = config.notification_badge;
    n.vibrate = config.vibrate_pattern;

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(arrived.time_since_epoch());
    n.data["dateOfArrival"] = std::to_string(ms.count());
    n.data["primaryKey"] = core::config::kNotificationPrimaryKey;

    n.actions.push_back({kActionCheckIn, "Check In", config.action_icon});
    n.actions.push_back({kActionCheckOut, "Check Out", config.action_icon});
    return n;
}

PushDispatcher::PushDispatcher(const core::EngineConfig& config,
                               NotificationSurface& notifications, ClientsSurface& clients,
                               core::DiagnosticEmitter& diagnostics)
    : config_(config),
      notifications_(notifications),
      clients_(clients),
      diagnostics_(diagnostics) {}

NotificationRequest PushDispatcher::handle_push(const std::optional<std::string>& payload,
                                                std::uint64_t correlation_id) {
    auto notification = build_notification(config_, payload, std::chrono::system_clock::now());
    notifications_.show(notification);
    diagnostics_.emit(core::Severity::Info, kModule, "push",
                      "showing \"" + notification.body + "\"", correlation_id);
    return notification;
}

NavigationIntent PushDispatcher::handle_click(const NotificationRequest& notification,
                                              const std::string& action,
                                              std::uint64_t correlation_id) {
    diagnostics_.emit(core::Severity::Info, kModule, "click",
                      "Notification click received" +
                          (action.empty() ? std::string() : " (" + action + ")"),
                      correlation_id);
    notifications_.close(notification);

    auto intent = navigation_for_action(action);
    clients_.open_window(intent);
    return intent;
}

} // namespace shelter::worker

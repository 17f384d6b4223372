#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace shelter::worker {

inline constexpr const char kActionCheckIn[] = "check-in";
inline constexpr const char kActionCheckOut[] = "check-out";

struct NotificationAction {
    std::string action;   // id reported back on click
    std::string title;
    std::string icon;
};

struct NotificationRequest {
    std::string title;
    std::string body;
    std::string icon;
    std::string badge;
    std::vector<int> vibrate;
    std::map<std::string, std::string> data;
    std::vector<NotificationAction> actions;
};

// Window the host should open (or focus) in response to a click
struct NavigationIntent {
    std::string url;

    bool operator==(const NavigationIntent&) const = default;
};

} // namespace shelter::worker

#include <shelter/worker/push_dispatcher.h>
#include <gtest/gtest.h>

#include "test_fakes.h"

using namespace shelter::worker;
using shelter::core::DiagnosticEmitter;
using shelter::core::EngineConfig;
using shelter::testing::RecordingClients;
using shelter::testing::RecordingNotifications;

TEST(PushDispatcherTest, NotificationCarriesPayloadAndAppLook) {
    EngineConfig config;
    auto arrived = std::chrono::system_clock::time_point(std::chrono::milliseconds(1700000000123));
    auto n = build_notification(config, std::string("Shift starts in 10 minutes"), arrived);

    EXPECT_EQ(n.title, "Attendance Tracker");
    EXPECT_EQ(n.body, "Shift starts in 10 minutes");
    EXPECT_EQ(n.icon, "/static/icon-192.png");
    EXPECT_EQ(n.badge, "/static/icon-72.png");
    EXPECT_EQ(n.vibrate, (std::vector<int>{100, 50, 100}));
    EXPECT_EQ(n.data.at("dateOfArrival"), "1700000000123");
    EXPECT_EQ(n.data.at("primaryKey"), "attendance-notification");

    ASSERT_EQ(n.actions.size(), 2u);
    EXPECT_EQ(n.actions[0].action, "check-in");
    EXPECT_EQ(n.actions[0].title, "Check In");
    EXPECT_EQ(n.actions[1].action, "check-out");
    EXPECT_EQ(n.actions[1].title, "Check Out");
    EXPECT_EQ(n.actions[1].icon, "/static/icon-96.png");
}

TEST(PushDispatcherTest, MissingPayloadUsesReminderText) {
    EngineConfig config;
    auto n = build_notification(config, std::nullopt, std::chrono::system_clock::now());
    EXPECT_EQ(n.body, "Attendance reminder");
}

TEST(PushDispatcherTest, ActionsMapToNavigationIntents) {
    EXPECT_EQ(navigation_for_action("check-in").url, "/?action=checkin");
    EXPECT_EQ(navigation_for_action("check-out").url, "/?action=checkout");
    EXPECT_EQ(navigation_for_action("").url, "/");
    EXPECT_EQ(navigation_for_action("snooze").url, "/");
}

TEST(PushDispatcherTest, PushShowsNotification) {
    EngineConfig config;
    RecordingNotifications notifications;
    RecordingClients clients;
    DiagnosticEmitter diagnostics;
    PushDispatcher push(config, notifications, clients, diagnostics);

    auto shown = push.handle_push(std::nullopt);
    ASSERT_EQ(notifications.shown.size(), 1u);
    EXPECT_EQ(notifications.shown[0].body, shown.body);
}

TEST(PushDispatcherTest, ShowFailurePropagates) {
    EngineConfig config;
    RecordingNotifications notifications;
    notifications.fail_show = true;
    RecordingClients clients;
    DiagnosticEmitter diagnostics;
    PushDispatcher push(config, notifications, clients, diagnostics);

    EXPECT_THROW(push.handle_push(std::string("x")), std::runtime_error);
}

TEST(PushDispatcherTest, ClickClosesThenOpensExactlyOneWindow) {
    EngineConfig config;
    RecordingNotifications notifications;
    RecordingClients clients;
    DiagnosticEmitter diagnostics;
    PushDispatcher push(config, notifications, clients, diagnostics);

    auto n = build_notification(config, std::nullopt, std::chrono::system_clock::now());
    auto intent = push.handle_click(n, "check-out");

    EXPECT_EQ(intent.url, "/?action=checkout");
    ASSERT_EQ(notifications.log.size(), 1u);
    EXPECT_EQ(notifications.log[0], "close:Attendance Tracker");
    ASSERT_EQ(clients.opened.size(), 1u);
    EXPECT_EQ(clients.opened[0], intent);
}

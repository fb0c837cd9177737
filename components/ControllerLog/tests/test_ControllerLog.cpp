/**
 * @file test_ControllerLog.cpp
 * @brief Unit tests for ControllerLog.h
 *
 * Tests cover: recording each hub signal, bounded eviction, category
 * filtering, tail formatting, and unsubscription on destruction.
 */
/*
FATP_META:
  meta_version: 1
  component: ControllerLog
  file_role: test
  path: components/ControllerLog/tests/test_ControllerLog.cpp
  namespace: fat_p::testing::controllerlog
  layer: Testing
  summary: Unit tests for ControllerLog - rolling history fed by the mode event hub.
  api_stability: in_work
  related:
    headers:
      - include/wifimode/ControllerLog.h
      - include/wifimode/ModeEvents.h
  hygiene:
    pragma_once: false
    include_guard: false
    defines_total: 0
    defines_unprefixed: 0
    undefs_total: 0
    includes_windows_h: false
*/

#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "ControllerLog.h"
#include "FatPTest.h"
#include "ModeEvents.h"
#include "SerialExecutor.h"
#include "SimulatedHardware.h"

namespace fat_p::testing::controllerlog
{

using wifimode::LogCategory;

class IgnoringClientListener final : public wifimode::ModeManagerListener<wifimode::ClientModeManager>
{
public:
    void onStarted(const wifimode::ClientModeManagerPtr&) override {}
    void onRoleChanged(const wifimode::ClientModeManagerPtr&) override {}
    void onStopped(const wifimode::ClientModeManagerPtr&) override {}
    void onStartFailure(const wifimode::ClientModeManagerPtr&) override {}
};

// ============================================================================
// Recording
// ============================================================================

FATP_TEST_CASE(empty_log_formats_placeholder)
{
    wifimode::events::ModeEventHub hub;
    wifimode::ControllerLog<> log(hub);

    FATP_ASSERT_TRUE(log.empty(), "Nothing recorded yet");
    FATP_ASSERT_EQ(log.formatTail(10), std::string("(no controller log entries)\n"), "Placeholder text");
    return true;
}

FATP_TEST_CASE(records_state_and_message_signals)
{
    wifimode::events::ModeEventHub hub;
    wifimode::ControllerLog<> log(hub);

    hub.onControllerStateChanged.emit("", "DisabledState");
    hub.onControllerStateChanged.emit("DisabledState", "EnabledState");
    hub.onMessageProcessed.emit("CMD_WIFI_TOGGLED", "DisabledState", "clients=1 softAps=0");
    hub.onWifiStateChanged.emit(wifimode::WifiState::Enabled);

    const auto states = log.byCategory(LogCategory::StateTransition);
    FATP_ASSERT_EQ(states.size(), std::size_t(2), "Two transitions");
    FATP_ASSERT_EQ(states[0].detail, std::string("initial -> DisabledState"), "First transition has no source");
    FATP_ASSERT_EQ(states[1].detail, std::string("DisabledState -> EnabledState"), "Second transition");

    const auto msgs = log.byCategory(LogCategory::Message);
    FATP_ASSERT_EQ(msgs.size(), std::size_t(1), "One message");
    FATP_ASSERT_EQ(msgs[0].subject, std::string("CMD_WIFI_TOGGLED"), "Subject is the message name");
    FATP_ASSERT_EQ(msgs[0].detail, std::string("in DisabledState (clients=1 softAps=0)"), "Handler and detail");

    FATP_ASSERT_EQ(log.byCategory(LogCategory::WifiState).front().subject, std::string("ENABLED"),
                   "Wifi state recorded by name");
    return true;
}

FATP_TEST_CASE(records_manager_and_primary_signals)
{
    wifimode::ManualClock    clock;
    wifimode::SerialExecutor executor{"log", [&clock] { return clock.now(); }};
    wifimode::sim::SimulatedChip chip;
    wifimode::sim::SimulatedModeManagerFactory factory{executor, chip};

    wifimode::events::ModeEventHub hub;
    wifimode::ControllerLog<> log(hub);

    auto client = factory.makeClientModeManager(std::make_shared<IgnoringClientListener>(),
                                                wifimode::WorkSource::settings(),
                                                wifimode::Role::ClientPrimary, false);
    (void)executor.dispatchReady();

    hub.onManagerAdded.emit(client);
    hub.onPrimaryChanged.emit(nullptr, client);
    hub.onSubsystemRestarting.emit();
    hub.onSubsystemRestarted.emit();
    hub.onSoftApStartFailed.emit(wifimode::SoftApIpMode::Tethered, "soft AP failed to start");

    const auto added = log.byCategory(LogCategory::ManagerAdded);
    FATP_ASSERT_EQ(added.size(), std::size_t(1), "One added entry");
    FATP_ASSERT_EQ(added[0].subject, "ClientModeManager#" + std::to_string(client->id()), "Manager described");
    FATP_ASSERT_EQ(added[0].detail, std::string("ROLE_CLIENT_PRIMARY"), "Role recorded");

    const auto primary = log.byCategory(LogCategory::PrimaryChanged);
    FATP_ASSERT_CONTAINS(primary[0].detail, "null -> ClientModeManager#", "Null previous primary");

    FATP_ASSERT_EQ(log.byCategory(LogCategory::Restarting).size(), std::size_t(1), "Restarting recorded");
    FATP_ASSERT_EQ(log.byCategory(LogCategory::Restarted).size(), std::size_t(1), "Restarted recorded");
    FATP_ASSERT_EQ(log.byCategory(LogCategory::SoftApFailure).front().subject, std::string("tethered"),
                   "Soft AP failure keyed by ip mode");
    return true;
}

// ============================================================================
// Bounds and formatting
// ============================================================================

FATP_TEST_CASE(oldest_entries_are_evicted)
{
    wifimode::events::ModeEventHub hub;
    wifimode::ControllerLog<4> log(hub);

    for (int i = 0; i < 6; ++i)
    {
        log.logInfo("note", std::to_string(i));
    }

    FATP_ASSERT_EQ(log.size(), std::size_t(4), "Capped at MaxEntries");
    FATP_ASSERT_EQ(log.all().front().detail, std::string("2"), "Oldest survivor is the third entry");

    const auto tail = log.recent(2);
    FATP_ASSERT_EQ(tail.size(), std::size_t(2), "recent(2)");
    FATP_ASSERT_EQ(tail.back().detail, std::string("5"), "Newest last");
    FATP_ASSERT_EQ(log.recent(50).size(), std::size_t(4), "recent() clamps to size");
    return true;
}

FATP_TEST_CASE(format_tail_uses_category_names)
{
    wifimode::events::ModeEventHub hub;
    wifimode::ControllerLog<> log(hub);

    hub.onSubsystemRestarting.emit();
    log.logInfo("native", "daemon died");

    const std::string text = log.formatTail(10);
    FATP_ASSERT_CONTAINS(text, "RESTARTING wifi: restarting", "Restarting line");
    FATP_ASSERT_CONTAINS(text, "INFO native: daemon died", "Info line");
    FATP_ASSERT_CONTAINS(text, "[+0ms]", "First line is the time origin");

    log.clear();
    FATP_ASSERT_TRUE(log.empty(), "clear() empties the log");
    return true;
}

FATP_TEST_CASE(destroyed_log_disconnects)
{
    wifimode::events::ModeEventHub hub;
    {
        wifimode::ControllerLog<> log(hub);
        hub.onSubsystemRestarted.emit();
        FATP_ASSERT_EQ(log.size(), std::size_t(1), "Recorded while alive");
    }
    // Must not touch the destroyed log.
    hub.onSubsystemRestarted.emit();
    hub.onWifiStateChanged.emit(wifimode::WifiState::Disabled);
    return true;
}

} // namespace fat_p::testing::controllerlog

namespace fat_p::testing
{

bool test_ControllerLog()
{
    FATP_PRINT_HEADER(CONTROLLER LOG)

    TestRunner runner;

    FATP_RUN_TEST_NS(runner, controllerlog, empty_log_formats_placeholder);
    FATP_RUN_TEST_NS(runner, controllerlog, records_state_and_message_signals);
    FATP_RUN_TEST_NS(runner, controllerlog, records_manager_and_primary_signals);
    FATP_RUN_TEST_NS(runner, controllerlog, oldest_entries_are_evicted);
    FATP_RUN_TEST_NS(runner, controllerlog, format_tail_uses_category_names);
    FATP_RUN_TEST_NS(runner, controllerlog, destroyed_log_disconnects);

    return 0 == runner.print_summary();
}

} // namespace fat_p::testing

#ifdef ENABLE_TEST_APPLICATION
int main()
{
    return fat_p::testing::test_ControllerLog() ? 0 : 1;
}
#endif

/**
 * @file test_ConsoleCore.cpp
 * @brief Integration tests for the console stack: CommandParser driving the
 *        controller over simulated hardware.
 *
 * Tests cover: every console command, usage errors and hostile input,
 * request answers appended to the command output, and the recovery sequence
 * driven through `wait`.
 */
/*
FATP_META:
  meta_version: 1
  component: ConsoleCore
  file_role: test
  path: components/ConsoleCore/tests/test_ConsoleCore.cpp
  namespace: fat_p::testing::consolecore
  layer: Testing
  summary: Integration tests for the console stack - commands, usage errors, recovery through wait.
  api_stability: in_work
  related:
    headers:
      - include/wifimode/CommandParser.h
      - include/wifimode/ModeController.h
      - include/wifimode/SimulatedHardware.h
  hygiene:
    pragma_once: false
    include_guard: false
    defines_total: 0
    defines_unprefixed: 0
    undefs_total: 0
    includes_windows_h: false
*/

#include <iostream>
#include <string>

#include "CommandParser.h"
#include "ControllerConfig.h"
#include "FatPTest.h"
#include "ModeController.h"
#include "SerialExecutor.h"
#include "SimulatedHardware.h"

namespace fat_p::testing::consolecore
{

wifimode::ControllerConfig consoleConfig()
{
    wifimode::ControllerConfig config;
    config.multiStaLocalOnlyEnabled     = true;
    config.multiStaMbbEnabled           = true;
    config.multiStaRestrictedEnabled    = true;
    config.multiStaMultiInternetEnabled = true;
    return config;
}

struct FullStack
{
    wifimode::ManualClock        clock;
    wifimode::SerialExecutor     executor{"console", [this] { return clock.now(); }};
    wifimode::sim::SimulatedWifi wifi{executor};
    wifimode::ModeController     controller{wifi.dependencies(), consoleConfig()};
    wifimode::CommandParser      cmd{controller, wifi, clock};

    FullStack()
    {
        controller.start();
        (void)cmd.settle();
    }

    void wifiOn() { (void)cmd.execute("wifi on"); }
};

// ============================================================================
// Basic commands
// ============================================================================

FATP_TEST_CASE(command_unknown_returns_error)
{
    FullStack f;
    auto result = f.cmd.execute("frobnicate");
    FATP_ASSERT_FALSE(result.success, "Unknown command should return failure");
    FATP_ASSERT_EQ(result.message, std::string("Unknown command: 'frobnicate'. Type 'help' for command list."),
                   "Error names the command");
    return true;
}

FATP_TEST_CASE(command_empty_line_ok)
{
    FullStack f;
    FATP_ASSERT_TRUE(f.cmd.execute("").success, "Empty line should succeed (no-op)");
    FATP_ASSERT_TRUE(f.cmd.execute("   \t ").success, "Whitespace-only line is a no-op");
    return true;
}

FATP_TEST_CASE(command_is_case_insensitive)
{
    FullStack f;
    auto result = f.cmd.execute("WIFI on");
    FATP_ASSERT_TRUE(result.success, "Upper-case command accepted");
    FATP_ASSERT_TRUE(f.controller.hasPrimaryClientModeManager(), "Toggle applied");
    return true;
}

FATP_TEST_CASE(command_help_returns_text)
{
    FullStack f;
    auto result = f.cmd.execute("help");
    FATP_ASSERT_TRUE(result.success, "help should succeed");
    FATP_ASSERT_CONTAINS(result.message, "wifi on|off", "Help lists the toggle");
    FATP_ASSERT_CONTAINS(result.message, "request <localonly|longlived|transient>", "Help lists requests");
    FATP_ASSERT_CONTAINS(result.message, "recovery_disable", "Help lists recovery_disable");
    FATP_ASSERT_CONTAINS(result.message, "wait <ms>", "Help lists wait");
    return true;
}

FATP_TEST_CASE(command_quit_sets_quit_flag)
{
    FullStack f;
    auto result = f.cmd.execute("quit");
    FATP_ASSERT_TRUE(result.quit, "quit should set quit flag");
    FATP_ASSERT_EQ(result.message, std::string("Goodbye."), "Farewell text");
    FATP_ASSERT_TRUE(f.cmd.execute("exit").quit, "exit should set quit flag");
    FATP_ASSERT_FALSE(f.cmd.execute("status").quit, "status does not quit");
    return true;
}

// ============================================================================
// Toggles
// ============================================================================

FATP_TEST_CASE(wifi_on_off_and_status)
{
    FullStack f;

    auto status = f.cmd.execute("status");
    FATP_ASSERT_CONTAINS(status.message, "Controller state: DisabledState", "Starts disabled");
    FATP_ASSERT_CONTAINS(status.message, "(none)", "No managers listed");

    auto on = f.cmd.execute("wifi on");
    FATP_ASSERT_TRUE(on.success, "wifi on succeeds");
    FATP_ASSERT_EQ(on.message, std::string("wifi on"), "Echo");

    status = f.cmd.execute("status");
    FATP_ASSERT_CONTAINS(status.message, "Controller state: EnabledState", "Enabled after toggle");
    FATP_ASSERT_CONTAINS(status.message, "Wi-Fi state: ENABLED", "Wifi enabled");
    FATP_ASSERT_CONTAINS(status.message, "ClientModeManager#", "Primary listed");

    (void)f.cmd.execute("wifi off");
    status = f.cmd.execute("status");
    FATP_ASSERT_CONTAINS(status.message, "Controller state: DisabledState", "Disabled after toggle off");
    return true;
}

FATP_TEST_CASE(toggle_usage_errors)
{
    FullStack f;

    auto none = f.cmd.execute("wifi");
    FATP_ASSERT_FALSE(none.success, "Missing argument fails");
    FATP_ASSERT_EQ(none.message, std::string("Usage: wifi on|off"), "Usage text");

    auto bad = f.cmd.execute("airplane maybe");
    FATP_ASSERT_FALSE(bad.success, "Bad argument fails");
    FATP_ASSERT_EQ(bad.message, std::string("Usage: airplane on|off"), "Usage names the command");

    FATP_ASSERT_FALSE(f.cmd.execute("ecm on off").success, "Extra argument fails");
    FATP_ASSERT_TRUE(f.controller.registry().empty(), "Nothing happened");
    return true;
}

FATP_TEST_CASE(scan_settings_start_scan_only)
{
    FullStack f;
    (void)f.cmd.execute("location on");
    (void)f.cmd.execute("scanalways on");

    FATP_ASSERT_TRUE(f.controller.scanOnlyClientModeManager() != nullptr, "Scan-only running");
    FATP_ASSERT_CONTAINS(f.cmd.execute("status").message, "Wi-Fi state: DISABLED", "Scan-only is not wifi on");
    return true;
}

FATP_TEST_CASE(airplane_and_satellite)
{
    FullStack f;
    f.wifiOn();

    (void)f.cmd.execute("airplane on");
    FATP_ASSERT_TRUE(f.controller.registry().empty(), "Airplane turns wifi off");
    (void)f.cmd.execute("airplane off");
    FATP_ASSERT_TRUE(f.controller.hasPrimaryClientModeManager(), "Airplane off restores wifi");

    (void)f.cmd.execute("satellite on");
    FATP_ASSERT_TRUE(f.controller.registry().empty(), "Satellite turns wifi off");
    (void)f.cmd.execute("satellite off");
    FATP_ASSERT_TRUE(f.controller.hasPrimaryClientModeManager(), "Satellite off restores wifi");
    return true;
}

FATP_TEST_CASE(emergency_commands)
{
    FullStack f;
    f.wifiOn();

    (void)f.cmd.execute("ecm on");
    auto status = f.cmd.execute("status");
    FATP_ASSERT_CONTAINS(status.message, "Emergency mode: yes", "In emergency mode");
    FATP_ASSERT_TRUE(f.controller.registry().empty(), "Wifi off in emergency callback mode");

    (void)f.cmd.execute("ecm off");
    FATP_ASSERT_CONTAINS(f.cmd.execute("status").message, "Emergency mode: no", "Emergency mode exited");
    FATP_ASSERT_TRUE(f.controller.hasPrimaryClientModeManager(), "Wifi restored");

    (void)f.cmd.execute("wifi off");
    (void)f.cmd.execute("escan on");
    FATP_ASSERT_TRUE(f.controller.scanOnlyClientModeManager() != nullptr, "Emergency scan runs scan-only");
    (void)f.cmd.execute("escan off");
    FATP_ASSERT_TRUE(f.controller.registry().empty(), "Scan-only stopped");
    return true;
}

// ============================================================================
// Soft AP
// ============================================================================

FATP_TEST_CASE(ap_start_and_stop)
{
    FullStack f;

    auto start = f.cmd.execute("ap start tethered MyHotspot");
    FATP_ASSERT_TRUE(start.success, "Start accepted");
    FATP_ASSERT_EQ(start.message, std::string("Soft AP start requested: MyHotspot"), "Echo ssid");
    FATP_ASSERT_TRUE(f.controller.tetheredSoftApManager() != nullptr, "Tethered AP up");

    auto stop = f.cmd.execute("ap stop tethered");
    FATP_ASSERT_TRUE(stop.success, "Stop accepted");
    FATP_ASSERT_TRUE(f.controller.tetheredSoftApManager() == nullptr, "Tethered AP down");
    FATP_ASSERT_CONTAINS(f.cmd.execute("graveyard").message, "SoftApManager", "AP buried");
    return true;
}

FATP_TEST_CASE(ap_usage_errors)
{
    FullStack f;
    FATP_ASSERT_FALSE(f.cmd.execute("ap").success, "Missing action");
    FATP_ASSERT_FALSE(f.cmd.execute("ap start").success, "Missing mode");
    FATP_ASSERT_FALSE(f.cmd.execute("ap start bridged").success, "Unknown mode");
    FATP_ASSERT_FALSE(f.cmd.execute("ap stop bridged").success, "Unknown stop mode");

    const std::string longSsid(40, 'x');
    auto tooLong = f.cmd.execute("ap start localonly " + longSsid);
    FATP_ASSERT_FALSE(tooLong.success, "Oversized ssid rejected");
    FATP_ASSERT_CONTAINS(tooLong.message, "Soft AP start rejected", "Rejection reported");
    FATP_ASSERT_TRUE(f.controller.registry().empty(), "Nothing started");
    return true;
}

// ============================================================================
// Additional client requests
// ============================================================================

FATP_TEST_CASE(request_answer_is_appended)
{
    FullStack f;
    f.wifiOn();

    auto result = f.cmd.execute("request longlived Work");
    FATP_ASSERT_TRUE(result.success, "Request accepted");
    FATP_ASSERT_CONTAINS(result.message, "Request longlived submitted for Work", "Submission echoed");
    FATP_ASSERT_CONTAINS(result.message, "Request longlived answered: ClientModeManager#", "Answer appended");
    FATP_ASSERT_CONTAINS(f.cmd.execute("status").message, "Secondary requestors: 1", "Requestor tracked");
    return true;
}

FATP_TEST_CASE(request_while_disabled_is_answered_null)
{
    FullStack f;
    auto result = f.cmd.execute("request transient Foo AA:BB:CC:DD:EE:FF");
    FATP_ASSERT_TRUE(result.success, "Submission itself succeeds");
    FATP_ASSERT_CONTAINS(result.message, "Request transient answered: rejected (null)", "Null answer shown");
    return true;
}

FATP_TEST_CASE(request_usage_errors)
{
    FullStack f;
    FATP_ASSERT_FALSE(f.cmd.execute("request").success, "Missing arguments");
    FATP_ASSERT_FALSE(f.cmd.execute("request bogus Foo").success, "Unknown kind");
    FATP_ASSERT_FALSE(f.cmd.execute("request transient Foo bssid extra").success, "Too many arguments");
    return true;
}

FATP_TEST_CASE(remove_by_id)
{
    FullStack f;
    f.wifiOn();
    (void)f.cmd.execute("request longlived Work");
    auto secondary = f.controller.clientModeManagerInRole(wifimode::Role::ClientSecondaryLongLived);
    FATP_ASSERT_TRUE(secondary != nullptr, "Secondary up");

    auto result = f.cmd.execute("remove " + std::to_string(secondary->id()));
    FATP_ASSERT_TRUE(result.success, "Remove accepted");
    FATP_ASSERT_TRUE(f.controller.clientModeManagerInRole(wifimode::Role::ClientSecondaryLongLived) == nullptr,
                     "Secondary stopped");

    auto missing = f.cmd.execute("remove 999");
    FATP_ASSERT_FALSE(missing.success, "Unknown id fails");
    FATP_ASSERT_EQ(missing.message, std::string("No client mode manager with id 999"), "Names the id");

    FATP_ASSERT_FALSE(f.cmd.execute("remove abc").success, "Non-numeric id fails");
    FATP_ASSERT_FALSE(f.cmd.execute("remove -1").success, "Negative id fails");
    return true;
}

FATP_TEST_CASE(connect_publishes_current_network)
{
    FullStack f;
    f.wifiOn();
    auto primary = f.controller.primaryClientModeManagerNullable();

    auto result = f.cmd.execute("connect " + std::to_string(primary->id()) + " Home AA:BB:CC:DD:EE:FF");
    FATP_ASSERT_TRUE(result.success, "Connect accepted");
    FATP_ASSERT_CONTAINS(f.cmd.execute("status").message, "Current network:", "Network shown in status");

    FATP_ASSERT_FALSE(f.cmd.execute("connect 999 Home AA:BB:CC:DD:EE:FF").success, "Unknown id fails");
    FATP_ASSERT_FALSE(f.cmd.execute("connect 1 Home").success, "Missing bssid fails");
    return true;
}

// ============================================================================
// Recovery and time
// ============================================================================

FATP_TEST_CASE(recovery_completes_after_wait)
{
    FullStack f;
    f.wifiOn();

    auto result = f.cmd.execute("recovery firmware crash");
    FATP_ASSERT_EQ(result.message, std::string("Recovery restart requested: firmware crash"), "Reason echoed");
    FATP_ASSERT_TRUE(f.controller.isRecoveryInProgress(), "Waiting for the restart delay");
    FATP_ASSERT_EQ(f.wifi.services.bugReports.front().title, std::string("Wi-Fi BugReport: firmware crash"),
                   "Bug report carries the reason");

    auto wait = f.cmd.execute("wait 2000");
    FATP_ASSERT_EQ(wait.message, std::string("Advanced clock by 2000 ms"), "Wait echoed");
    FATP_ASSERT_FALSE(f.controller.isRecoveryInProgress(), "Recovery done");
    FATP_ASSERT_TRUE(f.controller.hasPrimaryClientModeManager(), "Primary back");
    return true;
}

FATP_TEST_CASE(daemon_death_routes_through_recovery)
{
    FullStack f;
    f.wifiOn();

    auto result = f.cmd.execute("daemon_died");
    FATP_ASSERT_TRUE(result.success, "Accepted");
    FATP_ASSERT_EQ(f.wifi.services.recoveryTriggers.size(), std::size_t(1), "Recovery coordinator triggered");
    FATP_ASSERT_TRUE(f.controller.isRecoveryInProgress(), "Console wires the trigger to a restart");

    (void)f.cmd.execute("wait 2000");
    FATP_ASSERT_TRUE(f.controller.hasPrimaryClientModeManager(), "Primary back after the delay");
    return true;
}

FATP_TEST_CASE(recovery_disable_turns_wifi_off)
{
    FullStack f;
    f.wifiOn();
    (void)f.cmd.execute("recovery_disable");
    FATP_ASSERT_TRUE(f.controller.registry().empty(), "Everything stopped");
    return true;
}

FATP_TEST_CASE(wait_usage_errors)
{
    FullStack f;
    FATP_ASSERT_FALSE(f.cmd.execute("wait").success, "Missing ms");
    FATP_ASSERT_FALSE(f.cmd.execute("wait soon").success, "Non-numeric ms");
    FATP_ASSERT_FALSE(f.cmd.execute("wait 99999999999").success, "Absurd ms rejected");
    return true;
}

// ============================================================================
// Introspection
// ============================================================================

FATP_TEST_CASE(log_dump_and_graveyard)
{
    FullStack f;
    f.wifiOn();
    (void)f.cmd.execute("wifi off");

    auto log = f.cmd.execute("log 5");
    FATP_ASSERT_TRUE(log.success, "log succeeds");
    FATP_ASSERT_CONTAINS(log.message, "DisabledState", "State transitions logged");
    FATP_ASSERT_FALSE(f.cmd.execute("log x").success, "Bad count fails");

    auto dump = f.cmd.execute("dump");
    FATP_ASSERT_CONTAINS(dump.message, "Current wifi mode: DisabledState", "Dump shows state");
    FATP_ASSERT_CONTAINS(dump.message, "Controller log:", "Dump includes the log");

    auto graveyard = f.cmd.execute("graveyard");
    FATP_ASSERT_CONTAINS(graveyard.message, "Graveyard: 1 client(s)", "Stopped primary buried");
    FATP_ASSERT_CONTAINS(graveyard.message, "ROLE_CLIENT_PRIMARY", "Last role listed");
    return true;
}

FATP_TEST_CASE(hostile_input_does_not_break_parser)
{
    FullStack f;
    FATP_ASSERT_FALSE(f.cmd.execute("\x01\x02\x03").success, "Control characters rejected");
    FATP_ASSERT_FALSE(f.cmd.execute(std::string(4096, 'a')).success, "Very long token rejected");
    FATP_ASSERT_FALSE(f.cmd.execute("remove 1; wifi on").success, "No command chaining");

    f.wifiOn();
    FATP_ASSERT_TRUE(f.controller.hasPrimaryClientModeManager(), "Parser still works afterwards");
    return true;
}

} // namespace fat_p::testing::consolecore

// ============================================================================
// Public interface
// ============================================================================

namespace fat_p::testing
{

bool test_ConsoleCore()
{
    FATP_PRINT_HEADER(CONSOLE CORE)

    TestRunner runner;

    FATP_RUN_TEST_NS(runner, consolecore, command_unknown_returns_error);
    FATP_RUN_TEST_NS(runner, consolecore, command_empty_line_ok);
    FATP_RUN_TEST_NS(runner, consolecore, command_is_case_insensitive);
    FATP_RUN_TEST_NS(runner, consolecore, command_help_returns_text);
    FATP_RUN_TEST_NS(runner, consolecore, command_quit_sets_quit_flag);
    FATP_RUN_TEST_NS(runner, consolecore, wifi_on_off_and_status);
    FATP_RUN_TEST_NS(runner, consolecore, toggle_usage_errors);
    FATP_RUN_TEST_NS(runner, consolecore, scan_settings_start_scan_only);
    FATP_RUN_TEST_NS(runner, consolecore, airplane_and_satellite);
    FATP_RUN_TEST_NS(runner, consolecore, emergency_commands);
    FATP_RUN_TEST_NS(runner, consolecore, ap_start_and_stop);
    FATP_RUN_TEST_NS(runner, consolecore, ap_usage_errors);
    FATP_RUN_TEST_NS(runner, consolecore, request_answer_is_appended);
    FATP_RUN_TEST_NS(runner, consolecore, request_while_disabled_is_answered_null);
    FATP_RUN_TEST_NS(runner, consolecore, request_usage_errors);
    FATP_RUN_TEST_NS(runner, consolecore, remove_by_id);
    FATP_RUN_TEST_NS(runner, consolecore, connect_publishes_current_network);
    FATP_RUN_TEST_NS(runner, consolecore, recovery_completes_after_wait);
    FATP_RUN_TEST_NS(runner, consolecore, daemon_death_routes_through_recovery);
    FATP_RUN_TEST_NS(runner, consolecore, recovery_disable_turns_wifi_off);
    FATP_RUN_TEST_NS(runner, consolecore, wait_usage_errors);
    FATP_RUN_TEST_NS(runner, consolecore, log_dump_and_graveyard);
    FATP_RUN_TEST_NS(runner, consolecore, hostile_input_does_not_break_parser);

    return 0 == runner.print_summary();
}

} // namespace fat_p::testing

#ifdef ENABLE_TEST_APPLICATION
int main()
{
    return fat_p::testing::test_ConsoleCore() ? 0 : 1;
}
#endif

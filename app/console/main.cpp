/**
 * @file main.cpp
 * @brief Entry point for the wifimode interactive console simulator.
 */
/*
FATP_META:
  meta_version: 1
  component: WifiModeConsole
  file_role: source
  path: app/console/main.cpp
  namespace: ""
  layer: Testing
  summary: Interactive console REPL driving the mode controller against simulated hardware.
  api_stability: in_work
  related:
    headers:
      - include/wifimode/CommandParser.h
      - include/wifimode/ModeController.h
      - include/wifimode/SimulatedHardware.h
      - include/wifimode/SerialExecutor.h
  hygiene:
    pragma_once: false
    include_guard: false
    defines_total: 0
    defines_unprefixed: 0
    undefs_total: 0
    includes_windows_h: false
*/

#include "CommandParser.h"
#include "ControllerConfig.h"
#include "ModeController.h"
#include "SerialExecutor.h"
#include "SimulatedHardware.h"

#include <exception>
#include <iostream>
#include <string>
#include <string_view>

// Anonymous namespace: compile-time ANSI escape string constants, no mutable state.
namespace
{

constexpr const char* kReset  = "\033[0m";
constexpr const char* kRed    = "\033[31m";
constexpr const char* kGreen  = "\033[32m";
constexpr const char* kYellow = "\033[33m";
constexpr const char* kCyan   = "\033[36m";

void printBanner()
{
    std::cout
        << kCyan
        << "+---------------------------------------+\n"
           "|   wifimode  controller simulator      |\n"
           "|   two STA + one AP simulated chip     |\n"
           "+---------------------------------------+\n"
        << kReset
        << "Type 'help' for available commands.\n\n";
}

void printPrompt(std::string_view stateName, std::string_view wifiState)
{
    std::cout << kCyan << "[" << stateName << " / " << wifiState << "]" << kReset << " > " << std::flush;
}

void printResult(const wifimode::CommandResult& result)
{
    if (result.message.empty()) { return; }

    if (result.success)
        std::cout << kGreen << result.message << kReset << "\n";
    else
        std::cout << kRed << result.message << kReset << "\n";
}

} // anonymous namespace

int main()
{
    wifimode::ManualClock    clock;
    wifimode::SerialExecutor executor("wifimode-console", [&clock] { return clock.now(); });
    wifimode::sim::SimulatedWifi wifi(executor);

    wifimode::ControllerConfig config;
    config.multiStaLocalOnlyEnabled     = true;
    config.multiStaMbbEnabled           = true;
    config.multiStaRestrictedEnabled    = true;
    config.multiStaMultiInternetEnabled = true;

    try
    {
        wifimode::ModeController controller(wifi.dependencies(), config);
        wifimode::CommandParser  cmd{controller, wifi, clock};

        controller.start();
        cmd.settle();

        printBanner();

        std::string line;
        while (true)
        {
            printPrompt(controller.currentStateName(), wifimode::wifiStateName(controller.wifiState()));

            if (!std::getline(std::cin, line))
            {
                std::cout << "\n" << kYellow << "EOF, exiting." << kReset << "\n";
                break;
            }

            const wifimode::CommandResult result = cmd.execute(line);
            printResult(result);

            if (result.quit) { break; }
            std::cout << "\n";
        }

        controller.notifyShuttingDown();
    }
    catch (const std::exception& e)
    {
        std::cerr << kRed << "fatal: " << e.what() << kReset << "\n";
        return 1;
    }
    return 0;
}

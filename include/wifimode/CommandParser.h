#pragma once

/*
FATP_META:
  meta_version: 1
  component: CommandParser
  file_role: public_header
  path: include/wifimode/CommandParser.h
  namespace: wifimode
  layer: Domain
  summary: Console command interpreter for the wifi mode simulation. Presentation/domain boundary.
  api_stability: in_work
  related:
    tests:
      - components/ConsoleCore/tests/test_ConsoleCore.cpp
  hygiene:
    pragma_once: true
    include_guard: false
    defines_total: 0
    defines_unprefixed: 0
    undefs_total: 0
    includes_windows_h: false
*/

/**
 * @file CommandParser.h
 * @brief Console command interpreter.
 *
 * @details
 * CommandParser is the ONLY file that may produce output strings directly.
 * The controller, the registry and the simulated hardware never write to
 * stdout; they return Expected<> or emit signals.
 *
 * The executor runs in manual-dispatch mode under a ManualClock. execute()
 * applies one command and then dispatches every task that became due, so the
 * controller has settled by the time the result is returned. `wait <ms>`
 * advances the clock, which is how delayed recovery work is released.
 *
 * Command set:
 * @code
 *   wifi on|off                 -- user wifi toggle
 *   airplane on|off             -- airplane mode
 *   satellite on|off            -- satellite mode
 *   scanalways on|off           -- scan-always-available setting
 *   location on|off             -- location mode
 *   ap start tethered|localonly [ssid]
 *   ap stop [tethered|localonly]
 *   ecm on|off                  -- emergency callback mode
 *   ecall on|off                -- emergency call
 *   escan on|off                -- emergency scan in progress
 *   request <localonly|longlived|transient> <ssid> [bssid]
 *   remove <id>                 -- remove an additional client manager
 *   connect <id> <ssid> <bssid> -- associate a simulated client
 *   recovery [reason]           -- restart wifi with a bug report
 *   recovery_disable            -- throttled recovery, turn wifi off
 *   daemon_died                 -- native daemon failure
 *   wait <ms>                   -- advance the clock
 *   status | graveyard | log [n] | dump | help | quit
 * @endcode
 */

#include "ModeController.h"
#include "ModeManager.h"
#include "Roles.h"
#include "SerialExecutor.h"
#include "SimulatedHardware.h"
#include "WorkSource.h"

#include <cctype>
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace wifimode
{

/**
 * @brief Result of a command execution.
 *
 * success: true = normal output; false = error output (different display color)
 * message: the string to display
 * quit:    true = application should exit
 */
struct CommandResult
{
    bool success = true;
    std::string message;
    bool quit = false;
};

/**
 * @brief Parses and executes console commands against the controller and the
 *        simulated hardware.
 *
 * Holds non-owning references; everything referenced must outlive the parser.
 */
class CommandParser
{
public:
    /// App uid used for console requests.
    static constexpr int kConsoleUid = 10123;

    CommandParser(ModeController& controller, sim::SimulatedWifi& wifi, ManualClock& clock)
        : mController(controller)
        , mWifi(wifi)
        , mClock(clock)
        , mAnswers(std::make_shared<std::vector<std::string>>())
    {
        mWifi.services.onTrigger = [this](const std::string& reason)
        {
            mController.recoveryRestartWifi(reason, true);
        };
    }

    ~CommandParser() { mWifi.services.onTrigger = nullptr; }

    CommandParser(const CommandParser&) = delete;
    CommandParser& operator=(const CommandParser&) = delete;

    /**
     * @brief Parses and executes a single command line, then lets the
     *        controller settle.
     */
    [[nodiscard]] CommandResult execute(std::string_view line)
    {
        auto tokens = tokenize(line);
        if (tokens.empty())
        {
            return {true, {}};
        }

        std::string cmd = tokens.front();
        for (char& c : cmd)
        {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        tokens.erase(tokens.begin());

        CommandResult result = dispatch(cmd, tokens);
        settle();
        appendAnswers(result);
        return result;
    }

    /// Runs every task due now.
    std::size_t settle() { return mWifi.executor.dispatchReady(); }

    [[nodiscard]] static std::string helpText()
    {
        return
            "Available commands:\n"
            "  wifi on|off                   -- user wifi toggle\n"
            "  airplane on|off               -- airplane mode\n"
            "  satellite on|off              -- satellite mode\n"
            "  scanalways on|off             -- scan always available\n"
            "  location on|off               -- location mode\n"
            "  ap start tethered|localonly [ssid]\n"
            "  ap stop [tethered|localonly]  -- stop soft APs (all by default)\n"
            "  ecm on|off                    -- emergency callback mode\n"
            "  ecall on|off                  -- emergency call\n"
            "  escan on|off                  -- emergency scan in progress\n"
            "  request <localonly|longlived|transient> <ssid> [bssid]\n"
            "  remove <id>                   -- remove an additional client manager\n"
            "  connect <id> <ssid> <bssid>   -- associate a simulated client\n"
            "  recovery [reason]             -- restart wifi and take a bug report\n"
            "  recovery_disable              -- throttled recovery, turn wifi off\n"
            "  daemon_died                   -- simulate a native daemon failure\n"
            "  wait <ms>                     -- advance the simulated clock\n"
            "  status                        -- controller state and live managers\n"
            "  graveyard                     -- recently stopped managers\n"
            "  log [n]                       -- show last n controller log entries (default 20)\n"
            "  dump                          -- full controller dump\n"
            "  help                          -- show this list\n"
            "  quit                          -- exit\n";
    }

private:
    ModeController&     mController;
    sim::SimulatedWifi& mWifi;
    ManualClock&        mClock;

    /// Answers delivered to console requests, drained after each command.
    std::shared_ptr<std::vector<std::string>> mAnswers;

    using Args = std::vector<std::string>;

    static Args tokenize(std::string_view line)
    {
        Args tokens;
        std::size_t pos = 0;
        while (pos < line.size())
        {
            pos = line.find_first_not_of(" \t\r\n", pos);
            if (pos == std::string_view::npos)
            {
                break;
            }
            auto end = line.find_first_of(" \t\r\n", pos);
            if (end == std::string_view::npos)
            {
                end = line.size();
            }
            tokens.emplace_back(line.substr(pos, end - pos));
            pos = end;
        }
        return tokens;
    }

    static std::optional<bool> parseOnOff(const Args& args)
    {
        if (args.size() != 1)
        {
            return std::nullopt;
        }
        if (args[0] == "on")  { return true; }
        if (args[0] == "off") { return false; }
        return std::nullopt;
    }

    static std::optional<unsigned long> parseNumber(const std::string& text)
    {
        if (text.empty() || text.size() > 9)
        {
            return std::nullopt;
        }
        unsigned long value = 0;
        for (char c : text)
        {
            if (!std::isdigit(static_cast<unsigned char>(c)))
            {
                return std::nullopt;
            }
            value = value * 10 + static_cast<unsigned long>(c - '0');
        }
        return value;
    }

    static WorkSource consoleWs()
    {
        return WorkSource(kConsoleUid, "com.example.console", RequestorPriority::Foreground);
    }

    CommandResult dispatch(const std::string& cmd, const Args& args)
    {
        if (cmd == "wifi")       { return cmdToggle(args, "wifi", [this](bool on) { mWifi.settings.setWifiToggle(on); mController.wifiToggled(WorkSource::settings()); }); }
        if (cmd == "airplane")   { return cmdToggle(args, "airplane", [this](bool on) { mWifi.settings.setAirplaneMode(on); mController.airplaneModeToggled(); }); }
        if (cmd == "satellite")  { return cmdToggle(args, "satellite", [this](bool on) { mWifi.settings.setSatelliteMode(on); mController.satelliteModeChanged(); }); }
        if (cmd == "scanalways") { return cmdToggle(args, "scanalways", [this](bool on) { mWifi.settings.setScanAlwaysAvailable(on); mController.scanAlwaysModeChanged(); }); }
        if (cmd == "location")   { return cmdToggle(args, "location", [this](bool on) { mWifi.settings.setLocationMode(on); mController.locationModeChanged(); }); }
        if (cmd == "ecm")        { return cmdToggle(args, "ecm", [this](bool on) { mController.emergencyCallbackModeChanged(on); }); }
        if (cmd == "ecall")      { return cmdToggle(args, "ecall", [this](bool on) { mController.emergencyCallStateChanged(on); }); }
        if (cmd == "escan")      { return cmdToggle(args, "escan", [this](bool on) { mController.setEmergencyScanRequestInProgress(on); }); }
        if (cmd == "ap")         { return cmdAp(args); }
        if (cmd == "request")    { return cmdRequest(args); }
        if (cmd == "remove")     { return cmdRemove(args); }
        if (cmd == "connect")    { return cmdConnect(args); }
        if (cmd == "recovery")   { return cmdRecovery(args); }
        if (cmd == "recovery_disable")
        {
            mController.recoveryDisableWifi();
            return {true, "Recovery disable requested."};
        }
        if (cmd == "daemon_died")
        {
            mController.onNativeStatusChanged(false);
            return {true, "Native daemon failure reported."};
        }
        if (cmd == "wait")      { return cmdWait(args); }
        if (cmd == "status")    { return cmdStatus(); }
        if (cmd == "graveyard") { return {true, mController.graveyard().dump()}; }
        if (cmd == "log")       { return cmdLog(args); }
        if (cmd == "dump")      { return {true, mController.dump()}; }
        if (cmd == "help")      { return {true, helpText()}; }
        if (cmd == "quit" || cmd == "exit") { return {true, "Goodbye.", true}; }

        return {false, "Unknown command: '" + cmd + "'. Type 'help' for command list."};
    }

    template <typename Apply>
    CommandResult cmdToggle(const Args& args, const std::string& name, Apply apply)
    {
        auto on = parseOnOff(args);
        if (!on)
        {
            return {false, "Usage: " + name + " on|off"};
        }
        apply(*on);
        return {true, name + (*on ? " on" : " off")};
    }

    CommandResult cmdAp(const Args& args)
    {
        if (args.empty())
        {
            return {false, "Usage: ap start tethered|localonly [ssid] | ap stop [tethered|localonly]"};
        }
        const std::string& action = args[0];
        if (action == "stop")
        {
            SoftApIpMode mode = SoftApIpMode::Unspecified;
            if (args.size() > 1)
            {
                auto parsed = parseIpMode(args[1]);
                if (!parsed)
                {
                    return {false, "Usage: ap stop [tethered|localonly]"};
                }
                mode = *parsed;
            }
            mController.stopSoftAp(mode);
            return {true, "Soft AP stop requested (" + std::string(ipModeName(mode)) + ")"};
        }
        if (action != "start" || args.size() < 2)
        {
            return {false, "Usage: ap start tethered|localonly [ssid]"};
        }
        auto mode = parseIpMode(args[1]);
        if (!mode)
        {
            return {false, "Usage: ap start tethered|localonly [ssid]"};
        }

        SoftApModeConfiguration config;
        config.targetMode = *mode;
        config.config.ssid = args.size() > 2 ? args[2]
                                             : (*mode == SoftApIpMode::Tethered ? "ConsoleTether" : "ConsoleLocalOnly");
        config.config.passphrase = "consolepass";

        auto res = mController.startSoftAp(config, consoleWs());
        if (!res)
        {
            return {false, "Soft AP start rejected: " + res.error()};
        }
        return {true, "Soft AP start requested: " + config.config.ssid};
    }

    static std::optional<SoftApIpMode> parseIpMode(const std::string& text)
    {
        if (text == "tethered")  { return SoftApIpMode::Tethered; }
        if (text == "localonly") { return SoftApIpMode::LocalOnly; }
        return std::nullopt;
    }

    CommandResult cmdRequest(const Args& args)
    {
        if (args.size() < 2 || args.size() > 3)
        {
            return {false, "Usage: request <localonly|longlived|transient> <ssid> [bssid]"};
        }
        const std::string& kind = args[0];
        const std::string& ssid = args[1];
        std::optional<std::string> bssid;
        if (args.size() == 3)
        {
            bssid = args[2];
        }

        auto answers = mAnswers;
        auto listener = [answers, kind](const ClientModeManagerPtr& manager)
        {
            answers->push_back("Request " + kind + " answered: "
                               + (manager ? manager->describe() : std::string("rejected (null)")));
        };

        auto submit = [&]() -> std::optional<fat_p::Expected<void, std::string>>
        {
            if (kind == "localonly")
            {
                return mController.requestLocalOnlyClientModeManager(listener, consoleWs(), ssid,
                                                                     bssid.value_or(std::string()), false, false);
            }
            if (kind == "longlived")
            {
                return mController.requestSecondaryLongLivedClientModeManager(listener, consoleWs(), ssid, bssid);
            }
            if (kind == "transient")
            {
                return mController.requestSecondaryTransientClientModeManager(listener, consoleWs(), ssid, bssid);
            }
            return std::nullopt;
        };

        auto submitted = submit();
        if (!submitted)
        {
            return {false, "Usage: request <localonly|longlived|transient> <ssid> [bssid]"};
        }
        const auto& res = *submitted;
        if (!res)
        {
            return {false, "Request rejected: " + res.error()};
        }
        return {true, "Request " + kind + " submitted for " + ssid};
    }

    CommandResult cmdRemove(const Args& args)
    {
        if (args.size() != 1)
        {
            return {false, "Usage: remove <id>"};
        }
        auto id = parseNumber(args[0]);
        if (!id)
        {
            return {false, "Usage: remove <id>  (id must be a number)"};
        }
        auto manager = mController.registry().findClient(static_cast<ManagerId>(*id));
        if (!manager)
        {
            return {false, "No client mode manager with id " + args[0]};
        }
        mController.removeClientModeManager(manager);
        return {true, "Remove requested for " + manager->describe()};
    }

    CommandResult cmdConnect(const Args& args)
    {
        if (args.size() != 3)
        {
            return {false, "Usage: connect <id> <ssid> <bssid>"};
        }
        auto id = parseNumber(args[0]);
        if (!id)
        {
            return {false, "Usage: connect <id> <ssid> <bssid>  (id must be a number)"};
        }
        auto manager = mWifi.factory.findClient(static_cast<ManagerId>(*id));
        if (!manager || manager->isStopped())
        {
            return {false, "No live client mode manager with id " + args[0]};
        }
        manager->connect(args[1], args[2]);
        mController.updateCurrentConnectionInfo();
        return {true, "Connected: " + manager->describe()};
    }

    CommandResult cmdRecovery(const Args& args)
    {
        std::string reason;
        for (const auto& word : args)
        {
            if (!reason.empty()) { reason += ' '; }
            reason += word;
        }
        mController.recoveryRestartWifi(reason, true);
        return {true, "Recovery restart requested" + (reason.empty() ? std::string() : ": " + reason)};
    }

    CommandResult cmdWait(const Args& args)
    {
        if (args.size() != 1)
        {
            return {false, "Usage: wait <ms>"};
        }
        auto ms = parseNumber(args[0]);
        if (!ms)
        {
            return {false, "Usage: wait <ms>  (ms must be a positive integer)"};
        }
        mClock.advance(std::chrono::milliseconds(*ms));
        return {true, "Advanced clock by " + args[0] + " ms"};
    }

    CommandResult cmdStatus()
    {
        std::ostringstream oss;
        oss << "Controller state: " << mController.currentStateName() << "\n";
        oss << "Wi-Fi state: " << wifiStateName(mController.wifiState()) << "\n";
        oss << "Emergency mode: " << (mController.isInEmergencyMode() ? "yes" : "no") << "\n";

        const auto& registry = mController.registry();
        oss << "\nActive mode managers:\n";
        if (registry.empty())
        {
            oss << "  (none)\n";
        }
        else
        {
            for (const auto& manager : registry.activeManagers())
            {
                oss << "  " << manager->describe() << "\n";
            }
        }

        if (auto network = mController.currentNetwork())
        {
            oss << "\nCurrent network: " << network->netId << "\n";
        }
        oss << "STA bands: 0x" << std::hex << mWifi.settings.cachedStaBands() << std::dec << "\n";
        oss << "Secondary requestors: " << mController.secondaryRequestWorkSources().size() << "\n";
        return {true, oss.str()};
    }

    CommandResult cmdLog(const Args& args)
    {
        std::size_t n = 20;
        if (!args.empty())
        {
            auto parsed = parseNumber(args[0]);
            if (!parsed || args.size() > 1)
            {
                return {false, "Usage: log [n]  (n must be a positive integer)"};
            }
            n = static_cast<std::size_t>(*parsed);
        }
        return {true, mController.controllerLog().formatTail(n)};
    }

    void appendAnswers(CommandResult& result)
    {
        for (const auto& answer : *mAnswers)
        {
            if (!result.message.empty())
            {
                result.message += "\n";
            }
            result.message += answer;
        }
        mAnswers->clear();
    }
};

} // namespace wifimode

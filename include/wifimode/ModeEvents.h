#pragma once

/*
FATP_META:
  meta_version: 1
  component: ModeEvents
  file_role: public_header
  path: include/wifimode/ModeEvents.h
  namespace: wifimode::events
  layer: Domain
  summary: Typed Signal-based event hub for mode manager, primary and controller notifications.
  api_stability: in_work
  related:
    tests:
      - components/ControllerLog/tests/test_ControllerLog.cpp
      - components/ModeController/tests/test_ModeController.cpp
  hygiene:
    pragma_once: true
    include_guard: false
    defines_total: 0
    defines_unprefixed: 0
    undefs_total: 0
    includes_windows_h: false
*/

/**
 * @file ModeEvents.h
 * @brief Typed event hub for mode manager lifecycle and controller notifications.
 *
 * @details
 * Two observer families hang off the hub:
 *   - structural: added / removed / role-changed per manager
 *   - primary:    primary-changed (previous, next), either side may be null
 *
 * Ordering contract on primary replacement:
 * @code
 *   onPrimaryChanged(old, null)  before  onManagerRemoved(old)
 *   onManagerAdded(new)          before  onPrimaryChanged(null, new)
 *   onManagerRoleChanged(new)    before  onPrimaryChanged(null, new)
 * @endcode
 *
 * Usage:
 * @code
 * wifimode::events::ModeEventHub hub;
 * auto conn = hub.onManagerAdded.connect(
 *     [](const wifimode::ActiveModeManagerPtr& m) { ... });
 * @endcode
 *
 * @note Thread-safety: emitted only from the controller's executor thread.
 *       Connect before the controller starts or from the executor thread.
 */

#include "ModeManager.h"
#include "Roles.h"
#include "Signal.h"

#include <memory>
#include <string_view>

namespace wifimode
{

using ActiveModeManagerPtr = std::shared_ptr<ActiveModeManager>;

/// @brief Wifi state reported to API callers.
enum class WifiState
{
    Disabling,
    Disabled,
    Enabling,
    Enabled,
    Unknown
};

[[nodiscard]] constexpr std::string_view wifiStateName(WifiState state) noexcept
{
    switch (state)
    {
        case WifiState::Disabling: return "DISABLING";
        case WifiState::Disabled:  return "DISABLED";
        case WifiState::Enabling:  return "ENABLING";
        case WifiState::Enabled:   return "ENABLED";
        case WifiState::Unknown:   return "UNKNOWN";
    }
    return "UNKNOWN";
}

namespace events
{

/**
 * @brief Central hub for mode controller notifications.
 *
 * Owned by the ModeController; observers subscribe through
 * ModeController::events() or the controller's register helpers.
 */
struct ModeEventHub
{
    /// A manager reached the started state.
    fat_p::Signal<void(const ActiveModeManagerPtr&)> onManagerAdded;

    /// A manager stopped or failed to start.
    fat_p::Signal<void(const ActiveModeManagerPtr&)> onManagerRemoved;

    /// A manager completed a role switch.
    fat_p::Signal<void(const ActiveModeManagerPtr&)> onManagerRoleChanged;

    /// Args: previous primary (may be null), new primary (may be null)
    fat_p::Signal<void(const ClientModeManagerPtr&, const ClientModeManagerPtr&)> onPrimaryChanged;

    /// Recovery began tearing everything down.
    fat_p::Signal<void()> onSubsystemRestarting;

    /// Recovery recreated the pre-recovery managers.
    fat_p::Signal<void()> onSubsystemRestarted;

    /// Args: new wifi state
    fat_p::Signal<void(WifiState)> onWifiStateChanged;

    /// Args: from state name, to state name
    fat_p::Signal<void(std::string_view, std::string_view)> onControllerStateChanged;

    /// Args: message name, state that handled it, detail
    fat_p::Signal<void(std::string_view, std::string_view, std::string_view)> onMessageProcessed;

    /// Args: requested ip mode, reason
    fat_p::Signal<void(SoftApIpMode, std::string_view)> onSoftApStartFailed;
};

} // namespace events
} // namespace wifimode

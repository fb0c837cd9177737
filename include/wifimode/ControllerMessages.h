#pragma once

/*
FATP_META:
  meta_version: 1
  component: ControllerMessages
  file_role: public_header
  path: include/wifimode/ControllerMessages.h
  namespace: wifimode
  layer: Domain
  summary: Controller states and the tagged union of messages the mode controller consumes.
  api_stability: in_work
  related:
    tests:
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
 * @file ControllerMessages.h
 * @brief Message vocabulary of the mode controller.
 *
 * @details
 * Every external stimulus becomes one ControllerMessage posted to the
 * executor. Each alternative carries a kName used for logging and for the
 * controller log; the names follow the CMD_* convention of the wifi stack.
 *
 * Messages are values. A message deferred by the controller is stored as-is
 * and replayed later, so nothing in here may refer to state that can go
 * stale (recovery entries capture roles and configurations, not managers).
 */

#include "ModeManager.h"
#include "Roles.h"
#include "WorkSource.h"

#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace wifimode
{

// ============================================================================
// Controller states
// ============================================================================

/**
 * @brief Leaf states. Default is the super-state of both and is always active.
 */
enum class ControllerState
{
    Disabled,
    Enabled
};

[[nodiscard]] constexpr std::string_view stateName(ControllerState state) noexcept
{
    return state == ControllerState::Enabled ? "EnabledState" : "DisabledState";
}

// ============================================================================
// Recovery snapshot
// ============================================================================

/**
 * @brief One manager to recreate after a recovery restart.
 */
struct RecoveryEntry
{
    ManagerKind kind = ManagerKind::Client;
    Role role = Role::ClientPrimary;
    WorkSource requestorWs;
    std::optional<SoftApModeConfiguration> softApConfig;  ///< soft AP only
};

// ============================================================================
// Messages
// ============================================================================

namespace msg
{

struct WifiToggled
{
    static constexpr std::string_view kName = "CMD_WIFI_TOGGLED";
    WorkSource requestorWs;
};

struct ScanAlwaysModeChanged
{
    static constexpr std::string_view kName = "CMD_SCAN_ALWAYS_MODE_CHANGED";
    WorkSource requestorWs;
};

struct AirplaneToggled
{
    static constexpr std::string_view kName = "CMD_AIRPLANE_TOGGLED";
};

struct SatelliteModeChanged
{
    static constexpr std::string_view kName = "CMD_SATELLITE_MODE_CHANGED";
};

/// enable: start a soft AP from config. !enable: stop soft APs of stopMode
/// (Unspecified stops all).
struct SetSoftAp
{
    static constexpr std::string_view kName = "CMD_SET_AP";
    bool enable = false;
    std::optional<SoftApModeConfiguration> config;
    WorkSource requestorWs;
    SoftApIpMode stopMode = SoftApIpMode::Unspecified;
};

struct UpdateSoftApCapability
{
    static constexpr std::string_view kName = "CMD_UPDATE_AP_CAPABILITY";
    SoftApCapability capability;
    SoftApIpMode ipMode = SoftApIpMode::Tethered;
};

struct UpdateSoftApConfig
{
    static constexpr std::string_view kName = "CMD_UPDATE_AP_CONFIG";
    SoftApConfiguration config;
};

struct EmergencyCallbackModeChanged
{
    static constexpr std::string_view kName = "CMD_EMERGENCY_MODE_CHANGED";
    bool active = false;
};

struct EmergencyCallStateChanged
{
    static constexpr std::string_view kName = "CMD_EMERGENCY_CALL_STATE_CHANGED";
    bool active = false;
};

struct EmergencyScanStateChanged
{
    static constexpr std::string_view kName = "CMD_EMERGENCY_SCAN_STATE_CHANGED";
    bool inProgress = false;
    WorkSource requestorWs;
};

struct RequestAdditionalClientModeManager
{
    static constexpr std::string_view kName = "CMD_REQUEST_ADDITIONAL_CLIENT_MODE_MANAGER";
    AdditionalClientModeManagerRequest request;
};

struct RemoveAdditionalClientModeManager
{
    static constexpr std::string_view kName = "CMD_REMOVE_ADDITIONAL_CLIENT_MODE_MANAGER";
    ClientModeManagerPtr manager;
};

struct StaStopped
{
    static constexpr std::string_view kName = "CMD_STA_STOPPED";
};

struct StaStartFailure
{
    static constexpr std::string_view kName = "CMD_STA_START_FAILURE";
};

struct ApStopped
{
    static constexpr std::string_view kName = "CMD_AP_STOPPED";
};

struct ApStartFailure
{
    static constexpr std::string_view kName = "CMD_AP_START_FAILURE";
};

struct RecoveryRestart
{
    static constexpr std::string_view kName = "CMD_RECOVERY_RESTART_WIFI";
    std::string reason;
    bool requestBugReport = false;
};

/// Parked in Enabled until Disabled is reached, then replayed.
struct DeferredRecoveryRestart
{
    static constexpr std::string_view kName = "CMD_DEFERRED_RECOVERY_RESTART_WIFI";
    std::vector<RecoveryEntry> entries;
};

struct RecoveryRestartContinue
{
    static constexpr std::string_view kName = "CMD_RECOVERY_RESTART_WIFI_CONTINUE";
    std::vector<RecoveryEntry> entries;
};

struct RecoveryDisable
{
    static constexpr std::string_view kName = "CMD_RECOVERY_DISABLE_WIFI";
};

} // namespace msg

using ControllerMessage = std::variant<
    msg::WifiToggled,
    msg::ScanAlwaysModeChanged,
    msg::AirplaneToggled,
    msg::SatelliteModeChanged,
    msg::SetSoftAp,
    msg::UpdateSoftApCapability,
    msg::UpdateSoftApConfig,
    msg::EmergencyCallbackModeChanged,
    msg::EmergencyCallStateChanged,
    msg::EmergencyScanStateChanged,
    msg::RequestAdditionalClientModeManager,
    msg::RemoveAdditionalClientModeManager,
    msg::StaStopped,
    msg::StaStartFailure,
    msg::ApStopped,
    msg::ApStartFailure,
    msg::RecoveryRestart,
    msg::DeferredRecoveryRestart,
    msg::RecoveryRestartContinue,
    msg::RecoveryDisable>;

[[nodiscard]] inline std::string_view messageName(const ControllerMessage& message) noexcept
{
    return std::visit([](const auto& m) { return std::decay_t<decltype(m)>::kName; }, message);
}

template <typename T>
[[nodiscard]] bool holds(const ControllerMessage& message) noexcept
{
    return std::holds_alternative<T>(message);
}

} // namespace wifimode

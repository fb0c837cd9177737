#pragma once

/*
FATP_META:
  meta_version: 1
  component: Roles
  file_role: public_header
  path: include/wifimode/Roles.h
  namespace: wifimode
  layer: Domain
  summary: Mode manager roles, role classification predicates and soft-AP IP modes.
  api_stability: in_work
  related:
    tests:
      - components/AdmissionPolicy/tests/test_AdmissionPolicy.cpp
  hygiene:
    pragma_once: true
    include_guard: false
    defines_total: 0
    defines_unprefixed: 0
    undefs_total: 0
    includes_windows_h: false
*/

/**
 * @file Roles.h
 * @brief Roles a mode manager can hold, and their classification.
 *
 * @details
 * Client roles split into two overlapping families:
 *
 *   connectivity roles           = every client role except ScanOnly
 *   internet connectivity roles  = Primary, SecondaryLongLived, SecondaryTransient
 *
 * Soft-AP roles map one-to-one onto the soft-AP IP mode the hotspot was
 * requested in (tethered vs local-only hotspot).
 */

#include <cstdint>
#include <optional>
#include <string_view>

namespace wifimode
{

// ============================================================================
// Role
// ============================================================================

enum class Role : std::uint8_t
{
    ClientPrimary,
    ClientScanOnly,
    ClientLocalOnly,
    ClientSecondaryLongLived,
    ClientSecondaryTransient,
    SoftApTethered,
    SoftApLocalOnly
};

/// @brief Kind of interface a mode manager drives.
enum class ManagerKind : std::uint8_t
{
    Client,
    SoftAp
};

/// @brief IP mode of a soft-AP request. Unspecified only appears in stop requests.
enum class SoftApIpMode : std::uint8_t
{
    Unspecified,
    Tethered,
    LocalOnly
};

[[nodiscard]] constexpr bool isClientRole(Role role) noexcept
{
    return role != Role::SoftApTethered && role != Role::SoftApLocalOnly;
}

[[nodiscard]] constexpr bool isSoftApRole(Role role) noexcept
{
    return !isClientRole(role);
}

/// @brief Client roles that may associate with a network (all but ScanOnly).
[[nodiscard]] constexpr bool isConnectivityRole(Role role) noexcept
{
    return isClientRole(role) && role != Role::ClientScanOnly;
}

/// @brief Client roles that provide internet connectivity.
[[nodiscard]] constexpr bool isInternetConnectivityRole(Role role) noexcept
{
    return role == Role::ClientPrimary
        || role == Role::ClientSecondaryLongLived
        || role == Role::ClientSecondaryTransient;
}

/// @brief Roles requestable through the additional client mode manager API.
[[nodiscard]] constexpr bool isAdditionalClientRole(Role role) noexcept
{
    return role == Role::ClientLocalOnly
        || role == Role::ClientSecondaryLongLived
        || role == Role::ClientSecondaryTransient;
}

/// @brief Secondary roles whose requestor is tracked in the secondary request set.
[[nodiscard]] constexpr bool isTrackedSecondaryRole(Role role) noexcept
{
    return role == Role::ClientSecondaryLongLived || role == Role::ClientLocalOnly;
}

[[nodiscard]] constexpr ManagerKind kindOf(Role role) noexcept
{
    return isClientRole(role) ? ManagerKind::Client : ManagerKind::SoftAp;
}

[[nodiscard]] constexpr std::string_view roleName(Role role) noexcept
{
    switch (role)
    {
        case Role::ClientPrimary:            return "ROLE_CLIENT_PRIMARY";
        case Role::ClientScanOnly:           return "ROLE_CLIENT_SCAN_ONLY";
        case Role::ClientLocalOnly:          return "ROLE_CLIENT_LOCAL_ONLY";
        case Role::ClientSecondaryLongLived: return "ROLE_CLIENT_SECONDARY_LONG_LIVED";
        case Role::ClientSecondaryTransient: return "ROLE_CLIENT_SECONDARY_TRANSIENT";
        case Role::SoftApTethered:           return "ROLE_SOFTAP_TETHERED";
        case Role::SoftApLocalOnly:          return "ROLE_SOFTAP_LOCAL_ONLY";
    }
    return "ROLE_UNKNOWN";
}

[[nodiscard]] inline std::string_view roleName(const std::optional<Role>& role) noexcept
{
    return role ? roleName(*role) : std::string_view("null");
}

[[nodiscard]] constexpr std::string_view kindName(ManagerKind kind) noexcept
{
    return kind == ManagerKind::Client ? "ClientModeManager" : "SoftApManager";
}

[[nodiscard]] constexpr Role softApRoleFor(SoftApIpMode mode) noexcept
{
    return mode == SoftApIpMode::Tethered ? Role::SoftApTethered : Role::SoftApLocalOnly;
}

[[nodiscard]] constexpr std::string_view ipModeName(SoftApIpMode mode) noexcept
{
    switch (mode)
    {
        case SoftApIpMode::Unspecified: return "unspecified";
        case SoftApIpMode::Tethered:    return "tethered";
        case SoftApIpMode::LocalOnly:   return "local-only";
    }
    return "unknown";
}

} // namespace wifimode

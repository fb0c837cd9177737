#pragma once

/*
FATP_META:
  meta_version: 1
  component: ModeManager
  file_role: public_header
  path: include/wifimode/ModeManager.h
  namespace: wifimode
  layer: Domain
  summary: Abstract mode manager handles, lifecycle listener and factory seams.
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
 * @file ModeManager.h
 * @brief Mode manager handles and the seams through which they are created.
 *
 * @details
 * A mode manager owns one live radio interface in one role. The controller
 * never drives an interface directly: it asks the factory for a manager, then
 * issues stop() / setRole() and waits for the lifecycle listener.
 *
 * Lifecycle contract for implementations:
 * - role() is empty until the manager reports onStarted.
 * - targetRole() is set while a start or role switch is in flight.
 * - onStarted / onRoleChanged / onStopped / onStartFailure are delivered on
 *   the controller's executor thread, never synchronously from start(),
 *   stop() or setRole().
 * - previousRole() holds the role before the latest role change or stop.
 */

#include "FeatureSet.h"
#include "Expected.h"
#include "Roles.h"
#include "WorkSource.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace wifimode
{

using ManagerId = std::uint32_t;

// ============================================================================
// Value types carried by managers
// ============================================================================

/// @brief Opaque handle to the network a client is attached to.
struct NetworkHandle
{
    std::uint64_t netId = 0;

    bool operator==(const NetworkHandle& other) const { return netId == other.netId; }
};

/// @brief Connection information exposed through the read snapshot.
struct ConnectionInfo
{
    std::string ssid;
    std::string bssid;
    int rssi = -127;
    int frequencyMhz = 0;

    bool operator==(const ConnectionInfo& other) const
    {
        return ssid == other.ssid && bssid == other.bssid
            && rssi == other.rssi && frequencyMhz == other.frequencyMhz;
    }
};

struct SoftApConfiguration
{
    std::string ssid;
    std::string passphrase;
    int bands = kBand24Ghz;
    bool hiddenSsid = false;
};

struct SoftApCapability
{
    int maxSupportedClients = 0;
    bool acsOffloadSupported = false;
};

/**
 * @brief A soft-AP request: IP mode plus the configuration to bring up.
 */
struct SoftApModeConfiguration
{
    SoftApIpMode targetMode = SoftApIpMode::Tethered;
    SoftApConfiguration config;
    SoftApCapability capability;
};

/**
 * @brief Validates a soft-AP request before it is posted to the controller.
 */
[[nodiscard]] inline fat_p::Expected<void, std::string>
validateSoftApModeConfiguration(const SoftApModeConfiguration& request)
{
    if (request.targetMode == SoftApIpMode::Unspecified)
    {
        return fat_p::unexpected(std::string("soft AP target mode must be tethered or local-only"));
    }
    if (request.config.ssid.empty() || request.config.ssid.size() > 32)
    {
        return fat_p::unexpected(std::string("soft AP ssid must be 1..32 bytes"));
    }
    const auto passLen = request.config.passphrase.size();
    if (passLen != 0 && (passLen < 8 || passLen > 63))
    {
        return fat_p::unexpected(std::string("soft AP passphrase must be empty or 8..63 characters"));
    }
    return {};
}

// ============================================================================
// Handles
// ============================================================================

class ActiveModeManager
{
public:
    virtual ~ActiveModeManager() = default;

    [[nodiscard]] virtual ManagerId id() const noexcept = 0;
    [[nodiscard]] virtual ManagerKind kind() const noexcept = 0;

    /// Current role; empty until started and after stopped.
    [[nodiscard]] virtual std::optional<Role> role() const = 0;

    /// Role before the latest role change or stop.
    [[nodiscard]] virtual std::optional<Role> previousRole() const = 0;

    [[nodiscard]] virtual const WorkSource& requestorWs() const = 0;
    [[nodiscard]] virtual std::string interfaceName() const = 0;

    /// Asynchronous; completion is reported through onStopped.
    virtual void stop() = 0;

    [[nodiscard]] virtual std::string describe() const = 0;
};

class ClientModeManager;
class SoftApManager;

/**
 * @brief Lifecycle listener attached to a manager.
 *
 * @tparam Manager ClientModeManager or SoftApManager.
 */
template <typename Manager>
class ModeManagerListener
{
public:
    virtual ~ModeManagerListener() = default;

    virtual void onStarted(const std::shared_ptr<Manager>& manager) = 0;
    virtual void onRoleChanged(const std::shared_ptr<Manager>& manager) = 0;
    virtual void onStopped(const std::shared_ptr<Manager>& manager) = 0;
    virtual void onStartFailure(const std::shared_ptr<Manager>& manager) = 0;
};

using ClientListenerPtr = std::shared_ptr<ModeManagerListener<ClientModeManager>>;
using SoftApListenerPtr = std::shared_ptr<ModeManagerListener<SoftApManager>>;

class ClientModeManager : public ActiveModeManager
{
public:
    [[nodiscard]] ManagerKind kind() const noexcept override { return ManagerKind::Client; }

    /// Role being started into or switched into; empty when settled.
    [[nodiscard]] virtual std::optional<Role> targetRole() const = 0;

    /**
     * @brief Switches role in place. Completion is reported through onRoleChanged.
     *
     * @param listener Replaces the manager's listener when non-null.
     */
    virtual void setRole(Role role, const WorkSource& requestorWs, ClientListenerPtr listener) = 0;

    /// SSID of the network being connected, else the connected one, else empty.
    [[nodiscard]] virtual std::string connectingOrConnectedSsid() const = 0;
    [[nodiscard]] virtual std::string connectingOrConnectedBssid() const = 0;

    /// True if bssid belongs to another link of a multi-link connection.
    [[nodiscard]] virtual bool isAffiliatedLinkBssid(const std::string& bssid) const = 0;

    [[nodiscard]] virtual std::optional<NetworkHandle> currentNetwork() const = 0;
    [[nodiscard]] virtual ConnectionInfo connectionInfo() const = 0;
};

class SoftApManager : public ActiveModeManager
{
public:
    [[nodiscard]] ManagerKind kind() const noexcept override { return ManagerKind::SoftAp; }

    [[nodiscard]] virtual const SoftApModeConfiguration& softApModeConfiguration() const = 0;

    virtual void updateCapability(const SoftApCapability& capability) = 0;
    virtual void updateConfiguration(const SoftApConfiguration& config) = 0;
};

using ClientModeManagerPtr = std::shared_ptr<ClientModeManager>;
using SoftApManagerPtr     = std::shared_ptr<SoftApManager>;

// ============================================================================
// Factory
// ============================================================================

/**
 * @brief Creates and starts managers. The returned handle has not started yet.
 */
class ModeManagerFactory
{
public:
    virtual ~ModeManagerFactory() = default;

    [[nodiscard]] virtual ClientModeManagerPtr makeClientModeManager(
        ClientListenerPtr listener, const WorkSource& requestorWs, Role role, bool verboseLogging) = 0;

    [[nodiscard]] virtual SoftApManagerPtr makeSoftApManager(
        SoftApListenerPtr listener, const SoftApModeConfiguration& config,
        const WorkSource& requestorWs, Role role, bool verboseLogging) = 0;
};

// ============================================================================
// Additional client mode manager requests
// ============================================================================

/// @brief One-shot answer to an additional-client request; null means rejected.
using ClientModeManagerRequestListener = std::function<void(const ClientModeManagerPtr&)>;

struct AdditionalClientModeManagerRequest
{
    ClientModeManagerRequestListener listener;
    WorkSource requestorWs;
    Role clientRole = Role::ClientLocalOnly;
    std::string ssid;
    std::optional<std::string> bssid;
    bool didUserApprove = false;
    bool preferSecondarySta = false;
};

} // namespace wifimode

#pragma once

/*
FATP_META:
  meta_version: 1
  component: ControllerConfig
  file_role: public_header
  path: include/wifimode/ControllerConfig.h
  namespace: wifimode
  layer: Domain
  summary: Overlay and resource flags consumed by the mode controller, with validation.
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
 * @file ControllerConfig.h
 * @brief Device overlay flags for the mode controller.
 *
 * @details
 * A plain aggregate. Construct, tweak fields, then pass to the controller,
 * which calls validate() and clamp() once at construction. validate() rejects
 * values that cannot be made sensible; clamp() fixes values that only need
 * bounding (the recovery delay).
 */

#include "Expected.h"

#include <chrono>
#include <string>

namespace wifimode
{

class ControllerConfig
{
public:
    /// Upper bound on the delay between recovery shutdown and restart.
    static constexpr std::chrono::milliseconds kMaxRecoveryDelay{4000};

    /// Default bound for blocking cross-thread calls.
    static constexpr std::chrono::milliseconds kDefaultBlockingCallTimeout{4000};

    // -------------------------------------------------------------------------
    // Emergency
    // -------------------------------------------------------------------------

    bool disableWifiInEcm        = true;  ///< Carrier "disable wifi in ECBM"
    bool trackEmergencyCallState = true;  ///< Turn wifi off during emergency calls

    // -------------------------------------------------------------------------
    // Multi-STA use cases
    // -------------------------------------------------------------------------

    bool multiStaLocalOnlyEnabled     = false;
    bool multiStaMbbEnabled           = false;
    bool multiStaRestrictedEnabled    = false;
    bool multiStaMultiInternetEnabled = false;

    /// When false, hidden-network scanning is only enabled with a connectivity role.
    bool scanHiddenNetworksInScanOnlyMode = false;

    /// Root requests for a local-only client skip the car-mode primary restriction.
    bool allowRootToGetLocalOnlyCmm = true;

    // -------------------------------------------------------------------------
    // Timing
    // -------------------------------------------------------------------------

    std::chrono::milliseconds recoveryDelay{2000};
    std::chrono::milliseconds blockingCallTimeout{kDefaultBlockingCallTimeout};
    bool timeoutsAreErrors = false;

    // -------------------------------------------------------------------------
    // Feature overlay
    // -------------------------------------------------------------------------

    bool connectedMacRandomizationSupported = true;
    bool apMacRandomizationSupported        = true;
    bool bridgedApSupported                 = false;
    bool staBridgedApSupported              = false;
    bool wepSupported                       = false;
    bool wpaPersonalDeprecated              = false;
    bool d2dAllowedWhenInfraStaDisabled     = false;
    bool rttFeaturePresent                  = true;
    bool p2pMacRandomizationSupported       = true;

    /**
     * @brief Rejects configurations the controller cannot run with.
     */
    [[nodiscard]] fat_p::Expected<void, std::string> validate() const
    {
        if (recoveryDelay.count() < 0)
        {
            return fat_p::unexpected(std::string("recoveryDelay must not be negative"));
        }
        if (blockingCallTimeout.count() <= 0)
        {
            return fat_p::unexpected(std::string("blockingCallTimeout must be positive"));
        }
        return {};
    }

    /**
     * @brief Caps the recovery delay at kMaxRecoveryDelay.
     *
     * @return true if a value was changed.
     */
    bool clamp() noexcept
    {
        if (recoveryDelay > kMaxRecoveryDelay)
        {
            recoveryDelay = kMaxRecoveryDelay;
            return true;
        }
        return false;
    }
};

} // namespace wifimode

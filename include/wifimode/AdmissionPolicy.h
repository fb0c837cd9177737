#pragma once

/*
FATP_META:
  meta_version: 1
  component: AdmissionPolicy
  file_role: public_header
  path: include/wifimode/AdmissionPolicy.h
  namespace: wifimode
  layer: Domain
  summary: Decides how an additional client mode manager request is answered.
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
 * @file AdmissionPolicy.h
 * @brief Role admission for additional client mode manager requests.
 *
 * @details
 * AdmissionPolicy::decide() only reads: the registry, the capability oracle,
 * the permission checker and the DPP monitor. Acting on the decision (answer
 * the listener, create a manager, switch a role) is the controller's job.
 *
 * Decision order, first match wins:
 * @code
 *   1. wifi disabling or disabled                     -> Reject
 *   2. local-only, car-mode prioritized requestor     -> AnswerPrimary
 *   3. secondary transient while DPP is running       -> AnswerPrimary
 *   4. a client already on (ssid, bssid)
 *        holder is primary / holder has role          -> AnswerExisting
 *        requestor cannot outrank holder              -> Reject
 *        otherwise                                    -> SwitchRole
 *   5. a client already in the role                   -> AnswerExisting
 *   6. oracle + overlay allow a new interface         -> CreateNew
 *   7. local-only, dual STA, non-legacy app           -> Reject
 *      otherwise                                      -> AnswerPrimary
 * @endcode
 *
 * AnswerPrimary carries the primary manager, which may be null.
 */

#include "Collaborators.h"
#include "ControllerConfig.h"
#include "Logging.h"
#include "ModeEvents.h"
#include "ModeManager.h"
#include "ModeManagerRegistry.h"
#include "Roles.h"
#include "WorkSource.h"

#include <optional>
#include <string>
#include <string_view>

namespace wifimode
{

enum class AdmissionOutcome
{
    AnswerExisting,
    CreateNew,
    SwitchRole,
    AnswerPrimary,
    Reject
};

[[nodiscard]] constexpr std::string_view outcomeName(AdmissionOutcome outcome) noexcept
{
    switch (outcome)
    {
        case AdmissionOutcome::AnswerExisting: return "AnswerExisting";
        case AdmissionOutcome::CreateNew:      return "CreateNew";
        case AdmissionOutcome::SwitchRole:     return "SwitchRole";
        case AdmissionOutcome::AnswerPrimary:  return "AnswerPrimary";
        case AdmissionOutcome::Reject:         return "Reject";
    }
    return "Unknown";
}

struct AdmissionDecision
{
    AdmissionOutcome outcome = AdmissionOutcome::Reject;

    /// Manager to answer with (AnswerExisting, AnswerPrimary) or to switch (SwitchRole).
    ClientModeManagerPtr manager;

    /// Attribution for the new interface (CreateNew).
    WorkSource creatorWs;

    std::string reason;
};

/**
 * @brief True if the client is connecting or connected to (ssid, bssid).
 *
 * The connecting network wins over the connected one. A bssid matching any
 * affiliated link of a multi-link connection counts as the same bssid.
 */
[[nodiscard]] inline bool isConnectedOrConnectingTo(const ClientModeManager& manager,
                                                    const std::string& ssid,
                                                    const std::string& bssid)
{
    if (manager.connectingOrConnectedSsid() != ssid)
    {
        return false;
    }
    return manager.connectingOrConnectedBssid() == bssid || manager.isAffiliatedLinkBssid(bssid);
}

class AdmissionPolicy
{
public:
    AdmissionPolicy(const ControllerConfig& config,
                    const ModeManagerRegistry& registry,
                    CapabilityOracle& chip,
                    PermissionChecker& permissions,
                    DppSessionMonitor& dpp)
        : mConfig(config)
        , mRegistry(registry)
        , mChip(chip)
        , mPermissions(permissions)
        , mDpp(dpp)
    {
    }

    [[nodiscard]] AdmissionDecision decide(const AdditionalClientModeManagerRequest& request,
                                           WifiState wifiState) const
    {
        if (wifiState == WifiState::Disabling || wifiState == WifiState::Disabled)
        {
            return reject("wifi is disabling or disabled");
        }

        const ClientModeManagerPtr primary = mRegistry.clientInRole(Role::ClientPrimary);

        // Car-mode prioritized apps only ever get the primary, to keep the
        // device out of STA+STA.
        if (!request.preferSecondarySta && request.clientRole == Role::ClientLocalOnly)
        {
            for (const auto& entry : request.requestorWs.entries())
            {
                if (mConfig.allowRootToGetLocalOnlyCmm && entry.uid == kRootUid)
                {
                    continue;
                }
                if (entry.uid != kSystemUid && mPermissions.checkEnterCarModePrioritized(entry.uid))
                {
                    return answerPrimary(primary, "uid " + std::to_string(entry.uid)
                                                      + " has car mode priority, disabling STA+STA");
                }
            }
        }

        if (request.clientRole == Role::ClientSecondaryTransient && mDpp.isSessionInProgress())
        {
            return answerPrimary(primary, "DPP session in progress");
        }

        if (auto holder = findClientOnSameBssid(request.ssid, request.bssid))
        {
            if (holder->role() == Role::ClientPrimary)
            {
                return answer(holder, "primary already on the requested bssid");
            }
            if (holder->role() == request.clientRole)
            {
                return answer(holder, "requested role already on the requested bssid");
            }
            if (!canRequestMoreClientModeManagersInRole(request.requestorWs, request.clientRole,
                                                        request.didUserApprove))
            {
                return reject("request cannot override existing holder of the bssid");
            }
            AdmissionDecision decision;
            decision.outcome = AdmissionOutcome::SwitchRole;
            decision.manager = holder;
            decision.reason  = "bssid holder outranked, switching its role";
            return decision;
        }

        if (auto sameRole = mRegistry.clientInRole(request.clientRole))
        {
            return answer(sameRole, "manager already exists for role");
        }

        if (canRequestMoreClientModeManagersInRole(request.requestorWs, request.clientRole,
                                                   request.didUserApprove))
        {
            AdmissionDecision decision;
            decision.outcome   = AdmissionOutcome::CreateNew;
            decision.creatorWs = ifCreatorWs(request.requestorWs, request.didUserApprove);
            decision.reason    = "starting a new client mode manager";
            return decision;
        }

        if (request.clientRole == Role::ClientLocalOnly
            && isStaStaConcurrencySupportedForLocalOnly()
            && !mPermissions.isTargetSdkLessThanS(request.requestorWs.packageName(0),
                                                  request.requestorWs.uid(0)))
        {
            return reject("no single-STA fallback for local-only when STA+STA is supported");
        }

        return answerPrimary(primary, "falling back to single STA");
    }

    /**
     * @brief True if a new client in role can be created for the requestor.
     *
     * A user-approved request is attributed to settings as well, which raises
     * its priority for the oracle's check.
     */
    [[nodiscard]] bool canRequestMoreClientModeManagersInRole(const WorkSource& requestorWs,
                                                              Role role,
                                                              bool didUserApprove) const
    {
        if (!mChip.isItPossibleToCreateStaIface(ifCreatorWs(requestorWs, didUserApprove)))
        {
            return false;
        }
        switch (role)
        {
            case Role::ClientLocalOnly:
            {
                if (!mConfig.multiStaLocalOnlyEnabled)
                {
                    return false;
                }
                const auto package = requestorWs.packageName(0);
                const int uid = requestorWs.uid(0);
                return mPermissions.isSystem(package, uid) || !mPermissions.isTargetSdkLessThanS(package, uid);
            }
            case Role::ClientSecondaryTransient:
                return mConfig.multiStaMbbEnabled;
            case Role::ClientSecondaryLongLived:
                return mConfig.multiStaRestrictedEnabled || mConfig.multiStaMultiInternetEnabled;
            default:
                logger().error("canRequestMoreClientModeManagersInRole: unrecognized role {}", roleName(role));
                return false;
        }
    }

    [[nodiscard]] bool canRequestMoreSoftApManagers(const WorkSource& requestorWs) const
    {
        return mChip.isItPossibleToCreateApIface(requestorWs);
    }

    [[nodiscard]] bool canRequestSecondaryTransientClientModeManager() const
    {
        return canRequestMoreClientModeManagersInRole(WorkSource::internal(),
                                                      Role::ClientSecondaryTransient, false);
    }

    [[nodiscard]] bool isStaStaConcurrencySupportedForLocalOnly() const
    {
        return mChip.isStaStaConcurrencySupported() && mConfig.multiStaLocalOnlyEnabled;
    }

    [[nodiscard]] bool isStaStaConcurrencySupportedForMbb() const
    {
        return mChip.isStaStaConcurrencySupported() && mConfig.multiStaMbbEnabled;
    }

    [[nodiscard]] bool isStaStaConcurrencySupportedForRestricted() const
    {
        return mChip.isStaStaConcurrencySupported() && mConfig.multiStaRestrictedEnabled;
    }

    [[nodiscard]] bool isStaStaConcurrencySupportedForMultiInternet() const
    {
        return mChip.isStaStaConcurrencySupported() && mConfig.multiStaMultiInternetEnabled;
    }

    /// Client connecting or connected to (ssid, bssid); none without a bssid.
    [[nodiscard]] ClientModeManagerPtr findClientOnSameBssid(const std::string& ssid,
                                                             const std::optional<std::string>& bssid) const
    {
        if (!bssid)
        {
            return nullptr;
        }
        for (const auto& client : mRegistry.clients())
        {
            if (isConnectedOrConnectingTo(*client, ssid, *bssid))
            {
                return client;
            }
        }
        return nullptr;
    }

private:
    const ControllerConfig&    mConfig;
    const ModeManagerRegistry& mRegistry;
    CapabilityOracle&          mChip;
    PermissionChecker&         mPermissions;
    DppSessionMonitor&         mDpp;

    static WorkSource ifCreatorWs(const WorkSource& requestorWs, bool didUserApprove)
    {
        WorkSource ws = requestorWs;
        if (didUserApprove)
        {
            ws.add(WorkSource::settings());
        }
        return ws;
    }

    static AdmissionDecision reject(std::string reason)
    {
        AdmissionDecision decision;
        decision.outcome = AdmissionOutcome::Reject;
        decision.reason  = std::move(reason);
        return decision;
    }

    static AdmissionDecision answer(ClientModeManagerPtr manager, std::string reason)
    {
        AdmissionDecision decision;
        decision.outcome = AdmissionOutcome::AnswerExisting;
        decision.manager = std::move(manager);
        decision.reason  = std::move(reason);
        return decision;
    }

    static AdmissionDecision answerPrimary(ClientModeManagerPtr primary, std::string reason)
    {
        AdmissionDecision decision;
        decision.outcome = AdmissionOutcome::AnswerPrimary;
        decision.manager = std::move(primary);
        decision.reason  = std::move(reason);
        return decision;
    }
};

} // namespace wifimode

#pragma once

/*
FATP_META:
  meta_version: 1
  component: ModeController
  file_role: public_header
  path: include/wifimode/ModeController.h
  namespace: wifimode
  layer: Domain
  summary: Event-driven wifi mode controller; owns the registry and sequences every start, stop and role switch.
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
 * @file ModeController.h
 * @brief The wifi mode controller state machine.
 *
 * @details
 * States:
 * @code
 *   Default (super-state, always active)
 *     +-- Disabled   registry empty
 *     +-- Enabled    registry non-empty
 * @endcode
 *
 * Dispatch of one message:
 *   1. Emergency call / callback mode changes are handled first, always.
 *   2. Emergency scan state changes are handled next, even in emergency mode.
 *   3. In emergency mode only stop completions and soft-AP start requests are
 *      acted on; everything else is dropped.
 *   4. Otherwise the current leaf state handles the message; anything it does
 *      not handle falls through to Default.
 *   5. A transition requested while handling takes effect after the handler
 *      returns. Deferred messages are then replayed ahead of newer ones.
 *
 * Disabled and Enabled are ControllerStateMachine states (ControllerStates.h);
 * entering one reports it on the hub and replays the deferred messages.
 *
 * Input methods (wifiToggled(), startSoftAp(), ...) may be called from any
 * thread; they only post a message. Query methods (primaryClientModeManager(),
 * dump(), ...) must run on the executor. The read snapshot getters
 * (supportedFeatures(), currentNetwork(), wifiState(), ...) are safe from
 * any thread.
 *
 * Lifetime: stop a worker-thread executor before destroying the controller.
 * Work still queued for a destroyed controller is dropped when it runs, both
 * its own messages and the callbacks of the managers it created.
 *
 * Usage:
 * @code
 * wifimode::SerialExecutor executor;
 * wifimode::ModeController controller(deps, config);
 * controller.start();
 * controller.wifiToggled(wifimode::WorkSource::settings());
 * executor.dispatchReady();
 * @endcode
 */

#include "AdmissionPolicy.h"
#include "Collaborators.h"
#include "ControllerConfig.h"
#include "ControllerLog.h"
#include "ControllerMessages.h"
#include "ControllerStates.h"
#include "Expected.h"
#include "FeatureSet.h"
#include "Graveyard.h"
#include "Logging.h"
#include "ModeEvents.h"
#include "ModeManager.h"
#include "ModeManagerRegistry.h"
#include "Roles.h"
#include "SerialExecutor.h"
#include "ServiceApiSnapshot.h"
#include "SettingsStore.h"
#include "Signal.h"
#include "WorkSource.h"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace wifimode
{

class ModeController
{
public:
    using PrimaryChangedCallback =
        std::function<void(const ClientModeManagerPtr&, const ClientModeManagerPtr&)>;

    static constexpr std::size_t kControllerLogCapacity = 100;

    /**
     * @throws std::invalid_argument if config fails validation.
     */
    ModeController(ControllerDependencies deps, ControllerConfig config = {})
        : mDeps(deps)
        , mExecutor(deps.executor)
        , mConfig(std::move(config))
        , mPolicy(mConfig, mRegistry, deps.chip, deps.permissions, deps.dpp)
        , mLog(mHub)
        , mContext{mRegistry, mHub, [this] { replayDeferredMessages(); }, {}, false}
        , mSM(mContext) // mContext must be fully initialized before this line
    {
        auto valid = mConfig.validate();
        if (!valid)
        {
            throw std::invalid_argument("ModeController: " + valid.error());
        }
        if (mConfig.clamp())
        {
            logger().warn("Overriding recovery delay with maximum limit value {} ms",
                          ControllerConfig::kMaxRecoveryDelay.count());
        }
        mExecutor.setDefaultTimeout(mConfig.blockingCallTimeout);
        mExecutor.setTimeoutsAreErrors(mConfig.timeoutsAreErrors);
    }

    ~ModeController()
    {
        if (mExecutor.isRunning() && !mExecutor.isCurrentThread())
        {
            logger().critical("ModeController destroyed while executor '{}' is still running",
                              mExecutor.name());
        }
    }

    ModeController(const ModeController&) = delete;
    ModeController& operator=(const ModeController&) = delete;
    ModeController(ModeController&&) = delete;
    ModeController& operator=(ModeController&&) = delete;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /**
     * @brief Reads the persisted toggles and picks the initial state.
     *
     * Posted to the executor; nothing happens until it runs.
     */
    void start()
    {
        mExecutor.post(guarded([this] { initialize(); }), "ModeController::start");
    }

    void enableVerboseLogging(bool verbose)
    {
        mVerboseLogging.store(verbose);
        setVerboseLogging(verbose);
    }

    void allowRootToGetLocalOnlyCmm(bool enabled)
    {
        mExecutor.post(guarded([this, enabled] { mConfig.allowRootToGetLocalOnlyCmm = enabled; }),
                       "allowRootToGetLocalOnlyCmm");
    }

    void notifyShuttingDown() noexcept { mShuttingDown.store(true); }
    [[nodiscard]] bool isShuttingDown() const noexcept { return mShuttingDown.load(); }

    // =========================================================================
    // Inputs (any thread)
    // =========================================================================

    void wifiToggled(const WorkSource& requestorWs)
    {
        sendMessage(msg::WifiToggled{requestorWs});
    }

    void airplaneModeToggled() { sendMessage(msg::AirplaneToggled{}); }

    void satelliteModeChanged() { sendMessage(msg::SatelliteModeChanged{}); }

    /// Not a direct user action, so the lowest-priority requestor is used.
    void scanAlwaysModeChanged()
    {
        sendMessage(msg::ScanAlwaysModeChanged{WorkSource::internal()});
    }

    /// Location toggles re-evaluate scan-only eligibility like scan-always does.
    void locationModeChanged() { scanAlwaysModeChanged(); }

    [[nodiscard]] fat_p::Expected<void, std::string> startSoftAp(const SoftApModeConfiguration& config,
                                                                 const WorkSource& requestorWs)
    {
        auto valid = validateSoftApModeConfiguration(config);
        if (!valid)
        {
            return valid;
        }
        msg::SetSoftAp message;
        message.enable      = true;
        message.config      = config;
        message.requestorWs = requestorWs;
        sendMessage(std::move(message));
        return {};
    }

    /// @param mode Unspecified stops every soft AP.
    void stopSoftAp(SoftApIpMode mode)
    {
        msg::SetSoftAp message;
        message.enable   = false;
        message.stopMode = mode;
        sendMessage(std::move(message));
    }

    void updateSoftApCapability(const SoftApCapability& capability, SoftApIpMode ipMode)
    {
        sendMessage(msg::UpdateSoftApCapability{capability, ipMode});
    }

    void updateSoftApConfiguration(const SoftApConfiguration& config)
    {
        sendMessage(msg::UpdateSoftApConfig{config});
    }

    void emergencyCallbackModeChanged(bool inEmergencyCallbackMode)
    {
        sendMessage(msg::EmergencyCallbackModeChanged{inEmergencyCallbackMode});
    }

    void emergencyCallStateChanged(bool inEmergencyCall)
    {
        if (!mConfig.trackEmergencyCallState)
        {
            logger().debug("Emergency call state not tracked, ignoring change to {}", inEmergencyCall);
            return;
        }
        sendMessage(msg::EmergencyCallStateChanged{inEmergencyCall});
    }

    /// Emergency scans carry the highest priority requestor.
    void setEmergencyScanRequestInProgress(bool inProgress)
    {
        sendMessage(msg::EmergencyScanStateChanged{inProgress, WorkSource::settings()});
    }

    [[nodiscard]] fat_p::Expected<void, std::string> requestLocalOnlyClientModeManager(
        ClientModeManagerRequestListener listener, const WorkSource& requestorWs,
        const std::string& ssid, const std::string& bssid,
        bool didUserApprove, bool preferSecondarySta)
    {
        AdditionalClientModeManagerRequest request;
        request.listener           = std::move(listener);
        request.requestorWs        = requestorWs;
        request.clientRole         = Role::ClientLocalOnly;
        request.ssid               = ssid;
        request.bssid              = bssid;
        request.didUserApprove     = didUserApprove;
        request.preferSecondarySta = preferSecondarySta;
        return postAdditionalRequest(std::move(request));
    }

    [[nodiscard]] fat_p::Expected<void, std::string> requestSecondaryLongLivedClientModeManager(
        ClientModeManagerRequestListener listener, const WorkSource& requestorWs,
        const std::string& ssid, const std::optional<std::string>& bssid)
    {
        AdditionalClientModeManagerRequest request;
        request.listener    = std::move(listener);
        request.requestorWs = requestorWs;
        request.clientRole  = Role::ClientSecondaryLongLived;
        request.ssid        = ssid;
        request.bssid       = bssid;
        return postAdditionalRequest(std::move(request));
    }

    [[nodiscard]] fat_p::Expected<void, std::string> requestSecondaryTransientClientModeManager(
        ClientModeManagerRequestListener listener, const WorkSource& requestorWs,
        const std::string& ssid, const std::optional<std::string>& bssid)
    {
        AdditionalClientModeManagerRequest request;
        request.listener    = std::move(listener);
        request.requestorWs = requestorWs;
        request.clientRole  = Role::ClientSecondaryTransient;
        request.ssid        = ssid;
        request.bssid       = bssid;
        return postAdditionalRequest(std::move(request));
    }

    void removeClientModeManager(ClientModeManagerPtr manager)
    {
        sendMessage(msg::RemoveAdditionalClientModeManager{std::move(manager)});
    }

    void recoveryRestartWifi(std::string reason, bool requestBugReport)
    {
        sendMessage(msg::RecoveryRestart{std::move(reason), requestBugReport});
    }

    /// Recovery was throttled: turn everything off.
    void recoveryDisableWifi() { sendMessage(msg::RecoveryDisable{}); }

    /**
     * @brief Native daemon status. A daemon dying outside of shutdown triggers
     *        a bug report and asks the recovery coordinator to recover.
     */
    void onNativeStatusChanged(bool isReady)
    {
        if (isReady || mShuttingDown.load())
        {
            return;
        }
        mExecutor.post(guarded([this]
                       {
                           logger().error("One of the native daemons died. Triggering recovery");
                           mLog.logInfo("native", "daemon died, triggering recovery");
                           mDeps.diagnostics.takeBugReport("Wi-Fi BugReport", "native daemon failure");
                           mDeps.recovery.trigger("native daemon failure");
                       }),
                       "nativeStatusChanged");
    }

    /// Scan enablement depends on the country code only once one is known.
    void updateClientScanModeAfterCountryCodeUpdate(std::optional<std::string> countryCode)
    {
        if (!countryCode || countryCode->empty())
        {
            return;
        }
        mExecutor.post(guarded([this] { updateClientScanMode(); }), "countryCodeUpdated");
    }

    // =========================================================================
    // Observers
    // =========================================================================

    /// Added / removed / role-changed, primary-changed, restart and state signals.
    [[nodiscard]] events::ModeEventHub& events() noexcept { return mHub; }

    /**
     * @brief Registers a primary-changed observer. Executor thread only.
     *
     * If a primary exists, the callback is invoked immediately with
     * (null, primary).
     */
    [[nodiscard]] fat_p::ScopedConnection registerPrimaryChangedCallback(PrimaryChangedCallback callback)
    {
        if (auto primary = primaryClientModeManagerNullable())
        {
            callback(ClientModeManagerPtr{}, primary);
        }
        return mHub.onPrimaryChanged.connect(std::move(callback));
    }

    // =========================================================================
    // Queries (executor thread)
    // =========================================================================

    [[nodiscard]] ControllerState currentState() const noexcept
    {
        return mSM.isInState<EnabledState>() ? ControllerState::Enabled : ControllerState::Disabled;
    }
    [[nodiscard]] std::string_view currentStateName() const noexcept { return stateName(currentState()); }

    [[nodiscard]] bool isInEmergencyMode() const noexcept
    {
        return mInEmergencyCall || mInEmergencyCallbackMode;
    }

    [[nodiscard]] bool isEmergencyScanInProgress() const noexcept { return mEmergencyScanInProgress; }
    [[nodiscard]] bool isRecoveryInProgress() const noexcept { return mRecoveryInProgress; }
    [[nodiscard]] std::size_t deferredMessageCount() const noexcept { return mDeferred.size(); }

    [[nodiscard]] bool hasPrimaryClientModeManager() const
    {
        return mRegistry.clientInRole(Role::ClientPrimary) != nullptr;
    }

    [[nodiscard]] ClientModeManagerPtr primaryClientModeManagerNullable() const
    {
        return mRegistry.clientInRole(Role::ClientPrimary);
    }

    [[nodiscard]] fat_p::Expected<ClientModeManagerPtr, std::string> primaryClientModeManager() const
    {
        if (auto primary = primaryClientModeManagerNullable())
        {
            return primary;
        }
        return fat_p::unexpected(std::string("no primary client mode manager"));
    }

    [[nodiscard]] ClientModeManagerPtr scanOnlyClientModeManager() const
    {
        return mRegistry.clientInRole(Role::ClientScanOnly);
    }

    [[nodiscard]] SoftApManagerPtr tetheredSoftApManager() const
    {
        return mRegistry.softApInRole(Role::SoftApTethered);
    }

    [[nodiscard]] SoftApManagerPtr localOnlySoftApManager() const
    {
        return mRegistry.softApInRole(Role::SoftApLocalOnly);
    }

    [[nodiscard]] std::vector<ClientModeManagerPtr> clientModeManagers() const
    {
        return mRegistry.clients();
    }

    [[nodiscard]] ClientModeManagerPtr clientModeManagerInRole(Role role) const
    {
        return mRegistry.clientInRole(role);
    }

    [[nodiscard]] ClientModeManagerPtr clientModeManagerTransitioningIntoRole(Role role) const
    {
        return mRegistry.clientTransitioningInto(role);
    }

    [[nodiscard]] std::vector<ClientModeManagerPtr> clientModeManagersInRoles(std::initializer_list<Role> roles) const
    {
        return mRegistry.clientsInRoles(roles);
    }

    [[nodiscard]] std::vector<ClientModeManagerPtr> internetConnectivityClientModeManagers() const
    {
        return mRegistry.internetConnectivityClients();
    }

    /// Stops every additional client in role; primary and scan-only are left alone.
    void stopAllClientModeManagersInRole(Role role)
    {
        for (const auto& manager : mRegistry.clients())
        {
            if (manager->role() == role)
            {
                stopAdditionalClientModeManager(manager);
            }
        }
    }

    [[nodiscard]] bool canRequestMoreClientModeManagersInRole(const WorkSource& requestorWs, Role role,
                                                              bool didUserApprove) const
    {
        return mPolicy.canRequestMoreClientModeManagersInRole(requestorWs, role, didUserApprove);
    }

    [[nodiscard]] bool canRequestMoreSoftApManagers(const WorkSource& requestorWs) const
    {
        return mPolicy.canRequestMoreSoftApManagers(requestorWs);
    }

    [[nodiscard]] bool canRequestSecondaryTransientClientModeManager() const
    {
        return mPolicy.canRequestSecondaryTransientClientModeManager();
    }

    [[nodiscard]] bool isStaStaConcurrencySupportedForLocalOnlyConnections() const
    {
        return mPolicy.isStaStaConcurrencySupportedForLocalOnly();
    }

    [[nodiscard]] bool isStaStaConcurrencySupportedForMbb() const
    {
        return mPolicy.isStaStaConcurrencySupportedForMbb();
    }

    [[nodiscard]] bool isStaStaConcurrencySupportedForRestrictedConnections() const
    {
        return mPolicy.isStaStaConcurrencySupportedForRestricted();
    }

    [[nodiscard]] bool isStaStaConcurrencySupportedForMultiInternet() const
    {
        return mPolicy.isStaStaConcurrencySupportedForMultiInternet();
    }

    [[nodiscard]] const ModeManagerRegistry& registry() const noexcept { return mRegistry; }
    [[nodiscard]] const Graveyard& graveyard() const noexcept { return mRegistry.graveyard(); }
    [[nodiscard]] const ControllerLog<kControllerLogCapacity>& controllerLog() const noexcept { return mLog; }
    [[nodiscard]] const ControllerConfig& config() const noexcept { return mConfig; }

    /// Refreshes the snapshot's network and connection info from the primary, if any.
    void updateCurrentConnectionInfo()
    {
        if (auto primary = primaryClientModeManagerNullable())
        {
            mSnapshot.setCurrentNetwork(primary->currentNetwork());
            mSnapshot.setConnectionInfo(primary->connectionInfo());
        }
    }

    [[nodiscard]] std::string dump() const
    {
        std::ostringstream oss;
        oss << "Dump of ModeController\n";
        oss << "Current wifi mode: " << currentStateName() << "\n";
        oss << "Wi-Fi is " << wifiStateName(wifiState()) << "\n";
        oss << "NumActiveModeManagers: " << mRegistry.size() << "\n";
        oss << "mIsMultiplePrimaryBugreportTaken: " << std::boolalpha << mMultiplePrimaryBugreportTaken << "\n";
        oss << "In emergency mode: " << isInEmergencyMode()
            << " (call=" << mInEmergencyCall << ", callback=" << mInEmergencyCallbackMode
            << ", scan=" << mEmergencyScanInProgress << ")\n";
        oss << "Recovery in progress: " << mRecoveryInProgress << "\n";
        oss << "Deferred messages: " << mDeferred.size() << "\n";
        for (const auto& manager : mRegistry.activeManagers())
        {
            oss << "  " << manager->describe() << "\n";
        }
        oss << mRegistry.graveyard().dump();

        const bool staSta = mDeps.chip.isStaStaConcurrencySupported();
        oss << "STA + STA Concurrency Supported: " << staSta << "\n";
        if (staSta)
        {
            oss << "   MBB use-case enabled: " << mConfig.multiStaMbbEnabled << "\n";
            oss << "   Local only use-case enabled: " << mConfig.multiStaLocalOnlyEnabled << "\n";
            oss << "   Restricted use-case enabled: " << mConfig.multiStaRestrictedEnabled << "\n";
            oss << "   Multi internet use-case enabled: " << mConfig.multiStaMultiInternetEnabled << "\n";
        }
        oss << "STA + AP Concurrency Supported: " << mDeps.chip.isStaApConcurrencySupported() << "\n";
        oss << "Controller log:\n" << mLog.formatTail(20);
        return oss.str();
    }

    // =========================================================================
    // Blocking bridge (other threads, worker-thread executor)
    // =========================================================================

    /**
     * @brief Primary manager, fetched on the executor.
     *
     * @return null when there is no primary or the executor did not answer in time.
     */
    [[nodiscard]] ClientModeManagerPtr primaryClientModeManagerBlocking(
        std::optional<std::chrono::milliseconds> timeout = std::nullopt)
    {
        return mExecutor.call([this] { return primaryClientModeManagerNullable(); },
                              ClientModeManagerPtr{}, "getPrimaryClientModeManager", timeout);
    }

    [[nodiscard]] std::string dumpBlocking(std::optional<std::chrono::milliseconds> timeout = std::nullopt)
    {
        return mExecutor.call([this] { return dump(); },
                              std::string("(dump timed out)\n"), "dump", timeout);
    }

    // =========================================================================
    // Read snapshot (any thread)
    // =========================================================================

    [[nodiscard]] FeatureSet supportedFeatures() const { return mSnapshot.supportedFeatures(); }
    [[nodiscard]] bool isBandSupportedForSta(int band) const noexcept { return mSnapshot.isBandSupportedForSta(band); }
    [[nodiscard]] std::optional<NetworkHandle> currentNetwork() const { return mSnapshot.currentNetwork(); }
    [[nodiscard]] ConnectionInfo connectionInfo() const { return mSnapshot.connectionInfo(); }
    [[nodiscard]] std::vector<WorkSource> secondaryRequestWorkSources() const { return mSnapshot.secondaryRequestWorkSources(); }
    [[nodiscard]] WifiState wifiState() const noexcept { return mSnapshot.wifiState(); }

private:
    static constexpr bool kHandled    = true;
    static constexpr bool kNotHandled = false;

    // -------------------------------------------------------------------------
    // Manager listeners
    // -------------------------------------------------------------------------

    struct Lifetime {};

    class ClientListener final : public ModeManagerListener<ClientModeManager>
    {
    public:
        explicit ClientListener(ModeController& controller,
                                ClientModeManagerRequestListener externalListener = {})
            : mController(controller)
            , mLifetime(controller.mLifetime)
            , mExternalListener(std::move(externalListener))
        {
        }

        void onStarted(const ClientModeManagerPtr& manager) override
        {
            if (mLifetime.expired() || !mController.isTracked(manager, "onStarted"))
            {
                return;
            }
            onStartedOrRoleChanged(manager);
            mController.invokeOnAddedCallbacks(manager);
            // added before primary changed
            mController.onPrimaryChangedDueToStartedOrRoleChanged(manager);
        }

        void onRoleChanged(const ClientModeManagerPtr& manager) override
        {
            if (mLifetime.expired() || !mController.isTracked(manager, "onRoleChanged"))
            {
                return;
            }
            onStartedOrRoleChanged(manager);
            mController.invokeOnRoleChangedCallbacks(manager);
            mController.onPrimaryChangedDueToStartedOrRoleChanged(manager);
        }

        void onStopped(const ClientModeManagerPtr& manager) override
        {
            if (mLifetime.expired())
            {
                return;
            }
            if (mController.onClientStoppedOrStartFailure(manager, false))
            {
                mController.sendMessage(msg::StaStopped{});
            }
        }

        void onStartFailure(const ClientModeManagerPtr& manager) override
        {
            logger().error("ClientModeManager start failed! {}", manager->describe());
            if (mLifetime.expired())
            {
                return;
            }
            if (mController.onClientStoppedOrStartFailure(manager, true))
            {
                mController.sendMessage(msg::StaStartFailure{});
            }
        }

    private:
        ModeController& mController;
        std::weak_ptr<const Lifetime> mLifetime;
        ClientModeManagerRequestListener mExternalListener;  // one shot

        void onStartedOrRoleChanged(const ClientModeManagerPtr& manager)
        {
            mController.updateClientScanMode();
            mController.updateBatteryStats();
            mController.configureHwForMultiSta();
            if (mExternalListener)
            {
                auto listener = std::move(mExternalListener);
                mExternalListener = nullptr;
                listener(manager);
            }
            mController.reportWifiStateToSar();
        }
    };

    class SoftApListener final : public ModeManagerListener<SoftApManager>
    {
    public:
        explicit SoftApListener(ModeController& controller)
            : mController(controller)
            , mLifetime(controller.mLifetime)
        {
        }

        void onStarted(const SoftApManagerPtr& manager) override
        {
            if (mLifetime.expired() || !mController.isTracked(manager, "onStarted"))
            {
                return;
            }
            mController.updateBatteryStats();
            mController.invokeOnAddedCallbacks(manager);
        }

        void onRoleChanged(const SoftApManagerPtr& manager) override
        {
            logger().warn("Role switch received on {} unexpectedly", manager->describe());
        }

        void onStopped(const SoftApManagerPtr& manager) override
        {
            onStoppedOrStartFailure(manager, false);
        }

        void onStartFailure(const SoftApManagerPtr& manager) override
        {
            logger().error("SoftApManager start failed! {}", manager->describe());
            onStoppedOrStartFailure(manager, true);
        }

    private:
        ModeController& mController;
        std::weak_ptr<const Lifetime> mLifetime;

        void onStoppedOrStartFailure(const SoftApManagerPtr& manager, bool startFailed)
        {
            if (mLifetime.expired())
            {
                return;
            }
            if (!mController.mRegistry.remove(manager))
            {
                logger().critical("{} for untracked {}", startFailed ? "onStartFailure" : "onStopped",
                                  manager->describe());
                return;
            }
            mController.mRegistry.graveyard().inter(snapshotOf(*manager, startFailed));
            mController.updateBatteryStats();
            if (startFailed)
            {
                mController.sendMessage(msg::ApStartFailure{});
                const std::string_view reason = "soft AP failed to start";
                mController.mHub.onSoftApStartFailed.emit(manager->softApModeConfiguration().targetMode, reason);
            }
            else
            {
                mController.sendMessage(msg::ApStopped{});
            }
            mController.invokeOnRemovedCallbacks(manager);
        }
    };

    // -------------------------------------------------------------------------
    // Members
    // -------------------------------------------------------------------------

    ControllerDependencies mDeps;
    SerialExecutor&        mExecutor;
    ControllerConfig       mConfig;

    events::ModeEventHub   mHub;
    ModeManagerRegistry    mRegistry;
    ServiceApiSnapshot     mSnapshot;
    AdmissionPolicy        mPolicy;
    ControllerLog<kControllerLogCapacity> mLog;

    // mContext must be declared before mSM: StateMachine binds a Context& in its ctor.
    ControllerContext              mContext;
    ControllerStateMachine         mSM;
    std::optional<ControllerState> mPendingTransition;
    std::deque<ControllerMessage>  mDeferred;
    std::string                    mMessageDetail;

    ClientModeManagerPtr mLastPrimary;

    bool mStarted                       = false;
    bool mInEmergencyCall               = false;
    bool mInEmergencyCallbackMode       = false;
    bool mEmergencyScanInProgress       = false;
    bool mRecoveryInProgress            = false;
    bool mMultiplePrimaryBugreportTaken = false;

    std::atomic<bool> mVerboseLogging{false};
    std::atomic<bool> mShuttingDown{false};

    /// Expires with the controller; queued work holding a weak reference is dropped.
    std::shared_ptr<const Lifetime> mLifetime = std::make_shared<const Lifetime>();

    // -------------------------------------------------------------------------
    // Message plumbing
    // -------------------------------------------------------------------------

    /// Wraps fn so it does nothing once this controller is destroyed.
    template <typename Fn>
    [[nodiscard]] SerialExecutor::Task guarded(Fn fn) const
    {
        return [lifetime = std::weak_ptr<const Lifetime>(mLifetime), fn = std::move(fn)]() mutable
        {
            if (lifetime.expired())
            {
                return;
            }
            fn();
        };
    }

    void sendMessage(ControllerMessage message)
    {
        std::string name(messageName(message));
        mExecutor.post(guarded([this, message = std::move(message)]() mutable { processMessage(std::move(message)); }),
                       std::move(name));
    }

    void sendMessageDelayed(ControllerMessage message, std::chrono::milliseconds delay)
    {
        std::string name(messageName(message));
        mExecutor.postDelayed(guarded([this, message = std::move(message)]() mutable
                                      { processMessage(std::move(message)); }),
                              delay, std::move(name));
    }

    /// Parks the message until the next transition.
    void deferMessage(ControllerMessage message)
    {
        logger().info("Deferring {}", messageName(message));
        mDeferred.push_back(std::move(message));
        noteDetail("deferred");
    }

    template <typename T>
    [[nodiscard]] bool hasDeferredMessages() const
    {
        for (const auto& message : mDeferred)
        {
            if (holds<T>(message)) { return true; }
        }
        return false;
    }

    template <typename T>
    void removeDeferredMessages()
    {
        for (auto it = mDeferred.begin(); it != mDeferred.end();)
        {
            it = holds<T>(*it) ? mDeferred.erase(it) : std::next(it);
        }
    }

    void transitionTo(ControllerState state) { mPendingTransition = state; }

    void noteDetail(std::string_view detail)
    {
        if (!mMessageDetail.empty())
        {
            mMessageDetail += ", ";
        }
        mMessageDetail += detail;
    }

    [[nodiscard]] fat_p::Expected<void, std::string> postAdditionalRequest(AdditionalClientModeManagerRequest request)
    {
        if (!request.listener)
        {
            return fat_p::unexpected(std::string("request listener must not be null"));
        }
        if (request.requestorWs.empty())
        {
            return fat_p::unexpected(std::string("request work source must not be empty"));
        }
        sendMessage(msg::RequestAdditionalClientModeManager{std::move(request)});
        return {};
    }

    void processMessage(ControllerMessage message)
    {
        const std::string_view name = messageName(message);
        const ControllerState handledIn = currentState();
        mMessageDetail.clear();

        if (holds<msg::EmergencyCallStateChanged>(message) || holds<msg::EmergencyCallbackModeChanged>(message))
        {
            handleEmergencyModeStateChange(message);
        }
        else if (auto* scan = std::get_if<msg::EmergencyScanStateChanged>(&message))
        {
            handleEmergencyScanStateChange(scan->inProgress, scan->requestorWs);
        }
        else if (isInEmergencyMode())
        {
            processMessageInEmergencyMode(message);
        }
        else
        {
            const bool handled = currentState() == ControllerState::Enabled ? processInEnabledState(message)
                                                                            : processInDisabledState(message);
            if (!handled)
            {
                processInDefaultState(message);
            }
        }

        noteDetail("clients=" + std::to_string(mRegistry.clients().size())
                   + " softAps=" + std::to_string(mRegistry.softAps().size()));
        const std::string detail = mMessageDetail;
        mHub.onMessageProcessed.emit(name, stateName(handledIn), std::string_view(detail));
        performTransition();
    }

    void performTransition()
    {
        if (!mPendingTransition)
        {
            return;
        }
        const ControllerState target = *mPendingTransition;
        mPendingTransition.reset();

        if (target == currentState())
        {
            replayDeferredMessages();
        }
        else if (target == ControllerState::Enabled)
        {
            mSM.transition<EnabledState>();
        }
        else
        {
            mSM.transition<DisabledState>();
        }
    }

    /// Replays deferred messages in their original order, ahead of everything already queued.
    void replayDeferredMessages()
    {
        for (auto it = mDeferred.rbegin(); it != mDeferred.rend(); ++it)
        {
            std::string taskName(messageName(*it));
            mExecutor.postAtFront(guarded([this, message = std::move(*it)]() mutable
                                          { processMessage(std::move(message)); }),
                                  std::move(taskName));
        }
        mDeferred.clear();
    }

    // -------------------------------------------------------------------------
    // Startup
    // -------------------------------------------------------------------------

    void initialize()
    {
        if (mStarted)
        {
            logger().warn("ModeController already started");
            return;
        }
        mStarted = true;

        const auto& settings = mDeps.settings;
        logger().info("isAirplaneModeOn = {}, isWifiEnabled = {}, isScanningAvailable = {}, "
                      "isLocationModeActive = {}, isSatelliteModeOn = {}",
                      settings.isAirplaneModeOn(), settings.isWifiToggleEnabled(),
                      settings.isScanAlwaysAvailable(), settings.isLocationModeEnabled(),
                      settings.isSatelliteModeOn());

        setSupportedFeatureSet(mDeps.chip.nativeFeatureSet(std::nullopt),
                               mDeps.chip.isStaApConcurrencySupported(),
                               mDeps.chip.isStaStaConcurrencySupported());
        mSnapshot.setStaBands(settings.cachedStaBands());

        mRegistry.setLastPrimaryRequestorWs(WorkSource::settings());
        mRegistry.setLastScanOnlyRequestorWs(WorkSource::internal());

        bool started = false;
        if (shouldEnableSta())
        {
            const auto role = roleForPrimaryOrScanOnly();
            if (role == Role::ClientPrimary)
            {
                started = startPrimaryClientModeManager(mRegistry.lastPrimaryRequestorWs());
            }
            else if (role == Role::ClientScanOnly)
            {
                started = startScanOnlyClientModeManager(mRegistry.lastScanOnlyRequestorWs());
            }
        }
        if (started)
        {
            mSM.transition<EnabledState>();
        }

        // the initial state is reported once, with no previous state
        mContext.reporting = true;
        mHub.onControllerStateChanged.emit(std::string_view{}, currentStateName());
    }

    // -------------------------------------------------------------------------
    // Emergency handling (ahead of every state)
    // -------------------------------------------------------------------------

    [[nodiscard]] bool isInEmergencyModeWhichRequiresWifiDisable() const
    {
        return isInEmergencyMode() && mConfig.disableWifiInEcm;
    }

    void handleEmergencyModeStateChange(const ControllerMessage& message)
    {
        const bool wasInEmergencyMode = isInEmergencyMode();
        if (auto* call = std::get_if<msg::EmergencyCallStateChanged>(&message))
        {
            mInEmergencyCall = call->active;
        }
        else if (auto* ecm = std::get_if<msg::EmergencyCallbackModeChanged>(&message))
        {
            mInEmergencyCallbackMode = ecm->active;
        }
        const bool inEmergencyMode = isInEmergencyMode();

        if (!wasInEmergencyMode && inEmergencyMode)
        {
            enterEmergencyMode();
        }
        else if (wasInEmergencyMode && !inEmergencyMode)
        {
            exitEmergencyMode();
        }
    }

    void enterEmergencyMode()
    {
        stopSoftApModeManagers(SoftApIpMode::Unspecified);
        logger().info("Entering emergency callback mode, disable wifi in ECBM: {}", mConfig.disableWifiInEcm);
        noteDetail("entering emergency mode");
        if (!mEmergencyScanInProgress)
        {
            if (mConfig.disableWifiInEcm)
            {
                shutdownWifi();
            }
        }
        else if (mConfig.disableWifiInEcm)
        {
            switchAllPrimaryClientModeManagersToScanOnlyMode(WorkSource::settings());
        }
    }

    void exitEmergencyMode()
    {
        logger().info("Exiting emergency callback mode");
        noteDetail("exiting emergency mode");
        // Whichever state we are in, the toggle handler decides what comes next.
        wifiToggled(WorkSource::settings());
    }

    void handleEmergencyScanStateChange(bool scanInProgress, const WorkSource& requestorWs)
    {
        logger().info("Processing emergency scan state change: {}", scanInProgress);
        mEmergencyScanInProgress = scanInProgress;
        if (isInEmergencyModeWhichRequiresWifiDisable())
        {
            // The toggle handlers would bring back connectivity mode, so only
            // scan-only is started or torn down here.
            if (currentState() == ControllerState::Disabled && scanInProgress)
            {
                startScanOnlyClientModeManager(requestorWs);
                transitionTo(ControllerState::Enabled);
            }
            else if (currentState() == ControllerState::Enabled && !scanInProgress)
            {
                stopAllClientModeManagers();
            }
        }
        else if (currentState() == ControllerState::Disabled)
        {
            handleStaToggleChangeInDisabledState(requestorWs);
        }
        else
        {
            handleStaToggleChangeInEnabledState(requestorWs);
        }
    }

    void processMessageInEmergencyMode(const ControllerMessage& message)
    {
        if (holds<msg::StaStopped>(message) || holds<msg::ApStopped>(message)
            || holds<msg::StaStartFailure>(message) || holds<msg::ApStartFailure>(message))
        {
            logger().info("Processing {} in emergency mode", messageName(message));
            if (mRegistry.empty())
            {
                logger().info("No active mode managers, return to DisabledState");
                transitionTo(ControllerState::Disabled);
            }
            return;
        }

        if (auto* setAp = std::get_if<msg::SetSoftAp>(&message))
        {
            if (setAp->enable && setAp->config)
            {
                logger().info("AP cannot be started in emergency mode");
                noteDetail("soft AP start refused");
                const std::string_view reason = "soft AP cannot start in emergency mode";
                mHub.onSoftApStartFailed.emit(setAp->config->targetMode, reason);
            }
            return;
        }

        if (auto* request = std::get_if<msg::RequestAdditionalClientModeManager>(&message))
        {
            noteDetail("rejected in emergency mode");
            answer(request->request, nullptr);
            return;
        }

        logger().info("Dropping {} in emergency mode", messageName(message));
        noteDetail("dropped in emergency mode");
    }

    // -------------------------------------------------------------------------
    // Default state
    // -------------------------------------------------------------------------

    [[nodiscard]] bool shouldEnableScanOnlyMode() const
    {
        return (mDeps.settings.isLocationModeEnabled() && mDeps.settings.isScanAlwaysAvailable())
            || mEmergencyScanInProgress;
    }

    [[nodiscard]] bool shouldEnableSta() const
    {
        return (mDeps.settings.isWifiToggleEnabled() || shouldEnableScanOnlyMode())
            && !mDeps.settings.isSatelliteModeOn();
    }

    void checkAndHandleAirplaneModeState()
    {
        if (mDeps.settings.isAirplaneModeOn())
        {
            logger().info("Airplane mode toggled");
            if (!mDeps.settings.shouldWifiRemainEnabledInApm())
            {
                logger().info("Wifi disabled on APM, disable wifi");
                shutdownWifi();
            }
            return;
        }
        logger().info("Airplane mode disabled, determine next state");
        if (shouldEnableSta())
        {
            startPrimaryOrScanOnlyClientModeManager(WorkSource::settings());
            transitionTo(ControllerState::Enabled);
        }
    }

    void processInDefaultState(const ControllerMessage& message)
    {
        if (holds<msg::ScanAlwaysModeChanged>(message) || holds<msg::EmergencyScanStateChanged>(message)
            || holds<msg::WifiToggled>(message) || holds<msg::StaStopped>(message)
            || holds<msg::StaStartFailure>(message) || holds<msg::ApStopped>(message)
            || holds<msg::ApStartFailure>(message) || holds<msg::RecoveryRestart>(message)
            || holds<msg::RecoveryRestartContinue>(message) || holds<msg::DeferredRecoveryRestart>(message)
            || holds<msg::RemoveAdditionalClientModeManager>(message))
        {
            return;
        }

        if (auto* request = std::get_if<msg::RequestAdditionalClientModeManager>(&message))
        {
            answer(request->request, nullptr);
            return;
        }
        if (holds<msg::RecoveryDisable>(message))
        {
            logger().info("Recovery has been throttled, disable wifi");
            shutdownWifi();
            return;
        }
        if (holds<msg::AirplaneToggled>(message))
        {
            if (mDeps.settings.isSatelliteModeOn())
            {
                logger().info("Satellite mode is on, ignoring airplane mode toggle");
                noteDetail("ignored, satellite on");
                return;
            }
            checkAndHandleAirplaneModeState();
            return;
        }
        if (auto* capability = std::get_if<msg::UpdateSoftApCapability>(&message))
        {
            for (const auto& softAp : mRegistry.softAps())
            {
                if (softAp->softApModeConfiguration().targetMode == capability->ipMode)
                {
                    softAp->updateCapability(capability->capability);
                }
            }
            return;
        }
        if (auto* config = std::get_if<msg::UpdateSoftApConfig>(&message))
        {
            for (const auto& softAp : mRegistry.softAps())
            {
                softAp->updateConfiguration(config->config);
            }
            return;
        }
        if (holds<msg::SatelliteModeChanged>(message))
        {
            if (mDeps.settings.isSatelliteModeOn())
            {
                logger().info("Satellite mode is on, disable wifi");
                shutdownWifi();
            }
            else
            {
                logger().info("Satellite mode is off, determine next state");
                checkAndHandleAirplaneModeState();
            }
            return;
        }

        logger().critical("Unhandled message {} in {}", messageName(message), currentStateName());
        noteDetail("unhandled");
    }

    // -------------------------------------------------------------------------
    // Toggle handling shared by Disabled and Enabled
    // -------------------------------------------------------------------------

    void handleStaToggleChangeInDisabledState(const WorkSource& requestorWs)
    {
        if (shouldEnableSta())
        {
            startPrimaryOrScanOnlyClientModeManager(requestorWs);
            transitionTo(ControllerState::Enabled);
        }
    }

    void handleStaToggleChangeInEnabledState(const WorkSource& requestorWs)
    {
        if (!shouldEnableSta())
        {
            stopAllClientModeManagers();
            mDeps.connectivity.resetOnWifiDisable();
            return;
        }
        if (!mRegistry.hasPrimaryOrScanOnly())
        {
            startPrimaryOrScanOnlyClientModeManager(requestorWs);
            return;
        }
        if (!mDeps.settings.isWifiToggleEnabled())
        {
            // Secondaries go first so their users abort before the primary
            // drops to scan-only.
            stopSecondaryClientModeManagers();
            mDeps.connectivity.resetOnWifiDisable();
        }
        switchAllPrimaryOrScanOnlyClientModeManagers();
    }

    // -------------------------------------------------------------------------
    // Disabled state
    // -------------------------------------------------------------------------

    bool processInDisabledState(const ControllerMessage& message)
    {
        if (auto* toggled = std::get_if<msg::WifiToggled>(&message))
        {
            handleStaToggleChangeInDisabledState(toggled->requestorWs);
            return kHandled;
        }
        if (auto* scanAlways = std::get_if<msg::ScanAlwaysModeChanged>(&message))
        {
            handleStaToggleChangeInDisabledState(scanAlways->requestorWs);
            return kHandled;
        }
        if (auto* setAp = std::get_if<msg::SetSoftAp>(&message))
        {
            if (setAp->enable && setAp->config)
            {
                if (startSoftApModeManager(*setAp->config, setAp->requestorWs))
                {
                    transitionTo(ControllerState::Enabled);
                }
            }
            return kHandled;
        }
        if (holds<msg::RecoveryRestart>(message))
        {
            logger().info("Recovery triggered, already in disabled state");
            mRecoveryInProgress = true;
            sendMessageDelayed(msg::RecoveryRestartContinue{}, mConfig.recoveryDelay);
            return kHandled;
        }
        if (auto* deferred = std::get_if<msg::DeferredRecoveryRestart>(&message))
        {
            // give the driver time to reset cleanly
            sendMessageDelayed(msg::RecoveryRestartContinue{deferred->entries}, mConfig.recoveryDelay);
            return kHandled;
        }
        if (auto* resume = std::get_if<msg::RecoveryRestartContinue>(&message))
        {
            continueRecoveryInDisabledState(resume->entries);
            return kHandled;
        }
        return kNotHandled;
    }

    void continueRecoveryInDisabledState(const std::vector<RecoveryEntry>& entries)
    {
        logger().info("Recovery in progress, start wifi");
        if (entries.empty())
        {
            mRecoveryInProgress = false;
            // nothing user-controlled was up before recovery
            if (shouldEnableSta())
            {
                startPrimaryOrScanOnlyClientModeManager(WorkSource::settings());
                transitionTo(ControllerState::Enabled);
            }
            return;
        }

        for (const auto& entry : entries)
        {
            if (entry.kind == ManagerKind::Client)
            {
                startPrimaryOrScanOnlyClientModeManager(entry.requestorWs);
            }
            else if (entry.softApConfig)
            {
                startSoftApModeManager(*entry.softApConfig, entry.requestorWs);
            }
        }
        if (mRegistry.empty())
        {
            logger().warn("Recovery recreated no mode managers, staying in DisabledState");
        }
        else
        {
            transitionTo(ControllerState::Enabled);
        }
        finishRecovery();
    }

    void finishRecovery()
    {
        mRecoveryInProgress = false;
        mHub.onSubsystemRestarted.emit();
        mDeps.recovery.onRecoveryCompleted();
    }

    // -------------------------------------------------------------------------
    // Enabled state
    // -------------------------------------------------------------------------

    bool processInEnabledState(const ControllerMessage& message)
    {
        if (auto* toggled = std::get_if<msg::WifiToggled>(&message))
        {
            handleStaToggleChangeInEnabledState(toggled->requestorWs);
            return kHandled;
        }
        if (auto* scanAlways = std::get_if<msg::ScanAlwaysModeChanged>(&message))
        {
            handleStaToggleChangeInEnabledState(scanAlways->requestorWs);
            return kHandled;
        }
        if (auto* request = std::get_if<msg::RequestAdditionalClientModeManager>(&message))
        {
            handleAdditionalClientModeManagerRequest(request->request);
            return kHandled;
        }
        if (auto* remove = std::get_if<msg::RemoveAdditionalClientModeManager>(&message))
        {
            stopAdditionalClientModeManager(remove->manager);
            return kHandled;
        }
        if (auto* setAp = std::get_if<msg::SetSoftAp>(&message))
        {
            if (setAp->enable)
            {
                if (setAp->config)
                {
                    startSoftApModeManager(*setAp->config, setAp->requestorWs);
                }
            }
            else
            {
                stopSoftApModeManagers(setAp->stopMode);
            }
            return kHandled;
        }
        if (holds<msg::AirplaneToggled>(message))
        {
            return handleAirplaneToggleInEnabledState(message);
        }
        if (holds<msg::SatelliteModeChanged>(message))
        {
            if (mDeps.settings.isSatelliteModeOn())
            {
                logger().info("Satellite mode is on, disable wifi");
                shutdownWifi();
                return kHandled;
            }
            if (!mRegistry.hasPrimaryOrScanOnly())
            {
                // soft AP only: let Default decide whether STA comes back
                return kNotHandled;
            }
            return kHandled;
        }
        if (holds<msg::ApStopped>(message) || holds<msg::ApStartFailure>(message))
        {
            handleSoftApGoneInEnabledState(holds<msg::ApStopped>(message));
            return kHandled;
        }
        if (holds<msg::StaStopped>(message) || holds<msg::StaStartFailure>(message))
        {
            handleClientGoneInEnabledState();
            return kHandled;
        }
        if (holds<msg::DeferredRecoveryRestart>(message))
        {
            // shutdown still in progress; wait for DisabledState
            deferMessage(message);
            return kHandled;
        }
        if (auto* restart = std::get_if<msg::RecoveryRestart>(&message))
        {
            restartWifiInEnabledState(*restart);
            return kHandled;
        }
        if (holds<msg::RecoveryRestartContinue>(message))
        {
            logger().info("Received recovery continue while already in EnabledState");
            // A soft AP came up before recovery completed; make sure STA is back too.
            if (shouldEnableSta() && !mRegistry.hasPrimaryOrScanOnly())
            {
                startPrimaryOrScanOnlyClientModeManager(WorkSource::settings());
            }
            finishRecovery();
            return kHandled;
        }
        return kNotHandled;
    }

    bool handleAirplaneToggleInEnabledState(const ControllerMessage& message)
    {
        if (mDeps.settings.isAirplaneModeOn())
        {
            return kNotHandled;
        }
        if (wifiState() == WifiState::Disabling)
        {
            // The previous airplane-on is still shutting down. Replay once
            // DisabledState is reached.
            deferMessage(message);
            return kHandled;
        }
        if (!mRegistry.hasPrimaryOrScanOnly())
        {
            logger().info("Airplane mode toggled off with no primary manager");
            return kNotHandled;
        }
        logger().info("Airplane mode toggled off and wifi is on, nothing to do");
        return kHandled;
    }

    void handleSoftApGoneInEnabledState(bool stopped)
    {
        if (!mRegistry.empty())
        {
            logger().info("AP disabled, remain in EnabledState");
            return;
        }
        if (stopped)
        {
            mDeps.recovery.onWifiStopped();
            if (mRecoveryInProgress)
            {
                transitionTo(ControllerState::Disabled);
                return;
            }
        }
        if (shouldEnableSta())
        {
            logger().info("SoftAp disabled, start client mode");
            startPrimaryOrScanOnlyClientModeManager(WorkSource::settings());
        }
        else
        {
            logger().info("SoftAp mode disabled, return to DisabledState");
            transitionTo(ControllerState::Disabled);
        }
    }

    void handleClientGoneInEnabledState()
    {
        if (mRegistry.empty())
        {
            mDeps.recovery.onWifiStopped();
            logger().info("STA disabled, return to DisabledState");
            transitionTo(ControllerState::Disabled);
            return;
        }
        logger().info("STA disabled, remain in EnabledState");

        // An airplane-off deferred while disabling never sees a state change
        // when only soft APs remain, so it is consumed here.
        if (hasDeferredMessages<msg::AirplaneToggled>() && !mRegistry.hasPrimaryOrScanOnly())
        {
            removeDeferredMessages<msg::AirplaneToggled>();
            noteDetail("consumed deferred airplane toggle");
            if (mDeps.settings.isAirplaneModeOn())
            {
                return;
            }
            logger().info("Airplane mode disabled, determine next state");
            if (shouldEnableSta())
            {
                startPrimaryOrScanOnlyClientModeManager(WorkSource::settings());
            }
        }
    }

    void restartWifiInEnabledState(const msg::RecoveryRestart& restart)
    {
        logger().info("Recovery triggered, disable wifi");
        if (restart.requestBugReport)
        {
            std::string title = restart.reason.empty() ? std::string("Wi-Fi BugReport")
                                                       : "Wi-Fi BugReport: " + restart.reason;
            mExecutor.post(guarded([this, title = std::move(title), detail = restart.reason]
                                   { mDeps.diagnostics.takeBugReport(title, detail); }),
                           "takeBugReport");
        }

        std::vector<RecoveryEntry> entries;
        for (const auto& client : mRegistry.clientsInRoles({Role::ClientScanOnly, Role::ClientPrimary}))
        {
            entries.push_back(RecoveryEntry{ManagerKind::Client, *client->role(), client->requestorWs(), std::nullopt});
        }
        for (const auto& softAp : mRegistry.softAps())
        {
            if (softAp->role() == Role::SoftApTethered)
            {
                entries.push_back(RecoveryEntry{ManagerKind::SoftAp, Role::SoftApTethered,
                                                softAp->requestorWs(), softAp->softApModeConfiguration()});
            }
        }
        noteDetail("recreating " + std::to_string(entries.size()) + " manager(s) after recovery");

        deferMessage(msg::DeferredRecoveryRestart{std::move(entries)});
        mRecoveryInProgress = true;
        mHub.onSubsystemRestarting.emit();
        shutdownWifi();
    }

    // -------------------------------------------------------------------------
    // Additional client requests
    // -------------------------------------------------------------------------

    void handleAdditionalClientModeManagerRequest(const AdditionalClientModeManagerRequest& request)
    {
        const AdmissionDecision decision = mPolicy.decide(request, wifiState());
        logger().debug("{} request from {}: {} ({})", roleName(request.clientRole),
                       request.requestorWs.toString(), outcomeName(decision.outcome), decision.reason);
        noteDetail(std::string(outcomeName(decision.outcome)) + ": " + decision.reason);

        switch (decision.outcome)
        {
            case AdmissionOutcome::Reject:
                answer(request, nullptr);
                break;
            case AdmissionOutcome::AnswerExisting:
            case AdmissionOutcome::AnswerPrimary:
                answer(request, decision.manager);
                break;
            case AdmissionOutcome::CreateNew:
                startAdditionalClientModeManager(request.clientRole, request.listener, decision.creatorWs);
                break;
            case AdmissionOutcome::SwitchRole:
                switchRoleForAdditionalClientModeManager(decision.manager, request.clientRole,
                                                         request.listener, request.requestorWs);
                break;
        }
    }

    static void answer(const AdditionalClientModeManagerRequest& request, const ClientModeManagerPtr& manager)
    {
        if (request.listener)
        {
            request.listener(manager);
        }
    }

    void startAdditionalClientModeManager(Role role, const ClientModeManagerRequestListener& externalListener,
                                          const WorkSource& requestorWs)
    {
        logger().debug("Starting additional ClientModeManager in role: {}", roleName(role));
        auto listener = std::make_shared<ClientListener>(*this, externalListener);
        auto manager = mDeps.factory.makeClientModeManager(listener, requestorWs, role, mVerboseLogging.load());
        if (!manager)
        {
            logger().error("Factory could not create a ClientModeManager in role {}", roleName(role));
            if (externalListener)
            {
                externalListener(nullptr);
            }
            return;
        }
        mRegistry.add(manager);
        if (isTrackedSecondaryRole(role))
        {
            mSnapshot.addSecondaryRequestWs(requestorWs);
        }
    }

    void switchRoleForAdditionalClientModeManager(const ClientModeManagerPtr& manager, Role role,
                                                  const ClientModeManagerRequestListener& externalListener,
                                                  const WorkSource& requestorWs)
    {
        logger().debug("Switching role for additional ClientModeManager to role: {}", roleName(role));
        auto listener = std::make_shared<ClientListener>(*this, externalListener);
        mSnapshot.removeSecondaryRequestWs(manager->requestorWs());
        if (isTrackedSecondaryRole(role))
        {
            mSnapshot.addSecondaryRequestWs(requestorWs);
        }
        manager->setRole(role, requestorWs, std::move(listener));
    }

    void stopAdditionalClientModeManager(const ClientModeManagerPtr& manager)
    {
        if (!manager || manager->role() == Role::ClientPrimary || manager->role() == Role::ClientScanOnly)
        {
            return;
        }
        logger().debug("Shutting down additional client mode manager: {}", manager->describe());
        manager->stop();
    }

    // -------------------------------------------------------------------------
    // Starting and stopping managers
    // -------------------------------------------------------------------------

    [[nodiscard]] std::optional<Role> roleForPrimaryOrScanOnly() const
    {
        if (mDeps.settings.isWifiToggleEnabled())
        {
            return Role::ClientPrimary;
        }
        if (shouldEnableScanOnlyMode())
        {
            return Role::ClientScanOnly;
        }
        logger().error("Something is wrong, no client mode toggles enabled");
        return std::nullopt;
    }

    bool refuseDuplicatePrimaryOrScanOnly(std::string_view what)
    {
        if (!mRegistry.hasPrimaryOrScanOnly())
        {
            return false;
        }
        logger().error("Unexpected state - {} CMM should not be started when a primary "
                       "or scan only CMM is already present", what);
        if (!mMultiplePrimaryBugreportTaken)
        {
            mMultiplePrimaryBugreportTaken = true;
            mDeps.diagnostics.takeBugReport("Wi-Fi ModeController bugreport",
                                            "Trying to start " + std::string(what)
                                                + " mode manager when one already exists.");
        }
        return true;
    }

    bool startScanOnlyClientModeManager(const WorkSource& requestorWs)
    {
        if (refuseDuplicatePrimaryOrScanOnly("scan only"))
        {
            return false;
        }
        logger().debug("Starting primary ClientModeManager in scan only mode");
        if (!makeClientModeManager(requestorWs, Role::ClientScanOnly))
        {
            return false;
        }
        mRegistry.setLastScanOnlyRequestorWs(requestorWs);
        return true;
    }

    bool startPrimaryClientModeManager(const WorkSource& requestorWs)
    {
        if (refuseDuplicatePrimaryOrScanOnly("primary"))
        {
            return false;
        }
        logger().debug("Starting primary ClientModeManager in connect mode");
        if (!makeClientModeManager(requestorWs, Role::ClientPrimary))
        {
            return false;
        }
        mRegistry.setLastPrimaryRequestorWs(requestorWs);
        setWifiState(WifiState::Enabling);
        return true;
    }

    bool startPrimaryOrScanOnlyClientModeManager(const WorkSource& requestorWs)
    {
        const auto role = roleForPrimaryOrScanOnly();
        if (role == Role::ClientPrimary)
        {
            return startPrimaryClientModeManager(requestorWs);
        }
        if (role == Role::ClientScanOnly)
        {
            return startScanOnlyClientModeManager(requestorWs);
        }
        return false;
    }

    bool makeClientModeManager(const WorkSource& requestorWs, Role role)
    {
        auto manager = mDeps.factory.makeClientModeManager(std::make_shared<ClientListener>(*this),
                                                           requestorWs, role, mVerboseLogging.load());
        if (!manager)
        {
            logger().error("Factory could not create a ClientModeManager in role {}", roleName(role));
            return false;
        }
        mRegistry.add(std::move(manager));
        return true;
    }

    bool startSoftApModeManager(const SoftApModeConfiguration& config, const WorkSource& requestorWs)
    {
        if (config.targetMode != SoftApIpMode::Tethered && config.targetMode != SoftApIpMode::LocalOnly)
        {
            logger().critical("Soft AP request with unspecified ip mode dropped");
            return false;
        }
        if (!mRegistry.softApsForMode(config.targetMode).empty())
        {
            logger().warn("A SoftApManager in role {} already exists, dropping request",
                          roleName(softApRoleFor(config.targetMode)));
            const std::string_view reason = "soft AP already active in this role";
            mHub.onSoftApStartFailed.emit(config.targetMode, reason);
            return false;
        }
        if (!mPolicy.canRequestMoreSoftApManagers(requestorWs))
        {
            logger().warn("No AP interface available for {}", requestorWs.toString());
            const std::string_view reason = "no soft AP interface available";
            mHub.onSoftApStartFailed.emit(config.targetMode, reason);
            return false;
        }
        logger().debug("Starting SoftApModeManager ssid = {}", config.config.ssid);
        auto manager = mDeps.factory.makeSoftApManager(std::make_shared<SoftApListener>(*this), config,
                                                       requestorWs, softApRoleFor(config.targetMode),
                                                       mVerboseLogging.load());
        if (!manager)
        {
            logger().error("Factory could not create a SoftApManager");
            const std::string_view reason = "soft AP manager could not be created";
            mHub.onSoftApStartFailed.emit(config.targetMode, reason);
            return false;
        }
        mRegistry.add(std::move(manager));
        return true;
    }

    void stopSoftApModeManagers(SoftApIpMode ipMode)
    {
        logger().debug("Shutting down all softap mode managers in mode {}", ipModeName(ipMode));
        for (const auto& softAp : mRegistry.softAps())
        {
            if (ipMode == SoftApIpMode::Unspecified || softAp->role() == softApRoleFor(ipMode))
            {
                softAp->stop();
            }
        }
    }

    /// Clients with the primary last; more than one primary is reported once.
    [[nodiscard]] std::vector<ClientModeManagerPtr> clientModeManagersPrimaryLast()
    {
        if (mRegistry.countInRole(Role::ClientPrimary) > 1)
        {
            logger().critical("More than 1 primary CMM detected when turning off Wi-Fi");
            mDeps.diagnostics.takeBugReport("Wi-Fi ModeController bugreport",
                                            "Multiple primary CMMs detected when turning off Wi-Fi.");
        }
        return mRegistry.clientsPrimaryLast();
    }

    void stopAllClientModeManagers()
    {
        logger().debug("Shutting down all client mode managers");
        for (const auto& client : clientModeManagersPrimaryLast())
        {
            if (client->role() == Role::ClientPrimary)
            {
                setWifiState(WifiState::Disabling);
            }
            client->stop();
        }
    }

    void switchAllPrimaryClientModeManagersToScanOnlyMode(const WorkSource& requestorWs)
    {
        logger().debug("Switching all primary client mode managers to scan only mode");
        for (const auto& client : mRegistry.clients())
        {
            if (client->role() != Role::ClientPrimary)
            {
                continue;
            }
            setWifiState(WifiState::Disabling);
            client->setRole(Role::ClientScanOnly, requestorWs, nullptr);
        }
    }

    void stopSecondaryClientModeManagers()
    {
        stopAllClientModeManagersInRole(Role::ClientLocalOnly);
        stopAllClientModeManagersInRole(Role::ClientSecondaryTransient);
        stopAllClientModeManagersInRole(Role::ClientSecondaryLongLived);
    }

    bool switchAllPrimaryOrScanOnlyClientModeManagers()
    {
        logger().debug("Switching all client mode managers");
        const auto role = roleForPrimaryOrScanOnly();
        if (!role)
        {
            return false;
        }
        const WorkSource& lastRequestorWs = *role == Role::ClientPrimary ? mRegistry.lastPrimaryRequestorWs()
                                                                         : mRegistry.lastScanOnlyRequestorWs();
        for (const auto& client : mRegistry.clients())
        {
            const auto current = client->role();
            const auto target  = client->targetRole();
            if (current != Role::ClientPrimary && current != Role::ClientScanOnly
                && target != Role::ClientPrimary && target != Role::ClientScanOnly)
            {
                continue;
            }
            if (*role == Role::ClientPrimary && current != Role::ClientPrimary)
            {
                setWifiState(WifiState::Enabling);
            }
            else if (*role == Role::ClientScanOnly && current == Role::ClientPrimary)
            {
                setWifiState(WifiState::Disabling);
            }
            client->setRole(*role, lastRequestorWs, nullptr);
        }
        return true;
    }

    /// Soft APs first, then clients with the primary last.
    void shutdownWifi()
    {
        logger().debug("Shutting down all mode managers");
        for (const auto& softAp : mRegistry.softAps())
        {
            softAp->stop();
        }
        for (const auto& client : clientModeManagersPrimaryLast())
        {
            if (client->role() == Role::ClientPrimary)
            {
                setWifiState(WifiState::Disabling);
            }
            client->stop();
        }
    }

    // -------------------------------------------------------------------------
    // Lifecycle bookkeeping
    // -------------------------------------------------------------------------

    template <typename Manager>
    [[nodiscard]] bool isTracked(const std::shared_ptr<Manager>& manager, std::string_view callback) const
    {
        if (mRegistry.contains(manager))
        {
            return true;
        }
        logger().critical("{} from untracked {}", callback, manager->describe());
        return false;
    }

    [[nodiscard]] static ModeManagerSnapshot snapshotOf(const ActiveModeManager& manager, bool startFailed)
    {
        ModeManagerSnapshot snapshot;
        snapshot.id            = manager.id();
        snapshot.kind          = manager.kind();
        snapshot.lastRole      = manager.previousRole();
        snapshot.requestorWs   = manager.requestorWs();
        snapshot.interfaceName = manager.interfaceName();
        snapshot.description   = manager.describe();
        snapshot.startFailed   = startFailed;
        snapshot.buriedAt      = std::chrono::steady_clock::now();
        return snapshot;
    }

    /// @return false if the manager was not tracked.
    bool onClientStoppedOrStartFailure(const ClientModeManagerPtr& manager, bool startFailed)
    {
        if (!mRegistry.remove(manager))
        {
            logger().critical("{} from untracked {}", startFailed ? "onStartFailure" : "onStopped",
                              manager->describe());
            return false;
        }
        const auto previousRole = manager->previousRole();
        if (previousRole && isTrackedSecondaryRole(*previousRole))
        {
            mSnapshot.removeSecondaryRequestWs(manager->requestorWs());
        }
        mRegistry.graveyard().inter(snapshotOf(*manager, startFailed));
        updateClientScanMode();
        updateBatteryStats();

        const bool wasPrimary = manager == mLastPrimary;
        if (wasPrimary)
        {
            invokeOnPrimaryChangedCallbacks(mLastPrimary, ClientModeManagerPtr{});
            mLastPrimary.reset();
            mSnapshot.setCurrentNetwork(std::nullopt);
            setSupportedFeatureSet(mDeps.chip.nativeFeatureSet(std::nullopt),
                                   mDeps.chip.isStaApConcurrencySupported(),
                                   mDeps.chip.isStaStaConcurrencySupported());
            setBandSupported(mDeps.settings.cachedStaBands());
        }
        if (wasPrimary || previousRole == Role::ClientPrimary)
        {
            updateWifiStateAfterPrimaryLoss();
        }
        // removed after primary changed
        invokeOnRemovedCallbacks(manager);
        reportWifiStateToSar();
        return true;
    }

    void onPrimaryChangedDueToStartedOrRoleChanged(const ClientModeManagerPtr& manager)
    {
        const bool isPrimary = manager->role() == Role::ClientPrimary;
        if (!isPrimary && manager == mLastPrimary)
        {
            invokeOnPrimaryChangedCallbacks(manager, ClientModeManagerPtr{});
            mLastPrimary.reset();
            updateWifiStateAfterPrimaryLoss();
        }
        else if (isPrimary && manager != mLastPrimary)
        {
            const ClientModeManagerPtr previous = mLastPrimary;
            invokeOnPrimaryChangedCallbacks(previous, manager);
            mLastPrimary = manager;
            mSnapshot.setCurrentNetwork(manager->currentNetwork());
        }
        if (isPrimary)
        {
            setWifiState(WifiState::Enabled);
        }

        auto primary = primaryClientModeManagerNullable();
        setSupportedFeatureSet(
            mDeps.chip.nativeFeatureSet(primary ? std::optional<std::string>(primary->interfaceName())
                                                : std::nullopt),
            mDeps.chip.isStaApConcurrencySupported(),
            mDeps.chip.isStaStaConcurrencySupported());

        if (isPrimary)
        {
            int bands = mDeps.chip.supportedBandsForSta(manager->interfaceName());
            if (bands == kBandUnspecified)
            {
                bands = mDeps.settings.cachedStaBands();
            }
            setBandSupported(bands);
        }
    }

    void updateWifiStateAfterPrimaryLoss()
    {
        if (mRegistry.clientInRole(Role::ClientPrimary))
        {
            setWifiState(WifiState::Enabled);
        }
        else if (mRegistry.clientTransitioningInto(Role::ClientPrimary))
        {
            setWifiState(WifiState::Enabling);
        }
        else
        {
            setWifiState(WifiState::Disabled);
        }
    }

    void setWifiState(WifiState state)
    {
        const WifiState previous = mSnapshot.exchangeWifiState(state);
        if (previous == state)
        {
            return;
        }
        logger().debug("setting wifi state to: {}", wifiStateName(state));
        mHub.onWifiStateChanged.emit(state);
    }

    /// Scanning is on with any client; hidden-network scanning needs a
    /// connectivity role unless the overlay allows it in scan-only mode.
    void updateClientScanMode()
    {
        const bool scanEnabled = mRegistry.hasAnyClient();
        const bool hiddenEnabled = mConfig.scanHiddenNetworksInScanOnlyMode
            ? mRegistry.hasAnyClient()
            : mRegistry.hasAnyClientInConnectivityRole();
        mDeps.scanner.enableScanning(scanEnabled, hiddenEnabled);
    }

    void updateBatteryStats()
    {
        if (!mRegistry.empty())
        {
            if (mRegistry.size() == 1)
            {
                mDeps.batteryStats.reportWifiOn();
            }
        }
        else
        {
            mDeps.batteryStats.reportWifiOff();
        }
        if (mRegistry.areAllClientsScanOnly())
        {
            mDeps.batteryStats.reportScanModeActive(true);
        }
    }

    /// The first secondary found decides; a single STA prefers the primary.
    [[nodiscard]] MultiStaUseCase multiStaUseCase() const
    {
        for (const auto& client : mRegistry.clients())
        {
            const auto role = client->role();
            if (role == Role::ClientLocalOnly || role == Role::ClientSecondaryLongLived)
            {
                return MultiStaUseCase::DualStaNonTransientUnbiased;
            }
            if (role == Role::ClientSecondaryTransient)
            {
                return MultiStaUseCase::DualStaTransientPreferPrimary;
            }
        }
        return MultiStaUseCase::DualStaTransientPreferPrimary;
    }

    void configureHwForMultiSta()
    {
        mDeps.chip.setMultiStaUseCase(multiStaUseCase());
        // With no primary (briefly, during make-before-break) keep the previous one.
        if (auto primary = primaryClientModeManagerNullable())
        {
            mDeps.chip.setMultiStaPrimaryConnection(primary->interfaceName());
        }
    }

    void reportWifiStateToSar()
    {
        mDeps.sar.setScanOnlyWifiState(mRegistry.areAllClientsScanOnly());
        mDeps.sar.setClientWifiState(mRegistry.hasAnyClientInConnectivityRole());
    }

    void setSupportedFeatureSet(const FeatureSet& nativeFeatures, bool staApSupported, bool staStaSupported)
    {
        FeatureSet features = nativeFeatures;

        if (staApSupported)
        {
            setFeature(features, WifiFeature::ApSta);
        }
        if (staStaSupported)
        {
            setFeature(features, WifiFeature::AdditionalStaLocalOnly, mConfig.multiStaLocalOnlyEnabled);
            setFeature(features, WifiFeature::AdditionalStaMbb, mConfig.multiStaMbbEnabled);
            setFeature(features, WifiFeature::AdditionalStaRestricted, mConfig.multiStaRestrictedEnabled);
            setFeature(features, WifiFeature::AdditionalStaMultiInternet, mConfig.multiStaMultiInternetEnabled);
        }

        // overlay-only features, no native bit
        if (mConfig.connectedMacRandomizationSupported)
        {
            setFeature(features, WifiFeature::ConnectedRandMac);
        }
        if (mConfig.apMacRandomizationSupported)
        {
            setFeature(features, WifiFeature::ApRandMac);
        }
        if (mConfig.bridgedApSupported)
        {
            setFeature(features, WifiFeature::BridgedAp);
        }
        if (mConfig.staBridgedApSupported)
        {
            setFeature(features, WifiFeature::StaBridgedAp);
        }
        if (mConfig.wepSupported)
        {
            setFeature(features, WifiFeature::Wep);
        }
        if (!mConfig.wpaPersonalDeprecated)
        {
            setFeature(features, WifiFeature::WpaPersonal);
        }
        if (mConfig.d2dAllowedWhenInfraStaDisabled)
        {
            setFeature(features, WifiFeature::D2dWhenInfraStaDisabled);
        }

        if (!mConfig.rttFeaturePresent)
        {
            setFeature(features, WifiFeature::D2dRtt, false);
            setFeature(features, WifiFeature::D2apRtt, false);
        }
        if (!mConfig.p2pMacRandomizationSupported)
        {
            setFeature(features, WifiFeature::P2pRandMac, false);
        }

        mSnapshot.setSupportedFeatures(features);
        logger().debug("setSupportedFeatureSet to {}", features.to_string());
    }

    void setBandSupported(int bands)
    {
        mSnapshot.setStaBands(bands);
        if (bands != mDeps.settings.cachedStaBands())
        {
            mDeps.settings.setCachedStaBands(bands);
            logger().info("Supported STA bands is updated in config store: {}", bands);
        }
        logger().debug("setBandSupported 0x{:x}", bands);
    }

    // -------------------------------------------------------------------------
    // Fan-out
    // -------------------------------------------------------------------------

    void invokeOnAddedCallbacks(const ActiveModeManagerPtr& manager)
    {
        logger().debug("ModeManager added {}", manager->describe());
        mHub.onManagerAdded.emit(manager);
    }

    void invokeOnRemovedCallbacks(const ActiveModeManagerPtr& manager)
    {
        logger().debug("ModeManager removed {}", manager->describe());
        mHub.onManagerRemoved.emit(manager);
    }

    void invokeOnRoleChangedCallbacks(const ActiveModeManagerPtr& manager)
    {
        logger().debug("ModeManager role changed {}", manager->describe());
        mHub.onManagerRoleChanged.emit(manager);
    }

    void invokeOnPrimaryChangedCallbacks(const ClientModeManagerPtr& previous, const ClientModeManagerPtr& next)
    {
        logger().debug("Primary ClientModeManager changed from {} to {}", describeManager(previous.get()),
                       describeManager(next.get()));
        mHub.onPrimaryChanged.emit(previous, next);
    }
};

} // namespace wifimode

#pragma once

/*
FATP_META:
  meta_version: 1
  component: SimulatedHardware
  file_role: public_header
  path: include/wifimode/SimulatedHardware.h
  namespace: wifimode::sim
  layer: Domain
  summary: Simulated chip, permission oracle, mode managers and service sinks for tests and the console.
  api_stability: in_work
  related:
    tests:
      - components/ModeController/tests/test_ModeController.cpp
      - components/AdmissionPolicy/tests/test_AdmissionPolicy.cpp
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
 * @file SimulatedHardware.h
 * @brief Stand-ins for the radio, the package manager and the services the
 *        controller reports to.
 *
 * @details
 * SimulatedChip counts live interfaces per requestor and answers
 * creatability the way an interface-combination manager does: a free slot,
 * or an existing interface whose requestor has strictly lower priority.
 *
 * Simulated managers never call back synchronously. start(), stop() and
 * setRole() post the lifecycle callback to the executor, so the controller
 * sees the same ordering it would see with a real driver.
 *
 * @note Thread-safety: executor thread only, like the controller.
 */

#include "Collaborators.h"
#include "FeatureSet.h"
#include "Logging.h"
#include "ModeManager.h"
#include "Roles.h"
#include "SerialExecutor.h"
#include "SettingsStore.h"
#include "WorkSource.h"

#include <algorithm>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace wifimode::sim
{

// ============================================================================
// SimulatedChip
// ============================================================================

class SimulatedChip final : public CapabilityOracle, public PermissionChecker
{
public:
    /// Two STA and one AP interface, STA+AP concurrent.
    SimulatedChip()
    {
        setFeature(mNativeFeatures, WifiFeature::Infra);
        setFeature(mNativeFeatures, WifiFeature::Scanner);
        setFeature(mNativeFeatures, WifiFeature::MobileHotspot);
        setFeature(mNativeFeatures, WifiFeature::D2dRtt);
        setFeature(mNativeFeatures, WifiFeature::D2apRtt);
        setFeature(mNativeFeatures, WifiFeature::P2pRandMac);
    }

    // -------------------------------------------------------------------------
    // Knobs
    // -------------------------------------------------------------------------

    void setInterfaceLimits(InterfaceLimits limits) { mLimits = limits; }
    void setStaApConcurrency(bool supported) { mStaAp = supported; }
    void setNativeFeatures(FeatureSet features) { mNativeFeatures = features; }
    void setStaBands(int bands) { mStaBands = bands; }

    void addSystemUid(int uid) { mSystemUids.insert(uid); }
    void addLegacyPackage(std::string packageName) { mLegacyPackages.insert(std::move(packageName)); }
    void setCarModePrioritized(int uid, bool prioritized)
    {
        if (prioritized) { mCarModeUids.insert(uid); } else { mCarModeUids.erase(uid); }
    }

    // -------------------------------------------------------------------------
    // Interface accounting, driven by the simulated managers
    // -------------------------------------------------------------------------

    void interfaceUp(ManagerId id, ManagerKind kind, const WorkSource& requestorWs)
    {
        mLive[id] = LiveInterface{kind, requestorWs};
    }

    void interfaceDown(ManagerId id) { mLive.erase(id); }

    void updateRequestor(ManagerId id, const WorkSource& requestorWs)
    {
        auto it = mLive.find(id);
        if (it != mLive.end())
        {
            it->second.requestorWs = requestorWs;
        }
    }

    [[nodiscard]] std::size_t liveCount(ManagerKind kind) const
    {
        return static_cast<std::size_t>(std::count_if(mLive.begin(), mLive.end(),
            [kind](const auto& entry) { return entry.second.kind == kind; }));
    }

    // -------------------------------------------------------------------------
    // CapabilityOracle
    // -------------------------------------------------------------------------

    [[nodiscard]] bool isItPossibleToCreateStaIface(const WorkSource& ws) override
    {
        return canCreate(ManagerKind::Client, static_cast<std::size_t>(mLimits.maxStaInterfaces), ws);
    }

    [[nodiscard]] bool isItPossibleToCreateApIface(const WorkSource& ws) override
    {
        if (!mStaAp && liveCount(ManagerKind::Client) > 0 && !outranksAny(ManagerKind::Client, ws))
        {
            return false;
        }
        return canCreate(ManagerKind::SoftAp, static_cast<std::size_t>(mLimits.maxApInterfaces), ws);
    }

    [[nodiscard]] bool isStaStaConcurrencySupported() override { return mLimits.maxStaInterfaces > 1; }
    [[nodiscard]] bool isStaApConcurrencySupported() override { return mStaAp; }
    [[nodiscard]] InterfaceLimits interfaceLimits() override { return mLimits; }

    [[nodiscard]] FeatureSet nativeFeatureSet(const std::optional<std::string>& ifaceName) override
    {
        (void)ifaceName;
        return mNativeFeatures;
    }

    [[nodiscard]] int supportedBandsForSta(const std::string& ifaceName) override
    {
        (void)ifaceName;
        return mStaBands;
    }

    void setMultiStaUseCase(MultiStaUseCase useCase) override { mUseCase = useCase; }
    void setMultiStaPrimaryConnection(const std::string& ifaceName) override { mPrimaryIface = ifaceName; }

    [[nodiscard]] std::optional<MultiStaUseCase> multiStaUseCase() const { return mUseCase; }
    [[nodiscard]] const std::string& multiStaPrimaryIface() const noexcept { return mPrimaryIface; }

    // -------------------------------------------------------------------------
    // PermissionChecker
    // -------------------------------------------------------------------------

    [[nodiscard]] bool isSystem(const std::string& packageName, int uid) override
    {
        return uid == kRootUid || uid == kSystemUid || mSystemUids.count(uid) != 0
            || packageName == kSystemPackage;
    }

    [[nodiscard]] bool isTargetSdkLessThanS(const std::string& packageName, int uid) override
    {
        (void)uid;
        return mLegacyPackages.count(packageName) != 0;
    }

    [[nodiscard]] bool checkEnterCarModePrioritized(int uid) override { return mCarModeUids.count(uid) != 0; }

private:
    struct LiveInterface
    {
        ManagerKind kind = ManagerKind::Client;
        WorkSource requestorWs;
    };

    InterfaceLimits mLimits{2, 1};
    bool mStaAp = true;
    FeatureSet mNativeFeatures;
    int mStaBands = kBand24Ghz | kBand5Ghz;

    std::map<ManagerId, LiveInterface> mLive;

    std::set<int> mSystemUids;
    std::set<std::string> mLegacyPackages;
    std::set<int> mCarModeUids;

    std::optional<MultiStaUseCase> mUseCase;
    std::string mPrimaryIface;

    [[nodiscard]] bool outranksAny(ManagerKind kind, const WorkSource& ws) const
    {
        return std::any_of(mLive.begin(), mLive.end(), [&](const auto& entry)
        {
            return entry.second.kind == kind
                && static_cast<int>(ws.priority()) > static_cast<int>(entry.second.requestorWs.priority());
        });
    }

    [[nodiscard]] bool canCreate(ManagerKind kind, std::size_t limit, const WorkSource& ws) const
    {
        if (liveCount(kind) < limit)
        {
            return true;
        }
        return outranksAny(kind, ws);
    }
};

// ============================================================================
// Simulated managers
// ============================================================================

/**
 * @brief Lifecycle shared by the simulated client and soft-AP managers.
 */
template <typename Base, typename Derived>
class SimulatedManagerBase : public Base, public std::enable_shared_from_this<Derived>
{
public:
    using ListenerPtr = std::shared_ptr<ModeManagerListener<Base>>;

    [[nodiscard]] ManagerId id() const noexcept override { return mId; }
    [[nodiscard]] std::optional<Role> role() const override { return mRole; }
    [[nodiscard]] std::optional<Role> previousRole() const override { return mPreviousRole; }
    [[nodiscard]] const WorkSource& requestorWs() const override { return mRequestorWs; }
    [[nodiscard]] std::string interfaceName() const override { return mIfaceName; }

    /// Posts onStarted, or onStartFailure when failStart is set.
    void start(bool failStart)
    {
        mStartRole = mTargetRole;
        post([this, failStart]
        {
            if (mDead)
            {
                return;
            }
            if (failStart)
            {
                mPreviousRole = mTargetRole;
                mTargetRole.reset();
                mDead = true;
                mChip.interfaceDown(mId);
                mListener->onStartFailure(self());
                return;
            }
            mRole = mTargetRole;
            mTargetRole.reset();
            mListener->onStarted(self());
        }, "start");
    }

    void stop() override
    {
        if (mStopRequested || mDead)
        {
            return;
        }
        mStopRequested = true;
        post([this]
        {
            if (mDead)
            {
                return;
            }
            mPreviousRole = mRole ? mRole : mStartRole;
            mRole.reset();
            mTargetRole.reset();
            mDead = true;
            mChip.interfaceDown(mId);
            mListener->onStopped(self());
        }, "stop");
    }

    [[nodiscard]] bool isStopped() const noexcept { return mDead; }

protected:
    SimulatedManagerBase(ManagerId id, SerialExecutor& executor, SimulatedChip& chip,
                         ListenerPtr listener, const WorkSource& requestorWs, Role role,
                         std::string ifaceName)
        : mId(id)
        , mExecutor(executor)
        , mChip(chip)
        , mListener(std::move(listener))
        , mRequestorWs(requestorWs)
        , mIfaceName(std::move(ifaceName))
        , mTargetRole(role)
    {
        mChip.interfaceUp(mId, kindOf(role), mRequestorWs);
    }

    void post(SerialExecutor::Task task, const std::string& what)
    {
        // Keeps the manager alive until its callback ran.
        auto keepAlive = this->shared_from_this();
        mExecutor.post([keepAlive, task = std::move(task)] { task(); },
                       mIfaceName + ":" + what);
    }

    [[nodiscard]] std::shared_ptr<Base> self() { return this->shared_from_this(); }

    ManagerId mId;
    SerialExecutor& mExecutor;
    SimulatedChip& mChip;
    ListenerPtr mListener;
    WorkSource mRequestorWs;
    std::string mIfaceName;

    std::optional<Role> mRole;
    std::optional<Role> mTargetRole;
    std::optional<Role> mPreviousRole;
    std::optional<Role> mStartRole;
    bool mStopRequested = false;
    bool mDead = false;
};

class SimulatedClientModeManager final
    : public SimulatedManagerBase<ClientModeManager, SimulatedClientModeManager>
{
public:
    SimulatedClientModeManager(ManagerId id, SerialExecutor& executor, SimulatedChip& chip,
                               ClientListenerPtr listener, const WorkSource& requestorWs, Role role,
                               std::string ifaceName)
        : SimulatedManagerBase(id, executor, chip, std::move(listener), requestorWs, role, std::move(ifaceName))
    {
    }

    [[nodiscard]] std::optional<Role> targetRole() const override { return mTargetRole; }

    void setRole(Role role, const WorkSource& requestorWs, ClientListenerPtr listener) override
    {
        if (mDead || mStopRequested)
        {
            logger().warn("{}: setRole on a stopping manager ignored", describe());
            return;
        }
        if (listener)
        {
            mListener = std::move(listener);
        }
        mRequestorWs = requestorWs;
        mChip.updateRequestor(mId, requestorWs);
        mTargetRole = role;
        post([this]
        {
            if (mDead || !mTargetRole)
            {
                return;
            }
            mPreviousRole = mRole;
            mRole = mTargetRole;
            mTargetRole.reset();
            mListener->onRoleChanged(self());
        }, "setRole");
    }

    /// Simulates association; the network id is derived from the manager id.
    void connect(std::string ssid, std::string bssid)
    {
        mSsid  = std::move(ssid);
        mBssid = std::move(bssid);
        mNetwork = NetworkHandle{100u + mId};
    }

    void disconnect()
    {
        mSsid.clear();
        mBssid.clear();
        mNetwork.reset();
    }

    void addAffiliatedLinkBssid(std::string bssid) { mAffiliated.insert(std::move(bssid)); }

    [[nodiscard]] std::string connectingOrConnectedSsid() const override { return mSsid; }
    [[nodiscard]] std::string connectingOrConnectedBssid() const override { return mBssid; }

    [[nodiscard]] bool isAffiliatedLinkBssid(const std::string& bssid) const override
    {
        return mAffiliated.count(bssid) != 0;
    }

    [[nodiscard]] std::optional<NetworkHandle> currentNetwork() const override { return mNetwork; }

    [[nodiscard]] ConnectionInfo connectionInfo() const override
    {
        ConnectionInfo info;
        info.ssid  = mSsid;
        info.bssid = mBssid;
        if (mNetwork)
        {
            info.rssi = -55;
            info.frequencyMhz = 5180;
        }
        return info;
    }

    [[nodiscard]] std::string describe() const override
    {
        std::ostringstream oss;
        oss << "ClientModeManager#" << mId << " " << mIfaceName
            << " role=" << roleName(mRole);
        if (mTargetRole)
        {
            oss << " target=" << roleName(*mTargetRole);
        }
        if (!mSsid.empty())
        {
            oss << " ssid=" << mSsid << " bssid=" << mBssid;
        }
        oss << " requestor=" << mRequestorWs.toString();
        return oss.str();
    }

private:
    std::string mSsid;
    std::string mBssid;
    std::optional<NetworkHandle> mNetwork;
    std::set<std::string> mAffiliated;
};

class SimulatedSoftApManager final
    : public SimulatedManagerBase<SoftApManager, SimulatedSoftApManager>
{
public:
    SimulatedSoftApManager(ManagerId id, SerialExecutor& executor, SimulatedChip& chip,
                           SoftApListenerPtr listener, const SoftApModeConfiguration& config,
                           const WorkSource& requestorWs, Role role, std::string ifaceName)
        : SimulatedManagerBase(id, executor, chip, std::move(listener), requestorWs, role, std::move(ifaceName))
        , mConfig(config)
    {
    }

    [[nodiscard]] const SoftApModeConfiguration& softApModeConfiguration() const override { return mConfig; }

    void updateCapability(const SoftApCapability& capability) override
    {
        mConfig.capability = capability;
        ++mCapabilityUpdates;
    }

    void updateConfiguration(const SoftApConfiguration& config) override
    {
        mConfig.config = config;
        ++mConfigUpdates;
    }

    [[nodiscard]] int capabilityUpdates() const noexcept { return mCapabilityUpdates; }
    [[nodiscard]] int configUpdates() const noexcept { return mConfigUpdates; }

    [[nodiscard]] std::string describe() const override
    {
        std::ostringstream oss;
        oss << "SoftApManager#" << mId << " " << mIfaceName
            << " role=" << roleName(mRole)
            << " mode=" << ipModeName(mConfig.targetMode)
            << " ssid=" << mConfig.config.ssid
            << " requestor=" << mRequestorWs.toString();
        return oss.str();
    }

private:
    SoftApModeConfiguration mConfig;
    int mCapabilityUpdates = 0;
    int mConfigUpdates = 0;
};

using SimulatedClientPtr = std::shared_ptr<SimulatedClientModeManager>;
using SimulatedSoftApPtr = std::shared_ptr<SimulatedSoftApManager>;

// ============================================================================
// SimulatedModeManagerFactory
// ============================================================================

class SimulatedModeManagerFactory final : public ModeManagerFactory
{
public:
    SimulatedModeManagerFactory(SerialExecutor& executor, SimulatedChip& chip)
        : mExecutor(executor)
        , mChip(chip)
    {
    }

    /// The next client manager created reports onStartFailure.
    void failNextClientStart() { mFailNextClient = true; }
    void failNextSoftApStart() { mFailNextSoftAp = true; }

    [[nodiscard]] ClientModeManagerPtr makeClientModeManager(
        ClientListenerPtr listener, const WorkSource& requestorWs, Role role, bool verboseLogging) override
    {
        (void)verboseLogging;
        const ManagerId id = mNextId++;
        auto manager = std::make_shared<SimulatedClientModeManager>(
            id, mExecutor, mChip, std::move(listener), requestorWs, role, "wlan" + std::to_string(mStaIfaceIndex++));
        mClients.push_back(manager);
        manager->start(std::exchange(mFailNextClient, false));
        return manager;
    }

    [[nodiscard]] SoftApManagerPtr makeSoftApManager(
        SoftApListenerPtr listener, const SoftApModeConfiguration& config,
        const WorkSource& requestorWs, Role role, bool verboseLogging) override
    {
        (void)verboseLogging;
        const ManagerId id = mNextId++;
        auto manager = std::make_shared<SimulatedSoftApManager>(
            id, mExecutor, mChip, std::move(listener), config, requestorWs, role, "ap" + std::to_string(mApIfaceIndex++));
        mSoftAps.push_back(manager);
        manager->start(std::exchange(mFailNextSoftAp, false));
        return manager;
    }

    /// Every client manager ever created, oldest first.
    [[nodiscard]] const std::vector<SimulatedClientPtr>& createdClients() const noexcept { return mClients; }
    [[nodiscard]] const std::vector<SimulatedSoftApPtr>& createdSoftAps() const noexcept { return mSoftAps; }

    [[nodiscard]] SimulatedClientPtr findClient(ManagerId id) const
    {
        for (const auto& m : mClients)
        {
            if (m->id() == id) { return m; }
        }
        return nullptr;
    }

private:
    SerialExecutor& mExecutor;
    SimulatedChip& mChip;
    ManagerId mNextId = 1;
    int mStaIfaceIndex = 0;
    int mApIfaceIndex = 0;
    bool mFailNextClient = false;
    bool mFailNextSoftAp = false;
    std::vector<SimulatedClientPtr> mClients;
    std::vector<SimulatedSoftApPtr> mSoftAps;
};

// ============================================================================
// RecordingServices
// ============================================================================

/**
 * @brief Every outbound service sink in one object, recording what it was told.
 */
class RecordingServices final
    : public DppSessionMonitor
    , public ScanController
    , public BatteryStatsReporter
    , public DiagnosticsReporter
    , public SarReporter
    , public ConnectivityResetter
    , public RecoveryCoordinator
{
public:
    struct BugReport
    {
        std::string title;
        std::string description;
    };

    // DppSessionMonitor
    [[nodiscard]] bool isSessionInProgress() override { return dppInProgress; }

    // ScanController
    void enableScanning(bool enable, bool enableHiddenNetworks) override
    {
        scanEnabled = enable;
        hiddenScanEnabled = enableHiddenNetworks;
        ++scanUpdates;
    }

    // BatteryStatsReporter
    void reportWifiOn() override { ++wifiOnReports; }
    void reportWifiOff() override { ++wifiOffReports; }
    void reportScanModeActive(bool active) override
    {
        if (active) { ++scanModeActiveReports; }
    }

    // DiagnosticsReporter
    void takeBugReport(const std::string& title, const std::string& description) override
    {
        bugReports.push_back(BugReport{title, description});
    }

    // SarReporter
    void setClientWifiState(bool connectivityActive) override { sarClientActive = connectivityActive; }
    void setScanOnlyWifiState(bool scanOnlyActive) override { sarScanOnlyActive = scanOnlyActive; }

    // ConnectivityResetter
    void resetOnWifiDisable() override { ++connectivityResets; }

    // RecoveryCoordinator
    void trigger(const std::string& reason) override
    {
        recoveryTriggers.push_back(reason);
        if (onTrigger)
        {
            onTrigger(reason);
        }
    }
    void onWifiStopped() override { ++wifiStoppedNotifications; }
    void onRecoveryCompleted() override { ++recoveryCompletions; }

    bool dppInProgress = false;

    bool scanEnabled = false;
    bool hiddenScanEnabled = false;
    int scanUpdates = 0;

    int wifiOnReports = 0;
    int wifiOffReports = 0;
    int scanModeActiveReports = 0;

    std::vector<BugReport> bugReports;

    bool sarClientActive = false;
    bool sarScanOnlyActive = false;

    int connectivityResets = 0;

    std::vector<std::string> recoveryTriggers;
    int wifiStoppedNotifications = 0;
    int recoveryCompletions = 0;

    /// Invoked on trigger(); the console wires it to recoveryRestartWifi().
    std::function<void(const std::string&)> onTrigger;
};

// ============================================================================
// SimulatedWifi
// ============================================================================

/**
 * @brief Bundles the simulated collaborators and builds ControllerDependencies.
 */
struct SimulatedWifi
{
    explicit SimulatedWifi(SerialExecutor& exec)
        : executor(exec)
        , factory(exec, chip)
    {
    }

    [[nodiscard]] ControllerDependencies dependencies()
    {
        return ControllerDependencies{executor, settings, chip, chip, factory, services, services,
                                      services, services, services, services, services};
    }

    SerialExecutor&             executor;
    InMemorySettingsStore       settings;
    SimulatedChip               chip;
    SimulatedModeManagerFactory factory;
    RecordingServices           services;
};

} // namespace wifimode::sim

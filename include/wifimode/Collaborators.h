#pragma once

/*
FATP_META:
  meta_version: 1
  component: Collaborators
  file_role: public_header
  path: include/wifimode/Collaborators.h
  namespace: wifimode
  layer: Domain
  summary: Interfaces of the external services the mode controller consults or drives.
  api_stability: in_work
  related:
    tests:
      - components/ModeController/tests/test_ModeController.cpp
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
 * @file Collaborators.h
 * @brief External services seen by the mode controller.
 *
 * @details
 * Every collaborator is an abstract class. The controller receives them
 * bundled in ControllerDependencies (non-owning references); whoever builds
 * the controller owns them and keeps them alive for its lifetime.
 *
 * Sinks that the controller only notifies (BatteryStats, SarReporter, ...)
 * provide empty default implementations so an embedder overrides only what
 * it cares about.
 */

#include "FeatureSet.h"
#include "ModeManager.h"
#include "WorkSource.h"

#include <optional>
#include <string>

namespace wifimode
{

class SerialExecutor;
class SettingsStore;

// ============================================================================
// Oracles (queried)
// ============================================================================

struct InterfaceLimits
{
    int maxStaInterfaces = 1;
    int maxApInterfaces  = 1;
};

/**
 * @brief Answers what the chip can do right now.
 */
class CapabilityOracle
{
public:
    virtual ~CapabilityOracle() = default;

    /// True if a STA interface can be created for ws without destroying a
    /// higher-priority interface.
    [[nodiscard]] virtual bool isItPossibleToCreateStaIface(const WorkSource& ws) = 0;
    [[nodiscard]] virtual bool isItPossibleToCreateApIface(const WorkSource& ws) = 0;

    [[nodiscard]] virtual bool isStaStaConcurrencySupported() = 0;
    [[nodiscard]] virtual bool isStaApConcurrencySupported() = 0;
    [[nodiscard]] virtual InterfaceLimits interfaceLimits() = 0;

    /// Native feature bits of the given interface, or of the chip when empty.
    [[nodiscard]] virtual FeatureSet nativeFeatureSet(const std::optional<std::string>& ifaceName) = 0;

    /// STA band mask for the interface; kBandUnspecified when unknown.
    [[nodiscard]] virtual int supportedBandsForSta(const std::string& ifaceName) = 0;

    virtual void setMultiStaUseCase(MultiStaUseCase useCase) = 0;
    virtual void setMultiStaPrimaryConnection(const std::string& ifaceName) = 0;
};

/**
 * @brief Package and uid facts used by the admission policy.
 */
class PermissionChecker
{
public:
    virtual ~PermissionChecker() = default;

    [[nodiscard]] virtual bool isSystem(const std::string& packageName, int uid) = 0;

    /// True for apps built before multi-STA awareness.
    [[nodiscard]] virtual bool isTargetSdkLessThanS(const std::string& packageName, int uid) = 0;

    /// True if uid holds the car-mode prioritization capability.
    [[nodiscard]] virtual bool checkEnterCarModePrioritized(int uid) = 0;
};

class DppSessionMonitor
{
public:
    virtual ~DppSessionMonitor() = default;
    [[nodiscard]] virtual bool isSessionInProgress() = 0;
};

// ============================================================================
// Sinks (driven)
// ============================================================================

class ScanController
{
public:
    virtual ~ScanController() = default;
    virtual void enableScanning(bool enable, bool enableHiddenNetworks) { (void)enable; (void)enableHiddenNetworks; }
};

class BatteryStatsReporter
{
public:
    virtual ~BatteryStatsReporter() = default;
    virtual void reportWifiOn() {}
    virtual void reportWifiOff() {}
    virtual void reportScanModeActive(bool active) { (void)active; }
};

class DiagnosticsReporter
{
public:
    virtual ~DiagnosticsReporter() = default;
    virtual void takeBugReport(const std::string& title, const std::string& description)
    {
        (void)title;
        (void)description;
    }
};

class SarReporter
{
public:
    virtual ~SarReporter() = default;
    virtual void setClientWifiState(bool connectivityActive) { (void)connectivityActive; }
    virtual void setScanOnlyWifiState(bool scanOnlyActive) { (void)scanOnlyActive; }
};

/**
 * @brief Resets connectivity bookkeeping when wifi is toggled off.
 */
class ConnectivityResetter
{
public:
    virtual ~ConnectivityResetter() = default;
    virtual void resetOnWifiDisable() {}
};

/**
 * @brief Recovery throttling lives outside the controller; it is told about
 *        progress and asked to trigger recovery.
 */
class RecoveryCoordinator
{
public:
    virtual ~RecoveryCoordinator() = default;
    virtual void trigger(const std::string& reason) { (void)reason; }
    virtual void onWifiStopped() {}
    virtual void onRecoveryCompleted() {}
};

// ============================================================================
// ControllerDependencies
// ============================================================================

/**
 * @brief Everything the controller needs, built by the embedder.
 */
struct ControllerDependencies
{
    SerialExecutor&       executor;
    SettingsStore&        settings;
    CapabilityOracle&     chip;
    PermissionChecker&    permissions;
    ModeManagerFactory&   factory;
    DppSessionMonitor&    dpp;
    ScanController&       scanner;
    BatteryStatsReporter& batteryStats;
    DiagnosticsReporter&  diagnostics;
    SarReporter&          sar;
    ConnectivityResetter& connectivity;
    RecoveryCoordinator&  recovery;
};

} // namespace wifimode

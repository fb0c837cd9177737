#pragma once

/*
FATP_META:
  meta_version: 1
  component: SettingsStore
  file_role: public_header
  path: include/wifimode/SettingsStore.h
  namespace: wifimode
  layer: Domain
  summary: Persisted toggle access and an in-memory implementation.
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
 * @file SettingsStore.h
 * @brief Persisted toggles read by the mode controller.
 *
 * The controller only reads toggles, except for the STA band cache which it
 * writes back when the chip reports a different mask.
 */

#include "FeatureSet.h"

#include <atomic>

namespace wifimode
{

class SettingsStore
{
public:
    virtual ~SettingsStore() = default;

    [[nodiscard]] virtual bool isWifiToggleEnabled() const = 0;
    [[nodiscard]] virtual bool isAirplaneModeOn() const = 0;
    [[nodiscard]] virtual bool isScanAlwaysAvailable() const = 0;
    [[nodiscard]] virtual bool isLocationModeEnabled() const = 0;
    [[nodiscard]] virtual bool isSatelliteModeOn() const = 0;

    /// Wifi stays up when airplane mode turns on (user opted in).
    [[nodiscard]] virtual bool shouldWifiRemainEnabledInApm() const = 0;

    [[nodiscard]] virtual int cachedStaBands() const = 0;
    virtual void setCachedStaBands(int bands) = 0;
};

/**
 * @brief SettingsStore backed by atomics; used by tests and the console.
 */
class InMemorySettingsStore final : public SettingsStore
{
public:
    [[nodiscard]] bool isWifiToggleEnabled() const override { return mWifiToggle.load(); }
    [[nodiscard]] bool isAirplaneModeOn() const override { return mAirplane.load(); }
    [[nodiscard]] bool isScanAlwaysAvailable() const override { return mScanAlways.load(); }
    [[nodiscard]] bool isLocationModeEnabled() const override { return mLocation.load(); }
    [[nodiscard]] bool isSatelliteModeOn() const override { return mSatellite.load(); }
    [[nodiscard]] bool shouldWifiRemainEnabledInApm() const override { return mRemainInApm.load(); }
    [[nodiscard]] int cachedStaBands() const override { return mStaBands.load(); }
    void setCachedStaBands(int bands) override { mStaBands.store(bands); }

    void setWifiToggle(bool on) { mWifiToggle.store(on); }
    void setAirplaneMode(bool on) { mAirplane.store(on); }
    void setScanAlwaysAvailable(bool on) { mScanAlways.store(on); }
    void setLocationMode(bool on) { mLocation.store(on); }
    void setSatelliteMode(bool on) { mSatellite.store(on); }
    void setRemainEnabledInApm(bool on) { mRemainInApm.store(on); }

private:
    std::atomic<bool> mWifiToggle{false};
    std::atomic<bool> mAirplane{false};
    std::atomic<bool> mScanAlways{false};
    std::atomic<bool> mLocation{false};
    std::atomic<bool> mSatellite{false};
    std::atomic<bool> mRemainInApm{false};
    std::atomic<int>  mStaBands{kBandUnspecified};
};

} // namespace wifimode

#pragma once

/*
FATP_META:
  meta_version: 1
  component: ServiceApiSnapshot
  file_role: public_header
  path: include/wifimode/ServiceApiSnapshot.h
  namespace: wifimode
  layer: Domain
  summary: Lock-guarded copy-on-read state for API callers that must not block on the executor.
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
 * @file ServiceApiSnapshot.h
 * @brief Read-side state shared with API threads.
 *
 * Written only by the controller's executor thread; read from anywhere.
 * Every getter returns a copy.
 */

#include "FeatureSet.h"
#include "ModeEvents.h"
#include "ModeManager.h"
#include "WorkSource.h"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <optional>
#include <vector>

namespace wifimode
{

class ServiceApiSnapshot
{
public:
    // -------------------------------------------------------------------------
    // Reads (any thread)
    // -------------------------------------------------------------------------

    [[nodiscard]] std::optional<NetworkHandle> currentNetwork() const
    {
        std::lock_guard<std::mutex> lock(mLock);
        return mCurrentNetwork;
    }

    [[nodiscard]] ConnectionInfo connectionInfo() const
    {
        std::lock_guard<std::mutex> lock(mLock);
        return mConnectionInfo;
    }

    [[nodiscard]] FeatureSet supportedFeatures() const
    {
        std::lock_guard<std::mutex> lock(mLock);
        return mFeatures;
    }

    [[nodiscard]] std::vector<WorkSource> secondaryRequestWorkSources() const
    {
        std::lock_guard<std::mutex> lock(mLock);
        return mRequestWs;
    }

    [[nodiscard]] int staBands() const noexcept { return mBands.load(); }

    [[nodiscard]] bool isBandSupportedForSta(int band) const noexcept
    {
        return (mBands.load() & band) != 0;
    }

    [[nodiscard]] WifiState wifiState() const noexcept { return mWifiState.load(); }

    // -------------------------------------------------------------------------
    // Writes (executor thread)
    // -------------------------------------------------------------------------

    void setCurrentNetwork(std::optional<NetworkHandle> network)
    {
        std::lock_guard<std::mutex> lock(mLock);
        mCurrentNetwork = network;
    }

    void setConnectionInfo(ConnectionInfo info)
    {
        std::lock_guard<std::mutex> lock(mLock);
        mConnectionInfo = std::move(info);
    }

    void setSupportedFeatures(const FeatureSet& features)
    {
        std::lock_guard<std::mutex> lock(mLock);
        mFeatures = features;
    }

    void addSecondaryRequestWs(const WorkSource& ws)
    {
        std::lock_guard<std::mutex> lock(mLock);
        mRequestWs.push_back(ws);
    }

    /// Removes one matching entry.
    void removeSecondaryRequestWs(const WorkSource& ws)
    {
        std::lock_guard<std::mutex> lock(mLock);
        auto it = std::find(mRequestWs.begin(), mRequestWs.end(), ws);
        if (it != mRequestWs.end())
        {
            mRequestWs.erase(it);
        }
    }

    void setStaBands(int bands) noexcept { mBands.store(bands); }

    /// @return previous state
    WifiState exchangeWifiState(WifiState state) noexcept { return mWifiState.exchange(state); }

private:
    mutable std::mutex            mLock;
    std::optional<NetworkHandle>  mCurrentNetwork;
    ConnectionInfo                mConnectionInfo;
    FeatureSet                    mFeatures;
    std::vector<WorkSource>       mRequestWs;
    std::atomic<int>              mBands{kBandUnspecified};
    std::atomic<WifiState>        mWifiState{WifiState::Disabled};
};

} // namespace wifimode

#pragma once

/*
FATP_META:
  meta_version: 1
  component: FeatureSet
  file_role: public_header
  path: include/wifimode/FeatureSet.h
  namespace: wifimode
  layer: Domain
  summary: Supported-feature bit positions, band masks and multi-STA use-case constants.
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
 * @file FeatureSet.h
 * @brief Supported feature bit set and band masks.
 *
 * Bit positions are stable; they are the only shared vocabulary between the
 * chip's native feature report and the snapshot exposed to API callers.
 */

#include <bitset>
#include <cstddef>

namespace wifimode
{

enum class WifiFeature : std::size_t
{
    Infra                     = 0,
    Passpoint                 = 1,
    P2p                       = 2,
    MobileHotspot             = 3,
    Scanner                   = 4,
    Aware                     = 5,
    D2dRtt                    = 6,
    D2apRtt                   = 7,
    ApSta                     = 8,
    P2pRandMac                = 9,
    ConnectedRandMac          = 10,
    ApRandMac                 = 11,
    AdditionalStaLocalOnly    = 12,
    AdditionalStaMbb          = 13,
    AdditionalStaRestricted   = 14,
    AdditionalStaMultiInternet = 15,
    BridgedAp                 = 16,
    StaBridgedAp              = 17,
    Wep                       = 18,
    WpaPersonal               = 19,
    D2dWhenInfraStaDisabled   = 20,

    Count
};

using FeatureSet = std::bitset<64>;

[[nodiscard]] inline bool hasFeature(const FeatureSet& set, WifiFeature feature)
{
    return set.test(static_cast<std::size_t>(feature));
}

inline void setFeature(FeatureSet& set, WifiFeature feature, bool value = true)
{
    set.set(static_cast<std::size_t>(feature), value);
}

// ============================================================================
// STA bands
// ============================================================================

inline constexpr int kBandUnspecified = 0;
inline constexpr int kBand24Ghz       = 1 << 0;
inline constexpr int kBand5Ghz        = 1 << 1;
inline constexpr int kBand5GhzDfs     = 1 << 2;
inline constexpr int kBand6Ghz        = 1 << 3;
inline constexpr int kBand60Ghz       = 1 << 4;

// ============================================================================
// Multi-STA use case reported to the chip
// ============================================================================

enum class MultiStaUseCase
{
    DualStaTransientPreferPrimary,
    DualStaNonTransientUnbiased
};

} // namespace wifimode

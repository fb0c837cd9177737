#pragma once

/*
FATP_META:
  meta_version: 1
  component: Graveyard
  file_role: public_header
  path: include/wifimode/Graveyard.h
  namespace: wifimode
  layer: Domain
  summary: Fixed-capacity ring of post-mortem snapshots of stopped mode managers.
  api_stability: in_work
  related:
    tests:
      - components/Graveyard/tests/test_Graveyard.cpp
  hygiene:
    pragma_once: true
    include_guard: false
    defines_total: 0
    defines_unprefixed: 0
    undefs_total: 0
    includes_windows_h: false
*/

/**
 * @file Graveyard.h
 * @brief Bounded retention of recently stopped managers, for dumps only.
 *
 * @details
 * BoundedRing is a fixed array plus head index; it never allocates after
 * construction and evicts strictly oldest first. Graveyard keeps one ring per
 * manager kind so a burst of soft-AP failures cannot push client history out.
 */

#include "ModeManager.h"
#include "Roles.h"
#include "WorkSource.h"

#include <array>
#include <chrono>
#include <cstddef>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace wifimode
{

// ============================================================================
// BoundedRing
// ============================================================================

template <typename T, std::size_t Capacity>
class BoundedRing
{
    static_assert(Capacity > 0, "BoundedRing needs at least one slot");

public:
    static constexpr std::size_t kCapacity = Capacity;

    /// Appends, overwriting the oldest element once full.
    void push(T value)
    {
        mSlots[(mHead + mCount) % Capacity] = std::move(value);
        if (mCount < Capacity)
        {
            ++mCount;
        }
        else
        {
            mHead = (mHead + 1) % Capacity;
        }
    }

    [[nodiscard]] std::size_t size() const noexcept { return mCount; }
    [[nodiscard]] bool empty() const noexcept { return mCount == 0; }

    /// Element i counted from the oldest.
    [[nodiscard]] const T& at(std::size_t i) const { return mSlots[(mHead + i) % Capacity]; }

    /// Copies, oldest first.
    [[nodiscard]] std::vector<T> snapshot() const
    {
        std::vector<T> out;
        out.reserve(mCount);
        for (std::size_t i = 0; i < mCount; ++i)
        {
            out.push_back(at(i));
        }
        return out;
    }

private:
    std::array<T, Capacity> mSlots{};
    std::size_t mHead  = 0;
    std::size_t mCount = 0;
};

// ============================================================================
// Graveyard
// ============================================================================

/**
 * @brief Immutable record of a manager at the moment it left the registry.
 */
struct ModeManagerSnapshot
{
    ManagerId id = 0;
    ManagerKind kind = ManagerKind::Client;
    std::optional<Role> lastRole;
    WorkSource requestorWs;
    std::string interfaceName;
    std::string description;
    bool startFailed = false;
    std::chrono::steady_clock::time_point buriedAt{};
};

class Graveyard
{
public:
    static constexpr std::size_t kInstancesToKeep = 3;

    void inter(ModeManagerSnapshot snapshot)
    {
        if (snapshot.kind == ManagerKind::Client)
        {
            mClients.push(std::move(snapshot));
        }
        else
        {
            mSoftAps.push(std::move(snapshot));
        }
    }

    [[nodiscard]] std::vector<ModeManagerSnapshot> clients() const { return mClients.snapshot(); }
    [[nodiscard]] std::vector<ModeManagerSnapshot> softAps() const { return mSoftAps.snapshot(); }

    [[nodiscard]] std::string dump() const
    {
        std::ostringstream oss;
        oss << "Graveyard: " << mClients.size() << " client(s), "
            << mSoftAps.size() << " soft AP(s)\n";
        dumpRing(oss, mClients);
        dumpRing(oss, mSoftAps);
        return oss.str();
    }

private:
    using Ring = BoundedRing<ModeManagerSnapshot, kInstancesToKeep>;

    Ring mClients;
    Ring mSoftAps;

    static void dumpRing(std::ostringstream& oss, const Ring& ring)
    {
        for (std::size_t i = 0; i < ring.size(); ++i)
        {
            const auto& s = ring.at(i);
            oss << "  #" << s.id << " " << kindName(s.kind)
                << " lastRole=" << roleName(s.lastRole)
                << (s.startFailed ? " (start failure)" : "")
                << " " << s.description << "\n";
        }
    }
};

} // namespace wifimode

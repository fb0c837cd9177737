#pragma once

/*
FATP_META:
  meta_version: 1
  component: ModeManagerRegistry
  file_role: public_header
  path: include/wifimode/ModeManagerRegistry.h
  namespace: wifimode
  layer: Domain
  summary: Live client and soft-AP managers indexed by role, plus last-requestor tracking and graveyard.
  api_stability: in_work
  related:
    tests:
      - components/ModeManagerRegistry/tests/test_ModeManagerRegistry.cpp
  hygiene:
    pragma_once: true
    include_guard: false
    defines_total: 0
    defines_unprefixed: 0
    undefs_total: 0
    includes_windows_h: false
*/

/**
 * @file ModeManagerRegistry.h
 * @brief Set of live mode managers, queried by role.
 *
 * @details
 * Managers are tracked from the moment they are created (so the registry is
 * non-empty whenever an interface may be coming up), not from the moment they
 * report started. Role queries look at the settled role(); the
 * "transitioning into" queries look at targetRole().
 *
 * @note Thread-safety: NOT thread-safe. Executor thread only.
 */

#include "Graveyard.h"
#include "ModeManager.h"
#include "Roles.h"
#include "WorkSource.h"

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <memory>
#include <vector>

namespace wifimode
{

class ModeManagerRegistry
{
public:
    // -------------------------------------------------------------------------
    // Membership
    // -------------------------------------------------------------------------

    void add(ClientModeManagerPtr manager) { mClients.push_back(std::move(manager)); }
    void add(SoftApManagerPtr manager) { mSoftAps.push_back(std::move(manager)); }

    /// @return false if the manager was not tracked.
    bool remove(const ClientModeManagerPtr& manager) { return eraseFrom(mClients, manager); }
    bool remove(const SoftApManagerPtr& manager) { return eraseFrom(mSoftAps, manager); }

    [[nodiscard]] bool contains(const ClientModeManagerPtr& manager) const
    {
        return std::find(mClients.begin(), mClients.end(), manager) != mClients.end();
    }

    [[nodiscard]] bool contains(const SoftApManagerPtr& manager) const
    {
        return std::find(mSoftAps.begin(), mSoftAps.end(), manager) != mSoftAps.end();
    }

    [[nodiscard]] const std::vector<ClientModeManagerPtr>& clients() const noexcept { return mClients; }
    [[nodiscard]] const std::vector<SoftApManagerPtr>& softAps() const noexcept { return mSoftAps; }

    [[nodiscard]] bool empty() const noexcept { return mClients.empty() && mSoftAps.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return mClients.size() + mSoftAps.size(); }
    [[nodiscard]] bool hasAnyClient() const noexcept { return !mClients.empty(); }
    [[nodiscard]] bool hasAnySoftAp() const noexcept { return !mSoftAps.empty(); }

    [[nodiscard]] ClientModeManagerPtr findClient(ManagerId id) const
    {
        for (const auto& m : mClients)
        {
            if (m->id() == id) { return m; }
        }
        return nullptr;
    }

    [[nodiscard]] SoftApManagerPtr findSoftAp(ManagerId id) const
    {
        for (const auto& m : mSoftAps)
        {
            if (m->id() == id) { return m; }
        }
        return nullptr;
    }

    // -------------------------------------------------------------------------
    // Role queries
    // -------------------------------------------------------------------------

    [[nodiscard]] ClientModeManagerPtr clientInRole(Role role) const
    {
        for (const auto& m : mClients)
        {
            if (m->role() == role) { return m; }
        }
        return nullptr;
    }

    [[nodiscard]] ClientModeManagerPtr clientTransitioningInto(Role role) const
    {
        for (const auto& m : mClients)
        {
            if (m->targetRole() == role) { return m; }
        }
        return nullptr;
    }

    [[nodiscard]] std::vector<ClientModeManagerPtr> clientsInRoles(std::initializer_list<Role> roles) const
    {
        std::vector<ClientModeManagerPtr> out;
        for (const auto& m : mClients)
        {
            const auto role = m->role();
            if (role && std::find(roles.begin(), roles.end(), *role) != roles.end())
            {
                out.push_back(m);
            }
        }
        return out;
    }

    [[nodiscard]] std::size_t countInRole(Role role) const
    {
        return static_cast<std::size_t>(std::count_if(
            mClients.begin(), mClients.end(), [role](const auto& m) { return m->role() == role; }));
    }

    [[nodiscard]] std::vector<ClientModeManagerPtr> internetConnectivityClients() const
    {
        std::vector<ClientModeManagerPtr> out;
        for (const auto& m : mClients)
        {
            const auto role = m->role();
            if (role && isInternetConnectivityRole(*role)) { out.push_back(m); }
        }
        return out;
    }

    [[nodiscard]] SoftApManagerPtr softApInRole(Role role) const
    {
        for (const auto& m : mSoftAps)
        {
            if (m->role() == role) { return m; }
        }
        return nullptr;
    }

    [[nodiscard]] std::vector<SoftApManagerPtr> softApsForMode(SoftApIpMode mode) const
    {
        std::vector<SoftApManagerPtr> out;
        for (const auto& m : mSoftAps)
        {
            if (mode == SoftApIpMode::Unspecified || m->softApModeConfiguration().targetMode == mode)
            {
                out.push_back(m);
            }
        }
        return out;
    }

    /// Primary or scan-only, settled or in flight.
    [[nodiscard]] bool hasPrimaryOrScanOnly() const
    {
        return clientInRole(Role::ClientPrimary) || clientInRole(Role::ClientScanOnly)
            || clientTransitioningInto(Role::ClientPrimary) || clientTransitioningInto(Role::ClientScanOnly);
    }

    [[nodiscard]] bool areAllClientsScanOnly() const
    {
        return !mClients.empty()
            && std::all_of(mClients.begin(), mClients.end(),
                           [](const auto& m) { return m->role() == Role::ClientScanOnly; });
    }

    [[nodiscard]] bool hasAnyClientInConnectivityRole() const
    {
        return std::any_of(mClients.begin(), mClients.end(), [](const auto& m)
        {
            const auto role = m->role();
            return role && isConnectivityRole(*role);
        });
    }

    /// Clients with the primary (if any) moved to the end, for teardown ordering.
    [[nodiscard]] std::vector<ClientModeManagerPtr> clientsPrimaryLast() const
    {
        std::vector<ClientModeManagerPtr> out;
        std::vector<ClientModeManagerPtr> primaries;
        for (const auto& m : mClients)
        {
            (m->role() == Role::ClientPrimary ? primaries : out).push_back(m);
        }
        out.insert(out.end(), primaries.begin(), primaries.end());
        return out;
    }

    /// Soft APs first, then clients with the primary last.
    [[nodiscard]] std::vector<std::shared_ptr<ActiveModeManager>> activeManagers() const
    {
        std::vector<std::shared_ptr<ActiveModeManager>> out(mSoftAps.begin(), mSoftAps.end());
        for (const auto& m : clientsPrimaryLast())
        {
            out.push_back(m);
        }
        return out;
    }

    // -------------------------------------------------------------------------
    // Last requestor per role family
    // -------------------------------------------------------------------------

    [[nodiscard]] const WorkSource& lastPrimaryRequestorWs() const noexcept { return mLastPrimaryWs; }
    [[nodiscard]] const WorkSource& lastScanOnlyRequestorWs() const noexcept { return mLastScanOnlyWs; }
    void setLastPrimaryRequestorWs(const WorkSource& ws) { mLastPrimaryWs = ws; }
    void setLastScanOnlyRequestorWs(const WorkSource& ws) { mLastScanOnlyWs = ws; }

    [[nodiscard]] Graveyard& graveyard() noexcept { return mGraveyard; }
    [[nodiscard]] const Graveyard& graveyard() const noexcept { return mGraveyard; }

private:
    std::vector<ClientModeManagerPtr> mClients;
    std::vector<SoftApManagerPtr>     mSoftAps;
    WorkSource mLastPrimaryWs  = WorkSource::settings();
    WorkSource mLastScanOnlyWs = WorkSource::internal();
    Graveyard  mGraveyard;

    template <typename Ptr>
    static bool eraseFrom(std::vector<Ptr>& list, const Ptr& manager)
    {
        auto it = std::find(list.begin(), list.end(), manager);
        if (it == list.end())
        {
            return false;
        }
        list.erase(it);
        return true;
    }
};

} // namespace wifimode

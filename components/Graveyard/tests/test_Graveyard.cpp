/**
 * @file test_Graveyard.cpp
 * @brief Unit tests for Graveyard.h
 *
 * Tests cover: BoundedRing eviction order, per-kind capacity, snapshot
 * independence, and the dump format.
 */
/*
FATP_META:
  meta_version: 1
  component: Graveyard
  file_role: test
  path: components/Graveyard/tests/test_Graveyard.cpp
  namespace: fat_p::testing::graveyard
  layer: Testing
  summary: Unit tests for Graveyard - bounded per-kind history of stopped managers.
  api_stability: in_work
  related:
    headers:
      - include/wifimode/Graveyard.h
  hygiene:
    pragma_once: false
    include_guard: false
    defines_total: 0
    defines_unprefixed: 0
    undefs_total: 0
    includes_windows_h: false
*/

#include <iostream>
#include <string>
#include <vector>

#include "FatPTest.h"
#include "Graveyard.h"

namespace fat_p::testing::graveyard
{

using wifimode::Graveyard;
using wifimode::ManagerKind;
using wifimode::ModeManagerSnapshot;
using wifimode::Role;

ModeManagerSnapshot makeSnapshot(wifimode::ManagerId id, ManagerKind kind, Role role, bool failed = false)
{
    ModeManagerSnapshot s;
    s.id          = id;
    s.kind        = kind;
    s.lastRole    = role;
    s.startFailed = failed;
    s.description = "iface" + std::to_string(id);
    return s;
}

// ============================================================================
// BoundedRing
// ============================================================================

FATP_TEST_CASE(ring_keeps_newest_and_evicts_oldest)
{
    wifimode::BoundedRing<int, 3> ring;
    FATP_ASSERT_TRUE(ring.empty(), "New ring is empty");

    for (int i = 1; i <= 5; ++i)
    {
        ring.push(i);
    }

    FATP_ASSERT_EQ(ring.size(), std::size_t(3), "Ring is capped at capacity");
    FATP_ASSERT_TRUE(ring.snapshot() == std::vector<int>({3, 4, 5}), "Oldest two were evicted");
    FATP_ASSERT_EQ(ring.at(0), 3, "at(0) is the oldest survivor");
    return true;
}

// ============================================================================
// Graveyard
// ============================================================================

FATP_TEST_CASE(graveyard_caps_each_kind_independently)
{
    Graveyard g;
    for (wifimode::ManagerId id = 1; id <= 5; ++id)
    {
        g.inter(makeSnapshot(id, ManagerKind::Client, Role::ClientPrimary));
    }
    g.inter(makeSnapshot(10, ManagerKind::SoftAp, Role::SoftApTethered));

    const auto clients = g.clients();
    FATP_ASSERT_EQ(clients.size(), Graveyard::kInstancesToKeep, "Client history is bounded");
    FATP_ASSERT_EQ(clients.front().id, wifimode::ManagerId(3), "Oldest kept client is #3");
    FATP_ASSERT_EQ(clients.back().id, wifimode::ManagerId(5), "Newest client is last");
    FATP_ASSERT_EQ(g.softAps().size(), std::size_t(1), "Client churn does not evict soft APs");
    return true;
}

FATP_TEST_CASE(snapshots_are_copies)
{
    Graveyard g;
    g.inter(makeSnapshot(1, ManagerKind::Client, Role::ClientScanOnly));

    auto copy = g.clients();
    copy.front().description = "mutated";

    FATP_ASSERT_EQ(g.clients().front().description, std::string("iface1"),
                   "Mutating a returned snapshot does not touch the graveyard");
    return true;
}

FATP_TEST_CASE(dump_lists_entries_with_failure_marker)
{
    Graveyard g;
    FATP_ASSERT_CONTAINS(g.dump(), "Graveyard: 0 client(s), 0 soft AP(s)", "Empty header");

    g.inter(makeSnapshot(4, ManagerKind::Client, Role::ClientPrimary, true));
    g.inter(makeSnapshot(7, ManagerKind::SoftAp, Role::SoftApLocalOnly));

    const std::string text = g.dump();
    FATP_ASSERT_CONTAINS(text, "Graveyard: 1 client(s), 1 soft AP(s)", "Counts in header");
    FATP_ASSERT_CONTAINS(text, "#4 ClientModeManager lastRole=ROLE_CLIENT_PRIMARY (start failure)",
                         "Start failure is marked");
    FATP_ASSERT_CONTAINS(text, "#7 SoftApManager lastRole=ROLE_SOFTAP_LOCAL_ONLY", "Soft AP listed");
    return true;
}

} // namespace fat_p::testing::graveyard

namespace fat_p::testing
{

bool test_Graveyard()
{
    FATP_PRINT_HEADER(GRAVEYARD)

    TestRunner runner;

    FATP_RUN_TEST_NS(runner, graveyard, ring_keeps_newest_and_evicts_oldest);
    FATP_RUN_TEST_NS(runner, graveyard, graveyard_caps_each_kind_independently);
    FATP_RUN_TEST_NS(runner, graveyard, snapshots_are_copies);
    FATP_RUN_TEST_NS(runner, graveyard, dump_lists_entries_with_failure_marker);

    return 0 == runner.print_summary();
}

} // namespace fat_p::testing

#ifdef ENABLE_TEST_APPLICATION
int main()
{
    return fat_p::testing::test_Graveyard() ? 0 : 1;
}
#endif

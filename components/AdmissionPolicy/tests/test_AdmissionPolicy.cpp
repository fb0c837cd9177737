/**
 * @file test_AdmissionPolicy.cpp
 * @brief Unit tests for AdmissionPolicy.h
 *
 * Tests cover: each step of the decision order, bssid matching through
 * affiliated links, priority-based role switching, user-approval attribution,
 * the single-STA fallback, and that deciding has no side effects.
 */
/*
FATP_META:
  meta_version: 1
  component: AdmissionPolicy
  file_role: test
  path: components/AdmissionPolicy/tests/test_AdmissionPolicy.cpp
  namespace: fat_p::testing::admission
  layer: Testing
  summary: Unit tests for AdmissionPolicy - additional client request decisions.
  api_stability: in_work
  related:
    headers:
      - include/wifimode/AdmissionPolicy.h
      - include/wifimode/SimulatedHardware.h
  hygiene:
    pragma_once: false
    include_guard: false
    defines_total: 0
    defines_unprefixed: 0
    undefs_total: 0
    includes_windows_h: false
*/

#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "AdmissionPolicy.h"
#include "ControllerConfig.h"
#include "FatPTest.h"
#include "ModeManagerRegistry.h"
#include "SerialExecutor.h"
#include "SimulatedHardware.h"

namespace fat_p::testing::admission
{

using wifimode::AdmissionOutcome;
using wifimode::Role;
using wifimode::WifiState;
using wifimode::WorkSource;

constexpr const char* kSsid  = "Foo";
constexpr const char* kBssid = "AA:BB:CC:DD:EE:FF";

const WorkSource kApp(10123, "com.example.app", wifimode::RequestorPriority::Foreground);

class IgnoringClientListener final : public wifimode::ModeManagerListener<wifimode::ClientModeManager>
{
public:
    void onStarted(const wifimode::ClientModeManagerPtr&) override {}
    void onRoleChanged(const wifimode::ClientModeManagerPtr&) override {}
    void onStopped(const wifimode::ClientModeManagerPtr&) override {}
    void onStartFailure(const wifimode::ClientModeManagerPtr&) override {}
};

struct Fixture
{
    wifimode::ManualClock    clock;
    wifimode::SerialExecutor executor{"admission", [this] { return clock.now(); }};
    wifimode::sim::SimulatedChip chip;
    wifimode::sim::SimulatedModeManagerFactory factory{executor, chip};
    wifimode::sim::RecordingServices services;
    wifimode::ModeManagerRegistry registry;
    wifimode::ControllerConfig config;
    wifimode::AdmissionPolicy policy{config, registry, chip, chip, services};

    Fixture()
    {
        config.multiStaLocalOnlyEnabled     = true;
        config.multiStaMbbEnabled           = true;
        config.multiStaRestrictedEnabled    = true;
        config.multiStaMultiInternetEnabled = true;
    }

    /// Creates and settles a client, optionally connected to (ssid, bssid).
    std::shared_ptr<wifimode::sim::SimulatedClientModeManager>
    addClient(Role role, const WorkSource& ws, const std::string& ssid = "", const std::string& bssid = "")
    {
        auto m = factory.makeClientModeManager(std::make_shared<IgnoringClientListener>(), ws, role, false);
        registry.add(m);
        (void)executor.dispatchReady();
        auto sim = factory.findClient(m->id());
        if (!ssid.empty())
        {
            sim->connect(ssid, bssid);
        }
        return sim;
    }

    static wifimode::AdditionalClientModeManagerRequest request(Role role, const WorkSource& ws,
                                                                std::optional<std::string> bssid = std::nullopt)
    {
        wifimode::AdditionalClientModeManagerRequest r;
        r.listener    = [](const wifimode::ClientModeManagerPtr&) {};
        r.requestorWs = ws;
        r.clientRole  = role;
        r.ssid        = kSsid;
        r.bssid       = std::move(bssid);
        return r;
    }
};

// ============================================================================
// Steps 1-3: state, car mode, DPP
// ============================================================================

FATP_TEST_CASE(rejects_while_disabling_or_disabled)
{
    Fixture f;
    const auto r = Fixture::request(Role::ClientSecondaryLongLived, kApp);

    FATP_ASSERT_TRUE(f.policy.decide(r, WifiState::Disabled).outcome == AdmissionOutcome::Reject,
                     "Disabled rejects");
    FATP_ASSERT_TRUE(f.policy.decide(r, WifiState::Disabling).outcome == AdmissionOutcome::Reject,
                     "Disabling rejects");
    FATP_ASSERT_TRUE(f.policy.decide(r, WifiState::Enabled).outcome == AdmissionOutcome::CreateNew,
                     "Enabled admits");
    return true;
}

FATP_TEST_CASE(car_mode_local_only_gets_primary)
{
    Fixture f;
    auto primary = f.addClient(Role::ClientPrimary, WorkSource::settings());
    f.chip.setCarModePrioritized(kApp.uid(0), true);

    auto r = Fixture::request(Role::ClientLocalOnly, kApp);
    auto d = f.policy.decide(r, WifiState::Enabled);
    FATP_ASSERT_TRUE(d.outcome == AdmissionOutcome::AnswerPrimary, "Car-mode app is answered with the primary");
    FATP_ASSERT_TRUE(d.manager == primary, "Primary manager carried");
    FATP_ASSERT_CONTAINS(d.reason, "car mode", "Reason names car mode");

    r.preferSecondarySta = true;
    d = f.policy.decide(r, WifiState::Enabled);
    FATP_ASSERT_TRUE(d.outcome == AdmissionOutcome::CreateNew, "preferSecondarySta skips the car-mode rule");
    return true;
}

FATP_TEST_CASE(root_skips_car_mode_rule_when_allowed)
{
    Fixture f;
    (void)f.addClient(Role::ClientPrimary, WorkSource::settings());
    f.chip.setCarModePrioritized(wifimode::kRootUid, true);
    const WorkSource root(wifimode::kRootUid, "root", wifimode::RequestorPriority::Privileged);

    auto d = f.policy.decide(Fixture::request(Role::ClientLocalOnly, root), WifiState::Enabled);
    FATP_ASSERT_TRUE(d.outcome == AdmissionOutcome::CreateNew, "Root may get a local-only client");

    f.config.allowRootToGetLocalOnlyCmm = false;
    d = f.policy.decide(Fixture::request(Role::ClientLocalOnly, root), WifiState::Enabled);
    FATP_ASSERT_TRUE(d.outcome == AdmissionOutcome::AnswerPrimary, "Without the flag root is restricted too");
    return true;
}

FATP_TEST_CASE(transient_during_dpp_gets_primary)
{
    Fixture f;
    auto primary = f.addClient(Role::ClientPrimary, WorkSource::settings());
    f.services.dppInProgress = true;

    auto d = f.policy.decide(Fixture::request(Role::ClientSecondaryTransient, kApp), WifiState::Enabled);
    FATP_ASSERT_TRUE(d.outcome == AdmissionOutcome::AnswerPrimary, "DPP blocks make-before-break");
    FATP_ASSERT_TRUE(d.manager == primary, "Primary is the answer");

    d = f.policy.decide(Fixture::request(Role::ClientSecondaryLongLived, kApp), WifiState::Enabled);
    FATP_ASSERT_TRUE(d.outcome == AdmissionOutcome::CreateNew, "DPP only affects transient requests");
    return true;
}

// ============================================================================
// Step 4: same bssid
// ============================================================================

FATP_TEST_CASE(primary_on_same_bssid_is_answered)
{
    Fixture f;
    auto primary = f.addClient(Role::ClientPrimary, WorkSource::settings(), kSsid, kBssid);

    auto d = f.policy.decide(Fixture::request(Role::ClientLocalOnly, kApp, std::string(kBssid)),
                             WifiState::Enabled);
    FATP_ASSERT_TRUE(d.outcome == AdmissionOutcome::AnswerExisting, "Primary on the bssid answers");
    FATP_ASSERT_TRUE(d.manager == primary, "Answer is the primary");
    return true;
}

FATP_TEST_CASE(affiliated_link_bssid_counts_as_same)
{
    Fixture f;
    auto primary = f.addClient(Role::ClientPrimary, WorkSource::settings(), kSsid, kBssid);
    primary->addAffiliatedLinkBssid("AA:BB:CC:DD:EE:01");

    auto d = f.policy.decide(Fixture::request(Role::ClientLocalOnly, kApp, std::string("AA:BB:CC:DD:EE:01")),
                             WifiState::Enabled);
    FATP_ASSERT_TRUE(d.outcome == AdmissionOutcome::AnswerExisting, "Affiliated link matches");

    d = f.policy.decide(Fixture::request(Role::ClientLocalOnly, kApp, std::string("11:22:33:44:55:66")),
                        WifiState::Enabled);
    FATP_ASSERT_TRUE(d.outcome == AdmissionOutcome::CreateNew, "Unrelated bssid gets its own interface");
    return true;
}

FATP_TEST_CASE(outranking_request_switches_bssid_holder)
{
    Fixture f;
    (void)f.addClient(Role::ClientPrimary, WorkSource::settings());
    auto transient = f.addClient(Role::ClientSecondaryTransient, WorkSource::internal(), kSsid, kBssid);

    auto d = f.policy.decide(Fixture::request(Role::ClientLocalOnly, kApp, std::string(kBssid)),
                             WifiState::Enabled);
    FATP_ASSERT_TRUE(d.outcome == AdmissionOutcome::SwitchRole, "Foreground app outranks the internal holder");
    FATP_ASSERT_TRUE(d.manager == transient, "The holder is switched");
    return true;
}

FATP_TEST_CASE(lower_priority_request_cannot_take_bssid_holder)
{
    Fixture f;
    (void)f.addClient(Role::ClientPrimary, WorkSource::settings());
    (void)f.addClient(Role::ClientSecondaryTransient, WorkSource::settings(), kSsid, kBssid);

    auto d = f.policy.decide(Fixture::request(Role::ClientLocalOnly, kApp, std::string(kBssid)),
                             WifiState::Enabled);
    FATP_ASSERT_TRUE(d.outcome == AdmissionOutcome::Reject, "Holder with system priority is kept");
    return true;
}

FATP_TEST_CASE(holder_already_in_role_is_answered)
{
    Fixture f;
    (void)f.addClient(Role::ClientPrimary, WorkSource::settings());
    auto longLived = f.addClient(Role::ClientSecondaryLongLived, WorkSource::settings(), kSsid, kBssid);

    auto d = f.policy.decide(Fixture::request(Role::ClientSecondaryLongLived, kApp, std::string(kBssid)),
                             WifiState::Enabled);
    FATP_ASSERT_TRUE(d.outcome == AdmissionOutcome::AnswerExisting, "Same role on same bssid is shared");
    FATP_ASSERT_TRUE(d.manager == longLived, "Existing holder answered");
    return true;
}

// ============================================================================
// Steps 5-7: same role, new interface, fallback
// ============================================================================

FATP_TEST_CASE(existing_role_is_answered_without_bssid)
{
    Fixture f;
    auto longLived = f.addClient(Role::ClientSecondaryLongLived, WorkSource::settings());

    auto d = f.policy.decide(Fixture::request(Role::ClientSecondaryLongLived, kApp), WifiState::Enabled);
    FATP_ASSERT_TRUE(d.outcome == AdmissionOutcome::AnswerExisting, "At most one manager per secondary role");
    FATP_ASSERT_TRUE(d.manager == longLived, "Existing manager answered");
    return true;
}

FATP_TEST_CASE(user_approval_adds_settings_attribution)
{
    Fixture f;
    auto r = Fixture::request(Role::ClientLocalOnly, kApp);
    r.didUserApprove = true;

    auto d = f.policy.decide(r, WifiState::Enabled);
    FATP_ASSERT_TRUE(d.outcome == AdmissionOutcome::CreateNew, "Free slot creates");
    FATP_ASSERT_EQ(d.creatorWs.size(), std::size_t(2), "Requestor plus settings");
    FATP_ASSERT_TRUE(d.creatorWs.priority() == wifimode::RequestorPriority::System,
                     "Approved request carries system priority");
    return true;
}

FATP_TEST_CASE(local_only_rejected_instead_of_sharing_primary)
{
    Fixture f;
    (void)f.addClient(Role::ClientPrimary, WorkSource::settings());
    (void)f.addClient(Role::ClientSecondaryLongLived, WorkSource::settings());

    auto d = f.policy.decide(Fixture::request(Role::ClientLocalOnly, kApp), WifiState::Enabled);
    FATP_ASSERT_TRUE(d.outcome == AdmissionOutcome::Reject, "Modern app gets no single-STA fallback");

    f.chip.addLegacyPackage(kApp.packageName(0));
    d = f.policy.decide(Fixture::request(Role::ClientLocalOnly, kApp), WifiState::Enabled);
    FATP_ASSERT_TRUE(d.outcome == AdmissionOutcome::AnswerPrimary, "Legacy app shares the primary");
    return true;
}

FATP_TEST_CASE(disabled_use_case_falls_back_to_primary)
{
    Fixture f;
    f.config.multiStaMbbEnabled = false;
    auto primary = f.addClient(Role::ClientPrimary, WorkSource::settings());

    FATP_ASSERT_FALSE(f.policy.canRequestSecondaryTransientClientModeManager(), "MBB disabled in overlay");
    auto d = f.policy.decide(Fixture::request(Role::ClientSecondaryTransient, kApp), WifiState::Enabled);
    FATP_ASSERT_TRUE(d.outcome == AdmissionOutcome::AnswerPrimary, "Falls back to single STA");
    FATP_ASSERT_TRUE(d.manager == primary, "Primary answered");
    return true;
}

FATP_TEST_CASE(fallback_without_primary_answers_null)
{
    Fixture f;
    f.chip.setInterfaceLimits({1, 1});
    (void)f.addClient(Role::ClientScanOnly, WorkSource::settings());

    auto d = f.policy.decide(Fixture::request(Role::ClientSecondaryLongLived, kApp), WifiState::Enabled);
    FATP_ASSERT_TRUE(d.outcome == AdmissionOutcome::AnswerPrimary, "No slot and no STA+STA");
    FATP_ASSERT_TRUE(d.manager == nullptr, "No primary means a null answer");
    return true;
}

FATP_TEST_CASE(decide_has_no_side_effects)
{
    Fixture f;
    (void)f.addClient(Role::ClientPrimary, WorkSource::settings());
    (void)f.addClient(Role::ClientSecondaryTransient, WorkSource::internal(), kSsid, kBssid);
    const auto r = Fixture::request(Role::ClientLocalOnly, kApp, std::string(kBssid));

    const auto first  = f.policy.decide(r, WifiState::Enabled);
    const auto second = f.policy.decide(r, WifiState::Enabled);

    FATP_ASSERT_TRUE(first.outcome == second.outcome, "Same inputs give the same outcome");
    FATP_ASSERT_TRUE(first.manager == second.manager, "Same manager selected");
    FATP_ASSERT_EQ(f.registry.size(), std::size_t(2), "Registry untouched");
    FATP_ASSERT_EQ(f.executor.pendingCount(), std::size_t(0), "Nothing posted");
    return true;
}

FATP_TEST_CASE(sta_sta_support_needs_chip_and_overlay)
{
    Fixture f;
    FATP_ASSERT_TRUE(f.policy.isStaStaConcurrencySupportedForLocalOnly(), "Two STA slots and flag set");

    f.config.multiStaRestrictedEnabled = false;
    FATP_ASSERT_FALSE(f.policy.isStaStaConcurrencySupportedForRestricted(), "Overlay flag off");
    FATP_ASSERT_TRUE(f.policy.canRequestMoreClientModeManagersInRole(kApp, Role::ClientSecondaryLongLived, false),
                     "Multi-internet alone still allows long-lived");

    f.chip.setInterfaceLimits({1, 1});
    FATP_ASSERT_FALSE(f.policy.isStaStaConcurrencySupportedForMbb(), "Single STA chip");
    return true;
}

} // namespace fat_p::testing::admission

namespace fat_p::testing
{

bool test_AdmissionPolicy()
{
    FATP_PRINT_HEADER(ADMISSION POLICY)

    TestRunner runner;

    FATP_RUN_TEST_NS(runner, admission, rejects_while_disabling_or_disabled);
    FATP_RUN_TEST_NS(runner, admission, car_mode_local_only_gets_primary);
    FATP_RUN_TEST_NS(runner, admission, root_skips_car_mode_rule_when_allowed);
    FATP_RUN_TEST_NS(runner, admission, transient_during_dpp_gets_primary);
    FATP_RUN_TEST_NS(runner, admission, primary_on_same_bssid_is_answered);
    FATP_RUN_TEST_NS(runner, admission, affiliated_link_bssid_counts_as_same);
    FATP_RUN_TEST_NS(runner, admission, outranking_request_switches_bssid_holder);
    FATP_RUN_TEST_NS(runner, admission, lower_priority_request_cannot_take_bssid_holder);
    FATP_RUN_TEST_NS(runner, admission, holder_already_in_role_is_answered);
    FATP_RUN_TEST_NS(runner, admission, existing_role_is_answered_without_bssid);
    FATP_RUN_TEST_NS(runner, admission, user_approval_adds_settings_attribution);
    FATP_RUN_TEST_NS(runner, admission, local_only_rejected_instead_of_sharing_primary);
    FATP_RUN_TEST_NS(runner, admission, disabled_use_case_falls_back_to_primary);
    FATP_RUN_TEST_NS(runner, admission, fallback_without_primary_answers_null);
    FATP_RUN_TEST_NS(runner, admission, decide_has_no_side_effects);
    FATP_RUN_TEST_NS(runner, admission, sta_sta_support_needs_chip_and_overlay);

    return 0 == runner.print_summary();
}

} // namespace fat_p::testing

#ifdef ENABLE_TEST_APPLICATION
int main()
{
    return fat_p::testing::test_AdmissionPolicy() ? 0 : 1;
}
#endif

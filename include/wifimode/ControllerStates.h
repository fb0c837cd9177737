#pragma once

/*
FATP_META:
  meta_version: 1
  component: ControllerStates
  file_role: public_header
  path: include/wifimode/ControllerStates.h
  namespace: wifimode
  layer: Domain
  summary: Disabled and Enabled controller states on fat_p::StateMachine with hub-emitting entry hooks.
  api_stability: in_work
  related:
    headers:
      - include/wifimode/ModeController.h
      - include/wifimode/ModeEvents.h
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
 * @file ControllerStates.h
 * @brief The controller's two leaf states built on fat_p::StateMachine.
 *
 * @details
 *   Disabled -> Enabled  (some mode manager was started)
 *   Enabled  -> Disabled (the last mode manager is gone)
 *
 * The Default super-state is not a machine state: ModeController intercepts
 * emergency messages before dispatching to the leaf handler.
 *
 * Entering a state checks that the registry agrees with it, reports the
 * transition on the hub and replays the deferred messages. Both are skipped
 * until the controller has started, so the construction-time entry into
 * Disabled stays silent.
 *
 * @note Thread-safety: NOT thread-safe. Driven from the controller's executor.
 */

#include "Logging.h"
#include "ModeEvents.h"
#include "ModeManagerRegistry.h"
#include "StateMachine.h"

#include <functional>
#include <string_view>
#include <tuple>
#include <utility>

namespace wifimode
{

struct ControllerContext;

// ============================================================================
// States
// ============================================================================

struct DisabledState
{
    static constexpr const char* kName = "DisabledState";

    void on_entry(ControllerContext& ctx);
    void on_exit(ControllerContext& ctx);
};

struct EnabledState
{
    static constexpr const char* kName = "EnabledState";

    void on_entry(ControllerContext& ctx);
    void on_exit(ControllerContext& ctx);
};

using ControllerTransitions = std::tuple<
    std::pair<DisabledState, EnabledState>,
    std::pair<EnabledState,  DisabledState>
>;

// ============================================================================
// Context
// ============================================================================

/**
 * @brief Shared data visible to the state hooks.
 */
struct ControllerContext
{
    const ModeManagerRegistry& registry;
    events::ModeEventHub&      events;
    std::function<void()>      replayDeferred;
    std::string_view           fromState;
    bool                       reporting = false; ///< Set once the controller has started
};

// ============================================================================
// Hooks
// ============================================================================

inline void DisabledState::on_entry(ControllerContext& ctx)
{
    if (!ctx.registry.empty())
    {
        logger().error("Entered {}, but has active mode managers", kName);
    }
    if (!ctx.reporting)
    {
        return;
    }
    logger().info("{} -> {}", ctx.fromState, kName);
    ctx.events.onControllerStateChanged.emit(ctx.fromState, kName);
    ctx.replayDeferred();
}

inline void DisabledState::on_exit(ControllerContext& ctx)
{
    ctx.fromState = kName;
}

inline void EnabledState::on_entry(ControllerContext& ctx)
{
    if (ctx.registry.empty())
    {
        logger().error("Entered {}, but no active mode managers", kName);
    }
    if (!ctx.reporting)
    {
        return;
    }
    logger().info("{} -> {}", ctx.fromState, kName);
    ctx.events.onControllerStateChanged.emit(ctx.fromState, kName);
    ctx.replayDeferred();
}

inline void EnabledState::on_exit(ControllerContext& ctx)
{
    if (!ctx.registry.empty())
    {
        logger().error("Exiting {}, but has active mode managers", kName);
    }
    ctx.fromState = kName;
}

// ============================================================================
// State machine type alias
// ============================================================================

using ControllerStateMachine = fat_p::StateMachine<
    ControllerContext,
    ControllerTransitions,
    fat_p::StrictTransitionPolicy,
    fat_p::ThrowingActionPolicy,
    0,                        // InitialIndex = DisabledState
    DisabledState,
    EnabledState
>;

} // namespace wifimode

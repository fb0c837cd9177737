#pragma once

/*
FATP_META:
  meta_version: 1
  component: ControllerLog
  file_role: public_header
  path: include/wifimode/ControllerLog.h
  namespace: wifimode
  layer: Domain
  summary: Rolling structured log of controller messages and mode manager events, fed by ModeEventHub.
  api_stability: in_work
  related:
    tests:
      - components/ControllerLog/tests/test_ControllerLog.cpp
  hygiene:
    pragma_once: true
    include_guard: false
    defines_total: 0
    defines_unprefixed: 0
    undefs_total: 0
    includes_windows_h: false
*/

/**
 * @file ControllerLog.h
 * @brief Rolling history of controller activity, for dump().
 *
 * @details
 * ControllerLog subscribes to a ModeEventHub at construction and records
 * manager lifecycle events, primary changes, restart notifications, wifi
 * state changes, controller state transitions and every processed message.
 * Entries live in a std::deque bounded to MaxEntries; the oldest entry is
 * evicted first.
 *
 * @note Thread-safety: NOT thread-safe. The hub emits on the executor thread;
 *       read the log from that thread (dump() runs there).
 */

#include "ModeEvents.h"
#include "Roles.h"
#include "Signal.h"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <deque>
#include <iterator>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace wifimode
{

// ============================================================================
// ControllerLogEntry
// ============================================================================

enum class LogCategory
{
    ManagerAdded,
    ManagerRemoved,
    RoleChanged,
    PrimaryChanged,
    Restarting,
    Restarted,
    WifiState,
    StateTransition,
    Message,
    SoftApFailure,
    Info
};

struct ControllerLogEntry
{
    std::chrono::steady_clock::time_point timestamp;
    LogCategory category;
    std::string subject;  ///< Manager, message or state name
    std::string detail;
};

/// One-line description of a manager for log entries.
[[nodiscard]] inline std::string describeManager(const ActiveModeManager* manager)
{
    if (manager == nullptr)
    {
        return "null";
    }
    return std::string(kindName(manager->kind())) + "#" + std::to_string(manager->id());
}

// ============================================================================
// ControllerLog
// ============================================================================

/**
 * @tparam MaxEntries Entries retained before the oldest is evicted.
 */
template <std::size_t MaxEntries = 100>
class ControllerLog
{
public:
    static constexpr std::size_t kMaxEntries = MaxEntries;

    /**
     * @param hub Hub to subscribe to. Must outlive this log.
     */
    explicit ControllerLog(events::ModeEventHub& hub)
    {
        mConnections.push_back(
            hub.onManagerAdded.connect(
                [this](const ActiveModeManagerPtr& m)
                {
                    append(LogCategory::ManagerAdded, describeManager(m.get()),
                           std::string(roleName(m->role())));
                }));

        mConnections.push_back(
            hub.onManagerRemoved.connect(
                [this](const ActiveModeManagerPtr& m)
                {
                    append(LogCategory::ManagerRemoved, describeManager(m.get()),
                           "last role " + std::string(roleName(m->previousRole())));
                }));

        mConnections.push_back(
            hub.onManagerRoleChanged.connect(
                [this](const ActiveModeManagerPtr& m)
                {
                    append(LogCategory::RoleChanged, describeManager(m.get()),
                           std::string(roleName(m->previousRole())) + " -> "
                               + std::string(roleName(m->role())));
                }));

        mConnections.push_back(
            hub.onPrimaryChanged.connect(
                [this](const ClientModeManagerPtr& prev, const ClientModeManagerPtr& next)
                {
                    append(LogCategory::PrimaryChanged, "primary",
                           describeManager(prev.get()) + " -> " + describeManager(next.get()));
                }));

        mConnections.push_back(
            hub.onSubsystemRestarting.connect(
                [this]() { append(LogCategory::Restarting, "wifi", "restarting"); }));

        mConnections.push_back(
            hub.onSubsystemRestarted.connect(
                [this]() { append(LogCategory::Restarted, "wifi", "restarted"); }));

        mConnections.push_back(
            hub.onWifiStateChanged.connect(
                [this](WifiState state)
                {
                    append(LogCategory::WifiState, std::string(wifiStateName(state)), {});
                }));

        mConnections.push_back(
            hub.onControllerStateChanged.connect(
                [this](std::string_view from, std::string_view to)
                {
                    std::string detail = from.empty()
                        ? std::string("initial -> ") + std::string(to)
                        : std::string(from) + " -> " + std::string(to);
                    append(LogCategory::StateTransition, std::string(to), std::move(detail));
                }));

        mConnections.push_back(
            hub.onMessageProcessed.connect(
                [this](std::string_view message, std::string_view state, std::string_view detail)
                {
                    std::string text = "in " + std::string(state);
                    if (!detail.empty())
                    {
                        text += " (" + std::string(detail) + ")";
                    }
                    append(LogCategory::Message, std::string(message), std::move(text));
                }));

        mConnections.push_back(
            hub.onSoftApStartFailed.connect(
                [this](SoftApIpMode mode, std::string_view reason)
                {
                    append(LogCategory::SoftApFailure, std::string(ipModeName(mode)), std::string(reason));
                }));
    }

    ControllerLog(const ControllerLog&) = delete;
    ControllerLog& operator=(const ControllerLog&) = delete;

    [[nodiscard]] std::size_t size() const noexcept { return mEntries.size(); }
    [[nodiscard]] bool empty() const noexcept { return mEntries.empty(); }

    [[nodiscard]] const std::deque<ControllerLogEntry>& all() const noexcept { return mEntries; }

    /// Most recent n entries, oldest first.
    [[nodiscard]] std::vector<ControllerLogEntry> recent(std::size_t n) const
    {
        n = std::min(n, mEntries.size());
        return {mEntries.end() - static_cast<std::ptrdiff_t>(n), mEntries.end()};
    }

    /// Entries of one category, oldest first.
    [[nodiscard]] std::vector<ControllerLogEntry> byCategory(LogCategory category) const
    {
        std::vector<ControllerLogEntry> out;
        std::copy_if(mEntries.begin(), mEntries.end(), std::back_inserter(out),
                     [category](const ControllerLogEntry& e) { return e.category == category; });
        return out;
    }

    /**
     * @brief Formats the last n entries, one per line: [+ms] CATEGORY subject: detail
     */
    [[nodiscard]] std::string formatTail(std::size_t n) const
    {
        auto entries = recent(n);
        if (entries.empty())
        {
            return "(no controller log entries)\n";
        }

        const auto& first = entries.front();
        std::ostringstream oss;
        for (const auto& e : entries)
        {
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                e.timestamp - first.timestamp).count();

            oss << "[+" << ms << "ms] " << categoryName(e.category) << " " << e.subject;
            if (!e.detail.empty())
            {
                oss << ": " << e.detail;
            }
            oss << "\n";
        }
        return oss.str();
    }

    void logInfo(std::string subject, std::string detail)
    {
        append(LogCategory::Info, std::move(subject), std::move(detail));
    }

    void clear() noexcept { mEntries.clear(); }

    [[nodiscard]] static std::string_view categoryName(LogCategory c) noexcept
    {
        switch (c)
        {
            case LogCategory::ManagerAdded:    return "ADDED";
            case LogCategory::ManagerRemoved:  return "REMOVED";
            case LogCategory::RoleChanged:     return "ROLE";
            case LogCategory::PrimaryChanged:  return "PRIMARY";
            case LogCategory::Restarting:      return "RESTARTING";
            case LogCategory::Restarted:       return "RESTARTED";
            case LogCategory::WifiState:       return "WIFI_STATE";
            case LogCategory::StateTransition: return "STATE";
            case LogCategory::Message:         return "MSG";
            case LogCategory::SoftApFailure:   return "AP_FAIL";
            case LogCategory::Info:            return "INFO";
        }
        return "UNKNOWN";
    }

private:
    std::deque<ControllerLogEntry>       mEntries;
    std::vector<fat_p::ScopedConnection> mConnections;

    void append(LogCategory category, std::string subject, std::string detail)
    {
        if (mEntries.size() >= kMaxEntries)
        {
            mEntries.pop_front();
        }
        mEntries.push_back({std::chrono::steady_clock::now(),
                            category,
                            std::move(subject),
                            std::move(detail)});
    }
};

} // namespace wifimode

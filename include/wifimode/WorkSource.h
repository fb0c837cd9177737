#pragma once

/*
FATP_META:
  meta_version: 1
  component: WorkSource
  file_role: public_header
  path: include/wifimode/WorkSource.h
  namespace: wifimode
  layer: Domain
  summary: Requestor attribution set used for accounting and priority comparison.
  api_stability: in_work
  related:
    tests:
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
 * @file WorkSource.h
 * @brief Requestor attribution ("work source") for role requests.
 *
 * @details
 * A WorkSource is an ordered set of (uid, package, priority) entries. The
 * first entry identifies the primary requestor; additional entries are
 * attributions merged in later (e.g. the settings app when the user approved
 * a connection from the UI). The effective priority of the set is the
 * highest priority of any entry.
 */

#include <algorithm>
#include <cstddef>
#include <sstream>
#include <string>
#include <vector>

namespace wifimode
{

// ============================================================================
// Well-known uids
// ============================================================================

inline constexpr int kRootUid   = 0;
inline constexpr int kSystemUid = 1000;
inline constexpr int kWifiUid   = 1010;

inline constexpr const char* kSystemPackage   = "android";
inline constexpr const char* kSettingsPackage = "com.android.settings";

/// @brief Priority class of a requestor, lowest first.
enum class RequestorPriority : int
{
    Internal   = 0, ///< Framework-internal requests (scan-only on location toggle)
    Background = 1,
    Foreground = 2,
    Privileged = 3, ///< Privileged apps or user-approved requests
    System     = 4  ///< System / settings
};

struct WorkSourceEntry
{
    int uid = kWifiUid;
    std::string packageName;
    RequestorPriority priority = RequestorPriority::Internal;

    bool operator==(const WorkSourceEntry& other) const
    {
        return uid == other.uid && packageName == other.packageName && priority == other.priority;
    }
};

// ============================================================================
// WorkSource
// ============================================================================

class WorkSource
{
public:
    WorkSource() = default;

    WorkSource(int uid, std::string packageName, RequestorPriority priority)
    {
        add(WorkSourceEntry{uid, std::move(packageName), priority});
    }

    /// @brief Lowest-priority internal requestor (the wifi stack itself).
    [[nodiscard]] static WorkSource internal()
    {
        return WorkSource(kWifiUid, kSystemPackage, RequestorPriority::Internal);
    }

    /// @brief Settings requestor; carries system priority.
    [[nodiscard]] static WorkSource settings()
    {
        return WorkSource(kSystemUid, kSettingsPackage, RequestorPriority::System);
    }

    /// @brief Adds an entry unless an identical one is already present.
    void add(const WorkSourceEntry& entry)
    {
        if (std::find(mEntries.begin(), mEntries.end(), entry) == mEntries.end())
        {
            mEntries.push_back(entry);
        }
    }

    /// @brief Merges every entry of another work source.
    void add(const WorkSource& other)
    {
        for (const auto& entry : other.mEntries)
        {
            add(entry);
        }
    }

    [[nodiscard]] std::size_t size() const noexcept { return mEntries.size(); }
    [[nodiscard]] bool empty() const noexcept { return mEntries.empty(); }

    [[nodiscard]] const std::vector<WorkSourceEntry>& entries() const noexcept { return mEntries; }

    /// @brief Uid of entry i, or the wifi uid when out of range.
    [[nodiscard]] int uid(std::size_t i) const noexcept
    {
        return i < mEntries.size() ? mEntries[i].uid : kWifiUid;
    }

    [[nodiscard]] std::string packageName(std::size_t i) const
    {
        return i < mEntries.size() ? mEntries[i].packageName : std::string();
    }

    /// @brief Highest priority among all entries; Internal for an empty set.
    [[nodiscard]] RequestorPriority priority() const noexcept
    {
        RequestorPriority best = RequestorPriority::Internal;
        for (const auto& entry : mEntries)
        {
            if (static_cast<int>(entry.priority) > static_cast<int>(best))
            {
                best = entry.priority;
            }
        }
        return best;
    }

    bool operator==(const WorkSource& other) const { return mEntries == other.mEntries; }
    bool operator!=(const WorkSource& other) const { return !(*this == other); }

    [[nodiscard]] std::string toString() const
    {
        std::ostringstream oss;
        oss << "WorkSource{";
        for (std::size_t i = 0; i < mEntries.size(); ++i)
        {
            if (i != 0) { oss << ", "; }
            oss << mEntries[i].uid << " " << mEntries[i].packageName;
        }
        oss << "}";
        return oss.str();
    }

private:
    std::vector<WorkSourceEntry> mEntries;
};

/// @brief True if a's effective priority is at least b's.
[[nodiscard]] inline bool hasPriorityAtLeast(const WorkSource& a, const WorkSource& b) noexcept
{
    return static_cast<int>(a.priority()) >= static_cast<int>(b.priority());
}

} // namespace wifimode

#pragma once

/*
FATP_META:
  meta_version: 1
  component: Logging
  file_role: public_header
  path: include/wifimode/Logging.h
  namespace: wifimode
  layer: Infrastructure
  summary: Named spdlog logger shared by every wifimode component.
  api_stability: in_work
  hygiene:
    pragma_once: true
    include_guard: false
    defines_total: 0
    defines_unprefixed: 0
    undefs_total: 0
    includes_windows_h: false
*/

/**
 * @file Logging.h
 * @brief Accessor for the "wifimode" spdlog logger.
 *
 * Critical is used as the "should never happen" severity: invariant violations
 * that are logged and recovered from.
 */

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>

namespace wifimode
{

inline constexpr const char* kLoggerName = "wifimode";

/**
 * @brief Returns the shared logger, creating it on first use.
 *
 * If an application registered a logger named "wifimode" before first use,
 * that logger is adopted instead.
 */
[[nodiscard]] inline spdlog::logger& logger()
{
    static std::shared_ptr<spdlog::logger> instance = []
    {
        if (auto existing = spdlog::get(kLoggerName))
        {
            return existing;
        }
        auto created = spdlog::stdout_color_mt(kLoggerName);
        created->set_level(spdlog::level::info);
        return created;
    }();
    return *instance;
}

inline void setVerboseLogging(bool verbose)
{
    logger().set_level(verbose ? spdlog::level::debug : spdlog::level::info);
}

} // namespace wifimode

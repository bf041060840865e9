/**
 * @file quota_monitor.hpp
 * @brief Language Server Quota Monitor client library
 *
 * Finds the locally running Antigravity Language Server, talks to its
 * private control API over HTTP/2 and reports model quota usage.
 */

#ifndef LSQUOTA_QUOTA_MONITOR_HPP
#define LSQUOTA_QUOTA_MONITOR_HPP

#include "config.hpp"
#include "quota_types.hpp"

#include <memory>

namespace lsquota {

/**
 * @brief Main quota monitor class
 *
 * Owns the platform process table, the connection cache and the pooled
 * HTTP client. Applies the configured log level on construction. Safe to call from several threads; calls are serialized.
 */
class QuotaMonitor {
public:
    /**
     * @brief Construct a quota monitor
     *
     * @param config Timeout, process name, procfs root and log level
     */
    explicit QuotaMonitor(const Config& config = Config::from_env());

    ~QuotaMonitor();

    QuotaMonitor(const QuotaMonitor&) = delete;
    QuotaMonitor& operator=(const QuotaMonitor&) = delete;

    /**
     * @brief Get the current quota report
     *
     * @return Normalized report
     * @throws LanguageServerNotFoundException if the Language Server is not running
     * @throws RemoteException if the status call fails, even after one retry
     */
    QuotaReport get_quota_report();

    /**
     * @brief Drop the cached connection so the next report re-detects
     */
    void invalidate_connection();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace lsquota

#endif // LSQUOTA_QUOTA_MONITOR_HPP

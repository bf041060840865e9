/**
 * @file quota_service.hpp
 * @brief Detect, fetch, normalize, with one reset-and-retry on failure
 */

#ifndef LSQUOTA_QUOTA_SERVICE_HPP
#define LSQUOTA_QUOTA_SERVICE_HPP

#include "connection_cache.hpp"
#include "quota_types.hpp"
#include "time_util.hpp"

#include <functional>
#include <optional>

namespace lsquota {

class QuotaService {
public:
    using Clock = std::function<TimePoint()>;

    /**
     * @param cache Connection cache shared by all calls on this service
     * @param clock Source of the capture instant; defaults to the system clock
     */
    explicit QuotaService(ConnectionCache& cache, Clock clock = Clock());

    /**
     * @brief Produce a fresh quota report
     *
     * A failed fetch resets the cache and the whole sequence runs once
     * more. After a second failure the cache is left empty.
     *
     * @throws LanguageServerNotFoundException if no Language Server answers
     * @throws RemoteException if the status call fails twice
     */
    QuotaReport get_quota_report();

    /**
     * @brief Forget the cached connection; the next report re-detects
     */
    void invalidate_connection();

private:
    std::optional<Connection> connection();
    QuotaReport fetch_report(const Connection& connection);

    ConnectionCache& cache_;
    Clock clock_;
};

} // namespace lsquota

#endif // LSQUOTA_QUOTA_SERVICE_HPP

/**
 * @file connection_cache.hpp
 * @brief Single-slot cache for the detected Language Server connection
 */

#ifndef LSQUOTA_CONNECTION_CACHE_HPP
#define LSQUOTA_CONNECTION_CACHE_HPP

#include "http_client.hpp"
#include "process_table.hpp"
#include "quota_types.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace lsquota {

/**
 * @brief Holds at most one validated Connection and the pooled HTTP client
 *
 * All members are serialized on one mutex, including HTTP calls made
 * through with_client(), so a reset() can never tear the client down
 * while another caller is using it.
 */
class ConnectionCache {
public:
    /**
     * @param table Process source used for detection
     * @param client_factory Builds the pooled client, lazily and after each invalidation
     * @param process_name Binary-name fragment identifying the Language Server
     */
    ConnectionCache(ProcessTable& table, HttpClientFactory client_factory,
                    std::string process_name);
    ~ConnectionCache();

    ConnectionCache(const ConnectionCache&) = delete;
    ConnectionCache& operator=(const ConnectionCache&) = delete;

    /**
     * @brief Cached connection, detecting the Language Server if there is none
     *
     * A failed detection is not remembered; the next call scans again.
     */
    std::optional<Connection> get();

    /**
     * @brief Drop the cached connection and close the pooled client
     */
    void invalidate();

    /**
     * @brief Discard connection and client after a confirmed failure
     */
    void reset();

    bool has_connection() const;

    /**
     * @brief Run @p fn with the pooled client while holding the cache lock
     */
    template <typename Fn>
    auto with_client(Fn&& fn) -> decltype(fn(std::declval<HttpClient&>())) {
        std::lock_guard<std::mutex> lock(mtx_);
        return fn(client_locked());
    }

private:
    HttpClient& client_locked();
    void discard_locked();

    ProcessTable& table_;
    HttpClientFactory client_factory_;
    std::string process_name_;

    mutable std::mutex mtx_;
    std::optional<Connection> connection_;
    std::unique_ptr<HttpClient> client_;
};

} // namespace lsquota

#endif // LSQUOTA_CONNECTION_CACHE_HPP

/**
 * @file quota_service.cpp
 * @brief Report orchestration
 */

#include "quota_service.hpp"
#include "language_server_api.hpp"
#include "log.hpp"
#include "quota_normalizer.hpp"

#include <chrono>

namespace lsquota {

QuotaService::QuotaService(ConnectionCache& cache, Clock clock)
    : cache_(cache), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
}

std::optional<Connection> QuotaService::connection() {
    try {
        return cache_.get();
    } catch (const HttpException& e) {
        throw RemoteException(e.what());
    }
}

QuotaReport QuotaService::fetch_report(const Connection& connection) {
    Json::Value raw = cache_.with_client([&connection](HttpClient& client) {
        return QuotaFetcher(client).fetch(connection);
    });
    return normalize(raw, clock_());
}

QuotaReport QuotaService::get_quota_report() {
    auto first = connection();
    if (!first) {
        throw LanguageServerNotFoundException();
    }

    std::string cause;
    try {
        return fetch_report(*first);
    } catch (const RemoteException& e) {
        cause = e.what();
        log_warn(std::string("Quota fetch failed (") + to_string(e.kind()) +
                 "), resetting and retrying: " + cause);
    }

    cache_.reset();

    // Without a re-detected connection the first cause is reported
    try {
        auto second = connection();
        if (second) {
            return fetch_report(*second);
        }
    } catch (const RemoteException& e) {
        cause = e.what();
    }

    log_error("Quota fetch failed after retry: " + cause);
    cache_.reset();
    throw RemoteException("Quota fetch failed: " + cause);
}

void QuotaService::invalidate_connection() {
    cache_.invalidate();
}

} // namespace lsquota

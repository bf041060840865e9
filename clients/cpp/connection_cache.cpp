/**
 * @file connection_cache.cpp
 * @brief Connection cache implementation
 */

#include "connection_cache.hpp"
#include "language_server_api.hpp"
#include "log.hpp"
#include "process_locator.hpp"

namespace lsquota {

ConnectionCache::ConnectionCache(ProcessTable& table, HttpClientFactory client_factory,
                                 std::string process_name)
    : table_(table),
      client_factory_(std::move(client_factory)),
      process_name_(std::move(process_name)) {}

ConnectionCache::~ConnectionCache() {
    std::lock_guard<std::mutex> lock(mtx_);
    discard_locked();
}

std::optional<Connection> ConnectionCache::get() {
    std::lock_guard<std::mutex> lock(mtx_);
    if (connection_) return connection_;

    PortProbe probe(client_locked());
    ProcessLocator locator(table_, probe, process_name_);
    connection_ = locator.locate();
    return connection_;
}

void ConnectionCache::invalidate() {
    std::lock_guard<std::mutex> lock(mtx_);
    discard_locked();
}

void ConnectionCache::reset() {
    std::lock_guard<std::mutex> lock(mtx_);
    discard_locked();
    log_info("Connection cache reset (stale connection discarded)");
}

bool ConnectionCache::has_connection() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return connection_.has_value();
}

HttpClient& ConnectionCache::client_locked() {
    if (!client_) {
        client_ = client_factory_();
        if (!client_) {
            throw HttpException("HTTP client factory returned no client");
        }
    }
    return *client_;
}

void ConnectionCache::discard_locked() {
    connection_.reset();
    if (client_) {
        client_->close();
        client_.reset();
    }
}

} // namespace lsquota

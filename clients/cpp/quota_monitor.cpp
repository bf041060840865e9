/**
 * @file quota_monitor.cpp
 * @brief Implementation of the Language Server Quota Monitor client library
 */

#include "quota_monitor.hpp"
#include "connection_cache.hpp"
#include "http_client.hpp"
#include "log.hpp"
#include "process_table.hpp"
#include "quota_service.hpp"

namespace lsquota {

// PIMPL implementation
class QuotaMonitor::Impl {
public:
    std::unique_ptr<ProcessTable> table;
    ConnectionCache cache;
    QuotaService service;

    explicit Impl(const Config& config)
        : table(make_process_table(config.proc_root)),
          cache(*table, curl_client_factory(config.timeout), config.process_name),
          service(cache) {
        Logger::instance().set_level(config.log_level);
    }
};

QuotaMonitor::QuotaMonitor(const Config& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

QuotaMonitor::~QuotaMonitor() = default;

QuotaReport QuotaMonitor::get_quota_report() {
    return pimpl_->service.get_quota_report();
}

void QuotaMonitor::invalidate_connection() {
    pimpl_->service.invalidate_connection();
}

} // namespace lsquota
